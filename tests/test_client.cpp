//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_client.cpp
// Purpose: Client against an in-process server: tool calls, paging, timeouts, cancellation
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>

#include "toolrpc/Client.h"
#include "toolrpc/InMemoryTransport.hpp"
#include "toolrpc/Server.h"

using namespace toolrpc;
using namespace std::chrono_literals;

namespace {

struct Fixture {
    Server server;
    Client client;

    Fixture() {
        server.RegisterTool(Tool{"echo", "Echo text back"}, [](ToolContext&, CallToolRequest& req) {
            std::string text;
            if (const JSONValue* t = req.arguments.Find("text"); t && t->IsString()) {
                text = std::get<std::string>(t->value);
            }
            return ToolOutcome::Ok(TextResult(text));
        });
        server.RegisterTool(Tool{"sleepy", "Waits until cancelled"}, [](ToolContext& ctx, CallToolRequest&) {
            const auto until = std::chrono::steady_clock::now() + 5s;
            while (!ctx.stop.stop_requested() && std::chrono::steady_clock::now() < until) {
                std::this_thread::sleep_for(5ms);
            }
            return ToolOutcome::Ok(TextResult("done"));
        });
    }

    void connect() {
        auto [serverSide, clientSide] = InMemoryTransport::CreatePair();
        server.Start(std::move(serverSide)).get();
        client.Connect(std::move(clientSide)).get();
    }
};

int failureCode(std::future<CallToolResult>& fut) {
    try {
        (void)fut.get();
    } catch (const errors::McpException& e) {
        return e.code();
    }
    return 0;
}

} // namespace

TEST(Client, CallToolReturnsResult) {
    Fixture f;
    f.connect();
    ASSERT_TRUE(f.client.IsConnected());

    auto fut = f.client.CallTool("echo", ParseJSON(R"({"text":"ping"})"));
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    CallToolResult r = fut.get();
    EXPECT_FALSE(r.isError);
    EXPECT_EQ(ResultText(r), "ping");
    EXPECT_EQ(f.client.PendingCount(), 0u);
}

TEST(Client, UnknownToolFailsWithToolNotFound) {
    Fixture f;
    f.connect();
    auto fut = f.client.CallTool("nope", JSONValue{JSONValue::Object{}});
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(failureCode(fut), JSONRPCErrorCodes::ToolNotFound);
}

TEST(Client, NonObjectArgumentsAreRejectedLocally) {
    Fixture f;
    f.connect();
    auto fut = f.client.CallTool("echo", JSONValue{int64_t{3}});
    ASSERT_EQ(fut.wait_for(0ms), std::future_status::ready);
    EXPECT_EQ(failureCode(fut), JSONRPCErrorCodes::InvalidParams);
}

TEST(Client, TimeoutFailsCallAndCancelsServerSide) {
    Fixture f;
    f.connect();
    CallOptions opts;
    opts.timeout = 50ms;
    auto start = std::chrono::steady_clock::now();
    auto fut = f.client.CallTool("sleepy", JSONValue{JSONValue::Object{}}, opts);
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(failureCode(fut), JSONRPCErrorCodes::RequestTimeout);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);

    // The connection stays usable.
    auto next = f.client.CallTool("echo", ParseJSON(R"({"text":"still here"})"));
    ASSERT_EQ(next.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(ResultText(next.get()), "still here");
}

TEST(Client, StopTokenCancelsCall) {
    Fixture f;
    f.connect();
    std::stop_source source;
    CallOptions opts;
    opts.stop = source.get_token();
    auto fut = f.client.CallTool("sleepy", JSONValue{JSONValue::Object{}}, opts);
    std::this_thread::sleep_for(20ms);
    source.request_stop();
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(failureCode(fut), JSONRPCErrorCodes::RequestCancelled);
}

TEST(Client, ListToolsFollowsCursorsAcrossPages) {
    Fixture f;
    for (int i = 0; i < 7; ++i) {
        f.server.RegisterTool(Tool{"extra-" + std::to_string(i), ""}, [](ToolContext&, CallToolRequest&) {
            return ToolOutcome::Ok(TextResult("x"));
        });
    }
    f.connect();

    auto page = f.client.ListToolsPaged(std::nullopt, 3);
    ASSERT_EQ(page.wait_for(2s), std::future_status::ready);
    ToolsListResult first = page.get();
    EXPECT_EQ(first.tools.size(), 3u);
    ASSERT_TRUE(first.nextCursor.has_value());

    auto all = f.client.ListTools();
    ASSERT_EQ(all.wait_for(2s), std::future_status::ready);
    auto tools = all.get();
    ASSERT_EQ(tools.size(), 9u);
    EXPECT_EQ(tools.front().name, "echo");
    EXPECT_EQ(tools.back().name, "sleepy");
}

TEST(Client, ReceivesServerNotifications) {
    Fixture f;
    std::promise<std::string> got;
    f.client.SetNotificationHandler([&got](const std::string& method, const std::optional<JSONValue>&) {
        if (method == "server/hello") {
            got.set_value(method);
        }
    });
    f.connect();
    f.server.Broadcast("server/hello", JSONValue{JSONValue::Object{}});
    auto fut = got.get_future();
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
}

TEST(Client, CallsFailAfterDisconnect) {
    Fixture f;
    f.connect();
    f.client.Disconnect().get();
    EXPECT_FALSE(f.client.IsConnected());
    auto fut = f.client.CallTool("echo", JSONValue{JSONValue::Object{}});
    ASSERT_EQ(fut.wait_for(1s), std::future_status::ready);
    EXPECT_EQ(failureCode(fut), JSONRPCErrorCodes::ConnectionClosed);
}
