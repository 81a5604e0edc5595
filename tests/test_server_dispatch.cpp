//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_server_dispatch.cpp
// Purpose: Server request dispatch: tools/call error mapping, paging, custom methods, notifications
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "toolrpc/InMemoryTransport.hpp"
#include "toolrpc/Server.h"
#include "toolrpc/Session.h"
#include "toolrpc/middleware/Builtin.h"

using namespace toolrpc;
using namespace std::chrono_literals;

namespace {

JSONRPCRequest callRequest(int64_t id, const std::string& tool, const std::string& argsJson) {
    JSONValue::Object params;
    params["name"] = std::make_shared<JSONValue>(tool);
    params["arguments"] = std::make_shared<JSONValue>(ParseJSON(argsJson));
    return JSONRPCRequest(JSONRPCId{id}, Methods::CallTool, JSONValue{params});
}

int errorCode(const JSONRPCResponse& resp) {
    if (!resp.error.has_value()) {
        return 0;
    }
    return static_cast<int>(std::get<int64_t>(resp.error->Find("code")->value));
}

std::string errorMessage(const JSONRPCResponse& resp) {
    return std::get<std::string>(resp.error->Find("message")->value);
}

std::string resultText(const JSONRPCResponse& resp) {
    auto r = CallToolResultFromJSON(resp.result.value());
    return r.has_value() ? ResultText(r.value()) : std::string();
}

JSONValue helloSchema() {
    return ParseJSON(R"({"type":"object","properties":{"name":{"type":"string"},"auth_token":{"type":"string"}},"required":["auth_token"]})");
}

ToolHandlerFunc helloHandler() {
    return [](ToolContext&, CallToolRequest& req) {
        std::string name = "World";
        if (const JSONValue* n = req.arguments.Find("name"); n && n->IsString()) {
            name = std::get<std::string>(n->value);
        }
        return ToolOutcome::Ok(TextResult("Hello, " + name + "! Tool executed successfully."));
    };
}

} // namespace

TEST(ServerDispatch, HelloWithAuthAndMetricsChain) {
    Server server;
    auto verifier = std::make_shared<auth::StaticTokenVerifier>();
    verifier->AddToken("valid_token");
    auto metrics = std::make_shared<middleware::ToolMetrics>();

    // Outermost layer: records every outcome the rest of the chain produced.
    std::vector<bool> observedErrors;
    MiddlewareFunc recorder = [&observedErrors](ToolContext& ctx, CallToolRequest& req, const ToolHandlerFunc& next) {
        ToolOutcome out = next(ctx, req);
        observedErrors.push_back(out.IsError());
        return out;
    };
    server.Use({recorder, middleware::Recovery(), middleware::Logging(), middleware::Auth(verifier), middleware::Metrics(metrics)});

    int helloCalls = 0;
    auto greet = helloHandler();
    ASSERT_FALSE(server.RegisterTool(Tool{"hello", "Greets", helloSchema()},
                                     [&helloCalls, greet](ToolContext& ctx, CallToolRequest& req) {
                                         ++helloCalls;
                                         return greet(ctx, req);
                                     }).has_value());

    RequestContext ctx;
    auto ok = server.Dispatch(callRequest(1, "hello", R"({"name":"Alice","auth_token":"valid_token"})"), ctx);
    ASSERT_FALSE(ok.IsError());
    EXPECT_EQ(resultText(ok), "Hello, Alice! Tool executed successfully.");
    EXPECT_EQ(helloCalls, 1);
    auto stats = metrics->Snapshot("hello");
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->success, 1u);

    // Auth rejects before Metrics or the handler see the call; the outer layers see the failure.
    metrics->Reset();
    auto denied = server.Dispatch(callRequest(2, "hello", R"({"name":"Mallory","auth_token":"wrong"})"), ctx);
    ASSERT_TRUE(denied.IsError());
    EXPECT_EQ(errorCode(denied), JSONRPCErrorCodes::Unauthorized);
    EXPECT_EQ(errorMessage(denied), "unauthorized: invalid or missing auth_token");
    EXPECT_FALSE(metrics->Snapshot("hello").has_value());
    EXPECT_EQ(helloCalls, 1);

    auto missing = server.Dispatch(callRequest(3, "hello", R"({})"), ctx);
    EXPECT_EQ(errorCode(missing), JSONRPCErrorCodes::Unauthorized);
    EXPECT_EQ(helloCalls, 1);

    ASSERT_EQ(observedErrors.size(), 3u);
    EXPECT_FALSE(observedErrors[0]);
    EXPECT_TRUE(observedErrors[1]);
    EXPECT_TRUE(observedErrors[2]);
}

TEST(ServerDispatch, ToolCallErrorMapping) {
    Server server;
    server.RegisterTool(Tool{"boom", ""}, [](ToolContext&, CallToolRequest&) -> ToolOutcome {
        throw std::runtime_error("kaput");
    });
    server.RegisterTool(Tool{"soft", ""}, [](ToolContext&, CallToolRequest&) {
        return ToolOutcome::Ok(TextResult("tool says no", true));
    });
    RequestContext ctx;

    auto unknown = server.Dispatch(callRequest(1, "ghost", "{}"), ctx);
    EXPECT_EQ(errorCode(unknown), JSONRPCErrorCodes::ToolNotFound);

    auto fault = server.Dispatch(callRequest(2, "boom", "{}"), ctx);
    EXPECT_EQ(errorCode(fault), JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(errorMessage(fault), "Handler fault: kaput");
    EXPECT_EQ(std::get<std::string>(fault.error->Find("data")->Find("fault")->value), "kaput");

    auto soft = server.Dispatch(callRequest(3, "soft", "{}"), ctx);
    ASSERT_FALSE(soft.IsError());
    auto parsed = CallToolResultFromJSON(soft.result.value());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->isError);

    JSONValue::Object noName;
    auto badName = server.Dispatch(JSONRPCRequest(JSONRPCId{int64_t{4}}, Methods::CallTool, JSONValue{noName}), ctx);
    EXPECT_EQ(errorCode(badName), JSONRPCErrorCodes::InvalidParams);

    JSONValue::Object badArgs;
    badArgs["name"] = std::make_shared<JSONValue>(std::string("soft"));
    badArgs["arguments"] = std::make_shared<JSONValue>(std::string("not an object"));
    auto badArgsResp = server.Dispatch(JSONRPCRequest(JSONRPCId{int64_t{5}}, Methods::CallTool, JSONValue{badArgs}), ctx);
    EXPECT_EQ(errorCode(badArgsResp), JSONRPCErrorCodes::InvalidParams);

    auto noMethod = server.Dispatch(JSONRPCRequest(JSONRPCId{int64_t{6}}, "resources/list"), ctx);
    EXPECT_EQ(errorCode(noMethod), JSONRPCErrorCodes::MethodNotFound);
}

TEST(ServerDispatch, TypedToolExceptionKeepsItsError) {
    Server server;
    ToolHandlerFunc refuse = [](ToolContext&, CallToolRequest&) -> ToolOutcome {
        throw errors::McpException(errors::makeError(JSONRPCErrorCodes::InvalidParams, "divisor must not be zero"));
    };
    server.RegisterTool(Tool{"divide", ""}, refuse);
    server.RegisterTool(Tool{"divide_recovered", ""}, refuse, {middleware::Recovery()});
    RequestContext ctx;

    for (const char* tool : {"divide", "divide_recovered"}) {
        auto resp = server.Dispatch(callRequest(1, tool, "{}"), ctx);
        ASSERT_TRUE(resp.IsError()) << tool;
        EXPECT_EQ(errorCode(resp), JSONRPCErrorCodes::InvalidParams) << tool;
        EXPECT_EQ(errorMessage(resp), "divisor must not be zero") << tool;
    }
}

TEST(ServerDispatch, StopWaitsForRunningToolHandlers) {
    std::atomic<bool> handlerRunning{false};
    std::promise<void> entered;
    auto server = std::make_unique<Server>();
    server->RegisterTool(Tool{"slow", ""}, [&](ToolContext&, CallToolRequest&) {
        handlerRunning.store(true);
        entered.set_value();
        // Ignores the stop token on purpose; Stop must still wait for it.
        std::this_thread::sleep_for(400ms);
        handlerRunning.store(false);
        return ToolOutcome::Ok(TextResult("done"));
    });

    auto [serverSide, clientSide] = InMemoryTransport::CreatePair();
    auto peer = Session::Create(std::shared_ptr<ITransport>(std::move(clientSide)));
    peer->Start().get();
    server->Start(std::move(serverSide)).get();

    JSONValue::Object params;
    params["name"] = std::make_shared<JSONValue>(std::string("slow"));
    auto call = peer->Call(Methods::CallTool, JSONValue{params});
    ASSERT_EQ(entered.get_future().wait_for(2s), std::future_status::ready);

    server->Stop().get();
    EXPECT_FALSE(handlerRunning.load());
    server.reset();
    EXPECT_FALSE(handlerRunning.load());
    peer->Close();
}

TEST(ServerDispatch, StrictModeRejectsMissingRequiredArguments) {
    Server server;
    server.SetValidationMode(validation::ValidationMode::Strict);
    server.RegisterTool(Tool{"hello", "", helloSchema()}, helloHandler());
    RequestContext ctx;

    auto resp = server.Dispatch(callRequest(1, "hello", R"({"name":"x"})"), ctx);
    ASSERT_TRUE(resp.IsError());
    EXPECT_EQ(errorCode(resp), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(errorMessage(resp), "Missing required arguments: auth_token");

    server.SetValidationMode(validation::ValidationMode::Off);
    EXPECT_FALSE(server.Dispatch(callRequest(2, "hello", R"({"name":"x"})"), ctx).IsError());
}

TEST(ServerDispatch, CancelledRequestReportsRequestCancelled) {
    Server server;
    server.RegisterTool(Tool{"wait", ""}, [](ToolContext& ctx, CallToolRequest&) {
        while (!ctx.stop.stop_requested()) {
            std::this_thread::sleep_for(5ms);
        }
        return ToolOutcome::Ok(TextResult("too late"));
    });
    std::stop_source source;
    RequestContext ctx;
    ctx.stop = source.get_token();
    auto fut = std::async(std::launch::async, [&]() { return server.Dispatch(callRequest(1, "wait", "{}"), ctx); });
    std::this_thread::sleep_for(20ms);
    source.request_stop();
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(errorCode(fut.get()), JSONRPCErrorCodes::RequestCancelled);
}

TEST(ServerDispatch, ToolsListPaging) {
    Server server;
    for (const char* n : {"e", "d", "c", "b", "a"}) {
        server.RegisterTool(Tool{n, ""}, helloHandler());
    }
    RequestContext ctx;

    JSONValue::Object p1;
    p1["limit"] = std::make_shared<JSONValue>(int64_t{2});
    auto page1 = server.Dispatch(JSONRPCRequest(JSONRPCId{int64_t{1}}, Methods::ListTools, JSONValue{p1}), ctx);
    ASSERT_FALSE(page1.IsError());
    const auto& tools1 = std::get<JSONValue::Array>(page1.result->Find("tools")->value);
    ASSERT_EQ(tools1.size(), 2u);
    EXPECT_EQ(std::get<std::string>(tools1[0]->Find("name")->value), "a");
    ASSERT_NE(page1.result->Find("nextCursor"), nullptr);
    EXPECT_EQ(std::get<std::string>(page1.result->Find("nextCursor")->value), "2");

    JSONValue::Object p3;
    p3["cursor"] = std::make_shared<JSONValue>(std::string("4"));
    p3["limit"] = std::make_shared<JSONValue>(int64_t{2});
    auto page3 = server.Dispatch(JSONRPCRequest(JSONRPCId{int64_t{2}}, Methods::ListTools, JSONValue{p3}), ctx);
    const auto& tools3 = std::get<JSONValue::Array>(page3.result->Find("tools")->value);
    ASSERT_EQ(tools3.size(), 1u);
    EXPECT_EQ(page3.result->Find("nextCursor"), nullptr);

    JSONValue::Object bad;
    bad["cursor"] = std::make_shared<JSONValue>(std::string("abc"));
    auto badResp = server.Dispatch(JSONRPCRequest(JSONRPCId{int64_t{3}}, Methods::ListTools, JSONValue{bad}), ctx);
    EXPECT_EQ(errorCode(badResp), JSONRPCErrorCodes::InvalidParams);

    auto all = server.Dispatch(JSONRPCRequest(JSONRPCId{int64_t{4}}, Methods::ListTools), ctx);
    EXPECT_EQ(std::get<JSONValue::Array>(all.result->Find("tools")->value).size(), 5u);
}

TEST(ServerDispatch, CustomMethodsAndTypedErrors) {
    Server server;
    server.RegisterMethod("math/add", [](const std::optional<JSONValue>& params, const RequestContext&) {
        const auto a = std::get<int64_t>(params->Find("a")->value);
        const auto b = std::get<int64_t>(params->Find("b")->value);
        return JSONValue{a + b};
    });
    server.RegisterMethod("math/fail", [](const std::optional<JSONValue>&, const RequestContext&) -> JSONValue {
        throw errors::McpException(errors::makeError(JSONRPCErrorCodes::InvalidParams, "bad operands"));
    });
    RequestContext ctx;

    auto sum = server.Dispatch(JSONRPCRequest(JSONRPCId{int64_t{1}}, "math/add", ParseJSON(R"({"a":2,"b":3})")), ctx);
    ASSERT_FALSE(sum.IsError());
    EXPECT_EQ(std::get<int64_t>(sum.result->value), 5);

    auto fail = server.Dispatch(JSONRPCRequest(JSONRPCId{int64_t{2}}, "math/fail"), ctx);
    EXPECT_EQ(errorCode(fail), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(errorMessage(fail), "bad operands");
}

TEST(ServerDispatch, NotificationsAndListChangedOverTransport) {
    Server server;
    std::promise<std::string> pinged;
    server.RegisterNotification("client/ping", [&pinged](const std::optional<JSONValue>& params, const std::string&) {
        pinged.set_value(std::get<std::string>(params->Find("msg")->value));
    });

    auto [serverSide, clientSide] = InMemoryTransport::CreatePair();
    auto peer = Session::Create(std::shared_ptr<ITransport>(std::move(clientSide)));
    std::promise<void> listChanged;
    std::atomic<bool> seen{false};
    peer->SetNotificationHandler([&](const JSONRPCNotification& note, Session&) {
        if (note.method == Methods::ToolListChanged && !seen.exchange(true)) {
            listChanged.set_value();
        }
    });
    peer->Start().get();
    ASSERT_EQ(server.Start(std::move(serverSide)).wait_for(1s), std::future_status::ready);
    EXPECT_EQ(server.SessionCount(), 1u);
    EXPECT_TRUE(server.IsRunning());

    peer->Notify("client/ping", ParseJSON(R"({"msg":"hi"})")).get();
    auto pingFut = pinged.get_future();
    ASSERT_EQ(pingFut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(pingFut.get(), "hi");

    server.RegisterTool(Tool{"late", ""}, helloHandler());
    auto changedFut = listChanged.get_future();
    ASSERT_EQ(changedFut.wait_for(2s), std::future_status::ready);

    // Round trip through the session-level dispatcher.
    auto listFut = peer->Call(Methods::ListTools, std::nullopt);
    ASSERT_EQ(listFut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(std::get<JSONValue::Array>(listFut.get().Find("tools")->value).size(), 1u);

    server.Stop().get();
    EXPECT_FALSE(server.IsRunning());
    peer->Close();
}
