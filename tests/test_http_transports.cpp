//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_http_transports.cpp
// Purpose: SSE and streamable HTTP transports end to end on loopback, plus raw HTTP status behavior
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "toolrpc/Client.h"
#include "toolrpc/Codec.h"
#include "toolrpc/SSEClientTransport.hpp"
#include "toolrpc/SSEServer.hpp"
#include "toolrpc/Server.h"
#include "toolrpc/StreamableHTTPClientTransport.hpp"
#include "toolrpc/StreamableHTTPServer.hpp"

using namespace toolrpc;
using namespace std::chrono_literals;
namespace http = boost::beast::http;

namespace {

//==========================================================================================================
// httpRequest
// Purpose: One synchronous HTTP/1.1 exchange against the loopback server.
//==========================================================================================================
http::response<http::string_body> httpRequest(http::verb verb, uint16_t port, const std::string& target,
                                              const std::string& body,
                                              const std::map<std::string, std::string>& headers = {}) {
    using boost::asio::ip::tcp;
    boost::asio::io_context ioc;
    tcp::resolver resolver{ioc};
    auto r = resolver.resolve("127.0.0.1", std::to_string(port));
    tcp::socket socket{ioc};
    boost::asio::connect(socket, r);

    http::request<http::string_body> req{verb, target, 11};
    req.set(http::field::host, "127.0.0.1");
    req.keep_alive(false);
    if (!body.empty()) {
        req.set(http::field::content_type, "application/json");
    }
    for (const auto& [k, v] : headers) {
        req.set(k, v);
    }
    req.body() = body;
    req.prepare_payload();
    http::write(socket, req);

    boost::beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(socket, buffer, res);

    boost::system::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
    return res;
}

void registerTools(Server& server) {
    server.RegisterTool(Tool{"echo", "Echo text back"}, [](ToolContext&, CallToolRequest& req) {
        std::string text;
        if (const JSONValue* t = req.arguments.Find("text"); t && t->IsString()) {
            text = std::get<std::string>(t->value);
        }
        return ToolOutcome::Ok(TextResult(text));
    });
    server.RegisterTool(Tool{"stall", "Runs until cancelled"}, [](ToolContext& ctx, CallToolRequest&) {
        const auto until = std::chrono::steady_clock::now() + 5s;
        while (!ctx.stop.stop_requested() && std::chrono::steady_clock::now() < until) {
            std::this_thread::sleep_for(5ms);
        }
        return ToolOutcome::Ok(TextResult("stalled"));
    });
}

uint16_t serveStreamable(Server& server, StreamableHTTPServer::Options opts) {
    auto acceptor = std::make_unique<StreamableHTTPServer>(opts);
    StreamableHTTPServer* raw = acceptor.get();
    server.Serve(std::move(acceptor)).get();
    return raw->GetBoundPort();
}

std::string callBody(const std::string& id, const std::string& tool, const std::string& argsJson) {
    return R"({"jsonrpc":"2.0","id":")" + id + R"(","method":"tools/call","params":{"name":")" + tool +
           R"(","arguments":)" + argsJson + "}}";
}

} // namespace

/////////////////////////////////////////// SSE ///////////////////////////////////////////

TEST(SSETransport, ClientServerRoundTripAndNotifications) {
    Server server;
    registerTools(server);
    auto acceptor = std::make_unique<SSEServer>(SSEServer::Options{});
    SSEServer* sse = acceptor.get();
    server.Serve(std::move(acceptor)).get();
    const uint16_t port = sse->GetBoundPort();
    ASSERT_NE(port, 0);

    Client client;
    std::promise<void> notified;
    std::atomic<bool> seen{false};
    client.SetNotificationHandler([&](const std::string& method, const std::optional<JSONValue>&) {
        if (method == "server/announce" && !seen.exchange(true)) {
            notified.set_value();
        }
    });
    SSEClientTransport::Options copts;
    copts.url = "http://127.0.0.1:" + std::to_string(port) + "/sse";
    ASSERT_EQ(client.Connect(std::make_unique<SSEClientTransport>(copts)).wait_for(5s), std::future_status::ready);
    ASSERT_TRUE(client.IsConnected());

    auto fut = client.CallTool("echo", ParseJSON(R"({"text":"over sse"})"));
    ASSERT_EQ(fut.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(ResultText(fut.get()), "over sse");

    auto tools = client.ListTools();
    ASSERT_EQ(tools.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(tools.get().size(), 2u);

    server.Broadcast("server/announce", JSONValue{JSONValue::Object{}});
    auto nf = notified.get_future();
    EXPECT_EQ(nf.wait_for(5s), std::future_status::ready);

    client.Disconnect().get();
    server.Stop().get();
}

TEST(SSETransport, NotificationsArriveInSendOrder) {
    constexpr int64_t Count = 200;
    Server server;
    std::mutex orderMutex;
    std::vector<int64_t> order;
    std::promise<void> all;
    server.RegisterNotification("client/seq", [&](const std::optional<JSONValue>& params, const std::string&) {
        std::lock_guard<std::mutex> lock(orderMutex);
        order.push_back(std::get<int64_t>(params->Find("n")->value));
        if (static_cast<int64_t>(order.size()) == Count) {
            all.set_value();
        }
    });
    auto acceptor = std::make_unique<SSEServer>(SSEServer::Options{});
    SSEServer* sse = acceptor.get();
    server.Serve(std::move(acceptor)).get();

    Client client;
    SSEClientTransport::Options copts;
    copts.url = "http://127.0.0.1:" + std::to_string(sse->GetBoundPort()) + "/sse";
    ASSERT_EQ(client.Connect(std::make_unique<SSEClientTransport>(copts)).wait_for(5s), std::future_status::ready);

    std::vector<std::future<void>> sends;
    for (int64_t n = 0; n < Count; ++n) {
        JSONValue::Object params;
        params["n"] = std::make_shared<JSONValue>(n);
        sends.push_back(client.Notify("client/seq", JSONValue{params}));
    }
    for (auto& f : sends) {
        ASSERT_EQ(f.wait_for(10s), std::future_status::ready);
        EXPECT_NO_THROW(f.get());
    }
    auto allFut = all.get_future();
    ASSERT_EQ(allFut.wait_for(5s), std::future_status::ready);
    std::lock_guard<std::mutex> lock(orderMutex);
    for (int64_t n = 0; n < Count; ++n) {
        EXPECT_EQ(order[static_cast<std::size_t>(n)], n);
    }

    client.Disconnect().get();
    server.Stop().get();
}

TEST(SSETransport, MessageEndpointStatusCodes) {
    Server server;
    auto acceptor = std::make_unique<SSEServer>(SSEServer::Options{});
    SSEServer* sse = acceptor.get();
    server.Serve(std::move(acceptor)).get();
    const uint16_t port = sse->GetBoundPort();

    auto noSession = httpRequest(http::verb::post, port, "/message", R"({"jsonrpc":"2.0","method":"x"})");
    EXPECT_EQ(noSession.result(), http::status::bad_request);

    auto unknown = httpRequest(http::verb::post, port, "/message?sessionId=nope", R"({"jsonrpc":"2.0","method":"x"})");
    EXPECT_EQ(unknown.result(), http::status::not_found);

    auto wrongPath = httpRequest(http::verb::get, port, "/elsewhere", "");
    EXPECT_EQ(wrongPath.result(), http::status::not_found);
    server.Stop().get();
}

/////////////////////////////////////////// Streamable HTTP ///////////////////////////////////////////

TEST(StreamableHTTP, StatelessRoundTrip) {
    Server server;
    registerTools(server);
    StreamableHTTPServer::Options sopts;
    sopts.mode = StreamableHTTPServer::Mode::Stateless;
    const uint16_t port = serveStreamable(server, sopts);

    Client client;
    StreamableHTTPClientTransport::Options copts;
    copts.url = "http://127.0.0.1:" + std::to_string(port) + "/mcp";
    client.Connect(std::make_unique<StreamableHTTPClientTransport>(copts)).get();

    for (int i = 0; i < 3; ++i) {
        auto fut = client.CallTool("echo", ParseJSON(R"({"text":"n)" + std::to_string(i) + R"("})"));
        ASSERT_EQ(fut.wait_for(5s), std::future_status::ready);
        EXPECT_EQ(ResultText(fut.get()), "n" + std::to_string(i));
    }

    // Each stateless exchange is torn down once answered.
    for (int i = 0; i < 100 && server.SessionCount() > 0; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_EQ(server.SessionCount(), 0u);

    auto get = httpRequest(http::verb::get, port, "/mcp", "");
    EXPECT_EQ(get.result(), http::status::method_not_allowed);
    client.Disconnect().get();
    server.Stop().get();
}

TEST(StreamableHTTP, StatefulPushStreamDeliversBroadcasts) {
    Server server;
    registerTools(server);
    const uint16_t port = serveStreamable(server, StreamableHTTPServer::Options{});

    Client client;
    std::promise<void> notified;
    std::atomic<bool> seen{false};
    client.SetNotificationHandler([&](const std::string& method, const std::optional<JSONValue>&) {
        if (method == "server/announce" && !seen.exchange(true)) {
            notified.set_value();
        }
    });
    StreamableHTTPClientTransport::Options copts;
    copts.url = "http://127.0.0.1:" + std::to_string(port) + "/mcp";
    copts.autoOpenPushStream = true;
    client.Connect(std::make_unique<StreamableHTTPClientTransport>(copts)).get();

    auto fut = client.CallTool("echo", ParseJSON(R"({"text":"stateful"})"));
    ASSERT_EQ(fut.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(ResultText(fut.get()), "stateful");
    EXPECT_EQ(server.SessionCount(), 1u);

    // The push stream attaches asynchronously after the session id is learned.
    auto nf = notified.get_future();
    for (int i = 0; i < 50 && nf.wait_for(0ms) != std::future_status::ready; ++i) {
        server.Broadcast("server/announce", JSONValue{JSONValue::Object{}});
        std::this_thread::sleep_for(50ms);
    }
    EXPECT_EQ(nf.wait_for(1s), std::future_status::ready);

    client.Disconnect().get();
    server.Stop().get();
}

TEST(StreamableHTTP, StatefulSessionLifecycleStatusCodes) {
    Server server;
    registerTools(server);
    const uint16_t port = serveStreamable(server, StreamableHTTPServer::Options{});

    auto unknown = httpRequest(http::verb::post, port, "/mcp", callBody("1", "echo", "{}"),
                               {{"Mcp-Session-Id", "does-not-exist"}});
    EXPECT_EQ(unknown.result(), http::status::not_found);

    auto bad = httpRequest(http::verb::post, port, "/mcp", "{not json");
    EXPECT_EQ(bad.result(), http::status::bad_request);
    EXPECT_NE(bad.body().find("-32700"), std::string::npos);

    auto first = httpRequest(http::verb::post, port, "/mcp", callBody("1", "echo", R"({"text":"hi"})"));
    ASSERT_EQ(first.result(), http::status::ok);
    auto sid = first.find("Mcp-Session-Id");
    ASSERT_NE(sid, first.end());
    const std::string sessionId(sid->value());
    auto decoded = DecodeEnvelope(first.body());
    ASSERT_TRUE(decoded.Ok());
    EXPECT_FALSE(std::get<JSONRPCResponse>(*decoded.envelope).IsError());

    auto note = httpRequest(http::verb::post, port, "/mcp", R"({"jsonrpc":"2.0","method":"client/ping"})",
                            {{"Mcp-Session-Id", sessionId}});
    EXPECT_EQ(note.result(), http::status::accepted);

    auto getNoHeader = httpRequest(http::verb::get, port, "/mcp", "");
    EXPECT_EQ(getNoHeader.result(), http::status::bad_request);

    auto put = httpRequest(http::verb::put, port, "/mcp", "{}");
    EXPECT_EQ(put.result(), http::status::method_not_allowed);

    auto del = httpRequest(http::verb::delete_, port, "/mcp", "", {{"Mcp-Session-Id", sessionId}});
    EXPECT_EQ(del.result(), http::status::ok);
    auto after = httpRequest(http::verb::post, port, "/mcp", callBody("2", "echo", "{}"),
                             {{"Mcp-Session-Id", sessionId}});
    EXPECT_EQ(after.result(), http::status::not_found);
    server.Stop().get();
}

TEST(StreamableHTTP, SlowRequestTimesOutWithGatewayTimeout) {
    Server server;
    registerTools(server);
    StreamableHTTPServer::Options sopts;
    sopts.requestTimeout = 100ms;
    const uint16_t port = serveStreamable(server, sopts);

    const auto start = std::chrono::steady_clock::now();
    auto res = httpRequest(http::verb::post, port, "/mcp", callBody("slow-1", "stall", "{}"));
    EXPECT_EQ(res.result(), http::status::gateway_timeout);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 3s);
    auto decoded = DecodeEnvelope(res.body());
    ASSERT_TRUE(decoded.Ok());
    const auto& resp = std::get<JSONRPCResponse>(*decoded.envelope);
    EXPECT_EQ(std::get<std::string>(resp.id), "slow-1");
    EXPECT_EQ(std::get<int64_t>(resp.error->Find("code")->value), JSONRPCErrorCodes::RequestTimeout);
    server.Stop().get();
}

TEST(StreamableHTTP, ClientSeesTransportErrorWhenServerIsGone) {
    Client client;
    StreamableHTTPClientTransport::Options copts;
    copts.url = "http://127.0.0.1:1/mcp";
    copts.connectTimeout = 500ms;
    client.Connect(std::make_unique<StreamableHTTPClientTransport>(copts)).get();
    auto fut = client.CallTool("echo", JSONValue{JSONValue::Object{}});
    ASSERT_EQ(fut.wait_for(5s), std::future_status::ready);
    EXPECT_ANY_THROW(fut.get());
}

TEST(StreamableHTTP, SlowNotificationHandlerDoesNotStallOtherExchanges) {
    Server server;
    registerTools(server);
    std::promise<void> slowEntered;
    server.RegisterNotification("client/slow", [&slowEntered](const std::optional<JSONValue>&, const std::string&) {
        slowEntered.set_value();
        std::this_thread::sleep_for(1500ms);
    });
    StreamableHTTPServer::Options sopts;
    sopts.mode = StreamableHTTPServer::Mode::Stateless;
    const uint16_t port = serveStreamable(server, sopts);

    auto note = std::async(std::launch::async, [port]() {
        return httpRequest(http::verb::post, port, "/mcp", R"({"jsonrpc":"2.0","method":"client/slow"})");
    });
    ASSERT_EQ(slowEntered.get_future().wait_for(2s), std::future_status::ready);

    const auto start = std::chrono::steady_clock::now();
    auto res = httpRequest(http::verb::post, port, "/mcp", callBody("fast-1", "echo", R"({"text":"quick"})"));
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 500ms);
    EXPECT_EQ(note.get().result(), http::status::accepted);
    server.Stop().get();
}

TEST(StreamableHTTP, NotificationsArriveInSendOrder) {
    constexpr int64_t Count = 100;
    Server server;
    registerTools(server);
    std::mutex orderMutex;
    std::vector<int64_t> order;
    std::promise<void> all;
    server.RegisterNotification("client/seq", [&](const std::optional<JSONValue>& params, const std::string&) {
        std::lock_guard<std::mutex> lock(orderMutex);
        order.push_back(std::get<int64_t>(params->Find("n")->value));
        if (static_cast<int64_t>(order.size()) == Count) {
            all.set_value();
        }
    });
    const uint16_t port = serveStreamable(server, StreamableHTTPServer::Options{});

    Client client;
    StreamableHTTPClientTransport::Options copts;
    copts.url = "http://127.0.0.1:" + std::to_string(port) + "/mcp";
    client.Connect(std::make_unique<StreamableHTTPClientTransport>(copts)).get();

    // A request interleaved with the notifications must not reorder them.
    std::vector<std::future<void>> sends;
    std::future<CallToolResult> call;
    for (int64_t n = 0; n < Count; ++n) {
        if (n == Count / 2) {
            call = client.CallTool("echo", ParseJSON(R"({"text":"middle"})"));
        }
        JSONValue::Object params;
        params["n"] = std::make_shared<JSONValue>(n);
        sends.push_back(client.Notify("client/seq", JSONValue{params}));
    }
    for (auto& f : sends) {
        ASSERT_EQ(f.wait_for(10s), std::future_status::ready);
        EXPECT_NO_THROW(f.get());
    }
    ASSERT_EQ(call.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(ResultText(call.get()), "middle");

    auto allFut = all.get_future();
    ASSERT_EQ(allFut.wait_for(5s), std::future_status::ready);
    std::lock_guard<std::mutex> lock(orderMutex);
    for (int64_t n = 0; n < Count; ++n) {
        EXPECT_EQ(order[static_cast<std::size_t>(n)], n);
    }
    EXPECT_EQ(server.SessionCount(), 1u);

    client.Disconnect().get();
    server.Stop().get();
}

TEST(StreamableHTTP, IdleStatefulSessionsExpire) {
    Server server;
    registerTools(server);
    StreamableHTTPServer::Options sopts;
    sopts.sessionIdleTimeout = 200ms;
    auto acceptor = std::make_unique<StreamableHTTPServer>(sopts);
    StreamableHTTPServer* streamable = acceptor.get();
    server.Serve(std::move(acceptor)).get();
    const uint16_t port = streamable->GetBoundPort();
    const std::string ping = R"({"jsonrpc":"2.0","method":"client/ping"})";

    // Clients that never send DELETE.
    std::string abandonedId;
    for (int i = 0; i < 5; ++i) {
        auto res = httpRequest(http::verb::post, port, "/mcp", ping);
        ASSERT_EQ(res.result(), http::status::accepted);
        abandonedId = std::string(res.find("Mcp-Session-Id")->value());
    }

    // A session that keeps talking outlives the idle timeout.
    auto first = httpRequest(http::verb::post, port, "/mcp", ping);
    const std::string busyId(first.find("Mcp-Session-Id")->value());
    for (int i = 0; i < 8; ++i) {
        std::this_thread::sleep_for(50ms);
        EXPECT_EQ(httpRequest(http::verb::post, port, "/mcp", ping, {{"Mcp-Session-Id", busyId}}).result(),
                  http::status::accepted);
    }
    EXPECT_EQ(httpRequest(http::verb::post, port, "/mcp", ping, {{"Mcp-Session-Id", abandonedId}}).result(),
              http::status::not_found);

    for (int i = 0; i < 100 && (streamable->SessionCount() > 0 || server.SessionCount() > 0); ++i) {
        std::this_thread::sleep_for(20ms);
    }
    EXPECT_EQ(streamable->SessionCount(), 0u);
    EXPECT_EQ(server.SessionCount(), 0u);
    server.Stop().get();
}
