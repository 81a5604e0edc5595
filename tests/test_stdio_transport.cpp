//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_stdio_transport.cpp
// Purpose: Line-delimited stdio transport over pipes: framing, server round trip, write queue limits
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <poll.h>
#include <unistd.h>

#include "toolrpc/Client.h"
#include "toolrpc/Codec.h"
#include "toolrpc/Server.h"
#include "toolrpc/StdioTransport.hpp"

using namespace toolrpc;
using namespace std::chrono_literals;

namespace {

struct Pipe {
    int fds[2]{-1, -1};
    Pipe() { EXPECT_EQ(::pipe(fds), 0); }
    ~Pipe() {
        closeRead();
        closeWrite();
    }
    int readFd() const { return fds[0]; }
    int writeFd() const { return fds[1]; }
    void closeRead() { if (fds[0] >= 0) { ::close(fds[0]); fds[0] = -1; } }
    void closeWrite() { if (fds[1] >= 0) { ::close(fds[1]); fds[1] = -1; } }
    // The transport owns and closes these ends.
    int releaseRead() { int fd = fds[0]; fds[0] = -1; return fd; }
    int releaseWrite() { int fd = fds[1]; fds[1] = -1; return fd; }
};

void writeAll(int fd, const std::string& data) {
    std::size_t off = 0;
    while (off < data.size()) {
        ssize_t w = ::write(fd, data.data() + off, data.size() - off);
        ASSERT_GT(w, 0);
        off += static_cast<std::size_t>(w);
    }
}

std::optional<std::string> readLine(int fd, std::chrono::milliseconds timeout) {
    std::string line;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        struct pollfd pfd{fd, POLLIN, 0};
        if (::poll(&pfd, 1, 10) <= 0) {
            continue;
        }
        char c = 0;
        ssize_t r = ::read(fd, &c, 1);
        if (r <= 0) {
            return std::nullopt;
        }
        if (c == '\n') {
            return line;
        }
        line.push_back(c);
    }
    return std::nullopt;
}

StdioTransport::Options pipeOptions(int inFd, int outFd) {
    StdioTransport::Options o;
    o.inFd = inFd;
    o.outFd = outFd;
    return o;
}

} // namespace

TEST(StdioTransport, DrainLinesSplitsCompleteLinesAndKeepsPartial) {
    StdioTransport t;
    std::vector<std::string> methods;
    t.SetMessageHandler([&methods](Envelope env) { methods.push_back(EnvelopeMethod(env)); });

    std::string buffer = "{\"jsonrpc\":\"2.0\",\"method\":\"a\"}\r\n\n   \n{\"jsonrpc\":\"2.0\",\"method\":\"b\"}\n{\"jsonrpc\"";
    StdioTransportTestHooks::drainLines(t, buffer);

    ASSERT_EQ(methods.size(), 2u);
    EXPECT_EQ(methods[0], "a");
    EXPECT_EQ(methods[1], "b");
    EXPECT_EQ(buffer, "{\"jsonrpc\"");
}

TEST(StdioTransport, OverlongLineIsDiscardedAndStreamRecovers) {
    StdioTransport::Options o;
    o.maxLineBytes = 64;
    StdioTransport t(o);
    int decodeErrors = 0;
    std::vector<std::string> methods;
    t.SetDecodeErrorHandler([&decodeErrors](const errors::McpError& e, const std::optional<JSONRPCId>&) {
        EXPECT_EQ(e.code, JSONRPCErrorCodes::ParseError);
        ++decodeErrors;
    });
    t.SetMessageHandler([&methods](Envelope env) { methods.push_back(EnvelopeMethod(env)); });

    // The long line arrives in two chunks; the tail must be skipped too.
    std::string buffer(100, 'x');
    StdioTransportTestHooks::drainLines(t, buffer);
    EXPECT_TRUE(buffer.empty());
    buffer = std::string(10, 'y') + "\n{\"jsonrpc\":\"2.0\",\"method\":\"ok\"}\n";
    StdioTransportTestHooks::drainLines(t, buffer);

    EXPECT_EQ(decodeErrors, 1);
    ASSERT_EQ(methods.size(), 1u);
    EXPECT_EQ(methods[0], "ok");
}

TEST(StdioTransport, MalformedLineReportsDecodeErrorWithId) {
    StdioTransport t;
    std::optional<JSONRPCId> seenId;
    int seenCode = 0;
    t.SetDecodeErrorHandler([&](const errors::McpError& e, const std::optional<JSONRPCId>& id) {
        seenCode = e.code;
        seenId = id;
    });
    std::string buffer = "{\"jsonrpc\":\"2.0\",\"id\":17,\"method\":42}\n";
    StdioTransportTestHooks::drainLines(t, buffer);
    EXPECT_EQ(seenCode, JSONRPCErrorCodes::InvalidRequest);
    ASSERT_TRUE(seenId.has_value());
    EXPECT_EQ(std::get<int64_t>(seenId.value()), 17);
}

TEST(StdioTransport, ServerAnswersLinesOverPipes) {
    Pipe toServer;
    Pipe fromServer;
    Server server;
    server.RegisterTool(Tool{"echo", ""}, [](ToolContext&, CallToolRequest& req) {
        return ToolOutcome::Ok(TextResult(SerializeJSON(req.arguments)));
    });
    auto transport = std::make_unique<StdioTransport>(pipeOptions(toServer.releaseRead(), fromServer.releaseWrite()));
    ASSERT_EQ(server.Start(std::move(transport)).wait_for(1s), std::future_status::ready);

    writeAll(toServer.writeFd(), "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"tools/call\",\"params\":{\"name\":\"missing\"}}\n");
    auto line1 = readLine(fromServer.readFd(), 2000ms);
    ASSERT_TRUE(line1.has_value());
    auto r1 = DecodeEnvelope(line1.value());
    ASSERT_TRUE(r1.Ok());
    const auto& resp1 = std::get<JSONRPCResponse>(*r1.envelope);
    EXPECT_EQ(std::get<int64_t>(resp1.id), 1);
    EXPECT_EQ(std::get<int64_t>(resp1.error->Find("code")->value), JSONRPCErrorCodes::ToolNotFound);

    writeAll(toServer.writeFd(), "this is not json\n");
    auto line2 = readLine(fromServer.readFd(), 2000ms);
    ASSERT_TRUE(line2.has_value());
    auto r2 = DecodeEnvelope(line2.value());
    ASSERT_TRUE(r2.Ok());
    const auto& resp2 = std::get<JSONRPCResponse>(*r2.envelope);
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(resp2.id));
    EXPECT_EQ(std::get<int64_t>(resp2.error->Find("code")->value), JSONRPCErrorCodes::ParseError);

    writeAll(toServer.writeFd(), "{\"jsonrpc\":\"2.0\",\"id\":\"x\",\"method\":\"tools/call\",\"params\":{\"name\":\"echo\",\"arguments\":{\"k\":1}}}\n");
    auto line3 = readLine(fromServer.readFd(), 2000ms);
    ASSERT_TRUE(line3.has_value());
    auto r3 = DecodeEnvelope(line3.value());
    ASSERT_TRUE(r3.Ok());
    const auto& resp3 = std::get<JSONRPCResponse>(*r3.envelope);
    ASSERT_FALSE(resp3.IsError());
    EXPECT_EQ(ResultText(CallToolResultFromJSON(resp3.result.value()).value()), R"({"k":1})");

    // EOF on input detaches the session.
    toServer.closeWrite();
    for (int i = 0; i < 200 && server.SessionCount() > 0; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_EQ(server.SessionCount(), 0u);
}

TEST(StdioTransport, ClientAndServerOverPipes) {
    Pipe clientToServer;
    Pipe serverToClient;
    Server server;
    server.RegisterTool(Tool{"ping", ""}, [](ToolContext&, CallToolRequest&) {
        return ToolOutcome::Ok(TextResult("pong"));
    });
    server.Start(std::make_unique<StdioTransport>(
        pipeOptions(clientToServer.releaseRead(), serverToClient.releaseWrite()))).get();

    Client client;
    client.Connect(std::make_unique<StdioTransport>(
        pipeOptions(serverToClient.releaseRead(), clientToServer.releaseWrite()))).get();

    auto fut = client.CallTool("ping", JSONValue{JSONValue::Object{}});
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(ResultText(fut.get()), "pong");

    auto tools = client.ListTools();
    ASSERT_EQ(tools.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(tools.get().size(), 1u);
    client.Disconnect().get();
}

TEST(StdioTransport, WriteQueueOverflowFailsSend) {
    Pipe in;
    Pipe out;
    StdioTransport::Options o = pipeOptions(in.releaseRead(), out.releaseWrite());
    o.writeQueueMaxBytes = 16;
    StdioTransport t(o);
    std::promise<void> errPromise;
    std::atomic<bool> sawError{false};
    t.SetErrorHandler([&](const std::string&) { if (!sawError.exchange(true)) { errPromise.set_value(); } });
    t.Start().get();

    JSONValue::Object obj;
    obj["data"] = std::make_shared<JSONValue>(std::string(128, 'x'));
    auto sent = t.Send(JSONRPCNotification("notify/overflow", JSONValue{obj}));
    ASSERT_EQ(sent.wait_for(1s), std::future_status::ready);
    EXPECT_THROW(sent.get(), errors::TransportError);
    auto fut = errPromise.get_future();
    ASSERT_EQ(fut.wait_for(1s), std::future_status::ready);
    EXPECT_EQ(StdioTransportTestHooks::queuedBytes(t), 0u);
    t.Close().get();
}

TEST(StdioTransport, SendCompletesWhenLineIsWritten) {
    Pipe in;
    Pipe out;
    StdioTransport t(pipeOptions(in.releaseRead(), out.releaseWrite()));
    EXPECT_THROW(t.Send(JSONRPCNotification("early")).get(), errors::TransportError);
    t.Start().get();

    auto sent = t.Send(JSONRPCNotification("hello/world"));
    ASSERT_EQ(sent.wait_for(1s), std::future_status::ready);
    EXPECT_NO_THROW(sent.get());
    auto line = readLine(out.readFd(), 1000ms);
    ASSERT_TRUE(line.has_value());
    auto decoded = DecodeEnvelope(line.value());
    ASSERT_TRUE(decoded.Ok());
    EXPECT_EQ(EnvelopeMethod(*decoded.envelope), "hello/world");

    t.Close().get();
    EXPECT_FALSE(t.IsConnected());
    EXPECT_THROW(t.Send(JSONRPCNotification("late")).get(), errors::TransportError);
}

TEST(StdioTransport, BurstOfOverlongInputStaysWithinLineLimit) {
    Pipe in;
    Pipe out;
    StdioTransport::Options o = pipeOptions(in.releaseRead(), out.releaseWrite());
    o.maxLineBytes = 256;
    StdioTransport t(o);
    std::atomic<int> decodeErrors{0};
    std::promise<std::string> delivered;
    t.SetDecodeErrorHandler([&decodeErrors](const errors::McpError&, const std::optional<JSONRPCId>&) { ++decodeErrors; });
    t.SetMessageHandler([&delivered](Envelope env) { delivered.set_value(EnvelopeMethod(env)); });
    t.Start().get();

    // Far more than one pipe buffer, written without pause so the reader never sees EAGAIN early.
    const std::string burst = std::string(512 * 1024, 'x') + "\n{\"jsonrpc\":\"2.0\",\"method\":\"after/burst\"}\n";
    std::thread writer([fd = in.writeFd(), &burst]() { writeAll(fd, burst); });

    auto fut = delivered.get_future();
    ASSERT_EQ(fut.wait_for(5s), std::future_status::ready);
    writer.join();
    EXPECT_EQ(fut.get(), "after/burst");
    EXPECT_EQ(decodeErrors.load(), 1);
    EXPECT_LE(StdioTransportTestHooks::peakBufferedBytes(t), o.maxLineBytes + 4096);
    t.Close().get();
}
