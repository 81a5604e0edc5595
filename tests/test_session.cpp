//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_session.cpp
// Purpose: Session correlation, concurrency, cancellation and teardown over an in-memory pair
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "toolrpc/InMemoryTransport.hpp"
#include "toolrpc/Protocol.h"
#include "toolrpc/Session.h"

using namespace toolrpc;
using namespace std::chrono_literals;

namespace {

struct SessionPair {
    std::shared_ptr<Session> left;
    std::shared_ptr<Session> right;
};

// Right side echoes params back, optionally after a delay read from params.delayMs.
SessionPair makeEchoPair() {
    auto [a, b] = InMemoryTransport::CreatePair();
    SessionPair p;
    p.left = Session::Create(std::shared_ptr<ITransport>(std::move(a)));
    p.right = Session::Create(std::shared_ptr<ITransport>(std::move(b)));
    p.right->SetRequestHandler([](const JSONRPCRequest& req, const RequestContext& ctx) {
        if (req.method != "echo") {
            return *CreateErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + req.method);
        }
        if (req.params.has_value()) {
            if (const JSONValue* d = req.params->Find("delayMs")) {
                auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(std::get<int64_t>(d->value));
                while (std::chrono::steady_clock::now() < until && !ctx.stop.stop_requested()) {
                    std::this_thread::sleep_for(5ms);
                }
            }
        }
        return JSONRPCResponse(req.id, req.params.value_or(JSONValue{nullptr}));
    });
    return p;
}

JSONValue intParams(const std::string& key, int64_t v) {
    JSONValue::Object o;
    o[key] = std::make_shared<JSONValue>(v);
    return JSONValue{o};
}

int failureCode(std::future<JSONValue>& fut) {
    try {
        (void)fut.get();
    } catch (const errors::McpException& e) {
        return e.code();
    }
    return 0;
}

} // namespace

TEST(Session, CallIsCorrelatedWithResponse) {
    auto p = makeEchoPair();
    ASSERT_EQ(p.left->Start().wait_for(1s), std::future_status::ready);
    ASSERT_EQ(p.right->Start().wait_for(1s), std::future_status::ready);

    auto fut = p.left->Call("echo", intParams("n", 7));
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    JSONValue result = fut.get();
    EXPECT_EQ(std::get<int64_t>(result.Find("n")->value), 7);
    EXPECT_EQ(p.left->PendingCount(), 0u);
    p.left->Close();
}

TEST(Session, ConcurrentCallsResolveIndependentlyOutOfOrder) {
    auto p = makeEchoPair();
    p.left->Start().get();
    p.right->Start().get();

    // Slow call first, fast calls after; the fast ones must not wait for it.
    JSONValue::Object slow;
    slow["delayMs"] = std::make_shared<JSONValue>(int64_t{300});
    slow["n"] = std::make_shared<JSONValue>(int64_t{-1});
    auto slowFut = p.left->Call("echo", JSONValue{slow});

    std::vector<std::future<JSONValue>> fast;
    for (int64_t i = 0; i < 20; ++i) {
        fast.push_back(p.left->Call("echo", intParams("n", i)));
    }
    for (int64_t i = 0; i < 20; ++i) {
        ASSERT_EQ(fast[i].wait_for(2s), std::future_status::ready) << i;
        EXPECT_EQ(std::get<int64_t>(fast[i].get().Find("n")->value), i);
    }
    EXPECT_NE(slowFut.wait_for(0ms), std::future_status::ready);
    ASSERT_EQ(slowFut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(std::get<int64_t>(slowFut.get().Find("n")->value), -1);
    p.left->Close();
}

TEST(Session, UnhandledMethodIsMethodNotFound) {
    auto p = makeEchoPair();
    p.left->Start().get();
    p.right->Start().get();
    auto fut = p.left->Call("nope", std::nullopt);
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(failureCode(fut), JSONRPCErrorCodes::MethodNotFound);
    p.left->Close();
}

TEST(Session, TimeoutSendsCancelAndStopsPeerHandler) {
    auto [a, b] = InMemoryTransport::CreatePair();
    auto left = Session::Create(std::shared_ptr<ITransport>(std::move(a)));
    auto right = Session::Create(std::shared_ptr<ITransport>(std::move(b)));
    std::promise<void> stopped;
    right->SetRequestHandler([&stopped](const JSONRPCRequest& req, const RequestContext& ctx) {
        while (!ctx.stop.stop_requested()) {
            std::this_thread::sleep_for(5ms);
        }
        stopped.set_value();
        return JSONRPCResponse(req.id, JSONValue{std::string("late")});
    });
    std::atomic<int> unmatched{0};
    left->SetErrorHandler([&unmatched](const std::string&) { ++unmatched; });
    left->Start().get();
    right->Start().get();

    CallOptions opts;
    opts.timeout = 50ms;
    auto fut = left->Call("block", std::nullopt, opts);
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(failureCode(fut), JSONRPCErrorCodes::RequestTimeout);

    // The cancel notification stops the handler; its late response is discarded silently.
    auto stoppedFut = stopped.get_future();
    ASSERT_EQ(stoppedFut.wait_for(2s), std::future_status::ready);
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(unmatched.load(), 0);
    EXPECT_EQ(right->InFlightCount(), 0u);
    left->Close();
}

TEST(Session, CallerStopCancelsCall) {
    auto p = makeEchoPair();
    p.left->Start().get();
    p.right->Start().get();
    std::stop_source source;
    CallOptions opts;
    opts.stop = source.get_token();
    auto fut = p.left->Call("echo", intParams("delayMs", 2000), opts);
    std::this_thread::sleep_for(20ms);
    source.request_stop();
    ASSERT_EQ(fut.wait_for(1s), std::future_status::ready);
    EXPECT_EQ(failureCode(fut), JSONRPCErrorCodes::RequestCancelled);
    p.left->Close();
}

TEST(Session, PeerCloseFailsPendingCalls) {
    auto [a, b] = InMemoryTransport::CreatePair();
    auto left = Session::Create(std::shared_ptr<ITransport>(std::move(a)));
    auto rightTransport = std::shared_ptr<InMemoryTransport>(std::move(b));
    std::promise<void> closed;
    left->SetClosedHandler([&closed](Session&) { closed.set_value(); });
    left->Start().get();
    rightTransport->Start().get();

    // Nobody answers on the right; closing it ends the stream.
    auto fut = left->Call("echo", std::nullopt);
    rightTransport->Close().get();

    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(failureCode(fut), JSONRPCErrorCodes::ConnectionClosed);
    auto closedFut = closed.get_future();
    ASSERT_EQ(closedFut.wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(left->IsOpen());

    auto after = left->Call("echo", std::nullopt);
    ASSERT_EQ(after.wait_for(1s), std::future_status::ready);
    EXPECT_EQ(failureCode(after), JSONRPCErrorCodes::ConnectionClosed);
}

TEST(Session, UnmatchedResponseIsReportedAsError) {
    auto [a, b] = InMemoryTransport::CreatePair();
    auto left = Session::Create(std::shared_ptr<ITransport>(std::move(a)));
    auto rawPeer = std::shared_ptr<InMemoryTransport>(std::move(b));
    std::promise<std::string> error;
    left->SetErrorHandler([&error](const std::string& msg) { error.set_value(msg); });
    left->Start().get();
    rawPeer->Start().get();

    ASSERT_TRUE(rawPeer->SendRawFrame(R"({"jsonrpc":"2.0","id":"ghost","result":1})"));
    auto errFut = error.get_future();
    ASSERT_EQ(errFut.wait_for(2s), std::future_status::ready);
    EXPECT_NE(errFut.get().find("ghost"), std::string::npos);
    left->Close();
}

TEST(Session, UndecodableFrameGetsErrorResponse) {
    auto [a, b] = InMemoryTransport::CreatePair();
    auto left = Session::Create(std::shared_ptr<ITransport>(std::move(a)));
    auto rawPeer = std::shared_ptr<InMemoryTransport>(std::move(b));
    std::promise<JSONRPCResponse> reply;
    rawPeer->SetMessageHandler([&reply](Envelope env) {
        if (auto* r = std::get_if<JSONRPCResponse>(&env)) {
            reply.set_value(*r);
        }
    });
    left->Start().get();
    rawPeer->Start().get();

    ASSERT_TRUE(rawPeer->SendRawFrame(R"({"jsonrpc":"2.0","id":5,"method":9})"));
    auto replyFut = reply.get_future();
    ASSERT_EQ(replyFut.wait_for(2s), std::future_status::ready);
    JSONRPCResponse resp = replyFut.get();
    ASSERT_TRUE(resp.IsError());
    EXPECT_EQ(std::get<int64_t>(resp.id), 5);
    EXPECT_EQ(std::get<int64_t>(resp.error->Find("code")->value), JSONRPCErrorCodes::InvalidRequest);
    left->Close();
}

TEST(Session, SlowNotificationHandlerDoesNotBlockRequests) {
    auto p = makeEchoPair();
    std::mutex seenMutex;
    std::vector<std::string> seen;
    std::promise<void> allSeen;
    p.right->SetNotificationHandler([&](const JSONRPCNotification& note, Session&) {
        if (note.method == "slow") {
            std::this_thread::sleep_for(400ms);
        }
        std::lock_guard<std::mutex> lock(seenMutex);
        seen.push_back(note.method);
        if (seen.size() == 3) {
            allSeen.set_value();
        }
    });
    p.left->Start().get();
    p.right->Start().get();

    p.left->Notify("slow").get();
    p.left->Notify("n1").get();
    p.left->Notify("n2").get();

    const auto start = std::chrono::steady_clock::now();
    auto fut = p.left->Call("echo", intParams("n", 1));
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 250ms);

    // Notifications still run one at a time, in arrival order.
    auto allFut = allSeen.get_future();
    ASSERT_EQ(allFut.wait_for(2s), std::future_status::ready);
    std::lock_guard<std::mutex> lock(seenMutex);
    EXPECT_EQ(seen, (std::vector<std::string>{"slow", "n1", "n2"}));
    p.left->Close();
}

TEST(Session, CloseWaitsForRunningRequestHandler) {
    auto [a, b] = InMemoryTransport::CreatePair();
    auto left = Session::Create(std::shared_ptr<ITransport>(std::move(a)));
    auto right = Session::Create(std::shared_ptr<ITransport>(std::move(b)));
    std::atomic<bool> running{false};
    std::promise<void> entered;
    right->SetRequestHandler([&](const JSONRPCRequest& req, const RequestContext&) {
        running.store(true);
        entered.set_value();
        std::this_thread::sleep_for(300ms);
        running.store(false);
        return JSONRPCResponse(req.id, JSONValue{std::string("done")});
    });
    left->Start().get();
    right->Start().get();

    auto fut = left->Call("work", std::nullopt);
    ASSERT_EQ(entered.get_future().wait_for(2s), std::future_status::ready);
    right->Close();
    EXPECT_FALSE(running.load());
    EXPECT_EQ(right->InFlightCount(), 0u);
    left->Close();
}

TEST(Session, HandlerMayCloseItsOwnSession) {
    auto p = makeEchoPair();
    std::promise<void> closed;
    p.right->SetClosedHandler([&closed](Session&) { closed.set_value(); });
    p.right->SetNotificationHandler([](const JSONRPCNotification& note, Session& s) {
        if (note.method == "shutdown") {
            s.Close();
        }
    });
    p.left->Start().get();
    p.right->Start().get();

    const auto start = std::chrono::steady_clock::now();
    p.left->Notify("shutdown").get();
    auto closedFut = closed.get_future();
    ASSERT_EQ(closedFut.wait_for(2s), std::future_status::ready);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
    EXPECT_FALSE(p.right->IsOpen());
    p.left->Close();
}
