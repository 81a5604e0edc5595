//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_builtin_middleware.cpp
// Purpose: Stock middleware behavior: recovery, token auth and scopes, metrics, rate limiting
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "toolrpc/middleware/Builtin.h"

using namespace toolrpc;
using namespace std::chrono_literals;

namespace {

CallToolRequest requestWith(const std::string& name, const std::string& json) {
    return CallToolRequest{name, ParseJSON(json)};
}

ToolOutcome invoke(const ToolHandlerFunc& chain, CallToolRequest req, ToolContext* ctxOut = nullptr) {
    ToolContext ctx;
    ctx.toolName = req.name;
    ctx.requestId = int64_t{1};
    ToolOutcome out = chain(ctx, req);
    if (ctxOut) {
        *ctxOut = ctx;
    }
    return out;
}

} // namespace

TEST(BuiltinMiddleware, RecoveryConvertsExceptionsToInternalError) {
    auto chain = BuildChain({middleware::Recovery()}, {}, [](ToolContext&, CallToolRequest&) -> ToolOutcome {
        throw std::runtime_error("disk on fire");
    });
    ToolOutcome out = invoke(chain, requestWith("boom", "{}"));
    ASSERT_TRUE(out.IsError());
    EXPECT_EQ(out.error->code, JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(out.error->message, "Handler fault: disk on fire");
    ASSERT_TRUE(out.error->data.has_value());
    const JSONValue* fault = out.error->data->Find("fault");
    ASSERT_NE(fault, nullptr);
    EXPECT_EQ(std::get<std::string>(fault->value), "disk on fire");
}

TEST(BuiltinMiddleware, RecoveryPassesThroughNormalOutcomes) {
    auto chain = BuildChain({middleware::Recovery(), middleware::Logging()}, {}, [](ToolContext&, CallToolRequest&) {
        return ToolOutcome::Ok(TextResult("fine"));
    });
    ToolOutcome out = invoke(chain, requestWith("ok", "{}"));
    ASSERT_FALSE(out.IsError());
    EXPECT_EQ(ResultText(*out.result), "fine");
}

TEST(BuiltinMiddleware, AuthStripsTokenAndExposesScopes) {
    auto verifier = std::make_shared<auth::StaticTokenVerifier>();
    verifier->AddToken("admin-token", {"tools:read", "tools:write"});
    middleware::AuthOptions opts;
    opts.requiredScopes = {"tools:write"};

    bool sawTokenInfo = false;
    bool tokenStillPresent = true;
    auto chain = BuildChain({middleware::Auth(verifier, opts)}, {}, [&](ToolContext&, CallToolRequest& req) {
        tokenStillPresent = req.arguments.Find("auth_token") != nullptr;
        const auth::TokenInfo* info = auth::CurrentTokenInfo();
        sawTokenInfo = info != nullptr && info->scopes.size() == 2;
        return ToolOutcome::Ok(TextResult("written"));
    });

    ToolContext ctx;
    ToolOutcome out = invoke(chain, requestWith("write", R"({"auth_token":"admin-token","v":1})"), &ctx);
    ASSERT_FALSE(out.IsError());
    EXPECT_FALSE(tokenStillPresent);
    EXPECT_TRUE(sawTokenInfo);
    EXPECT_EQ(auth::CurrentTokenInfo(), nullptr);

    auto it = ctx.values.find("auth.scopes");
    ASSERT_NE(it, ctx.values.end());
    ASSERT_TRUE(it->second.IsArray());
    EXPECT_EQ(std::get<JSONValue::Array>(it->second.value).size(), 2u);
}

TEST(BuiltinMiddleware, AuthRejectsMissingInvalidAndUnderScopedTokens) {
    auto verifier = std::make_shared<auth::StaticTokenVerifier>();
    verifier->AddToken("reader", {"tools:read"});
    middleware::AuthOptions opts;
    opts.argumentName = "key";
    opts.requiredScopes = {"tools:write"};
    int handlerCalls = 0;
    auto chain = BuildChain({middleware::Auth(verifier, opts)}, {}, [&handlerCalls](ToolContext&, CallToolRequest&) {
        ++handlerCalls;
        return ToolOutcome::Ok(TextResult("x"));
    });

    auto expectReason = [&](const std::string& args, const std::string& reason) {
        ToolOutcome out = invoke(chain, requestWith("write", args));
        ASSERT_TRUE(out.IsError());
        EXPECT_EQ(out.error->code, JSONRPCErrorCodes::Unauthorized);
        EXPECT_EQ(out.error->message, "unauthorized: invalid or missing key");
        ASSERT_TRUE(out.error->data.has_value());
        EXPECT_EQ(std::get<std::string>(out.error->data->Find("reason")->value), reason);
    };
    expectReason("{}", "no token");
    expectReason(R"({"key":"nope"})", "invalid token");
    expectReason(R"({"key":"reader"})", "insufficient scope");
    expectReason(R"({"key":42})", "no token");
    EXPECT_EQ(handlerCalls, 0);
}

TEST(BuiltinMiddleware, AuthWithoutVerifierDenies) {
    auto chain = BuildChain({middleware::Auth(nullptr)}, {}, [](ToolContext&, CallToolRequest&) {
        return ToolOutcome::Ok(TextResult("x"));
    });
    ToolOutcome out = invoke(chain, requestWith("t", R"({"auth_token":"anything"})"));
    ASSERT_TRUE(out.IsError());
    EXPECT_EQ(out.error->code, JSONRPCErrorCodes::Unauthorized);
}

TEST(BuiltinMiddleware, MetricsCountsSuccessAndErrors) {
    auto metrics = std::make_shared<middleware::ToolMetrics>();
    auto chain = BuildChain({middleware::Metrics(metrics)}, {}, [](ToolContext&, CallToolRequest& req) {
        const JSONValue* mode = req.arguments.Find("mode");
        const std::string m = mode ? std::get<std::string>(mode->value) : std::string();
        if (m == "fail") {
            return ToolOutcome::Fail(JSONRPCErrorCodes::InternalError, "nope");
        }
        if (m == "soft") {
            return ToolOutcome::Ok(TextResult("bad input", true));
        }
        return ToolOutcome::Ok(TextResult("ok"));
    });

    invoke(chain, requestWith("calc", R"({"mode":"ok"})"));
    invoke(chain, requestWith("calc", R"({"mode":"ok"})"));
    invoke(chain, requestWith("calc", R"({"mode":"fail"})"));
    invoke(chain, requestWith("calc", R"({"mode":"soft"})"));

    auto snap = metrics->Snapshot("calc");
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->success, 2u);
    EXPECT_EQ(snap->error, 2u);
    EXPECT_FALSE(metrics->Snapshot("other").has_value());

    metrics->Reset();
    EXPECT_FALSE(metrics->Snapshot("calc").has_value());
}

TEST(BuiltinMiddleware, RateLimitRejectsOnceBurstIsSpent) {
    middleware::RateLimitOptions opts;
    opts.perSecond = 0.001;
    opts.burst = 2;
    auto chain = BuildChain({middleware::RateLimit(opts)}, {}, [](ToolContext&, CallToolRequest&) {
        return ToolOutcome::Ok(TextResult("ok"));
    });

    EXPECT_FALSE(invoke(chain, requestWith("hot", "{}")).IsError());
    EXPECT_FALSE(invoke(chain, requestWith("hot", "{}")).IsError());
    ToolOutcome third = invoke(chain, requestWith("hot", "{}"));
    ASSERT_TRUE(third.IsError());
    EXPECT_EQ(third.error->code, JSONRPCErrorCodes::RateLimited);

    // Buckets are per tool.
    EXPECT_FALSE(invoke(chain, requestWith("cold", "{}")).IsError());
}

TEST(BuiltinMiddleware, RateLimitRefillsOverTime) {
    middleware::RateLimitOptions opts;
    opts.perSecond = 50;
    opts.burst = 1;
    auto chain = BuildChain({middleware::RateLimit(opts)}, {}, [](ToolContext&, CallToolRequest&) {
        return ToolOutcome::Ok(TextResult("ok"));
    });
    EXPECT_FALSE(invoke(chain, requestWith("t", "{}")).IsError());
    EXPECT_TRUE(invoke(chain, requestWith("t", "{}")).IsError());
    std::this_thread::sleep_for(60ms);
    EXPECT_FALSE(invoke(chain, requestWith("t", "{}")).IsError());
}
