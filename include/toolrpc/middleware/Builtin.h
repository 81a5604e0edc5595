//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Builtin.h
// Purpose: Stock tool middleware: fault recovery, logging, token auth, metrics, rate limiting
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "toolrpc/Middleware.h"
#include "toolrpc/auth/TokenAuth.hpp"

namespace toolrpc {
namespace middleware {

//==========================================================================================================
// Recovery
// Purpose: Converts any exception escaping `next` into an InternalError outcome
//          ("Handler fault: <what>", data {"fault": <what>}).
//==========================================================================================================
MiddlewareFunc Recovery();

//==========================================================================================================
// Logging
// Purpose: Logs tool start, arguments (DEBUG), duration and outcome.
//==========================================================================================================
MiddlewareFunc Logging();

//==========================================================================================================
// AuthOptions / Auth
// Purpose: Requires a valid token in the call arguments.
// Fields:
//   argumentName: Argument carrying the token.
//   requiredScopes: Scopes the token must grant.
//   stripToken: Remove the token from the arguments before calling `next`.
// Notes:
//   On failure the chain short-circuits with Unauthorized (-32006),
//   "unauthorized: invalid or missing <argumentName>". On success the scopes are stored in
//   ToolContext::values["auth.scopes"] and auth::CurrentTokenInfo() is set for the rest of the chain.
//==========================================================================================================
struct AuthOptions {
    std::string argumentName{"auth_token"};
    std::vector<std::string> requiredScopes;
    bool stripToken{true};
};

MiddlewareFunc Auth(std::shared_ptr<auth::ITokenVerifier> verifier, AuthOptions options = {});

//==========================================================================================================
// ToolMetrics / Metrics
// Purpose: Per-tool success/error counters and cumulative latency. An outcome counts as an error when it
//          is a protocol error or a result with isError=true.
//==========================================================================================================
struct ToolStats {
    uint64_t success{0};
    uint64_t error{0};
    std::chrono::nanoseconds totalLatency{0};
};

class ToolMetrics {
public:
    void Record(const std::string& tool, bool ok, std::chrono::nanoseconds latency);
    std::optional<ToolStats> Snapshot(const std::string& tool) const;
    void Reset();

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, ToolStats> stats_;
};

MiddlewareFunc Metrics(std::shared_ptr<ToolMetrics> metrics);

//==========================================================================================================
// RateLimitOptions / RateLimit
// Purpose: Token bucket per tool name, shared by every session the middleware is installed for.
// Fields:
//   perSecond: Refill rate.
//   burst: Bucket capacity (also the initial fill).
// Notes:
//   An empty bucket short-circuits with RateLimited (-32007).
//==========================================================================================================
struct RateLimitOptions {
    double perSecond{10.0};
    double burst{10.0};
};

MiddlewareFunc RateLimit(RateLimitOptions options);

} // namespace middleware
} // namespace toolrpc
