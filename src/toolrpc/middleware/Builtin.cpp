//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Builtin.cpp
// Purpose: Stock tool middleware implementation
//==========================================================================================================

#include <algorithm>
#include <chrono>
#include <exception>

#include "toolrpc/middleware/Builtin.h"
#include "logging/Logger.h"

namespace toolrpc {
namespace middleware {

namespace {

using Clock = std::chrono::steady_clock;

long long elapsedMs(Clock::time_point start) {
    return static_cast<long long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count());
}

ToolOutcome handlerFault(const std::string& what) {
    JSONValue::Object data;
    data["fault"] = std::make_shared<JSONValue>(what);
    return ToolOutcome::Fail(errors::makeError(JSONRPCErrorCodes::InternalError, "Handler fault: " + what,
                                               JSONValue{data}));
}

bool outcomeOk(const ToolOutcome& out) {
    return !out.IsError() && out.result.has_value() && !out.result->isError;
}

} // namespace

MiddlewareFunc Recovery() {
    return [](ToolContext& ctx, CallToolRequest& req, const ToolHandlerFunc& next) -> ToolOutcome {
        try {
            return next(ctx, req);
        } catch (const errors::McpException& e) {
            LOG_WARN("Tool {} raised error {}: {}", ctx.toolName, e.code(), e.what());
            return ToolOutcome::Fail(e.error());
        } catch (const std::exception& e) {
            LOG_ERROR("Recovered from fault in tool {}: {}", ctx.toolName, e.what());
            return handlerFault(e.what());
        } catch (...) {
            LOG_ERROR("Recovered from unknown fault in tool {}", ctx.toolName);
            return handlerFault("unknown exception");
        }
    };
}

MiddlewareFunc Logging() {
    return [](ToolContext& ctx, CallToolRequest& req, const ToolHandlerFunc& next) -> ToolOutcome {
        LOG_INFO("Tool call started: {} (request {})", req.name, IdToString(ctx.requestId));
        LOG_DEBUG("Tool call arguments: {}", SerializeJSON(req.arguments));
        const auto start = Clock::now();
        ToolOutcome out = next(ctx, req);
        const long long ms = elapsedMs(start);
        if (out.IsError()) {
            LOG_WARN("Tool call failed: {} ({} ms): {} ({})", req.name, ms, out.error->message, out.error->code);
        } else if (out.result.has_value() && out.result->isError) {
            LOG_WARN("Tool call failed: {} ({} ms): tool reported an error", req.name, ms);
        } else {
            LOG_INFO("Tool call succeeded: {} ({} ms)", req.name, ms);
        }
        return out;
    };
}

MiddlewareFunc Auth(std::shared_ptr<auth::ITokenVerifier> verifier, AuthOptions options) {
    return [verifier = std::move(verifier), options = std::move(options)](
               ToolContext& ctx, CallToolRequest& req, const ToolHandlerFunc& next) -> ToolOutcome {
        std::string token;
        if (const JSONValue* t = req.arguments.Find(options.argumentName); t && t->IsString()) {
            token = std::get<std::string>(t->value);
        }
        auth::TokenInfo info;
        auth::TokenCheckResult check;
        if (verifier) {
            check = auth::CheckToken(token, *verifier, auth::TokenCheckOptions{options.requiredScopes}, info);
        } else {
            check.errorMessage = "no verifier configured";
        }
        if (!check.ok) {
            LOG_WARN("Unauthorized call to {}: {}", req.name, check.errorMessage);
            JSONValue::Object data;
            data["reason"] = std::make_shared<JSONValue>(check.errorMessage);
            return ToolOutcome::Fail(errors::makeError(JSONRPCErrorCodes::Unauthorized,
                                                       "unauthorized: invalid or missing " + options.argumentName,
                                                       JSONValue{data}));
        }

        if (options.stripToken && req.arguments.IsObject()) {
            std::get<JSONValue::Object>(req.arguments.value).erase(options.argumentName);
        }
        JSONValue::Array scopes;
        for (const auto& s : info.scopes) {
            scopes.push_back(std::make_shared<JSONValue>(s));
        }
        ctx.values["auth.scopes"] = JSONValue{scopes};

        auth::TokenInfoScope scope(&info);
        return next(ctx, req);
    };
}

void ToolMetrics::Record(const std::string& tool, bool ok, std::chrono::nanoseconds latency) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& s = stats_[tool];
    if (ok) {
        ++s.success;
    } else {
        ++s.error;
    }
    s.totalLatency += latency;
}

std::optional<ToolStats> ToolMetrics::Snapshot(const std::string& tool) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stats_.find(tool);
    if (it == stats_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ToolMetrics::Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.clear();
}

MiddlewareFunc Metrics(std::shared_ptr<ToolMetrics> metrics) {
    return [metrics = std::move(metrics)](ToolContext& ctx, CallToolRequest& req, const ToolHandlerFunc& next) -> ToolOutcome {
        const auto start = Clock::now();
        ToolOutcome out = next(ctx, req);
        const bool ok = outcomeOk(out);
        if (metrics) {
            metrics->Record(req.name, ok, std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start));
        }
        LOG_INFO("Metric: tool={}, status={}", req.name, ok ? "success" : "error");
        return out;
    };
}

MiddlewareFunc RateLimit(RateLimitOptions options) {
    struct Bucket {
        double tokens;
        Clock::time_point last;
    };
    struct State {
        std::mutex mutex;
        std::unordered_map<std::string, Bucket> buckets;
    };
    auto state = std::make_shared<State>();
    const double rate = std::max(options.perSecond, 0.0);
    const double burst = std::max(options.burst, 1.0);

    return [state, rate, burst](ToolContext& ctx, CallToolRequest& req, const ToolHandlerFunc& next) -> ToolOutcome {
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            const auto now = Clock::now();
            auto it = state->buckets.find(ctx.toolName);
            if (it == state->buckets.end()) {
                it = state->buckets.emplace(ctx.toolName, Bucket{burst, now}).first;
            }
            Bucket& b = it->second;
            const double elapsed = std::chrono::duration<double>(now - b.last).count();
            b.tokens = std::min(burst, b.tokens + elapsed * rate);
            b.last = now;
            if (b.tokens < 1.0) {
                LOG_WARN("Rate limit exceeded for tool {}", ctx.toolName);
                return ToolOutcome::Fail(JSONRPCErrorCodes::RateLimited, "rate limit exceeded for tool " + ctx.toolName);
            }
            b.tokens -= 1.0;
        }
        return next(ctx, req);
    };
}

} // namespace middleware
} // namespace toolrpc
