//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Middleware.cpp
// Purpose: Middleware chain composition
//==========================================================================================================

#include "toolrpc/Middleware.h"
#include "logging/Logger.h"

namespace toolrpc {

namespace {

ToolHandlerFunc wrap(const MiddlewareFunc& mw, ToolHandlerFunc next) {
    return [mw, next = std::move(next)](ToolContext& ctx, CallToolRequest& req) -> ToolOutcome {
        return mw(ctx, req, next);
    };
}

} // namespace

ToolHandlerFunc BuildChain(const std::vector<MiddlewareFunc>& globals,
                           const std::vector<MiddlewareFunc>& perTool,
                           ToolHandlerFunc handler) {
    FUNC_SCOPE();
    ToolHandlerFunc chain = std::move(handler);
    for (auto it = perTool.rbegin(); it != perTool.rend(); ++it) {
        if (*it) {
            chain = wrap(*it, std::move(chain));
        }
    }
    for (auto it = globals.rbegin(); it != globals.rend(); ++it) {
        if (*it) {
            chain = wrap(*it, std::move(chain));
        }
    }
    return chain;
}

} // namespace toolrpc
