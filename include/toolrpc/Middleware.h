//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Middleware.h
// Purpose: Tool invocation context, outcome type and middleware chain composition
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

#include "toolrpc/JSONRPCTypes.h"
#include "toolrpc/Protocol.h"
#include "toolrpc/errors/Errors.h"

namespace toolrpc {

//==========================================================================================================
// ToolOutcome
// Purpose: Result-or-error returned by handlers and middleware.
// Notes:
//   - A protocol-level failure (unauthorized, rate limited, bad params) sets error and is encoded as a
//     JSON-RPC error response.
//   - A tool-reported failure is a successful outcome whose result has isError=true.
//==========================================================================================================
struct ToolOutcome {
    std::optional<CallToolResult> result;
    std::optional<errors::McpError> error;

    bool IsError() const { return error.has_value(); }

    static ToolOutcome Ok(CallToolResult r) {
        ToolOutcome o;
        o.result = std::move(r);
        return o;
    }

    static ToolOutcome Fail(errors::McpError e) {
        ToolOutcome o;
        o.error = std::move(e);
        return o;
    }

    static ToolOutcome Fail(int code, std::string message) {
        return Fail(errors::makeError(code, std::move(message)));
    }
};

//==========================================================================================================
// ToolContext
// Purpose: Per-invocation data shared by the chain.
// Fields:
//   stop: Cooperative cancellation; requested when the caller cancels the call.
//   requestId: JSON-RPC id of the tools/call request.
//   sessionId: Transport session the call arrived on.
//   toolName: Resolved tool name.
//   values: Free-form middleware-to-handler data (e.g. "auth.scopes").
//==========================================================================================================
struct ToolContext {
    std::stop_token stop;
    JSONRPCId requestId;
    std::string sessionId;
    std::string toolName;
    std::unordered_map<std::string, JSONValue> values;
};

using ToolHandlerFunc = std::function<ToolOutcome(ToolContext&, CallToolRequest&)>;
using MiddlewareFunc = std::function<ToolOutcome(ToolContext&, CallToolRequest&, const ToolHandlerFunc& next)>;

// Immutable, shareable composed handler.
using ToolChain = std::shared_ptr<const ToolHandlerFunc>;

//==========================================================================================================
// BuildChain
// Purpose: Folds globals then perTool around handler, right to left, so globals[0] is outermost and the
//          handler innermost. Pure: building twice with the same inputs yields equivalent chains.
// Args:
//   globals: Server-wide middleware in registration order.
//   perTool: Tool-specific middleware in registration order.
//   handler: Terminal tool handler.
// Returns:
//   The composed handler.
//==========================================================================================================
ToolHandlerFunc BuildChain(const std::vector<MiddlewareFunc>& globals,
                           const std::vector<MiddlewareFunc>& perTool,
                           ToolHandlerFunc handler);

} // namespace toolrpc
