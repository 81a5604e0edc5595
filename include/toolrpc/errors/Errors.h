//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures, exceptions, and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "toolrpc/JSONRPCTypes.h"

namespace toolrpc {
namespace errors {

// Categorization of JSON-RPC and protocol error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    McpInvalidRequestId,
    McpToolNotFound,
    McpDuplicateTool,
    McpUnauthorized,
    McpRateLimited,
    RequestTimeout,
    RequestCancelled,
    ConnectionClosed,
    Unknown
};

// Typed error representation used across the library.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a JSON-RPC numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code (JSON-RPC standard or protocol-specific).
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::InvalidRequestId: return ErrorCategory::McpInvalidRequestId;
        case JSONRPCErrorCodes::ToolNotFound: return ErrorCategory::McpToolNotFound;
        case JSONRPCErrorCodes::DuplicateTool: return ErrorCategory::McpDuplicateTool;
        case JSONRPCErrorCodes::Unauthorized: return ErrorCategory::McpUnauthorized;
        case JSONRPCErrorCodes::RateLimited: return ErrorCategory::McpRateLimited;
        case JSONRPCErrorCodes::RequestTimeout: return ErrorCategory::RequestTimeout;
        case JSONRPCErrorCodes::RequestCancelled: return ErrorCategory::RequestCancelled;
        case JSONRPCErrorCodes::ConnectionClosed: return ErrorCategory::ConnectionClosed;
        default: return ErrorCategory::Unknown;
    }
}

// Build an McpError with its category derived from the code.
inline McpError makeError(int code, std::string message, std::optional<JSONValue> data = std::nullopt) {
    McpError e;
    e.code = code;
    e.message = std::move(message);
    e.data = std::move(data);
    e.category = errorCategoryFromCode(code);
    return e;
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    const JSONValue* code = errVal.Find("code");
    const JSONValue* msg = errVal.Find("message");
    if (!code || !msg) {
        return std::nullopt;
    }
    if (!std::holds_alternative<int64_t>(code->value) || !std::holds_alternative<std::string>(msg->value)) {
        return std::nullopt;
    }
    std::optional<JSONValue> data;
    if (const JSONValue* d = errVal.Find("data")) {
        data = *d;
    }
    return makeError(static_cast<int>(std::get<int64_t>(code->value)), std::get<std::string>(msg->value),
                     std::move(data));
}

// Extract McpError from a JSONRPCResponse if it carries an error.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

// Create a JSONValue error object from a typed McpError.
inline JSONValue makeErrorValue(const McpError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Convenience: Create a JSONRPCResponse error from McpError and id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

//==========================================================================================================
// McpException
// Purpose: Exception carrying a typed McpError; thrown through client futures (remote errors, timeouts,
//          cancellation, connection loss).
//==========================================================================================================
class McpException : public std::runtime_error {
public:
    explicit McpException(McpError err)
        : std::runtime_error(err.message), error_(std::move(err)) {}

    const McpError& error() const noexcept { return error_; }
    int code() const noexcept { return error_.code; }
    ErrorCategory category() const noexcept { return error_.category; }

private:
    McpError error_;
};

//==========================================================================================================
// TransportError
// Purpose: Transport-level failure (closed transport, full queue, write/read failure, frame-level decode).
//==========================================================================================================
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace errors
} // namespace toolrpc
