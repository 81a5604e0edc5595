//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.h
// Purpose: Tool server: registry, middleware, request dispatch across one or many sessions
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "toolrpc/JSONRPCTypes.h"
#include "toolrpc/Middleware.h"
#include "toolrpc/Protocol.h"
#include "toolrpc/Session.h"
#include "toolrpc/Transport.h"
#include "toolrpc/errors/Errors.h"
#include "toolrpc/validation/Validation.h"

namespace toolrpc {

//==========================================================================================================
// Custom method hooks.
// MethodHandler returns the result value; throw errors::McpException to answer with a specific error.
// Any other exception is answered as a handler fault.
//==========================================================================================================
using MethodHandler = std::function<JSONValue(const std::optional<JSONValue>& params, const RequestContext& ctx)>;
using NotificationHandler = std::function<void(const std::optional<JSONValue>& params, const std::string& sessionId)>;

class IServer {
public:
    using ErrorHandler = std::function<void(const std::string& error)>;

    virtual ~IServer() = default;

    /////////////////////////////////////////// Lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts serving a single transport (e.g. stdio).
    // Args:
    //   transport: Transport owned by the new session.
    // Returns:
    //   Future that completes once the transport is running.
    //==========================================================================================================
    virtual std::future<void> Start(std::unique_ptr<ITransport> transport) = 0;

    //==========================================================================================================
    // Serves every session accepted by an acceptor (SSE, streamable HTTP).
    // Args:
    //   acceptor: Acceptor owned by the server until Stop.
    // Returns:
    //   Future that completes once the acceptor is listening.
    //==========================================================================================================
    virtual std::future<void> Serve(std::unique_ptr<ITransportAcceptor> acceptor) = 0;

    //==========================================================================================================
    // Closes all sessions and acceptors. Redundant calls are no-ops.
    //==========================================================================================================
    virtual std::future<void> Stop() = 0;

    virtual bool IsRunning() const = 0;

    /////////////////////////////////////////// Tools ///////////////////////////////////////////
    //==========================================================================================================
    // Appends global middleware (outermost first) and rebuilds the chains of registered tools.
    //==========================================================================================================
    virtual void Use(MiddlewareFunc middleware) = 0;
    virtual void Use(const std::vector<MiddlewareFunc>& middleware) = 0;

    //==========================================================================================================
    // Registers a tool and notifies connected sessions with notifications/tools/list_changed.
    // Returns:
    //   std::nullopt on success; the registry error otherwise (InvalidParams, DuplicateTool).
    //==========================================================================================================
    virtual std::optional<errors::McpError> RegisterTool(Tool tool, ToolHandlerFunc handler,
                                                         std::vector<MiddlewareFunc> perTool = {}) = 0;
    virtual bool UnregisterTool(const std::string& name) = 0;
    virtual std::vector<Tool> ListTools() const = 0;

    /////////////////////////////////////////// Custom methods ///////////////////////////////////////////
    virtual void RegisterMethod(const std::string& method, MethodHandler handler) = 0;
    virtual void RegisterNotification(const std::string& method, NotificationHandler handler) = 0;

    //==========================================================================================================
    // Sends a notification to every connected session (best effort).
    //==========================================================================================================
    virtual void Broadcast(const std::string& method, std::optional<JSONValue> params = std::nullopt) = 0;

    /////////////////////////////////////////// Policy ///////////////////////////////////////////
    virtual void SetValidationMode(validation::ValidationMode mode) = 0;
    virtual validation::ValidationMode GetValidationMode() const = 0;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;

    virtual std::size_t SessionCount() const = 0;
};

//==========================================================================================================
// Server
// Purpose: Default IServer.
// Notes:
//   - Built-in methods: tools/list (sorted, cursor/limit paging) and tools/call.
//   - Every tool call runs its cached chain inside a fault boundary; an escaping exception becomes
//     InternalError "Handler fault: <what>" with data {"fault": <what>}.
//   - A call stopped by notifications/cancelled before its chain produced a result is answered with
//     RequestCancelled (-32800).
//   - Unknown methods yield MethodNotFound; unknown notifications are logged and dropped.
//   - Validation mode starts from TOOLRPC_VALIDATION (Off unless set to strict).
//==========================================================================================================
class Server : public IServer {
public:
    Server();
    ~Server() override;

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    std::future<void> Start(std::unique_ptr<ITransport> transport) override;
    std::future<void> Serve(std::unique_ptr<ITransportAcceptor> acceptor) override;
    std::future<void> Stop() override;
    bool IsRunning() const override;

    void Use(MiddlewareFunc middleware) override;
    void Use(const std::vector<MiddlewareFunc>& middleware) override;
    std::optional<errors::McpError> RegisterTool(Tool tool, ToolHandlerFunc handler,
                                                 std::vector<MiddlewareFunc> perTool = {}) override;
    bool UnregisterTool(const std::string& name) override;
    std::vector<Tool> ListTools() const override;

    void RegisterMethod(const std::string& method, MethodHandler handler) override;
    void RegisterNotification(const std::string& method, NotificationHandler handler) override;
    void Broadcast(const std::string& method, std::optional<JSONValue> params = std::nullopt) override;

    void SetValidationMode(validation::ValidationMode mode) override;
    validation::ValidationMode GetValidationMode() const override;
    void SetErrorHandler(ErrorHandler handler) override;

    std::size_t SessionCount() const override;

    //==========================================================================================================
    // Dispatch
    // Purpose: Answers one request exactly as a session would (used by sessions and embedders).
    // Returns:
    //   The response carrying request.id.
    //==========================================================================================================
    JSONRPCResponse Dispatch(const JSONRPCRequest& request, const RequestContext& ctx);

private:
    class Impl;
    // Shared so session worker threads can outlive a stopped server safely.
    std::shared_ptr<Impl> pImpl;
};

} // namespace toolrpc
