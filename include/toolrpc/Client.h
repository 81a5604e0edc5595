//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.h
// Purpose: Tool client: discovery, invocation, timeouts and cancellation over one session
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "toolrpc/JSONRPCTypes.h"
#include "toolrpc/Protocol.h"
#include "toolrpc/Session.h"
#include "toolrpc/Transport.h"
#include "toolrpc/validation/Validation.h"

namespace toolrpc {

class IClient {
public:
    // Server-initiated traffic.
    using NotificationHandler = std::function<void(const std::string& method, const std::optional<JSONValue>& params)>;
    using RequestHandler = std::function<JSONValue(const std::string& method, const std::optional<JSONValue>& params,
                                                   const RequestContext& ctx)>;
    using ErrorHandler = std::function<void(const std::string& error)>;

    virtual ~IClient() = default;

    /////////////////////////////////////////// Connection ///////////////////////////////////////////
    //==========================================================================================================
    // Connects using the provided transport (owned by the client's session).
    // Returns:
    //   Future that completes once the transport is running.
    //==========================================================================================================
    virtual std::future<void> Connect(std::unique_ptr<ITransport> transport) = 0;

    //==========================================================================================================
    // Closes the session. Pending calls fail with ConnectionClosed. Redundant calls are no-ops.
    //==========================================================================================================
    virtual std::future<void> Disconnect() = 0;

    virtual bool IsConnected() const = 0;

    /////////////////////////////////////////// Tools ///////////////////////////////////////////
    //==========================================================================================================
    // Lists every tool, following nextCursor pages.
    //==========================================================================================================
    virtual std::future<std::vector<Tool>> ListTools(const CallOptions& options = {}) = 0;

    //==========================================================================================================
    // Lists one page.
    //==========================================================================================================
    virtual std::future<ToolsListResult> ListToolsPaged(const std::optional<std::string>& cursor,
                                                        const std::optional<int>& limit,
                                                        const CallOptions& options = {}) = 0;

    //==========================================================================================================
    // Invokes a tool.
    // Args:
    //   name: Tool name.
    //   arguments: Object (or null for none).
    //   options: Timeout (defaults to TOOLRPC_CLIENT_TIMEOUT_MS) and stop token.
    // Returns:
    //   The tool result; isError results are returned, not thrown. Protocol errors, timeouts,
    //   cancellation and teardown surface as errors::McpException.
    //==========================================================================================================
    virtual std::future<CallToolResult> CallTool(const std::string& name, const JSONValue& arguments,
                                                 const CallOptions& options = {}) = 0;

    /////////////////////////////////////////// Generic ///////////////////////////////////////////
    virtual std::future<JSONValue> Call(const std::string& method, std::optional<JSONValue> params,
                                        const CallOptions& options = {}) = 0;
    virtual std::future<void> Notify(const std::string& method, std::optional<JSONValue> params = std::nullopt) = 0;

    virtual void SetNotificationHandler(NotificationHandler handler) = 0;
    virtual void SetRequestHandler(RequestHandler handler) = 0;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;

    virtual void SetValidationMode(validation::ValidationMode mode) = 0;
    virtual validation::ValidationMode GetValidationMode() const = 0;

    // Default timeout applied when CallOptions::timeout is unset.
    virtual void SetDefaultTimeout(std::chrono::milliseconds timeout) = 0;
};

//==========================================================================================================
// Client
// Purpose: Default IClient.
// Notes:
//   - Handlers are captured on Connect; set them before connecting.
//   - In Strict validation mode malformed tools/list and tools/call results fail with InternalError.
//==========================================================================================================
class Client : public IClient {
public:
    Client();
    ~Client() override;

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    std::future<void> Connect(std::unique_ptr<ITransport> transport) override;
    std::future<void> Disconnect() override;
    bool IsConnected() const override;

    std::future<std::vector<Tool>> ListTools(const CallOptions& options = {}) override;
    std::future<ToolsListResult> ListToolsPaged(const std::optional<std::string>& cursor,
                                                const std::optional<int>& limit,
                                                const CallOptions& options = {}) override;
    std::future<CallToolResult> CallTool(const std::string& name, const JSONValue& arguments,
                                         const CallOptions& options = {}) override;

    std::future<JSONValue> Call(const std::string& method, std::optional<JSONValue> params,
                                const CallOptions& options = {}) override;
    std::future<void> Notify(const std::string& method, std::optional<JSONValue> params = std::nullopt) override;

    void SetNotificationHandler(NotificationHandler handler) override;
    void SetRequestHandler(RequestHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    void SetValidationMode(validation::ValidationMode mode) override;
    validation::ValidationMode GetValidationMode() const override;
    void SetDefaultTimeout(std::chrono::milliseconds timeout) override;

    // Number of calls awaiting a response.
    std::size_t PendingCount() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolrpc
