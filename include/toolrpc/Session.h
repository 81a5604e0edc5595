//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.h
// Purpose: One logical connection: transport + pending-call table + in-flight request table
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

#include "toolrpc/JSONRPCTypes.h"
#include "toolrpc/PendingCallTable.h"
#include "toolrpc/Transport.h"

namespace toolrpc {

class Session;

//==========================================================================================================
// CallOptions
// Purpose: Per-call controls for outgoing requests.
// Fields:
//   timeout: Relative deadline; nullopt waits until response, cancellation or teardown.
//   stop: Caller cancellation token; a stop request fails the call with RequestCancelled.
//==========================================================================================================
struct CallOptions {
    std::optional<std::chrono::milliseconds> timeout;
    std::stop_token stop;
};

// Context handed to inbound request handlers.
struct RequestContext {
    std::stop_token stop;      // requested when the peer cancels the request or the session closes
    std::string sessionId;
    std::weak_ptr<Session> session;
};

//==========================================================================================================
// Session
// Purpose: Correlates responses with pending calls and routes inbound requests/notifications.
// Notes:
//   - Each inbound request runs on its own worker thread, so concurrent calls proceed concurrently and
//     responses may complete out of order.
//   - Notifications run on a per-session worker, one at a time in arrival order, so a slow handler never
//     blocks the transport's I/O thread.
//   - "notifications/cancelled" stops the matching in-flight request.
//   - Responses for unknown ids are protocol errors (logged, reported to the error handler); responses
//     for ids retired by cancellation or timeout are discarded silently.
//   - Calls that are cancelled or time out notify the peer with "notifications/cancelled".
//   - Teardown (Close, transport close, write failure) happens exactly once: in-flight requests are
//     drained, pending calls fail with ConnectionClosed and the transport is closed.
//==========================================================================================================
class Session : public std::enable_shared_from_this<Session> {
public:
    using RequestHandler = std::function<JSONRPCResponse(const JSONRPCRequest&, const RequestContext&)>;
    using NotificationHandler = std::function<void(const JSONRPCNotification&, Session&)>;
    using ErrorHandler = std::function<void(const std::string&)>;
    using ClosedHandler = std::function<void(Session&)>;

    struct Options {
        std::size_t retiredIdCapacity{PendingCallTable::DefaultRetiredCapacity};
        // Upper bound on waiting for in-flight handlers during teardown.
        std::chrono::milliseconds drainTimeout{std::chrono::seconds(5)};
    };

    static std::shared_ptr<Session> Create(std::shared_ptr<ITransport> transport);
    static std::shared_ptr<Session> Create(std::shared_ptr<ITransport> transport, const Options& options);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /////////////////////////////////////////// Handlers (set before Start) ///////////////////////////////////////////
    void SetRequestHandler(RequestHandler handler);
    void SetNotificationHandler(NotificationHandler handler);
    void SetErrorHandler(ErrorHandler handler);
    void SetClosedHandler(ClosedHandler handler);

    /////////////////////////////////////////// Lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Start
    // Purpose: Wires transport callbacks and starts the transport.
    // Returns:
    //   The transport's start future.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Close
    // Purpose: Cancels in-flight requests and waits (bounded by drainTimeout) for their handlers, fails
    //          pending calls with ConnectionClosed and closes the transport. Redundant calls only wait for
    //          handlers that are still running.
    //==========================================================================================================
    void Close();

    bool IsOpen() const;
    std::string GetId() const;

    /////////////////////////////////////////// Outbound ///////////////////////////////////////////
    //==========================================================================================================
    // Call
    // Purpose: Sends a request with a fresh id ("req-<n>") and returns a future for its result.
    // Returns:
    //   Future resolving to the response result; it fails with errors::McpException for remote errors,
    //   RequestTimeout, RequestCancelled and ConnectionClosed, or with errors::TransportError when the
    //   send itself fails.
    //==========================================================================================================
    std::future<JSONValue> Call(const std::string& method, std::optional<JSONValue> params, const CallOptions& options = {});

    std::future<void> Notify(const std::string& method, std::optional<JSONValue> params = std::nullopt);
    std::future<void> Send(Envelope envelope);

    std::size_t PendingCount() const;
    std::size_t InFlightCount() const;

private:
    Session(std::shared_ptr<ITransport> transport, const Options& options);

    void onEnvelope(Envelope env);
    void onRequest(JSONRPCRequest request);
    void onResponse(const JSONRPCResponse& response);
    void onNotification(const JSONRPCNotification& note);
    // Returns false when another caller already started the teardown.
    bool teardown(bool graceful);

    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolrpc
