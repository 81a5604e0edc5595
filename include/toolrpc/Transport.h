//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Transport layer interfaces - uniform envelope exchange over any byte medium
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <functional>
#include <future>
#include <cstdint>

#include "toolrpc/JSONRPCTypes.h"
#include "toolrpc/errors/Errors.h"

namespace toolrpc {

//==========================================================================================================
// Transport interface
// Purpose: One logical, bidirectional envelope stream.
// Notes:
//   - Writes are serialized: concurrent Send calls never interleave partial frames.
//   - Once closed, Send fails fast with errors::TransportError.
//   - Close is idempotent; resources are released exactly once.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the transport I/O loop.
    // Args:
    //   (none)
    // Returns:
    //   A future that completes when the transport is running.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Closes the transport and releases resources. Redundant calls are no-ops.
    // Args:
    //   (none)
    // Returns:
    //   A future that completes when the transport has closed.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    //==========================================================================================================
    // Indicates whether the transport is currently connected.
    // Args:
    //   (none)
    // Returns:
    //   true if connected; false otherwise.
    //==========================================================================================================
    virtual bool IsConnected() const = 0;

    //==========================================================================================================
    // Returns a transport session identifier for diagnostics.
    // Args:
    //   (none)
    // Returns:
    //   A string identifying the current session.
    //==========================================================================================================
    virtual std::string GetSessionId() const = 0;

    /////////////////////////////////////////// Message sending ///////////////////////////////////////////
    //==========================================================================================================
    // Queues one envelope for outbound delivery.
    // Args:
    //   envelope: Request, response or notification to write.
    // Returns:
    //   Future completing once the frame is written (or handed to the outbound stream); it fails with
    //   errors::TransportError when the transport is closed, the queue is full or the write fails.
    //==========================================================================================================
    virtual std::future<void> Send(Envelope envelope) = 0;

    /////////////////////////////////////////// Inbound delivery ///////////////////////////////////////////
    //==========================================================================================================
    // Registers the inbound envelope callback. Envelopes are delivered in arrival order per stream.
    // Args:
    //   handler: Callback receiving ownership of each decoded envelope.
    // Returns:
    //   (none)
    //==========================================================================================================
    using MessageHandler = std::function<void(Envelope)>;
    virtual void SetMessageHandler(MessageHandler handler) = 0;

    //==========================================================================================================
    // Registers a callback for inbound frames that failed to decode.
    // Args:
    //   handler: Callback with the decode error and the id when one could be recovered.
    // Returns:
    //   (none)
    //==========================================================================================================
    using DecodeErrorHandler = std::function<void(const errors::McpError& error, const std::optional<JSONRPCId>& id)>;
    virtual void SetDecodeErrorHandler(DecodeErrorHandler handler) = 0;

    /////////////////////////////////////////// Error handling ///////////////////////////////////////////
    //==========================================================================================================
    // Registers an error handler to receive transport errors.
    // Args:
    //   handler: Callback with error string.
    // Returns:
    //   (none)
    //==========================================================================================================
    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;

    //==========================================================================================================
    // Registers a callback fired once when the transport closes (local Close, EOF, peer disconnect).
    // Args:
    //   handler: Callback with no arguments.
    // Returns:
    //   (none)
    //==========================================================================================================
    using CloseHandler = std::function<void()>;
    virtual void SetCloseHandler(CloseHandler handler) = 0;
};

// Concrete transports are declared in their respective headers:
//  - toolrpc/StdioTransport.hpp
//  - toolrpc/InMemoryTransport.hpp
//  - toolrpc/SSEClientTransport.hpp
//  - toolrpc/StreamableHTTPClientTransport.hpp
//  - toolrpc/SSEServer.hpp and toolrpc/StreamableHTTPServer.hpp (implement ITransportAcceptor)

//==========================================================================================================
// Transport factory interface
// Purpose: Factory for creating transports from configuration strings.
//==========================================================================================================
class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;

    //==========================================================================================================
    // Creates a transport instance using the provided configuration.
    // Args:
    //   config: Transport-specific configuration string ("key=value;..." or a URL).
    // Returns:
    //   A unique_ptr to a newly created ITransport.
    //==========================================================================================================
    virtual std::unique_ptr<ITransport> CreateTransport(const std::string& config) = 0;
};

//==========================================================================================================
// ITransportAcceptor
// Purpose: Server-side listener owning the multi-client accept role.
// Notes:
//   - Binds/listens in Start(), tears down listener and live sessions in Stop().
//   - Every new logical session is surfaced as an ITransport through the accept handler; the session's
//     envelopes then flow through that transport's own handlers.
//==========================================================================================================
class ITransportAcceptor {
public:
    virtual ~ITransportAcceptor() = default;

    //==========================================================================================================
    // Starts the acceptor (binds/listens/spawns accept loop as needed).
    // Args:
    //   (none)
    // Returns:
    //   Future that completes when the accept loop is running.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Stops the acceptor and releases resources (closes listener and active sessions).
    // Args:
    //   (none)
    // Returns:
    //   Future that completes when the acceptor has stopped.
    //==========================================================================================================
    virtual std::future<void> Stop() = 0;

    //==========================================================================================================
    // Registers the callback invoked once per new logical session. The handler must install its message
    // handler on the transport before returning; the acceptor starts delivering afterwards.
    // Args:
    //   handler: Callback receiving shared ownership of the session transport.
    // Returns:
    //   (none)
    //==========================================================================================================
    using AcceptHandler = std::function<void(std::shared_ptr<ITransport>)>;
    virtual void SetAcceptHandler(AcceptHandler handler) = 0;

    //==========================================================================================================
    // Registers an error handler to receive acceptor errors.
    // Args:
    //   handler: Callback receiving error strings.
    //==========================================================================================================
    virtual void SetErrorHandler(ITransport::ErrorHandler handler) = 0;
};

//==========================================================================================================
// Transport acceptor factory interface
// Purpose: Factory for creating server-side acceptors from configuration strings.
//==========================================================================================================
class ITransportAcceptorFactory {
public:
    virtual ~ITransportAcceptorFactory() = default;

    //==========================================================================================================
    // Creates a server-side acceptor instance using the provided configuration.
    // Args:
    //   config: Acceptor-specific configuration string (e.g., "http://127.0.0.1:9443/mcp?mode=stateful").
    // Returns:
    //   A unique_ptr to a newly created ITransportAcceptor.
    //==========================================================================================================
    virtual std::unique_ptr<ITransportAcceptor> CreateTransportAcceptor(const std::string& config) = 0;
};

} // namespace toolrpc
