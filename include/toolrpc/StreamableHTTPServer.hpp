//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StreamableHTTPServer.hpp
// Purpose: Single-endpoint streamable HTTP acceptor (POST/GET/DELETE) with stateless and stateful modes
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "toolrpc/Transport.h"

namespace toolrpc {

//==========================================================================================================
// StreamableHTTPServer
// Purpose: ITransportAcceptor serving one HTTP endpoint.
// Notes:
//   - Stateless: every POST is its own logical session; requests are answered in the POST body and the
//     session is closed after the exchange. Server-initiated sends fail.
//   - Stateful: the first POST creates a session identified by the Mcp-Session-Id response header. Each
//     client request is answered on its own POST; everything else the server sends goes to the GET push
//     stream. DELETE terminates the session, and sessions idle for sessionIdleTimeout expire.
//   - A request not answered within requestTimeout gets 504 with a RequestTimeout error envelope and the
//     handler is sent notifications/cancelled.
//==========================================================================================================
class StreamableHTTPServer : public ITransportAcceptor {
public:
    enum class Mode { Stateless, Stateful };

    struct Options {
        std::string scheme{"http"};
        std::string address{"127.0.0.1"};
        std::string port{"0"};
        std::string path{"/mcp"};
        Mode mode{Mode::Stateful};
        std::chrono::milliseconds requestTimeout{std::chrono::seconds(30)};
        std::size_t maxQueuedMessages{256};
        std::chrono::milliseconds keepaliveInterval{std::chrono::seconds(15)};
        // Stateful sessions with no open exchange, no push stream and no traffic for this long are
        // closed. Zero keeps sessions until DELETE or Stop.
        std::chrono::milliseconds sessionIdleTimeout{std::chrono::minutes(5)};
        std::string certFile;
        std::string keyFile;
    };

    explicit StreamableHTTPServer(const Options& opts);
    ~StreamableHTTPServer() override;

    std::future<void> Start() override;
    std::future<void> Stop() override;

    void SetAcceptHandler(AcceptHandler handler) override;
    void SetErrorHandler(ITransport::ErrorHandler handler) override;

    uint16_t GetBoundPort() const;
    // Live stateful sessions (always 0 in stateless mode once exchanges finish).
    std::size_t SessionCount() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// StreamableHTTPServerFactory
// Purpose: "http(s)://<address>:<port>/mcp?mode=stateful|stateless&timeout_ms=30000&max_queue=256
//          &keepalive_ms=15000&idle_timeout_ms=300000&cert=<pem>&key=<pem>". The URL path becomes the
//          endpoint path.
//==========================================================================================================
class StreamableHTTPServerFactory : public ITransportAcceptorFactory {
public:
    std::unique_ptr<ITransportAcceptor> CreateTransportAcceptor(const std::string& config) override;
};

} // namespace toolrpc
