//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SSEServer.hpp
// Purpose: Server-Sent Events acceptor (GET push stream + POST message channel) on Boost.Beast
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "toolrpc/Transport.h"

namespace toolrpc {

// Note: SSEServer implements the server-side acceptor role (ITransportAcceptor); every GET stream
// becomes one logical session handed to the accept handler.
class SSEServer : public ITransportAcceptor {
public:
    //==========================================================================================================
    // Options
    // Purpose: Bind address, endpoint paths, queue bound and TLS files.
    // Fields:
    //   scheme: "http" or "https" (TLS 1.3 only for https)
    //   address/port: Bind address and port ("0" picks an ephemeral port, see GetBoundPort)
    //   ssePath: GET path opening the event stream
    //   messagePath: POST path carrying client envelopes (?sessionId=<id>)
    //   maxQueuedMessages: Outbound frames buffered per session; Send fails fast beyond it
    //   keepaliveInterval: Idle period after which ": keepalive" is written
    //   certFile/keyFile: PEM files required when scheme == https
    //==========================================================================================================
    struct Options {
        std::string scheme{"http"};
        std::string address{"127.0.0.1"};
        std::string port{"0"};
        std::string ssePath{"/sse"};
        std::string messagePath{"/message"};
        std::size_t maxQueuedMessages{256};
        std::chrono::milliseconds keepaliveInterval{std::chrono::seconds(15)};
        std::string certFile;
        std::string keyFile;
    };

    explicit SSEServer(const Options& opts);
    ~SSEServer() override;

    //==========================================================================================================
    // Binds the listener and starts the accept loop on a background I/O thread.
    // Returns:
    //   Future that is ready once listening; it fails with errors::TransportError when binding fails.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Closes every session stream and stops the listener.
    //==========================================================================================================
    std::future<void> Stop() override;

    void SetAcceptHandler(AcceptHandler handler) override;
    void SetErrorHandler(ITransport::ErrorHandler handler) override;

    uint16_t GetBoundPort() const;
    std::size_t SessionCount() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// SSEServerFactory
// Purpose: Creates SSE acceptors from a URI:
//            - "http://<address>:<port>?sse=/sse&message=/message&max_queue=256&keepalive_ms=15000"
//            - "https://<address>:<port>?cert=<pem>&key=<pem>"
//          Unknown parameters are ignored; the port defaults to 0 (ephemeral).
//==========================================================================================================
class SSEServerFactory : public ITransportAcceptorFactory {
public:
    std::unique_ptr<ITransportAcceptor> CreateTransportAcceptor(const std::string& config) override;
};

} // namespace toolrpc
