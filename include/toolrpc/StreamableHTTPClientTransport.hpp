//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StreamableHTTPClientTransport.hpp
// Purpose: Client side of the streamable HTTP transport (POST per envelope, optional GET push stream)
//==========================================================================================================
#pragma once

#include "toolrpc/Transport.h"
#include <chrono>
#include <memory>

namespace toolrpc {

//==========================================================================================================
// StreamableHTTPClientTransport
// Purpose: POSTs every outbound envelope to one endpoint and delivers JSON response bodies as inbound
//          envelopes.
// Notes:
//   - The first Mcp-Session-Id returned by the server is remembered and sent on every later request.
//     POSTs issued before it is known wait for the first POST to finish so they join the same session.
//   - POSTs are written in Send order. Notifications and responses wait for their 202 before the next
//     POST starts; requests only wait until their bytes are written, so their responses overlap.
//   - Error bodies carrying a correlated JSON-RPC response (for example 504 timeouts) are delivered too.
//   - Close() sends DELETE for a stateful session before stopping the I/O thread.
//==========================================================================================================
class StreamableHTTPClientTransport : public ITransport {
public:
    struct Options {
        std::string url{"http://127.0.0.1:8080/mcp"};
        std::string caFile;
        std::string caPath;
        std::chrono::milliseconds connectTimeout{std::chrono::seconds(10)};
        // Longer than the server's exchange timeout so its 504 arrives first.
        std::chrono::milliseconds readTimeout{std::chrono::seconds(60)};
        // Open the GET push stream as soon as a session id is known.
        bool autoOpenPushStream{false};
    };

    explicit StreamableHTTPClientTransport(const Options& options);
    virtual ~StreamableHTTPClientTransport();

    std::future<void> Start() override;
    std::future<void> Close() override;

    bool IsConnected() const override;
    std::string GetSessionId() const override;

    //==========================================================================================================
    // POSTs the envelope.
    // Returns:
    //   Future completing when the POST exchange finishes; fails with TransportError on connection failure
    //   or an HTTP status without a deliverable body.
    //==========================================================================================================
    std::future<void> Send(Envelope envelope) override;

    void SetMessageHandler(MessageHandler handler) override;
    void SetDecodeErrorHandler(DecodeErrorHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;
    void SetCloseHandler(CloseHandler handler) override;

    //==========================================================================================================
    // Opens the GET push stream for server-initiated messages.
    // Returns:
    //   Future completing once the stream is accepted; fails with TransportError when no session id is
    //   known yet or the server refuses the stream.
    //==========================================================================================================
    std::future<void> OpenPushStream();
    bool IsPushStreamOpen() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// StreamableHTTPClientTransportFactory
// Purpose: Config is the endpoint URL plus optional "?push=1&ca_file=..&ca_path=..&timeout_ms=..".
//==========================================================================================================
class StreamableHTTPClientTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;
};

} // namespace toolrpc
