//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SSEClientTransport.hpp
// Purpose: Client side of the SSE transport: GET event stream inbound, POST per outbound envelope
//==========================================================================================================
#pragma once

#include "toolrpc/Transport.h"
#include <chrono>
#include <memory>

namespace toolrpc {

//==========================================================================================================
// SSEClientTransport
// Purpose: Connects to an SSEServer stream URL. Start() completes once the server has announced the POST
//          endpoint; data events are decoded and delivered, and each Send is one POST.
// Notes:
//   - POSTs are sent one at a time in Send order; each waits for its 202 before the next goes out.
//   - Uses a private io_context thread (Boost.Beast coroutines); https uses TLS 1.3 with peer verification.
//   - The end of the event stream fires the close handler.
//==========================================================================================================
class SSEClientTransport : public ITransport {
public:
    struct Options {
        std::string url{"http://127.0.0.1:8080/sse"};
        std::string caFile;
        std::string caPath;
        std::chrono::milliseconds connectTimeout{std::chrono::seconds(10)};
        std::chrono::milliseconds readTimeout{std::chrono::seconds(30)};
    };

    explicit SSEClientTransport(const Options& options);
    virtual ~SSEClientTransport();

    //==========================================================================================================
    // Opens the event stream.
    // Returns:
    //   Future completing when the endpoint event arrives; fails with TransportError when the connection
    //   or the stream is rejected.
    //==========================================================================================================
    std::future<void> Start() override;
    std::future<void> Close() override;

    bool IsConnected() const override;
    // Session id from the Mcp-Session-Id header (empty before Start completes).
    std::string GetSessionId() const override;

    //==========================================================================================================
    // POSTs the envelope to the announced endpoint.
    // Returns:
    //   Future completing on 202; fails with TransportError on connection failure or any other status.
    //==========================================================================================================
    std::future<void> Send(Envelope envelope) override;

    void SetMessageHandler(MessageHandler handler) override;
    void SetDecodeErrorHandler(DecodeErrorHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;
    void SetCloseHandler(CloseHandler handler) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// SSEClientTransportFactory
// Purpose: Config is the stream URL, optionally with "?ca_file=..&ca_path=..&timeout_ms=.." appended.
//==========================================================================================================
class SSEClientTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;
};

} // namespace toolrpc
