//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpSessionTransport.h
// Purpose: Server-side ITransport for one HTTP logical session (SSE or streamable HTTP)
//==========================================================================================================

#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <string>

#include "toolrpc/Transport.h"

namespace toolrpc {
namespace detail {

//==========================================================================================================
// HttpSessionTransport
// Purpose: Inbound envelopes are pushed in by the owning server (Deliver); outbound envelopes are handed
//          to a server-provided sink that routes them to a push stream or a pending POST exchange.
// Notes:
//   - Start is a no-op; the acceptor owns the I/O.
//   - The close handler runs on its own thread so teardown never blocks the I/O loop.
//==========================================================================================================
class HttpSessionTransport : public ITransport, public std::enable_shared_from_this<HttpSessionTransport> {
public:
    // Returns true when the encoded envelope was accepted; otherwise sets error.
    using Sink = std::function<bool(const Envelope& envelope, const std::string& encoded, std::string& error)>;
    using ClosedCallback = std::function<void(const std::string& sessionId)>;

    HttpSessionTransport(std::string sessionId, Sink sink, ClosedCallback onClosed);
    ~HttpSessionTransport() override;

    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;
    std::future<void> Send(Envelope envelope) override;

    void SetMessageHandler(MessageHandler handler) override;
    void SetDecodeErrorHandler(DecodeErrorHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;
    void SetCloseHandler(CloseHandler handler) override;

    // Hands one decoded inbound envelope to the session.
    void Deliver(Envelope envelope);
    void ReportError(const std::string& message);

private:
    std::string sessionId_;
    Sink sink_;
    ClosedCallback onClosed_;
    std::atomic<bool> closed_{false};

    std::mutex handlersMutex_;
    MessageHandler messageHandler_;
    DecodeErrorHandler decodeErrorHandler_;
    ErrorHandler errorHandler_;
    CloseHandler closeHandler_;
};

} // namespace detail
} // namespace toolrpc
