//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Inbound.h
// Purpose: Handler bookkeeping shared by the HTTP client transports
//==========================================================================================================

#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <thread>

#include "toolrpc/Codec.h"
#include "toolrpc/Transport.h"
#include "logging/Logger.h"

namespace toolrpc {
namespace detail {

//==========================================================================================================
// InboundHandlers
// Purpose: Thread-safe holder for an ITransport's callbacks plus the decode-and-deliver path for one
//          inbound JSON frame.
//==========================================================================================================
class InboundHandlers {
public:
    void SetMessage(ITransport::MessageHandler h) { std::lock_guard<std::mutex> lock(mutex_); message_ = std::move(h); }
    void SetDecodeError(ITransport::DecodeErrorHandler h) { std::lock_guard<std::mutex> lock(mutex_); decodeError_ = std::move(h); }
    void SetError(ITransport::ErrorHandler h) { std::lock_guard<std::mutex> lock(mutex_); error_ = std::move(h); }
    void SetClose(ITransport::CloseHandler h) { std::lock_guard<std::mutex> lock(mutex_); close_ = std::move(h); }

    // Decodes one frame and hands it to the message handler; malformed frames go to the decode error handler.
    void DeliverFrame(const std::string& json) {
        LOG_DEBUG("Inbound frame: {}", json);
        DecodeResult decoded = DecodeEnvelope(json);
        if (!decoded.Ok()) {
            LOG_WARN("Dropping undecodable frame: {}", decoded.error->message);
            ITransport::DecodeErrorHandler h;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                h = decodeError_;
            }
            if (h) {
                h(*decoded.error, decoded.id);
            }
            return;
        }
        Deliver(std::move(*decoded.envelope));
    }

    void Deliver(Envelope envelope) {
        ITransport::MessageHandler h;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            h = message_;
        }
        if (h) {
            h(std::move(envelope));
        } else {
            LOG_WARN("No message handler; dropping {}", EnvelopeMethod(envelope));
        }
    }

    void ReportError(const std::string& msg) {
        LOG_WARN("{}", msg);
        ITransport::ErrorHandler h;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            h = error_;
        }
        if (h) {
            h(msg);
        }
    }

    // Peer-initiated close; runs the close handler once on its own thread.
    void NotifyClosed() {
        if (closeFired_.exchange(true)) {
            return;
        }
        ITransport::CloseHandler h;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            h = close_;
        }
        if (h) {
            std::thread([h]() { h(); }).detach();
        }
    }

private:
    std::mutex mutex_;
    ITransport::MessageHandler message_;
    ITransport::DecodeErrorHandler decodeError_;
    ITransport::ErrorHandler error_;
    ITransport::CloseHandler close_;
    std::atomic<bool> closeFired_{false};
};

} // namespace detail
} // namespace toolrpc
