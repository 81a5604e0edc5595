//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpSessionTransport.cpp
// Purpose: Server-side ITransport for one HTTP logical session
//==========================================================================================================

#include <thread>

#include "detail/HttpSessionTransport.h"
#include "detail/Futures.h"
#include "toolrpc/Codec.h"
#include "logging/Logger.h"

namespace toolrpc {
namespace detail {

HttpSessionTransport::HttpSessionTransport(std::string sessionId, Sink sink, ClosedCallback onClosed)
    : sessionId_(std::move(sessionId)), sink_(std::move(sink)), onClosed_(std::move(onClosed)) {
    FUNC_SCOPE();
}

HttpSessionTransport::~HttpSessionTransport() {
    FUNC_SCOPE();
}

std::future<void> HttpSessionTransport::Start() {
    return readyFuture();
}

std::future<void> HttpSessionTransport::Close() {
    if (closed_.exchange(true)) {
        return readyFuture();
    }
    LOG_INFO("HTTP session {} closed", sessionId_);
    if (onClosed_) {
        onClosed_(sessionId_);
    }
    CloseHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        handler = closeHandler_;
    }
    if (handler) {
        std::thread([self = shared_from_this(), handler]() { handler(); }).detach();
    }
    return readyFuture();
}

bool HttpSessionTransport::IsConnected() const {
    return !closed_.load();
}

std::string HttpSessionTransport::GetSessionId() const {
    return sessionId_;
}

std::future<void> HttpSessionTransport::Send(Envelope envelope) {
    if (closed_.load()) {
        return failedFuture("HTTP session " + sessionId_ + " is closed");
    }
    std::string encoded = EncodeEnvelope(envelope);
    std::string error;
    if (!sink_(envelope, encoded, error)) {
        LOG_WARN("HTTP session {} dropped outbound {}: {}", sessionId_, EnvelopeMethod(envelope), error);
        return failedFuture(error);
    }
    LOG_DEBUG("HTTP session {} queued: {}", sessionId_, encoded);
    return readyFuture();
}

void HttpSessionTransport::SetMessageHandler(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(handlersMutex_);
    messageHandler_ = std::move(handler);
}

void HttpSessionTransport::SetDecodeErrorHandler(DecodeErrorHandler handler) {
    std::lock_guard<std::mutex> lock(handlersMutex_);
    decodeErrorHandler_ = std::move(handler);
}

void HttpSessionTransport::SetErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(handlersMutex_);
    errorHandler_ = std::move(handler);
}

void HttpSessionTransport::SetCloseHandler(CloseHandler handler) {
    std::lock_guard<std::mutex> lock(handlersMutex_);
    closeHandler_ = std::move(handler);
}

void HttpSessionTransport::Deliver(Envelope envelope) {
    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        handler = messageHandler_;
    }
    if (!handler) {
        LOG_WARN("HTTP session {} has no message handler; dropping {}", sessionId_, EnvelopeMethod(envelope));
        return;
    }
    handler(std::move(envelope));
}

void HttpSessionTransport::ReportError(const std::string& message) {
    ErrorHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        handler = errorHandler_;
    }
    if (handler) {
        handler(message);
    }
}

} // namespace detail
} // namespace toolrpc
