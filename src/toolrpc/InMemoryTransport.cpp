//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.cpp
// Purpose: In-memory transport implementation
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <random>
#include <stop_token>
#include <string>
#include <thread>

#include "logging/Logger.h"
#include "toolrpc/Codec.h"
#include "toolrpc/InMemoryTransport.hpp"
#include "detail/Futures.h"

namespace toolrpc {

class InMemoryTransport::Impl {
public:
    // Shared between the two sides so either may be destroyed first.
    struct Link {
        std::mutex mutex;
        Impl* sides[2]{nullptr, nullptr};
    };

    std::atomic<bool> connected{false};
    std::atomic<bool> closed{false};
    std::string sessionId;
    ITransport::MessageHandler messageHandler;
    ITransport::DecodeErrorHandler decodeErrorHandler;
    ITransport::ErrorHandler errorHandler;
    ITransport::CloseHandler closeHandler;
    std::shared_ptr<Link> link;
    int side{0};

    // nullopt marks end-of-stream from the peer.
    std::deque<std::optional<std::string>> messageQueue;
    std::mutex queueMutex;
    std::condition_variable queueCondition;
    std::jthread processingThread;

    Impl() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "memory-" + std::to_string(dis(gen));
    }

    ~Impl() {
        detach();
        connected = false;
        if (processingThread.joinable()) {
            processingThread.request_stop();
            queueCondition.notify_all();
            if (processingThread.get_id() == std::this_thread::get_id()) {
                processingThread.detach();
            } else {
                processingThread.join();
            }
        }
    }

    void detach() {
        if (!link) {
            return;
        }
        std::lock_guard<std::mutex> lock(link->mutex);
        link->sides[side] = nullptr;
    }

    void startProcessing() {
        processingThread = std::jthread([this](std::stop_token st) {
            for (;;) {
                std::optional<std::string> frame;
                {
                    std::unique_lock<std::mutex> lock(queueMutex);
                    queueCondition.wait(lock, [this, &st]() {
                        return !messageQueue.empty() || closed.load() || st.stop_requested();
                    });
                    if (st.stop_requested() || closed.load()) {
                        break;
                    }
                    frame = std::move(messageQueue.front());
                    messageQueue.pop_front();
                }
                if (!frame.has_value()) {
                    LOG_INFO("InMemoryTransport {}: peer closed", sessionId);
                    shutdown();
                    break;
                }
                processFrame(frame.value());
            }
        });
    }

    void processFrame(const std::string& frame) {
        LOG_DEBUG("Processing in-memory frame: {}", frame);
        DecodeResult decoded = DecodeEnvelope(frame);
        if (!decoded.Ok()) {
            LOG_WARN("InMemoryTransport {}: dropping undecodable frame: {}", sessionId, decoded.error->message);
            if (decodeErrorHandler) {
                decodeErrorHandler(decoded.error.value(), decoded.id);
            }
            return;
        }
        if (messageHandler) {
            messageHandler(std::move(decoded.envelope.value()));
        }
    }

    void enqueue(std::optional<std::string> frame) {
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            messageQueue.push_back(std::move(frame));
        }
        queueCondition.notify_one();
    }

    bool sendToPeer(std::optional<std::string> frame) {
        if (!link) {
            return false;
        }
        std::lock_guard<std::mutex> lock(link->mutex);
        Impl* peer = link->sides[1 - side];
        if (!peer || peer->closed.load()) {
            return false;
        }
        peer->enqueue(std::move(frame));
        return true;
    }

    // Marks closed and fires the close handler; true on the first call only.
    bool shutdown() {
        bool expected = false;
        if (!closed.compare_exchange_strong(expected, true)) {
            return false;
        }
        connected = false;
        queueCondition.notify_all();
        if (closeHandler) {
            closeHandler();
        }
        return true;
    }
};

InMemoryTransport::InMemoryTransport() : pImpl(std::make_unique<Impl>()) { FUNC_SCOPE(); }
InMemoryTransport::~InMemoryTransport() { FUNC_SCOPE(); }

std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> InMemoryTransport::CreatePair() {
    FUNC_SCOPE();
    auto transport1 = std::make_unique<InMemoryTransport>();
    auto transport2 = std::make_unique<InMemoryTransport>();
    auto link = std::make_shared<Impl::Link>();
    link->sides[0] = transport1->pImpl.get();
    link->sides[1] = transport2->pImpl.get();
    transport1->pImpl->link = link;
    transport1->pImpl->side = 0;
    transport2->pImpl->link = link;
    transport2->pImpl->side = 1;
    auto ret = std::make_pair(std::move(transport1), std::move(transport2));
    return ret;
}

std::future<void> InMemoryTransport::Start() {
    FUNC_SCOPE();
    if (pImpl->closed.load()) {
        return detail::failedFuture("InMemoryTransport: already closed");
    }
    if (pImpl->connected.exchange(true)) {
        return detail::readyFuture();
    }
    LOG_INFO("Starting InMemoryTransport {}", pImpl->sessionId);
    pImpl->startProcessing();
    return detail::readyFuture();
}

std::future<void> InMemoryTransport::Close() {
    FUNC_SCOPE();
    if (pImpl->closed.load()) {
        return detail::readyFuture();
    }
    LOG_INFO("Closing InMemoryTransport {}", pImpl->sessionId);
    // Deliver end-of-stream after everything already sent.
    (void)pImpl->sendToPeer(std::nullopt);
    if (pImpl->shutdown()) {
        auto& t = pImpl->processingThread;
        if (t.joinable() && t.get_id() != std::this_thread::get_id()) {
            t.request_stop();
            t.join();
        }
    }
    return detail::readyFuture();
}

bool InMemoryTransport::IsConnected() const { FUNC_SCOPE(); return pImpl->connected && !pImpl->closed; }
std::string InMemoryTransport::GetSessionId() const { FUNC_SCOPE(); return pImpl->sessionId; }

std::future<void> InMemoryTransport::Send(Envelope envelope) {
    FUNC_SCOPE();
    if (pImpl->closed.load()) {
        return detail::failedFuture("InMemoryTransport: transport closed");
    }
    std::string serialized = EncodeEnvelope(envelope);
    LOG_DEBUG("Sending in-memory frame: {}", serialized);
    if (!pImpl->sendToPeer(std::move(serialized))) {
        if (pImpl->errorHandler) {
            pImpl->errorHandler("Peer not connected");
        }
        return detail::failedFuture("InMemoryTransport: peer not connected");
    }
    return detail::readyFuture();
}

bool InMemoryTransport::SendRawFrame(const std::string& frame) {
    FUNC_SCOPE();
    if (pImpl->closed.load()) {
        return false;
    }
    return pImpl->sendToPeer(frame);
}

void InMemoryTransport::SetMessageHandler(MessageHandler handler) {
    FUNC_SCOPE();
    pImpl->messageHandler = std::move(handler);
}

void InMemoryTransport::SetDecodeErrorHandler(DecodeErrorHandler handler) {
    FUNC_SCOPE();
    pImpl->decodeErrorHandler = std::move(handler);
}

void InMemoryTransport::SetErrorHandler(ErrorHandler handler) {
    FUNC_SCOPE();
    pImpl->errorHandler = std::move(handler);
}

void InMemoryTransport::SetCloseHandler(CloseHandler handler) {
    FUNC_SCOPE();
    pImpl->closeHandler = std::move(handler);
}

} // namespace toolrpc
