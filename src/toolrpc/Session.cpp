//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.cpp
// Purpose: Session implementation: response correlation, in-flight requests, teardown
//==========================================================================================================

#include <atomic>
#include <stdexcept>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <unordered_map>

#include "toolrpc/Session.h"
#include "toolrpc/Protocol.h"
#include "toolrpc/errors/Errors.h"
#include "logging/Logger.h"
#include "detail/Futures.h"

namespace toolrpc {

namespace {

// Session whose request or notification handler is running on this thread.
thread_local const void* tlsDispatchingSession = nullptr;

struct DispatchScope {
    explicit DispatchScope(const void* session) : previous(tlsDispatchingSession) { tlsDispatchingSession = session; }
    ~DispatchScope() { tlsDispatchingSession = previous; }
    const void* previous;
};

} // namespace

class Session::Impl {
public:
    std::shared_ptr<ITransport> transport;
    Options options;
    PendingCallTable pending;

    RequestHandler requestHandler;
    NotificationHandler notificationHandler;
    ErrorHandler errorHandler;
    ClosedHandler closedHandler;

    std::atomic<bool> started{false};
    std::atomic<bool> closing{false};
    std::atomic<uint64_t> nextId{1};

    // Guards the in-flight table and the notification queue.
    mutable std::mutex inFlightMutex;
    std::condition_variable inFlightCv;
    std::unordered_map<JSONRPCId, std::stop_source> inFlight;
    std::deque<JSONRPCNotification> notificationQueue;
    bool notificationWorkerActive{false};

    Impl(std::shared_ptr<ITransport> t, const Options& opts)
        : transport(std::move(t)), options(opts), pending(opts.retiredIdCapacity) {}

    void reportError(const std::string& msg) {
        if (errorHandler) {
            errorHandler(msg);
        }
    }

    void sendBestEffort(Envelope env, const char* what) {
        auto fut = transport->Send(std::move(env));
        if (fut.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            try {
                fut.get();
            } catch (const std::exception& e) {
                LOG_WARN("Failed to send {}: {}", what, e.what());
            }
        }
    }

    // Removes a finished request from the in-flight table and wakes a draining teardown.
    void finishInFlight(const JSONRPCId& id) {
        {
            std::lock_guard<std::mutex> lock(inFlightMutex);
            inFlight.erase(id);
        }
        inFlightCv.notify_all();
    }

    void stopInFlight() {
        std::lock_guard<std::mutex> lock(inFlightMutex);
        for (auto& [id, source] : inFlight) {
            source.request_stop();
        }
    }

    void dropQueuedNotifications() {
        std::lock_guard<std::mutex> lock(inFlightMutex);
        if (!notificationQueue.empty()) {
            LOG_DEBUG("Dropping {} queued notifications", notificationQueue.size());
            notificationQueue.clear();
        }
    }

    // Waits for in-flight requests and the notification worker. A handler closing its own session
    // cannot wait for itself, so that case returns immediately.
    bool drainInFlight(std::chrono::milliseconds timeout) {
        if (tlsDispatchingSession == this) {
            LOG_DEBUG("Session closed from its own handler; not waiting for in-flight work");
            return true;
        }
        std::unique_lock<std::mutex> lock(inFlightMutex);
        return inFlightCv.wait_for(lock, timeout, [this] { return inFlight.empty() && !notificationWorkerActive; });
    }

    // Runs queued notifications one at a time, in arrival order, off the transport's thread.
    void runNotifications(const std::shared_ptr<Session>& session) {
        DispatchScope scope(this);
        for (;;) {
            JSONRPCNotification note;
            {
                std::lock_guard<std::mutex> lock(inFlightMutex);
                if (notificationQueue.empty()) {
                    notificationWorkerActive = false;
                    break;
                }
                note = std::move(notificationQueue.front());
                notificationQueue.pop_front();
            }
            try {
                notificationHandler(note, *session);
            } catch (const std::exception& e) {
                LOG_ERROR("Notification handler for {} threw: {}", note.method, e.what());
                reportError("Notification handler " + note.method + " threw: " + e.what());
            }
        }
        inFlightCv.notify_all();
    }
};

std::shared_ptr<Session> Session::Create(std::shared_ptr<ITransport> transport) {
    return Create(std::move(transport), Options{});
}

std::shared_ptr<Session> Session::Create(std::shared_ptr<ITransport> transport, const Options& options) {
    if (!transport) {
        throw std::invalid_argument("Session requires a transport");
    }
    return std::shared_ptr<Session>(new Session(std::move(transport), options));
}

Session::Session(std::shared_ptr<ITransport> transport, const Options& options)
    : pImpl(std::make_unique<Impl>(std::move(transport), options)) {
    FUNC_SCOPE();
}

Session::~Session() {
    FUNC_SCOPE();
    if (!pImpl->closing.exchange(true)) {
        pImpl->pending.FailAll(errors::makeError(JSONRPCErrorCodes::ConnectionClosed, "Connection closed"));
        if (pImpl->started.load()) {
            try {
                pImpl->transport->Close().get();
            } catch (const std::exception& e) {
                LOG_WARN("Transport close failed during session destruction: {}", e.what());
            }
        }
    }
}

void Session::SetRequestHandler(RequestHandler handler) { pImpl->requestHandler = std::move(handler); }
void Session::SetNotificationHandler(NotificationHandler handler) { pImpl->notificationHandler = std::move(handler); }
void Session::SetErrorHandler(ErrorHandler handler) { pImpl->errorHandler = std::move(handler); }
void Session::SetClosedHandler(ClosedHandler handler) { pImpl->closedHandler = std::move(handler); }

std::future<void> Session::Start() {
    FUNC_SCOPE();
    if (pImpl->started.exchange(true)) {
        return detail::readyFuture();
    }

    std::weak_ptr<Session> weak = weak_from_this();

    pImpl->pending.SetAbandonHandler([weak](const JSONRPCId& id, const errors::McpError& reason) {
        auto self = weak.lock();
        if (!self || self->pImpl->closing.load()) {
            return;
        }
        JSONValue::Object params;
        if (std::holds_alternative<std::string>(id)) {
            params["requestId"] = std::make_shared<JSONValue>(std::get<std::string>(id));
        } else if (std::holds_alternative<int64_t>(id)) {
            params["requestId"] = std::make_shared<JSONValue>(std::get<int64_t>(id));
        }
        params["reason"] = std::make_shared<JSONValue>(reason.message);
        LOG_DEBUG("Abandoning request {}: {}", IdToString(id), reason.message);
        self->pImpl->sendBestEffort(JSONRPCNotification(Methods::Cancelled, JSONValue{params}), "cancel notification");
    });

    pImpl->transport->SetMessageHandler([weak](Envelope env) {
        if (auto self = weak.lock()) {
            self->onEnvelope(std::move(env));
        }
    });

    pImpl->transport->SetDecodeErrorHandler([weak](const errors::McpError& err, const std::optional<JSONRPCId>& id) {
        auto self = weak.lock();
        if (!self) {
            return;
        }
        const JSONRPCId replyId = id.has_value() ? id.value() : JSONRPCId{nullptr};
        LOG_WARN("Decode error on session {} (id {}): {}", self->GetId(), IdToString(replyId), err.message);
        self->pImpl->sendBestEffort(*errors::makeErrorResponse(replyId, err), "decode error response");
    });

    pImpl->transport->SetErrorHandler([weak](const std::string& msg) {
        if (auto self = weak.lock()) {
            LOG_WARN("Transport error on session {}: {}", self->GetId(), msg);
            self->pImpl->reportError(msg);
        }
    });

    pImpl->transport->SetCloseHandler([weak]() {
        if (auto self = weak.lock()) {
            self->teardown(/*graceful=*/true);
        }
    });

    return pImpl->transport->Start();
}

void Session::Close() {
    FUNC_SCOPE();
    if (!teardown(/*graceful=*/false)) {
        // A peer-initiated teardown may be draining on another thread; Close still returns only once
        // handlers have finished.
        if (!pImpl->drainInFlight(pImpl->options.drainTimeout)) {
            LOG_WARN("Session {}: handlers still running {} ms after close", GetId(), pImpl->options.drainTimeout.count());
        }
    }
}

bool Session::teardown(bool graceful) {
    if (pImpl->closing.exchange(true)) {
        return false;
    }
    LOG_INFO("Session {} closing ({})", GetId(), graceful ? "peer closed" : "local close");

    if (graceful) {
        if (!pImpl->drainInFlight(pImpl->options.drainTimeout)) {
            LOG_WARN("Session {}: in-flight requests still running after drain timeout", GetId());
            pImpl->stopInFlight();
        }
    } else {
        pImpl->stopInFlight();
        pImpl->dropQueuedNotifications();
        if (!pImpl->drainInFlight(pImpl->options.drainTimeout)) {
            LOG_WARN("Session {}: handlers still running {} ms after stop was requested", GetId(),
                     pImpl->options.drainTimeout.count());
        }
    }

    pImpl->pending.FailAll(errors::makeError(JSONRPCErrorCodes::ConnectionClosed, "Connection closed"));

    try {
        pImpl->transport->Close().get();
    } catch (const std::exception& e) {
        LOG_WARN("Session {}: transport close failed: {}", GetId(), e.what());
    }

    if (pImpl->closedHandler) {
        pImpl->closedHandler(*this);
    }
    return true;
}

bool Session::IsOpen() const {
    return pImpl->started.load() && !pImpl->closing.load() && pImpl->transport->IsConnected();
}

std::string Session::GetId() const {
    return pImpl->transport->GetSessionId();
}

/////////////////////////////////////////// Inbound ///////////////////////////////////////////

void Session::onEnvelope(Envelope env) {
    if (auto* response = std::get_if<JSONRPCResponse>(&env)) {
        onResponse(*response);
    } else if (auto* request = std::get_if<JSONRPCRequest>(&env)) {
        onRequest(std::move(*request));
    } else if (auto* note = std::get_if<JSONRPCNotification>(&env)) {
        onNotification(*note);
    }
}

void Session::onResponse(const JSONRPCResponse& response) {
    switch (pImpl->pending.Resolve(response)) {
    case PendingCallTable::ResolveStatus::Resolved:
        break;
    case PendingCallTable::ResolveStatus::Retired:
        LOG_DEBUG("Discarding late response for retired id {}", IdToString(response.id));
        break;
    case PendingCallTable::ResolveStatus::Unknown: {
        const std::string msg = "Unmatched response id: " + IdToString(response.id);
        LOG_WARN("Session {}: {}", GetId(), msg);
        pImpl->reportError(msg);
        break;
    }
    }
}

void Session::onNotification(const JSONRPCNotification& note) {
    if (note.method == Methods::Cancelled) {
        std::optional<JSONRPCId> target;
        if (note.params.has_value()) {
            const JSONValue* v = note.params->Find("requestId");
            if (!v) {
                v = note.params->Find("id");
            }
            if (v && v->IsString()) {
                target = std::get<std::string>(v->value);
            } else if (v && std::holds_alternative<int64_t>(v->value)) {
                target = std::get<int64_t>(v->value);
            }
        }
        if (!target.has_value()) {
            LOG_WARN("Ignoring cancel notification without a request id");
            return;
        }
        bool found = false;
        {
            std::lock_guard<std::mutex> lock(pImpl->inFlightMutex);
            auto it = pImpl->inFlight.find(target.value());
            if (it != pImpl->inFlight.end()) {
                it->second.request_stop();
                found = true;
            }
        }
        LOG_DEBUG("Cancel request {}: {}", IdToString(target.value()), found ? "stopping" : "not in flight");
    }

    if (!pImpl->notificationHandler) {
        if (note.method != Methods::Cancelled) {
            LOG_DEBUG("Dropping notification {} (no handler)", note.method);
        }
        return;
    }
    if (pImpl->closing.load()) {
        LOG_DEBUG("Session closing; dropping notification {}", note.method);
        return;
    }

    bool spawn = false;
    {
        std::lock_guard<std::mutex> lock(pImpl->inFlightMutex);
        pImpl->notificationQueue.push_back(note);
        spawn = !pImpl->notificationWorkerActive;
        pImpl->notificationWorkerActive = true;
    }
    if (spawn) {
        std::thread([self = shared_from_this()]() { self->pImpl->runNotifications(self); }).detach();
    }
}

void Session::onRequest(JSONRPCRequest request) {
    if (pImpl->closing.load()) {
        LOG_DEBUG("Session closing; dropping request {}", IdToString(request.id));
        return;
    }

    std::stop_source source;
    bool duplicate = false;
    {
        std::lock_guard<std::mutex> lock(pImpl->inFlightMutex);
        duplicate = !pImpl->inFlight.emplace(request.id, source).second;
    }
    if (duplicate) {
        LOG_WARN("Duplicate in-flight request id {}", IdToString(request.id));
        pImpl->sendBestEffort(*CreateErrorResponse(request.id, JSONRPCErrorCodes::InvalidRequestId,
                                                    "Duplicate request id: " + IdToString(request.id)),
                              "duplicate id response");
        return;
    }

    RequestContext ctx{source.get_token(), GetId(), weak_from_this()};
    std::thread([self = shared_from_this(), request = std::move(request), ctx = std::move(ctx)]() {
        DispatchScope scope(self->pImpl.get());
        JSONRPCResponse response;
        if (self->pImpl->requestHandler) {
            try {
                response = self->pImpl->requestHandler(request, ctx);
            } catch (const std::exception& e) {
                LOG_ERROR("Request handler for {} threw: {}", request.method, e.what());
                response = *CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError,
                                                std::string("Internal error: ") + e.what());
            } catch (...) {
                LOG_ERROR("Request handler for {} threw an unknown exception", request.method);
                response = *CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError,
                                                "Internal error: unknown exception");
            }
            response.id = request.id;
        } else {
            response = *CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound,
                                            "Method not found: " + request.method);
        }
        self->pImpl->sendBestEffort(std::move(response), "response");
        self->pImpl->finishInFlight(request.id);
    }).detach();
}

/////////////////////////////////////////// Outbound ///////////////////////////////////////////

std::future<JSONValue> Session::Call(const std::string& method, std::optional<JSONValue> params, const CallOptions& options) {
    FUNC_SCOPE();
    const JSONRPCId id = std::string("req-") + std::to_string(pImpl->nextId.fetch_add(1));
    std::optional<PendingCallTable::Clock::time_point> deadline;
    if (options.timeout.has_value()) {
        deadline = PendingCallTable::Clock::now() + options.timeout.value();
    }

    auto result = pImpl->pending.Add(id, deadline, options.stop);
    if (pImpl->closing.load()) {
        pImpl->pending.Remove(id, std::make_exception_ptr(errors::McpException(
            errors::makeError(JSONRPCErrorCodes::ConnectionClosed, "Connection closed"))));
        return result;
    }

    LOG_DEBUG("Calling {} as {}", method, IdToString(id));
    auto sent = pImpl->transport->Send(JSONRPCRequest(id, method, std::move(params)));
    if (sent.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
        try {
            sent.get();
        } catch (const std::exception& e) {
            LOG_WARN("Send of {} failed: {}", IdToString(id), e.what());
            pImpl->pending.Remove(id, std::current_exception());
        }
    } else {
        // Transports that complete writes asynchronously (stdio, HTTP) report failure later.
        std::thread([weak = weak_from_this(), id, sent = std::move(sent)]() mutable {
            try {
                sent.get();
            } catch (const std::exception& e) {
                if (auto self = weak.lock()) {
                    LOG_WARN("Send of {} failed: {}", IdToString(id), e.what());
                    self->pImpl->pending.Remove(id, std::current_exception());
                }
            }
        }).detach();
    }
    return result;
}

std::future<void> Session::Notify(const std::string& method, std::optional<JSONValue> params) {
    return Send(JSONRPCNotification(method, std::move(params)));
}

std::future<void> Session::Send(Envelope envelope) {
    if (pImpl->closing.load()) {
        return detail::failedFuture("Session is closed");
    }
    return pImpl->transport->Send(std::move(envelope));
}

std::size_t Session::PendingCount() const {
    return pImpl->pending.Size();
}

std::size_t Session::InFlightCount() const {
    std::lock_guard<std::mutex> lock(pImpl->inFlightMutex);
    return pImpl->inFlight.size();
}

} // namespace toolrpc
