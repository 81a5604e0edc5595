//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SSEClientTransport.cpp
// Purpose: Client side of the SSE transport: GET event stream inbound, POST per outbound envelope
//==========================================================================================================

#include "toolrpc/SSEClientTransport.hpp"
#include "toolrpc/Codec.h"
#include "detail/Futures.h"
#include "detail/Http.h"
#include "detail/Inbound.h"
#include "logging/Logger.h"

namespace toolrpc {

using namespace detail;

namespace {

net::awaitable<void> postMessage(HttpEndpoint endpoint, http::request<http::string_body> req) {
    auto res = co_await roundTrip(std::move(endpoint), std::move(req));
    if (res.result() != http::status::accepted && res.result() != http::status::ok) {
        throw errors::TransportError("rejected with HTTP " + std::to_string(res.result_int()) + ": " + res.body());
    }
}

} // namespace

class SSEClientTransport::Impl {
public:
    Options opts;
    std::unique_ptr<ssl::context> sslCtx;   // outlives the io_context and its streams
    net::io_context ioc;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    std::thread ioThread;
    HttpEndpoint streamEndpoint;
    // POSTs go out one at a time so the server sees them in send order.
    std::shared_ptr<PostLane> lane{std::make_shared<PostLane>(ioc.get_executor())};

    mutable std::mutex stateMutex;
    std::string sessionId;
    HttpEndpoint postEndpoint;
    std::string postTarget;

    std::atomic<bool> started{false};
    std::atomic<bool> connected{false};
    std::atomic<bool> closed{false};
    std::shared_ptr<std::atomic<bool>> stop{std::make_shared<std::atomic<bool>>(false)};

    std::promise<void> ready;
    std::atomic<bool> readySettled{false};

    InboundHandlers handlers;

    explicit Impl(const Options& o) : opts(o) {
        streamEndpoint.url = parseUrl(opts.url);
        if (streamEndpoint.url.scheme == "https") {
            sslCtx = makeClientTlsContext(opts.caFile, opts.caPath);
            streamEndpoint.sslCtx = sslCtx.get();
        }
        streamEndpoint.connectTimeout = opts.connectTimeout;
        streamEndpoint.readTimeout = opts.readTimeout;
        postEndpoint = streamEndpoint;
    }

    ~Impl() {
        stopIo();
    }

    void settleReady(std::exception_ptr e) {
        if (readySettled.exchange(true)) {
            return;
        }
        if (e) {
            ready.set_exception(e);
        } else {
            connected.store(true);
            ready.set_value();
        }
    }

    void stopIo() {
        stop->store(true);
        if (workGuard) {
            workGuard->reset();
            workGuard.reset();
        }
        ioc.stop();
        if (ioThread.joinable()) {
            if (ioThread.get_id() == std::this_thread::get_id()) {
                ioThread.detach();
            } else {
                ioThread.join();
            }
        }
    }

    // The endpoint event carries either a path (same origin) or an absolute URL.
    void setEndpoint(const std::string& data) {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (data.rfind("http://", 0) == 0 || data.rfind("https://", 0) == 0) {
            postEndpoint.url = parseUrl(data);
            const auto slash = data.find('/', data.find("://") + 3);
            postTarget = slash == std::string::npos ? std::string("/") : data.substr(slash);
        } else {
            postTarget = data;
        }
        LOG_INFO("SSE endpoint announced: {}", postTarget);
    }

    void onEvent(const SseEvent& ev) {
        if (ev.event == "endpoint") {
            try {
                setEndpoint(ev.data);
                settleReady(nullptr);
            } catch (const std::exception& e) {
                settleReady(std::make_exception_ptr(errors::TransportError(std::string("bad SSE endpoint: ") + e.what())));
            }
            return;
        }
        if (ev.event != "message") {
            LOG_DEBUG("Ignoring SSE event '{}'", ev.event);
            return;
        }
        handlers.DeliverFrame(ev.data);
    }

    void onStreamEnd(std::exception_ptr e) {
        const std::string reason = e ? "SSE stream failed: " + describeException(e) : std::string("SSE stream ended");
        settleReady(std::make_exception_ptr(errors::TransportError(reason)));
        if (closed.load()) {
            return;
        }
        connected.store(false);
        if (e) {
            handlers.ReportError(reason);
        } else {
            LOG_INFO("{}", reason);
        }
        handlers.NotifyClosed();
    }
};

SSEClientTransport::SSEClientTransport(const Options& options) : pImpl(std::make_unique<Impl>(options)) {
    FUNC_SCOPE();
}

SSEClientTransport::~SSEClientTransport() {
    FUNC_SCOPE();
    pImpl->closed.store(true);
}

std::future<void> SSEClientTransport::Start() {
    FUNC_SCOPE();
    if (pImpl->started.exchange(true)) {
        return failedFuture("SSEClientTransport already started");
    }
    auto fut = pImpl->ready.get_future();
    pImpl->workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(pImpl->ioc));
    pImpl->ioThread = std::thread([impl = pImpl.get()]() {
        try {
            impl->ioc.run();
        } catch (const std::exception& e) {
            impl->handlers.ReportError(std::string("SSE client I/O loop error: ") + e.what());
        }
    });

    http::request<http::empty_body> req{http::verb::get, pImpl->streamEndpoint.url.path, 11};
    Impl* impl = pImpl.get();
    net::co_spawn(
        pImpl->ioc,
        readEventStream(
            pImpl->streamEndpoint, std::move(req),
            [impl](const StreamHeader& header) {
                if (header.result() != http::status::ok) {
                    impl->settleReady(std::make_exception_ptr(errors::TransportError(
                        "SSE stream rejected with HTTP " + std::to_string(header.result_int()))));
                    return false;
                }
                if (auto it = header.find(SessionHeader); it != header.end()) {
                    std::lock_guard<std::mutex> lock(impl->stateMutex);
                    impl->sessionId = std::string(it->value());
                }
                return true;
            },
            [impl](const SseEvent& ev) { impl->onEvent(ev); },
            pImpl->stop),
        [impl](std::exception_ptr e) { impl->onStreamEnd(e); });
    LOG_INFO("SSE client connecting to {}", pImpl->opts.url);
    return fut;
}

std::future<void> SSEClientTransport::Close() {
    FUNC_SCOPE();
    if (pImpl->closed.exchange(true)) {
        return readyFuture();
    }
    LOG_INFO("Closing SSE client transport {}", GetSessionId());
    pImpl->connected.store(false);
    pImpl->stopIo();
    pImpl->lane->Abort("SSEClientTransport closed");
    return readyFuture();
}

bool SSEClientTransport::IsConnected() const {
    return pImpl->connected.load() && !pImpl->closed.load();
}

std::string SSEClientTransport::GetSessionId() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->sessionId;
}

std::future<void> SSEClientTransport::Send(Envelope envelope) {
    FUNC_SCOPE();
    if (!IsConnected()) {
        return failedFuture("SSEClientTransport: not connected");
    }
    HttpEndpoint endpoint;
    std::string target;
    {
        std::lock_guard<std::mutex> lock(pImpl->stateMutex);
        endpoint = pImpl->postEndpoint;
        target = pImpl->postTarget;
    }
    http::request<http::string_body> req{http::verb::post, target, 11};
    req.set(http::field::content_type, "application/json");
    req.body() = EncodeEnvelope(envelope);
    LOG_DEBUG("SSE POST {}: {}", target, req.body());

    auto promise = std::make_shared<std::promise<void>>();
    auto fut = promise->get_future();
    pImpl->lane->Submit(
        [endpoint = std::move(endpoint), req = std::move(req)](PostLane::Release) { return postMessage(endpoint, req); },
        [promise](std::exception_ptr e) {
            if (e) {
                promise->set_exception(std::make_exception_ptr(
                    errors::TransportError("SSE POST failed: " + describeException(e))));
            } else {
                promise->set_value();
            }
        });
    return fut;
}

void SSEClientTransport::SetMessageHandler(MessageHandler handler) { pImpl->handlers.SetMessage(std::move(handler)); }
void SSEClientTransport::SetDecodeErrorHandler(DecodeErrorHandler handler) { pImpl->handlers.SetDecodeError(std::move(handler)); }
void SSEClientTransport::SetErrorHandler(ErrorHandler handler) { pImpl->handlers.SetError(std::move(handler)); }
void SSEClientTransport::SetCloseHandler(CloseHandler handler) { pImpl->handlers.SetClose(std::move(handler)); }

std::unique_ptr<ITransport> SSEClientTransportFactory::CreateTransport(const std::string& config) {
    FUNC_SCOPE();
    UrlParts url = parseUrl(config);
    SSEClientTransport::Options opts;
    opts.url = config;
    if (auto it = url.query.find("ca_file"); it != url.query.end()) {
        opts.caFile = it->second;
    }
    if (auto it = url.query.find("ca_path"); it != url.query.end()) {
        opts.caPath = it->second;
    }
    if (auto it = url.query.find("timeout_ms"); it != url.query.end()) {
        opts.readTimeout = std::chrono::milliseconds(std::stoul(it->second));
    }
    return std::make_unique<SSEClientTransport>(opts);
}

} // namespace toolrpc
