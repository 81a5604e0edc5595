//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StreamableHTTPClientTransport.cpp
// Purpose: Client side of the streamable HTTP transport (POST per envelope, optional GET push stream)
//==========================================================================================================

#include "toolrpc/StreamableHTTPClientTransport.hpp"
#include "toolrpc/Codec.h"
#include "detail/Futures.h"
#include "detail/Http.h"
#include "detail/Inbound.h"
#include "logging/Logger.h"

namespace toolrpc {

using namespace detail;

namespace {

// One-shot promise that may be settled from either of two callbacks.
struct OnceSignal {
    std::promise<void> promise;
    std::atomic<bool> settled{false};

    void Succeed() {
        if (!settled.exchange(true)) {
            promise.set_value();
        }
    }
    void Fail(const std::string& message) {
        if (!settled.exchange(true)) {
            promise.set_exception(std::make_exception_ptr(errors::TransportError(message)));
        }
    }
};

} // namespace

class StreamableHTTPClientTransport::Impl {
public:
    Options opts;
    std::unique_ptr<ssl::context> sslCtx;
    net::io_context ioc;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    std::thread ioThread;
    HttpEndpoint endpoint;
    // Request bytes leave in Send order; responses to requests are awaited concurrently.
    std::shared_ptr<PostLane> lane{std::make_shared<PostLane>(ioc.get_executor())};

    // Session gate; touched only on the I/O thread.
    net::steady_timer gate{ioc};
    bool awaitingSession{false};
    bool sessionSettled{false};

    mutable std::mutex stateMutex;
    std::string sessionId;

    std::atomic<bool> started{false};
    std::atomic<bool> connected{false};
    std::atomic<bool> closed{false};
    std::atomic<bool> pushOpen{false};
    std::shared_ptr<std::atomic<bool>> stop{std::make_shared<std::atomic<bool>>(false)};

    InboundHandlers handlers;

    explicit Impl(const Options& o) : opts(o) {
        endpoint.url = parseUrl(opts.url);
        if (endpoint.url.scheme == "https") {
            sslCtx = makeClientTlsContext(opts.caFile, opts.caPath);
            endpoint.sslCtx = sslCtx.get();
        }
        endpoint.connectTimeout = opts.connectTimeout;
        endpoint.readTimeout = opts.readTimeout;
    }

    ~Impl() {
        stopIo();
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

    std::string currentSession() const {
        std::lock_guard<std::mutex> lock(stateMutex);
        return sessionId;
    }

    void releaseGate(bool settled) {
        awaitingSession = false;
        sessionSettled = sessionSettled || settled;
        gate.cancel();
    }

    // Delivers an error-status body when it is a JSON-RPC response correlated to a request id.
    bool deliverCorrelated(const std::string& body) {
        if (body.empty()) {
            return false;
        }
        DecodeResult decoded = DecodeEnvelope(body);
        if (!decoded.Ok() || !IsResponse(*decoded.envelope) ||
            std::holds_alternative<std::nullptr_t>(std::get<JSONRPCResponse>(*decoded.envelope).id)) {
            return false;
        }
        handlers.Deliver(std::move(*decoded.envelope));
        return true;
    }

    net::awaitable<void> post(std::string body, PostLane::Release onWritten) {
        bool first = false;
        if (currentSession().empty() && !sessionSettled) {
            if (awaitingSession) {
                while (awaitingSession) {
                    boost::system::error_code ec;
                    co_await gate.async_wait(net::redirect_error(net::use_awaitable, ec));
                }
            } else {
                first = true;
                awaitingSession = true;
                gate.expires_at(net::steady_timer::time_point::max());
            }
        }

        http::request<http::string_body> req{http::verb::post, endpoint.url.path, 11};
        req.set(http::field::content_type, "application/json");
        req.set(http::field::accept, "application/json, text/event-stream");
        const std::string sid = currentSession();
        if (!sid.empty()) {
            req.set(SessionHeader, sid);
        }
        req.body() = std::move(body);
        LOG_DEBUG("Streamable HTTP POST {}: {}", endpoint.url.path, req.body());

        http::response<http::string_body> res;
        try {
            res = co_await roundTrip(endpoint, std::move(req), std::move(onWritten));
        } catch (const std::exception&) {
            if (first) {
                releaseGate(false);
            }
            throw;
        }

        if (auto it = res.find(SessionHeader); it != res.end()) {
            bool learned = false;
            {
                std::lock_guard<std::mutex> lock(stateMutex);
                if (sessionId.empty()) {
                    sessionId = std::string(it->value());
                    learned = true;
                }
            }
            if (learned) {
                LOG_INFO("Streamable HTTP session established: {}", std::string(it->value()));
                if (opts.autoOpenPushStream) {
                    spawnPushStream(std::make_shared<OnceSignal>());
                }
            }
        }
        if (first) {
            releaseGate(true);
        }

        const auto status = res.result();
        if (status == http::status::accepted) {
            co_return;
        }
        if (status == http::status::ok) {
            if (!res.body().empty()) {
                handlers.DeliverFrame(res.body());
            }
            co_return;
        }
        if (status == http::status::not_found && !sid.empty()) {
            LOG_WARN("Streamable HTTP session {} no longer exists", sid);
            connected.store(false);
            handlers.NotifyClosed();
            throw errors::TransportError("streamable HTTP session " + sid + " not found");
        }
        if (deliverCorrelated(res.body())) {
            LOG_WARN("Streamable HTTP POST answered with HTTP {}", res.result_int());
            co_return;
        }
        throw errors::TransportError("streamable HTTP POST rejected with HTTP " + std::to_string(res.result_int()) +
                                     ": " + res.body());
    }

    void spawnPushStream(std::shared_ptr<OnceSignal> signal) {
        const std::string sid = currentSession();
        if (sid.empty()) {
            signal->Fail("no streamable HTTP session to open a push stream for");
            return;
        }
        if (pushOpen.exchange(true)) {
            signal->Succeed();
            return;
        }
        http::request<http::empty_body> req{http::verb::get, endpoint.url.path, 11};
        req.set(SessionHeader, sid);
        net::co_spawn(
            ioc,
            readEventStream(
                endpoint, std::move(req),
                [signal](const StreamHeader& header) {
                    if (header.result() != http::status::ok) {
                        signal->Fail("push stream rejected with HTTP " + std::to_string(header.result_int()));
                        return false;
                    }
                    signal->Succeed();
                    return true;
                },
                [this](const SseEvent& ev) {
                    if (ev.event == "message") {
                        handlers.DeliverFrame(ev.data);
                    }
                },
                stop),
            [this, signal, sid](std::exception_ptr e) {
                pushOpen.store(false);
                if (e) {
                    signal->Fail("push stream failed: " + describeException(e));
                    if (!closed.load()) {
                        handlers.ReportError("Streamable HTTP push stream failed: " + describeException(e));
                    }
                } else {
                    signal->Fail("push stream ended");
                    LOG_INFO("Streamable HTTP push stream for {} ended", sid);
                }
            });
    }
};

StreamableHTTPClientTransport::StreamableHTTPClientTransport(const Options& options)
    : pImpl(std::make_unique<Impl>(options)) {
    FUNC_SCOPE();
}

StreamableHTTPClientTransport::~StreamableHTTPClientTransport() {
    FUNC_SCOPE();
    pImpl->closed.store(true);
}

std::future<void> StreamableHTTPClientTransport::Start() {
    FUNC_SCOPE();
    if (pImpl->started.exchange(true)) {
        return failedFuture("StreamableHTTPClientTransport already started");
    }
    pImpl->workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(pImpl->ioc));
    pImpl->ioThread = std::thread([impl = pImpl.get()]() {
        try {
            impl->ioc.run();
        } catch (const std::exception& e) {
            impl->handlers.ReportError(std::string("Streamable HTTP client I/O loop error: ") + e.what());
        }
    });
    pImpl->connected.store(true);
    LOG_INFO("Streamable HTTP client targeting {}", pImpl->opts.url);
    return readyFuture();
}

std::future<void> StreamableHTTPClientTransport::Close() {
    FUNC_SCOPE();
    if (pImpl->closed.exchange(true)) {
        return readyFuture();
    }
    const std::string sid = pImpl->currentSession();
    const bool onIoThread = pImpl->ioThread.get_id() == std::this_thread::get_id();
    if (!sid.empty() && pImpl->connected.load() && !onIoThread) {
        http::request<http::string_body> req{http::verb::delete_, pImpl->endpoint.url.path, 11};
        req.set(SessionHeader, sid);
        auto fut = net::co_spawn(pImpl->ioc, roundTrip(pImpl->endpoint, std::move(req)), net::use_future);
        if (fut.wait_for(pImpl->opts.connectTimeout) == std::future_status::ready) {
            try {
                auto res = fut.get();
                LOG_INFO("Streamable HTTP session {} deleted (HTTP {})", sid, res.result_int());
            } catch (const std::exception& e) {
                LOG_WARN("Streamable HTTP DELETE for {} failed: {}", sid, e.what());
            }
        } else {
            LOG_WARN("Streamable HTTP DELETE for {} timed out", sid);
        }
    }
    pImpl->connected.store(false);
    pImpl->stopIo();
    pImpl->lane->Abort("StreamableHTTPClientTransport closed");
    return readyFuture();
}

bool StreamableHTTPClientTransport::IsConnected() const {
    return pImpl->connected.load() && !pImpl->closed.load();
}

std::string StreamableHTTPClientTransport::GetSessionId() const {
    return pImpl->currentSession();
}

std::future<void> StreamableHTTPClientTransport::Send(Envelope envelope) {
    FUNC_SCOPE();
    if (!IsConnected()) {
        return failedFuture("StreamableHTTPClientTransport: not connected");
    }
    auto promise = std::make_shared<std::promise<void>>();
    auto fut = promise->get_future();
    // A request frees the lane once written; notifications and responses hold it until acknowledged.
    const bool pipelined = IsRequest(envelope);
    pImpl->lane->Submit(
        [impl = pImpl.get(), body = EncodeEnvelope(envelope), pipelined](PostLane::Release release) {
            return impl->post(body, pipelined ? std::move(release) : PostLane::Release{});
        },
        [promise](std::exception_ptr e) {
            if (e) {
                promise->set_exception(std::make_exception_ptr(
                    errors::TransportError("streamable HTTP send failed: " + describeException(e))));
            } else {
                promise->set_value();
            }
        });
    return fut;
}

std::future<void> StreamableHTTPClientTransport::OpenPushStream() {
    FUNC_SCOPE();
    if (!IsConnected()) {
        return failedFuture("StreamableHTTPClientTransport: not connected");
    }
    auto signal = std::make_shared<OnceSignal>();
    auto fut = signal->promise.get_future();
    net::post(pImpl->ioc, [impl = pImpl.get(), signal]() { impl->spawnPushStream(signal); });
    return fut;
}

bool StreamableHTTPClientTransport::IsPushStreamOpen() const {
    return pImpl->pushOpen.load();
}

void StreamableHTTPClientTransport::SetMessageHandler(MessageHandler handler) { pImpl->handlers.SetMessage(std::move(handler)); }
void StreamableHTTPClientTransport::SetDecodeErrorHandler(DecodeErrorHandler handler) { pImpl->handlers.SetDecodeError(std::move(handler)); }
void StreamableHTTPClientTransport::SetErrorHandler(ErrorHandler handler) { pImpl->handlers.SetError(std::move(handler)); }
void StreamableHTTPClientTransport::SetCloseHandler(CloseHandler handler) { pImpl->handlers.SetClose(std::move(handler)); }

std::unique_ptr<ITransport> StreamableHTTPClientTransportFactory::CreateTransport(const std::string& config) {
    FUNC_SCOPE();
    UrlParts url = parseUrl(config);
    StreamableHTTPClientTransport::Options opts;
    opts.url = config;
    if (auto it = url.query.find("push"); it != url.query.end()) {
        opts.autoOpenPushStream = (it->second == "1" || it->second == "true");
    }
    if (auto it = url.query.find("ca_file"); it != url.query.end()) {
        opts.caFile = it->second;
    }
    if (auto it = url.query.find("ca_path"); it != url.query.end()) {
        opts.caPath = it->second;
    }
    if (auto it = url.query.find("timeout_ms"); it != url.query.end()) {
        opts.readTimeout = std::chrono::milliseconds(std::stoul(it->second));
    }
    return std::make_unique<StreamableHTTPClientTransport>(opts);
}

} // namespace toolrpc
