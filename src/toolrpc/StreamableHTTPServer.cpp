//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StreamableHTTPServer.cpp
// Purpose: Single-endpoint streamable HTTP acceptor (POST/GET/DELETE) with stateless and stateful modes
//==========================================================================================================

#include <algorithm>
#include <unordered_map>

#include "toolrpc/StreamableHTTPServer.hpp"
#include "toolrpc/Codec.h"
#include "toolrpc/Protocol.h"
#include "toolrpc/errors/Errors.h"
#include "detail/Http.h"
#include "detail/HttpSessionTransport.h"
#include "logging/Logger.h"

namespace toolrpc {

using namespace detail;

namespace {

// Exchange key distinguishing "1" from 1.
std::string exchangeKey(const JSONRPCId& id) {
    if (std::holds_alternative<std::string>(id)) {
        return "s:" + std::get<std::string>(id);
    }
    if (std::holds_alternative<int64_t>(id)) {
        return "i:" + std::to_string(std::get<int64_t>(id));
    }
    return "null";
}

//==========================================================================================================
// HttpSession
// Purpose: Routing state of one logical session: POST exchanges waiting for a response by id, plus the
//          push queue (stateful mode only).
//==========================================================================================================
struct HttpSession {
    std::string id;
    std::shared_ptr<HttpSessionTransport> transport;
    std::shared_ptr<OutboundQueue> push;

    std::mutex mutex;
    std::unordered_map<std::string, std::shared_ptr<OutboundQueue>> exchanges;
    bool streamAttached{false};
    std::chrono::steady_clock::time_point lastActivity{std::chrono::steady_clock::now()};

    void touch() {
        std::lock_guard<std::mutex> lock(mutex);
        lastActivity = std::chrono::steady_clock::now();
    }

    // Idle means no open exchange, no push stream and no traffic for at least the timeout.
    bool idleFor(std::chrono::milliseconds timeout, std::chrono::steady_clock::time_point now) {
        std::lock_guard<std::mutex> lock(mutex);
        return exchanges.empty() && !streamAttached && now - lastActivity >= timeout;
    }

    // Returns false when an exchange with this id is already open.
    bool openExchange(const std::string& key, std::shared_ptr<OutboundQueue> queue) {
        std::lock_guard<std::mutex> lock(mutex);
        return exchanges.emplace(key, std::move(queue)).second;
    }

    std::shared_ptr<OutboundQueue> takeExchange(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = exchanges.find(key);
        if (it == exchanges.end()) {
            return nullptr;
        }
        auto q = it->second;
        exchanges.erase(it);
        return q;
    }

    void closeQueues() {
        std::vector<std::shared_ptr<OutboundQueue>> open;
        {
            std::lock_guard<std::mutex> lock(mutex);
            for (auto& [key, q] : exchanges) {
                open.push_back(q);
            }
            exchanges.clear();
        }
        for (auto& q : open) {
            q->Close();
        }
        if (push) {
            push->Close();
        }
    }
};

http::response<http::string_body> makeResponse(http::status status, unsigned version, std::string body,
                                               const std::string& contentType = "text/plain") {
    http::response<http::string_body> res{status, version};
    res.set(http::field::content_type, contentType);
    res.body() = std::move(body);
    return res;
}

std::string errorBody(const JSONRPCId& id, int code, const std::string& message) {
    return errors::makeErrorResponse(id, errors::makeError(code, message))->Serialize();
}

} // namespace

class StreamableHTTPServer::Impl {
public:
    explicit Impl(const Options& opts)
        : opts_(opts),
          listener_(HttpListener::Options{opts.scheme, opts.address, opts.port, opts.certFile, opts.keyFile},
                    [this](PlainStream& s) { return serve(s); },
                    [this](TlsStream& s) { return serve(s); },
                    [this](const std::string& msg) { reportError(msg); }) {}

    Options opts_;
    HttpListener listener_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<HttpSession>> sessions_;
    AcceptHandler acceptHandler_;
    ITransport::ErrorHandler errorHandler_;

    bool stateful() const { return opts_.mode == Mode::Stateful; }

    void reportError(const std::string& msg) {
        ITransport::ErrorHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = errorHandler_;
        }
        if (handler) {
            handler(msg);
        }
    }

    std::shared_ptr<HttpSession> findSession(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(id);
        return it == sessions_.end() ? nullptr : it->second;
    }

    // Creates the transport for a new logical session and hands it to the accept handler.
    std::shared_ptr<HttpSession> createSession() {
        auto session = std::make_shared<HttpSession>();
        session->id = randomSessionId(stateful() ? "sess" : "sess-x");
        if (stateful()) {
            session->push = std::make_shared<OutboundQueue>(listener_.Context().get_executor(), opts_.maxQueuedMessages);
        }
        std::weak_ptr<HttpSession> weak = session;
        session->transport = std::make_shared<HttpSessionTransport>(
            session->id,
            [weak](const Envelope& envelope, const std::string& encoded, std::string& error) {
                auto s = weak.lock();
                if (!s) {
                    error = "streamable HTTP session closed";
                    return false;
                }
                if (IsResponse(envelope)) {
                    auto exchange = s->takeExchange(exchangeKey(std::get<JSONRPCResponse>(envelope).id));
                    if (!exchange || !exchange->Push(encoded)) {
                        error = "no pending HTTP exchange for response id " +
                                IdToString(std::get<JSONRPCResponse>(envelope).id);
                        return false;
                    }
                    return true;
                }
                if (!s->push) {
                    error = "stateless streamable HTTP session cannot send server-initiated messages";
                    return false;
                }
                if (!s->push->Push(sseDataFrame(encoded))) {
                    error = s->push->IsClosed() ? "streamable HTTP session closed" : "push queue full";
                    return false;
                }
                return true;
            },
            [this, weak](const std::string& sid) {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    sessions_.erase(sid);
                }
                if (auto s = weak.lock()) {
                    s->closeQueues();
                }
            });

        AcceptHandler accept;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sessions_[session->id] = session;
            accept = acceptHandler_;
        }
        LOG_INFO("Streamable HTTP session {} created", session->id);
        if (accept) {
            accept(session->transport);
        } else {
            LOG_WARN("Streamable HTTP session {} created with no accept handler", session->id);
        }
        return session;
    }

    // Closes stateful sessions nobody has used within sessionIdleTimeout (clients that never DELETE).
    net::awaitable<void> reapIdleSessions() {
        net::steady_timer timer(co_await net::this_coro::executor);
        const auto interval = std::clamp<std::chrono::milliseconds>(opts_.sessionIdleTimeout / 4,
                                                                    std::chrono::milliseconds(10),
                                                                    std::chrono::milliseconds(1000));
        for (;;) {
            timer.expires_after(interval);
            boost::system::error_code ec;
            co_await timer.async_wait(net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                co_return;
            }
            const auto now = std::chrono::steady_clock::now();
            std::vector<std::shared_ptr<HttpSession>> idle;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                for (auto& [id, s] : sessions_) {
                    if (s->idleFor(opts_.sessionIdleTimeout, now)) {
                        idle.push_back(s);
                    }
                }
            }
            for (auto& s : idle) {
                LOG_INFO("Streamable HTTP session {} expired after {} ms idle", s->id, opts_.sessionIdleTimeout.count());
                s->transport->Close().get();
            }
        }
    }

    void closeAll() {
        std::vector<std::shared_ptr<HttpSession>> open;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto& [id, s] : sessions_) {
                open.push_back(s);
            }
        }
        for (auto& s : open) {
            s->transport->Close().get();
        }
    }

    //////////////////////////////////////////// POST ////////////////////////////////////////////

    net::awaitable<http::response<http::string_body>> handlePost(const http::request<http::string_body>& req) {
        const unsigned version = req.version();
        std::shared_ptr<HttpSession> session;
        auto header = req.find(SessionHeader);
        // Stateless exchanges are registered too but never looked up by header.
        if (stateful() && header != req.end()) {
            session = findSession(std::string(header->value()));
            if (!session) {
                LOG_WARN("POST for unknown session {}", std::string(header->value()));
                co_return makeResponse(http::status::not_found, version, "Unknown session");
            }
        }

        DecodeResult decoded = DecodeEnvelope(req.body());
        if (!decoded.Ok()) {
            LOG_WARN("Streamable HTTP rejected message: {}", decoded.error->message);
            co_return makeResponse(http::status::bad_request, version,
                                   errors::makeErrorResponse(decoded.id.value_or(JSONRPCId{nullptr}), *decoded.error)->Serialize(),
                                   "application/json");
        }
        Envelope envelope = std::move(*decoded.envelope);

        if (!session) {
            session = createSession();
        }
        session->touch();
        auto finish = [&](http::response<http::string_body> res) {
            if (stateful()) {
                session->touch();
                res.set(SessionHeader, session->id);
            } else {
                session->transport->Close().get();
            }
            return res;
        };

        if (!IsRequest(envelope)) {
            session->transport->Deliver(std::move(envelope));
            co_return finish(makeResponse(http::status::accepted, version, ""));
        }

        const JSONRPCId id = std::get<JSONRPCRequest>(envelope).id;
        const std::string key = exchangeKey(id);
        auto exchange = std::make_shared<OutboundQueue>(listener_.Context().get_executor(), 1);
        if (!session->openExchange(key, exchange)) {
            co_return finish(makeResponse(http::status::bad_request, version,
                                          errorBody(id, JSONRPCErrorCodes::InvalidRequestId, "Duplicate request id"),
                                          "application/json"));
        }
        session->transport->Deliver(std::move(envelope));

        auto popped = co_await exchange->Pop(opts_.requestTimeout);
        if (popped.item) {
            co_return finish(makeResponse(http::status::ok, version, std::move(*popped.item), "application/json"));
        }
        session->takeExchange(key);
        if (popped.closed) {
            co_return finish(makeResponse(http::status::service_unavailable, version,
                                          errorBody(id, JSONRPCErrorCodes::ConnectionClosed, "Connection closed"),
                                          "application/json"));
        }

        LOG_WARN("Streamable HTTP request {} timed out after {} ms", IdToString(id), opts_.requestTimeout.count());
        JSONValue::Object params;
        if (std::holds_alternative<std::string>(id)) {
            params["requestId"] = std::make_shared<JSONValue>(std::get<std::string>(id));
        } else if (std::holds_alternative<int64_t>(id)) {
            params["requestId"] = std::make_shared<JSONValue>(std::get<int64_t>(id));
        }
        params["reason"] = std::make_shared<JSONValue>(std::string("HTTP exchange timed out"));
        session->transport->Deliver(JSONRPCNotification(Methods::Cancelled, JSONValue{params}));
        co_return finish(makeResponse(http::status::gateway_timeout, version,
                                      errorBody(id, JSONRPCErrorCodes::RequestTimeout, "Request timed out"),
                                      "application/json"));
    }

    //////////////////////////////////////////// GET ////////////////////////////////////////////

    template <class Stream>
    net::awaitable<void> streamPush(Stream& stream, const http::request<http::string_body>& req,
                                    std::shared_ptr<HttpSession> session) {
        auto header = sseResponse(req.version(), session->id);
        http::response_serializer<http::empty_body> sr{header};
        co_await http::async_write_header(stream, sr, net::use_awaitable);
        beast::get_lowest_layer(stream).expires_never();
        LOG_INFO("Streamable HTTP session {} push stream attached", session->id);

        try {
            for (;;) {
                auto popped = co_await session->push->Pop(opts_.keepaliveInterval);
                if (popped.closed) {
                    break;
                }
                const std::string frame = popped.item ? *popped.item : std::string(SseKeepaliveFrame);
                co_await net::async_write(stream, net::buffer(frame), net::use_awaitable);
                beast::get_lowest_layer(stream).expires_never();
            }
        } catch (const std::exception& e) {
            LOG_DEBUG("Streamable HTTP session {} push stream ended: {}", session->id, e.what());
        }
        std::lock_guard<std::mutex> lock(session->mutex);
        session->streamAttached = false;
        session->lastActivity = std::chrono::steady_clock::now();
    }

    //////////////////////////////////////////// Connection ////////////////////////////////////////////

    template <class Stream>
    net::awaitable<void> serve(Stream& stream) {
        beast::flat_buffer buffer;
        for (;;) {
            http::request<http::string_body> req;
            beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(30));
            boost::system::error_code ec;
            co_await http::async_read(stream, buffer, req, net::redirect_error(net::use_awaitable, ec));
            if (ec == http::error::end_of_stream) {
                co_return;
            }
            if (ec) {
                throw boost::system::system_error(ec);
            }
            beast::get_lowest_layer(stream).expires_never();
            LOG_DEBUG("Streamable HTTP {} {}", std::string(req.method_string()), std::string(req.target()));

            http::response<http::string_body> res;
            if (pathOf(std::string(req.target())) != opts_.path) {
                res = makeResponse(http::status::not_found, req.version(), "Not found");
            } else if (req.method() == http::verb::post) {
                res = co_await handlePost(req);
            } else if (req.method() == http::verb::get && stateful()) {
                auto header = req.find(SessionHeader);
                auto session = header == req.end() ? nullptr : findSession(std::string(header->value()));
                if (header == req.end()) {
                    res = makeResponse(http::status::bad_request, req.version(), "Missing Mcp-Session-Id");
                } else if (!session) {
                    res = makeResponse(http::status::not_found, req.version(), "Unknown session");
                } else {
                    bool attached = false;
                    {
                        std::lock_guard<std::mutex> lock(session->mutex);
                        attached = session->streamAttached;
                        session->streamAttached = true;
                    }
                    if (!attached) {
                        co_await streamPush(stream, req, session);
                        co_return;
                    }
                    res = makeResponse(http::status::conflict, req.version(), "Push stream already open");
                }
            } else if (req.method() == http::verb::delete_ && stateful()) {
                auto header = req.find(SessionHeader);
                auto session = header == req.end() ? nullptr : findSession(std::string(header->value()));
                if (!session) {
                    res = makeResponse(http::status::not_found, req.version(), "Unknown session");
                } else {
                    LOG_INFO("Streamable HTTP session {} terminated by client", session->id);
                    session->transport->Close().get();
                    res = makeResponse(http::status::ok, req.version(), "");
                }
            } else {
                res = makeResponse(http::status::method_not_allowed, req.version(), "Method not allowed");
                res.set(http::field::allow, stateful() ? "GET, POST, DELETE" : "POST");
            }
            res.keep_alive(req.keep_alive());
            res.prepare_payload();
            co_await http::async_write(stream, res, net::use_awaitable);
            if (!req.keep_alive()) {
                co_return;
            }
        }
    }
};

StreamableHTTPServer::StreamableHTTPServer(const Options& opts) : pImpl(std::make_unique<Impl>(opts)) {
    FUNC_SCOPE();
}

StreamableHTTPServer::~StreamableHTTPServer() {
    FUNC_SCOPE();
    Stop().get();
}

std::future<void> StreamableHTTPServer::Start() {
    FUNC_SCOPE();
    auto started = pImpl->listener_.Start();
    if (pImpl->stateful() && pImpl->listener_.IsRunning() && pImpl->opts_.sessionIdleTimeout.count() > 0) {
        net::co_spawn(pImpl->listener_.Context(), pImpl->reapIdleSessions(), net::detached);
    }
    return started;
}

std::future<void> StreamableHTTPServer::Stop() {
    FUNC_SCOPE();
    pImpl->closeAll();
    pImpl->listener_.Stop();
    std::promise<void> done;
    done.set_value();
    return done.get_future();
}

void StreamableHTTPServer::SetAcceptHandler(AcceptHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->mutex_);
    pImpl->acceptHandler_ = std::move(handler);
}

void StreamableHTTPServer::SetErrorHandler(ITransport::ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->mutex_);
    pImpl->errorHandler_ = std::move(handler);
}

uint16_t StreamableHTTPServer::GetBoundPort() const {
    return pImpl->listener_.BoundPort();
}

std::size_t StreamableHTTPServer::SessionCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex_);
    return pImpl->sessions_.size();
}

std::unique_ptr<ITransportAcceptor> StreamableHTTPServerFactory::CreateTransportAcceptor(const std::string& config) {
    FUNC_SCOPE();
    UrlParts url = parseUrl(config, "0");
    if (url.scheme != "http" && url.scheme != "https") {
        throw std::invalid_argument("streamable HTTP acceptor requires http or https scheme: " + config);
    }
    StreamableHTTPServer::Options opts;
    opts.scheme = url.scheme;
    opts.address = url.host;
    opts.port = url.port;
    if (!url.path.empty() && url.path != "/") {
        opts.path = url.path;
    }
    if (auto it = url.query.find("mode"); it != url.query.end()) {
        if (it->second == "stateless") {
            opts.mode = StreamableHTTPServer::Mode::Stateless;
        } else if (it->second == "stateful") {
            opts.mode = StreamableHTTPServer::Mode::Stateful;
        } else {
            throw std::invalid_argument("unknown streamable HTTP mode: " + it->second);
        }
    }
    if (auto it = url.query.find("timeout_ms"); it != url.query.end()) {
        opts.requestTimeout = std::chrono::milliseconds(std::stoul(it->second));
    }
    if (auto it = url.query.find("max_queue"); it != url.query.end()) {
        opts.maxQueuedMessages = static_cast<std::size_t>(std::stoul(it->second));
    }
    if (auto it = url.query.find("keepalive_ms"); it != url.query.end()) {
        opts.keepaliveInterval = std::chrono::milliseconds(std::stoul(it->second));
    }
    if (auto it = url.query.find("idle_timeout_ms"); it != url.query.end()) {
        opts.sessionIdleTimeout = std::chrono::milliseconds(std::stoul(it->second));
    }
    if (auto it = url.query.find("cert"); it != url.query.end()) {
        opts.certFile = it->second;
    }
    if (auto it = url.query.find("key"); it != url.query.end()) {
        opts.keyFile = it->second;
    }
    return std::make_unique<StreamableHTTPServer>(opts);
}

} // namespace toolrpc
