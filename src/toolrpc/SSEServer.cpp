//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SSEServer.cpp
// Purpose: Server-Sent Events acceptor (GET push stream + POST message channel) on Boost.Beast
//==========================================================================================================

#include <unordered_map>

#include "toolrpc/SSEServer.hpp"
#include "toolrpc/Codec.h"
#include "toolrpc/errors/Errors.h"
#include "detail/Http.h"
#include "detail/HttpSessionTransport.h"
#include "logging/Logger.h"

namespace toolrpc {

using namespace detail;

class SSEServer::Impl {
public:
    struct StreamEntry {
        std::shared_ptr<HttpSessionTransport> transport;
        std::shared_ptr<OutboundQueue> queue;
    };

    explicit Impl(const Options& opts)
        : opts_(opts),
          listener_(HttpListener::Options{opts.scheme, opts.address, opts.port, opts.certFile, opts.keyFile},
                    [this](PlainStream& s) { return serve(s); },
                    [this](TlsStream& s) { return serve(s); },
                    [this](const std::string& msg) { reportError(msg); }) {}

    Options opts_;
    HttpListener listener_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, StreamEntry> streams_;
    AcceptHandler acceptHandler_;
    ITransport::ErrorHandler errorHandler_;

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

    std::shared_ptr<HttpSessionTransport> findSession(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = streams_.find(id);
        if (it == streams_.end()) {
            return nullptr;
        }
        return it->second.transport;
    }

    // Invoked once per session from HttpSessionTransport::Close.
    void removeSession(const std::string& id) {
        std::shared_ptr<OutboundQueue> queue;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = streams_.find(id);
            if (it == streams_.end()) {
                return;
            }
            queue = it->second.queue;
            streams_.erase(it);
        }
        queue->Close();
    }

    void closeAll() {
        std::vector<std::shared_ptr<HttpSessionTransport>> open;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto& [id, entry] : streams_) {
                open.push_back(entry.transport);
            }
        }
        for (auto& t : open) {
            t->Close().get();
        }
    }

    static http::response<http::string_body> plainResponse(http::status status, unsigned version,
                                                           const std::string& body,
                                                           const std::string& contentType = "text/plain") {
        http::response<http::string_body> res{status, version};
        res.set(http::field::content_type, contentType);
        res.body() = body;
        return res;
    }

    http::response<http::string_body> handleMessage(const http::request<http::string_body>& req) {
        auto query = queryOf(std::string(req.target()));
        auto it = query.find("sessionId");
        if (it == query.end() || it->second.empty()) {
            return plainResponse(http::status::bad_request, req.version(), "Missing sessionId");
        }
        auto transport = findSession(it->second);
        if (!transport) {
            LOG_WARN("SSE POST for unknown session {}", it->second);
            return plainResponse(http::status::not_found, req.version(), "Unknown session");
        }

        DecodeResult decoded = DecodeEnvelope(req.body());
        if (!decoded.Ok()) {
            LOG_WARN("SSE session {} rejected message: {}", it->second, decoded.error->message);
            auto errorResponse = errors::makeErrorResponse(decoded.id.value_or(JSONRPCId{nullptr}), *decoded.error);
            return plainResponse(http::status::bad_request, req.version(), errorResponse->Serialize(),
                                 "application/json");
        }
        transport->Deliver(std::move(*decoded.envelope));
        return plainResponse(http::status::accepted, req.version(), "");
    }

    template <class Stream>
    net::awaitable<void> streamEvents(Stream& stream, const http::request<http::string_body>& req) {
        const std::string id = randomSessionId("sse");
        auto queue = std::make_shared<OutboundQueue>(stream.get_executor(), opts_.maxQueuedMessages);
        std::weak_ptr<OutboundQueue> weakQueue = queue;
        auto transport = std::make_shared<HttpSessionTransport>(
            id,
            [weakQueue](const Envelope&, const std::string& encoded, std::string& error) {
                auto q = weakQueue.lock();
                if (!q || q->IsClosed()) {
                    error = "SSE session closed";
                    return false;
                }
                if (!q->Push(sseDataFrame(encoded))) {
                    error = "SSE outbound queue full";
                    return false;
                }
                return true;
            },
            [this](const std::string& sid) { removeSession(sid); });

        AcceptHandler accept;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            streams_[id] = StreamEntry{transport, queue};
            accept = acceptHandler_;
        }
        LOG_INFO("SSE session {} opened", id);
        if (accept) {
            accept(transport);
        } else {
            LOG_WARN("SSE session {} opened with no accept handler", id);
        }

        try {
            auto header = sseResponse(req.version(), id);
            http::response_serializer<http::empty_body> sr{header};
            co_await http::async_write_header(stream, sr, net::use_awaitable);

            std::string endpoint = sseEventFrame("endpoint", opts_.messagePath + "?sessionId=" + id);
            co_await net::async_write(stream, net::buffer(endpoint), net::use_awaitable);
            beast::get_lowest_layer(stream).expires_never();

            for (;;) {
                auto popped = co_await queue->Pop(opts_.keepaliveInterval);
                if (popped.closed) {
                    break;
                }
                const std::string frame = popped.item ? *popped.item : std::string(SseKeepaliveFrame);
                co_await net::async_write(stream, net::buffer(frame), net::use_awaitable);
                beast::get_lowest_layer(stream).expires_never();
            }
        } catch (const std::exception& e) {
            LOG_DEBUG("SSE session {} stream ended: {}", id, e.what());
        }
        transport->Close().get();
    }

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

            const std::string path = pathOf(std::string(req.target()));
            LOG_DEBUG("SSE {} {}", std::string(req.method_string()), std::string(req.target()));
            http::response<http::string_body> res;
            if (path == opts_.ssePath) {
                if (req.method() == http::verb::get) {
                    co_await streamEvents(stream, req);
                    co_return;
                }
                res = plainResponse(http::status::method_not_allowed, req.version(), "Method not allowed");
            } else if (path == opts_.messagePath) {
                if (req.method() == http::verb::post) {
                    res = handleMessage(req);
                } else {
                    res = plainResponse(http::status::method_not_allowed, req.version(), "Method not allowed");
                }
            } else {
                res = plainResponse(http::status::not_found, req.version(), "Not found");
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

SSEServer::SSEServer(const Options& opts) : pImpl(std::make_unique<Impl>(opts)) {
    FUNC_SCOPE();
}

SSEServer::~SSEServer() {
    FUNC_SCOPE();
    Stop().get();
}

std::future<void> SSEServer::Start() {
    FUNC_SCOPE();
    return pImpl->listener_.Start();
}

std::future<void> SSEServer::Stop() {
    FUNC_SCOPE();
    pImpl->closeAll();
    pImpl->listener_.Stop();
    std::promise<void> done;
    done.set_value();
    return done.get_future();
}

void SSEServer::SetAcceptHandler(AcceptHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->mutex_);
    pImpl->acceptHandler_ = std::move(handler);
}

void SSEServer::SetErrorHandler(ITransport::ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->mutex_);
    pImpl->errorHandler_ = std::move(handler);
}

uint16_t SSEServer::GetBoundPort() const {
    return pImpl->listener_.BoundPort();
}

std::size_t SSEServer::SessionCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex_);
    return pImpl->streams_.size();
}

std::unique_ptr<ITransportAcceptor> SSEServerFactory::CreateTransportAcceptor(const std::string& config) {
    FUNC_SCOPE();
    UrlParts url = parseUrl(config, "0");
    if (url.scheme != "http" && url.scheme != "https") {
        throw std::invalid_argument("SSE acceptor requires http or https scheme: " + config);
    }
    SSEServer::Options opts;
    opts.scheme = url.scheme;
    opts.address = url.host;
    opts.port = url.port;
    if (auto it = url.query.find("sse"); it != url.query.end()) {
        opts.ssePath = it->second;
    }
    if (auto it = url.query.find("message"); it != url.query.end()) {
        opts.messagePath = it->second;
    }
    if (auto it = url.query.find("max_queue"); it != url.query.end()) {
        opts.maxQueuedMessages = static_cast<std::size_t>(std::stoul(it->second));
    }
    if (auto it = url.query.find("keepalive_ms"); it != url.query.end()) {
        opts.keepaliveInterval = std::chrono::milliseconds(std::stoul(it->second));
    }
    if (auto it = url.query.find("cert"); it != url.query.end()) {
        opts.certFile = it->second;
    }
    if (auto it = url.query.find("key"); it != url.query.end()) {
        opts.keyFile = it->second;
    }
    return std::make_unique<SSEServer>(opts);
}

} // namespace toolrpc
