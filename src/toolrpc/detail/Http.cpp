//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Http.cpp
// Purpose: Boost.Beast plumbing shared by the SSE and streamable HTTP transports
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <random>
#include <sstream>
#include <stdexcept>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "detail/Http.h"
#include "toolrpc/errors/Errors.h"
#include "logging/Logger.h"

namespace toolrpc {
namespace detail {

namespace {

void trim(std::string& s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
}

bool validPort(const std::string& port) {
    if (port.empty() || port.size() > 5) {
        return false;
    }
    if (!std::all_of(port.begin(), port.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
        return false;
    }
    return std::stoul(port) <= 65535ul;
}

std::string percentDecode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size() && std::isxdigit(static_cast<unsigned char>(s[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(s[i + 2]))) {
            out.push_back(static_cast<char>(std::stoi(s.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else if (s[i] == '+') {
            out.push_back(' ');
        } else {
            out.push_back(s[i]);
        }
    }
    return out;
}

} // namespace

/////////////////////////////////////////// URLs ///////////////////////////////////////////

std::map<std::string, std::string> parseQuery(const std::string& query) {
    std::map<std::string, std::string> out;
    std::stringstream ss(query);
    std::string kv;
    while (std::getline(ss, kv, '&')) {
        if (kv.empty()) {
            continue;
        }
        auto eq = kv.find('=');
        std::string key = (eq == std::string::npos) ? kv : kv.substr(0, eq);
        std::string val = (eq == std::string::npos) ? std::string() : kv.substr(eq + 1);
        out[percentDecode(key)] = percentDecode(val);
    }
    return out;
}

std::string pathOf(const std::string& target) {
    auto q = target.find('?');
    return q == std::string::npos ? target : target.substr(0, q);
}

std::map<std::string, std::string> queryOf(const std::string& target) {
    auto q = target.find('?');
    return q == std::string::npos ? std::map<std::string, std::string>{} : parseQuery(target.substr(q + 1));
}

UrlParts parseUrl(const std::string& url, const std::string& defaultPort) {
    UrlParts parts;
    std::string cfg = url;
    trim(cfg);

    auto schemeEnd = cfg.find("://");
    if (schemeEnd != std::string::npos) {
        parts.scheme = cfg.substr(0, schemeEnd);
        std::transform(parts.scheme.begin(), parts.scheme.end(), parts.scheme.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        cfg = cfg.substr(schemeEnd + 3);
    }
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("Unsupported URL scheme: " + parts.scheme);
    }

    std::string rest = cfg;
    auto qpos = cfg.find('?');
    if (qpos != std::string::npos) {
        rest = cfg.substr(0, qpos);
        parts.query = parseQuery(cfg.substr(qpos + 1));
    }

    std::string hostPort = rest;
    auto slash = rest.find('/');
    if (slash != std::string::npos) {
        hostPort = rest.substr(0, slash);
        parts.path = rest.substr(slash);
    }

    if (!hostPort.empty() && hostPort.front() == '[') {
        auto rb = hostPort.find(']');
        if (rb == std::string::npos) {
            throw std::invalid_argument("Malformed IPv6 host in URL: " + url);
        }
        parts.host = hostPort.substr(1, rb - 1);
        if (rb + 1 < hostPort.size() && hostPort[rb + 1] == ':') {
            parts.port = hostPort.substr(rb + 2);
        }
    } else {
        auto colon = hostPort.rfind(':');
        if (colon != std::string::npos) {
            parts.host = hostPort.substr(0, colon);
            parts.port = hostPort.substr(colon + 1);
        } else {
            parts.host = hostPort;
        }
    }
    trim(parts.host);
    trim(parts.port);

    if (parts.host.empty()) {
        throw std::invalid_argument("URL has no host: " + url);
    }
    if (parts.port.empty()) {
        if (!defaultPort.empty()) {
            parts.port = defaultPort;
        } else {
            parts.port = parts.scheme == "https" ? "443" : "80";
        }
    }
    if (!validPort(parts.port)) {
        throw std::invalid_argument("Invalid port in URL: " + parts.port);
    }
    return parts;
}

/////////////////////////////////////////// TLS ///////////////////////////////////////////

std::unique_ptr<ssl::context> makeServerTlsContext(const std::string& certFile, const std::string& keyFile) {
    auto ctx = std::make_unique<ssl::context>(ssl::context::tls_server);
    // TLS 1.3 only
    ::SSL_CTX_set_min_proto_version(ctx->native_handle(), TLS1_3_VERSION);
    ::SSL_CTX_set_max_proto_version(ctx->native_handle(), TLS1_3_VERSION);
    ctx->set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                     ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
    try {
        ctx->use_certificate_chain_file(certFile);
        ctx->use_private_key_file(keyFile, ssl::context::file_format::pem);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to load certificate/key ({}, {}): {}", certFile, keyFile, e.what());
        throw;
    }
    return ctx;
}

std::unique_ptr<ssl::context> makeClientTlsContext(const std::string& caFile, const std::string& caPath) {
    auto ctx = std::make_unique<ssl::context>(ssl::context::tls_client);
    ::SSL_CTX_set_min_proto_version(ctx->native_handle(), TLS1_3_VERSION);
    ::SSL_CTX_set_max_proto_version(ctx->native_handle(), TLS1_3_VERSION);
    ::ERR_clear_error();
    if (!caFile.empty() || !caPath.empty()) {
        if (!caFile.empty()) {
            ctx->load_verify_file(caFile);
        }
        if (!caPath.empty()) {
            ctx->add_verify_path(caPath);
        }
    } else {
        boost::system::error_code ec;
        ctx->set_default_verify_paths(ec);
        if (ec) {
            LOG_DEBUG("HTTPS: set_default_verify_paths failed: {}", ec.message());
        }
    }
    ctx->set_verify_mode(ssl::verify_peer);
    return ctx;
}

std::string randomSessionId(const std::string& prefix) {
    static thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dis;
    std::ostringstream oss;
    oss << prefix << '-' << std::hex << dis(gen);
    return oss.str();
}

/////////////////////////////////////////// OutboundQueue ///////////////////////////////////////////

OutboundQueue::OutboundQueue(net::any_io_executor executor, std::size_t maxMessages)
    : executor_(std::move(executor)), maxMessages_(std::max<std::size_t>(maxMessages, 1)) {}

bool OutboundQueue::Push(std::string message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || items_.size() >= maxMessages_) {
            return false;
        }
        items_.push_back(std::move(message));
    }
    wake();
    return true;
}

void OutboundQueue::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
    }
    wake();
}

bool OutboundQueue::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t OutboundQueue::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

void OutboundQueue::wake() {
    net::post(executor_, [weak = weak_from_this()]() {
        if (auto self = weak.lock()) {
            if (self->waiter_) {
                self->waiter_->cancel();
            }
        }
    });
}

net::awaitable<OutboundQueue::PopResult> OutboundQueue::Pop(std::chrono::milliseconds idle) {
    const auto deadline = std::chrono::steady_clock::now() + idle;
    net::steady_timer timer(executor_);
    for (;;) {
        PopResult result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!items_.empty()) {
                result.item = std::move(items_.front());
                items_.pop_front();
            } else if (closed_) {
                result.closed = true;
            }
        }
        if (result.item.has_value() || result.closed || std::chrono::steady_clock::now() >= deadline) {
            co_return result;
        }
        timer.expires_at(deadline);
        waiter_ = &timer;
        boost::system::error_code ec;
        co_await timer.async_wait(net::redirect_error(net::use_awaitable, ec));
        waiter_ = nullptr;
    }
}

/////////////////////////////////////////// SSE ///////////////////////////////////////////

std::vector<SseEvent> SseParser::Feed(std::string_view bytes) {
    std::vector<SseEvent> out;
    pending_.append(bytes.data(), bytes.size());
    std::size_t start = 0;
    for (;;) {
        auto nl = pending_.find('\n', start);
        if (nl == std::string::npos) {
            break;
        }
        std::string line = pending_.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        dispatchLine(line, out);
        start = nl + 1;
    }
    pending_.erase(0, start);
    return out;
}

void SseParser::dispatchLine(const std::string& line, std::vector<SseEvent>& out) {
    if (line.empty()) {
        if (hasData_) {
            out.push_back(std::move(current_));
        }
        current_ = SseEvent{};
        hasData_ = false;
        return;
    }
    if (line.front() == ':') {
        return;
    }
    auto colon = line.find(':');
    std::string field = line.substr(0, colon);
    std::string value = colon == std::string::npos ? std::string() : line.substr(colon + 1);
    if (!value.empty() && value.front() == ' ') {
        value.erase(0, 1);
    }
    if (field == "event") {
        current_.event = value;
    } else if (field == "data") {
        if (hasData_) {
            current_.data.push_back('\n');
        }
        current_.data += value;
        hasData_ = true;
    }
}

std::string sseDataFrame(const std::string& json) {
    return "data: " + json + "\n\n";
}

std::string sseEventFrame(const std::string& event, const std::string& data) {
    return "event: " + event + "\ndata: " + data + "\n\n";
}

http::response<http::empty_body> sseResponse(unsigned version, const std::string& sessionId) {
    http::response<http::empty_body> res{http::status::ok, version};
    res.set(http::field::content_type, "text/event-stream");
    res.set(http::field::cache_control, "no-cache");
    res.set(SessionHeader, sessionId);
    res.keep_alive(false);
    return res;
}

/////////////////////////////////////////// Listener ///////////////////////////////////////////

HttpListener::HttpListener(Options options, PlainHandler plain, TlsHandler tls, ErrorHandler onError)
    : opts_(std::move(options)), plain_(std::move(plain)), tls_(std::move(tls)), onError_(std::move(onError)) {}

HttpListener::~HttpListener() {
    Stop();
}

void HttpListener::reportError(const std::string& msg) {
    LOG_WARN("{}", msg);
    if (onError_) {
        onError_(msg);
    }
}

std::future<void> HttpListener::Start() {
    FUNC_SCOPE();
    std::promise<void> ready;
    auto fut = ready.get_future();
    try {
        if (!validPort(opts_.port)) {
            throw std::invalid_argument("invalid port: " + opts_.port);
        }
        if (opts_.scheme == "https") {
            sslCtx_ = makeServerTlsContext(opts_.certFile, opts_.keyFile);
        }
        tcp::resolver resolver(ioc_);
        tcp::endpoint ep = *resolver.resolve(opts_.address, opts_.port).begin();
        acceptor_ = std::make_unique<tcp::acceptor>(ioc_);
        acceptor_->open(ep.protocol());
        acceptor_->set_option(tcp::acceptor::reuse_address(true));
        acceptor_->bind(ep);
        acceptor_->listen();
        boundPort_.store(acceptor_->local_endpoint().port());
    } catch (const std::exception& e) {
        reportError(std::string("HTTP listener failed to start: ") + e.what());
        ready.set_exception(std::make_exception_ptr(errors::TransportError(std::string("listen failed: ") + e.what())));
        return fut;
    }

    running_.store(true);
    net::co_spawn(ioc_, acceptLoop(), net::detached);
    ioThread_ = std::thread([this]() {
        try {
            ioc_.run();
        } catch (const std::exception& e) {
            reportError(std::string("HTTP listener I/O loop error: ") + e.what());
        }
    });
    LOG_INFO("Listening on {}://{}:{}", opts_.scheme, opts_.address, boundPort_.load());
    ready.set_value();
    return fut;
}

void HttpListener::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    FUNC_SCOPE();
    ioc_.stop();
    if (ioThread_.joinable()) {
        if (ioThread_.get_id() == std::this_thread::get_id()) {
            ioThread_.detach();
        } else {
            ioThread_.join();
        }
    }
    if (acceptor_) {
        boost::system::error_code ec;
        acceptor_->close(ec);
    }
    LOG_INFO("Listener on port {} stopped", boundPort_.load());
}

bool HttpListener::IsRunning() const { return running_.load(); }
uint16_t HttpListener::BoundPort() const { return boundPort_.load(); }
net::io_context& HttpListener::Context() { return ioc_; }

net::awaitable<void> HttpListener::acceptLoop() {
    try {
        while (running_.load()) {
            tcp::socket socket = co_await acceptor_->async_accept(net::use_awaitable);
            if (sslCtx_) {
                net::co_spawn(ioc_, serveTls(std::move(socket)), net::detached);
            } else {
                net::co_spawn(ioc_, servePlain(std::move(socket)), net::detached);
            }
        }
    } catch (const std::exception& e) {
        if (running_.load()) {
            reportError(std::string("HTTP accept error: ") + e.what());
        } else {
            LOG_DEBUG("HTTP accept loop ended during shutdown: {}", e.what());
        }
    }
}

net::awaitable<void> HttpListener::servePlain(tcp::socket socket) {
    PlainStream stream(std::move(socket));
    try {
        co_await plain_(stream);
    } catch (const std::exception& e) {
        LOG_DEBUG("HTTP connection ended: {}", e.what());
    }
    boost::system::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
}

net::awaitable<void> HttpListener::serveTls(tcp::socket socket) {
    TlsStream stream(std::move(socket), *sslCtx_);
    try {
        beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(30));
        co_await stream.async_handshake(ssl::stream_base::server, net::use_awaitable);
        beast::get_lowest_layer(stream).expires_never();
        co_await tls_(stream);
    } catch (const std::exception& e) {
        LOG_DEBUG("HTTPS connection ended: {}", e.what());
    }
    boost::system::error_code ec;
    beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_both, ec);
}

/////////////////////////////////////////// Client helpers ///////////////////////////////////////////

namespace {

template <class Stream, class Request>
net::awaitable<http::response<http::string_body>> exchangeOn(Stream& stream, Request& req, std::chrono::milliseconds readTimeout,
                                                             const std::function<void()>& onWritten) {
    beast::get_lowest_layer(stream).expires_after(readTimeout);
    co_await http::async_write(stream, req, net::use_awaitable);
    if (onWritten) {
        onWritten();
    }
    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    co_await http::async_read(stream, buffer, res, net::use_awaitable);
    co_return res;
}

template <class Stream>
net::awaitable<void> consumeEvents(Stream& stream, http::request<http::empty_body>& req,
                                   std::chrono::milliseconds headerTimeout,
                                   const std::function<bool(const StreamHeader&)>& onHeader,
                                   const std::function<void(const SseEvent&)>& onEvent,
                                   const std::shared_ptr<std::atomic<bool>>& stop) {
    beast::get_lowest_layer(stream).expires_after(headerTimeout);
    co_await http::async_write(stream, req, net::use_awaitable);
    beast::flat_buffer buffer;
    http::response_parser<http::empty_body> parser;
    co_await http::async_read_header(stream, buffer, parser, net::use_awaitable);
    beast::get_lowest_layer(stream).expires_never();
    if (!onHeader(parser.get().base())) {
        co_return;
    }

    SseParser sse;
    auto deliver = [&](std::string_view bytes) {
        for (const auto& ev : sse.Feed(bytes)) {
            onEvent(ev);
        }
    };
    if (buffer.size() > 0) {
        deliver(beast::buffers_to_string(buffer.data()));
        buffer.consume(buffer.size());
    }

    char chunk[4096];
    for (;;) {
        if (stop && stop->load()) {
            co_return;
        }
        boost::system::error_code ec;
        std::size_t n = co_await stream.async_read_some(net::buffer(chunk), net::redirect_error(net::use_awaitable, ec));
        if (n > 0) {
            deliver(std::string_view(chunk, n));
        }
        if (ec) {
            if (ec == net::error::eof || ec == ssl::error::stream_truncated) {
                co_return;
            }
            throw boost::system::system_error(ec);
        }
    }
}

void setServerName(TlsStream& stream, const std::string& host) {
    if (!::SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
        throw errors::TransportError("HTTPS: failed to set SNI hostname");
    }
    ::SSL_set1_host(stream.native_handle(), host.c_str());
}

} // namespace

net::awaitable<http::response<http::string_body>> roundTrip(HttpEndpoint endpoint, http::request<http::string_body> req,
                                                             std::function<void()> onWritten) {
    auto ex = co_await net::this_coro::executor;
    tcp::resolver resolver(ex);
    auto results = co_await resolver.async_resolve(endpoint.url.host, endpoint.url.port, net::use_awaitable);
    req.set(http::field::host, endpoint.url.host);
    req.set(http::field::connection, "close");
    req.prepare_payload();

    if (endpoint.url.scheme == "https") {
        if (!endpoint.sslCtx) {
            throw errors::TransportError("HTTPS endpoint without TLS context");
        }
        TlsStream stream(ex, *endpoint.sslCtx);
        setServerName(stream, endpoint.url.host);
        beast::get_lowest_layer(stream).expires_after(endpoint.connectTimeout);
        co_await beast::get_lowest_layer(stream).async_connect(results, net::use_awaitable);
        co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
        auto res = co_await exchangeOn(stream, req, endpoint.readTimeout, onWritten);
        boost::system::error_code ec;
        beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_both, ec);
        co_return res;
    }

    PlainStream stream(ex);
    stream.expires_after(endpoint.connectTimeout);
    co_await stream.async_connect(results, net::use_awaitable);
    auto res = co_await exchangeOn(stream, req, endpoint.readTimeout, onWritten);
    boost::system::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    co_return res;
}

/////////////////////////////////////////// PostLane ///////////////////////////////////////////

PostLane::PostLane(net::any_io_executor executor) : executor_(std::move(executor)) {}

void PostLane::Submit(Job job, Done done) {
    bool spawn = false;
    std::optional<std::string> rejected;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (aborted_) {
            rejected = abortReason_;
        } else {
            items_.push_back(Item{std::move(job), done});
            spawn = !draining_;
            draining_ = true;
        }
    }
    if (rejected.has_value()) {
        done(std::make_exception_ptr(errors::TransportError(rejected.value())));
        return;
    }
    if (spawn) {
        net::co_spawn(executor_, [self = shared_from_this()]() { return self->drain(); }, net::detached);
    }
}

void PostLane::Abort(const std::string& reason) {
    std::deque<Item> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        aborted_ = true;
        abortReason_ = reason;
        dropped.swap(items_);
    }
    for (auto& item : dropped) {
        item.done(std::make_exception_ptr(errors::TransportError(reason)));
    }
}

net::awaitable<void> PostLane::drain() {
    for (;;) {
        Item item;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (items_.empty()) {
                draining_ = false;
                co_return;
            }
            item = std::move(items_.front());
            items_.pop_front();
        }

        // Both flags live on the executor; the timer wakes this loop when the job lets go of the lane.
        auto released = std::make_shared<bool>(false);
        auto wakeup = std::make_shared<net::steady_timer>(executor_, net::steady_timer::time_point::max());
        auto release = [released, wakeup]() {
            if (!*released) {
                *released = true;
                wakeup->cancel();
            }
        };
        net::co_spawn(executor_, item.job(release),
                      [release, done = std::move(item.done)](std::exception_ptr e) {
                          release();
                          done(e);
                      });
        while (!*released) {
            boost::system::error_code ec;
            co_await wakeup->async_wait(net::redirect_error(net::use_awaitable, ec));
        }
    }
}

net::awaitable<void> readEventStream(HttpEndpoint endpoint,
                                     http::request<http::empty_body> req,
                                     std::function<bool(const StreamHeader&)> onHeader,
                                     std::function<void(const SseEvent&)> onEvent,
                                     std::shared_ptr<std::atomic<bool>> stop) {
    auto ex = co_await net::this_coro::executor;
    tcp::resolver resolver(ex);
    auto results = co_await resolver.async_resolve(endpoint.url.host, endpoint.url.port, net::use_awaitable);
    req.set(http::field::host, endpoint.url.host);
    req.set(http::field::accept, "text/event-stream");
    req.set(http::field::cache_control, "no-cache");

    if (endpoint.url.scheme == "https") {
        if (!endpoint.sslCtx) {
            throw errors::TransportError("HTTPS endpoint without TLS context");
        }
        TlsStream stream(ex, *endpoint.sslCtx);
        setServerName(stream, endpoint.url.host);
        beast::get_lowest_layer(stream).expires_after(endpoint.connectTimeout);
        co_await beast::get_lowest_layer(stream).async_connect(results, net::use_awaitable);
        co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
        co_await consumeEvents(stream, req, endpoint.readTimeout, onHeader, onEvent, stop);
        co_return;
    }

    PlainStream stream(ex);
    stream.expires_after(endpoint.connectTimeout);
    co_await stream.async_connect(results, net::use_awaitable);
    co_await consumeEvents(stream, req, endpoint.readTimeout, onHeader, onEvent, stop);
}

} // namespace detail
} // namespace toolrpc
