//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Http.h
// Purpose: Internal Boost.Beast plumbing shared by the SSE and streamable HTTP transports
//==========================================================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

namespace toolrpc {
namespace detail {

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

using PlainStream = beast::tcp_stream;
using TlsStream = beast::ssl_stream<beast::tcp_stream>;

inline constexpr const char* SessionHeader = "Mcp-Session-Id";

/////////////////////////////////////////// URLs ///////////////////////////////////////////

//==========================================================================================================
// UrlParts
// Purpose: Minimal URL split adequate for http(s)://host[:port]/path?query.
//==========================================================================================================
struct UrlParts {
    std::string scheme{"http"};
    std::string host;
    std::string port;
    std::string path{"/"};
    std::map<std::string, std::string> query;
};

// Parses "http(s)://host[:port][/path][?k=v&...]"; IPv6 hosts use [addr]. Missing port defaults to
// 80/443 unless defaultPort is given. Throws std::invalid_argument for an empty host or bad port.
UrlParts parseUrl(const std::string& url, const std::string& defaultPort = {});

std::map<std::string, std::string> parseQuery(const std::string& query);

// Target with path and optional query string, e.g. "/message?sessionId=abc".
std::string pathOf(const std::string& target);
std::map<std::string, std::string> queryOf(const std::string& target);

/////////////////////////////////////////// TLS ///////////////////////////////////////////

// TLS 1.3-only server context loaded from PEM files. Throws on load failure.
std::unique_ptr<ssl::context> makeServerTlsContext(const std::string& certFile, const std::string& keyFile);

// TLS 1.3-only client context verifying the peer (caFile/caPath, else system defaults).
std::unique_ptr<ssl::context> makeClientTlsContext(const std::string& caFile, const std::string& caPath);

std::string randomSessionId(const std::string& prefix);

/////////////////////////////////////////// OutboundQueue ///////////////////////////////////////////

//==========================================================================================================
// OutboundQueue
// Purpose: Bounded message queue fed from any thread and drained by one coroutine on the I/O executor.
// Notes:
//   - Push fails fast when full or closed.
//   - Producers wake the consumer by posting a timer cancel to the executor.
//   - Owned by std::shared_ptr. Close it before its io_context stops.
//==========================================================================================================
class OutboundQueue : public std::enable_shared_from_this<OutboundQueue> {
public:
    struct PopResult {
        std::optional<std::string> item;  // empty with closed=false means the idle interval elapsed
        bool closed{false};
    };

    OutboundQueue(net::any_io_executor executor, std::size_t maxMessages);

    bool Push(std::string message);
    void Close();
    bool IsClosed() const;
    std::size_t Size() const;

    net::awaitable<PopResult> Pop(std::chrono::milliseconds idle);

private:
    void wake();

    net::any_io_executor executor_;
    net::steady_timer* waiter_{nullptr};   // touched only on the executor
    mutable std::mutex mutex_;
    std::deque<std::string> items_;
    std::size_t maxMessages_;
    bool closed_{false};
};

/////////////////////////////////////////// SSE ///////////////////////////////////////////

struct SseEvent {
    std::string event{"message"};
    std::string data;
};

// Incremental text/event-stream parser. Comments (": keepalive") are dropped.
class SseParser {
public:
    std::vector<SseEvent> Feed(std::string_view bytes);

private:
    void dispatchLine(const std::string& line, std::vector<SseEvent>& out);

    std::string pending_;
    SseEvent current_;
    bool hasData_{false};
};

std::string sseDataFrame(const std::string& json);
std::string sseEventFrame(const std::string& event, const std::string& data);
inline constexpr const char* SseKeepaliveFrame = ": keepalive\n\n";

// Header of an open-ended text/event-stream response (body delimited by connection close); write it
// with http::async_write_header and stream frames afterwards.
http::response<http::empty_body> sseResponse(unsigned version, const std::string& sessionId);

/////////////////////////////////////////// Listener ///////////////////////////////////////////

//==========================================================================================================
// HttpListener
// Purpose: Coroutine accept loop on a private io_context thread; plain HTTP or HTTPS (TLS 1.3 only).
// Notes:
//   - Start binds synchronously so bind failures surface through the returned future and the bound
//     port is known as soon as it is ready.
//   - Each connection runs the plain or TLS handler until it returns.
//==========================================================================================================
class HttpListener {
public:
    struct Options {
        std::string scheme{"http"};
        std::string address{"127.0.0.1"};
        std::string port{"0"};
        std::string certFile;
        std::string keyFile;
    };

    using PlainHandler = std::function<net::awaitable<void>(PlainStream&)>;
    using TlsHandler = std::function<net::awaitable<void>(TlsStream&)>;
    using ErrorHandler = std::function<void(const std::string&)>;

    HttpListener(Options options, PlainHandler plain, TlsHandler tls, ErrorHandler onError);
    ~HttpListener();

    HttpListener(const HttpListener&) = delete;
    HttpListener& operator=(const HttpListener&) = delete;

    std::future<void> Start();
    void Stop();

    bool IsRunning() const;
    uint16_t BoundPort() const;
    net::io_context& Context();

private:
    net::awaitable<void> acceptLoop();
    net::awaitable<void> servePlain(tcp::socket socket);
    net::awaitable<void> serveTls(tcp::socket socket);
    void reportError(const std::string& msg);

    Options opts_;
    PlainHandler plain_;
    TlsHandler tls_;
    ErrorHandler onError_;

    net::io_context ioc_;
    std::unique_ptr<tcp::acceptor> acceptor_;
    std::unique_ptr<ssl::context> sslCtx_;
    std::thread ioThread_;
    std::atomic<bool> running_{false};
    std::atomic<uint16_t> boundPort_{0};
};

/////////////////////////////////////////// Client helpers ///////////////////////////////////////////

//==========================================================================================================
// HttpEndpoint
// Purpose: Target of client round trips; sslCtx is set for https.
//==========================================================================================================
struct HttpEndpoint {
    UrlParts url;
    ssl::context* sslCtx{nullptr};
    std::chrono::milliseconds connectTimeout{std::chrono::seconds(10)};
    std::chrono::milliseconds readTimeout{std::chrono::seconds(30)};
};

// One request/response on a fresh connection (Connection: close). onWritten, when set, runs on the
// executor once the request has been fully written.
net::awaitable<http::response<http::string_body>> roundTrip(HttpEndpoint endpoint,
                                                             http::request<http::string_body> request,
                                                             std::function<void()> onWritten = {});

//==========================================================================================================
// PostLane
// Purpose: Runs outbound HTTP jobs one at a time, in submission order, on one executor.
// Notes:
//   - A job holds the lane until it calls its release callback or completes, whichever comes first.
//     Jobs that release after writing their request let the next request go out while they await
//     their response.
//   - Submit may be called from any thread; done runs on the executor with the job's exception, if any.
//   - Abort fails every job that has not started yet, and every job submitted afterwards.
//==========================================================================================================
class PostLane : public std::enable_shared_from_this<PostLane> {
public:
    using Release = std::function<void()>;
    using Job = std::function<net::awaitable<void>(Release release)>;
    using Done = std::function<void(std::exception_ptr)>;

    explicit PostLane(net::any_io_executor executor);

    void Submit(Job job, Done done);
    void Abort(const std::string& reason);

private:
    struct Item {
        Job job;
        Done done;
    };

    net::awaitable<void> drain();

    net::any_io_executor executor_;
    std::mutex mutex_;
    std::deque<Item> items_;
    bool draining_{false};
    bool aborted_{false};
    std::string abortReason_;
};

//==========================================================================================================
// readEventStream
// Purpose: Sends a GET and consumes its text/event-stream body until EOF or stop.
// Args:
//   onHeader: Called with the response header; returning false aborts.
//   onEvent: Called for every event.
//==========================================================================================================
using StreamHeader = http::response_header<>;
net::awaitable<void> readEventStream(HttpEndpoint endpoint,
                                     http::request<http::empty_body> request,
                                     std::function<bool(const StreamHeader&)> onHeader,
                                     std::function<void(const SseEvent&)> onEvent,
                                     std::shared_ptr<std::atomic<bool>> stop);

} // namespace detail
} // namespace toolrpc
