//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.cpp
// Purpose: Newline-delimited JSON transport implementation (epoll reader, queued writer)
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <cstring>
#include <poll.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>

#include <atomic>
#include <charconv>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "logging/Logger.h"
#include "toolrpc/Codec.h"
#include "toolrpc/StdioTransport.hpp"
#include "env/EnvVars.h"
#include "detail/Futures.h"

namespace toolrpc {

class StdioTransport::Impl {
public:
    struct QueuedFrame {
        std::string bytes;
        std::promise<void> done;
    };

    StdioTransport::Options options;
    std::atomic<bool> started{false};
    std::atomic<bool> stopping{false};
    std::atomic<bool> inputClosed{false};
    std::atomic<bool> writeFailed{false};
    std::atomic<bool> closeNotified{false};
    std::string sessionId;
    ITransport::MessageHandler messageHandler;
    ITransport::DecodeErrorHandler decodeErrorHandler;
    ITransport::ErrorHandler errorHandler;
    ITransport::CloseHandler closeHandler;
    std::thread readerThread;
    std::thread writerThread;
    std::mutex writeMutex; // protects writeQueue and queuedBytes
    std::condition_variable cvWrite;
    std::deque<QueuedFrame> writeQueue;
    std::size_t queuedBytes{0};
    std::mutex closeMutex;
    int wakeEventFd{-1};

    // Line splitter state: set while skipping the remainder of an over-long line.
    bool discardingLine{false};
    // Largest input buffer seen before splitting.
    std::atomic<std::size_t> peakBufferedBytes{0};

    static constexpr int WaitTimeoutMs = 100;
    static constexpr std::chrono::milliseconds CloseDrainTimeout{500};
    std::chrono::steady_clock::time_point drainDeadline{};
    std::chrono::steady_clock::time_point lastReadTs{std::chrono::steady_clock::now()};

    explicit Impl(const StdioTransport::Options& opts) : options(opts) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "stdio-" + std::to_string(dis(gen));
        options.writeQueueMaxBytes = static_cast<std::size_t>(
            GetEnvUintOrDefault("TOOLRPC_STDIO_WRITE_QUEUE_MAX_BYTES", options.writeQueueMaxBytes));
        if (options.writeQueueMaxBytes == 0) {
            options.writeQueueMaxBytes = 1;
        }

        wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeEventFd < 0) {
            LOG_ERROR("StdioTransport: failed to create eventfd (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    ~Impl() {
        stopping = true;
        wake();
        cvWrite.notify_all();
        joinOrDetach(readerThread);
        joinOrDetach(writerThread);
        if (wakeEventFd >= 0) { ::close(wakeEventFd); wakeEventFd = -1; }
    }

    static void joinOrDetach(std::thread& t) {
        if (!t.joinable()) {
            return;
        }
        if (t.get_id() == std::this_thread::get_id()) {
            t.detach();
        } else {
            t.join();
        }
    }

    void reportError(const std::string& message) {
        if (errorHandler) {
            errorHandler(message);
        }
    }

    void wake() {
        if (wakeEventFd < 0) {
            return;
        }
        uint64_t one = 1;
        ssize_t wr;
        do {
            wr = ::write(wakeEventFd, &one, sizeof(one));
        } while (wr < 0 && errno == EINTR);
        if (wr < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            LOG_WARN("StdioTransport: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    // Fires the close handler exactly once.
    void notifyClosed() {
        if (closeNotified.exchange(true)) {
            return;
        }
        if (closeHandler) {
            closeHandler();
        }
    }

    std::future<void> enqueueFrame(std::string frame) {
        std::future<void> fut;
        {
            std::lock_guard<std::mutex> lk(writeMutex);
            if (stopping.load() || writeFailed.load()) {
                return detail::failedFuture("StdioTransport: transport closed");
            }
            if (queuedBytes + frame.size() > options.writeQueueMaxBytes) {
                LOG_ERROR("StdioTransport: write queue overflow (queued={} add={} max={})", queuedBytes, frame.size(), options.writeQueueMaxBytes);
                reportError("StdioTransport: write queue overflow");
                return detail::failedFuture("StdioTransport: write queue overflow");
            }
            queuedBytes += frame.size();
            QueuedFrame item;
            item.bytes = std::move(frame);
            fut = item.done.get_future();
            writeQueue.emplace_back(std::move(item));
        }
        cvWrite.notify_one();
        return fut;
    }

    void processLine(std::string line) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            return;
        }
        LOG_DEBUG("StdioTransport: received line: {}", line);
        DecodeResult decoded = DecodeEnvelope(line);
        if (!decoded.Ok()) {
            LOG_WARN("StdioTransport: undecodable line: {}", decoded.error->message);
            if (decodeErrorHandler) {
                decodeErrorHandler(decoded.error.value(), decoded.id);
            }
            return;
        }
        if (messageHandler) {
            messageHandler(std::move(decoded.envelope.value()));
        }
    }

    void reportOverlongLine() {
        LOG_WARN("StdioTransport: line exceeds max {} bytes; discarding", options.maxLineBytes);
        if (decodeErrorHandler) {
            decodeErrorHandler(errors::makeError(JSONRPCErrorCodes::ParseError, "Parse error: line too long"), std::nullopt);
        }
    }

    void notePeakBuffered(std::size_t size) {
        std::size_t prev = peakBufferedBytes.load();
        while (size > prev && !peakBufferedBytes.compare_exchange_weak(prev, size)) {
        }
    }

    // Splits complete lines out of the buffer; partial data stays for the next read.
    void drainLines(std::string& buffer) {
        for (;;) {
            std::size_t nl = buffer.find('\n');
            if (discardingLine) {
                if (nl == std::string::npos) {
                    buffer.clear();
                    return;
                }
                buffer.erase(0, nl + 1);
                discardingLine = false;
                continue;
            }
            if (nl == std::string::npos) {
                if (buffer.size() > options.maxLineBytes) {
                    reportOverlongLine();
                    buffer.clear();
                    discardingLine = true;
                }
                return;
            }
            if (nl > options.maxLineBytes) {
                reportOverlongLine();
                buffer.erase(0, nl + 1);
                continue;
            }
            std::string line = buffer.substr(0, nl);
            buffer.erase(0, nl + 1);
            processLine(std::move(line));
        }
    }

    void startReader() {
        readerThread = std::thread([this]() {
            std::string buffer;
            std::vector<char> tmp(4096);
            const int fd = options.inFd;
            int flags = ::fcntl(fd, F_GETFL, 0);
            if (flags >= 0) { (void)::fcntl(fd, F_SETFL, flags | O_NONBLOCK); }
            lastReadTs = std::chrono::steady_clock::now();

            int ep = ::epoll_create1(EPOLL_CLOEXEC);
            if (ep < 0) {
                LOG_ERROR("StdioTransport: epoll_create1 failed (errno={} msg={})", errno, ::strerror(errno));
                reportError("StdioTransport: epoll_create1 failed");
                inputClosed = true;
                notifyClosed();
                return;
            }
            // Regular files cannot be polled (EPERM); they never block, so read them directly.
            bool pollable = true;
            epoll_event evIn{}; evIn.events = EPOLLIN | EPOLLRDHUP; evIn.data.fd = fd;
            if (::epoll_ctl(ep, EPOLL_CTL_ADD, fd, &evIn) != 0) {
                if (errno == EPERM) {
                    pollable = false;
                } else {
                    LOG_ERROR("StdioTransport: epoll_ctl failed for fd {} (errno={} msg={})", fd, errno, ::strerror(errno));
                }
            }
            if (wakeEventFd >= 0) {
                epoll_event evWake{}; evWake.events = EPOLLIN; evWake.data.fd = wakeEventFd;
                (void)::epoll_ctl(ep, EPOLL_CTL_ADD, wakeEventFd, &evWake);
            }

            bool eof = false;
            while (!stopping.load() && !eof) {
                epoll_event events[2];
                int rc = ::epoll_wait(ep, events, 2, pollable ? WaitTimeoutMs : 0);
                if (rc < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    LOG_ERROR("StdioTransport: epoll_wait failed (errno={} msg={})", errno, ::strerror(errno));
                    reportError("StdioTransport: epoll_wait failed");
                    break;
                }
                bool readable = !pollable;
                for (int i = 0; i < rc; ++i) {
                    if (events[i].data.fd == fd) {
                        readable = true;
                    } else {
                        uint64_t v = 0;
                        ssize_t r;
                        do {
                            r = ::read(events[i].data.fd, &v, sizeof(v));
                        } while (r < 0 && errno == EINTR);
                    }
                }
                if (stopping.load()) {
                    break;
                }
                if (readable) {
                    // Drain everything available; HUP is only final once read() reports EOF.
                    for (;;) {
                        ssize_t n = ::read(fd, tmp.data(), tmp.size());
                        if (n > 0) {
                            buffer.append(tmp.data(), static_cast<std::size_t>(n));
                            lastReadTs = std::chrono::steady_clock::now();
                            notePeakBuffered(buffer.size());
                            // Split per chunk: the buffer stays within maxLineBytes plus one read.
                            drainLines(buffer);
                            continue;
                        }
                        if (n == 0) {
                            LOG_INFO("StdioTransport: EOF on input");
                            eof = true;
                        } else if (errno == EINTR) {
                            continue;
                        } else if (errno != EAGAIN && errno != EWOULDBLOCK) {
                            LOG_ERROR("StdioTransport: read error (errno={} msg={})", errno, ::strerror(errno));
                            reportError("StdioTransport: read error");
                            eof = true;
                        }
                        break;
                    }
                }

                // Idle read timeout check
                if (!eof && options.idleReadTimeoutMs > 0) {
                    auto now = std::chrono::steady_clock::now();
                    if (now - lastReadTs >= std::chrono::milliseconds(options.idleReadTimeoutMs)) {
                        LOG_ERROR("StdioTransport: idle read timeout ({} ms)", options.idleReadTimeoutMs);
                        reportError("StdioTransport: idle read timeout");
                        break;
                    }
                }
            }
            ::close(ep);
            inputClosed = true;
            if (!stopping.load()) {
                notifyClosed();
            }
        });
    }

    // Writes one frame; returns an error message on failure.
    std::optional<std::string> writeFrame(const std::string& frame) {
        const int fd = options.outFd;
        std::size_t total = 0;
        auto start = std::chrono::steady_clock::now();
        while (total < frame.size()) {
            ssize_t w = ::write(fd, frame.data() + total, frame.size() - total);
            if (w > 0) {
                total += static_cast<std::size_t>(w);
                continue;
            }
            if (w < 0 && errno == EINTR) {
                continue;
            }
            if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                auto now = std::chrono::steady_clock::now();
                if (options.writeTimeoutMs > 0 && (now - start) >= std::chrono::milliseconds(options.writeTimeoutMs)) {
                    LOG_ERROR("StdioTransport: write timeout ({} ms)", options.writeTimeoutMs);
                    return std::string("StdioTransport: write timeout");
                }
                if (stopping.load() && now >= drainDeadline) {
                    return std::string("StdioTransport: closed before frame was written");
                }
                struct pollfd pfd{fd, POLLOUT, 0};
                (void)::poll(&pfd, 1, 5);
                continue;
            }
            LOG_ERROR("StdioTransport: write error (errno={} msg={})", errno, ::strerror(errno));
            return std::string("StdioTransport: write error");
        }
        return std::nullopt;
    }

    void startWriter() {
        writerThread = std::thread([this]() {
            int flags = ::fcntl(options.outFd, F_GETFL, 0);
            if (flags >= 0) { (void)::fcntl(options.outFd, F_SETFL, flags | O_NONBLOCK); }
            for (;;) {
                QueuedFrame item;
                {
                    std::unique_lock<std::mutex> lk(writeMutex);
                    cvWrite.wait(lk, [&]{ return stopping.load() || !writeQueue.empty(); });
                    if (writeQueue.empty()) {
                        break;
                    }
                    item = std::move(writeQueue.front());
                    writeQueue.pop_front();
                }

                std::optional<std::string> err;
                if (writeFailed.load()) {
                    err = std::string("StdioTransport: output broken");
                } else {
                    err = writeFrame(item.bytes);
                }
                {
                    std::lock_guard<std::mutex> lk(writeMutex);
                    queuedBytes = (queuedBytes >= item.bytes.size()) ? queuedBytes - item.bytes.size() : 0;
                }
                if (err.has_value()) {
                    item.done.set_exception(std::make_exception_ptr(errors::TransportError(err.value())));
                    if (!writeFailed.exchange(true) && !stopping.load()) {
                        reportError(err.value());
                        notifyClosed();
                    }
                } else {
                    item.done.set_value();
                }
            }
        });
    }
};

StdioTransport::StdioTransport() : pImpl(std::make_unique<Impl>(Options{})) { FUNC_SCOPE(); }
StdioTransport::StdioTransport(const Options& options) : pImpl(std::make_unique<Impl>(options)) { FUNC_SCOPE(); }
StdioTransport::~StdioTransport() { FUNC_SCOPE(); }

std::future<void> StdioTransport::Start() {
    FUNC_SCOPE();
    if (pImpl->stopping.load()) {
        return detail::failedFuture("StdioTransport: already closed");
    }
    if (pImpl->started.exchange(true)) {
        return detail::readyFuture();
    }
    LOG_INFO("Starting StdioTransport {} (in_fd={} out_fd={})", pImpl->sessionId, pImpl->options.inFd, pImpl->options.outFd);
    pImpl->startReader();
    pImpl->startWriter();
    return detail::readyFuture();
}

std::future<void> StdioTransport::Close() {
    FUNC_SCOPE();
    {
        std::lock_guard<std::mutex> closeLock(pImpl->closeMutex);
        if (pImpl->stopping.load()) {
            return detail::readyFuture();
        }
        std::lock_guard<std::mutex> lk(pImpl->writeMutex);
        pImpl->drainDeadline = std::chrono::steady_clock::now() + Impl::CloseDrainTimeout;
        pImpl->stopping = true;
    }
    LOG_INFO("Closing StdioTransport {}", pImpl->sessionId);
    pImpl->wake();
    pImpl->cvWrite.notify_all();
    Impl::joinOrDetach(pImpl->readerThread);
    Impl::joinOrDetach(pImpl->writerThread);

    // Frames never picked up by the writer (not started, or writer detached).
    {
        std::lock_guard<std::mutex> lk(pImpl->writeMutex);
        for (auto& item : pImpl->writeQueue) {
            item.done.set_exception(std::make_exception_ptr(errors::TransportError("StdioTransport: transport closed")));
        }
        pImpl->writeQueue.clear();
        pImpl->queuedBytes = 0;
    }

    if (pImpl->options.closeFdsOnClose) {
        ::close(pImpl->options.inFd);
        if (pImpl->options.outFd != pImpl->options.inFd) {
            ::close(pImpl->options.outFd);
        }
    }
    pImpl->notifyClosed();
    return detail::readyFuture();
}

bool StdioTransport::IsConnected() const {
    FUNC_SCOPE();
    return pImpl->started.load() && !pImpl->stopping.load() && !pImpl->inputClosed.load() && !pImpl->writeFailed.load();
}

std::string StdioTransport::GetSessionId() const { FUNC_SCOPE(); return pImpl->sessionId; }

std::future<void> StdioTransport::Send(Envelope envelope) {
    FUNC_SCOPE();
    if (!pImpl->started.load()) {
        return detail::failedFuture("StdioTransport: not started");
    }
    std::string frame = EncodeEnvelope(envelope);
    LOG_DEBUG("StdioTransport: queueing line ({} bytes)", frame.size());
    frame.push_back('\n');
    return pImpl->enqueueFrame(std::move(frame));
}

void StdioTransport::SetMessageHandler(MessageHandler handler) { FUNC_SCOPE(); pImpl->messageHandler = std::move(handler); }
void StdioTransport::SetDecodeErrorHandler(DecodeErrorHandler handler) { FUNC_SCOPE(); pImpl->decodeErrorHandler = std::move(handler); }
void StdioTransport::SetErrorHandler(ErrorHandler handler) { FUNC_SCOPE(); pImpl->errorHandler = std::move(handler); }
void StdioTransport::SetCloseHandler(CloseHandler handler) { FUNC_SCOPE(); pImpl->closeHandler = std::move(handler); }

void StdioTransport::SetIdleReadTimeoutMs(uint64_t timeoutMs) {
    FUNC_SCOPE();
    pImpl->options.idleReadTimeoutMs = timeoutMs;
}

void StdioTransport::SetWriteQueueMaxBytes(std::size_t maxBytes) {
    FUNC_SCOPE();
    if (maxBytes == 0) { maxBytes = 1; }
    pImpl->options.writeQueueMaxBytes = maxBytes;
}

void StdioTransport::SetWriteTimeoutMs(uint64_t timeoutMs) {
    FUNC_SCOPE();
    pImpl->options.writeTimeoutMs = timeoutMs;
}

void StdioTransport::SetMaxLineBytes(std::size_t maxBytes) {
    FUNC_SCOPE();
    if (maxBytes == 0) { maxBytes = 1; }
    pImpl->options.maxLineBytes = maxBytes;
}

std::unique_ptr<ITransport> StdioTransportFactory::CreateTransport(const std::string& config) {
    FUNC_SCOPE();
    StdioTransport::Options opts;
    auto parseUint = [](const std::string& s, uint64_t& out) -> bool {
        if (s.empty()) {
            return false;
        }
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
        return ec == std::errc() && ptr == s.data() + s.size();
    };
    // Parse key=value pairs separated by ';' or whitespace
    for (std::size_t i = 0; i < config.size();) {
        while (i < config.size() && (config[i] == ';' || config[i] == ' ' || config[i] == '\t')) ++i;
        if (i >= config.size()) break;
        std::size_t start = i;
        while (i < config.size() && config[i] != ';' && config[i] != ' ' && config[i] != '\t') ++i;
        const std::string token = config.substr(start, i - start);
        auto eq = token.find('=');
        if (eq == std::string::npos) {
            LOG_WARN("StdioTransportFactory: ignoring token without '=': {}", token);
            continue;
        }
        const std::string key = token.substr(0, eq);
        const std::string val = token.substr(eq + 1);
        uint64_t v = 0;
        if (!parseUint(val, v)) {
            LOG_WARN("StdioTransportFactory: ignoring malformed value {}={}", key, val);
            continue;
        }
        if (key == "in_fd") {
            opts.inFd = static_cast<int>(v);
        } else if (key == "out_fd") {
            opts.outFd = static_cast<int>(v);
        } else if (key == "write_queue_max_bytes") {
            opts.writeQueueMaxBytes = static_cast<std::size_t>(v);
        } else if (key == "write_timeout_ms") {
            opts.writeTimeoutMs = v;
        } else if (key == "idle_read_timeout_ms") {
            opts.idleReadTimeoutMs = v;
        } else if (key == "max_line_bytes") {
            opts.maxLineBytes = static_cast<std::size_t>(v);
        } else if (key == "close_fds") {
            opts.closeFdsOnClose = (v != 0);
        } else {
            LOG_WARN("StdioTransportFactory: unknown key {}", key);
        }
    }
    return std::make_unique<StdioTransport>(opts);
}

/////////////////////////////////////////// Test hooks ///////////////////////////////////////////
void StdioTransportTestHooks::drainLines(StdioTransport& t, std::string& buffer) {
    t.pImpl->drainLines(buffer);
}

std::size_t StdioTransportTestHooks::queuedBytes(const StdioTransport& t) {
    std::lock_guard<std::mutex> lk(t.pImpl->writeMutex);
    return t.pImpl->queuedBytes;
}

StdioTransport::Options StdioTransportTestHooks::options(const StdioTransport& t) {
    return t.pImpl->options;
}

std::size_t StdioTransportTestHooks::peakBufferedBytes(const StdioTransport& t) {
    return t.pImpl->peakBufferedBytes.load();
}

} // namespace toolrpc
