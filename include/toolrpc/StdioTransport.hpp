//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.hpp
// Purpose: Newline-delimited JSON transport over a pair of file descriptors
//==========================================================================================================
#pragma once

#include "toolrpc/Transport.h"
#include <memory>
#include <cstdint>

namespace toolrpc {

//==========================================================================================================
// StdioTransport
// Purpose: Envelope transport over two byte streams, one JSON document per line. Defaults to the process
//          stdin/stdout; any pair of descriptors (pipes, sockets) may be supplied instead.
// Notes:
//   - A reader thread waits on the input descriptor and a wake eventfd with epoll.
//   - A writer thread drains a byte-capped queue; Send fails fast when the cap would be exceeded.
//   - Blank lines and trailing '\r' are ignored. A malformed or over-long line is reported to the decode
//     error handler and skipped; it never closes the transport.
//   - EOF or a read error on the input ends the inbound stream and fires the close handler; the writer
//     keeps draining until Close().
//==========================================================================================================
class StdioTransport : public ITransport {
public:
    struct Options {
        int inFd{0};
        int outFd{1};
        std::size_t writeQueueMaxBytes{2 * 1024 * 1024};
        uint64_t writeTimeoutMs{0};      // 0 disables the per-frame write timeout
        uint64_t idleReadTimeoutMs{0};   // 0 disables the idle read timeout
        std::size_t maxLineBytes{1024 * 1024};
        bool closeFdsOnClose{true};
    };

    StdioTransport();
    explicit StdioTransport(const Options& options);
    virtual ~StdioTransport();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    //==========================================================================================================
    // Starts the reader/writer threads.
    // Returns:
    //   Future that completes when the loops are running.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Stops both loops, flushes what is queued (bounded), and closes the descriptors when configured to.
    // Returns:
    //   Future that completes when closed.
    //==========================================================================================================
    std::future<void> Close() override;

    bool IsConnected() const override;
    std::string GetSessionId() const override;

    //==========================================================================================================
    // Encodes the envelope as one line and queues it.
    // Returns:
    //   Future completing when the line has been fully written; fails with TransportError when the
    //   transport is closed, the queue is over its byte cap, or the write fails or times out.
    //==========================================================================================================
    std::future<void> Send(Envelope envelope) override;

    void SetMessageHandler(MessageHandler handler) override;
    void SetDecodeErrorHandler(DecodeErrorHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;
    void SetCloseHandler(CloseHandler handler) override;

    //==========================================================================================================
    // Tuning (call before Start()).
    //==========================================================================================================
    void SetIdleReadTimeoutMs(uint64_t timeoutMs);
    void SetWriteQueueMaxBytes(std::size_t maxBytes);
    void SetWriteTimeoutMs(uint64_t timeoutMs);
    void SetMaxLineBytes(std::size_t maxBytes);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
    friend struct StdioTransportTestHooks;
};

//==========================================================================================================
// StdioTransportFactory
// Purpose: Creates stdio transports from "key=value;..." strings.
// Keys:
//   in_fd, out_fd, write_queue_max_bytes, write_timeout_ms, idle_read_timeout_ms, max_line_bytes,
//   close_fds (0/1). Unknown keys and malformed values are logged and ignored.
//==========================================================================================================
class StdioTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;
};

struct StdioTransportTestHooks {
    // Feeds raw bytes through the line splitter; complete lines are decoded and delivered.
    static void drainLines(StdioTransport& t, std::string& buffer);
    static std::size_t queuedBytes(const StdioTransport& t);
    static StdioTransport::Options options(const StdioTransport& t);
    // Largest number of unsplit input bytes the reader has held.
    static std::size_t peakBufferedBytes(const StdioTransport& t);
};

} // namespace toolrpc
