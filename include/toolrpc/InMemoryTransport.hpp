//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.hpp
// Purpose: In-memory transport for tests and embedding
//==========================================================================================================
#pragma once

#include "toolrpc/Transport.h"
#include <memory>
#include <utility>

namespace toolrpc {

//==========================================================================================================
// InMemoryTransport
// Purpose: In-process transport used for tests and embedding. Frames are encoded on Send and decoded on
//          the paired side, so the codec runs exactly as it does over a real medium. Each side delivers to
//          its message handler from a single worker thread, preserving order. Closing one side closes the
//          peer after it drains what it already received.
//==========================================================================================================
class InMemoryTransport : public ITransport {
public:
    InMemoryTransport();
    virtual ~InMemoryTransport();

    //==========================================================================================================
    // CreatePair
    // Purpose: Creates two paired transports wired to each other in-memory.
    // Returns:
    //   pair(left,right) where sending on one delivers to the other.
    //==========================================================================================================
    static std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> CreatePair();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;

    //==========================================================================================================
    // Encodes the envelope and queues it on the peer. Fails with TransportError when either side is
    // closed or the peer is gone.
    //==========================================================================================================
    std::future<void> Send(Envelope envelope) override;

    void SetMessageHandler(MessageHandler handler) override;
    void SetDecodeErrorHandler(DecodeErrorHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;
    void SetCloseHandler(CloseHandler handler) override;

    //==========================================================================================================
    // Test hook: pushes a raw frame to the peer as if it came off the wire.
    // Returns:
    //   true when the peer accepted the frame.
    //==========================================================================================================
    bool SendRawFrame(const std::string& frame);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolrpc
