//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PendingCallTable.h
// Purpose: Outstanding-request table: id -> single-resolution slot with deadline and cancellation
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stop_token>

#include "toolrpc/JSONRPCTypes.h"
#include "toolrpc/errors/Errors.h"

namespace toolrpc {

//==========================================================================================================
// PendingCallTable
// Purpose: Tracks requests sent by this side until exactly one of {matching response, cancellation,
//          deadline expiry, teardown} resolves them. Every resolution removes the slot.
// Notes:
//   - Futures carry the response result, or fail with errors::McpException (remote error, RequestTimeout,
//     RequestCancelled, ConnectionClosed).
//   - Ids resolved by cancellation or timeout are remembered in a bounded FIFO so a late response for them
//     can be told apart from a response nobody asked for.
//   - Deadlines are enforced by a sweeper thread started on first use.
//==========================================================================================================
class PendingCallTable {
public:
    enum class ResolveStatus {
        Resolved,   // a pending slot took the response
        Retired,    // the id was cancelled/timed out earlier; late response, discard silently
        Unknown     // no slot and never retired: protocol error
    };

    using Clock = std::chrono::steady_clock;

    // Invoked (outside the table lock) when a slot is abandoned through Cancel or deadline expiry.
    using AbandonHandler = std::function<void(const JSONRPCId& id, const errors::McpError& reason)>;

    static constexpr std::size_t DefaultRetiredCapacity = 1024;

    explicit PendingCallTable(std::size_t retiredCapacity = DefaultRetiredCapacity);
    ~PendingCallTable();

    PendingCallTable(const PendingCallTable&) = delete;
    PendingCallTable& operator=(const PendingCallTable&) = delete;

    //==========================================================================================================
    // Add
    // Purpose: Registers a slot for an outgoing request.
    // Args:
    //   id: Request id (unique among pending slots).
    //   deadline: Optional absolute deadline; expiry fails the slot with RequestTimeout.
    //   cancel: Optional caller token; a stop request fails the slot with RequestCancelled.
    // Returns:
    //   Future for the result. After FailAll, or for a duplicate id, the future is already failed.
    //==========================================================================================================
    std::future<JSONValue> Add(const JSONRPCId& id,
                               std::optional<Clock::time_point> deadline = std::nullopt,
                               std::stop_token cancel = {});

    //==========================================================================================================
    // Resolve
    // Purpose: Completes the slot matching response.id with its result or error.
    //==========================================================================================================
    ResolveStatus Resolve(const JSONRPCResponse& response);

    //==========================================================================================================
    // Cancel / Fail
    // Purpose: Fails one slot with the given error and retires its id. Returns false when no slot exists.
    //          Cancel also notifies the abandon handler; Remove drops a slot silently (send failures).
    //==========================================================================================================
    bool Cancel(const JSONRPCId& id, const errors::McpError& reason);
    bool Remove(const JSONRPCId& id, std::exception_ptr failure);

    //==========================================================================================================
    // FailAll
    // Purpose: Teardown. Fails every slot with the given error; later Add calls fail immediately.
    //==========================================================================================================
    void FailAll(const errors::McpError& reason);

    void SetAbandonHandler(AbandonHandler handler);

    std::size_t Size() const;
    bool Contains(const JSONRPCId& id) const;
    bool IsRetired(const JSONRPCId& id) const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolrpc
