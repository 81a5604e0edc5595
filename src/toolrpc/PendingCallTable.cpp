//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PendingCallTable.cpp
// Purpose: Outstanding-request table implementation
//==========================================================================================================

#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "toolrpc/PendingCallTable.h"
#include "logging/Logger.h"

namespace toolrpc {

class PendingCallTable::Impl {
public:
    using StopCallback = std::stop_callback<std::function<void()>>;

    struct Slot {
        std::promise<JSONValue> promise;
        std::optional<Clock::time_point> deadline;
        std::unique_ptr<StopCallback> onStop;
    };

    mutable std::mutex mutex;
    std::unordered_map<JSONRPCId, Slot> slots;
    std::deque<JSONRPCId> retiredOrder;
    std::unordered_set<JSONRPCId> retired;
    std::size_t retiredCapacity;
    bool closed{false};
    errors::McpError closeReason;
    AbandonHandler abandonHandler;
    std::condition_variable_any cv;
    bool deadlinesChanged{false};
    std::jthread sweeper;

    explicit Impl(std::size_t capacity) : retiredCapacity(capacity == 0 ? 1 : capacity) {}

    // Caller holds the lock.
    void retire(const JSONRPCId& id) {
        if (retired.insert(id).second) {
            retiredOrder.push_back(id);
            while (retiredOrder.size() > retiredCapacity) {
                retired.erase(retiredOrder.front());
                retiredOrder.pop_front();
            }
        }
    }

    // Caller holds the lock.
    std::optional<Slot> take(const JSONRPCId& id) {
        auto it = slots.find(id);
        if (it == slots.end()) {
            return std::nullopt;
        }
        Slot slot = std::move(it->second);
        slots.erase(it);
        return slot;
    }

    // Caller holds the lock.
    void ensureSweeper() {
        if (sweeper.joinable()) {
            return;
        }
        sweeper = std::jthread([this](std::stop_token st) { sweep(st); });
    }

    void sweep(std::stop_token st) {
        std::unique_lock<std::mutex> lk(mutex);
        while (!st.stop_requested()) {
            std::optional<Clock::time_point> next;
            for (const auto& [id, slot] : slots) {
                if (slot.deadline.has_value() && (!next.has_value() || slot.deadline.value() < next.value())) {
                    next = slot.deadline;
                }
            }
            deadlinesChanged = false;
            if (next.has_value()) {
                cv.wait_until(lk, st, next.value(), [this] { return deadlinesChanged; });
            } else {
                cv.wait(lk, st, [this] { return deadlinesChanged; });
            }
            if (st.stop_requested()) {
                break;
            }

            const auto now = Clock::now();
            std::vector<std::pair<JSONRPCId, Slot>> expired;
            for (auto it = slots.begin(); it != slots.end();) {
                if (it->second.deadline.has_value() && it->second.deadline.value() <= now) {
                    retire(it->first);
                    expired.emplace_back(it->first, std::move(it->second));
                    it = slots.erase(it);
                } else {
                    ++it;
                }
            }
            if (expired.empty()) {
                continue;
            }
            AbandonHandler handler = abandonHandler;
            lk.unlock();
            const auto reason = errors::makeError(JSONRPCErrorCodes::RequestTimeout, "Request timed out");
            for (auto& [id, slot] : expired) {
                LOG_WARN("PendingCallTable: request {} timed out", IdToString(id));
                slot.promise.set_exception(std::make_exception_ptr(errors::McpException(reason)));
                if (handler) {
                    handler(id, reason);
                }
            }
            expired.clear();
            lk.lock();
        }
    }

    bool cancel(const JSONRPCId& id, const errors::McpError& reason) {
        std::optional<Slot> slot;
        AbandonHandler handler;
        {
            std::lock_guard<std::mutex> lk(mutex);
            slot = take(id);
            if (!slot.has_value()) {
                return false;
            }
            retire(id);
            handler = abandonHandler;
        }
        LOG_DEBUG("PendingCallTable: request {} abandoned: {}", IdToString(id), reason.message);
        slot->promise.set_exception(std::make_exception_ptr(errors::McpException(reason)));
        if (handler) {
            handler(id, reason);
        }
        return true;
    }
};

PendingCallTable::PendingCallTable(std::size_t retiredCapacity)
    : pImpl(std::make_unique<Impl>(retiredCapacity)) {
    FUNC_SCOPE();
}

PendingCallTable::~PendingCallTable() {
    FUNC_SCOPE();
    FailAll(errors::makeError(JSONRPCErrorCodes::ConnectionClosed, "Connection closed"));
    if (pImpl->sweeper.joinable()) {
        pImpl->sweeper.request_stop();
        pImpl->sweeper.join();
    }
}

std::future<JSONValue> PendingCallTable::Add(const JSONRPCId& id, std::optional<Clock::time_point> deadline,
                                             std::stop_token cancel) {
    FUNC_SCOPE();
    std::promise<JSONValue> promise;
    auto future = promise.get_future();
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        if (pImpl->closed) {
            promise.set_exception(std::make_exception_ptr(errors::McpException(pImpl->closeReason)));
            return future;
        }
        if (pImpl->slots.contains(id)) {
            LOG_WARN("PendingCallTable: duplicate pending id {}", IdToString(id));
            promise.set_exception(std::make_exception_ptr(errors::McpException(
                errors::makeError(JSONRPCErrorCodes::InvalidRequestId, "Duplicate pending request id"))));
            return future;
        }
        Impl::Slot slot;
        slot.promise = std::move(promise);
        slot.deadline = deadline;
        pImpl->slots.emplace(id, std::move(slot));
        if (deadline.has_value()) {
            pImpl->deadlinesChanged = true;
            pImpl->ensureSweeper();
        }
    }
    if (deadline.has_value()) {
        pImpl->cv.notify_all();
    }

    if (cancel.stop_possible()) {
        // Constructed outside the lock: it runs synchronously when stop was already requested.
        Impl* impl = pImpl.get();
        auto onStop = std::make_unique<Impl::StopCallback>(cancel, std::function<void()>([impl, id]() {
            impl->cancel(id, errors::makeError(JSONRPCErrorCodes::RequestCancelled, "Request cancelled"));
        }));
        {
            std::lock_guard<std::mutex> lk(pImpl->mutex);
            auto it = pImpl->slots.find(id);
            if (it != pImpl->slots.end()) {
                it->second.onStop = std::move(onStop);
            }
        }
        // When the slot is already gone, onStop is destroyed here, outside the lock.
    }
    return future;
}

PendingCallTable::ResolveStatus PendingCallTable::Resolve(const JSONRPCResponse& response) {
    FUNC_SCOPE();
    std::optional<Impl::Slot> slot;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        slot = pImpl->take(response.id);
        if (!slot.has_value()) {
            return pImpl->retired.contains(response.id) ? ResolveStatus::Retired : ResolveStatus::Unknown;
        }
    }
    if (response.error.has_value()) {
        auto err = errors::mcpErrorFromResponse(response);
        if (!err.has_value()) {
            err = errors::makeError(JSONRPCErrorCodes::InternalError, "Malformed error response");
        }
        slot->promise.set_exception(std::make_exception_ptr(errors::McpException(err.value())));
    } else {
        slot->promise.set_value(response.result.has_value() ? response.result.value() : JSONValue(nullptr));
    }
    return ResolveStatus::Resolved;
}

bool PendingCallTable::Cancel(const JSONRPCId& id, const errors::McpError& reason) {
    FUNC_SCOPE();
    return pImpl->cancel(id, reason);
}

bool PendingCallTable::Remove(const JSONRPCId& id, std::exception_ptr failure) {
    FUNC_SCOPE();
    std::optional<Impl::Slot> slot;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        slot = pImpl->take(id);
        if (!slot.has_value()) {
            return false;
        }
        pImpl->retire(id);
    }
    slot->promise.set_exception(failure);
    return true;
}

void PendingCallTable::FailAll(const errors::McpError& reason) {
    FUNC_SCOPE();
    std::vector<Impl::Slot> failed;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        if (!pImpl->closed) {
            pImpl->closed = true;
            pImpl->closeReason = reason;
        }
        for (auto& [id, slot] : pImpl->slots) {
            pImpl->retire(id);
            failed.push_back(std::move(slot));
        }
        pImpl->slots.clear();
    }
    if (!failed.empty()) {
        LOG_INFO("PendingCallTable: failing {} pending call(s): {}", failed.size(), reason.message);
    }
    for (auto& slot : failed) {
        slot.promise.set_exception(std::make_exception_ptr(errors::McpException(reason)));
    }
}

void PendingCallTable::SetAbandonHandler(AbandonHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    pImpl->abandonHandler = std::move(handler);
}

std::size_t PendingCallTable::Size() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->slots.size();
}

bool PendingCallTable::Contains(const JSONRPCId& id) const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->slots.contains(id);
}

bool PendingCallTable::IsRetired(const JSONRPCId& id) const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->retired.contains(id);
}

} // namespace toolrpc
