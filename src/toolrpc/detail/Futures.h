//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Futures.h
// Purpose: Internal helpers for already-completed futures
//==========================================================================================================

#pragma once

#include <exception>
#include <future>
#include <string>

#include "toolrpc/errors/Errors.h"

namespace toolrpc {
namespace detail {

inline std::future<void> readyFuture() {
    std::promise<void> promise;
    promise.set_value();
    return promise.get_future();
}

// Future failed with errors::TransportError(message).
inline std::future<void> failedFuture(const std::string& message) {
    std::promise<void> promise;
    promise.set_exception(std::make_exception_ptr(errors::TransportError(message)));
    return promise.get_future();
}

// what() of a captured exception, for logs and TransportError messages.
inline std::string describeException(const std::exception_ptr& e) {
    if (!e) {
        return "no error";
    }
    try {
        std::rethrow_exception(e);
    } catch (const std::exception& ex) {
        return ex.what();
    } catch (...) {
        return "unknown exception";
    }
}

} // namespace detail
} // namespace toolrpc
