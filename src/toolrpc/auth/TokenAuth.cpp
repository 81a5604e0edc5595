//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/toolrpc/auth/TokenAuth.cpp
// Purpose: Token verification helpers implementation
//==========================================================================================================

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

#include "toolrpc/auth/TokenAuth.hpp"

namespace toolrpc::auth {

namespace {
    // Thread-local storage for per-call TokenInfo.
    thread_local const TokenInfo* gCurrentTokenInfo = nullptr;

    static bool containsAllScopes(const std::vector<std::string>& have, const std::vector<std::string>& need) {
        for (const auto& s : need) {
            if (std::find(have.begin(), have.end(), s) == have.end()) {
                return false;
            }
        }
        return true;
    }
}

const TokenInfo* CurrentTokenInfo() {
    return gCurrentTokenInfo;
}

TokenInfoScope::TokenInfoScope(const TokenInfo* info) : prev(gCurrentTokenInfo) {
    gCurrentTokenInfo = info;
}

TokenInfoScope::~TokenInfoScope() {
    gCurrentTokenInfo = prev;
}

StaticTokenVerifier::StaticTokenVerifier(std::chrono::seconds lifetime) : lifetime_(lifetime) {}

void StaticTokenVerifier::AddToken(const std::string& token, std::vector<std::string> scopes) {
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_[token] = std::move(scopes);
}

void StaticTokenVerifier::RemoveToken(const std::string& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_.erase(token);
}

bool StaticTokenVerifier::Verify(const std::string& token, TokenInfo& outInfo, std::string& errorMessage) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(token);
    if (it == tokens_.end()) {
        errorMessage = "invalid token";
        return false;
    }
    outInfo.scopes = it->second;
    outInfo.expiration = std::chrono::system_clock::now() + lifetime_;
    return true;
}

TokenCheckResult CheckToken(
    const std::string& token,
    ITokenVerifier& verifier,
    const TokenCheckOptions& opts,
    TokenInfo& outInfo) {

    TokenCheckResult r;

    if (token.empty()) {
        r.ok = false;
        r.errorMessage = std::string("no token");
        return r;
    }

    // Verify token via callback
    std::string err;
    TokenInfo info;
    if (!verifier.Verify(token, info, err)) {
        r.ok = false;
        r.errorMessage = err.empty() ? std::string("invalid token") : err;
        return r;
    }

    // Check scopes
    if (!opts.requiredScopes.empty()) {
        if (!containsAllScopes(info.scopes, opts.requiredScopes)) {
            r.ok = false;
            r.errorMessage = std::string("insufficient scope");
            return r;
        }
    }

    // Check expiration
    if (info.expiration.time_since_epoch().count() == 0) {
        r.ok = false;
        r.errorMessage = std::string("token missing expiration");
        return r;
    }
    if (info.expiration <= std::chrono::system_clock::now()) {
        r.ok = false;
        r.errorMessage = std::string("token expired");
        return r;
    }

    // Success
    outInfo = std::move(info);
    r.ok = true;
    return r;
}

} // namespace toolrpc::auth
