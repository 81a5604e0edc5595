//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TokenAuth.hpp
// Purpose: Token verification interfaces and helpers used by the Auth middleware
//==========================================================================================================

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <chrono>

namespace toolrpc::auth {

//==========================================================================================================
// TokenInfo
// Purpose: Information extracted from a token (scopes, expiration, and optional extra fields).
//==========================================================================================================
struct TokenInfo {
    std::vector<std::string> scopes;
    std::chrono::system_clock::time_point expiration;
    std::unordered_map<std::string, std::string> extra;
};

//==========================================================================================================
// ITokenVerifier
// Purpose: Interface to validate a token and populate TokenInfo when valid. Must be thread-safe; tool
//          calls verify concurrently.
// Returns: true on success (TokenInfo populated); false on failure (set errorMessage).
//==========================================================================================================
class ITokenVerifier {
public:
    virtual ~ITokenVerifier() = default;
    virtual bool Verify(const std::string& token, TokenInfo& outInfo, std::string& errorMessage) = 0;
};

//==========================================================================================================
// StaticTokenVerifier
// Purpose: Accepts a fixed set of tokens, each with its scopes. Verified tokens expire `lifetime` after
//          the verification instant.
//==========================================================================================================
class StaticTokenVerifier : public ITokenVerifier {
public:
    explicit StaticTokenVerifier(std::chrono::seconds lifetime = std::chrono::hours(1));

    void AddToken(const std::string& token, std::vector<std::string> scopes = {});
    void RemoveToken(const std::string& token);

    bool Verify(const std::string& token, TokenInfo& outInfo, std::string& errorMessage) override;

private:
    std::mutex mutex_;
    std::unordered_map<std::string, std::vector<std::string>> tokens_;
    std::chrono::seconds lifetime_;
};

//==========================================================================================================
// TokenCheckOptions
// Purpose: Options controlling token enforcement.
// Fields:
//   requiredScopes: All listed scopes must be present in the token.
//==========================================================================================================
struct TokenCheckOptions {
    std::vector<std::string> requiredScopes;
};

//==========================================================================================================
// TokenCheckResult
// Purpose: Result of checking a token.
// Fields:
//   ok: True if authorization passed.
//   errorMessage: Reason for rejection ("no token", "invalid token", "insufficient scope", "token expired").
//==========================================================================================================
struct TokenCheckResult {
    bool ok{false};
    std::string errorMessage;
};

//==========================================================================================================
// CheckToken
// Purpose: Validate a token using the supplied verifier and options (presence, verification, scopes,
//          expiration).
// Args:
//   token: The presented token (may be empty).
//   verifier: Token verifier.
//   opts: Enforcement options.
//   outInfo: Populated on success with token information.
// Returns:
//   TokenCheckResult indicating success or failure details.
//==========================================================================================================
TokenCheckResult CheckToken(
    const std::string& token,
    ITokenVerifier& verifier,
    const TokenCheckOptions& opts,
    TokenInfo& outInfo);

//==========================================================================================================
// Per-call TokenInfo context accessors
// Purpose: Give tool handlers access to the TokenInfo of the call they are serving.
//==========================================================================================================
const TokenInfo* CurrentTokenInfo();

// RAII helper: sets the current TokenInfo for the lifetime of this object, then restores the previous one.
class TokenInfoScope {
public:
    explicit TokenInfoScope(const TokenInfo* info);
    ~TokenInfoScope();
private:
    const TokenInfo* prev{nullptr};
};

} // namespace toolrpc::auth
