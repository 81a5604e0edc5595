//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Codec.h
// Purpose: Envelope codec: strict JSON-RPC 2.0 decode with validation, compact encode
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "toolrpc/JSONRPCTypes.h"
#include "toolrpc/errors/Errors.h"

namespace toolrpc {

//==========================================================================================================
// DecodeResult
// Purpose: Outcome of DecodeEnvelope.
// Fields:
//   envelope: Set on success.
//   error: Set on failure (ParseError for malformed JSON, InvalidRequest for shape violations).
//   id: The id recovered from the input when one was readable, even on failure; lets the caller answer
//       a malformed request with a correlated error response.
//==========================================================================================================
struct DecodeResult {
    std::optional<Envelope> envelope;
    std::optional<errors::McpError> error;
    std::optional<JSONRPCId> id;

    bool Ok() const { return envelope.has_value(); }
};

//==========================================================================================================
// DecodeEnvelope
// Purpose: Decodes one JSON-RPC message. Pure and stateless.
// Args:
//   bytes: A single JSON document.
// Returns:
//   DecodeResult with either the envelope or the reason for rejection. Rejected inputs include a missing
//   or wrong "jsonrpc" tag, a response carrying both (or neither) result and error, and a message without
//   method/result/error.
//==========================================================================================================
DecodeResult DecodeEnvelope(const std::string& bytes);

//==========================================================================================================
// DecodeEnvelopeValue
// Purpose: Same as DecodeEnvelope for an already-parsed JSON value.
//==========================================================================================================
DecodeResult DecodeEnvelopeValue(const JSONValue& doc);

//==========================================================================================================
// EncodeEnvelope
// Purpose: Serializes an envelope to compact JSON (no trailing newline).
//==========================================================================================================
std::string EncodeEnvelope(const Envelope& envelope);

//==========================================================================================================
// Envelope helpers
//==========================================================================================================
inline bool IsRequest(const Envelope& e) { return std::holds_alternative<JSONRPCRequest>(e); }
inline bool IsResponse(const Envelope& e) { return std::holds_alternative<JSONRPCResponse>(e); }
inline bool IsNotification(const Envelope& e) { return std::holds_alternative<JSONRPCNotification>(e); }

// Method of a request/notification, or empty for responses.
std::string EnvelopeMethod(const Envelope& e);

} // namespace toolrpc
