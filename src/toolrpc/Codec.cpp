//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Codec.cpp
// Purpose: Envelope decode/encode and JSON-RPC message (de)serialization
//==========================================================================================================

#include <stdexcept>

#include "toolrpc/Codec.h"
#include "logging/Logger.h"

namespace toolrpc {

namespace {

DecodeResult failure(int code, const std::string& message, std::optional<JSONRPCId> id = std::nullopt) {
    DecodeResult r;
    r.error = errors::makeError(code, message);
    r.id = std::move(id);
    return r;
}

// Reads an id member. Returns false when the value is present but not string/integer/null.
bool readId(const JSONValue& v, JSONRPCId& out) {
    if (std::holds_alternative<std::string>(v.value)) {
        out = std::get<std::string>(v.value);
        return true;
    }
    if (std::holds_alternative<int64_t>(v.value)) {
        out = std::get<int64_t>(v.value);
        return true;
    }
    if (v.IsNull()) {
        out = nullptr;
        return true;
    }
    return false;
}

std::shared_ptr<JSONValue> idToValue(const JSONRPCId& id) {
    return std::visit([](const auto& v) -> std::shared_ptr<JSONValue> {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) { return std::make_shared<JSONValue>(v); }
        else if constexpr (std::is_same_v<T, int64_t>) { return std::make_shared<JSONValue>(v); }
        else { return std::make_shared<JSONValue>(nullptr); }
    }, id);
}

JSONValue toValue(const JSONRPCRequest& r) {
    JSONValue::Object obj;
    obj["jsonrpc"] = std::make_shared<JSONValue>(r.jsonrpc);
    obj["id"] = idToValue(r.id);
    obj["method"] = std::make_shared<JSONValue>(r.method);
    if (r.params.has_value()) {
        obj["params"] = std::make_shared<JSONValue>(r.params.value());
    }
    return JSONValue(std::move(obj));
}

JSONValue toValue(const JSONRPCResponse& r) {
    JSONValue::Object obj;
    obj["jsonrpc"] = std::make_shared<JSONValue>(r.jsonrpc);
    obj["id"] = idToValue(r.id);
    if (r.error.has_value()) {
        obj["error"] = std::make_shared<JSONValue>(r.error.value());
    } else {
        obj["result"] = std::make_shared<JSONValue>(r.result.has_value() ? r.result.value() : JSONValue(nullptr));
    }
    return JSONValue(std::move(obj));
}

JSONValue toValue(const JSONRPCNotification& n) {
    JSONValue::Object obj;
    obj["jsonrpc"] = std::make_shared<JSONValue>(n.jsonrpc);
    obj["method"] = std::make_shared<JSONValue>(n.method);
    if (n.params.has_value()) {
        obj["params"] = std::make_shared<JSONValue>(n.params.value());
    }
    return JSONValue(std::move(obj));
}

} // namespace

DecodeResult DecodeEnvelopeValue(const JSONValue& doc) {
    if (!doc.IsObject()) {
        return failure(JSONRPCErrorCodes::InvalidRequest, "Envelope must be a JSON object");
    }

    // Recover the id first so later failures can still be correlated.
    std::optional<JSONRPCId> id;
    const JSONValue* idVal = doc.Find("id");
    if (idVal) {
        JSONRPCId parsed;
        if (!readId(*idVal, parsed)) {
            return failure(JSONRPCErrorCodes::InvalidRequest, "Invalid id: must be string or integer");
        }
        id = std::move(parsed);
    }

    const JSONValue* version = doc.Find("jsonrpc");
    if (!version || !version->IsString() || std::get<std::string>(version->value) != "2.0") {
        return failure(JSONRPCErrorCodes::InvalidRequest, "Missing or invalid jsonrpc version", id);
    }

    const JSONValue* method = doc.Find("method");
    const JSONValue* result = doc.Find("result");
    const JSONValue* error = doc.Find("error");

    if (method) {
        if (result || error) {
            return failure(JSONRPCErrorCodes::InvalidRequest, "Envelope carries method together with result/error", id);
        }
        if (!method->IsString()) {
            return failure(JSONRPCErrorCodes::InvalidRequest, "Method must be a string", id);
        }
        std::optional<JSONValue> params;
        if (const JSONValue* p = doc.Find("params")) {
            if (!p->IsObject() && !p->IsArray()) {
                return failure(JSONRPCErrorCodes::InvalidRequest, "Params must be an object or array", id);
            }
            params = *p;
        }
        DecodeResult r;
        r.id = id;
        if (id.has_value()) {
            if (std::holds_alternative<std::nullptr_t>(id.value())) {
                return failure(JSONRPCErrorCodes::InvalidRequest, "Request id must not be null", id);
            }
            r.envelope = Envelope{JSONRPCRequest(id.value(), std::get<std::string>(method->value), std::move(params))};
        } else {
            r.envelope = Envelope{JSONRPCNotification(std::get<std::string>(method->value), std::move(params))};
        }
        return r;
    }

    if (!result && !error) {
        if (id.has_value()) {
            return failure(JSONRPCErrorCodes::InvalidRequest, "Request is missing method", id);
        }
        return failure(JSONRPCErrorCodes::InvalidRequest, "Envelope has neither method nor result/error");
    }
    if (result && error) {
        return failure(JSONRPCErrorCodes::InvalidRequest, "Response carries both result and error", id);
    }
    if (!id.has_value()) {
        return failure(JSONRPCErrorCodes::InvalidRequest, "Response is missing id");
    }

    JSONRPCResponse resp;
    resp.id = id.value();
    if (error) {
        if (!errors::mcpErrorFromErrorValue(*error).has_value()) {
            return failure(JSONRPCErrorCodes::InvalidRequest, "Error object requires integer code and string message", id);
        }
        resp.error = *error;
    } else {
        if (std::holds_alternative<std::nullptr_t>(id.value())) {
            return failure(JSONRPCErrorCodes::InvalidRequest, "Success response must carry a non-null id", id);
        }
        resp.result = *result;
    }
    DecodeResult r;
    r.id = id;
    r.envelope = Envelope{std::move(resp)};
    return r;
}

DecodeResult DecodeEnvelope(const std::string& bytes) {
    FUNC_SCOPE();
    JSONValue doc;
    try {
        doc = ParseJSON(bytes);
    } catch (const std::exception& e) {
        LOG_DEBUG("DecodeEnvelope: parse error: {}", e.what());
        return failure(JSONRPCErrorCodes::ParseError, std::string("Parse error: ") + e.what());
    }
    return DecodeEnvelopeValue(doc);
}

std::string EncodeEnvelope(const Envelope& envelope) {
    return std::visit([](const auto& m) { return m.Serialize(); }, envelope);
}

std::string EnvelopeMethod(const Envelope& e) {
    if (const auto* req = std::get_if<JSONRPCRequest>(&e)) {
        return req->method;
    }
    if (const auto* note = std::get_if<JSONRPCNotification>(&e)) {
        return note->method;
    }
    return std::string();
}

/////////////////////////////////////////// Message (de)serialization ///////////////////////////////////////////

std::string JSONRPCRequest::Serialize() const {
    return SerializeJSON(toValue(*this));
}

bool JSONRPCRequest::Deserialize(const std::string& json) {
    DecodeResult r = DecodeEnvelope(json);
    if (!r.Ok() || !IsRequest(r.envelope.value())) {
        return false;
    }
    *this = std::get<JSONRPCRequest>(std::move(r.envelope.value()));
    return true;
}

std::string JSONRPCResponse::Serialize() const {
    return SerializeJSON(toValue(*this));
}

bool JSONRPCResponse::Deserialize(const std::string& json) {
    DecodeResult r = DecodeEnvelope(json);
    if (!r.Ok() || !IsResponse(r.envelope.value())) {
        return false;
    }
    *this = std::get<JSONRPCResponse>(std::move(r.envelope.value()));
    return true;
}

std::string JSONRPCNotification::Serialize() const {
    return SerializeJSON(toValue(*this));
}

bool JSONRPCNotification::Deserialize(const std::string& json) {
    DecodeResult r = DecodeEnvelope(json);
    if (!r.Ok() || !IsNotification(r.envelope.value())) {
        return false;
    }
    *this = std::get<JSONRPCNotification>(std::move(r.envelope.value()));
    return true;
}

bool operator==(const JSONRPCRequest& a, const JSONRPCRequest& b) {
    return a.jsonrpc == b.jsonrpc && a.id == b.id && a.method == b.method && a.params == b.params;
}

bool operator==(const JSONRPCResponse& a, const JSONRPCResponse& b) {
    return a.jsonrpc == b.jsonrpc && a.id == b.id && a.result == b.result && a.error == b.error;
}

bool operator==(const JSONRPCNotification& a, const JSONRPCNotification& b) {
    return a.jsonrpc == b.jsonrpc && a.method == b.method && a.params == b.params;
}

JSONValue CreateErrorObject(int code, const std::string& message, const std::optional<JSONValue>& data) {
    JSONValue::Object obj;
    obj["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(code));
    obj["message"] = std::make_shared<JSONValue>(message);
    if (data.has_value()) {
        obj["data"] = std::make_shared<JSONValue>(data.value());
    }
    return JSONValue(std::move(obj));
}

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(const JSONRPCId& id, int code, const std::string& message,
                                                     const std::optional<JSONValue>& data) {
    auto resp = std::make_unique<JSONRPCResponse>();
    resp->id = id;
    resp->error = CreateErrorObject(code, message, data);
    return resp;
}

} // namespace toolrpc
