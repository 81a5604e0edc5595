//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Validators.h
// Purpose: Lightweight validators for tool schemas, call arguments and call results
//==========================================================================================================

#pragma once

#include <string>
#include <optional>
#include <unordered_set>
#include <vector>
#include "toolrpc/Protocol.h"

namespace toolrpc {
namespace validation {

//------------------------------ Primitive content checks ------------------------------
inline bool isTextContentItem(const JSONValue& v) {
    const JSONValue* type = v.Find("type");
    if (!type || !type->IsString()) return false;
    if (std::get<std::string>(type->value) != std::string("text")) return false;
    const JSONValue* text = v.Find("text");
    return text && text->IsString();
}

// Any content block needs at least a string "type".
inline bool isContentItem(const JSONValue& v) {
    const JSONValue* type = v.Find("type");
    return type && type->IsString();
}

//------------------------------ Schema well-formedness ------------------------------
inline bool isKnownSchemaType(const std::string& t) {
    static const std::unordered_set<std::string> kTypes = {
        "object", "array", "string", "number", "integer", "boolean", "null"
    };
    return kTypes.contains(t);
}

//==========================================================================================================
// validateToolInputSchema
// Purpose: Structural check of a declared tool input schema.
// Rules:
//   - The schema is an object with "type":"object".
//   - "properties", when present, is an object whose members are objects; a member "type", when present,
//     is a known JSON Schema type name.
//   - "required", when present, is an array of strings each naming a declared property.
// Returns:
//   std::nullopt when well-formed; otherwise a description of the first violation.
//==========================================================================================================
inline std::optional<std::string> validateToolInputSchema(const JSONValue& schema) {
    if (!schema.IsObject()) return std::string("inputSchema must be an object");
    const JSONValue* type = schema.Find("type");
    if (!type || !type->IsString() || std::get<std::string>(type->value) != "object") {
        return std::string("inputSchema.type must be \"object\"");
    }
    std::unordered_set<std::string> declared;
    if (const JSONValue* props = schema.Find("properties")) {
        if (!props->IsObject()) return std::string("inputSchema.properties must be an object");
        for (const auto& [name, prop] : std::get<JSONValue::Object>(props->value)) {
            if (!prop || !prop->IsObject()) {
                return "inputSchema.properties." + name + " must be an object";
            }
            if (const JSONValue* pt = prop->Find("type")) {
                if (!pt->IsString() || !isKnownSchemaType(std::get<std::string>(pt->value))) {
                    return "inputSchema.properties." + name + ".type is not a valid type";
                }
            }
            declared.insert(name);
        }
    }
    if (const JSONValue* req = schema.Find("required")) {
        if (!req->IsArray()) return std::string("inputSchema.required must be an array");
        for (const auto& item : std::get<JSONValue::Array>(req->value)) {
            if (!item || !item->IsString()) return std::string("inputSchema.required entries must be strings");
            const auto& name = std::get<std::string>(item->value);
            if (!declared.contains(name)) {
                return "inputSchema.required names undeclared property " + name;
            }
        }
    }
    return std::nullopt;
}

//==========================================================================================================
// missingRequiredArguments
// Purpose: Lists required schema properties absent from the arguments object (null counts as absent).
//==========================================================================================================
inline std::vector<std::string> missingRequiredArguments(const JSONValue& schema, const JSONValue& arguments) {
    std::vector<std::string> missing;
    const JSONValue* req = schema.Find("required");
    if (!req || !req->IsArray()) return missing;
    for (const auto& item : std::get<JSONValue::Array>(req->value)) {
        if (!item || !item->IsString()) continue;
        const auto& name = std::get<std::string>(item->value);
        if (!arguments.Find(name)) {
            missing.push_back(name);
        }
    }
    return missing;
}

//------------------------------ JSON validators (for client-side raw JSON) ------------------------------
inline bool validateCallToolResultJson(const JSONValue& v) {
    const JSONValue* content = v.Find("content");
    if (!content || !content->IsArray()) return false;
    for (const auto& p : std::get<JSONValue::Array>(content->value)) {
        if (!p) return false;
        if (!isContentItem(*p)) return false;
    }
    if (const JSONValue* e = v.Find("isError")) {
        if (!std::holds_alternative<bool>(e->value)) return false;
    }
    return true;
}

inline bool validateToolsListResultJson(const JSONValue& v) {
    const JSONValue* tools = v.Find("tools");
    if (!tools || !tools->IsArray()) return false;
    for (const auto& p : std::get<JSONValue::Array>(tools->value)) {
        if (!p) return false;
        const JSONValue* name = p->Find("name");
        if (!name || !name->IsString()) return false;
        const JSONValue* schema = p->Find("inputSchema");
        if (!schema || !schema->IsObject()) return false;
    }
    if (const JSONValue* c = v.Find("nextCursor")) {
        if (!c->IsString()) return false;
    }
    return true;
}

} // namespace validation
} // namespace toolrpc
