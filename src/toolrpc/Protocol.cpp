//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: JSON mapping for tool protocol structures
//==========================================================================================================

#include "toolrpc/Protocol.h"

namespace toolrpc {

JSONValue TextContent(const std::string& text) {
    JSONValue::Object obj;
    obj["type"] = std::make_shared<JSONValue>(std::string("text"));
    obj["text"] = std::make_shared<JSONValue>(text);
    return JSONValue{obj};
}

CallToolResult TextResult(const std::string& text, bool isError) {
    CallToolResult r;
    r.content.push_back(TextContent(text));
    r.isError = isError;
    return r;
}

std::string ResultText(const CallToolResult& result) {
    std::string out;
    for (const auto& block : result.content) {
        const JSONValue* t = block.Find("text");
        if (t && t->IsString()) {
            out += std::get<std::string>(t->value);
        }
    }
    return out;
}

JSONValue EmptyObjectSchema() {
    JSONValue::Object schema;
    schema["type"] = std::make_shared<JSONValue>(std::string("object"));
    schema["properties"] = std::make_shared<JSONValue>(JSONValue::Object{});
    return JSONValue{schema};
}

JSONValue ToolToJSON(const Tool& tool) {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(tool.name);
    obj["description"] = std::make_shared<JSONValue>(tool.description);
    obj["inputSchema"] = std::make_shared<JSONValue>(tool.inputSchema.IsNull() ? EmptyObjectSchema() : tool.inputSchema);
    if (tool.meta.has_value()) {
        obj["_meta"] = std::make_shared<JSONValue>(tool.meta.value());
    }
    return JSONValue{obj};
}

std::optional<Tool> ToolFromJSON(const JSONValue& v) {
    const JSONValue* name = v.Find("name");
    if (!name || !name->IsString()) {
        return std::nullopt;
    }
    Tool t;
    t.name = std::get<std::string>(name->value);
    if (const JSONValue* d = v.Find("description"); d && d->IsString()) {
        t.description = std::get<std::string>(d->value);
    }
    if (const JSONValue* s = v.Find("inputSchema")) {
        t.inputSchema = *s;
    }
    if (const JSONValue* m = v.Find("_meta")) {
        t.meta = *m;
    }
    return t;
}

JSONValue CallToolResultToJSON(const CallToolResult& result) {
    JSONValue::Array content;
    for (const auto& block : result.content) {
        content.push_back(std::make_shared<JSONValue>(block));
    }
    JSONValue::Object obj;
    obj["content"] = std::make_shared<JSONValue>(content);
    obj["isError"] = std::make_shared<JSONValue>(result.isError);
    return JSONValue{obj};
}

std::optional<CallToolResult> CallToolResultFromJSON(const JSONValue& v) {
    const JSONValue* content = v.Find("content");
    if (!content || !content->IsArray()) {
        return std::nullopt;
    }
    CallToolResult r;
    for (const auto& block : std::get<JSONValue::Array>(content->value)) {
        r.content.push_back(block ? *block : JSONValue(nullptr));
    }
    if (const JSONValue* e = v.Find("isError"); e && std::holds_alternative<bool>(e->value)) {
        r.isError = std::get<bool>(e->value);
    }
    return r;
}

} // namespace toolrpc
