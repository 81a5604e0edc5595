//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: Tool protocol data structures, JSON mappings and method names
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <string>
#include <vector>
#include <optional>

namespace toolrpc {
//==========================================================================================================
// Tool protocol types and constants
// Purpose: Shared protocol structures and method names.
//==========================================================================================================

///////////////////////////////////////// Tools ///////////////////////////////////////////
// Tool descriptor; immutable once registered
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool parameters
    std::optional<JSONValue> meta; // serialized as _meta in tools/list

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{},
         std::optional<JSONValue> metaValue = std::nullopt)
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)), meta(std::move(metaValue)) {}
};

// tools/call parameters; arguments is the raw, schema-unvalidated payload (object or null)
struct CallToolRequest {
    std::string name;
    JSONValue arguments;
};

struct CallToolResult {
    std::vector<JSONValue> content;  // Ordered content blocks
    bool isError = false;
};

struct ToolsListResult {
    std::vector<Tool> tools;
    std::optional<std::string> nextCursor;
};

///////////////////////////////////////// Content helpers ///////////////////////////////////////////
// {"type":"text","text":...}
JSONValue TextContent(const std::string& text);

// Result with a single text block.
CallToolResult TextResult(const std::string& text, bool isError = false);

// Concatenation of all text blocks (empty when none).
std::string ResultText(const CallToolResult& result);

///////////////////////////////////////// JSON mapping ///////////////////////////////////////////
JSONValue ToolToJSON(const Tool& tool);
std::optional<Tool> ToolFromJSON(const JSONValue& v);

JSONValue CallToolResultToJSON(const CallToolResult& result);
std::optional<CallToolResult> CallToolResultFromJSON(const JSONValue& v);

// Default schema for tools registered without one: {"type":"object","properties":{}}
JSONValue EmptyObjectSchema();

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";

    // Notifications
    constexpr const char* ToolListChanged = "notifications/tools/list_changed";
    constexpr const char* Cancelled = "notifications/cancelled";
}

} // namespace toolrpc
