//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.h
// Purpose: Name -> tool descriptor and cached middleware chain
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "toolrpc/Middleware.h"
#include "toolrpc/Protocol.h"
#include "toolrpc/errors/Errors.h"

namespace toolrpc {

// Lookup payload: descriptor copy plus the immutable composed chain.
struct ToolEntry {
    Tool tool;
    ToolChain chain;
};

struct ToolLookup {
    std::optional<ToolEntry> entry;
    std::optional<errors::McpError> error;

    bool Ok() const { return entry.has_value(); }
};

//==========================================================================================================
// ToolRegistry
// Purpose: Owned by one server; concurrent lookups under a shared lock, mutations under an exclusive lock.
// Notes:
//   - Re-registering an existing name is rejected with DuplicateTool (-32005); replace a tool with
//     Unregister followed by Register.
//   - Chains are built at registration (and rebuilt by Use) so calls never compose on the hot path.
//   - Handlers are never invoked by the registry.
//==========================================================================================================
class ToolRegistry {
public:
    ToolRegistry();
    ~ToolRegistry();

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    //==========================================================================================================
    // Register
    // Purpose: Publishes a tool.
    // Args:
    //   tool: Descriptor; a null inputSchema becomes {"type":"object","properties":{}}.
    //   handler: Terminal handler (required).
    //   perTool: Middleware applied inside the global middleware, in order.
    // Returns:
    //   std::nullopt on success; InvalidParams for an empty name, missing handler or malformed schema;
    //   DuplicateTool when the name is taken.
    //==========================================================================================================
    std::optional<errors::McpError> Register(Tool tool, ToolHandlerFunc handler,
                                             std::vector<MiddlewareFunc> perTool = {});

    //==========================================================================================================
    // Unregister
    // Returns:
    //   true when a tool was removed.
    //==========================================================================================================
    bool Unregister(const std::string& name);

    //==========================================================================================================
    // Lookup
    // Returns:
    //   The entry, or ToolNotFound (-32003).
    //==========================================================================================================
    ToolLookup Lookup(const std::string& name) const;

    //==========================================================================================================
    // Use
    // Purpose: Appends global middleware and rebuilds every cached chain. Calls already running keep the
    //          chain they started with.
    //==========================================================================================================
    void Use(MiddlewareFunc middleware);
    void Use(const std::vector<MiddlewareFunc>& middleware);

    // Descriptors sorted by name.
    std::vector<Tool> List() const;

    std::size_t Size() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolrpc
