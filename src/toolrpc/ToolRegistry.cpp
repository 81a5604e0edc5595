//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.cpp
// Purpose: Tool registry implementation
//==========================================================================================================

#include <map>
#include <mutex>
#include <shared_mutex>

#include "toolrpc/ToolRegistry.h"
#include "toolrpc/validation/Validators.h"
#include "logging/Logger.h"

namespace toolrpc {

class ToolRegistry::Impl {
public:
    struct Record {
        Tool tool;
        ToolHandlerFunc handler;
        std::vector<MiddlewareFunc> perTool;
        ToolChain chain;
    };

    mutable std::shared_mutex mutex;
    std::map<std::string, Record> tools;
    std::vector<MiddlewareFunc> globals;

    // Caller holds the exclusive lock.
    void rebuild(Record& rec) {
        rec.chain = std::make_shared<const ToolHandlerFunc>(BuildChain(globals, rec.perTool, rec.handler));
    }
};

ToolRegistry::ToolRegistry() : pImpl(std::make_unique<Impl>()) { FUNC_SCOPE(); }
ToolRegistry::~ToolRegistry() { FUNC_SCOPE(); }

std::optional<errors::McpError> ToolRegistry::Register(Tool tool, ToolHandlerFunc handler,
                                                       std::vector<MiddlewareFunc> perTool) {
    FUNC_SCOPE();
    if (tool.name.empty()) {
        return errors::makeError(JSONRPCErrorCodes::InvalidParams, "Tool name must not be empty");
    }
    if (!handler) {
        return errors::makeError(JSONRPCErrorCodes::InvalidParams, "Tool handler is required: " + tool.name);
    }
    if (tool.inputSchema.IsNull()) {
        tool.inputSchema = EmptyObjectSchema();
    }
    if (auto problem = validation::validateToolInputSchema(tool.inputSchema)) {
        LOG_WARN("Rejecting tool {}: {}", tool.name, problem.value());
        return errors::makeError(JSONRPCErrorCodes::InvalidParams, "Invalid inputSchema for tool " + tool.name + ": " + problem.value());
    }

    std::unique_lock<std::shared_mutex> lock(pImpl->mutex);
    if (pImpl->tools.contains(tool.name)) {
        LOG_WARN("Rejecting duplicate tool registration: {}", tool.name);
        return errors::makeError(JSONRPCErrorCodes::DuplicateTool, "Tool already registered: " + tool.name);
    }
    const std::string name = tool.name;
    Impl::Record rec;
    rec.tool = std::move(tool);
    rec.handler = std::move(handler);
    rec.perTool = std::move(perTool);
    pImpl->rebuild(rec);
    pImpl->tools.emplace(name, std::move(rec));
    LOG_INFO("Registered tool: {}", name);
    return std::nullopt;
}

bool ToolRegistry::Unregister(const std::string& name) {
    FUNC_SCOPE();
    std::unique_lock<std::shared_mutex> lock(pImpl->mutex);
    const bool removed = pImpl->tools.erase(name) > 0;
    if (removed) {
        LOG_INFO("Unregistered tool: {}", name);
    }
    return removed;
}

ToolLookup ToolRegistry::Lookup(const std::string& name) const {
    FUNC_SCOPE();
    ToolLookup out;
    std::shared_lock<std::shared_mutex> lock(pImpl->mutex);
    auto it = pImpl->tools.find(name);
    if (it == pImpl->tools.end()) {
        out.error = errors::makeError(JSONRPCErrorCodes::ToolNotFound, "Tool not found: " + name);
        return out;
    }
    out.entry = ToolEntry{it->second.tool, it->second.chain};
    return out;
}

void ToolRegistry::Use(MiddlewareFunc middleware) {
    FUNC_SCOPE();
    Use(std::vector<MiddlewareFunc>{std::move(middleware)});
}

void ToolRegistry::Use(const std::vector<MiddlewareFunc>& middleware) {
    FUNC_SCOPE();
    std::unique_lock<std::shared_mutex> lock(pImpl->mutex);
    for (const auto& mw : middleware) {
        if (mw) {
            pImpl->globals.push_back(mw);
        }
    }
    for (auto& [name, rec] : pImpl->tools) {
        pImpl->rebuild(rec);
    }
    LOG_DEBUG("Global middleware count now {}", pImpl->globals.size());
}

std::vector<Tool> ToolRegistry::List() const {
    FUNC_SCOPE();
    std::shared_lock<std::shared_mutex> lock(pImpl->mutex);
    std::vector<Tool> out;
    out.reserve(pImpl->tools.size());
    for (const auto& [name, rec] : pImpl->tools) {
        out.push_back(rec.tool);
    }
    return out;
}

std::size_t ToolRegistry::Size() const {
    std::shared_lock<std::shared_mutex> lock(pImpl->mutex);
    return pImpl->tools.size();
}

} // namespace toolrpc
