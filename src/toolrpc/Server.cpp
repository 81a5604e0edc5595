//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.cpp
// Purpose: Tool server implementation
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <charconv>
#include <mutex>
#include <unordered_map>

#include "toolrpc/Server.h"
#include "toolrpc/ToolRegistry.h"
#include "toolrpc/version.h"
#include "toolrpc/validation/Validators.h"
#include "logging/Logger.h"
#include "detail/Futures.h"

namespace toolrpc {

class Server::Impl : public std::enable_shared_from_this<Server::Impl> {
public:
    ToolRegistry registry;
    std::atomic<validation::ValidationMode> validationMode{validation::modeFromEnv()};

    mutable std::mutex handlersMutex;
    std::unordered_map<std::string, MethodHandler> methods;
    std::unordered_map<std::string, NotificationHandler> notifications;
    ErrorHandler errorHandler;

    mutable std::mutex sessionsMutex;
    std::unordered_map<Session*, std::shared_ptr<Session>> sessions;
    std::vector<std::unique_ptr<ITransportAcceptor>> acceptors;
    std::atomic<bool> stopped{false};

    void reportError(const std::string& msg) {
        ErrorHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlersMutex);
            handler = errorHandler;
        }
        if (handler) {
            handler(msg);
        }
    }

    /////////////////////////////////////////// Sessions ///////////////////////////////////////////

    std::future<void> attach(std::shared_ptr<ITransport> transport) {
        auto session = Session::Create(std::move(transport));
        std::weak_ptr<Impl> weak = weak_from_this();

        session->SetRequestHandler([weak](const JSONRPCRequest& req, const RequestContext& ctx) -> JSONRPCResponse {
            auto self = weak.lock();
            if (!self) {
                return *CreateErrorResponse(req.id, JSONRPCErrorCodes::ConnectionClosed, "Server stopped");
            }
            return self->dispatch(req, ctx);
        });
        session->SetNotificationHandler([weak](const JSONRPCNotification& note, Session& s) {
            if (auto self = weak.lock()) {
                self->onNotification(note, s.GetId());
            }
        });
        session->SetErrorHandler([weak](const std::string& msg) {
            if (auto self = weak.lock()) {
                self->reportError(msg);
            }
        });
        session->SetClosedHandler([weak](Session& s) {
            if (auto self = weak.lock()) {
                std::lock_guard<std::mutex> lock(self->sessionsMutex);
                if (self->sessions.erase(&s) > 0) {
                    LOG_INFO("Session {} detached ({} remaining)", s.GetId(), self->sessions.size());
                }
            }
        });

        {
            std::lock_guard<std::mutex> lock(sessionsMutex);
            if (stopped.load()) {
                return detail::failedFuture("Server is stopped");
            }
            sessions.emplace(session.get(), session);
        }
        LOG_INFO("Session {} attached", session->GetId());
        return session->Start();
    }

    std::vector<std::shared_ptr<Session>> snapshotSessions() const {
        std::lock_guard<std::mutex> lock(sessionsMutex);
        std::vector<std::shared_ptr<Session>> out;
        out.reserve(sessions.size());
        for (const auto& [ptr, s] : sessions) {
            out.push_back(s);
        }
        return out;
    }

    void broadcast(const std::string& method, const std::optional<JSONValue>& params) {
        for (const auto& s : snapshotSessions()) {
            auto fut = s->Notify(method, params);
            if (fut.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                try {
                    fut.get();
                } catch (const std::exception& e) {
                    LOG_DEBUG("Broadcast {} to {} not delivered: {}", method, s->GetId(), e.what());
                }
            }
        }
    }

    /////////////////////////////////////////// Dispatch ///////////////////////////////////////////

    JSONRPCResponse dispatch(const JSONRPCRequest& req, const RequestContext& ctx) {
        LOG_DEBUG("Dispatching {} (id {}) on session {}", req.method, IdToString(req.id), ctx.sessionId);
        if (req.method == Methods::ListTools) {
            return handleToolsList(req);
        }
        if (req.method == Methods::CallTool) {
            return handleToolsCall(req, ctx);
        }

        MethodHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlersMutex);
            auto it = methods.find(req.method);
            if (it != methods.end()) {
                handler = it->second;
            }
        }
        if (!handler) {
            LOG_WARN("Method not found: {}", req.method);
            return *CreateErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + req.method);
        }

        try {
            return JSONRPCResponse(req.id, handler(req.params, ctx));
        } catch (const errors::McpException& e) {
            return *errors::makeErrorResponse(req.id, e.error());
        } catch (const std::exception& e) {
            LOG_ERROR("Method handler {} fault: {}", req.method, e.what());
            return *errors::makeErrorResponse(req.id, handlerFault(e.what()));
        } catch (...) {
            LOG_ERROR("Method handler {} fault: unknown exception", req.method);
            return *errors::makeErrorResponse(req.id, handlerFault("unknown exception"));
        }
    }

    static errors::McpError handlerFault(const std::string& what) {
        JSONValue::Object data;
        data["fault"] = std::make_shared<JSONValue>(what);
        return errors::makeError(JSONRPCErrorCodes::InternalError, "Handler fault: " + what, JSONValue{data});
    }

    JSONRPCResponse handleToolsList(const JSONRPCRequest& req) {
        size_t start = 0;
        std::optional<size_t> limit;
        if (req.params.has_value() && req.params->IsObject()) {
            if (const JSONValue* c = req.params->Find("cursor"); c && c->IsString()) {
                const auto& cursor = std::get<std::string>(c->value);
                auto [ptr, ec] = std::from_chars(cursor.data(), cursor.data() + cursor.size(), start);
                if (ec != std::errc() || ptr != cursor.data() + cursor.size()) {
                    return *CreateErrorResponse(req.id, JSONRPCErrorCodes::InvalidParams, "Invalid cursor: " + cursor);
                }
            }
            if (const JSONValue* l = req.params->Find("limit"); l && std::holds_alternative<int64_t>(l->value)) {
                const auto lim = std::get<int64_t>(l->value);
                if (lim > 0) {
                    limit = static_cast<size_t>(lim);
                }
            }
        }

        const auto tools = registry.List();
        const size_t total = tools.size();
        const size_t begin = std::min(start, total);
        const size_t end = limit.has_value() ? std::min(total, begin + limit.value()) : total;

        JSONValue::Array arr;
        for (size_t i = begin; i < end; ++i) {
            arr.push_back(std::make_shared<JSONValue>(ToolToJSON(tools[i])));
        }
        JSONValue::Object obj;
        obj["tools"] = std::make_shared<JSONValue>(arr);
        if (end < total) {
            obj["nextCursor"] = std::make_shared<JSONValue>(std::to_string(end));
        }
        JSONValue result{obj};
        if (validationMode.load() == validation::ValidationMode::Strict && !validation::validateToolsListResultJson(result)) {
            LOG_ERROR("Validation failed (Strict): {} result invalid", Methods::ListTools);
            return *CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, "Invalid tools/list result shape");
        }
        return JSONRPCResponse(req.id, std::move(result));
    }

    JSONRPCResponse handleToolsCall(const JSONRPCRequest& req, const RequestContext& rctx) {
        const JSONValue* nameVal = nullptr;
        if (req.params.has_value() && req.params->IsObject()) {
            nameVal = req.params->Find("name");
        }
        if (!nameVal || !nameVal->IsString() || std::get<std::string>(nameVal->value).empty()) {
            return *CreateErrorResponse(req.id, JSONRPCErrorCodes::InvalidParams, "Invalid params: tool name is required");
        }

        CallToolRequest call;
        call.name = std::get<std::string>(nameVal->value);
        call.arguments = JSONValue{JSONValue::Object{}};
        if (const JSONValue* args = req.params->Find("arguments"); args && !args->IsNull()) {
            if (!args->IsObject()) {
                return *CreateErrorResponse(req.id, JSONRPCErrorCodes::InvalidParams, "arguments are not parseable");
            }
            call.arguments = *args;
        }

        auto lookup = registry.Lookup(call.name);
        if (!lookup.Ok()) {
            LOG_WARN("tools/call for unknown tool {}", call.name);
            return *errors::makeErrorResponse(req.id, lookup.error.value());
        }
        const ToolEntry& entry = lookup.entry.value();

        if (validationMode.load() == validation::ValidationMode::Strict) {
            const auto missing = validation::missingRequiredArguments(entry.tool.inputSchema, call.arguments);
            if (!missing.empty()) {
                std::string list;
                for (const auto& m : missing) {
                    list += list.empty() ? m : ", " + m;
                }
                return *CreateErrorResponse(req.id, JSONRPCErrorCodes::InvalidParams, "Missing required arguments: " + list);
            }
        }

        if (rctx.stop.stop_requested()) {
            return *CreateErrorResponse(req.id, JSONRPCErrorCodes::RequestCancelled, "Request cancelled");
        }

        ToolContext ctx;
        ctx.stop = rctx.stop;
        ctx.requestId = req.id;
        ctx.sessionId = rctx.sessionId;
        ctx.toolName = call.name;

        ToolOutcome outcome;
        try {
            outcome = (*entry.chain)(ctx, call);
        } catch (const errors::McpException& e) {
            LOG_WARN("Tool {} failed with error {}: {}", call.name, e.code(), e.what());
            outcome = ToolOutcome::Fail(e.error());
        } catch (const std::exception& e) {
            LOG_ERROR("Tool {} fault: {}", call.name, e.what());
            outcome = ToolOutcome::Fail(handlerFault(e.what()));
        } catch (...) {
            LOG_ERROR("Tool {} fault: unknown exception", call.name);
            outcome = ToolOutcome::Fail(handlerFault("unknown exception"));
        }

        if (rctx.stop.stop_requested()) {
            LOG_INFO("Tool call {} cancelled (request {})", call.name, IdToString(req.id));
            return *CreateErrorResponse(req.id, JSONRPCErrorCodes::RequestCancelled, "Request cancelled");
        }
        if (outcome.IsError()) {
            return *errors::makeErrorResponse(req.id, outcome.error.value());
        }
        if (!outcome.result.has_value()) {
            return *CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, "Tool produced no result: " + call.name);
        }

        JSONValue result = CallToolResultToJSON(outcome.result.value());
        if (validationMode.load() == validation::ValidationMode::Strict && !validation::validateCallToolResultJson(result)) {
            LOG_ERROR("Validation failed (Strict): {} result invalid for tool {}", Methods::CallTool, call.name);
            return *CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, "Invalid tool result shape");
        }
        return JSONRPCResponse(req.id, std::move(result));
    }

    void onNotification(const JSONRPCNotification& note, const std::string& sessionId) {
        if (note.method == Methods::Cancelled) {
            return;
        }
        NotificationHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlersMutex);
            auto it = notifications.find(note.method);
            if (it != notifications.end()) {
                handler = it->second;
            }
        }
        if (!handler) {
            LOG_WARN("Dropping unknown notification {} from session {}", note.method, sessionId);
            return;
        }
        try {
            handler(note.params, sessionId);
        } catch (const std::exception& e) {
            LOG_ERROR("Notification handler {} fault: {}", note.method, e.what());
            reportError("Notification handler " + note.method + " fault: " + e.what());
        }
    }
};

Server::Server() : pImpl(std::make_shared<Impl>()) {
    FUNC_SCOPE();
    LOG_DEBUG("toolrpc {} server created (validation {})", getVersionString(), validation::toString(pImpl->validationMode.load()));
}

Server::~Server() {
    FUNC_SCOPE();
    Stop().get();
}

std::future<void> Server::Start(std::unique_ptr<ITransport> transport) {
    FUNC_SCOPE();
    if (!transport) {
        return detail::failedFuture("Server::Start requires a transport");
    }
    return pImpl->attach(std::shared_ptr<ITransport>(std::move(transport)));
}

std::future<void> Server::Serve(std::unique_ptr<ITransportAcceptor> acceptor) {
    FUNC_SCOPE();
    if (!acceptor) {
        return detail::failedFuture("Server::Serve requires an acceptor");
    }
    std::weak_ptr<Impl> weak = pImpl;
    acceptor->SetAcceptHandler([weak](std::shared_ptr<ITransport> transport) {
        auto self = weak.lock();
        if (!self) {
            return;
        }
        auto started = self->attach(std::move(transport));
        try {
            started.get();
        } catch (const std::exception& e) {
            LOG_WARN("Accepted session failed to start: {}", e.what());
            self->reportError(e.what());
        }
    });
    acceptor->SetErrorHandler([weak](const std::string& msg) {
        if (auto self = weak.lock()) {
            LOG_WARN("Acceptor error: {}", msg);
            self->reportError(msg);
        }
    });

    ITransportAcceptor* raw = acceptor.get();
    {
        std::lock_guard<std::mutex> lock(pImpl->sessionsMutex);
        if (pImpl->stopped.load()) {
            return detail::failedFuture("Server is stopped");
        }
        pImpl->acceptors.push_back(std::move(acceptor));
    }
    return raw->Start();
}

std::future<void> Server::Stop() {
    FUNC_SCOPE();
    std::vector<std::unique_ptr<ITransportAcceptor>> acceptors;
    std::vector<std::shared_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lock(pImpl->sessionsMutex);
        if (pImpl->stopped.exchange(true)) {
            return detail::readyFuture();
        }
        acceptors.swap(pImpl->acceptors);
        for (auto& [ptr, s] : pImpl->sessions) {
            sessions.push_back(s);
        }
        pImpl->sessions.clear();
    }
    LOG_INFO("Stopping server ({} acceptors, {} sessions)", acceptors.size(), sessions.size());
    for (auto& a : acceptors) {
        try {
            a->Stop().get();
        } catch (const std::exception& e) {
            LOG_WARN("Acceptor stop failed: {}", e.what());
        }
    }
    for (auto& s : sessions) {
        s->Close();
    }
    return detail::readyFuture();
}

bool Server::IsRunning() const {
    std::lock_guard<std::mutex> lock(pImpl->sessionsMutex);
    return !pImpl->stopped.load() && (!pImpl->sessions.empty() || !pImpl->acceptors.empty());
}

void Server::Use(MiddlewareFunc middleware) {
    pImpl->registry.Use(std::move(middleware));
}

void Server::Use(const std::vector<MiddlewareFunc>& middleware) {
    pImpl->registry.Use(middleware);
}

std::optional<errors::McpError> Server::RegisterTool(Tool tool, ToolHandlerFunc handler, std::vector<MiddlewareFunc> perTool) {
    FUNC_SCOPE();
    auto err = pImpl->registry.Register(std::move(tool), std::move(handler), std::move(perTool));
    if (!err.has_value()) {
        pImpl->broadcast(Methods::ToolListChanged, JSONValue{JSONValue::Object{}});
    }
    return err;
}

bool Server::UnregisterTool(const std::string& name) {
    FUNC_SCOPE();
    const bool removed = pImpl->registry.Unregister(name);
    if (removed) {
        pImpl->broadcast(Methods::ToolListChanged, JSONValue{JSONValue::Object{}});
    }
    return removed;
}

std::vector<Tool> Server::ListTools() const {
    return pImpl->registry.List();
}

void Server::RegisterMethod(const std::string& method, MethodHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlersMutex);
    pImpl->methods[method] = std::move(handler);
    LOG_DEBUG("Registered method {}", method);
}

void Server::RegisterNotification(const std::string& method, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlersMutex);
    pImpl->notifications[method] = std::move(handler);
    LOG_DEBUG("Registered notification {}", method);
}

void Server::Broadcast(const std::string& method, std::optional<JSONValue> params) {
    pImpl->broadcast(method, params);
}

void Server::SetValidationMode(validation::ValidationMode mode) {
    pImpl->validationMode.store(mode);
    LOG_INFO("Validation mode set to {}", validation::toString(mode));
}

validation::ValidationMode Server::GetValidationMode() const {
    return pImpl->validationMode.load();
}

void Server::SetErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlersMutex);
    pImpl->errorHandler = std::move(handler);
}

std::size_t Server::SessionCount() const {
    std::lock_guard<std::mutex> lock(pImpl->sessionsMutex);
    return pImpl->sessions.size();
}

JSONRPCResponse Server::Dispatch(const JSONRPCRequest& request, const RequestContext& ctx) {
    return pImpl->dispatch(request, ctx);
}

} // namespace toolrpc
