//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.cpp
// Purpose: Tool client implementation
//==========================================================================================================

#include <atomic>
#include <mutex>

#include "toolrpc/Client.h"
#include "toolrpc/errors/Errors.h"
#include "toolrpc/validation/Validators.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "detail/Futures.h"

namespace toolrpc {

namespace {

std::chrono::milliseconds defaultTimeoutFromEnv() {
    return std::chrono::milliseconds(GetEnvUintOrDefault("TOOLRPC_CLIENT_TIMEOUT_MS", 30000));
}

template <typename T>
std::future<T> failedWith(const errors::McpError& err) {
    std::promise<T> p;
    p.set_exception(std::make_exception_ptr(errors::McpException(err)));
    return p.get_future();
}

[[noreturn]] void throwInvalidShape(const std::string& what) {
    throw errors::McpException(errors::makeError(JSONRPCErrorCodes::InternalError, what));
}

} // namespace

class Client::Impl {
public:
    mutable std::mutex mutex;
    std::shared_ptr<Session> session;

    NotificationHandler notificationHandler;
    RequestHandler requestHandler;
    ErrorHandler errorHandler;

    std::atomic<validation::ValidationMode> validationMode{validation::modeFromEnv()};
    std::atomic<int64_t> defaultTimeoutMs{defaultTimeoutFromEnv().count()};

    std::shared_ptr<Session> current() const {
        std::lock_guard<std::mutex> lock(mutex);
        return session;
    }

    CallOptions withDefaults(const CallOptions& options) const {
        CallOptions out = options;
        if (!out.timeout.has_value()) {
            const auto ms = defaultTimeoutMs.load();
            if (ms > 0) {
                out.timeout = std::chrono::milliseconds(ms);
            }
        }
        return out;
    }

    std::future<JSONValue> call(const std::string& method, std::optional<JSONValue> params, const CallOptions& options) {
        auto s = current();
        if (!s) {
            return failedWith<JSONValue>(errors::makeError(JSONRPCErrorCodes::ConnectionClosed, "Client is not connected"));
        }
        return s->Call(method, std::move(params), withDefaults(options));
    }

    ToolsListResult parseToolsList(const JSONValue& result) const {
        if (validationMode.load() == validation::ValidationMode::Strict && !validation::validateToolsListResultJson(result)) {
            LOG_ERROR("Validation failed (Strict): {} result invalid (client)", Methods::ListTools);
            throwInvalidShape("Invalid tools/list result shape");
        }
        ToolsListResult out;
        if (const JSONValue* tools = result.Find("tools"); tools && tools->IsArray()) {
            for (const auto& item : std::get<JSONValue::Array>(tools->value)) {
                if (!item) {
                    continue;
                }
                if (auto tool = ToolFromJSON(*item)) {
                    out.tools.push_back(std::move(tool.value()));
                } else {
                    LOG_WARN("Skipping malformed tool descriptor in tools/list result");
                }
            }
        }
        if (const JSONValue* next = result.Find("nextCursor"); next && next->IsString()) {
            out.nextCursor = std::get<std::string>(next->value);
        }
        return out;
    }

    static JSONValue pagingParams(const std::optional<std::string>& cursor, const std::optional<int>& limit) {
        JSONValue::Object params;
        if (cursor.has_value()) {
            params["cursor"] = std::make_shared<JSONValue>(cursor.value());
        }
        if (limit.has_value() && limit.value() > 0) {
            params["limit"] = std::make_shared<JSONValue>(static_cast<int64_t>(limit.value()));
        }
        return JSONValue{params};
    }
};

Client::Client() : pImpl(std::make_unique<Impl>()) {
    FUNC_SCOPE();
}

Client::~Client() {
    FUNC_SCOPE();
    Disconnect().get();
}

std::future<void> Client::Connect(std::unique_ptr<ITransport> transport) {
    FUNC_SCOPE();
    if (!transport) {
        return detail::failedFuture("Client::Connect requires a transport");
    }
    auto session = Session::Create(std::shared_ptr<ITransport>(std::move(transport)));

    auto notificationHandler = pImpl->notificationHandler;
    auto requestHandler = pImpl->requestHandler;
    auto errorHandler = pImpl->errorHandler;

    session->SetNotificationHandler([notificationHandler](const JSONRPCNotification& note, Session&) {
        if (note.method == Methods::Cancelled) {
            return;
        }
        if (!notificationHandler) {
            LOG_DEBUG("Client dropping notification {}", note.method);
            return;
        }
        try {
            notificationHandler(note.method, note.params);
        } catch (const std::exception& e) {
            LOG_ERROR("Client notification handler {} fault: {}", note.method, e.what());
        }
    });

    session->SetRequestHandler([requestHandler](const JSONRPCRequest& req, const RequestContext& ctx) -> JSONRPCResponse {
        if (!requestHandler) {
            return *CreateErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + req.method);
        }
        try {
            return JSONRPCResponse(req.id, requestHandler(req.method, req.params, ctx));
        } catch (const errors::McpException& e) {
            return *errors::makeErrorResponse(req.id, e.error());
        }
    });

    session->SetErrorHandler([errorHandler](const std::string& msg) {
        if (errorHandler) {
            errorHandler(msg);
        }
    });

    std::shared_ptr<Session> previous;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        previous = std::move(pImpl->session);
        pImpl->session = session;
    }
    if (previous) {
        LOG_INFO("Client reconnecting; closing session {}", previous->GetId());
        previous->Close();
    }
    LOG_INFO("Client connecting on session {}", session->GetId());
    return session->Start();
}

std::future<void> Client::Disconnect() {
    FUNC_SCOPE();
    std::shared_ptr<Session> s;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        s = std::move(pImpl->session);
    }
    if (s) {
        LOG_INFO("Client disconnecting session {}", s->GetId());
        s->Close();
    }
    return detail::readyFuture();
}

bool Client::IsConnected() const {
    auto s = pImpl->current();
    return s && s->IsOpen();
}

std::future<std::vector<Tool>> Client::ListTools(const CallOptions& options) {
    FUNC_SCOPE();
    return std::async(std::launch::async, [this, options]() {
        std::vector<Tool> all;
        std::optional<std::string> cursor;
        do {
            ToolsListResult page = ListToolsPaged(cursor, std::nullopt, options).get();
            for (auto& t : page.tools) {
                all.push_back(std::move(t));
            }
            if (page.nextCursor.has_value() && page.nextCursor == cursor) {
                throwInvalidShape("tools/list returned a non-advancing cursor");
            }
            cursor = page.nextCursor;
        } while (cursor.has_value());
        LOG_DEBUG("ListTools returned {} tools", all.size());
        return all;
    });
}

std::future<ToolsListResult> Client::ListToolsPaged(const std::optional<std::string>& cursor,
                                                    const std::optional<int>& limit,
                                                    const CallOptions& options) {
    FUNC_SCOPE();
    auto fut = pImpl->call(Methods::ListTools, Impl::pagingParams(cursor, limit), options);
    return std::async(std::launch::async, [this, fut = std::move(fut)]() mutable {
        return pImpl->parseToolsList(fut.get());
    });
}

std::future<CallToolResult> Client::CallTool(const std::string& name, const JSONValue& arguments, const CallOptions& options) {
    FUNC_SCOPE();
    if (!arguments.IsNull() && !arguments.IsObject()) {
        return failedWith<CallToolResult>(errors::makeError(JSONRPCErrorCodes::InvalidParams, "arguments must be an object"));
    }
    JSONValue::Object params;
    params["name"] = std::make_shared<JSONValue>(name);
    params["arguments"] = std::make_shared<JSONValue>(arguments.IsNull() ? JSONValue{JSONValue::Object{}} : arguments);

    auto fut = pImpl->call(Methods::CallTool, JSONValue{params}, options);
    const bool strict = pImpl->validationMode.load() == validation::ValidationMode::Strict;
    return std::async(std::launch::async, [fut = std::move(fut), name, strict]() mutable {
        JSONValue result = fut.get();
        if (strict && !validation::validateCallToolResultJson(result)) {
            LOG_ERROR("Validation failed (Strict): {} result invalid for tool {}", Methods::CallTool, name);
            throwInvalidShape("Invalid tools/call result shape");
        }
        auto parsed = CallToolResultFromJSON(result);
        if (!parsed.has_value()) {
            throwInvalidShape("Malformed tools/call result for tool " + name);
        }
        return parsed.value();
    });
}

std::future<JSONValue> Client::Call(const std::string& method, std::optional<JSONValue> params, const CallOptions& options) {
    FUNC_SCOPE();
    return pImpl->call(method, std::move(params), options);
}

std::future<void> Client::Notify(const std::string& method, std::optional<JSONValue> params) {
    auto s = pImpl->current();
    if (!s) {
        return detail::failedFuture("Client is not connected");
    }
    return s->Notify(method, std::move(params));
}

void Client::SetNotificationHandler(NotificationHandler handler) { pImpl->notificationHandler = std::move(handler); }
void Client::SetRequestHandler(RequestHandler handler) { pImpl->requestHandler = std::move(handler); }
void Client::SetErrorHandler(ErrorHandler handler) { pImpl->errorHandler = std::move(handler); }

void Client::SetValidationMode(validation::ValidationMode mode) {
    pImpl->validationMode.store(mode);
}

validation::ValidationMode Client::GetValidationMode() const {
    return pImpl->validationMode.load();
}

void Client::SetDefaultTimeout(std::chrono::milliseconds timeout) {
    pImpl->defaultTimeoutMs.store(static_cast<int64_t>(timeout.count()));
}

std::size_t Client::PendingCount() const {
    auto s = pImpl->current();
    return s ? s->PendingCount() : 0;
}

} // namespace toolrpc
