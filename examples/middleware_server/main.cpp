//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Tool server example with the stock middleware chain over stdio, SSE or streamable HTTP
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <future>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolrpc/SSEServer.hpp"
#include "toolrpc/Server.h"
#include "toolrpc/StdioTransport.hpp"
#include "toolrpc/StreamableHTTPServer.hpp"
#include "toolrpc/middleware/Builtin.h"

using namespace toolrpc;

namespace {

volatile std::sig_atomic_t gInterrupted = 0;

void onSignal(int) {
    gInterrupted = 1;
}

//==========================================================================================================
// Parses simple key=value style command-line options.
// Args:
//   argc: Argument count
//   argv: Argument values
//   key: Option name including leading dashes (e.g., "--transport")
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == nullptr) {
            continue;
        }
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

JSONValue helloSchema() {
    JSONValue::Object stringType;
    stringType["type"] = std::make_shared<JSONValue>(std::string("string"));
    JSONValue::Object props;
    props["name"] = std::make_shared<JSONValue>(JSONValue{stringType});
    props["auth_token"] = std::make_shared<JSONValue>(JSONValue{stringType});
    JSONValue::Array required;
    required.push_back(std::make_shared<JSONValue>(std::string("auth_token")));
    JSONValue::Object schema;
    schema["type"] = std::make_shared<JSONValue>(std::string("object"));
    schema["properties"] = std::make_shared<JSONValue>(JSONValue{props});
    schema["required"] = std::make_shared<JSONValue>(JSONValue{required});
    return JSONValue{schema};
}

} // namespace

int main(int argc, char** argv) {
    const std::string transportKind = getArgValue(argc, argv, "--transport").value_or("stdio");
    if (transportKind == "stdio") {
        // stdout carries frames; keep console logs on stderr.
        ::setenv("TOOLRPC_STDIO_MODE", "1", 1);
    }
    Logger::setLogLevel(Logger::toLogLevel(Logger::levelFromString(GetEnvOrDefault("TOOLRPC_LOG_LEVEL", "INFO"))));
    FUNC_SCOPE();

    Server server;
    auto verifier = std::make_shared<auth::StaticTokenVerifier>();
    verifier->AddToken(GetEnvOrDefault("TOOLRPC_DEMO_TOKEN", "valid_token"), {"tools:call"});
    auto metrics = std::make_shared<middleware::ToolMetrics>();
    server.Use({middleware::Recovery(), middleware::Logging()});

    server.RegisterTool(Tool{"hello", "Greets the caller (requires auth_token)", helloSchema()},
        [](ToolContext&, CallToolRequest& req) {
            std::string name = "World";
            if (const JSONValue* n = req.arguments.Find("name"); n && n->IsString()) {
                name = std::get<std::string>(n->value);
            }
            return ToolOutcome::Ok(TextResult("Hello, " + name + "! Tool executed successfully."));
        },
        {middleware::Auth(verifier), middleware::Metrics(metrics)});

    auto counter = std::make_shared<std::atomic<int64_t>>(0);
    server.RegisterTool(Tool{"counter", "Increments a shared counter"},
        [counter](ToolContext&, CallToolRequest&) {
            const int64_t value = ++(*counter);
            return ToolOutcome::Ok(TextResult("Counter value: " + std::to_string(value)));
        },
        {middleware::RateLimit(middleware::RateLimitOptions{20.0, 5.0}), middleware::Metrics(metrics)});

    server.SetErrorHandler([](const std::string& err) {
        LOG_WARN("Server error: {}", err);
    });

    std::future<void> started;
    if (transportKind == "stdio") {
        StdioTransportFactory factory;
        const std::string cfg = getArgValue(argc, argv, "--stdiocfg").value_or("");
        started = server.Start(factory.CreateTransport(cfg));
    } else if (transportKind == "sse") {
        SSEServerFactory factory;
        const std::string listen = getArgValue(argc, argv, "--listen").value_or("http://127.0.0.1:8080");
        started = server.Serve(factory.CreateTransportAcceptor(listen));
    } else if (transportKind == "streamable") {
        StreamableHTTPServerFactory factory;
        const std::string listen = getArgValue(argc, argv, "--listen").value_or("http://127.0.0.1:8080/mcp?mode=stateful");
        started = server.Serve(factory.CreateTransportAcceptor(listen));
    } else {
        LOG_ERROR("Unknown --transport option: {} (expected stdio|sse|streamable)", transportKind);
        return 2;
    }

    try {
        started.get();
    } catch (const std::exception& e) {
        LOG_ERROR("Server failed to start: {}", e.what());
        return 1;
    }
    LOG_INFO("Server running with transport={}", transportKind);

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
    while (server.IsRunning() && !gInterrupted) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    for (const char* tool : {"hello", "counter"}) {
        if (auto s = metrics->Snapshot(tool)) {
            LOG_INFO("Tool {}: {} ok, {} failed", tool, s->success, s->error);
        }
    }
    server.Stop().get();
    return 0;
}
