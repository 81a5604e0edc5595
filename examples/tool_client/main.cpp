//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Client example: lists tools and calls one over stdio, SSE or streamable HTTP
//==========================================================================================================

#include <chrono>
#include <cstdlib>
#include <exception>
#include <memory>
#include <optional>
#include <string>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolrpc/Client.h"
#include "toolrpc/SSEClientTransport.hpp"
#include "toolrpc/StdioTransport.hpp"
#include "toolrpc/StreamableHTTPClientTransport.hpp"

using namespace toolrpc;

static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    const std::string transportKind = getArgValue(argc, argv, "--transport").value_or("streamable");
    if (transportKind == "stdio") {
        ::setenv("TOOLRPC_STDIO_MODE", "1", 1);
    }
    Logger::setLogLevel(LogLevel::LOG_INFO_LEVEL);

    std::unique_ptr<ITransport> transport;
    try {
        if (transportKind == "stdio") {
            StdioTransportFactory f;
            transport = f.CreateTransport(getArgValue(argc, argv, "--stdiocfg").value_or(""));
        } else if (transportKind == "sse") {
            SSEClientTransportFactory f;
            transport = f.CreateTransport(getArgValue(argc, argv, "--url").value_or("http://127.0.0.1:8080/sse"));
        } else if (transportKind == "streamable") {
            StreamableHTTPClientTransportFactory f;
            transport = f.CreateTransport(getArgValue(argc, argv, "--url").value_or("http://127.0.0.1:8080/mcp"));
        } else {
            LOG_ERROR("Unknown --transport option: {} (expected stdio|sse|streamable)", transportKind);
            return 2;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Bad transport configuration: {}", e.what());
        return 2;
    }

    Client client;
    client.SetErrorHandler([](const std::string& err) { LOG_WARN("Client error: {}", err); });
    client.SetNotificationHandler([](const std::string& method, const std::optional<JSONValue>&) {
        LOG_INFO("Notification: {}", method);
    });

    try {
        client.Connect(std::move(transport)).get();

        for (const auto& t : client.ListTools().get()) {
            LOG_INFO("Tool: {} - {}", t.name, t.description);
        }

        const std::string tool = getArgValue(argc, argv, "--tool").value_or("hello");
        const std::string args = getArgValue(argc, argv, "--args").value_or(
            "{\"name\":\"Client\",\"auth_token\":\"" + GetEnvOrDefault("TOOLRPC_DEMO_TOKEN", "valid_token") + "\"}");
        CallOptions opts;
        opts.timeout = std::chrono::milliseconds(5000);
        CallToolResult result = client.CallTool(tool, ParseJSON(args), opts).get();
        LOG_INFO("{} -> {}{}", tool, ResultText(result), result.isError ? " (tool error)" : "");
    } catch (const errors::McpException& e) {
        LOG_ERROR("Call failed: {} ({})", e.what(), e.code());
        client.Disconnect().get();
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Client failed: {}", e.what());
        client.Disconnect().get();
        return 1;
    }

    client.Disconnect().get();
    return 0;
}
