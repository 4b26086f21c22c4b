// SPDX-License-Identifier: Apache-2.0
// Minimal stdio tool server used by the integration tests.
//
// Usage: fake_tool_server [--initialize-error] [--exit-on-start]
//
// The stall_input tool answers and then stops reading stdin.

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <format>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <unistd.h>

namespace
{

std::mutex outputMutex;
std::mutex toolsMutex;
std::vector<std::string> toolNames { "echo", "sleep", "malformed", "garbage", "list_changed", "crash", "env", "stall_input" };

void writeLine(std::string_view line)
{
    auto const lock = std::lock_guard { outputMutex };
    std::fwrite(line.data(), 1, line.size(), stdout);
    std::fputc('\n', stdout);
    std::fflush(stdout);
}

void writeMessage(const nlohmann::json& message)
{
    writeLine(message.dump());
}

auto textResult(std::string text) -> nlohmann::json
{
    return {
        { "content", nlohmann::json::array({ { { "type", "text" }, { "text", std::move(text) } } }) },
        { "isError", false },
    };
}

void reply(const nlohmann::json& id, nlohmann::json result)
{
    writeMessage({ { "jsonrpc", "2.0" }, { "id", id }, { "result", std::move(result) } });
}

void replyError(const nlohmann::json& id, int code, std::string message)
{
    writeMessage({ { "jsonrpc", "2.0" }, { "id", id }, { "error", { { "code", code }, { "message", message } } } });
}

auto listTools() -> nlohmann::json
{
    auto const lock = std::lock_guard { toolsMutex };
    auto tools = nlohmann::json::array();
    for (const auto& name: toolNames)
    {
        tools.push_back({
            { "name", name },
            { "description", "Fake tool " + name },
            { "inputSchema",
              { { "type", "object" },
                { "properties", { { "text", { { "type", "string" } } }, { "ms", { { "type", "integer" } } } } } } },
        });
    }
    return { { "tools", tools } };
}

void callTool(const nlohmann::json& id, const nlohmann::json& params)
{
    auto const name = params.value("name", std::string {});
    auto const arguments = params.value("arguments", nlohmann::json::object());

    if (name == "echo")
    {
        reply(id, textResult(arguments.value("text", arguments.dump())));
    }
    else if (name == "sleep")
    {
        auto const ms = arguments.value("ms", 100);
        std::this_thread::sleep_for(std::chrono::milliseconds(ms));
        reply(id, textResult(std::format("slept {}", ms)));
    }
    else if (name == "malformed")
    {
        writeMessage({ { "jsonrpc", "2.0" }, { "id", id } });
    }
    else if (name == "garbage")
    {
        writeLine("this is not json {");
        reply(id, textResult("after garbage"));
    }
    else if (name == "list_changed")
    {
        {
            auto const lock = std::lock_guard { toolsMutex };
            toolNames.emplace_back("extra");
        }
        reply(id, textResult("changed"));
        writeMessage({ { "jsonrpc", "2.0" }, { "method", "notifications/tools/list_changed" } });
    }
    else if (name == "crash")
    {
        std::fflush(stdout);
        ::_exit(3);
    }
    else if (name == "env")
    {
        auto const variable = arguments.value("name", std::string {});
        auto const* value = std::getenv(variable.c_str());
        reply(id, textResult(value ? value : ""));
    }
    else
    {
        replyError(id, -32602, "Unknown tool: " + name);
    }
}

} // namespace

int main(int argc, char** argv)
{
    auto initializeError = false;
    for (auto i = 1; i < argc; ++i)
    {
        auto const arg = std::string_view(argv[i]);
        if (arg == "--exit-on-start")
            return 1;
        if (arg == "--initialize-error")
            initializeError = true;
    }

    auto workers = std::vector<std::thread> {};
    auto line = std::string {};
    while (std::getline(std::cin, line))
    {
        if (line.empty())
            continue;

        auto message = nlohmann::json::parse(line, nullptr, false);
        if (message.is_discarded() || !message.is_object())
            continue;

        auto const method = message.value("method", std::string {});
        if (!message.contains("id"))
            continue; // notification

        auto const id = message["id"];
        if (method == "initialize")
        {
            if (initializeError)
            {
                replyError(id, -32603, "initialization refused");
                continue;
            }
            reply(id,
                  { { "protocolVersion", "2025-06-18" },
                    { "serverInfo", { { "name", "fake-tool-server" }, { "version", "1.2.3" } } },
                    { "capabilities", { { "tools", { { "listChanged", true } } } } } });
        }
        else if (method == "tools/list")
        {
            reply(id, listTools());
        }
        else if (method == "tools/call")
        {
            auto params = message.value("params", nlohmann::json::object());
            if (params.value("name", std::string {}) == "stall_input")
            {
                reply(id, textResult("stalled"));
                std::this_thread::sleep_for(std::chrono::minutes(5));
                continue;
            }
            workers.emplace_back([id, params = std::move(params)] { callTool(id, params); });
        }
        else if (method == "ping")
        {
            reply(id, nlohmann::json::object());
        }
        else
        {
            replyError(id, -32601, "Method not found: " + method);
        }
    }

    for (auto& worker: workers)
        worker.join();
    return 0;
}
