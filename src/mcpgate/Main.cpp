// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <mcpgate/App.hpp>
#include <mcpgate/Config.hpp>

#include <CLI/CLI.hpp>

#include <chrono>
#include <cstdlib>
#include <format>

int main(int argc, char** argv)
{
    auto config = mcpgate::GatewayConfig {};
    if (auto env = mcpgate::applyEnvironment(config, [](const char* name) { return std::getenv(name); }); !env)
    {
        mcpgate::log::error("Invalid environment: {}", env.error().message);
        return 1;
    }

    auto app = CLI::App { "mcpgate - HTTP gateway for stdio MCP tool servers" };

    auto autoEnable = std::string {};
    auto logLevel = std::string {};
    auto verbose = false;
    auto callTimeout = static_cast<int>(config.serverOptions.callTimeout.count() / 1000);
    auto startupTimeout = static_cast<int>(config.serverOptions.startupTimeout.count() / 1000);
    auto secretTimeout = static_cast<int>(config.serverOptions.secretTimeout.count() / 1000);
    auto sessionIdleTimeout =
        static_cast<int>(std::chrono::duration_cast<std::chrono::seconds>(config.sessionIdleTimeout).count());

    app.add_option("-c,--config", config.configPath, "Path to the server definition file");
    app.add_option("--host", config.host, "Address to listen on");
    app.add_option("-p,--port", config.port, "Port to listen on")->check(CLI::Range(0, 65535));
    app.add_option("--auto-enable", autoEnable, "Servers to start at launch: comma separated ids or '*'");
    app.add_option("--log-level", logLevel, "Log level (error|warning|info|debug|trace)");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_option("--call-timeout", callTimeout, "Tool call timeout in seconds")->check(CLI::PositiveNumber);
    app.add_option("--startup-timeout", startupTimeout, "Backend handshake timeout in seconds")
        ->check(CLI::PositiveNumber);
    app.add_option("--secret-timeout", secretTimeout, "Secret command timeout in seconds")
        ->check(CLI::PositiveNumber);
    app.add_option("--session-idle-timeout", sessionIdleTimeout, "Streaming session idle expiry in seconds")
        ->check(CLI::PositiveNumber);

    CLI11_PARSE(app, argc, argv);

    if (!logLevel.empty())
    {
        auto const level = mcpgate::log::levelFromString(logLevel);
        if (!level)
        {
            mcpgate::log::error("Unknown log level '{}'", logLevel);
            return 1;
        }
        config.logLevel = *level;
    }
    if (verbose)
        config.logLevel = mcpgate::log::Level::Debug;
    mcpgate::log::setLevel(config.logLevel);

    if (!autoEnable.empty())
        config.autoEnable = mcpgate::parseAutoEnableList(autoEnable);

    config.serverOptions.callTimeout = std::chrono::seconds(callTimeout);
    config.serverOptions.startupTimeout = std::chrono::seconds(startupTimeout);
    config.serverOptions.secretTimeout = std::chrono::seconds(secretTimeout);
    config.sessionIdleTimeout = std::chrono::seconds(sessionIdleTimeout);

    auto const pathIsExplicit = !config.configPath.empty();
    if (auto loaded = mcpgate::loadServers(config, pathIsExplicit); !loaded)
    {
        mcpgate::log::error("Failed to load config: {}", loaded.error().message);
        return 1;
    }

    auto application = mcpgate::App(std::move(config));
    if (auto initResult = application.initialize(); !initResult)
    {
        mcpgate::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return application.run();
}
