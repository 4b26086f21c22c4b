// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <core/Log.hpp>
#include <gateway/Router.hpp>
#include <gateway/ServerManager.hpp>
#include <gateway/SessionManager.hpp>
#include <gateway/ToolRegistry.hpp>
#include <http/HttpServer.hpp>

#include <atomic>
#include <chrono>
#include <ctime>
#include <mutex>
#include <thread>

#include <signal.h>

namespace mcpgate
{

namespace
{
    constexpr auto SignalPollInterval = std::chrono::milliseconds(200);

    auto shutdownSignals() -> sigset_t
    {
        sigset_t signals;
        sigemptyset(&signals);
        sigaddset(&signals, SIGINT);
        sigaddset(&signals, SIGTERM);
        return signals;
    }
} // namespace

struct App::Impl
{
    GatewayConfig config;

    std::unique_ptr<ToolRegistry> registry;
    std::unique_ptr<ServerManager> servers;
    std::unique_ptr<SessionManager> sessions;
    std::unique_ptr<Router> router;
    std::unique_ptr<http::HttpServer> listener;

    std::mutex stopMutex; // stop() callers return only once shutdown has completed
    std::atomic<bool> stopRequested = false;
    std::atomic<bool> listenerDone = false;
    std::thread signalWatcher;
    std::thread autoEnabler;

    void watchSignals()
    {
        auto const signals = shutdownSignals();
        auto const interval = timespec {
            .tv_sec = 0,
            .tv_nsec = static_cast<long>(
                std::chrono::duration_cast<std::chrono::nanoseconds>(SignalPollInterval).count()),
        };

        while (!listenerDone)
        {
            auto const received = ::sigtimedwait(&signals, nullptr, &interval);
            if (received == SIGINT || received == SIGTERM)
            {
                log::info("Received signal {}, shutting down", received);
                stop();
            }
            else if (stopRequested && listener && listener->isRunning())
            {
                // A stop requested before the listener started serving.
                listener->stop();
            }
        }
    }

    void stop()
    {
        auto const lock = std::lock_guard { stopMutex };
        stopRequested = true;

        // The listener joins its workers before listen() returns, so requests waiting on a
        // backend must be released with ShuttingDown first.
        if (servers)
            servers->shutdown();
        if (listener)
            listener->stop();
    }
};

App::App(GatewayConfig config): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
}

App::~App()
{
    _impl->stop();
    _impl->listenerDone = true;
    if (_impl->signalWatcher.joinable())
        _impl->signalWatcher.join();
    if (_impl->servers)
        _impl->servers->shutdown();
    if (_impl->autoEnabler.joinable())
        _impl->autoEnabler.join();
}

auto App::initialize() -> VoidResult
{
    // Blocked here so every thread created below inherits the mask and only the watcher receives them.
    auto const signals = shutdownSignals();
    ::pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    auto& config = _impl->config;
    log::info("mcpgate starting with {} configured server(s)", config.servers.size());

    _impl->registry = std::make_unique<ToolRegistry>();
    _impl->servers = std::make_unique<ServerManager>(*_impl->registry, config.serverOptions);
    _impl->servers->configure(config.servers);
    _impl->sessions = std::make_unique<SessionManager>(config.sessionIdleTimeout);
    _impl->router = std::make_unique<Router>(*_impl->servers, *_impl->registry, *_impl->sessions);

    _impl->listener = std::make_unique<http::HttpServer>();
    _impl->router->registerRoutes(*_impl->listener);

    return _impl->listener->bind(config.host, config.port);
}

auto App::run() -> int
{
    _impl->signalWatcher = std::thread([this] { _impl->watchSignals(); });

    auto const& startOrder = _impl->config.startOrder;
    if (!startOrder.empty())
    {
        log::info("Auto-enabling {} server(s) in the background", startOrder.size());
        _impl->autoEnabler = std::thread([this, startOrder] { _impl->servers->enableServers(startOrder); });
    }

    auto exitCode = 0;
    if (!_impl->stopRequested)
    {
        if (auto served = _impl->listener->listen(); !served)
        {
            log::error("HTTP listener failed: {}", served.error());
            exitCode = 1;
        }
    }

    _impl->stop();
    _impl->listenerDone = true;
    if (_impl->signalWatcher.joinable())
        _impl->signalWatcher.join();

    log::info("Shutting down");
    _impl->servers->shutdown();
    if (_impl->autoEnabler.joinable())
        _impl->autoEnabler.join();
    _impl->sessions->closeAll();

    log::info("Shutdown complete");
    return exitCode;
}

void App::requestStop()
{
    _impl->stop();
}

auto App::port() const -> int
{
    return _impl->listener ? _impl->listener->port() : 0;
}

} // namespace mcpgate
