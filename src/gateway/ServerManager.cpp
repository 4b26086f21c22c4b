// SPDX-License-Identifier: Apache-2.0
#include "ServerManager.hpp"

#include <core/Log.hpp>
#include <mcp/SecretResolver.hpp>
#include <mcp/StdioTransport.hpp>

#include <format>

namespace mcpgate
{

auto spawnStdioTransport(const ServerDefinition& definition, const ServerManagerOptions& options)
    -> Result<std::unique_ptr<Transport>>
{
    auto secrets = resolveSecrets(definition.secretCommands, options.secretTimeout);
    if (!secrets)
        return std::unexpected(secrets.error());

    auto config = StdioTransportConfig {
        .command = definition.command,
        .args = definition.args,
        .env = definition.env,
        .terminateGracePeriod = options.terminateGracePeriod,
    };
    for (auto& [key, value]: *secrets)
        config.env[key] = std::move(value);

    auto transport = std::make_unique<StdioTransport>();
    if (auto started = transport->start(config); !started)
        return std::unexpected(started.error());

    return std::unique_ptr<Transport>(std::move(transport));
}

ServerManager::ServerManager(ToolRegistry& registry, ServerManagerOptions options, TransportFactory factory):
    _registry(registry), _options(options), _factory(std::move(factory))
{
    _eventWorker = std::thread([this] { eventLoop(); });
}

ServerManager::~ServerManager()
{
    shutdown();
}

void ServerManager::configure(const std::vector<ServerDefinition>& definitions)
{
    for (const auto& definition: definitions)
    {
        auto entry = std::make_unique<ServerEntry>();
        entry->definition = definition;
        _servers.insert_or_assign(definition.id, std::move(entry));
    }
    log::info("Configured {} server(s)", _servers.size());
}

auto ServerManager::enableServer(std::string_view id) -> VoidResult
{
    if (_shuttingDown)
        return makeError(ErrorCode::ShuttingDown, "Gateway is shutting down");

    auto* entry = findEntry(id);
    if (!entry)
        return makeError(ErrorCode::ServerNotFound, std::format("Server {} not found", id));

    auto const lifecycle = std::lock_guard { entry->lifecycleMutex };

    auto generation = uint64_t { 0 };
    {
        auto const lock = std::lock_guard { entry->stateMutex };
        if (entry->backend && entry->backend->state() != BackendState::Stopped)
            return {};
        entry->enabled = true;
        generation = ++entry->generation;
        entry->backend.reset();
        entry->lastError.reset();
    }

    auto const& definition = entry->definition;
    log::info("[{}] starting: {}", definition.id, definition.command);

    auto const recordFailure = [&](const Error& error) {
        auto const lock = std::lock_guard { entry->stateMutex };
        entry->backend.reset();
        entry->lastError = error.message;
    };

    auto transport = _factory(definition, _options);
    if (!transport)
    {
        log::error("[{}] failed to start: {}", definition.id, transport.error());
        recordFailure(transport.error());
        return std::unexpected(transport.error());
    }

    auto const serverId = definition.id;
    auto backend = std::make_shared<BackendProcess>(
        serverId,
        std::move(*transport),
        BackendEvents {
            .onToolsChanged =
                [this, serverId, generation]() {
                    postEvent(Event { .kind = Event::Kind::ToolsChanged,
                                      .serverId = serverId,
                                      .generation = generation,
                                      .reason = {} });
                },
            .onExited =
                [this, serverId, generation](const Error& reason) {
                    postEvent(Event { .kind = Event::Kind::Exited,
                                      .serverId = serverId,
                                      .generation = generation,
                                      .reason = reason });
                },
        });

    {
        auto const lock = std::lock_guard { entry->stateMutex };
        entry->backend = backend;
    }

    // shutdown() sets the flag before failing pending calls of stored backends.
    if (_shuttingDown)
        backend->failPending(Error { ErrorCode::ShuttingDown, "Gateway is shutting down" });

    auto tools = backend->handshake(_options.startupTimeout);
    if (!tools)
    {
        log::error("[{}] handshake failed: {}", serverId, tools.error());
        backend->stop(tools.error());
        recordFailure(tools.error());
        return std::unexpected(tools.error());
    }

    if (_shuttingDown)
    {
        auto const reason = Error { ErrorCode::ShuttingDown, "Gateway is shutting down" };
        backend->stop(reason);
        recordFailure(reason);
        return std::unexpected(reason);
    }

    _registry.publishServerTools(serverId, *tools);
    backend->markReady();
    log::info("[{}] ready with {} tool(s)", serverId, tools->size());
    return {};
}

auto ServerManager::disableServer(std::string_view id) -> VoidResult
{
    auto* entry = findEntry(id);
    if (!entry)
        return makeError(ErrorCode::ServerNotFound, std::format("Server {} not found", id));

    auto const lifecycle = std::lock_guard { entry->lifecycleMutex };

    auto backend = std::shared_ptr<BackendProcess> {};
    {
        auto const lock = std::lock_guard { entry->stateMutex };
        entry->enabled = false;
        ++entry->generation;
        backend = std::move(entry->backend);
        entry->lastError.reset();
    }

    if (backend)
        backend->stop(Error { ErrorCode::BackendUnavailable, std::format("Server '{}' was disabled", id) });

    _registry.removeServer(id);
    log::info("[{}] disabled", id);
    return {};
}

auto ServerManager::enableServers(const std::vector<std::string>& ids) -> size_t
{
    auto started = std::atomic<size_t> { 0 };
    auto workers = std::vector<std::thread> {};
    workers.reserve(ids.size());

    for (const auto& id: ids)
    {
        workers.emplace_back([this, &started, id] {
            if (auto result = enableServer(id); result)
                ++started;
            else
                log::warning("[{}] not enabled: {}", id, result.error());
        });
    }

    for (auto& worker: workers)
        worker.join();

    log::info("Enabled {}/{} server(s)", started.load(), ids.size());
    return started;
}

auto ServerManager::startToolCall(std::string_view serverId,
                                  std::string_view localName,
                                  const nlohmann::json& arguments) -> Result<CallHandle>
{
    if (_shuttingDown)
        return makeError(ErrorCode::ShuttingDown, "Gateway is shutting down");

    auto* entry = findEntry(serverId);
    if (!entry)
        return makeError(ErrorCode::ServerNotFound, std::format("Server {} not found", serverId));

    auto backend = std::shared_ptr<BackendProcess> {};
    auto lastError = std::optional<std::string> {};
    {
        auto const lock = std::lock_guard { entry->stateMutex };
        backend = entry->backend;
        lastError = entry->lastError;
    }

    if (!backend)
    {
        return makeError(ErrorCode::BackendUnavailable,
                         lastError ? std::format("Server {} is not running: {}", serverId, *lastError)
                                   : std::format("Server {} is not running", serverId));
    }

    return backend->startToolCall(localName, arguments, _options.callTimeout);
}

auto ServerManager::callTool(std::string_view serverId, std::string_view localName, const nlohmann::json& arguments)
    -> Result<nlohmann::json>
{
    return startToolCall(serverId, localName, arguments).and_then([](CallHandle handle) { return handle.wait(); });
}

auto ServerManager::serverIds() const -> std::vector<std::string>
{
    auto ids = std::vector<std::string> {};
    ids.reserve(_servers.size());
    for (const auto& [id, entry]: _servers)
        ids.push_back(id);
    return ids;
}

auto ServerManager::serverInfo(std::string_view id) const -> std::optional<ServerInfo>
{
    auto* entry = findEntry(id);
    if (!entry)
        return std::nullopt;

    auto info = ServerInfo { .id = entry->definition.id };

    auto backend = std::shared_ptr<BackendProcess> {};
    {
        auto const lock = std::lock_guard { entry->stateMutex };
        info.enabled = entry->enabled;
        info.error = entry->lastError;
        backend = entry->backend;
    }

    if (backend)
    {
        info.state = backend->state();
        if (!info.error)
            info.error = backend->lastError();
        auto const capabilities = backend->capabilities();
        info.serverName = capabilities.serverName;
        info.serverVersion = capabilities.serverVersion;
        info.pendingCalls = backend->pendingCount();
    }

    auto const catalog = _registry.snapshot();
    for (const auto* tool: catalog->toolsOf(info.id))
        info.tools.push_back(tool->localName);

    return info;
}

auto ServerManager::allServers() const -> std::vector<ServerInfo>
{
    auto result = std::vector<ServerInfo> {};
    for (const auto& [id, entry]: _servers)
    {
        if (auto info = serverInfo(id))
            result.push_back(std::move(*info));
    }
    return result;
}

auto ServerManager::enabledCount() const -> size_t
{
    auto count = size_t { 0 };
    for (const auto& [id, entry]: _servers)
    {
        auto const lock = std::lock_guard { entry->stateMutex };
        if (entry->enabled)
            ++count;
    }
    return count;
}

auto ServerManager::options() const -> const ServerManagerOptions&
{
    return _options;
}

auto ServerManager::isShuttingDown() const -> bool
{
    return _shuttingDown;
}

void ServerManager::shutdown()
{
    if (_shuttingDown.exchange(true))
        return;

    log::info("Shutting down {} server(s)", _servers.size());
    auto const reason = Error { ErrorCode::ShuttingDown, "Gateway is shutting down" };

    // Wake handshakes and refreshes first so lifecycle locks are released promptly.
    for (auto& [id, entry]: _servers)
    {
        auto backend = std::shared_ptr<BackendProcess> {};
        {
            auto const lock = std::lock_guard { entry->stateMutex };
            backend = entry->backend;
        }
        if (backend)
            backend->failPending(reason);
    }

    for (auto& [id, entry]: _servers)
    {
        auto const lifecycle = std::lock_guard { entry->lifecycleMutex };
        auto backend = std::shared_ptr<BackendProcess> {};
        {
            auto const lock = std::lock_guard { entry->stateMutex };
            backend = std::move(entry->backend);
            ++entry->generation;
        }
        if (backend)
            backend->stop(reason);
        _registry.removeServer(id);
    }

    postEvent(Event { .kind = Event::Kind::Quit, .serverId = {}, .generation = 0, .reason = {} });
    if (_eventWorker.joinable())
        _eventWorker.join();

    // No refresh is scheduled once the event worker is gone.
    for (auto& [id, entry]: _servers)
    {
        auto refresher = std::thread {};
        {
            auto const lock = std::lock_guard { entry->refreshMutex };
            refresher = std::move(entry->refresher);
        }
        if (refresher.joinable())
            refresher.join();
    }
}

auto ServerManager::findEntry(std::string_view id) const -> ServerEntry*
{
    auto const it = _servers.find(id);
    return it != _servers.end() ? it->second.get() : nullptr;
}

void ServerManager::postEvent(Event event)
{
    {
        auto const lock = std::lock_guard { _eventMutex };
        _events.push_back(std::move(event));
    }
    _eventSignal.notify_one();
}

void ServerManager::eventLoop()
{
    while (true)
    {
        auto event = Event {};
        {
            auto lock = std::unique_lock { _eventMutex };
            _eventSignal.wait(lock, [this] { return !_events.empty(); });
            event = std::move(_events.front());
            _events.pop_front();
        }

        if (event.kind == Event::Kind::Quit)
            return;

        auto* entry = findEntry(event.serverId);
        if (!entry)
            continue;

        switch (event.kind)
        {
            case Event::Kind::ToolsChanged: scheduleRefresh(*entry, event.generation); break;
            case Event::Kind::Exited: handleExited(*entry, event.generation, event.reason); break;
            case Event::Kind::Quit: break;
        }
    }
}

void ServerManager::scheduleRefresh(ServerEntry& entry, uint64_t generation)
{
    auto const lock = std::lock_guard { entry.refreshMutex };
    if (entry.refreshRunning)
    {
        // Coalesced: the running refresher fetches once more when it is done.
        entry.refreshQueued = true;
        entry.queuedGeneration = generation;
        return;
    }

    if (entry.refresher.joinable())
        entry.refresher.join();
    entry.refreshRunning = true;
    entry.refresher = std::thread([this, &entry, generation] { runRefreshes(entry, generation); });
}

void ServerManager::runRefreshes(ServerEntry& entry, uint64_t generation)
{
    while (true)
    {
        handleToolsChanged(entry, generation);

        auto const lock = std::lock_guard { entry.refreshMutex };
        if (!entry.refreshQueued || _shuttingDown)
        {
            entry.refreshQueued = false;
            entry.refreshRunning = false;
            return;
        }
        entry.refreshQueued = false;
        generation = entry.queuedGeneration;
    }
}

void ServerManager::handleToolsChanged(ServerEntry& entry, uint64_t generation)
{
    auto const lifecycle = std::lock_guard { entry.lifecycleMutex };
    auto backend = currentBackend(entry, generation);
    if (!backend || backend->state() == BackendState::Stopped || backend->state() == BackendState::Starting)
        return;

    auto const& id = entry.definition.id;
    log::info("[{}] tool list changed, re-fetching", id);

    auto tools = backend->refreshTools(_options.startupTimeout);
    if (tools)
    {
        _registry.publishServerTools(id, *tools);
        backend->markReady();
        return;
    }

    if (tools.error().code == ErrorCode::BackendUnavailable || tools.error().code == ErrorCode::ShuttingDown)
        return;

    log::warning("[{}] tool list refresh failed, backend degraded: {}", id, tools.error());
    backend->markDegraded(tools.error());
    _registry.removeServer(id);
}

void ServerManager::handleExited(ServerEntry& entry, uint64_t generation, const Error& reason)
{
    auto const lifecycle = std::lock_guard { entry.lifecycleMutex };
    auto backend = currentBackend(entry, generation);
    if (!backend)
        return;

    auto const& id = entry.definition.id;
    log::warning("[{}] backend process exited; awaiting restart by the host supervisor", id);

    backend->stop(reason);
    _registry.removeServer(id);

    auto const lock = std::lock_guard { entry.stateMutex };
    if (entry.generation == generation)
    {
        entry.backend.reset();
        entry.lastError = reason.message;
    }
}

auto ServerManager::currentBackend(ServerEntry& entry, uint64_t generation) const -> std::shared_ptr<BackendProcess>
{
    auto const lock = std::lock_guard { entry.stateMutex };
    if (entry.generation != generation)
        return nullptr;
    return entry.backend;
}

} // namespace mcpgate
