// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <gateway/BackendProcess.hpp>
#include <gateway/ToolRegistry.hpp>
#include <mcp/Transport.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace mcpgate
{

/// @brief Timeouts governing backend startup and calls.
struct ServerManagerOptions
{
    std::chrono::milliseconds callTimeout { 60'000 };
    std::chrono::milliseconds startupTimeout { 30'000 };
    std::chrono::milliseconds secretTimeout { 10'000 };
    std::chrono::milliseconds terminateGracePeriod { 2'000 };
};

/// @brief Creates a connected transport for a server definition.
using TransportFactory =
    std::function<Result<std::unique_ptr<Transport>>(const ServerDefinition&, const ServerManagerOptions&)>;

/// @brief Default factory: resolves secrets and spawns the server's command over stdio.
/// @return A running StdioTransport, or SecretResolutionError / SpawnError.
[[nodiscard]] auto spawnStdioTransport(const ServerDefinition& definition, const ServerManagerOptions& options)
    -> Result<std::unique_ptr<Transport>>;

/// @brief Point-in-time information about one configured server.
struct ServerInfo
{
    std::string id;
    bool enabled = false;
    BackendState state = BackendState::Stopped;
    std::vector<std::string> tools;
    std::optional<std::string> error;
    std::string serverName;
    std::string serverVersion;
    size_t pendingCalls = 0;
};

/// @brief Supervises one BackendProcess per enabled server and routes tool calls to them.
///
/// The set of configured servers is fixed by configure(). Lifecycle operations on one
/// server are serialized; calls to different servers never contend. Events raised by
/// backend reader threads (exit, tool list changes) are handled by a worker thread.
/// Tool list re-fetches run on a per-server refresh thread, so a backend that is slow to
/// answer never delays exit handling for the others.
class ServerManager
{
  public:
    /// @brief Constructs a manager that publishes tools into the given registry.
    /// @param registry The tool registry; must outlive the manager.
    /// @param options Timeouts.
    /// @param factory Transport factory; the default spawns real processes.
    ServerManager(ToolRegistry& registry, ServerManagerOptions options, TransportFactory factory = spawnStdioTransport);
    ~ServerManager();

    ServerManager(const ServerManager&) = delete;
    ServerManager& operator=(const ServerManager&) = delete;

    /// @brief Sets the configured servers. Must be called once, before any other operation.
    void configure(const std::vector<ServerDefinition>& definitions);

    /// @brief Starts a server and waits for its handshake.
    ///
    /// On success the server's tools are in the catalog and the backend is ready.
    /// @return Success, ServerNotFound, SecretResolutionError, SpawnError, or the handshake error.
    [[nodiscard]] auto enableServer(std::string_view id) -> VoidResult;

    /// @brief Stops a server, withdraws its tools and fails its pending calls.
    [[nodiscard]] auto disableServer(std::string_view id) -> VoidResult;

    /// @brief Enables the given servers concurrently and waits for all of them.
    ///
    /// Failures are logged per server and do not affect the others.
    /// @return The number of servers that became ready.
    auto enableServers(const std::vector<std::string>& ids) -> size_t;

    /// @brief Starts a tool call on the server that owns it.
    /// @param serverId The server id.
    /// @param localName The tool's backend-local name.
    /// @param arguments The tool arguments.
    /// @return A handle, or ServerNotFound / BackendUnavailable / ShuttingDown.
    [[nodiscard]] auto startToolCall(std::string_view serverId,
                                     std::string_view localName,
                                     const nlohmann::json& arguments) -> Result<CallHandle>;

    /// @brief Calls a tool and waits for the backend's raw result.
    [[nodiscard]] auto callTool(std::string_view serverId,
                                std::string_view localName,
                                const nlohmann::json& arguments) -> Result<nlohmann::json>;

    [[nodiscard]] auto serverIds() const -> std::vector<std::string>;
    [[nodiscard]] auto serverInfo(std::string_view id) const -> std::optional<ServerInfo>;
    [[nodiscard]] auto allServers() const -> std::vector<ServerInfo>;

    /// @brief Returns the number of servers currently enabled.
    [[nodiscard]] auto enabledCount() const -> size_t;

    [[nodiscard]] auto options() const -> const ServerManagerOptions&;
    [[nodiscard]] auto isShuttingDown() const -> bool;

    /// @brief Fails all pending calls with ShuttingDown and stops every backend.
    void shutdown();

  private:
    struct ServerEntry
    {
        ServerDefinition definition;

        std::mutex lifecycleMutex; // serializes enable/disable/event handling

        mutable std::mutex stateMutex; // guards the fields below
        bool enabled = false;
        uint64_t generation = 0;
        std::shared_ptr<BackendProcess> backend;
        std::optional<std::string> lastError;

        std::mutex refreshMutex; // guards the fields below
        std::thread refresher;
        bool refreshRunning = false;
        bool refreshQueued = false;
        uint64_t queuedGeneration = 0;
    };

    struct Event
    {
        enum class Kind
        {
            ToolsChanged,
            Exited,
            Quit,
        };

        Kind kind = Kind::Quit;
        std::string serverId;
        uint64_t generation = 0;
        Error reason;
    };

    ToolRegistry& _registry;
    ServerManagerOptions _options;
    TransportFactory _factory;
    std::map<std::string, std::unique_ptr<ServerEntry>, std::less<>> _servers;
    std::atomic<bool> _shuttingDown = false;

    std::mutex _eventMutex;
    std::condition_variable _eventSignal;
    std::deque<Event> _events;
    std::thread _eventWorker;

    [[nodiscard]] auto findEntry(std::string_view id) const -> ServerEntry*;
    void postEvent(Event event);
    void eventLoop();
    void scheduleRefresh(ServerEntry& entry, uint64_t generation);
    void runRefreshes(ServerEntry& entry, uint64_t generation);
    void handleToolsChanged(ServerEntry& entry, uint64_t generation);
    void handleExited(ServerEntry& entry, uint64_t generation, const Error& reason);
    [[nodiscard]] auto currentBackend(ServerEntry& entry, uint64_t generation) const
        -> std::shared_ptr<BackendProcess>;
};

} // namespace mcpgate
