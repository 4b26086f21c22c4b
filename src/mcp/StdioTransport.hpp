// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mcpgate
{

/// @brief Configuration for spawning a backend process.
struct StdioTransportConfig
{
    std::string command;
    std::vector<std::string> args;

    /// @brief Variables added to (or overriding) the gateway's own environment.
    std::map<std::string, std::string> env;

    /// @brief How long close() waits after SIGTERM before sending SIGKILL.
    std::chrono::milliseconds terminateGracePeriod { 2000 };
};

/// @brief Transport that communicates with a backend via its stdin/stdout pipes.
///
/// Spawns a child process; stderr is inherited from the gateway.
class StdioTransport: public Transport
{
  public:
    StdioTransport();
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /// @brief Starts the backend process.
    /// @param config The process configuration.
    /// @return Success or a SpawnError.
    [[nodiscard]] auto start(const StdioTransportConfig& config) -> VoidResult;

    [[nodiscard]] auto send(const nlohmann::json& message, Deadline deadline) -> VoidResult override;
    [[nodiscard]] auto receive() -> Result<nlohmann::json> override;
    void interrupt() override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;

    /// @brief Returns the child's process id, or -1 if no process is running.
    [[nodiscard]] auto processId() const -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcpgate
