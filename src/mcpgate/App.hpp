// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcpgate/Config.hpp>

#include <memory>

namespace mcpgate
{

/// @brief Wires the gateway together and owns its lifetime.
class App
{
  public:
    /// @brief Constructs the application with a loaded configuration.
    explicit App(GatewayConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Creates all components and binds the HTTP listener.
    /// @return Success, or IoError if the listener cannot be bound.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Serves until SIGINT/SIGTERM or requestStop(), then shuts everything down.
    /// @return Process exit code.
    [[nodiscard]] auto run() -> int;

    /// @brief Asks run() to return. Thread-safe.
    ///
    /// Pending tool calls fail with ShuttingDown and backends are terminated before the
    /// listener stops.
    void requestStop();

    /// @brief Returns the port the listener is bound to, or 0 before initialize().
    [[nodiscard]] auto port() const -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcpgate
