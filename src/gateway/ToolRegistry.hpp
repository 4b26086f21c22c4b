// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace mcpgate
{

/// @brief Immutable view of the aggregate tool catalog.
struct CatalogSnapshot
{
    /// @brief Monotonic version, incremented on every publication.
    uint64_t version = 0;

    /// @brief All tools keyed by namespaced name.
    std::map<std::string, Tool> tools;

    /// @brief Finds a tool by its namespaced name.
    [[nodiscard]] auto find(std::string_view namespacedName) const -> const Tool*;

    /// @brief Finds a tool by owning server and local name.
    [[nodiscard]] auto find(std::string_view serverId, std::string_view localName) const -> const Tool*;

    /// @brief Returns the tools of one server.
    [[nodiscard]] auto toolsOf(std::string_view serverId) const -> std::vector<const Tool*>;

    /// @brief Returns true if the server has a slice in the catalog, even an empty one.
    [[nodiscard]] auto hasServer(std::string_view serverId) const -> bool;

    /// @brief Tool count per server that currently has a slice in the catalog.
    std::map<std::string, size_t, std::less<>> serverToolCounts;
};

/// @brief Maintains the aggregate tool catalog as copy-on-publish snapshots.
///
/// Readers load the current snapshot without taking a lock; writers build a new
/// snapshot under a writer mutex and swap it in, so a reader sees either all or
/// none of a backend's re-fetched tools.
class ToolRegistry
{
  public:
    ToolRegistry();

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    /// @brief Returns the current catalog snapshot.
    [[nodiscard]] auto snapshot() const -> std::shared_ptr<const CatalogSnapshot>;

    /// @brief Replaces one server's slice of the catalog.
    ///
    /// Local names are wrapped as `server_id__local_name`. Duplicate local names keep the
    /// first occurrence.
    /// @param serverId The owning server.
    /// @param tools The tools it reported.
    void publishServerTools(std::string_view serverId, const std::vector<ToolDefinition>& tools);

    /// @brief Removes one server's slice of the catalog.
    void removeServer(std::string_view serverId);

    /// @brief Resolves a namespaced tool name against the current snapshot.
    [[nodiscard]] auto resolve(std::string_view namespacedName) const -> Result<Tool>;

    /// @brief Resolves a (server id, local name) pair against the current snapshot.
    [[nodiscard]] auto resolve(std::string_view serverId, std::string_view localName) const -> Result<Tool>;

  private:
    std::atomic<std::shared_ptr<const CatalogSnapshot>> _current;
    std::mutex _writeMutex;

    void publish(std::shared_ptr<CatalogSnapshot> next);
};

} // namespace mcpgate
