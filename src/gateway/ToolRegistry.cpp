// SPDX-License-Identifier: Apache-2.0
#include "ToolRegistry.hpp"

#include <core/Log.hpp>

#include <format>
#include <set>

namespace mcpgate
{

auto CatalogSnapshot::find(std::string_view namespacedName) const -> const Tool*
{
    auto const it = tools.find(std::string(namespacedName));
    return it != tools.end() ? &it->second : nullptr;
}

auto CatalogSnapshot::find(std::string_view serverId, std::string_view localName) const -> const Tool*
{
    auto const* tool = find(makeNamespacedName(serverId, localName));
    if (tool && tool->serverId == serverId && tool->localName == localName)
        return tool;
    return nullptr;
}

auto CatalogSnapshot::toolsOf(std::string_view serverId) const -> std::vector<const Tool*>
{
    auto result = std::vector<const Tool*> {};
    for (const auto& [name, tool]: tools)
    {
        if (tool.serverId == serverId)
            result.push_back(&tool);
    }
    return result;
}

auto CatalogSnapshot::hasServer(std::string_view serverId) const -> bool
{
    return serverToolCounts.find(serverId) != serverToolCounts.end();
}

ToolRegistry::ToolRegistry(): _current(std::make_shared<const CatalogSnapshot>())
{
}

auto ToolRegistry::snapshot() const -> std::shared_ptr<const CatalogSnapshot>
{
    return _current.load();
}

void ToolRegistry::publishServerTools(std::string_view serverId, const std::vector<ToolDefinition>& tools)
{
    auto const lock = std::lock_guard { _writeMutex };
    auto const current = _current.load();
    auto next = std::make_shared<CatalogSnapshot>(*current);

    std::erase_if(next->tools, [&](const auto& entry) { return entry.second.serverId == serverId; });

    auto seen = std::set<std::string> {};
    for (const auto& definition: tools)
    {
        if (!seen.insert(definition.name).second)
        {
            log::warning("[{}] duplicate tool name '{}' ignored", serverId, definition.name);
            continue;
        }

        auto tool = Tool {
            .serverId = std::string(serverId),
            .localName = definition.name,
            .namespacedName = makeNamespacedName(serverId, definition.name),
            .description = definition.description,
            .inputSchema = definition.inputSchema,
        };
        auto const key = tool.namespacedName;
        next->tools.insert_or_assign(key, std::move(tool));
    }

    next->serverToolCounts.insert_or_assign(std::string(serverId), seen.size());
    log::info("[{}] published {} tool(s)", serverId, seen.size());
    publish(std::move(next));
}

void ToolRegistry::removeServer(std::string_view serverId)
{
    auto const lock = std::lock_guard { _writeMutex };
    auto const current = _current.load();
    if (!current->hasServer(serverId))
        return;

    auto next = std::make_shared<CatalogSnapshot>(*current);
    std::erase_if(next->tools, [&](const auto& entry) { return entry.second.serverId == serverId; });
    if (auto const it = next->serverToolCounts.find(serverId); it != next->serverToolCounts.end())
        next->serverToolCounts.erase(it);

    log::info("[{}] tools withdrawn from catalog", serverId);
    publish(std::move(next));
}

auto ToolRegistry::resolve(std::string_view namespacedName) const -> Result<Tool>
{
    auto const current = snapshot();
    if (auto const* tool = current->find(namespacedName))
        return *tool;
    return makeError(ErrorCode::ToolNotFound, std::format("Tool not found: {}", namespacedName));
}

auto ToolRegistry::resolve(std::string_view serverId, std::string_view localName) const -> Result<Tool>
{
    auto const current = snapshot();
    if (auto const* tool = current->find(serverId, localName))
        return *tool;
    return makeError(ErrorCode::ToolNotFound, std::format("Tool {} not found on server {}", localName, serverId));
}

void ToolRegistry::publish(std::shared_ptr<CatalogSnapshot> next)
{
    next->version = _current.load()->version + 1;
    _current.store(std::move(next));
}

} // namespace mcpgate
