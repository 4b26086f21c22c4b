// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <gateway/ToolRegistry.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace mcpgate
{

/// @brief Version reported by the gateway in its schema and to streaming clients.
constexpr auto GatewayVersion = std::string_view { "0.1.0" };

/// @brief Builds the OpenAPI operationId of a tool: `server_tool`, with '-' replaced by '_'.
[[nodiscard]] auto makeOperationId(std::string_view serverId, std::string_view localName) -> std::string;

/// @brief Builds a human readable summary from a tool name, e.g. "git_status" -> "Git Status".
[[nodiscard]] auto makeOperationSummary(std::string_view localName) -> std::string;

/// @brief Renders an OpenAPI 3.1 document with one POST operation per catalog entry.
///
/// Each tool is exposed at `/tools/{server_id}/{local_name}`; its request body schema is
/// derived from the tool's input schema. A `/health` operation is always present.
/// Operation ids are unique within the document; a later tool whose id collides gets a
/// numeric suffix (`a_b_x_2`).
[[nodiscard]] auto renderOpenApiDocument(const CatalogSnapshot& catalog) -> nlohmann::json;

} // namespace mcpgate
