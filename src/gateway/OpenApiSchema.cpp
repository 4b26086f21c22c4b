// SPDX-License-Identifier: Apache-2.0
#include "OpenApiSchema.hpp"

#include <cctype>
#include <format>
#include <set>

namespace mcpgate
{

namespace
{
    auto errorResponseSchema() -> nlohmann::json
    {
        return nlohmann::json {
            { "type", "object" },
            { "properties",
              { { "error",
                  { { "type", "object" },
                    { "properties",
                      { { "kind", { { "type", "string" } } }, { "message", { { "type", "string" } } } } } } } } },
        };
    }

    auto errorResponse(std::string_view description) -> nlohmann::json
    {
        return nlohmann::json {
            { "description", description },
            { "content", { { "application/json", { { "schema", errorResponseSchema() } } } } },
        };
    }

    auto requestBodySchema(const nlohmann::json& inputSchema) -> nlohmann::json
    {
        auto schema = nlohmann::json { { "type", "object" } };
        if (inputSchema.is_object() && inputSchema.contains("properties") && inputSchema["properties"].is_object())
            schema["properties"] = inputSchema["properties"];
        else
            schema["properties"] = nlohmann::json::object();
        if (inputSchema.is_object() && inputSchema.contains("required") && inputSchema["required"].is_array())
            schema["required"] = inputSchema["required"];
        return schema;
    }

    auto toolOperation(const Tool& tool, const std::string& operationId) -> nlohmann::json
    {
        auto const body = requestBodySchema(tool.inputSchema);
        auto const bodyRequired = body.contains("required") && !body["required"].empty();

        return nlohmann::json {
            { "summary", makeOperationSummary(tool.localName) },
            { "description", tool.description },
            { "operationId", operationId },
            { "tags", nlohmann::json::array({ tool.serverId }) },
            { "requestBody",
              { { "required", bodyRequired }, { "content", { { "application/json", { { "schema", body } } } } } } },
            { "responses",
              {
                  { "200",
                    { { "description", "Tool execution result" },
                      { "content",
                        { { "application/json",
                            { { "schema",
                                { { "type", "object" },
                                  { "properties",
                                    { { "content", { { "type", "array" } } },
                                      { "isError", { { "type", "boolean" } } } } } } } } } } } } },
                  { "404", errorResponse("Tool or server not found") },
                  { "502", errorResponse("Backend returned an error or malformed response") },
                  { "503", errorResponse("Backend unavailable") },
                  { "504", errorResponse("Tool call timed out") },
                  { "500", errorResponse("Tool execution error") },
              } },
        };
    }

    /// Appends `_2`, `_3`, ... to @p id until it is not in @p used, then records it.
    auto uniqueOperationId(std::string id, std::set<std::string>& used) -> std::string
    {
        auto candidate = id;
        for (auto suffix = 2; used.contains(candidate); ++suffix)
            candidate = std::format("{}_{}", id, suffix);
        used.insert(candidate);
        return candidate;
    }
} // namespace

auto makeOperationId(std::string_view serverId, std::string_view localName) -> std::string
{
    auto id = std::format("{}_{}", serverId, localName);
    for (auto& ch: id)
    {
        if (ch == '-')
            ch = '_';
    }
    return id;
}

auto makeOperationSummary(std::string_view localName) -> std::string
{
    auto summary = std::string {};
    summary.reserve(localName.size());

    auto previousIsAlpha = false;
    for (auto ch: localName)
    {
        if (ch == '_')
            ch = ' ';
        auto const isAlpha = std::isalpha(static_cast<unsigned char>(ch)) != 0;
        if (isAlpha)
            ch = static_cast<char>(previousIsAlpha ? std::tolower(static_cast<unsigned char>(ch))
                                                   : std::toupper(static_cast<unsigned char>(ch)));
        summary += ch;
        previousIsAlpha = isAlpha;
    }
    return summary;
}

auto renderOpenApiDocument(const CatalogSnapshot& catalog) -> nlohmann::json
{
    auto paths = nlohmann::json::object();
    paths["/health"] = {
        { "get",
          { { "summary", "Health Check" },
            { "operationId", "health_check" },
            { "tags", nlohmann::json::array({ "Gateway" }) },
            { "responses", { { "200", { { "description", "Gateway health status" } } } } } } },
    };

    auto usedOperationIds = std::set<std::string> { "health_check" };
    for (const auto& [name, tool]: catalog.tools)
    {
        auto const operationId = uniqueOperationId(makeOperationId(tool.serverId, tool.localName), usedOperationIds);
        paths[std::format("/tools/{}/{}", tool.serverId, tool.localName)] = { { "post", toolOperation(tool, operationId) } };
    }

    return nlohmann::json {
        { "openapi", "3.1.0" },
        { "info",
          { { "title", "MCP Gateway - Tool API" },
            { "description",
              "Dynamic API exposing MCP server tools. Each tool is available as a separate endpoint." },
            { "version", GatewayVersion } } },
        { "paths", std::move(paths) },
    };
}

} // namespace mcpgate
