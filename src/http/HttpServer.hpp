// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mcpgate::http
{

enum class Method
{
    Get,
    Post,
    Patch,
    Delete,
};

/// @brief An inbound HTTP request, decoupled from the listener library.
struct Request
{
    Method method = Method::Get;
    std::string path;
    std::string body;
    std::map<std::string, std::string> query;
    std::map<std::string, std::string> headers; ///< keys lower-cased
    std::map<std::string, std::string> pathParams;

    /// @brief Returns a header value by case-insensitive name.
    [[nodiscard]] auto header(std::string_view name) const -> std::optional<std::string>;

    /// @brief Returns a path parameter, or an empty string if absent.
    [[nodiscard]] auto param(std::string_view name) const -> std::string;
};

struct Response
{
    int status = 200;
    std::string contentType = "application/json";
    std::string body;
    std::map<std::string, std::string> headers;
};

using Handler = std::function<Response(const Request&)>;

/// @brief Blocking HTTP listener with a fixed worker pool.
///
/// Handlers run concurrently on the worker threads. Route patterns use `:name`
/// segments for path parameters, e.g. `/tools/:server/:tool`.
class HttpServer
{
  public:
    /// @param workerThreads Number of requests served concurrently.
    explicit HttpServer(size_t workerThreads = 32);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// @brief Registers a handler. Must be called before bind().
    void addHandler(Method method, const std::string& pattern, Handler handler);

    /// @brief Binds the listening socket.
    /// @param host The address to bind to.
    /// @param port The port, or 0 to pick a free one.
    /// @return IoError if the address cannot be bound.
    [[nodiscard]] auto bind(const std::string& host, int port) -> VoidResult;

    /// @brief Serves requests until stop() is called. Requires a successful bind().
    [[nodiscard]] auto listen() -> VoidResult;

    /// @brief Stops the listener; listen() returns once in-flight requests finish. Thread-safe.
    void stop();

    /// @brief Returns the bound port, or 0 before bind().
    [[nodiscard]] auto port() const -> int;

    /// @brief Returns true while listen() is serving.
    [[nodiscard]] auto isRunning() const -> bool;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcpgate::http
