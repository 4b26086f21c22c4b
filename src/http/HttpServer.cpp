// SPDX-License-Identifier: Apache-2.0
#include "HttpServer.hpp"

#include <core/Log.hpp>

#include <httplib.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <format>

namespace mcpgate::http
{

namespace
{
    auto toLower(std::string_view text) -> std::string
    {
        auto result = std::string(text);
        std::ranges::transform(
            result, result.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    auto convertRequest(Method method, const httplib::Request& req) -> Request
    {
        auto request = Request { .method = method, .path = req.path, .body = req.body };
        for (const auto& [key, value]: req.params)
            request.query.emplace(key, value);
        for (const auto& [key, value]: req.headers)
            request.headers.emplace(toLower(key), value);
        for (const auto& [key, value]: req.path_params)
            request.pathParams.emplace(key, value);
        return request;
    }

    auto wrapHandler(Method method, Handler handler) -> httplib::Server::Handler
    {
        return [method, handler = std::move(handler)](const httplib::Request& req, httplib::Response& res) {
            auto response = Response {};
            try
            {
                response = handler(convertRequest(method, req));
            }
            catch (const std::exception& e)
            {
                log::error("Unhandled exception serving {} {}: {}", req.method, req.path, e.what());
                response = Response {
                    .status = 500,
                    .body = R"({"error":{"kind":"Unknown","message":"Internal server error"}})",
                };
            }

            for (const auto& [key, value]: response.headers)
                res.set_header(key, value);
            res.status = response.status;
            if (!response.body.empty())
                res.set_content(response.body, response.contentType);
        };
    }
} // namespace

auto Request::header(std::string_view name) const -> std::optional<std::string>
{
    if (auto it = headers.find(toLower(name)); it != headers.end())
        return it->second;
    return std::nullopt;
}

auto Request::param(std::string_view name) const -> std::string
{
    if (auto it = pathParams.find(std::string(name)); it != pathParams.end())
        return it->second;
    return {};
}

struct HttpServer::Impl
{
    httplib::Server server;
    std::atomic<int> port = 0;
    std::atomic<bool> bound = false;
};

HttpServer::HttpServer(size_t workerThreads): _impl(std::make_unique<Impl>())
{
    _impl->server.new_task_queue = [workerThreads] { return new httplib::ThreadPool(workerThreads); };
}

HttpServer::~HttpServer()
{
    stop();
}

void HttpServer::addHandler(Method method, const std::string& pattern, Handler handler)
{
    auto wrapped = wrapHandler(method, std::move(handler));
    switch (method)
    {
        case Method::Get: _impl->server.Get(pattern, std::move(wrapped)); break;
        case Method::Post: _impl->server.Post(pattern, std::move(wrapped)); break;
        case Method::Patch: _impl->server.Patch(pattern, std::move(wrapped)); break;
        case Method::Delete: _impl->server.Delete(pattern, std::move(wrapped)); break;
    }
}

auto HttpServer::bind(const std::string& host, int port) -> VoidResult
{
    if (port == 0)
    {
        auto const chosen = _impl->server.bind_to_any_port(host);
        if (chosen < 0)
            return makeError(ErrorCode::IoError, std::format("Failed to bind HTTP server to {}", host));
        _impl->port = chosen;
    }
    else
    {
        if (!_impl->server.bind_to_port(host, port))
            return makeError(ErrorCode::IoError, std::format("Failed to bind HTTP server to {}:{}", host, port));
        _impl->port = port;
    }

    _impl->bound = true;
    log::info("Listening on http://{}:{}", host, _impl->port.load());
    return {};
}

auto HttpServer::listen() -> VoidResult
{
    if (!_impl->bound)
        return makeError(ErrorCode::IoError, "HTTP server is not bound");

    if (!_impl->server.listen_after_bind())
        return makeError(ErrorCode::IoError, "HTTP listener terminated unexpectedly");
    return {};
}

void HttpServer::stop()
{
    if (_impl->server.is_running())
        _impl->server.stop();
}

auto HttpServer::port() const -> int
{
    return _impl->port;
}

auto HttpServer::isRunning() const -> bool
{
    return _impl->server.is_running();
}

} // namespace mcpgate::http
