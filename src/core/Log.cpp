// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <mutex>
#include <print>
#include <string>

namespace mcpgate::log
{

namespace
{
    auto globalLevel = std::atomic<Level> { Level::Info };
    auto globalCallback = LogCallback {};
    auto globalMutex = std::mutex {};
} // namespace

void setCallback(LogCallback callback)
{
    auto const lock = std::lock_guard { globalMutex };
    globalCallback = std::move(callback);
}

void setLevel(Level level)
{
    globalLevel = level;
}

auto getLevel() -> Level
{
    return globalLevel;
}

auto levelFromString(std::string_view name) -> std::optional<Level>
{
    auto lowered = std::string(name);
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) { return std::tolower(c); });

    if (lowered == "error")
        return Level::Error;
    if (lowered == "warning" || lowered == "warn")
        return Level::Warning;
    if (lowered == "info")
        return Level::Info;
    if (lowered == "debug")
        return Level::Debug;
    if (lowered == "trace")
        return Level::Trace;
    return std::nullopt;
}

void write(Level level, std::string_view message)
{
    if (level > globalLevel)
        return;

    auto const lock = std::lock_guard { globalMutex };

    if (globalCallback)
    {
        globalCallback(level, message);
        return;
    }

    constexpr auto levelPrefix = [](Level l) -> std::string_view {
        switch (l)
        {
            case Level::Error: return "ERROR";
            case Level::Warning: return "WARN ";
            case Level::Info: return "INFO ";
            case Level::Debug: return "DEBUG";
            case Level::Trace: return "TRACE";
        }
        return "?????";
    };

    std::println(stderr, "[{}] {}", levelPrefix(level), message);
}

} // namespace mcpgate::log
