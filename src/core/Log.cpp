// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <atomic>
#include <mutex>
#include <print>

namespace netmcp::log
{

namespace
{
    auto globalLevel = std::atomic<Level> { Level::Info };
    auto globalCallback = LogCallback {};
    auto globalMutex = std::mutex {};
} // namespace

void setCallback(LogCallback callback)
{
    auto const lock = std::lock_guard(globalMutex);
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
    if (name == "error")
        return Level::Error;
    if (name == "warning")
        return Level::Warning;
    if (name == "info")
        return Level::Info;
    if (name == "debug")
        return Level::Debug;
    if (name == "trace")
        return Level::Trace;
    return std::nullopt;
}

void write(Level level, std::string_view message)
{
    if (level > globalLevel)
        return;

    // Reader thread and caller thread both log.
    auto const lock = std::lock_guard(globalMutex);

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

} // namespace netmcp::log
