// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <format>
#include <functional>
#include <optional>
#include <string_view>

namespace netmcp::log
{

/// @brief Severity of a diagnostic, most severe first.
///
/// Info is the default. `-v` on the command line raises it to Debug. Trace
/// adds every JSON-RPC line written to or read from the server.
enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

/// @brief Receiver for formatted messages, without the level prefix.
using LogCallback = std::function<void(Level level, std::string_view message)>;

/// @brief Redirects messages away from stderr, e.g. into a test's buffer.
///
/// The callback runs under the logger's mutex, on whichever thread logged
/// (often the MCP reader thread). It must not log itself. An empty callback
/// restores stderr output.
void setCallback(LogCallback callback);

/// @brief Sets the most verbose level that is still emitted.
void setLevel(Level level);

[[nodiscard]] auto getLevel() -> Level;

/// @brief Maps the `logLevel` config value to a Level.
/// @return std::nullopt unless the name is exactly one of
///         error, warning, info, debug or trace.
[[nodiscard]] auto levelFromString(std::string_view name) -> std::optional<Level>;

/// @brief Emits one message if the level passes the filter.
///
/// Writes from the operator thread and the MCP reader thread are serialized,
/// so lines never interleave on stderr.
void write(Level level, std::string_view message);

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Also the default destination of server WARNING/ERROR lines.
template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Skips formatting entirely unless Debug is enabled.
template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Debug)
        write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Wire-level logging; formatting is skipped unless Trace is enabled.
template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Trace)
        write(Level::Trace, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace netmcp::log
