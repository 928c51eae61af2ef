// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace netmcp
{

/// @brief Abstract interface for a newline-delimited JSON byte-stream pair.
///
/// One thread may block in receiveLine() while another calls send() or close().
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Sends a JSON message to the server as a single line.
    /// @param message The JSON message to send.
    /// @return Success or an error.
    [[nodiscard]] virtual auto send(const nlohmann::json& message) -> VoidResult = 0;

    /// @brief Receives the next non-empty line from the server (blocking).
    ///
    /// The line is returned undecoded, without its terminator.
    /// @return The line, or a TransportError once the stream is closed.
    [[nodiscard]] virtual auto receiveLine() -> Result<std::string> = 0;

    /// @brief Closes the transport connection. Never fails, idempotent.
    virtual void close() = 0;

    /// @brief Returns true if the transport is connected.
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;
};

} // namespace netmcp
