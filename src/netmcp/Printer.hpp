// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <iosfwd>
#include <string_view>

namespace netmcp
{

/// @brief Renders a display-normalized tool result.
void printToolResult(std::ostream& out, std::string_view toolName, const nlohmann::json& data);

/// @brief Renders the combined output of a tool run across all devices.
/// @param combinedRaw Concatenated `=== device ===` blocks.
/// @param combinedParsed Array of {device, parsed} or {device, error} entries.
void printAggregate(std::ostream& out, std::string_view combinedRaw, const nlohmann::json& combinedParsed);

} // namespace netmcp
