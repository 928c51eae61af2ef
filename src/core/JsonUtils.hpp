// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "Error.hpp"

namespace netmcp::json
{

/// @brief Parses a JSON string, returning a Result.
/// @param input The JSON string to parse.
/// @return The parsed JSON value or a DecodeError.
[[nodiscard]] inline auto parse(std::string_view input) -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::DecodeError, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Serializes a JSON value, replacing invalid UTF-8 with U+FFFD.
///
/// Strings typed by the operator are not guaranteed to be UTF-8, and the
/// plain dump() throws on them.
/// @param value The value to serialize.
/// @param indent Pretty-print indentation; -1 gives a single line.
[[nodiscard]] inline auto dump(const nlohmann::json& value, int indent = -1) -> std::string
{
    return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

/// @brief Extracts an optional string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The string value or the default.
[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_string())
        return obj[keyStr].get<std::string>();
    return std::string(defaultValue);
}

/// @brief Extracts an optional integer field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The integer value or the default.
[[nodiscard]] inline auto getIntOr(const nlohmann::json& obj, std::string_view key, int64_t defaultValue)
    -> int64_t
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_number_integer())
        return obj[keyStr].get<int64_t>();
    return defaultValue;
}

/// @brief Extracts an optional boolean field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The boolean value or the default.
[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool defaultValue)
    -> bool
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_boolean())
        return obj[keyStr].get<bool>();
    return defaultValue;
}

/// @brief Extracts the string elements of an array field, skipping non-strings.
[[nodiscard]] inline auto getStringArray(const nlohmann::json& obj, std::string_view key)
    -> std::vector<std::string>
{
    auto values = std::vector<std::string> {};
    auto keyStr = std::string(key);
    if (!obj.is_object() || !obj.contains(keyStr) || !obj[keyStr].is_array())
        return values;

    for (const auto& item: obj[keyStr])
    {
        if (item.is_string())
            values.push_back(item.get<std::string>());
    }
    return values;
}

/// @brief Extracts the string members of an object field, skipping non-strings.
[[nodiscard]] inline auto getStringMap(const nlohmann::json& obj, std::string_view key)
    -> std::map<std::string, std::string>
{
    auto values = std::map<std::string, std::string> {};
    auto keyStr = std::string(key);
    if (!obj.is_object() || !obj.contains(keyStr) || !obj[keyStr].is_object())
        return values;

    for (const auto& [name, value]: obj[keyStr].items())
    {
        if (value.is_string())
            values[name] = value.get<std::string>();
    }
    return values;
}

} // namespace netmcp::json
