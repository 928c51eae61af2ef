// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <array>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace netmcp
{

/// @brief A content block of type "json" whose data is already a mapping.
struct StructuredFragment
{
    nlohmann::json data;
};

/// @brief A content block of type "text"; the text may itself be JSON.
struct TextFragment
{
    std::string text;
};

using ContentFragment = std::variant<StructuredFragment, TextFragment>;

/// @brief Outcome of merging content fragments into one mapping.
struct MergeOutcome
{
    nlohmann::json merged = nlohmann::json::object();
    bool foundStructured = false;
    bool foundText = false;

    [[nodiscard]] auto foundAny() const -> bool { return foundStructured || foundText; }
};

/// @brief Keys a display-normalized result always carries.
inline constexpr auto DisplayKeys =
    std::array<std::string_view, 7> { "raw", "parsed", "commands", "saved", "dry_run", "device", "error" };

/// @brief Extracts the content fragments of a tools/call result.
///
/// A missing or non-array `content` member yields no fragments. Blocks of
/// other types, and "json" blocks whose data is not a mapping, are skipped.
[[nodiscard]] auto parseFragments(const nlohmann::json& result) -> std::vector<ContentFragment>;

/// @brief Merges fragments into a single mapping.
///
/// Structured fragments are merged in order, later keys winning. Only when
/// none contributed are text fragments decoded and merged the same way.
[[nodiscard]] auto mergeFragments(std::span<const ContentFragment> fragments) -> MergeOutcome;

/// @brief Returns exactly the merged mapping of a tools/call result (no keys invented).
[[nodiscard]] auto normalizeRaw(const nlohmann::json& result) -> nlohmann::json;

/// @brief Returns the merged mapping with every DisplayKeys entry present
///        (null when missing) and the version recovered for version results.
[[nodiscard]] auto normalizeForDisplay(std::string_view toolName, const nlohmann::json& result)
    -> nlohmann::json;

/// @brief Finds an IOS / IOS XE version token in `show version` output.
/// @return The first match of the ordered pattern list, trimmed, or std::nullopt.
[[nodiscard]] auto extractVersion(std::string_view rawText) -> std::optional<std::string>;

/// @brief Fills parsed.version from raw when it is missing or blank.
/// @return true if a version was recovered.
auto recoverVersion(nlohmann::json& data) -> bool;

} // namespace netmcp
