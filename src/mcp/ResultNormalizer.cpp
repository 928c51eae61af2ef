// SPDX-License-Identifier: Apache-2.0
#include "ResultNormalizer.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <cctype>
#include <regex>

namespace netmcp
{

namespace
{
    constexpr auto VersionToolPrefix = std::string_view { "get_version" };

    /// @brief Version patterns, most specific first.
    auto versionPatterns() -> const std::vector<std::regex>&
    {
        constexpr auto flags = std::regex::ECMAScript | std::regex::icase;
        static auto const patterns = std::vector<std::regex> {
            std::regex(R"(Cisco IOS XE Software,\s*Version\s+([^,\n]+))", flags),
            std::regex(R"(Cisco IOS Software,[^\n]*Version\s+([^,\n]+))", flags),
            std::regex(R"(\bVersion\s+([0-9A-Za-z.()\-]+\d)(?:,\s*RELEASE|\s|$))", flags),
            std::regex(R"(IOS[-\s]?XE Software,[^\n]*Version\s+([^,\n]+))", flags),
        };
        return patterns;
    }

    auto trim(std::string_view text) -> std::string
    {
        auto const isSpace = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
        auto const first = std::ranges::find_if_not(text, isSpace);
        auto const last = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();
        if (first >= last)
            return {};
        return std::string(first, last);
    }

    auto isBlank(const nlohmann::json& value) -> bool
    {
        if (value.is_null())
            return true;
        if (value.is_string())
            return trim(value.get_ref<const std::string&>()).empty();
        return false;
    }

    void mergeInto(nlohmann::json& target, const nlohmann::json& source)
    {
        for (const auto& [key, value]: source.items())
            target[key] = value;
    }

    auto looksLikeVersionResult(std::string_view toolName, const nlohmann::json& data) -> bool
    {
        if (toolName.starts_with(VersionToolPrefix))
            return true;
        auto const it = data.find("parsed");
        return it != data.end() && it->is_object() && it->contains("version");
    }
} // namespace

auto parseFragments(const nlohmann::json& result) -> std::vector<ContentFragment>
{
    auto fragments = std::vector<ContentFragment> {};

    if (!result.is_object())
        return fragments;

    auto const it = result.find("content");
    if (it == result.end() || !it->is_array())
        return fragments;

    for (const auto& block: *it)
    {
        auto const type = json::getStringOr(block, "type", "");
        if (type == "json")
        {
            auto const data = block.find("data");
            if (data != block.end() && data->is_object())
                fragments.emplace_back(StructuredFragment { .data = *data });
        }
        else if (type == "text")
        {
            auto const text = block.find("text");
            if (text != block.end() && text->is_string())
                fragments.emplace_back(TextFragment { .text = text->get<std::string>() });
        }
    }

    return fragments;
}

auto mergeFragments(std::span<const ContentFragment> fragments) -> MergeOutcome
{
    auto outcome = MergeOutcome {};

    for (const auto& fragment: fragments)
    {
        if (auto const* structured = std::get_if<StructuredFragment>(&fragment))
        {
            mergeInto(outcome.merged, structured->data);
            outcome.foundStructured = true;
        }
    }

    if (outcome.foundStructured)
        return outcome;

    for (const auto& fragment: fragments)
    {
        auto const* text = std::get_if<TextFragment>(&fragment);
        if (!text)
            continue;

        auto decoded = json::parse(text->text);
        if (!decoded || !decoded->is_object())
            continue;

        mergeInto(outcome.merged, *decoded);
        outcome.foundText = true;
    }

    return outcome;
}

auto normalizeRaw(const nlohmann::json& result) -> nlohmann::json
{
    auto const fragments = parseFragments(result);
    auto outcome = mergeFragments(fragments);
    if (!outcome.foundAny())
        return nlohmann::json::object();
    return std::move(outcome.merged);
}

auto normalizeForDisplay(std::string_view toolName, const nlohmann::json& result) -> nlohmann::json
{
    auto data = normalizeRaw(result);
    for (auto const key: DisplayKeys)
    {
        if (!data.contains(key))
            data[std::string(key)] = nullptr;
    }

    if (looksLikeVersionResult(toolName, data) && recoverVersion(data))
        log::debug("Recovered version for '{}' from raw output", toolName);

    return data;
}

auto extractVersion(std::string_view rawText) -> std::optional<std::string>
{
    if (rawText.empty())
        return std::nullopt;

    auto const text = std::string(rawText);
    for (const auto& pattern: versionPatterns())
    {
        auto match = std::smatch {};
        if (!std::regex_search(text, match, pattern))
            continue;

        auto version = trim(match[1].str());
        if (!version.empty())
            return version;
    }
    return std::nullopt;
}

auto recoverVersion(nlohmann::json& data) -> bool
{
    if (!data.is_object())
        return false;

    auto const parsed = data.find("parsed");
    if (parsed == data.end() || !parsed->is_object())
        return false;

    auto const current = parsed->find("version");
    if (current != parsed->end() && !isBlank(*current))
        return false;

    auto const raw = json::getStringOr(data, "raw", "");
    auto version = extractVersion(raw);
    if (!version)
        return false;

    (*parsed)["version"] = std::move(*version);
    return true;
}

} // namespace netmcp
