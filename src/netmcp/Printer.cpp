// SPDX-License-Identifier: Apache-2.0
#include "Printer.hpp"

#include <core/JsonUtils.hpp>
#include <mcp/ResultNormalizer.hpp>

#include <ostream>
#include <print>

namespace netmcp
{

namespace
{
    auto isSet(const nlohmann::json& data, const char* key) -> bool
    {
        return data.is_object() && data.contains(key) && !data[key].is_null();
    }

    auto truthy(const nlohmann::json& value) -> bool
    {
        if (value.is_boolean())
            return value.get<bool>();
        if (value.is_number())
            return value.get<double>() != 0.0;
        if (value.is_string())
            return !value.get_ref<const std::string&>().empty();
        if (value.is_array() || value.is_object())
            return !value.empty();
        return false;
    }

    auto asText(const nlohmann::json& value) -> std::string
    {
        return value.is_string() ? value.get<std::string>() : json::dump(value);
    }
} // namespace

void printToolResult(std::ostream& out, std::string_view toolName, const nlohmann::json& data)
{
    // Results that bypassed normalizeForDisplay still get their version filled in.
    auto shown = data;
    if (toolName.starts_with("get_version"))
        recoverVersion(shown);

    if (isSet(shown, "device"))
        std::println(out, "\n=== {} [{}] ===", toolName, asText(shown["device"]));
    else
        std::println(out, "\n=== {} ===", toolName);

    if (isSet(shown, "error") && truthy(shown["error"]))
        std::println(out, "Server error: {}", asText(shown["error"]));

    if (isSet(shown, "commands") && truthy(shown["commands"]))
    {
        std::println(out, "Commands to device:");
        if (shown["commands"].is_array())
        {
            for (const auto& command: shown["commands"])
                std::println(out, "  - {}", asText(command));
        }
        else
        {
            std::println(out, "  - {}", asText(shown["commands"]));
        }
    }

    if (isSet(shown, "raw"))
    {
        auto const raw = asText(shown["raw"]);
        std::println(out, "\nRAW output:\n");
        std::println(out, "{}", raw.empty() ? "<no raw output>" : raw);
    }

    if (isSet(shown, "parsed"))
    {
        std::println(out, "\nParsed:");
        std::println(out, "{}", json::dump(shown["parsed"], 2));
    }

    if (isSet(shown, "saved"))
        std::println(out, "\nSaved to NVRAM: {}", truthy(shown["saved"]));

    if (isSet(shown, "dry_run"))
        std::println(out, "Dry run: {}", truthy(shown["dry_run"]));
}

void printAggregate(std::ostream& out, std::string_view combinedRaw, const nlohmann::json& combinedParsed)
{
    std::println(out, "\n=== Aggregated (all devices) ===");
    std::println(out, "\nRAW (combined):\n");
    std::println(out, "{}", combinedRaw);
    std::println(out, "\nParsed (combined):");
    std::println(out, "{}", json::dump(combinedParsed, 2));
}

} // namespace netmcp
