// SPDX-License-Identifier: Apache-2.0
#include "Prompt.hpp"

#include <netmcp/AddressValidation.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <istream>
#include <ostream>
#include <print>

namespace netmcp
{

namespace
{
    auto trim(std::string text) -> std::string
    {
        auto const isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
        text.erase(text.begin(), std::ranges::find_if_not(text, isSpace));
        text.erase(std::find_if_not(text.rbegin(), text.rend(), isSpace).base(), text.end());
        return text;
    }

    auto toLower(std::string text) -> std::string
    {
        std::ranges::transform(text, text.begin(), [](unsigned char c) { return std::tolower(c); });
        return text;
    }
} // namespace

Prompt::Prompt(std::istream& in, std::ostream& out): _in(in), _out(out)
{
}

auto Prompt::readLine(std::string_view label) -> std::optional<std::string>
{
    std::print(_out, "{}", label);
    _out.flush();

    auto line = std::string {};
    if (!std::getline(_in, line))
        return std::nullopt;
    return trim(std::move(line));
}

auto Prompt::askString(std::string_view message, std::optional<std::string_view> defaultValue, bool allowEmpty)
    -> std::optional<std::string>
{
    auto const hint = defaultValue ? std::format(" [{}]", *defaultValue) : std::string {};
    while (true)
    {
        auto value = readLine(std::format("{}{}: ", message, hint));
        if (!value)
            return std::nullopt;
        if (!value->empty())
            return value;
        if (defaultValue)
            return std::string(*defaultValue);
        if (allowEmpty)
            return std::string {};
        std::println(_out, "Please enter a value.");
    }
}

auto Prompt::askBool(std::string_view message, bool defaultValue) -> std::optional<bool>
{
    auto const hint = defaultValue ? "Y/n" : "y/N";
    while (true)
    {
        auto value = readLine(std::format("{} ({}): ", message, hint));
        if (!value)
            return std::nullopt;

        auto const answer = toLower(*value);
        if (answer.empty())
            return defaultValue;
        if (answer == "y" || answer == "yes" || answer == "true" || answer == "1")
            return true;
        if (answer == "n" || answer == "no" || answer == "false" || answer == "0")
            return false;
        std::println(_out, "Please answer y or n.");
    }
}

auto Prompt::askInt(std::string_view message,
                    std::optional<int> defaultValue,
                    std::optional<int> minValue,
                    std::optional<int> maxValue) -> std::optional<int>
{
    auto const hint = defaultValue ? std::format(" [{}]", *defaultValue) : std::string {};
    while (true)
    {
        auto value = readLine(std::format("{}{}: ", message, hint));
        if (!value)
            return std::nullopt;
        if (value->empty() && defaultValue)
            return *defaultValue;

        auto number = 0;
        auto const* const end = value->data() + value->size();
        auto const [ptr, ec] = std::from_chars(value->data(), end, number);
        if (value->empty() || ec != std::errc {} || ptr != end)
        {
            std::println(_out, "Please enter a number.");
            continue;
        }
        if (minValue && number < *minValue)
        {
            std::println(_out, "Must be >= {}", *minValue);
            continue;
        }
        if (maxValue && number > *maxValue)
        {
            std::println(_out, "Must be <= {}", *maxValue);
            continue;
        }
        return number;
    }
}

auto Prompt::askAddress(std::string_view defaultIp, std::string_view defaultMask) -> std::optional<AddressAnswer>
{
    while (true)
    {
        auto ip = askString("IP (CIDR or dotted)", defaultIp);
        if (!ip)
            return std::nullopt;

        auto parsed = parseAddressInput(*ip);
        if (!parsed)
        {
            std::println(_out, "Warning: {}", parsed.error().message);
            continue;
        }
        if (parsed->isCidr())
            return AddressAnswer { .ip = *ip, .mask = std::nullopt };

        auto const maskDefault = defaultMask.empty() ? std::string_view { "24" } : defaultMask;
        while (true)
        {
            auto mask = askString("Mask (CIDR length like 24 or dotted like 255.255.255.0)", maskDefault);
            if (!mask)
                return std::nullopt;
            if (isValidMask(*mask))
                return AddressAnswer { .ip = *ip, .mask = *mask };
            std::println(_out, "Warning: Invalid mask.");
        }
    }
}

} // namespace netmcp
