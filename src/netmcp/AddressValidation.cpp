// SPDX-License-Identifier: Apache-2.0
#include "AddressValidation.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>

namespace netmcp
{

namespace
{
    auto parseNumber(std::string_view text, int maxValue) -> std::optional<int>
    {
        if (text.empty() || text.size() > 3)
            return std::nullopt;
        if (!std::ranges::all_of(text, [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }))
            return std::nullopt;

        auto value = 0;
        auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc {} || ptr != text.data() + text.size() || value > maxValue)
            return std::nullopt;
        return value;
    }

    auto trimmed(std::string_view text) -> std::string_view
    {
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
            text.remove_prefix(1);
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
            text.remove_suffix(1);
        return text;
    }
} // namespace

auto parseIpv4(std::string_view text) -> std::optional<uint32_t>
{
    auto address = uint32_t { 0 };
    auto octets = 0;

    while (true)
    {
        auto const dot = text.find('.');
        auto const part = text.substr(0, dot);
        auto const value = parseNumber(part, 255);
        if (!value)
            return std::nullopt;

        address = (address << 8) | static_cast<uint32_t>(*value);
        ++octets;

        if (dot == std::string_view::npos)
            break;
        text.remove_prefix(dot + 1);
    }

    if (octets != 4)
        return std::nullopt;
    return address;
}

auto parseAddressInput(std::string_view text) -> Result<Ipv4Input>
{
    text = trimmed(text);

    auto const slash = text.find('/');
    if (slash == std::string_view::npos)
    {
        auto const address = parseIpv4(text);
        if (!address)
            return makeError(ErrorCode::InvalidArgument, "Invalid IP address.");
        return Ipv4Input { .address = *address, .prefixLength = std::nullopt };
    }

    auto const address = parseIpv4(text.substr(0, slash));
    auto const prefix = parseNumber(text.substr(slash + 1), 32);
    if (!address || !prefix)
        return makeError(ErrorCode::InvalidArgument, "Invalid CIDR (e.g., 10.0.0.1/24).");

    return Ipv4Input { .address = *address, .prefixLength = *prefix };
}

auto isValidMask(std::string_view mask) -> bool
{
    mask = trimmed(mask);
    if (mask.find('.') == std::string_view::npos)
        return parseNumber(mask, 32).has_value();

    auto const value = parseIpv4(mask);
    if (!value)
        return false;

    // Contiguous ones followed by zeros: the inverted mask plus one is a power of two.
    auto const inverted = ~*value;
    return (inverted & (inverted + 1)) == 0;
}

auto formatIpv4(uint32_t address) -> std::string
{
    return std::format("{}.{}.{}.{}", (address >> 24) & 0xFF, (address >> 16) & 0xFF, (address >> 8) & 0xFF,
                       address & 0xFF);
}

} // namespace netmcp
