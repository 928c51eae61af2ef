// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace netmcp
{

/// @brief An IPv4 address as entered by the operator, with an optional prefix.
struct Ipv4Input
{
    uint32_t address = 0;
    std::optional<int> prefixLength;

    [[nodiscard]] auto isCidr() const -> bool { return prefixLength.has_value(); }
};

/// @brief Parses a dotted-quad IPv4 address.
[[nodiscard]] auto parseIpv4(std::string_view text) -> std::optional<uint32_t>;

/// @brief Parses "a.b.c.d" or "a.b.c.d/len".
/// @return The parsed input or an InvalidArgument error describing the problem.
[[nodiscard]] auto parseAddressInput(std::string_view text) -> Result<Ipv4Input>;

/// @brief Accepts a prefix length (0..32) or a contiguous dotted netmask.
[[nodiscard]] auto isValidMask(std::string_view mask) -> bool;

/// @brief Formats an address back to dotted-quad notation.
[[nodiscard]] auto formatIpv4(uint32_t address) -> std::string;

} // namespace netmcp
