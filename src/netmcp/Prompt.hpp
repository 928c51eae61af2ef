// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace netmcp
{

/// @brief Address entered in a wizard; mask is set only for plain addresses.
struct AddressAnswer
{
    std::string ip;
    std::optional<std::string> mask;
};

/// @brief Line-based operator prompts over a pair of streams.
///
/// Every prompt re-asks until the answer is valid. std::nullopt means the
/// input stream ended.
class Prompt
{
  public:
    Prompt(std::istream& in, std::ostream& out);

    [[nodiscard]] auto readLine(std::string_view label) -> std::optional<std::string>;

    [[nodiscard]] auto askString(std::string_view message,
                                 std::optional<std::string_view> defaultValue = std::nullopt,
                                 bool allowEmpty = false) -> std::optional<std::string>;

    [[nodiscard]] auto askBool(std::string_view message, bool defaultValue) -> std::optional<bool>;

    [[nodiscard]] auto askInt(std::string_view message,
                              std::optional<int> defaultValue = std::nullopt,
                              std::optional<int> minValue = std::nullopt,
                              std::optional<int> maxValue = std::nullopt) -> std::optional<int>;

    /// @brief Asks for an address in CIDR or dotted form, and for a mask
    ///        (prefix length or dotted) when no prefix was given.
    [[nodiscard]] auto askAddress(std::string_view defaultIp, std::string_view defaultMask = {})
        -> std::optional<AddressAnswer>;

    [[nodiscard]] auto out() -> std::ostream& { return _out; }

  private:
    std::istream& _in;
    std::ostream& _out;
};

} // namespace netmcp
