// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <iosfwd>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace netmcp
{

/// @brief Outcome of reading the tool menu.
struct MenuChoice
{
    enum class Kind
    {
        Tool,
        Quit,
        Invalid,
    };

    Kind kind = Kind::Invalid;
    std::string tool;
    std::string message;
};

/// @brief Outcome of the device picker.
struct DeviceSelection
{
    enum class Mode
    {
        Single,
        All,
        Cancel,
    };

    Mode mode = Mode::Single;

    /// @brief The chosen device; empty means the server's default device.
    std::optional<std::string> device;

    /// @brief Every device, set for Mode::All.
    std::vector<std::string> names;

    /// @brief Set when the input was not understood and a fallback was taken.
    std::string notice;
};

/// @brief Returns true for q, quit or exit (case-insensitive).
[[nodiscard]] auto isQuitWord(std::string_view input) -> bool;

/// @brief Interprets menu input: quit words, a 1-based number (optionally
///        followed by a dot), an exact or case-insensitive tool name.
[[nodiscard]] auto parseMenuChoice(std::string_view input, std::span<const std::string> toolNames)
    -> MenuChoice;

/// @brief Interprets device picker input.
///
/// Quit words cancel. Empty input or a/all select every device when allowed,
/// otherwise empty input picks the first device. Numbers and names select a
/// device; anything else (including an out-of-range number) falls back to
/// the first device with a notice.
[[nodiscard]] auto parseDeviceSelection(std::string_view input,
                                        std::span<const std::string> names,
                                        bool allowAll) -> DeviceSelection;

/// @brief Prints the numbered tool menu.
void printMenu(std::ostream& out, std::span<const ToolDefinition> tools);

} // namespace netmcp
