// SPDX-License-Identifier: Apache-2.0
#include "Menu.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <ostream>
#include <print>

namespace netmcp
{

namespace
{
    auto trimmed(std::string_view text) -> std::string_view
    {
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
            text.remove_prefix(1);
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
            text.remove_suffix(1);
        return text;
    }

    auto equalsIgnoreCase(std::string_view a, std::string_view b) -> bool
    {
        return std::ranges::equal(a, b, [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
        });
    }

    auto parseIndex(std::string_view text) -> std::optional<std::size_t>
    {
        if (text.empty()
            || !std::ranges::all_of(text, [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }))
            return std::nullopt;

        auto value = std::size_t { 0 };
        auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc {})
            return std::nullopt;
        return value;
    }
} // namespace

auto isQuitWord(std::string_view input) -> bool
{
    input = trimmed(input);
    return equalsIgnoreCase(input, "q") || equalsIgnoreCase(input, "quit") || equalsIgnoreCase(input, "exit");
}

auto parseMenuChoice(std::string_view input, std::span<const std::string> toolNames) -> MenuChoice
{
    auto const choice = trimmed(input);

    if (isQuitWord(choice))
        return MenuChoice { .kind = MenuChoice::Kind::Quit, .tool = {}, .message = {} };

    // "3" or "3."
    auto number = choice;
    if (number.ends_with('.'))
        number = trimmed(number.substr(0, number.size() - 1));
    if (auto const index = parseIndex(number))
    {
        if (*index >= 1 && *index <= toolNames.size())
            return MenuChoice { .kind = MenuChoice::Kind::Tool, .tool = toolNames[*index - 1], .message = {} };
        return MenuChoice { .kind = MenuChoice::Kind::Invalid, .tool = {}, .message = "Invalid number." };
    }

    if (auto const it = std::ranges::find(toolNames, choice); it != toolNames.end())
        return MenuChoice { .kind = MenuChoice::Kind::Tool, .tool = *it, .message = {} };

    auto const it = std::ranges::find_if(toolNames, [&](const std::string& name) {
        return equalsIgnoreCase(name, choice);
    });
    if (it != toolNames.end())
        return MenuChoice { .kind = MenuChoice::Kind::Tool, .tool = *it, .message = {} };

    return MenuChoice {
        .kind = MenuChoice::Kind::Invalid,
        .tool = {},
        .message = std::format("Unknown selection '{}'. Try a number like '1' or a tool name.", input),
    };
}

auto parseDeviceSelection(std::string_view input, std::span<const std::string> names, bool allowAll)
    -> DeviceSelection
{
    auto const selection = trimmed(input);

    if (isQuitWord(selection))
        return DeviceSelection { .mode = DeviceSelection::Mode::Cancel, .device = {}, .names = {}, .notice = {} };

    if (names.empty())
        return DeviceSelection { .mode = DeviceSelection::Mode::Single,
                                 .device = std::nullopt,
                                 .names = {},
                                 .notice = "No device list available; using server default device." };

    if (allowAll && (selection.empty() || equalsIgnoreCase(selection, "a") || equalsIgnoreCase(selection, "all")))
        return DeviceSelection { .mode = DeviceSelection::Mode::All,
                                 .device = {},
                                 .names = { names.begin(), names.end() },
                                 .notice = {} };

    auto const first = [&](std::string notice) {
        return DeviceSelection {
            .mode = DeviceSelection::Mode::Single, .device = names.front(), .names = {}, .notice = std::move(notice)
        };
    };

    if (selection.empty())
        return first({});

    if (auto const index = parseIndex(selection))
    {
        if (*index >= 1 && *index <= names.size())
            return DeviceSelection {
                .mode = DeviceSelection::Mode::Single, .device = names[*index - 1], .names = {}, .notice = {}
            };
        return first("Out of range; defaulting to first device.");
    }

    if (auto const it = std::ranges::find(names, selection); it != names.end())
        return DeviceSelection { .mode = DeviceSelection::Mode::Single, .device = *it, .names = {}, .notice = {} };

    return first("Not recognized; defaulting to first device.");
}

void printMenu(std::ostream& out, std::span<const ToolDefinition> tools)
{
    std::println(out, "\n===== Select a tool (or 'q' to quit) =====");
    for (auto i = std::size_t { 0 }; i < tools.size(); ++i)
    {
        auto const& tool = tools[i];
        if (tool.description.empty())
            std::println(out, "{}. {}", i + 1, tool.name);
        else
            std::println(out, "{}. {} - {}", i + 1, tool.name, tool.description);
    }
}

} // namespace netmcp
