// SPDX-License-Identifier: Apache-2.0
#include "DeviceWorkflows.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <netmcp/Printer.hpp>

#include <format>
#include <ostream>
#include <print>

namespace netmcp
{

namespace
{
    constexpr auto InterfaceNamingTip =
        std::string_view { "Tip: use interface names like 'Ethernet0/0', 'Ethernet0/1', 'Ethernet0/2'." };

    auto stringsOf(const nlohmann::json& array) -> std::vector<std::string>
    {
        auto names = std::vector<std::string> {};
        for (const auto& item: array)
        {
            if (item.is_string())
                names.push_back(item.get<std::string>());
        }
        return names;
    }

    /// @brief A display result reports a server-side failure through a non-empty `error`.
    auto reportsError(const nlohmann::json& data) -> bool
    {
        if (!data.is_object() || !data.contains("error"))
            return false;
        auto const& error = data["error"];
        if (error.is_null() || (error.is_boolean() && !error.get<bool>()))
            return false;
        if (error.is_string())
            return !error.get_ref<const std::string&>().empty();
        if (error.is_array() || error.is_object())
            return !error.empty();
        return true;
    }
} // namespace

auto extractDeviceNames(const nlohmann::json& merged) -> std::vector<std::string>
{
    if (!merged.is_object())
        return {};

    if (merged.contains("devices") && merged["devices"].is_array())
        return stringsOf(merged["devices"]);

    auto const raw = json::getStringOr(merged, "raw", "");
    if (raw.empty())
        return {};

    auto decoded = json::parse(raw);
    if (!decoded)
        return {};
    if (decoded->is_object() && decoded->contains("devices") && (*decoded)["devices"].is_array())
        return stringsOf((*decoded)["devices"]);
    if (decoded->is_array())
        return stringsOf(*decoded);
    return {};
}

auto makeLoopbackFallbackArgs(const nlohmann::json& loopbackArgs, std::string_view interface) -> nlohmann::json
{
    auto args = nlohmann::json {
        { "ip", json::getStringOr(loopbackArgs, "ip", "") },
        { "replace", true },
        { "no_shutdown", true },
        { "save", false },
        { "dry_run", false },
        { "interface", interface },
    };

    if (auto const mask = json::getStringOr(loopbackArgs, "mask", ""); !mask.empty())
        args["mask"] = mask;
    if (auto const device = json::getStringOr(loopbackArgs, "device", ""); !device.empty())
        args["device"] = device;

    return args;
}

DeviceWorkflows::DeviceWorkflows(McpClient& client, Prompt& prompt, const AppConfig& config):
    _client(client), _prompt(prompt), _config(config)
{
}

void DeviceWorkflows::run(std::string_view tool)
{
    if (tool == "list_devices")
        runListDevices();
    else if (tool == "get_interfaces" || tool == "get_version")
        runShowCommand(tool);
    else if (tool == "set_interface_ip")
        runSetInterfaceIp();
    else if (tool == "create_loopback")
        runCreateLoopback();
    else
        runGeneric(tool);
}

auto DeviceWorkflows::listDevices() -> std::vector<std::string>
{
    auto result = _client.callToolRaw("list_devices", nlohmann::json::object(), readTimeout());
    if (!result)
    {
        std::println(_prompt.out(), "Warning: list_devices failed: {}", result.error().message);
        return {};
    }
    return extractDeviceNames(*result);
}

auto DeviceWorkflows::pickDevice(bool allowAll, std::string_view label) -> DeviceSelection
{
    auto& out = _prompt.out();
    auto const names = listDevices();
    if (names.empty())
    {
        std::println(out, "Warning: could not retrieve device list from server; using server default device.");
        return DeviceSelection { .mode = DeviceSelection::Mode::Single, .device = {}, .names = {}, .notice = {} };
    }

    std::println(out, "\nDevices:");
    for (auto i = std::size_t { 0 }; i < names.size(); ++i)
        std::println(out, "  {}. {}", i + 1, names[i]);

    if (allowAll)
        std::println(out, "\nPick a device number or name, press ENTER / 'a' for all, or 'q' to cancel.");
    else
        std::println(out, "\nPick a device number or name (ENTER picks the first) or 'q' to cancel.");

    auto const input = _prompt.readLine(std::format("{}: ", label));
    if (!input)
        return DeviceSelection { .mode = DeviceSelection::Mode::Cancel, .device = {}, .names = {}, .notice = {} };

    auto selection = parseDeviceSelection(*input, names, allowAll);
    if (!selection.notice.empty())
        std::println(out, "Warning: {}", selection.notice);
    return selection;
}

auto DeviceWorkflows::runAcrossDevices(std::string_view tool, std::span<const std::string> names)
    -> AggregateResult
{
    auto& out = _prompt.out();
    auto aggregate = AggregateResult {};
    auto blocks = std::vector<std::string> {};

    std::println(out, "\nRunning '{}' on ALL devices ...", tool);
    for (const auto& name: names)
    {
        auto result = _client.callToolForDisplay(tool, nlohmann::json { { "device", name } }, readTimeout());
        if (!result)
        {
            std::println(out, "{}: {}", name, result.error().message);
            aggregate.parsed.push_back(nlohmann::json { { "device", name }, { "error", result.error().message } });
            ++aggregate.failures;
            continue;
        }

        printToolResult(out, tool, *result);
        auto const& raw = (*result)["raw"];
        blocks.push_back(std::format("=== {} ===\n{}\n", name, raw.is_string() ? raw.get<std::string>() : ""));
        aggregate.parsed.push_back(nlohmann::json { { "device", name }, { "parsed", (*result)["parsed"] } });
    }

    for (auto i = std::size_t { 0 }; i < blocks.size(); ++i)
    {
        if (i > 0)
            aggregate.raw += '\n';
        aggregate.raw += blocks[i];
    }

    if (aggregate.failures > 0)
        log::warning("'{}' failed on {} of {} device(s)", tool, aggregate.failures, names.size());
    return aggregate;
}

auto DeviceWorkflows::setInterfaceIpWizard() -> std::optional<nlohmann::json>
{
    auto const& d = _config.defaults;
    auto& out = _prompt.out();

    while (true)
    {
        std::println(out, "\nset_interface_ip - guided setup");
        auto const selection = pickDevice(false, "Device");
        if (selection.mode == DeviceSelection::Mode::Cancel)
            return std::nullopt;

        std::println(out, "{}", InterfaceNamingTip);

        auto const interface = _prompt.askString("Interface", d.interface);
        if (!interface)
            return std::nullopt;
        auto const address = _prompt.askAddress(d.ip, d.mask);
        if (!address)
            return std::nullopt;
        auto const replace = _prompt.askBool("Replace existing IP on interface?", d.replace);
        if (!replace)
            return std::nullopt;
        auto const noShutdown = _prompt.askBool("Send 'no shutdown'?", d.noShutdown);
        if (!noShutdown)
            return std::nullopt;
        auto const save = _prompt.askBool("Save config (write memory)?", d.save);
        if (!save)
            return std::nullopt;
        auto const dryRun = _prompt.askBool("Dry run (preview only)?", d.dryRun);
        if (!dryRun)
            return std::nullopt;

        auto args = nlohmann::json {
            { "interface", *interface }, { "ip", address->ip }, { "replace", *replace },
            { "no_shutdown", *noShutdown }, { "save", *save },  { "dry_run", *dryRun },
        };
        if (address->mask)
            args["mask"] = *address->mask;
        if (selection.device)
            args["device"] = *selection.device;

        auto const confirmed = confirmArguments(args);
        if (!confirmed)
            return std::nullopt;
        if (*confirmed)
            return args;
    }
}

auto DeviceWorkflows::createLoopbackWizard() -> std::optional<nlohmann::json>
{
    auto const& d = _config.defaults;
    auto& out = _prompt.out();

    while (true)
    {
        std::println(out, "\ncreate_loopback - guided setup");
        auto const selection = pickDevice(false, "Device");
        if (selection.mode == DeviceSelection::Mode::Cancel)
            return std::nullopt;

        auto const loopbackId = _prompt.askInt("Loopback ID", d.loopbackId, 0);
        if (!loopbackId)
            return std::nullopt;
        auto const address = _prompt.askAddress(d.loopbackIp);
        if (!address)
            return std::nullopt;
        auto const description = _prompt.askString("Description", d.loopbackDescription, true);
        if (!description)
            return std::nullopt;
        auto const save = _prompt.askBool("Save config (write memory)?", d.save);
        if (!save)
            return std::nullopt;
        auto const dryRun = _prompt.askBool("Dry run (preview only)?", d.dryRun);
        if (!dryRun)
            return std::nullopt;

        auto args = nlohmann::json {
            { "loopback_id", *loopbackId }, { "ip", address->ip }, { "description", *description },
            { "save", *save },              { "dry_run", *dryRun },
        };
        if (address->mask)
            args["mask"] = *address->mask;
        if (selection.device)
            args["device"] = *selection.device;

        auto const confirmed = confirmArguments(args);
        if (!confirmed)
            return std::nullopt;
        if (*confirmed)
            return args;
    }
}

void DeviceWorkflows::runListDevices()
{
    auto& out = _prompt.out();
    auto result = _client.callToolForDisplay("list_devices", nlohmann::json::object(), readTimeout());
    if (!result)
    {
        std::println(out, "Tool call failed: {}", result.error().message);
        return;
    }

    if (result->contains("devices") && (*result)["devices"].is_array())
    {
        std::println(out, "\nDevices:");
        auto index = 1;
        for (const auto& name: (*result)["devices"])
            std::println(out, "  {}. {}", index++, name.is_string() ? name.get<std::string>() : json::dump(name));
    }
    printToolResult(out, "list_devices", *result);
}

void DeviceWorkflows::runShowCommand(std::string_view tool)
{
    auto& out = _prompt.out();
    auto const selection = pickDevice(true, "Selection");

    switch (selection.mode)
    {
        case DeviceSelection::Mode::Cancel: return;
        case DeviceSelection::Mode::All: {
            auto const aggregate = runAcrossDevices(tool, selection.names);
            printAggregate(out, aggregate.raw, aggregate.parsed);
            return;
        }
        case DeviceSelection::Mode::Single: break;
    }

    auto args = nlohmann::json::object();
    if (selection.device)
        args["device"] = *selection.device;

    std::println(out, "\nRunning '{}' on {} ...", tool, selection.device.value_or("<default device>"));
    auto result = _client.callToolForDisplay(tool, args, readTimeout());
    if (!result)
    {
        std::println(out, "Tool call failed: {}", result.error().message);
        return;
    }
    printToolResult(out, tool, *result);
}

void DeviceWorkflows::runSetInterfaceIp()
{
    auto const args = setInterfaceIpWizard();
    if (!args)
        return;

    auto result = _client.callToolForDisplay("set_interface_ip", *args, configureTimeout());
    if (!result)
    {
        std::println(_prompt.out(), "Tool call failed: {}", result.error().message);
        return;
    }
    printToolResult(_prompt.out(), "set_interface_ip", *result);
}

void DeviceWorkflows::runCreateLoopback()
{
    auto const args = createLoopbackWizard();
    if (!args)
        return;

    auto result = _client.callToolForDisplay("create_loopback", *args, configureTimeout());
    if (!result)
    {
        std::println(_prompt.out(), "Tool call failed: {}", result.error().message);
        return;
    }
    printToolResult(_prompt.out(), "create_loopback", *result);

    if (reportsError(*result))
        offerLoopbackFallback(*args);
}

void DeviceWorkflows::offerLoopbackFallback(const nlohmann::json& loopbackArgs)
{
    auto& out = _prompt.out();
    std::println(out, "\nWarning: loopback creation failed on the server.");

    auto const accepted = _prompt.askBool("Try applying the same IP to a physical interface instead?", true);
    if (!accepted || !*accepted)
        return;

    std::println(out, "{}", InterfaceNamingTip);
    auto const interface = _prompt.askString("Interface to configure", _config.defaults.interface);
    if (!interface)
        return;

    auto const fallback = makeLoopbackFallbackArgs(loopbackArgs, *interface);
    std::println(out, "\nFallback arguments (set_interface_ip):");
    std::println(out, "{}", json::dump(fallback, 2));

    auto const proceed = _prompt.askBool("Proceed with fallback?", true);
    if (!proceed || !*proceed)
        return;

    auto result = _client.callToolForDisplay("set_interface_ip", fallback, configureTimeout());
    if (!result)
    {
        std::println(out, "Fallback failed: {}", result.error().message);
        return;
    }
    printToolResult(out, "set_interface_ip (fallback)", *result);
}

void DeviceWorkflows::runGeneric(std::string_view tool)
{
    std::println(_prompt.out(), "\nNo guided flow for '{}'; calling it without arguments.", tool);
    auto result = _client.callToolForDisplay(tool, nlohmann::json::object(), readTimeout());
    if (!result)
    {
        std::println(_prompt.out(), "Tool call failed: {}", result.error().message);
        return;
    }
    printToolResult(_prompt.out(), tool, *result);
}

auto DeviceWorkflows::readTimeout() const -> std::chrono::milliseconds
{
    return std::chrono::milliseconds(_config.client.callTimeoutMs);
}

auto DeviceWorkflows::configureTimeout() const -> std::chrono::milliseconds
{
    return std::chrono::milliseconds(_config.client.configureTimeoutMs);
}

auto DeviceWorkflows::confirmArguments(const nlohmann::json& args) -> std::optional<bool>
{
    std::println(_prompt.out(), "\nReview arguments:");
    std::println(_prompt.out(), "{}", json::dump(args, 2));
    return _prompt.askBool("Proceed with these settings?", true);
}

} // namespace netmcp
