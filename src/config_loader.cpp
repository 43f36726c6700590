#include "keyboard_transport/config_loader.hpp"

// Use the system package include path
#define TOML_EXCEPTIONS 1
#include <toml++/toml.hpp>

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace kb::transport {

namespace {

using View = toml::node_view<const toml::node>;

std::int64_t readInteger(View node,
                         const std::string& key,
                         std::int64_t min,
                         std::int64_t max,
                         std::int64_t fallback) {
    if (!node) {
        return fallback;
    }
    auto value = node.value<std::int64_t>();
    if (!value) {
        throw std::runtime_error(key + " must be an integer");
    }
    if (*value < min || *value > max) {
        throw std::runtime_error(key + " out of range: " + std::to_string(*value));
    }
    return *value;
}

std::uint16_t readId(View node, const std::string& key, std::uint16_t fallback) {
    return static_cast<std::uint16_t>(readInteger(node, key, 0, 0xFFFF, fallback));
}

std::chrono::milliseconds readMs(View node, const std::string& key, std::chrono::milliseconds fallback) {
    return std::chrono::milliseconds(readInteger(node, key, 0, 60000, fallback.count()));
}

bool readBool(View node, const std::string& key, bool fallback) {
    if (!node) {
        return fallback;
    }
    auto value = node.value<bool>();
    if (!value) {
        throw std::runtime_error(key + " must be true or false");
    }
    return *value;
}

template <typename T>
std::vector<T> readIntegerList(View node,
                               const std::string& key,
                               std::int64_t max,
                               const std::vector<T>& fallback) {
    if (!node) {
        return fallback;
    }
    const auto* arr = node.as_array();
    if (arr == nullptr) {
        throw std::runtime_error(key + " must be an array of integers");
    }
    std::vector<T> out;
    for (const auto& elem : *arr) {
        out.push_back(static_cast<T>(readInteger(View(&elem), key, 0, max, 0)));
    }
    return out;
}

InterfaceUsage readUsage(View section, const std::string& prefix, InterfaceUsage fallback) {
    InterfaceUsage usage;
    usage.usage_page = readId(section["usage_page"], prefix + ".usage_page", fallback.usage_page);
    usage.usage = readId(section["usage"], prefix + ".usage", fallback.usage);
    return usage;
}

void applyRegistry(View section, DeviceRegistry& registry) {
    if (!section) return;
    const std::string prefix = "registry";
    registry.vendor_id = readId(section["vendor_id"], prefix + ".vendor_id", registry.vendor_id);
    registry.wired_pids =
        readIntegerList(section["wired_pids"], prefix + ".wired_pids", 0xFFFF, registry.wired_pids);
    registry.dongle_pids =
        readIntegerList(section["dongle_pids"], prefix + ".dongle_pids", 0xFFFF, registry.dongle_pids);
    registry.bluetooth_pids = readIntegerList(section["bluetooth_pids"], prefix + ".bluetooth_pids",
                                              0xFFFF, registry.bluetooth_pids);
    registry.usb_command = readUsage(section["usb_command"], prefix + ".usb_command", registry.usb_command);
    registry.usb_input = readUsage(section["usb_input"], prefix + ".usb_input", registry.usb_input);
    registry.ble_command = readUsage(section["ble_command"], prefix + ".ble_command", registry.ble_command);
    registry.ble_input = readUsage(section["ble_input"], prefix + ".ble_input", registry.ble_input);
}

FlowPolicy readPolicy(View section, const std::string& prefix, FlowPolicy policy) {
    if (!section) return policy;
    policy.max_attempts = static_cast<std::uint32_t>(
        readInteger(section["max_attempts"], prefix + ".max_attempts", 1, 1000, policy.max_attempts));
    policy.first_wait = readMs(section["first_wait_ms"], prefix + ".first_wait_ms", policy.first_wait);
    policy.poll_interval =
        readMs(section["poll_interval_ms"], prefix + ".poll_interval_ms", policy.poll_interval);
    policy.max_poll_interval = readMs(section["max_poll_interval_ms"],
                                      prefix + ".max_poll_interval_ms", policy.max_poll_interval);
    policy.query_timeout =
        readMs(section["query_timeout_ms"], prefix + ".query_timeout_ms", policy.query_timeout);
    policy.wake_timeout =
        readMs(section["wake_timeout_ms"], prefix + ".wake_timeout_ms", policy.wake_timeout);
    policy.send_delay = readMs(section["send_delay_ms"], prefix + ".send_delay_ms", policy.send_delay);
    policy.max_drain_flushes = static_cast<std::uint32_t>(readInteger(
        section["max_drain_flushes"], prefix + ".max_drain_flushes", 0, 100, policy.max_drain_flushes));
    policy.drain_interval =
        readMs(section["drain_interval_ms"], prefix + ".drain_interval_ms", policy.drain_interval);

    if (policy.max_poll_interval < policy.poll_interval) {
        throw std::runtime_error(prefix + ".max_poll_interval_ms is below poll_interval_ms");
    }
    if (policy.wake_timeout < policy.query_timeout) {
        throw std::runtime_error(prefix + ".wake_timeout_ms is below query_timeout_ms");
    }
    return policy;
}

void applyEvents(View section, DiscoveryOptions& options) {
    if (!section) return;
    const auto capacity = static_cast<std::size_t>(readInteger(
        section["channel_capacity"], "events.channel_capacity", 1, 65536,
        static_cast<std::int64_t>(options.usb_events.channel_capacity)));
    const auto backoff =
        readMs(section["error_backoff_ms"], "events.error_backoff_ms", options.usb_events.error_backoff);

    options.usb_events.channel_capacity = capacity;
    options.usb_events.error_backoff = backoff;
    options.usb_events.read_timeout =
        readMs(section["read_timeout_ms"], "events.read_timeout_ms", options.usb_events.read_timeout);

    options.ble_events.channel_capacity = capacity;
    options.ble_events.error_backoff = backoff;
    options.ble_events.read_timeout = readMs(section["ble_read_timeout_ms"],
                                             "events.ble_read_timeout_ms", options.ble_events.read_timeout);
}

void applyDongle(View section, DongleHeuristics& heuristics) {
    if (!section) return;
    heuristics.max_battery_level = static_cast<std::uint8_t>(readInteger(
        section["max_battery_level"], "dongle.max_battery_level", 0, 255, heuristics.max_battery_level));
    heuristics.empty_echoes =
        readIntegerList(section["empty_echoes"], "dongle.empty_echoes", 0xFF, heuristics.empty_echoes);
}

TransportConfig buildConfig(const toml::table& tbl) {
    TransportConfig config;

    applyRegistry(tbl["registry"], config.registry);

    auto& discovery = config.discovery;
    discovery.wired_policy = readPolicy(tbl["flow"]["wired"], "flow.wired", discovery.wired_policy);
    discovery.dongle_policy = readPolicy(tbl["flow"]["dongle"], "flow.dongle", discovery.dongle_policy);
    // A buffer as deep as the response cache must drain down to an idle frame.
    if (discovery.dongle_policy.max_drain_flushes <= ResponseCache::kDefaultCapacity) {
        throw std::runtime_error("flow.dongle.max_drain_flushes must exceed " +
                                 std::to_string(ResponseCache::kDefaultCapacity));
    }
    discovery.bluetooth_policy =
        readPolicy(tbl["flow"]["bluetooth"], "flow.bluetooth", discovery.bluetooth_policy);
    discovery.ble_read.per_attempt = readMs(tbl["flow"]["bluetooth"]["read_attempt_ms"],
                                            "flow.bluetooth.read_attempt_ms", discovery.ble_read.per_attempt);
    discovery.ble_read.deadline = readMs(tbl["flow"]["bluetooth"]["read_deadline_ms"],
                                         "flow.bluetooth.read_deadline_ms", discovery.ble_read.deadline);

    applyEvents(tbl["events"], discovery);
    applyDongle(tbl["dongle"], discovery.dongle);

    discovery.trace = readBool(tbl["logging"]["trace"], "logging.trace", discovery.trace);
    discovery.traffic = readBool(tbl["logging"]["traffic"], "logging.traffic", discovery.traffic);

    config.probe_watch = std::chrono::seconds(
        readInteger(tbl["probe"]["watch_seconds"], "probe.watch_seconds", 0, 86400, config.probe_watch.count()));
    return config;
}

}  // namespace

TransportConfig ConfigLoader::loadFromString(std::string_view text, std::string_view source) const {
    toml::table tbl;
    try {
        tbl = toml::parse(text, source);
    } catch (const toml::parse_error& err) {
        throw std::runtime_error("TOML Parse Error in " + std::string(source) + ": " +
                                 std::string(err.description()));
    }

    try {
        return buildConfig(tbl);
    } catch (const std::runtime_error& err) {
        throw std::runtime_error(std::string(source) + ": " + err.what());
    }
}

TransportConfig ConfigLoader::loadFromFile(const std::string& path) const {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        throw std::runtime_error("Config file not found: " + path);
    }

    toml::table tbl;
    try {
        tbl = toml::parse_file(path);
    } catch (const toml::parse_error& err) {
        throw std::runtime_error("TOML Parse Error in " + path + ": " + std::string(err.description()));
    }

    try {
        auto config = buildConfig(tbl);
        std::cout << "[ConfigLoader] Loaded " << path << '\n';
        return config;
    } catch (const std::runtime_error& err) {
        throw std::runtime_error(path + ": " + err.what());
    }
}

}  // namespace kb::transport
