#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "keyboard_transport/hid_device.hpp"
#include "keyboard_transport/types.hpp"

namespace kb::transport {

struct InterfaceUsage {
    std::uint16_t usage_page{0};
    std::uint16_t usage{0};

    [[nodiscard]] bool matches(const HidInterfaceInfo& info) const noexcept {
        return info.usage_page == usage_page && info.usage == usage;
    }
};

// Known product ids and the HID collections that carry commands and input
// reports. Built once and handed to HidDiscovery; config files may replace it.
struct DeviceRegistry {
    std::uint16_t vendor_id{0};
    std::vector<std::uint16_t> wired_pids;
    std::vector<std::uint16_t> dongle_pids;
    std::vector<std::uint16_t> bluetooth_pids;

    InterfaceUsage usb_command;
    InterfaceUsage usb_input;
    InterfaceUsage ble_command;
    InterfaceUsage ble_input;

    static DeviceRegistry defaults();

    [[nodiscard]] bool isKnown(std::uint16_t vid, std::uint16_t pid) const;
    [[nodiscard]] bool isDonglePid(std::uint16_t pid) const;
    [[nodiscard]] bool isBluetoothPid(std::uint16_t pid) const;

    // Routing only: which backend talks to this interface. nullopt for
    // devices outside the registry.
    [[nodiscard]] std::optional<TransportType> classify(const HidInterfaceInfo& info) const;

    [[nodiscard]] bool isCommandInterface(const HidInterfaceInfo& info, TransportType type) const;
    [[nodiscard]] bool isInputInterface(const HidInterfaceInfo& info, TransportType type) const;
};

}  // namespace kb::transport
