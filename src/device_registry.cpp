#include "keyboard_transport/device_registry.hpp"

#include <algorithm>

namespace kb::transport {

namespace {

bool contains(const std::vector<std::uint16_t>& ids, std::uint16_t pid) {
    return std::find(ids.begin(), ids.end(), pid) != ids.end();
}

}  // namespace

DeviceRegistry DeviceRegistry::defaults() {
    DeviceRegistry registry;
    registry.vendor_id = 0x3151;
    registry.wired_pids = {0x5030};
    registry.dongle_pids = {0x5038, 0x503A, 0x503D};
    registry.bluetooth_pids = {0x5027};
    registry.usb_command = {0xFFFF, 0x0002};
    registry.usb_input = {0xFFFF, 0x0001};
    registry.ble_command = {0xFF55, 0x0202};
    // Generic desktop / keyboard collection of the HOGP device.
    registry.ble_input = {0x0001, 0x0006};
    return registry;
}

bool DeviceRegistry::isKnown(std::uint16_t vid, std::uint16_t pid) const {
    if (vid != vendor_id) {
        return false;
    }
    return contains(wired_pids, pid) || contains(dongle_pids, pid) || contains(bluetooth_pids, pid);
}

bool DeviceRegistry::isDonglePid(std::uint16_t pid) const {
    return contains(dongle_pids, pid);
}

bool DeviceRegistry::isBluetoothPid(std::uint16_t pid) const {
    return contains(bluetooth_pids, pid);
}

std::optional<TransportType> DeviceRegistry::classify(const HidInterfaceInfo& info) const {
    if (!isKnown(info.vendor_id, info.product_id)) {
        return std::nullopt;
    }
    if (info.bus == HidBusType::Bluetooth || isBluetoothPid(info.product_id)) {
        return TransportType::HidBluetooth;
    }
    if (isDonglePid(info.product_id)) {
        return TransportType::HidDongle;
    }
    return TransportType::HidWired;
}

bool DeviceRegistry::isCommandInterface(const HidInterfaceInfo& info, TransportType type) const {
    if (type == TransportType::HidBluetooth) {
        return ble_command.matches(info);
    }
    return usb_command.matches(info);
}

bool DeviceRegistry::isInputInterface(const HidInterfaceInfo& info, TransportType type) const {
    if (type == TransportType::HidBluetooth) {
        return ble_input.matches(info);
    }
    return usb_input.matches(info);
}

}  // namespace kb::transport
