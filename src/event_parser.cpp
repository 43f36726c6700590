#include "keyboard_transport/event_parser.hpp"

#include <algorithm>

#include "keyboard_transport/protocol.hpp"

namespace kb::transport {

namespace {

std::int16_t readLe16(const Bytes& data, std::size_t offset) {
    return static_cast<std::int16_t>(static_cast<std::uint16_t>(data[offset]) |
                                     (static_cast<std::uint16_t>(data[offset + 1]) << 8));
}

VendorEvent parseKbFunc(const Bytes& payload, std::size_t begin) {
    const std::uint8_t category = payload.size() > begin + 1 ? payload[begin + 1] : 0;
    const std::uint8_t action = payload.size() > begin + 2 ? payload[begin + 2] : 0;

    switch (action) {
    case 0x01:
        return event::WinLockToggle{category != 0};
    case 0x03:
        return event::WasdSwapToggle{category == 8};
    case 0x08:
        return event::FnLayerToggle{category};
    case 0x09:
        return event::BacklightToggle{};
    case 0x11:
        return event::DialModeToggle{};
    default:
        return event::UnknownKbFunc{category, action};
    }
}

// `data[begin]` is the notification type once the framing is removed.
VendorEvent parsePayload(const Bytes& data, std::size_t begin) {
    if (begin >= data.size()) {
        return event::Unknown{data};
    }

    const std::size_t length = data.size() - begin;
    const std::uint8_t type = data[begin];
    const std::uint8_t value = length > 1 ? data[begin + 1] : 0;

    switch (type) {
    case notif::WAKE:
        if (std::all_of(data.begin() + begin + 1, data.end(), [](std::uint8_t b) { return b == 0; })) {
            return event::Wake{};
        }
        break;
    case notif::PROFILE_CHANGE:
        return event::ProfileChange{value};
    case notif::KB_FUNC:
        return parseKbFunc(data, begin);
    case notif::LED_EFFECT_MODE:
        return event::LedEffectMode{value};
    case notif::LED_EFFECT_SPEED:
        return event::LedEffectSpeed{value};
    case notif::BRIGHTNESS_LEVEL:
        return event::BrightnessLevel{value};
    case notif::LED_COLOR:
        return event::LedColor{value};
    case notif::SETTINGS_ACK:
        // The ack that follows SET_MAGNETISM_REPORT echoes the command in byte 2.
        if (length > 2 && data[begin + 2] == cmd::SET_MAGNETISM_REPORT) {
            if (value != 0) {
                return event::MagnetismStart{};
            }
            return event::MagnetismStop{};
        }
        return event::SettingsAck{value != 0};
    case notif::KEY_DEPTH:
        if (length >= 5) {
            return event::KeyDepth{data[begin + 3],
                                   static_cast<std::uint16_t>(readLe16(data, begin + 1))};
        }
        break;
    case notif::BATTERY_STATUS:
        if (length >= 5) {
            const std::uint8_t flags = data[begin + 4];
            return event::Battery{data[begin + 3], (flags & 0x02) != 0, (flags & 0x01) != 0};
        }
        break;
    default:
        break;
    }
    return event::Unknown{data};
}

}  // namespace

VendorEvent parseUsbEvent(const Bytes& data) {
    if (data.empty()) {
        return event::Unknown{data};
    }

    // [02, buttons, 00, x_lo, x_hi, y_lo, y_hi, wheel_lo, wheel_hi]
    if (data[0] == report_id::MOUSE && data.size() >= 7) {
        event::MouseReport report;
        report.buttons = data[1];
        report.x = readLe16(data, 3);
        report.y = readLe16(data, 5);
        report.wheel = data.size() >= 9 ? readLe16(data, 7) : 0;
        return report;
    }

    const std::size_t begin =
        (data[0] == report_id::USB_VENDOR_EVENT && data.size() > 1) ? 1 : 0;
    return parsePayload(data, begin);
}

VendorEvent parseBleEvent(const Bytes& data) {
    if (data.size() < 3) {
        return event::Unknown{data};
    }

    if (data[0] == ble::VENDOR_REPORT_ID && data[1] == ble::EVENT_MARKER) {
        return parsePayload(data, 2);
    }
    if (data[0] == report_id::USB_VENDOR_EVENT || data[0] == ble::VENDOR_REPORT_ID) {
        return parsePayload(data, 1);
    }
    return event::Unknown{data};
}

EventParser parserFor(TransportType type) {
    if (type == TransportType::HidBluetooth || type == TransportType::BluetoothGatt) {
        return parseBleEvent;
    }
    return parseUsbEvent;
}

}  // namespace kb::transport
