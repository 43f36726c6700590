#include "keyboard_transport/protocol.hpp"

#include "keyboard_transport/types.hpp"

namespace kb::transport {

const char* commandName(std::uint8_t command) noexcept {
    switch (command) {
    case cmd::SET_RESET: return "SET_RESET";
    case cmd::SET_REPORT: return "SET_REPORT";
    case cmd::SET_PROFILE: return "SET_PROFILE";
    case cmd::SET_DEBOUNCE: return "SET_DEBOUNCE";
    case cmd::SET_LEDPARAM: return "SET_LEDPARAM";
    case cmd::SET_SLEDPARAM: return "SET_SLEDPARAM";
    case cmd::SET_KBOPTION: return "SET_KBOPTION";
    case cmd::SET_KEYMATRIX: return "SET_KEYMATRIX";
    case cmd::SET_MACRO: return "SET_MACRO";
    case cmd::SET_USERPIC: return "SET_USERPIC";
    case cmd::SET_FN: return "SET_FN";
    case cmd::SET_SLEEPTIME: return "SET_SLEEPTIME";
    case cmd::SET_USERGIF: return "SET_USERGIF";
    case cmd::SET_MAGNETISM_REPORT: return "SET_MAGNETISM_REPORT";
    case cmd::SET_MAGNETISM_CAL: return "SET_MAGNETISM_CAL";
    case cmd::SET_KEY_MAGNETISM_MODE: return "SET_KEY_MAGNETISM_MODE";
    case cmd::SET_MULTI_MAGNETISM: return "SET_MULTI_MAGNETISM";
    case cmd::GET_REV: return "GET_REV";
    case cmd::GET_REPORT: return "GET_REPORT";
    case cmd::GET_PROFILE: return "GET_PROFILE";
    case cmd::GET_LEDONOFF: return "GET_LEDONOFF";
    case cmd::GET_DEBOUNCE: return "GET_DEBOUNCE";
    case cmd::GET_LEDPARAM: return "GET_LEDPARAM";
    case cmd::GET_SLEDPARAM: return "GET_SLEDPARAM";
    case cmd::GET_KBOPTION: return "GET_KBOPTION";
    case cmd::GET_KEYMATRIX: return "GET_KEYMATRIX";
    case cmd::GET_MACRO: return "GET_MACRO";
    case cmd::GET_USERPIC: return "GET_USERPIC";
    case cmd::GET_USB_VERSION: return "GET_USB_VERSION";
    case cmd::GET_FN: return "GET_FN";
    case cmd::GET_SLEEPTIME: return "GET_SLEEPTIME";
    case cmd::GET_KEY_MAGNETISM_MODE: return "GET_KEY_MAGNETISM_MODE";
    case cmd::GET_MULTI_MAGNETISM: return "GET_MULTI_MAGNETISM";
    case cmd::GET_FEATURE_LIST: return "GET_FEATURE_LIST";
    case cmd::GET_CALIBRATION: return "GET_CALIBRATION";
    case cmd::DONGLE_STATUS: return "DONGLE_STATUS";
    case cmd::DONGLE_FLUSH_NOP: return "DONGLE_FLUSH_NOP";
    case cmd::STATUS_SUCCESS: return "STATUS_SUCCESS";
    default: return "UNKNOWN";
    }
}

const char* transportTypeName(TransportType type) noexcept {
    switch (type) {
    case TransportType::HidWired:
        return "wired";
    case TransportType::HidDongle:
        return "dongle";
    case TransportType::HidBluetooth:
        return "bluetooth";
    case TransportType::BluetoothGatt:
        return "bluetooth-gatt";
    }
    return "unknown";
}

}  // namespace kb::transport
