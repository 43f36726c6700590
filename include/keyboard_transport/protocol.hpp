#pragma once

#include <cstddef>
#include <cstdint>

namespace kb::transport {

namespace cmd {

inline constexpr std::uint8_t SET_RESET = 0x01;
inline constexpr std::uint8_t SET_REPORT = 0x03;
inline constexpr std::uint8_t SET_PROFILE = 0x04;
inline constexpr std::uint8_t SET_DEBOUNCE = 0x06;
inline constexpr std::uint8_t SET_LEDPARAM = 0x07;
inline constexpr std::uint8_t SET_SLEDPARAM = 0x08;
inline constexpr std::uint8_t SET_KBOPTION = 0x09;
inline constexpr std::uint8_t SET_KEYMATRIX = 0x0A;
inline constexpr std::uint8_t SET_MACRO = 0x0B;
inline constexpr std::uint8_t SET_USERPIC = 0x0C;
inline constexpr std::uint8_t SET_FN = 0x10;
inline constexpr std::uint8_t SET_SLEEPTIME = 0x11;
inline constexpr std::uint8_t SET_USERGIF = 0x12;
inline constexpr std::uint8_t SET_MAGNETISM_REPORT = 0x1B;
inline constexpr std::uint8_t SET_MAGNETISM_CAL = 0x1C;
inline constexpr std::uint8_t SET_KEY_MAGNETISM_MODE = 0x1D;
inline constexpr std::uint8_t SET_MULTI_MAGNETISM = 0x65;

inline constexpr std::uint8_t GET_REV = 0x80;
inline constexpr std::uint8_t GET_REPORT = 0x83;
inline constexpr std::uint8_t GET_PROFILE = 0x84;
inline constexpr std::uint8_t GET_LEDONOFF = 0x85;
inline constexpr std::uint8_t GET_DEBOUNCE = 0x86;
inline constexpr std::uint8_t GET_LEDPARAM = 0x87;
inline constexpr std::uint8_t GET_SLEDPARAM = 0x88;
inline constexpr std::uint8_t GET_KBOPTION = 0x89;
inline constexpr std::uint8_t GET_KEYMATRIX = 0x8A;
inline constexpr std::uint8_t GET_MACRO = 0x8B;
inline constexpr std::uint8_t GET_USERPIC = 0x8C;
inline constexpr std::uint8_t GET_USB_VERSION = 0x8F;
inline constexpr std::uint8_t GET_FN = 0x90;
inline constexpr std::uint8_t GET_SLEEPTIME = 0x91;
inline constexpr std::uint8_t GET_KEY_MAGNETISM_MODE = 0x9D;
inline constexpr std::uint8_t GET_MULTI_MAGNETISM = 0xE5;
inline constexpr std::uint8_t GET_FEATURE_LIST = 0xE6;
inline constexpr std::uint8_t GET_CALIBRATION = 0xFE;

// Answered by the dongle itself, never forwarded over RF.
inline constexpr std::uint8_t DONGLE_STATUS = 0xF7;
// No-op that makes the dongle push its next buffered reply into the readable slot.
inline constexpr std::uint8_t DONGLE_FLUSH_NOP = 0xFC;

inline constexpr std::uint8_t STATUS_SUCCESS = 0xAA;

}  // namespace cmd

[[nodiscard]] const char* commandName(std::uint8_t command) noexcept;

namespace usb {

inline constexpr std::uint8_t REPORT_ID = 0x00;
// Report id plus 64 data bytes.
inline constexpr std::size_t FRAME_SIZE = 65;
inline constexpr std::size_t INPUT_REPORT_SIZE = 64;

}  // namespace usb

namespace ble {

inline constexpr std::uint8_t VENDOR_REPORT_ID = 0x06;
inline constexpr std::uint8_t CMDRESP_MARKER = 0x55;
inline constexpr std::uint8_t EVENT_MARKER = 0x66;
// Report id, marker and 64 data bytes.
inline constexpr std::size_t FRAME_SIZE = 66;

}  // namespace ble

namespace report_id {

inline constexpr std::uint8_t MOUSE = 0x02;
inline constexpr std::uint8_t USB_VENDOR_EVENT = 0x05;

}  // namespace report_id

// Notification types share numeric values with command bytes but live on the
// input endpoint, so 0x05 is LED_EFFECT_SPEED here and not a command.
namespace notif {

inline constexpr std::uint8_t WAKE = 0x00;
inline constexpr std::uint8_t PROFILE_CHANGE = 0x01;
inline constexpr std::uint8_t KB_FUNC = 0x03;
inline constexpr std::uint8_t LED_EFFECT_MODE = 0x04;
inline constexpr std::uint8_t LED_EFFECT_SPEED = 0x05;
inline constexpr std::uint8_t BRIGHTNESS_LEVEL = 0x06;
inline constexpr std::uint8_t LED_COLOR = 0x07;
inline constexpr std::uint8_t SETTINGS_ACK = 0x0F;
inline constexpr std::uint8_t KEY_DEPTH = 0x1B;
inline constexpr std::uint8_t BATTERY_STATUS = 0x88;

}  // namespace notif

}  // namespace kb::transport
