#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>

#include "keyboard_transport/types.hpp"

namespace kb::transport {

namespace event {

struct KeyDepth {
    std::uint8_t key_index{0};
    std::uint16_t depth_raw{0};
};
struct MagnetismStart {};
struct MagnetismStop {};
struct Wake {};
struct ProfileChange {
    std::uint8_t profile{0};
};
struct SettingsAck {
    bool started{false};
};
struct LedEffectMode {
    std::uint8_t effect_id{0};
};
struct LedEffectSpeed {
    std::uint8_t speed{0};
};
struct BrightnessLevel {
    std::uint8_t level{0};
};
struct LedColor {
    std::uint8_t color{0};
};
struct WinLockToggle {
    bool locked{false};
};
struct WasdSwapToggle {
    bool swapped{false};
};
struct FnLayerToggle {
    std::uint8_t layer{0};
};
struct BacklightToggle {};
struct DialModeToggle {};
struct UnknownKbFunc {
    std::uint8_t category{0};
    std::uint8_t action{0};
};
struct Battery {
    std::uint8_t level{0};
    bool charging{false};
    bool online{false};
};
// The keyboard's built-in pointing function (report id 0x02).
struct MouseReport {
    std::uint8_t buttons{0};
    std::int16_t x{0};
    std::int16_t y{0};
    std::int16_t wheel{0};
};
struct Unknown {
    Bytes raw;
};

}  // namespace event

using VendorEvent = std::variant<event::KeyDepth,
                                 event::MagnetismStart,
                                 event::MagnetismStop,
                                 event::Wake,
                                 event::ProfileChange,
                                 event::SettingsAck,
                                 event::LedEffectMode,
                                 event::LedEffectSpeed,
                                 event::BrightnessLevel,
                                 event::LedColor,
                                 event::WinLockToggle,
                                 event::WasdSwapToggle,
                                 event::FnLayerToggle,
                                 event::BacklightToggle,
                                 event::DialModeToggle,
                                 event::UnknownKbFunc,
                                 event::Battery,
                                 event::MouseReport,
                                 event::Unknown>;

struct TimestampedEvent {
    VendorEvent event;
    // Since the owning transport was opened.
    std::chrono::steady_clock::duration elapsed{};

    [[nodiscard]] double seconds() const {
        return std::chrono::duration<double>(elapsed).count();
    }
};

[[nodiscard]] std::string describe(const VendorEvent& event);

}  // namespace kb::transport
