#include "keyboard_transport/vendor_event.hpp"

#include <iomanip>
#include <sstream>
#include <type_traits>

namespace kb::transport {

namespace {

const char* onOff(bool value) {
    return value ? "on" : "off";
}

}  // namespace

std::string describe(const VendorEvent& event) {
    std::ostringstream out;
    std::visit(
        [&out](const auto& ev) {
            using T = std::decay_t<decltype(ev)>;
            if constexpr (std::is_same_v<T, event::KeyDepth>) {
                out << "KeyDepth key=" << static_cast<int>(ev.key_index)
                    << " depth=" << ev.depth_raw;
            } else if constexpr (std::is_same_v<T, event::MagnetismStart>) {
                out << "MagnetismStart";
            } else if constexpr (std::is_same_v<T, event::MagnetismStop>) {
                out << "MagnetismStop";
            } else if constexpr (std::is_same_v<T, event::Wake>) {
                out << "Wake";
            } else if constexpr (std::is_same_v<T, event::ProfileChange>) {
                out << "ProfileChange profile=" << static_cast<int>(ev.profile);
            } else if constexpr (std::is_same_v<T, event::SettingsAck>) {
                out << "SettingsAck " << (ev.started ? "started" : "done");
            } else if constexpr (std::is_same_v<T, event::LedEffectMode>) {
                out << "LedEffectMode effect=" << static_cast<int>(ev.effect_id);
            } else if constexpr (std::is_same_v<T, event::LedEffectSpeed>) {
                out << "LedEffectSpeed speed=" << static_cast<int>(ev.speed);
            } else if constexpr (std::is_same_v<T, event::BrightnessLevel>) {
                out << "BrightnessLevel level=" << static_cast<int>(ev.level);
            } else if constexpr (std::is_same_v<T, event::LedColor>) {
                out << "LedColor color=" << static_cast<int>(ev.color);
            } else if constexpr (std::is_same_v<T, event::WinLockToggle>) {
                out << "WinLock " << onOff(ev.locked);
            } else if constexpr (std::is_same_v<T, event::WasdSwapToggle>) {
                out << "WasdSwap " << onOff(ev.swapped);
            } else if constexpr (std::is_same_v<T, event::FnLayerToggle>) {
                out << "FnLayer layer=" << static_cast<int>(ev.layer);
            } else if constexpr (std::is_same_v<T, event::BacklightToggle>) {
                out << "BacklightToggle";
            } else if constexpr (std::is_same_v<T, event::DialModeToggle>) {
                out << "DialModeToggle";
            } else if constexpr (std::is_same_v<T, event::UnknownKbFunc>) {
                out << "KbFunc category=" << static_cast<int>(ev.category)
                    << " action=" << static_cast<int>(ev.action);
            } else if constexpr (std::is_same_v<T, event::Battery>) {
                out << "Battery level=" << static_cast<int>(ev.level)
                    << " charging=" << onOff(ev.charging)
                    << " online=" << onOff(ev.online);
            } else if constexpr (std::is_same_v<T, event::MouseReport>) {
                out << "Mouse buttons=" << static_cast<int>(ev.buttons)
                    << " x=" << ev.x << " y=" << ev.y << " wheel=" << ev.wheel;
            } else {
                out << "Unknown (" << ev.raw.size() << " bytes)" << std::hex << std::setfill('0');
                std::size_t shown = 0;
                for (auto byte : ev.raw) {
                    if (shown++ == 8) {
                        out << " ...";
                        break;
                    }
                    out << ' ' << std::setw(2) << static_cast<int>(byte);
                }
            }
        },
        event);
    return out.str();
}

}  // namespace kb::transport
