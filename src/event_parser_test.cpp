#include <doctest/doctest.h>

#include <string>
#include <variant>

#include "keyboard_transport/event_parser.hpp"
#include "keyboard_transport/protocol.hpp"

using namespace kb::transport;

TEST_CASE("event parser - keyboard function toggles") {
    const auto locked = parseUsbEvent(Bytes{0x03, 0x01, 0x01});
    REQUIRE(std::holds_alternative<event::WinLockToggle>(locked));
    CHECK(std::get<event::WinLockToggle>(locked).locked);

    const auto unlocked = parseUsbEvent(Bytes{0x05, 0x03, 0x00, 0x01});
    REQUIRE(std::holds_alternative<event::WinLockToggle>(unlocked));
    CHECK_FALSE(std::get<event::WinLockToggle>(unlocked).locked);

    const auto wasd = parseUsbEvent(Bytes{0x05, 0x03, 0x08, 0x03});
    REQUIRE(std::holds_alternative<event::WasdSwapToggle>(wasd));
    CHECK(std::get<event::WasdSwapToggle>(wasd).swapped);

    const auto fn = parseUsbEvent(Bytes{0x05, 0x03, 0x02, 0x08});
    REQUIRE(std::holds_alternative<event::FnLayerToggle>(fn));
    CHECK(std::get<event::FnLayerToggle>(fn).layer == 2);

    CHECK(std::holds_alternative<event::BacklightToggle>(parseUsbEvent(Bytes{0x05, 0x03, 0x00, 0x09})));
    CHECK(std::holds_alternative<event::DialModeToggle>(parseUsbEvent(Bytes{0x05, 0x03, 0x00, 0x11})));

    const auto other = parseUsbEvent(Bytes{0x05, 0x03, 0x04, 0x42});
    REQUIRE(std::holds_alternative<event::UnknownKbFunc>(other));
    CHECK(std::get<event::UnknownKbFunc>(other).category == 0x04);
    CHECK(std::get<event::UnknownKbFunc>(other).action == 0x42);
}

TEST_CASE("event parser - lighting notifications") {
    const auto brightness = parseUsbEvent(Bytes{0x06, 0x03});
    REQUIRE(std::holds_alternative<event::BrightnessLevel>(brightness));
    CHECK(std::get<event::BrightnessLevel>(brightness).level == 3);

    const auto mode = parseUsbEvent(Bytes{0x05, 0x04, 0x0A});
    REQUIRE(std::holds_alternative<event::LedEffectMode>(mode));
    CHECK(std::get<event::LedEffectMode>(mode).effect_id == 0x0A);

    // 0x05 after the report id is a speed notification, not another report id.
    const auto speed = parseUsbEvent(Bytes{0x05, 0x05, 0x02});
    REQUIRE(std::holds_alternative<event::LedEffectSpeed>(speed));
    CHECK(std::get<event::LedEffectSpeed>(speed).speed == 2);

    const auto color = parseUsbEvent(Bytes{0x05, 0x07, 0x06});
    REQUIRE(std::holds_alternative<event::LedColor>(color));
    CHECK(std::get<event::LedColor>(color).color == 6);

    const auto profile = parseUsbEvent(Bytes{0x05, 0x01, 0x02});
    REQUIRE(std::holds_alternative<event::ProfileChange>(profile));
    CHECK(std::get<event::ProfileChange>(profile).profile == 2);
}

TEST_CASE("event parser - key depth and battery") {
    const auto depth = parseUsbEvent(Bytes{0x05, 0x1B, 0x34, 0x12, 0x2A, 0x00});
    REQUIRE(std::holds_alternative<event::KeyDepth>(depth));
    CHECK(std::get<event::KeyDepth>(depth).key_index == 0x2A);
    CHECK(std::get<event::KeyDepth>(depth).depth_raw == 0x1234);

    CHECK(std::holds_alternative<event::Unknown>(parseUsbEvent(Bytes{0x05, 0x1B, 0x34})));

    const auto battery = parseUsbEvent(Bytes{0x05, 0x88, 0x00, 0x00, 0x55, 0x03});
    REQUIRE(std::holds_alternative<event::Battery>(battery));
    const auto& status = std::get<event::Battery>(battery);
    CHECK(status.level == 0x55);
    CHECK(status.online);
    CHECK(status.charging);

    const auto unplugged = std::get<event::Battery>(parseUsbEvent(Bytes{0x05, 0x88, 0, 0, 40, 0x02}));
    CHECK(unplugged.online);
    CHECK_FALSE(unplugged.charging);
}

TEST_CASE("event parser - magnetism report acknowledgements") {
    CHECK(std::holds_alternative<event::MagnetismStart>(parseUsbEvent(Bytes{0x05, 0x0F, 0x01, 0x1B})));
    CHECK(std::holds_alternative<event::MagnetismStop>(parseUsbEvent(Bytes{0x05, 0x0F, 0x00, 0x1B})));

    const auto ack = parseUsbEvent(Bytes{0x05, 0x0F, 0x01, 0x07});
    REQUIRE(std::holds_alternative<event::SettingsAck>(ack));
    CHECK(std::get<event::SettingsAck>(ack).started);
    CHECK_FALSE(std::get<event::SettingsAck>(parseUsbEvent(Bytes{0x05, 0x0F, 0x00})).started);
}

TEST_CASE("event parser - wake requires an all-zero payload") {
    CHECK(std::holds_alternative<event::Wake>(parseUsbEvent(Bytes{0x05, 0x00, 0x00, 0x00, 0x00})));
    CHECK(std::holds_alternative<event::Wake>(parseUsbEvent(Bytes{0x05, 0x00})));
    CHECK(std::holds_alternative<event::Unknown>(parseUsbEvent(Bytes{0x05, 0x00, 0x00, 0x07})));
}

TEST_CASE("event parser - mouse reports") {
    const auto mouse = parseUsbEvent(Bytes{0x02, 0x01, 0x00, 0xFF, 0xFF, 0x05, 0x00, 0x01, 0x00});
    REQUIRE(std::holds_alternative<event::MouseReport>(mouse));
    const auto& report = std::get<event::MouseReport>(mouse);
    CHECK(report.buttons == 1);
    CHECK(report.x == -1);
    CHECK(report.y == 5);
    CHECK(report.wheel == 1);

    const auto no_wheel = std::get<event::MouseReport>(
        parseUsbEvent(Bytes{0x02, 0x00, 0x00, 0x10, 0x00, 0x00, 0x00}));
    CHECK(no_wheel.x == 16);
    CHECK(no_wheel.wheel == 0);
}

TEST_CASE("event parser - bluetooth framing") {
    const auto depth = parseBleEvent(Bytes{0x06, 0x66, 0x1B, 0x10, 0x00, 0x05, 0x00});
    REQUIRE(std::holds_alternative<event::KeyDepth>(depth));
    CHECK(std::get<event::KeyDepth>(depth).key_index == 5);
    CHECK(std::get<event::KeyDepth>(depth).depth_raw == 0x10);

    const auto lock = parseBleEvent(Bytes{0x06, 0x66, 0x03, 0x01, 0x01});
    REQUIRE(std::holds_alternative<event::WinLockToggle>(lock));

    // Some firmware drops the event marker.
    const auto brightness = parseBleEvent(Bytes{0x05, 0x06, 0x04});
    REQUIRE(std::holds_alternative<event::BrightnessLevel>(brightness));
    CHECK(std::get<event::BrightnessLevel>(brightness).level == 4);

    CHECK(std::holds_alternative<event::Unknown>(parseBleEvent(Bytes{0x06, 0x66})));
    CHECK(std::holds_alternative<event::Unknown>(parseBleEvent(Bytes{0x01, 0x02, 0x03})));
}

TEST_CASE("event parser - unknown reports keep their bytes") {
    const Bytes raw{0x05, 0x42, 0x01};
    const auto parsed = parseUsbEvent(raw);
    REQUIRE(std::holds_alternative<event::Unknown>(parsed));
    CHECK(std::get<event::Unknown>(parsed).raw == raw);
    CHECK(std::holds_alternative<event::Unknown>(parseUsbEvent(Bytes{})));
}

TEST_CASE("event parser - parser follows transport") {
    const Bytes ble_report{0x06, 0x66, 0x06, 0x02};
    CHECK(std::holds_alternative<event::BrightnessLevel>(parserFor(TransportType::HidBluetooth)(ble_report)));
    CHECK(std::holds_alternative<event::BrightnessLevel>(parserFor(TransportType::HidDongle)(Bytes{0x05, 0x06, 0x02})));
}

TEST_CASE("vendor event - describe") {
    CHECK(describe(event::WinLockToggle{true}) == "WinLock on");
    CHECK(describe(event::KeyDepth{3, 200}) == "KeyDepth key=3 depth=200");
    CHECK(describe(event::Unknown{Bytes{0xAB, 0x01}}) == "Unknown (2 bytes) ab 01");
}
