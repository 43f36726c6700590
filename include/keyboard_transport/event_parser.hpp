#pragma once

#include <functional>

#include "keyboard_transport/types.hpp"
#include "keyboard_transport/vendor_event.hpp"

namespace kb::transport {

using EventParser = std::function<VendorEvent(const Bytes&)>;

// Input reports on the wired and dongle links: [0x05][type][value...], the
// report id may be missing. Mouse reports keep their 0x02 report id.
[[nodiscard]] VendorEvent parseUsbEvent(const Bytes& data);

// Bluetooth input reports: [0x06][0x66][type][value...].
[[nodiscard]] VendorEvent parseBleEvent(const Bytes& data);

[[nodiscard]] EventParser parserFor(TransportType type);

}  // namespace kb::transport
