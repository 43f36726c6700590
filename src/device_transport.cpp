#include "keyboard_transport/device_transport.hpp"

#include "keyboard_transport/transport_error.hpp"

namespace kb::transport {

void DeviceTransport::flush() {
    throw TransportError(ErrorKind::Unimplemented, "flush is not supported by " + id());
}

BatteryStatus DeviceTransport::batteryStatus() {
    throw TransportError(ErrorKind::Unimplemented, "battery status is not reported by " + id());
}

}  // namespace kb::transport
