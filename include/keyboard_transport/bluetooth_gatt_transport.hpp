#pragma once

#include <string>

#include "keyboard_transport/device_transport.hpp"

namespace kb::transport {

// Native GATT link (talking to the characteristics directly instead of going
// through the OS HID driver). Not built yet: every I/O call throws the same
// TransportError(Unimplemented) so callers can tell it apart from a failure.
class BluetoothGattTransport : public DeviceTransport {
public:
    static constexpr const char* kUnimplementedMessage =
        "native Bluetooth GATT transport is not implemented";

    [[nodiscard]] std::string id() const override;
    [[nodiscard]] TransportType type() const noexcept override;

    void writeFrame(const Bytes& frame) override;
    Bytes readFrame() override;
    void flush() override;
    BatteryStatus batteryStatus() override;

    bool isConnected() override;
    void close() override;
};

}  // namespace kb::transport
