#include "keyboard_transport/bluetooth_gatt_transport.hpp"

#include "keyboard_transport/transport_error.hpp"

namespace kb::transport {

namespace {

[[noreturn]] void unimplemented() {
    throw TransportError(ErrorKind::Unimplemented, BluetoothGattTransport::kUnimplementedMessage);
}

}  // namespace

std::string BluetoothGattTransport::id() const {
    return "bluetooth-gatt";
}

TransportType BluetoothGattTransport::type() const noexcept {
    return TransportType::BluetoothGatt;
}

void BluetoothGattTransport::writeFrame(const Bytes&) {
    unimplemented();
}

Bytes BluetoothGattTransport::readFrame() {
    unimplemented();
}

void BluetoothGattTransport::flush() {
    unimplemented();
}

BatteryStatus BluetoothGattTransport::batteryStatus() {
    unimplemented();
}

bool BluetoothGattTransport::isConnected() {
    return false;
}

void BluetoothGattTransport::close() {}

}  // namespace kb::transport
