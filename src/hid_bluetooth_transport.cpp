#include "keyboard_transport/hid_bluetooth_transport.hpp"

#include <utility>

#include "keyboard_transport/protocol.hpp"
#include "keyboard_transport/transport_error.hpp"
#include "keyboard_transport/wire_codec.hpp"

namespace kb::transport {

HidBluetoothTransport::HidBluetoothTransport(std::unique_ptr<HidHandle> vendor, BleReadTiming timing)
    : vendor_(std::move(vendor)), timing_(timing) {}

std::string HidBluetoothTransport::id() const {
    return "hid-bluetooth";
}

TransportType HidBluetoothTransport::type() const noexcept {
    return TransportType::HidBluetooth;
}

HidHandle& HidBluetoothTransport::handleLocked() {
    if (!vendor_) {
        throw TransportError(ErrorKind::Io, id() + " is closed");
    }
    return *vendor_;
}

void HidBluetoothTransport::writeFrame(const Bytes& frame) {
    std::lock_guard<std::mutex> lock(mutex_);
    handleLocked().write(frame);
}

Bytes HidBluetoothTransport::readFrame() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& handle = handleLocked();

    const auto deadline = std::chrono::steady_clock::now() + timing_.deadline;
    while (std::chrono::steady_clock::now() < deadline) {
        Bytes data = handle.readTimeout(ble::FRAME_SIZE, timing_.per_attempt);
        if (data.empty() || isBleEventFrame(data)) {
            continue;
        }
        return data;
    }
    return {};
}

bool HidBluetoothTransport::isConnected() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!vendor_) {
        return false;
    }
    try {
        vendor_->productString();
        return true;
    } catch (const TransportError&) {
        return false;
    }
}

void HidBluetoothTransport::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    vendor_.reset();
}

}  // namespace kb::transport
