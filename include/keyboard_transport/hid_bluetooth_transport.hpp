#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "keyboard_transport/device_transport.hpp"
#include "keyboard_transport/hid_device.hpp"

namespace kb::transport {

struct BleReadTiming {
    std::chrono::milliseconds per_attempt{50};
    std::chrono::milliseconds deadline{500};
};

// Bluetooth LE through the OS HID-over-GATT driver. Commands are output
// reports on the 0xFF55 vendor collection; replies arrive as input reports on
// the same collection, interleaved with 0x66 event frames that are skipped.
class HidBluetoothTransport : public DeviceTransport {
public:
    explicit HidBluetoothTransport(std::unique_ptr<HidHandle> vendor, BleReadTiming timing = {});

    [[nodiscard]] std::string id() const override;
    [[nodiscard]] TransportType type() const noexcept override;

    void writeFrame(const Bytes& frame) override;
    // First non-event frame within the read deadline, empty otherwise.
    Bytes readFrame() override;

    bool isConnected() override;
    void close() override;

private:
    HidHandle& handleLocked();

    std::mutex mutex_;
    std::unique_ptr<HidHandle> vendor_;
    BleReadTiming timing_;
};

}  // namespace kb::transport
