#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "keyboard_transport/device_transport.hpp"
#include "keyboard_transport/hid_device.hpp"

namespace kb::transport {

// Direct USB link: frames go out as SET_FEATURE and come back as GET_FEATURE
// on the vendor interface. One request in flight at a time.
class HidWiredTransport : public DeviceTransport {
public:
    explicit HidWiredTransport(std::unique_ptr<HidHandle> feature);

    [[nodiscard]] std::string id() const override;
    [[nodiscard]] TransportType type() const noexcept override;

    void writeFrame(const Bytes& frame) override;
    Bytes readFrame() override;
    BatteryStatus batteryStatus() override;

    bool isConnected() override;
    void close() override;

protected:
    // Throws TransportError(Io) once closed. Caller holds mutex_.
    HidHandle& handleLocked();

    std::mutex mutex_;
    std::unique_ptr<HidHandle> feature_;
};

}  // namespace kb::transport
