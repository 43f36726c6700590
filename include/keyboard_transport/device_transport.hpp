#pragma once

#include <string>

#include "keyboard_transport/types.hpp"

namespace kb::transport {

// Raw, uncorrelated frame I/O over one link. Frames are complete wire frames,
// report id included; correlation and retries live in FlowControlClient.
class DeviceTransport {
public:
    virtual ~DeviceTransport() = default;

    [[nodiscard]] virtual std::string id() const = 0;
    [[nodiscard]] virtual TransportType type() const noexcept = 0;

    virtual void writeFrame(const Bytes& frame) = 0;
    // Empty when the link had nothing to read.
    virtual Bytes readFrame() = 0;
    // Dongle only: ask the RF link to surface its next buffered reply.
    virtual void flush();
    virtual BatteryStatus batteryStatus();

    virtual bool isConnected() = 0;
    virtual void close() = 0;
};

}  // namespace kb::transport
