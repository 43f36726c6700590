#pragma once

#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>

#include "keyboard_transport/device_transport.hpp"

namespace kb::transport {

// Traffic monitor: forwards to the wrapped backend and hex-dumps every frame
// written and read, plus each flush.
class LoggingTransport : public DeviceTransport {
public:
    explicit LoggingTransport(std::unique_ptr<DeviceTransport> inner);
    LoggingTransport(std::unique_ptr<DeviceTransport> inner, std::ostream& out);

    [[nodiscard]] std::string id() const override;
    [[nodiscard]] TransportType type() const noexcept override;

    void writeFrame(const Bytes& frame) override;
    Bytes readFrame() override;
    void flush() override;
    BatteryStatus batteryStatus() override;

    bool isConnected() override;
    void close() override;

private:
    void dump(const char* direction, const Bytes& frame);

    std::unique_ptr<DeviceTransport> inner_;
    std::ostream& out_;
    std::mutex mutex_;
};

}  // namespace kb::transport
