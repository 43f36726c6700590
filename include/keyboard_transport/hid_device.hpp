#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "keyboard_transport/types.hpp"

namespace kb::transport {

enum class HidBusType {
    Unknown,
    Usb,
    Bluetooth,
    I2c,
    Spi,
};

// One HID interface (top-level collection) as reported by enumeration.
struct HidInterfaceInfo {
    std::string path;
    std::uint16_t vendor_id{0};
    std::uint16_t product_id{0};
    std::uint16_t usage_page{0};
    std::uint16_t usage{0};
    int interface_number{-1};
    HidBusType bus{HidBusType::Unknown};
    std::optional<std::string> serial;
    std::optional<std::string> product_name;
};

// An opened HID interface. All operations throw TransportError(Io) on OS failure.
class HidHandle {
public:
    virtual ~HidHandle() = default;

    virtual void sendFeatureReport(const Bytes& report) = 0;
    // Returns the report as read, report id first.
    virtual Bytes getFeatureReport(std::uint8_t report_id, std::size_t size) = 0;
    virtual void write(const Bytes& report) = 0;
    // Empty when nothing arrived within `timeout`.
    virtual Bytes readTimeout(std::size_t max_size, std::chrono::milliseconds timeout) = 0;
    virtual std::string productString() = 0;
};

class HidBus {
public:
    virtual ~HidBus() = default;

    virtual std::vector<HidInterfaceInfo> enumerate(std::uint16_t vendor_id) = 0;
    virtual std::unique_ptr<HidHandle> open(const std::string& path) = 0;
};

}  // namespace kb::transport
