#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <hidapi/hidapi.h>

#include "keyboard_transport/hid_device.hpp"

namespace kb::transport {

class HidapiDevice : public HidHandle {
public:
    HidapiDevice(hid_device* device, std::string path, std::shared_ptr<void> runtime);
    ~HidapiDevice() override;

    void sendFeatureReport(const Bytes& report) override;
    Bytes getFeatureReport(std::uint8_t report_id, std::size_t size) override;
    void write(const Bytes& report) override;
    Bytes readTimeout(std::size_t max_size, std::chrono::milliseconds timeout) override;
    std::string productString() override;

private:
    struct HidDeleter {
        void operator()(hid_device* device) const noexcept;
    };

    [[noreturn]] void fail(const char* operation);

    std::mutex mutex_;
    std::unique_ptr<hid_device, HidDeleter> handle_;
    std::string path_;
    // Keeps hid_exit from running while this handle is open.
    std::shared_ptr<void> runtime_;
};

class HidapiBus : public HidBus {
public:
    HidapiBus();

    std::vector<HidInterfaceInfo> enumerate(std::uint16_t vendor_id) override;
    std::unique_ptr<HidHandle> open(const std::string& path) override;

private:
    std::shared_ptr<void> runtime_;
};

}  // namespace kb::transport
