#include "keyboard_transport/hidapi_device.hpp"

#include <iostream>
#include <utility>

#include "keyboard_transport/transport_error.hpp"

namespace kb::transport {

namespace {

// hidapi hands out wide strings; everything here is ASCII in practice.
std::string narrow(const wchar_t* wide) {
    std::string result;
    if (wide == nullptr) {
        return result;
    }
    while (*wide != L'\0') {
        wchar_t wc = *wide++;
        if (wc < 0x80) {
            result.push_back(static_cast<char>(wc));
        } else {
            result.push_back('?');
        }
    }
    return result;
}

std::string narrowError(hid_device* device) {
    const wchar_t* werror = hid_error(device);
    if (werror == nullptr) {
        return "unknown";
    }
    return narrow(werror);
}

std::optional<std::string> optionalNarrow(const wchar_t* wide) {
    if (wide == nullptr || *wide == L'\0') {
        return std::nullopt;
    }
    return narrow(wide);
}

HidBusType busTypeOf(const hid_device_info* info) {
    switch (info->bus_type) {
    case HID_API_BUS_USB:
        return HidBusType::Usb;
    case HID_API_BUS_BLUETOOTH:
        return HidBusType::Bluetooth;
    case HID_API_BUS_I2C:
        return HidBusType::I2c;
    case HID_API_BUS_SPI:
        return HidBusType::Spi;
    default:
        return HidBusType::Unknown;
    }
}

struct HidapiRuntime {
    HidapiRuntime() {
        if (hid_init() != 0) {
            throw TransportError(ErrorKind::Io, "hid_init failed");
        }
    }
    ~HidapiRuntime() { hid_exit(); }

    HidapiRuntime(const HidapiRuntime&) = delete;
    HidapiRuntime& operator=(const HidapiRuntime&) = delete;
};

// hid_init once for as long as any bus or device is alive.
std::shared_ptr<void> acquireRuntime() {
    static std::mutex mutex;
    static std::weak_ptr<HidapiRuntime> current;

    std::lock_guard<std::mutex> lock(mutex);
    auto runtime = current.lock();
    if (!runtime) {
        runtime = std::make_shared<HidapiRuntime>();
        current = runtime;
    }
    return runtime;
}

}  // namespace

void HidapiDevice::HidDeleter::operator()(hid_device* device) const noexcept {
    if (device != nullptr) {
        hid_close(device);
    }
}

HidapiDevice::HidapiDevice(hid_device* device, std::string path, std::shared_ptr<void> runtime)
    : handle_(device), path_(std::move(path)), runtime_(std::move(runtime)) {}

HidapiDevice::~HidapiDevice() {
    handle_.reset();
}

void HidapiDevice::fail(const char* operation) {
    throw TransportError(ErrorKind::Io, std::string(operation) + " failed on " + path_ + ": " +
                                            narrowError(handle_.get()));
}

void HidapiDevice::sendFeatureReport(const Bytes& report) {
    std::lock_guard<std::mutex> lock(mutex_);
    int res = hid_send_feature_report(handle_.get(), report.data(), report.size());
    if (res < 0) {
        fail("send_feature_report");
    }
}

Bytes HidapiDevice::getFeatureReport(std::uint8_t report_id, std::size_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    Bytes buffer(size, 0);
    buffer[0] = report_id;
    int res = hid_get_feature_report(handle_.get(), buffer.data(), buffer.size());
    if (res < 0) {
        fail("get_feature_report");
    }
    buffer.resize(static_cast<std::size_t>(res));
    return buffer;
}

void HidapiDevice::write(const Bytes& report) {
    std::lock_guard<std::mutex> lock(mutex_);
    int res = hid_write(handle_.get(), report.data(), report.size());
    if (res < 0) {
        fail("write");
    }
}

Bytes HidapiDevice::readTimeout(std::size_t max_size, std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    Bytes buffer(max_size, 0);
    int res = hid_read_timeout(handle_.get(), buffer.data(), buffer.size(),
                               static_cast<int>(timeout.count()));
    if (res < 0) {
        fail("read_timeout");
    }
    buffer.resize(static_cast<std::size_t>(res));
    return buffer;
}

std::string HidapiDevice::productString() {
    std::lock_guard<std::mutex> lock(mutex_);
    wchar_t buffer[256] = {};
    if (hid_get_product_string(handle_.get(), buffer, 255) < 0) {
        fail("get_product_string");
    }
    return narrow(buffer);
}

HidapiBus::HidapiBus() : runtime_(acquireRuntime()) {}

std::vector<HidInterfaceInfo> HidapiBus::enumerate(std::uint16_t vendor_id) {
    std::vector<HidInterfaceInfo> result;
    hid_device_info* list = hid_enumerate(vendor_id, 0);
    for (auto* current = list; current != nullptr; current = current->next) {
        HidInterfaceInfo info;
        info.path = current->path != nullptr ? current->path : "";
        info.vendor_id = current->vendor_id;
        info.product_id = current->product_id;
        info.usage_page = current->usage_page;
        info.usage = current->usage;
        info.interface_number = current->interface_number;
        info.bus = busTypeOf(current);
        info.serial = optionalNarrow(current->serial_number);
        info.product_name = optionalNarrow(current->product_string);
        result.push_back(std::move(info));
    }
    hid_free_enumeration(list);
    return result;
}

std::unique_ptr<HidHandle> HidapiBus::open(const std::string& path) {
    hid_device* device = hid_open_path(path.c_str());
    if (device == nullptr) {
        std::cerr << "[HidapiBus] Unable to open " << path << ": " << narrowError(nullptr) << '\n';
        throw TransportError(ErrorKind::Io, "unable to open " + path);
    }
    return std::make_unique<HidapiDevice>(device, path, runtime_);
}

}  // namespace kb::transport
