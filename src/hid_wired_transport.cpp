#include "keyboard_transport/hid_wired_transport.hpp"

#include <utility>

#include "keyboard_transport/protocol.hpp"
#include "keyboard_transport/transport_error.hpp"

namespace kb::transport {

HidWiredTransport::HidWiredTransport(std::unique_ptr<HidHandle> feature)
    : feature_(std::move(feature)) {}

std::string HidWiredTransport::id() const {
    return "hid-wired";
}

TransportType HidWiredTransport::type() const noexcept {
    return TransportType::HidWired;
}

HidHandle& HidWiredTransport::handleLocked() {
    if (!feature_) {
        throw TransportError(ErrorKind::Io, id() + " is closed");
    }
    return *feature_;
}

void HidWiredTransport::writeFrame(const Bytes& frame) {
    std::lock_guard<std::mutex> lock(mutex_);
    handleLocked().sendFeatureReport(frame);
}

Bytes HidWiredTransport::readFrame() {
    std::lock_guard<std::mutex> lock(mutex_);
    return handleLocked().getFeatureReport(usb::REPORT_ID, usb::FRAME_SIZE);
}

BatteryStatus HidWiredTransport::batteryStatus() {
    // Bus powered.
    return BatteryStatus{100, true, false};
}

bool HidWiredTransport::isConnected() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!feature_) {
        return false;
    }
    try {
        feature_->productString();
        return true;
    } catch (const TransportError&) {
        return false;
    }
}

void HidWiredTransport::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    feature_.reset();
}

}  // namespace kb::transport
