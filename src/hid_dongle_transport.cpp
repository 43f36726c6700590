#include "keyboard_transport/hid_dongle_transport.hpp"

#include <algorithm>
#include <utility>

#include "keyboard_transport/protocol.hpp"
#include "keyboard_transport/transport_error.hpp"
#include "keyboard_transport/wire_codec.hpp"

namespace kb::transport {

bool DongleHeuristics::isEmptyEcho(std::uint8_t echo) const {
    return std::find(empty_echoes.begin(), empty_echoes.end(), echo) != empty_echoes.end();
}

bool DongleHeuristics::isIdle(const Bytes& payload) const {
    if (payload.empty() || isEmptyEcho(payload.front())) {
        return true;
    }
    return std::all_of(payload.begin(), payload.end(), [](std::uint8_t b) { return b == 0; });
}

HidDongleTransport::HidDongleTransport(std::unique_ptr<HidHandle> feature,
                                       DongleHeuristics heuristics)
    : HidWiredTransport(std::move(feature)), heuristics_(std::move(heuristics)) {}

std::string HidDongleTransport::id() const {
    return "hid-dongle";
}

TransportType HidDongleTransport::type() const noexcept {
    return TransportType::HidDongle;
}

void HidDongleTransport::flush() {
    const Bytes frame = encodeUsbFrame(cmd::DONGLE_FLUSH_NOP, {}, ChecksumKind::SumByte1to7);
    std::lock_guard<std::mutex> lock(mutex_);
    handleLocked().sendFeatureReport(frame);
}

DongleStatus HidDongleTransport::queryStatus() {
    const Bytes frame = encodeUsbFrame(cmd::DONGLE_STATUS, {}, ChecksumKind::SumByte1to7);

    Bytes reply;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& handle = handleLocked();
        handle.sendFeatureReport(frame);
        reply = handle.getFeatureReport(usb::REPORT_ID, usb::FRAME_SIZE);
    }

    // [report_id, has_response, level, _, charging, _, rf_ready]
    if (reply.size() < 7) {
        throw TransportError(ErrorKind::ProtocolMismatch,
                             "dongle status reply too short (" + std::to_string(reply.size()) +
                                 " bytes)");
    }
    const std::uint8_t level = reply[2];
    if (level > heuristics_.max_battery_level) {
        throw TransportError(ErrorKind::ProtocolMismatch,
                             "implausible battery level " + std::to_string(level));
    }

    DongleStatus status;
    status.has_response = reply[1] != 0;
    status.battery_level = level;
    status.charging = reply[4] != 0;
    status.rf_ready = reply[6] != 0;
    return status;
}

BatteryStatus HidDongleTransport::batteryStatus() {
    const auto status = queryStatus();
    return BatteryStatus{status.battery_level, status.rf_ready, status.charging};
}

}  // namespace kb::transport
