#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "keyboard_transport/hid_wired_transport.hpp"

namespace kb::transport {

// Empirical constants for the 2.4GHz dongle, taken from hardware captures
// rather than a documented protocol.
struct DongleHeuristics {
    // Status replies with a larger battery byte are not status replies.
    std::uint8_t max_battery_level{100};
    // Echo bytes that mean "slot empty" rather than a reply. Bulk table
    // replies carry data from byte 0, so 0x00 is not one of them.
    std::vector<std::uint8_t> empty_echoes{0xFC};

    [[nodiscard]] bool isEmptyEcho(std::uint8_t echo) const;
    // [echo][data...] with an empty echo or nothing but zeros.
    [[nodiscard]] bool isIdle(const Bytes& payload) const;
};

// Answered by the dongle itself, without a round trip to the keyboard.
struct DongleStatus {
    bool has_response{false};
    std::uint8_t battery_level{0};
    bool charging{false};
    bool rf_ready{false};
};

// Store-and-forward RF receiver. Raw I/O is the same as the wired link; the
// dongle polls the keyboard on its own schedule, so a read may return a
// reply to an earlier command. flush() pushes the next buffered reply into
// the readable slot.
class HidDongleTransport : public HidWiredTransport {
public:
    HidDongleTransport(std::unique_ptr<HidHandle> feature, DongleHeuristics heuristics = {});

    [[nodiscard]] std::string id() const override;
    [[nodiscard]] TransportType type() const noexcept override;

    void flush() override;
    BatteryStatus batteryStatus() override;

    // Throws TransportError(ProtocolMismatch) when the reply does not look
    // like a status block.
    DongleStatus queryStatus();

    [[nodiscard]] const DongleHeuristics& heuristics() const noexcept { return heuristics_; }

private:
    DongleHeuristics heuristics_;
};

}  // namespace kb::transport
