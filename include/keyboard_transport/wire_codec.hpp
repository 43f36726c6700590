#pragma once

#include <cstddef>
#include <cstdint>

#include "keyboard_transport/types.hpp"

namespace kb::transport {

// The two framing dialects. Usb covers both the wired link and the dongle.
enum class Framing {
    Usb,
    Bluetooth,
};

struct ResponseFrame {
    std::uint8_t echo{0};
    // Report id (and Bluetooth marker) stripped: [echo_or_undefined][data...]
    Bytes payload;
};

[[nodiscard]] Framing framingFor(TransportType type) noexcept;

// Bytes available after the command byte in one frame.
[[nodiscard]] std::size_t payloadCapacity(Framing framing) noexcept;

// `body` starts at the command byte. Returns 255 - (sum & 0xFF) over the
// first 7 (SumByte1to7) or 8 (SumByte1to8) bytes; 0 for ChecksumKind::None.
[[nodiscard]] std::uint8_t computeChecksum(const std::uint8_t* body,
                                           std::size_t size,
                                           ChecksumKind kind) noexcept;
void applyChecksum(std::uint8_t* body, std::size_t size, ChecksumKind kind) noexcept;

// Decoding never checks checksums; callers that care use this on the payload.
[[nodiscard]] bool verifyChecksum(const Bytes& body, ChecksumKind kind) noexcept;

// Throws std::length_error when the payload does not fit in one frame.
[[nodiscard]] Bytes encodeUsbFrame(std::uint8_t command,
                                   const Bytes& payload,
                                   ChecksumKind checksum);
[[nodiscard]] Bytes encodeBleFrame(std::uint8_t command,
                                   const Bytes& payload,
                                   ChecksumKind checksum);
[[nodiscard]] Bytes encodeFrame(Framing framing,
                                std::uint8_t command,
                                const Bytes& payload,
                                ChecksumKind checksum);

// Throw FramingError on a truncated frame or, for Bluetooth, a missing
// command/response marker (including frames carrying the event marker).
[[nodiscard]] ResponseFrame decodeUsbFrame(const Bytes& raw);
[[nodiscard]] ResponseFrame decodeBleFrame(const Bytes& raw);
[[nodiscard]] ResponseFrame decodeFrame(Framing framing, const Bytes& raw);

[[nodiscard]] bool isBleEventFrame(const Bytes& raw) noexcept;

}  // namespace kb::transport
