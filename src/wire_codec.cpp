#include "keyboard_transport/wire_codec.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "keyboard_transport/protocol.hpp"
#include "keyboard_transport/transport_error.hpp"

namespace kb::transport {

namespace {

std::size_t checksumSpan(ChecksumKind kind) noexcept {
    switch (kind) {
    case ChecksumKind::SumByte1to7:
        return 7;
    case ChecksumKind::SumByte1to8:
        return 8;
    case ChecksumKind::None:
        break;
    }
    return 0;
}

Bytes buildFrame(std::size_t frame_size,
                 const Bytes& header,
                 std::uint8_t command,
                 const Bytes& payload,
                 ChecksumKind checksum) {
    const std::size_t capacity = frame_size - header.size() - 1;
    if (payload.size() > capacity) {
        throw std::length_error("Payload of " + std::to_string(payload.size()) +
                                " bytes exceeds frame capacity of " +
                                std::to_string(capacity));
    }

    Bytes frame(frame_size, 0);
    std::copy(header.begin(), header.end(), frame.begin());
    const std::size_t body_offset = header.size();
    frame[body_offset] = command;
    std::copy(payload.begin(), payload.end(), frame.begin() + body_offset + 1);
    applyChecksum(frame.data() + body_offset, frame.size() - body_offset, checksum);
    return frame;
}

}  // namespace

Framing framingFor(TransportType type) noexcept {
    return type == TransportType::HidWired || type == TransportType::HidDongle
               ? Framing::Usb
               : Framing::Bluetooth;
}

std::size_t payloadCapacity(Framing framing) noexcept {
    return framing == Framing::Usb ? usb::FRAME_SIZE - 2 : ble::FRAME_SIZE - 3;
}

std::uint8_t computeChecksum(const std::uint8_t* body,
                             std::size_t size,
                             ChecksumKind kind) noexcept {
    const std::size_t span = std::min(checksumSpan(kind), size);
    if (span == 0) {
        return 0;
    }
    unsigned int sum = 0;
    for (std::size_t i = 0; i < span; ++i) {
        sum += body[i];
    }
    return static_cast<std::uint8_t>(255 - (sum & 0xFF));
}

void applyChecksum(std::uint8_t* body, std::size_t size, ChecksumKind kind) noexcept {
    const std::size_t span = checksumSpan(kind);
    if (span == 0 || size <= span) {
        return;
    }
    body[span] = computeChecksum(body, size, kind);
}

bool verifyChecksum(const Bytes& body, ChecksumKind kind) noexcept {
    const std::size_t span = checksumSpan(kind);
    if (span == 0) {
        return true;
    }
    if (body.size() <= span) {
        return false;
    }
    return body[span] == computeChecksum(body.data(), body.size(), kind);
}

Bytes encodeUsbFrame(std::uint8_t command, const Bytes& payload, ChecksumKind checksum) {
    return buildFrame(usb::FRAME_SIZE, {usb::REPORT_ID}, command, payload, checksum);
}

// The checksum covers the slice starting at the command byte; the 0x55
// marker is outside it.
Bytes encodeBleFrame(std::uint8_t command, const Bytes& payload, ChecksumKind checksum) {
    return buildFrame(ble::FRAME_SIZE,
                      {ble::VENDOR_REPORT_ID, ble::CMDRESP_MARKER},
                      command,
                      payload,
                      checksum);
}

Bytes encodeFrame(Framing framing,
                  std::uint8_t command,
                  const Bytes& payload,
                  ChecksumKind checksum) {
    return framing == Framing::Usb ? encodeUsbFrame(command, payload, checksum)
                                   : encodeBleFrame(command, payload, checksum);
}

// The report id is not checked: dongle firmware answers on report id 0 where
// the descriptor promises 5.
ResponseFrame decodeUsbFrame(const Bytes& raw) {
    if (raw.size() < 2) {
        throw FramingError("USB frame truncated (" + std::to_string(raw.size()) + " bytes)");
    }
    ResponseFrame frame;
    frame.payload.assign(raw.begin() + 1, raw.end());
    frame.echo = frame.payload.front();
    return frame;
}

ResponseFrame decodeBleFrame(const Bytes& raw) {
    if (raw.size() < 3) {
        throw FramingError("Bluetooth frame truncated (" + std::to_string(raw.size()) + " bytes)");
    }
    if (raw[0] != ble::VENDOR_REPORT_ID) {
        throw FramingError("Bluetooth frame has unexpected report id " + std::to_string(raw[0]));
    }
    if (raw[1] == ble::EVENT_MARKER) {
        throw FramingError("Bluetooth frame is an event, not a response");
    }
    if (raw[1] != ble::CMDRESP_MARKER) {
        throw FramingError("Bluetooth frame missing command/response marker");
    }
    ResponseFrame frame;
    frame.payload.assign(raw.begin() + 2, raw.end());
    frame.echo = frame.payload.front();
    return frame;
}

ResponseFrame decodeFrame(Framing framing, const Bytes& raw) {
    return framing == Framing::Usb ? decodeUsbFrame(raw) : decodeBleFrame(raw);
}

bool isBleEventFrame(const Bytes& raw) noexcept {
    return raw.size() >= 2 && raw[0] == ble::VENDOR_REPORT_ID && raw[1] == ble::EVENT_MARKER;
}

}  // namespace kb::transport
