#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kb::transport {

using Bytes = std::vector<std::uint8_t>;

enum class ChecksumKind {
    None,
    SumByte1to7,
    SumByte1to8,
};

enum class TransportType {
    HidWired,
    HidDongle,
    HidBluetooth,
    BluetoothGatt,
};

[[nodiscard]] const char* transportTypeName(TransportType type) noexcept;

[[nodiscard]] inline bool isWireless(TransportType type) noexcept {
    return type != TransportType::HidWired;
}

struct DeviceDescriptor {
    std::uint16_t vendor_id{0};
    std::uint16_t product_id{0};
    TransportType transport{TransportType::HidWired};
    std::string path;
    std::optional<std::string> serial;
    std::optional<std::string> product_name;
    bool is_dongle{false};
};

struct BatteryStatus {
    std::uint8_t level{0};
    bool online{false};
    bool charging{false};
};

inline bool operator==(const BatteryStatus& lhs, const BatteryStatus& rhs) {
    return lhs.level == rhs.level && lhs.online == rhs.online && lhs.charging == rhs.charging;
}

}  // namespace kb::transport
