#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "keyboard_transport/device_registry.hpp"
#include "keyboard_transport/discovery.hpp"

namespace kb::transport {

struct TransportConfig {
    DeviceRegistry registry{DeviceRegistry::defaults()};
    DiscoveryOptions discovery;
    std::chrono::seconds probe_watch{10};
};

// Reads the TOML configuration. Every key is optional and falls back to the
// built-in defaults; malformed values throw std::runtime_error naming the key.
class ConfigLoader {
public:
    [[nodiscard]] TransportConfig loadFromFile(const std::string& path) const;
    [[nodiscard]] TransportConfig loadFromString(std::string_view text,
                                                 std::string_view source = "<inline>") const;
};

}  // namespace kb::transport
