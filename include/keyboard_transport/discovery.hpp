#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "keyboard_transport/device_registry.hpp"
#include "keyboard_transport/event_reader.hpp"
#include "keyboard_transport/flow_control_client.hpp"
#include "keyboard_transport/hid_bluetooth_transport.hpp"
#include "keyboard_transport/hid_device.hpp"
#include "keyboard_transport/hid_dongle_transport.hpp"

namespace kb::transport {

struct DiscoveryOptions {
    FlowPolicy wired_policy{FlowPolicy::wired()};
    FlowPolicy dongle_policy{FlowPolicy::dongle()};
    FlowPolicy bluetooth_policy{FlowPolicy::bluetooth()};
    EventReaderOptions usb_events{EventReaderOptions::usb()};
    EventReaderOptions ble_events{EventReaderOptions::bluetooth()};
    BleReadTiming ble_read;
    DongleHeuristics dongle;
    bool trace{false};
    // Wrap every backend in a LoggingTransport.
    bool traffic{false};

    [[nodiscard]] FlowClientOptions clientOptionsFor(TransportType type) const;
    [[nodiscard]] EventReaderOptions eventOptionsFor(TransportType type) const;
};

struct ProbedDevice {
    DeviceDescriptor device;
    bool responsive{false};
    std::optional<std::uint32_t> device_id;
    std::optional<std::uint16_t> version;
};

class HidDiscovery {
public:
    HidDiscovery(HidBus& bus, DeviceRegistry registry, DiscoveryOptions options = {});

    // Command interfaces of every registered device currently attached.
    std::vector<DeviceDescriptor> listDevices();

    // Throws TransportError(Io) when the command interface cannot be opened.
    // A missing or unopenable input interface only disables events.
    std::unique_ptr<FlowControlClient> open(const DeviceDescriptor& device);
    // Throws TransportError(DeviceNotFound) when nothing is attached.
    std::unique_ptr<FlowControlClient> openFirst();

    // Opens each device and asks for its firmware version. Responsive devices
    // first, then Bluetooth, dongle, wired.
    std::vector<ProbedDevice> probeDevices();
    std::unique_ptr<FlowControlClient> openPreferred();
    // `probed` as returned by probeDevices().
    std::unique_ptr<FlowControlClient> openPreferred(const std::vector<ProbedDevice>& probed);
    // One client per device that answered the probe, in probe order. Empty
    // when nothing is attached; TransportError(DeviceNotFound) when devices
    // are attached but none answered.
    std::vector<std::unique_ptr<FlowControlClient>> openAllResponsive();

    [[nodiscard]] const DeviceRegistry& registry() const noexcept { return registry_; }

private:
    std::unique_ptr<DeviceTransport> makeBackend(const DeviceDescriptor& device);
    std::unique_ptr<EventReader> openEvents(const DeviceDescriptor& device);
    ProbedDevice probe(const DeviceDescriptor& device);

    HidBus& bus_;
    DeviceRegistry registry_;
    DiscoveryOptions options_;
};

}  // namespace kb::transport
