#include "keyboard_transport/discovery.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

#include "keyboard_transport/bluetooth_gatt_transport.hpp"
#include "keyboard_transport/event_parser.hpp"
#include "keyboard_transport/hid_wired_transport.hpp"
#include "keyboard_transport/logging_transport.hpp"
#include "keyboard_transport/protocol.hpp"
#include "keyboard_transport/transport_error.hpp"

namespace kb::transport {

namespace {

std::string hexId(std::uint16_t vid, std::uint16_t pid) {
    std::ostringstream out;
    out << std::uppercase << std::hex << std::setfill('0') << std::setw(4) << vid << ':'
        << std::setw(4) << pid;
    return out.str();
}

int preference(TransportType type) {
    switch (type) {
    case TransportType::HidBluetooth:
        return 0;
    case TransportType::HidDongle:
        return 1;
    case TransportType::HidWired:
        return 2;
    case TransportType::BluetoothGatt:
        break;
    }
    return 3;
}

}  // namespace

FlowClientOptions DiscoveryOptions::clientOptionsFor(TransportType type) const {
    FlowClientOptions options;
    switch (type) {
    case TransportType::HidDongle:
        options.policy = dongle_policy;
        break;
    case TransportType::HidBluetooth:
    case TransportType::BluetoothGatt:
        options.policy = bluetooth_policy;
        break;
    case TransportType::HidWired:
        options.policy = wired_policy;
        break;
    }
    options.heuristics = dongle;
    options.trace = trace;
    return options;
}

EventReaderOptions DiscoveryOptions::eventOptionsFor(TransportType type) const {
    if (type == TransportType::HidBluetooth || type == TransportType::BluetoothGatt) {
        return ble_events;
    }
    return usb_events;
}

HidDiscovery::HidDiscovery(HidBus& bus, DeviceRegistry registry, DiscoveryOptions options)
    : bus_(bus), registry_(std::move(registry)), options_(std::move(options)) {}

std::vector<DeviceDescriptor> HidDiscovery::listDevices() {
    std::vector<DeviceDescriptor> devices;
    for (const auto& info : bus_.enumerate(registry_.vendor_id)) {
        const auto type = registry_.classify(info);
        if (!type || !registry_.isCommandInterface(info, *type)) {
            continue;
        }

        DeviceDescriptor device;
        device.vendor_id = info.vendor_id;
        device.product_id = info.product_id;
        device.transport = *type;
        device.path = info.path;
        device.serial = info.serial;
        device.product_name = info.product_name;
        device.is_dongle = registry_.isDonglePid(info.product_id);

        if (options_.trace) {
            std::cout << "[HidDiscovery] Found " << hexId(device.vendor_id, device.product_id)
                      << " (" << transportTypeName(device.transport) << ") at " << device.path
                      << '\n';
        }
        devices.push_back(std::move(device));
    }

    std::cout << "[HidDiscovery] Found " << devices.size() << " devices" << '\n';
    return devices;
}

std::unique_ptr<DeviceTransport> HidDiscovery::makeBackend(const DeviceDescriptor& device) {
    std::unique_ptr<DeviceTransport> backend;
    switch (device.transport) {
    case TransportType::HidWired:
        backend = std::make_unique<HidWiredTransport>(bus_.open(device.path));
        break;
    case TransportType::HidDongle:
        backend = std::make_unique<HidDongleTransport>(bus_.open(device.path), options_.dongle);
        break;
    case TransportType::HidBluetooth:
        backend = std::make_unique<HidBluetoothTransport>(bus_.open(device.path), options_.ble_read);
        break;
    case TransportType::BluetoothGatt:
        backend = std::make_unique<BluetoothGattTransport>();
        break;
    }

    if (options_.traffic) {
        backend = std::make_unique<LoggingTransport>(std::move(backend));
    }
    return backend;
}

std::unique_ptr<EventReader> HidDiscovery::openEvents(const DeviceDescriptor& device) {
    if (device.transport == TransportType::BluetoothGatt) {
        return nullptr;
    }

    std::vector<HidInterfaceInfo> candidates;
    for (auto& info : bus_.enumerate(device.vendor_id)) {
        if (info.product_id != device.product_id) {
            continue;
        }
        if (!registry_.isInputInterface(info, device.transport)) {
            continue;
        }
        // Identical boards share vid:pid; their serials keep the collections apart.
        if (device.serial && info.serial && *info.serial != *device.serial) {
            continue;
        }
        candidates.push_back(std::move(info));
    }
    if (candidates.empty()) {
        return nullptr;
    }

    std::stable_partition(candidates.begin(), candidates.end(), [&device](const HidInterfaceInfo& info) {
        return device.serial && info.serial == device.serial;
    });
    const auto& chosen = candidates.front();
    if (candidates.size() > 1 && !(device.serial && chosen.serial == device.serial)) {
        std::cerr << "[HidDiscovery] " << candidates.size() << " input interfaces match "
                  << hexId(device.vendor_id, device.product_id) << ", using " << chosen.path
                  << '\n';
    }

    try {
        auto input = bus_.open(chosen.path);
        return std::make_unique<EventReader>(std::move(input),
                                             parserFor(device.transport),
                                             options_.eventOptionsFor(device.transport),
                                             transportTypeName(device.transport));
    } catch (const TransportError& e) {
        std::cerr << "[HidDiscovery] Input interface " << chosen.path
                  << " unavailable, events disabled: " << e.what() << '\n';
        return nullptr;
    }
}

std::unique_ptr<FlowControlClient> HidDiscovery::open(const DeviceDescriptor& device) {
    auto backend = makeBackend(device);
    auto events = openEvents(device);
    const bool has_events = events != nullptr;

    auto client = std::make_unique<FlowControlClient>(
        device, std::move(backend), std::move(events), options_.clientOptionsFor(device.transport));

    std::cout << "[HidDiscovery] Opened " << transportTypeName(device.transport) << " transport for "
              << hexId(device.vendor_id, device.product_id)
              << (has_events ? " with events" : "") << '\n';
    return client;
}

std::unique_ptr<FlowControlClient> HidDiscovery::openFirst() {
    const auto devices = listDevices();
    if (devices.empty()) {
        throw TransportError(ErrorKind::DeviceNotFound, "no registered keyboard attached");
    }
    return open(devices.front());
}

ProbedDevice HidDiscovery::probe(const DeviceDescriptor& device) {
    ProbedDevice probed;
    probed.device = device;

    try {
        auto client = open(device);
        const Bytes reply = client->query(cmd::GET_USB_VERSION);
        // [0x8F, id0, id1, id2, id3, _, _, ver_lo, ver_hi]
        if (reply.size() >= 5 && reply[0] == cmd::GET_USB_VERSION) {
            probed.responsive = true;
            probed.device_id = static_cast<std::uint32_t>(reply[1]) |
                               (static_cast<std::uint32_t>(reply[2]) << 8) |
                               (static_cast<std::uint32_t>(reply[3]) << 16) |
                               (static_cast<std::uint32_t>(reply[4]) << 24);
            if (reply.size() >= 9) {
                probed.version = static_cast<std::uint16_t>(reply[7] | (reply[8] << 8));
            }
        }
    } catch (const TransportError& e) {
        std::cerr << "[HidDiscovery] Probe of " << transportTypeName(device.transport) << " at "
                  << device.path << " failed: " << e.what() << '\n';
    }
    return probed;
}

std::vector<ProbedDevice> HidDiscovery::probeDevices() {
    std::vector<ProbedDevice> probed;
    for (const auto& device : listDevices()) {
        probed.push_back(probe(device));
    }

    std::stable_sort(probed.begin(), probed.end(), [](const ProbedDevice& a, const ProbedDevice& b) {
        if (a.responsive != b.responsive) {
            return a.responsive;
        }
        return preference(a.device.transport) < preference(b.device.transport);
    });

    const auto responsive = std::count_if(probed.begin(), probed.end(),
                                          [](const ProbedDevice& p) { return p.responsive; });
    std::cout << "[HidDiscovery] Probed " << probed.size() << " devices: " << responsive
              << " responsive" << '\n';
    return probed;
}

std::unique_ptr<FlowControlClient> HidDiscovery::openPreferred() {
    return openPreferred(probeDevices());
}

std::unique_ptr<FlowControlClient> HidDiscovery::openPreferred(const std::vector<ProbedDevice>& probed) {
    if (probed.empty()) {
        throw TransportError(ErrorKind::DeviceNotFound, "no registered keyboard attached");
    }
    if (!probed.front().responsive) {
        std::cerr << "[HidDiscovery] No device answered, falling back to "
                  << transportTypeName(probed.front().device.transport) << '\n';
    }
    return open(probed.front().device);
}

std::vector<std::unique_ptr<FlowControlClient>> HidDiscovery::openAllResponsive() {
    const auto probed = probeDevices();

    std::vector<std::unique_ptr<FlowControlClient>> clients;
    for (const auto& candidate : probed) {
        if (!candidate.responsive) {
            continue;
        }
        try {
            clients.push_back(open(candidate.device));
        } catch (const TransportError& e) {
            std::cerr << "[HidDiscovery] Failed to reopen " << transportTypeName(candidate.device.transport)
                      << " at " << candidate.device.path << ": " << e.what() << '\n';
        }
    }

    if (clients.empty() && !probed.empty()) {
        throw TransportError(ErrorKind::DeviceNotFound, "no device answered the version query");
    }
    return clients;
}

}  // namespace kb::transport
