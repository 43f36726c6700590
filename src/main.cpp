#include <chrono>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>

#include "keyboard_transport/config_loader.hpp"
#include "keyboard_transport/discovery.hpp"
#include "keyboard_transport/hidapi_device.hpp"
#include "keyboard_transport/protocol.hpp"
#include "keyboard_transport/transport_error.hpp"

using kb::transport::ConfigLoader;
using kb::transport::FlowControlClient;
using kb::transport::HidapiBus;
using kb::transport::HidDiscovery;
using kb::transport::ProbedDevice;
using kb::transport::TransportConfig;
using kb::transport::TransportError;

namespace {

void printDevice(const ProbedDevice& probed) {
    const auto& device = probed.device;
    std::cout << "  " << kb::transport::transportTypeName(device.transport) << "  "
              << std::hex << std::setfill('0') << std::setw(4) << device.vendor_id << ':'
              << std::setw(4) << device.product_id << std::dec << std::setfill(' ') << "  "
              << device.product_name.value_or("(unnamed)") << "  " << device.path;
    if (probed.responsive) {
        std::cout << "  id=" << probed.device_id.value_or(0);
        if (probed.version) {
            std::cout << " fw=0x" << std::hex << *probed.version << std::dec;
        }
    } else {
        std::cout << "  (no reply)";
    }
    std::cout << '\n';
}

void printBattery(FlowControlClient& client) {
    try {
        const auto battery = client.batteryStatus();
        std::cout << "Battery: " << static_cast<int>(battery.level) << "%"
                  << (battery.charging ? " charging" : "")
                  << (battery.online ? "" : " (offline)") << '\n';
    } catch (const TransportError& ex) {
        std::cout << "Battery: unavailable (" << ex.what() << ")" << '\n';
    }
}

void watchEvents(FlowControlClient& client, std::chrono::seconds duration) {
    auto receiver = client.subscribeEvents();
    if (!receiver) {
        std::cout << "No input interface, skipping event watch" << '\n';
        return;
    }

    std::cout << "Watching events for " << duration.count() << "s" << '\n';
    const auto deadline = std::chrono::steady_clock::now() + duration;
    kb::transport::TimestampedEvent stamped;
    while (std::chrono::steady_clock::now() < deadline) {
        switch (receiver->recvFor(stamped, std::chrono::milliseconds(100))) {
        case kb::transport::RecvStatus::Ok:
            std::cout << std::fixed << std::setprecision(3) << '[' << stamped.seconds() << "s] "
                      << kb::transport::describe(stamped.event) << '\n';
            break;
        case kb::transport::RecvStatus::Lagged:
            std::cout << "(missed " << receiver->missed() << " events)" << '\n';
            break;
        case kb::transport::RecvStatus::Closed:
            return;
        case kb::transport::RecvStatus::Empty:
            break;
        }
    }
}

}  // namespace

int main(int argc, char** argv) {
    try {
        std::string config_path = "configs/keyboard_transport.toml";
        if (argc > 1) {
            config_path = argv[1];
        }

        ConfigLoader loader;
        TransportConfig config = loader.loadFromFile(config_path);

        HidapiBus bus;
        HidDiscovery discovery(bus, config.registry, config.discovery);

        const auto probed = discovery.probeDevices();
        std::cout << "Devices:" << '\n';
        for (const auto& device : probed) {
            printDevice(device);
        }

        auto client = discovery.openPreferred(probed);
        std::cout << "Using " << kb::transport::transportTypeName(client->transportType()) << " at "
                  << client->descriptor().path << '\n';

        printBattery(*client);
        watchEvents(*client, config.probe_watch);

        client->close();
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << "\n";
        return 1;
    }
}
