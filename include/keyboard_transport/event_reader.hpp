#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>

#include "keyboard_transport/event_channel.hpp"
#include "keyboard_transport/event_parser.hpp"
#include "keyboard_transport/hid_device.hpp"
#include "keyboard_transport/vendor_event.hpp"

namespace kb::transport {

using EventChannel = BroadcastChannel<TimestampedEvent>;
using EventReceiver = EventChannel::Receiver;

struct EventReaderOptions {
    std::size_t channel_capacity{256};
    std::size_t max_report_size{64};
    // Also bounds how long stop() waits for the worker.
    std::chrono::milliseconds read_timeout{5};
    std::chrono::milliseconds error_backoff{100};

    static EventReaderOptions usb();
    static EventReaderOptions bluetooth();
};

// Background worker that owns a device's input interface, parses every input
// report into a VendorEvent and publishes it on a bounded broadcast channel.
// The producer never waits for consumers.
class EventReader {
public:
    EventReader(std::unique_ptr<HidHandle> input,
                EventParser parser,
                EventReaderOptions options,
                std::string name);
    ~EventReader();

    EventReader(const EventReader&) = delete;
    EventReader& operator=(const EventReader&) = delete;

    void start();
    // Joins the worker and closes the channel. Safe to call more than once.
    void stop();

    [[nodiscard]] EventReceiver subscribe() const;
    [[nodiscard]] bool running() const noexcept { return thread_.joinable(); }

private:
    void runLoop();

    std::unique_ptr<HidHandle> input_;
    EventParser parser_;
    EventReaderOptions options_;
    std::string name_;
    EventChannel channel_;
    std::chrono::steady_clock::time_point origin_;

    std::atomic<bool> stop_{false};
    std::thread thread_;
};

}  // namespace kb::transport
