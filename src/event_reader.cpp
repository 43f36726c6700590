#include "keyboard_transport/event_reader.hpp"

#include <iostream>
#include <utility>

#include "keyboard_transport/transport_error.hpp"

namespace kb::transport {

EventReaderOptions EventReaderOptions::usb() {
    return EventReaderOptions{};
}

EventReaderOptions EventReaderOptions::bluetooth() {
    EventReaderOptions options;
    options.read_timeout = std::chrono::milliseconds(10);
    return options;
}

EventReader::EventReader(std::unique_ptr<HidHandle> input,
                         EventParser parser,
                         EventReaderOptions options,
                         std::string name)
    : input_(std::move(input)),
      parser_(std::move(parser)),
      options_(options),
      name_(std::move(name)),
      channel_(options.channel_capacity),
      origin_(std::chrono::steady_clock::now()) {}

EventReader::~EventReader() { stop(); }

void EventReader::start() {
    if (!input_) return;
    if (thread_.joinable()) return;
    stop_.store(false);
    thread_ = std::thread(&EventReader::runLoop, this);
}

void EventReader::stop() {
    stop_.store(true);
    if (thread_.joinable()) {
        thread_.join();
    }
    channel_.close();
}

EventReceiver EventReader::subscribe() const {
    return channel_.subscribe();
}

void EventReader::runLoop() {
    while (!stop_.load()) {
        Bytes report;
        try {
            report = input_->readTimeout(options_.max_report_size, options_.read_timeout);
        } catch (const TransportError& e) {
            std::cerr << "[EventReader] " << name_ << " read failed: " << e.what() << '\n';
            std::this_thread::sleep_for(options_.error_backoff);
            continue;
        }
        if (report.empty()) {
            continue;
        }

        TimestampedEvent stamped{parser_(report), std::chrono::steady_clock::now() - origin_};
        channel_.publish(std::move(stamped));
    }
}

}  // namespace kb::transport
