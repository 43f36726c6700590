#include "keyboard_transport/logging_transport.hpp"

#include <iomanip>
#include <iostream>
#include <utility>

#include "keyboard_transport/protocol.hpp"

namespace kb::transport {

namespace {

// Command name for [report_id][cmd]... or [0x06][0x55][cmd]... frames.
std::string frameLabel(const Bytes& frame) {
    if (frame.size() >= 3 && frame[0] == ble::VENDOR_REPORT_ID) {
        if (frame[1] == ble::EVENT_MARKER) {
            return "event";
        }
        if (frame[1] == ble::CMDRESP_MARKER) {
            return commandName(frame[2]);
        }
    }
    if (frame.size() >= 2) {
        return commandName(frame[1]);
    }
    return "?";
}

}  // namespace

LoggingTransport::LoggingTransport(std::unique_ptr<DeviceTransport> inner)
    : LoggingTransport(std::move(inner), std::cout) {}

LoggingTransport::LoggingTransport(std::unique_ptr<DeviceTransport> inner, std::ostream& out)
    : inner_(std::move(inner)), out_(out) {}

std::string LoggingTransport::id() const {
    return inner_->id();
}

TransportType LoggingTransport::type() const noexcept {
    return inner_->type();
}

void LoggingTransport::dump(const char* direction, const Bytes& frame) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "[LoggingTransport] " << inner_->id() << ' ' << direction << ' ' << frameLabel(frame)
         << " (" << frame.size() << " bytes):" << '\n';
    out_ << std::hex << std::setfill('0');
    std::size_t column = 0;
    for (auto byte : frame) {
        out_ << "0x" << std::setw(2) << static_cast<int>(byte) << ' ';
        if (++column == 16) {
            out_ << '\n';
            column = 0;
        }
    }
    if (column != 0) {
        out_ << '\n';
    }
    out_ << std::dec << std::setfill(' ');
}

void LoggingTransport::writeFrame(const Bytes& frame) {
    dump("write", frame);
    inner_->writeFrame(frame);
}

Bytes LoggingTransport::readFrame() {
    Bytes frame = inner_->readFrame();
    if (!frame.empty()) {
        dump("read", frame);
    }
    return frame;
}

void LoggingTransport::flush() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ << "[LoggingTransport] " << inner_->id() << " flush" << '\n';
    }
    inner_->flush();
}

BatteryStatus LoggingTransport::batteryStatus() {
    return inner_->batteryStatus();
}

bool LoggingTransport::isConnected() {
    return inner_->isConnected();
}

void LoggingTransport::close() {
    inner_->close();
}

}  // namespace kb::transport
