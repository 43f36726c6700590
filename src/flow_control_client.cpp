#include "keyboard_transport/flow_control_client.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>

#include "keyboard_transport/protocol.hpp"
#include "keyboard_transport/transport_error.hpp"

namespace kb::transport {

namespace {

using Clock = std::chrono::steady_clock;
using std::chrono::milliseconds;

std::string hexCommand(std::uint8_t command) {
    std::ostringstream out;
    out << "0x" << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(command) << " (" << commandName(command) << ")";
    return out.str();
}

long long elapsedMs(Clock::duration duration) {
    return std::chrono::duration_cast<milliseconds>(duration).count();
}

bool hasData(const Bytes& payload) {
    return std::any_of(payload.begin(), payload.end(), [](std::uint8_t b) { return b != 0; });
}

// Sleeps for `interval` but never past `deadline`.
void pauseBefore(Clock::time_point deadline, milliseconds interval) {
    const auto wake = std::min(Clock::now() + interval, deadline);
    std::this_thread::sleep_until(wake);
}

milliseconds grow(milliseconds interval, milliseconds ceiling) {
    const auto next = std::max(interval + interval / 2, interval + milliseconds(1));
    return std::min(next, ceiling);
}

}  // namespace

FlowPolicy FlowPolicy::wired() {
    FlowPolicy policy;
    policy.max_attempts = 5;
    policy.first_wait = milliseconds(10);
    policy.poll_interval = milliseconds(5);
    policy.max_poll_interval = milliseconds(20);
    policy.query_timeout = milliseconds(1000);
    policy.wake_timeout = milliseconds(1000);
    policy.send_delay = milliseconds(10);
    return policy;
}

FlowPolicy FlowPolicy::dongle() {
    FlowPolicy policy;
    policy.max_attempts = 20;
    policy.first_wait = milliseconds(20);
    policy.poll_interval = milliseconds(2);
    policy.max_poll_interval = milliseconds(25);
    policy.query_timeout = milliseconds(500);
    policy.wake_timeout = milliseconds(2000);
    policy.send_delay = milliseconds(5);
    // One more than the cache holds, so a full buffer drains to an idle frame.
    policy.max_drain_flushes = static_cast<std::uint32_t>(ResponseCache::kDefaultCapacity) + 1;
    policy.drain_interval = milliseconds(1);
    return policy;
}

FlowPolicy FlowPolicy::bluetooth() {
    FlowPolicy policy;
    policy.max_attempts = 3;
    policy.first_wait = milliseconds(50);
    policy.poll_interval = milliseconds(10);
    policy.max_poll_interval = milliseconds(50);
    policy.query_timeout = milliseconds(2000);
    policy.wake_timeout = milliseconds(2000);
    policy.send_delay = milliseconds(150);
    return policy;
}

FlowPolicy FlowPolicy::forTransport(TransportType type) {
    switch (type) {
    case TransportType::HidDongle:
        return dongle();
    case TransportType::HidBluetooth:
    case TransportType::BluetoothGatt:
        return bluetooth();
    case TransportType::HidWired:
        break;
    }
    return wired();
}

ResponseCache::ResponseCache(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("ResponseCache capacity must be positive");
    }
}

void ResponseCache::add(std::uint8_t echo, Bytes payload) {
    if (entries_.size() >= capacity_) {
        entries_.pop_front();
    }
    entries_.emplace_back(echo, std::move(payload));
}

std::optional<Bytes> ResponseCache::take(std::uint8_t echo) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [echo](const auto& entry) { return entry.first == echo; });
    if (it == entries_.end()) {
        return std::nullopt;
    }
    Bytes payload = std::move(it->second);
    entries_.erase(it);
    return payload;
}

LatencyTracker::LatencyTracker(std::size_t window) : window_(std::max<std::size_t>(window, 1)) {}

void LatencyTracker::record(std::chrono::microseconds latency) {
    if (samples_.size() >= window_) {
        samples_.pop_front();
    }
    samples_.push_back(latency);
}

std::optional<std::chrono::microseconds> LatencyTracker::average() const {
    if (samples_.empty()) {
        return std::nullopt;
    }
    std::chrono::microseconds total{0};
    for (auto sample : samples_) {
        total += sample;
    }
    return total / static_cast<std::chrono::microseconds::rep>(samples_.size());
}

std::chrono::microseconds LatencyTracker::firstWait(std::chrono::microseconds ceiling) const {
    const auto avg = average();
    if (!avg) {
        return ceiling;
    }
    return std::min(*avg / 2, ceiling);
}

FlowControlClient::FlowControlClient(DeviceDescriptor descriptor,
                                     std::unique_ptr<DeviceTransport> backend,
                                     std::unique_ptr<EventReader> events,
                                     FlowClientOptions options)
    : descriptor_(std::move(descriptor)),
      backend_(std::move(backend)),
      events_(std::move(events)),
      options_(std::move(options)),
      framing_(framingFor(descriptor_.transport)) {
    if (!backend_) {
        throw std::invalid_argument("FlowControlClient requires a backend");
    }
    if (events_) {
        events_->start();
    }
}

FlowControlClient::~FlowControlClient() { close(); }

bool FlowControlClient::isDongle() const noexcept {
    return descriptor_.transport == TransportType::HidDongle;
}

void FlowControlClient::send(std::uint8_t command, const Bytes& payload, ChecksumKind checksum) {
    sendWithDelay(command, payload, checksum, options_.policy.send_delay);
}

void FlowControlClient::sendWithDelay(std::uint8_t command,
                                      const Bytes& payload,
                                      ChecksumKind checksum,
                                      std::chrono::milliseconds delay) {
    const Bytes frame = encodeFrame(framing_, command, payload, checksum);

    std::lock_guard<std::mutex> lock(io_mutex_);
    if (closed_.load()) {
        throw TransportError(ErrorKind::Io, "client for " + descriptor_.path + " is closed");
    }
    backend_->writeFrame(frame);
    if (isDongle()) {
        // The dongle only forwards a SET once something is polled behind it.
        backend_->flush();
    }
    if (options_.trace) {
        std::cout << "[FlowControlClient] Sent " << hexCommand(command) << '\n';
    }
    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }
}

Bytes FlowControlClient::query(std::uint8_t command, const Bytes& payload, ChecksumKind checksum) {
    return correlatedQuery(command, payload, checksum, false);
}

Bytes FlowControlClient::queryRaw(std::uint8_t command, const Bytes& payload, ChecksumKind checksum) {
    return correlatedQuery(command, payload, checksum, true);
}

Bytes FlowControlClient::correlatedQuery(std::uint8_t command,
                                         const Bytes& payload,
                                         ChecksumKind checksum,
                                         bool raw) {
    const Bytes frame = encodeFrame(framing_, command, payload, checksum);

    std::lock_guard<std::mutex> lock(io_mutex_);
    if (closed_.load()) {
        throw TransportError(ErrorKind::Io, "client for " + descriptor_.path + " is closed");
    }
    return isDongle() ? dongleQuery(command, frame, raw) : directQuery(command, frame, raw);
}

std::optional<ResponseFrame> FlowControlClient::decodeQuietly(const Bytes& raw) const {
    if (raw.empty()) {
        return std::nullopt;
    }
    try {
        return decodeFrame(framing_, raw);
    } catch (const FramingError& e) {
        if (options_.trace) {
            std::cout << "[FlowControlClient] Skipping frame: " << e.what() << '\n';
        }
        return std::nullopt;
    }
}

std::size_t FlowControlClient::drainDongle(std::uint8_t command,
                                          bool raw,
                                          std::optional<Bytes>& earlier) {
    std::size_t discarded = 0;
    for (std::uint32_t i = 0; i < options_.policy.max_drain_flushes; ++i) {
        backend_->flush();
        auto stale = decodeQuietly(backend_->readFrame());
        if (!stale || options_.heuristics.isIdle(stale->payload)) {
            return discarded;
        }
        if (!raw && stale->echo == command) {
            if (options_.trace) {
                std::cout << "[FlowControlClient] Keeping earlier reply " << hexCommand(stale->echo)
                          << " as fallback" << '\n';
            }
            earlier = std::move(stale->payload);
        } else {
            ++discarded;
            if (options_.trace) {
                std::cout << "[FlowControlClient] Drained stale reply " << hexCommand(stale->echo)
                          << '\n';
            }
        }
        std::this_thread::sleep_for(options_.policy.drain_interval);
    }
    std::cerr << "[FlowControlClient] Dongle still buffering after "
              << options_.policy.max_drain_flushes << " flushes" << '\n';
    return discarded;
}

Bytes FlowControlClient::dongleQuery(std::uint8_t command, const Bytes& frame, bool raw) {
    const auto& policy = options_.policy;

    // Replies for this command that arrived before it was written. They only
    // answer the query when no fresh reply shows up in time.
    std::optional<Bytes> earlier;
    if (!raw) {
        earlier = cache_.take(command);
    }
    cache_.clear();
    drainDongle(command, raw, earlier);

    const bool waking = wake_mode_.load();
    const auto started = Clock::now();
    const auto deadline = started + (waking ? policy.wake_timeout : policy.query_timeout);

    backend_->writeFrame(frame);
    std::this_thread::sleep_for(
        latency_.firstWait(std::chrono::duration_cast<std::chrono::microseconds>(policy.first_wait)));

    auto interval = policy.poll_interval;
    std::uint32_t polls = 0;
    // Waking keyboards answer late: only the deadline bounds that query.
    while (Clock::now() < deadline && (waking || polls < policy.max_attempts)) {
        ++polls;
        backend_->flush();
        auto reply = decodeQuietly(backend_->readFrame());
        if (reply && !options_.heuristics.isIdle(reply->payload)) {
            if (raw || reply->echo == command) {
                recordSuccess(started);
                if (options_.trace) {
                    std::cout << "[FlowControlClient] Dongle reply " << hexCommand(command) << " in "
                              << elapsedMs(Clock::now() - started) << "ms (" << polls
                              << " polls)" << '\n';
                }
                return std::move(reply->payload);
            }
            if (options_.trace) {
                std::cout << "[FlowControlClient] Caching out-of-order reply "
                          << hexCommand(reply->echo) << '\n';
            }
            cache_.add(reply->echo, std::move(reply->payload));
        }
        pauseBefore(deadline, interval);
        interval = grow(interval, policy.max_poll_interval);
    }

    if (earlier) {
        consecutive_timeouts_.store(0);
        wake_mode_.store(false);
        std::cerr << "[FlowControlClient] No fresh reply to " << hexCommand(command) << " after "
                  << polls << " polls, using the earlier one" << '\n';
        return std::move(*earlier);
    }
    recordTimeout(command, Clock::now() - started);
    throw TransportError(ErrorKind::Timeout, "no reply to " + hexCommand(command) + " after " +
                                                 std::to_string(polls) + " polls");
}

Bytes FlowControlClient::directQuery(std::uint8_t command, const Bytes& frame, bool raw) {
    const auto& policy = options_.policy;
    const auto started = Clock::now();
    const auto deadline = started + policy.query_timeout;

    backend_->writeFrame(frame);
    std::this_thread::sleep_for(policy.first_wait);

    auto interval = policy.poll_interval;
    std::uint32_t attempts = 0;
    while (attempts < policy.max_attempts && Clock::now() < deadline) {
        ++attempts;
        if (auto reply = decodeQuietly(backend_->readFrame())) {
            const bool matched = raw ? hasData(reply->payload) : reply->echo == command;
            if (matched) {
                recordSuccess(started);
                return std::move(reply->payload);
            }
            if (options_.trace && !raw) {
                std::cout << "[FlowControlClient] Reply mismatch: expected " << hexCommand(command)
                          << ", got " << hexCommand(reply->echo) << '\n';
            }
        }
        if (attempts < policy.max_attempts) {
            pauseBefore(deadline, interval);
            interval = grow(interval, policy.max_poll_interval);
        }
    }

    recordTimeout(command, Clock::now() - started);
    throw TransportError(ErrorKind::Timeout, "no reply to " + hexCommand(command) + " after " +
                                                 std::to_string(attempts) + " attempts");
}

void FlowControlClient::recordSuccess(std::chrono::steady_clock::time_point started) {
    latency_.record(std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - started));
    consecutive_timeouts_.store(0);
    wake_mode_.store(false);
}

void FlowControlClient::recordTimeout(std::uint8_t command, std::chrono::steady_clock::duration waited) {
    const auto previous = consecutive_timeouts_.fetch_add(1);
    if (!isDongle()) {
        std::cerr << "[FlowControlClient] Timeout for " << hexCommand(command) << " after "
                  << elapsedMs(waited) << "ms" << '\n';
        return;
    }
    if (previous == 0 && !wake_mode_.load()) {
        wake_mode_.store(true);
        std::cerr << "[FlowControlClient] Dongle timeout for " << hexCommand(command) << " after "
                  << elapsedMs(waited) << "ms, entering wake mode" << '\n';
    } else {
        std::cerr << "[FlowControlClient] Dongle timeout for " << hexCommand(command) << " after "
                  << elapsedMs(waited) << "ms (" << previous + 1 << " consecutive)" << '\n';
    }
}

std::optional<VendorEvent> FlowControlClient::readEvent(std::chrono::milliseconds timeout) {
    if (!events_) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(event_mutex_);
    if (!event_rx_) {
        event_rx_ = events_->subscribe();
    }

    const auto deadline = Clock::now() + timeout;
    TimestampedEvent stamped;
    while (true) {
        const auto remaining =
            std::max(std::chrono::duration_cast<milliseconds>(deadline - Clock::now()), milliseconds(0));
        switch (event_rx_->recvFor(stamped, remaining)) {
        case RecvStatus::Ok:
            return stamped.event;
        case RecvStatus::Lagged:
            std::cerr << "[FlowControlClient] Event receiver lagged, " << event_rx_->missed()
                      << " events dropped" << '\n';
            continue;
        case RecvStatus::Empty:
        case RecvStatus::Closed:
            return std::nullopt;
        }
    }
}

std::optional<EventReceiver> FlowControlClient::subscribeEvents() const {
    if (!events_) {
        return std::nullopt;
    }
    return events_->subscribe();
}

BatteryStatus FlowControlClient::batteryStatus() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (closed_.load()) {
        throw TransportError(ErrorKind::Io, "client for " + descriptor_.path + " is closed");
    }
    return backend_->batteryStatus();
}

bool FlowControlClient::isConnected() {
    if (closed_.load()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(io_mutex_);
    return backend_->isConnected();
}

void FlowControlClient::close() {
    if (closed_.exchange(true)) {
        return;
    }
    if (events_) {
        events_->stop();
    }

    std::lock_guard<std::mutex> lock(io_mutex_);
    backend_->close();
    if (options_.trace) {
        if (const auto avg = latency_.average()) {
            std::cout << "[FlowControlClient] Closed " << descriptor_.path << ", average latency "
                      << avg->count() / 1000.0 << "ms" << '\n';
        }
    }
}

std::optional<std::chrono::microseconds> FlowControlClient::averageLatency() const {
    std::lock_guard<std::mutex> lock(io_mutex_);
    return latency_.average();
}

std::size_t FlowControlClient::cachedResponses() const {
    std::lock_guard<std::mutex> lock(io_mutex_);
    return cache_.size();
}

}  // namespace kb::transport
