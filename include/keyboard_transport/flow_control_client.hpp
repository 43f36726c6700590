#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

#include "keyboard_transport/device_transport.hpp"
#include "keyboard_transport/event_reader.hpp"
#include "keyboard_transport/hid_dongle_transport.hpp"
#include "keyboard_transport/types.hpp"
#include "keyboard_transport/vendor_event.hpp"
#include "keyboard_transport/wire_codec.hpp"

namespace kb::transport {

// Retry and timing budget for one kind of link.
struct FlowPolicy {
    std::uint32_t max_attempts{5};
    // Pause between the write and the first read.
    std::chrono::milliseconds first_wait{5};
    // Pause after an unproductive read; grows by half each time up to the max.
    std::chrono::milliseconds poll_interval{5};
    std::chrono::milliseconds max_poll_interval{20};
    std::chrono::milliseconds query_timeout{1000};
    // Deadline for the query that follows a dongle timeout.
    std::chrono::milliseconds wake_timeout{1000};
    std::chrono::milliseconds send_delay{0};
    std::uint32_t max_drain_flushes{0};
    std::chrono::milliseconds drain_interval{1};

    static FlowPolicy wired();
    static FlowPolicy dongle();
    static FlowPolicy bluetooth();
    static FlowPolicy forTransport(TransportType type);
};

// Replies the dongle surfaced while a different query was waiting.
class ResponseCache {
public:
    static constexpr std::size_t kDefaultCapacity = 16;

    explicit ResponseCache(std::size_t capacity = kDefaultCapacity);

    // Evicts the oldest entry when full.
    void add(std::uint8_t echo, Bytes payload);
    std::optional<Bytes> take(std::uint8_t echo);
    void clear() noexcept { entries_.clear(); }

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    std::size_t capacity_;
    std::deque<std::pair<std::uint8_t, Bytes>> entries_;
};

// Moving average of recent dongle round trips.
class LatencyTracker {
public:
    explicit LatencyTracker(std::size_t window = 8);

    void record(std::chrono::microseconds latency);
    // Half the average round trip, never more than `ceiling`; `ceiling`
    // itself before any sample exists.
    [[nodiscard]] std::chrono::microseconds firstWait(std::chrono::microseconds ceiling) const;
    [[nodiscard]] std::optional<std::chrono::microseconds> average() const;

private:
    std::size_t window_;
    std::deque<std::chrono::microseconds> samples_;
};

struct FlowClientOptions {
    FlowPolicy policy;
    DongleHeuristics heuristics;
    bool trace{false};
};

// The uniform command API over one backend. Every write+read cycle runs under
// one lock, so concurrent callers never interleave frames on the wire.
class FlowControlClient {
public:
    FlowControlClient(DeviceDescriptor descriptor,
                      std::unique_ptr<DeviceTransport> backend,
                      std::unique_ptr<EventReader> events,
                      FlowClientOptions options);
    ~FlowControlClient();

    FlowControlClient(const FlowControlClient&) = delete;
    FlowControlClient& operator=(const FlowControlClient&) = delete;

    // Fire and forget: one write, no retry.
    void send(std::uint8_t command,
              const Bytes& payload = {},
              ChecksumKind checksum = ChecksumKind::SumByte1to7);
    void sendWithDelay(std::uint8_t command,
                       const Bytes& payload,
                       ChecksumKind checksum,
                       std::chrono::milliseconds delay);

    // Returns [echo][data...] of the reply whose echo equals `command`.
    // Throws TransportError(Timeout) once the attempt budget is spent.
    Bytes query(std::uint8_t command,
                const Bytes& payload = {},
                ChecksumKind checksum = ChecksumKind::SumByte1to7);
    // Same loop, but the first non-idle reply wins whatever its first byte.
    Bytes queryRaw(std::uint8_t command,
                   const Bytes& payload = {},
                   ChecksumKind checksum = ChecksumKind::SumByte1to7);

    // nullopt on timeout or when the device has no input interface.
    std::optional<VendorEvent> readEvent(std::chrono::milliseconds timeout);
    [[nodiscard]] std::optional<EventReceiver> subscribeEvents() const;
    [[nodiscard]] bool hasEvents() const noexcept { return events_ != nullptr; }

    BatteryStatus batteryStatus();

    bool isConnected();
    void close();

    [[nodiscard]] const DeviceDescriptor& descriptor() const noexcept { return descriptor_; }
    [[nodiscard]] TransportType transportType() const noexcept { return descriptor_.transport; }
    [[nodiscard]] const FlowPolicy& policy() const noexcept { return options_.policy; }
    [[nodiscard]] bool wakeMode() const noexcept { return wake_mode_.load(); }
    [[nodiscard]] std::uint32_t consecutiveTimeouts() const noexcept {
        return consecutive_timeouts_.load();
    }
    [[nodiscard]] std::optional<std::chrono::microseconds> averageLatency() const;
    [[nodiscard]] std::size_t cachedResponses() const;

private:
    Bytes correlatedQuery(std::uint8_t command,
                          const Bytes& payload,
                          ChecksumKind checksum,
                          bool raw);
    Bytes dongleQuery(std::uint8_t command, const Bytes& frame, bool raw);
    Bytes directQuery(std::uint8_t command, const Bytes& frame, bool raw);

    // Flushes until the dongle reports idle. Buffered replies echoing
    // `command` land in `earlier`; the rest are discarded and counted.
    std::size_t drainDongle(std::uint8_t command, bool raw, std::optional<Bytes>& earlier);
    // nullopt when the frame is unusable this attempt.
    std::optional<ResponseFrame> decodeQuietly(const Bytes& raw) const;
    [[nodiscard]] bool isDongle() const noexcept;
    void recordSuccess(std::chrono::steady_clock::time_point started);
    void recordTimeout(std::uint8_t command, std::chrono::steady_clock::duration waited);

    DeviceDescriptor descriptor_;
    std::unique_ptr<DeviceTransport> backend_;
    std::unique_ptr<EventReader> events_;
    FlowClientOptions options_;
    Framing framing_;

    mutable std::mutex io_mutex_;
    ResponseCache cache_;
    LatencyTracker latency_;
    std::atomic<bool> wake_mode_{false};
    std::atomic<std::uint32_t> consecutive_timeouts_{0};

    std::mutex event_mutex_;
    std::optional<EventReceiver> event_rx_;

    std::atomic<bool> closed_{false};
};

}  // namespace kb::transport
