#include <doctest/doctest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "keyboard_transport/flow_control_client.hpp"
#include "keyboard_transport/protocol.hpp"
#include "keyboard_transport/transport_error.hpp"
#include "test_support.hpp"

using namespace kb::transport;
using kb::transport::testing::bleReply;
using kb::transport::testing::FakeHidHandle;
using kb::transport::testing::FakeHidState;
using kb::transport::testing::ScriptedTransport;
using kb::transport::testing::ScriptState;
using kb::transport::testing::usbReply;
using std::chrono::milliseconds;

namespace {

FlowPolicy quickDirect() {
    FlowPolicy policy;
    policy.max_attempts = 8;
    policy.first_wait = milliseconds(0);
    policy.poll_interval = milliseconds(1);
    policy.max_poll_interval = milliseconds(2);
    policy.query_timeout = milliseconds(1000);
    policy.wake_timeout = milliseconds(1000);
    policy.send_delay = milliseconds(0);
    return policy;
}

FlowPolicy quickDongle() {
    FlowPolicy policy = quickDirect();
    policy.max_attempts = 10;
    policy.query_timeout = milliseconds(500);
    policy.max_drain_flushes = static_cast<std::uint32_t>(ResponseCache::kDefaultCapacity) + 1;
    policy.drain_interval = milliseconds(0);
    return policy;
}

std::unique_ptr<FlowControlClient> makeClient(TransportType type,
                                              std::shared_ptr<ScriptState> state,
                                              FlowPolicy policy,
                                              std::unique_ptr<EventReader> events = nullptr) {
    DeviceDescriptor descriptor;
    descriptor.vendor_id = 0x3151;
    descriptor.transport = type;
    descriptor.path = "scripted";
    descriptor.is_dongle = type == TransportType::HidDongle;

    FlowClientOptions options;
    options.policy = policy;
    return std::make_unique<FlowControlClient>(
        descriptor, std::make_unique<ScriptedTransport>(type, std::move(state)), std::move(events),
        options);
}

// Answers each query with a reply echoing its command byte.
void echoReplies(ScriptState& state, const Bytes& frame) {
    state.replies.push_back(usbReply(frame[1], {0x01}));
}

ErrorKind queryError(FlowControlClient& client, std::uint8_t command) {
    try {
        (void)client.query(command);
    } catch (const TransportError& e) {
        return e.kind();
    }
    FAIL("query should have failed");
    return ErrorKind::Io;
}

}  // namespace

TEST_CASE("flow control - direct query skips mismatched replies") {
    auto state = std::make_shared<ScriptState>();
    for (int i = 0; i < 5; ++i) {
        state->replies.push_back(usbReply(cmd::GET_PROFILE, {0x02}));
    }
    state->replies.push_back(usbReply(cmd::GET_USB_VERSION, {0x01, 0x02, 0x03}));
    auto client = makeClient(TransportType::HidWired, state, quickDirect());

    const Bytes reply = client->query(cmd::GET_USB_VERSION);
    REQUIRE(reply.size() >= 4);
    CHECK(reply[0] == cmd::GET_USB_VERSION);
    CHECK(reply[1] == 0x01);
    CHECK(reply[3] == 0x03);
    CHECK(state->reads == 6);
    REQUIRE(state->writes.size() == 1);
    CHECK(state->writes.front()[1] == cmd::GET_USB_VERSION);
    CHECK(client->consecutiveTimeouts() == 0);
    CHECK(client->averageLatency().has_value());
}

TEST_CASE("flow control - direct query gives up after max attempts") {
    auto state = std::make_shared<ScriptState>();
    for (int i = 0; i < 6; ++i) {
        state->replies.push_back(usbReply(cmd::GET_PROFILE));
    }
    auto policy = quickDirect();
    policy.max_attempts = 5;
    auto client = makeClient(TransportType::HidWired, state, policy);

    CHECK(queryError(*client, cmd::GET_USB_VERSION) == ErrorKind::Timeout);
    CHECK(state->reads == 5);
    CHECK(client->consecutiveTimeouts() == 1);
    CHECK_FALSE(client->wakeMode());
}

TEST_CASE("flow control - timeouts are bounded by the deadline") {
    auto state = std::make_shared<ScriptState>();
    auto policy = quickDirect();
    policy.max_attempts = 1000;
    policy.poll_interval = milliseconds(5);
    policy.max_poll_interval = milliseconds(10);
    policy.query_timeout = milliseconds(50);
    auto client = makeClient(TransportType::HidWired, state, policy);

    const auto start = std::chrono::steady_clock::now();
    try {
        (void)client->query(cmd::GET_LEDPARAM);
        FAIL("query should time out");
    } catch (const TransportError& e) {
        CHECK(e.kind() == ErrorKind::Timeout);
        CHECK(e.isTransient());
        CHECK(std::string(e.what()).find("GET_LEDPARAM") != std::string::npos);
    }
    const auto elapsed = std::chrono::steady_clock::now() - start;
    CHECK(elapsed >= milliseconds(50));
    CHECK(elapsed < milliseconds(1000));
    CHECK(state->reads > 1);
    CHECK(state->reads < 1000);
}

TEST_CASE("flow control - undecodable frames are skipped") {
    auto state = std::make_shared<ScriptState>();
    state->replies.push_back(bleReply(ble::EVENT_MARKER, notif::KEY_DEPTH, {0x01, 0x00, 0x02}));
    state->replies.push_back(Bytes{0x06});
    state->replies.push_back(bleReply(ble::CMDRESP_MARKER, cmd::GET_USB_VERSION, {0x09}));
    auto client = makeClient(TransportType::HidBluetooth, state, quickDirect());

    const Bytes reply = client->query(cmd::GET_USB_VERSION);
    CHECK(reply == Bytes{cmd::GET_USB_VERSION, 0x09});
    REQUIRE(state->writes.size() == 1);
    const Bytes& sent = state->writes.front();
    CHECK(sent.size() == ble::FRAME_SIZE);
    CHECK(sent[1] == ble::CMDRESP_MARKER);
    CHECK(sent[2] == cmd::GET_USB_VERSION);
}

TEST_CASE("flow control - raw query accepts any reply with data") {
    auto state = std::make_shared<ScriptState>();
    state->replies.push_back(Bytes(usb::FRAME_SIZE, 0));
    state->replies.push_back(usbReply(0x55, {0x01}));
    auto client = makeClient(TransportType::HidWired, state, quickDirect());

    const Bytes reply = client->queryRaw(cmd::GET_MULTI_MAGNETISM, {0x00, 0x01});
    CHECK(reply[0] == 0x55);
    CHECK(reply[1] == 0x01);
    CHECK(state->reads == 2);
}

TEST_CASE("flow control - send is a single write without reads") {
    auto state = std::make_shared<ScriptState>();
    auto client = makeClient(TransportType::HidWired, state, quickDirect());

    client->send(cmd::SET_LEDPARAM, {0x01, 0x02});
    client->send(cmd::SET_LEDPARAM, {0x01, 0x02});

    REQUIRE(state->writes.size() == 2);
    CHECK(state->writes[0] == state->writes[1]);
    CHECK(state->writes[0][1] == cmd::SET_LEDPARAM);
    CHECK(state->reads == 0);
    CHECK(state->flushes == 0);
    CHECK(client->cachedResponses() == 0);
}

TEST_CASE("flow control - dongle send pushes the write with a flush") {
    auto state = std::make_shared<ScriptState>();
    auto client = makeClient(TransportType::HidDongle, state, quickDongle());

    client->send(cmd::SET_PROFILE, {0x01});
    CHECK(state->writes.size() == 1);
    CHECK(state->flushes == 1);
    CHECK(state->reads == 0);
}

TEST_CASE("flow control - send delay is honoured") {
    auto state = std::make_shared<ScriptState>();
    auto client = makeClient(TransportType::HidWired, state, quickDirect());

    const auto start = std::chrono::steady_clock::now();
    client->sendWithDelay(cmd::SET_RESET, {}, ChecksumKind::SumByte1to7, milliseconds(20));
    CHECK(std::chrono::steady_clock::now() - start >= milliseconds(20));
}

TEST_CASE("flow control - dongle drains stale replies before writing") {
    auto state = std::make_shared<ScriptState>();
    state->buffered.push_back(usbReply(cmd::GET_PROFILE, {0x01}));
    state->buffered.push_back(usbReply(cmd::GET_LEDPARAM, {0x02}));
    // Matches the next query, but a fresh reply still wins over it.
    state->buffered.push_back(usbReply(cmd::GET_USB_VERSION, {0xEE}));
    std::size_t buffered_at_write = 99;
    state->on_write = [&buffered_at_write](ScriptState& s, const Bytes& frame) {
        buffered_at_write = s.buffered.size();
        s.buffered.push_back(usbReply(frame[1], {0x42}));
    };
    auto client = makeClient(TransportType::HidDongle, state, quickDongle());

    const Bytes reply = client->query(cmd::GET_USB_VERSION);
    CHECK(reply[0] == cmd::GET_USB_VERSION);
    CHECK(reply[1] == 0x42);
    CHECK(buffered_at_write == 0);
    // Three stale frames, one idle flush that ends the drain, one poll.
    CHECK(state->flushes == 5);
    CHECK(state->buffered.empty());
    CHECK(client->cachedResponses() == 0);
}

TEST_CASE("flow control - dongle drains a buffer as deep as the cache") {
    auto state = std::make_shared<ScriptState>();
    const auto depth = ResponseCache::kDefaultCapacity;
    for (std::size_t i = 0; i + 1 < depth; ++i) {
        state->buffered.push_back(usbReply(i % 2 ? cmd::GET_PROFILE : cmd::GET_LEDPARAM, {0x01}));
    }
    state->buffered.push_back(usbReply(cmd::GET_USB_VERSION, {0xEE}));
    std::size_t buffered_at_write = 99;
    state->on_write = [&buffered_at_write](ScriptState& s, const Bytes& frame) {
        buffered_at_write = s.buffered.size();
        s.buffered.push_back(usbReply(frame[1], {0x42}));
    };
    // Stock dongle budget with the sleeps taken out.
    auto policy = FlowPolicy::dongle();
    policy.first_wait = milliseconds(0);
    policy.drain_interval = milliseconds(0);
    auto client = makeClient(TransportType::HidDongle, state, policy);

    const Bytes reply = client->query(cmd::GET_USB_VERSION);
    CHECK(buffered_at_write == 0);
    CHECK(reply[1] == 0x42);
    CHECK(state->flushes == static_cast<int>(depth) + 1 + 1);
    CHECK(client->cachedResponses() == 0);
}

TEST_CASE("flow control - earlier reply answers when no fresh one arrives") {
    auto state = std::make_shared<ScriptState>();
    state->buffered.push_back(usbReply(cmd::GET_PROFILE, {0x01}));
    state->buffered.push_back(usbReply(cmd::GET_USB_VERSION, {0xEE}));
    auto client = makeClient(TransportType::HidDongle, state, quickDongle());

    const Bytes reply = client->query(cmd::GET_USB_VERSION);
    CHECK(reply[0] == cmd::GET_USB_VERSION);
    CHECK(reply[1] == 0xEE);
    CHECK(state->writes.size() == 1);
    CHECK(client->consecutiveTimeouts() == 0);
    CHECK_FALSE(client->wakeMode());
}

TEST_CASE("flow control - dongle drain is bounded") {
    auto state = std::make_shared<ScriptState>();
    for (int i = 0; i < 20; ++i) {
        state->buffered.push_back(usbReply(cmd::GET_PROFILE));
    }
    auto policy = quickDongle();
    policy.max_drain_flushes = 4;
    policy.max_attempts = 2;
    auto client = makeClient(TransportType::HidDongle, state, policy);

    CHECK(queryError(*client, cmd::GET_USB_VERSION) == ErrorKind::Timeout);
    CHECK(state->flushes == 4 + 2);
}

TEST_CASE("flow control - dongle caches out of order replies") {
    auto state = std::make_shared<ScriptState>();
    state->on_write = [](ScriptState& s, const Bytes& frame) {
        if (frame[1] == cmd::GET_USB_VERSION) {
            s.buffered.push_back(usbReply(cmd::GET_LEDPARAM, {0x11}));
            s.buffered.push_back(usbReply(cmd::GET_USB_VERSION, {0x22}));
        }
    };
    auto client = makeClient(TransportType::HidDongle, state, quickDongle());

    const Bytes version = client->query(cmd::GET_USB_VERSION);
    CHECK(version[1] == 0x22);
    CHECK(client->cachedResponses() == 1);

    // Nothing fresh comes back for GET_LEDPARAM, so the cached reply answers.
    const Bytes led = client->query(cmd::GET_LEDPARAM);
    CHECK(led[0] == cmd::GET_LEDPARAM);
    CHECK(led[1] == 0x11);
    CHECK(state->writes.size() == 2);
    CHECK(client->cachedResponses() == 0);

    // A fresh reply beats the cached one.
    state->on_write = [](ScriptState& s, const Bytes& frame) {
        if (frame[1] == cmd::GET_PROFILE) {
            s.buffered.push_back(usbReply(cmd::GET_LEDPARAM, {0x11}));
            s.buffered.push_back(usbReply(cmd::GET_PROFILE, {0x01}));
        } else {
            s.buffered.push_back(usbReply(frame[1], {0x33}));
        }
    };
    CHECK(client->query(cmd::GET_PROFILE)[1] == 0x01);
    REQUIRE(client->cachedResponses() == 1);
    CHECK(client->query(cmd::GET_LEDPARAM)[1] == 0x33);
    CHECK(client->cachedResponses() == 0);
}

TEST_CASE("flow control - dongle timeout enters wake mode") {
    auto state = std::make_shared<ScriptState>();
    auto policy = quickDongle();
    policy.max_attempts = 3;
    policy.query_timeout = milliseconds(200);
    policy.wake_timeout = milliseconds(60);
    auto client = makeClient(TransportType::HidDongle, state, policy);

    auto start = std::chrono::steady_clock::now();
    CHECK(queryError(*client, cmd::GET_USB_VERSION) == ErrorKind::Timeout);
    CHECK(std::chrono::steady_clock::now() - start < milliseconds(200));
    CHECK(client->wakeMode());
    CHECK(client->consecutiveTimeouts() == 1);

    // Only the wake deadline bounds the next attempt.
    const int flushes_before = state->flushes;
    start = std::chrono::steady_clock::now();
    CHECK(queryError(*client, cmd::GET_USB_VERSION) == ErrorKind::Timeout);
    CHECK(std::chrono::steady_clock::now() - start >= milliseconds(60));
    CHECK(state->flushes - flushes_before > 1 + 3);
    CHECK(client->wakeMode());
    CHECK(client->consecutiveTimeouts() == 2);

    state->on_write = [](ScriptState& s, const Bytes& frame) {
        s.buffered.push_back(usbReply(frame[1], {0x01}));
    };
    CHECK(client->query(cmd::GET_USB_VERSION)[1] == 0x01);
    CHECK_FALSE(client->wakeMode());
    CHECK(client->consecutiveTimeouts() == 0);
}

TEST_CASE("flow control - dongle raw query ignores idle frames") {
    auto state = std::make_shared<ScriptState>();
    int queries = 0;
    state->on_write = [&queries](ScriptState& s, const Bytes&) {
        ++queries;
        s.buffered.push_back(usbReply(0x00));
        s.buffered.push_back(usbReply(cmd::DONGLE_FLUSH_NOP, {0x05}));
        // Magnetism pages carry data from byte 0.
        s.buffered.push_back(usbReply(0x00, {0x2C, 0x01, 0x90}));
    };
    auto client = makeClient(TransportType::HidDongle, state, quickDongle());

    const Bytes reply = client->queryRaw(cmd::GET_MULTI_MAGNETISM, {0x00, 0x01});
    CHECK(queries == 1);
    CHECK(reply[0] == 0x00);
    CHECK(reply[1] == 0x2C);
    CHECK(reply[3] == 0x90);
    CHECK_FALSE(client->wakeMode());
}

TEST_CASE("flow control - dongle raw query drains everything buffered") {
    auto state = std::make_shared<ScriptState>();
    state->buffered.push_back(usbReply(cmd::GET_MULTI_MAGNETISM, {0xEE}));
    state->buffered.push_back(usbReply(0x00, {0xEE}));
    state->on_write = [](ScriptState& s, const Bytes&) {
        s.buffered.push_back(usbReply(0x00, {0x42}));
    };
    auto client = makeClient(TransportType::HidDongle, state, quickDongle());

    const Bytes reply = client->queryRaw(cmd::GET_MULTI_MAGNETISM);
    CHECK(reply[1] == 0x42);
}

TEST_CASE("flow control - concurrent queries never interleave") {
    auto state = std::make_shared<ScriptState>();
    state->on_write = echoReplies;
    auto client = makeClient(TransportType::HidWired, state, quickDirect());

    const std::uint8_t commands[] = {cmd::GET_USB_VERSION, cmd::GET_LEDPARAM, cmd::GET_PROFILE};
    std::vector<int> mismatches(3, 0);
    std::vector<std::thread> workers;
    for (std::size_t t = 0; t < 3; ++t) {
        workers.emplace_back([&, t] {
            for (int i = 0; i < 20; ++i) {
                const Bytes reply = client->query(commands[t]);
                if (reply.empty() || reply[0] != commands[t]) {
                    ++mismatches[t];
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    CHECK(mismatches == std::vector<int>{0, 0, 0});
    CHECK(state->writes.size() == 60);
    CHECK(state->reads == 60);
}

TEST_CASE("flow control - events through the client") {
    auto hid = std::make_shared<FakeHidState>();
    EventReaderOptions event_options;
    event_options.read_timeout = milliseconds(1);
    auto reader = std::make_unique<EventReader>(std::make_unique<FakeHidHandle>(hid), parseUsbEvent,
                                                event_options, "client-test");
    auto client = makeClient(TransportType::HidWired, std::make_shared<ScriptState>(), quickDirect(),
                             std::move(reader));
    REQUIRE(client->hasEvents());

    // The first call subscribes; nothing has been published yet.
    CHECK_FALSE(client->readEvent(milliseconds(1)).has_value());
    auto receiver = client->subscribeEvents();
    REQUIRE(receiver.has_value());

    hid->pushInput(Bytes{0x05, 0x06, 0x04});
    const auto polled = client->readEvent(milliseconds(2000));
    REQUIRE(polled.has_value());
    REQUIRE(std::holds_alternative<event::BrightnessLevel>(*polled));
    CHECK(std::get<event::BrightnessLevel>(*polled).level == 4);

    TimestampedEvent stamped;
    REQUIRE(receiver->recvFor(stamped, milliseconds(2000)) == RecvStatus::Ok);
    CHECK(std::holds_alternative<event::BrightnessLevel>(stamped.event));

    client->close();
    CHECK(receiver->recvFor(stamped, milliseconds(100)) == RecvStatus::Closed);
    CHECK_FALSE(client->readEvent(milliseconds(5)).has_value());
}

TEST_CASE("flow control - no input interface means no events") {
    auto client = makeClient(TransportType::HidWired, std::make_shared<ScriptState>(), quickDirect());
    CHECK_FALSE(client->hasEvents());
    CHECK_FALSE(client->readEvent(milliseconds(5)).has_value());
    CHECK_FALSE(client->subscribeEvents().has_value());
}

TEST_CASE("flow control - close is idempotent") {
    auto state = std::make_shared<ScriptState>();
    auto client = makeClient(TransportType::HidDongle, state, quickDongle());
    CHECK(client->isConnected());
    CHECK(client->batteryStatus() == BatteryStatus{77, true, true});

    client->close();
    client->close();
    CHECK(state->closed);
    CHECK_FALSE(client->isConnected());
    CHECK(queryError(*client, cmd::GET_USB_VERSION) == ErrorKind::Io);
    CHECK_THROWS_AS(client->send(cmd::SET_RESET), TransportError);
    CHECK_THROWS_AS((void)client->batteryStatus(), TransportError);
}

TEST_CASE("flow control - construction") {
    DeviceDescriptor descriptor;
    descriptor.transport = TransportType::HidWired;
    CHECK_THROWS_AS(FlowControlClient(descriptor, nullptr, nullptr, FlowClientOptions{}),
                    std::invalid_argument);

    auto client = makeClient(TransportType::HidBluetooth, std::make_shared<ScriptState>(),
                             FlowPolicy::bluetooth());
    CHECK(client->transportType() == TransportType::HidBluetooth);
    CHECK(client->policy().send_delay == milliseconds(150));
    CHECK(client->descriptor().path == "scripted");
}

TEST_CASE("flow policy - presets per link") {
    const auto wired = FlowPolicy::forTransport(TransportType::HidWired);
    CHECK(wired.max_attempts == 5);
    CHECK(wired.max_drain_flushes == 0);

    const auto dongle = FlowPolicy::forTransport(TransportType::HidDongle);
    CHECK(dongle.max_attempts == 20);
    CHECK(dongle.max_drain_flushes > ResponseCache::kDefaultCapacity);
    CHECK(dongle.wake_timeout > dongle.query_timeout);

    CHECK(FlowPolicy::forTransport(TransportType::BluetoothGatt).query_timeout ==
          FlowPolicy::bluetooth().query_timeout);
}

TEST_CASE("response cache - bounded and keyed by echo") {
    ResponseCache cache(2);
    cache.add(0x84, Bytes{0x84, 0x01});
    cache.add(0x87, Bytes{0x87, 0x02});
    cache.add(0x8F, Bytes{0x8F, 0x03});
    CHECK(cache.size() == 2);
    CHECK_FALSE(cache.take(0x84).has_value());

    const auto hit = cache.take(0x87);
    REQUIRE(hit.has_value());
    CHECK(*hit == Bytes{0x87, 0x02});
    CHECK(cache.size() == 1);
    CHECK_FALSE(cache.take(0x87).has_value());

    cache.clear();
    CHECK(cache.size() == 0);
    CHECK(ResponseCache().capacity() == ResponseCache::kDefaultCapacity);
    CHECK_THROWS_AS(ResponseCache(0), std::invalid_argument);
}

TEST_CASE("latency tracker - first wait follows the moving average") {
    using std::chrono::microseconds;
    LatencyTracker tracker(2);
    CHECK_FALSE(tracker.average().has_value());
    CHECK(tracker.firstWait(microseconds(20000)) == microseconds(20000));

    tracker.record(microseconds(8000));
    tracker.record(microseconds(12000));
    CHECK(*tracker.average() == microseconds(10000));
    CHECK(tracker.firstWait(microseconds(20000)) == microseconds(5000));
    CHECK(tracker.firstWait(microseconds(1000)) == microseconds(1000));

    // Window of two drops the 8ms sample.
    tracker.record(microseconds(40000));
    CHECK(*tracker.average() == microseconds(26000));
}
