#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace kb::transport {

enum class RecvStatus {
    Ok,
    Empty,
    Lagged,
    Closed,
};

// Bounded multi-consumer channel. The producer never blocks: when the ring is
// full the oldest value is dropped, and a receiver whose cursor pointed at a
// dropped value gets RecvStatus::Lagged once before resuming at the oldest
// retained value. Receivers only see values published after they subscribed.
template <typename T>
class BroadcastChannel {
    struct State {
        explicit State(std::size_t cap) : capacity(cap) {}

        [[nodiscard]] std::uint64_t oldest() const noexcept { return next_seq - buffer.size(); }

        const std::size_t capacity;
        std::mutex mutex;
        std::condition_variable ready;
        std::deque<T> buffer;
        std::uint64_t next_seq{0};
        bool closed{false};
    };

public:
    class Receiver {
    public:
        RecvStatus tryRecv(T& out) {
            std::lock_guard<std::mutex> lock(state_->mutex);
            return takeLocked(out);
        }

        RecvStatus recvFor(T& out, std::chrono::milliseconds timeout) {
            std::unique_lock<std::mutex> lock(state_->mutex);
            state_->ready.wait_for(lock, timeout, [this] {
                return cursor_ < state_->next_seq || state_->closed;
            });
            return takeLocked(out);
        }

        // Values skipped by the most recent Lagged result.
        [[nodiscard]] std::uint64_t missed() const noexcept { return missed_; }

    private:
        friend class BroadcastChannel;

        Receiver(std::shared_ptr<State> state, std::uint64_t cursor)
            : state_(std::move(state)), cursor_(cursor) {}

        RecvStatus takeLocked(T& out) {
            const auto oldest = state_->oldest();
            if (cursor_ < oldest) {
                missed_ = oldest - cursor_;
                cursor_ = oldest;
                return RecvStatus::Lagged;
            }
            if (cursor_ < state_->next_seq) {
                out = state_->buffer[static_cast<std::size_t>(cursor_ - oldest)];
                ++cursor_;
                return RecvStatus::Ok;
            }
            return state_->closed ? RecvStatus::Closed : RecvStatus::Empty;
        }

        std::shared_ptr<State> state_;
        std::uint64_t cursor_;
        std::uint64_t missed_{0};
    };

    explicit BroadcastChannel(std::size_t capacity)
        : state_(std::make_shared<State>(capacity)) {
        if (capacity == 0) {
            throw std::invalid_argument("BroadcastChannel capacity must be positive");
        }
    }

    void publish(T value) {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->closed) {
                return;
            }
            if (state_->buffer.size() == state_->capacity) {
                state_->buffer.pop_front();
            }
            state_->buffer.push_back(std::move(value));
            ++state_->next_seq;
        }
        state_->ready.notify_all();
    }

    [[nodiscard]] Receiver subscribe() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return Receiver(state_, state_->next_seq);
    }

    // Receivers drain what is buffered, then get RecvStatus::Closed.
    void close() {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->closed = true;
        }
        state_->ready.notify_all();
    }

    [[nodiscard]] std::size_t capacity() const noexcept { return state_->capacity; }

private:
    std::shared_ptr<State> state_;
};

}  // namespace kb::transport
