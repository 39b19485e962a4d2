#pragma once

#include "core/InputEvents.h"

#include <atomic>
#include <array>
#include <cstddef>

namespace notesketch {

/// Lock-free single-producer single-consumer ring of input events.
/// The OSC listener thread produces, the editor thread consumes.
template <size_t Capacity>
class InputQueue {
    static_assert(Capacity > 0, "Capacity must be > 0");

public:
    /// Push an event (producer thread only).
    /// Returns false and drops the event if the queue is full.
    bool push(const InputEvent& event) {
        const size_t head = head_.load(std::memory_order_relaxed);
        const size_t next = (head + 1) % (Capacity + 1);
        if (next == tail_.load(std::memory_order_acquire))
            return false;
        buf_[head] = event;
        head_.store(next, std::memory_order_release);
        return true;
    }

    /// Pop the oldest event (consumer thread only).
    bool pop(InputEvent& event) {
        const size_t tail = tail_.load(std::memory_order_relaxed);
        if (tail == head_.load(std::memory_order_acquire))
            return false;
        event = buf_[tail];
        tail_.store((tail + 1) % (Capacity + 1), std::memory_order_release);
        return true;
    }

    /// Pop every queued event in arrival order and hand it to `fn`.
    /// Returns the number of events drained.
    template <typename Fn>
    int drain(Fn&& fn) {
        int count = 0;
        InputEvent event;
        while (pop(event)) {
            fn(event);
            ++count;
        }
        return count;
    }

private:
    std::array<InputEvent, Capacity + 1> buf_{};  // one spare slot tells full from empty
    std::atomic<size_t> head_{0};
    std::atomic<size_t> tail_{0};
};

} // namespace notesketch
