#pragma once

#include "core/AudioClock.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace notesketch {

/// Periodic driver reading an AudioClock. The host loop calls poll(), which
/// fires the callback once for every period that has elapsed on the clock.
class TickClock {
public:
    using Callback = std::function<void()>;

    /// Upper bound on callbacks fired by a single poll after a stall.
    /// Any remaining backlog is dropped.
    static constexpr int kMaxCatchUpTicks = 8;

    TickClock(AudioClock& clock, double period, Callback callback);

    void start();
    void stop() { running_ = false; }
    bool isRunning() const { return running_; }

    /// Fire due ticks. Returns the number fired.
    int poll();

    double period() const { return period_; }

private:
    AudioClock& clock_;
    double period_;
    Callback callback_;
    double next_ = 0.0;
    bool running_ = false;
};

/// Clock-driven executor of timestamped callbacks.
///
/// Each tick advances the scheduler's time by at least one resolution step
/// and fires, in ascending time order, every pending event due before it.
/// Events with equal times fire in the order they were scheduled.
class Scheduler {
public:
    /// Receives the time the event was scheduled for (or the current clock
    /// time for events scheduled in the past)
    using Action = std::function<void(double when)>;

    Scheduler(AudioClock& clock, double resolution);

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /// Run `action` at `time`. Past or present times fire synchronously
    /// before returning. Ignored once the scheduler has halted.
    void schedule(double time, Action action);

    /// Advance one resolution step and fire due events. Normally called by
    /// the owned TickClock through poll().
    void tick();

    /// Poll the owned tick clock
    int poll() { return tickClock_.poll(); }

    /// Arm `cleanup` to run on the next tick with that tick's time, after
    /// which the scheduler halts and drops every pending event. Repeated
    /// calls chain their cleanups. On a halted scheduler it runs at once.
    void stop(Action cleanup);

    bool isRunning() const { return !halted_; }
    bool isStopping() const { return static_cast<bool>(willStop_); }

    /// Scheduler time: the end of the last tick window
    double now() const { return time_; }

    /// Current time of the underlying clock
    double clockTime() const { return clock_.now(); }

    double resolution() const { return resolution_; }
    size_t pendingCount() const { return heap_.size(); }

private:
    struct Event {
        double time;
        uint64_t seq;
        Action action;
    };

    /// Heap ordering: earliest time on top, FIFO among equals
    struct Later {
        bool operator()(const Event& a, const Event& b) const {
            if (a.time != b.time) return a.time > b.time;
            return a.seq > b.seq;
        }
    };

    AudioClock& clock_;
    double resolution_;
    TickClock tickClock_;

    std::vector<Event> heap_;
    uint64_t nextSeq_ = 0;
    double time_;

    Action willStop_;
    bool halted_ = false;
};

} // namespace notesketch
