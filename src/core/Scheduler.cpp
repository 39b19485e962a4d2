#include "core/Scheduler.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace notesketch {

// ---------------------------------------------------------------------------
// TickClock
// ---------------------------------------------------------------------------

TickClock::TickClock(AudioClock& clock, double period, Callback callback)
    : clock_(clock)
    , period_(period)
    , callback_(std::move(callback))
{
    if (!(period_ > 0.0))
        throw std::invalid_argument("TickClock period must be positive, got " +
                                    std::to_string(period));
}

void TickClock::start() {
    next_ = clock_.now() + period_;
    running_ = true;
}

int TickClock::poll() {
    int fired = 0;
    const double now = clock_.now();

    while (running_ && now >= next_ && fired < kMaxCatchUpTicks) {
        next_ += period_;
        ++fired;
        callback_();
    }

    // Drop whatever a stall left behind
    if (running_ && now >= next_)
        next_ = now + period_;

    return fired;
}

// ---------------------------------------------------------------------------
// Scheduler
// ---------------------------------------------------------------------------

Scheduler::Scheduler(AudioClock& clock, double resolution)
    : clock_(clock)
    , resolution_(resolution)
    , tickClock_(clock, resolution, [this] { tick(); })
    , time_(clock.now())
{
    tickClock_.start();
}

void Scheduler::schedule(double time, Action action) {
    if (halted_ || !action)
        return;

    const double clockNow = clock_.now();
    if (time <= clockNow) {
        action(clockNow);
        return;
    }

    heap_.push_back(Event{time, nextSeq_++, std::move(action)});
    std::push_heap(heap_.begin(), heap_.end(), Later{});
}

void Scheduler::tick() {
    if (halted_)
        return;

    const double next = std::max(time_ + resolution_, clock_.now());

    if (willStop_) {
        Action cleanup = std::move(willStop_);
        willStop_ = nullptr;
        time_ = next;
        halted_ = true;
        tickClock_.stop();
        heap_.clear();
        cleanup(next);
        return;
    }

    time_ = next;
    // Actions may schedule more events inside this window; they are picked
    // up by the same loop
    while (!heap_.empty() && heap_.front().time < time_) {
        std::pop_heap(heap_.begin(), heap_.end(), Later{});
        Event event = std::move(heap_.back());
        heap_.pop_back();
        event.action(event.time);
        if (halted_)
            break;
    }
}

void Scheduler::stop(Action cleanup) {
    if (!cleanup)
        cleanup = [](double) {};

    if (halted_) {
        cleanup(std::max(time_, clock_.now()));
        return;
    }

    if (willStop_) {
        Action first = std::move(willStop_);
        willStop_ = [first, cleanup](double when) {
            first(when);
            cleanup(when);
        };
    } else {
        willStop_ = std::move(cleanup);
    }
}

} // namespace notesketch
