#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace notesketch {

/// Source of monotonic audio time in seconds
class AudioClock {
public:
    virtual ~AudioClock() = default;

    virtual double now() const = 0;
};

/// Wall clock (steady_clock) measured from construction. Used when no audio
/// device drives the timeline.
class SystemClock : public AudioClock {
public:
    SystemClock();

    double now() const override;

private:
    std::chrono::steady_clock::time_point origin_;
};

/// Sample counter advanced from an audio device callback.
/// advance() runs on the audio thread, now() on the editor thread.
class DeviceClock : public AudioClock {
public:
    explicit DeviceClock(double sampleRate = 44100.0);

    /// Called from the audio callback with the block size
    void advance(int numSamples);

    void setSampleRate(double rate);
    double sampleRate() const { return sampleRate_.load(std::memory_order_relaxed); }

    int64_t totalSamples() const { return samples_.load(std::memory_order_acquire); }

    double now() const override;

private:
    std::atomic<int64_t> samples_{0};
    std::atomic<double> sampleRate_;
};

/// Widens a wrapping 32-bit frame counter into a 64-bit running total.
/// Exact as long as advance() sees every wrap period (2^32 frames) at least once.
class FrameCounter {
public:
    void reset(uint32_t frame) {
        last_ = frame;
        total_ = 0;
    }

    uint64_t advance(uint32_t frame) {
        total_ += static_cast<uint32_t>(frame - last_);
        last_ = frame;
        return total_;
    }

    uint64_t total() const { return total_; }

private:
    uint32_t last_ = 0;
    uint64_t total_ = 0;
};

/// Clock that only moves when told to
class ManualClock : public AudioClock {
public:
    explicit ManualClock(double start = 0.0) : time_(start) {}

    void set(double time) { time_ = time; }
    void advance(double seconds) { time_ += seconds; }

    double now() const override { return time_; }

private:
    double time_;
};

} // namespace notesketch
