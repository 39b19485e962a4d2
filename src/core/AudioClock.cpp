#include "core/AudioClock.h"

namespace notesketch {

SystemClock::SystemClock()
    : origin_(std::chrono::steady_clock::now())
{}

double SystemClock::now() const {
    auto elapsed = std::chrono::steady_clock::now() - origin_;
    return std::chrono::duration<double>(elapsed).count();
}

DeviceClock::DeviceClock(double sampleRate)
    : sampleRate_(sampleRate > 0.0 ? sampleRate : 44100.0)
{}

void DeviceClock::advance(int numSamples) {
    if (numSamples > 0)
        samples_.fetch_add(numSamples, std::memory_order_release);
}

void DeviceClock::setSampleRate(double rate) {
    if (rate > 0.0)
        sampleRate_.store(rate, std::memory_order_relaxed);
}

double DeviceClock::now() const {
    return static_cast<double>(totalSamples()) / sampleRate();
}

} // namespace notesketch
