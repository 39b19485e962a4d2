#pragma once

#include "core/AudioClock.h"

#include <jack/jack.h>

#include <mutex>

namespace notesketch {

/// Audio time read from a JACK server's frame clock.
///
/// Opens its own lightweight JACK client (no ports). now() reports the
/// server's frame time since init() over its sample rate, so the scheduler
/// follows the same timeline as every other JACK client.
class JackClock : public AudioClock {
public:
    JackClock() = default;
    ~JackClock() override;

    // Non-copyable / non-movable
    JackClock(const JackClock&) = delete;
    JackClock& operator=(const JackClock&) = delete;

    /// Open and activate the JACK client. Returns true on success.
    bool init();

    /// Deactivate and close the JACK client.
    void shutdown();

    /// Whether the JACK client is connected and active.
    bool isActive() const { return client_ != nullptr && active_; }

    double sampleRate() const { return sampleRate_; }

    double now() const override;

private:
    jack_client_t* client_ = nullptr;
    bool active_ = false;
    double sampleRate_ = 48000.0;

    // jack_frame_time() wraps after 2^32 frames
    mutable std::mutex frameMutex_;
    mutable FrameCounter frames_;
};

} // namespace notesketch
