#include "audio/JackClock.h"

#include <cstdio>

namespace notesketch {

JackClock::~JackClock() {
    shutdown();
}

bool JackClock::init() {
    if (client_) return true;  // already initialised

    jack_status_t status{};
    client_ = jack_client_open("NoteSketch Clock", JackNoStartServer, &status);
    if (!client_) {
        fprintf(stderr, "JackClock: could not open JACK client (status 0x%x)\n",
                static_cast<unsigned>(status));
        return false;
    }

    // Activate the client (no ports, but required for the frame clock).
    if (jack_activate(client_) != 0) {
        fprintf(stderr, "JackClock: failed to activate JACK client\n");
        jack_client_close(client_);
        client_ = nullptr;
        return false;
    }

    sampleRate_ = static_cast<double>(jack_get_sample_rate(client_));
    {
        std::lock_guard<std::mutex> lock(frameMutex_);
        frames_.reset(jack_frame_time(client_));
    }
    active_ = true;
    fprintf(stderr, "JackClock: active at %.0f Hz\n", sampleRate_);
    return true;
}

void JackClock::shutdown() {
    if (!client_) return;

    if (active_) {
        jack_deactivate(client_);
        active_ = false;
    }
    jack_client_close(client_);
    client_ = nullptr;
}

double JackClock::now() const {
    if (!isActive()) return 0.0;
    std::lock_guard<std::mutex> lock(frameMutex_);
    const uint64_t elapsed = frames_.advance(jack_frame_time(client_));
    return static_cast<double>(elapsed) / sampleRate_;
}

} // namespace notesketch
