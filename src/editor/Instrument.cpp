#include "editor/Instrument.h"

#include "core/Scheduler.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace notesketch {

LogInstrument::LogInstrument(MessageCallback onMessage)
    : onMessage_(std::move(onMessage))
{}

void LogInstrument::message(const std::string& msg) const {
    if (onMessage_)
        onMessage_(msg);
}

void LogInstrument::startNote(double freq, double when) {
    ++sounding_[freq];
    char buf[64];
    snprintf(buf, sizeof(buf), "on  %.2f Hz @ %.3f", freq, when);
    message(buf);
}

void LogInstrument::stopNote(double freq, double when) {
    auto it = sounding_.find(freq);
    if (it == sounding_.end())
        return;
    if (--it->second <= 0)
        sounding_.erase(it);
    char buf[64];
    snprintf(buf, sizeof(buf), "off %.2f Hz @ %.3f", freq, when);
    message(buf);
}

void LogInstrument::allNotesOff(double when) {
    if (sounding_.empty())
        return;
    sounding_.clear();
    char buf[64];
    snprintf(buf, sizeof(buf), "all notes off @ %.3f", when);
    message(buf);
}

int LogInstrument::sounding(double freq) const {
    auto it = sounding_.find(freq);
    return it == sounding_.end() ? 0 : it->second;
}

int LogInstrument::soundingCount() const {
    int count = 0;
    for (const auto& [freq, n] : sounding_)
        count += n;
    return count;
}

MidiPitch midiPitchFor(double freq, int bendRangeSemitones) {
    const double exact = 69.0 + 12.0 * std::log2(freq / 440.0);
    MidiPitch out;
    out.note = std::clamp(static_cast<int>(std::lround(exact)), 0, 127);
    const double semis = exact - out.note;
    const int range = std::max(bendRangeSemitones, 1);
    out.bend = std::clamp(8192 + static_cast<int>(std::lround(semis / range * 8192.0)), 0, 16383);
    return out;
}

void playNote(Instrument& instrument, Scheduler& scheduler, double freq, double duration) {
    const double now = scheduler.clockTime();
    instrument.startNote(freq, now);
    Instrument* target = &instrument;
    scheduler.schedule(now + duration, [target, freq](double when) {
        target->stopNote(freq, when);
    });
}

} // namespace notesketch
