#pragma once

#include <functional>
#include <map>
#include <string>

namespace notesketch {

class Scheduler;

/// Sound output addressed by arbitrary frequency. `when` is the audio time
/// the change belongs to.
class Instrument {
public:
    virtual ~Instrument() = default;

    virtual void startNote(double freq, double when) = 0;
    virtual void stopNote(double freq, double when) = 0;
    virtual void allNotesOff(double when) = 0;
};

/// Instrument that reports what it would play (simulation mode)
class LogInstrument : public Instrument {
public:
    using MessageCallback = std::function<void(const std::string&)>;

    explicit LogInstrument(MessageCallback onMessage = {});

    void startNote(double freq, double when) override;
    void stopNote(double freq, double when) override;
    void allNotesOff(double when) override;

    /// Number of starts of `freq` not yet stopped
    int sounding(double freq) const;
    int soundingCount() const;

private:
    void message(const std::string& msg) const;

    MessageCallback onMessage_;
    std::map<double, int> sounding_;
};

/// A frequency as the nearest MIDI note plus a 14-bit pitch bend
struct MidiPitch {
    int note;       // 0..127
    int bend;       // 0..16383, 8192 = centre
};

/// Split `freq` into note and bend for a synth whose bend range is
/// +/- `bendRangeSemitones`
MidiPitch midiPitchFor(double freq, int bendRangeSemitones = 2);

/// Start `freq` now and schedule its stop `duration` seconds later.
/// The instrument must outlive the scheduler's pending events.
void playNote(Instrument& instrument, Scheduler& scheduler, double freq, double duration);

} // namespace notesketch
