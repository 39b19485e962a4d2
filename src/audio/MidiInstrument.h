#pragma once

#include "editor/Instrument.h"

#include <juce_audio_devices/juce_audio_devices.h>

#include <memory>
#include <string>
#include <vector>

namespace notesketch {

/// Plays arbitrary frequencies on a MIDI output. Every sounding note gets
/// its own channel (2..16, round robin) so it can carry its own pitch bend.
class MidiInstrument : public Instrument {
public:
    static constexpr int kFirstChannel = 2;
    static constexpr int kLastChannel = 16;

    explicit MidiInstrument(std::unique_ptr<juce::MidiOutput> output,
                            int bendRangeSemitones = 2);
    ~MidiInstrument() override;

    MidiInstrument(const MidiInstrument&) = delete;
    MidiInstrument& operator=(const MidiInstrument&) = delete;

    void startNote(double freq, double when) override;
    void stopNote(double freq, double when) override;
    void allNotesOff(double when) override;

    std::string name() const;

    /// Open an output by case-insensitive substring match, or create a
    /// virtual device called `virtualName` when `name` is empty or not found.
    /// Returns nullptr if neither works.
    static std::unique_ptr<juce::MidiOutput> openOutput(const std::string& name,
                                                        const std::string& virtualName);

private:
    struct Voice {
        double freq;
        int channel;
        int note;
    };

    int takeChannel();

    std::unique_ptr<juce::MidiOutput> output_;
    int bendRange_;
    std::vector<Voice> voices_;
    int nextChannel_ = kFirstChannel;
};

} // namespace notesketch
