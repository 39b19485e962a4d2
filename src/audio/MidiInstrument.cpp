#include "audio/MidiInstrument.h"

#include <algorithm>
#include <cstdio>

namespace notesketch {

MidiInstrument::MidiInstrument(std::unique_ptr<juce::MidiOutput> output, int bendRangeSemitones)
    : output_(std::move(output))
    , bendRange_(bendRangeSemitones)
{}

MidiInstrument::~MidiInstrument() {
    allNotesOff(0.0);
}

std::string MidiInstrument::name() const {
    return output_ ? output_->getName().toStdString() : std::string();
}

int MidiInstrument::takeChannel() {
    const int channel = nextChannel_;
    nextChannel_ = nextChannel_ >= kLastChannel ? kFirstChannel : nextChannel_ + 1;
    return channel;
}

void MidiInstrument::startNote(double freq, double /*when*/) {
    if (!output_)
        return;

    const MidiPitch pitch = midiPitchFor(freq, bendRange_);
    const int channel = takeChannel();

    // Reusing a channel steals whatever it was playing
    auto stolen = std::find_if(voices_.begin(), voices_.end(),
                               [channel](const Voice& v) { return v.channel == channel; });
    if (stolen != voices_.end()) {
        output_->sendMessageNow(juce::MidiMessage::noteOff(channel, stolen->note));
        voices_.erase(stolen);
    }

    output_->sendMessageNow(juce::MidiMessage::pitchWheel(channel, pitch.bend));
    output_->sendMessageNow(juce::MidiMessage::noteOn(channel, pitch.note, static_cast<juce::uint8>(100)));
    voices_.push_back({freq, channel, pitch.note});
}

void MidiInstrument::stopNote(double freq, double /*when*/) {
    if (!output_)
        return;

    auto it = std::find_if(voices_.begin(), voices_.end(),
                           [freq](const Voice& v) { return v.freq == freq; });
    if (it == voices_.end())
        return;
    output_->sendMessageNow(juce::MidiMessage::noteOff(it->channel, it->note));
    voices_.erase(it);
}

void MidiInstrument::allNotesOff(double /*when*/) {
    if (!output_)
        return;
    for (const auto& voice : voices_)
        output_->sendMessageNow(juce::MidiMessage::noteOff(voice.channel, voice.note));
    voices_.clear();
}

std::unique_ptr<juce::MidiOutput> MidiInstrument::openOutput(const std::string& name,
                                                             const std::string& virtualName) {
    if (!name.empty()) {
        juce::String wanted(name);
        auto devices = juce::MidiOutput::getAvailableDevices();
        for (const auto& d : devices) {
            if (d.name.containsIgnoreCase(wanted)) {
                auto output = juce::MidiOutput::openDevice(d.identifier);
                if (output) {
                    fprintf(stderr, "Opened MIDI output: %s\n", d.name.toRawUTF8());
                    return output;
                }
            }
        }
        fprintf(stderr, "Warning: MIDI output device '%s' not found\n", name.c_str());
        fprintf(stderr, "Available MIDI outputs:\n");
        for (const auto& d : devices) {
            fprintf(stderr, "  %s\n", d.name.toRawUTF8());
        }
    }

    auto output = juce::MidiOutput::createNewDevice(juce::String(virtualName));
    if (output) {
        fprintf(stderr, "Created virtual MIDI output: %s\n", virtualName.c_str());
    } else {
        fprintf(stderr, "Warning: could not create virtual MIDI output\n");
    }
    return output;
}

} // namespace notesketch
