#include "editor/Player.h"

#include <catch2/catch.hpp>

#include <cmath>
#include <string>
#include <vector>

using namespace notesketch;

namespace {

Note makeNote(double start, double end, double pitch) {
    Note n;
    n.start = start;
    n.end = end;
    n.pitch = pitch;
    return n;
}

struct Rig {
    ManualClock clock{0.0};
    std::vector<std::string> log;
    LogInstrument instrument{[this](const std::string& msg) { log.push_back(msg); }};
};

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

} // namespace

TEST_CASE("Player plays a note and finishes on its own", "[player]") {
    Rig rig;
    Player player(rig.clock, rig.instrument, 0.25, 4.0);
    Score score;
    score.add(makeNote(0.0, 4.0, 220.0));   // one second at 4 beats/s

    player.play(score);
    CHECK(player.isPlaying());
    CHECK(rig.instrument.sounding(220.0) == 1);

    rig.clock.set(0.5);
    player.poll();
    CHECK(player.playhead() == Approx(2.0));
    CHECK(rig.instrument.sounding(220.0) == 1);

    rig.clock.set(1.5);
    player.poll();
    CHECK(rig.instrument.sounding(220.0) == 0);
    CHECK_FALSE(player.isPlaying());
    CHECK(player.playhead() == 0.0);
    CHECK(player.retiringCount() == 1);

    rig.clock.set(2.0);
    player.poll();
    CHECK(player.retiringCount() == 0);
}

TEST_CASE("Stopping releases sounding notes on the next tick", "[player]") {
    Rig rig;
    Player player(rig.clock, rig.instrument, 0.25, 4.0);
    Score score;
    score.add(makeNote(0.0, 4.0, 220.0));
    score.add(makeNote(8.0, 12.0, 330.0));

    player.play(score);
    rig.clock.set(0.5);
    player.poll();

    player.stop();
    CHECK_FALSE(player.isPlaying());
    CHECK(player.playhead() == Approx(2.0));
    CHECK(player.retiringCount() == 1);
    CHECK(rig.instrument.sounding(220.0) == 1);

    rig.clock.set(0.75);
    player.poll();
    CHECK(rig.instrument.sounding(220.0) == 0);
    CHECK(player.retiringCount() == 0);

    // The later note never starts
    rig.clock.set(5.0);
    player.poll();
    CHECK(rig.instrument.soundingCount() == 0);
    for (const auto& line : rig.log)
        CHECK(line.find("330") == std::string::npos);
}

TEST_CASE("A note ending where the next one starts is released first", "[player]") {
    Rig rig;
    Player player(rig.clock, rig.instrument, 0.25, 4.0);
    Score score;
    score.add(makeNote(0.0, 4.0, 220.0));
    score.add(makeNote(4.0, 8.0, 220.0));

    player.play(score);
    rig.clock.set(1.5);
    player.poll();

    REQUIRE(rig.log.size() >= 3);
    CHECK(startsWith(rig.log[0], "on"));
    CHECK(startsWith(rig.log[1], "off"));
    CHECK(startsWith(rig.log[2], "on"));
    CHECK(rig.instrument.sounding(220.0) == 1);
}

TEST_CASE("Playing from a beat skips finished notes and joins held ones", "[player]") {
    Rig rig;
    Player player(rig.clock, rig.instrument, 0.25, 4.0);
    Score score;
    score.add(makeNote(0.0, 4.0, 110.0));
    score.add(makeNote(2.0, 6.0, 330.0));
    score.add(makeNote(4.0, 8.0, 440.0));

    player.play(score, 4.0);
    CHECK(player.playhead() == Approx(4.0));
    CHECK(rig.instrument.sounding(110.0) == 0);
    CHECK(rig.instrument.sounding(330.0) == 1);
    CHECK(rig.instrument.sounding(440.0) == 1);

    // Restarting stops the previous play first
    player.play(score, 0.0);
    CHECK(player.retiringCount() == 1);
    CHECK(rig.instrument.sounding(110.0) == 1);
}

TEST_CASE("Destroying a playing Player silences the instrument", "[player]") {
    Rig rig;
    Score score;
    score.add(makeNote(0.0, 4.0, 220.0));
    {
        Player player(rig.clock, rig.instrument, 0.25);
        player.play(score);
        CHECK(rig.instrument.soundingCount() == 1);
    }
    CHECK(rig.instrument.soundingCount() == 0);
}

TEST_CASE("Tempo must be positive", "[player]") {
    Rig rig;
    Player player(rig.clock, rig.instrument, 0.25, -2.0);
    CHECK(player.tempo() == Player::kDefaultTempo);
    player.setTempo(0.0);
    CHECK(player.tempo() == Player::kDefaultTempo);
    player.setTempo(8.0);
    CHECK(player.tempo() == 8.0);
}

TEST_CASE("MIDI pitch splits a frequency into note and bend", "[instrument]") {
    MidiPitch a = midiPitchFor(440.0);
    CHECK(a.note == 69);
    CHECK(a.bend == 8192);

    // 0.4 semitones above A4 with a two-semitone bend range
    MidiPitch q = midiPitchFor(440.0 * std::pow(2.0, 0.4 / 12.0));
    CHECK(q.note == 69);
    CHECK(q.bend == 8192 + 1638);

    CHECK(midiPitchFor(1.0).note == 0);
}
