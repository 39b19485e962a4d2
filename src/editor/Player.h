#pragma once

#include "core/AudioClock.h"
#include "core/Scheduler.h"
#include "editor/Instrument.h"
#include "editor/Score.h"

#include <memory>
#include <set>
#include <vector>

namespace notesketch {

/// Plays a score through an Instrument. Every play() gets its own Scheduler;
/// stopping arms that scheduler's cleanup, which silences whatever is still
/// sounding on its next tick.
class Player {
public:
    static constexpr double kDefaultTempo = 4.0;   // beats per second

    Player(AudioClock& clock, Instrument& instrument, double resolution,
           double tempo = kDefaultTempo);
    ~Player();

    Player(const Player&) = delete;
    Player& operator=(const Player&) = delete;

    /// Start playing `score` from `fromBeat`. A running play is stopped first.
    void play(const Score& score, double fromBeat = 0.0);

    /// Stop the current play. Sounding notes are released on the next tick.
    void stop();

    /// Drive the schedulers. Call once per host loop iteration.
    void poll();

    bool isPlaying() const { return scheduler_ != nullptr; }

    /// Current position in beats (start beat of the last play when idle)
    double playhead() const;

    void setTempo(double tempo);
    double tempo() const { return tempo_; }

    /// Schedulers stopped but not yet ticked into their cleanup
    size_t retiringCount() const { return retiring_.size(); }

private:
    struct Session {
        std::multiset<double> sounding;
        bool finished = false;
    };

    void retire();

    AudioClock& clock_;
    Instrument& instrument_;
    double resolution_;
    double tempo_;

    std::unique_ptr<Scheduler> scheduler_;
    std::shared_ptr<Session> session_;
    std::vector<std::unique_ptr<Scheduler>> retiring_;

    double startTime_ = 0.0;
    double fromBeat_ = 0.0;
};

} // namespace notesketch
