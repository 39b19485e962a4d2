#include "editor/Player.h"

#include <algorithm>

namespace notesketch {

Player::Player(AudioClock& clock, Instrument& instrument, double resolution, double tempo)
    : clock_(clock)
    , instrument_(instrument)
    , resolution_(resolution)
    , tempo_(tempo > 0.0 ? tempo : kDefaultTempo)
{}

Player::~Player() {
    if (isPlaying() || !retiring_.empty())
        instrument_.allNotesOff(clock_.now());
}

void Player::setTempo(double tempo) {
    if (tempo > 0.0)
        tempo_ = tempo;
}

void Player::play(const Score& score, double fromBeat) {
    if (isPlaying())
        stop();

    scheduler_ = std::make_unique<Scheduler>(clock_, resolution_);
    session_ = std::make_shared<Session>();
    startTime_ = clock_.now();
    fromBeat_ = fromBeat;

    auto timeOf = [this, fromBeat](double beat) {
        return startTime_ + std::max(0.0, beat - fromBeat) / tempo_;
    };

    std::vector<Note> notes = score.sortedByStart();
    notes.erase(std::remove_if(notes.begin(), notes.end(),
                               [fromBeat](const Note& n) { return n.end <= fromBeat; }),
                notes.end());

    Instrument* instrument = &instrument_;
    std::shared_ptr<Session> session = session_;

    // Stops go in first so a stop and a start at the same time keep that order
    double last = startTime_;
    for (const auto& note : notes) {
        const double freq = note.pitch;
        const double at = timeOf(note.end);
        last = std::max(last, at);
        scheduler_->schedule(at, [instrument, session, freq](double when) {
            auto it = session->sounding.find(freq);
            if (it == session->sounding.end())
                return;
            session->sounding.erase(it);
            instrument->stopNote(freq, when);
        });
    }
    for (const auto& note : notes) {
        const double freq = note.pitch;
        scheduler_->schedule(timeOf(note.start), [instrument, session, freq](double when) {
            session->sounding.insert(freq);
            instrument->startNote(freq, when);
        });
    }
    scheduler_->schedule(last, [session](double) { session->finished = true; });
}

void Player::stop() {
    if (!scheduler_)
        return;
    fromBeat_ = playhead();
    retire();
}

void Player::retire() {
    Instrument* instrument = &instrument_;
    std::shared_ptr<Session> session = session_;
    scheduler_->stop([instrument, session](double when) {
        for (double freq : session->sounding)
            instrument->stopNote(freq, when);
        session->sounding.clear();
    });
    retiring_.push_back(std::move(scheduler_));
    session_.reset();
}

void Player::poll() {
    for (auto& sched : retiring_)
        sched->poll();
    retiring_.erase(std::remove_if(retiring_.begin(), retiring_.end(),
                                   [](const std::unique_ptr<Scheduler>& s) { return !s->isRunning(); }),
                    retiring_.end());

    if (scheduler_) {
        scheduler_->poll();
        if (session_->finished) {
            fromBeat_ = 0.0;
            retire();
        }
    }
}

double Player::playhead() const {
    if (!scheduler_)
        return fromBeat_;
    return fromBeat_ + (clock_.now() - startTime_) * tempo_;
}

} // namespace notesketch
