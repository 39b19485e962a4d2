#include "editor/NoteEditor.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iterator>

namespace notesketch {

NoteEditor::NoteEditor(AudioClock& clock, Instrument& instrument,
                       EditorOptions options, EditorCallbacks callbacks)
    : clock_(clock)
    , instrument_(instrument)
    , options_(std::move(options))
    , callbacks_(std::move(callbacks))
    , grid_(options_.xSnap, options_.ySnap)
    , viewport_(makeViewport(options_.viewport, options_.width, options_.height))
    , scheduler_(clock, options_.resolution)
    , player_(clock, instrument, options_.resolution, options_.tempo)
    , runner_(input_)
{
    runner_.setMessageCallback([this](const std::string& msg) { message(msg); });
    registerCommands();
}

NoteEditor::~NoteEditor() {
    releaseCreateVoice();
}

void NoteEditor::handleInput(const InputEvent& event) {
    input_.apply(event);
    if (auto hook = hookFor(event.type))
        runner_.dispatch(*hook);
}

void NoteEditor::frame() {
    handleInput(InputEvent::frameTick());
    scheduler_.poll();

    const bool wasPlaying = player_.isPlaying();
    player_.poll();
    if (wasPlaying != player_.isPlaying())
        notifyChanged();
}

void NoteEditor::resize(int width, int height) {
    viewport_->setSize(width, height);
}

bool NoteEditor::saveScore() {
    std::string error;
    if (!score_.save(options_.scoreFile, error)) {
        message(error);
        return false;
    }
    message("Saved " + std::to_string(score_.size()) + " notes to " + options_.scoreFile);
    return true;
}

bool NoteEditor::loadScore(const std::string& path) {
    std::string error;
    auto loaded = Score::load(path, error);
    if (!loaded) {
        message(error);
        return false;
    }
    score_ = std::move(*loaded);
    selection_.clear();
    options_.scoreFile = path;
    message("Loaded " + std::to_string(score_.size()) + " notes from " + path);
    notifyChanged();
    return true;
}

// ---------------------------------------------------------------------------
// Geometry
// ---------------------------------------------------------------------------

NoteCells NoteEditor::cellsOf(const Note& note) const {
    NoteCells cells;
    cells.row = static_cast<int>(std::lround(viewport_->mapY(note.pitch)));
    cells.first = static_cast<int>(std::floor(viewport_->mapX(note.start)));
    cells.last = std::max(cells.first,
                          static_cast<int>(std::ceil(viewport_->mapX(note.end))) - 1);
    return cells;
}

std::optional<int> NoteEditor::noteAtCell(double x, double y) const {
    const int col = static_cast<int>(std::floor(x));
    const int row = static_cast<int>(std::floor(y));
    const auto& notes = score_.notes();
    for (auto it = notes.rbegin(); it != notes.rend(); ++it) {
        NoteCells cells = cellsOf(*it);
        if (cells.row == row && cells.first <= col && col <= cells.last)
            return it->id;
    }
    return std::nullopt;
}

std::optional<int> NoteEditor::noteEndAtCell(double x, double y) const {
    const int col = static_cast<int>(std::floor(x));
    const int row = static_cast<int>(std::floor(y));
    const auto& notes = score_.notes();
    for (auto it = notes.rbegin(); it != notes.rend(); ++it) {
        NoteCells cells = cellsOf(*it);
        if (cells.row == row && cells.last > cells.first && col == cells.last)
            return it->id;
    }
    return std::nullopt;
}

double NoteEditor::pointerTime() const {
    return viewport_->mapXinv(input_.pointerX);
}

double NoteEditor::pointerPitch() const {
    return viewport_->mapYinv(input_.pointerY);
}

// ---------------------------------------------------------------------------
// Effects shared by several commands
// ---------------------------------------------------------------------------

void NoteEditor::releaseCreateVoice() {
    if (createVoice_) {
        instrument_.stopNote(*createVoice_, clock_.now());
        createVoice_.reset();
    }
}

void NoteEditor::selectOnly(int id) {
    const Note* note = score_.find(id);
    if (!note)
        return;
    selection_.clear();
    selection_.insert(id);
    audition(note->pitch);
    notifyChanged();
}

void NoteEditor::audition(double pitch) {
    playNote(instrument_, scheduler_, pitch, kAuditionSeconds);
}

void NoteEditor::cycleXSnap() {
    static constexpr double kSnaps[] = {0.0, 0.25, 0.5, 1.0};
    const double current = grid_.xSnap();
    double next = kSnaps[0];
    for (size_t i = 0; i < std::size(kSnaps); ++i) {
        if (kSnaps[i] == current) {
            next = kSnaps[(i + 1) % std::size(kSnaps)];
            break;
        }
    }
    grid_.setXSnap(next);

    if (next == 0.0) {
        message("Time grid: free");
    } else {
        char buf[64];
        snprintf(buf, sizeof(buf), "Time grid: %g beats", next);
        message(buf);
    }
}

void NoteEditor::togglePlayback() {
    if (player_.isPlaying()) {
        player_.stop();
        message("Stopped");
    } else {
        player_.play(score_, 0.0);
        message("Playing " + std::to_string(score_.size()) + " notes");
    }
    notifyChanged();
}

void NoteEditor::message(const std::string& msg) const {
    if (callbacks_.onMessage)
        callbacks_.onMessage(msg);
    else
        fprintf(stderr, "%s\n", msg.c_str());
}

void NoteEditor::notifyChanged() const {
    if (callbacks_.onStateChanged)
        callbacks_.onStateChanged();
}

} // namespace notesketch
