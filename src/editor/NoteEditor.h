#pragma once

#include "core/AudioClock.h"
#include "core/CommandRunner.h"
#include "core/InputEvents.h"
#include "core/Scheduler.h"
#include "editor/Instrument.h"
#include "editor/Player.h"
#include "editor/QuantizationGrid.h"
#include "editor/Score.h"
#include "editor/Viewport.h"

#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace notesketch {

/// Callbacks from the editor to its host (TUI, OSC server)
struct EditorCallbacks {
    std::function<void(const std::string&)> onMessage;
    std::function<void()> onStateChanged;
};

struct EditorOptions {
    double xSnap = 1.0;
    double ySnap = 216.0;
    Viewport::Kind viewport = Viewport::Kind::Log;
    int width = 80;
    int height = 24;
    double resolution = 0.01;
    double tempo = Player::kDefaultTempo;
    std::string scoreFile = "score.toml";
};

/// World-space rectangle (beats x Hz)
struct Box {
    double t0, t1;
    double p0, p1;
};

/// Canvas cells a note occupies: one row, columns first..last inclusive
struct NoteCells {
    int row;
    int first;
    int last;
};

/// The pitch/time note editor: owns the score, the grids, the view, the
/// selection and the command runner that turns input into edits.
class NoteEditor {
public:
    /// Seconds a selected note is auditioned for
    static constexpr double kAuditionSeconds = 0.33;

    NoteEditor(AudioClock& clock, Instrument& instrument,
               EditorOptions options = {}, EditorCallbacks callbacks = {});
    ~NoteEditor();

    NoteEditor(const NoteEditor&) = delete;
    NoteEditor& operator=(const NoteEditor&) = delete;

    /// Update the input snapshot and dispatch the matching hook
    void handleInput(const InputEvent& event);

    /// Per-frame step: dispatch FrameTick and drive the schedulers
    void frame();

    void resize(int width, int height);

    // --- Document ---

    bool saveScore();
    bool loadScore(const std::string& path);
    const std::string& scoreFile() const { return options_.scoreFile; }

    // --- Read access for drawing, remote state and tests ---

    const Score& score() const { return score_; }
    Score& score() { return score_; }
    const QuantizationGrid& grid() const { return grid_; }
    const Viewport& viewport() const { return *viewport_; }
    const std::set<int>& selection() const { return selection_; }
    bool isSelected(int id) const { return selection_.count(id) != 0; }
    const InputState& input() const { return input_; }
    const Player& player() const { return player_; }
    const CommandRunner& runner() const { return runner_; }
    CommandRunner& runner() { return runner_; }

    const std::optional<Note>& createPreview() const { return createPreview_; }
    const std::optional<Note>& resizePreview() const { return resizePreview_; }
    const std::vector<Note>& duplicatePreview() const { return duplicatePreview_; }
    const std::optional<Box>& selectionBox() const { return selectionBox_; }

    NoteCells cellsOf(const Note& note) const;

    /// Note drawn under the canvas cell, topmost (last added) first
    std::optional<int> noteAtCell(double x, double y) const;

    /// Note whose last cell is under the canvas cell (resize handle)
    std::optional<int> noteEndAtCell(double x, double y) const;

private:
    enum class DragStep { Move, Release, Abort };

    void registerCommands();

    // Command bodies (EditorCommands.cpp)
    void boxSelectDrag(Context cx);
    void createDrag(Context cx);
    // The preview only starts once the pointer leaves the pressed cell
    void resizeDrag(Context cx, int id, int pressCol, int pressRow);
    void duplicateFollow(Context cx);

    Listener<DragStep> dragListener(int priority, std::function<void()> step) const;

    double pointerTime() const;
    double pointerPitch() const;
    double snappedTime() const { return grid_.snapX(pointerTime()); }
    double snappedPitch() const { return grid_.snapY(pointerPitch()); }

    void releaseCreateVoice();
    void selectOnly(int id);
    void audition(double pitch);
    void cycleXSnap();
    void togglePlayback();

    void message(const std::string& msg) const;
    void notifyChanged() const;

    AudioClock& clock_;
    Instrument& instrument_;
    EditorOptions options_;
    EditorCallbacks callbacks_;

    Score score_;
    QuantizationGrid grid_;
    std::unique_ptr<Viewport> viewport_;
    std::set<int> selection_;

    Scheduler scheduler_;      // auditions
    Player player_;

    // Drag state
    std::optional<Note> createPreview_;
    std::optional<double> createVoice_;
    std::optional<Note> resizePreview_;
    std::vector<Note> duplicateSource_;
    std::vector<Note> duplicatePreview_;
    double duplicateAnchorTime_ = 0.0;
    double duplicateAnchorPitch_ = 0.0;
    std::optional<Box> selectionBox_;

    InputState input_;
    CommandRunner runner_;
};

} // namespace notesketch
