// Interactive commands of the note editor. Each command is a perpetual
// procedure on the CommandRunner; drags update their preview through a
// per-dispatch action so competing drags are settled by priority.

#include "editor/NoteEditor.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace notesketch {

namespace {

// Action priorities: the more specific interaction wins
constexpr int kPriorityDeselect = -1;
constexpr int kPriorityCreate = 0;
constexpr int kPrioritySelect = 1;
constexpr int kPriorityResize = 2;
constexpr int kPriorityDuplicate = 3;

constexpr double kPanStep = 0.25;
constexpr double kZoomStep = 1.25;

/// Consume any key down among `codes`, carrying the code
Listener<int> anyKey(const InputState& input, std::vector<int> codes) {
    const InputState* in = &input;
    Listener<int> l;
    l.keyDown = [in, codes]() {
        if (std::find(codes.begin(), codes.end(), in->keyCode) != codes.end())
            return Status<int>::consume(in->keyCode);
        return Status<int>::repeat();
    };
    return l;
}

} // namespace

Listener<NoteEditor::DragStep> NoteEditor::dragListener(int priority,
                                                        std::function<void()> step) const {
    const InputState* in = &input_;
    Listener<DragStep> l;
    l.actionPriority = priority;
    l.action = [step]() {
        step();
        return Status<DragStep>::proceed(DragStep::Move);
    };
    l.pointerUp = []() { return Status<DragStep>::proceed(DragStep::Release); };
    l.keyDown = [in]() {
        return in->keyCode == KeyCode::Escape ? Status<DragStep>::consume(DragStep::Abort)
                                              : Status<DragStep>::repeat();
    };
    return l;
}

void NoteEditor::registerCommands() {
    // Registration order is dispatch order: consuming gestures first,
    // deselect last so every drag sees Escape before it.

    runner_.registerCommand("Ctrl+drag: select notes in a box", "Selection", [this](Context cx) {
        selectionBox_.reset();
        auto ctrlDown = cx.when([this](Unit) { return input_.ctrl; }, cx.pointerDown());
        cx.listen(ctrlDown, [this](Context cx, Unit) {
            const double t = pointerTime();
            const double p = pointerPitch();
            selectionBox_ = Box{t, t, p, p};
            boxSelectDrag(cx);
        });
    });

    runner_.registerCommand("Shift+click a note: set the pitch grid to it", "Grid", [this](Context cx) {
        auto shiftOnNote = cx.when([this](Unit) {
            return input_.shift && noteAtCell(input_.pointerX, input_.pointerY).has_value();
        }, cx.pointerDown());
        cx.listen(shiftOnNote, [this](Context cx, Unit) {
            auto id = noteAtCell(input_.pointerX, input_.pointerY);
            if (!id)
                return;
            const int noteId = *id;
            cx.action([this, noteId]() {
                if (const Note* note = score_.find(noteId)) {
                    grid_.setYSnap(note->pitch);
                    char buf[64];
                    snprintf(buf, sizeof(buf), "Pitch grid: %.2f Hz", note->pitch);
                    message(buf);
                }
            }, kPriorityDuplicate);
        });
    });

    runner_.registerCommand("D: duplicate the selection, click to drop", "Notes", [this](Context cx) {
        duplicateSource_.clear();
        duplicatePreview_.clear();
        cx.listen(cx.key(KeyCode::D), [this](Context cx, Unit) {
            if (selection_.empty()) {
                message("Nothing selected to duplicate");
                return;
            }
            for (int id : selection_) {
                if (const Note* note = score_.find(id))
                    duplicateSource_.push_back(*note);
            }
            duplicatePreview_ = duplicateSource_;
            duplicateAnchorTime_ = snappedTime();
            duplicateAnchorPitch_ = snappedPitch();
            duplicateFollow(cx);
        });
    });

    runner_.registerCommand("Drag the end of a note: resize it", "Notes", [this](Context cx) {
        resizePreview_.reset();
        auto onEnd = cx.when([this](Unit) {
            return !input_.shift && noteEndAtCell(input_.pointerX, input_.pointerY).has_value();
        }, cx.pointerDown(Control::Proceed));
        cx.listen(onEnd, [this](Context cx, Unit) {
            auto id = noteEndAtCell(input_.pointerX, input_.pointerY);
            if (!id)
                return;
            resizeDrag(cx, *id, static_cast<int>(std::floor(input_.pointerX)),
                       static_cast<int>(std::floor(input_.pointerY)));
        });
    });

    runner_.registerCommand("Click a note: select it", "Selection", [this](Context cx) {
        auto onNote = cx.when([this](Unit) {
            return noteAtCell(input_.pointerX, input_.pointerY).has_value();
        }, cx.pointerDown(Control::Proceed));
        cx.listen(onNote, [this](Context cx, Unit) {
            auto id = noteAtCell(input_.pointerX, input_.pointerY);
            if (!id)
                return;
            const int noteId = *id;
            cx.action([this, noteId]() { selectOnly(noteId); }, kPrioritySelect);
        });
    });

    runner_.registerCommand("Drag on the canvas: create a note", "Notes", [this](Context cx) {
        releaseCreateVoice();
        createPreview_.reset();
        cx.listen(cx.pointerDown(Control::Proceed), [this](Context cx, Unit) {
            Note note;
            note.start = note.end = snappedTime();
            note.pitch = snappedPitch();
            createPreview_ = note;
            createDrag(cx);
        });
    });

    runner_.registerCommand("Backspace/Delete: delete the selection", "Notes", [this](Context cx) {
        cx.listen(anyKey(input_, {KeyCode::Backspace, KeyCode::Delete}), [this](Context cx, int) {
            cx.action([this]() {
                if (selection_.empty())
                    return;
                for (int id : selection_)
                    score_.remove(id);
                message("Deleted " + std::to_string(selection_.size()) + " notes");
                selection_.clear();
                notifyChanged();
            });
        });
    });

    runner_.registerCommand("G: set the pitch grid to the selection's common divisor", "Grid",
                            [this](Context cx) {
        cx.listen(cx.key(KeyCode::G), [this](Context cx, Unit) {
            cx.action([this]() {
                std::vector<double> pitches;
                for (int id : selection_) {
                    if (const Note* note = score_.find(id))
                        pitches.push_back(note->pitch);
                }
                if (pitches.empty()) {
                    message("Select notes to find their common divisor");
                    return;
                }
                const double divisor = QuantizationGrid::commonDivisor(pitches);
                grid_.setYSnap(divisor);
                char buf[64];
                snprintf(buf, sizeof(buf), "Pitch grid: %.2f Hz", divisor);
                message(buf);
            });
        });
    });

    runner_.registerCommand("Tab: cycle the time grid", "Grid", [this](Context cx) {
        cx.listen(cx.key(KeyCode::Tab), [this](Context cx, Unit) {
            cx.action([this]() { cycleXSnap(); });
        });
    });

    runner_.registerCommand("Space: play/stop", "Playback", [this](Context cx) {
        cx.listen(cx.key(KeyCode::Space), [this](Context cx, Unit) {
            cx.action([this]() { togglePlayback(); });
        });
    });

    runner_.registerCommand("Arrows: pan", "View", [this](Context cx) {
        auto arrows = anyKey(input_, {KeyCode::Left, KeyCode::Right, KeyCode::Up, KeyCode::Down});
        cx.listen(arrows, [this](Context cx, int code) {
            cx.action([this, code]() {
                switch (code) {
                    case KeyCode::Left:  viewport_->translateX(-kPanStep); break;
                    case KeyCode::Right: viewport_->translateX(kPanStep); break;
                    case KeyCode::Up:    viewport_->translateY(kPanStep); break;
                    case KeyCode::Down:  viewport_->translateY(-kPanStep); break;
                    default: break;
                }
            });
        });
    });

    runner_.registerCommand("+/-: zoom", "View", [this](Context cx) {
        cx.listen(anyKey(input_, {KeyCode::Plus, KeyCode::Minus}), [this](Context cx, int code) {
            cx.action([this, code]() {
                const double ratio = code == KeyCode::Plus ? kZoomStep : 1.0 / kZoomStep;
                const double aboutTime = viewport_->mapXinv(viewport_->width() / 2.0);
                const double aboutPitch = viewport_->mapYinv(viewport_->height() / 2.0);
                viewport_->zoomX(ratio, aboutTime);
                viewport_->zoomY(ratio, aboutPitch);
            });
        });
    });

    runner_.registerCommand("V: toggle log/linear pitch axis", "View", [this](Context cx) {
        cx.listen(cx.key(KeyCode::V), [this](Context cx, Unit) {
            cx.action([this]() {
                viewport_ = toggled(*viewport_);
                message(viewport_->kind() == Viewport::Kind::Log ? "Log pitch axis"
                                                                 : "Linear pitch axis");
            });
        });
    });

    runner_.registerCommand("S: save", CommandRunner::kHiddenCategory, [this](Context cx) {
        cx.listen(cx.key(KeyCode::S), [this](Context cx, Unit) {
            cx.action([this]() { saveScore(); });
        });
    });

    runner_.registerCommand("Escape: deselect", "Selection", [this](Context cx) {
        cx.listen(cx.key(KeyCode::Escape), [this](Context cx, Unit) {
            cx.action([this]() {
                if (selection_.empty())
                    return;
                selection_.clear();
                notifyChanged();
            }, kPriorityDeselect);
        });
    });
}

// ---------------------------------------------------------------------------
// Drag loops
// ---------------------------------------------------------------------------

void NoteEditor::boxSelectDrag(Context cx) {
    auto step = [this]() {
        if (selectionBox_) {
            selectionBox_->t1 = pointerTime();
            selectionBox_->p1 = pointerPitch();
        }
    };
    cx.listen(dragListener(kPriorityCreate, step), [this](Context cx, DragStep s) {
        switch (s) {
            case DragStep::Move:
                boxSelectDrag(cx);
                return;
            case DragStep::Abort:
                selectionBox_.reset();
                return;
            case DragStep::Release:
                cx.action([this]() {
                    if (!selectionBox_)
                        return;
                    const Box box = *selectionBox_;
                    selectionBox_.reset();
                    selection_.clear();
                    for (int id : score_.notesIn(box.t0, pointerTime(), box.p0, pointerPitch()))
                        selection_.insert(id);
                    message("Selected " + std::to_string(selection_.size()) + " notes");
                    notifyChanged();
                });
                return;
        }
    });
}

void NoteEditor::createDrag(Context cx) {
    auto step = [this]() {
        if (!createPreview_)
            return;
        if (!createVoice_) {
            createVoice_ = createPreview_->pitch;
            instrument_.startNote(*createVoice_, clock_.now());
        }
        createPreview_->end = snappedTime();
    };
    cx.listen(dragListener(kPriorityCreate, step), [this](Context cx, DragStep s) {
        switch (s) {
            case DragStep::Move:
                createDrag(cx);
                return;
            case DragStep::Abort:
                releaseCreateVoice();
                createPreview_.reset();
                return;
            case DragStep::Release:
                cx.action([this]() {
                    releaseCreateVoice();
                    if (!createPreview_)
                        return;
                    Note note = *createPreview_;
                    createPreview_.reset();
                    note.end = snappedTime();
                    if (note.end == note.start)
                        return;
                    const int id = score_.add(note);
                    selection_.clear();
                    selection_.insert(id);
                    notifyChanged();
                }, kPriorityCreate);
                return;
        }
    });
}

void NoteEditor::resizeDrag(Context cx, int id, int pressCol, int pressRow) {
    auto step = [this, id, pressCol, pressRow]() {
        const Note* note = score_.find(id);
        if (!note) {
            resizePreview_.reset();
            return;
        }
        const bool onPressCell = static_cast<int>(std::floor(input_.pointerX)) == pressCol &&
                                 static_cast<int>(std::floor(input_.pointerY)) == pressRow;
        if (!resizePreview_ && onPressCell)
            return;
        Note preview = *note;
        preview.end = std::max(snappedTime(), note->start);
        resizePreview_ = preview;
    };
    cx.listen(dragListener(kPriorityResize, step),
              [this, id, pressCol, pressRow](Context cx, DragStep s) {
        switch (s) {
            case DragStep::Move:
                resizeDrag(cx, id, pressCol, pressRow);
                return;
            case DragStep::Abort:
                resizePreview_.reset();
                return;
            case DragStep::Release:
                cx.action([this, id]() {
                    const bool dragged = resizePreview_.has_value();
                    resizePreview_.reset();
                    Note* note = score_.find(id);
                    if (!note)
                        return;
                    // Never left the pressed cell: this was a click on the note
                    if (!dragged) {
                        if (selection_ != std::set<int>{id})
                            selectOnly(id);
                        return;
                    }
                    const double end = snappedTime();
                    if (end > note->start) {
                        note->end = end;
                        notifyChanged();
                    }
                }, kPriorityResize);
                return;
        }
    });
}

void NoteEditor::duplicateFollow(Context cx) {
    const InputState* in = &input_;
    auto step = [this]() {
        const double dt = snappedTime() - duplicateAnchorTime_;
        const double ratio = duplicateAnchorPitch_ > 0.0 ? snappedPitch() / duplicateAnchorPitch_ : 1.0;
        for (size_t i = 0; i < duplicateSource_.size(); ++i) {
            duplicatePreview_[i].start = duplicateSource_[i].start + dt;
            duplicatePreview_[i].end = duplicateSource_[i].end + dt;
            duplicatePreview_[i].pitch = duplicateSource_[i].pitch * ratio;
        }
    };

    Listener<DragStep> l;
    l.actionPriority = kPriorityDuplicate;
    l.action = [step]() {
        step();
        return Status<DragStep>::proceed(DragStep::Move);
    };
    l.pointerDown = []() { return Status<DragStep>::consume(DragStep::Release); };
    l.keyDown = [in]() {
        return in->keyCode == KeyCode::Escape ? Status<DragStep>::consume(DragStep::Abort)
                                              : Status<DragStep>::repeat();
    };

    cx.listen(l, [this](Context cx, DragStep s) {
        switch (s) {
            case DragStep::Move:
                duplicateFollow(cx);
                return;
            case DragStep::Abort:
                duplicatePreview_.clear();
                duplicateSource_.clear();
                return;
            case DragStep::Release:
                cx.action([this]() {
                    selection_.clear();
                    for (const Note& copy : duplicatePreview_)
                        selection_.insert(score_.add(copy));
                    message("Duplicated " + std::to_string(duplicatePreview_.size()) + " notes");
                    duplicatePreview_.clear();
                    duplicateSource_.clear();
                    notifyChanged();
                }, kPriorityDuplicate);
                return;
        }
    });
}

} // namespace notesketch
