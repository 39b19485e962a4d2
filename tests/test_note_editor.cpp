#include "editor/NoteEditor.h"

#include <catch2/catch.hpp>

#include <cstdio>
#include <filesystem>
#include <string>
#include <vector>

using namespace notesketch;

namespace {

// Default editor geometry: 80x24 cells showing beats 0..16 and 55..1760 Hz
// on a log axis, so one column is 0.2 beats. A 440 Hz note sits on row 10.

struct EditorRig {
    ManualClock clock{0.0};
    LogInstrument instrument;
    std::vector<std::string> messages;
    NoteEditor editor;

    explicit EditorRig(EditorOptions options = {})
        : editor(clock, instrument, std::move(options), callbacks())
    {}

    EditorCallbacks callbacks() {
        EditorCallbacks cb;
        cb.onMessage = [this](const std::string& msg) { messages.push_back(msg); };
        return cb;
    }

    void down(double x, double y, uint8_t mods = ModNone) {
        editor.handleInput(InputEvent::pointerDown(x, y, mods));
    }
    void move(double x, double y, uint8_t mods = ModNone) {
        editor.handleInput(InputEvent::pointerMove(x, y, mods));
    }
    void up(double x, double y, uint8_t mods = ModNone) {
        editor.handleInput(InputEvent::pointerUp(x, y, mods));
    }
    void key(int code) {
        editor.handleInput(InputEvent::keyDown(code));
        editor.handleInput(InputEvent::keyUp(code));
    }
    void frame() { editor.frame(); }

    /// Click with a frame in between, as the terminal delivers it
    void click(double x, double y) {
        down(x, y);
        frame();
        up(x, y);
        frame();
    }

    int addNote(double start, double end, double pitch) {
        Note n;
        n.start = start;
        n.end = end;
        n.pitch = pitch;
        return editor.score().add(n);
    }

    bool logged(const std::string& text) const {
        for (const auto& msg : messages) {
            if (msg.find(text) != std::string::npos)
                return true;
        }
        return false;
    }
};

} // namespace

TEST_CASE("Notes are drawn on the expected cells", "[editor]") {
    EditorRig rig;
    const int id = rig.addNote(2.0, 6.0, 440.0);
    NoteCells cells = rig.editor.cellsOf(*rig.editor.score().find(id));
    CHECK(cells.row == 10);
    CHECK(cells.first == 10);
    CHECK(cells.last == 29);

    CHECK(rig.editor.noteAtCell(15.5, 10.2) == id);
    CHECK_FALSE(rig.editor.noteAtCell(15.0, 11.0).has_value());
    CHECK(rig.editor.noteEndAtCell(29.0, 10.0) == id);
    CHECK_FALSE(rig.editor.noteEndAtCell(28.0, 10.0).has_value());
}

TEST_CASE("Dragging on empty canvas creates a snapped note", "[editor]") {
    EditorRig rig;

    rig.down(5.0, 20.0);
    REQUIRE(rig.editor.createPreview());
    CHECK(rig.editor.createPreview()->start == Approx(1.0));

    rig.move(20.0, 20.0);
    rig.frame();
    CHECK(rig.editor.createPreview()->end == Approx(4.0));
    CHECK(rig.instrument.sounding(108.0) == 1);   // row 20 snaps to 216/2

    rig.up(20.0, 20.0);
    rig.frame();

    REQUIRE(rig.editor.score().size() == 1);
    const Note& note = rig.editor.score().notes()[0];
    CHECK(note.start == Approx(1.0));
    CHECK(note.end == Approx(4.0));
    CHECK(note.pitch == Approx(108.0));
    CHECK(rig.editor.isSelected(note.id));
    CHECK_FALSE(rig.editor.createPreview());
    CHECK(rig.instrument.soundingCount() == 0);
}

TEST_CASE("A click without movement creates nothing", "[editor]") {
    EditorRig rig;
    rig.down(5.0, 20.0);
    rig.up(5.0, 20.0);
    rig.frame();
    CHECK(rig.editor.score().empty());
    CHECK_FALSE(rig.editor.createPreview());
}

TEST_CASE("Escape aborts a create drag without deselecting", "[editor]") {
    EditorRig rig;
    rig.down(5.0, 20.0);
    rig.move(20.0, 20.0);
    rig.frame();
    CHECK(rig.instrument.soundingCount() == 1);

    rig.key(KeyCode::Escape);
    rig.up(20.0, 20.0);
    rig.frame();

    CHECK(rig.editor.score().empty());
    CHECK_FALSE(rig.editor.createPreview());
    CHECK(rig.instrument.soundingCount() == 0);
}

TEST_CASE("Clicking a note selects and auditions it instead of creating one", "[editor]") {
    EditorRig rig;
    const int id = rig.addNote(2.0, 6.0, 440.0);

    rig.click(15.0, 10.0);

    CHECK(rig.editor.score().size() == 1);
    CHECK(rig.editor.selection() == std::set<int>{id});
    CHECK_FALSE(rig.editor.createPreview());
    CHECK(rig.instrument.sounding(440.0) == 1);

    rig.clock.set(NoteEditor::kAuditionSeconds + 0.1);
    rig.frame();
    CHECK(rig.instrument.sounding(440.0) == 0);
}

TEST_CASE("Delete removes the selection", "[editor]") {
    EditorRig rig;
    const int keep = rig.addNote(8.0, 10.0, 220.0);
    rig.addNote(2.0, 6.0, 440.0);
    rig.click(15.0, 10.0);

    rig.key(KeyCode::Delete);
    REQUIRE(rig.editor.score().size() == 1);
    CHECK(rig.editor.score().notes()[0].id == keep);
    CHECK(rig.editor.selection().empty());
    CHECK(rig.logged("Deleted 1 notes"));

    // Nothing selected: nothing happens
    rig.key(KeyCode::Backspace);
    CHECK(rig.editor.score().size() == 1);
}

TEST_CASE("Escape clears the selection", "[editor]") {
    EditorRig rig;
    rig.addNote(2.0, 6.0, 440.0);
    rig.click(15.0, 10.0);
    REQUIRE(rig.editor.selection().size() == 1);

    rig.key(KeyCode::Escape);
    CHECK(rig.editor.selection().empty());
}

TEST_CASE("Ctrl+drag box-selects and G sets the pitch grid", "[editor]") {
    EditorRig rig;
    const int a = rig.addNote(2.0, 6.0, 200.0);
    const int b = rig.addNote(8.0, 10.0, 300.0);
    rig.addNote(1.0, 2.0, 40.0);   // below the view

    rig.down(0.0, 0.0, ModCtrl);
    REQUIRE(rig.editor.selectionBox());
    rig.move(79.0, 23.0, ModCtrl);
    rig.frame();
    CHECK(rig.editor.selectionBox()->t1 == Approx(15.8));
    rig.up(79.0, 23.0, ModCtrl);
    rig.frame();

    CHECK(rig.editor.selection() == std::set<int>{a, b});
    CHECK_FALSE(rig.editor.selectionBox());
    CHECK(rig.editor.score().size() == 3);

    rig.key(KeyCode::G);
    CHECK(rig.editor.grid().ySnap() == Approx(100.0));
    CHECK(rig.logged("Pitch grid: 100.00 Hz"));
}

TEST_CASE("G without a selection leaves the grid alone", "[editor]") {
    EditorRig rig;
    rig.key(KeyCode::G);
    CHECK(rig.editor.grid().ySnap() == 216.0);
    CHECK(rig.logged("Select notes"));
}

TEST_CASE("Shift+click on a note sets the pitch grid to it", "[editor]") {
    EditorRig rig;
    rig.addNote(2.0, 6.0, 440.0);

    rig.down(15.0, 10.0, ModShift);
    rig.up(15.0, 10.0, ModShift);
    rig.frame();

    CHECK(rig.editor.grid().ySnap() == Approx(440.0));
    CHECK(rig.editor.selection().empty());
    CHECK(rig.editor.score().size() == 1);
}

TEST_CASE("Dragging the last cell of a note resizes it", "[editor]") {
    EditorRig rig;
    const int id = rig.addNote(2.0, 6.0, 440.0);

    rig.down(29.0, 10.0);
    rig.move(39.0, 10.0);
    rig.frame();
    REQUIRE(rig.editor.resizePreview());
    CHECK(rig.editor.resizePreview()->end == Approx(8.0));

    rig.up(39.0, 10.0);
    rig.frame();

    CHECK(rig.editor.score().size() == 1);
    CHECK(rig.editor.score().find(id)->end == Approx(8.0));
    CHECK(rig.editor.selection().empty());
    CHECK_FALSE(rig.editor.resizePreview());
}

TEST_CASE("Clicking the last cell of a note selects it without resizing", "[editor]") {
    EditorOptions options;
    options.xSnap = 0.0;
    EditorRig rig(options);
    const int id = rig.addNote(2.0, 6.0, 440.0);

    rig.click(29.0, 10.0);

    CHECK(rig.editor.score().find(id)->end == Approx(6.0));
    CHECK(rig.editor.selection() == std::set<int>{id});
    CHECK_FALSE(rig.editor.resizePreview());
    CHECK(rig.instrument.sounding(440.0) == 1);
}

TEST_CASE("D duplicates the selection where the pointer drops it", "[editor]") {
    EditorRig rig;
    const int source = rig.addNote(2.0, 6.0, 440.0);
    rig.click(15.0, 10.0);

    rig.key(KeyCode::D);
    REQUIRE(rig.editor.duplicatePreview().size() == 1);

    rig.move(25.0, 10.0);
    rig.frame();
    CHECK(rig.editor.duplicatePreview()[0].start == Approx(4.0));

    rig.down(25.0, 10.0);
    rig.up(25.0, 10.0);

    REQUIRE(rig.editor.score().size() == 2);
    const Note& copy = rig.editor.score().notes()[1];
    CHECK(copy.start == Approx(4.0));
    CHECK(copy.end == Approx(8.0));
    CHECK(copy.pitch == Approx(440.0));
    CHECK(rig.editor.selection() == std::set<int>{copy.id});
    CHECK_FALSE(rig.editor.isSelected(source));
    CHECK(rig.editor.duplicatePreview().empty());
}

TEST_CASE("Tab cycles the time grid", "[editor]") {
    EditorRig rig;
    CHECK(rig.editor.grid().xSnap() == 1.0);
    rig.key(KeyCode::Tab);
    CHECK(rig.editor.grid().xSnap() == 0.0);
    rig.key(KeyCode::Tab);
    CHECK(rig.editor.grid().xSnap() == 0.25);
}

TEST_CASE("Space toggles playback", "[editor]") {
    EditorRig rig;
    rig.addNote(0.0, 4.0, 220.0);

    rig.key(KeyCode::Space);
    CHECK(rig.editor.player().isPlaying());
    CHECK(rig.instrument.sounding(220.0) == 1);

    rig.key(KeyCode::Space);
    CHECK_FALSE(rig.editor.player().isPlaying());
}

TEST_CASE("View keys pan, zoom and switch the pitch axis", "[editor]") {
    EditorRig rig;

    rig.key(KeyCode::Right);
    CHECK(rig.editor.viewport().minTime() == Approx(4.0));

    rig.key(KeyCode::Plus);
    CHECK(rig.editor.viewport().maxTime() - rig.editor.viewport().minTime() == Approx(12.8));

    rig.key(KeyCode::V);
    CHECK(rig.editor.viewport().kind() == Viewport::Kind::Linear);
    rig.key(KeyCode::V);
    CHECK(rig.editor.viewport().kind() == Viewport::Kind::Log);
}

TEST_CASE("S saves the score and it loads back", "[editor]") {
    const auto path = (std::filesystem::temp_directory_path() / "notesketch_editor_test.toml").string();
    EditorOptions options;
    options.scoreFile = path;

    {
        EditorRig rig(options);
        rig.addNote(2.0, 6.0, 440.0);
        rig.key(KeyCode::S);
        CHECK(rig.logged("Saved 1 notes"));
    }

    EditorRig other;
    REQUIRE(other.editor.loadScore(path));
    std::remove(path.c_str());
    CHECK(other.editor.score().size() == 1);
    CHECK(other.editor.scoreFile() == path);

    CHECK_FALSE(other.editor.loadScore(path));
    CHECK(other.logged("Load error"));
    CHECK(other.editor.score().size() == 1);
}

TEST_CASE("Help lists the visible command categories", "[editor]") {
    EditorRig rig;
    std::vector<std::string> categories;
    for (const auto& section : rig.editor.runner().helpSections()) {
        categories.push_back(section.category);
        for (const auto& desc : section.descriptions)
            CHECK(desc.find("save") == std::string::npos);
    }
    CHECK(categories == std::vector<std::string>{"Grid", "Notes", "Playback", "Selection", "View"});
}
