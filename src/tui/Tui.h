#pragma once

#include "editor/NoteEditor.h"
#include <string>
#include <vector>
#include <mutex>
#include <deque>

namespace notesketch {

/// ncurses front end: the terminal is the canvas. Turns keyboard and xterm
/// mouse input into InputEvents for the editor and draws the score, grid,
/// previews, playhead, help and log.
class Tui {
public:
    explicit Tui(NoteEditor& editor);
    ~Tui();

    /// Initialize ncurses
    bool init();

    /// Shut down ncurses
    void shutdown();

    /// Process one frame of the TUI: feed input to the editor, redraw.
    /// Returns false if the user wants to quit.
    bool update();

    /// Add a message to the log
    void addMessage(const std::string& msg);

    /// Canvas size in cells: the terminal minus the status line and log
    int canvasWidth() const { return termWidth_; }
    int canvasHeight() const;

private:
    void draw();
    void drawGrid();
    void drawNotes();
    void drawNote(const Note& note, int pair, int attrs, char fill);
    void drawSelectionBox();
    void drawPlayhead();
    void drawStatus(int row);
    void drawHelp();
    void drawMessages(int startRow);
    void handleKey(int key);
    void handleMouse();
    void put(int row, int col, unsigned ch);

    NoteEditor& editor_;
    bool initialized_ = false;
    bool showHelp_ = false;

    std::mutex messageMutex_;
    std::deque<std::string> messages_;
    static constexpr int maxMessages_ = 4;

    int termWidth_ = 80;
    int termHeight_ = 24;
};

} // namespace notesketch
