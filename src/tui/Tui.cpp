#include "tui/Tui.h"
#include <ncurses.h>
#include <cmath>
#include <cstdio>
#include <algorithm>

namespace notesketch {

namespace {

constexpr int kLogRows = 4;
constexpr int kStatusRows = 1;

/// Enables xterm "any event" mouse tracking so motion is reported while a
/// button is held
constexpr const char* kMouseTrackingOn = "\033[?1003h";
constexpr const char* kMouseTrackingOff = "\033[?1003l";

uint8_t mouseModifiers(mmask_t state) {
    uint8_t mods = ModNone;
    if (state & BUTTON_SHIFT) mods |= ModShift;
    if (state & BUTTON_CTRL)  mods |= ModCtrl;
    if (state & BUTTON_ALT)   mods |= ModAlt;
    return mods;
}

/// Map an ncurses key to a key code, or -1 if it has none
int keyCodeFor(int key) {
    switch (key) {
        case KEY_LEFT:      return KeyCode::Left;
        case KEY_RIGHT:     return KeyCode::Right;
        case KEY_UP:        return KeyCode::Up;
        case KEY_DOWN:      return KeyCode::Down;
        case KEY_BACKSPACE: return KeyCode::Backspace;
        case KEY_DC:        return KeyCode::Delete;
        case KEY_ENTER:     return KeyCode::Enter;
        default: break;
    }
    if (auto code = KeyCode::fromChar(key))
        return *code;
    return -1;
}

} // namespace

Tui::Tui(NoteEditor& editor)
    : editor_(editor)
{
}

Tui::~Tui() {
    shutdown();
}

bool Tui::init() {
    initscr();
    if (!stdscr) return false;

    cbreak();             // Disable line buffering
    noecho();             // Don't echo input
    keypad(stdscr, TRUE); // Enable special keys
    nodelay(stdscr, TRUE); // Non-blocking input
    curs_set(0);          // Hide cursor
    set_escdelay(25);     // Escape is a command key

    mousemask(ALL_MOUSE_EVENTS | REPORT_MOUSE_POSITION, nullptr);
    mouseinterval(0);
    printf("%s", kMouseTrackingOn);
    fflush(stdout);

    if (has_colors()) {
        start_color();
        use_default_colors();
        init_pair(1, COLOR_BLUE, -1);     // Notes
        init_pair(2, COLOR_CYAN, -1);     // Selected notes
        init_pair(3, COLOR_MAGENTA, -1);  // Previews
        init_pair(4, COLOR_WHITE, -1);    // Time grid
        init_pair(5, COLOR_YELLOW, -1);   // Harmonic lines
        init_pair(6, COLOR_GREEN, -1);    // Playhead
        init_pair(7, COLOR_BLUE, -1);     // Header
    }

    getmaxyx(stdscr, termHeight_, termWidth_);
    editor_.resize(canvasWidth(), canvasHeight());
    initialized_ = true;
    return true;
}

void Tui::shutdown() {
    if (initialized_) {
        printf("%s", kMouseTrackingOff);
        fflush(stdout);
        endwin();
        initialized_ = false;
    }
}

int Tui::canvasHeight() const {
    return std::max(1, termHeight_ - kStatusRows - kLogRows);
}

bool Tui::update() {
    if (!initialized_) return false;

    // Handle resize
    int h, w;
    getmaxyx(stdscr, h, w);
    if (h != termHeight_ || w != termWidth_) {
        termHeight_ = h;
        termWidth_ = w;
        editor_.resize(canvasWidth(), canvasHeight());
    }

    // Process all available input
    int key;
    while ((key = getch()) != ERR) {
        if (key == 'q' || key == 'Q') {
            return false;
        }
        if (key == KEY_MOUSE) {
            handleMouse();
        } else if (key == '?') {
            showHelp_ = !showHelp_;
        } else if (key != KEY_RESIZE) {
            handleKey(key);
        }
    }

    editor_.frame();
    draw();

    return true;
}

void Tui::handleKey(int key) {
    const int code = keyCodeFor(key);
    if (code < 0)
        return;

    const uint8_t mods = (key >= 'A' && key <= 'Z') ? ModShift : ModNone;

    // Terminals report presses only, so release right away
    editor_.handleInput(InputEvent::keyDown(code, mods));
    editor_.handleInput(InputEvent::keyUp(code, mods));
}

void Tui::handleMouse() {
    MEVENT ev;
    if (getmouse(&ev) != OK)
        return;

    const uint8_t mods = mouseModifiers(ev.bstate);
    const double x = ev.x;
    const double y = ev.y;

    if (ev.bstate & (BUTTON1_PRESSED | BUTTON1_CLICKED)) {
        editor_.handleInput(InputEvent::pointerDown(x, y, mods));
        if (ev.bstate & BUTTON1_CLICKED)
            editor_.handleInput(InputEvent::pointerUp(x, y, mods));
    } else if (ev.bstate & BUTTON1_RELEASED) {
        editor_.handleInput(InputEvent::pointerUp(x, y, mods));
    } else if (ev.bstate & REPORT_MOUSE_POSITION) {
        editor_.handleInput(InputEvent::pointerMove(x, y, mods));
    }
}

// ---------------------------------------------------------------------------
// Drawing
// ---------------------------------------------------------------------------

void Tui::put(int row, int col, unsigned ch) {
    if (row < 0 || row >= canvasHeight() || col < 0 || col >= termWidth_)
        return;
    mvaddch(row, col, ch);
}

void Tui::draw() {
    erase();

    drawGrid();
    drawNotes();
    drawSelectionBox();
    drawPlayhead();

    const int statusRow = canvasHeight();
    drawStatus(statusRow);
    drawMessages(statusRow + kStatusRows);

    if (showHelp_)
        drawHelp();

    refresh();
}

void Tui::drawGrid() {
    const Viewport& view = editor_.viewport();
    const QuantizationGrid& grid = editor_.grid();
    const int height = canvasHeight();

    attron(COLOR_PAIR(4) | A_DIM);
    for (double t : grid.verticalLines(view.minTime(), view.maxTime())) {
        const int col = static_cast<int>(std::floor(view.mapX(t)));
        for (int row = 0; row < height; ++row)
            put(row, col, ACS_VLINE);
    }
    attroff(COLOR_PAIR(4) | A_DIM);

    for (const GridLine& line : grid.harmonicLines(view.minPitch(), view.maxPitch())) {
        const int row = static_cast<int>(std::lround(view.mapY(line.pitch)));
        // Octaves of the reference stand out
        const bool strong = line.index == 1 || (line.index & (line.index - 1)) == 0;
        const attr_t attrs = COLOR_PAIR(5) | (strong ? A_BOLD : A_DIM);
        attron(attrs);
        for (int col = 0; col < termWidth_; ++col)
            put(row, col, ACS_HLINE);
        attroff(attrs);
    }
}

void Tui::drawNote(const Note& note, int pair, int attrs, char fill) {
    NoteCells cells = editor_.cellsOf(note);
    const attr_t a = COLOR_PAIR(pair) | static_cast<attr_t>(attrs);
    attron(a);
    for (int col = cells.first; col <= cells.last; ++col)
        put(cells.row, col, static_cast<unsigned char>(fill));
    if (cells.last > cells.first)
        put(cells.row, cells.last, ']');
    attroff(a);
}

void Tui::drawNotes() {
    const auto& resizing = editor_.resizePreview();
    for (const Note& note : editor_.score().notes()) {
        if (resizing && resizing->id == note.id)
            continue;
        if (editor_.isSelected(note.id))
            drawNote(note, 2, A_BOLD | A_REVERSE, '=');
        else
            drawNote(note, 1, A_BOLD, '=');
    }

    if (resizing)
        drawNote(*resizing, 3, A_BOLD | A_REVERSE, '=');
    if (const auto& creating = editor_.createPreview())
        drawNote(*creating, 3, A_BOLD, '#');
    for (const Note& copy : editor_.duplicatePreview())
        drawNote(copy, 3, A_BOLD, '+');
}

void Tui::drawSelectionBox() {
    const auto& box = editor_.selectionBox();
    if (!box)
        return;

    const Viewport& view = editor_.viewport();
    const int c0 = static_cast<int>(std::floor(view.mapX(std::min(box->t0, box->t1))));
    const int c1 = static_cast<int>(std::floor(view.mapX(std::max(box->t0, box->t1))));
    const int r0 = static_cast<int>(std::lround(view.mapY(std::max(box->p0, box->p1))));
    const int r1 = static_cast<int>(std::lround(view.mapY(std::min(box->p0, box->p1))));

    attron(COLOR_PAIR(3));
    for (int col = c0; col <= c1; ++col) {
        put(r0, col, '.');
        put(r1, col, '.');
    }
    for (int row = r0; row <= r1; ++row) {
        put(row, c0, ':');
        put(row, c1, ':');
    }
    attroff(COLOR_PAIR(3));
}

void Tui::drawPlayhead() {
    if (!editor_.player().isPlaying())
        return;

    const int col = static_cast<int>(std::floor(editor_.viewport().mapX(editor_.player().playhead())));
    attron(COLOR_PAIR(6) | A_BOLD);
    for (int row = 0; row < canvasHeight(); ++row)
        put(row, col, '|');
    attroff(COLOR_PAIR(6) | A_BOLD);
}

void Tui::drawStatus(int row) {
    const QuantizationGrid& grid = editor_.grid();
    const bool logView = editor_.viewport().kind() == Viewport::Kind::Log;

    attron(A_BOLD | COLOR_PAIR(7));
    mvprintw(row, 0, "NOTESKETCH");
    attroff(A_BOLD | COLOR_PAIR(7));

    char xsnap[16];
    if (grid.xSnap() == 0.0)
        snprintf(xsnap, sizeof(xsnap), "free");
    else
        snprintf(xsnap, sizeof(xsnap), "%g", grid.xSnap());

    mvprintw(row, 12, "notes %zu  sel %zu  grid %s / %.2f Hz  %s",
             editor_.score().size(), editor_.selection().size(),
             xsnap, grid.ySnap(), logView ? "log" : "linear");

    if (editor_.player().isPlaying()) {
        attron(COLOR_PAIR(6) | A_BOLD);
        printw("  PLAYING %.2f", editor_.player().playhead());
        attroff(COLOR_PAIR(6) | A_BOLD);
    }

    const char* hint = "?:help q:quit";
    const int col = termWidth_ - static_cast<int>(std::char_traits<char>::length(hint)) - 1;
    if (col > 0)
        mvprintw(row, col, "%s", hint);
}

void Tui::drawHelp() {
    std::vector<std::string> lines;
    for (const auto& section : editor_.runner().helpSections()) {
        lines.push_back(section.category);
        for (const auto& desc : section.descriptions)
            lines.push_back("  " + desc);
    }

    int width = 0;
    for (const auto& line : lines)
        width = std::max(width, static_cast<int>(line.size()));
    width += 4;

    const int left = std::max(0, termWidth_ - width - 1);
    const int rows = std::min(static_cast<int>(lines.size()), canvasHeight() - 2);

    for (int i = 0; i < rows + 2; ++i)
        mvhline(i, left, ' ', width);

    attron(A_BOLD);
    mvprintw(0, left + 1, "COMMANDS");
    attroff(A_BOLD);
    for (int i = 0; i < rows; ++i) {
        const bool heading = lines[i].empty() || lines[i][0] != ' ';
        if (heading) attron(A_BOLD | COLOR_PAIR(7));
        mvprintw(i + 1, left + 1, "%s", lines[i].c_str());
        if (heading) attroff(A_BOLD | COLOR_PAIR(7));
    }
}

void Tui::drawMessages(int startRow) {
    std::lock_guard<std::mutex> lock(messageMutex_);
    int row = startRow;
    for (const auto& msg : messages_) {
        if (row >= termHeight_) break;
        mvprintw(row, 2, "%s", msg.c_str());
        ++row;
    }
}

void Tui::addMessage(const std::string& msg) {
    std::lock_guard<std::mutex> lock(messageMutex_);
    messages_.push_front(msg);
    while (static_cast<int>(messages_.size()) > maxMessages_) {
        messages_.pop_back();
    }
}

} // namespace notesketch
