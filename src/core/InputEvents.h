#pragma once

#include "core/Hooks.h"

#include <cstdint>
#include <optional>
#include <set>

namespace notesketch {

/// Key codes follow the DOM keyCode numbering: letters are their upper-case
/// ASCII code regardless of shift.
namespace KeyCode {
constexpr int Backspace = 8;
constexpr int Tab       = 9;
constexpr int Enter     = 13;
constexpr int Escape    = 27;
constexpr int Space     = 32;
constexpr int Left      = 37;
constexpr int Up        = 38;
constexpr int Right     = 39;
constexpr int Down      = 40;
constexpr int Delete    = 46;
constexpr int D         = 68;
constexpr int G         = 71;
constexpr int S         = 83;
constexpr int V         = 86;
constexpr int Plus      = 187;  // '=' / '+'
constexpr int Minus     = 189;

/// Key code for a printable character, or nullopt if it has none
std::optional<int> fromChar(int ch);
} // namespace KeyCode

/// Modifier bits carried by input events
enum Modifier : uint8_t {
    ModNone  = 0,
    ModShift = 1 << 0,
    ModCtrl  = 1 << 1,
    ModAlt   = 1 << 2
};

/// A raw input record delivered by an input source (terminal, OSC)
struct InputEvent {
    enum class Type {
        KeyDown,
        KeyUp,
        PointerDown,
        PointerUp,
        PointerMove,
        FrameTick
    };

    Type type = Type::FrameTick;
    int keyCode = 0;
    double x = 0.0;          // canvas cell coordinates
    double y = 0.0;
    uint8_t modifiers = ModNone;

    static InputEvent keyDown(int code, uint8_t mods = ModNone);
    static InputEvent keyUp(int code, uint8_t mods = ModNone);
    static InputEvent pointerDown(double x, double y, uint8_t mods = ModNone);
    static InputEvent pointerUp(double x, double y, uint8_t mods = ModNone);
    static InputEvent pointerMove(double x, double y, uint8_t mods = ModNone);
    static InputEvent frameTick();
};

/// The hook dispatched for an event, or nullopt for events that only
/// update the input snapshot (pointer motion).
std::optional<Hook> hookFor(InputEvent::Type type);

/// Transient input snapshot read by command bodies while they run.
struct InputState {
    int keyCode = 0;             // last key pressed or released
    double pointerX = 0.0;
    double pointerY = 0.0;
    bool pointerPressed = false;
    bool shift = false;
    bool ctrl = false;
    bool alt = false;
    std::set<int> keysDown;

    /// Update the snapshot from an event before it is dispatched
    void apply(const InputEvent& event);

    bool isKeyDown(int code) const { return keysDown.count(code) != 0; }
};

} // namespace notesketch
