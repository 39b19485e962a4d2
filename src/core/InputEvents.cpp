#include "core/InputEvents.h"

namespace notesketch {

namespace KeyCode {

std::optional<int> fromChar(int ch) {
    if (ch >= 'a' && ch <= 'z') return ch - 'a' + 'A';
    if (ch >= 'A' && ch <= 'Z') return ch;
    if (ch >= '0' && ch <= '9') return ch;
    switch (ch) {
        case ' ':  return Space;
        case '\t': return Tab;
        case '\n':
        case '\r': return Enter;
        case 27:   return Escape;
        case 8:
        case 127:  return Backspace;
        case '+':
        case '=':  return Plus;
        case '-':
        case '_':  return Minus;
        default:   return std::nullopt;
    }
}

} // namespace KeyCode

InputEvent InputEvent::keyDown(int code, uint8_t mods) {
    InputEvent ev;
    ev.type = Type::KeyDown;
    ev.keyCode = code;
    ev.modifiers = mods;
    return ev;
}

InputEvent InputEvent::keyUp(int code, uint8_t mods) {
    InputEvent ev;
    ev.type = Type::KeyUp;
    ev.keyCode = code;
    ev.modifiers = mods;
    return ev;
}

InputEvent InputEvent::pointerDown(double x, double y, uint8_t mods) {
    InputEvent ev;
    ev.type = Type::PointerDown;
    ev.x = x;
    ev.y = y;
    ev.modifiers = mods;
    return ev;
}

InputEvent InputEvent::pointerUp(double x, double y, uint8_t mods) {
    InputEvent ev = pointerDown(x, y, mods);
    ev.type = Type::PointerUp;
    return ev;
}

InputEvent InputEvent::pointerMove(double x, double y, uint8_t mods) {
    InputEvent ev = pointerDown(x, y, mods);
    ev.type = Type::PointerMove;
    return ev;
}

InputEvent InputEvent::frameTick() {
    return InputEvent{};
}

std::optional<Hook> hookFor(InputEvent::Type type) {
    switch (type) {
        case InputEvent::Type::KeyDown:     return Hook::KeyDown;
        case InputEvent::Type::KeyUp:       return Hook::KeyUp;
        case InputEvent::Type::PointerDown: return Hook::PointerDown;
        case InputEvent::Type::PointerUp:   return Hook::PointerUp;
        case InputEvent::Type::FrameTick:   return Hook::FrameTick;
        case InputEvent::Type::PointerMove: return std::nullopt;
    }
    return std::nullopt;
}

void InputState::apply(const InputEvent& event) {
    switch (event.type) {
        case InputEvent::Type::KeyDown:
            keyCode = event.keyCode;
            keysDown.insert(event.keyCode);
            break;
        case InputEvent::Type::KeyUp:
            keyCode = event.keyCode;
            keysDown.erase(event.keyCode);
            break;
        case InputEvent::Type::PointerDown:
            pointerPressed = true;
            pointerX = event.x;
            pointerY = event.y;
            break;
        case InputEvent::Type::PointerUp:
            pointerPressed = false;
            pointerX = event.x;
            pointerY = event.y;
            break;
        case InputEvent::Type::PointerMove:
            pointerX = event.x;
            pointerY = event.y;
            break;
        case InputEvent::Type::FrameTick:
            // Frames carry no modifier information
            return;
    }
    shift = (event.modifiers & ModShift) != 0;
    ctrl  = (event.modifiers & ModCtrl) != 0;
    alt   = (event.modifiers & ModAlt) != 0;
}

} // namespace notesketch
