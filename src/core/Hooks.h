#pragma once

#include <array>
#include <functional>
#include <optional>
#include <utility>

namespace notesketch {

/// Moments in the host event loop at which commands may react.
enum class Hook {
    KeyDown,
    KeyUp,
    PointerDown,
    PointerUp,
    FrameTick,
    Action   // resolved by the runner after every dispatch, never dispatched directly
};

inline constexpr std::array<Hook, 6> kAllHooks = {
    Hook::KeyDown, Hook::KeyUp, Hook::PointerDown,
    Hook::PointerUp, Hook::FrameTick, Hook::Action
};

/// Human-readable name for a Hook
const char* hookName(Hook hook);

/// Outcome of invoking a handler
enum class Control {
    Repeat,   // not interested, nothing changes
    Cancel,   // restart the command from the top
    Proceed,  // resume the command, other commands still see this dispatch
    Consume   // resume the command and stop the dispatch here
};

/// Value carried by statuses that carry no information
struct Unit {
    bool operator==(const Unit&) const { return true; }
};

/// Result of a handler. Proceed and Consume carry a value that is handed
/// back to the waiting procedure when it resumes.
template <typename T>
struct Status {
    Control control = Control::Repeat;
    std::optional<T> value;

    static Status repeat() { return {}; }

    static Status cancel() {
        Status s;
        s.control = Control::Cancel;
        return s;
    }

    static Status proceed(T v) {
        Status s;
        s.control = Control::Proceed;
        s.value = std::move(v);
        return s;
    }

    static Status consume(T v) {
        Status s;
        s.control = Control::Consume;
        s.value = std::move(v);
        return s;
    }

    bool resumes() const {
        return control == Control::Proceed || control == Control::Consume;
    }
};

/// The set of handlers a command is currently waiting on: one optional slot
/// per hook category. An empty slot means the command ignores that hook.
template <typename T>
struct Listener {
    using Handler = std::function<Status<T>()>;

    Handler keyDown;
    Handler keyUp;
    Handler pointerDown;
    Handler pointerUp;
    Handler frameTick;
    Handler action;
    int actionPriority = 0;

    Handler& slot(Hook hook) {
        switch (hook) {
            case Hook::KeyDown:     return keyDown;
            case Hook::KeyUp:       return keyUp;
            case Hook::PointerDown: return pointerDown;
            case Hook::PointerUp:   return pointerUp;
            case Hook::FrameTick:   return frameTick;
            case Hook::Action:      return action;
        }
        return action;
    }

    const Handler& slot(Hook hook) const {
        switch (hook) {
            case Hook::KeyDown:     return keyDown;
            case Hook::KeyUp:       return keyUp;
            case Hook::PointerDown: return pointerDown;
            case Hook::PointerUp:   return pointerUp;
            case Hook::FrameTick:   return frameTick;
            case Hook::Action:      return action;
        }
        return action;
    }

    bool has(Hook hook) const { return static_cast<bool>(slot(hook)); }

    bool empty() const {
        for (Hook hook : kAllHooks) {
            if (has(hook)) return false;
        }
        return true;
    }
};

/// Build a Listener<U> by transforming every present handler of `in`.
/// `f` receives a Listener<T>::Handler and returns a Listener<U>::Handler.
template <typename U, typename T, typename F>
Listener<U> transformHandlers(const Listener<T>& in, F f) {
    Listener<U> out;
    for (Hook hook : kAllHooks) {
        if (in.has(hook)) {
            out.slot(hook) = f(in.slot(hook));
        }
    }
    out.actionPriority = in.actionPriority;
    return out;
}

/// Map the carried value of every handler in a listener.
template <typename T, typename F>
auto mapListener(const Listener<T>& in, F f) -> Listener<decltype(f(std::declval<T>()))> {
    using U = decltype(f(std::declval<T>()));
    return transformHandlers<U>(in, [f](const typename Listener<T>::Handler& handler) {
        return [handler, f]() -> Status<U> {
            Status<T> status = handler();
            switch (status.control) {
                case Control::Repeat:  return Status<U>::repeat();
                case Control::Cancel:  return Status<U>::cancel();
                case Control::Proceed: return Status<U>::proceed(f(std::move(*status.value)));
                case Control::Consume: return Status<U>::consume(f(std::move(*status.value)));
            }
            return Status<U>::repeat();
        };
    });
}

} // namespace notesketch
