#pragma once

#include "core/Hooks.h"
#include "core/InputEvents.h"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace notesketch {

class CommandRunner;

/// Index of a registered command, stable for the runner's lifetime
using CommandId = std::size_t;

/// Capability handed to a running command procedure.
///
/// A procedure is ordinary sequential code that suspends by calling listen()
/// (or one of its wrappers) with the continuation to run once the listener
/// fires. A procedure or continuation that returns without listening has
/// finished; the runner then starts the command again from the top.
///
/// A Context is only usable while the runner is executing that command's
/// procedure or one of its continuations. Using it at any other time throws.
class Context {
public:
    template <typename T>
    using Next = std::function<void(Context, T)>;

    /// Suspend on `listener`. When one of its handlers returns Proceed or
    /// Consume, `next(cx, value)` runs after the current dispatch completes.
    template <typename T, typename Fn>
    void listen(const Listener<T>& listener, Fn next);

    /// Run `effect` once this command wins the per-dispatch action contention,
    /// then finish the procedure.
    template <typename Effect>
    void action(Effect effect, int priority = 0);

    /// Run `effect` once this command wins the action contention, then resume
    /// with `next(cx, result)`. A void effect resumes with Unit.
    template <typename Effect, typename Fn>
    void action(Effect effect, int priority, Fn next);

    /// Consume a key down carrying `keyCode`
    Listener<Unit> key(int keyCode) const;

    /// Any pointer down. Consume by default; pass Control::Proceed for drag
    /// starts that should let other commands see the same press.
    Listener<Unit> pointerDown(Control control = Control::Consume) const;

    /// Any pointer up. Proceed by default so every active drag sees the release.
    Listener<Unit> pointerUp(Control control = Control::Proceed) const;

    /// Next frame tick (proceeds)
    Listener<Unit> frame() const;

    /// Only honour statuses of `listener` whose carried value satisfies
    /// `predicate` at the moment they are produced; otherwise report Repeat.
    template <typename T, typename Pred>
    Listener<T> when(Pred predicate, const Listener<T>& listener) const;

    const InputState& input() const;
    CommandId id() const { return id_; }

private:
    friend class CommandRunner;

    Context(CommandRunner& runner, CommandId id) : runner_(&runner), id_(id) {}

    CommandRunner* runner_;
    CommandId id_;
};

/// Registry of perpetual, resumable commands driven by raw input hooks.
///
/// dispatch() visits commands in registration order, then resolves the
/// pending actions by priority, then resumes every command whose handler
/// proceeded or consumed during that dispatch.
class CommandRunner {
public:
    using Procedure = std::function<void(Context)>;
    using MessageCallback = std::function<void(const std::string&)>;

    /// Commands in this category are left out of the help listing
    static constexpr const char* kHiddenCategory = "hidden";

    struct HelpSection {
        std::string category;
        std::vector<std::string> descriptions;
    };

    explicit CommandRunner(const InputState& input);

    CommandRunner(const CommandRunner&) = delete;
    CommandRunner& operator=(const CommandRunner&) = delete;

    /// Add a command and run its procedure up to the first suspension.
    CommandId registerCommand(std::string description, std::string category,
                              Procedure procedure);

    /// Deliver one input hook. Throws std::logic_error for Hook::Action and
    /// for re-entrant calls.
    void dispatch(Hook hook);

    /// Discard a command's progress and run it again from the top
    void restart(CommandId id);

    /// Categories in sorted order, descriptions in registration order
    std::vector<HelpSection> helpSections() const;

    size_t commandCount() const { return commands_.size(); }
    const std::string& description(CommandId id) const;
    const std::string& category(CommandId id) const;

    /// Whether the command is currently suspended on a listener with `hook`
    bool isWaitingOn(CommandId id, Hook hook) const;

    /// Number of times the command's procedure has been started
    uint64_t activationCount(CommandId id) const;

    bool isDispatching() const { return dispatching_; }

    const InputState& input() const { return input_; }

    /// Diagnostics sink (defaults to stderr)
    void setMessageCallback(MessageCallback cb) { onMessage_ = std::move(cb); }

private:
    friend class Context;

    using Resume = std::function<void(Context)>;

    /// Installed listener: every status carries the serial of the listener
    /// that produced it so stale handlers can be detected.
    using ActiveListener = Listener<uint64_t>;

    struct CommandRecord {
        std::string description;
        std::string category;
        Procedure procedure;
        ActiveListener listener;
        uint64_t serial = 0;        // current listener, or current activation while running
        bool resuming = false;      // a handler resumed it during this dispatch
        uint64_t activations = 0;
    };

    struct PendingResume {
        CommandId id;
        uint64_t serial;
        Resume resume;
    };

    /// The body currently executing (procedures may nest through register)
    struct RunFrame {
        CommandId id;
        bool listened = false;
    };

    CommandRecord& record(CommandId id);
    const CommandRecord& record(CommandId id) const;

    void start(CommandId id);
    bool runBody(CommandId id, const std::function<void(Context)>& body);
    Control applyStatus(CommandId id, const Status<uint64_t>& status, Hook hook);
    void resolveActions();
    void resumePending(std::exception_ptr& failure);

    uint64_t nextSerial() { return ++serialCounter_; }
    void install(CommandId id, ActiveListener listener, uint64_t serial);
    void queueResume(CommandId id, uint64_t serial, Resume resume);
    void message(const std::string& msg) const;

    const InputState& input_;
    MessageCallback onMessage_;
    std::vector<std::unique_ptr<CommandRecord>> commands_;
    std::deque<PendingResume> pending_;
    uint64_t serialCounter_ = 0;
    bool dispatching_ = false;
    RunFrame* running_ = nullptr;
};

// ---------------------------------------------------------------------------
// Context templates
// ---------------------------------------------------------------------------

template <typename T, typename Fn>
void Context::listen(const Listener<T>& listener, Fn next) {
    CommandRunner* runner = runner_;
    const CommandId id = id_;
    const uint64_t serial = runner->nextSerial();
    Next<T> cont(std::move(next));

    auto active = transformHandlers<uint64_t>(listener,
        [runner, id, serial, cont](const typename Listener<T>::Handler& handler) {
            return [runner, id, serial, cont, handler]() -> Status<uint64_t> {
                Status<T> status = handler();
                switch (status.control) {
                    case Control::Repeat: return Status<uint64_t>::repeat();
                    case Control::Cancel: return Status<uint64_t>::cancel();
                    case Control::Proceed:
                    case Control::Consume:
                        break;
                }
                T value = std::move(*status.value);
                runner->queueResume(id, serial, [cont, value](Context cx) {
                    cont(cx, value);
                });
                return status.control == Control::Proceed
                    ? Status<uint64_t>::proceed(serial)
                    : Status<uint64_t>::consume(serial);
            };
        });

    runner->install(id, std::move(active), serial);
}

template <typename Effect>
void Context::action(Effect effect, int priority) {
    action(std::move(effect), priority, [](Context, auto) {});
}

template <typename Effect, typename Fn>
void Context::action(Effect effect, int priority, Fn next) {
    using Result = std::invoke_result_t<Effect&>;
    using Value = std::conditional_t<std::is_void_v<Result>, Unit, Result>;

    Listener<Value> listener;
    listener.actionPriority = priority;
    listener.action = [effect]() mutable -> Status<Value> {
        if constexpr (std::is_void_v<Result>) {
            effect();
            return Status<Value>::proceed(Unit{});
        } else {
            return Status<Value>::proceed(effect());
        }
    };
    listen(listener, std::move(next));
}

template <typename T, typename Pred>
Listener<T> Context::when(Pred predicate, const Listener<T>& listener) const {
    return transformHandlers<T>(listener,
        [predicate](const typename Listener<T>::Handler& handler) {
            return [handler, predicate]() -> Status<T> {
                Status<T> status = handler();
                if (status.resumes() && predicate(*status.value)) {
                    return status;
                }
                return Status<T>::repeat();
            };
        });
}

} // namespace notesketch
