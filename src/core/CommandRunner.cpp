#include "core/CommandRunner.h"

#include <cstdio>
#include <exception>
#include <limits>
#include <set>
#include <stdexcept>

namespace notesketch {

const char* hookName(Hook hook) {
    switch (hook) {
        case Hook::KeyDown:     return "keyDown";
        case Hook::KeyUp:       return "keyUp";
        case Hook::PointerDown: return "pointerDown";
        case Hook::PointerUp:   return "pointerUp";
        case Hook::FrameTick:   return "frameTick";
        case Hook::Action:      return "action";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Context
// ---------------------------------------------------------------------------

const InputState& Context::input() const {
    return runner_->input();
}

Listener<Unit> Context::key(int keyCode) const {
    const InputState* in = &runner_->input();
    Listener<Unit> l;
    l.keyDown = [in, keyCode]() {
        return in->keyCode == keyCode ? Status<Unit>::consume(Unit{})
                                      : Status<Unit>::repeat();
    };
    return l;
}

Listener<Unit> Context::pointerDown(Control control) const {
    Listener<Unit> l;
    l.pointerDown = [control]() {
        return control == Control::Proceed ? Status<Unit>::proceed(Unit{})
                                           : Status<Unit>::consume(Unit{});
    };
    return l;
}

Listener<Unit> Context::pointerUp(Control control) const {
    Listener<Unit> l;
    l.pointerUp = [control]() {
        return control == Control::Consume ? Status<Unit>::consume(Unit{})
                                           : Status<Unit>::proceed(Unit{});
    };
    return l;
}

Listener<Unit> Context::frame() const {
    Listener<Unit> l;
    l.frameTick = []() { return Status<Unit>::proceed(Unit{}); };
    return l;
}

// ---------------------------------------------------------------------------
// CommandRunner
// ---------------------------------------------------------------------------

namespace {

/// Restores a flag or pointer on scope exit, including on throw
template <typename T>
class ScopedValue {
public:
    ScopedValue(T& target, T value) : target_(target), saved_(target) { target_ = value; }
    ~ScopedValue() { target_ = saved_; }

    ScopedValue(const ScopedValue&) = delete;
    ScopedValue& operator=(const ScopedValue&) = delete;

private:
    T& target_;
    T saved_;
};

} // namespace

CommandRunner::CommandRunner(const InputState& input)
    : input_(input) {}

CommandId CommandRunner::registerCommand(std::string description, std::string category,
                                         Procedure procedure) {
    if (dispatching_)
        throw std::logic_error("Commands cannot be registered during a dispatch");
    if (!procedure)
        throw std::invalid_argument("Command '" + description + "' has no procedure");

    auto rec = std::make_unique<CommandRecord>();
    rec->description = std::move(description);
    rec->category = std::move(category);
    rec->procedure = std::move(procedure);
    commands_.push_back(std::move(rec));

    const CommandId id = commands_.size() - 1;
    start(id);
    return id;
}

CommandRunner::CommandRecord& CommandRunner::record(CommandId id) {
    if (id >= commands_.size())
        throw std::out_of_range("No command with id " + std::to_string(id));
    return *commands_[id];
}

const CommandRunner::CommandRecord& CommandRunner::record(CommandId id) const {
    if (id >= commands_.size())
        throw std::out_of_range("No command with id " + std::to_string(id));
    return *commands_[id];
}

const std::string& CommandRunner::description(CommandId id) const {
    return record(id).description;
}

const std::string& CommandRunner::category(CommandId id) const {
    return record(id).category;
}

bool CommandRunner::isWaitingOn(CommandId id, Hook hook) const {
    const CommandRecord& rec = record(id);
    return !rec.resuming && rec.listener.has(hook);
}

uint64_t CommandRunner::activationCount(CommandId id) const {
    return record(id).activations;
}

void CommandRunner::restart(CommandId id) {
    record(id);
    start(id);
}

void CommandRunner::start(CommandId id) {
    CommandRecord& rec = record(id);
    rec.listener = ActiveListener{};
    rec.resuming = false;
    rec.serial = nextSerial();
    const uint64_t activation = ++rec.activations;

    // The record outlives registerCommand's push_back, but copy the
    // procedure so a body that re-registers cannot pull it from under us
    Procedure procedure = rec.procedure;
    if (!runBody(id, procedure) && rec.activations == activation)
        throw std::logic_error("Command '" + rec.description + "' completed without suspending");
}

bool CommandRunner::runBody(CommandId id, const std::function<void(Context)>& body) {
    RunFrame frame{id};
    ScopedValue<RunFrame*> scope(running_, &frame);
    body(Context(*this, id));
    return frame.listened;
}

void CommandRunner::install(CommandId id, ActiveListener listener, uint64_t serial) {
    if (running_ == nullptr || running_->id != id)
        throw std::logic_error("Command '" + record(id).description +
                               "' listened outside its own activation");
    if (running_->listened)
        throw std::logic_error("Command '" + record(id).description +
                               "' listened twice without suspending");
    if (listener.empty())
        throw std::logic_error("Command '" + record(id).description +
                               "' listened on an empty listener");

    CommandRecord& rec = record(id);
    rec.listener = std::move(listener);
    rec.serial = serial;
    running_->listened = true;
}

void CommandRunner::queueResume(CommandId id, uint64_t serial, Resume resume) {
    pending_.push_back(PendingResume{id, serial, std::move(resume)});
}

void CommandRunner::message(const std::string& msg) const {
    if (onMessage_)
        onMessage_(msg);
    else
        fprintf(stderr, "%s\n", msg.c_str());
}

void CommandRunner::dispatch(Hook hook) {
    if (hook == Hook::Action)
        throw std::logic_error("Actions are resolved by the runner and cannot be dispatched");
    if (dispatching_)
        throw std::logic_error(std::string("Re-entrant dispatch of ") + hookName(hook));

    ScopedValue<bool> guard(dispatching_, true);
    pending_.clear();

    // A throw from one handler must not strand the commands that already
    // proceeded: they still resume before the error leaves dispatch().
    std::exception_ptr failure;
    try {
        bool consumed = false;
        for (CommandId id = 0; id < commands_.size(); ++id) {
            CommandRecord& rec = *commands_[id];
            if (rec.resuming || !rec.listener.has(hook))
                continue;

            // Copy: a Cancel restarts the command and replaces the listener
            ActiveListener::Handler handler = rec.listener.slot(hook);
            if (applyStatus(id, handler(), hook) == Control::Consume) {
                consumed = true;
                break;
            }
        }

        if (!consumed)
            resolveActions();
    } catch (...) {
        failure = std::current_exception();
    }

    resumePending(failure);
    if (failure)
        std::rethrow_exception(failure);
}

Control CommandRunner::applyStatus(CommandId id, const Status<uint64_t>& status, Hook hook) {
    CommandRecord& rec = record(id);
    switch (status.control) {
        case Control::Repeat:
            break;
        case Control::Cancel:
            start(id);
            break;
        case Control::Proceed:
        case Control::Consume:
            if (!status.value || *status.value != rec.serial) {
                throw std::logic_error("Command '" + rec.description + "' resumed from a stale " +
                                       hookName(hook) + " handler");
            }
            rec.resuming = true;
            break;
    }
    return status.control;
}

void CommandRunner::resolveActions() {
    std::vector<CommandId> best;
    int bestPriority = std::numeric_limits<int>::min();

    for (CommandId id = 0; id < commands_.size(); ++id) {
        const CommandRecord& rec = *commands_[id];
        if (rec.resuming || !rec.listener.has(Hook::Action))
            continue;

        const int priority = rec.listener.actionPriority;
        if (best.empty() || priority > bestPriority) {
            std::vector<CommandId> beaten;
            beaten.swap(best);
            best.push_back(id);
            bestPriority = priority;
            for (CommandId loser : beaten)
                start(loser);
        } else if (priority == bestPriority) {
            best.push_back(id);
        } else {
            start(id);
        }
    }

    if (best.empty())
        return;

    const CommandId winner = best.front();
    if (best.size() > 1) {
        std::string names;
        for (CommandId id : best) {
            if (!names.empty()) names += ", ";
            names += "'" + commands_[id]->description + "'";
        }
        message("Competing actions at priority " + std::to_string(bestPriority) + " (" + names +
                "), running '" + commands_[winner]->description + "'");
        for (size_t i = 1; i < best.size(); ++i)
            start(best[i]);
    }

    ActiveListener::Handler handler = commands_[winner]->listener.action;
    Status<uint64_t> status = handler();
    if (status.control == Control::Consume)
        throw std::logic_error("Action of '" + commands_[winner]->description +
                               "' may not consume");
    applyStatus(winner, status, Hook::Action);
}

void CommandRunner::resumePending(std::exception_ptr& failure) {
    while (!pending_.empty()) {
        PendingResume next = std::move(pending_.front());
        pending_.pop_front();

        CommandRecord& rec = record(next.id);
        if (rec.serial != next.serial || !rec.resuming)
            continue;   // restarted since the status was produced

        rec.resuming = false;
        rec.listener = ActiveListener{};
        const uint64_t activation = rec.activations;
        // A failing continuation leaves only its own command without a
        // listener; the remaining resumptions still run.
        try {
            if (!runBody(next.id, next.resume) && rec.activations == activation)
                start(next.id);
        } catch (...) {
            if (failure)
                message("Command '" + rec.description + "' also failed during this dispatch");
            else
                failure = std::current_exception();
        }
    }
}

std::vector<CommandRunner::HelpSection> CommandRunner::helpSections() const {
    std::set<std::string> categories;
    for (const auto& rec : commands_) {
        if (rec->category != kHiddenCategory)
            categories.insert(rec->category);
    }

    std::vector<HelpSection> sections;
    for (const std::string& category : categories) {
        HelpSection section;
        section.category = category;
        for (const auto& rec : commands_) {
            if (rec->category == category)
                section.descriptions.push_back(rec->description);
        }
        sections.push_back(std::move(section));
    }
    return sections;
}

} // namespace notesketch
