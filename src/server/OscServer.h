#pragma once

#include "core/InputQueue.h"
#include <lo/lo.h>

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace notesketch {

/// Queue carrying remote input from the OSC thread to the editor thread
using RemoteInputQueue = InputQueue<256>;

/// A subscribed OSC client that receives state pushes
struct OscSubscriber {
    lo_address addr = nullptr;
    std::chrono::steady_clock::time_point lastSeen;
};

/// Editor state sent to subscribers
struct EditorSnapshot {
    int noteCount = 0;
    int selectionSize = 0;
    bool playing = false;
    double playhead = 0.0;
};

/// OSC server that turns remote key and pointer messages into InputEvents
/// and pushes editor state to subscribed clients.
///
/// Input paths:
///   /notesketch/key/down i, /notesketch/key/up i
///   /notesketch/pointer/{down,up,move} ff or ffi (x, y, modifiers)
///   /notesketch/client/subscribe si, /notesketch/client/unsubscribe si
class OscServer {
public:
    OscServer(RemoteInputQueue& queue, const std::string& port = "7780");
    ~OscServer();

    bool start();
    void stop();

    /// Push editor state and buffered log lines to all subscribed clients.
    /// Call this from the main loop.
    void pushState(const EditorSnapshot& snapshot);

    /// Queue a log line for the next state push
    void addMessage(const std::string& msg);

    const std::string& port() const { return port_; }

    /// Events dropped because the queue was full
    int droppedEvents() const { return dropped_.load(); }

private:
    using Handler = int (OscServer::*)(lo_arg** argv, int argc);

    /// liblo entry point forwarding to a member handler
    template <Handler H>
    static int route(const char*, const char*, lo_arg** argv, int argc,
                     lo_message, void* user) {
        return (static_cast<OscServer*>(user)->*H)(argv, argc);
    }

    static void errorHandler(int num, const char* msg, const char* path);

    int onKeyDown(lo_arg** argv, int argc);
    int onKeyUp(lo_arg** argv, int argc);
    int onPointerDown(lo_arg** argv, int argc);
    int onPointerUp(lo_arg** argv, int argc);
    int onPointerMove(lo_arg** argv, int argc);
    int onSubscribe(lo_arg** argv, int argc);
    int onUnsubscribe(lo_arg** argv, int argc);

    void queue(const InputEvent& event);
    int queuePointer(InputEvent::Type type, lo_arg** argv, int argc);

    static std::string endpointKey(const char* host, int port);
    void dropExpiredSubscribers();

    RemoteInputQueue& queue_;
    std::string port_;
    lo_server_thread serverThread_ = nullptr;
    std::atomic<int> dropped_{0};

    // Keyed by "host:port"
    std::mutex subMutex_;
    std::map<std::string, OscSubscriber> subscribers_;
    static constexpr double kSubscriberTimeoutSec = 30.0;

    std::mutex msgMutex_;
    std::vector<std::string> pendingMessages_;
};

} // namespace notesketch
