#include "server/OscServer.h"
#include <cstdio>

namespace notesketch {

OscServer::OscServer(RemoteInputQueue& queue, const std::string& port)
    : queue_(queue)
    , port_(port)
{
}

OscServer::~OscServer() {
    stop();
}

bool OscServer::start() {
    serverThread_ = lo_server_thread_new(port_.c_str(), errorHandler);
    if (!serverThread_) {
        fprintf(stderr, "OscServer: failed to create server on port %s\n", port_.c_str());
        return false;
    }

    struct Route {
        const char* path;
        const char* types;
        lo_method_handler handler;
    };
    const Route routes[] = {
        {"/notesketch/key/down",           "i",   &OscServer::route<&OscServer::onKeyDown>},
        {"/notesketch/key/up",             "i",   &OscServer::route<&OscServer::onKeyUp>},
        {"/notesketch/pointer/down",       "ff",  &OscServer::route<&OscServer::onPointerDown>},
        {"/notesketch/pointer/down",       "ffi", &OscServer::route<&OscServer::onPointerDown>},
        {"/notesketch/pointer/up",         "ff",  &OscServer::route<&OscServer::onPointerUp>},
        {"/notesketch/pointer/up",         "ffi", &OscServer::route<&OscServer::onPointerUp>},
        {"/notesketch/pointer/move",       "ff",  &OscServer::route<&OscServer::onPointerMove>},
        {"/notesketch/pointer/move",       "ffi", &OscServer::route<&OscServer::onPointerMove>},
        {"/notesketch/client/subscribe",   "si",  &OscServer::route<&OscServer::onSubscribe>},
        {"/notesketch/client/unsubscribe", "si",  &OscServer::route<&OscServer::onUnsubscribe>},
    };
    for (const auto& r : routes)
        lo_server_thread_add_method(serverThread_, r.path, r.types, r.handler, this);

    if (lo_server_thread_start(serverThread_) < 0) {
        fprintf(stderr, "OscServer: failed to start listener thread\n");
        lo_server_thread_free(serverThread_);
        serverThread_ = nullptr;
        return false;
    }
    fprintf(stderr, "OscServer: listening on port %s\n", port_.c_str());
    return true;
}

void OscServer::stop() {
    if (serverThread_) {
        lo_server_thread_stop(serverThread_);
        lo_server_thread_free(serverThread_);
        serverThread_ = nullptr;
    }

    std::lock_guard<std::mutex> lock(subMutex_);
    for (auto& entry : subscribers_)
        lo_address_free(entry.second.addr);
    subscribers_.clear();
}

void OscServer::addMessage(const std::string& msg) {
    std::lock_guard<std::mutex> lock(msgMutex_);
    pendingMessages_.push_back(msg);
}

void OscServer::pushState(const EditorSnapshot& snapshot) {
    dropExpiredSubscribers();

    std::vector<std::string> messages;
    {
        std::lock_guard<std::mutex> lock(msgMutex_);
        messages.swap(pendingMessages_);
    }

    std::lock_guard<std::mutex> lock(subMutex_);
    for (const auto& entry : subscribers_) {
        lo_address addr = entry.second.addr;
        lo_send(addr, "/notesketch/state/score", "ii",
                snapshot.noteCount, snapshot.selectionSize);
        lo_send(addr, "/notesketch/state/player", "id",
                snapshot.playing ? 1 : 0, snapshot.playhead);
        for (const auto& msg : messages)
            lo_send(addr, "/notesketch/state/log", "s", msg.c_str());
    }
}

void OscServer::errorHandler(int num, const char* msg, const char* path) {
    fprintf(stderr, "OscServer error %d: %s (path: %s)\n",
            num, msg, path ? path : "null");
}

// Handlers below run on the liblo thread; they only touch the input queue
// and the subscriber table.

void OscServer::queue(const InputEvent& event) {
    if (!queue_.push(event))
        ++dropped_;
}

int OscServer::queuePointer(InputEvent::Type type, lo_arg** argv, int argc) {
    InputEvent ev;
    ev.type = type;
    ev.x = argv[0]->f;
    ev.y = argv[1]->f;
    ev.modifiers = argc > 2 ? static_cast<uint8_t>(argv[2]->i) : ModNone;
    queue(ev);
    return 0;
}

int OscServer::onKeyDown(lo_arg** argv, int) {
    queue(InputEvent::keyDown(argv[0]->i));
    return 0;
}

int OscServer::onKeyUp(lo_arg** argv, int) {
    queue(InputEvent::keyUp(argv[0]->i));
    return 0;
}

int OscServer::onPointerDown(lo_arg** argv, int argc) {
    return queuePointer(InputEvent::Type::PointerDown, argv, argc);
}

int OscServer::onPointerUp(lo_arg** argv, int argc) {
    return queuePointer(InputEvent::Type::PointerUp, argv, argc);
}

int OscServer::onPointerMove(lo_arg** argv, int argc) {
    return queuePointer(InputEvent::Type::PointerMove, argv, argc);
}

std::string OscServer::endpointKey(const char* host, int port) {
    return std::string(host) + ":" + std::to_string(port);
}

int OscServer::onSubscribe(lo_arg** argv, int) {
    const char* host = &argv[0]->s;
    const int port = argv[1]->i;
    const std::string key = endpointKey(host, port);
    bool added = false;
    {
        std::lock_guard<std::mutex> lock(subMutex_);
        auto it = subscribers_.find(key);
        if (it == subscribers_.end()) {
            OscSubscriber sub;
            sub.addr = lo_address_new(host, std::to_string(port).c_str());
            if (!sub.addr) {
                fprintf(stderr, "OscServer: bad subscriber address %s\n", key.c_str());
                return 0;
            }
            it = subscribers_.emplace(key, sub).first;
            added = true;
        }
        it->second.lastSeen = std::chrono::steady_clock::now();
    }
    if (added)
        addMessage("Remote client subscribed " + key);
    return 0;
}

int OscServer::onUnsubscribe(lo_arg** argv, int) {
    const std::string key = endpointKey(&argv[0]->s, argv[1]->i);
    std::lock_guard<std::mutex> lock(subMutex_);
    auto it = subscribers_.find(key);
    if (it != subscribers_.end()) {
        lo_address_free(it->second.addr);
        subscribers_.erase(it);
    }
    return 0;
}

void OscServer::dropExpiredSubscribers() {
    const auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(subMutex_);
    for (auto it = subscribers_.begin(); it != subscribers_.end();) {
        const double age = std::chrono::duration<double>(now - it->second.lastSeen).count();
        if (age > kSubscriberTimeoutSec) {
            lo_address_free(it->second.addr);
            it = subscribers_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace notesketch
