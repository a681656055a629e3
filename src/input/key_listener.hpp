#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "config/shortcut_registry.hpp"
#include "key_event_source.hpp"

namespace whisperkeys
{

struct ListenerOptions
{
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    // A shortcut that fired less than this long ago is not fired again.
    std::chrono::milliseconds debounce{200};

    // Monotonic time source. Null means Clock::now.
    std::function<TimePoint()> clock;
};

// Turns raw key events into shortcut triggers.
//
// Tracks which physical modifier keys are held, matches each non-modifier
// key-down against the enabled shortcuts of the registry (in registry order)
// and debounces per shortcut id. Matching shortcuts are passed to the trigger
// callback on the thread that delivered the event.
//
// start() pumps a KeyEventSource on a background thread. handle_event() can
// also be driven directly, which is what the pump thread does.
class KeyListener
{
   public:
    using Trigger = std::function<void(const std::string& id)>;

    KeyListener(const ShortcutRegistry& registry, Trigger trigger, ListenerOptions options = {});

    // Must not run on the pump thread: a trigger may stop() the listener but
    // never destroy it.
    ~KeyListener();

    KeyListener(const KeyListener&)            = delete;
    KeyListener& operator=(const KeyListener&) = delete;

    // Start pumping `source` on a new thread. Idempotent: returns true if
    // already running. The source must outlive the listening session.
    bool start(KeyEventSource& source);

    // Idempotent. From any other thread: closes the source, waits for the
    // in-flight handler chain and joins the pump thread. From a handler on the
    // pump thread: only requests the stop.
    // Held modifiers are forgotten; debounce history is kept.
    void stop();

    bool is_running() const { return running_.load(std::memory_order_acquire); }

    // Process one event on the calling thread. Returns the ids triggered.
    std::vector<std::string> handle_event(const KeyEvent& event);

    // Logical modifiers currently held.
    KeyMod active_modifiers() const;

    // Forget debounce history.
    void reset_debounce();

    const ListenerOptions& options() const { return options_; }

   private:
    void                       pump(KeyEventSource& source);
    ListenerOptions::TimePoint now() const;

    // Expect mutex_ to be held.
    KeyMod active_modifiers_locked() const;
    void   refresh_bindings_locked();

    const ShortcutRegistry& registry_;
    Trigger                 trigger_;
    ListenerOptions         options_;

    // Matching state
    mutable std::mutex                                          mutex_;
    std::unordered_set<int>                                     held_modifiers_;
    std::unordered_map<std::string, ListenerOptions::TimePoint> last_fired_;
    std::vector<ShortcutBinding>                                bindings_;
    uint64_t                                                    bindings_revision_ = 0;
    bool                                                        bindings_valid_    = false;

    // Thread lifecycle
    std::mutex        lifecycle_mutex_;
    std::thread       thread_;
    KeyEventSource*   source_ = nullptr;
    std::atomic<bool> running_{false};
};

}   // namespace whisperkeys
