#include "key_listener.hpp"

#include <whisperkeys/logger.hpp>

namespace whisperkeys
{

KeyListener::KeyListener(const ShortcutRegistry& registry, Trigger trigger, ListenerOptions options)
    : registry_(registry), trigger_(std::move(trigger)), options_(std::move(options))
{
}

KeyListener::~KeyListener()
{
    stop();

    // A stop requested from a handler leaves the pump thread for us to reap.
    if (thread_.joinable())
    {
        if (thread_.get_id() == std::this_thread::get_id())
        {
            WHISPERKEYS_LOG_ERROR("listener",
                                  "Listener destroyed from its own pump thread; "
                                  "the thread is detached and must not touch it again");
            thread_.detach();
        }
        else
            thread_.join();
    }
}

// ─── Lifecycle ───────────────────────────────────────────────────────────────

bool KeyListener::start(KeyEventSource& source)
{
    std::thread previous;
    {
        std::lock_guard lock(lifecycle_mutex_);
        if (running_.load(std::memory_order_acquire))
            return true;
        if (thread_.joinable())
        {
            if (thread_.get_id() == std::this_thread::get_id())
            {
                WHISPERKEYS_LOG_WARN("listener",
                                     "Cannot restart the listener from its own thread");
                return false;
            }
            previous = std::move(thread_);
        }
    }

    // Reap a pump thread whose stop was requested from a handler.
    if (previous.joinable())
        previous.join();

    std::lock_guard lock(lifecycle_mutex_);
    if (running_.load(std::memory_order_acquire) || thread_.joinable())
        return running_.load(std::memory_order_acquire);

    if (!source.open())
    {
        WHISPERKEYS_LOG_ERROR("listener", "Key event source failed to open");
        return false;
    }

    {
        std::lock_guard state_lock(mutex_);
        held_modifiers_.clear();
    }

    source_ = &source;
    running_.store(true, std::memory_order_release);
    thread_ = std::thread([this, &source] { pump(source); });

    WHISPERKEYS_LOG_INFO("listener", "Shortcuts keyboard listener started");
    return true;
}

void KeyListener::stop()
{
    std::thread     worker;
    KeyEventSource* source      = nullptr;
    bool            was_running = false;
    {
        std::lock_guard lock(lifecycle_mutex_);
        was_running = running_.exchange(false, std::memory_order_acq_rel);
        source      = source_;
        source_     = nullptr;
        if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id())
            worker = std::move(thread_);
    }

    if (source)
        source->close();
    if (worker.joinable())
        worker.join();

    {
        std::lock_guard lock(mutex_);
        held_modifiers_.clear();
    }

    if (was_running)
        WHISPERKEYS_LOG_INFO("listener", "Shortcuts keyboard listener stopped");
}

void KeyListener::pump(KeyEventSource& source)
{
    KeyEvent event;
    while (running_.load(std::memory_order_acquire) && source.wait_event(event))
        handle_event(event);

    // The source may also close on its own (window destroyed).
    running_.store(false, std::memory_order_release);
    WHISPERKEYS_LOG_DEBUG("listener", "Pump thread exiting");
}

// ─── Matching ────────────────────────────────────────────────────────────────

std::vector<std::string> KeyListener::handle_event(const KeyEvent& event)
{
    std::vector<std::string> fired;
    if (event.key == keys::Unknown)
        return fired;

    {
        std::lock_guard lock(mutex_);

        if (is_modifier_key(event.key))
        {
            if (event.is_down())
                held_modifiers_.insert(event.key);
            else
                held_modifiers_.erase(event.key);
            return fired;
        }

        if (!event.is_down())
            return fired;

        refresh_bindings_locked();
        const KeyMod active = active_modifiers_locked();
        const auto   t      = now();

        for (const auto& binding : bindings_)
        {
            if (!binding.spec.matches(event.key, active))
                continue;

            auto it = last_fired_.find(binding.id);
            if (it != last_fired_.end() && t - it->second < options_.debounce)
            {
                WHISPERKEYS_LOG_TRACE("listener", "Shortcut '{}' debounced", binding.id);
                continue;
            }
            last_fired_[binding.id] = t;
            fired.push_back(binding.id);
        }
    }

    // Handlers run without the listener lock held
    for (const auto& id : fired)
    {
        WHISPERKEYS_LOG_DEBUG("listener", "Shortcut triggered: {}", id);
        if (trigger_)
            trigger_(id);
    }
    return fired;
}

KeyMod KeyListener::active_modifiers() const
{
    std::lock_guard lock(mutex_);
    return active_modifiers_locked();
}

void KeyListener::reset_debounce()
{
    std::lock_guard lock(mutex_);
    last_fired_.clear();
}

ListenerOptions::TimePoint KeyListener::now() const
{
    return options_.clock ? options_.clock() : ListenerOptions::Clock::now();
}

KeyMod KeyListener::active_modifiers_locked() const
{
    KeyMod mods = KeyMod::None;
    for (int key : held_modifiers_)
        mods |= modifier_for_key(key);
    return mods;
}

// Recompile the bindings only when the registry changed since the last event.
void KeyListener::refresh_bindings_locked()
{
    uint64_t rev = registry_.revision();
    if (bindings_valid_ && rev == bindings_revision_)
        return;
    bindings_          = registry_.enabled_bindings();
    bindings_revision_ = rev;
    bindings_valid_    = true;
}

}   // namespace whisperkeys
