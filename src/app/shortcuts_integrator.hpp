#pragma once

#include <atomic>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "config/shortcut_registry.hpp"
#include "dispatch_table.hpp"
#include "input/key_listener.hpp"

namespace whisperkeys
{

// Glue between the shortcut configuration, the action handlers the host
// registers, and the key listener.
//
// The host constructs one integrator next to its registry (no global
// instance), registers handlers by shortcut id, then starts the listener on
// a key source. Handlers run on the listener thread for key presses, or on
// the caller's thread for trigger().
//
// Typical usage:
//   ShortcutRegistry registry;
//   registry.load();
//   ShortcutsIntegrator shortcuts(registry);
//   shortcuts.initialize();
//   shortcuts.register_action_handler("record_toggle", [&] { recorder.toggle(); });
//   shortcuts.start_keyboard_listener(source);
class ShortcutsIntegrator
{
   public:
    explicit ShortcutsIntegrator(ShortcutRegistry& registry, ListenerOptions options = {});
    ~ShortcutsIntegrator();

    ShortcutsIntegrator(const ShortcutsIntegrator&)            = delete;
    ShortcutsIntegrator& operator=(const ShortcutsIntegrator&) = delete;

    // Idempotent startup hook.
    void initialize();
    bool is_initialized() const { return initialized_.load(); }

    // Handlers for one id run in registration order. Returns false for an
    // empty handler.
    bool register_action_handler(const std::string& id, DispatchTable::Handler handler);

    // Run the handlers for `id` on the calling thread.
    void trigger(const std::string& id);

    // Returns false (and runs nothing) if no handler is registered for `id`.
    bool trigger_by_id(const std::string& id);

    size_t handler_count(const std::string& id) const;
    void   clear_handlers(const std::string& id);
    void   clear_handlers();

    // Re-read the configuration file. Registered handlers are kept.
    void reload_shortcuts();

    bool start_keyboard_listener(KeyEventSource& source);
    void stop_keyboard_listener();
    bool is_listening() const;

    std::optional<std::string> get_shortcut_hotkey(const std::string& id) const;
    bool                       is_shortcut_enabled(const std::string& id) const;
    EditResult set_shortcut_hotkey(const std::string& id, const std::string& hotkey);

    std::vector<Shortcut> get_all_shortcuts() const;
    std::vector<Shortcut> get_shortcuts_by_group(const std::string& group) const;
    std::map<std::string, std::vector<std::string>> detect_all_conflicts() const;

    ShortcutRegistry&       registry() { return registry_; }
    const ShortcutRegistry& registry() const { return registry_; }
    KeyListener&            listener() { return listener_; }

   private:
    ShortcutRegistry& registry_;
    DispatchTable     dispatch_;
    KeyListener       listener_;   // after dispatch_: stopped before handlers go away
    std::atomic<bool> initialized_{false};
};

}   // namespace whisperkeys
