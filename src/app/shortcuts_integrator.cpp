#include "shortcuts_integrator.hpp"

#include <whisperkeys/logger.hpp>

namespace whisperkeys
{

ShortcutsIntegrator::ShortcutsIntegrator(ShortcutRegistry& registry, ListenerOptions options)
    : registry_(registry),
      listener_(registry, [this](const std::string& id) { trigger(id); }, std::move(options))
{
}

ShortcutsIntegrator::~ShortcutsIntegrator()
{
    listener_.stop();
}

void ShortcutsIntegrator::initialize()
{
    if (initialized_.exchange(true))
        return;
    WHISPERKEYS_LOG_INFO("integrator",
                         "Shortcuts integrator initialized with {} shortcuts",
                         registry_.size());
}

// ─── Handlers ────────────────────────────────────────────────────────────────

bool ShortcutsIntegrator::register_action_handler(const std::string& id,
                                                  DispatchTable::Handler handler)
{
    if (!dispatch_.add(id, std::move(handler)))
    {
        WHISPERKEYS_LOG_WARN("integrator", "Empty handler for shortcut '{}' rejected", id);
        return false;
    }
    if (!registry_.get(id))
        WHISPERKEYS_LOG_DEBUG("integrator", "Handler registered for unknown shortcut '{}'", id);
    WHISPERKEYS_LOG_DEBUG("integrator", "Registered handler for shortcut '{}'", id);
    return true;
}

void ShortcutsIntegrator::trigger(const std::string& id)
{
    size_t count = dispatch_.invoke(id);
    if (count == 0)
    {
        WHISPERKEYS_LOG_WARN("integrator", "No handlers registered for shortcut '{}'", id);
        return;
    }
    WHISPERKEYS_LOG_DEBUG("integrator", "Triggered shortcut '{}' with {} handler(s)", id, count);
}

bool ShortcutsIntegrator::trigger_by_id(const std::string& id)
{
    if (!dispatch_.contains(id))
        return false;
    trigger(id);
    return true;
}

size_t ShortcutsIntegrator::handler_count(const std::string& id) const
{
    return dispatch_.handler_count(id);
}

void ShortcutsIntegrator::clear_handlers(const std::string& id)
{
    dispatch_.remove(id);
}

void ShortcutsIntegrator::clear_handlers()
{
    dispatch_.clear();
}

void ShortcutsIntegrator::reload_shortcuts()
{
    // Handlers are keyed by id, not by hotkey, so nothing to re-bind here.
    // The listener picks up the new bindings on its next key press.
    registry_.load();
    WHISPERKEYS_LOG_INFO("integrator", "Shortcuts reloaded from configuration");
}

// ─── Listener ────────────────────────────────────────────────────────────────

bool ShortcutsIntegrator::start_keyboard_listener(KeyEventSource& source)
{
    return listener_.start(source);
}

void ShortcutsIntegrator::stop_keyboard_listener()
{
    listener_.stop();
}

bool ShortcutsIntegrator::is_listening() const
{
    return listener_.is_running();
}

// ─── Configuration passthroughs ──────────────────────────────────────────────

std::optional<std::string> ShortcutsIntegrator::get_shortcut_hotkey(const std::string& id) const
{
    auto sc = registry_.get(id);
    if (!sc)
        return std::nullopt;
    return sc->hotkey;
}

bool ShortcutsIntegrator::is_shortcut_enabled(const std::string& id) const
{
    auto sc = registry_.get(id);
    return sc && sc->enabled;
}

EditResult ShortcutsIntegrator::set_shortcut_hotkey(const std::string& id,
                                                    const std::string& hotkey)
{
    EditResult result = registry_.set_hotkey(id, hotkey);
    if (!result)
        WHISPERKEYS_LOG_WARN("integrator", "Cannot set hotkey of '{}': {}", id, result.message);
    return result;
}

std::vector<Shortcut> ShortcutsIntegrator::get_all_shortcuts() const
{
    return registry_.get_all();
}

std::vector<Shortcut> ShortcutsIntegrator::get_shortcuts_by_group(const std::string& group) const
{
    return registry_.get_group(group);
}

std::map<std::string, std::vector<std::string>> ShortcutsIntegrator::detect_all_conflicts() const
{
    return registry_.detect_all_conflicts();
}

}   // namespace whisperkeys
