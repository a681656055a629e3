#pragma once

#include <whisperkeys/fwd.hpp>
#include <whisperkeys/key.hpp>
#include <whisperkeys/logger.hpp>

#define WHISPERKEYS_VERSION_MAJOR 1
#define WHISPERKEYS_VERSION_MINOR 0
#define WHISPERKEYS_VERSION_PATCH 0

// ─── Engine headers ──────────────────────────────────────────────────────────
// The shortcut engine itself is consumed through the whisperkeys target, which
// puts src/ on the include path:
//
//   #include "app/shortcuts_integrator.hpp"
//
//   whisperkeys::ShortcutRegistry registry;
//   registry.load();
//   whisperkeys::ShortcutsIntegrator shortcuts(registry);
//   shortcuts.register_action_handler("record_toggle", [] { /* ... */ });

namespace whisperkeys
{

inline constexpr const char* version_string()
{
    return "1.0.0";
}

}   // namespace whisperkeys
