// Shortcut Configuration Demo
// Demonstrates shortcut editing, conflict reporting, and save/export/import
//
// This example shows:
// - Loading the shortcut configuration (defaults when no file exists)
// - Rebinding shortcuts and handling conflicts
// - Saving to and reloading from a JSON file
// - Exporting and merging a configuration from another machine

#include <filesystem>
#include <iostream>
#include <whisperkeys/whisperkeys.hpp>

#include "config/shortcut_registry.hpp"
#include "input/hotkey.hpp"

using namespace whisperkeys;

namespace
{

void print_group(const ShortcutRegistry& registry, const std::string& group)
{
    std::cout << "   " << group_title(group) << ":\n";
    for (const auto& sc : registry.get_group(group))
    {
        std::cout << "     - " << sc.id << ": " << display_hotkey(sc.hotkey)
                  << (sc.enabled ? "" : " (disabled)") << "\n";
    }
}

}   // namespace

int main()
{
    std::cout << "=== Shortcut Configuration Demo ===\n\n";

    const auto dir = std::filesystem::temp_directory_path() / "whisperkeys_demo";
    std::filesystem::create_directories(dir);
    const std::string config_file = (dir / "shortcuts_config.json").string();
    const std::string export_file = (dir / "shortcuts_export.json").string();

    ShortcutRegistry registry(config_file);
    registry.load();

    std::cout << "1. Loaded " << registry.size() << " shortcuts\n";
    print_group(registry, "recording");
    print_group(registry, "history");

    std::cout << "\n2. Rebinding shortcuts...\n";
    if (auto r = registry.set_hotkey("record_toggle", "ctrl+alt+space"); r)
        std::cout << "   - record_toggle: Ctrl+Alt+Space (was Pause)\n";

    // show_history cannot take a hotkey that copy_last already owns
    auto conflict = registry.set_hotkey("show_history", "Shift+Ctrl+C");
    if (!conflict)
        std::cout << "   - show_history refused: " << conflict.message << "\n";

    // exit_app is disabled by default; enable it on its stored hotkey
    if (registry.set_enabled("exit_app", true))
        std::cout << "   - exit_app enabled on " << display_hotkey(registry.get("exit_app")->hotkey)
                  << "\n";

    std::cout << "\n3. Saving to " << config_file << "\n";
    if (!registry.save())
    {
        std::cerr << "   Failed to save\n";
        return 1;
    }

    ShortcutRegistry reloaded(config_file);
    reloaded.load();
    std::cout << "   Reloaded record_toggle: " << display_hotkey(reloaded.get("record_toggle")->hotkey)
              << "\n";

    std::cout << "\n4. Exporting to " << export_file << "\n";
    std::cout << "   " << registry.export_config(export_file).message << "\n";

    std::cout << "\n5. Merging the export into a fresh default configuration...\n";
    ShortcutRegistry other((dir / "other_config.json").string());
    ImportResult     merged = other.import_config(export_file, true);
    std::cout << "   " << merged.message << " (" << merged.imported << " new, "
              << merged.id_collisions.size() << " already present)\n";

    std::cout << "\n6. Conflict audit: ";
    auto conflicts = other.detect_all_conflicts();
    if (conflicts.empty())
        std::cout << "no conflicts\n";
    for (const auto& [hotkey, ids] : conflicts)
        std::cout << "\n   " << hotkey << " claimed by " << ids.size() << " shortcuts";

    std::filesystem::remove_all(dir);
    std::cout << "\n=== Demo Complete ===\n";
    return 0;
}
