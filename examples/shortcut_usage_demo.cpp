// Shortcut Usage Demo
// Shows how a push-to-talk host wires its actions to shortcuts and feeds key
// events into the listener.
//
// This example shows:
// - Registering action handlers by shortcut id
// - Running the keyboard listener on a background thread
// - Feeding it synthetic key events through a QueuedKeySource
// - Debounce of a double-tapped hotkey

#include <chrono>
#include <filesystem>
#include <iostream>
#include <thread>
#include <whisperkeys/whisperkeys.hpp>

#include "app/shortcuts_integrator.hpp"
#include "input/queued_key_source.hpp"

using namespace whisperkeys;

int main()
{
    Logger::instance().set_level(LogLevel::Info);
    Logger::instance().add_sink(sinks::console_sink());

    ShortcutRegistry registry(
        (std::filesystem::temp_directory_path() / "whisperkeys_usage_demo.json").string());
    registry.load();

    ShortcutsIntegrator shortcuts(registry);
    shortcuts.initialize();

    bool recording = false;
    shortcuts.register_action_handler("record_toggle",
                                      [&]
                                      {
                                          recording = !recording;
                                          std::cout << (recording ? "  >> recording started\n"
                                                                  : "  >> recording stopped\n");
                                      });
    shortcuts.register_action_handler("copy_last",
                                      [] { std::cout << "  >> last transcription copied\n"; });
    shortcuts.register_action_handler("show_history",
                                      [] { std::cout << "  >> history panel opened\n"; });

    QueuedKeySource keyboard;
    if (!shortcuts.start_keyboard_listener(keyboard))
        return 1;

    auto settle = [] { std::this_thread::sleep_for(std::chrono::milliseconds(250)); };

    std::cout << "Pressing Pause\n";
    keyboard.press(keys::Pause);
    keyboard.release(keys::Pause);
    settle();

    std::cout << "Pressing Ctrl+Shift+C\n";
    keyboard.press(keys::LeftControl);
    keyboard.press(keys::LeftShift);
    keyboard.press('C');
    keyboard.release('C');
    keyboard.release(keys::LeftShift);
    keyboard.release(keys::LeftControl);
    settle();

    std::cout << "Double-tapping Pause (second tap is debounced)\n";
    keyboard.press(keys::Pause);
    keyboard.release(keys::Pause);
    keyboard.press(keys::Pause);
    keyboard.release(keys::Pause);
    settle();

    std::cout << "Triggering show_history programmatically\n";
    shortcuts.trigger_by_id("show_history");

    shortcuts.stop_keyboard_listener();
    std::cout << "Recording is " << (recording ? "on" : "off") << "\n";
    return 0;
}
