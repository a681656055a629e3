#include "shortcut_registry.hpp"

namespace whisperkeys
{

// Hotkey strings here must stay as they are: existing user configs were
// written against them.
const std::vector<ShortcutGroupDefaults>& default_shortcut_groups()
{
    static const std::vector<ShortcutGroupDefaults> groups = {
        {"recording",
         {
             {"record_toggle", "Toggle Recording", "pause", "Start or stop recording", true, "recording"},
             {"record_start", "Start Recording", "", "Start recording immediately", false, "recording"},
             {"record_stop", "Stop Recording", "", "Stop recording and transcribe", false, "recording"},
         }},
        {"playback",
         {
             {"play_pause", "Play/Pause", "", "Play or pause playback", false, "playback"},
         }},
        {"navigation",
         {
             {"seek_forward", "Seek Forward", "", "Seek forward in audio", false, "navigation"},
             {"seek_backward", "Seek Backward", "", "Seek backward in audio", false, "navigation"},
         }},
        {"history",
         {
             {"copy_last", "Copy Last Transcription", "ctrl+shift+c",
              "Copy the last transcription to clipboard", true, "history"},
             {"show_history", "Show History", "ctrl+h", "Show the history panel", true, "history"},
             {"clear_history", "Clear History", "", "Clear all transcription history", false, "history"},
         }},
        {"application",
         {
             {"toggle_app", "Toggle Application", "", "Toggle the application on/off", false, "application"},
             {"show_settings", "Show Settings", "ctrl+,", "Open the settings window", true, "application"},
             {"show_shortcuts", "Show Shortcuts", "ctrl+k", "Open the shortcuts manager", true, "application"},
             {"toggle_privacy", "Toggle Privacy Mode", "ctrl+shift+p", "Toggle privacy mode on/off", false,
              "application"},
             {"exit_app", "Exit Application", "ctrl+q", "Exit the application", false, "application"},
         }},
        {"text_processing",
         {
             {"show_dictionary", "Show Dictionary", "ctrl+d", "Open the dictionary manager", false,
              "text_processing"},
             {"show_snippets", "Show Snippets", "ctrl+shift+s", "Open the snippets manager", false,
              "text_processing"},
             {"show_text_processing", "Show Text Processing", "", "Open text processing settings", false,
              "text_processing"},
         }},
    };
    return groups;
}

std::string group_title(const std::string& group)
{
    if (group == "recording")
        return "Recording Controls";
    if (group == "playback")
        return "Playback Controls";
    if (group == "navigation")
        return "Navigation";
    if (group == "history")
        return "History Management";
    if (group == "application")
        return "Application Control";
    if (group == "text_processing")
        return "Text Processing";
    return group;
}

}   // namespace whisperkeys
