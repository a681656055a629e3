#pragma once

#include <string>
#include <vector>
#include <whisperkeys/key.hpp>

namespace whisperkeys
{

// Structured form of a hotkey: logical modifiers plus at most one main key.
struct HotkeySpec
{
    KeyMod mods = KeyMod::None;
    int    key  = keys::Unknown;

    bool operator==(const HotkeySpec& o) const { return key == o.key && mods == o.mods; }
    bool operator!=(const HotkeySpec& o) const { return !(*this == o); }

    bool empty() const { return key == keys::Unknown && mods == KeyMod::None; }
    bool has_key() const { return key != keys::Unknown; }

    // True when `pressed` is the main key and either no modifiers are
    // required or at least one required modifier is in `active`.
    // ctrl+shift+x therefore also matches with only Ctrl held.
    bool matches(int pressed, KeyMod active) const
    {
        if (!has_key() || pressed != key)
            return false;
        if (!any_mod(mods))
            return true;
        return any_mod(mods & active);
    }
};

// Result of parsing hotkey text. Parsing never fails: unknown tokens are
// dropped and described in `warnings`.
struct HotkeyParse
{
    HotkeySpec               spec;
    std::vector<std::string> warnings;

    bool clean() const { return warnings.empty(); }
};

// Parse "ctrl+shift+f1" style text (case-insensitive, '+'-joined).
HotkeyParse parse_hotkey(const std::string& text);

// Canonical lowercase text: modifiers as ctrl, alt, shift, meta, then the key.
std::string format_hotkey(const HotkeySpec& spec);

// format_hotkey(parse_hotkey(text).spec)
std::string normalize_hotkey(const std::string& text);

// Label for menus and settings panels, e.g. "Ctrl+Shift+C". "Not Set" if empty.
std::string display_hotkey(const std::string& text);

// Canonical token for a single key ("f1", "pageup", "a", ","). Empty if the
// key has no name.
std::string key_name(int key);

// Key code for a single token, keys::Unknown if unrecognized.
int key_from_name(const std::string& token);

}   // namespace whisperkeys
