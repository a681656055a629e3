#include "hotkey.hpp"

#include <cctype>
#include <cstdlib>
#include <whisperkeys/logger.hpp>

namespace whisperkeys
{

// ─── Key names ───────────────────────────────────────────────────────────────

namespace
{

struct NamedKey
{
    const char* token;     // canonical lowercase token
    const char* display;   // label for display_hotkey()
    int         key;
};

constexpr NamedKey kNamedKeys[] = {
    {"pause", "Pause", keys::Pause},
    {"insert", "Insert", keys::Insert},
    {"home", "Home", keys::Home},
    {"end", "End", keys::End},
    {"pageup", "PageUp", keys::PageUp},
    {"pagedown", "PageDown", keys::PageDown},
    {"space", "Space", keys::Space},
    {"enter", "Enter", keys::Enter},
    {"tab", "Tab", keys::Tab},
    {"backspace", "Backspace", keys::Backspace},
    {"delete", "Delete", keys::Delete},
    {"escape", "Escape", keys::Escape},
    {"up", "Up", keys::Up},
    {"down", "Down", keys::Down},
    {"left", "Left", keys::Left},
    {"right", "Right", keys::Right},
};

struct Alias
{
    const char* token;
    int         key;
};

constexpr Alias kAliases[] = {
    {"esc", keys::Escape},
    {"return", keys::Enter},
    {"del", keys::Delete},
    {"ins", keys::Insert},
    {"pgup", keys::PageUp},
    {"pgdn", keys::PageDown},
};

std::string to_lower(const std::string& s)
{
    std::string lower;
    lower.reserve(s.size());
    for (char c : s)
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return lower;
}

std::string trim(const std::string& s)
{
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

bool is_all_digits(const std::string& s, size_t from)
{
    if (from >= s.size())
        return false;
    for (size_t i = from; i < s.size(); ++i)
    {
        if (!std::isdigit(static_cast<unsigned char>(s[i])))
            return false;
    }
    return true;
}

// Lowercase token -> modifier flag, KeyMod::None if not a modifier.
KeyMod modifier_from_token(const std::string& lower)
{
    if (lower == "ctrl" || lower == "control")
        return KeyMod::Ctrl;
    if (lower == "alt" || lower == "option")
        return KeyMod::Alt;
    if (lower == "shift")
        return KeyMod::Shift;
    if (lower == "win" || lower == "meta" || lower == "cmd" || lower == "super")
        return KeyMod::Meta;
    return KeyMod::None;
}

std::string display_name(int key)
{
    for (const auto& nk : kNamedKeys)
    {
        if (nk.key == key)
            return nk.display;
    }
    if (key >= keys::F1 && key <= keys::F12)
        return "F" + std::to_string(key - keys::F1 + 1);
    if (key >= keys::A && key <= keys::Z)
        return std::string(1, static_cast<char>(key));
    std::string name = key_name(key);
    if (name.size() > 1)
        name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));
    return name;
}

void warn(HotkeyParse& result, const std::string& text, std::string message)
{
    WHISPERKEYS_LOG_WARN("parser", "Hotkey '{}': {}", text, message);
    result.warnings.push_back(std::move(message));
}

}   // namespace

std::string key_name(int key)
{
    for (const auto& nk : kNamedKeys)
    {
        if (nk.key == key)
            return nk.token;
    }
    if (key >= keys::F1 && key <= keys::F12)
        return "f" + std::to_string(key - keys::F1 + 1);
    if (key >= keys::A && key <= keys::Z)
        return std::string(1, static_cast<char>(std::tolower(key)));
    // Remaining printable ASCII except lowercase letters, which are never key codes
    if (key > keys::Space && key < 127 && !(key >= 'a' && key <= 'z'))
        return std::string(1, static_cast<char>(key));
    if (key > 0)
        return "key" + std::to_string(key);
    return "";
}

int key_from_name(const std::string& token)
{
    std::string lower = to_lower(trim(token));
    if (lower.empty())
        return keys::Unknown;

    if (lower.size() == 1)
    {
        unsigned char c = static_cast<unsigned char>(lower[0]);
        if (c >= 'a' && c <= 'z')
            return std::toupper(c);
        if (c > keys::Space && c < 127)
            return c;
        return keys::Unknown;
    }

    for (const auto& nk : kNamedKeys)
    {
        if (lower == nk.token)
            return nk.key;
    }
    for (const auto& alias : kAliases)
    {
        if (lower == alias.token)
            return alias.key;
    }

    // F-keys
    if (lower[0] == 'f' && is_all_digits(lower, 1) && lower.size() <= 3)
    {
        int n = std::atoi(lower.c_str() + 1);
        if (n >= 1 && n <= 12)
            return keys::f(n);
        return keys::Unknown;
    }

    // Raw key code, as produced by key_name() for keys without a name
    if (lower.rfind("key", 0) == 0 && is_all_digits(lower, 3) && lower.size() <= 8)
    {
        int code = std::atoi(lower.c_str() + 3);
        return code > 0 ? code : keys::Unknown;
    }

    return keys::Unknown;
}

// ─── Parse / format ──────────────────────────────────────────────────────────

HotkeyParse parse_hotkey(const std::string& text)
{
    HotkeyParse result;
    std::string body = trim(text);
    if (body.empty())
        return result;

    // "+" and "ctrl++" name the plus key itself.
    bool plus_key = false;
    if (body.back() == '+' && (body.size() == 1 || body[body.size() - 2] == '+'))
    {
        plus_key = true;
        body.pop_back();
        if (!body.empty())
            body.pop_back();
    }

    auto assign_key = [&](int key, const std::string& token)
    {
        if (result.spec.has_key())
        {
            warn(result, text, "extra key '" + token + "' ignored");
            return;
        }
        result.spec.key = key;
    };

    size_t start = 0;
    while (!body.empty() && start <= body.size())
    {
        size_t      end   = body.find('+', start);
        std::string token = trim(body.substr(start, end == std::string::npos ? std::string::npos
                                                                             : end - start));
        start = end == std::string::npos ? body.size() + 1 : end + 1;

        if (token.empty())
        {
            warn(result, text, "empty key token");
            continue;
        }

        std::string lower = to_lower(token);
        KeyMod      mod   = modifier_from_token(lower);
        if (mod != KeyMod::None)
        {
            result.spec.mods |= mod;
            continue;
        }

        int key = key_from_name(lower);
        if (key != keys::Unknown)
        {
            assign_key(key, lower);
            continue;
        }

        warn(result, text, "unknown key '" + token + "' dropped");
    }

    if (plus_key)
        assign_key('+', "+");

    return result;
}

std::string format_hotkey(const HotkeySpec& spec)
{
    std::string result;
    auto        append = [&](const std::string& token)
    {
        if (!result.empty())
            result += '+';
        result += token;
    };

    if (has_mod(spec.mods, KeyMod::Ctrl))
        append("ctrl");
    if (has_mod(spec.mods, KeyMod::Alt))
        append("alt");
    if (has_mod(spec.mods, KeyMod::Shift))
        append("shift");
    if (has_mod(spec.mods, KeyMod::Meta))
        append("meta");
    if (spec.has_key())
        append(key_name(spec.key));
    return result;
}

std::string normalize_hotkey(const std::string& text)
{
    return format_hotkey(parse_hotkey(text).spec);
}

std::string display_hotkey(const std::string& text)
{
    HotkeySpec spec = parse_hotkey(text).spec;
    if (spec.empty())
        return "Not Set";

    std::string result;
    if (has_mod(spec.mods, KeyMod::Ctrl))
        result += "Ctrl+";
    if (has_mod(spec.mods, KeyMod::Alt))
        result += "Alt+";
    if (has_mod(spec.mods, KeyMod::Shift))
        result += "Shift+";
    if (has_mod(spec.mods, KeyMod::Meta))
        result += "Meta+";
    if (spec.has_key())
        result += display_name(spec.key);
    else
        result.pop_back();
    return result;
}

}   // namespace whisperkeys
