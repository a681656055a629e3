#pragma once

#include <cstdint>

namespace whisperkeys
{

// Logical modifier flags. Bit order is the canonical display order
// (Ctrl, Alt, Shift, Meta).
enum class KeyMod : uint8_t
{
    None  = 0,
    Ctrl  = 0x01,
    Alt   = 0x02,
    Shift = 0x04,
    Meta  = 0x08,
};

inline constexpr KeyMod operator|(KeyMod a, KeyMod b)
{
    return static_cast<KeyMod>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}
inline constexpr KeyMod operator&(KeyMod a, KeyMod b)
{
    return static_cast<KeyMod>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}
inline KeyMod& operator|=(KeyMod& a, KeyMod b)
{
    a = a | b;
    return a;
}
inline constexpr bool has_mod(KeyMod mods, KeyMod flag)
{
    return (static_cast<uint8_t>(mods) & static_cast<uint8_t>(flag)) != 0;
}
inline constexpr bool any_mod(KeyMod mods)
{
    return mods != KeyMod::None;
}

// Key codes. Values follow GLFW's key tokens so a GLFW key callback can feed
// the engine without a translation table. Letters use their uppercase ASCII
// code; other printable characters use their ASCII code.
namespace keys
{
constexpr int Unknown = 0;

constexpr int Space = 32;
constexpr int A     = 65;
constexpr int Z     = 90;

constexpr int Escape    = 256;
constexpr int Enter     = 257;
constexpr int Tab       = 258;
constexpr int Backspace = 259;
constexpr int Insert    = 260;
constexpr int Delete    = 261;
constexpr int Right     = 262;
constexpr int Left      = 263;
constexpr int Down      = 264;
constexpr int Up        = 265;
constexpr int PageUp    = 266;
constexpr int PageDown  = 267;
constexpr int Home      = 268;
constexpr int End       = 269;
constexpr int Pause     = 284;
constexpr int F1        = 290;
constexpr int F12       = 301;

// Physical modifier keys
constexpr int LeftShift    = 340;
constexpr int LeftControl  = 341;
constexpr int LeftAlt      = 342;
constexpr int LeftSuper    = 343;
constexpr int RightShift   = 344;
constexpr int RightControl = 345;
constexpr int RightAlt     = 346;
constexpr int RightSuper   = 347;

constexpr int f(int n)
{
    return F1 + n - 1;
}
}   // namespace keys

// Logical modifier for a physical modifier key, KeyMod::None for other keys.
inline constexpr KeyMod modifier_for_key(int key)
{
    switch (key)
    {
        case keys::LeftControl:
        case keys::RightControl:
            return KeyMod::Ctrl;
        case keys::LeftAlt:
        case keys::RightAlt:
            return KeyMod::Alt;
        case keys::LeftShift:
        case keys::RightShift:
            return KeyMod::Shift;
        case keys::LeftSuper:
        case keys::RightSuper:
            return KeyMod::Meta;
        default:
            return KeyMod::None;
    }
}

inline constexpr bool is_modifier_key(int key)
{
    return modifier_for_key(key) != KeyMod::None;
}

enum class KeyAction : uint8_t
{
    Release = 0,
    Press   = 1,
    Repeat  = 2,
};

// One discrete notification from a key event source.
struct KeyEvent
{
    int       key    = keys::Unknown;
    KeyAction action = KeyAction::Press;

    bool is_down() const { return action != KeyAction::Release; }

    static KeyEvent down(int key) { return {key, KeyAction::Press}; }
    static KeyEvent up(int key) { return {key, KeyAction::Release}; }
};

}   // namespace whisperkeys
