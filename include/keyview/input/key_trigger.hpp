// include/keyview/input/key_trigger.hpp
// @brief Key triggers: a base key plus modifiers, with parsing and display.
// @invariant Equality is exact on code, codepoint and modifiers.
// @ownership Value types; no external resources.
#pragma once

#include "keyview/support/expected.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace keyview::input
{

/// @brief Modifier bit flags combined into KeyTrigger::mods.
enum Modifier : unsigned
{
    None = 0,
    Ctrl = 1U << 0U,
    Alt = 1U << 1U,
    Shift = 1U << 2U,
};

/// @brief Base key identity; Char keys carry their codepoint separately.
enum class KeyCode : uint8_t
{
    Char,
    Enter,
    Esc,
    Tab,
    Backspace,
    Up,
    Down,
    Left,
    Right,
    Home,
    End,
    PageUp,
    PageDown,
    Insert,
    Delete,
    F1,
    F2,
    F3,
    F4,
    F5,
    F6,
    F7,
    F8,
    F9,
    F10,
    F11,
    F12,
};

/// @brief Key combination identifying a bindable input event.
struct KeyTrigger
{
    KeyCode code{KeyCode::Char};
    char32_t codepoint{0};
    unsigned mods{None};

    /// @brief Build a character trigger such as Ctrl+p.
    static KeyTrigger character(char32_t cp, unsigned mods = None)
    {
        return KeyTrigger{KeyCode::Char, cp, mods};
    }

    /// @brief Build a named-key trigger such as Alt+Left.
    static KeyTrigger named(KeyCode code, unsigned mods = None)
    {
        return KeyTrigger{code, 0, mods};
    }

    bool operator==(const KeyTrigger &other) const;

    bool operator!=(const KeyTrigger &other) const
    {
        return !(*this == other);
    }

    /// @brief Order by code, then codepoint, then modifiers.
    bool operator<(const KeyTrigger &other) const;
};

/// @brief Hash functor for unordered containers keyed by KeyTrigger.
struct KeyTriggerHash
{
    std::size_t operator()(const KeyTrigger &kt) const;
};

/// @brief Display cells of a trigger: {"Ctrl", "+", "p"} or {"", "", "Enter"}.
struct TriggerParts
{
    std::string modifiers;
    std::string joiner;
    std::string key;
};

/// @brief Parse text such as "Ctrl+p", "Alt+Shift+Left", "Space" or "Ctrl++".
/// @return Trigger on success; an unlocated error diagnostic otherwise.
support::Expected<KeyTrigger> parseTrigger(std::string_view text);

/// @brief Canonical short form, modifiers ordered Ctrl, Alt, Shift.
std::string displayTrigger(const KeyTrigger &kt);

/// @brief Display name of the base key alone, e.g. "p", "Space", "PageUp".
std::string keyName(const KeyTrigger &kt);

/// @brief Split the display form into modifier, joiner and key cells.
TriggerParts splitTrigger(const KeyTrigger &kt);

} // namespace keyview::input
