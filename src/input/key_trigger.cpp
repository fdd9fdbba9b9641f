//===----------------------------------------------------------------------===//
//
// Part of the Keyview project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/input/key_trigger.cpp
// Purpose: Parse textual key triggers and render them in canonical short form.
// Key invariants: displayTrigger(parseTrigger(s)) == s for canonical strings.
// Ownership/Lifetime: Stateless; name tables have static storage duration.
//
//===----------------------------------------------------------------------===//

#include "keyview/input/key_trigger.hpp"
#include "keyview/util/strings.hpp"
#include "keyview/util/unicode.hpp"

#include <sstream>
#include <tuple>

namespace keyview::input
{

namespace
{
struct NamedKey
{
    std::string_view name;
    KeyCode code;
};

// Accepted spellings, lowercase. The first entry for a code is not
// necessarily its display name; see displayName().
constexpr NamedKey kNamedKeys[] = {
    {"enter", KeyCode::Enter},
    {"return", KeyCode::Enter},
    {"esc", KeyCode::Esc},
    {"escape", KeyCode::Esc},
    {"tab", KeyCode::Tab},
    {"backspace", KeyCode::Backspace},
    {"up", KeyCode::Up},
    {"down", KeyCode::Down},
    {"left", KeyCode::Left},
    {"right", KeyCode::Right},
    {"home", KeyCode::Home},
    {"end", KeyCode::End},
    {"pageup", KeyCode::PageUp},
    {"pgup", KeyCode::PageUp},
    {"pagedown", KeyCode::PageDown},
    {"pgdn", KeyCode::PageDown},
    {"insert", KeyCode::Insert},
    {"ins", KeyCode::Insert},
    {"delete", KeyCode::Delete},
    {"del", KeyCode::Delete},
    {"f1", KeyCode::F1},
    {"f2", KeyCode::F2},
    {"f3", KeyCode::F3},
    {"f4", KeyCode::F4},
    {"f5", KeyCode::F5},
    {"f6", KeyCode::F6},
    {"f7", KeyCode::F7},
    {"f8", KeyCode::F8},
    {"f9", KeyCode::F9},
    {"f10", KeyCode::F10},
    {"f11", KeyCode::F11},
    {"f12", KeyCode::F12},
};

const char *displayName(KeyCode code)
{
    switch (code)
    {
        case KeyCode::Char:
            return "";
        case KeyCode::Enter:
            return "Enter";
        case KeyCode::Esc:
            return "Esc";
        case KeyCode::Tab:
            return "Tab";
        case KeyCode::Backspace:
            return "Backspace";
        case KeyCode::Up:
            return "Up";
        case KeyCode::Down:
            return "Down";
        case KeyCode::Left:
            return "Left";
        case KeyCode::Right:
            return "Right";
        case KeyCode::Home:
            return "Home";
        case KeyCode::End:
            return "End";
        case KeyCode::PageUp:
            return "PageUp";
        case KeyCode::PageDown:
            return "PageDown";
        case KeyCode::Insert:
            return "Insert";
        case KeyCode::Delete:
            return "Delete";
        case KeyCode::F1:
            return "F1";
        case KeyCode::F2:
            return "F2";
        case KeyCode::F3:
            return "F3";
        case KeyCode::F4:
            return "F4";
        case KeyCode::F5:
            return "F5";
        case KeyCode::F6:
            return "F6";
        case KeyCode::F7:
            return "F7";
        case KeyCode::F8:
            return "F8";
        case KeyCode::F9:
            return "F9";
        case KeyCode::F10:
            return "F10";
        case KeyCode::F11:
            return "F11";
        case KeyCode::F12:
            return "F12";
    }
    return "";
}

support::Diag parseError(std::string msg)
{
    return support::makeError({}, std::move(msg));
}

/// @brief Map a modifier token to its flag; returns None for non-modifiers.
unsigned parseModifier(const std::string &lower)
{
    if (lower == "ctrl" || lower == "control" || lower == "c")
        return Ctrl;
    if (lower == "alt" || lower == "meta" || lower == "a")
        return Alt;
    if (lower == "shift" || lower == "s")
        return Shift;
    return None;
}

std::string modifierPrefix(unsigned mods)
{
    std::string out;
    if (mods & Ctrl)
        out += "Ctrl+";
    if (mods & Alt)
        out += "Alt+";
    if (mods & Shift)
        out += "Shift+";
    return out;
}
} // namespace

bool KeyTrigger::operator==(const KeyTrigger &other) const
{
    return code == other.code && codepoint == other.codepoint && mods == other.mods;
}

bool KeyTrigger::operator<(const KeyTrigger &other) const
{
    return std::tie(code, codepoint, mods) < std::tie(other.code, other.codepoint, other.mods);
}

/// @brief Compute a hash combining key code, modifiers, and Unicode codepoint.
std::size_t KeyTriggerHash::operator()(const KeyTrigger &kt) const
{
    return static_cast<std::size_t>(kt.code) ^ (static_cast<std::size_t>(kt.mods) << 8U) ^
           (static_cast<std::size_t>(kt.codepoint) << 16U);
}

support::Expected<KeyTrigger> parseTrigger(std::string_view text)
{
    const std::string s = util::trim(text);
    if (s.empty())
    {
        return parseError("empty key trigger");
    }

    std::string base;
    std::string rest;
    if (s == "+")
    {
        base = "+";
    }
    else if (s.size() >= 2 && s.compare(s.size() - 2, 2, "++") == 0)
    {
        base = "+";
        rest = s.substr(0, s.size() - 2);
    }
    else
    {
        const auto plus = s.rfind('+');
        if (plus == std::string::npos)
        {
            base = s;
        }
        else
        {
            base = util::trim(s.substr(plus + 1));
            rest = s.substr(0, plus);
        }
        if (base.empty())
        {
            return parseError("missing key after '+' in '" + s + "'");
        }
    }

    KeyTrigger kt{};
    if (!rest.empty())
    {
        // getline drops a trailing empty token, so "Ctrl++x" is caught here.
        if (rest.back() == '+')
        {
            return parseError("empty modifier in '" + s + "'");
        }
        std::stringstream ss(rest);
        std::string token;
        while (std::getline(ss, token, '+'))
        {
            const std::string lower = util::toLower(util::trim(token));
            const unsigned mod = parseModifier(lower);
            if (mod == None)
            {
                if (lower.empty())
                {
                    return parseError("empty modifier in '" + s + "'");
                }
                return parseError("'" + util::trim(token) + "' is not a modifier in '" + s + "'");
            }
            kt.mods |= mod;
        }
    }

    const std::u32string cps = util::decode_utf8(base);
    if (cps.size() == 1)
    {
        kt.code = KeyCode::Char;
        kt.codepoint = cps.front();
        return kt;
    }

    const std::string lower = util::toLower(base);
    if (lower == "space" || lower == "spc")
    {
        kt.code = KeyCode::Char;
        kt.codepoint = U' ';
        return kt;
    }
    for (const auto &nk : kNamedKeys)
    {
        if (nk.name == lower)
        {
            kt.code = nk.code;
            return kt;
        }
    }
    return parseError("unknown key '" + base + "'");
}

std::string keyName(const KeyTrigger &kt)
{
    if (kt.code != KeyCode::Char)
    {
        return displayName(kt.code);
    }
    if (kt.codepoint == U' ')
    {
        return "Space";
    }
    std::string out;
    if (kt.codepoint != 0)
    {
        util::encode_utf8(kt.codepoint, out);
    }
    return out;
}

std::string displayTrigger(const KeyTrigger &kt)
{
    return modifierPrefix(kt.mods) + keyName(kt);
}

TriggerParts splitTrigger(const KeyTrigger &kt)
{
    TriggerParts parts;
    parts.key = keyName(kt);
    std::string prefix = modifierPrefix(kt.mods);
    if (!prefix.empty())
    {
        prefix.pop_back();
        parts.modifiers = std::move(prefix);
        parts.joiner = "+";
    }
    return parts;
}

} // namespace keyview::input
