//===----------------------------------------------------------------------===//
//
// Part of the Keyview project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/render/ansi_writer.cpp
// Purpose: Turn a RenderedView into the byte stream the host displays.
// Key invariants: An SGR sequence is emitted only when the span style differs
//                 from the style already in effect; every coloured line ends
//                 with a reset so lines are independent.
// Ownership/Lifetime: AnsiWriter borrows the TermIO sink.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the ANSI writer for rendered keybinding views.
/// @details Colour output uses the sixteen-colour palette so the view looks
///          the same under any terminal theme the host has configured.

#include "keyview/render/ansi_writer.hpp"
#include "keyview/term/term_io.hpp"

#include <string>

namespace keyview::render
{

Style styleFor(Role role)
{
    switch (role)
    {
        case Role::Normal:
            return Style{};
        case Role::Title:
            return Style{Color::Yellow, Color::Default, Bold};
        case Role::Key:
            return Style{Color::White, Color::Default, Plain};
        case Role::Muted:
            return Style{Color::DarkGray, Color::Default, Plain};
        case Role::Action:
            return Style{Color::White, Color::Default, Plain};
        case Role::Marker:
            return Style{Color::DarkGray, Color::Default, Plain};
    }
    return Style{};
}

int sgrCode(Color color, bool background)
{
    const int base = background ? 40 : 30;
    switch (color)
    {
        case Color::Default:
            return 0;
        case Color::Black:
            return base + 0;
        case Color::Red:
            return base + 1;
        case Color::Green:
            return base + 2;
        case Color::Yellow:
            return base + 3;
        case Color::Blue:
            return base + 4;
        case Color::Magenta:
            return base + 5;
        case Color::Cyan:
            return base + 6;
        case Color::Gray:
            return base + 7;
        case Color::DarkGray:
            return base + 60 + 0;
        case Color::LightRed:
            return base + 60 + 1;
        case Color::LightGreen:
            return base + 60 + 2;
        case Color::LightYellow:
            return base + 60 + 3;
        case Color::LightBlue:
            return base + 60 + 4;
        case Color::LightMagenta:
            return base + 60 + 5;
        case Color::LightCyan:
            return base + 60 + 6;
        case Color::White:
            return base + 60 + 7;
    }
    return 0;
}

AnsiWriter::AnsiWriter(term::TermIO &tio, bool color) : tio_(tio), color_(color) {}

void AnsiWriter::setStyle(Style style)
{
    if (style == currentStyle_)
    {
        return;
    }

    std::string seq = "\x1b[0";
    if (style.attrs & Bold)
        seq += ";1";
    if (const int fg = sgrCode(style.fg, false))
        seq += ";" + std::to_string(fg);
    if (const int bg = sgrCode(style.bg, true))
        seq += ";" + std::to_string(bg);
    seq += 'm';
    tio_.write(seq);
    currentStyle_ = style;
}

void AnsiWriter::draw(const RenderedView &view, Viewport viewport)
{
    for (const auto &line : view.lines)
    {
        Line padded = line;
        padLine(padded, viewport.width);
        for (const auto &span : padded.spans)
        {
            if (color_)
            {
                setStyle(styleFor(span.role));
            }
            tio_.write(span.text);
        }
        if (color_)
        {
            tio_.write("\x1b[0m\n");
            currentStyle_ = Style{};
        }
        else
        {
            tio_.write("\n");
        }
    }
    tio_.flush();
}

} // namespace keyview::render
