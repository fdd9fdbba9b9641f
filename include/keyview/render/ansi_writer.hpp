// include/keyview/render/ansi_writer.hpp
// @brief Writes rendered views to a terminal sink with ANSI colours.
// @invariant setStyle avoids redundant SGR sequences based on cached state.
// @ownership AnsiWriter writes through a borrowed TermIO reference.
#pragma once

#include "keyview/render/view.hpp"

#include <cstdint>

namespace keyview::term
{
class TermIO;
}

namespace keyview::render
{

/// @brief Sixteen-colour terminal palette plus the terminal default.
enum class Color : uint8_t
{
    Default,
    Black,
    Red,
    Green,
    Yellow,
    Blue,
    Magenta,
    Cyan,
    Gray,
    DarkGray,
    LightRed,
    LightGreen,
    LightYellow,
    LightBlue,
    LightMagenta,
    LightCyan,
    White,
};

/// @brief Text attribute bit flags.
enum Attr : unsigned
{
    Plain = 0,
    Bold = 1U << 0U,
};

struct Style
{
    Color fg{Color::Default};
    Color bg{Color::Default};
    unsigned attrs{Plain};

    bool operator==(const Style &other) const
    {
        return fg == other.fg && bg == other.bg && attrs == other.attrs;
    }

    bool operator!=(const Style &other) const
    {
        return !(*this == other);
    }
};

/// @brief Fixed style for each span role.
Style styleFor(Role role);

/// @brief SGR parameter for @p color as foreground or background, 0 for Default.
int sgrCode(Color color, bool background);

/// @brief Streams a RenderedView line by line, padding to the viewport width.
class AnsiWriter
{
  public:
    AnsiWriter(term::TermIO &tio, bool color);

    /// @brief Write every line of @p view followed by a newline, then flush.
    void draw(const RenderedView &view, Viewport viewport);

  private:
    void setStyle(Style style);

    term::TermIO &tio_;
    bool color_;
    Style currentStyle_{};
};

} // namespace keyview::render
