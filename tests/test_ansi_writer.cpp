// tests/test_ansi_writer.cpp
// @brief Verify AnsiWriter colour sequences, padding and plain output.
// @invariant Colour output resets at the end of every line; plain output has
//            no escape sequences.
// @ownership AnsiWriter borrows a StringTermIO owned by the test.

#include "keyview/render/ansi_writer.hpp"
#include "keyview/term/term_io.hpp"

#include <cassert>
#include <string>

using keyview::render::AnsiWriter;
using keyview::render::Color;
using keyview::render::Line;
using keyview::render::RenderedView;
using keyview::render::Role;
using keyview::render::sgrCode;
using keyview::render::Style;
using keyview::render::styleFor;
using keyview::render::Viewport;
using keyview::term::StringTermIO;

static RenderedView sampleView()
{
    Line line;
    line.append("Ctrl+q", Role::Key);
    line.append(" \xE2\x86\x92 ", Role::Muted);
    line.append("quit", Role::Action);
    RenderedView view;
    view.lines.push_back(line);
    return view;
}

int main()
{
    assert(sgrCode(Color::Default, false) == 0);
    assert(sgrCode(Color::Red, false) == 31);
    assert(sgrCode(Color::Red, true) == 41);
    assert(sgrCode(Color::DarkGray, false) == 90);
    assert(sgrCode(Color::White, true) == 107);
    assert(styleFor(Role::Title).fg == Color::Yellow);
    assert(styleFor(Role::Title).attrs == keyview::render::Bold);
    assert(styleFor(Role::Normal) == Style{});
    assert(styleFor(Role::Key) == styleFor(Role::Action));

    StringTermIO tio;
    AnsiWriter colour(tio, true);
    colour.draw(sampleView(), Viewport{20, 1});
    assert(tio.buffer() == "\x1b[0;97mCtrl+q"
                           "\x1b[0;90m \xE2\x86\x92 "
                           "\x1b[0;97mquit"
                           "\x1b[0m       "
                           "\x1b[0m\n");

    // Style state does not leak from one line or frame to the next.
    tio.clear();
    RenderedView two;
    Line key;
    key.append("k", Role::Key);
    two.lines.push_back(key);
    two.lines.push_back(key);
    colour.draw(two, Viewport{1, 2});
    assert(tio.buffer() == "\x1b[0;97mk\x1b[0m\n\x1b[0;97mk\x1b[0m\n");

    // Titles are bold yellow.
    tio.clear();
    RenderedView titled;
    Line title;
    title.append("Pane", Role::Title);
    titled.lines.push_back(title);
    colour.draw(titled, Viewport{4, 1});
    assert(tio.buffer() == "\x1b[0;1;33mPane\x1b[0m\n");

    tio.clear();
    AnsiWriter plain(tio, false);
    plain.draw(sampleView(), Viewport{20, 1});
    assert(tio.buffer() == "Ctrl+q \xE2\x86\x92 quit       \n");
    assert(tio.buffer().find('\x1b') == std::string::npos);

    // Empty views write nothing.
    tio.clear();
    plain.draw(RenderedView{}, Viewport{20, 4});
    assert(tio.buffer().empty());
    return 0;
}
