// tests/test_layout_table.cpp
// @brief Verify the table layout: side-by-side sections, grouping markers,
//        column alignment, elision and the stacked fallback.
// @invariant Side-by-side lines span the full width and end in a border.
// @ownership Test owns sections and rendered views.

#include "keyview/render/layout.hpp"

#include <cassert>
#include <string>
#include <vector>

using keyview::input::Ctrl;
using keyview::input::KeyCode;
using keyview::input::KeyTrigger;
using keyview::render::RenderedView;
using keyview::render::renderTable;
using keyview::render::Role;
using keyview::render::Viewport;
using keyview::resolve::ActiveEntry;
using keyview::resolve::Origin;
using keyview::resolve::Section;

static const std::string kBar = "\xE2\x94\x82"; // │

static std::vector<Section> sample()
{
    Section pane{"Pane", {}};
    pane.entries.push_back(ActiveEntry{KeyTrigger::named(KeyCode::Left), "focus", Origin::Mode});
    pane.entries.push_back(ActiveEntry{KeyTrigger::character(U'n', Ctrl), "new", Origin::Mode});
    pane.entries.push_back(ActiveEntry{KeyTrigger::character(U'p', Ctrl), "new", Origin::Mode});
    Section shared{"Shared", {}};
    shared.entries.push_back(ActiveEntry{KeyTrigger::character(U'q', Ctrl), "quit", Origin::Global});
    return {pane, shared};
}

static std::string spaces(int n)
{
    return std::string(static_cast<std::size_t>(n), ' ');
}

int main()
{
    const auto sections = sample();
    const RenderedView view = renderTable(sections, Viewport{40, 6});
    assert(view.lines.size() == 4);
    for (const auto &line : view.lines)
    {
        assert(line.width() == 40);
    }
    const auto text = view.text();
    assert(text[0] == "Pane" + spaces(15) + kBar + "Shared" + spaces(13) + kBar);
    // Rows: modifiers, joiner, key, group marker, action; one space apart.
    assert(text[1] == "       Left \xE2\x94\x81 focus" + kBar + "Ctrl + q \xE2\x94\x81 quit" + spaces(4) + kBar);
    assert(text[2] == "Ctrl + n    \xE2\x94\xB3 new" + spaces(2) + kBar + spaces(19) + kBar);
    assert(text[3] == "Ctrl + p    \xE2\x94\x9B " + spaces(5) + kBar + spaces(19) + kBar);

    // Titles, repeated modifiers and markers carry their roles.
    assert(view.lines[0].spans[0].role == Role::Title);
    assert(view.lines[2].spans[0].text == "Ctrl");
    assert(view.lines[2].spans[0].role == Role::Key);
    assert(view.lines[3].spans[0].text == "Ctrl");
    assert(view.lines[3].spans[0].role == Role::Muted);
    bool sawMarker = false;
    for (const auto &span : view.lines[2].spans)
    {
        if (span.role == Role::Marker)
        {
            sawMarker = true;
            assert(span.text == "\xE2\x94\xB3");
        }
    }
    assert(sawMarker);

    // Words a label shares with the row above are muted; the rest stays bright.
    Section focus{"Pane", {}};
    focus.entries.push_back(ActiveEntry{KeyTrigger::character(U'h', Ctrl), "focus left", Origin::Mode});
    focus.entries.push_back(ActiveEntry{KeyTrigger::character(U'l', Ctrl), "focus right", Origin::Mode});
    focus.entries.push_back(ActiveEntry{KeyTrigger::character(U'x', Ctrl), "NewPane: Right", Origin::Mode});
    focus.entries.push_back(ActiveEntry{KeyTrigger::character(U'y', Ctrl), "NewPane: Down", Origin::Mode});
    const RenderedView dimmed = renderTable({focus}, Viewport{40, 5});
    assert(dimmed.lines.size() == 5);
    assert(dimmed.text()[2] == "Ctrl + l \xE2\x94\x81 focus right" + spaces(17) + kBar);
    auto roleOf = [](const keyview::render::Line &line, const std::string &text)
    {
        for (const auto &span : line.spans)
        {
            if (span.text == text)
            {
                return span.role;
            }
        }
        assert(false && "span not found");
        return Role::Normal;
    };
    assert(roleOf(dimmed.lines[1], "focus left") == Role::Action);
    assert(roleOf(dimmed.lines[2], "focus ") == Role::Muted);
    assert(roleOf(dimmed.lines[2], "right") == Role::Action);
    assert(roleOf(dimmed.lines[3], "NewPane: Right") == Role::Action);
    assert(roleOf(dimmed.lines[4], "NewPane: ") == Role::Muted);
    assert(roleOf(dimmed.lines[4], "Down") == Role::Action);

    // Modifier and joiner columns disappear when no row uses them.
    Section bare{"Keys", {}};
    bare.entries.push_back(ActiveEntry{KeyTrigger::named(KeyCode::Enter), "go", Origin::Mode});
    const RenderedView one = renderTable({bare}, Viewport{20, 3});
    assert(one.lines.size() == 2);
    assert(one.text()[1] == "Enter \xE2\x94\x81 go" + spaces(9) + kBar);

    // Rows beyond the height are summarised.
    Section many{"Many", {}};
    for (int i = 0; i < 5; ++i)
    {
        many.entries.push_back(
            ActiveEntry{KeyTrigger::character(U'a' + i, Ctrl), "a" + std::to_string(i), Origin::Mode});
    }
    const RenderedView cut = renderTable({many}, Viewport{30, 3});
    assert(cut.lines.size() == 3);
    assert(cut.text()[2] == "+4 more" + spaces(22) + kBar);

    // Narrow viewports stack the sections and split the height.
    const RenderedView stacked = renderTable(sections, Viewport{3, 6});
    assert(stacked.lines.size() == 5);
    assert(stacked.text()[0] == "Pa\xE2\x80\xA6");
    for (const auto &line : stacked.lines)
    {
        assert(line.width() <= 3);
        assert(line.text().find(kBar) == std::string::npos);
    }

    // Nothing to draw.
    assert(renderTable(sections, Viewport{0, 5}).lines.empty());
    assert(renderTable({}, Viewport{40, 5}).lines.empty());

    // Bounds and determinism.
    for (int w = 1; w <= 50; ++w)
    {
        for (int h = 1; h <= 7; ++h)
        {
            const Viewport vp{w, h};
            const RenderedView a = renderTable(sections, vp);
            assert(static_cast<int>(a.lines.size()) <= h);
            for (const auto &line : a.lines)
            {
                assert(line.width() <= w);
            }
            assert(a == renderTable(sections, vp));
        }
    }
    return 0;
}
