//===----------------------------------------------------------------------===//
//
// Part of the Keyview project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/render/table.cpp
// Purpose: Table layout that shows the current mode's own bindings next to
//          the shared ones, one aligned row per binding, with rows that
//          perform the same action joined by a bracket marker.
// Key invariants: Every produced line is exactly the viewport width wide when
//                 sections sit side by side; the line count never exceeds the
//                 viewport height.
// Ownership/Lifetime: Pure; no state survives a call.
//
//===----------------------------------------------------------------------===//

#include "keyview/render/layout.hpp"
#include "keyview/util/unicode.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <utility>

namespace keyview::render
{

namespace
{
constexpr const char *kBorder = "\xE2\x94\x82";   // │
constexpr const char *kOpen = "\xE2\x94\xB3";     // ┳
constexpr const char *kContinue = "\xE2\x94\xAB"; // ┫
constexpr const char *kClose = "\xE2\x94\x9B";    // ┛
constexpr const char *kSingle = "\xE2\x94\x81";   // ━

constexpr std::size_t kColumns = 5;

using Row = std::array<Line, kColumns>;
using Widths = std::array<int, kColumns>;

const char *groupMarker(bool prevSame, bool nextSame)
{
    if (prevSame && nextSame)
        return kContinue;
    if (nextSame)
        return kOpen;
    if (prevSame)
        return kClose;
    return kSingle;
}

Line cell(std::string text, Role role)
{
    Line line;
    line.append(std::move(text), role);
    return line;
}

/// @brief Split @p label into alternating word and separator runs.
std::vector<std::string> labelTokens(const std::string &label)
{
    std::vector<std::string> tokens;
    bool prevWord = false;
    for (char ch : label)
    {
        const auto uc = static_cast<unsigned char>(ch);
        const bool word = uc >= 0x80 || std::isalnum(uc) != 0;
        if (tokens.empty() || word != prevWord)
        {
            tokens.emplace_back();
        }
        tokens.back() += ch;
        prevWord = word;
    }
    return tokens;
}

/// @brief Action cell whose leading tokens shared with @p prev are muted.
Line actionCell(const std::string &action, const std::string *prev)
{
    const auto tokens = labelTokens(action);
    std::size_t common = 0;
    if (prev)
    {
        const auto prevTokens = labelTokens(*prev);
        while (common < tokens.size() && common < prevTokens.size() &&
               tokens[common] == prevTokens[common])
        {
            ++common;
        }
    }
    std::string head;
    std::string tail;
    for (std::size_t t = 0; t < tokens.size(); ++t)
    {
        (t < common ? head : tail) += tokens[t];
    }
    Line line;
    line.append(std::move(head), Role::Muted);
    line.append(std::move(tail), Role::Action);
    return line;
}

std::vector<Row> buildRows(const resolve::ActiveSet &entries)
{
    std::vector<Row> rows;
    rows.reserve(entries.size());
    std::string prevModifiers;
    for (std::size_t i = 0; i < entries.size(); ++i)
    {
        const auto &e = entries[i];
        const auto parts = input::splitTrigger(e.trigger);
        const std::string *prevAction = i > 0 ? &entries[i - 1].action : nullptr;
        const bool prevSame = prevAction && *prevAction == e.action;
        const bool nextSame = i + 1 < entries.size() && entries[i + 1].action == e.action;
        const Role modRole = (i > 0 && prevModifiers == parts.modifiers) ? Role::Muted : Role::Key;

        rows.push_back(Row{cell(parts.modifiers, modRole),
                           cell(parts.joiner, Role::Muted),
                           cell(parts.key, Role::Key),
                           cell(groupMarker(prevSame, nextSame), Role::Marker),
                           prevSame ? Line{} : actionCell(e.action, prevAction)});
        prevModifiers = parts.modifiers;
    }
    return rows;
}

Widths columnWidths(const std::vector<Row> &rows, std::size_t count)
{
    Widths widths{};
    for (std::size_t r = 0; r < count; ++r)
    {
        for (std::size_t c = 0; c < kColumns; ++c)
        {
            widths[c] = std::max(widths[c], rows[r][c].width());
        }
    }
    return widths;
}

Line rowLine(const Row &row, const Widths &widths)
{
    Line line;
    bool first = true;
    for (std::size_t c = 0; c < kColumns; ++c)
    {
        if (widths[c] == 0)
        {
            continue;
        }
        if (!first)
        {
            line.append(" ", Role::Normal);
        }
        first = false;
        line.append(row[c]);
        const int pad = widths[c] - row[c].width();
        if (pad > 0 && c + 1 < kColumns)
        {
            line.append(std::string(static_cast<std::size_t>(pad), ' '), Role::Normal);
        }
    }
    return line;
}

class BlockBuilder
{
  public:
    BlockBuilder(int width, bool border, const LayoutOptions &opts)
        : content_(border ? width - 1 : width), border_(border), opts_(opts)
    {
    }

    void add(const Line &line)
    {
        Line out = truncateLine(line, content_, opts_.ellipsis);
        padLine(out, content_);
        if (border_)
        {
            out.append(kBorder, Role::Muted);
        }
        lines_.push_back(std::move(out));
    }

    std::vector<Line> take()
    {
        return std::move(lines_);
    }

  private:
    int content_;
    bool border_;
    const LayoutOptions &opts_;
    std::vector<Line> lines_;
};

std::vector<Line> renderBlock(const resolve::Section &section,
                              int width,
                              int height,
                              bool border,
                              const LayoutOptions &opts)
{
    if (width <= 0 || height <= 0)
    {
        return {};
    }
    BlockBuilder block(width, border, opts);

    Line title;
    title.append(section.title, Role::Title);
    block.add(title);

    const auto rows = buildRows(section.entries);
    const auto avail = static_cast<std::size_t>(height - 1);
    std::size_t shown = rows.size();
    bool elide = false;
    if (rows.size() > avail)
    {
        elide = avail > 0;
        shown = elide ? avail - 1 : 0;
    }

    const Widths widths = columnWidths(rows, shown);
    for (std::size_t r = 0; r < shown; ++r)
    {
        block.add(rowLine(rows[r], widths));
    }
    if (elide)
    {
        Line more;
        more.append("+" + std::to_string(rows.size() - shown) + " more", Role::Muted);
        block.add(more);
    }
    return block.take();
}
} // namespace

RenderedView renderTable(const std::vector<resolve::Section> &sections,
                         Viewport viewport,
                         const LayoutOptions &opts)
{
    RenderedView view;
    if (viewport.empty() || sections.empty())
    {
        return view;
    }

    const int n = static_cast<int>(sections.size());
    const int share = viewport.width / n;
    if (share >= 2)
    {
        std::vector<std::vector<Line>> blocks;
        std::vector<int> widths;
        std::size_t rows = 0;
        for (int i = 0; i < n; ++i)
        {
            const int w = (i == n - 1) ? viewport.width - share * (n - 1) : share;
            widths.push_back(w);
            blocks.push_back(renderBlock(sections[static_cast<std::size_t>(i)], w, viewport.height, true, opts));
            rows = std::max(rows, blocks.back().size());
        }
        for (std::size_t r = 0; r < rows; ++r)
        {
            Line line;
            for (std::size_t i = 0; i < blocks.size(); ++i)
            {
                if (r < blocks[i].size())
                {
                    line.append(blocks[i][r]);
                    continue;
                }
                Line blank;
                padLine(blank, widths[i] - 1);
                blank.append(kBorder, Role::Muted);
                line.append(blank);
            }
            view.lines.push_back(std::move(line));
        }
        return view;
    }

    // Too narrow for columns: stack the sections and split the height instead.
    const int slice = viewport.height / n;
    for (int i = 0; i < n; ++i)
    {
        const int h = (i == n - 1) ? viewport.height - slice * (n - 1) : slice;
        for (auto &line : renderBlock(sections[static_cast<std::size_t>(i)], viewport.width, h, false, opts))
        {
            view.lines.push_back(std::move(line));
        }
    }
    return view;
}

} // namespace keyview::render
