//===----------------------------------------------------------------------===//
//
// Part of the Keyview project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/render/view.cpp
// Purpose: Span-aware measurement, clipping and padding of display lines.
// Key invariants: truncateLine never returns a line wider than requested.
// Ownership/Lifetime: Value semantics throughout.
//
//===----------------------------------------------------------------------===//

#include "keyview/render/view.hpp"
#include "keyview/util/unicode.hpp"

namespace keyview::render
{

void Line::append(std::string text, Role role)
{
    if (text.empty())
    {
        return;
    }
    spans.push_back(Span{std::move(text), role});
}

void Line::append(const Line &other)
{
    for (const auto &span : other.spans)
    {
        append(span.text, span.role);
    }
}

std::string Line::text() const
{
    std::string out;
    for (const auto &span : spans)
    {
        out += span.text;
    }
    return out;
}

int Line::width() const
{
    int w = 0;
    for (const auto &span : spans)
    {
        w += util::display_width(span.text);
    }
    return w;
}

std::vector<std::string> RenderedView::text() const
{
    std::vector<std::string> out;
    out.reserve(lines.size());
    for (const auto &line : lines)
    {
        out.push_back(line.text());
    }
    return out;
}

Line truncateLine(const Line &line, int width, std::string_view ellipsis)
{
    if (line.width() <= width)
    {
        return line;
    }
    Line out;
    if (width <= 0)
    {
        return out;
    }
    const int ew = util::display_width(ellipsis);
    if (ew > width)
    {
        const Role role = line.spans.empty() ? Role::Normal : line.spans.front().role;
        out.append(util::truncate_to_width(ellipsis, width, {}), role);
        return out;
    }

    const int budget = width - ew;
    int used = 0;
    for (const auto &span : line.spans)
    {
        const int sw = util::display_width(span.text);
        if (used + sw <= budget)
        {
            out.append(span.text, span.role);
            used += sw;
            continue;
        }
        out.append(util::truncate_to_width(span.text, budget - used, {}), span.role);
        out.append(std::string(ellipsis), span.role);
        break;
    }
    return out;
}

void padLine(Line &line, int width)
{
    const int w = line.width();
    if (w < width)
    {
        line.append(std::string(static_cast<std::size_t>(width - w), ' '), Role::Normal);
    }
}

} // namespace keyview::render
