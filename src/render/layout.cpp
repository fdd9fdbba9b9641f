//===----------------------------------------------------------------------===//
//
// Part of the Keyview project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/render/layout.cpp
// Purpose: Compact layout that packs "<key> → <action>" entries into as few
//          lines as the viewport width allows.
// Key invariants: Line count <= viewport height and line width <= viewport
//                 width for every input; elision is deterministic.
// Ownership/Lifetime: Pure; no state survives a call.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the compact keybinding layout.
/// @details Entries are first clipped to the viewport width individually and
///          then packed greedily, joined by the configured separator. When the
///          packed lines outgrow the viewport height, entries are removed one
///          at a time in priority order and the remainder is repacked until it
///          leaves room for a trailing "+N more" line.

#include "keyview/render/layout.hpp"
#include "keyview/util/unicode.hpp"

namespace keyview::render
{

namespace
{
std::vector<Line> pack(const std::vector<Line> &cells,
                       const std::vector<bool> &dropped,
                       int width,
                       const std::string &separator)
{
    const int sepWidth = util::display_width(separator);
    std::vector<Line> out;
    Line cur;
    int curWidth = 0;
    bool open = false;
    for (std::size_t i = 0; i < cells.size(); ++i)
    {
        if (dropped[i])
        {
            continue;
        }
        const int w = cells[i].width();
        if (open && curWidth + sepWidth + w <= width)
        {
            cur.append(separator, Role::Muted);
            cur.append(cells[i]);
            curWidth += sepWidth + w;
            continue;
        }
        if (open)
        {
            out.push_back(std::move(cur));
        }
        cur = cells[i];
        curWidth = w;
        open = true;
    }
    if (open)
    {
        out.push_back(std::move(cur));
    }
    return out;
}

/// @brief Indices of @p active from lowest to highest priority.
std::vector<std::size_t> dropOrder(const resolve::ActiveSet &active)
{
    std::vector<std::size_t> order;
    order.reserve(active.size());
    for (const auto origin : {resolve::Origin::Global, resolve::Origin::Mode})
    {
        for (std::size_t i = active.size(); i-- > 0;)
        {
            if (active[i].origin == origin)
            {
                order.push_back(i);
            }
        }
    }
    return order;
}

Line summaryLine(std::size_t elided, int width, const std::string &ellipsis)
{
    Line line;
    line.append("+" + std::to_string(elided) + " more", Role::Muted);
    return truncateLine(line, width, ellipsis);
}
} // namespace

LayoutOptions LayoutOptions::from(const config::ViewOptions &view)
{
    LayoutOptions opts;
    opts.separator = view.separator;
    opts.arrow = view.arrow;
    opts.ellipsis = view.ellipsis;
    return opts;
}

Line formatEntry(const resolve::ActiveEntry &entry, const LayoutOptions &opts)
{
    Line line;
    line.append(input::displayTrigger(entry.trigger), Role::Key);
    line.append(" " + opts.arrow + " ", Role::Muted);
    line.append(entry.action, Role::Action);
    return line;
}

RenderedView render(const resolve::ActiveSet &active, Viewport viewport, const LayoutOptions &opts)
{
    RenderedView view;
    if (viewport.empty() || active.empty())
    {
        return view;
    }

    std::vector<Line> cells;
    cells.reserve(active.size());
    for (const auto &entry : active)
    {
        cells.push_back(truncateLine(formatEntry(entry, opts), viewport.width, opts.ellipsis));
    }

    std::vector<bool> dropped(cells.size(), false);
    view.lines = pack(cells, dropped, viewport.width, opts.separator);
    if (static_cast<int>(view.lines.size()) <= viewport.height)
    {
        return view;
    }

    const auto room = static_cast<std::size_t>(viewport.height - 1);
    std::size_t elided = 0;
    for (const std::size_t idx : dropOrder(active))
    {
        dropped[idx] = true;
        ++elided;
        view.lines = pack(cells, dropped, viewport.width, opts.separator);
        if (view.lines.size() <= room)
        {
            break;
        }
    }
    view.lines.push_back(summaryLine(elided, viewport.width, opts.ellipsis));
    return view;
}

} // namespace keyview::render
