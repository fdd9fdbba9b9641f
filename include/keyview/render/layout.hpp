// include/keyview/render/layout.hpp
// @brief Pack resolved keybindings into a bounded text view.
// @invariant Output never exceeds the viewport; equal inputs give equal output.
// @ownership Pure functions; inputs are borrowed.
#pragma once

#include "keyview/config/config.hpp"
#include "keyview/render/view.hpp"
#include "keyview/resolve/resolver.hpp"

#include <string>
#include <vector>

namespace keyview::render
{

/// @brief Glyphs and separators used by the layouts.
struct LayoutOptions
{
    std::string separator{"  "};
    std::string arrow{"\xE2\x86\x92"};    // →
    std::string ellipsis{"\xE2\x80\xA6"}; // …

    static LayoutOptions from(const config::ViewOptions &view);
};

/// @brief Format one entry as "<trigger> <arrow> <action>".
Line formatEntry(const resolve::ActiveEntry &entry, const LayoutOptions &opts);

/// @brief Compact layout: entries packed left to right, wrapped at the width.
/// @details When the entries do not fit in the height, the lowest-priority
///          entries are dropped until the rest fit in height - 1 lines and a
///          "+N more" line is appended. Global entries rank below mode
///          entries; later entries rank below earlier ones.
RenderedView render(const resolve::ActiveSet &active,
                    Viewport viewport,
                    const LayoutOptions &opts = {});

/// @brief Table layout: sections side by side with aligned, grouped rows.
RenderedView renderTable(const std::vector<resolve::Section> &sections,
                         Viewport viewport,
                         const LayoutOptions &opts = {});

} // namespace keyview::render
