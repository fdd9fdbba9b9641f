// include/keyview/resolve/resolver.hpp
// @brief Resolve the bindings active in a mode and group them for display.
// @invariant An ActiveSet never holds two entries with the same trigger.
// @ownership Results are owned copies; the configuration is only borrowed.
#pragma once

#include "keyview/config/config.hpp"
#include "keyview/input/key_trigger.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace keyview::resolve
{

/// @brief Where the winning label of an active entry was declared.
enum class Origin
{
    Global,
    Mode,
};

/// @brief One effective trigger-to-action pair.
struct ActiveEntry
{
    input::KeyTrigger trigger{};
    std::string action{};
    Origin origin{Origin::Global};

    bool operator==(const ActiveEntry &other) const
    {
        return trigger == other.trigger && action == other.action && origin == other.origin;
    }
};

using ActiveSet = std::vector<ActiveEntry>;

/// @brief Compute the bindings effective in @p mode.
/// @details Global bindings come first in declaration order; the mode's
///          bindings then replace entries sharing a trigger in place and
///          append new triggers. A trigger repeated within one section keeps
///          its first position and its last label. Unknown modes yield the
///          Global-only set.
ActiveSet resolve(const config::Configuration &cfg, std::string_view mode);

/// @brief Titled group of active entries.
struct Section
{
    std::string title{};
    ActiveSet entries{};
};

/// @brief Split @p active into a mode-specific section and a "Shared" section.
/// @details Global-origin entries are shared. A mode-origin entry is shared
///          when at least `cfg.view.shared_threshold` other modes bind the same
///          trigger to the same action. Entries in each section are sorted by
///          action, then trigger.
std::vector<Section> partition(const config::Configuration &cfg,
                               std::string_view mode,
                               const ActiveSet &active);

} // namespace keyview::resolve
