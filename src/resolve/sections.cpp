//===----------------------------------------------------------------------===//
//
// Part of the Keyview project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/resolve/sections.cpp
// Purpose: Group an active set into the current mode's own bindings and the
//          bindings it shares with Global or with other modes.
// Key invariants: Every input entry lands in exactly one section.
// Ownership/Lifetime: Sections own copies of their entries.
//
//===----------------------------------------------------------------------===//

#include "keyview/resolve/resolver.hpp"
#include "keyview/util/strings.hpp"

#include <algorithm>
#include <cctype>

namespace keyview::resolve
{

namespace
{
/// @brief Label a mode finally assigns to @p kt, or nullptr when unbound.
const std::string *effectiveAction(const config::Mode &mode, const input::KeyTrigger &kt)
{
    const std::string *found = nullptr;
    for (const auto &b : mode.bindings)
    {
        if (b.trigger == kt)
        {
            found = &b.action;
        }
    }
    return found;
}

unsigned repeatCount(const config::Configuration &cfg,
                     const std::string &current,
                     const ActiveEntry &entry)
{
    unsigned count = 0;
    for (const auto &m : cfg.modes())
    {
        if (m.name == current)
        {
            continue;
        }
        const std::string *action = effectiveAction(m, entry.trigger);
        if (action && *action == entry.action)
        {
            ++count;
        }
    }
    return count;
}

std::string titleFor(std::string name)
{
    if (!name.empty())
    {
        name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));
    }
    return name;
}

void sortByAction(ActiveSet &entries)
{
    std::stable_sort(entries.begin(),
                     entries.end(),
                     [](const ActiveEntry &a, const ActiveEntry &b)
                     {
                         if (a.action != b.action)
                         {
                             return a.action < b.action;
                         }
                         return a.trigger < b.trigger;
                     });
}
} // namespace

std::vector<Section> partition(const config::Configuration &cfg,
                               std::string_view mode,
                               const ActiveSet &active)
{
    const std::string current = util::toLower(mode);
    Section own{titleFor(current), {}};
    Section shared{"Shared", {}};

    for (const auto &entry : active)
    {
        const bool isShared = entry.origin == Origin::Global ||
                              repeatCount(cfg, current, entry) >= cfg.view.shared_threshold;
        (isShared ? shared : own).entries.push_back(entry);
    }

    sortByAction(own.entries);
    sortByAction(shared.entries);

    std::vector<Section> out;
    out.push_back(std::move(own));
    out.push_back(std::move(shared));
    return out;
}

} // namespace keyview::resolve
