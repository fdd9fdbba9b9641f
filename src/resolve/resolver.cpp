//===----------------------------------------------------------------------===//
//
// Part of the Keyview project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/resolve/resolver.cpp
// Purpose: Resolve the active keybindings for a mode.
// Key invariants: Mode bindings override global bindings for the same trigger;
//                 output order follows first declaration.
// Ownership/Lifetime: Configuration is borrowed for the duration of a call.
//
//===----------------------------------------------------------------------===//

#include "keyview/resolve/resolver.hpp"

#include <unordered_map>

namespace keyview::resolve
{

namespace
{
class Overlay
{
  public:
    void apply(const std::vector<config::Binding> &bindings, Origin origin)
    {
        for (const auto &b : bindings)
        {
            auto it = slot_.find(b.trigger);
            if (it == slot_.end())
            {
                slot_.emplace(b.trigger, out_.size());
                out_.push_back(ActiveEntry{b.trigger, b.action, origin});
                continue;
            }
            auto &entry = out_[it->second];
            entry.action = b.action;
            entry.origin = origin;
        }
    }

    ActiveSet take()
    {
        return std::move(out_);
    }

  private:
    ActiveSet out_;
    std::unordered_map<input::KeyTrigger, std::size_t, input::KeyTriggerHash> slot_;
};
} // namespace

ActiveSet resolve(const config::Configuration &cfg, std::string_view mode)
{
    Overlay overlay;
    overlay.apply(cfg.global(), Origin::Global);
    if (const auto *m = cfg.findMode(mode))
    {
        overlay.apply(m->bindings, Origin::Mode);
    }
    return overlay.take();
}

} // namespace keyview::resolve
