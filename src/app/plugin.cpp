//===----------------------------------------------------------------------===//
//
// Part of the Keyview project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/app/plugin.cpp
// Purpose: Implement the event-driven shell that keeps the keybinding view in
//          step with the host's mode, size and configuration.
// Key invariants: Each dispatched event yields at most one presented view;
//                 a recomputation reads exactly one configuration snapshot.
// Ownership/Lifetime: Plugin borrows the ConfigStore and RenderTarget and owns
//                     the last resolved set and rendered view.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the keybinding plugin shell.
/// @details The host delivers events serially. Every event is applied and then
///          followed by a full recomputation: the current configuration
///          snapshot is taken once, the active set for the current mode is
///          resolved, the configured layout renders it for the current
///          viewport, and the render target receives the result. Nothing is
///          rendered until the host has reported a non-empty viewport.

#include "keyview/app/plugin.hpp"
#include "keyview/render/layout.hpp"

#include <utility>

namespace keyview::app
{

AnsiTarget::AnsiTarget(term::TermIO &tio, bool color) : writer_(tio, color) {}

void AnsiTarget::present(const render::RenderedView &view, render::Viewport viewport)
{
    writer_.draw(view, viewport);
}

/// @brief Construct a plugin bound to a configuration store and render target.
/// @param store Source of configuration snapshots; reloads publish into it.
/// @param target Receives every recomputed view.
Plugin::Plugin(config::ConfigStore &store, RenderTarget &target) : store_(store), target_(target) {}

/// @brief Apply one host event and recompute the view.
/// @details Mode names are kept as given; the resolver matches them without
///          regard to case. A reload publishes the new snapshot before the
///          recomputation so the view reflects it immediately.
/// @param ev Event delivered by the host.
void Plugin::dispatch(const Event &ev)
{
    if (const auto *m = std::get_if<ModeChanged>(&ev))
    {
        mode_ = m->mode;
    }
    else if (const auto *r = std::get_if<Resized>(&ev))
    {
        viewport_ = r->viewport;
        sized_ = true;
    }
    else if (const auto *c = std::get_if<ConfigReloaded>(&ev))
    {
        store_.publish(c->config);
    }
    recompute();
}

void Plugin::pushEvent(Event ev)
{
    events_.push_back(std::move(ev));
}

/// @brief Drain the event queue, dispatching in arrival order.
/// @details The queue is detached before dispatching so render targets may
///          push follow-up events; those run on the next tick.
/// @return Number of events dispatched.
std::size_t Plugin::tick()
{
    std::vector<Event> pending;
    pending.swap(events_);
    for (const auto &ev : pending)
    {
        dispatch(ev);
    }
    return pending.size();
}

void Plugin::recompute()
{
    if (!sized_ || viewport_.empty())
    {
        return;
    }
    state_ = State::Recomputing;

    const config::Snapshot cfg = store_.snapshot();
    active_ = resolve::resolve(*cfg, mode_);
    const auto opts = render::LayoutOptions::from(cfg->view);
    if (cfg->view.layout == config::LayoutKind::Table)
    {
        view_ = render::renderTable(resolve::partition(*cfg, mode_, active_), viewport_, opts);
    }
    else
    {
        view_ = render::render(active_, viewport_, opts);
    }

    state_ = State::Idle;
    target_.present(view_, viewport_);
    ++presented_;
}

} // namespace keyview::app
