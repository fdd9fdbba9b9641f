// include/keyview/app/plugin.hpp
// @brief Host-facing shell: consumes mode, resize and reload events and
//        presents a fresh view after each one.
// @invariant dispatch() processes one event to completion before returning;
//            the host only ever observes the Idle state.
// @ownership Plugin borrows the config store and render target.
#pragma once

#include "keyview/config/store.hpp"
#include "keyview/render/ansi_writer.hpp"
#include "keyview/render/view.hpp"
#include "keyview/resolve/resolver.hpp"

#include <string>
#include <variant>
#include <vector>

namespace keyview::term
{
class TermIO;
}

namespace keyview::app
{

/// @brief The multiplexer switched input mode.
struct ModeChanged
{
    std::string mode;
};

/// @brief The display area changed size.
struct Resized
{
    render::Viewport viewport;
};

/// @brief A new configuration snapshot replaces the current one.
struct ConfigReloaded
{
    config::Snapshot config;
};

using Event = std::variant<ModeChanged, Resized, ConfigReloaded>;

/// @brief Destination for each recomputed view.
class RenderTarget
{
  public:
    virtual ~RenderTarget() = default;

    virtual void present(const render::RenderedView &view, render::Viewport viewport) = 0;
};

/// @brief RenderTarget that streams views through an AnsiWriter.
class AnsiTarget final : public RenderTarget
{
  public:
    AnsiTarget(term::TermIO &tio, bool color);

    void present(const render::RenderedView &view, render::Viewport viewport) override;

  private:
    render::AnsiWriter writer_;
};

/// @brief Keybinding view driven by host events.
class Plugin
{
  public:
    enum class State
    {
        Idle,
        Recomputing,
    };

    Plugin(config::ConfigStore &store, RenderTarget &target);

    /// @brief Apply @p ev, then re-resolve, re-render and present.
    void dispatch(const Event &ev);

    /// @brief Queue an event for processing on the next tick().
    void pushEvent(Event ev);

    /// @brief Dispatch queued events in arrival order.
    /// @return Number of events processed.
    std::size_t tick();

    [[nodiscard]] const render::RenderedView &view() const
    {
        return view_;
    }

    [[nodiscard]] const resolve::ActiveSet &active() const
    {
        return active_;
    }

    [[nodiscard]] const std::string &mode() const
    {
        return mode_;
    }

    [[nodiscard]] render::Viewport viewport() const
    {
        return viewport_;
    }

    [[nodiscard]] State state() const
    {
        return state_;
    }

    /// @brief Number of views handed to the render target.
    [[nodiscard]] std::size_t presentCount() const
    {
        return presented_;
    }

  private:
    void recompute();

    config::ConfigStore &store_;
    RenderTarget &target_;
    std::vector<Event> events_{};
    std::string mode_{};
    render::Viewport viewport_{};
    bool sized_{false};
    resolve::ActiveSet active_{};
    render::RenderedView view_{};
    State state_{State::Idle};
    std::size_t presented_{0};
};

} // namespace keyview::app
