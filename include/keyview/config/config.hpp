// include/keyview/config/config.hpp
// @brief Keybinding configuration model and INI-like loader.
// @invariant Modes are unique by lowercase name and keep first-declaration order.
// @ownership Configuration owns its bindings; the loader borrows the diagnostic sink.
#pragma once

#include "keyview/input/key_trigger.hpp"
#include "keyview/support/diagnostics.hpp"
#include "keyview/support/expected.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace keyview::config
{

/// @brief One key-to-action declaration.
struct Binding
{
    input::KeyTrigger trigger{};
    std::string action{};
    unsigned line{0}; ///< Source line, 0 when built in code
};

/// @brief Named input context owning its bindings in declaration order.
struct Mode
{
    std::string name{};
    std::vector<Binding> bindings{};
};

/// @brief Which renderer the view uses.
enum class LayoutKind
{
    Compact,
    Table,
};

/// @brief Presentation options read from the [view] section.
struct ViewOptions
{
    LayoutKind layout{LayoutKind::Compact};
    std::string separator{"  "};
    std::string arrow{"\xE2\x86\x92"};    // →
    std::string ellipsis{"\xE2\x80\xA6"}; // …
    bool color{true};
    unsigned shared_threshold{2};
};

/// @brief Global bindings, per-mode bindings and view options.
class Configuration
{
  public:
    /// @brief Bindings active in every mode unless overridden.
    const std::vector<Binding> &global() const
    {
        return global_;
    }

    /// @brief Modes in first-declaration order.
    const std::vector<Mode> &modes() const
    {
        return modes_;
    }

    /// @brief Case-insensitive lookup; nullptr when the mode is not declared.
    const Mode *findMode(std::string_view name) const;

    /// @brief Return the mode named @p name, declaring it when absent.
    Mode &addMode(std::string_view name);

    void bindGlobal(const input::KeyTrigger &kt, std::string action, unsigned line = 0);

    void bind(std::string_view mode, const input::KeyTrigger &kt, std::string action, unsigned line = 0);

    ViewOptions view{};

  private:
    std::vector<Binding> global_{};
    std::vector<Mode> modes_{};
};

/// @brief Parse configuration text.
/// @param text Whole configuration document.
/// @param diags Receives a warning for every skipped line.
/// @param origin Name used in diagnostic locations.
Configuration parseConfig(std::string_view text,
                          support::DiagnosticEngine &diags,
                          std::string_view origin = "<memory>");

/// @brief Read and parse the configuration file at @p path.
/// @return Parsed configuration, or an error when the file cannot be read.
support::Expected<Configuration> loadFromFile(const std::string &path,
                                              support::DiagnosticEngine &diags);

/// @brief Lowercase layout name, "compact" or "table".
const char *layoutName(LayoutKind kind);

} // namespace keyview::config
