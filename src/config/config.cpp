//===----------------------------------------------------------------------===//
//
// Part of the Keyview project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/config/config.cpp
// Purpose: INI-like keybinding configuration loader.
// Key invariants: Reads sections [global], [mode.<name>] and [view]; each
//                 skipped line or unknown section produces one warning.
// Ownership/Lifetime: Loader does not own external resources beyond the
//                     stream it opens for the duration of loadFromFile.
//
//===----------------------------------------------------------------------===//

#include "keyview/config/config.hpp"
#include "keyview/util/strings.hpp"

#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace keyview::config
{

namespace
{
constexpr std::string_view kModePrefix = "mode.";

enum class Section
{
    None,
    Global,
    Mode,
    View,
    Unknown,
};

/// @brief Strip one pair of surrounding double quotes, keeping inner whitespace.
std::string unquote(const std::string &value)
{
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
    {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

bool parse_bool(const std::string &s, bool &out)
{
    const std::string lower = util::toLower(s);
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on")
    {
        out = true;
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off")
    {
        out = false;
        return true;
    }
    return false;
}

/// @brief Position of the '=' separating key from value, or npos.
/// @details An '=' with whitespace on both sides wins so that triggers such
///          as "Ctrl+=" can be bound; otherwise the first '=' after the first
///          character is used, which lets a lone "=" key be bound too.
std::size_t findSeparator(const std::string &line)
{
    for (std::size_t i = 1; i + 1 < line.size(); ++i)
    {
        if (line[i] == '=' && std::isspace(static_cast<unsigned char>(line[i - 1])) &&
            std::isspace(static_cast<unsigned char>(line[i + 1])))
        {
            return i;
        }
    }
    return line.find('=', 1);
}

class Parser
{
  public:
    Parser(Configuration &out, support::DiagnosticEngine &diags, std::string_view origin)
        : out_(out), diags_(diags), origin_(origin)
    {
    }

    void parseLine(const std::string &raw, unsigned lineNo)
    {
        line_ = lineNo;
        const std::string trimmed = util::trim(raw);
        if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';')
        {
            return;
        }
        if (trimmed.front() == '[' && trimmed.back() == ']')
        {
            enterSection(util::toLower(util::trim(trimmed.substr(1, trimmed.size() - 2))));
            return;
        }

        const auto eq = findSeparator(trimmed);
        if (eq == std::string::npos)
        {
            warn("expected '<key> = <value>'");
            return;
        }
        const std::string key = util::trim(trimmed.substr(0, eq));
        const std::string value = unquote(util::trim(trimmed.substr(eq + 1)));

        switch (section_)
        {
            case Section::None:
                warn("entry outside of any section");
                break;
            case Section::Unknown:
                // Already reported when the section header was read.
                break;
            case Section::View:
                parseView(util::toLower(key), value);
                break;
            case Section::Global:
            case Section::Mode:
                parseBinding(key, value);
                break;
        }
    }

  private:
    void warn(std::string msg)
    {
        diags_.report(support::makeWarning({std::string(origin_), line_}, std::move(msg)));
    }

    void enterSection(const std::string &name)
    {
        mode_.clear();
        if (name == "global")
        {
            section_ = Section::Global;
            return;
        }
        if (name == "view")
        {
            section_ = Section::View;
            return;
        }
        if (name.compare(0, kModePrefix.size(), kModePrefix) == 0)
        {
            std::string mode = util::trim(name.substr(kModePrefix.size()));
            if (mode.empty())
            {
                warn("mode section without a name");
                section_ = Section::Unknown;
                return;
            }
            if (mode == "global")
            {
                warn("'global' is reserved; reading [mode.global] as [global]");
                section_ = Section::Global;
                return;
            }
            section_ = Section::Mode;
            mode_ = std::move(mode);
            out_.addMode(mode_);
            return;
        }
        warn("unknown section '" + name + "'");
        section_ = Section::Unknown;
    }

    void parseBinding(const std::string &key, const std::string &value)
    {
        auto trigger = input::parseTrigger(key);
        if (!trigger)
        {
            warn(trigger.error().message);
            return;
        }
        if (value.empty())
        {
            warn("binding for '" + input::displayTrigger(trigger.value()) + "' has no action");
            return;
        }
        if (section_ == Section::Global)
        {
            out_.bindGlobal(trigger.value(), value, line_);
        }
        else
        {
            out_.bind(mode_, trigger.value(), value, line_);
        }
    }

    void parseView(const std::string &key, const std::string &value)
    {
        ViewOptions &view = out_.view;
        if (key == "layout")
        {
            const std::string lower = util::toLower(value);
            if (lower == "compact")
                view.layout = LayoutKind::Compact;
            else if (lower == "table")
                view.layout = LayoutKind::Table;
            else
                warn("unknown layout '" + value + "'");
        }
        else if (key == "separator")
        {
            view.separator = value;
        }
        else if (key == "arrow")
        {
            view.arrow = value;
        }
        else if (key == "ellipsis")
        {
            view.ellipsis = value;
        }
        else if (key == "color" || key == "colour")
        {
            if (!parse_bool(value, view.color))
            {
                warn("invalid boolean '" + value + "' for " + key);
            }
        }
        else if (key == "shared_threshold")
        {
            // Plain decimal digits only.
            if (value.empty() || !std::isdigit(static_cast<unsigned char>(value.front())))
            {
                warn("invalid number '" + value + "' for shared_threshold");
                return;
            }
            try
            {
                std::size_t parsed = 0;
                const unsigned long n = std::stoul(value, &parsed);
                if (parsed != value.size())
                {
                    warn("invalid number '" + value + "' for shared_threshold");
                    return;
                }
                if (n > std::numeric_limits<unsigned>::max())
                {
                    warn("number '" + value + "' out of range for shared_threshold");
                    return;
                }
                view.shared_threshold = static_cast<unsigned>(n);
            }
            catch (const std::invalid_argument &)
            {
                warn("invalid number '" + value + "' for shared_threshold");
            }
            catch (const std::out_of_range &)
            {
                warn("number '" + value + "' out of range for shared_threshold");
            }
        }
        else
        {
            warn("unknown view option '" + key + "'");
        }
    }

    Configuration &out_;
    support::DiagnosticEngine &diags_;
    std::string_view origin_;
    Section section_{Section::None};
    std::string mode_{};
    unsigned line_{0};
};
} // namespace

const Mode *Configuration::findMode(std::string_view name) const
{
    const std::string lower = util::toLower(name);
    for (const auto &m : modes_)
    {
        if (m.name == lower)
        {
            return &m;
        }
    }
    return nullptr;
}

Mode &Configuration::addMode(std::string_view name)
{
    std::string lower = util::toLower(name);
    for (auto &m : modes_)
    {
        if (m.name == lower)
        {
            return m;
        }
    }
    modes_.push_back(Mode{std::move(lower), {}});
    return modes_.back();
}

void Configuration::bindGlobal(const input::KeyTrigger &kt, std::string action, unsigned line)
{
    global_.push_back(Binding{kt, std::move(action), line});
}

void Configuration::bind(std::string_view mode,
                         const input::KeyTrigger &kt,
                         std::string action,
                         unsigned line)
{
    addMode(mode).bindings.push_back(Binding{kt, std::move(action), line});
}

Configuration parseConfig(std::string_view text,
                          support::DiagnosticEngine &diags,
                          std::string_view origin)
{
    Configuration cfg;
    Parser parser(cfg, diags, origin);
    std::istringstream in{std::string(text)};
    std::string line;
    unsigned lineNo = 0;
    while (std::getline(in, line))
    {
        parser.parseLine(line, ++lineNo);
    }
    return cfg;
}

support::Expected<Configuration> loadFromFile(const std::string &path,
                                              support::DiagnosticEngine &diags)
{
    std::ifstream in(path);
    if (!in)
    {
        return support::makeError({path, 0}, "cannot open configuration file");
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return parseConfig(ss.str(), diags, path);
}

const char *layoutName(LayoutKind kind)
{
    switch (kind)
    {
        case LayoutKind::Compact:
            return "compact";
        case LayoutKind::Table:
            return "table";
    }
    return "compact";
}

} // namespace keyview::config
