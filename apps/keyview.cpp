//===----------------------------------------------------------------------===//
//
// Part of the Keyview project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// Provides the standalone `keyview` host driver. The executable loads a
// keybinding configuration, stands in for the multiplexer by feeding the
// plugin shell a mode and a viewport, and prints the rendered view. With
// --events it replays host notifications read from stdin, one per line, so
// mode switches, resizes and live reloads can be exercised from a script.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the keyview command-line host driver.

#include "arg_queue.hpp"
#include "keyview/app/plugin.hpp"
#include "keyview/config/config.hpp"
#include "keyview/config/store.hpp"
#include "keyview/support/expected.hpp"
#include "keyview/term/term_io.hpp"
#include "keyview/util/strings.hpp"
#include "keyview/version.hpp"

#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace keyview::apps
{

namespace
{
constexpr const char *kUsage =
    "Usage: keyview --config FILE [--mode NAME] [--size ROWSxCOLS]\n"
    "               [--layout compact|table] [--no-color] [--events] [--list-modes]\n"
    "       keyview --version\n";

struct Options
{
    std::string configPath;
    std::string mode{"normal"};
    render::Viewport viewport{80, 24};
    std::optional<config::LayoutKind> layout;
    bool noColor{false};
    bool events{false};
    bool listModes{false};
    bool version{false};
};

/// @brief TermIO adapter that forwards frames to a caller-supplied stream.
class StreamTermIO final : public term::TermIO
{
  public:
    explicit StreamTermIO(std::ostream &os) : os_(os) {}

    void write(std::string_view s) override
    {
        os_.write(s.data(), static_cast<std::streamsize>(s.size()));
    }

    void flush() override
    {
        os_.flush();
    }

  private:
    std::ostream &os_;
};

bool parseInt(const std::string &text, int &out)
{
    try
    {
        std::size_t parsed = 0;
        const int v = std::stoi(text, &parsed);
        if (parsed != text.size() || v < 0)
        {
            return false;
        }
        out = v;
        return true;
    }
    catch (const std::invalid_argument &)
    {
        return false;
    }
    catch (const std::out_of_range &)
    {
        return false;
    }
}

/// @brief Parse "ROWSxCOLS" into a viewport.
bool parseSize(const std::string &text, render::Viewport &out)
{
    const auto x = text.find_first_of("xX");
    if (x == std::string::npos)
    {
        return false;
    }
    int rows = 0;
    int cols = 0;
    if (!parseInt(text.substr(0, x), rows) || !parseInt(text.substr(x + 1), cols))
    {
        return false;
    }
    out = render::Viewport{cols, rows};
    return true;
}

support::Expected<Options> parseArgs(ArgQueue args)
{
    Options opts;
    auto usageError = [](std::string msg) { return support::makeError({}, std::move(msg)); };
    while (!args.done())
    {
        const std::string arg = args.take();

        std::string value;
        if (arg == "--version")
        {
            opts.version = true;
        }
        else if (arg == "--config")
        {
            if (!args.takeValue(opts.configPath))
                return usageError("--config requires a file");
        }
        else if (arg == "--mode")
        {
            if (!args.takeValue(opts.mode))
                return usageError("--mode requires a name");
        }
        else if (arg == "--size")
        {
            if (!args.takeValue(value) || !parseSize(value, opts.viewport))
                return usageError("--size expects ROWSxCOLS");
        }
        else if (arg == "--layout")
        {
            if (!args.takeValue(value))
                return usageError("--layout requires compact or table");
            const std::string lower = util::toLower(value);
            if (lower == "compact")
                opts.layout = config::LayoutKind::Compact;
            else if (lower == "table")
                opts.layout = config::LayoutKind::Table;
            else
                return usageError("unknown layout '" + value + "'");
        }
        else if (arg == "--no-color")
        {
            opts.noColor = true;
        }
        else if (arg == "--events")
        {
            opts.events = true;
        }
        else if (arg == "--list-modes")
        {
            opts.listModes = true;
        }
        else
        {
            return usageError("unknown argument '" + arg + "'");
        }
    }
    if (!opts.version && opts.configPath.empty())
    {
        return usageError("missing --config");
    }
    return opts;
}

/// @brief Load the configuration file and apply command-line overrides.
/// @return Snapshot on success; nullptr after printing the failure to @p err.
config::Snapshot loadSnapshot(const Options &opts, std::ostream &err)
{
    support::DiagnosticEngine diags;
    auto loaded = config::loadFromFile(opts.configPath, diags);
    diags.printAll(err);
    if (!loaded)
    {
        support::printDiag(loaded.error(), err);
        return nullptr;
    }
    config::Configuration cfg = std::move(loaded.value());
    if (opts.layout)
    {
        cfg.view.layout = *opts.layout;
    }
    if (opts.noColor)
    {
        cfg.view.color = false;
    }
    return std::make_shared<const config::Configuration>(std::move(cfg));
}

/// @brief Replay host commands from @p in until EOF or "quit".
void replayEvents(const Options &opts, app::Plugin &plugin, std::istream &in, std::ostream &err)
{
    std::string line;
    unsigned lineNo = 0;
    while (std::getline(in, line))
    {
        ++lineNo;
        const std::string trimmed = util::trim(line);
        if (trimmed.empty() || trimmed[0] == '#')
        {
            continue;
        }
        std::istringstream words(trimmed);
        std::string command;
        words >> command;
        command = util::toLower(command);
        auto warn = [&](std::string msg)
        { support::printDiag(support::makeWarning({"<stdin>", lineNo}, std::move(msg)), err); };

        if (command == "quit")
        {
            break;
        }
        if (command == "mode")
        {
            std::string name;
            if (!(words >> name))
            {
                warn("mode requires a name");
                continue;
            }
            plugin.dispatch(app::ModeChanged{name});
        }
        else if (command == "resize")
        {
            std::string rows;
            std::string cols;
            int r = 0;
            int c = 0;
            if (!(words >> rows >> cols) || !parseInt(rows, r) || !parseInt(cols, c))
            {
                warn("resize expects <rows> <cols>");
                continue;
            }
            plugin.dispatch(app::Resized{render::Viewport{c, r}});
        }
        else if (command == "reload")
        {
            if (auto snapshot = loadSnapshot(opts, err))
            {
                plugin.dispatch(app::ConfigReloaded{std::move(snapshot)});
            }
            else
            {
                warn("reload failed; keeping the previous configuration");
            }
        }
        else
        {
            warn("unknown command '" + command + "'");
        }
    }
}
} // namespace

/// @brief Execute the keyview CLI workflow with injectable streams.
/// @param argc Argument count supplied by the caller.
/// @param argv Argument vector containing the program name and options.
/// @param in Stream supplying host commands in --events mode.
/// @param out Stream receiving rendered frames and listings.
/// @param err Stream receiving diagnostics.
/// @return Zero on success; one on usage or configuration load failure.
int runCLI(int argc, char **argv, std::istream &in, std::ostream &out, std::ostream &err)
{
    auto parsed = parseArgs(ArgQueue(argc, argv));
    if (!parsed)
    {
        support::printDiag(parsed.error(), err);
        err << kUsage;
        return 1;
    }
    const Options &opts = parsed.value();
    if (opts.version)
    {
        out << "keyview " << keyview_version() << "\n";
        return 0;
    }

    config::Snapshot snapshot = loadSnapshot(opts, err);
    if (!snapshot)
    {
        return 1;
    }
    if (opts.listModes)
    {
        for (const auto &m : snapshot->modes())
        {
            out << m.name << "\n";
        }
        return 0;
    }

    config::ConfigStore store(snapshot);
    StreamTermIO tio(out);
    app::AnsiTarget target(tio, snapshot->view.color);
    app::Plugin plugin(store, target);

    plugin.dispatch(app::ModeChanged{opts.mode});
    plugin.dispatch(app::Resized{opts.viewport});
    if (opts.events)
    {
        replayEvents(opts, plugin, in, err);
    }
    return 0;
}

} // namespace keyview::apps

#ifndef KEYVIEW_SKIP_MAIN
int main(int argc, char **argv)
{
    return keyview::apps::runCLI(argc, argv, std::cin, std::cout, std::cerr);
}
#endif
