// tests/test_config.cpp
// @brief Verify the configuration loader reads bindings, modes and view options.
// @invariant Malformed lines are skipped with a warning; the rest still loads.
// @ownership Test owns configurations and diagnostic engines.

#include "keyview/config/config.hpp"

#include <cassert>
#include <initializer_list>
#include <string>

using keyview::config::Configuration;
using keyview::config::LayoutKind;
using keyview::config::layoutName;
using keyview::config::loadFromFile;
using keyview::config::parseConfig;
using keyview::input::Ctrl;
using keyview::input::KeyCode;
using keyview::input::KeyTrigger;
using keyview::support::DiagnosticEngine;

static bool hasWarning(const DiagnosticEngine &de, const std::string &needle)
{
    for (const auto &d : de.diagnostics())
    {
        if (d.message.find(needle) != std::string::npos)
        {
            return true;
        }
    }
    return false;
}

int main()
{
    // Sample configuration loads without complaint.
    DiagnosticEngine de;
    auto loaded = loadFromFile(CONFIG_INI, de);
    assert(loaded);
    assert(de.warningCount() == 0);
    const Configuration &cfg = loaded.value();

    assert(cfg.view.layout == LayoutKind::Compact);
    assert(cfg.view.separator == "  ");
    assert(cfg.view.color);
    assert(cfg.view.shared_threshold == 2);

    assert(cfg.global().size() == 2);
    assert(cfg.global()[0].trigger == KeyTrigger::character(U'q', Ctrl));
    assert(cfg.global()[0].action == "quit");
    assert(cfg.global()[0].line != 0);

    assert(cfg.modes().size() == 5);
    assert(cfg.modes()[0].name == "normal");
    assert(cfg.modes()[4].name == "locked");
    const auto *pane = cfg.findMode("PANE");
    assert(pane != nullptr);
    assert(pane->bindings.size() == 6);
    assert(pane->bindings[2].trigger == KeyTrigger::named(KeyCode::Left));
    assert(pane->bindings[2].action == "focus left");
    const auto *resize = cfg.findMode("resize");
    assert(resize != nullptr);
    assert(resize->bindings[0].trigger == KeyTrigger::character(U'=', Ctrl));
    assert(resize->bindings[1].trigger == KeyTrigger::character(U'-'));
    assert(cfg.findMode("missing") == nullptr);

    // Bad values are reported and leave the defaults in place.
    DiagnosticEngine bad;
    auto loadedBad = loadFromFile(CONFIG_BAD_INI, bad);
    assert(loadedBad);
    assert(bad.errorCount() == 0);
    assert(bad.warningCount() == 9);
    assert(bad.diagnostics()[0].loc.file == CONFIG_BAD_INI);
    assert(bad.diagnostics()[0].loc.line == 1);
    assert(hasWarning(bad, "entry outside of any section"));
    assert(hasWarning(bad, "'Hyper' is not a modifier"));
    assert(hasWarning(bad, "missing key after '+'"));
    assert(hasWarning(bad, "binding for 'Ctrl+w' has no action"));
    assert(hasWarning(bad, "expected '<key> = <value>'"));
    assert(hasWarning(bad, "unknown layout 'sideways'"));
    assert(hasWarning(bad, "invalid boolean 'maybe'"));
    assert(hasWarning(bad, "invalid number 'lots'"));
    assert(hasWarning(bad, "unknown section 'keymap.editor'"));
    const Configuration &cfgBad = loadedBad.value();
    assert(cfgBad.global().size() == 1);
    assert(cfgBad.view.layout == LayoutKind::Compact);
    assert(cfgBad.view.color);
    assert(cfgBad.view.shared_threshold == 2);
    assert(cfgBad.view.arrow == "->");
    assert(cfgBad.modes().size() == 1);
    assert(cfgBad.findMode("pane")->bindings.size() == 2);

    // Missing files are an error, not a warning.
    DiagnosticEngine none;
    auto missing = loadFromFile("/nonexistent/keyview/keys.ini", none);
    assert(!missing);
    assert(missing.error().message == "cannot open configuration file");
    assert(missing.error().loc.file == "/nonexistent/keyview/keys.ini");

    // In-memory documents: separators, quoting and reserved names.
    DiagnosticEngine mem;
    const Configuration doc = parseConfig("[view]\n"
                                          "layout = TABLE\n"
                                          "arrow = \" -> \"\n"
                                          "colour = off\n"
                                          "shared_threshold = 3\n"
                                          "[mode.global]\n"
                                          "x = from mode.global\n"
                                          "[mode.]\n"
                                          "y = lost\n"
                                          "[Mode.Edit]\n"
                                          "= = equals\n"
                                          "a=b\n",
                                          mem,
                                          "inline");
    assert(doc.view.layout == LayoutKind::Table);
    assert(std::string(layoutName(doc.view.layout)) == "table");
    assert(doc.view.arrow == " -> ");
    assert(!doc.view.color);
    assert(doc.view.shared_threshold == 3);
    assert(doc.global().size() == 1);
    assert(doc.global()[0].action == "from mode.global");
    assert(doc.modes().size() == 1);
    const auto *edit = doc.findMode("edit");
    assert(edit != nullptr);
    assert(edit->bindings.size() == 2);
    assert(edit->bindings[0].trigger == KeyTrigger::character(U'='));
    assert(edit->bindings[0].action == "equals");
    assert(edit->bindings[1].trigger == KeyTrigger::character(U'a'));
    assert(edit->bindings[1].action == "b");
    assert(mem.warningCount() == 2);
    assert(hasWarning(mem, "'global' is reserved"));
    assert(hasWarning(mem, "mode section without a name"));
    assert(mem.diagnostics()[0].loc.file == "inline");
    assert(mem.diagnostics()[0].loc.line == 6);

    // Signed or oversized thresholds are rejected and keep the default.
    for (const char *bad : {"-1", "+3", "\" 4\"", "4294967296", "99999999999999999999999"})
    {
        DiagnosticEngine thr;
        const Configuration c = parseConfig(std::string("[view]\nshared_threshold = ") + bad + "\n", thr);
        assert(c.view.shared_threshold == 2);
        assert(thr.warningCount() == 1);
        assert(hasWarning(thr, "shared_threshold"));
    }
    DiagnosticEngine thrOk;
    assert(parseConfig("[view]\nshared_threshold = 4294967295\n", thrOk).view.shared_threshold == 4294967295U);
    assert(thrOk.warningCount() == 0);

    // Programmatic construction keeps modes unique by lowercase name.
    Configuration built;
    built.bind("Normal", KeyTrigger::character(U'p', Ctrl), "pane");
    built.bind("NORMAL", KeyTrigger::character(U't', Ctrl), "tab");
    assert(built.modes().size() == 1);
    assert(built.modes()[0].bindings.size() == 2);
    return 0;
}
