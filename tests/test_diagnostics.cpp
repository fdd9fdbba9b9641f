// tests/test_diagnostics.cpp
// @brief Verify diagnostic counting, Expected and diagnostic formatting.
// @invariant Printed diagnostics follow `file:line: severity: message`.
// @ownership Test owns the engine and streams.

#include "keyview/support/diagnostics.hpp"
#include "keyview/support/expected.hpp"

#include <cassert>
#include <sstream>
#include <string>

using keyview::support::Diagnostic;
using keyview::support::DiagnosticEngine;
using keyview::support::Expected;
using keyview::support::makeError;
using keyview::support::makeWarning;
using keyview::support::printDiag;
using keyview::support::Severity;

static Expected<int> half(int v)
{
    if (v % 2 != 0)
    {
        return makeError({}, "odd value");
    }
    return v / 2;
}

int main()
{
    DiagnosticEngine de;
    de.report(makeWarning({"keys.ini", 3}, "unknown view option 'foo'"));
    de.report(makeError({"keys.ini", 0}, "cannot open configuration file"));
    de.report(Diagnostic{Severity::Note, "loaded", {}});
    assert(de.warningCount() == 1);
    assert(de.errorCount() == 1);
    assert(de.diagnostics().size() == 3);

    std::ostringstream os;
    de.printAll(os);
    assert(os.str() == "keys.ini:3: warning: unknown view option 'foo'\n"
                       "keys.ini: error: cannot open configuration file\n"
                       "note: loaded\n");

    auto ok = half(8);
    assert(ok);
    assert(ok.value() == 4);
    auto err = half(3);
    assert(!err);
    assert(err.error().severity == Severity::Error);
    assert(err.error().message == "odd value");

    Expected<void> done;
    assert(done.hasValue());
    Expected<void> failed(makeError({"x", 1}, "bad"));
    assert(!failed);
    std::ostringstream one;
    printDiag(failed.error(), one);
    assert(one.str() == "x:1: error: bad\n");
    return 0;
}
