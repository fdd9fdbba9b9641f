// tests/test_term_io.cpp
// @brief Verify StringTermIO buffering and RealTermIO pass-through.
// @invariant StringTermIO buffer matches written content until cleared.
// @ownership Test owns TermIO instances.

#include "keyview/term/term_io.hpp"

#include <cassert>

using keyview::term::RealTermIO;
using keyview::term::StringTermIO;
using keyview::term::TermIO;

int main()
{
    StringTermIO tio;
    TermIO &sink = tio;
    sink.write("abc");
    sink.write("");
    sink.write("\x1b[0m");
    sink.flush();
    assert(tio.buffer() == "abc\x1b[0m");
    tio.clear();
    assert(tio.buffer().empty());

    RealTermIO out;
    out.write("");
    out.flush();
    return 0;
}
