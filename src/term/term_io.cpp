//===----------------------------------------------------------------------===//
//
// Part of the Keyview project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/term/term_io.cpp
// Purpose: Implement the stdout and in-memory TermIO sinks.
// Key invariants: Bytes are forwarded unmodified and in order.
// Ownership/Lifetime: RealTermIO never closes stdout.
//
//===----------------------------------------------------------------------===//

#include "keyview/term/term_io.hpp"

#include <cstdio>

namespace keyview::term
{

void RealTermIO::write(std::string_view s)
{
    if (!s.empty())
    {
        std::fwrite(s.data(), 1, s.size(), stdout);
    }
}

void RealTermIO::flush()
{
    std::fflush(stdout);
}

void StringTermIO::write(std::string_view s)
{
    buffer_.append(s.data(), s.size());
}

void StringTermIO::flush() {}

} // namespace keyview::term
