//===----------------------------------------------------------------------===//
//
// Part of the Keyview project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: apps/arg_queue.hpp
// Purpose: Consume command-line arguments front to back while parsing options.
// Key invariants: Each argument is handed out at most once, in order.
// Ownership/Lifetime: Borrows argv; the caller keeps it alive while parsing.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>

namespace keyview::apps
{

/// @brief Front-consuming queue over argv, skipping the program name.
class ArgQueue
{
  public:
    ArgQueue(int argc, char **argv) : argv_(argv), end_(argv ? argc : 0), next_(1) {}

    [[nodiscard]] bool done() const
    {
        return next_ >= end_;
    }

    /// @brief Remove and return the next argument; empty when done().
    std::string take()
    {
        return done() ? std::string() : std::string(argv_[next_++]);
    }

    /// @brief Take the value following an option into @p out.
    /// @return False when no argument is left.
    bool takeValue(std::string &out)
    {
        if (done())
        {
            return false;
        }
        out = take();
        return true;
    }

  private:
    char **argv_;
    int end_;
    int next_;
};

} // namespace keyview::apps
