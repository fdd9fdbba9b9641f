//===----------------------------------------------------------------------===//
//
// Part of the Keyview project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: include/keyview/support/diagnostics.hpp
// Purpose: Declares the diagnostic record and engine used to report
//          configuration and command-line problems.
// Key invariants: Counts reflect reported diagnostics.
// Ownership/Lifetime: Engine owns collected diagnostics.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace keyview::support
{

/// @brief Severity levels for diagnostics.
enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief Location of a diagnostic inside a named input.
/// @details A zero line means the location is unknown; an empty file means
///          the diagnostic is not tied to an input at all.
struct SourceLoc
{
    std::string file;  ///< Input name or path
    unsigned line = 0; ///< 1-based line number

    [[nodiscard]] bool isValid() const
    {
        return !file.empty();
    }
};

/// @brief Single diagnostic message with location.
struct Diagnostic
{
    Severity severity;   ///< Message severity
    std::string message; ///< Human-readable text
    SourceLoc loc;       ///< Optional source location
};

/// @brief Collects diagnostics and prints them in order.
class DiagnosticEngine
{
  public:
    /// @brief Record diagnostic @p d.
    void report(Diagnostic d);

    /// @brief Print all recorded diagnostics to stream @p os.
    void printAll(std::ostream &os) const;

    /// @brief Number of errors reported.
    size_t errorCount() const;

    /// @brief Number of warnings reported.
    size_t warningCount() const;

    /// @brief Recorded diagnostics in report order.
    const std::vector<Diagnostic> &diagnostics() const
    {
        return diags_;
    }

  private:
    std::vector<Diagnostic> diags_;
    size_t errors_ = 0;
    size_t warnings_ = 0;
};

} // namespace keyview::support
