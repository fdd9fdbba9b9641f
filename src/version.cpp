//===----------------------------------------------------------------------===//
//
// Part of the Keyview project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/version.cpp
// Purpose: Report the library version to the host driver and embedders.
// Key invariants: Matches the project version recorded in CMake metadata.
// Ownership/Lifetime: Returns a pointer to a string literal.
//
//===----------------------------------------------------------------------===//

#include "keyview/version.hpp"

#ifndef KEYVIEW_VERSION_STR
#define KEYVIEW_VERSION_STR "0.1.0"
#endif

namespace keyview
{
/// @brief Expose the semantic version string of the Keyview library.
/// @return Null-terminated "major.minor.patch" literal.
const char *keyview_version() noexcept
{
    return KEYVIEW_VERSION_STR;
}
} // namespace keyview
