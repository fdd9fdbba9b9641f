// include/keyview/version.hpp
#pragma once

/// @brief Returns the Keyview version string.
/// @invariant The returned pointer is non-null and points to a null-terminated string.
/// @ownership The returned string has static storage duration and must not be freed.
namespace keyview
{
const char *keyview_version() noexcept;
} // namespace keyview
