// include/keyview/util/unicode.hpp
// @brief UTF-8 decoding and terminal cell width helpers.
// @invariant Invalid input never throws; each bad byte decodes to U+FFFD.
// @ownership Functions return owned strings; inputs are borrowed views.
#pragma once

#include <string>
#include <string_view>

namespace keyview::util
{

/// @brief Decode UTF-8 bytes into code points, replacing invalid bytes with U+FFFD.
std::u32string decode_utf8(std::string_view in);

/// @brief Append the UTF-8 encoding of @p cp to @p out.
void encode_utf8(char32_t cp, std::string &out);

/// @brief Number of terminal cells occupied by @p cp (0, 1 or 2).
int char_width(char32_t cp);

/// @brief Number of terminal cells occupied by the UTF-8 text @p s.
int display_width(std::string_view s);

/// @brief Clip @p s to at most @p width cells, ending in @p ellipsis when clipped.
/// @details Text that already fits is returned unchanged. When even the
///          ellipsis does not fit, the longest prefix of the ellipsis that
///          fits is returned, which may be empty.
std::string truncate_to_width(std::string_view s, int width, std::string_view ellipsis);

} // namespace keyview::util
