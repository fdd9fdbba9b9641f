// include/keyview/util/strings.hpp
// @brief Small ASCII string helpers shared by the trigger parser and loader.
// @ownership Functions return owned strings.
#pragma once

#include <string>
#include <string_view>

namespace keyview::util
{

/// @brief Strip ASCII whitespace from both ends.
std::string trim(std::string_view sv);

/// @brief Lowercase ASCII letters; other bytes are copied unchanged.
std::string toLower(std::string_view sv);

} // namespace keyview::util
