//===----------------------------------------------------------------------===//
//
// Part of the Keyview project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/util/unicode.cpp
// Purpose: Decode and measure UTF-8 text so rendered lines can be bounded by
//          terminal cells rather than bytes.
// Key invariants: Every invalid byte maps to exactly one U+FFFD; widths are
//                 0, 1 or 2.
// Ownership/Lifetime: Stateless helpers.
//
//===----------------------------------------------------------------------===//

#include "keyview/util/unicode.hpp"

#include <cstddef>

namespace keyview::util
{

namespace
{
constexpr char32_t kReplacement = 0xFFFD;

struct Range
{
    char32_t lo;
    char32_t hi;
};

// Combining marks and zero-width format characters.
constexpr Range kZeroWidth[] = {
    {0x0300, 0x036F},
    {0x0483, 0x0489},
    {0x0591, 0x05BD},
    {0x0610, 0x061A},
    {0x064B, 0x065F},
    {0x0E31, 0x0E31},
    {0x0E34, 0x0E3A},
    {0x1AB0, 0x1AFF},
    {0x1DC0, 0x1DFF},
    {0x200B, 0x200F},
    {0x2028, 0x202E},
    {0x2060, 0x2064},
    {0x20D0, 0x20FF},
    {0xFE00, 0xFE0F},
    {0xFE20, 0xFE2F},
    {0xFEFF, 0xFEFF},
};

// East Asian wide/fullwidth blocks and emoji.
constexpr Range kWide[] = {
    {0x1100, 0x115F},
    {0x2E80, 0x303E},
    {0x3041, 0x33FF},
    {0x3400, 0x4DBF},
    {0x4E00, 0x9FFF},
    {0xA000, 0xA4CF},
    {0xAC00, 0xD7A3},
    {0xF900, 0xFAFF},
    {0xFE30, 0xFE4F},
    {0xFF00, 0xFF60},
    {0xFFE0, 0xFFE6},
    {0x1F300, 0x1F64F},
    {0x1F900, 0x1F9FF},
    {0x20000, 0x2FFFD},
    {0x30000, 0x3FFFD},
};

template <std::size_t N> bool inRanges(char32_t cp, const Range (&ranges)[N])
{
    for (const auto &r : ranges)
    {
        if (cp < r.lo)
        {
            return false;
        }
        if (cp <= r.hi)
        {
            return true;
        }
    }
    return false;
}

/// @brief Append the longest prefix of @p s that fits in @p budget cells.
void appendPrefix(std::string_view s, int budget, std::string &out)
{
    int used = 0;
    for (char32_t cp : decode_utf8(s))
    {
        const int w = char_width(cp);
        if (used + w > budget)
        {
            break;
        }
        used += w;
        encode_utf8(cp, out);
    }
}
} // namespace

std::u32string decode_utf8(std::string_view in)
{
    std::u32string out;
    out.reserve(in.size());
    std::size_t i = 0;
    const std::size_t n = in.size();
    while (i < n)
    {
        const auto b = static_cast<unsigned char>(in[i]);
        if (b < 0x80)
        {
            out.push_back(b);
            ++i;
            continue;
        }

        std::size_t len = 0;
        char32_t cp = 0;
        char32_t min = 0;
        if ((b & 0xE0) == 0xC0)
        {
            len = 2;
            cp = b & 0x1F;
            min = 0x80;
        }
        else if ((b & 0xF0) == 0xE0)
        {
            len = 3;
            cp = b & 0x0F;
            min = 0x800;
        }
        else if ((b & 0xF8) == 0xF0)
        {
            len = 4;
            cp = b & 0x07;
            min = 0x10000;
        }
        else
        {
            out.push_back(kReplacement);
            ++i;
            continue;
        }

        bool ok = i + len <= n;
        for (std::size_t k = 1; ok && k < len; ++k)
        {
            const auto c = static_cast<unsigned char>(in[i + k]);
            if ((c & 0xC0) != 0x80)
            {
                ok = false;
                break;
            }
            cp = (cp << 6) | (c & 0x3F);
        }
        if (!ok || cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        {
            // Resynchronise on the next byte; stray continuations become U+FFFD too.
            out.push_back(kReplacement);
            ++i;
            continue;
        }
        out.push_back(cp);
        i += len;
    }
    return out;
}

void encode_utf8(char32_t cp, std::string &out)
{
    if (cp <= 0x7F)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if (cp <= 0x7FF)
    {
        out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp <= 0xFFFF)
    {
        out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

int char_width(char32_t cp)
{
    if (cp < 0x20 || (cp >= 0x7F && cp < 0xA0))
    {
        return 0;
    }
    if (cp < 0x0300)
    {
        return 1;
    }
    if (inRanges(cp, kZeroWidth))
    {
        return 0;
    }
    if (inRanges(cp, kWide))
    {
        return 2;
    }
    return 1;
}

int display_width(std::string_view s)
{
    int width = 0;
    for (char32_t cp : decode_utf8(s))
    {
        width += char_width(cp);
    }
    return width;
}

std::string truncate_to_width(std::string_view s, int width, std::string_view ellipsis)
{
    if (width <= 0)
    {
        return {};
    }
    if (display_width(s) <= width)
    {
        return std::string(s);
    }
    std::string out;
    const int ew = display_width(ellipsis);
    if (ew > width)
    {
        appendPrefix(ellipsis, width, out);
        return out;
    }
    appendPrefix(s, width - ew, out);
    out.append(ellipsis);
    return out;
}

} // namespace keyview::util
