// include/keyview/render/view.hpp
// @brief Viewport and rendered view types shared by layouts and writers.
// @invariant A RenderedView produced for a Viewport never exceeds its bounds.
// @ownership Lines own their span text.
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace keyview::render
{

/// @brief Character-cell dimensions of the display area.
struct Viewport
{
    int width{0};
    int height{0};

    bool operator==(const Viewport &other) const
    {
        return width == other.width && height == other.height;
    }

    bool operator!=(const Viewport &other) const
    {
        return !(*this == other);
    }

    [[nodiscard]] bool empty() const
    {
        return width <= 0 || height <= 0;
    }
};

/// @brief Semantic role of a span; writers map roles to colours.
enum class Role
{
    Normal,
    Title,
    Key,
    Muted,
    Action,
    Marker,
};

/// @brief Run of text sharing one role.
struct Span
{
    std::string text{};
    Role role{Role::Normal};

    bool operator==(const Span &other) const
    {
        return text == other.text && role == other.role;
    }
};

/// @brief One display line made of styled spans.
struct Line
{
    std::vector<Span> spans{};

    /// @brief Append @p text with @p role; empty text is ignored.
    void append(std::string text, Role role);

    /// @brief Append every span of @p other.
    void append(const Line &other);

    /// @brief Concatenated span text.
    [[nodiscard]] std::string text() const;

    /// @brief Width in terminal cells.
    [[nodiscard]] int width() const;

    bool operator==(const Line &other) const
    {
        return spans == other.spans;
    }
};

/// @brief Ordered display lines handed to the host.
struct RenderedView
{
    std::vector<Line> lines{};

    /// @brief Plain text of each line.
    [[nodiscard]] std::vector<std::string> text() const;

    bool operator==(const RenderedView &other) const
    {
        return lines == other.lines;
    }

    bool operator!=(const RenderedView &other) const
    {
        return !(*this == other);
    }
};

/// @brief Clip @p line to @p width cells, marking the cut with @p ellipsis.
/// @details The ellipsis takes the role of the span it cuts into.
Line truncateLine(const Line &line, int width, std::string_view ellipsis);

/// @brief Pad @p line with spaces up to @p width cells.
void padLine(Line &line, int width);

} // namespace keyview::render
