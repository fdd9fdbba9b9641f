// include/keyview/term/term_io.hpp
// @brief Output sinks for rendered frames.
// @invariant StringTermIO captures writes verbatim.
// @ownership StringTermIO owns its buffer; RealTermIO borrows stdout.
#pragma once

#include <string>
#include <string_view>

namespace keyview::term
{

/// @brief Abstract byte sink for terminal output.
class TermIO
{
  public:
    virtual ~TermIO() = default;

    virtual void write(std::string_view s) = 0;

    virtual void flush() = 0;
};

/// @brief Writes straight to the process's standard output.
class RealTermIO final : public TermIO
{
  public:
    void write(std::string_view s) override;
    void flush() override;
};

/// @brief In-memory sink used by tests and by hosts that forward frames.
class StringTermIO final : public TermIO
{
  public:
    void write(std::string_view s) override;
    void flush() override;

    [[nodiscard]] const std::string &buffer() const
    {
        return buffer_;
    }

    void clear()
    {
        buffer_.clear();
    }

  private:
    std::string buffer_;
};

} // namespace keyview::term
