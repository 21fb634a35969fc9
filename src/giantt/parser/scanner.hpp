/**
 * @file scanner.hpp
 * @brief Position-tracking cursor over one line of notation text.
 */
#pragma once
#include "giantt/common/common.hpp"

namespace giantt
{

/**
 * @brief A forward-only cursor over a string with column-precise failures.
 *
 * @details
 * `Scanner` does not own the text; the viewed string must outlive it. All
 * positions are byte offsets. `fail()` throws `ParseError` carrying the whole
 * scanned text and the current offset, so errors raised deep inside a
 * sub-grammar still point into the original line.
 */
class Scanner
{
public:
    explicit Scanner(std::string_view text)
        : m_text(text)
    {
    }

    bool at_end() const noexcept
    {
        return m_pos >= m_text.size();
    }

    size_t position() const noexcept
    {
        return m_pos;
    }

    std::string_view text() const noexcept
    {
        return m_text;
    }

    std::string_view rest() const noexcept
    {
        return m_text.substr(m_pos);
    }

    /**
     * @brief Current byte, or '\0' at the end.
     */
    char peek() const noexcept
    {
        return at_end() ? '\0' : m_text[m_pos];
    }

    bool at_whitespace() const noexcept;

    bool starts_with(std::string_view literal) const noexcept;

    /**
     * @brief Skip spaces and tabs.
     * @return True if at least one byte was skipped.
     */
    bool skip_whitespace() noexcept;

    /**
     * @brief Consume `literal` if the text continues with it.
     */
    bool accept(std::string_view literal) noexcept;

    /**
     * @brief Consume `literal` or fail with "expected <what>".
     */
    void expect(std::string_view literal, const std::string& what);

    /**
     * @brief Require at least one whitespace byte and skip the run.
     */
    void expect_whitespace(const std::string& what);

    /**
     * @brief Consume bytes while `pred` holds.
     */
    std::string_view take_while(const std::function<bool(char)>& pred);

    /**
     * @brief Consume bytes up to the next whitespace or the end.
     */
    std::string_view take_token();

    /**
     * @brief Consume everything that is left.
     */
    std::string_view take_rest() noexcept;

    /**
     * @brief Throw a ParseError located at the current position.
     */
    [[noreturn]] void fail(const std::string& message) const;

    /**
     * @brief Throw a ParseError located at `position`.
     */
    [[noreturn]] void fail_at(size_t position, const std::string& message) const;

private:
    std::string_view m_text;
    size_t m_pos{0};
};

/**
 * @brief Strip leading and trailing whitespace (including CR and LF).
 */
std::string_view trim(std::string_view text) noexcept;

} // namespace giantt
