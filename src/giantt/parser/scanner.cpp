/**
 * @file scanner.cpp
 */
#include "giantt/parser/scanner.hpp"
#include "giantt/common/errors.hpp"

namespace giantt
{

namespace
{

bool is_space(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

} // namespace

bool Scanner::at_whitespace() const noexcept
{
    return !at_end() && is_space(m_text[m_pos]);
}

bool Scanner::starts_with(std::string_view literal) const noexcept
{
    return m_text.substr(m_pos, literal.size()) == literal;
}

bool Scanner::skip_whitespace() noexcept
{
    const size_t start = m_pos;
    while (at_whitespace())
    {
        ++m_pos;
    }
    return m_pos != start;
}

bool Scanner::accept(std::string_view literal) noexcept
{
    if (!starts_with(literal))
    {
        return false;
    }
    m_pos += literal.size();
    return true;
}

void Scanner::expect(std::string_view literal, const std::string& what)
{
    if (!accept(literal))
    {
        fail("expected " + what);
    }
}

void Scanner::expect_whitespace(const std::string& what)
{
    if (!skip_whitespace())
    {
        fail("expected whitespace before " + what);
    }
}

std::string_view Scanner::take_while(const std::function<bool(char)>& pred)
{
    const size_t start = m_pos;
    while (!at_end() && pred(m_text[m_pos]))
    {
        ++m_pos;
    }
    return m_text.substr(start, m_pos - start);
}

std::string_view Scanner::take_token()
{
    return take_while([](char c) { return !is_space(c); });
}

std::string_view Scanner::take_rest() noexcept
{
    std::string_view result = rest();
    m_pos = m_text.size();
    return result;
}

void Scanner::fail(const std::string& message) const
{
    fail_at(m_pos, message);
}

void Scanner::fail_at(size_t position, const std::string& message) const
{
    throw ParseError(
        message + " (column " + std::to_string(position + 1) + ")", std::string(m_text), position);
}

std::string_view trim(std::string_view text) noexcept
{
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && is_space(text[begin]))
    {
        ++begin;
    }
    while (end > begin && is_space(text[end - 1]))
    {
        --end;
    }
    return text.substr(begin, end - begin);
}

} // namespace giantt
