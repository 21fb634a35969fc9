/**
 * @file log_entry.cpp
 */
#include "giantt/model/log_entry.hpp"
#include "giantt/common/errors.hpp"

#include <cctype>

#include <spdlog/fmt/fmt.h>

namespace giantt
{

namespace
{

// Days since 1970-01-01 for a proleptic Gregorian date.
int64_t days_from_civil(int64_t y, unsigned m, unsigned d)
{
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d)
{
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0);
}

class TimestampReader
{
public:
    explicit TimestampReader(std::string_view text)
        : m_text(text)
    {
    }

    int read_digits(size_t count)
    {
        int value = 0;
        for (size_t i = 0; i < count; ++i)
        {
            if (m_pos >= m_text.size() ||
                !std::isdigit(static_cast<unsigned char>(m_text[m_pos])))
            {
                fail("expected digit");
            }
            value = value * 10 + (m_text[m_pos] - '0');
            ++m_pos;
        }
        return value;
    }

    void expect(char c)
    {
        if (m_pos >= m_text.size() || m_text[m_pos] != c)
        {
            fail(std::string("expected '") + c + "'");
        }
        ++m_pos;
    }

    bool accept(char c)
    {
        if (m_pos < m_text.size() && m_text[m_pos] == c)
        {
            ++m_pos;
            return true;
        }
        return false;
    }

    bool at_digit() const
    {
        return m_pos < m_text.size() && std::isdigit(static_cast<unsigned char>(m_text[m_pos]));
    }

    bool at_end() const
    {
        return m_pos >= m_text.size();
    }

    [[noreturn]] void fail(const std::string& what) const
    {
        throw ParseError("Invalid timestamp: " + what, std::string(m_text), m_pos);
    }

private:
    std::string_view m_text;
    size_t m_pos{0};
};

} // namespace

std::string format_timestamp(Timestamp timestamp)
{
    using namespace std::chrono;
    const int64_t ms = duration_cast<milliseconds>(timestamp.time_since_epoch()).count();
    int64_t days = ms / 86400000;
    int64_t rem = ms % 86400000;
    if (rem < 0)
    {
        rem += 86400000;
        --days;
    }
    int64_t year = 0;
    unsigned month = 0;
    unsigned day = 0;
    civil_from_days(days, year, month, day);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
        year, month, day,
        rem / 3600000, (rem / 60000) % 60, (rem / 1000) % 60, rem % 1000);
}

Timestamp parse_timestamp(std::string_view text)
{
    TimestampReader reader(text);
    const int year = reader.read_digits(4);
    reader.expect('-');
    const int month = reader.read_digits(2);
    reader.expect('-');
    const int day = reader.read_digits(2);
    if (!reader.accept('T'))
    {
        reader.expect(' ');
    }
    const int hour = reader.read_digits(2);
    reader.expect(':');
    const int minute = reader.read_digits(2);
    reader.expect(':');
    const int second = reader.read_digits(2);
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 ||
        second > 60)
    {
        reader.fail("field out of range");
    }

    int64_t millis = 0;
    if (reader.accept('.'))
    {
        int64_t scale = 100;
        if (!reader.at_digit())
        {
            reader.fail("expected fraction digits");
        }
        while (reader.at_digit())
        {
            millis += reader.read_digits(1) * scale;
            scale /= 10;
        }
    }

    int64_t offset_minutes = 0;
    if (!reader.at_end() && !reader.accept('Z'))
    {
        int sign = 0;
        if (reader.accept('+'))
        {
            sign = 1;
        }
        else if (reader.accept('-'))
        {
            sign = -1;
        }
        else
        {
            reader.fail("unexpected trailing text");
        }
        const int off_h = reader.read_digits(2);
        reader.accept(':');
        const int off_m = reader.read_digits(2);
        offset_minutes = sign * (off_h * 60 + off_m);
    }
    if (!reader.at_end())
    {
        reader.fail("unexpected trailing text");
    }

    const int64_t days = days_from_civil(year, static_cast<unsigned>(month),
        static_cast<unsigned>(day));
    const int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second -
        offset_minutes * 60;
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::milliseconds(seconds * 1000 + millis)));
}

LogEntry LogEntry::create(
    std::string session,
    std::string message,
    std::set<std::string> tags,
    std::map<std::string, std::string> metadata)
{
    LogEntry entry;
    entry.session = std::move(session);
    entry.timestamp = std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    entry.message = std::move(message);
    entry.tags = std::move(tags);
    entry.metadata = std::move(metadata);
    return entry;
}

bool LogEntry::has_any_tag(const std::vector<std::string>& wanted) const
{
    return std::any_of(wanted.begin(), wanted.end(),
        [this](const std::string& tag) { return tags.count(tag) != 0; });
}

} // namespace giantt
