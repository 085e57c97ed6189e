/**
 * @file Temporal.cpp
 * @brief DATE / DATETIME / TIME text conversion
 */

#include "jsonsql/Temporal.hpp"

#include <iomanip>
#include <sstream>

namespace jsonsql {

namespace {

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) return 29;
    return kDays[month - 1];
}

/**
 * @brief Days since 1970-01-01 for a proleptic Gregorian date
 *
 * Howard Hinnant's days_from_civil.
 */
long long days_from_civil(long long y, int m, int d) {
    y -= m <= 2;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const long long yoe = y - era * 400;
    const long long doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

/**
 * @brief Read exactly `count` decimal digits starting at `pos`
 */
bool read_digits(std::string_view text, std::size_t pos, std::size_t count, int& out) {
    if (pos + count > text.size()) return false;
    int value = 0;
    for (std::size_t i = pos; i < pos + count; ++i) {
        char c = text[i];
        if (c < '0' || c > '9') return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

void write_date(std::ostream& os, const Date& d) {
    os << std::setfill('0')
       << std::setw(4) << d.year << '-'
       << std::setw(2) << d.month << '-'
       << std::setw(2) << d.day;
}

} // anonymous namespace

std::string format_date(const Date& d) {
    std::ostringstream oss;
    write_date(oss, d);
    return oss.str();
}

std::string format_datetime(const DateTime& dt) {
    std::ostringstream oss;
    write_date(oss, dt.date);
    oss << ' '
        << std::setw(2) << dt.hour << ':'
        << std::setw(2) << dt.minute << ':'
        << std::setw(2) << dt.second << '.'
        << std::setw(6) << dt.microsecond;
    return oss.str();
}

std::string format_time_of_day(std::chrono::microseconds offset) {
    using namespace std::chrono;

    const bool negative = offset.count() < 0;
    microseconds diff = negative ? -offset : offset;

    const auto h = duration_cast<hours>(diff);
    diff -= h;
    const auto m = duration_cast<minutes>(diff);
    diff -= m;
    const auto s = duration_cast<seconds>(diff);
    diff -= s;

    std::ostringstream oss;
    if (negative) oss << '-';
    // MySQL wraps the hour field past 32 hours and loses the rest.
    oss << std::setfill('0')
        << std::setw(2) << (h.count() % 32) << ':'
        << std::setw(2) << m.count() << ':'
        << std::setw(2) << s.count() << '.'
        << std::setw(6) << diff.count();
    return oss.str();
}

std::optional<Date> parse_date(std::string_view text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }

    Date d;
    if (!read_digits(text, 0, 4, d.year) ||
        !read_digits(text, 5, 2, d.month) ||
        !read_digits(text, 8, 2, d.day)) {
        return std::nullopt;
    }
    if (d.month < 1 || d.month > 12) return std::nullopt;
    if (d.day < 1 || d.day > days_in_month(d.year, d.month)) return std::nullopt;
    return d;
}

std::optional<DateTime> parse_datetime(std::string_view text) {
    if (text.size() < 10) return std::nullopt;

    auto date = parse_date(text.substr(0, 10));
    if (!date) return std::nullopt;

    DateTime dt;
    dt.date = *date;
    if (text.size() == 10) return dt;

    // "YYYY-MM-DD HH:MM:SS" is 19 characters
    if (text.size() < 19 || (text[10] != ' ' && text[10] != 'T') ||
        text[13] != ':' || text[16] != ':') {
        return std::nullopt;
    }
    if (!read_digits(text, 11, 2, dt.hour) ||
        !read_digits(text, 14, 2, dt.minute) ||
        !read_digits(text, 17, 2, dt.second)) {
        return std::nullopt;
    }
    if (dt.hour > 23 || dt.minute > 59 || dt.second > 59) return std::nullopt;

    if (text.size() == 19) return dt;

    const std::size_t digits = text.size() - 20;
    if (text[19] != '.' || digits < 1 || digits > 6) return std::nullopt;

    int fraction = 0;
    if (!read_digits(text, 20, digits, fraction)) return std::nullopt;
    for (std::size_t i = digits; i < 6; ++i) {
        fraction *= 10;
    }
    dt.microsecond = fraction;
    return dt;
}

TimePoint to_time_point(const DateTime& dt) {
    using namespace std::chrono;

    const Days days{days_from_civil(dt.date.year, dt.date.month, dt.date.day)};
    return TimePoint(duration_cast<microseconds>(days) +
                     hours(dt.hour) + minutes(dt.minute) +
                     seconds(dt.second) + microseconds(dt.microsecond));
}

} // namespace jsonsql
