/**
 * @file Temporal.hpp
 * @brief Text formatting and parsing for DATE, DATETIME and TIME
 *
 * Formats match MySQL literal syntax:
 * - DATE:     YYYY-MM-DD
 * - DATETIME: YYYY-MM-DD HH:MM:SS.ffffff (always 6 fractional digits)
 * - TIME:     [-]HH:MM:SS.ffffff
 */

#ifndef JSONSQL_TEMPORAL_HPP
#define JSONSQL_TEMPORAL_HPP

#include "jsonsql/Clock.hpp"
#include "jsonsql/Value.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace jsonsql {

std::string format_date(const Date& d);

std::string format_datetime(const DateTime& dt);

/**
 * @brief Format a signed duration-of-day
 *
 * The hour field is the absolute hour count modulo 32, matching the way
 * MySQL truncates TIME values in JSON. Negative offsets get a leading '-'.
 *
 * Examples:
 *   - 13h 5m 7.25s   -> "13:05:07.250000"
 *   - 33h            -> "01:00:00.000000"
 *   - -(1h 30m)      -> "-01:30:00.000000"
 */
std::string format_time_of_day(std::chrono::microseconds offset);

/**
 * @brief Parse "YYYY-MM-DD"
 * @return Date, or nullopt if the text is malformed or out of range
 */
std::optional<Date> parse_date(std::string_view text);

/**
 * @brief Parse "YYYY-MM-DD", "YYYY-MM-DD HH:MM:SS" or with 1-6 fractional digits
 *
 * A 'T' separator is accepted in place of the space.
 *
 * @return DateTime, or nullopt if the text is malformed or out of range
 */
std::optional<DateTime> parse_datetime(std::string_view text);

/**
 * @brief Convert a calendar DateTime (UTC) to an instant
 */
TimePoint to_time_point(const DateTime& dt);

} // namespace jsonsql

#endif // JSONSQL_TEMPORAL_HPP
