/**
 * @file Clock.hpp
 * @brief Injectable wall clock
 *
 * TIME values are rendered relative to midnight of the current date, so
 * the marshaler takes the clock as an argument. Tests pass a FixedClock
 * to get reproducible output.
 */

#ifndef JSONSQL_CLOCK_HPP
#define JSONSQL_CLOCK_HPP

#include <chrono>

namespace jsonsql {

/// Instant with microsecond resolution on the system clock (UTC).
using TimePoint = std::chrono::time_point<std::chrono::system_clock,
                                          std::chrono::microseconds>;

/// Whole days, for calendar arithmetic.
using Days = std::chrono::duration<long long, std::ratio<86400>>;

/**
 * @brief Source of the current instant
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

/**
 * @brief Reads std::chrono::system_clock
 */
class SystemClock final : public Clock {
public:
    TimePoint now() const override;
};

/**
 * @brief Always returns the instant it was constructed with
 */
class FixedClock final : public Clock {
public:
    explicit FixedClock(TimePoint at) : at_(at) {}

    TimePoint now() const override { return at_; }

private:
    TimePoint at_;
};

/**
 * @brief Shared stateless SystemClock instance
 */
const Clock& system_clock();

/**
 * @brief Midnight (UTC) of the day containing t
 *
 * Rounds toward negative infinity, so instants before the epoch land on
 * the start of their own day.
 */
TimePoint midnight_of(TimePoint t);

} // namespace jsonsql

#endif // JSONSQL_CLOCK_HPP
