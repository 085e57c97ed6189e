/**
 * @file Clock.cpp
 * @brief Clock implementations
 */

#include "jsonsql/Clock.hpp"

namespace jsonsql {

TimePoint SystemClock::now() const {
    return std::chrono::time_point_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now());
}

const Clock& system_clock() {
    static const SystemClock clock;
    return clock;
}

TimePoint midnight_of(TimePoint t) {
    return std::chrono::time_point_cast<std::chrono::microseconds>(
        std::chrono::floor<Days>(t));
}

} // namespace jsonsql
