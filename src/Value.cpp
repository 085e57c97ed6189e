/**
 * @file Value.cpp
 * @brief Value factories and comparisons
 */

#include "jsonsql/Value.hpp"

namespace jsonsql {

const char* type_name(Type type) noexcept {
    switch (type) {
        case Type::Object:   return "object";
        case Type::Array:    return "array";
        case Type::String:   return "string";
        case Type::Date:     return "date";
        case Type::DateTime: return "datetime";
        case Type::Time:     return "time";
        case Type::Blob:     return "blob";
        case Type::Bit:      return "bit";
        case Type::Number:   return "number";
        case Type::Boolean:  return "boolean";
        case Type::Null:     return "null";
    }
    return "unknown";
}

bool operator==(const String& a, const String& b) {
    // The raw sub-kind renders identically, so it does not affect equality.
    return a.text == b.text;
}

bool operator==(const Date& a, const Date& b) {
    return a.year == b.year && a.month == b.month && a.day == b.day;
}

bool operator==(const DateTime& a, const DateTime& b) {
    return a.date == b.date && a.hour == b.hour && a.minute == b.minute &&
           a.second == b.second && a.microsecond == b.microsecond;
}

bool operator==(const Time& a, const Time& b) {
    return a.at == b.at;
}

bool operator==(const Blob& a, const Blob& b) {
    return a.bytes == b.bytes;
}

bool operator==(const Bit& a, const Bit& b) {
    return a.bytes == b.bytes;
}

bool operator==(const Number& a, const Number& b) {
    return a.text == b.text;
}

bool operator==(const Null&, const Null&) {
    return true;
}

Value Value::object(Object members) {
    return Value(Data(std::in_place_type<Object>, std::move(members)));
}

Value Value::array(Array elements) {
    return Value(Data(std::in_place_type<Array>, std::move(elements)));
}

Value Value::string(std::string text) {
    return Value(Data(std::in_place_type<String>, String{std::move(text), false}));
}

Value Value::raw_string(std::string text) {
    return Value(Data(std::in_place_type<String>, String{std::move(text), true}));
}

Value Value::date(Date d) {
    return Value(Data(std::in_place_type<Date>, d));
}

Value Value::datetime(DateTime dt) {
    return Value(Data(std::in_place_type<DateTime>, dt));
}

Value Value::time(TimePoint at) {
    return Value(Data(std::in_place_type<Time>, Time{at}));
}

Value Value::time_of_day(std::chrono::microseconds offset, const Clock& clock) {
    return time(midnight_of(clock.now()) + offset);
}

Value Value::blob(std::string bytes) {
    return Value(Data(std::in_place_type<Blob>, Blob{std::move(bytes)}));
}

Value Value::bit(std::string bytes) {
    return Value(Data(std::in_place_type<Bit>, Bit{std::move(bytes)}));
}

Value Value::number(std::string text) {
    return Value(Data(std::in_place_type<Number>, Number{std::move(text)}));
}

Value Value::boolean(bool b) {
    return Value(Data(std::in_place_type<Boolean>, b ? Boolean::True : Boolean::False));
}

Value Value::null() {
    return Value();
}

} // namespace jsonsql
