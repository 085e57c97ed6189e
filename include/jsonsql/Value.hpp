/**
 * @file Value.hpp
 * @brief Type-tagged JSON value tree
 *
 * Covers the plain JSON types plus the MySQL extended JSON types that a
 * JSON column can hold:
 * - Object ({String: Value, ...}, insertion ordered)
 * - Array ([Value, ...])
 * - String (UTF-8; "raw" sub-kind for pre-escaped content)
 * - Date, DateTime, Time
 * - Blob (opaque bytes)
 * - Bit (big-endian bit string)
 * - Number (decimal text, kept verbatim)
 * - Boolean (true | false)
 * - Null
 *
 * Values are immutable once built. Containers are filled before the
 * enclosing Value is constructed.
 */

#ifndef JSONSQL_VALUE_HPP
#define JSONSQL_VALUE_HPP

#include "jsonsql/Clock.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace jsonsql {

class Value;

using Member = std::pair<std::string, Value>;
using Object = std::vector<Member>;
using Array = std::vector<Value>;

struct String {
    std::string text;
    bool raw = false;
};

struct Date {
    int year = 0;
    int month = 1;
    int day = 1;
};

struct DateTime {
    Date date;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int microsecond = 0;
};

struct Time {
    TimePoint at;
};

struct Blob {
    std::string bytes;
};

struct Bit {
    std::string bytes;
};

struct Number {
    std::string text;
};

enum class Boolean { False, True };

struct Null {};

/**
 * @brief Variant tag, in the same order as Value::Data alternatives
 */
enum class Type {
    Object,
    Array,
    String,
    Date,
    DateTime,
    Time,
    Blob,
    Bit,
    Number,
    Boolean,
    Null
};

/**
 * @brief Get human-readable type name
 * @return Lowercase name (e.g., "object", "datetime", "null")
 */
const char* type_name(Type type) noexcept;

bool operator==(const String& a, const String& b);
bool operator==(const Date& a, const Date& b);
bool operator==(const DateTime& a, const DateTime& b);
bool operator==(const Time& a, const Time& b);
bool operator==(const Blob& a, const Blob& b);
bool operator==(const Bit& a, const Bit& b);
bool operator==(const Number& a, const Number& b);
bool operator==(const Null& a, const Null& b);

/**
 * @brief One node of a JSON value tree
 *
 * Built through the static factories; read through type() and as<T>().
 *
 * ```cpp
 * Value v = Value::object({
 *     {"id", Value::number("7")},
 *     {"born", Value::date({1990, 4, 1})},
 * });
 * v.type();                          // Type::Object
 * v.as<Object>()[1].second.type();   // Type::Date
 * ```
 */
class Value {
public:
    using Data = std::variant<Object, Array, String, Date, DateTime, Time,
                              Blob, Bit, Number, Boolean, Null>;

    /// Null value.
    Value() : data_(std::in_place_type<Null>) {}

    static Value object(Object members);
    static Value array(Array elements);
    static Value string(std::string text);
    static Value raw_string(std::string text);
    static Value date(Date d);
    static Value datetime(DateTime dt);
    static Value time(TimePoint at);

    /**
     * @brief TIME value at a signed offset from the clock's current midnight
     *
     * The offset may exceed 24 hours or be negative.
     */
    static Value time_of_day(std::chrono::microseconds offset, const Clock& clock);

    static Value blob(std::string bytes);
    static Value bit(std::string bytes);
    static Value number(std::string text);
    static Value boolean(bool b);
    static Value null();

    Type type() const noexcept { return static_cast<Type>(data_.index()); }

    bool is_null() const noexcept { return type() == Type::Null; }
    bool is_container() const noexcept {
        return type() == Type::Object || type() == Type::Array;
    }

    /**
     * @brief Access the alternative of type T
     * @throws std::bad_variant_access if the value holds another type
     */
    template <typename T>
    const T& as() const { return std::get<T>(data_); }

    const Data& data() const noexcept { return data_; }

    friend bool operator==(const Value& a, const Value& b) {
        return a.data_ == b.data_;
    }
    friend bool operator!=(const Value& a, const Value& b) {
        return !(a == b);
    }

private:
    explicit Value(Data data) : data_(std::move(data)) {}

    Data data_;
};

static_assert(std::variant_size_v<Value::Data> == static_cast<std::size_t>(Type::Null) + 1,
              "Type must list every Value::Data alternative");

} // namespace jsonsql

#endif // JSONSQL_VALUE_HPP
