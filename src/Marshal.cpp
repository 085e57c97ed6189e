/**
 * @file Marshal.cpp
 * @brief SQL rendering of Value trees
 */

#include "jsonsql/Marshal.hpp"
#include "jsonsql/Parser.hpp"
#include "jsonsql/SqlString.hpp"
#include "jsonsql/Temporal.hpp"

#include <variant>

namespace jsonsql {

namespace {

/**
 * @brief Renders one node; one overload per Value::Data alternative
 *
 * std::visit rejects at compile time any alternative without an
 * overload here, so every tag is handled.
 */
class SqlRenderer {
public:
    SqlRenderer(bool top, std::string& dst, const Clock& clock)
        : top_(top), dst_(dst), clock_(clock) {}

    void operator()(const Object& members) const {
        dst_ += "JSON_OBJECT(";
        for (std::size_t i = 0; i < members.size(); ++i) {
            if (i != 0) dst_ += ", ";
            dst_ += "_utf8mb4";
            dst_ += encode_string_sql(members[i].first);
            dst_ += ", ";
            marshal_sql(members[i].second, false, dst_, clock_);
        }
        dst_ += ')';
    }

    void operator()(const Array& elements) const {
        dst_ += "JSON_ARRAY(";
        for (std::size_t i = 0; i < elements.size(); ++i) {
            if (i != 0) dst_ += ", ";
            marshal_sql(elements[i], false, dst_, clock_);
        }
        dst_ += ')';
    }

    void operator()(const String& s) const {
        if (top_) dst_ += "CAST(JSON_QUOTE(";
        dst_ += "_utf8mb4";
        dst_ += encode_string_sql(s.text);
        if (top_) dst_ += ") as JSON)";
    }

    void operator()(const Date& d) const {
        open_cast();
        dst_ += "date '";
        dst_ += format_date(d);
        dst_ += '\'';
        close_cast();
    }

    void operator()(const DateTime& dt) const {
        open_cast();
        dst_ += "timestamp '";
        dst_ += format_datetime(dt);
        dst_ += '\'';
        close_cast();
    }

    void operator()(const Time& t) const {
        // Relative to today's midnight, not the value's own date.
        const auto offset = t.at - midnight_of(clock_.now());
        open_cast();
        dst_ += "time '";
        dst_ += format_time_of_day(offset);
        dst_ += '\'';
        close_cast();
    }

    void operator()(const Blob& b) const {
        open_cast();
        dst_ += "x'";
        dst_ += encode_hex(b.bytes);
        dst_ += '\'';
        close_cast();
    }

    void operator()(const Bit& b) const {
        open_cast();
        dst_ += "b'";
        dst_ += bits_to_binary_text(b.bytes);
        dst_ += '\'';
        close_cast();
    }

    void operator()(const Number& n) const {
        open_cast();
        dst_ += n.text;
        close_cast();
    }

    void operator()(Boolean b) const {
        open_cast();
        dst_ += (b == Boolean::True) ? "true" : "false";
        close_cast();
    }

    void operator()(const Null&) const {
        open_cast();
        dst_ += "null";
        close_cast();
    }

private:
    void open_cast() const {
        if (top_) dst_ += "CAST(";
    }

    void close_cast() const {
        if (top_) dst_ += " as JSON)";
    }

    bool top_;
    std::string& dst_;
    const Clock& clock_;
};

} // anonymous namespace

std::string& marshal_sql(const Value& v, bool top, std::string& dst, const Clock& clock) {
    std::visit(SqlRenderer(top, dst, clock), v.data());
    return dst;
}

std::string& marshal_sql_to(const Value& v, std::string& dst, const Clock& clock) {
    return marshal_sql(v, true, dst, clock);
}

std::string& marshal_sql_to(const Value& v, std::string& dst) {
    return marshal_sql_to(v, dst, system_clock());
}

std::string to_sql(const Value& v, const Clock& clock) {
    std::string out;
    marshal_sql_to(v, out, clock);
    return out;
}

SqlValue marshal_sql_value(std::string_view buf, const Clock& clock) {
    Value root = parse_bytes_or_null(buf);
    return SqlValue::make_trusted(SqlType::Json, to_sql(root, clock));
}

SqlValue marshal_sql_value(std::string_view buf) {
    return marshal_sql_value(buf, system_clock());
}

} // namespace jsonsql
