/**
 * @file SqlValue.hpp
 * @brief Wire-typed database value
 *
 * A SqlValue pairs raw bytes with the MySQL wire type they represent.
 * make_trusted() tags bytes without validating them; the caller vouches
 * that they are well-formed for the type.
 */

#ifndef JSONSQL_SQLVALUE_HPP
#define JSONSQL_SQLVALUE_HPP

#include <string>
#include <string_view>
#include <utility>

namespace jsonsql {

/**
 * @brief Byte representation of SQL NULL accepted by parse_bytes()
 */
inline constexpr std::string_view kNullBytes = "null";

enum class SqlType {
    Null,
    Int64,
    Uint64,
    Float64,
    Decimal,
    VarChar,
    VarBinary,
    Date,
    Time,
    Datetime,
    Bit,
    Json
};

/**
 * @brief Wire type name as MySQL spells it (e.g., "JSON", "VARBINARY")
 */
const char* type_name(SqlType type) noexcept;

class SqlValue {
public:
    /// SQL NULL.
    SqlValue() = default;

    /**
     * @brief Tag bytes as already-valid content of the given type
     *
     * A Null type discards the bytes.
     */
    static SqlValue make_trusted(SqlType type, std::string raw);

    SqlType type() const noexcept { return type_; }
    const std::string& raw() const noexcept { return raw_; }
    bool is_null() const noexcept { return type_ == SqlType::Null; }

    /**
     * @brief Debug form: "NULL" or TYPE(raw), e.g. JSON(CAST(null as JSON))
     */
    std::string to_string() const;

    friend bool operator==(const SqlValue& a, const SqlValue& b) {
        return a.type_ == b.type_ && a.raw_ == b.raw_;
    }
    friend bool operator!=(const SqlValue& a, const SqlValue& b) {
        return !(a == b);
    }

private:
    SqlValue(SqlType type, std::string raw) : type_(type), raw_(std::move(raw)) {}

    SqlType type_ = SqlType::Null;
    std::string raw_;
};

} // namespace jsonsql

#endif // JSONSQL_SQLVALUE_HPP
