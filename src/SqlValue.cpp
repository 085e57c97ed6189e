/**
 * @file SqlValue.cpp
 * @brief Wire-typed value implementation
 */

#include "jsonsql/SqlValue.hpp"

#include <utility>

namespace jsonsql {

const char* type_name(SqlType type) noexcept {
    switch (type) {
        case SqlType::Null:      return "NULL";
        case SqlType::Int64:     return "INT64";
        case SqlType::Uint64:    return "UINT64";
        case SqlType::Float64:   return "FLOAT64";
        case SqlType::Decimal:   return "DECIMAL";
        case SqlType::VarChar:   return "VARCHAR";
        case SqlType::VarBinary: return "VARBINARY";
        case SqlType::Date:      return "DATE";
        case SqlType::Time:      return "TIME";
        case SqlType::Datetime:  return "DATETIME";
        case SqlType::Bit:       return "BIT";
        case SqlType::Json:      return "JSON";
    }
    return "UNKNOWN";
}

SqlValue SqlValue::make_trusted(SqlType type, std::string raw) {
    if (type == SqlType::Null) {
        return SqlValue();
    }
    return SqlValue(type, std::move(raw));
}

std::string SqlValue::to_string() const {
    if (is_null()) {
        return "NULL";
    }
    return std::string(type_name(type_)) + "(" + raw_ + ")";
}

} // namespace jsonsql
