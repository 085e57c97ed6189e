/**
 * @file Marshal.hpp
 * @brief Value tree to SQL expression
 *
 * Renders a Value as SQL that rebuilds the same JSON value on a
 * MySQL-compatible server, keeping DATE, DATETIME, TIME, BLOB and BIT
 * distinct from strings and numbers.
 *
 * Containers become JSON_OBJECT(...) / JSON_ARRAY(...) calls, whose
 * arguments MySQL converts to JSON on its own. A scalar standing alone
 * needs an explicit CAST(... as JSON); a string additionally goes through
 * JSON_QUOTE so the cast sees a JSON string rather than JSON text.
 *
 * Examples (top level):
 *   null               -> CAST(null as JSON)
 *   "a'b"              -> CAST(JSON_QUOTE(_utf8mb4'a\'b') as JSON)
 *   [1, 2]             -> JSON_ARRAY(1, 2)
 *   {"k": false}       -> JSON_OBJECT(_utf8mb4'k', false)
 *   blob 0xAB 0xCD     -> CAST(x'abcd' as JSON)
 *   date 2020-01-01    -> CAST(date '2020-01-01' as JSON)
 */

#ifndef JSONSQL_MARSHAL_HPP
#define JSONSQL_MARSHAL_HPP

#include "jsonsql/Clock.hpp"
#include "jsonsql/SqlValue.hpp"
#include "jsonsql/Value.hpp"

#include <string>
#include <string_view>

namespace jsonsql {

/**
 * @brief Append the SQL rendering of v to dst
 *
 * @param v Value tree, read only
 * @param top Whether the result stands alone as a full expression; scalars
 *            are then wrapped in CAST(... as JSON). Nested values are
 *            always rendered with top = false.
 * @param dst Output buffer, appended to
 * @param clock Source of the current date for TIME values
 * @return dst
 */
std::string& marshal_sql(const Value& v, bool top, std::string& dst, const Clock& clock);

/**
 * @brief Append the top-level SQL rendering of v to dst
 */
std::string& marshal_sql_to(const Value& v, std::string& dst, const Clock& clock);

/**
 * @brief marshal_sql_to() using the system clock
 */
std::string& marshal_sql_to(const Value& v, std::string& dst);

/**
 * @brief Top-level SQL rendering of v as a fresh string
 */
std::string to_sql(const Value& v, const Clock& clock);

/**
 * @brief Parse JSON bytes and render them as a JSON-typed SQL value
 *
 * Empty input is treated as kNullBytes, so an empty column value becomes
 * CAST(null as JSON) instead of a parse failure.
 *
 * @param buf JSON text
 * @param clock Source of the current date for TIME values
 * @return SqlValue of type SqlType::Json holding the SQL expression
 * @throws ParseError if buf is not well-formed JSON
 */
SqlValue marshal_sql_value(std::string_view buf, const Clock& clock);

/**
 * @brief marshal_sql_value() using the system clock
 */
SqlValue marshal_sql_value(std::string_view buf);

} // namespace jsonsql

#endif // JSONSQL_MARSHAL_HPP
