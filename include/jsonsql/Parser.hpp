/**
 * @file Parser.hpp
 * @brief Raw JSON bytes to Value tree
 */

#ifndef JSONSQL_PARSER_HPP
#define JSONSQL_PARSER_HPP

#include "jsonsql/Value.hpp"

#include <cstddef>
#include <string_view>

namespace jsonsql {

/**
 * @brief Deepest accepted nesting of objects and arrays
 */
inline constexpr std::size_t kMaxNestingDepth = 300;

/**
 * @brief Parse one JSON document into a Value tree
 *
 * - Object members keep source order; duplicate keys are all kept.
 * - Numbers keep their source text exactly ("1.50", "-0" and "1e400"
 *   are stored as written), whatever their magnitude.
 * - Only plain JSON types are produced (Object, Array, String, Number,
 *   Boolean, Null).
 *
 * @param buf UTF-8 JSON text
 * @return Root of the parsed tree
 * @throws ParseError if buf is not a single well-formed JSON document, or
 *         nests objects/arrays deeper than kMaxNestingDepth
 */
Value parse_bytes(std::string_view buf);

/**
 * @brief parse_bytes(), reading empty input as kNullBytes
 *
 * An empty column value stands for SQL NULL rather than malformed JSON.
 */
Value parse_bytes_or_null(std::string_view buf);

} // namespace jsonsql

#endif // JSONSQL_PARSER_HPP
