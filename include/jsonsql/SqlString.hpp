/**
 * @file SqlString.hpp
 * @brief SQL literal encoding primitives
 */

#ifndef JSONSQL_SQLSTRING_HPP
#define JSONSQL_SQLSTRING_HPP

#include <string>
#include <string_view>

namespace jsonsql {

/**
 * @brief Quote and escape text as a MySQL string literal
 *
 * Escapes NUL, ', ", backspace, newline, carriage return, tab,
 * Ctrl-Z (0x1A) and backslash with a backslash sequence. All other bytes,
 * including multi-byte UTF-8, are copied as-is.
 *
 * ```cpp
 * encode_string_sql("a'b")   // → 'a\'b'
 * encode_string_sql("x\ny")  // → 'x\ny' (backslash, n)
 * ```
 *
 * @param text Raw text
 * @return Single-quoted literal including the quotes
 */
std::string encode_string_sql(std::string_view text);

/**
 * @brief Lowercase hexadecimal encoding of a byte sequence
 */
std::string encode_hex(std::string_view bytes);

/**
 * @brief Base-2 text of a big-endian unsigned integer
 *
 * No leading zeros; an empty or all-zero sequence yields "0".
 */
std::string bits_to_binary_text(std::string_view bytes);

} // namespace jsonsql

#endif // JSONSQL_SQLSTRING_HPP
