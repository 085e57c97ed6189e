/**
 * @file SqlString.cpp
 * @brief SQL literal encoding
 */

#include "jsonsql/SqlString.hpp"

namespace jsonsql {

namespace {

/**
 * @brief Escape character for a byte, or 0 if it is copied unchanged
 */
char sql_escape_for(unsigned char c) {
    switch (c) {
        case '\0':   return '0';
        case '\'':   return '\'';
        case '"':    return '"';
        case '\b':   return 'b';
        case '\n':   return 'n';
        case '\r':   return 'r';
        case '\t':   return 't';
        case '\x1a': return 'Z';
        case '\\':   return '\\';
        default:     return 0;
    }
}

} // anonymous namespace

std::string encode_string_sql(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 2);
    out += '\'';
    for (char c : text) {
        char esc = sql_escape_for(static_cast<unsigned char>(c));
        if (esc != 0) {
            out += '\\';
            out += esc;
        } else {
            out += c;
        }
    }
    out += '\'';
    return out;
}

std::string encode_hex(std::string_view bytes) {
    static const char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (char c : bytes) {
        auto b = static_cast<unsigned char>(c);
        out += kDigits[b >> 4];
        out += kDigits[b & 0x0f];
    }
    return out;
}

std::string bits_to_binary_text(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size() * 8);
    for (char c : bytes) {
        auto b = static_cast<unsigned char>(c);
        for (int shift = 7; shift >= 0; --shift) {
            const char digit = ((b >> shift) & 1) ? '1' : '0';
            if (out.empty() && digit == '0') continue;
            out += digit;
        }
    }
    if (out.empty()) out = "0";
    return out;
}

} // namespace jsonsql
