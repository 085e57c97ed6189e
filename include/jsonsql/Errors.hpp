/**
 * @file Errors.hpp
 * @brief Exception types for jsonsql
 *
 * Error taxonomy:
 * - JsonSqlError: Base class
 * - ParseError: Malformed JSON input bytes
 * - FileNotFoundError: Input or settings file not found
 * - SettingsError: Invalid settings file, key or value
 */

#ifndef JSONSQL_ERRORS_HPP
#define JSONSQL_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace jsonsql {

/**
 * @brief Base class for all jsonsql exceptions
 */
class JsonSqlError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Input bytes are not a well-formed JSON document
 *
 * Raised by parse_bytes() and propagated unchanged by marshal_sql_value().
 */
class ParseError : public JsonSqlError {
public:
    /**
     * @brief Construct with byte position and parser diagnostic
     * @param position Byte offset where parsing stopped
     * @param details Detailed error message from the parser
     */
    ParseError(std::size_t position, std::string details)
        : JsonSqlError("JSON parse error at byte " + std::to_string(position) +
                       ": " + details)
        , position_(position)
        , details_(std::move(details))
    {}

    /**
     * @brief Byte offset where parsing stopped
     */
    std::size_t position() const noexcept {
        return position_;
    }

    /**
     * @brief Get detailed error message
     */
    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::size_t position_;
    std::string details_;
};

/**
 * @brief Input or settings file not found
 */
class FileNotFoundError : public JsonSqlError {
public:
    explicit FileNotFoundError(std::string path)
        : JsonSqlError("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Settings could not be loaded or hold an invalid value
 */
class SettingsError : public JsonSqlError {
public:
    /**
     * @brief Construct with the offending key and error details
     * @param key Settings key (e.g., "top_level"), or file path for file errors
     * @param details What is wrong with it
     */
    SettingsError(std::string key, std::string details)
        : JsonSqlError("Invalid setting '" + key + "': " + details)
        , key_(std::move(key))
        , details_(std::move(details))
    {}

    const std::string& key() const noexcept {
        return key_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string key_;
    std::string details_;
};

} // namespace jsonsql

#endif // JSONSQL_ERRORS_HPP
