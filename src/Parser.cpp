/**
 * @file Parser.cpp
 * @brief JSON parsing through nlohmann::json's SAX interface
 *
 * nlohmann::json converts every number to int64/uint64/double, which
 * loses the source text and fails on doubles out of range. Before parsing,
 * scan_input() lifts each number lexeme out of the text and leaves a
 * same-width "0" in its place; the SAX handler then takes the lexemes back
 * in document order. Byte positions in nlohmann's diagnostics stay valid.
 */

#include "jsonsql/Parser.hpp"
#include "jsonsql/Errors.hpp"
#include "jsonsql/SqlValue.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace jsonsql {

namespace {

struct ScannedInput {
    std::string text;                  // input with numbers masked
    std::vector<std::string> numbers;  // lexemes, document order
    std::size_t overflow_offset = 0;   // first '[' or '{' past kMaxNestingDepth
};

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool is_number_char(char c) {
    return is_digit(c) || c == '-' || c == '+' || c == '.' || c == 'e' || c == 'E';
}

/**
 * @brief Match -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
 */
bool is_json_number(std::string_view s) {
    std::size_t i = 0;
    const std::size_t n = s.size();

    if (i < n && s[i] == '-') ++i;
    if (i >= n || !is_digit(s[i])) return false;
    if (s[i] == '0') {
        ++i;
    } else {
        while (i < n && is_digit(s[i])) ++i;
    }

    if (i < n && s[i] == '.') {
        ++i;
        if (i >= n || !is_digit(s[i])) return false;
        while (i < n && is_digit(s[i])) ++i;
    }

    if (i < n && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        if (i < n && (s[i] == '+' || s[i] == '-')) ++i;
        if (i >= n || !is_digit(s[i])) return false;
        while (i < n && is_digit(s[i])) ++i;
    }

    return i == n;
}

/**
 * @brief Mask number lexemes and locate the first over-deep bracket
 *
 * String literals are copied untouched. A run of number characters that
 * is not a valid JSON number is also copied untouched, so nlohmann
 * reports it as a syntax error.
 */
ScannedInput scan_input(std::string_view buf) {
    ScannedInput out;
    out.text.reserve(buf.size());

    std::size_t depth = 0;
    bool overflowed = false;
    std::size_t i = 0;
    while (i < buf.size()) {
        const char c = buf[i];

        if (c == '"') {
            std::size_t j = i + 1;
            while (j < buf.size() && buf[j] != '"') {
                j += (buf[j] == '\\') ? 2 : 1;
            }
            const std::size_t end = std::min(j + 1, buf.size());
            out.text.append(buf.substr(i, end - i));
            i = end;
            continue;
        }

        if (c == '-' || is_digit(c)) {
            std::size_t j = i;
            while (j < buf.size() && is_number_char(buf[j])) ++j;
            std::string_view lexeme = buf.substr(i, j - i);
            if (is_json_number(lexeme)) {
                out.text += '0';
                out.text.append(lexeme.size() - 1, ' ');
                out.numbers.emplace_back(lexeme);
            } else {
                out.text.append(lexeme);
            }
            i = j;
            continue;
        }

        if (c == '[' || c == '{') {
            if (++depth > kMaxNestingDepth && !overflowed) {
                out.overflow_offset = i;
                overflowed = true;
            }
        } else if ((c == ']' || c == '}') && depth > 0) {
            --depth;
        }
        out.text += c;
        ++i;
    }
    return out;
}

/**
 * @brief SAX handler that assembles an immutable Value tree bottom-up
 *
 * Open containers live on a stack of frames; a container becomes a Value
 * only once its closing bracket is seen.
 */
class TreeBuilder final : public nlohmann::json_sax<nlohmann::json> {
public:
    explicit TreeBuilder(std::vector<std::string> numbers)
        : numbers_(std::move(numbers)) {}

    bool null() override {
        return emit(Value::null());
    }

    bool boolean(bool val) override {
        return emit(Value::boolean(val));
    }

    bool number_integer(number_integer_t val) override {
        return emit(Value::number(next_number(std::to_string(val))));
    }

    bool number_unsigned(number_unsigned_t val) override {
        return emit(Value::number(next_number(std::to_string(val))));
    }

    bool number_float(number_float_t /*val*/, const string_t& s) override {
        return emit(Value::number(next_number(s)));
    }

    bool string(string_t& val) override {
        return emit(Value::string(std::move(val)));
    }

    bool binary(binary_t& val) override {
        return emit(Value::blob(std::string(val.begin(), val.end())));
    }

    bool start_object(std::size_t /*elements*/) override {
        if (!enter()) return false;
        frames_.emplace_back();
        frames_.back().is_object = true;
        return true;
    }

    bool key(string_t& val) override {
        frames_.back().pending_key = std::move(val);
        return true;
    }

    bool end_object() override {
        --depth_;
        Frame frame = std::move(frames_.back());
        frames_.pop_back();
        return emit(Value::object(std::move(frame.members)));
    }

    bool start_array(std::size_t /*elements*/) override {
        if (!enter()) return false;
        frames_.emplace_back();
        return true;
    }

    bool end_array() override {
        --depth_;
        Frame frame = std::move(frames_.back());
        frames_.pop_back();
        return emit(Value::array(std::move(frame.elements)));
    }

    bool parse_error(std::size_t position,
                     const std::string& /*last_token*/,
                     const nlohmann::detail::exception& ex) override {
        error_position_ = position;
        error_message_ = ex.what();
        return false;
    }

    bool too_deep() const noexcept { return too_deep_; }
    std::size_t error_position() const noexcept { return error_position_; }
    const std::string& error_message() const noexcept { return error_message_; }

    Value take_root() { return std::move(root_); }

private:
    struct Frame {
        bool is_object = false;
        Object members;
        Array elements;
        std::string pending_key;
    };

    bool enter() {
        if (++depth_ > kMaxNestingDepth) {
            too_deep_ = true;
            return false;
        }
        return true;
    }

    // Only a document that fails to parse can run out of lexemes; the
    // fallback keeps the builder well-defined until the error arrives.
    std::string next_number(std::string fallback) {
        if (next_ < numbers_.size()) {
            return std::move(numbers_[next_++]);
        }
        return fallback;
    }

    bool emit(Value v) {
        if (frames_.empty()) {
            root_ = std::move(v);
            return true;
        }
        Frame& top = frames_.back();
        if (top.is_object) {
            top.members.emplace_back(std::move(top.pending_key), std::move(v));
            top.pending_key.clear();
        } else {
            top.elements.push_back(std::move(v));
        }
        return true;
    }

    std::vector<std::string> numbers_;
    std::size_t next_ = 0;
    std::vector<Frame> frames_;
    std::size_t depth_ = 0;
    bool too_deep_ = false;
    Value root_;
    std::size_t error_position_ = 0;
    std::string error_message_;
};

} // anonymous namespace

Value parse_bytes(std::string_view buf) {
    ScannedInput input = scan_input(buf);
    TreeBuilder builder(std::move(input.numbers));

    const bool ok = nlohmann::json::sax_parse(input.text.begin(), input.text.end(), &builder);
    if (builder.too_deep()) {
        throw ParseError(input.overflow_offset,
                         "maximum nesting depth of " + std::to_string(kMaxNestingDepth) +
                         " exceeded");
    }
    if (!ok) {
        throw ParseError(builder.error_position(), builder.error_message());
    }
    return builder.take_root();
}

Value parse_bytes_or_null(std::string_view buf) {
    if (buf.empty()) {
        buf = kNullBytes;
    }
    return parse_bytes(buf);
}

} // namespace jsonsql
