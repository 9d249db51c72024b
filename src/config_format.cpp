#include "config_format.hpp"
#include "utf8.hpp"
#include <charconv>
#include <format>
#include <limits>

namespace cmdrun::config_format {

const Value* Table::find(const std::string& key) const {
    if (const auto it = entries.find(key); it != entries.end()) {
        return &it->second;
    }
    return nullptr;
}

FormatError::FormatError(const size_t line, const size_t column, const std::string& message)
    : std::runtime_error(std::format("line {}, column {}: {}", line, column, message))
    , line_(line)
    , column_(column) {}

const char* type_name(const Value::Type type) {
    switch (type) {
        case Value::Type::String: return "string";
        case Value::Type::Integer: return "integer";
        case Value::Type::Float: return "float";
        case Value::Type::Boolean: return "boolean";
        case Value::Type::DateTime: return "date-time";
        case Value::Type::Array: return "array";
        case Value::Type::Table: return "table";
    }
    return "unknown";
}

namespace {

// Arrays and inline tables are parsed recursively
constexpr size_t kMaxNesting = 128;

bool is_digit(const char c) {
    return c >= '0' && c <= '9';
}

bool is_hex_digit(const char c) {
    return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

bool is_bare_key_char(const char c) {
    return is_digit(c) || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '-';
}

bool is_control(const char ch) {
    const auto c = static_cast<unsigned char>(ch);
    return (c < 0x20 && c != '\t') || c == 0x7F;
}

bool is_token_char(const char c) {
    return is_bare_key_char(c) || c == '+' || c == '.' || c == ':';
}

Value make_table_value(const bool is_inline) {
    Value value;
    value.type = Value::Type::Table;
    value.table = std::make_shared<Table>();
    value.table->is_inline = is_inline;
    return value;
}

std::string join_keys(const std::vector<std::string>& keys) {
    std::string joined;
    for (const auto& key : keys) {
        if (!joined.empty()) joined.push_back('.');
        joined += key;
    }
    return joined;
}

// Checks "N digits" at token[pos].
bool digits_at(std::string_view token, const size_t pos, const size_t count) {
    if (pos + count > token.size()) return false;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!is_digit(token[i])) return false;
    }
    return true;
}

int two_digits(std::string_view token, const size_t pos) {
    return (token[pos] - '0') * 10 + (token[pos + 1] - '0');
}

// HH:MM:SS(.fraction)? starting at pos; returns end position or npos.
size_t match_time(std::string_view token, size_t pos) {
    if (!digits_at(token, pos, 2) || pos + 2 >= token.size() || token[pos + 2] != ':') return std::string_view::npos;
    if (!digits_at(token, pos + 3, 2) || pos + 5 >= token.size() || token[pos + 5] != ':') return std::string_view::npos;
    if (!digits_at(token, pos + 6, 2)) return std::string_view::npos;
    // Leap second allowed
    if (two_digits(token, pos) > 23 || two_digits(token, pos + 3) > 59 || two_digits(token, pos + 6) > 60) {
        return std::string_view::npos;
    }
    pos += 8;
    if (pos < token.size() && token[pos] == '.') {
        const size_t frac_start = ++pos;
        while (pos < token.size() && is_digit(token[pos])) ++pos;
        if (pos == frac_start) return std::string_view::npos;
    }
    return pos;
}

bool is_valid_datetime(std::string_view token) {
    // Local time
    if (match_time(token, 0) == token.size()) return true;

    const bool has_date = digits_at(token, 0, 4) && token.size() >= 10 && token[4] == '-' &&
                          digits_at(token, 5, 2) && token[7] == '-' && digits_at(token, 8, 2);
    if (!has_date) return false;
    const int month = two_digits(token, 5);
    const int day = two_digits(token, 8);
    if (month < 1 || month > 12 || day < 1 || day > 31) return false;
    if (token.size() == 10) return true;

    const char sep = token[10];
    if (sep != 'T' && sep != 't' && sep != ' ') return false;

    size_t pos = match_time(token, 11);
    if (pos == std::string_view::npos) return false;
    if (pos == token.size()) return true;

    if ((token[pos] == 'Z' || token[pos] == 'z') && pos + 1 == token.size()) return true;
    if (token[pos] == '+' || token[pos] == '-') {
        return pos + 6 == token.size() && digits_at(token, pos + 1, 2) && token[pos + 3] == ':' &&
               digits_at(token, pos + 4, 2);
    }
    return false;
}

class Parser {
public:
    explicit Parser(std::string_view src) : src_(src) {}

    Table parse_document() {
        if (src_.starts_with("\xEF\xBB\xBF")) pos_ = 3;

        Table root;
        Table* current = &root;

        while (true) {
            skip_ws();
            if (at_end()) break;

            const char c = peek();
            if (c == '#') {
                skip_comment();
            } else if (c == '\n' || c == '\r') {
                consume_newline();
                continue;
            } else if (c == '[') {
                current = parse_table_header(root);
            } else {
                parse_key_value(*current);
            }
            expect_line_end();
        }
        return root;
    }

private:
    std::string_view src_;
    size_t pos_ = 0;
    size_t depth_ = 0;  // open arrays and inline tables

    [[nodiscard]] bool at_end() const { return pos_ >= src_.size(); }
    [[nodiscard]] char peek() const { return src_[pos_]; }
    [[nodiscard]] bool looking_at(std::string_view s) const { return src_.substr(pos_).starts_with(s); }

    [[noreturn]] void fail(const std::string& message) const {
        fail_at(pos_, message);
    }

    [[noreturn]] void fail_at(const size_t at, const std::string& message) const {
        size_t line = 1;
        size_t column = 1;
        for (size_t i = 0; i < at && i < src_.size(); ++i) {
            if (src_[i] == '\n') {
                ++line;
                column = 1;
            } else {
                ++column;
            }
        }
        throw FormatError(line, column, message);
    }

    void expect(const char c) {
        if (at_end() || peek() != c) {
            fail(std::format("expected '{}'", c));
        }
        ++pos_;
    }

    void skip_ws() {
        while (!at_end() && (peek() == ' ' || peek() == '\t')) ++pos_;
    }

    void skip_comment() {
        ++pos_;  // '#'
        while (!at_end() && peek() != '\n') {
            if (peek() == '\r' && pos_ + 1 < src_.size() && src_[pos_ + 1] == '\n') break;
            if (is_control(peek())) fail("control character in comment");
            ++pos_;
        }
    }

    void consume_newline() {
        if (peek() == '\n') {
            ++pos_;
        } else if (looking_at("\r\n")) {
            pos_ += 2;
        } else {
            fail("bare carriage return");
        }
    }

    void expect_line_end() {
        skip_ws();
        if (at_end()) return;
        if (peek() == '#') {
            skip_comment();
            if (at_end()) return;
        }
        if (peek() != '\n' && peek() != '\r') {
            fail("expected end of line");
        }
        consume_newline();
    }

    void skip_ws_comments_newlines() {
        while (true) {
            skip_ws();
            if (at_end()) return;
            if (peek() == '#') {
                skip_comment();
            } else if (peek() == '\n' || peek() == '\r') {
                consume_newline();
            } else {
                return;
            }
        }
    }

    std::vector<std::string> parse_key() {
        std::vector<std::string> keys;
        while (true) {
            skip_ws();
            keys.push_back(parse_simple_key());
            skip_ws();
            if (!at_end() && peek() == '.') {
                ++pos_;
                continue;
            }
            return keys;
        }
    }

    std::string parse_simple_key() {
        if (at_end()) fail("expected a key");

        if (peek() == '"') {
            if (looking_at("\"\"\"")) fail("multi-line strings are not allowed as keys");
            return parse_basic_string();
        }
        if (peek() == '\'') {
            if (looking_at("'''")) fail("multi-line strings are not allowed as keys");
            return parse_literal_string();
        }

        const size_t start = pos_;
        while (!at_end() && is_bare_key_char(peek())) ++pos_;
        if (pos_ == start) fail("expected a key");
        return std::string(src_.substr(start, pos_ - start));
    }

    void parse_key_value(Table& table) {
        const size_t key_pos = pos_;
        const auto keys = parse_key();
        skip_ws();
        expect('=');
        skip_ws();
        Value value = parse_value();
        insert(table, keys, std::move(value), key_pos);
    }

    void insert(Table& table, const std::vector<std::string>& keys, Value value, const size_t key_pos) {
        Table* target = &table;
        for (size_t i = 0; i + 1 < keys.size(); ++i) {
            auto it = target->entries.find(keys[i]);
            if (it == target->entries.end()) {
                Value sub = make_table_value(false);
                sub.table->defined_by_dotted_key = true;
                it = target->entries.emplace(keys[i], std::move(sub)).first;
            } else if (it->second.type != Value::Type::Table || it->second.table->is_inline) {
                fail_at(key_pos, std::format("cannot add keys to '{}'", join_keys(keys)));
            }
            target = it->second.table.get();
        }

        if (target->entries.contains(keys.back())) {
            fail_at(key_pos, std::format("duplicate key '{}'", join_keys(keys)));
        }
        target->entries.emplace(keys.back(), std::move(value));
    }

    Table* parse_table_header(Table& root) {
        const size_t header_pos = pos_;
        ++pos_;  // '['
        const bool array_of_tables = !at_end() && peek() == '[';
        if (array_of_tables) ++pos_;

        const auto keys = parse_key();
        skip_ws();
        expect(']');
        if (array_of_tables) expect(']');

        Table* target = &root;
        for (size_t i = 0; i + 1 < keys.size(); ++i) {
            auto it = target->entries.find(keys[i]);
            if (it == target->entries.end()) {
                it = target->entries.emplace(keys[i], make_table_value(false)).first;
            }

            Value& entry = it->second;
            if (entry.type == Value::Type::Table && !entry.table->is_inline) {
                target = entry.table.get();
            } else if (entry.type == Value::Type::Array && entry.array_of_tables) {
                target = entry.array.back().table.get();
            } else {
                fail_at(header_pos, std::format("key '{}' is not a table", keys[i]));
            }
        }

        const std::string& name = keys.back();
        auto it = target->entries.find(name);

        if (array_of_tables) {
            if (it == target->entries.end()) {
                Value array;
                array.type = Value::Type::Array;
                array.array_of_tables = true;
                it = target->entries.emplace(name, std::move(array)).first;
            } else if (it->second.type != Value::Type::Array || !it->second.array_of_tables) {
                fail_at(header_pos, std::format("key '{}' is not an array of tables", join_keys(keys)));
            }
            Value element = make_table_value(false);
            element.table->defined_by_header = true;
            it->second.array.push_back(std::move(element));
            return it->second.array.back().table.get();
        }

        if (it == target->entries.end()) {
            it = target->entries.emplace(name, make_table_value(false)).first;
        } else if (it->second.type != Value::Type::Table) {
            fail_at(header_pos, std::format("key '{}' is not a table", join_keys(keys)));
        } else {
            const auto& existing = *it->second.table;
            if (existing.defined_by_header || existing.defined_by_dotted_key || existing.is_inline) {
                fail_at(header_pos, std::format("table '{}' defined more than once", join_keys(keys)));
            }
        }
        it->second.table->defined_by_header = true;
        return it->second.table.get();
    }

    Value parse_value() {
        if (at_end()) fail("expected a value");

        Value value;
        const char c = peek();
        if (c == '"') {
            value.type = Value::Type::String;
            value.text = looking_at("\"\"\"") ? parse_multiline_basic_string() : parse_basic_string();
        } else if (c == '\'') {
            value.type = Value::Type::String;
            value.text = looking_at("'''") ? parse_multiline_literal_string() : parse_literal_string();
        } else if (c == '[' || c == '{') {
            if (++depth_ > kMaxNesting) fail("nesting too deep");
            value = c == '[' ? parse_array() : parse_inline_table();
            --depth_;
        } else if (looking_at("true") && !continues_token(4)) {
            pos_ += 4;
            value.type = Value::Type::Boolean;
            value.boolean = true;
        } else if (looking_at("false") && !continues_token(5)) {
            pos_ += 5;
            value.type = Value::Type::Boolean;
            value.boolean = false;
        } else if (is_digit(c) || c == '+' || c == '-' || c == 'i' || c == 'n') {
            value = parse_number_or_datetime();
        } else {
            fail("invalid value");
        }
        return value;
    }

    [[nodiscard]] bool continues_token(const size_t length) const {
        return pos_ + length < src_.size() && is_token_char(src_[pos_ + length]);
    }

    Value parse_array() {
        const size_t start = pos_;
        ++pos_;  // '['

        Value array;
        array.type = Value::Type::Array;

        while (true) {
            skip_ws_comments_newlines();
            if (at_end()) fail_at(start, "unterminated array");
            if (peek() == ']') {
                ++pos_;
                return array;
            }

            array.array.push_back(parse_value());

            skip_ws_comments_newlines();
            if (at_end()) fail_at(start, "unterminated array");
            if (peek() == ',') {
                ++pos_;
            } else if (peek() == ']') {
                ++pos_;
                return array;
            } else {
                fail("expected ',' or ']' in array");
            }
        }
    }

    Value parse_inline_table() {
        ++pos_;  // '{'
        Value value = make_table_value(true);

        skip_ws();
        if (!at_end() && peek() == '}') {
            ++pos_;
            return value;
        }

        while (true) {
            const size_t key_pos = pos_;
            const auto keys = parse_key();
            skip_ws();
            expect('=');
            skip_ws();
            Value item = parse_value();
            insert(*value.table, keys, std::move(item), key_pos);

            skip_ws();
            if (at_end()) fail("unterminated inline table");
            if (peek() == ',') {
                ++pos_;
                skip_ws();
            } else if (peek() == '}') {
                ++pos_;
                return value;
            } else {
                fail("expected ',' or '}' in inline table");
            }
        }
    }

    void parse_escape(std::string& out) {
        if (at_end()) fail("unterminated escape sequence");

        const char e = src_[pos_++];
        switch (e) {
            case 'b': out.push_back('\b'); return;
            case 't': out.push_back('\t'); return;
            case 'n': out.push_back('\n'); return;
            case 'f': out.push_back('\f'); return;
            case 'r': out.push_back('\r'); return;
            case '"': out.push_back('"'); return;
            case '\\': out.push_back('\\'); return;
            case 'u': append_code_point(out, 4); return;
            case 'U': append_code_point(out, 8); return;
            default:
                fail_at(pos_ - 2, std::format("invalid escape sequence '\\{}'", e));
        }
    }

    void append_code_point(std::string& out, const size_t digits) {
        const size_t start = pos_ - 2;
        char32_t cp = 0;
        for (size_t i = 0; i < digits; ++i) {
            if (at_end() || !is_hex_digit(peek())) {
                fail_at(start, "invalid unicode escape");
            }
            const char h = src_[pos_++];
            const char32_t digit = is_digit(h) ? h - '0' : (h >= 'a' ? h - 'a' + 10 : h - 'A' + 10);
            cp = cp * 16 + digit;
        }
        if (!append_utf8(out, cp)) {
            fail_at(start, "escape is not a unicode scalar value");
        }
    }

    std::string parse_basic_string() {
        const size_t start = pos_;
        ++pos_;
        std::string out;
        while (true) {
            if (at_end()) fail_at(start, "unterminated string");
            const char c = src_[pos_++];
            if (c == '"') return out;
            if (c == '\\') {
                parse_escape(out);
            } else if (c == '\n' || c == '\r') {
                fail_at(pos_ - 1, "newline in single-line string");
            } else if (is_control(c)) {
                fail_at(pos_ - 1, "control character in string");
            } else {
                out.push_back(c);
            }
        }
    }

    std::string parse_literal_string() {
        const size_t start = pos_;
        ++pos_;
        std::string out;
        while (true) {
            if (at_end()) fail_at(start, "unterminated string");
            const char c = src_[pos_++];
            if (c == '\'') return out;
            if (c == '\n' || c == '\r') {
                fail_at(pos_ - 1, "newline in single-line string");
            } else if (is_control(c)) {
                fail_at(pos_ - 1, "control character in string");
            }
            out.push_back(c);
        }
    }

    // Consumes the closing delimiter run of a multi-line string. Up to two
    // quote characters directly before the delimiter belong to the content.
    bool close_multiline(const char quote, std::string& out) {
        size_t run = 0;
        while (pos_ + run < src_.size() && src_[pos_ + run] == quote) ++run;
        if (run < 3) return false;
        if (run > 5) fail("too many quotes at end of multi-line string");
        out.append(run - 3, quote);
        pos_ += run;
        return true;
    }

    void skip_leading_newline() {
        if (looking_at("\n")) {
            pos_ += 1;
        } else if (looking_at("\r\n")) {
            pos_ += 2;
        }
    }

    std::string parse_multiline_basic_string() {
        const size_t start = pos_;
        pos_ += 3;
        skip_leading_newline();

        std::string out;
        while (true) {
            if (at_end()) fail_at(start, "unterminated multi-line string");
            if (peek() == '"' && close_multiline('"', out)) return out;

            const char c = src_[pos_++];
            if (c == '\\') {
                // Line-ending backslash trims following whitespace and newlines
                size_t look = pos_;
                while (look < src_.size() && (src_[look] == ' ' || src_[look] == '\t')) ++look;
                if (look < src_.size() && (src_[look] == '\n' || src_[look] == '\r')) {
                    pos_ = look;
                    skip_ws_and_newlines_in_string();
                } else {
                    parse_escape(out);
                }
            } else if (c == '\r') {
                if (at_end() || peek() != '\n') fail_at(pos_ - 1, "bare carriage return");
                ++pos_;
                out.push_back('\n');
            } else if (c != '\n' && is_control(c)) {
                fail_at(pos_ - 1, "control character in string");
            } else {
                out.push_back(c);
            }
        }
    }

    void skip_ws_and_newlines_in_string() {
        while (!at_end()) {
            const char c = peek();
            if (c == ' ' || c == '\t' || c == '\n') {
                ++pos_;
            } else if (looking_at("\r\n")) {
                pos_ += 2;
            } else {
                return;
            }
        }
    }

    std::string parse_multiline_literal_string() {
        const size_t start = pos_;
        pos_ += 3;
        skip_leading_newline();

        std::string out;
        while (true) {
            if (at_end()) fail_at(start, "unterminated multi-line string");
            if (peek() == '\'' && close_multiline('\'', out)) return out;

            const char c = src_[pos_++];
            if (c == '\r') {
                if (at_end() || peek() != '\n') fail_at(pos_ - 1, "bare carriage return");
                ++pos_;
                out.push_back('\n');
            } else if (c != '\n' && is_control(c)) {
                fail_at(pos_ - 1, "control character in string");
            } else {
                out.push_back(c);
            }
        }
    }

    Value parse_number_or_datetime() {
        const size_t start = pos_;
        while (!at_end() && is_token_char(peek())) ++pos_;

        // "1979-05-27 07:32:00": a space may separate date and time
        if (pos_ - start == 10 && pos_ + 3 < src_.size() && src_[pos_] == ' ' &&
            is_digit(src_[pos_ + 1]) && is_digit(src_[pos_ + 2]) && src_[pos_ + 3] == ':') {
            ++pos_;
            while (!at_end() && is_token_char(peek())) ++pos_;
        }

        const std::string_view token = src_.substr(start, pos_ - start);
        Value value;

        const bool date_like = token.find(':') != std::string_view::npos ||
                               (token.size() >= 10 && digits_at(token, 0, 4) && token[4] == '-');
        if (date_like) {
            if (!is_valid_datetime(token)) fail_at(start, std::format("invalid date-time '{}'", token));
            value.type = Value::Type::DateTime;
            value.text = std::string(token);
            return value;
        }

        parse_number(token, start, value);
        return value;
    }

    void parse_number(std::string_view token, const size_t start, Value& value) const {
        std::string_view body = token;
        bool negative = false;
        const bool has_sign = !body.empty() && (body[0] == '+' || body[0] == '-');
        if (has_sign) {
            negative = body[0] == '-';
            body.remove_prefix(1);
        }

        if (body == "inf" || body == "nan") {
            value.type = Value::Type::Float;
            value.floating = body == "inf" ? std::numeric_limits<double>::infinity()
                                           : std::numeric_limits<double>::quiet_NaN();
            if (negative) value.floating = -value.floating;
            return;
        }

        if (body.size() > 2 && body[0] == '0' && (body[1] == 'x' || body[1] == 'o' || body[1] == 'b')) {
            if (has_sign) fail_at(start, "sign is not allowed on prefixed integers");
            const int base = body[1] == 'x' ? 16 : (body[1] == 'o' ? 8 : 2);
            const std::string digits = strip_underscores(body.substr(2), start);
            value.type = Value::Type::Integer;
            const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value.integer, base);
            if (ec == std::errc::result_out_of_range) fail_at(start, std::format("integer '{}' out of range", token));
            if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
                fail_at(start, std::format("invalid integer '{}'", token));
            }
            return;
        }

        if (body.empty() || !is_digit(body[0])) fail_at(start, std::format("invalid number '{}'", token));

        const size_t int_end = body.find_first_of(".eE");
        const std::string_view int_part = body.substr(0, int_end);
        if (int_part.size() > 1 && int_part[0] == '0') {
            fail_at(start, std::format("leading zeros are not allowed in '{}'", token));
        }

        const std::string clean = (negative ? "-" : "") + strip_underscores(body, start);

        if (int_end == std::string_view::npos) {
            value.type = Value::Type::Integer;
            const auto [ptr, ec] = std::from_chars(clean.data(), clean.data() + clean.size(), value.integer);
            if (ec == std::errc::result_out_of_range) fail_at(start, std::format("integer '{}' out of range", token));
            if (ec != std::errc{} || ptr != clean.data() + clean.size()) {
                fail_at(start, std::format("invalid integer '{}'", token));
            }
            return;
        }

        if (const size_t dot = body.find('.'); dot != std::string_view::npos) {
            if (dot + 1 >= body.size() || !is_digit(body[dot + 1])) {
                fail_at(start, std::format("invalid float '{}'", token));
            }
        }

        value.type = Value::Type::Float;
        const auto [ptr, ec] = std::from_chars(clean.data(), clean.data() + clean.size(), value.floating);
        if (ec != std::errc{} || ptr != clean.data() + clean.size()) {
            fail_at(start, std::format("invalid float '{}'", token));
        }
    }

    // Underscores must sit between two digits.
    std::string strip_underscores(std::string_view text, const size_t start) const {
        std::string out;
        out.reserve(text.size());
        for (size_t i = 0; i < text.size(); ++i) {
            if (text[i] == '_') {
                if (i == 0 || i + 1 >= text.size() || !is_hex_digit(text[i - 1]) || !is_hex_digit(text[i + 1])) {
                    fail_at(start, "misplaced underscore in number");
                }
                continue;
            }
            out.push_back(text[i]);
        }
        return out;
    }
};

} // namespace

Table parse(std::string_view text) {
    if (!is_valid_utf8(text)) {
        throw FormatError(1, 1, "document is not valid UTF-8");
    }
    Parser parser(text);
    return parser.parse_document();
}

std::string quote_string(std::string_view value) {
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('"');
    for (const char c : value) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\t': out += "\\t"; break;
            case '\n': out += "\\n"; break;
            case '\f': out += "\\f"; break;
            case '\r': out += "\\r"; break;
            default:
                if (is_control(c)) {
                    out += std::format("\\u{:04X}", static_cast<unsigned>(static_cast<unsigned char>(c)));
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
    return out;
}

} // namespace cmdrun::config_format
