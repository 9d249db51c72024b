#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace cmdrun::config_format {

// TOML document model. Only what the config reader needs to walk the tree
// and check types; comments and formatting are not preserved.
struct Table;

struct Value {
    enum class Type { String, Integer, Float, Boolean, DateTime, Array, Table };

    Type type = Type::String;
    std::string text;       // String, DateTime (raw token)
    int64_t integer = 0;
    double floating = 0.0;
    bool boolean = false;
    std::vector<Value> array;
    std::shared_ptr<Table> table;

    // Array created by [[header]] entries
    bool array_of_tables = false;
};

struct Table {
    std::map<std::string, Value> entries;

    bool defined_by_header = false;
    bool defined_by_dotted_key = false;
    bool is_inline = false;

    [[nodiscard]] const Value* find(const std::string& key) const;
};

class FormatError : public std::runtime_error {
public:
    FormatError(size_t line, size_t column, const std::string& message);

    [[nodiscard]] size_t line() const noexcept { return line_; }
    [[nodiscard]] size_t column() const noexcept { return column_; }

private:
    size_t line_;
    size_t column_;
};

[[nodiscard]] const char* type_name(Value::Type type);

// Parse a whole document. Throws FormatError.
[[nodiscard]] Table parse(std::string_view text);

// Render a TOML basic string (with surrounding quotes).
[[nodiscard]] std::string quote_string(std::string_view value);

} // namespace cmdrun::config_format
