#include "shell_words.hpp"
#include "errors.hpp"
#include <format>

namespace cmdrun::shell_words {

namespace {

enum class State {
    Delimiter,
    Backslash,
    Unquoted,
    UnquotedBackslash,
    SingleQuoted,
    DoubleQuoted,
    DoubleQuotedBackslash,
    Comment
};

bool is_blank(const char c) {
    return c == ' ' || c == '\t' || c == '\n';
}

bool needs_no_quoting(const char c) {
    if (c >= 'a' && c <= 'z') return true;
    if (c >= 'A' && c <= 'Z') return true;
    if (c >= '0' && c <= '9') return true;
    switch (c) {
        case '_': case '@': case '%': case '+': case '=':
        case ':': case ',': case '.': case '/': case '-':
            return true;
        default:
            return false;
    }
}

[[noreturn]] void unterminated(const char* what, const size_t offset) {
    throw Error(ErrorKind::ArgumentParse, "could not parse arguments",
                std::format("could not parse arguments\nmissing closing {} quote (opened at offset {})", what, offset));
}

} // namespace

std::vector<std::string> split(std::string_view text) {
    std::vector<std::string> words;
    std::string word;
    State state = State::Delimiter;
    size_t quote_start = 0;

    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        switch (state) {
            case State::Delimiter:
                if (is_blank(c)) break;
                if (c == '\\') state = State::Backslash;
                else if (c == '\'') { state = State::SingleQuoted; quote_start = i; }
                else if (c == '"') { state = State::DoubleQuoted; quote_start = i; }
                else if (c == '#') state = State::Comment;
                else { word.push_back(c); state = State::Unquoted; }
                break;

            case State::Backslash:
                // Backslash-newline between words is a line continuation
                if (c == '\n') state = State::Delimiter;
                else { word.push_back(c); state = State::Unquoted; }
                break;

            case State::Unquoted:
                if (is_blank(c)) {
                    words.push_back(std::move(word));
                    word.clear();
                    state = State::Delimiter;
                } else if (c == '\\') state = State::UnquotedBackslash;
                else if (c == '\'') { state = State::SingleQuoted; quote_start = i; }
                else if (c == '"') { state = State::DoubleQuoted; quote_start = i; }
                else word.push_back(c);
                break;

            case State::UnquotedBackslash:
                if (c != '\n') word.push_back(c);
                state = State::Unquoted;
                break;

            case State::SingleQuoted:
                if (c == '\'') state = State::Unquoted;
                else word.push_back(c);
                break;

            case State::DoubleQuoted:
                if (c == '"') state = State::Unquoted;
                else if (c == '\\') state = State::DoubleQuotedBackslash;
                else word.push_back(c);
                break;

            case State::DoubleQuotedBackslash:
                switch (c) {
                    case '\n':
                        break;
                    case '$': case '`': case '"': case '\\':
                        word.push_back(c);
                        break;
                    default:
                        word.push_back('\\');
                        word.push_back(c);
                        break;
                }
                state = State::DoubleQuoted;
                break;

            case State::Comment:
                if (c == '\n') state = State::Delimiter;
                break;
        }
    }

    switch (state) {
        case State::Delimiter:
        case State::Comment:
            break;
        case State::Backslash:
        case State::UnquotedBackslash:
            word.push_back('\\');
            words.push_back(std::move(word));
            break;
        case State::Unquoted:
            words.push_back(std::move(word));
            break;
        case State::SingleQuoted:
            unterminated("single", quote_start);
        case State::DoubleQuoted:
        case State::DoubleQuotedBackslash:
            unterminated("double", quote_start);
    }

    return words;
}

std::string quote(std::string_view word) {
    if (word.empty()) return "\"\"";

    bool plain = true;
    for (const char c : word) {
        if (!needs_no_quoting(c)) {
            plain = false;
            break;
        }
    }
    if (plain) return std::string(word);

    std::string quoted;
    quoted.reserve(word.size() + 2);
    quoted.push_back('"');
    for (const char c : word) {
        if (c == '$' || c == '`' || c == '"' || c == '\\') {
            quoted.push_back('\\');
        }
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

std::string join(const std::vector<std::string>& words) {
    std::string joined;
    for (const auto& word : words) {
        if (!joined.empty()) joined.push_back(' ');
        joined += quote(word);
    }
    return joined;
}

} // namespace cmdrun::shell_words
