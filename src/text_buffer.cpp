#include "text_buffer.hpp"
#include <algorithm>

namespace cmdrun {

EditAction EditAction::insert(const size_t offset, std::string text) {
    return {Kind::Insert, offset, 0, std::move(text)};
}

EditAction EditAction::erase(const size_t offset, const size_t length) {
    return {Kind::Erase, offset, length, {}};
}

EditAction EditAction::replace_all(std::string text) {
    return {Kind::ReplaceAll, 0, 0, std::move(text)};
}

TextBuffer::TextBuffer(std::string text)
    : text_(std::move(text)) {}

size_t TextBuffer::line_count() const {
    return static_cast<size_t>(std::ranges::count(text_, '\n')) + 1;
}

void TextBuffer::perform(const EditAction& action) {
    const size_t offset = std::min(action.offset, text_.size());
    switch (action.kind) {
        case EditAction::Kind::Insert:
            text_.insert(offset, action.text);
            break;
        case EditAction::Kind::Erase:
            text_.erase(offset, std::min(action.length, text_.size() - offset));
            break;
        case EditAction::Kind::ReplaceAll:
            text_ = action.text;
            break;
    }
}

} // namespace cmdrun
