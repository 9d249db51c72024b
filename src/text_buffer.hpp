#pragma once

#include <cstddef>
#include <string>

namespace cmdrun {

// Edit applied to a TextBuffer. Offsets are byte offsets and clamp to the buffer.
struct EditAction {
    enum class Kind { Insert, Erase, ReplaceAll };

    Kind kind = Kind::ReplaceAll;
    size_t offset = 0;
    size_t length = 0;
    std::string text;

    static EditAction insert(size_t offset, std::string text);
    static EditAction erase(size_t offset, size_t length);
    static EditAction replace_all(std::string text);
};

class TextBuffer {
public:
    TextBuffer() = default;
    explicit TextBuffer(std::string text);

    [[nodiscard]] const std::string& text() const { return text_; }
    [[nodiscard]] size_t line_count() const;
    [[nodiscard]] bool empty() const { return text_.empty(); }

    void perform(const EditAction& action);

private:
    std::string text_;
};

} // namespace cmdrun
