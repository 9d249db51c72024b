#include "text_buffer.hpp"

#include "test_support.hpp"

#include <iostream>

using cmdrun::EditAction;
using cmdrun::TextBuffer;

int main() {
    TextBuffer buffer;
    assert(buffer.empty());
    assert(buffer.line_count() == 1);

    buffer.perform(EditAction::insert(0, "--flag"));
    buffer.perform(EditAction::insert(6, " value"));
    assert(buffer.text() == "--flag value");

    buffer.perform(EditAction::insert(2, "long-"));
    assert(buffer.text() == "--long-flag value");

    buffer.perform(EditAction::erase(2, 5));
    assert(buffer.text() == "--flag value");

    // Offsets past the end clamp
    buffer.perform(EditAction::insert(1000, "\nnext"));
    assert(buffer.text() == "--flag value\nnext");
    assert(buffer.line_count() == 2);

    buffer.perform(EditAction::erase(12, 1000));
    assert(buffer.text() == "--flag value");

    buffer.perform(EditAction::erase(1000, 3));
    assert(buffer.text() == "--flag value");

    buffer.perform(EditAction::replace_all("a\nb\nc\n"));
    assert(buffer.text() == "a\nb\nc\n");
    assert(buffer.line_count() == 4);

    buffer.perform(EditAction::replace_all(""));
    assert(buffer.empty());

    const TextBuffer seeded("x y");
    assert(seeded.text() == "x y");

    std::cout << "ok\n";
    return 0;
}
