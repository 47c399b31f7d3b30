#include "text_input.hpp"
#include "utf8.hpp"
#include <algorithm>

namespace plx {

namespace {

// Printable: one whole character, not a C0/C1 control or DEL
bool is_printable(const std::string& key) {
    char32_t cp = 0;
    if (!utf8::single_code_point(key, cp)) return false;
    return cp >= 0x20 && cp != 0x7F && !(cp >= 0x80 && cp < 0xA0);
}

} // namespace

void TextInput::set_value(const std::string& value) {
    value_ = utf8::prefix(value, char_limit_);
    length_ = utf8::length(value_);
    cursor_ = std::min(cursor_, length_);
}

void TextInput::set_cursor(size_t pos) {
    cursor_ = std::min(pos, length_);
}

void TextInput::reset() {
    value_.clear();
    length_ = 0;
    cursor_ = 0;
    focused_ = false;
}

size_t TextInput::byte_at(size_t char_index) const {
    return utf8::byte_offset(value_, char_index);
}

void TextInput::insert(const std::string& ch) {
    if (length_ >= char_limit_) return;
    value_.insert(byte_at(cursor_), ch);
    ++length_;
    ++cursor_;
}

bool TextInput::handle_key(const std::string& key) {
    if (!focused_) return false;

    if (key == "backspace") {
        if (cursor_ > 0) {
            const size_t begin = byte_at(cursor_ - 1);
            value_.erase(begin, byte_at(cursor_) - begin);
            --length_;
            --cursor_;
        }
    } else if (key == "delete") {
        if (cursor_ < length_) {
            const size_t begin = byte_at(cursor_);
            value_.erase(begin, utf8::sequence_length(value_, begin));
            --length_;
        }
    } else if (key == "left") {
        if (cursor_ > 0) --cursor_;
    } else if (key == "right") {
        if (cursor_ < length_) ++cursor_;
    } else if (key == "home" || key == "ctrl+a") {
        cursor_ = 0;
    } else if (key == "end" || key == "ctrl+e") {
        cursor_ = length_;
    } else if (key == "ctrl+u") {
        value_.erase(0, byte_at(cursor_));
        length_ -= cursor_;
        cursor_ = 0;
    } else if (key == "ctrl+k") {
        value_.erase(byte_at(cursor_));
        length_ = cursor_;
    } else if (is_printable(key)) {
        insert(key);
    } else {
        return false;
    }
    return true;
}

} // namespace plx
