#pragma once

#include <string>

namespace plx {

// Single-line text entry with a cursor, driven by canonical key names.
// The value is UTF-8; the cursor and the limit count characters, not bytes.
class TextInput {
public:
    static constexpr size_t kDefaultCharLimit = 200;

    explicit TextInput(size_t char_limit = kDefaultCharLimit) : char_limit_(char_limit) {}

    [[nodiscard]] const std::string& value() const { return value_; }
    void set_value(const std::string& value);

    [[nodiscard]] size_t cursor() const { return cursor_; }
    void set_cursor(size_t pos);
    void cursor_end() { cursor_ = length_; }
    [[nodiscard]] size_t length() const { return length_; }

    void focus() { focused_ = true; }
    void blur() { focused_ = false; }
    [[nodiscard]] bool focused() const { return focused_; }

    // Returns true if the key was consumed. Ignored while blurred.
    bool handle_key(const std::string& key);

    void reset();

private:
    void insert(const std::string& ch);
    [[nodiscard]] size_t byte_at(size_t char_index) const;

    std::string value_;
    size_t length_ = 0;  // In characters
    size_t cursor_ = 0;
    size_t char_limit_;
    bool focused_ = false;
};

} // namespace plx
