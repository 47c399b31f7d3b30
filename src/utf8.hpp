#pragma once

#include <cstddef>
#include <string>

namespace plx::utf8 {

// Byte length of the character starting at pos. Malformed sequences count
// as one byte per stray byte, so no offset ever lands inside a character.
inline size_t sequence_length(const std::string& s, size_t pos) {
    const auto lead = static_cast<unsigned char>(s[pos]);
    size_t expected = 1;
    if (lead >= 0xF0 && lead <= 0xF7) {
        expected = 4;
    } else if (lead >= 0xE0) {
        expected = lead <= 0xEF ? 3 : 1;
    } else if (lead >= 0xC0) {
        expected = 2;
    }

    size_t len = 1;
    while (len < expected && pos + len < s.size()
           && (static_cast<unsigned char>(s[pos + len]) & 0xC0) == 0x80) {
        ++len;
    }
    return len == expected ? len : 1;
}

inline size_t length(const std::string& s) {
    size_t count = 0;
    for (size_t pos = 0; pos < s.size(); pos += sequence_length(s, pos)) {
        ++count;
    }
    return count;
}

// Byte offset of the n-th character (size() when n is past the end)
inline size_t byte_offset(const std::string& s, size_t n) {
    size_t pos = 0;
    while (n > 0 && pos < s.size()) {
        pos += sequence_length(s, pos);
        --n;
    }
    return pos;
}

// First n characters
inline std::string prefix(const std::string& s, size_t n) {
    return s.substr(0, byte_offset(s, n));
}

// Decodes s if it holds exactly one well-formed character
inline bool single_code_point(const std::string& s, char32_t& cp) {
    if (s.empty() || sequence_length(s, 0) != s.size()) return false;

    const auto lead = static_cast<unsigned char>(s[0]);
    if (s.size() == 1) {
        if (lead >= 0x80) return false;
        cp = lead;
        return true;
    }

    cp = lead & (0xFF >> (s.size() + 1));
    for (size_t i = 1; i < s.size(); ++i) {
        cp = (cp << 6) | (static_cast<unsigned char>(s[i]) & 0x3F);
    }
    return true;
}

inline std::string encode(char32_t cp) {
    std::string out;
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x110000) {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return out;
}

} // namespace plx::utf8
