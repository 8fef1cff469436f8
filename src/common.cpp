#include "tinyboard/common.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>

namespace tinyboard {

namespace {

bool is_unicode_space(uint32_t cp) {
    switch (cp) {
        case 0x0009: case 0x000A: case 0x000B: case 0x000C: case 0x000D:
        case 0x0020: case 0x0085: case 0x00A0: case 0x1680:
        case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
            return true;
        default:
            return cp >= 0x2000 && cp <= 0x200A;
    }
}

// Decode one code point at pos; malformed bytes decode as a single non-space unit
size_t decode_at(const std::string& text, size_t pos, uint32_t& cp) {
    auto byte = [&](size_t i) { return static_cast<unsigned char>(text[i]); };
    unsigned char lead = byte(pos);
    size_t length = 1;
    if (lead < 0x80) {
        cp = lead;
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        cp = lead & 0x1F;
        length = 2;
    } else if ((lead & 0xF0) == 0xE0) {
        cp = lead & 0x0F;
        length = 3;
    } else if ((lead & 0xF8) == 0xF0) {
        cp = lead & 0x07;
        length = 4;
    } else {
        cp = 0xFFFD;
        return 1;
    }

    if (pos + length > text.size()) {
        cp = 0xFFFD;
        return 1;
    }
    for (size_t i = 1; i < length; ++i) {
        if ((byte(pos + i) & 0xC0) != 0x80) {
            cp = 0xFFFD;
            return 1;
        }
        cp = (cp << 6) | (byte(pos + i) & 0x3F);
    }
    return length;
}

} // anonymous namespace

std::string trim(const std::string& text) {
    size_t first = std::string::npos;
    size_t last = 0;
    for (size_t pos = 0; pos < text.size();) {
        uint32_t cp = 0;
        size_t length = decode_at(text, pos, cp);
        if (!is_unicode_space(cp)) {
            if (first == std::string::npos) {
                first = pos;
            }
            last = pos + length;
        }
        pos += length;
    }
    if (first == std::string::npos) {
        return {};
    }
    return text.substr(first, last - first);
}

bool is_blank(const std::string& text) {
    for (size_t pos = 0; pos < text.size();) {
        uint32_t cp = 0;
        pos += decode_at(text, pos, cp);
        if (!is_unicode_space(cp)) {
            return false;
        }
    }
    return true;
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

size_t utf8_length(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

} // namespace tinyboard
