#include "text_util.hpp"

namespace text {

namespace {

unsigned char byte_at(std::string_view s, size_t pos) {
    return pos < s.size() ? static_cast<unsigned char>(s[pos]) : 0;
}

// Length of the UTF-8 sequence introduced by a lead byte; invalid bytes count as 1.
size_t sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 1;
}

} // namespace

size_t newline_length(std::string_view s, size_t pos) {
    unsigned char c = byte_at(s, pos);
    switch (c) {
        case '\n':
        case '\r':
        case '\v':
        case '\f':
            return 1;
        case 0xC2:
            return byte_at(s, pos + 1) == 0x85 ? 2 : 0;
        case 0xE2:
            if (byte_at(s, pos + 1) == 0x80 &&
                (byte_at(s, pos + 2) == 0xA8 || byte_at(s, pos + 2) == 0xA9)) {
                return 3;
            }
            return 0;
        default:
            return 0;
    }
}

size_t whitespace_length(std::string_view s, size_t pos) {
    if (pos >= s.size()) return 0;
    if (size_t n = newline_length(s, pos)) return n;

    unsigned char c = byte_at(s, pos);
    if (c == ' ' || c == '\t') return 1;

    unsigned char c1 = byte_at(s, pos + 1);
    unsigned char c2 = byte_at(s, pos + 2);
    if (c == 0xC2 && c1 == 0xA0) return 2;                              // U+00A0
    if (c == 0xE1 && c1 == 0x9A && c2 == 0x80) return 3;                // U+1680
    if (c == 0xE2 && c1 == 0x80 && c2 >= 0x80 && c2 <= 0x8A) return 3;  // U+2000..U+200A
    if (c == 0xE2 && c1 == 0x80 && c2 == 0xAF) return 3;                // U+202F
    if (c == 0xE2 && c1 == 0x81 && c2 == 0x9F) return 3;                // U+205F
    if (c == 0xE3 && c1 == 0x80 && c2 == 0x80) return 3;                // U+3000
    return 0;
}

bool starts_with_whitespace(std::string_view s) {
    return whitespace_length(s, 0) > 0;
}

std::string trim(std::string_view s) {
    size_t begin = 0;
    while (size_t n = whitespace_length(s, begin)) {
        begin += n;
    }

    size_t end = begin;
    size_t pos = begin;
    while (pos < s.size()) {
        if (size_t n = whitespace_length(s, pos)) {
            pos += n;
            continue;
        }
        pos += sequence_length(byte_at(s, pos));
        if (pos > s.size()) pos = s.size();
        end = pos;
    }

    return std::string(s.substr(begin, end - begin));
}

std::string join_lines(std::string_view s) {
    auto trimmed = trim(s);
    std::string_view in(trimmed);
    std::string out;
    out.reserve(in.size());

    size_t pos = 0;
    while (pos < in.size()) {
        if (newline_length(in, pos) == 0) {
            out.push_back(in[pos++]);
            continue;
        }
        while (!out.empty() && (out.back() == ' ' || out.back() == '\t')) out.pop_back();
        while (size_t n = whitespace_length(in, pos)) pos += n;
        out.push_back(' ');
    }
    return out;
}

} // namespace text
