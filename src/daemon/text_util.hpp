#pragma once

#include <cstddef>
#include <string>
#include <string_view>

// UTF-8 aware whitespace helpers shared by the engine output reader and
// transcript delivery.
namespace text {

// Byte length of the line-break character starting at `pos`, or 0.
// Recognizes LF, CR, VT, FF, NEL (U+0085), LS (U+2028) and PS (U+2029).
size_t newline_length(std::string_view s, size_t pos);

// Byte length of the whitespace or line-break character starting at `pos`, or 0.
size_t whitespace_length(std::string_view s, size_t pos);

bool starts_with_whitespace(std::string_view s);

// Strip leading and trailing whitespace and line breaks.
std::string trim(std::string_view s);

// Trim, then replace each line break (and the whitespace around it) with one space.
std::string join_lines(std::string_view s);

} // namespace text
