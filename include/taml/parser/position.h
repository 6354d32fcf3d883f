#pragma once
#include <cstddef>
#include <string_view>

namespace taml::parser {

struct SourcePosition {
    std::size_t line = 1;    // 1-based
    std::size_t column = 1;  // 1-based, counted in bytes
};

// Line and column of byte offset `index` in `source`. Offsets past the end
// report the position just after the last character.
SourcePosition calculate_position(std::string_view source, std::size_t index);

// Text of 1-based line `line` without its newline; empty when out of range.
std::string_view source_line(std::string_view source, std::size_t line);

} // namespace taml::parser
