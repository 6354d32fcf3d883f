#include <taml/parser/position.h>

namespace taml::parser {

SourcePosition calculate_position(std::string_view source, std::size_t index) {
    SourcePosition pos;
    for (std::size_t i = 0; i < index && i < source.size(); ++i) {
        if (source[i] == '\n') {
            ++pos.line;
            pos.column = 1;
        } else {
            ++pos.column;
        }
    }
    return pos;
}

std::string_view source_line(std::string_view source, std::size_t line) {
    if (line == 0) return {};

    std::size_t begin = 0;
    for (std::size_t current = 1; current < line; ++current) {
        std::size_t newline = source.find('\n', begin);
        if (newline == std::string_view::npos) return {};
        begin = newline + 1;
    }

    std::size_t end = source.find('\n', begin);
    if (end == std::string_view::npos) end = source.size();
    return source.substr(begin, end - begin);
}

} // namespace taml::parser
