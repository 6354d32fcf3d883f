#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace taml::core {
class DiagnosticEmitter;
} // namespace taml::core

namespace taml::parser {

struct Token {
    enum Type { OpenTag, CloseTag, Text, End };
    Type type = End;
    std::string tag_name;  // OpenTag / CloseTag
    std::string content;   // Text: decoded text
    std::string value;     // raw source slice ("<red>", "</red>", "a &lt; b"); empty for End

    // Byte span [start, end); line/column are those of `start`.
    std::size_t start = 0;
    std::size_t end = 0;
    std::size_t line = 1;
    std::size_t column = 1;

    bool is_open_tag() const { return type == OpenTag; }
    bool is_close_tag() const { return type == CloseTag; }
    bool is_text() const { return type == Text; }
    bool is_end() const { return type == End; }
};

const char* token_type_name(Token::Type type);

struct PositionInfo {
    std::size_t position = 0;
    std::size_t line = 1;
    std::size_t column = 1;
};

// Single forward pass over TAML source. Produces OpenTag, CloseTag and Text
// tokens followed by exactly one End token. Throws a ParseError subclass on
// the first lexical fault (MalformedTagError, UnexpectedEndOfInputError,
// InvalidTagError); no partial token list is returned.
class Tokenizer {
public:
    explicit Tokenizer(std::string_view source,
                       core::DiagnosticEmitter* diagnostics = nullptr);

    std::vector<Token> tokenize();

    // Where the scan cursor is; after a failed tokenize() this is the place
    // scanning stopped.
    PositionInfo position_info() const;

private:
    std::string_view source_;
    core::DiagnosticEmitter* diagnostics_ = nullptr;
    std::size_t pos_ = 0;
    std::vector<Token> tokens_;

    char peek() const;
    bool at_end() const;
    bool starts_with_at(std::string_view text) const;

    void scan_tag();
    void scan_text();
    void push_end();
};

std::vector<Token> tokenize(std::string_view source);

// Tag names are one or more ASCII letters.
bool is_well_formed_tag_name(std::string_view name);

} // namespace taml::parser
