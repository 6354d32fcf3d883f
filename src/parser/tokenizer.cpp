#include <taml/parser/tokenizer.h>
#include <taml/parser/errors.h>
#include <taml/ast/tags.h>
#include <taml/core/diagnostics.h>
#include <algorithm>

namespace taml::parser {

namespace {

constexpr std::string_view kLtEntity = "&lt;";
constexpr std::string_view kAmpEntity = "&amp;";

bool is_ascii_letter(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

} // namespace

const char* token_type_name(Token::Type type) {
    switch (type) {
        case Token::OpenTag:  return "open-tag";
        case Token::CloseTag: return "close-tag";
        case Token::Text:     return "text";
        case Token::End:      return "end";
    }
    return "unknown";
}

bool is_well_formed_tag_name(std::string_view name) {
    return !name.empty() && std::all_of(name.begin(), name.end(), is_ascii_letter);
}

Tokenizer::Tokenizer(std::string_view source, core::DiagnosticEmitter* diagnostics)
    : source_(source), diagnostics_(diagnostics) {}

char Tokenizer::peek() const {
    if (pos_ < source_.size()) {
        return source_[pos_];
    }
    return '\0';
}

bool Tokenizer::at_end() const {
    return pos_ >= source_.size();
}

bool Tokenizer::starts_with_at(std::string_view text) const {
    return source_.substr(pos_, text.size()) == text;
}

std::vector<Token> Tokenizer::tokenize() {
    pos_ = 0;
    tokens_.clear();

    try {
        while (!at_end()) {
            if (peek() == '<') {
                scan_tag();
            } else {
                scan_text();
            }
        }
    } catch (const ParseError& e) {
        if (diagnostics_) {
            diagnostics_->emit_at(core::Severity::Error, "tokenizer", "scan",
                                  e.message(), e.line(), e.column());
        }
        throw;
    }

    push_end();

    if (diagnostics_) {
        diagnostics_->emit(core::Severity::Info, "tokenizer", "scan",
                           std::to_string(tokens_.size()) + " tokens from " +
                               std::to_string(source_.size()) + " bytes");
    }
    return std::move(tokens_);
}

PositionInfo Tokenizer::position_info() const {
    SourcePosition pos = calculate_position(source_, pos_);
    return {pos_, pos.line, pos.column};
}

void Tokenizer::scan_tag() {
    const std::size_t start = pos_;
    ++pos_;  // '<'

    const bool closing = peek() == '/';
    if (closing) {
        ++pos_;
    }

    const std::size_t name_start = pos_;
    while (!at_end() && peek() != '>') {
        ++pos_;
    }
    const std::string_view name = source_.substr(name_start, pos_ - name_start);

    if (!is_well_formed_tag_name(name)) {
        // Show the whole attempted tag, including its '>' when there is one.
        std::string_view content = source_.substr(start, pos_ + 1 - start);
        throw make_error_at<MalformedTagError>(source_, start, std::string(content));
    }

    if (at_end()) {
        throw make_error_at<UnexpectedEndOfInputError>(source_, start, "parsing tag");
    }
    ++pos_;  // '>'

    if (!ast::is_valid_tag(name)) {
        throw make_error_at<InvalidTagError>(source_, start, std::string(name));
    }

    SourcePosition at = calculate_position(source_, start);
    Token token;
    token.type = closing ? Token::CloseTag : Token::OpenTag;
    token.tag_name = std::string(name);
    token.value = std::string(source_.substr(start, pos_ - start));
    token.start = start;
    token.end = pos_;
    token.line = at.line;
    token.column = at.column;
    tokens_.push_back(std::move(token));
}

void Tokenizer::scan_text() {
    const std::size_t start = pos_;
    std::string content;

    while (!at_end() && peek() != '<') {
        if (peek() == '&') {
            if (starts_with_at(kLtEntity)) {
                content += '<';
                pos_ += kLtEntity.size();
                continue;
            }
            if (starts_with_at(kAmpEntity)) {
                content += '&';
                pos_ += kAmpEntity.size();
                continue;
            }
        }
        content += source_[pos_++];
    }

    SourcePosition at = calculate_position(source_, start);
    Token token;
    token.type = Token::Text;
    token.content = std::move(content);
    token.value = std::string(source_.substr(start, pos_ - start));
    token.start = start;
    token.end = pos_;
    token.line = at.line;
    token.column = at.column;
    tokens_.push_back(std::move(token));
}

void Tokenizer::push_end() {
    SourcePosition at = calculate_position(source_, pos_);
    Token token;
    token.type = Token::End;
    token.start = pos_;
    token.end = pos_;
    token.line = at.line;
    token.column = at.column;
    tokens_.push_back(std::move(token));
}

std::vector<Token> tokenize(std::string_view source) {
    Tokenizer tokenizer(source);
    return tokenizer.tokenize();
}

} // namespace taml::parser
