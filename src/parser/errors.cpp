#include <taml/parser/errors.h>
#include <sstream>

namespace taml::parser {

namespace {

std::string at(std::size_t line, std::size_t column) {
    return "at line " + std::to_string(line) + ", column " + std::to_string(column);
}

ErrorDetail with_tag_name(std::string tag_name) {
    ErrorDetail d;
    d.tag_name = std::move(tag_name);
    return d;
}

ErrorDetail with_mismatch(std::string expected, std::string actual) {
    ErrorDetail d;
    d.expected = std::move(expected);
    d.actual = std::move(actual);
    return d;
}

ErrorDetail with_content(std::string content) {
    ErrorDetail d;
    d.content = std::move(content);
    return d;
}

ErrorDetail with_context(std::optional<std::string> context) {
    ErrorDetail d;
    d.context = std::move(context);
    return d;
}

ErrorDetail with_character(std::string character, std::optional<std::string> hint) {
    ErrorDetail d;
    d.character = std::move(character);
    d.hint = std::move(hint);
    return d;
}

std::string end_of_input_message(const std::optional<std::string>& context,
                                 std::size_t line, std::size_t column) {
    std::string msg = "Unexpected end of input " + at(line, column);
    if (context && !context->empty()) {
        msg += " while " + *context;
    }
    return msg + ".";
}

std::string unexpected_character_message(const std::string& character,
                                         const std::optional<std::string>& hint,
                                         std::size_t line, std::size_t column) {
    std::string msg = "Unexpected character '" + character + "' " + at(line, column) + ".";
    if (hint && !hint->empty()) {
        msg += " Expected " + *hint + ".";
    }
    return msg;
}

} // namespace

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Generic:              return "ParseError";
        case ErrorKind::InvalidTag:           return "InvalidTagError";
        case ErrorKind::UnclosedTag:          return "UnclosedTagError";
        case ErrorKind::MismatchedTag:        return "MismatchedTagError";
        case ErrorKind::MalformedTag:         return "MalformedTagError";
        case ErrorKind::UnexpectedEndOfInput: return "UnexpectedEndOfInputError";
        case ErrorKind::UnexpectedCharacter:  return "UnexpectedCharacterError";
    }
    return "ParseError";
}

SourceRef share_source(std::string source) {
    if (source.empty()) return nullptr;
    return std::make_shared<const std::string>(std::move(source));
}

// ---------------------------------------------------------------------------
// ParseError
// ---------------------------------------------------------------------------

ParseError::ParseError(const std::string& message, std::size_t position,
                       std::size_t line, std::size_t column, std::string source)
    : ParseError(message, position, line, column, share_source(std::move(source))) {}

ParseError::ParseError(const std::string& message, std::size_t position,
                       std::size_t line, std::size_t column, SourceRef source)
    : ParseError(ErrorKind::Generic, ErrorDetail{}, message, position, line, column,
                 std::move(source)) {}

ParseError::ParseError(ErrorKind kind, ErrorDetail detail, const std::string& message,
                       std::size_t position, std::size_t line, std::size_t column,
                       SourceRef source)
    : std::runtime_error(message),
      kind_(kind),
      detail_(std::move(detail)),
      position_(position),
      line_(line),
      column_(column),
      source_(std::move(source)) {}

const char* ParseError::name() const {
    return error_kind_name(kind_);
}

std::string_view ParseError::source() const {
    if (!source_) return {};
    return *source_;
}

std::string ParseError::detailed_message() const {
    if (!has_source()) {
        return message();
    }

    const std::string line_label = std::to_string(line_);
    const std::size_t indent = column_ > 0 ? column_ - 1 : 0;

    std::ostringstream oss;
    oss << message() << "\n\n";
    oss << line_label << " | " << source_line(*source_, line_) << "\n";
    oss << std::string(line_label.size(), ' ') << " | " << std::string(indent, ' ') << "^\n";
    oss << "\n";
    oss << "Position: line " << line_ << ", column " << column_;
    return oss.str();
}

// ---------------------------------------------------------------------------
// Variants
// ---------------------------------------------------------------------------

InvalidTagError::InvalidTagError(std::string tag_name, std::size_t position,
                                 std::size_t line, std::size_t column, std::string source)
    : InvalidTagError(std::move(tag_name), position, line, column,
                      share_source(std::move(source))) {}

InvalidTagError::InvalidTagError(std::string tag_name, std::size_t position,
                                 std::size_t line, std::size_t column, SourceRef source)
    : ParseError(ErrorKind::InvalidTag, with_tag_name(tag_name),
                 "Invalid tag name '" + tag_name + "' " + at(line, column) +
                     ". Tag names must be one of the 37 valid TAML tags.",
                 position, line, column, std::move(source)) {}

UnclosedTagError::UnclosedTagError(std::string tag_name, std::size_t position,
                                   std::size_t line, std::size_t column, std::string source)
    : UnclosedTagError(std::move(tag_name), position, line, column,
                       share_source(std::move(source))) {}

UnclosedTagError::UnclosedTagError(std::string tag_name, std::size_t position,
                                   std::size_t line, std::size_t column, SourceRef source)
    : ParseError(ErrorKind::UnclosedTag, with_tag_name(tag_name),
                 "Unclosed tag '" + tag_name + "' " + at(line, column) +
                     ". Expected '</" + tag_name + ">' before end of input.",
                 position, line, column, std::move(source)) {}

MismatchedTagError::MismatchedTagError(std::string expected, std::string actual,
                                       std::size_t position, std::size_t line,
                                       std::size_t column, std::string source)
    : MismatchedTagError(std::move(expected), std::move(actual), position, line, column,
                         share_source(std::move(source))) {}

MismatchedTagError::MismatchedTagError(std::string expected, std::string actual,
                                       std::size_t position, std::size_t line,
                                       std::size_t column, SourceRef source)
    : ParseError(ErrorKind::MismatchedTag, with_mismatch(expected, actual),
                 "Mismatched closing tag " + at(line, column) + ". Expected '</" + expected +
                     ">' but found '</" + actual + ">'.",
                 position, line, column, std::move(source)) {}

MalformedTagError::MalformedTagError(std::string content, std::size_t position,
                                     std::size_t line, std::size_t column, std::string source)
    : MalformedTagError(std::move(content), position, line, column,
                        share_source(std::move(source))) {}

MalformedTagError::MalformedTagError(std::string content, std::size_t position,
                                     std::size_t line, std::size_t column, SourceRef source)
    : ParseError(ErrorKind::MalformedTag, with_content(content),
                 "Malformed tag '" + content + "' " + at(line, column) +
                     ". Tags must follow the pattern '<tagName>' or '</tagName>'.",
                 position, line, column, std::move(source)) {}

UnexpectedEndOfInputError::UnexpectedEndOfInputError(std::size_t position, std::size_t line,
                                                     std::size_t column, std::string source)
    : UnexpectedEndOfInputError(position, line, column, share_source(std::move(source))) {}

UnexpectedEndOfInputError::UnexpectedEndOfInputError(std::size_t position, std::size_t line,
                                                     std::size_t column, SourceRef source)
    : ParseError(ErrorKind::UnexpectedEndOfInput, with_context(std::nullopt),
                 end_of_input_message(std::nullopt, line, column),
                 position, line, column, std::move(source)) {}

UnexpectedEndOfInputError::UnexpectedEndOfInputError(std::string context, std::size_t position,
                                                     std::size_t line, std::size_t column,
                                                     std::string source)
    : UnexpectedEndOfInputError(std::move(context), position, line, column,
                                share_source(std::move(source))) {}

UnexpectedEndOfInputError::UnexpectedEndOfInputError(std::string context, std::size_t position,
                                                     std::size_t line, std::size_t column,
                                                     SourceRef source)
    : ParseError(ErrorKind::UnexpectedEndOfInput, with_context(context),
                 end_of_input_message(context, line, column),
                 position, line, column, std::move(source)) {}

UnexpectedCharacterError::UnexpectedCharacterError(std::string character, std::size_t position,
                                                   std::size_t line, std::size_t column,
                                                   std::string source)
    : UnexpectedCharacterError(std::move(character), position, line, column,
                               share_source(std::move(source))) {}

UnexpectedCharacterError::UnexpectedCharacterError(std::string character, std::size_t position,
                                                   std::size_t line, std::size_t column,
                                                   SourceRef source)
    : ParseError(ErrorKind::UnexpectedCharacter, with_character(character, std::nullopt),
                 unexpected_character_message(character, std::nullopt, line, column),
                 position, line, column, std::move(source)) {}

UnexpectedCharacterError::UnexpectedCharacterError(std::string character, std::string expected,
                                                   std::size_t position, std::size_t line,
                                                   std::size_t column, std::string source)
    : UnexpectedCharacterError(std::move(character), std::move(expected), position, line,
                               column, share_source(std::move(source))) {}

UnexpectedCharacterError::UnexpectedCharacterError(std::string character, std::string expected,
                                                   std::size_t position, std::size_t line,
                                                   std::size_t column, SourceRef source)
    : ParseError(ErrorKind::UnexpectedCharacter, with_character(character, expected),
                 unexpected_character_message(character, expected, line, column),
                 position, line, column, std::move(source)) {}

DepthLimitError::DepthLimitError(std::size_t max_depth)
    : std::runtime_error("Maximum nesting depth of " + std::to_string(max_depth) + " exceeded"),
      max_depth_(max_depth) {}

} // namespace taml::parser
