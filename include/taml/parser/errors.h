#pragma once
#include <taml/parser/position.h>
#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace taml::parser {

enum class ErrorKind {
    Generic,
    InvalidTag,
    UnclosedTag,
    MismatchedTag,
    MalformedTag,
    UnexpectedEndOfInput,
    UnexpectedCharacter
};

const char* error_kind_name(ErrorKind kind);

// Source text attached to errors. Errors raised during one pass share a
// single copy.
using SourceRef = std::shared_ptr<const std::string>;

// Null for an empty source.
SourceRef share_source(std::string source);

// Variant-specific fields. Which ones are meaningful depends on ErrorKind:
//   InvalidTag, UnclosedTag     -> tag_name
//   MismatchedTag               -> expected, actual
//   MalformedTag                -> content
//   UnexpectedEndOfInput        -> context (optional)
//   UnexpectedCharacter         -> character, hint (optional)
struct ErrorDetail {
    std::string tag_name;
    std::string expected;
    std::string actual;
    std::string content;
    std::string character;
    std::optional<std::string> context;
    std::optional<std::string> hint;
};

// A positioned lexical or structural fault. All payload lives in this class,
// so errors copied by value (e.g. into a ValidationResult) keep their fields;
// the subclasses only pick the kind and the message.
class ParseError : public std::runtime_error {
public:
    ParseError(const std::string& message, std::size_t position,
               std::size_t line, std::size_t column, std::string source = {});
    ParseError(const std::string& message, std::size_t position,
               std::size_t line, std::size_t column, SourceRef source);

    ErrorKind kind() const { return kind_; }
    const char* name() const;
    std::string message() const { return what(); }

    std::size_t position() const { return position_; }
    std::size_t line() const { return line_; }
    std::size_t column() const { return column_; }

    // Empty when the error was created without source context.
    bool has_source() const { return source_ && !source_->empty(); }
    std::string_view source() const;
    const SourceRef& shared_source() const { return source_; }

    const std::string& tag_name() const { return detail_.tag_name; }
    const std::string& expected() const { return detail_.expected; }
    const std::string& actual() const { return detail_.actual; }
    const std::string& content() const { return detail_.content; }
    const std::string& character() const { return detail_.character; }
    const std::optional<std::string>& context() const { return detail_.context; }
    const std::optional<std::string>& hint() const { return detail_.hint; }
    const ErrorDetail& detail() const { return detail_; }

    // Message followed by the offending source line, a caret under the
    // column and a "Position: line L, column C" footer. Plain message when
    // there is no source.
    std::string detailed_message() const;

protected:
    ParseError(ErrorKind kind, ErrorDetail detail, const std::string& message,
               std::size_t position, std::size_t line, std::size_t column,
               SourceRef source);

private:
    ErrorKind kind_ = ErrorKind::Generic;
    ErrorDetail detail_;
    std::size_t position_ = 0;
    std::size_t line_ = 0;
    std::size_t column_ = 0;
    SourceRef source_;
};

class InvalidTagError : public ParseError {
public:
    InvalidTagError(std::string tag_name, std::size_t position, std::size_t line,
                    std::size_t column, std::string source = {});
    InvalidTagError(std::string tag_name, std::size_t position, std::size_t line,
                    std::size_t column, SourceRef source);
};

class UnclosedTagError : public ParseError {
public:
    UnclosedTagError(std::string tag_name, std::size_t position, std::size_t line,
                     std::size_t column, std::string source = {});
    UnclosedTagError(std::string tag_name, std::size_t position, std::size_t line,
                     std::size_t column, SourceRef source);
};

// `expected` is "(none)" for a closing tag with nothing open.
class MismatchedTagError : public ParseError {
public:
    MismatchedTagError(std::string expected, std::string actual, std::size_t position,
                       std::size_t line, std::size_t column, std::string source = {});
    MismatchedTagError(std::string expected, std::string actual, std::size_t position,
                       std::size_t line, std::size_t column, SourceRef source);
};

class MalformedTagError : public ParseError {
public:
    MalformedTagError(std::string content, std::size_t position, std::size_t line,
                      std::size_t column, std::string source = {});
    MalformedTagError(std::string content, std::size_t position, std::size_t line,
                      std::size_t column, SourceRef source);
};

class UnexpectedEndOfInputError : public ParseError {
public:
    UnexpectedEndOfInputError(std::size_t position, std::size_t line, std::size_t column,
                              std::string source = {});
    UnexpectedEndOfInputError(std::size_t position, std::size_t line, std::size_t column,
                              SourceRef source);
    // `context` completes "... while <context>."
    UnexpectedEndOfInputError(std::string context, std::size_t position, std::size_t line,
                              std::size_t column, std::string source = {});
    UnexpectedEndOfInputError(std::string context, std::size_t position, std::size_t line,
                              std::size_t column, SourceRef source);
};

class UnexpectedCharacterError : public ParseError {
public:
    UnexpectedCharacterError(std::string character, std::size_t position, std::size_t line,
                             std::size_t column, std::string source = {});
    UnexpectedCharacterError(std::string character, std::size_t position, std::size_t line,
                             std::size_t column, SourceRef source);
    UnexpectedCharacterError(std::string character, std::string expected, std::size_t position,
                             std::size_t line, std::size_t column, std::string source = {});
    UnexpectedCharacterError(std::string character, std::string expected, std::size_t position,
                             std::size_t line, std::size_t column, SourceRef source);
};

// Resource guard, not a syntax fault: nesting went past ParseOptions::max_depth.
class DepthLimitError : public std::runtime_error {
public:
    explicit DepthLimitError(std::size_t max_depth);
    std::size_t max_depth() const { return max_depth_; }

private:
    std::size_t max_depth_;
};

// Builds ErrorT at byte offset `position` of `source`, computing line and
// column and attaching the source:
//   make_error_at<InvalidTagError>(source, 5, "purple")
template <typename ErrorT, typename... Args>
ErrorT make_error_at(std::string_view source, std::size_t position, Args&&... args) {
    SourcePosition pos = calculate_position(source, position);
    return ErrorT(std::forward<Args>(args)..., position, pos.line, pos.column,
                  std::string(source));
}

// Same, attaching an already shared source instead of copying it.
template <typename ErrorT, typename... Args>
ErrorT make_error_at(const SourceRef& source, std::size_t position, Args&&... args) {
    SourcePosition pos = calculate_position(source ? std::string_view(*source)
                                                   : std::string_view(),
                                            position);
    return ErrorT(std::forward<Args>(args)..., position, pos.line, pos.column, source);
}

} // namespace taml::parser
