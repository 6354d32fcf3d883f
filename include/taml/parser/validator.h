#pragma once
#include <taml/parser/errors.h>
#include <taml/parser/tokenizer.h>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace taml::core {
class DiagnosticEmitter;
} // namespace taml::core

namespace taml::parser {

struct ValidationResult {
    bool valid = true;
    std::vector<ParseError> errors;
};

struct ValidatorDebugInfo {
    std::size_t position = 0;
    std::vector<std::string> tag_stack;  // outermost first
    std::size_t error_count = 0;
};

// Structural checker over a token sequence. Unlike TreeBuilder it does not
// stop at the first problem: every unknown tag, extra or mismatched closing
// tag and unclosed tag is collected in one linear pass.
//
// A mismatched closing tag is reported and skipped; the open tag stays on
// the stack, so "<red>text</blue>" reports the mismatch and then red as
// unclosed.
class Validator {
public:
    // `source` is attached to the errors for detailed_message(); may be empty.
    explicit Validator(std::string_view source = {},
                       core::DiagnosticEmitter* diagnostics = nullptr);

    ValidationResult validate_tokens(const std::vector<Token>& tokens);

    // Tokenizes `source` first. Lexical faults are not collected: the
    // tokenizer's ParseError propagates.
    ValidationResult validate();

    ValidatorDebugInfo debug_info() const;

private:
    // Open tag and where it started; copied so the stack outlives the tokens.
    struct Entry {
        std::string tag_name;
        std::size_t start = 0;
        std::size_t line = 1;
        std::size_t column = 1;
    };

    std::string_view source_;
    SourceRef shared_source_;  // copied once, on the first error
    core::DiagnosticEmitter* diagnostics_ = nullptr;
    std::size_t pos_ = 0;
    std::vector<Entry> tag_stack_;
    std::vector<ParseError> errors_;

    void check_open_tag(const Token& token);
    void check_close_tag(const Token& token);
    const SourceRef& shared_source();
    void report(ParseError error);
};

ValidationResult validate_tokens(const std::vector<Token>& tokens, std::string_view source = {});

bool validate_tag_name(std::string_view tag_name);

// ---------------------------------------------------------------------------
// Lightweight views without the error taxonomy
// ---------------------------------------------------------------------------

struct TagMismatch {
    std::string expected;  // "(none)" for an extra closing tag
    std::string actual;
};

struct NestingReport {
    bool valid = true;
    std::vector<std::string> unclosed_tags;  // outermost first
    std::vector<TagMismatch> mismatched_tags;
};

// Stack check over known tags only; unknown names are ignored.
NestingReport validate_nesting(const std::vector<Token>& tokens);

struct ClosureIssue {
    enum Kind { Unclosed, Extra, Mismatched };
    Kind kind = Unclosed;
    std::string tag_name;
    std::size_t position = 0;  // byte offset of the offending tag
};

const char* closure_issue_kind_name(ClosureIssue::Kind kind);

struct ClosureReport {
    bool valid = true;
    std::vector<ClosureIssue> issues;
};

ClosureReport validate_tag_closure(const std::vector<Token>& tokens);

} // namespace taml::parser
