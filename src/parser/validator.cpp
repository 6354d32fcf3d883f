#include <taml/parser/validator.h>
#include <taml/ast/tags.h>
#include <taml/core/config.h>
#include <taml/core/diagnostics.h>
#include <utility>

namespace taml::parser {

Validator::Validator(std::string_view source, core::DiagnosticEmitter* diagnostics)
    : source_(source), diagnostics_(diagnostics) {}

ValidationResult Validator::validate_tokens(const std::vector<Token>& tokens) {
    pos_ = 0;
    tag_stack_.clear();
    errors_.clear();

    for (; pos_ < tokens.size(); ++pos_) {
        const Token& token = tokens[pos_];
        if (token.is_end()) break;

        switch (token.type) {
            case Token::OpenTag:
                check_open_tag(token);
                break;
            case Token::CloseTag:
                check_close_tag(token);
                break;
            case Token::Text:
            case Token::End:
                break;
        }
    }

    // Innermost first
    for (auto it = tag_stack_.rbegin(); it != tag_stack_.rend(); ++it) {
        report(UnclosedTagError(it->tag_name, it->start, it->line, it->column,
                                shared_source()));
    }

    if (diagnostics_) {
        diagnostics_->emit(core::Severity::Info, "validator", "validate",
                           std::to_string(tokens.size()) + " tokens, " +
                               std::to_string(errors_.size()) + " problems");
    }

    ValidationResult result;
    result.valid = errors_.empty();
    result.errors = errors_;
    return result;
}

ValidationResult Validator::validate() {
    std::vector<Token> tokens = Tokenizer(source_, diagnostics_).tokenize();
    return validate_tokens(tokens);
}

void Validator::check_open_tag(const Token& token) {
    if (!ast::is_valid_tag(token.tag_name)) {
        report(InvalidTagError(token.tag_name, token.start, token.line, token.column,
                               shared_source()));
        return;
    }
    tag_stack_.push_back({token.tag_name, token.start, token.line, token.column});
}

void Validator::check_close_tag(const Token& token) {
    if (!ast::is_valid_tag(token.tag_name)) {
        report(InvalidTagError(token.tag_name, token.start, token.line, token.column,
                               shared_source()));
        return;
    }

    if (tag_stack_.empty()) {
        report(MismatchedTagError(core::config::kNoOpenTagName, token.tag_name, token.start,
                                  token.line, token.column, shared_source()));
        return;
    }

    const Entry& innermost = tag_stack_.back();
    if (innermost.tag_name != token.tag_name) {
        // No resynchronization: the open tag stays for later closers.
        report(MismatchedTagError(innermost.tag_name, token.tag_name, token.start,
                                  token.line, token.column, shared_source()));
        return;
    }

    tag_stack_.pop_back();
}

const SourceRef& Validator::shared_source() {
    if (!shared_source_ && !source_.empty()) {
        shared_source_ = share_source(std::string(source_));
    }
    return shared_source_;
}

void Validator::report(ParseError error) {
    if (diagnostics_) {
        diagnostics_->emit_at(core::Severity::Warning, "validator", "validate",
                              error.message(), error.line(), error.column());
    }
    errors_.push_back(std::move(error));
}

ValidatorDebugInfo Validator::debug_info() const {
    ValidatorDebugInfo info;
    info.position = pos_;
    for (const auto& entry : tag_stack_) {
        info.tag_stack.push_back(entry.tag_name);
    }
    info.error_count = errors_.size();
    return info;
}

ValidationResult validate_tokens(const std::vector<Token>& tokens, std::string_view source) {
    Validator validator(source);
    return validator.validate_tokens(tokens);
}

bool validate_tag_name(std::string_view tag_name) {
    return ast::is_valid_tag(tag_name);
}

// ============================================================================
// Lightweight views
// ============================================================================

NestingReport validate_nesting(const std::vector<Token>& tokens) {
    NestingReport report;
    std::vector<std::string> stack;

    for (const auto& token : tokens) {
        if (!token.is_open_tag() && !token.is_close_tag()) continue;
        if (!ast::is_valid_tag(token.tag_name)) continue;

        if (token.is_open_tag()) {
            stack.push_back(token.tag_name);
        } else if (stack.empty()) {
            report.mismatched_tags.push_back({core::config::kNoOpenTagName, token.tag_name});
        } else if (stack.back() == token.tag_name) {
            stack.pop_back();
        } else {
            report.mismatched_tags.push_back({stack.back(), token.tag_name});
        }
    }

    report.unclosed_tags = std::move(stack);
    report.valid = report.unclosed_tags.empty() && report.mismatched_tags.empty();
    return report;
}

const char* closure_issue_kind_name(ClosureIssue::Kind kind) {
    switch (kind) {
        case ClosureIssue::Unclosed:   return "unclosed";
        case ClosureIssue::Extra:      return "extra";
        case ClosureIssue::Mismatched: return "mismatched";
    }
    return "unknown";
}

ClosureReport validate_tag_closure(const std::vector<Token>& tokens) {
    struct Open {
        std::string tag_name;
        std::size_t position;
    };

    ClosureReport report;
    std::vector<Open> stack;

    for (const auto& token : tokens) {
        if (!token.is_open_tag() && !token.is_close_tag()) continue;
        if (!ast::is_valid_tag(token.tag_name)) continue;

        if (token.is_open_tag()) {
            stack.push_back({token.tag_name, token.start});
        } else if (stack.empty()) {
            report.issues.push_back({ClosureIssue::Extra, token.tag_name, token.start});
        } else if (stack.back().tag_name == token.tag_name) {
            stack.pop_back();
        } else {
            report.issues.push_back({ClosureIssue::Mismatched, token.tag_name, token.start});
        }
    }

    for (const auto& open : stack) {
        report.issues.push_back({ClosureIssue::Unclosed, open.tag_name, open.position});
    }

    report.valid = report.issues.empty();
    return report;
}

} // namespace taml::parser
