#pragma once
#include <taml/parser/errors.h>
#include <taml/parser/tree_builder.h>
#include <taml/parser/validator.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace taml::parser {

// Outcome of parse_safe(). On success `ast` is set. On failure exactly one
// of `error` (lexical or structural fault) and `depth_error` is set.
struct SafeParseResult {
    bool success = false;
    std::unique_ptr<ast::Node> ast;
    std::optional<ParseError> error;
    std::optional<DepthLimitError> depth_error;

    std::string error_message() const;
};

// parse() that reports faults in the result instead of throwing.
SafeParseResult parse_safe(std::string_view source, const ParseOptions& options = {});

// Checks `source` by parsing it and discarding the tree. Stops at the first
// fault, so `errors` holds at most one entry; use Validator to collect every
// structural problem. DepthLimitError is not a syntax error and propagates.
ValidationResult validate_syntax(std::string_view source, const ParseOptions& options = {});

} // namespace taml::parser
