#pragma once
#include <taml/ast/node.h>
#include <taml/core/config.h>
#include <taml/parser/tokenizer.h>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace taml::core {
class DiagnosticEmitter;
} // namespace taml::core

namespace taml::parser {

struct ParseOptions {
    // Deepest element nesting accepted; one level more throws DepthLimitError.
    std::size_t max_depth = core::config::kDefaultMaxDepth;
    // When false every start/end in the returned tree is 0.
    bool include_positions = core::config::kDefaultIncludePositions;
    // Optional sink for tokenizer/parser diagnostics; not owned.
    core::DiagnosticEmitter* diagnostics = nullptr;
};

// Open element awaiting its closing tag.
struct TagStackEntry {
    std::string tag_name;
    const Token* token = nullptr;
};

struct ParserDebugInfo {
    std::size_t position = 0;          // index into the token list
    std::optional<Token> current_token;
    std::vector<std::string> tag_stack;  // outermost first
};

// Builds a Document tree from TAML source. Tokenizes up front, then
// consumes the tokens recursively, matching each closing tag against the
// innermost open element. Fails on the first fault: lexical errors come from
// the Tokenizer, structural ones are UnclosedTagError / MismatchedTagError,
// and too-deep nesting is DepthLimitError.
class TreeBuilder {
public:
    explicit TreeBuilder(std::string_view source, ParseOptions options = {});

    std::unique_ptr<ast::Node> build();

    // State of the last build(); after a failure this shows where it stopped.
    ParserDebugInfo debug_info() const;

private:
    std::string_view source_;
    ParseOptions options_;
    std::vector<Token> tokens_;
    std::size_t pos_ = 0;
    std::vector<TagStackEntry> tag_stack_;

    const Token& current() const;
    ast::NodeList parse_nodes(std::size_t depth);
    std::unique_ptr<ast::Node> parse_element(std::size_t depth);
    std::unique_ptr<ast::Node> parse_text();

    std::unique_ptr<ast::Node> run();
};

// Convenience: parse TAML source to a document tree.
std::unique_ptr<ast::Node> parse(std::string_view source, const ParseOptions& options = {});

// Copy of `node` with every position zeroed.
std::unique_ptr<ast::Node> strip_positions(const ast::Node& node);

} // namespace taml::parser
