#include <taml/parser/tree_builder.h>
#include <taml/parser/errors.h>
#include <taml/core/diagnostics.h>
#include <utility>

namespace taml::parser {

TreeBuilder::TreeBuilder(std::string_view source, ParseOptions options)
    : source_(source), options_(options) {}

const Token& TreeBuilder::current() const {
    if (pos_ < tokens_.size()) {
        return tokens_[pos_];
    }
    return tokens_.back();
}

std::unique_ptr<ast::Node> TreeBuilder::build() {
    pos_ = 0;
    tag_stack_.clear();
    tokens_.clear();
    tokens_ = Tokenizer(source_, options_.diagnostics).tokenize();

    std::unique_ptr<ast::Node> document;
    try {
        document = run();
    } catch (const ParseError& e) {
        if (options_.diagnostics) {
            options_.diagnostics->emit_at(core::Severity::Error, "parser", "build",
                                          e.message(), e.line(), e.column());
        }
        throw;
    } catch (const DepthLimitError& e) {
        if (options_.diagnostics) {
            options_.diagnostics->emit(core::Severity::Error, "parser", "build", e.what());
        }
        throw;
    }

    if (options_.diagnostics) {
        options_.diagnostics->emit(core::Severity::Info, "parser", "build",
                                   std::to_string(ast::count_nodes(*document)) + " nodes, depth " +
                                       std::to_string(ast::max_element_depth(*document)));
    }

    if (!options_.include_positions) {
        return strip_positions(*document);
    }
    return document;
}

std::unique_ptr<ast::Node> TreeBuilder::run() {
    ast::NodeList children = parse_nodes(0);

    if (!tag_stack_.empty()) {
        const TagStackEntry& innermost = tag_stack_.back();
        throw UnclosedTagError(innermost.tag_name, innermost.token->start,
                               innermost.token->line, innermost.token->column,
                               std::string(source_));
    }

    // Only a closing tag can stop the top-level sequence before End, and
    // with nothing open it has nothing to close. Rejected outright; the
    // document is never truncated at the stray closer.
    const Token& stray = current();
    if (stray.is_close_tag()) {
        throw MismatchedTagError(core::config::kNoOpenTagName, stray.tag_name, stray.start,
                                 stray.line, stray.column, std::string(source_));
    }

    return ast::create_document(std::move(children), 0, source_.size());
}

ast::NodeList TreeBuilder::parse_nodes(std::size_t depth) {
    if (depth > options_.max_depth) {
        throw DepthLimitError(options_.max_depth);
    }

    ast::NodeList nodes;
    while (pos_ < tokens_.size()) {
        const Token& token = tokens_[pos_];
        switch (token.type) {
            case Token::End:
            case Token::CloseTag:
                // Handled by the enclosing element (or run() at top level)
                return nodes;
            case Token::OpenTag:
                nodes.push_back(parse_element(depth));
                break;
            case Token::Text:
                nodes.push_back(parse_text());
                break;
        }
    }
    return nodes;
}

std::unique_ptr<ast::Node> TreeBuilder::parse_element(std::size_t depth) {
    const Token& open = tokens_[pos_];
    ++pos_;
    tag_stack_.push_back({open.tag_name, &open});

    ast::NodeList children = parse_nodes(depth + 1);

    if (pos_ >= tokens_.size() || !tokens_[pos_].is_close_tag()) {
        throw UnclosedTagError(open.tag_name, open.start, open.line, open.column,
                               std::string(source_));
    }

    const Token& close = tokens_[pos_];
    if (close.tag_name != open.tag_name) {
        throw MismatchedTagError(open.tag_name, close.tag_name, close.start, close.line,
                                 close.column, std::string(source_));
    }

    ++pos_;
    tag_stack_.pop_back();
    return ast::create_element(open.tag_name, std::move(children), open.start, close.end);
}

std::unique_ptr<ast::Node> TreeBuilder::parse_text() {
    const Token& token = tokens_[pos_];
    ++pos_;
    return ast::create_text(token.content, token.start, token.end);
}

ParserDebugInfo TreeBuilder::debug_info() const {
    ParserDebugInfo info;
    info.position = pos_;
    if (pos_ < tokens_.size()) {
        info.current_token = tokens_[pos_];
    }
    for (const auto& entry : tag_stack_) {
        info.tag_stack.push_back(entry.tag_name);
    }
    return info;
}

std::unique_ptr<ast::Node> parse(std::string_view source, const ParseOptions& options) {
    TreeBuilder builder(source, options);
    return builder.build();
}

std::unique_ptr<ast::Node> strip_positions(const ast::Node& node) {
    ast::NodeList children;
    children.reserve(node.children.size());
    for (auto& child : node.children) {
        children.push_back(strip_positions(*child));
    }

    switch (node.type) {
        case ast::Node::Element:
            return ast::create_element(node.tag_name, std::move(children), 0, 0);
        case ast::Node::Text:
            return ast::create_text(node.content, 0, 0);
        case ast::Node::Document:
            break;
    }
    return ast::create_document(std::move(children), 0, 0);
}

} // namespace taml::parser
