#include <taml/ast/node.h>
#include <taml/ast/tags.h>
#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace taml::ast {

std::string Node::text_content() const {
    if (type == Text) {
        return content;
    }
    std::string result;
    for (auto& child : children) {
        result += child->text_content();
    }
    return result;
}

std::unique_ptr<Node> create_document(NodeList children, std::size_t start, std::size_t end) {
    auto node = std::make_unique<Node>();
    node->type = Node::Document;
    node->children = std::move(children);
    node->start = start;
    node->end = end;
    return node;
}

std::unique_ptr<Node> create_element(std::string tag_name, NodeList children,
                                     std::size_t start, std::size_t end) {
    if (!is_valid_tag(tag_name)) {
        throw std::invalid_argument("Not a TAML tag: '" + tag_name + "'");
    }
    auto node = std::make_unique<Node>();
    node->type = Node::Element;
    node->tag_name = std::move(tag_name);
    node->children = std::move(children);
    node->start = start;
    node->end = end;
    return node;
}

std::unique_ptr<Node> create_text(std::string content, std::size_t start, std::size_t end) {
    auto node = std::make_unique<Node>();
    node->type = Node::Text;
    node->content = std::move(content);
    node->start = start;
    node->end = end;
    return node;
}

const char* node_type_name(Node::Type type) {
    switch (type) {
        case Node::Document: return "document";
        case Node::Element:  return "element";
        case Node::Text:     return "text";
    }
    return "unknown";
}

// ============================================================================
// Traversal
// ============================================================================

std::string get_all_text(const Node& node) {
    return node.text_content();
}

namespace {

void walk_impl(const Node& node, const NodeVisitor& visitor, std::size_t depth) {
    visitor(node, depth);
    for (auto& child : node.children) {
        walk_impl(*child, visitor, depth + 1);
    }
}

} // namespace

void walk(const Node& root, const NodeVisitor& visitor) {
    walk_impl(root, visitor, 0);
}

std::vector<const Node*> find_all_elements(const Node& root, std::string_view tag_name) {
    std::vector<const Node*> result;
    walk(root, [&](const Node& node, std::size_t) {
        if (node.type == Node::Element && node.tag_name == tag_name) {
            result.push_back(&node);
        }
    });
    return result;
}

std::size_t count_nodes(const Node& root) {
    std::size_t count = 0;
    walk(root, [&count](const Node&, std::size_t) { ++count; });
    return count;
}

std::size_t max_element_depth(const Node& root) {
    std::size_t deepest = 0;
    for (auto& child : root.children) {
        if (child->type != Node::Element) continue;
        deepest = std::max(deepest, 1 + max_element_depth(*child));
    }
    return deepest;
}

std::unique_ptr<Node> clone(const Node& node) {
    auto copy = std::make_unique<Node>();
    copy->type = node.type;
    copy->tag_name = node.tag_name;
    copy->content = node.content;
    copy->start = node.start;
    copy->end = node.end;
    copy->children.reserve(node.children.size());
    for (auto& child : node.children) {
        copy->children.push_back(clone(*child));
    }
    return copy;
}

bool trees_equal(const Node& a, const Node& b, bool compare_positions) {
    if (a.type != b.type || a.tag_name != b.tag_name || a.content != b.content) {
        return false;
    }
    if (compare_positions && (a.start != b.start || a.end != b.end)) {
        return false;
    }
    if (a.children.size() != b.children.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.children.size(); ++i) {
        if (!trees_equal(*a.children[i], *b.children[i], compare_positions)) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// Output
// ============================================================================

std::string escape_text(std::string_view text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        if (c == '&') {
            escaped += "&amp;";
        } else if (c == '<') {
            escaped += "&lt;";
        } else {
            escaped += c;
        }
    }
    return escaped;
}

std::string serialize(const Node& node) {
    switch (node.type) {
        case Node::Text:
            return escape_text(node.content);
        case Node::Element: {
            std::string output = "<" + node.tag_name + ">";
            for (auto& child : node.children) {
                output += serialize(*child);
            }
            output += "</" + node.tag_name + ">";
            return output;
        }
        case Node::Document:
            break;
    }

    std::string output;
    for (auto& child : node.children) {
        output += serialize(*child);
    }
    return output;
}

namespace {

std::string quote_for_dump(const std::string& text) {
    std::string quoted = "\"";
    for (char c : text) {
        switch (c) {
            case '\n': quoted += "\\n"; break;
            case '\t': quoted += "\\t"; break;
            case '\r': quoted += "\\r"; break;
            case '"':  quoted += "\\\""; break;
            case '\\': quoted += "\\\\"; break;
            default:   quoted += c; break;
        }
    }
    quoted += '"';
    return quoted;
}

} // namespace

std::string dump(const Node& node) {
    std::ostringstream oss;
    walk(node, [&oss](const Node& n, std::size_t depth) {
        oss << std::string(depth * 2, ' ');
        switch (n.type) {
            case Node::Document: oss << "#document"; break;
            case Node::Element:  oss << "<" << n.tag_name << ">"; break;
            case Node::Text:     oss << quote_for_dump(n.content); break;
        }
        oss << " [" << n.start << "," << n.end << "]\n";
    });
    return oss.str();
}

} // namespace taml::ast
