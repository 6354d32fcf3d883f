#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace taml::ast {

struct Node;
using NodeList = std::vector<std::unique_ptr<Node>>;

// A TAML tree node. `tag_name` is set for Element, `content` (decoded text)
// for Text. `start`/`end` are byte offsets into the parsed source; an
// Element spans its opening tag through its closing tag.
// Each node owns its children; there are no parent links.
struct Node {
    enum Type { Document, Element, Text };
    Type type = Document;
    std::string tag_name;
    std::string content;
    std::size_t start = 0;
    std::size_t end = 0;
    NodeList children;

    // Concatenated text of this subtree in document order
    std::string text_content() const;
};

std::unique_ptr<Node> create_document(NodeList children, std::size_t start, std::size_t end);
// Throws std::invalid_argument if `tag_name` is not one of the 37 TAML tags.
std::unique_ptr<Node> create_element(std::string tag_name, NodeList children,
                                     std::size_t start, std::size_t end);
std::unique_ptr<Node> create_text(std::string content, std::size_t start, std::size_t end);

inline bool is_document(const Node& node) { return node.type == Node::Document; }
inline bool is_element(const Node& node) { return node.type == Node::Element; }
inline bool is_text(const Node& node) { return node.type == Node::Text; }

const char* node_type_name(Node::Type type);

// ---------------------------------------------------------------------------
// Traversal
// ---------------------------------------------------------------------------

std::string get_all_text(const Node& node);

// Pre-order visit; `depth` is 0 for `root`.
using NodeVisitor = std::function<void(const Node& node, std::size_t depth)>;
void walk(const Node& root, const NodeVisitor& visitor);

std::vector<const Node*> find_all_elements(const Node& root, std::string_view tag_name);
std::size_t count_nodes(const Node& root);
// Deepest chain of nested elements below `root` (0 for text-only trees).
std::size_t max_element_depth(const Node& root);

// Deep copy. Transformations build new trees rather than editing in place.
std::unique_ptr<Node> clone(const Node& node);
bool trees_equal(const Node& a, const Node& b, bool compare_positions = true);

// ---------------------------------------------------------------------------
// Output
// ---------------------------------------------------------------------------

// TAML markup for the tree; text escapes '&' and '<' so that parsing the
// result yields an equivalent tree.
std::string serialize(const Node& node);
std::string escape_text(std::string_view text);

// Indented outline, one node per line, e.g.
//   #document [0,16]
//     <red> [0,16]
//       "Hello" [5,10]
std::string dump(const Node& node);

} // namespace taml::ast
