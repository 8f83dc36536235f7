#pragma once

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace tagtree::html {

inline constexpr const char kDocumentTagName[] = "document";
inline constexpr const char kTextTagName[] = "#text";

enum class NodeType {
    Document,
    Element,
    Text,
};

const char* node_type_name(NodeType type);

// Children are owned by their parent only; there are no back references,
// so releasing the document releases the whole tree.
struct Node {
    NodeType type = NodeType::Document;
    std::string tag_name;
    std::map<std::string, std::string> attributes;
    std::string text_content;
    std::vector<std::unique_ptr<Node>> children;

    Node() = default;
    explicit Node(NodeType node_type) : type(node_type) {}
    Node(NodeType node_type, std::string tag) : type(node_type), tag_name(std::move(tag)) {}
};

std::unique_ptr<Node> make_document();
std::unique_ptr<Node> make_element(std::string tag_name);
std::unique_ptr<Node> make_text(std::string text);

// Serialize the tree to a canonical string for deterministic comparison
std::string serialize_ast(const Node& node);

bool ast_equal(const Node& lhs, const Node& rhs);

}  // namespace tagtree::html
