#include "tagtree/html/ast.h"

#include "tagtree/html/tag_table.h"

namespace tagtree::html {
namespace {

// Backslash-escapes the characters that delimit serialized nodes, so distinct
// trees never serialize to the same string.
std::string escape_serialized(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        if (c == '\\' || c == '"' || c == '[' || c == ']') {
            escaped.push_back('\\');
        }
        escaped.push_back(c);
    }
    return escaped;
}

}  // namespace

const char* node_type_name(NodeType type) {
    switch (type) {
        case NodeType::Document: return "document";
        case NodeType::Element:  return "element";
        case NodeType::Text:     return "text";
    }
    return "unknown";
}

std::unique_ptr<Node> make_document() {
    return std::make_unique<Node>(NodeType::Document, kDocumentTagName);
}

std::unique_ptr<Node> make_element(std::string tag_name) {
    return std::make_unique<Node>(NodeType::Element, std::move(tag_name));
}

std::unique_ptr<Node> make_text(std::string text) {
    auto node = std::make_unique<Node>(NodeType::Text, kTextTagName);
    node->text_content = std::move(text);
    return node;
}

std::string serialize_ast(const Node& node) {
    std::string output;

    switch (node.type) {
        case NodeType::Document:
            output += kDocumentTagName;
            break;
        case NodeType::Text:
            output += "TEXT(\"" + escape_serialized(node.text_content) + "\")";
            return output;
        case NodeType::Element:
            output += "<" + node.tag_name;
            for (const auto& [key, value] : node.attributes) {
                output += " " + escape_serialized(key) + "=\"" + escape_serialized(value) + "\"";
            }
            output += ">";
            break;
    }

    for (const auto& child : node.children) {
        if (child) {
            output += "[" + serialize_ast(*child) + "]";
        }
    }

    if (node.type == NodeType::Element && !is_void_tag(node.tag_name)) {
        output += "</" + node.tag_name + ">";
    }

    return output;
}

bool ast_equal(const Node& lhs, const Node& rhs) {
    if (lhs.type != rhs.type) return false;
    if (lhs.tag_name != rhs.tag_name) return false;
    if (lhs.text_content != rhs.text_content) return false;
    if (lhs.attributes != rhs.attributes) return false;
    if (lhs.children.size() != rhs.children.size()) return false;
    for (std::size_t i = 0; i < lhs.children.size(); ++i) {
        const Node* left = lhs.children[i].get();
        const Node* right = rhs.children[i].get();
        if (left == nullptr || right == nullptr) {
            if (left != right) return false;
            continue;
        }
        if (!ast_equal(*left, *right)) return false;
    }
    return true;
}

}  // namespace tagtree::html
