#include "tagtree/html/query.h"

namespace tagtree::html {
namespace {

template <typename Predicate>
const Node* find_first_descendant(const Node& node, const Predicate& predicate) {
    for (const auto& child : node.children) {
        if (!child || child->type != NodeType::Element) {
            continue;
        }
        if (predicate(*child)) {
            return child.get();
        }
        if (const Node* match = find_first_descendant(*child, predicate)) {
            return match;
        }
    }
    return nullptr;
}

void collect_by_tag(const Node& node, const std::string& tag, std::vector<const Node*>& result) {
    for (const auto& child : node.children) {
        if (!child || child->type != NodeType::Element) {
            continue;
        }
        if (child->tag_name == tag) {
            result.push_back(child.get());
        }
        collect_by_tag(*child, tag, result);
    }
}

void collect_text(const Node& node, std::string& output) {
    if (node.type == NodeType::Text) {
        if (!output.empty()) {
            output += ' ';
        }
        output += node.text_content;
        return;
    }
    for (const auto& child : node.children) {
        if (child) {
            collect_text(*child, output);
        }
    }
}

}  // namespace

Node* get_element_by_id(Node& root, const std::string& id) {
    return const_cast<Node*>(get_element_by_id(static_cast<const Node&>(root), id));
}

const Node* get_element_by_id(const Node& root, const std::string& id) {
    if (id.empty()) {
        return nullptr;
    }
    return find_first_descendant(root, [&id](const Node& candidate) {
        const auto id_it = candidate.attributes.find("id");
        return id_it != candidate.attributes.end() && id_it->second == id;
    });
}

std::vector<Node*> query_all_by_tag(Node& root, const std::string& tag) {
    std::vector<Node*> result;
    const std::vector<const Node*> matches = query_all_by_tag(static_cast<const Node&>(root), tag);
    result.reserve(matches.size());
    for (const Node* match : matches) {
        result.push_back(const_cast<Node*>(match));
    }
    return result;
}

std::vector<const Node*> query_all_by_tag(const Node& root, const std::string& tag) {
    std::vector<const Node*> result;
    if (tag.empty()) {
        return result;
    }
    collect_by_tag(root, tag, result);
    return result;
}

Node* query_first_by_tag(Node& root, const std::string& tag) {
    return const_cast<Node*>(query_first_by_tag(static_cast<const Node&>(root), tag));
}

const Node* query_first_by_tag(const Node& root, const std::string& tag) {
    if (tag.empty()) {
        return nullptr;
    }
    return find_first_descendant(root, [&tag](const Node& candidate) {
        return candidate.tag_name == tag;
    });
}

std::string inner_text(const Node& root) {
    std::string text;
    collect_text(root, text);
    return text;
}

}  // namespace tagtree::html
