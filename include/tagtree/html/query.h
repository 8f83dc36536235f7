#pragma once

#include <string>
#include <vector>

#include "tagtree/html/ast.h"

namespace tagtree::html {

// Depth-first, document-order search over the descendants of `root`. The
// root itself is never a match. Returns nullptr when no element carries `id`.
Node* get_element_by_id(Node& root, const std::string& id);
const Node* get_element_by_id(const Node& root, const std::string& id);

std::vector<Node*> query_all_by_tag(Node& root, const std::string& tag);
std::vector<const Node*> query_all_by_tag(const Node& root, const std::string& tag);
Node* query_first_by_tag(Node& root, const std::string& tag);
const Node* query_first_by_tag(const Node& root, const std::string& tag);

// Text of all descendant text nodes, joined by a single space.
std::string inner_text(const Node& root);

}  // namespace tagtree::html
