#pragma once

#include <string>

namespace tagtree::html {

// Fixed, case-sensitive element vocabulary. Anything else is an invalid tag.
bool is_known_tag(const std::string& tag_name);

// Void elements never have children and never own an end tag.
bool is_void_tag(const std::string& tag_name);

// True when a start tag `next_tag` implicitly ends the open element
// `open_tag` (the end-tag omission rules, e.g. <p> ends an open <p>).
bool closes_on_sibling(const std::string& open_tag, const std::string& next_tag);

}  // namespace tagtree::html
