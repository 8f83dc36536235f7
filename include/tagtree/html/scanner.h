#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace tagtree::html {

// Cursor primitives. Every function takes the cursor explicitly and never
// reads past the end of `input`.

bool is_html_whitespace(char c);

std::size_t skip_whitespace(std::string_view input, std::size_t pos);

bool is_comment_start(std::string_view input, std::size_t pos);

// Moves `pos` past the first "-->" after the "<!--" at `pos`. Returns false
// and leaves `pos` untouched when the comment is never closed.
bool skip_comment(std::string_view input, std::size_t& pos);

// Reads a tag name starting at `pos` (just after "<" or "</"). Stops at
// whitespace, '>', '/' or end of input.
std::string read_tag_name(std::string_view input, std::size_t& pos);

// Moves `pos` just past the next '>'. Returns false when there is none.
bool skip_past_tag_close(std::string_view input, std::size_t& pos);

std::string_view trim_whitespace(std::string_view text);

}  // namespace tagtree::html
