#include "tagtree/html/scanner.h"

namespace tagtree::html {
namespace {

constexpr std::string_view kCommentOpen = "<!--";
constexpr std::string_view kCommentClose = "-->";

}  // namespace

bool is_html_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

std::size_t skip_whitespace(std::string_view input, std::size_t pos) {
    while (pos < input.size() && is_html_whitespace(input[pos])) {
        ++pos;
    }
    return pos;
}

bool is_comment_start(std::string_view input, std::size_t pos) {
    if (pos > input.size() || input.size() - pos < kCommentOpen.size()) {
        return false;
    }
    return input.compare(pos, kCommentOpen.size(), kCommentOpen) == 0;
}

bool skip_comment(std::string_view input, std::size_t& pos) {
    const std::size_t comment_end = input.find(kCommentClose, pos + kCommentOpen.size());
    if (comment_end == std::string_view::npos) {
        return false;
    }
    pos = comment_end + kCommentClose.size();
    return true;
}

std::string read_tag_name(std::string_view input, std::size_t& pos) {
    const std::size_t start = pos;
    while (pos < input.size() &&
           !is_html_whitespace(input[pos]) &&
           input[pos] != '>' &&
           input[pos] != '/') {
        ++pos;
    }
    return std::string(input.substr(start, pos - start));
}

bool skip_past_tag_close(std::string_view input, std::size_t& pos) {
    const std::size_t tag_end = input.find('>', pos);
    if (tag_end == std::string_view::npos) {
        return false;
    }
    pos = tag_end + 1;
    return true;
}

std::string_view trim_whitespace(std::string_view text) {
    std::size_t begin = 0;
    while (begin < text.size() && is_html_whitespace(text[begin])) {
        ++begin;
    }
    std::size_t end = text.size();
    while (end > begin && is_html_whitespace(text[end - 1])) {
        --end;
    }
    return text.substr(begin, end - begin);
}

}  // namespace tagtree::html
