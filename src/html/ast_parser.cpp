#include "tagtree/html/ast_parser.h"

#include <algorithm>
#include <map>
#include <utility>
#include <vector>

#include "tagtree/html/scanner.h"
#include "tagtree/html/tag_table.h"

namespace tagtree::html {
namespace {

constexpr char kDiagnosticModule[] = "html";
constexpr std::string_view kDoctypeName = "!DOCTYPE";

using NodeList = std::vector<std::unique_ptr<Node>>;
using AttributeMap = std::map<std::string, std::string>;

// Recursive descent over the source buffer. The only mutable scan state is
// the cursor threaded through each call; every step returns false after
// recording the first error, and callers propagate it without recovery.
class Parser {
  public:
    Parser(std::string_view html, const ParseOptions& options)
        : html_(html), options_(options) {}

    ParseResult parse() {
        ParseResult result;
        auto document = make_document();

        if (!parse_document(*document)) {
            note(core::Severity::Error, "parse", format_parse_error(error_));
            result.error = std::move(error_);
            return result;
        }

        result.document = std::move(document);
        return result;
    }

  private:
    std::string_view html_;
    const ParseOptions& options_;
    ParseError error_;
    // Tag names of the elements whose content is being parsed, outermost first.
    std::vector<std::string> open_elements_;

    bool fail(ParseErrorKind kind, std::size_t position, std::string message) {
        error_.kind = kind;
        error_.position = position;
        error_.message = std::move(message);
        return false;
    }

    void note(core::Severity severity, const char* stage, const std::string& message) const {
        if (options_.diagnostics != nullptr) {
            options_.diagnostics->emit(severity, kDiagnosticModule, stage, message);
        }
    }

    bool at_end(std::size_t pos) const {
        return pos >= html_.size();
    }

    bool parse_document(Node& document) {
        std::size_t pos = 0;
        if (!skip_prolog_trivia(pos) || !skip_doctype(pos)) {
            return false;
        }

        if (!parse_content(pos, document.children, document.tag_name, 0)) {
            return false;
        }

        if (!at_end(pos)) {
            note(core::Severity::Warning, "parse",
                 "Input from offset " + std::to_string(pos) + " is not part of the tree");
        }
        return true;
    }

    // Whitespace and comments may alternate any number of times before the
    // DOCTYPE.
    bool skip_prolog_trivia(std::size_t& pos) {
        while (true) {
            pos = skip_whitespace(html_, pos);
            if (!is_comment_start(html_, pos)) {
                return true;
            }
            if (!consume_comment(pos)) {
                return false;
            }
        }
    }

    bool skip_doctype(std::size_t& pos) {
        if (at_end(pos) || html_[pos] != '<') {
            return true;
        }

        std::size_t cursor = pos + 1;
        if (read_tag_name(html_, cursor) != kDoctypeName) {
            return true;
        }
        if (!skip_past_tag_close(html_, cursor)) {
            return fail(ParseErrorKind::OutOfBounds, pos, "Unterminated DOCTYPE");
        }

        note(core::Severity::Info, "prolog", "Consumed DOCTYPE");
        pos = cursor;
        return true;
    }

    bool consume_comment(std::size_t& pos) {
        if (!skip_comment(html_, pos)) {
            return fail(ParseErrorKind::OutOfBounds, pos, "Unterminated comment");
        }
        return true;
    }

    // Leaves `name` empty when `pos` is not at a start tag. An unknown name
    // after '<' is an error.
    bool classify_start_tag(std::size_t pos, std::string& name, std::size_t& name_end) {
        name.clear();
        if (at_end(pos) || html_[pos] != '<') {
            return true;
        }
        if (pos + 1 < html_.size()) {
            const char next = html_[pos + 1];
            if (next == '/' || next == '!' || next == '?') {
                return true;
            }
        }

        std::size_t cursor = pos + 1;
        std::string tag = read_tag_name(html_, cursor);
        if (!is_known_tag(tag)) {
            return fail(ParseErrorKind::InvalidTag, pos, "Invalid HTML tag: '" + tag + "'");
        }

        name = std::move(tag);
        name_end = cursor;
        return true;
    }

    bool classify_end_tag(std::size_t pos, std::string& name) {
        name.clear();
        if (pos + 1 >= html_.size() || html_[pos] != '<' || html_[pos + 1] != '/') {
            return true;
        }

        std::size_t cursor = pos + 2;
        std::string tag = read_tag_name(html_, cursor);
        if (!is_known_tag(tag)) {
            return fail(ParseErrorKind::InvalidTag, pos, "Invalid HTML end tag: '" + tag + "'");
        }

        name = std::move(tag);
        return true;
    }

    bool parse_content(std::size_t& pos,
                       NodeList& children,
                       const std::string& open_tag,
                       std::size_t depth) {
        while (!at_end(pos)) {
            pos = skip_whitespace(html_, pos);
            if (is_comment_start(html_, pos)) {
                if (!consume_comment(pos)) {
                    return false;
                }
                continue;
            }

            if (parse_text(pos, children)) {
                continue;
            }

            std::string tag_name;
            std::size_t name_end = pos;
            if (!classify_start_tag(pos, tag_name, name_end)) {
                return false;
            }

            if (tag_name.empty()) {
                bool skipped = false;
                if (!skip_stray_end_tag(pos, skipped)) {
                    return false;
                }
                if (skipped) {
                    continue;
                }
                break;
            }

            // Checked before recursing: the start tag stays unconsumed and
            // the caller's loop builds it as a sibling of `open_tag`.
            if (closes_on_sibling(open_tag, tag_name)) {
                note(core::Severity::Info, "content",
                     "<" + tag_name + "> implicitly closed <" + open_tag + ">");
                break;
            }

            std::unique_ptr<Node> element;
            if (!parse_element(pos, element, depth + 1)) {
                return false;
            }
            children.push_back(std::move(element));
        }

        return true;
    }

    // Returns true when the cursor moved, whether or not a node was added.
    bool parse_text(std::size_t& pos, NodeList& children) {
        const std::size_t next_tag = html_.find('<', pos);
        const std::size_t end = (next_tag == std::string_view::npos) ? html_.size() : next_tag;
        if (end <= pos) {
            return false;
        }

        const std::string_view text = trim_whitespace(html_.substr(pos, end - pos));
        if (!text.empty()) {
            children.push_back(make_text(std::string(text)));
        }
        pos = end;
        return true;
    }

    bool is_open(const std::string& tag_name) const {
        return std::find(open_elements_.begin(), open_elements_.end(), tag_name) !=
               open_elements_.end();
    }

    // Skips an end tag that no open element can own: one naming a void tag,
    // or one naming a tag that is not open. Any other end tag stays in place
    // so the loop stops and an ancestor consumes it.
    bool skip_stray_end_tag(std::size_t& pos, bool& skipped) {
        skipped = false;
        std::string end_name;
        if (!classify_end_tag(pos, end_name)) {
            return false;
        }
        if (end_name.empty()) {
            return true;
        }

        const bool void_tag = is_void_tag(end_name);
        if (!void_tag && is_open(end_name)) {
            return true;
        }

        const std::size_t tag_start = pos;
        if (!skip_past_tag_close(html_, pos)) {
            return fail(ParseErrorKind::OutOfBounds, tag_start,
                        "Unterminated end tag </" + end_name + ">");
        }
        note(core::Severity::Warning, "content",
             void_tag ? "Ignored end tag </" + end_name + "> of void element"
                      : "Ignored end tag </" + end_name + "> with no open element");
        skipped = true;
        return true;
    }

    bool parse_element(std::size_t& pos, std::unique_ptr<Node>& out, std::size_t depth) {
        if (depth > options_.max_nesting_depth) {
            return fail(ParseErrorKind::NestingTooDeep, pos,
                        "Element nesting exceeds " + std::to_string(options_.max_nesting_depth));
        }

        std::string tag_name;
        std::size_t cursor = pos;
        if (!classify_start_tag(pos, tag_name, cursor)) {
            return false;
        }
        if (tag_name.empty()) {
            return fail(ParseErrorKind::InvalidTag, pos, "Expected a start tag");
        }

        auto element = make_element(tag_name);
        if (!parse_attributes(cursor, element->attributes)) {
            return false;
        }

        if (!is_void_tag(tag_name)) {
            open_elements_.push_back(tag_name);
            if (!parse_content(cursor, element->children, element->tag_name, depth)) {
                return false;
            }
            open_elements_.pop_back();
            if (!consume_end_tag(cursor, element->tag_name)) {
                return false;
            }
        }

        pos = cursor;
        out = std::move(element);
        return true;
    }

    // Consumes "</tag_name>" only when it sits exactly at `pos`. A different
    // end tag is left in place for an ancestor with that name.
    bool consume_end_tag(std::size_t& pos, const std::string& tag_name) {
        std::string end_name;
        if (!classify_end_tag(pos, end_name)) {
            return false;
        }

        if (end_name != tag_name) {
            if (!end_name.empty()) {
                note(core::Severity::Info, "element",
                     "<" + tag_name + "> implicitly closed by </" + end_name + ">");
            } else if (at_end(pos)) {
                note(core::Severity::Info, "element",
                     "<" + tag_name + "> closed at end of input");
            }
            return true;
        }

        const std::size_t tag_start = pos;
        if (!skip_past_tag_close(html_, pos)) {
            return fail(ParseErrorKind::OutOfBounds, tag_start,
                        "Unterminated end tag </" + end_name + ">");
        }
        return true;
    }

    bool parse_attributes(std::size_t& pos, AttributeMap& attributes) {
        while (true) {
            pos = skip_whitespace(html_, pos);
            if (at_end(pos)) {
                return fail(ParseErrorKind::OutOfBounds, pos, "Unterminated start tag");
            }

            const char c = html_[pos];
            if (c == '>') {
                ++pos;
                return true;
            }
            if (c == '/') {
                if (pos + 1 < html_.size() && html_[pos + 1] == '>') {
                    pos += 2;
                    return true;
                }
                ++pos;
                continue;
            }

            std::string name = read_attribute_name(pos);
            if (name.empty()) {
                // stray '='
                ++pos;
                continue;
            }

            pos = skip_whitespace(html_, pos);
            std::string value;
            if (!at_end(pos) && html_[pos] == '=') {
                ++pos;
                pos = skip_whitespace(html_, pos);
                if (!parse_attribute_value(pos, value)) {
                    return false;
                }
            }

            attributes[std::move(name)] = std::move(value);
        }
    }

    std::string read_attribute_name(std::size_t& pos) const {
        const std::size_t start = pos;
        while (!at_end(pos) &&
               !is_html_whitespace(html_[pos]) &&
               html_[pos] != '=' &&
               html_[pos] != '>' &&
               html_[pos] != '/') {
            ++pos;
        }
        return std::string(html_.substr(start, pos - start));
    }

    bool parse_attribute_value(std::size_t& pos, std::string& value) {
        if (at_end(pos)) {
            return fail(ParseErrorKind::OutOfBounds, pos, "Missing attribute value");
        }

        const char quote = html_[pos];
        if (quote == '"' || quote == '\'') {
            const std::size_t close = html_.find(quote, pos + 1);
            if (close == std::string_view::npos) {
                return fail(ParseErrorKind::OutOfBounds, pos, "Unterminated attribute value");
            }
            value.assign(html_.substr(pos + 1, close - pos - 1));
            pos = close + 1;
            return true;
        }

        const std::size_t start = pos;
        while (!at_end(pos) && !is_html_whitespace(html_[pos]) && html_[pos] != '>') {
            ++pos;
        }
        value.assign(html_.substr(start, pos - start));
        return true;
    }
};

}  // namespace

const char* parse_error_kind_name(ParseErrorKind kind) {
    switch (kind) {
        case ParseErrorKind::None:           return "none";
        case ParseErrorKind::InvalidTag:     return "invalid-tag";
        case ParseErrorKind::OutOfBounds:    return "out-of-bounds";
        case ParseErrorKind::NestingTooDeep: return "nesting-too-deep";
    }
    return "unknown";
}

std::string format_parse_error(const ParseError& error) {
    std::string output = parse_error_kind_name(error.kind);
    output += " at offset " + std::to_string(error.position);
    if (!error.message.empty()) {
        output += ": " + error.message;
    }
    return output;
}

ParseResult parse_html(std::string_view html) {
    return parse_html(html, ParseOptions{});
}

ParseResult parse_html(std::string_view html, const ParseOptions& options) {
    return Parser(html, options).parse();
}

}  // namespace tagtree::html
