#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include "tagtree/core/config.h"
#include "tagtree/core/diagnostics.h"
#include "tagtree/html/ast.h"

namespace tagtree::html {

enum class ParseErrorKind {
    None,
    InvalidTag,
    OutOfBounds,
    NestingTooDeep,
};

const char* parse_error_kind_name(ParseErrorKind kind);

struct ParseError {
    ParseErrorKind kind = ParseErrorKind::None;
    std::size_t position = 0;
    std::string message;
};

std::string format_parse_error(const ParseError& error);

struct ParseOptions {
    std::size_t max_nesting_depth = core::config::kDefaultMaxNestingDepth;
    // Not owned. Receives prolog, omission and failure events when set.
    core::DiagnosticEmitter* diagnostics = nullptr;
};

struct ParseResult {
    std::unique_ptr<Node> document;
    ParseError error;

    bool ok() const { return error.kind == ParseErrorKind::None; }
};

// Builds the whole tree in one pass. On failure `document` is null; there is
// no partial tree.
ParseResult parse_html(std::string_view html);
ParseResult parse_html(std::string_view html, const ParseOptions& options);

}  // namespace tagtree::html
