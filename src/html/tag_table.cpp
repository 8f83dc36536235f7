#include "tagtree/html/tag_table.h"

#include <unordered_map>
#include <unordered_set>

namespace tagtree::html {
namespace {

using TagSet = std::unordered_set<std::string>;

const TagSet& known_tags() {
    static const TagSet kKnownTags = {
        "a",        "abbr",       "acronym",  "address",  "applet",   "area",     "article",
        "aside",    "audio",      "b",        "base",     "basefont", "bdi",      "bdo",
        "bgsound",  "big",        "blink",    "blockquote","body",    "br",       "button",
        "canvas",   "caption",    "center",   "cite",     "code",     "col",      "colgroup",
        "content",  "data",       "datalist", "dd",       "decorator","del",      "details",
        "dfn",      "dir",        "div",      "dl",       "dt",       "element",  "em",
        "embed",    "fieldset",   "figcaption","figure",  "font",     "footer",   "form",
        "frame",    "frameset",   "h1",       "h2",       "h3",       "h4",       "h5",
        "h6",       "head",       "header",   "hgroup",   "hr",       "html",     "i",
        "iframe",   "img",        "input",    "ins",      "isindex",  "kbd",      "keygen",
        "label",    "legend",     "li",       "link",     "listing",  "main",     "map",
        "mark",     "marquee",    "menu",     "menuitem", "meta",     "meter",    "nav",
        "nobr",     "noframes",   "noscript", "object",   "ol",       "optgroup", "option",
        "output",   "p",          "param",    "plaintext","pre",      "progress", "q",
        "rp",       "rt",         "ruby",     "s",        "samp",     "script",   "section",
        "select",   "shadow",     "small",    "source",   "spacer",   "span",     "strike",
        "strong",   "style",      "sub",      "summary",  "sup",      "table",    "tbody",
        "td",       "template",   "textarea", "tfoot",    "th",       "thead",    "time",
        "title",    "tr",         "track",    "tt",       "u",        "ul",       "var",
        "video",    "wbr",        "xmp",
    };
    return kKnownTags;
}

const TagSet& void_tags() {
    static const TagSet kVoidTags = {
        "area",  "base",   "br",   "col",   "embed", "hr",
        "img",   "input",  "keygen","link", "meta",  "param",
        "source","track",  "wbr",
    };
    return kVoidTags;
}

// Open element -> start tags that end it without an explicit end tag.
const std::unordered_map<std::string, TagSet>& implied_end_triggers() {
    static const std::unordered_map<std::string, TagSet> kTriggers = {
        {"p", {"address", "article", "aside", "blockquote", "details", "div",
               "dl", "dd", "dt", "fieldset", "figcaption", "figure", "footer",
               "form", "h1", "h2", "h3", "h4", "h5", "h6", "header", "hgroup",
               "hr", "li", "main", "menu", "nav", "ol", "p", "pre", "section",
               "table", "ul"}},
        {"li", {"li"}},
        {"dt", {"dt", "dd"}},
        {"dd", {"dt", "dd"}},
        {"td", {"td", "th", "tr", "tbody", "thead", "tfoot"}},
        {"th", {"td", "th", "tr", "tbody", "thead", "tfoot"}},
        {"tr", {"tr", "tbody", "thead", "tfoot"}},
        {"thead", {"tbody", "tfoot"}},
        {"tbody", {"tbody", "tfoot"}},
        {"tfoot", {"tbody"}},
        {"option", {"option", "optgroup"}},
        {"optgroup", {"optgroup"}},
        {"rt", {"rt", "rp"}},
        {"rp", {"rt", "rp"}},
        {"head", {"body"}},
    };
    return kTriggers;
}

}  // namespace

bool is_known_tag(const std::string& tag_name) {
    return known_tags().count(tag_name) != 0;
}

bool is_void_tag(const std::string& tag_name) {
    return void_tags().count(tag_name) != 0;
}

bool closes_on_sibling(const std::string& open_tag, const std::string& next_tag) {
    const auto& triggers = implied_end_triggers();
    const auto it = triggers.find(open_tag);
    if (it == triggers.end()) {
        return false;
    }
    return it->second.count(next_tag) != 0;
}

}  // namespace tagtree::html
