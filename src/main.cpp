#include "tagtree/core/config.h"
#include "tagtree/core/diagnostics.h"
#include "tagtree/html/ast_parser.h"
#include "tagtree/html/query.h"

#include <charconv>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

namespace {

constexpr const char kStdinPath[] = "-";

void print_usage(std::ostream& stream) {
    stream << "usage: " << tagtree::core::config::kProgramName
           << " [--id=ID] [--trace] [--max-depth=N] <file.html|->\n";
}

bool is_help_flag(std::string_view text) {
    return text == "-h" || text == "--help";
}

bool is_version_flag(std::string_view text) {
    return text == "-V" || text == "--version";
}

bool starts_with(std::string_view value, std::string_view prefix) {
    return value.size() >= prefix.size() &&
           value.compare(0, prefix.size(), prefix) == 0;
}

bool parse_positive_size(std::string_view text, std::size_t& value) {
    if (text.empty()) {
        return false;
    }

    std::size_t parsed = 0;
    const char* begin = text.data();
    const char* end = begin + text.size();
    const std::from_chars_result result = std::from_chars(begin, end, parsed);
    if (result.ec != std::errc() || result.ptr != end || parsed == 0) {
        return false;
    }

    value = parsed;
    return true;
}

bool read_input(const std::string& path, std::string& contents, std::string& err) {
    if (path == kStdinPath) {
        contents.assign(std::istreambuf_iterator<char>(std::cin),
                        std::istreambuf_iterator<char>());
        if (std::cin.bad()) {
            err = "Failed to read standard input";
            return false;
        }
        return true;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        err = "Cannot open '" + path + "'";
        return false;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        err = "Failed to read '" + path + "'";
        return false;
    }
    contents = buffer.str();
    return true;
}

}  // namespace

int main(int argc, char** argv) {
    std::string element_id;
    std::string input_path;
    bool trace = false;
    bool has_id = false;
    tagtree::html::ParseOptions options;

    for (int index = 1; index < argc; ++index) {
        const std::string_view argument(argv[index] != nullptr ? argv[index] : "");

        if (is_help_flag(argument)) {
            print_usage(std::cout);
            return 0;
        }
        if (is_version_flag(argument)) {
            std::cout << tagtree::core::config::kVersionString << "\n";
            return 0;
        }
        if (argument == "--trace") {
            trace = true;
            continue;
        }

        constexpr std::string_view kIdPrefix = "--id=";
        if (starts_with(argument, kIdPrefix)) {
            element_id = std::string(argument.substr(kIdPrefix.size()));
            if (element_id.empty()) {
                std::cerr << "Invalid --id: value must not be empty\n";
                print_usage(std::cerr);
                return 1;
            }
            has_id = true;
            continue;
        }

        constexpr std::string_view kDepthPrefix = "--max-depth=";
        if (starts_with(argument, kDepthPrefix)) {
            if (!parse_positive_size(argument.substr(kDepthPrefix.size()),
                                     options.max_nesting_depth)) {
                std::cerr << "Invalid --max-depth: '" << argument
                          << "' (expected a positive integer)\n";
                print_usage(std::cerr);
                return 1;
            }
            continue;
        }

        if (starts_with(argument, "--")) {
            std::cerr << "Unknown option '" << argument << "'\n";
            print_usage(std::cerr);
            return 1;
        }

        if (!input_path.empty()) {
            std::cerr << "Unexpected extra argument '" << argument << "'\n";
            print_usage(std::cerr);
            return 1;
        }
        input_path = std::string(argument);
    }

    if (input_path.empty()) {
        print_usage(std::cerr);
        return 1;
    }

    std::string html;
    std::string err;
    if (!read_input(input_path, html, err)) {
        std::cerr << err << "\n";
        return 1;
    }

    tagtree::core::DiagnosticEmitter diagnostics;
    diagnostics.add_observer([](const tagtree::core::DiagnosticEvent& event) {
        std::cerr << tagtree::core::format_diagnostic(event) << "\n";
    });
    if (!trace) {
        diagnostics.set_min_severity(tagtree::core::Severity::Warning);
    }
    options.diagnostics = &diagnostics;

    // Failures are reported through the emitter as an error event.
    const tagtree::html::ParseResult result = tagtree::html::parse_html(html, options);
    if (!result.ok()) {
        return 1;
    }

    if (trace) {
        std::cerr << diagnostics.count_at_least(tagtree::core::Severity::Warning)
                  << " warning(s)\n";
    }

    if (!has_id) {
        std::cout << tagtree::html::serialize_ast(*result.document) << "\n";
        return 0;
    }

    const tagtree::html::Node* element =
        tagtree::html::get_element_by_id(*result.document, element_id);
    if (element == nullptr) {
        std::cerr << "No element with id '" << element_id << "'\n";
        return 1;
    }

    std::cout << tagtree::html::serialize_ast(*element) << "\n";
    return 0;
}
