#include <taml/ast/node.h>
#include <taml/core/config.h>
#include <taml/core/diagnostics.h>
#include <taml/parser/parser.h>

#include <charconv>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

enum class Mode { Tree, Tokens, Check, Validate, Text, Serialize };

constexpr int kExitOk = 0;
constexpr int kExitFault = 1;
constexpr int kExitUsage = 2;

void print_usage(std::ostream& stream) {
    stream << "usage: " << taml::core::config::kProgramName
           << " [--tokens|--check|--validate|--text|--serialize]"
              " [--max-depth=N] [--no-positions] [--verbose] [file|-]\n";
}

bool is_help_flag(std::string_view text) {
    return text == "-h" || text == "--help";
}

bool is_version_flag(std::string_view text) {
    return text == "-V" || text == "--version";
}

bool parse_depth(std::string_view text, std::size_t& value) {
    if (text.empty()) {
        return false;
    }

    std::size_t parsed = 0;
    const char* begin = text.data();
    const char* end = begin + text.size();
    const std::from_chars_result result = std::from_chars(begin, end, parsed);
    if (result.ec != std::errc() || result.ptr != end) {
        return false;
    }

    value = parsed;
    return true;
}

bool read_input(const std::string& path, std::string& out) {
    if (path == "-") {
        std::ostringstream oss;
        oss << std::cin.rdbuf();
        out = oss.str();
        return true;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return true;
}

void print_tokens(const std::vector<taml::parser::Token>& tokens) {
    for (const auto& token : tokens) {
        std::cout << token.line << ":" << token.column << " "
                  << taml::parser::token_type_name(token.type)
                  << " [" << token.start << "," << token.end << ")";
        if (token.is_open_tag() || token.is_close_tag()) {
            std::cout << " " << token.tag_name;
        } else if (token.is_text()) {
            std::cout << " " << token.value.size() << " bytes";
        }
        std::cout << "\n";
    }
}

int report_errors(const std::vector<taml::parser::ParseError>& errors) {
    for (const auto& error : errors) {
        std::cerr << error.name() << ": " << error.detailed_message() << "\n\n";
    }
    return errors.empty() ? kExitOk : kExitFault;
}

}  // namespace

int main(int argc, char** argv) {
    Mode mode = Mode::Tree;
    bool verbose = false;
    taml::parser::ParseOptions options;
    std::vector<std::string> positional_args;

    for (int index = 1; index < argc; ++index) {
        const std::string_view argument(argv[index] != nullptr ? argv[index] : "");

        if (is_help_flag(argument)) {
            print_usage(std::cout);
            return kExitOk;
        }
        if (is_version_flag(argument)) {
            std::cout << taml::core::config::kVersionString << "\n";
            return kExitOk;
        }

        if (argument == "--tokens") {
            mode = Mode::Tokens;
        } else if (argument == "--check") {
            mode = Mode::Check;
        } else if (argument == "--validate") {
            mode = Mode::Validate;
        } else if (argument == "--text") {
            mode = Mode::Text;
        } else if (argument == "--serialize") {
            mode = Mode::Serialize;
        } else if (argument == "--no-positions") {
            options.include_positions = false;
        } else if (argument == "--verbose") {
            verbose = true;
        } else if (argument.starts_with("--max-depth=")) {
            if (!parse_depth(argument.substr(12), options.max_depth)) {
                std::cerr << "Invalid --max-depth: '" << argument
                          << "' (expected a non-negative integer)\n";
                print_usage(std::cerr);
                return kExitUsage;
            }
        } else if (argument.size() > 1 && argument.front() == '-') {
            std::cerr << "Unknown option: " << argument << "\n";
            print_usage(std::cerr);
            return kExitUsage;
        } else {
            positional_args.emplace_back(argument);
        }
    }

    if (positional_args.size() > 1) {
        print_usage(std::cerr);
        return kExitUsage;
    }

    const std::string path = positional_args.empty() ? "-" : positional_args.front();
    std::string source;
    if (!read_input(path, source)) {
        std::cerr << "Cannot read " << path << "\n";
        return kExitUsage;
    }

    taml::core::DiagnosticEmitter diagnostics;
    if (verbose) {
        diagnostics.add_observer([](const taml::core::DiagnosticEvent& event) {
            std::cerr << taml::core::format_diagnostic(event) << "\n";
        });
        options.diagnostics = &diagnostics;
    }

    try {
        switch (mode) {
            case Mode::Tokens:
                print_tokens(taml::parser::Tokenizer(source, options.diagnostics).tokenize());
                return kExitOk;
            case Mode::Check: {
                auto result = taml::parser::validate_syntax(source, options);
                if (result.valid) std::cout << "ok\n";
                return report_errors(result.errors);
            }
            case Mode::Validate: {
                taml::parser::Validator validator(source, options.diagnostics);
                auto result = validator.validate();
                if (result.valid) std::cout << "ok\n";
                return report_errors(result.errors);
            }
            case Mode::Text:
                std::cout << taml::ast::get_all_text(*taml::parser::parse(source, options));
                return kExitOk;
            case Mode::Serialize:
                std::cout << taml::ast::serialize(*taml::parser::parse(source, options));
                return kExitOk;
            case Mode::Tree:
                std::cout << taml::ast::dump(*taml::parser::parse(source, options));
                return kExitOk;
        }
    } catch (const taml::parser::ParseError& e) {
        std::cerr << e.name() << ": " << e.detailed_message() << "\n";
        return kExitFault;
    } catch (const taml::parser::DepthLimitError& e) {
        std::cerr << e.what() << "\n";
        return kExitFault;
    }

    return kExitOk;
}
