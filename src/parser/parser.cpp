#include <taml/parser/parser.h>

namespace taml::parser {

std::string SafeParseResult::error_message() const {
    if (error) return error->message();
    if (depth_error) return depth_error->what();
    return {};
}

SafeParseResult parse_safe(std::string_view source, const ParseOptions& options) {
    SafeParseResult result;
    try {
        result.ast = parse(source, options);
        result.success = true;
    } catch (const ParseError& e) {
        result.error = e;
    } catch (const DepthLimitError& e) {
        result.depth_error = e;
    }
    return result;
}

ValidationResult validate_syntax(std::string_view source, const ParseOptions& options) {
    ValidationResult result;
    try {
        parse(source, options);
    } catch (const ParseError& e) {
        result.valid = false;
        result.errors.push_back(e);
    }
    return result;
}

} // namespace taml::parser
