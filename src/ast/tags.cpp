#include <taml/ast/tags.h>
#include <algorithm>

namespace taml::ast {

namespace {

constexpr std::size_t kStandardEnd = 8;
constexpr std::size_t kBrightEnd = 16;
constexpr std::size_t kBackgroundEnd = 32;

constexpr std::array<std::string_view, kTagCount> kTags = {
    // standard colors
    "black", "red", "green", "yellow", "blue", "magenta", "cyan", "white",
    // bright colors
    "brightBlack", "brightRed", "brightGreen", "brightYellow",
    "brightBlue", "brightMagenta", "brightCyan", "brightWhite",
    // background colors
    "bgBlack", "bgRed", "bgGreen", "bgYellow",
    "bgBlue", "bgMagenta", "bgCyan", "bgWhite",
    "bgBrightBlack", "bgBrightRed", "bgBrightGreen", "bgBrightYellow",
    "bgBrightBlue", "bgBrightMagenta", "bgBrightCyan", "bgBrightWhite",
    // text styles
    "bold", "dim", "italic", "underline", "strikethrough"
};

std::optional<std::size_t> index_of(std::string_view name) {
    auto it = std::find(kTags.begin(), kTags.end(), name);
    if (it == kTags.end()) return std::nullopt;
    return static_cast<std::size_t>(it - kTags.begin());
}

} // namespace

const std::array<std::string_view, kTagCount>& all_tags() {
    return kTags;
}

bool is_valid_tag(std::string_view name) {
    return index_of(name).has_value();
}

std::optional<TagCategory> tag_category(std::string_view name) {
    auto index = index_of(name);
    if (!index) return std::nullopt;
    if (*index < kStandardEnd) return TagCategory::StandardColor;
    if (*index < kBrightEnd) return TagCategory::BrightColor;
    if (*index < kBackgroundEnd) return TagCategory::BackgroundColor;
    return TagCategory::TextStyle;
}

const char* tag_category_name(TagCategory category) {
    switch (category) {
        case TagCategory::StandardColor:   return "standard-color";
        case TagCategory::BrightColor:     return "bright-color";
        case TagCategory::BackgroundColor: return "background-color";
        case TagCategory::TextStyle:       return "text-style";
    }
    return "unknown";
}

} // namespace taml::ast
