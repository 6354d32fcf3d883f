#pragma once
#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace taml::ast {

enum class TagCategory {
    StandardColor,
    BrightColor,
    BackgroundColor,
    TextStyle
};

inline constexpr std::size_t kTagCount = 37;

// The closed TAML vocabulary, grouped: 8 standard colors, 8 bright colors,
// 16 backgrounds (normal then bright), 5 text styles.
const std::array<std::string_view, kTagCount>& all_tags();

// Case-sensitive membership test against all_tags().
bool is_valid_tag(std::string_view name);

std::optional<TagCategory> tag_category(std::string_view name);
const char* tag_category_name(TagCategory category);

} // namespace taml::ast
