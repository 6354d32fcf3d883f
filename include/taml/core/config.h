#ifndef TAML_CORE_CONFIG_H
#define TAML_CORE_CONFIG_H

#include <cstddef>

namespace taml::core::config {

inline constexpr std::size_t kDefaultMaxDepth = 100;
inline constexpr bool kDefaultIncludePositions = true;

// Stands in for the expected tag when a closing tag has nothing to close.
inline constexpr const char kNoOpenTagName[] = "(none)";

inline constexpr const char kProgramName[] = "tamlc";
inline constexpr const char kVersionString[] = "tamlc 1.0.0";

}  // namespace taml::core::config

#endif  // TAML_CORE_CONFIG_H
