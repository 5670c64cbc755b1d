#ifndef WEFT_CORE_CONFIG_H
#define WEFT_CORE_CONFIG_H

#include <cstdint>

namespace weft::core::config {

// Any negative extent dimension means "unbounded"; this is the canonical one.
inline constexpr int kUnboundedCells = -1;

inline constexpr int kBorderInset = 1;
inline constexpr std::uint32_t kDefaultFactor = 1;

inline constexpr int kDefaultViewportWidth = 80;
inline constexpr int kDefaultViewportHeight = 24;

inline constexpr const char kLayoutModule[] = "layout";

}  // namespace weft::core::config

#endif  // WEFT_CORE_CONFIG_H
