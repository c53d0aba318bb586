#ifndef TRELLIS_CORE_CONFIG_H
#define TRELLIS_CORE_CONFIG_H

#include <cstddef>
#include <cstdint>

namespace trellis::core::config {

inline constexpr std::uint32_t kDefaultViewportWidth = 1280;
inline constexpr std::uint32_t kDefaultViewportHeight = 720;

// Root font size used for rem units and as the initial font-size.
inline constexpr float kDefaultFontSize = 16.0f;
inline constexpr float kDefaultLineHeightFactor = 1.2f;

// Simple text metrics: average glyph advance as a fraction of font size.
inline constexpr float kAverageGlyphAdvance = 0.5f;

// Events kept by a DiagnosticEmitter before the oldest are evicted.
inline constexpr std::size_t kDiagnosticCapacity = 1024;

// Deepest element nesting a reflow accepts; style and layout recurse per level.
inline constexpr std::size_t kMaxTreeDepth = 512;

}  // namespace trellis::core::config

#endif  // TRELLIS_CORE_CONFIG_H
