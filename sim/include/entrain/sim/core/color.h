// ==============================================================================
// Layer 0: Core Utility - Cluster Colors
// ==============================================================================
// Palette types handed to the rendering collaborator. The engine itself only
// deals in palette indices; resolveColor() turns an index into RGB.
// ==============================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace Entrain {
namespace Sim {

/// 8-bit RGB color
struct Rgb8 {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    friend constexpr bool operator==(const Rgb8&, const Rgb8&) = default;
};

/// Per-oscillator color index: palette entry >= 0, or one of the sentinels
using ColorIndex = int32_t;

/// Oscillator belongs to no qualified cluster
inline constexpr ColorIndex kNeutralColor = -1;

/// Engine is fully locked; every oscillator is one group
inline constexpr ColorIndex kLockedColor = -2;

/// Default neutral bob color (inactive or unclustered)
inline constexpr Rgb8 kDefaultNeutralColor{150, 150, 160};

/// Default color of the fully locked group
inline constexpr Rgb8 kDefaultLockedColor{80, 200, 255};

/// @brief Pastel cluster palette used by the built-in presets.
[[nodiscard]] inline std::vector<Rgb8> defaultPastelPalette() {
    return {
        {255, 179, 186},  // rose
        {255, 223, 186},  // apricot
        {255, 255, 186},  // butter
        {186, 255, 201},  // mint
        {186, 225, 255},  // sky
        {214, 190, 255},  // lilac
        {255, 200, 240},  // orchid
        {200, 240, 230},  // seafoam
    };
}

/// @brief Resolve a color index into RGB.
/// @param index Palette index or sentinel
/// @param palette Cluster palette (indices wrap around its size)
/// @param neutral Color for kNeutralColor and for an empty palette
/// @param locked Color for kLockedColor
[[nodiscard]] inline Rgb8 resolveColor(
    ColorIndex index,
    std::span<const Rgb8> palette,
    Rgb8 neutral,
    Rgb8 locked
) noexcept {
    if (index == kLockedColor) {
        return locked;
    }
    if (index < 0 || palette.empty()) {
        return neutral;
    }
    return palette[static_cast<std::size_t>(index) % palette.size()];
}

} // namespace Sim
} // namespace Entrain
