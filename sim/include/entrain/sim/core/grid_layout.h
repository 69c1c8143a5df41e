// ==============================================================================
// Layer 0: Core Utility - Grid Layout
// ==============================================================================
// Default layout provider: places N metronomes on a row-major grid inside a
// frame of the given pixel size. Positions are computed once and handed to
// the engine, which never mutates them.
// ==============================================================================

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace Entrain {
namespace Sim {

/// 2-D position in layout units (pixels for the built-in layout)
struct Position {
    double x = 0.0;
    double y = 0.0;
};

/// @brief Euclidean distance between two positions.
[[nodiscard]] inline double distance(const Position& a, const Position& b) noexcept {
    return std::hypot(a.x - b.x, a.y - b.y);
}

/// @brief Squared Euclidean distance (no sqrt, for threshold tests).
[[nodiscard]] constexpr double distanceSquared(const Position& a, const Position& b) noexcept {
    const double dx = a.x - b.x;
    const double dy = a.y - b.y;
    return dx * dx + dy * dy;
}

/// @brief Frame geometry for the grid layout.
struct LayoutFrame {
    double width = 1280.0;       ///< Frame width
    double height = 720.0;       ///< Frame height
    double marginX = 120.0;      ///< Left/right margin to first/last column
    double marginTop = 160.0;    ///< Y of the first row
    double rowSpacing = 160.0;   ///< Vertical distance between rows
};

/// @brief Row-major grid positions for @p count oscillators on @p rows rows.
///
/// cols = ceil(count / rows); columns are spread evenly between the left and
/// right margins (a single column sits on the left margin). The last row
/// may be partially filled.
/// @return Exactly @p count positions (empty if count or rows is 0)
[[nodiscard]] inline std::vector<Position> makeGridLayout(
    std::size_t count,
    std::size_t rows,
    const LayoutFrame& frame = {}
) {
    std::vector<Position> positions;
    if (count == 0 || rows == 0) {
        return positions;
    }
    positions.reserve(count);

    const std::size_t cols = (count + rows - 1) / rows;
    const double spacingX =
        (frame.width - 2.0 * frame.marginX) / static_cast<double>(std::max<std::size_t>(1, cols - 1));

    for (std::size_t r = 0; r < rows && positions.size() < count; ++r) {
        const double y = frame.marginTop + static_cast<double>(r) * frame.rowSpacing;
        for (std::size_t c = 0; c < cols && positions.size() < count; ++c) {
            positions.push_back({frame.marginX + static_cast<double>(c) * spacingX, y});
        }
    }
    return positions;
}

} // namespace Sim
} // namespace Entrain
