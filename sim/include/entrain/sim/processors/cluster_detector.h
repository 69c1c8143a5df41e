// ==============================================================================
// Layer 2: Processor - Cluster Detector
// ==============================================================================
// Groups active oscillators that are close in space AND in phase.
//
// An edge (i, j) exists iff
//   |p_i - p_j| <= neighborRadius  and  |wrap(theta_i - theta_j)| <= phaseThreshold
// Connected components are found with a DisjointSet over the active indices
// only. A component qualifies as a cluster iff
//   size >= minClusterSize  and  |mean e^{i theta}| over members >= coherenceThreshold
//
// Components are reported in discovery order (ascending lowest member index).
// Qualified components receive palette indices 0, 1, 2, ... wrapping at the
// palette size. There is no identity across frames: each call is an
// independent snapshot, and HysteresisTracker smooths the result.
// ==============================================================================

#pragma once

#include <entrain/sim/core/circular_stats.h>
#include <entrain/sim/core/color.h>
#include <entrain/sim/core/grid_layout.h>
#include <entrain/sim/core/phase_utils.h>
#include <entrain/sim/primitives/disjoint_set.h>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <vector>

namespace Entrain {
namespace Sim {

/// @brief One connected component of a single frame.
struct Cluster {
    std::vector<std::size_t> members;   ///< Oscillator indices, ascending
    double coherence = 0.0;             ///< r over members
    bool qualified = false;             ///< Passed size and coherence tests
    ColorIndex color = kNeutralColor;   ///< Palette index if qualified
};

class ClusterDetector {
public:
    /// @brief Set the edge and qualification criteria.
    /// @param neighborRadius Max spatial distance of an edge
    /// @param phaseThreshold Max |phase difference| of an edge (rad)
    /// @param coherenceThreshold Min r of a qualified cluster
    /// @param minClusterSize Min members of a qualified cluster
    /// @param paletteSize Number of cluster colors (>= 1)
    void configure(
        double neighborRadius,
        double phaseThreshold,
        double coherenceThreshold,
        std::size_t minClusterSize,
        std::size_t paletteSize
    ) noexcept {
        radiusSquared_ = neighborRadius * neighborRadius;
        phaseThreshold_ = phaseThreshold;
        coherenceThreshold_ = coherenceThreshold;
        minClusterSize_ = minClusterSize;
        paletteSize_ = paletteSize > 0 ? paletteSize : 1;
    }

    /// @brief Reserve working memory for up to @p maxOscillators.
    void prepare(std::size_t maxOscillators) {
        activeIndices_.reserve(maxOscillators);
        rootSlot_.reserve(maxOscillators);
        dsu_.reserve(maxOscillators);
        colors_.assign(maxOscillators, kNeutralColor);
        componentCount_ = 0;
        qualifiedCount_ = 0;
    }

    /// @brief Detect this frame's components.
    /// @param positions Oscillator positions (N)
    /// @param phases Oscillator phases (N)
    /// @param active Active flags (N); inactive oscillators are ignored
    void detect(
        std::span<const Position> positions,
        std::span<const double> phases,
        std::span<const uint8_t> active
    ) {
        const std::size_t n = phases.size();
        colors_.assign(n, kNeutralColor);
        componentCount_ = 0;
        qualifiedCount_ = 0;

        activeIndices_.clear();
        for (std::size_t i = 0; i < n; ++i) {
            if (active[i] != 0) {
                activeIndices_.push_back(i);
            }
        }
        const std::size_t m = activeIndices_.size();
        if (m == 0) {
            return;
        }

        dsu_.reset(m);
        for (std::size_t a = 0; a < m; ++a) {
            const std::size_t i = activeIndices_[a];
            for (std::size_t b = a + 1; b < m; ++b) {
                const std::size_t j = activeIndices_[b];
                if (isEdge(positions[i], positions[j], phases[i], phases[j])) {
                    dsu_.unite(a, b);
                }
            }
        }

        // Gather members per root in ascending index order
        rootSlot_.assign(m, kNoSlot);
        for (std::size_t a = 0; a < m; ++a) {
            const std::size_t root = dsu_.find(a);
            if (rootSlot_[root] == kNoSlot) {
                rootSlot_[root] = acquireComponent();
            }
            components_[rootSlot_[root]].members.push_back(activeIndices_[a]);
        }

        for (std::size_t c = 0; c < componentCount_; ++c) {
            Cluster& cluster = components_[c];
            cluster.coherence = orderParameter(phases, cluster.members);
            cluster.qualified = cluster.members.size() >= minClusterSize_ &&
                                cluster.coherence >= coherenceThreshold_;
            if (!cluster.qualified) {
                continue;
            }
            cluster.color = static_cast<ColorIndex>(qualifiedCount_ % paletteSize_);
            ++qualifiedCount_;
            for (const std::size_t i : cluster.members) {
                colors_[i] = cluster.color;
            }
        }
    }

    /// All components of the last detect() call, in discovery order
    [[nodiscard]] std::span<const Cluster> components() const noexcept {
        return {components_.data(), componentCount_};
    }

    /// Per-oscillator palette index, or kNeutralColor
    [[nodiscard]] std::span<const ColorIndex> colors() const noexcept { return colors_; }

    /// Number of qualified clusters in the last detect() call
    [[nodiscard]] std::size_t qualifiedCount() const noexcept { return qualifiedCount_; }

    /// Edge predicate: within radius and within phase threshold
    [[nodiscard]] bool isEdge(
        const Position& pi,
        const Position& pj,
        double thetaI,
        double thetaJ
    ) const noexcept {
        return distanceSquared(pi, pj) <= radiusSquared_ &&
               phaseDistance(thetaI, thetaJ) <= phaseThreshold_;
    }

private:
    static constexpr std::size_t kNoSlot = std::numeric_limits<std::size_t>::max();

    /// Next free component slot; member vectors keep their capacity
    std::size_t acquireComponent() {
        if (componentCount_ == components_.size()) {
            components_.emplace_back();
        }
        Cluster& cluster = components_[componentCount_];
        cluster.members.clear();
        cluster.coherence = 0.0;
        cluster.qualified = false;
        cluster.color = kNeutralColor;
        return componentCount_++;
    }

    double radiusSquared_ = 0.0;
    double phaseThreshold_ = 0.0;
    double coherenceThreshold_ = 1.0;
    std::size_t minClusterSize_ = 1;
    std::size_t paletteSize_ = 1;

    DisjointSet dsu_;
    std::vector<std::size_t> activeIndices_;
    std::vector<std::size_t> rootSlot_;
    std::vector<Cluster> components_;
    std::vector<ColorIndex> colors_;
    std::size_t componentCount_ = 0;
    std::size_t qualifiedCount_ = 0;
};

} // namespace Sim
} // namespace Entrain
