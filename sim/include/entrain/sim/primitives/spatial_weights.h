// ==============================================================================
// Layer 1: Primitive - Spatial Weights
// ==============================================================================
// Row-normalized distance-decay adjacency between fixed oscillator positions:
//
//   w_ij = exp(-|p_i - p_j| / lambda),  w_ii = 0,  rows rescaled to sum to 1
//
// A row whose raw sum is zero keeps a divisor of 1, which leaves that
// oscillator with an all-zero row: it is simply uncoupled.
// ==============================================================================

#pragma once

#include <entrain/sim/core/grid_layout.h>

#include <cmath>
#include <cstddef>
#include <span>
#include <vector>

namespace Entrain {
namespace Sim {

/// @brief Dense N x N coupling weights, immutable after build().
///
/// @par Usage
/// @code
/// SpatialWeights weights;
/// weights.build(positions, 160.0);
/// for (std::size_t j = 0; j < weights.size(); ++j) {
///     sum += weights.row(i)[j] * std::sin(theta[j] - theta[i]);
/// }
/// @endcode
class SpatialWeights {
public:
    /// @brief Compute the normalized matrix for @p positions.
    /// @param positions Oscillator positions (one per oscillator)
    /// @param decayLength lambda, must be > 0 (validated by EngineConfig)
    void build(std::span<const Position> positions, double decayLength) {
        size_ = positions.size();
        weights_.assign(size_ * size_, 0.0);
        coupled_.assign(size_, false);

        for (std::size_t i = 0; i < size_; ++i) {
            double* rowData = weights_.data() + i * size_;
            double rowSum = 0.0;
            for (std::size_t j = 0; j < size_; ++j) {
                if (i == j) {
                    continue;
                }
                const double w = std::exp(-distance(positions[i], positions[j]) / decayLength);
                rowData[j] = w;
                rowSum += w;
            }

            coupled_[i] = rowSum > 0.0;
            const double divisor = coupled_[i] ? rowSum : 1.0;
            for (std::size_t j = 0; j < size_; ++j) {
                rowData[j] /= divisor;
            }
        }
    }

    /// Number of oscillators
    [[nodiscard]] std::size_t size() const noexcept { return size_; }

    /// Weight w_ij
    [[nodiscard]] double weight(std::size_t i, std::size_t j) const noexcept {
        return weights_[i * size_ + j];
    }

    /// Row i of the matrix (N entries)
    [[nodiscard]] std::span<const double> row(std::size_t i) const noexcept {
        return {weights_.data() + i * size_, size_};
    }

    /// Sum of row i: 1 for a coupled oscillator, 0 for an isolated one
    [[nodiscard]] double rowSum(std::size_t i) const noexcept {
        double sum = 0.0;
        for (const double w : row(i)) {
            sum += w;
        }
        return sum;
    }

    /// False when oscillator i has no neighbor with non-zero weight
    [[nodiscard]] bool isCoupled(std::size_t i) const noexcept { return coupled_[i]; }

private:
    std::vector<double> weights_;
    std::vector<bool> coupled_;
    std::size_t size_ = 0;
};

} // namespace Sim
} // namespace Entrain
