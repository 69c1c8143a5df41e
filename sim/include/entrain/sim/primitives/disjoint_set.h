// ==============================================================================
// Layer 1: Primitive - Disjoint Set (Union-Find)
// ==============================================================================
// Index-based union-find arena: parent and rank arrays sized to the number of
// elements of the current pass. Path compression (path halving) plus union by
// rank gives near-linear amortized cost.
//
// The arrays keep their capacity across reset() calls, so a detector that
// resets once per frame does not reallocate once it has seen its largest
// population.
// ==============================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <numeric>
#include <utility>
#include <vector>

namespace Entrain {
namespace Sim {

class DisjointSet {
public:
    /// @brief Re-initialize to @p count singleton sets {0}, {1}, ...
    void reset(std::size_t count) {
        parent_.resize(count);
        std::iota(parent_.begin(), parent_.end(), std::size_t{0});
        rank_.assign(count, 0);
        setCount_ = count;
    }

    /// @brief Pre-size the arena for up to @p capacity elements.
    void reserve(std::size_t capacity) {
        parent_.reserve(capacity);
        rank_.reserve(capacity);
    }

    /// Number of elements
    [[nodiscard]] std::size_t size() const noexcept { return parent_.size(); }

    /// Number of disjoint sets
    [[nodiscard]] std::size_t setCount() const noexcept { return setCount_; }

    /// @brief Representative of the set containing @p x.
    [[nodiscard]] std::size_t find(std::size_t x) noexcept {
        while (parent_[x] != x) {
            parent_[x] = parent_[parent_[x]];
            x = parent_[x];
        }
        return x;
    }

    /// @brief Merge the sets containing @p a and @p b.
    /// @return true if two distinct sets were merged
    bool unite(std::size_t a, std::size_t b) noexcept {
        std::size_t ra = find(a);
        std::size_t rb = find(b);
        if (ra == rb) {
            return false;
        }
        if (rank_[ra] < rank_[rb]) {
            std::swap(ra, rb);
        }
        parent_[rb] = ra;
        if (rank_[ra] == rank_[rb]) {
            ++rank_[ra];
        }
        --setCount_;
        return true;
    }

    /// True if @p a and @p b are in the same set
    [[nodiscard]] bool connected(std::size_t a, std::size_t b) noexcept {
        return find(a) == find(b);
    }

private:
    std::vector<std::size_t> parent_;
    std::vector<uint8_t> rank_;
    std::size_t setCount_ = 0;
};

} // namespace Sim
} // namespace Entrain
