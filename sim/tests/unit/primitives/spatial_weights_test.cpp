// ==============================================================================
// Layer 1: Primitive Tests - Spatial Weights
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>
#include <cstddef>
#include <vector>

#include <entrain/sim/core/grid_layout.h>
#include <entrain/sim/primitives/spatial_weights.h>

using namespace Entrain::Sim;
using Catch::Approx;

TEST_CASE("SpatialWeights rows sum to 1 with zero diagonal", "[spatial_weights][primitives]") {
    const auto positions = makeGridLayout(90, 3);
    SpatialWeights weights;
    weights.build(positions, 160.0);

    REQUIRE(weights.size() == 90);
    for (std::size_t i = 0; i < weights.size(); ++i) {
        REQUIRE(weights.weight(i, i) == 0.0);
        REQUIRE(weights.isCoupled(i));
        REQUIRE(weights.rowSum(i) == Approx(1.0).margin(1e-12));
        for (const double w : weights.row(i)) {
            REQUIRE(w >= 0.0);
        }
    }
}

TEST_CASE("SpatialWeights decay with distance", "[spatial_weights][primitives]") {
    const std::vector<Position> positions{{0.0, 0.0}, {100.0, 0.0}, {300.0, 0.0}};
    SpatialWeights weights;
    weights.build(positions, 100.0);

    // Row 0: raw e^-1 and e^-3
    const double raw1 = std::exp(-1.0);
    const double raw2 = std::exp(-3.0);
    REQUIRE(weights.weight(0, 1) == Approx(raw1 / (raw1 + raw2)));
    REQUIRE(weights.weight(0, 2) == Approx(raw2 / (raw1 + raw2)));
    REQUIRE(weights.weight(0, 1) > weights.weight(0, 2));
}

TEST_CASE("SpatialWeights co-located points share equal weights", "[spatial_weights][primitives]") {
    const std::vector<Position> positions(4, Position{10.0, 10.0});
    SpatialWeights weights;
    weights.build(positions, 50.0);

    for (std::size_t i = 0; i < 4; ++i) {
        for (std::size_t j = 0; j < 4; ++j) {
            const double expected = (i == j) ? 0.0 : 1.0 / 3.0;
            REQUIRE(weights.weight(i, j) == Approx(expected).margin(1e-12));
        }
    }
}

TEST_CASE("SpatialWeights single oscillator is uncoupled", "[spatial_weights][primitives][edge]") {
    const std::vector<Position> positions{{5.0, 5.0}};
    SpatialWeights weights;
    weights.build(positions, 160.0);

    REQUIRE(weights.size() == 1);
    REQUIRE(weights.weight(0, 0) == 0.0);
    REQUIRE_FALSE(weights.isCoupled(0));
    REQUIRE(weights.rowSum(0) == 0.0);
}

TEST_CASE("SpatialWeights far-apart oscillators underflow to isolated rows",
          "[spatial_weights][primitives][edge]") {
    const std::vector<Position> positions{{0.0, 0.0}, {1.0e6, 0.0}};
    SpatialWeights weights;
    weights.build(positions, 1.0);

    REQUIRE_FALSE(weights.isCoupled(0));
    REQUIRE_FALSE(weights.isCoupled(1));
    REQUIRE(weights.weight(0, 1) == 0.0);
    REQUIRE(weights.rowSum(1) == 0.0);
}

TEST_CASE("SpatialWeights empty input", "[spatial_weights][primitives][edge]") {
    const std::vector<Position> positions;
    SpatialWeights weights;
    weights.build(positions, 160.0);
    REQUIRE(weights.size() == 0);
}
