// ==============================================================================
// Layer 0: Core Utility Tests - Circular Statistics
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>
#include <cstddef>
#include <limits>
#include <random>
#include <vector>

#include <entrain/sim/core/circular_stats.h>
#include <entrain/sim/core/math_constants.h>

using namespace Entrain::Sim;
using Catch::Approx;

TEST_CASE("orderParameter of identical phases is 1", "[circular_stats][core]") {
    const std::vector<double> phases(10, 1.3);
    REQUIRE(orderParameter(phases) == Approx(1.0).margin(1e-12));
}

TEST_CASE("orderParameter of a splay state is 0", "[circular_stats][core]") {
    std::vector<double> phases;
    constexpr int kCount = 12;
    for (int i = 0; i < kCount; ++i) {
        phases.push_back(-kPi + kTwoPi * static_cast<double>(i) / kCount);
    }
    REQUIRE(orderParameter(phases) == Approx(0.0).margin(1e-12));
}

TEST_CASE("orderParameter of two opposite phases is 0", "[circular_stats][core]") {
    const std::vector<double> phases{0.4, 0.4 - kPi};
    REQUIRE(orderParameter(phases) == Approx(0.0).margin(1e-12));
}

TEST_CASE("orderParameter of empty input is 0", "[circular_stats][core][edge]") {
    const std::vector<double> phases;
    REQUIRE(orderParameter(phases) == 0.0);

    const std::vector<std::size_t> noIndices;
    const std::vector<double> some{0.1, 0.2};
    REQUIRE(orderParameter(some, noIndices) == 0.0);
}

TEST_CASE("orderParameter stays within [0, 1] for random phases", "[circular_stats][core]") {
    std::mt19937 rng(11);
    std::uniform_real_distribution<double> dist(-kPi, kPi);

    for (int trial = 0; trial < 200; ++trial) {
        std::vector<double> phases(1 + trial % 17);
        for (auto& p : phases) {
            p = dist(rng);
        }
        const double r = orderParameter(phases);
        REQUIRE(r >= 0.0);
        REQUIRE(r <= 1.0);
    }
}

TEST_CASE("orderParameter propagates NaN phases", "[circular_stats][core][edge]") {
    const std::vector<double> phases{0.1, std::numeric_limits<double>::quiet_NaN(), 0.2};
    REQUIRE(std::isnan(orderParameter(phases)));
}

TEST_CASE("subset orderParameter uses only the given indices", "[circular_stats][core]") {
    // Indices 0 and 2 are in phase; index 1 is opposite
    const std::vector<double> phases{0.5, 0.5 - kPi, 0.5};
    const std::vector<std::size_t> inPhase{0, 2};
    const std::vector<std::size_t> all{0, 1, 2};

    REQUIRE(orderParameter(phases, inPhase) == Approx(1.0).margin(1e-12));
    REQUIRE(orderParameter(phases, all) == Approx(1.0 / 3.0).margin(1e-12));
}

TEST_CASE("meanPhasor angle is the mean phase", "[circular_stats][core]") {
    const std::vector<double> phases{0.9, 1.1};
    const MeanPhasor phasor = meanPhasor(phases);
    REQUIRE(phasor.angle() == Approx(1.0).margin(1e-12));
    REQUIRE(phasor.magnitude() == Approx(std::cos(0.1)).margin(1e-12));

    SECTION("zero phasor has angle 0") {
        REQUIRE(MeanPhasor{}.angle() == 0.0);
    }

    SECTION("meanPhase across the wrap point") {
        const std::vector<double> nearPi{3.0, -3.0};
        REQUIRE(std::abs(meanPhase(nearPi)) == Approx(kPi).margin(1e-12));
    }
}
