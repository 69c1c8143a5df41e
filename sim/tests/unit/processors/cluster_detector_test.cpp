// ==============================================================================
// Layer 2: Processor Tests - Cluster Detector
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <set>
#include <vector>

#include <entrain/sim/core/color.h>
#include <entrain/sim/core/grid_layout.h>
#include <entrain/sim/processors/cluster_detector.h>

using namespace Entrain::Sim;
using Catch::Approx;

namespace {

ClusterDetector makeDetector(std::size_t minSize = 2, std::size_t paletteSize = 8) {
    ClusterDetector detector;
    detector.configure(180.0, 0.35, 0.92, minSize, paletteSize);
    detector.prepare(16);
    return detector;
}

std::set<std::set<std::size_t>> componentSets(const ClusterDetector& detector) {
    std::set<std::set<std::size_t>> sets;
    for (const auto& cluster : detector.components()) {
        sets.insert(std::set<std::size_t>(cluster.members.begin(), cluster.members.end()));
    }
    return sets;
}

} // namespace

TEST_CASE("ClusterDetector groups co-located in-phase oscillators", "[cluster][processors]") {
    auto detector = makeDetector();
    const std::vector<Position> positions(2, Position{100.0, 100.0});
    const std::vector<double> phases{0.7, 0.7};
    const std::vector<uint8_t> active{1, 1};

    detector.detect(positions, phases, active);

    REQUIRE(detector.components().size() == 1);
    const Cluster& cluster = detector.components()[0];
    REQUIRE(cluster.members == std::vector<std::size_t>{0, 1});
    REQUIRE(cluster.coherence == Approx(1.0));
    REQUIRE(cluster.qualified);
    REQUIRE(cluster.color == 0);
    REQUIRE(detector.qualifiedCount() == 1);
    REQUIRE(detector.colors()[0] == 0);
    REQUIRE(detector.colors()[1] == 0);
}

TEST_CASE("ClusterDetector edges need both spatial and phase proximity", "[cluster][processors]") {
    auto detector = makeDetector();

    SECTION("too far apart") {
        const std::vector<Position> positions{{0.0, 0.0}, {181.0, 0.0}};
        const std::vector<double> phases{0.0, 0.0};
        const std::vector<uint8_t> active{1, 1};
        detector.detect(positions, phases, active);
        REQUIRE(detector.components().size() == 2);
        REQUIRE(detector.qualifiedCount() == 0);
    }

    SECTION("phases too different") {
        const std::vector<Position> positions(2, Position{});
        const std::vector<double> phases{0.0, 0.36};
        const std::vector<uint8_t> active{1, 1};
        detector.detect(positions, phases, active);
        REQUIRE(detector.components().size() == 2);
    }

    SECTION("phase proximity measured across the wrap point") {
        const std::vector<Position> positions(2, Position{});
        const std::vector<double> phases{3.1, -3.1};
        const std::vector<uint8_t> active{1, 1};
        detector.detect(positions, phases, active);
        REQUIRE(detector.components().size() == 1);
    }

    SECTION("edge predicate at exact radius") {
        REQUIRE(detector.isEdge({0.0, 0.0}, {180.0, 0.0}, 0.0, 0.35));
        REQUIRE_FALSE(detector.isEdge({0.0, 0.0}, {180.0, 0.0}, 0.0, 0.36));
    }
}

TEST_CASE("ClusterDetector qualification by size and coherence", "[cluster][processors]") {
    SECTION("component smaller than minimum stays neutral") {
        auto detector = makeDetector(4);
        const std::vector<Position> positions(3, Position{});
        const std::vector<double> phases{0.0, 0.1, 0.2};
        const std::vector<uint8_t> active{1, 1, 1};
        detector.detect(positions, phases, active);

        REQUIRE(detector.components().size() == 1);
        REQUIRE_FALSE(detector.components()[0].qualified);
        for (const auto color : detector.colors()) {
            REQUIRE(color == kNeutralColor);
        }
    }

    SECTION("chained component with low coherence stays neutral") {
        // Neighboring phases 0.3 apart chain 0 .. 3.0 rad into one component
        auto detector = makeDetector(4);
        std::vector<double> phases;
        for (int k = 0; k <= 10; ++k) {
            phases.push_back(0.3 * k);
        }
        const std::vector<Position> positions(phases.size(), Position{});
        const std::vector<uint8_t> active(phases.size(), 1);
        detector.detect(positions, phases, active);

        REQUIRE(detector.components().size() == 1);
        REQUIRE(detector.components()[0].coherence < 0.92);
        REQUIRE(detector.qualifiedCount() == 0);
    }
}

TEST_CASE("ClusterDetector ignores inactive oscillators", "[cluster][processors]") {
    auto detector = makeDetector();
    // 0 and 2 are only linked through 1 spatially
    const std::vector<Position> positions{{0.0, 0.0}, {150.0, 0.0}, {300.0, 0.0}};
    const std::vector<double> phases{0.5, 0.5, 0.5};

    SECTION("with the bridge active") {
        const std::vector<uint8_t> active{1, 1, 1};
        detector.detect(positions, phases, active);
        REQUIRE(detector.components().size() == 1);
        REQUIRE(detector.qualifiedCount() == 1);
    }

    SECTION("with the bridge inactive") {
        const std::vector<uint8_t> active{1, 0, 1};
        detector.detect(positions, phases, active);
        REQUIRE(detector.components().size() == 2);
        REQUIRE(detector.qualifiedCount() == 0);
        REQUIRE(detector.colors()[1] == kNeutralColor);
        for (const auto& cluster : detector.components()) {
            REQUIRE(std::find(cluster.members.begin(), cluster.members.end(), 1u) ==
                    cluster.members.end());
        }
    }
}

TEST_CASE("ClusterDetector with no active oscillators", "[cluster][processors][edge]") {
    auto detector = makeDetector();
    const std::vector<Position> positions(4, Position{});
    const std::vector<double> phases(4, 0.0);
    const std::vector<uint8_t> active(4, 0);

    detector.detect(positions, phases, active);

    REQUIRE(detector.components().empty());
    REQUIRE(detector.qualifiedCount() == 0);
    REQUIRE(detector.colors().size() == 4);
    for (const auto color : detector.colors()) {
        REQUIRE(color == kNeutralColor);
    }
}

TEST_CASE("ClusterDetector palette indices wrap around the palette size", "[cluster][processors]") {
    auto detector = makeDetector(2, 2);
    // Three spatially separated pairs
    const std::vector<Position> positions{
        {0.0, 0.0}, {10.0, 0.0},
        {1000.0, 0.0}, {1010.0, 0.0},
        {2000.0, 0.0}, {2010.0, 0.0},
    };
    const std::vector<double> phases{0.0, 0.0, 1.0, 1.0, 2.0, 2.0};
    const std::vector<uint8_t> active(6, 1);

    detector.detect(positions, phases, active);

    REQUIRE(detector.qualifiedCount() == 3);
    const auto colors = detector.colors();
    REQUIRE(colors[0] == 0);
    REQUIRE(colors[2] == 1);
    REQUIRE(colors[4] == 0);
    REQUIRE(colors[1] == colors[0]);
    REQUIRE(colors[5] == colors[4]);
}

TEST_CASE("ClusterDetector grouping does not depend on index order", "[cluster][processors]") {
    const std::vector<Position> positions{
        {0.0, 0.0}, {500.0, 0.0}, {0.0, 0.0}, {100.0, 0.0}, {500.0, 100.0}, {900.0, 0.0},
    };
    const std::vector<double> phases{0.2, -1.0, 0.2, 0.4, -1.2, 2.0};
    const std::vector<uint8_t> active(6, 1);

    auto forward = makeDetector();
    forward.detect(positions, phases, active);

    // Reverse the index order: oscillator i becomes 5 - i
    std::vector<Position> reversedPositions(positions.rbegin(), positions.rend());
    std::vector<double> reversedPhases(phases.rbegin(), phases.rend());
    auto reversed = makeDetector();
    reversed.detect(reversedPositions, reversedPhases, active);

    std::set<std::set<std::size_t>> mapped;
    for (const auto& members : componentSets(reversed)) {
        std::set<std::size_t> original;
        for (const std::size_t i : members) {
            original.insert(5 - i);
        }
        mapped.insert(original);
    }
    REQUIRE(mapped == componentSets(forward));

    // The identical pair (0, 2) always shares a component
    REQUIRE(forward.colors()[0] == forward.colors()[2]);
    REQUIRE(reversed.colors()[5] == reversed.colors()[3]);
}

TEST_CASE("ClusterDetector reuses buffers across calls", "[cluster][processors]") {
    auto detector = makeDetector();
    const std::vector<Position> positions(3, Position{});
    const std::vector<uint8_t> active(3, 1);

    const std::vector<double> together{0.0, 0.0, 0.0};
    detector.detect(positions, together, active);
    REQUIRE(detector.components().size() == 1);

    const std::vector<double> apart{0.0, 2.0, -2.0};
    detector.detect(positions, apart, active);
    REQUIRE(detector.components().size() == 3);
    for (const auto& cluster : detector.components()) {
        REQUIRE(cluster.members.size() == 1);
        REQUIRE_FALSE(cluster.qualified);
    }
}
