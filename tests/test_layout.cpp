#include <catch2/catch.hpp>

#include "NetworkLayout.h"
#include "PsynetExceptions.h"

#include <cmath>

using Catch::Detail::Approx;

namespace {
double distance(const NodePosition& a, const NodePosition& b) {
    return std::hypot(a.x - b.x, a.y - b.y);
}

// Three disconnected pairs, each joined by a strong edge.
WeightMatrix pairedGraph() {
    WeightMatrix w(6, std::vector<double>(6, 0.0));
    for (size_t i = 0; i < 6; i += 2) {
        w[i][i + 1] = 0.9;
        w[i + 1][i] = 0.9;
    }
    return w;
}
} // namespace

TEST_CASE("Circle layout starts at the top and stays on the unit circle", "[layout]") {
    const auto pos = NetworkLayout::circle(4);
    REQUIRE(pos.size() == 4);
    CHECK(pos[0].x == Approx(0.0).margin(1e-12));
    CHECK(pos[0].y == Approx(1.0));
    CHECK(pos[1].x == Approx(1.0));
    for (const auto& p : pos) CHECK(std::hypot(p.x, p.y) == Approx(1.0));
    CHECK(NetworkLayout::circle(1)[0].x == 0.0);
}

TEST_CASE("Spring layout is reproducible and bounded", "[layout]") {
    const WeightMatrix w = pairedGraph();
    const auto a = NetworkLayout::spring(w, 7);
    const auto b = NetworkLayout::spring(w, 7);
    REQUIRE(a.size() == 6);
    for (size_t i = 0; i < a.size(); ++i) {
        CHECK(a[i].x == b[i].x);
        CHECK(a[i].y == b[i].y);
        CHECK(std::abs(a[i].x) <= 1.0 + 1e-12);
        CHECK(std::abs(a[i].y) <= 1.0 + 1e-12);
    }
}

TEST_CASE("Spring layout pulls strongly linked nodes together", "[layout]") {
    const auto pos = NetworkLayout::spring(pairedGraph(), 3);
    for (size_t i = 0; i < 6; i += 2) {
        const double partner = distance(pos[i], pos[i + 1]);
        for (size_t j = 0; j < 6; ++j) {
            if (j == i || j == i + 1) continue;
            CHECK(partner < distance(pos[i], pos[j]));
        }
    }
}

TEST_CASE("Layout names parse case-insensitively", "[layout]") {
    CHECK(NetworkLayout::parse(" Spring ") == LayoutKind::Spring);
    CHECK(NetworkLayout::parse("circle") == LayoutKind::Circle);
    CHECK_THROWS_AS(NetworkLayout::parse("kamada"), Psynet::ConfigurationException);
    CHECK(NetworkLayout::compute(LayoutKind::Circle, pairedGraph(), 1).size() == 6);
}
