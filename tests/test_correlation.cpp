#include <catch2/catch.hpp>

#include "CorrelationEngine.h"
#include "NetworkGraph.h"
#include "PsynetExceptions.h"
#include "TestData.h"

#include <cmath>

using Catch::Detail::Approx;

TEST_CASE("Pearson correlation matches hand computation", "[correlation]") {
    // x = 1..5, y = 2x + noise-free offset, z reversed.
    const ObservationMatrix m = ObservationMatrix::fromRows(
        {"x", "y", "z"}, {{1, 3, 5}, {2, 5, 3}, {3, 7, 4}, {4, 9, 1}, {5, 11, 2}});
    const WeightMatrix r = CorrelationEngine::calculateCorrelationMatrix(m);
    CHECK(r[0][0] == Approx(1.0));
    CHECK(r[0][1] == Approx(1.0));
    CHECK(r[0][2] == Approx(-0.8));
    CHECK(r[2][0] == Approx(r[0][2]));

    const WeightMatrix cov = CorrelationEngine::calculateCovarianceMatrix(m);
    CHECK(cov[0][0] == Approx(2.5));
    CHECK(cov[0][1] == Approx(5.0));
    const WeightMatrix ml = CorrelationEngine::calculateCovarianceMatrix(m, false);
    CHECK(ml[0][0] == Approx(2.0));
}

TEST_CASE("Correlation matrices are symmetric and bounded", "[correlation]") {
    const ObservationMatrix m = TestData::sampleFromPrecision(TestData::chainPrecision(6, 0.4), 300, 7);
    const WeightMatrix r = CorrelationEngine::calculateCorrelationMatrix(m);
    CHECK(NetworkGraph::isSymmetric(r));
    for (size_t i = 0; i < r.size(); ++i) {
        CHECK(r[i][i] == Approx(1.0));
        for (size_t j = 0; j < r.size(); ++j) CHECK(std::abs(r[i][j]) <= 1.0);
    }
}

TEST_CASE("Zero-variance items are named in the error", "[correlation]") {
    const ObservationMatrix m = ObservationMatrix::fromRows({"A1", "A2", "A3"}, {{1, 3, 2}, {2, 3, 5}, {4, 3, 1}});
    CHECK(CorrelationEngine::zeroVarianceItems(m) == std::vector<std::string>{"A2"});
    try {
        CorrelationEngine::calculateCorrelationMatrix(m);
        FAIL("expected an estimation error");
    } catch (const Psynet::EstimationException& e) {
        CHECK(std::string(e.what()).find("A2") != std::string::npos);
    }

    const ObservationMatrix single = ObservationMatrix::fromRows({"a", "b"}, {{1, 2}});
    CHECK_THROWS_AS(CorrelationEngine::calculateCovarianceMatrix(single), Psynet::EstimationException);
}

TEST_CASE("P-value matrix and strongest pairs", "[correlation]") {
    const WeightMatrix r = {{1.0, 0.6, 0.05}, {0.6, 1.0, -0.3}, {0.05, -0.3, 1.0}};
    const WeightMatrix p = CorrelationEngine::calculatePValueMatrix(r, 100);
    CHECK(p[0][0] == Approx(0.0));
    CHECK(p[0][1] < 1e-6);
    CHECK(p[0][2] > 0.5);
    CHECK(p[1][2] == Approx(p[2][1]));

    const ObservationMatrix m = TestData::sampleFromPrecision(TestData::chainPrecision(4, 0.45), 500, 3, {"A", "B", "C", "D"});
    const WeightMatrix corr = CorrelationEngine::calculateCorrelationMatrix(m);
    const auto top = CorrelationEngine::strongestCorrelations(m, corr, 2);
    REQUIRE(top.size() == 2);
    CHECK(std::abs(top[0].r) >= std::abs(top[1].r));
    CHECK(top[0].is_significant);
}
