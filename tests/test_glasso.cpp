#include <catch2/catch.hpp>

#include "CorrelationEngine.h"
#include "GraphicalLasso.h"
#include "MathUtils.h"
#include "NetworkEstimator.h"
#include "PsynetExceptions.h"
#include "TestData.h"

#include <cmath>
#include <string>

using Catch::Detail::Approx;

namespace {
const WeightMatrix kS = {{1.0, 0.5, 0.2, 0.1},
                         {0.5, 1.0, 0.4, 0.15},
                         {0.2, 0.4, 1.0, 0.3},
                         {0.1, 0.15, 0.3, 1.0}};
}

TEST_CASE("Unpenalised graphical lasso reproduces the inverse", "[glasso]") {
    const GlassoFit fit = GraphicalLasso::fit(kS, 0.0, 1e-8);
    CHECK(fit.converged);
    const auto inv = MathUtils::Matrix(kS).inverse();
    REQUIRE(inv);
    for (size_t i = 0; i < 4; ++i) {
        for (size_t j = 0; j < 4; ++j) CHECK(fit.precision[i][j] == Approx(inv->at(i, j)).margin(1e-3));
    }
}

TEST_CASE("A penalty at lambda max gives the empty graph", "[glasso]") {
    const GlassoFit fit = GraphicalLasso::fit(kS, 0.5);
    for (size_t i = 0; i < 4; ++i) {
        CHECK(fit.precision[i][i] == Approx(1.0));
        for (size_t j = 0; j < 4; ++j) {
            if (i != j) CHECK(fit.precision[i][j] == 0.0);
        }
    }
}

TEST_CASE("Stronger penalties give sparser symmetric fits", "[glasso]") {
    const GlassoFit dense = GraphicalLasso::fit(kS, 0.0);
    const GlassoFit sparse = GraphicalLasso::fit(kS, 0.35);
    CHECK(NetworkGraph::nonzeroEdgeCount(dense.precision) == 6);
    CHECK(NetworkGraph::nonzeroEdgeCount(sparse.precision) < 6);
    CHECK(NetworkGraph::nonzeroEdgeCount(sparse.precision) >= 1);
    CHECK(NetworkGraph::isSymmetric(sparse.precision, 1e-12));
    CHECK(sparse.lambda == Approx(0.35));
}

TEST_CASE("Lambda path is log-spaced from the largest off-diagonal", "[glasso]") {
    const auto path = GraphicalLasso::lambdaPath(kS, 100, 0.01);
    REQUIRE(path.size() == 100);
    CHECK(path.front() == Approx(0.5));
    CHECK(path.back() == Approx(0.005));
    CHECK(path[1] / path[0] == Approx(path[51] / path[50]));
    for (size_t i = 1; i < path.size(); ++i) CHECK(path[i] < path[i - 1]);

    const WeightMatrix identity = {{1.0, 0.0}, {0.0, 1.0}};
    CHECK(GraphicalLasso::lambdaPath(identity).empty());
}

TEST_CASE("EBIC adds the edge and gamma penalties", "[glasso]") {
    const WeightMatrix k = {{1.2, -0.3, 0.0}, {-0.3, 1.1, 0.0}, {0.0, 0.0, 1.0}};
    const WeightMatrix s = {{1.0, 0.25, 0.05}, {0.25, 1.0, 0.02}, {0.05, 0.02, 1.0}};
    const auto logDet = MathUtils::Matrix(k).logDeterminantSPD();
    REQUIRE(logDet);
    double tr = 0.0;
    for (size_t i = 0; i < 3; ++i) {
        for (size_t j = 0; j < 3; ++j) tr += s[i][j] * k[j][i];
    }
    const double n = 200.0;
    const double expected = -n * (*logDet - tr) + std::log(n) + 4.0 * 0.5 * std::log(3.0);
    CHECK(GraphicalLasso::ebic(s, k, 200, 0.5) == Approx(expected));
    CHECK(GraphicalLasso::ebic(s, k, 200, 0.0) < GraphicalLasso::ebic(s, k, 200, 0.5));
}

TEST_CASE("EBIC selection recovers a sparse chain", "[glasso]") {
    const ObservationMatrix data = TestData::sampleFromPrecision(TestData::chainPrecision(6, 0.4), 1500, 99);
    const WeightMatrix corr = CorrelationEngine::calculateCorrelationMatrix(data);
    const EbicSelection sel = GraphicalLasso::selectByEbic(corr, data.rowCount(), 0.5);

    CHECK(sel.lambdaPath.size() == 100);
    CHECK(sel.ebicPath.size() == 100);
    CHECK(sel.ebic == Approx(sel.ebicPath[sel.lambdaIndex]));
    for (double e : sel.ebicPath) {
        if (std::isfinite(e)) CHECK(sel.ebic <= e);
    }

    const WeightMatrix pc = NetworkEstimator::precisionToPartial(sel.fit.precision);
    for (size_t i = 0; i + 1 < 6; ++i) CHECK(pc[i][i + 1] > 0.2);
    size_t spurious = 0;
    for (size_t i = 0; i < 6; ++i) {
        for (size_t j = i + 2; j < 6; ++j) {
            if (pc[i][j] != 0.0) ++spurious;
            CHECK(std::abs(pc[i][j]) < 0.1);
        }
    }
    CHECK(spurious <= 2);
}

TEST_CASE("An iteration limit is reported instead of passed off as converged", "[glasso]") {
    const ObservationMatrix data = TestData::sampleFromPrecision(TestData::chainPrecision(5, 0.4), 800, 5);
    const WeightMatrix corr = CorrelationEngine::calculateCorrelationMatrix(data);

    const GlassoFit one = GraphicalLasso::fit(corr, 0.01, 1e-12, 1);
    CHECK_FALSE(one.converged);
    CHECK(one.iterations == 1);

    const EbicSelection sel = GraphicalLasso::selectByEbic(corr, data.rowCount(), 0.5, 100, 0.01, 1e-12, 1);
    CHECK_FALSE(sel.converged);
    CHECK(sel.iterations == 1);

    NetworkOptions opts;
    opts.estimator = EstimatorKind::EbicGlasso;
    opts.glassoTolerance = 1e-12;
    opts.glassoMaxIterations = 1;
    const NetworkModel limited = NetworkEstimator::estimate(data, opts);
    CHECK_FALSE(limited.converged);
    REQUIRE(limited.warnings.size() == 1);
    CHECK(limited.warnings.front().find("did not converge") != std::string::npos);

    opts.glassoTolerance = 1e-4;
    opts.glassoMaxIterations = 10000;
    const NetworkModel full = NetworkEstimator::estimate(data, opts);
    CHECK(full.converged);
    CHECK(full.iterations >= 1);
    CHECK(full.warnings.empty());
}

TEST_CASE("Graphical lasso rejects malformed input", "[glasso]") {
    CHECK_THROWS_AS(GraphicalLasso::fit({{1.0, 0.2}, {0.3, 1.0}}, 0.1), Psynet::EstimationException);
    CHECK_THROWS_AS(GraphicalLasso::fit({{0.0, 0.0}, {0.0, 1.0}}, 0.1), Psynet::EstimationException);
    CHECK_THROWS_AS(GraphicalLasso::fit({}, 0.1), Psynet::EstimationException);
}
