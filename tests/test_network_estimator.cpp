#include <catch2/catch.hpp>

#include "CentralityEngine.h"
#include "CorrelationEngine.h"
#include "NetworkEstimator.h"
#include "PsynetExceptions.h"
#include "TestData.h"

#include <cmath>

using Catch::Detail::Approx;

namespace {
NetworkOptions pcorOptions(PruneMode prune) {
    NetworkOptions opts;
    opts.estimator = EstimatorKind::PartialCorrelation;
    opts.prune = prune;
    return opts;
}
} // namespace

TEST_CASE("Partial correlations recover a causal chain", "[estimator]") {
    const ObservationMatrix data =
        TestData::sampleFromPrecision(TestData::chainPrecision(4, 0.4), 2000, 11, {"A", "B", "C", "D"});
    const NetworkModel model = NetworkEstimator::estimate(data, pcorOptions(PruneMode::None));
    const WeightMatrix& w = model.weights;

    CHECK(w[0][1] == Approx(0.4).margin(0.07));
    CHECK(w[1][2] == Approx(0.4).margin(0.07));
    CHECK(w[2][3] == Approx(0.4).margin(0.07));
    CHECK(std::abs(w[0][2]) < 0.08);
    CHECK(std::abs(w[0][3]) < 0.08);
    CHECK(std::abs(w[1][3]) < 0.08);

    const NetworkModel pruned = NetworkEstimator::estimate(data, pcorOptions(PruneMode::Significance));
    CHECK(pruned.weights[0][1] != 0.0);
    CHECK(pruned.weights[1][2] != 0.0);
    CHECK(pruned.weights[2][3] != 0.0);
}

TEST_CASE("Weights are symmetric, bounded and zero on the diagonal", "[estimator]") {
    const ObservationMatrix data = TestData::sampleFromPrecision(TestData::chainPrecision(8, 0.35), 400, 5);
    for (EstimatorKind kind : {EstimatorKind::Correlation, EstimatorKind::PartialCorrelation, EstimatorKind::EbicGlasso}) {
        NetworkOptions opts;
        opts.estimator = kind;
        opts.prune = PruneMode::None;
        const NetworkModel model = NetworkEstimator::estimate(data, opts);
        REQUIRE(model.weights.size() == 8);
        CHECK(NetworkGraph::isSymmetric(model.weights, 1e-12));
        for (size_t i = 0; i < 8; ++i) {
            CHECK(model.weights[i][i] == 0.0);
            for (size_t j = 0; j < 8; ++j) CHECK(std::abs(model.weights[i][j]) <= 1.0);
        }
    }
}

TEST_CASE("Pruning only removes edges and the zeros propagate downstream", "[estimator]") {
    const ObservationMatrix data = TestData::sampleFromPrecision(TestData::chainPrecision(10, 0.3), 150, 21);
    const NetworkModel full = NetworkEstimator::estimate(data, pcorOptions(PruneMode::None));
    const NetworkModel pruned = NetworkEstimator::estimate(data, pcorOptions(PruneMode::Significance));

    REQUIRE(pruned.pruning.applied);
    CHECK(pruned.pruning.candidateEdges == pruned.pruning.keptEdges + pruned.pruning.prunedEdges);
    CHECK(pruned.pruning.prunedEdges > 0);

    size_t zeros = 0;
    for (size_t i = 0; i < 10; ++i) {
        for (size_t j = i + 1; j < 10; ++j) {
            CHECK(std::abs(pruned.weights[i][j]) <= std::abs(full.weights[i][j]));
            if (pruned.weights[i][j] == 0.0) {
                ++zeros;
                CHECK(pruned.pValues[i][j] >= 0.05);
            } else {
                CHECK(pruned.weights[i][j] == full.weights[i][j]);
            }
        }
    }
    CHECK(pruned.edges().size() == 45 - zeros);

    // A pruned edge contributes nothing to strength.
    const auto strength = CentralityEngine::strength(pruned.weights);
    for (size_t i = 0; i < 10; ++i) {
        double manual = 0.0;
        for (size_t j = 0; j < 10; ++j) manual += std::abs(pruned.weights[i][j]);
        CHECK(strength[i] == Approx(manual));
    }
}

TEST_CASE("Stricter p-value adjustment prunes at least as many edges", "[estimator]") {
    const ObservationMatrix data = TestData::sampleFromPrecision(TestData::chainPrecision(10, 0.25), 200, 8);
    NetworkOptions none = pcorOptions(PruneMode::Significance);
    NetworkOptions holm = none;
    holm.adjust = PValueAdjust::Holm;
    NetworkOptions bonf = none;
    bonf.adjust = PValueAdjust::Bonferroni;

    const size_t keptNone = NetworkEstimator::estimate(data, none).pruning.keptEdges;
    const size_t keptHolm = NetworkEstimator::estimate(data, holm).pruning.keptEdges;
    const size_t keptBonf = NetworkEstimator::estimate(data, bonf).pruning.keptEdges;
    CHECK(keptHolm <= keptNone);
    CHECK(keptBonf <= keptHolm);
}

TEST_CASE("adjustPValues implements Bonferroni, Holm and BH", "[estimator]") {
    // Upper triangle in row order: .01, .04, .03
    const WeightMatrix p = {{0.0, 0.01, 0.04}, {0.01, 0.0, 0.03}, {0.04, 0.03, 0.0}};

    const auto bonf = NetworkEstimator::adjustPValues(p, PValueAdjust::Bonferroni);
    CHECK(bonf[0][1] == Approx(0.03));
    CHECK(bonf[0][2] == Approx(0.12));
    CHECK(bonf[2][1] == Approx(0.09));

    const auto holm = NetworkEstimator::adjustPValues(p, PValueAdjust::Holm);
    CHECK(holm[0][1] == Approx(0.03));
    CHECK(holm[1][2] == Approx(0.06));
    CHECK(holm[0][2] == Approx(0.06));

    const auto fdr = NetworkEstimator::adjustPValues(p, PValueAdjust::Fdr);
    CHECK(fdr[0][1] == Approx(0.03));
    CHECK(fdr[1][2] == Approx(0.04));
    CHECK(fdr[0][2] == Approx(0.04));

    CHECK(NetworkEstimator::adjustPValues(p, PValueAdjust::None) == p);
}

TEST_CASE("Degenerate inputs raise estimation errors", "[estimator]") {
    SECTION("duplicated item makes the correlation matrix singular") {
        const ObservationMatrix base = TestData::sampleFromPrecision(TestData::chainPrecision(3, 0.3), 100, 2);
        ObservationMatrix dup = base;
        dup.items.push_back("X1_copy");
        dup.columns.push_back(base.columns[0]);
        CHECK_THROWS_AS(NetworkEstimator::estimate(dup, pcorOptions(PruneMode::None)), Psynet::EstimationException);
    }
    SECTION("constant item") {
        const ObservationMatrix m = ObservationMatrix::fromRows({"a", "b", "c"}, {{1, 2, 3}, {2, 2, 1}, {3, 2, 2}, {1, 2, 5}});
        CHECK_THROWS_AS(NetworkEstimator::estimate(m, pcorOptions(PruneMode::None)), Psynet::EstimationException);
    }
    SECTION("too few rows for significance tests") {
        const ObservationMatrix m = TestData::sampleFromPrecision(TestData::chainPrecision(5, 0.2), 7, 4);
        CHECK_NOTHROW(NetworkEstimator::estimate(m, pcorOptions(PruneMode::None)));
        const ObservationMatrix tiny = m.selectRows({0, 1, 2, 3, 4});
        CHECK_THROWS_AS(NetworkEstimator::estimate(tiny, pcorOptions(PruneMode::Significance)),
                        Psynet::EstimationException);
    }
    SECTION("single item") {
        const ObservationMatrix m = ObservationMatrix::fromRows({"a"}, {{1}, {2}});
        CHECK_THROWS_AS(NetworkEstimator::estimate(m, pcorOptions(PruneMode::None)), Psynet::EstimationException);
    }
}

TEST_CASE("Estimator options parse and print", "[estimator]") {
    CHECK(NetworkEstimator::parseEstimator("PCOR") == EstimatorKind::PartialCorrelation);
    CHECK(NetworkEstimator::parseEstimator("ebicglasso") == EstimatorKind::EbicGlasso);
    CHECK(NetworkEstimator::parsePruneMode("sig") == PruneMode::Significance);
    CHECK(NetworkEstimator::parseAdjust("BH") == PValueAdjust::Fdr);
    CHECK(NetworkEstimator::toString(EstimatorKind::Correlation) == "cor");
    CHECK_THROWS_AS(NetworkEstimator::parseEstimator("spearman"), Psynet::ConfigurationException);
    CHECK_THROWS_AS(NetworkEstimator::parseAdjust("sidak"), Psynet::ConfigurationException);
}

TEST_CASE("precisionToPartial uses -K_ij / sqrt(K_ii K_jj)", "[estimator]") {
    const WeightMatrix k = {{2.0, -0.5, 0.0}, {-0.5, 1.0, 0.4}, {0.0, 0.4, 3.0}};
    const WeightMatrix pc = NetworkEstimator::precisionToPartial(k);
    CHECK(pc[0][1] == Approx(0.5 / std::sqrt(2.0)));
    CHECK(pc[1][2] == Approx(-0.4 / std::sqrt(3.0)));
    CHECK(pc[0][2] == 0.0);
    CHECK(pc[1][1] == 0.0);

    WeightMatrix bad = k;
    bad[2][2] = -1.0;
    CHECK_THROWS_AS(NetworkEstimator::precisionToPartial(bad), Psynet::EstimationException);
}
