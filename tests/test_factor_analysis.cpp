#include <catch2/catch.hpp>

#include "FactorAnalysis.h"
#include "PsynetExceptions.h"
#include "TestData.h"

#include <cmath>

using Catch::Detail::Approx;

namespace {
const std::vector<std::vector<double>> kLoadings = {{0.7, 0.8, 0.6, 0.7}, {0.6, 0.7, 0.8, 0.5}};

FactorModelSpec twoFactorSpec() {
    FactorModelSpec spec;
    spec.factors.push_back({"F1", {"X1", "X2", "X3", "X4"}});
    spec.factors.push_back({"F2", {"X5", "X6", "X7", "X8"}});
    return spec;
}

const ObservationMatrix& twoFactorData() {
    static const ObservationMatrix data =
        TestData::sampleFromCovariance(TestData::factorCovariance(kLoadings, 0.3), 1000, 2024);
    return data;
}
} // namespace

TEST_CASE("Two-factor CFA recovers the generating loadings", "[cfa]") {
    const CfaResult res = FactorAnalysis::fit(twoFactorData(), twoFactorSpec());

    CHECK(res.converged);
    CHECK(res.sampleSize == 1000);
    CHECK(res.fit.freeParameters == 17);
    CHECK(res.fit.df == 19);
    CHECK(res.fit.baselineDf == 28);
    CHECK(res.fit.cfi > 0.95);
    CHECK(res.fit.rmsea < 0.06);
    CHECK(res.fit.srmr < 0.05);
    CHECK(res.fit.pValue > 0.0);
    CHECK(res.fit.pValue <= 1.0);
    CHECK(res.fit.bic > res.fit.aic);

    size_t j = 0;
    for (const auto& factor : kLoadings) {
        for (double expected : factor) {
            CHECK(res.standardizedLoadings[j] == Approx(expected).margin(0.08));
            CHECK(res.residualVariances[j] > 0.0);
            ++j;
        }
    }
    REQUIRE(res.factorCorrelation.size() == 2);
    CHECK(res.factorCorrelation[0][1] == Approx(0.3).margin(0.1));
    CHECK(res.factorCorrelation[0][0] == Approx(1.0));
}

TEST_CASE("Marker loadings are fixed to one and listed as fixed", "[cfa]") {
    const CfaResult res = FactorAnalysis::fit(twoFactorData(), twoFactorSpec());
    CHECK(res.loadings[0] == 1.0);
    CHECK(res.loadings[4] == 1.0);

    size_t fixed = 0;
    size_t loadings = 0;
    for (const auto& par : res.parameters) {
        if (par.op != "=~") continue;
        ++loadings;
        if (!par.free) {
            ++fixed;
            CHECK(par.estimate == 1.0);
            CHECK(std::isnan(par.se));
        } else {
            CHECK(par.se > 0.0);
            CHECK(par.pValue < 0.001);
        }
    }
    CHECK(loadings == 8);
    CHECK(fixed == 2);
    // 8 loadings, 8 residual variances, 2 factor variances, 1 covariance
    CHECK(res.parameters.size() == 19);
}

TEST_CASE("A just-identified model reports a perfect fit", "[cfa]") {
    FactorModelSpec spec;
    spec.factors.push_back({"F1", {"X1", "X2", "X3"}});
    const CfaResult res = FactorAnalysis::fit(twoFactorData(), spec);
    CHECK(res.fit.df == 0);
    CHECK(res.fit.tli == 1.0);
    CHECK(res.fit.rmsea == 0.0);
    CHECK(res.fit.chiSquare == Approx(0.0).margin(1e-3));
}

TEST_CASE("Comparative fit indices follow their formulas and guard the TLI", "[cfa]") {
    CfaFitIndices fit;
    fit.chiSquare = 40.0;
    fit.df = 19;
    fit.baselineChiSquare = 800.0;
    fit.baselineDf = 28;
    FactorAnalysis::comparativeFit(fit, 500);
    CHECK(fit.cfi == Approx(1.0 - 21.0 / 772.0));
    CHECK(fit.tli == Approx((800.0 / 28.0 - 40.0 / 19.0) / (800.0 / 28.0 - 1.0)));
    CHECK(fit.rmsea == Approx(std::sqrt(21.0 / (19.0 * 500.0))));

    // Baseline chi-square equal to its df leaves the TLI undefined.
    fit.baselineChiSquare = 28.0;
    FactorAnalysis::comparativeFit(fit, 500);
    CHECK(std::isnan(fit.tli));
    CHECK(std::isfinite(fit.cfi));
    CHECK(std::isfinite(fit.rmsea));
}

TEST_CASE("Factor model validation", "[cfa]") {
    FactorModelSpec single;
    single.factors.push_back({"F1", {"X1"}});
    CHECK_THROWS_AS(single.validate(), Psynet::ConfigurationException);
    CHECK_THROWS_AS(FactorAnalysis::fit(twoFactorData(), single), Psynet::ConfigurationException);

    FactorModelSpec shared = twoFactorSpec();
    shared.factors[1].items[0] = "X1";
    CHECK_THROWS_AS(shared.validate(), Psynet::ConfigurationException);

    CHECK_THROWS_AS(FactorModelSpec{}.validate(), Psynet::ConfigurationException);

    FactorModelSpec missing;
    missing.factors.push_back({"F1", {"X1", "Q9"}});
    CHECK_THROWS_AS(FactorAnalysis::fit(twoFactorData(), missing), Psynet::DatasetException);
}

TEST_CASE("Big Five default model", "[cfa]") {
    const FactorModelSpec spec = FactorModelSpec::bigFive();
    REQUIRE(spec.factors.size() == 5);
    CHECK(spec.allItems().size() == 25);
    CHECK(spec.factors[3].name == "Neuroticism");
    CHECK(spec.factors[3].items.front() == "N1");
    CHECK(spec.groupOf("O5") == "Openness");
    CHECK_NOTHROW(spec.validate());
}
