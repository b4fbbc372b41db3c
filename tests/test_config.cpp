#include <catch2/catch.hpp>

#include "AutoConfig.h"
#include "PsynetExceptions.h"
#include "TestData.h"

#include <string>
#include <vector>

using Catch::Detail::Approx;

namespace {
AutoConfig parse(std::vector<std::string> args) {
    args.insert(args.begin(), "psynet");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);
    return AutoConfig::fromArgs(static_cast<int>(args.size()), argv.data());
}
} // namespace

TEST_CASE("Defaults reproduce the standard pipeline", "[config]") {
    const AutoConfig cfg = parse({"bfi.csv"});
    CHECK(cfg.datasetPath == "bfi.csv");
    CHECK(cfg.estimator == "pcor");
    CHECK(cfg.prune == "sig");
    CHECK(cfg.alpha == Approx(0.05));
    CHECK(cfg.bootstrapSamples == 1000);
    CHECK(cfg.ciLevel == Approx(0.95));
    CHECK(cfg.runCfa);
    CHECK_FALSE(cfg.factorModelExplicit);
    REQUIRE(cfg.factorModel.factors.size() == 5);
    CHECK(cfg.factorModel.factors[0].name == "Agreeableness");
    CHECK(cfg.factorModel.allItems().size() == 25);
}

TEST_CASE("CLI flags accept dashes and are validated", "[config]") {
    const AutoConfig cfg = parse({"data.csv", "--estimator", "EBICglasso", "--bootstrap-samples", "200", "--ci-level",
                                  "0.9", "--items", "A1, A2,A3", "--plot-format", "svg", "--seed", "42"});
    CHECK(cfg.estimator == "ebicglasso");
    CHECK(cfg.bootstrapSamples == 200);
    CHECK(cfg.ciLevel == Approx(0.9));
    CHECK(cfg.items == std::vector<std::string>{"A1", "A2", "A3"});
    CHECK(cfg.plot.format == "svg");
    CHECK(cfg.seed == 42u);

    CHECK_THROWS_AS(parse({"data.csv", "--estimator", "lasso"}), Psynet::ConfigurationException);
    CHECK_THROWS_AS(parse({"data.csv", "--adjust", "sidak"}), Psynet::ConfigurationException);
    CHECK_THROWS_AS(parse({"data.csv", "--alpha", "1.5"}), Psynet::ConfigurationException);
    CHECK_THROWS_AS(parse({"data.csv", "--alpha", "0.05x"}), Psynet::ConfigurationException);
    CHECK_THROWS_AS(parse({"data.csv", "--bootstrap-samples", "0"}), Psynet::ConfigurationException);
    CHECK_THROWS_AS(parse({"data.csv", "--no-such-flag", "1"}), Psynet::ConfigurationException);
    CHECK_THROWS_AS(parse({"data.csv", "--verbose"}), Psynet::ConfigurationException);
    CHECK_THROWS_AS(parse({"--estimator", "pcor"}), Psynet::ConfigurationException);
}

TEST_CASE("Estimator and adjustment aliases are accepted and stored canonically", "[config]") {
    const AutoConfig cfg = parse({"data.csv", "--estimator", "glasso", "--adjust", "BH", "--prune", "none"});
    CHECK(cfg.estimator == "ebicglasso");
    CHECK(cfg.adjust == "fdr");
    CHECK(cfg.prune == "none");

    AutoConfig direct;
    direct.datasetPath = "data.csv";
    direct.runCfa = false;
    direct.estimator = "glasso";
    direct.adjust = "bh";
    CHECK_NOTHROW(direct.validate());
    direct.estimator = "lasso";
    CHECK_THROWS_AS(direct.validate(), Psynet::ConfigurationException);
}

TEST_CASE("Factor definitions on the command line replace the default model", "[config]") {
    const AutoConfig cfg = parse({"data.csv", "--factor.Anxiety", "N1,N2,N3", "--factor.Mood", "N4,N5"});
    CHECK(cfg.factorModelExplicit);
    REQUIRE(cfg.factorModel.factors.size() == 2);
    CHECK(cfg.factorModel.factors[0].name == "Anxiety");
    CHECK(cfg.factorModel.groupOf("N5") == "Mood");
    CHECK(cfg.factorModel.groupOf("A1").empty());

    CHECK_THROWS_AS(parse({"data.csv", "--factor.Single", "N1"}), Psynet::ConfigurationException);
    CHECK_THROWS_AS(parse({"data.csv", "--factor.F1", "N1,N2", "--factor.F2", "N2,N3"}),
                    Psynet::ConfigurationException);
}

TEST_CASE("Config file values load and CLI flags override them", "[config]") {
    TestData::TempCsv file("psynet_config.yaml",
                           "# analysis settings\n"
                           "estimator: cor\n"
                           "alpha: 0.01\n"
                           "adjust: holm\n"
                           "bootstrap_samples: 50\n"
                           "factor.Calm: N1, N2\n"
                           "factor.Warm: A1, A2, A3\n");
    const AutoConfig cfg = parse({"data.csv", "--config", file.path(), "--alpha", "0.001"});
    CHECK(cfg.estimator == "cor");
    CHECK(cfg.adjust == "holm");
    CHECK(cfg.bootstrapSamples == 50);
    CHECK(cfg.alpha == Approx(0.001));
    REQUIRE(cfg.factorModel.factors.size() == 2);
    CHECK(cfg.factorModel.factors[1].items == std::vector<std::string>{"A1", "A2", "A3"});
}

TEST_CASE("Config file accepts loose JSON and reports the failing line", "[config]") {
    TestData::TempCsv json("psynet_config.json",
                           "{\n"
                           "  \"estimator\": \"ebicglasso\",\n"
                           "  \"gamma\": 0.25,\n"
                           "  \"generate_html\": \"true\"\n"
                           "}\n");
    AutoConfig base;
    base.datasetPath = "data.csv";
    const AutoConfig cfg = AutoConfig::fromFile(json.path(), base);
    CHECK(cfg.estimator == "ebicglasso");
    CHECK(cfg.gamma == Approx(0.25));
    CHECK(cfg.generateHtml);

    TestData::TempCsv bad("psynet_config_bad.yaml", "estimator: pcor\nthis line has no separator\n");
    try {
        AutoConfig::fromFile(bad.path(), base);
        FAIL("expected a configuration error");
    } catch (const Psynet::ConfigurationException& e) {
        CHECK(std::string(e.what()).find("line 2") != std::string::npos);
    }

    CHECK_THROWS_AS(AutoConfig::fromFile("/nonexistent/psynet.yaml", base), Psynet::ConfigurationException);
}

TEST_CASE("Delimiter accepts tab aliases", "[config]") {
    AutoConfig cfg;
    cfg.assign("delimiter", "\\t");
    CHECK(cfg.delimiter == '\t');
    cfg.assign("delimiter", ";");
    CHECK(cfg.delimiter == ';');
    CHECK_THROWS_AS(cfg.assign("delimiter", ";;"), Psynet::ConfigurationException);
}
