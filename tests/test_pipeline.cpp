#include <catch2/catch.hpp>

#include "AnalysisPipeline.h"
#include "AutoConfig.h"
#include "ItemDataset.h"
#include "NetworkEstimator.h"
#include "PsynetExceptions.h"
#include "TestData.h"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

using Catch::Detail::Approx;

namespace {
namespace fs = std::filesystem;

// Output directory for one pipeline run, removed with everything in it.
class ScopedDir {
public:
    explicit ScopedDir(const std::string& name) : path_(fs::temp_directory_path() / name) {
        std::error_code ec;
        fs::remove_all(path_, ec);
        fs::create_directories(path_);
    }
    ~ScopedDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    ScopedDir(const ScopedDir&) = delete;
    ScopedDir& operator=(const ScopedDir&) = delete;

    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    fs::path path_;
};

// Two correlated factors over X1..X8, plus a text id column and an unrelated numeric column Z.
std::string twoFactorCsv() {
    const ObservationMatrix data = TestData::sampleFromCovariance(
        TestData::factorCovariance({{0.7, 0.8, 0.6, 0.7}, {0.6, 0.7, 0.8, 0.5}}, 0.3), 300, 77);
    std::ostringstream csv;
    csv << std::setprecision(12) << "id";
    for (const auto& item : data.items) csv << ',' << item;
    csv << ",Z\n";
    for (size_t r = 0; r < data.rowCount(); ++r) {
        csv << "resp" << r;
        for (size_t i = 0; i < data.itemCount(); ++i) csv << ',' << data.at(r, i);
        csv << ',' << (r % 7) << '\n';
    }
    return csv.str();
}

FactorModelSpec twoFactorSpec() {
    FactorModelSpec spec;
    spec.factors.push_back({"F1", {"X1", "X2", "X3", "X4"}});
    spec.factors.push_back({"F2", {"X5", "X6", "X7", "X8"}});
    return spec;
}

AutoConfig quickConfig(const std::string& dataset, const ScopedDir& out) {
    AutoConfig config;
    config.datasetPath = dataset;
    config.reportFile = out.file("report.md");
    config.assetsDir = out.file("assets");
    config.plots = false;
    config.bootstrapSamples = 20;
    config.workers = 1;
    return config;
}

std::string readAll(const std::string& path) {
    std::ifstream in(path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::vector<std::vector<std::string>> readCsvRows(const std::string& path) {
    std::ifstream in(path);
    std::vector<std::vector<std::string>> rows;
    std::string line;
    while (std::getline(in, line)) {
        std::vector<std::string> cells;
        std::stringstream ls(line);
        std::string cell;
        while (std::getline(ls, cell, ',')) cells.push_back(cell);
        rows.push_back(std::move(cells));
    }
    return rows;
}
} // namespace

TEST_CASE("Pipeline uses the factor model items and writes every export", "[pipeline]") {
    TestData::TempCsv csv("psynet_pipeline_factor.csv", twoFactorCsv());
    ScopedDir out("psynet_pipeline_factor");
    AutoConfig config = quickConfig(csv.path(), out);
    config.factorModel = twoFactorSpec();
    config.factorModelExplicit = true;

    AnalysisPipeline pipeline;
    REQUIRE(pipeline.run(config) == 0);

    const std::string report = readAll(config.reportFile);
    CHECK(report.find("## 1. Data") != std::string::npos);
    CHECK(report.find("## 2. Confirmatory factor analysis") != std::string::npos);
    CHECK(report.find("### Model fit") != std::string::npos);
    CHECK(report.find("## 4. Network estimation") != std::string::npos);
    CHECK(report.find("## 5. Centrality") != std::string::npos);
    CHECK(report.find("20/20 resamples converged") != std::string::npos);
    CHECK(report.find("## 7. Exported files") != std::string::npos);

    for (const char* name : {"network_weights.csv", "network_edges.csv", "centrality.csv", "bootstrap_edges.csv"}) {
        CHECK(fs::exists(fs::path(config.assetsDir) / name));
    }

    // Z and the id column are not factor model items.
    const auto weights = readCsvRows(config.assetsDir + "/network_weights.csv");
    REQUIRE(weights.size() == 9);
    CHECK(weights[0] == std::vector<std::string>{"item", "X1", "X2", "X3", "X4", "X5", "X6", "X7", "X8"});

    ItemDataset dataset(csv.path());
    dataset.load();
    const ObservationMatrix data = dataset.completeCases(twoFactorSpec().allItems());
    const NetworkModel model = NetworkEstimator::estimate(data, NetworkOptions{});
    const auto expected = model.edges();

    const auto edges = readCsvRows(config.assetsDir + "/network_edges.csv");
    REQUIRE(edges.size() == expected.size() + 1);
    CHECK(edges[0] == std::vector<std::string>{"from", "to", "weight"});
    for (size_t k = 0; k < expected.size(); ++k) {
        REQUIRE(edges[k + 1].size() == 3);
        CHECK(edges[k + 1][0] == data.items[expected[k].from]);
        CHECK(edges[k + 1][1] == data.items[expected[k].to]);
        CHECK(std::stod(edges[k + 1][2]) == Approx(expected[k].weight).epsilon(1e-8));
    }

    const auto boot = readCsvRows(config.assetsDir + "/bootstrap_edges.csv");
    CHECK(boot.size() == 1 + 8 * 7 / 2);
}

TEST_CASE("Pipeline falls back to numeric columns and skips an uncovered default model", "[pipeline]") {
    TestData::TempCsv csv("psynet_pipeline_numeric.csv", twoFactorCsv());
    ScopedDir out("psynet_pipeline_numeric");
    AutoConfig config = quickConfig(csv.path(), out);

    AnalysisPipeline pipeline;
    REQUIRE(pipeline.run(config) == 0);

    const std::string report = readAll(config.reportFile);
    CHECK(report.find("## 2. Confirmatory factor analysis") != std::string::npos);
    CHECK(report.find("> Skipped: the selected items do not include every item of the factor model.") !=
          std::string::npos);
    CHECK(report.find("### Model fit") == std::string::npos);

    const auto weights = readCsvRows(config.assetsDir + "/network_weights.csv");
    REQUIRE_FALSE(weights.empty());
    CHECK(weights[0] == std::vector<std::string>{"item", "X1", "X2", "X3", "X4", "X5", "X6", "X7", "X8", "Z"});
}

TEST_CASE("Pipeline honours an explicit item list", "[pipeline]") {
    TestData::TempCsv csv("psynet_pipeline_items.csv", twoFactorCsv());
    ScopedDir out("psynet_pipeline_items");
    AutoConfig config = quickConfig(csv.path(), out);
    config.items = {"X1", "X2", "X5", "X6"};

    AnalysisPipeline pipeline;
    REQUIRE(pipeline.run(config) == 0);

    const auto weights = readCsvRows(config.assetsDir + "/network_weights.csv");
    REQUIRE(weights.size() == 5);
    CHECK(weights[0] == std::vector<std::string>{"item", "X1", "X2", "X5", "X6"});
    CHECK(readCsvRows(config.assetsDir + "/centrality.csv").size() == 5);
}

TEST_CASE("Pipeline rejects an explicit factor model the data does not contain", "[pipeline]") {
    TestData::TempCsv csv("psynet_pipeline_missing.csv", twoFactorCsv());
    ScopedDir out("psynet_pipeline_missing");
    AutoConfig config = quickConfig(csv.path(), out);
    config.factorModel.factors = {{"F1", {"Q1", "Q2", "Q3"}}};
    config.factorModelExplicit = true;

    AnalysisPipeline pipeline;
    CHECK_THROWS_AS(pipeline.run(config), Psynet::ConfigurationException);
    CHECK_FALSE(fs::exists(config.reportFile));
}
