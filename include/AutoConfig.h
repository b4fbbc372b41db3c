#pragma once
#include "FactorAnalysis.h"
#include <cstdint>
#include <string>
#include <vector>

struct PlotConfig {
    std::string format = "png";
    int width = 1280;
    int height = 720;
    std::string theme = "light";
    bool showGrid = true;
    double pointSize = 0.8;
    double lineWidth = 1.6;
};

struct AutoConfig {
    std::string datasetPath;
    std::string reportFile = "psynet_report.md";
    std::string assetsDir = "psynet_report_assets";
    char delimiter = ',';

    // Explicit item selection; empty => factor model items, or all numeric columns.
    std::vector<std::string> items;
    FactorModelSpec factorModel = FactorModelSpec::bigFive();
    bool factorModelExplicit = false;
    bool runCfa = true;

    std::string estimator = "pcor";  // cor|pcor|ebicglasso
    std::string prune = "sig";       // none|sig
    double alpha = 0.05;
    std::string adjust = "none";     // none|holm|bonferroni|fdr
    double threshold = 0.0;          // view-only edge filter
    double gamma = 0.5;

    size_t bootstrapSamples = 1000;
    int workers = 0;
    uint64_t seed = 1337;
    double ciLevel = 0.95;

    int cfaMaxIterations = 1000;
    double cfaTolerance = 1e-6;

    std::string layout = "spring";   // spring|circle
    bool plots = true;
    bool generateHtml = false;
    bool verbose = false;

    PlotConfig plot;

    /**
     * @brief Builds config from CLI args and optional config file.
     * @pre argv[1] is the dataset path.
     * @post Returns a validated config; CLI flags override config file values.
     * @throws Psynet::ConfigurationException on invalid arguments or values.
     */
    static AutoConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads a lightweight YAML/JSON-like key:value file on top of `base`.
     * @details `factor.<Name>: item, item, ...` lines replace the default factor model.
     * @throws Psynet::ConfigurationException on parse/validation failures.
     */
    static AutoConfig fromFile(const std::string& configPath, const AutoConfig& base);

    /**
     * @brief Applies one normalized key (flag name without dashes, '-' as '_').
     * @throws Psynet::ConfigurationException for unknown keys or malformed values.
     */
    void assign(const std::string& key, const std::string& value);

    /**
     * @brief Validates enum-like fields and numeric ranges.
     * @throws Psynet::ConfigurationException on invalid values.
     */
    void validate() const;

    static std::string usage();
};
