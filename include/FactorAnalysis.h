#pragma once
#include "ItemDataset.h"
#include "NetworkGraph.h"

#include <cstddef>
#include <string>
#include <vector>

struct FactorDefinition {
    std::string name;
    std::vector<std::string> items; // first item is the marker indicator
};

struct FactorModelSpec {
    std::vector<FactorDefinition> factors;

    // Agreeableness, Conscientiousness, Extraversion, Neuroticism, Openness; five items each.
    static FactorModelSpec bigFive();

    std::vector<std::string> allItems() const;

    // Factor name for an item, "" when the item is not in the model.
    std::string groupOf(const std::string& item) const;

    /**
     * @throws Psynet::ConfigurationException for empty factors, factors with
     * fewer than two indicators, or an item assigned to two factors.
     */
    void validate() const;
};

struct CfaParameter {
    std::string lhs;
    std::string op; // "=~" loading, "~~" (co)variance
    std::string rhs;
    double estimate = 0.0;
    double se = 0.0;
    double z = 0.0;
    double pValue = 0.0;
    double standardized = 0.0;
    bool free = true;
};

struct CfaFitIndices {
    double chiSquare = 0.0;
    int df = 0;
    double pValue = 0.0;
    double baselineChiSquare = 0.0;
    int baselineDf = 0;
    double cfi = 0.0;
    double tli = 0.0;
    double rmsea = 0.0;
    double srmr = 0.0;
    double logLikelihood = 0.0;
    double aic = 0.0;
    double bic = 0.0;
    size_t freeParameters = 0;
};

struct CfaResult {
    std::vector<std::string> factors;
    std::vector<std::string> items;
    std::vector<size_t> itemFactor;              // factor index per item
    std::vector<double> loadings;                // per item, unstandardised
    std::vector<double> standardizedLoadings;    // per item
    std::vector<double> residualVariances;       // per item
    WeightMatrix factorCovariance;
    WeightMatrix factorCorrelation;
    std::vector<CfaParameter> parameters;
    CfaFitIndices fit;
    size_t sampleSize = 0;
    double minimumDiscrepancy = 0.0;
    size_t iterations = 0;
    bool converged = false;
    std::vector<std::string> warnings;
};

struct CfaOptions {
    size_t maxIterations = 1000;
    double tolerance = 1e-6; // max |gradient| at convergence
};

class FactorAnalysis {
public:
    /**
     * @brief Maximum likelihood confirmatory factor analysis with marker-variable
     * identification, minimised by BFGS.
     * @details Non-convergence, negative variances and negative df become warnings.
     * @throws Psynet::DatasetException when a model item is missing from data.
     * @throws Psynet::EstimationException when the sample covariance is singular.
     */
    static CfaResult fit(const ObservationMatrix& data, const FactorModelSpec& spec, const CfaOptions& options = {});

    // Fills CFI, TLI and RMSEA from the model and baseline chi-squares. Undefined values are NaN.
    static void comparativeFit(CfaFitIndices& fit, size_t sampleSize);
};
