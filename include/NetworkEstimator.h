#pragma once
#include "ItemDataset.h"
#include "NetworkGraph.h"

#include <cstddef>
#include <string>
#include <vector>

enum class EstimatorKind { Correlation, PartialCorrelation, EbicGlasso };
enum class PruneMode { None, Significance };
enum class PValueAdjust { None, Holm, Bonferroni, Fdr };

struct NetworkOptions {
    EstimatorKind estimator = EstimatorKind::PartialCorrelation;
    PruneMode prune = PruneMode::Significance;
    double alpha = 0.05;
    PValueAdjust adjust = PValueAdjust::None;
    double gamma = 0.5;
    size_t lambdaCount = 100;
    double lambdaMinRatio = 0.01;
    double glassoTolerance = 1e-4;
    size_t glassoMaxIterations = 10000;
};

struct PruningSummary {
    bool applied = false;
    size_t candidateEdges = 0;
    size_t keptEdges = 0;
    size_t prunedEdges = 0;
};

struct NetworkModel {
    std::vector<std::string> items;
    WeightMatrix weights;  // zero diagonal
    WeightMatrix pValues;  // adjusted; empty for ebicglasso
    size_t sampleSize = 0;
    NetworkOptions options;
    PruningSummary pruning;
    double selectedLambda = 0.0;
    double ebic = 0.0;
    bool converged = true;   // false when the selected glasso fit hit its iteration limit
    size_t iterations = 0;
    std::vector<std::string> warnings;

    std::vector<WeightedEdge> edges() const { return NetworkGraph::toEdgeList(weights, false); }
    std::vector<WeightedEdge> visibleEdges(double threshold) const {
        return NetworkGraph::visibleEdges(weights, threshold);
    }
};

class NetworkEstimator {
public:
    /**
     * @brief Estimates a weighted undirected network over all items of data.
     * @details Pruning zeroes non-significant edges in the returned model.
     * Thresholding is not applied here; see NetworkModel::visibleEdges.
     * @throws Psynet::EstimationException for zero-variance items, singular or
     * non-finite correlation structures.
     */
    static NetworkModel estimate(const ObservationMatrix& data, const NetworkOptions& options);

    /**
     * @brief Partial correlations -K_ij / sqrt(K_ii K_jj) from the inverse of corr.
     * @throws Psynet::EstimationException when corr is singular or the precision
     * diagonal is not positive.
     */
    static WeightMatrix partialCorrelations(const WeightMatrix& corr);

    // Partial correlations from an already estimated precision matrix.
    static WeightMatrix precisionToPartial(const WeightMatrix& precision);

    // Adjusts the upper-triangle p-values jointly and mirrors them.
    static WeightMatrix adjustPValues(const WeightMatrix& pValues, PValueAdjust method);

    static EstimatorKind parseEstimator(const std::string& s);
    static PruneMode parsePruneMode(const std::string& s);
    static PValueAdjust parseAdjust(const std::string& s);
    static std::string toString(EstimatorKind kind);
    static std::string toString(PruneMode mode);
    static std::string toString(PValueAdjust adjust);
};
