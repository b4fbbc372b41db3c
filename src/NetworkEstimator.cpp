#include "NetworkEstimator.h"
#include "CommonUtils.h"
#include "CorrelationEngine.h"
#include "GraphicalLasso.h"
#include "MathUtils.h"
#include "PsynetExceptions.h"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace {
void requireFinite(const WeightMatrix& m, const std::vector<std::string>& items) {
    for (size_t i = 0; i < m.size(); ++i) {
        for (size_t j = 0; j < m.size(); ++j) {
            if (!std::isfinite(m[i][j])) {
                const std::string a = i < items.size() ? items[i] : std::to_string(i);
                const std::string b = j < items.size() ? items[j] : std::to_string(j);
                throw Psynet::EstimationException("Non-finite edge weight between " + a + " and " + b);
            }
        }
    }
}
} // namespace

WeightMatrix NetworkEstimator::precisionToPartial(const WeightMatrix& precision) {
    const size_t p = precision.size();
    WeightMatrix out(p, std::vector<double>(p, 0.0));
    for (size_t i = 0; i < p; ++i) {
        if (!(precision[i][i] > 0.0)) {
            throw Psynet::EstimationException("Precision matrix has a non-positive diagonal entry");
        }
    }
    for (size_t i = 0; i < p; ++i) {
        for (size_t j = i + 1; j < p; ++j) {
            double w = -precision[i][j] / std::sqrt(precision[i][i] * precision[j][j]);
            w = std::clamp(w, -1.0, 1.0);
            out[i][j] = w;
            out[j][i] = w;
        }
    }
    return out;
}

WeightMatrix NetworkEstimator::partialCorrelations(const WeightMatrix& corr) {
    const MathUtils::Matrix r(corr);
    if (!r.cholesky()) {
        throw Psynet::EstimationException("Correlation matrix is not positive definite (collinear or duplicated items)");
    }
    const auto inv = r.inverse();
    if (!inv) throw Psynet::EstimationException("Correlation matrix is singular");

    WeightMatrix k = inv->data;
    // Gauss-Jordan leaves tiny asymmetries; average them out.
    for (size_t i = 0; i < k.size(); ++i) {
        for (size_t j = i + 1; j < k.size(); ++j) {
            const double avg = 0.5 * (k[i][j] + k[j][i]);
            k[i][j] = avg;
            k[j][i] = avg;
        }
    }
    return precisionToPartial(k);
}

WeightMatrix NetworkEstimator::adjustPValues(const WeightMatrix& pValues, PValueAdjust method) {
    const size_t p = pValues.size();
    WeightMatrix out = pValues;
    if (method == PValueAdjust::None || p < 2) return out;

    struct Cell {
        size_t i;
        size_t j;
        double p;
    };
    std::vector<Cell> cells;
    for (size_t i = 0; i < p; ++i) {
        for (size_t j = i + 1; j < p; ++j) cells.push_back({i, j, pValues[i][j]});
    }
    const double m = static_cast<double>(cells.size());
    std::vector<double> adjusted(cells.size(), 1.0);

    std::vector<size_t> order(cells.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) { return cells[a].p < cells[b].p; });

    switch (method) {
        case PValueAdjust::Bonferroni:
            for (size_t k = 0; k < cells.size(); ++k) adjusted[k] = std::min(1.0, cells[k].p * m);
            break;
        case PValueAdjust::Holm: {
            double running = 0.0;
            for (size_t rank = 0; rank < order.size(); ++rank) {
                const double v = std::min(1.0, (m - static_cast<double>(rank)) * cells[order[rank]].p);
                running = std::max(running, v);
                adjusted[order[rank]] = running;
            }
            break;
        }
        case PValueAdjust::Fdr: {
            double running = 1.0;
            for (size_t rank = order.size(); rank-- > 0;) {
                const double v = std::min(1.0, m / static_cast<double>(rank + 1) * cells[order[rank]].p);
                running = std::min(running, v);
                adjusted[order[rank]] = running;
            }
            break;
        }
        case PValueAdjust::None:
            break;
    }

    for (size_t k = 0; k < cells.size(); ++k) {
        out[cells[k].i][cells[k].j] = adjusted[k];
        out[cells[k].j][cells[k].i] = adjusted[k];
    }
    return out;
}

NetworkModel NetworkEstimator::estimate(const ObservationMatrix& data, const NetworkOptions& options) {
    const size_t p = data.itemCount();
    const size_t n = data.rowCount();
    if (p < 2) throw Psynet::EstimationException("A network needs at least two items");

    NetworkModel model;
    model.items = data.items;
    model.sampleSize = n;
    model.options = options;

    const WeightMatrix corr = CorrelationEngine::calculateCorrelationMatrix(data);
    size_t controls = 0;

    switch (options.estimator) {
        case EstimatorKind::Correlation:
            model.weights = corr;
            for (size_t i = 0; i < p; ++i) model.weights[i][i] = 0.0;
            break;
        case EstimatorKind::PartialCorrelation:
            model.weights = partialCorrelations(corr);
            controls = p - 2;
            break;
        case EstimatorKind::EbicGlasso: {
            const EbicSelection sel = GraphicalLasso::selectByEbic(corr, n, options.gamma, options.lambdaCount,
                                                                   options.lambdaMinRatio, options.glassoTolerance,
                                                                   options.glassoMaxIterations);
            model.weights = precisionToPartial(sel.fit.precision);
            model.selectedLambda = sel.fit.lambda;
            model.ebic = sel.ebic;
            model.converged = sel.converged;
            model.iterations = sel.iterations;
            if (!sel.converged) {
                model.warnings.push_back("Graphical lasso did not converge at the selected lambda " +
                                         CommonUtils::toFixed(sel.fit.lambda, 4) + " after " +
                                         std::to_string(sel.iterations) + " iterations; edge weights are approximate");
            }
            break;
        }
    }
    requireFinite(model.weights, model.items);

    if (options.estimator != EstimatorKind::EbicGlasso) {
        model.pValues = adjustPValues(CorrelationEngine::calculatePValueMatrix(model.weights, n, controls),
                                      options.adjust);
    }

    if (options.prune == PruneMode::Significance && options.estimator != EstimatorKind::EbicGlasso) {
        if (n <= 2 + controls) {
            throw Psynet::EstimationException("Significance pruning needs more than " + std::to_string(2 + controls) +
                                              " complete rows, got " + std::to_string(n));
        }
        model.pruning.applied = true;
        for (size_t i = 0; i < p; ++i) {
            for (size_t j = i + 1; j < p; ++j) {
                if (model.weights[i][j] == 0.0) continue;
                ++model.pruning.candidateEdges;
                if (model.pValues[i][j] >= options.alpha) {
                    model.weights[i][j] = 0.0;
                    model.weights[j][i] = 0.0;
                    ++model.pruning.prunedEdges;
                } else {
                    ++model.pruning.keptEdges;
                }
            }
        }
    }
    return model;
}

EstimatorKind NetworkEstimator::parseEstimator(const std::string& s) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(s));
    if (v == "cor") return EstimatorKind::Correlation;
    if (v == "pcor") return EstimatorKind::PartialCorrelation;
    if (v == "ebicglasso" || v == "glasso") return EstimatorKind::EbicGlasso;
    throw Psynet::ConfigurationException("estimator must be cor, pcor or ebicglasso, got '" + s + "'");
}

PruneMode NetworkEstimator::parsePruneMode(const std::string& s) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(s));
    if (v == "none" || v.empty()) return PruneMode::None;
    if (v == "sig") return PruneMode::Significance;
    throw Psynet::ConfigurationException("prune must be none or sig, got '" + s + "'");
}

PValueAdjust NetworkEstimator::parseAdjust(const std::string& s) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(s));
    if (v == "none" || v.empty()) return PValueAdjust::None;
    if (v == "holm") return PValueAdjust::Holm;
    if (v == "bonferroni") return PValueAdjust::Bonferroni;
    if (v == "fdr" || v == "bh") return PValueAdjust::Fdr;
    throw Psynet::ConfigurationException("adjust must be none, holm, bonferroni or fdr, got '" + s + "'");
}

std::string NetworkEstimator::toString(EstimatorKind kind) {
    switch (kind) {
        case EstimatorKind::Correlation: return "cor";
        case EstimatorKind::PartialCorrelation: return "pcor";
        case EstimatorKind::EbicGlasso: return "ebicglasso";
    }
    return "pcor";
}

std::string NetworkEstimator::toString(PruneMode mode) {
    return mode == PruneMode::Significance ? "sig" : "none";
}

std::string NetworkEstimator::toString(PValueAdjust adjust) {
    switch (adjust) {
        case PValueAdjust::None: return "none";
        case PValueAdjust::Holm: return "holm";
        case PValueAdjust::Bonferroni: return "bonferroni";
        case PValueAdjust::Fdr: return "fdr";
    }
    return "none";
}
