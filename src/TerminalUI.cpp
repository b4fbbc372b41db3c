#include "TerminalUI.h"
#include "CommonUtils.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <iomanip>
#include <numeric>

namespace {
const char* const kRule = "============================================================================================================\n";

void printBanner(const std::string& title) {
    const size_t width = 108;
    const std::string padded = " " + title + " ";
    const size_t left = padded.size() >= width ? 0 : (width - padded.size()) / 2;
    const size_t right = padded.size() >= width ? 0 : width - padded.size() - left;
    std::cout << "\n" << std::string(left, '=') << padded << std::string(right, '=') << "\n";
}

size_t nameWidth(const std::vector<std::string>& names, size_t minimum) {
    size_t w = minimum;
    for (const auto& name : names) w = std::max(w, name.length());
    return w + 2;
}
} // namespace

void TerminalUI::printMissingDataReport(const MissingDataReport& report) {
    printBanner("MISSING DATA");
    std::cout << "Rows read: " << report.originalRows << " | complete: " << report.keptRows
              << " | removed (listwise): " << report.removedRows << " ("
              << CommonUtils::toFixed(100.0 * report.removedRatio(), 1) << "%)";
    if (report.allMissingRows > 0) std::cout << " | fully empty: " << report.allMissingRows;
    std::cout << "\n";

    bool any = false;
    for (size_t i = 0; i < report.items.size() && i < report.missingPerItem.size(); ++i) {
        if (report.missingPerItem[i] == 0) continue;
        if (!any) std::cout << "Missing values per item:\n";
        any = true;
        std::cout << "    " << std::left << std::setw(14) << report.items[i] << std::right << std::setw(8)
                  << report.missingPerItem[i] << "\n";
    }
    if (!any) std::cout << "No missing values in the selected items.\n";
    std::cout << kRule;
}

void TerminalUI::printDescriptiveTable(const std::vector<std::string>& itemNames, const std::vector<ColumnStats>& stats) {
    const int w = static_cast<int>(nameWidth(itemNames, 10));
    printBanner("DESCRIPTIVE STATISTICS");
    std::cout << std::left
              << std::setw(w) << "Item"
              << std::right
              << std::setw(7) << "n"
              << std::setw(10) << "Mean"
              << std::setw(10) << "Median"
              << std::setw(10) << "SD"
              << std::setw(10) << "Skew"
              << std::setw(10) << "Kurt"
              << std::setw(8) << "Min"
              << std::setw(8) << "Max" << "\n";
    std::cout << std::string(static_cast<size_t>(w) + 7 + 10 * 5 + 16, '-') << "\n";

    for (size_t i = 0; i < itemNames.size() && i < stats.size(); ++i) {
        const ColumnStats& s = stats[i];
        std::cout << std::left << std::setw(w) << itemNames[i]
                  << std::right << std::setw(7) << s.count
                  << std::fixed << std::setprecision(2)
                  << std::setw(10) << s.mean
                  << std::setw(10) << s.median
                  << std::setw(10) << s.stddev
                  << std::setw(10) << s.skewness
                  << std::setw(10) << s.kurtosis
                  << std::setw(8) << s.min
                  << std::setw(8) << s.max << "\n";
    }
    std::cout << kRule;
}

void TerminalUI::printCorrelationMatrix(const std::vector<std::string>& itemNames, const std::vector<std::vector<double>>& matrix) {
    printBanner("CORRELATION MATRIX");
    std::cout << std::setw(8) << " ";
    for (const auto& name : itemNames) {
        std::cout << std::setw(7) << name.substr(0, 6);
    }
    std::cout << "\n" << std::string(8 + 7 * itemNames.size(), '-') << "\n";
    for (size_t i = 0; i < itemNames.size() && i < matrix.size(); ++i) {
        std::cout << std::left << std::setw(8) << itemNames[i].substr(0, 7) << std::right;
        for (size_t j = 0; j < itemNames.size() && j < matrix[i].size(); ++j) {
            std::cout << std::setw(7) << std::fixed << std::setprecision(2) << matrix[i][j];
        }
        std::cout << "\n";
    }
    std::cout << kRule;
}

void TerminalUI::printCfaSummary(const CfaResult& result) {
    printBanner("CONFIRMATORY FACTOR ANALYSIS");
    const CfaFitIndices& fit = result.fit;
    std::cout << "Estimator: ML | N = " << result.sampleSize << " | free parameters: " << fit.freeParameters
              << " | iterations: " << result.iterations << (result.converged ? " (converged)" : " (NOT converged)") << "\n";
    std::cout << "Chi-square(" << fit.df << ") = " << CommonUtils::toFixed(fit.chiSquare, 2)
              << ", p = " << CommonUtils::formatPValue(fit.pValue) << "\n";
    std::cout << "CFI = " << CommonUtils::toFixed(fit.cfi) << " | TLI = " << CommonUtils::toFixed(fit.tli)
              << " | RMSEA = " << CommonUtils::toFixed(fit.rmsea) << " | SRMR = " << CommonUtils::toFixed(fit.srmr) << "\n";
    std::cout << "AIC = " << CommonUtils::toFixed(fit.aic, 1) << " | BIC = " << CommonUtils::toFixed(fit.bic, 1) << "\n";

    std::cout << "\n" << std::left << std::setw(20) << "Factor" << std::setw(10) << "Item" << std::right
              << std::setw(10) << "Loading" << std::setw(10) << "SE" << std::setw(10) << "Std" << "\n";
    std::cout << std::string(60, '-') << "\n";
    for (size_t j = 0; j < result.items.size(); ++j) {
        const std::string& factor = result.factors[result.itemFactor[j]];
        double se = 0.0;
        for (const auto& p : result.parameters) {
            if (p.op == "=~" && p.lhs == factor && p.rhs == result.items[j]) {
                se = p.se;
                break;
            }
        }
        std::cout << std::left << std::setw(20) << factor << std::setw(10) << result.items[j] << std::right
                  << std::setw(10) << CommonUtils::toFixed(result.loadings[j])
                  << std::setw(10) << (se > 0.0 ? CommonUtils::toFixed(se) : std::string("fixed"))
                  << std::setw(10) << CommonUtils::toFixed(result.standardizedLoadings[j]) << "\n";
    }

    for (const auto& warning : result.warnings) {
        std::cerr << "[Psynet][CFA][Warning] " << warning << "\n";
    }
    std::cout << kRule;
}

void TerminalUI::printNetworkSummary(const NetworkModel& model, double threshold) {
    printBanner("NETWORK ESTIMATION");
    const size_t p = model.items.size();
    const size_t possible = p < 2 ? 0 : p * (p - 1) / 2;
    const size_t nonzero = NetworkGraph::nonzeroEdgeCount(model.weights);
    std::cout << "Estimator: " << NetworkEstimator::toString(model.options.estimator)
              << " | N = " << model.sampleSize << " | nodes: " << p << "\n";
    if (model.options.estimator == EstimatorKind::EbicGlasso) {
        std::cout << "EBIC gamma = " << CommonUtils::toFixed(model.options.gamma, 2)
                  << " | selected lambda = " << CommonUtils::toFixed(model.selectedLambda, 4)
                  << " | EBIC = " << CommonUtils::toFixed(model.ebic, 2) << "\n";
    }
    if (model.pruning.applied) {
        std::cout << "Pruning (alpha = " << CommonUtils::toFixed(model.options.alpha, 3) << ", adjust = "
                  << NetworkEstimator::toString(model.options.adjust) << "): kept " << model.pruning.keptEdges
                  << " of " << model.pruning.candidateEdges << " edges, pruned " << model.pruning.prunedEdges << "\n";
    }
    std::cout << "Nonzero edges: " << nonzero << " / " << possible << " (density "
              << CommonUtils::toFixed(NetworkGraph::density(model.weights), 3) << ")";
    if (threshold > 0.0) {
        std::cout << " | visible at |w| >= " << CommonUtils::toFixed(threshold, 2) << ": "
                  << model.visibleEdges(threshold).size();
    }
    std::cout << "\n";
    for (const auto& warning : model.warnings) {
        std::cerr << "[Psynet][Network][Warning] " << warning << "\n";
    }
    std::cout << kRule;
}

void TerminalUI::printCentralityTable(const CentralityResult& result) {
    const int w = static_cast<int>(nameWidth(result.items, 8));
    printBanner("CENTRALITY");
    std::cout << std::left << std::setw(w) << "Item" << std::right
              << std::setw(12) << "Strength"
              << std::setw(12) << "Closeness"
              << std::setw(14) << "Betweenness"
              << std::setw(12) << "ExpInfl" << "\n";
    std::cout << std::string(static_cast<size_t>(w) + 50, '-') << "\n";
    for (size_t i = 0; i < result.items.size(); ++i) {
        std::cout << std::left << std::setw(w) << result.items[i] << std::right << std::fixed
                  << std::setprecision(3) << std::setw(12) << result.strength[i]
                  << std::setprecision(4) << std::setw(12) << result.closeness[i]
                  << std::setprecision(1) << std::setw(14) << result.betweenness[i]
                  << std::setprecision(3) << std::setw(12) << result.expectedInfluence[i] << "\n";
    }
    std::cout << kRule;
}

void TerminalUI::printBootstrapSummary(const BootstrapResult& result, size_t limit) {
    printBanner("BOOTSTRAPPED EDGE WEIGHTS");
    std::cout << result.yieldText() << " | CI level " << CommonUtils::toFixed(100.0 * result.ciLevel, 1) << "%\n";

    std::vector<size_t> order(result.edges.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return std::abs(result.edges[a].sampleWeight) > std::abs(result.edges[b].sampleWeight);
    });

    std::cout << std::left << std::setw(16) << "Edge" << std::right
              << std::setw(10) << "Sample" << std::setw(10) << "Mean" << std::setw(10) << "SD"
              << std::setw(10) << "Lower" << std::setw(10) << "Upper" << std::setw(10) << "Incl." << "\n";
    std::cout << std::string(76, '-') << "\n";
    const std::vector<std::string>& names = result.sample.items;
    for (size_t k = 0; k < order.size() && k < limit; ++k) {
        const EdgeSummary& e = result.edges[order[k]];
        std::cout << std::left << std::setw(16) << (names[e.from] + "--" + names[e.to]) << std::right << std::fixed
                  << std::setprecision(3)
                  << std::setw(10) << e.sampleWeight << std::setw(10) << e.mean << std::setw(10) << e.sd
                  << std::setw(10) << e.lower << std::setw(10) << e.upper
                  << std::setprecision(2) << std::setw(10) << e.inclusion << "\n";
    }
    if (!result.failures.empty()) {
        std::cerr << "[Psynet][Bootstrap][Warning] " << result.failures.size() << " resample(s) failed; first: #"
                  << result.failures.front().index << " " << result.failures.front().message << "\n";
    }
    std::cout << kRule;
}
