#include "CorrelationEngine.h"
#include "CommonUtils.h"
#include "MathUtils.h"
#include "PsynetExceptions.h"
#include <algorithm>
#include <cmath>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
std::vector<double> columnMeans(const ObservationMatrix& data) {
    std::vector<double> means(data.itemCount(), 0.0);
    const double n = static_cast<double>(data.rowCount());
    for (size_t c = 0; c < data.itemCount(); ++c) {
        double sum = 0.0;
        for (double v : data.columns[c]) sum += v;
        means[c] = sum / n;
    }
    return means;
}
} // namespace

WeightMatrix CorrelationEngine::calculateCovarianceMatrix(const ObservationMatrix& data, bool unbiased) {
    const size_t n = data.rowCount();
    const size_t p = data.itemCount();
    if (n < 2) throw Psynet::EstimationException("Covariance needs at least two complete rows, got " + std::to_string(n));

    const std::vector<double> means = columnMeans(data);
    const double divisor = unbiased ? static_cast<double>(n - 1) : static_cast<double>(n);
    WeightMatrix cov(p, std::vector<double>(p, 0.0));

    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (size_t i = 0; i < p; ++i) {
        const auto& xi = data.columns[i];
        for (size_t j = i; j < p; ++j) {
            const auto& xj = data.columns[j];
            double sum = 0.0;
            for (size_t r = 0; r < n; ++r) {
                sum += (xi[r] - means[i]) * (xj[r] - means[j]);
            }
            cov[i][j] = sum / divisor;
            cov[j][i] = cov[i][j];
        }
    }
    return cov;
}

std::vector<std::string> CorrelationEngine::zeroVarianceItems(const ObservationMatrix& data) {
    std::vector<std::string> out;
    if (data.rowCount() == 0) return data.items;
    for (size_t c = 0; c < data.itemCount(); ++c) {
        const auto [lo, hi] = std::minmax_element(data.columns[c].begin(), data.columns[c].end());
        if (*hi - *lo <= MathUtils::numericEpsilon()) out.push_back(data.items[c]);
    }
    return out;
}

WeightMatrix CorrelationEngine::calculateCorrelationMatrix(const ObservationMatrix& data) {
    const auto flat = zeroVarianceItems(data);
    if (!flat.empty()) {
        throw Psynet::EstimationException("Zero-variance items cannot be correlated: " + CommonUtils::joinList(flat));
    }

    WeightMatrix cov = calculateCovarianceMatrix(data, true);
    const size_t p = cov.size();
    std::vector<double> sd(p, 0.0);
    for (size_t i = 0; i < p; ++i) sd[i] = std::sqrt(cov[i][i]);

    WeightMatrix r(p, std::vector<double>(p, 1.0));
    for (size_t i = 0; i < p; ++i) {
        for (size_t j = i + 1; j < p; ++j) {
            const double v = std::clamp(cov[i][j] / (sd[i] * sd[j]), -1.0, 1.0);
            if (!std::isfinite(v)) {
                throw Psynet::EstimationException("Non-finite correlation between " + data.items[i] + " and " +
                                                  data.items[j]);
            }
            r[i][j] = v;
            r[j][i] = v;
        }
    }
    return r;
}

WeightMatrix CorrelationEngine::calculatePValueMatrix(const WeightMatrix& r, size_t n, size_t controls) {
    const size_t p = r.size();
    WeightMatrix pv(p, std::vector<double>(p, 0.0));
    for (size_t i = 0; i < p; ++i) {
        for (size_t j = i + 1; j < p; ++j) {
            const Significance sig = MathUtils::calculateSignificance(r[i][j], n, controls);
            pv[i][j] = sig.p_value;
            pv[j][i] = sig.p_value;
        }
    }
    return pv;
}

std::vector<CorrelationResult> CorrelationEngine::strongestCorrelations(const ObservationMatrix& data,
                                                                        const WeightMatrix& matrix,
                                                                        size_t topK) {
    std::vector<CorrelationResult> results;
    const size_t p = std::min(matrix.size(), data.itemCount());
    for (size_t i = 0; i < p; ++i) {
        for (size_t j = i + 1; j < p; ++j) {
            const Significance sig = MathUtils::calculateSignificance(matrix[i][j], data.rowCount());
            results.push_back({data.items[i], data.items[j], matrix[i][j], sig.p_value, sig.is_significant});
        }
    }
    std::sort(results.begin(), results.end(), [](const CorrelationResult& a, const CorrelationResult& b) {
        return std::abs(a.r) > std::abs(b.r);
    });
    if (results.size() > topK) results.resize(topK);
    return results;
}
