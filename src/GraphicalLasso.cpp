#include "GraphicalLasso.h"
#include "MathUtils.h"
#include "PsynetExceptions.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace {
double softThreshold(double z, double gamma) {
    if (z > gamma) return z - gamma;
    if (z < -gamma) return z + gamma;
    return 0.0;
}

double meanAbsOffDiagonal(const WeightMatrix& m) {
    const size_t p = m.size();
    if (p < 2) return 0.0;
    double sum = 0.0;
    for (size_t i = 0; i < p; ++i) {
        for (size_t j = 0; j < p; ++j) {
            if (i != j) sum += std::abs(m[i][j]);
        }
    }
    return sum / static_cast<double>(p * (p - 1));
}

// Lasso sub-problem: min 1/2 b'W11 b - b's12 + lambda |b|_1 over the indices in `others`.
void solveColumnLasso(const WeightMatrix& w,
                      const std::vector<size_t>& others,
                      const std::vector<double>& s12,
                      double lambda,
                      std::vector<double>& beta) {
    const size_t m = others.size();
    constexpr size_t kMaxInner = 1000;
    constexpr double kInnerTol = 1e-7;
    for (size_t iter = 0; iter < kMaxInner; ++iter) {
        double maxDelta = 0.0;
        for (size_t k = 0; k < m; ++k) {
            const size_t rowK = others[k];
            double r = s12[k];
            for (size_t l = 0; l < m; ++l) {
                if (l == k || beta[l] == 0.0) continue;
                r -= w[rowK][others[l]] * beta[l];
            }
            const double newBeta = softThreshold(r, lambda) / w[rowK][rowK];
            maxDelta = std::max(maxDelta, std::abs(newBeta - beta[k]));
            beta[k] = newBeta;
        }
        if (maxDelta < kInnerTol) break;
    }
}
} // namespace

GlassoFit GraphicalLasso::fit(const WeightMatrix& s,
                              double lambda,
                              double tolerance,
                              size_t maxIterations,
                              const WeightMatrix* warmStart) {
    const size_t p = s.size();
    if (p == 0 || !NetworkGraph::isSymmetric(s, 1e-9)) {
        throw Psynet::EstimationException("Graphical lasso needs a non-empty symmetric matrix");
    }
    for (size_t i = 0; i < p; ++i) {
        if (!(s[i][i] > 0.0) || !std::isfinite(s[i][i])) {
            throw Psynet::EstimationException("Graphical lasso needs a positive diagonal");
        }
    }

    GlassoFit out;
    out.lambda = lambda;
    out.covariance = (warmStart && warmStart->size() == p) ? *warmStart : s;
    WeightMatrix& w = out.covariance;
    for (size_t i = 0; i < p; ++i) w[i][i] = s[i][i];

    std::vector<std::vector<double>> betas(p, std::vector<double>(p > 0 ? p - 1 : 0, 0.0));
    const double threshold = tolerance * std::max(meanAbsOffDiagonal(s), MathUtils::numericEpsilon());

    std::vector<size_t> others;
    std::vector<double> s12;
    others.reserve(p);
    s12.reserve(p);

    for (size_t iter = 0; iter < maxIterations && p > 1; ++iter) {
        double totalChange = 0.0;
        for (size_t j = 0; j < p; ++j) {
            others.clear();
            s12.clear();
            for (size_t k = 0; k < p; ++k) {
                if (k == j) continue;
                others.push_back(k);
                s12.push_back(s[k][j]);
            }

            std::vector<double>& beta = betas[j];
            solveColumnLasso(w, others, s12, lambda, beta);

            for (size_t k = 0; k < others.size(); ++k) {
                double wkj = 0.0;
                for (size_t l = 0; l < others.size(); ++l) {
                    if (beta[l] != 0.0) wkj += w[others[k]][others[l]] * beta[l];
                }
                totalChange += std::abs(wkj - w[others[k]][j]);
                w[others[k]][j] = wkj;
                w[j][others[k]] = wkj;
            }
        }
        out.iterations = iter + 1;
        const double meanChange = totalChange / static_cast<double>(p * (p - 1));
        if (meanChange < threshold) {
            out.converged = true;
            break;
        }
    }
    if (p == 1) out.converged = true;

    out.precision.assign(p, std::vector<double>(p, 0.0));
    for (size_t j = 0; j < p; ++j) {
        double dot = 0.0;
        size_t k = 0;
        for (size_t i = 0; i < p; ++i) {
            if (i == j) continue;
            dot += w[i][j] * betas[j][k];
            ++k;
        }
        const double denom = w[j][j] - dot;
        if (!(denom > 0.0) || !std::isfinite(denom)) {
            throw Psynet::EstimationException("Graphical lasso produced a non-positive precision diagonal at lambda " +
                                              std::to_string(lambda));
        }
        const double thetaJJ = 1.0 / denom;
        out.precision[j][j] = thetaJJ;
        k = 0;
        for (size_t i = 0; i < p; ++i) {
            if (i == j) continue;
            out.precision[i][j] = -betas[j][k] * thetaJJ;
            ++k;
        }
    }

    for (size_t i = 0; i < p; ++i) {
        for (size_t j = i + 1; j < p; ++j) {
            double avg = 0.5 * (out.precision[i][j] + out.precision[j][i]);
            // Keep the sparsity pattern exact when only one side was shrunk to zero.
            if (out.precision[i][j] == 0.0 || out.precision[j][i] == 0.0) avg = 0.0;
            out.precision[i][j] = avg;
            out.precision[j][i] = avg;
        }
    }
    return out;
}

std::vector<double> GraphicalLasso::lambdaPath(const WeightMatrix& s, size_t count, double minRatio) {
    double lambdaMax = 0.0;
    for (size_t i = 0; i < s.size(); ++i) {
        for (size_t j = i + 1; j < s.size(); ++j) lambdaMax = std::max(lambdaMax, std::abs(s[i][j]));
    }
    std::vector<double> path;
    if (count == 0 || lambdaMax <= 0.0) return path;
    if (count == 1) return {lambdaMax};

    const double lambdaMin = lambdaMax * std::clamp(minRatio, 1e-6, 1.0);
    const double logMax = std::log(lambdaMax);
    const double logMin = std::log(lambdaMin);
    path.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        const double t = static_cast<double>(i) / static_cast<double>(count - 1);
        path.push_back(std::exp(logMax + t * (logMin - logMax)));
    }
    return path;
}

double GraphicalLasso::ebic(const WeightMatrix& s, const WeightMatrix& precision, size_t n, double gamma) {
    const size_t p = s.size();
    const MathUtils::Matrix k(precision);
    const auto logDet = k.logDeterminantSPD();
    if (!logDet) return std::numeric_limits<double>::infinity();

    double traceSK = 0.0;
    size_t edges = 0;
    for (size_t i = 0; i < p; ++i) {
        for (size_t j = 0; j < p; ++j) {
            traceSK += s[i][j] * precision[j][i];
            if (j > i && precision[i][j] != 0.0) ++edges;
        }
    }
    const double nd = static_cast<double>(n);
    const double logLik = nd / 2.0 * (*logDet - traceSK);
    const double e = static_cast<double>(edges);
    return -2.0 * logLik + e * std::log(nd) + 4.0 * e * gamma * std::log(static_cast<double>(p));
}

EbicSelection GraphicalLasso::selectByEbic(const WeightMatrix& s,
                                           size_t n,
                                           double gamma,
                                           size_t lambdaCount,
                                           double minRatio,
                                           double tolerance,
                                           size_t maxIterations) {
    EbicSelection best;
    best.lambdaPath = lambdaPath(s, lambdaCount, minRatio);
    best.ebic = std::numeric_limits<double>::infinity();

    if (best.lambdaPath.empty()) {
        // No off-diagonal association at all: the empty graph.
        best.fit = fit(s, 0.0, tolerance, maxIterations);
        best.ebic = ebic(s, best.fit.precision, n, gamma);
        best.converged = best.fit.converged;
        best.iterations = best.fit.iterations;
        return best;
    }

    bool found = false;
    const WeightMatrix* warm = nullptr;
    WeightMatrix previous;
    best.ebicPath.assign(best.lambdaPath.size(), std::numeric_limits<double>::infinity());

    for (size_t i = 0; i < best.lambdaPath.size(); ++i) {
        GlassoFit current;
        try {
            current = fit(s, best.lambdaPath[i], tolerance, maxIterations, warm);
        } catch (const Psynet::EstimationException&) {
            warm = nullptr;
            continue;
        }
        const double score = ebic(s, current.precision, n, gamma);
        best.ebicPath[i] = score;
        previous = current.covariance;
        warm = &previous;
        if (std::isfinite(score) && (!found || score < best.ebic)) {
            found = true;
            best.ebic = score;
            best.lambdaIndex = i;
            best.fit = std::move(current);
        }
    }

    if (!found) throw Psynet::EstimationException("Graphical lasso failed for every lambda on the path");
    best.edgeCount = NetworkGraph::nonzeroEdgeCount(best.fit.precision);
    best.converged = best.fit.converged;
    best.iterations = best.fit.iterations;
    return best;
}
