#include "FactorAnalysis.h"
#include "CommonUtils.h"
#include "CorrelationEngine.h"
#include "MathUtils.h"
#include "PsynetExceptions.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <unordered_map>
#include <unordered_set>

using Matrix = MathUtils::Matrix;

FactorModelSpec FactorModelSpec::bigFive() {
    FactorModelSpec spec;
    const std::vector<std::pair<std::string, std::string>> traits = {
        {"Agreeableness", "A"}, {"Conscientiousness", "C"}, {"Extraversion", "E"},
        {"Neuroticism", "N"},   {"Openness", "O"}};
    for (const auto& [name, prefix] : traits) {
        FactorDefinition def;
        def.name = name;
        for (int i = 1; i <= 5; ++i) def.items.push_back(prefix + std::to_string(i));
        spec.factors.push_back(std::move(def));
    }
    return spec;
}

std::vector<std::string> FactorModelSpec::allItems() const {
    std::vector<std::string> out;
    for (const auto& f : factors) out.insert(out.end(), f.items.begin(), f.items.end());
    return out;
}

std::string FactorModelSpec::groupOf(const std::string& item) const {
    for (const auto& f : factors) {
        if (std::find(f.items.begin(), f.items.end(), item) != f.items.end()) return f.name;
    }
    return "";
}

void FactorModelSpec::validate() const {
    if (factors.empty()) throw Psynet::ConfigurationException("Factor model has no factors");
    std::unordered_set<std::string> names;
    std::unordered_set<std::string> seen;
    for (const auto& f : factors) {
        if (f.name.empty()) throw Psynet::ConfigurationException("Factor with an empty name");
        if (!names.insert(f.name).second) throw Psynet::ConfigurationException("Duplicate factor name: " + f.name);
        if (f.items.size() < 2) {
            throw Psynet::ConfigurationException("Factor " + f.name + " needs at least two indicators");
        }
        for (const auto& item : f.items) {
            if (!seen.insert(item).second) {
                throw Psynet::ConfigurationException("Item " + item + " is assigned to more than one factor");
            }
        }
    }
}

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

// Free parameters: non-marker loadings, lower triangle of Phi, diagonal of Theta.
class CfaProblem {
public:
    CfaProblem(Matrix s, std::vector<size_t> itemFactor, size_t factorCount, double logDetS)
        : s_(std::move(s)), itemFactor_(std::move(itemFactor)), m_(factorCount), logDetS_(logDetS) {
        const size_t p = s_.rows;
        marker_.assign(p, false);
        std::vector<bool> hasMarker(m_, false);
        for (size_t j = 0; j < p; ++j) {
            if (!hasMarker[itemFactor_[j]]) {
                hasMarker[itemFactor_[j]] = true;
                marker_[j] = true;
            }
        }
        loadingIndex_.assign(p, npos);
        size_t k = 0;
        for (size_t j = 0; j < p; ++j) {
            if (!marker_[j]) loadingIndex_[j] = k++;
        }
        loadingCount_ = k;
        phiOffset_ = loadingCount_;
        thetaOffset_ = phiOffset_ + m_ * (m_ + 1) / 2;
        parameterCount_ = thetaOffset_ + p;
    }

    static constexpr size_t npos = static_cast<size_t>(-1);

    size_t itemCount() const { return s_.rows; }
    size_t parameterCount() const { return parameterCount_; }
    bool isMarker(size_t j) const { return marker_[j]; }
    size_t loadingIndex(size_t j) const { return loadingIndex_[j]; }
    size_t thetaIndex(size_t j) const { return thetaOffset_ + j; }

    size_t phiIndex(size_t f, size_t g) const {
        if (f < g) std::swap(f, g);
        return phiOffset_ + f * (f + 1) / 2 + g;
    }

    std::vector<double> startValues() const {
        const size_t p = itemCount();
        std::vector<double> x(parameterCount_, 0.0);
        std::vector<size_t> markerOf(m_, 0);
        for (size_t j = 0; j < p; ++j) {
            if (marker_[j]) markerOf[itemFactor_[j]] = j;
        }
        for (size_t f = 0; f < m_; ++f) {
            x[phiIndex(f, f)] = std::max(0.5 * s_.at(markerOf[f], markerOf[f]), 0.05);
        }
        for (size_t j = 0; j < p; ++j) {
            const size_t f = itemFactor_[j];
            if (!marker_[j]) x[loadingIndex_[j]] = s_.at(j, markerOf[f]) / x[phiIndex(f, f)];
            x[thetaIndex(j)] = std::max(0.5 * s_.at(j, j), 0.01);
        }
        return x;
    }

    Matrix lambda(const std::vector<double>& x) const {
        Matrix l(itemCount(), m_);
        for (size_t j = 0; j < itemCount(); ++j) {
            l.at(j, itemFactor_[j]) = marker_[j] ? 1.0 : x[loadingIndex_[j]];
        }
        return l;
    }

    Matrix phi(const std::vector<double>& x) const {
        Matrix ph(m_, m_);
        for (size_t f = 0; f < m_; ++f) {
            for (size_t g = 0; g <= f; ++g) {
                ph.at(f, g) = x[phiIndex(f, g)];
                ph.at(g, f) = ph.at(f, g);
            }
        }
        return ph;
    }

    Matrix sigma(const std::vector<double>& x) const {
        const Matrix l = lambda(x);
        Matrix sig = l.multiply(phi(x)).multiply(l.transpose());
        for (size_t j = 0; j < itemCount(); ++j) sig.at(j, j) += x[thetaIndex(j)];
        return sig;
    }

    // ML discrepancy; nullopt when Sigma is not positive definite.
    std::optional<double> objective(const std::vector<double>& x) const {
        const Matrix sig = sigma(x);
        const auto logDet = sig.logDeterminantSPD();
        if (!logDet) return std::nullopt;
        const auto inv = sig.inverse();
        if (!inv) return std::nullopt;
        const double trace = s_.multiply(*inv).trace();
        const double f = *logDet + trace - logDetS_ - static_cast<double>(itemCount());
        if (!std::isfinite(f)) return std::nullopt;
        return f;
    }

    std::optional<std::vector<double>> gradient(const std::vector<double>& x) const {
        const Matrix sig = sigma(x);
        if (!sig.cholesky()) return std::nullopt;
        const auto inv = sig.inverse();
        if (!inv) return std::nullopt;

        const size_t p = itemCount();
        // G = Sigma^-1 - Sigma^-1 S Sigma^-1
        const Matrix sis = inv->multiply(s_).multiply(*inv);
        Matrix g(p, p);
        for (size_t i = 0; i < p; ++i) {
            for (size_t j = 0; j < p; ++j) g.at(i, j) = inv->at(i, j) - sis.at(i, j);
        }

        const Matrix l = lambda(x);
        const Matrix glphi = g.multiply(l).multiply(phi(x));
        const Matrix lgl = l.transpose().multiply(g).multiply(l);

        std::vector<double> grad(parameterCount_, 0.0);
        for (size_t j = 0; j < p; ++j) {
            if (!marker_[j]) grad[loadingIndex_[j]] = 2.0 * glphi.at(j, itemFactor_[j]);
            grad[thetaIndex(j)] = g.at(j, j);
        }
        for (size_t f = 0; f < m_; ++f) {
            for (size_t h = 0; h <= f; ++h) {
                grad[phiIndex(f, h)] = (f == h) ? lgl.at(f, f) : 2.0 * lgl.at(f, h);
            }
        }
        return grad;
    }

private:
    Matrix s_;
    std::vector<size_t> itemFactor_;
    size_t m_;
    double logDetS_;
    std::vector<bool> marker_;
    std::vector<size_t> loadingIndex_;
    size_t loadingCount_ = 0;
    size_t phiOffset_ = 0;
    size_t thetaOffset_ = 0;
    size_t parameterCount_ = 0;
};

double dot(const std::vector<double>& a, const std::vector<double>& b) {
    double s = 0.0;
    for (size_t i = 0; i < a.size(); ++i) s += a[i] * b[i];
    return s;
}

double maxAbs(const std::vector<double>& v) {
    double m = 0.0;
    for (double x : v) m = std::max(m, std::abs(x));
    return m;
}

struct BfgsOutcome {
    std::vector<double> x;
    double f = 0.0;
    size_t iterations = 0;
    bool converged = false;
    bool lineSearchFailed = false;
    double gradientNorm = 0.0;
};

BfgsOutcome minimiseBfgs(const CfaProblem& problem, std::vector<double> x, const CfaOptions& options) {
    BfgsOutcome out;
    const size_t q = x.size();
    const auto f0 = problem.objective(x);
    const auto g0 = problem.gradient(x);
    if (!f0 || !g0) {
        throw Psynet::EstimationException("CFA start values do not give a positive definite implied covariance");
    }
    double f = *f0;
    std::vector<double> g = *g0;

    auto identity = [q]() {
        std::vector<std::vector<double>> h(q, std::vector<double>(q, 0.0));
        for (size_t i = 0; i < q; ++i) h[i][i] = 1.0;
        return h;
    };
    std::vector<std::vector<double>> h = identity();
    bool hIsIdentity = true;
    bool scaled = false;

    for (size_t iter = 0; iter < options.maxIterations; ++iter) {
        out.iterations = iter;
        if (maxAbs(g) < options.tolerance) {
            out.converged = true;
            break;
        }

        std::vector<double> d(q, 0.0);
        for (size_t i = 0; i < q; ++i) {
            for (size_t j = 0; j < q; ++j) d[i] -= h[i][j] * g[j];
        }
        double slope = dot(g, d);
        if (!(slope < 0.0)) {
            h = identity();
            hIsIdentity = true;
            for (size_t i = 0; i < q; ++i) d[i] = -g[i];
            slope = dot(g, d);
        }

        // Cap the trial step so a single move cannot leave the admissible region by far.
        double alpha = std::min(1.0, 1.0 / std::max(maxAbs(d), 1e-12));
        bool accepted = false;
        std::vector<double> xn(q);
        double fn = f;
        for (int k = 0; k < 60; ++k) {
            for (size_t i = 0; i < q; ++i) xn[i] = x[i] + alpha * d[i];
            const auto trial = problem.objective(xn);
            if (trial && *trial <= f + 1e-4 * alpha * slope) {
                fn = *trial;
                accepted = true;
                break;
            }
            alpha *= 0.5;
        }
        if (!accepted) {
            if (!hIsIdentity) {
                h = identity();
                hIsIdentity = true;
                continue;
            }
            out.lineSearchFailed = true;
            break;
        }

        const auto gn = problem.gradient(xn);
        if (!gn) {
            out.lineSearchFailed = true;
            break;
        }
        std::vector<double> s(q), y(q);
        for (size_t i = 0; i < q; ++i) {
            s[i] = xn[i] - x[i];
            y[i] = (*gn)[i] - g[i];
        }
        const double sy = dot(s, y);
        if (sy > 1e-12) {
            if (!scaled) {
                const double yy = dot(y, y);
                const double scale = sy / yy;
                for (size_t i = 0; i < q; ++i) {
                    for (size_t j = 0; j < q; ++j) h[i][j] = (i == j) ? scale : 0.0;
                }
                scaled = true;
            }
            std::vector<double> hy(q, 0.0);
            for (size_t i = 0; i < q; ++i) {
                for (size_t j = 0; j < q; ++j) hy[i] += h[i][j] * y[j];
            }
            const double yhy = dot(y, hy);
            const double a = (sy + yhy) / (sy * sy);
            for (size_t i = 0; i < q; ++i) {
                for (size_t j = 0; j < q; ++j) {
                    h[i][j] += a * s[i] * s[j] - (hy[i] * s[j] + s[i] * hy[j]) / sy;
                }
            }
            hIsIdentity = false;
        }

        x = std::move(xn);
        f = fn;
        g = *gn;
        out.iterations = iter + 1;
    }
    if (!out.converged && maxAbs(g) < options.tolerance) out.converged = true;

    out.x = std::move(x);
    out.f = f;
    out.gradientNorm = maxAbs(g);
    return out;
}

// Observed information from central differences of the analytic gradient.
std::optional<Matrix> numericHessian(const CfaProblem& problem, const std::vector<double>& x) {
    const size_t q = x.size();
    Matrix hess(q, q);
    for (size_t i = 0; i < q; ++i) {
        const double step = 1e-5 * std::max(1.0, std::abs(x[i]));
        std::vector<double> xp = x;
        std::vector<double> xm = x;
        xp[i] += step;
        xm[i] -= step;
        const auto gp = problem.gradient(xp);
        const auto gm = problem.gradient(xm);
        if (!gp || !gm) return std::nullopt;
        for (size_t j = 0; j < q; ++j) hess.at(i, j) = ((*gp)[j] - (*gm)[j]) / (2.0 * step);
    }
    for (size_t i = 0; i < q; ++i) {
        for (size_t j = i + 1; j < q; ++j) {
            const double avg = 0.5 * (hess.at(i, j) + hess.at(j, i));
            hess.at(i, j) = avg;
            hess.at(j, i) = avg;
        }
    }
    return hess;
}
} // namespace

void FactorAnalysis::comparativeFit(CfaFitIndices& fit, size_t sampleSize) {
    const double excess = std::max(fit.chiSquare - fit.df, 0.0);
    const double baseExcess = std::max(fit.baselineChiSquare - fit.baselineDf, 0.0);
    const double cfiDenom = std::max(excess, baseExcess);
    fit.cfi = cfiDenom > 0.0 ? 1.0 - excess / cfiDenom : 1.0;

    if (fit.df > 0 && fit.baselineDf > 0) {
        // Undefined when the baseline chi-square equals its df.
        const double baseRatio = fit.baselineChiSquare / fit.baselineDf;
        const double denom = baseRatio - 1.0;
        fit.tli = std::abs(denom) > 1e-12 ? (baseRatio - fit.chiSquare / fit.df) / denom : kNaN;
        fit.rmsea = sampleSize > 0 ? std::sqrt(excess / (static_cast<double>(fit.df) * static_cast<double>(sampleSize)))
                                   : kNaN;
    } else if (fit.df == 0) {
        fit.tli = 1.0;
        fit.rmsea = 0.0;
    } else {
        fit.tli = kNaN;
        fit.rmsea = kNaN;
    }
}

CfaResult FactorAnalysis::fit(const ObservationMatrix& data, const FactorModelSpec& spec, const CfaOptions& options) {
    spec.validate();

    CfaResult res;
    for (const auto& f : spec.factors) res.factors.push_back(f.name);
    res.items = spec.allItems();
    const size_t p = res.items.size();
    const size_t m = res.factors.size();

    std::unordered_map<std::string, size_t> columnOf;
    for (size_t c = 0; c < data.itemCount(); ++c) columnOf[data.items[c]] = c;

    ObservationMatrix modelData;
    modelData.items = res.items;
    for (size_t fi = 0; fi < m; ++fi) {
        for (const auto& item : spec.factors[fi].items) {
            const auto it = columnOf.find(item);
            if (it == columnOf.end()) throw Psynet::DatasetException("Factor model item not in data: " + item);
            modelData.columns.push_back(data.columns[it->second]);
            res.itemFactor.push_back(fi);
        }
    }

    const auto flat = CorrelationEngine::zeroVarianceItems(modelData);
    if (!flat.empty()) {
        throw Psynet::EstimationException("Zero-variance items in factor model: " + CommonUtils::joinList(flat));
    }

    const size_t n = modelData.rowCount();
    res.sampleSize = n;
    const Matrix s(CorrelationEngine::calculateCovarianceMatrix(modelData, false));
    const auto logDetS = s.logDeterminantSPD();
    if (!logDetS) throw Psynet::EstimationException("Sample covariance matrix of the factor model items is singular");

    const CfaProblem problem(s, res.itemFactor, m, *logDetS);
    const BfgsOutcome opt = minimiseBfgs(problem, problem.startValues(), options);
    const std::vector<double>& x = opt.x;
    res.iterations = opt.iterations;
    res.converged = opt.converged;
    res.minimumDiscrepancy = opt.f;

    if (!opt.converged) {
        res.warnings.push_back("Optimizer did not converge after " + std::to_string(opt.iterations) +
                               " iterations (max |gradient| = " + CommonUtils::toFixed(opt.gradientNorm, 6) +
                               (opt.lineSearchFailed ? ", line search failed" : "") +
                               "); estimates are approximate");
    }

    const Matrix phi = problem.phi(x);
    const Matrix sigma = problem.sigma(x);
    res.factorCovariance = phi.data;
    res.factorCorrelation.assign(m, std::vector<double>(m, 0.0));
    for (size_t f = 0; f < m; ++f) {
        for (size_t g = 0; g < m; ++g) {
            const double denom = std::sqrt(phi.at(f, f) * phi.at(g, g));
            res.factorCorrelation[f][g] = (denom > 0.0) ? phi.at(f, g) / denom : kNaN;
        }
    }

    for (size_t j = 0; j < p; ++j) {
        const size_t f = res.itemFactor[j];
        const double l = problem.isMarker(j) ? 1.0 : x[problem.loadingIndex(j)];
        res.loadings.push_back(l);
        const double sdF = phi.at(f, f) > 0.0 ? std::sqrt(phi.at(f, f)) : kNaN;
        res.standardizedLoadings.push_back(l * sdF / std::sqrt(sigma.at(j, j)));
        res.residualVariances.push_back(x[problem.thetaIndex(j)]);
    }

    // Fit statistics.
    const double nd = static_cast<double>(n);
    const size_t q = problem.parameterCount();
    const int moments = static_cast<int>(p * (p + 1) / 2);
    CfaFitIndices& fit = res.fit;
    fit.freeParameters = q;
    fit.df = moments - static_cast<int>(q);
    fit.chiSquare = nd * opt.f;
    fit.pValue = fit.df > 0 ? MathUtils::chiSquareSurvival(fit.chiSquare, fit.df) : kNaN;

    double baselineF = -*logDetS;
    for (size_t j = 0; j < p; ++j) baselineF += std::log(s.at(j, j));
    fit.baselineChiSquare = nd * baselineF;
    fit.baselineDf = static_cast<int>(p * (p - 1) / 2);

    comparativeFit(fit, n);

    double srmrSum = 0.0;
    for (size_t i = 0; i < p; ++i) {
        for (size_t j = 0; j <= i; ++j) {
            const double observed = s.at(i, j) / std::sqrt(s.at(i, i) * s.at(j, j));
            const double implied = sigma.at(i, j) / std::sqrt(sigma.at(i, i) * sigma.at(j, j));
            srmrSum += (observed - implied) * (observed - implied);
        }
    }
    fit.srmr = std::sqrt(srmrSum / static_cast<double>(moments));

    const auto logDetSigma = sigma.logDeterminantSPD();
    const auto sigmaInv = sigma.inverse();
    if (logDetSigma && sigmaInv) {
        const double tr = s.multiply(*sigmaInv).trace();
        fit.logLikelihood = -nd / 2.0 * (static_cast<double>(p) * std::log(2.0 * M_PI) + *logDetSigma + tr);
    } else {
        fit.logLikelihood = kNaN;
    }
    fit.aic = -2.0 * fit.logLikelihood + 2.0 * static_cast<double>(q);
    fit.bic = -2.0 * fit.logLikelihood + static_cast<double>(q) * std::log(nd);

    if (fit.df < 0) res.warnings.push_back("Model is not identified: df = " + std::to_string(fit.df));

    // Standard errors.
    std::vector<double> se(q, kNaN);
    const auto hess = numericHessian(problem, x);
    std::optional<Matrix> hessInv;
    if (hess) hessInv = hess->inverse();
    if (!hessInv) {
        res.warnings.push_back("Information matrix is singular; standard errors are unavailable");
    } else {
        bool negative = false;
        for (size_t i = 0; i < q; ++i) {
            const double v = hessInv->at(i, i) * 2.0 / nd;
            if (v > 0.0) {
                se[i] = std::sqrt(v);
            } else {
                negative = true;
            }
        }
        if (negative) res.warnings.push_back("Some sampling variances are not positive; their standard errors are NA");
    }

    auto addParameter = [&](const std::string& lhs, const std::string& op, const std::string& rhs, double est,
                            size_t idx, double standardized) {
        CfaParameter par;
        par.lhs = lhs;
        par.op = op;
        par.rhs = rhs;
        par.estimate = est;
        par.standardized = standardized;
        par.free = idx != CfaProblem::npos;
        par.se = par.free ? se[idx] : kNaN;
        par.z = (par.free && se[idx] > 0.0) ? est / se[idx] : kNaN;
        par.pValue = std::isfinite(par.z) ? 2.0 * (1.0 - MathUtils::normalCdf(std::abs(par.z))) : kNaN;
        res.parameters.push_back(par);
    };

    for (size_t j = 0; j < p; ++j) {
        const size_t idx = problem.isMarker(j) ? CfaProblem::npos : problem.loadingIndex(j);
        addParameter(res.factors[res.itemFactor[j]], "=~", res.items[j], res.loadings[j], idx,
                     res.standardizedLoadings[j]);
    }
    for (size_t j = 0; j < p; ++j) {
        addParameter(res.items[j], "~~", res.items[j], res.residualVariances[j], problem.thetaIndex(j),
                     res.residualVariances[j] / sigma.at(j, j));
    }
    for (size_t f = 0; f < m; ++f) {
        for (size_t g = f; g < m; ++g) {
            addParameter(res.factors[f], "~~", res.factors[g], phi.at(f, g), problem.phiIndex(f, g),
                         f == g ? 1.0 : res.factorCorrelation[f][g]);
        }
    }

    // Heywood cases.
    for (size_t j = 0; j < p; ++j) {
        if (res.residualVariances[j] < 0.0) {
            res.warnings.push_back("Negative residual variance for " + res.items[j] + " (Heywood case)");
        } else if (std::abs(res.standardizedLoadings[j]) > 1.0) {
            res.warnings.push_back("Standardized loading of " + res.items[j] + " exceeds 1");
        }
    }
    for (size_t f = 0; f < m; ++f) {
        if (!(phi.at(f, f) > 0.0)) {
            res.warnings.push_back("Non-positive variance for factor " + res.factors[f]);
        }
    }
    return res;
}
