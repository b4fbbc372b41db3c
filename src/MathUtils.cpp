#include "MathUtils.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
constexpr double kNearOneCorrelationThreshold = 0.9999999;
constexpr double kVeryLargeTStatisticCutoff = 1e10;

struct RuntimeConfig {
    double significanceAlpha = 0.05;
    double numericEpsilon = 1e-12;
};

// Written once from the main thread before any parallel section reads it.
RuntimeConfig& runtimeConfig() {
    static RuntimeConfig cfg;
    return cfg;
}

double clamp01(double v) {
    return std::min(1.0, std::max(0.0, v));
}

// Continued fraction for I_x(a, b), modified Lentz. Converges for x < (a + 1) / (a + b + 2).
double betaContinuedFraction(double a, double b, double x) {
    const int maxIter = std::clamp<int>(400 + static_cast<int>(std::ceil((a + b) * 0.75)), 400, 2000);
    constexpr double eps = 3e-14;
    constexpr double tiny = 1e-300;

    double c = 1.0;
    double d = 1.0 - (a + b) * x / (a + 1.0);
    if (std::abs(d) < tiny) d = tiny;
    d = 1.0 / d;
    double f = d;
    auto step = [&](double coeff) {
        d = 1.0 + coeff * d;
        if (std::abs(d) < tiny) d = tiny;
        c = 1.0 + coeff / c;
        if (std::abs(c) < tiny) c = tiny;
        d = 1.0 / d;
        return c * d;
    };

    for (int m = 1; m <= maxIter; ++m) {
        const double md = static_cast<double>(m);
        const double even = md * (b - md) * x / ((a + 2.0 * md - 1.0) * (a + 2.0 * md));
        f *= step(even);
        const double odd = -(a + md) * (a + b + md) * x / ((a + 2.0 * md) * (a + 2.0 * md + 1.0));
        const double delta = step(odd);
        f *= delta;
        if (std::abs(delta - 1.0) <= eps) break;
    }
    return f;
}

// Regularized incomplete beta I_x(a, b).
double betainc(double a, double b, double x) {
    if (!(a > 0.0) || !(b > 0.0) || !std::isfinite(a) || !std::isfinite(b)) return NAN;
    if (x < 0.0 || x > 1.0) return NAN;
    if (x == 0.0 || x == 1.0) return x;

    const double logFront = a * std::log(x) + b * std::log1p(-x) -
                            (std::lgamma(a) + std::lgamma(b) - std::lgamma(a + b));
    const double front = std::exp(logFront);
    if (x < (a + 1.0) / (a + b + 2.0)) return clamp01(front * betaContinuedFraction(a, b, x) / a);
    return clamp01(1.0 - front * betaContinuedFraction(b, a, 1.0 - x) / b);
}

// Regularized upper incomplete gamma Q(a, x): series below a+1, continued fraction above.
double gammaUpperRegularized(double a, double x) {
    if (x <= 0.0) return 1.0;
    if (a <= 0.0 || !std::isfinite(a)) return NAN;
    if (!std::isfinite(x)) return 0.0;

    constexpr int maxIter = 1000;
    constexpr double eps = 3e-14;
    constexpr double fpmin = 1e-300;
    const double gln = std::lgamma(a);

    if (x < a + 1.0) {
        double ap = a;
        double sum = 1.0 / a;
        double del = sum;
        for (int n = 1; n <= maxIter; ++n) {
            ap += 1.0;
            del *= x / ap;
            sum += del;
            if (std::abs(del) < std::abs(sum) * eps) break;
        }
        const double p = sum * std::exp(-x + a * std::log(x) - gln);
        return clamp01(1.0 - p);
    }

    double b = x + 1.0 - a;
    double c = 1.0 / fpmin;
    double d = 1.0 / b;
    double h = d;
    for (int i = 1; i <= maxIter; ++i) {
        const double an = -static_cast<double>(i) * (static_cast<double>(i) - a);
        b += 2.0;
        d = an * d + b;
        if (std::abs(d) < fpmin) d = fpmin;
        c = b + an / c;
        if (std::abs(c) < fpmin) c = fpmin;
        d = 1.0 / d;
        const double del = d * c;
        h *= del;
        if (std::abs(del - 1.0) < eps) break;
    }
    return clamp01(std::exp(-x + a * std::log(x) - gln) * h);
}

// Two-tailed p-value from t-statistic using analytical beta distribution
double pvalueFromT(double t, size_t df) {
    if (df == 0) return 1.0;
    const double nu = static_cast<double>(df);
    const double tAbs = std::abs(t);

    if (!std::isfinite(tAbs) || tAbs > kVeryLargeTStatisticCutoff) return 0.0;

    const double x = nu / (nu + tAbs * tAbs);
    return betainc(nu / 2.0, 0.5, x);
}
} // namespace

double MathUtils::getPValueFromT(double t, size_t df) {
    return pvalueFromT(t, df);
}

double MathUtils::chiSquareSurvival(double x, double df) {
    if (df <= 0.0) return NAN;
    if (!std::isfinite(x)) return (x > 0.0) ? 0.0 : 1.0;
    return gammaUpperRegularized(df / 2.0, x / 2.0);
}

double MathUtils::normalCdf(double z) {
    return 0.5 * std::erfc(-z / std::sqrt(2.0));
}

double MathUtils::normalQuantile(double p) {
    if (!(p > 0.0 && p < 1.0)) {
        if (p == 0.0) return -std::numeric_limits<double>::infinity();
        if (p == 1.0) return std::numeric_limits<double>::infinity();
        return NAN;
    }

    static const double a[] = {-3.969683028665376e+01, 2.209460984245205e+02, -2.759285104469687e+02,
                               1.383577518672690e+02, -3.066479806614716e+01, 2.506628277459239e+00};
    static const double b[] = {-5.447609879822406e+01, 1.615858368580409e+02, -1.556989798598866e+02,
                               6.680131188771972e+01, -1.328068155288572e+01};
    static const double c[] = {-7.784894002430293e-03, -3.223964580411365e-01, -2.400758277161838e+00,
                               -2.549732539343734e+00, 4.374664141464968e+00, 2.938163982698783e+00};
    static const double d[] = {7.784695709041462e-03, 3.224671290700398e-01, 2.445134137142996e+00,
                               3.754408661907416e+00};
    constexpr double pLow = 0.02425;

    double x = 0.0;
    if (p < pLow) {
        const double q = std::sqrt(-2.0 * std::log(p));
        x = (((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
            ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
    } else if (p <= 1.0 - pLow) {
        const double q = p - 0.5;
        const double r = q * q;
        x = (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r + a[5]) * q /
            (((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0);
    } else {
        const double q = std::sqrt(-2.0 * std::log(1.0 - p));
        x = -(((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
            ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
    }

    // One Halley refinement step against the erfc-based CDF.
    const double e = normalCdf(x) - p;
    const double u = e * std::sqrt(2.0 * M_PI) * std::exp(x * x / 2.0);
    return x - u / (1.0 + x * u / 2.0);
}

void MathUtils::setSignificanceAlpha(double alpha) {
    if (alpha > 0.0 && alpha < 1.0) {
        runtimeConfig().significanceAlpha = alpha;
    }
}

double MathUtils::getSignificanceAlpha() noexcept {
    return runtimeConfig().significanceAlpha;
}

double MathUtils::numericEpsilon() noexcept {
    return runtimeConfig().numericEpsilon;
}

void MathUtils::setNumericEpsilon(double epsilon) {
    if (epsilon > 0.0 && std::isfinite(epsilon)) runtimeConfig().numericEpsilon = epsilon;
}

Significance MathUtils::calculateSignificance(double r, size_t n, size_t controls) {
    Significance sig{0.0, 1.0, false};
    if (n <= 2 + controls) return sig;

    // Avoid division by zero if correlation is effectively perfect.
    if (std::abs(r) >= kNearOneCorrelationThreshold) {
        sig.p_value = 0.0;
        sig.t_stat = (r > 0 ? std::numeric_limits<double>::infinity() : -std::numeric_limits<double>::infinity());
        sig.is_significant = true;
        return sig;
    }

    const size_t df = n - 2 - controls;
    sig.t_stat = r * std::sqrt(static_cast<double>(df) / (1.0 - r * r));
    sig.p_value = getPValueFromT(sig.t_stat, df);
    sig.is_significant = (sig.p_value < runtimeConfig().significanceAlpha);

    return sig;
}

MathUtils::Matrix::Matrix(const std::vector<std::vector<double>>& nested)
    : rows(nested.size()), cols(nested.empty() ? 0 : nested.front().size()), data(nested) {
    for (const auto& row : data) {
        if (row.size() != cols) throw std::invalid_argument("Ragged nested vector cannot form a matrix.");
    }
}

MathUtils::Matrix MathUtils::Matrix::identity(size_t n) {
    Matrix res(n, n);
    for (size_t i = 0; i < n; ++i) res.at(i, i) = 1.0;
    return res;
}

MathUtils::Matrix MathUtils::Matrix::transpose() const {
    Matrix result(cols, rows);
    for (size_t r = 0; r < rows; ++r) {
        for (size_t c = 0; c < cols; ++c) {
            result.at(c, r) = at(r, c);
        }
    }
    return result;
}

MathUtils::Matrix MathUtils::Matrix::multiply(const Matrix& other) const {
    if (cols != other.rows) throw std::invalid_argument("Matrix dimensions mismatch for multiplication.");
    Matrix result(rows, other.cols);
    Matrix otherT = other.transpose();

    for (size_t r = 0; r < rows; ++r) {
        const auto& leftRow = data[r];
        auto& outRow = result.data[r];
        for (size_t c = 0; c < other.cols; ++c) {
            const auto& rightRow = otherT.data[c];
            double sum = 0.0;
            #ifdef USE_OPENMP
            #pragma omp simd reduction(+:sum)
            #endif
            for (size_t k = 0; k < cols; ++k) {
                sum += leftRow[k] * rightRow[k];
            }
            outRow[c] = sum;
        }
    }
    return result;
}

std::optional<MathUtils::Matrix> MathUtils::Matrix::inverse() const {
    if (rows != cols) throw std::invalid_argument("Only square matrices can be inverted.");
    const size_t n = rows;
    if (n == 0) return Matrix(0, 0);

    // Augmented [A | I]; the right half becomes A^-1.
    std::vector<std::vector<double>> aug(n, std::vector<double>(2 * n, 0.0));
    double scale = 0.0;
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < n; ++j) {
            const double v = at(i, j);
            if (!std::isfinite(v)) return std::nullopt;
            aug[i][j] = v;
            scale = std::max(scale, std::abs(v));
        }
        aug[i][n + i] = 1.0;
    }
    const double eps = runtimeConfig().numericEpsilon;
    if (scale <= eps) return std::nullopt;
    const double pivotTolerance = std::max(eps, std::numeric_limits<double>::epsilon() * scale * static_cast<double>(n));

    for (size_t col = 0; col < n; ++col) {
        size_t pivot = col;
        for (size_t r = col + 1; r < n; ++r) {
            if (std::abs(aug[r][col]) > std::abs(aug[pivot][col])) pivot = r;
        }
        if (std::abs(aug[pivot][col]) <= pivotTolerance) return std::nullopt;
        std::swap(aug[col], aug[pivot]);

        std::vector<double>& pivotRow = aug[col];
        const double inv = 1.0 / pivotRow[col];
        for (double& v : pivotRow) v *= inv;

        for (size_t r = 0; r < n; ++r) {
            if (r == col) continue;
            const double factor = aug[r][col];
            if (factor == 0.0) continue;
            for (size_t c = col; c < 2 * n; ++c) aug[r][c] -= factor * pivotRow[c];
        }
    }

    Matrix result(n, n);
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < n; ++j) {
            const double v = aug[i][n + j];
            if (!std::isfinite(v)) return std::nullopt;
            result.at(i, j) = v;
        }
    }
    return result;
}

std::optional<MathUtils::Matrix> MathUtils::Matrix::cholesky() const {
    if (rows != cols) return std::nullopt;
    const size_t n = rows;
    Matrix L(n, n);
    for (size_t j = 0; j < n; ++j) {
        double diag = at(j, j);
        for (size_t k = 0; k < j; ++k) diag -= L.at(j, k) * L.at(j, k);
        if (!(diag > 0.0) || !std::isfinite(diag)) return std::nullopt;
        const double ljj = std::sqrt(diag);
        L.at(j, j) = ljj;
        for (size_t i = j + 1; i < n; ++i) {
            double s = at(i, j);
            for (size_t k = 0; k < j; ++k) s -= L.at(i, k) * L.at(j, k);
            L.at(i, j) = s / ljj;
        }
    }
    return L;
}

std::optional<double> MathUtils::Matrix::logDeterminantSPD() const {
    const auto L = cholesky();
    if (!L) return std::nullopt;
    double logDet = 0.0;
    for (size_t i = 0; i < rows; ++i) logDet += 2.0 * std::log(L->at(i, i));
    return logDet;
}

double MathUtils::Matrix::trace() const {
    double t = 0.0;
    for (size_t i = 0; i < std::min(rows, cols); ++i) t += at(i, i);
    return t;
}

bool MathUtils::Matrix::isSymmetric(double tol) const {
    if (rows != cols) return false;
    for (size_t i = 0; i < rows; ++i) {
        for (size_t j = i + 1; j < cols; ++j) {
            if (std::abs(at(i, j) - at(j, i)) > tol) return false;
        }
    }
    return true;
}
