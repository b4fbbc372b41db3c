#pragma once
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

struct Significance {
    double t_stat;
    double p_value;
    bool is_significant; // Checked against MathUtils::getSignificanceAlpha()
};

class MathUtils {
public:
    static void setSignificanceAlpha(double alpha);
    static double getSignificanceAlpha() noexcept;
    // Scale below which variances and pivots count as zero.
    static void setNumericEpsilon(double epsilon);
    static double numericEpsilon() noexcept;

    /**
     * @brief t-test significance for a (partial) correlation coefficient.
     * @param controls number of variables partialled out; df = n - 2 - controls.
     * @post Returns non-significant result when df <= 0.
     */
    static Significance calculateSignificance(double r, size_t n, size_t controls = 0);

    /**
     * @brief Two-tailed p-value from t-statistic and degrees of freedom.
     */
    static double getPValueFromT(double t, size_t df);

    /**
     * @brief Upper tail P(X > x) of a chi-square distribution with df degrees of freedom.
     */
    static double chiSquareSurvival(double x, double df);

    static double normalCdf(double z);

    /**
     * @brief Inverse standard normal CDF (Acklam's rational approximation, one Newton step).
     * @pre 0 < p < 1.
     */
    static double normalQuantile(double p);

    // Dense row-major matrix used by the estimators.
    struct Matrix {
        size_t rows;
        size_t cols;
        std::vector<std::vector<double>> data;

        Matrix(size_t r, size_t c) : rows(r), cols(c), data(r, std::vector<double>(c, 0.0)) {}
        explicit Matrix(const std::vector<std::vector<double>>& nested);

        double& at(size_t r, size_t c) { return data[r][c]; }
        double at(size_t r, size_t c) const { return data[r][c]; }

        static Matrix identity(size_t n);
        Matrix transpose() const;

        /**
         * @brief Matrix multiplication this * other.
         * @throws std::invalid_argument on shape mismatch.
         */
        Matrix multiply(const Matrix& other) const;

        /**
         * @brief Inverts a square matrix by Gauss-Jordan elimination on [A | I] with partial pivoting.
         * @post Returns std::nullopt for singular/near-singular matrices.
         * @throws std::invalid_argument when matrix is not square.
         */
        std::optional<Matrix> inverse() const;

        /**
         * @brief Lower Cholesky factor L with this = L * L^T.
         * @post Returns std::nullopt when the matrix is not symmetric positive definite.
         */
        std::optional<Matrix> cholesky() const;

        /**
         * @brief log(det) of a symmetric positive definite matrix via Cholesky.
         */
        std::optional<double> logDeterminantSPD() const;

        double trace() const;
        bool isSymmetric(double tol) const;
    };
};
