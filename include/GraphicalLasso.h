#pragma once
#include "NetworkGraph.h"

#include <cstddef>
#include <vector>

struct GlassoFit {
    WeightMatrix precision;
    WeightMatrix covariance;
    double lambda = 0.0;
    size_t iterations = 0;
    bool converged = false;
};

struct EbicSelection {
    GlassoFit fit;
    double ebic = 0.0;
    size_t edgeCount = 0;
    size_t lambdaIndex = 0;
    bool converged = false;  // of the selected fit
    size_t iterations = 0;
    std::vector<double> lambdaPath;
    std::vector<double> ebicPath; // +inf where the fit failed
};

class GraphicalLasso {
public:
    /**
     * @brief Block coordinate descent graphical lasso (diagonal unpenalised).
     * @param warmStart optional covariance estimate from a neighbouring lambda.
     * @throws Psynet::EstimationException when the input is not a symmetric
     * matrix with a positive diagonal.
     */
    static GlassoFit fit(const WeightMatrix& s,
                         double lambda,
                         double tolerance = 1e-4,
                         size_t maxIterations = 10000,
                         const WeightMatrix* warmStart = nullptr);

    // Log-spaced path from max |s_ij| down to minRatio * max.
    static std::vector<double> lambdaPath(const WeightMatrix& s, size_t count = 100, double minRatio = 0.01);

    /**
     * @brief Extended BIC: -2 logLik + E log n + 4 E gamma log p.
     */
    static double ebic(const WeightMatrix& s, const WeightMatrix& precision, size_t n, double gamma);

    /**
     * @brief Fits the whole lambda path and keeps the fit with the lowest EBIC.
     * @details A selected fit that ran out of iterations is still returned,
     * with `converged` false.
     * @throws Psynet::EstimationException when no lambda yields a valid fit.
     */
    static EbicSelection selectByEbic(const WeightMatrix& s,
                                      size_t n,
                                      double gamma = 0.5,
                                      size_t lambdaCount = 100,
                                      double minRatio = 0.01,
                                      double tolerance = 1e-4,
                                      size_t maxIterations = 10000);
};
