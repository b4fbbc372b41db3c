#pragma once
#include "ItemDataset.h"
#include "NetworkGraph.h"

#include <string>
#include <vector>

struct CorrelationResult {
    std::string item1;
    std::string item2;
    double r;
    double p_value;
    bool is_significant;
};

class CorrelationEngine {
public:
    /**
     * @brief Sample covariance matrix of the item columns.
     * @param unbiased true for divisor n - 1, false for the ML divisor n.
     * @throws Psynet::EstimationException when fewer than two rows are present.
     */
    static WeightMatrix calculateCovarianceMatrix(const ObservationMatrix& data, bool unbiased = true);

    /**
     * @brief Pearson correlation matrix with unit diagonal.
     * @throws Psynet::EstimationException naming every zero-variance item.
     */
    static WeightMatrix calculateCorrelationMatrix(const ObservationMatrix& data);

    static std::vector<std::string> zeroVarianceItems(const ObservationMatrix& data);

    // Two-tailed p-values for every off-diagonal cell; df = n - 2 - controls.
    static WeightMatrix calculatePValueMatrix(const WeightMatrix& r, size_t n, size_t controls = 0);

    // Largest |r| pairs first, for the report table.
    static std::vector<CorrelationResult> strongestCorrelations(const ObservationMatrix& data,
                                                                const WeightMatrix& matrix,
                                                                size_t topK = 10);
};
