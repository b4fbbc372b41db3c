#pragma once
#include "ItemDataset.h"
#include "NetworkEstimator.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

using NetworkEstimateFn = std::function<NetworkModel(const ObservationMatrix&, const NetworkOptions&)>;

struct BootstrapOptions {
    size_t samples = 1000;
    int workers = 0; // 0 = OpenMP default
    uint64_t seed = 1337;
    double ciLevel = 0.95;
    NetworkOptions network;
    // Replaces NetworkEstimator::estimate for the sample and every resample when set.
    NetworkEstimateFn estimator;
};

struct BootstrapFailure {
    size_t index;
    std::string message;
};

struct EdgeSummary {
    size_t from = 0;
    size_t to = 0;
    double sampleWeight = 0.0;
    double mean = 0.0;
    double sd = 0.0;
    double lower = 0.0;
    double upper = 0.0;
    double inclusion = 0.0; // share of resamples with a nonzero edge
};

struct BootstrapResult {
    NetworkModel sample;
    std::vector<EdgeSummary> edges; // every unordered pair i < j
    size_t requested = 0;
    size_t succeeded = 0;
    std::vector<BootstrapFailure> failures;
    double ciLevel = 0.95;

    std::string yieldText() const;
    static const char* scopeNote();
};

class Bootstrapper {
public:
    /**
     * @brief Nonparametric case bootstrap of the edge weights.
     * @details Resample b uses its own generator seeded from (seed, b), so the
     * result does not depend on the number of workers. Failed resamples are
     * recorded and excluded from the summaries.
     * @throws Psynet::EstimationException when the sample network cannot be
     * estimated or every resample fails.
     */
    static BootstrapResult run(const ObservationMatrix& data, const BootstrapOptions& options);

    // Row indices drawn with replacement for resample `index`.
    static std::vector<size_t> resampleRows(size_t rowCount, uint64_t seed, size_t index);
};
