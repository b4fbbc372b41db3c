#include "Bootstrapper.h"
#include "CommonUtils.h"
#include "PsynetExceptions.h"
#include <algorithm>
#include <cmath>
#include <exception>
#include <optional>
#include <random>
#ifdef USE_OPENMP
#include <omp.h>
#endif

std::string BootstrapResult::yieldText() const {
    return std::to_string(succeeded) + "/" + std::to_string(requested) + " resamples converged";
}

const char* BootstrapResult::scopeNote() {
    return "Bootstrapped intervals are reported for edge weights only. Centrality indices are not bootstrapped: "
           "most are bounded below by zero through absolute values, so ordinary bootstrap intervals are not valid for them.";
}

std::vector<size_t> Bootstrapper::resampleRows(size_t rowCount, uint64_t seed, size_t index) {
    std::seed_seq seq{static_cast<uint32_t>(seed & 0xffffffffu), static_cast<uint32_t>(seed >> 32),
                      static_cast<uint32_t>(index & 0xffffffffu), static_cast<uint32_t>(index >> 32)};
    std::mt19937_64 rng(seq);
    std::vector<size_t> rows(rowCount, 0);
    if (rowCount == 0) return rows;
    std::uniform_int_distribution<size_t> pick(0, rowCount - 1);
    for (size_t& r : rows) r = pick(rng);
    return rows;
}

BootstrapResult Bootstrapper::run(const ObservationMatrix& data, const BootstrapOptions& options) {
    if (options.samples == 0) throw Psynet::ConfigurationException("bootstrap_samples must be positive");
    if (!(options.ciLevel > 0.0 && options.ciLevel < 1.0)) {
        throw Psynet::ConfigurationException("ci_level must lie in (0, 1)");
    }

    BootstrapResult res;
    res.requested = options.samples;
    res.ciLevel = options.ciLevel;
    const NetworkEstimateFn estimate = options.estimator ? options.estimator : NetworkEstimateFn(NetworkEstimator::estimate);
    res.sample = estimate(data, options.network);

    const size_t p = data.itemCount();
    const size_t n = data.rowCount();
    const size_t pairs = p * (p - 1) / 2;
    const long long total = static_cast<long long>(options.samples);

    // One slot per resample: upper-triangle weights on success, the error message on failure.
    std::vector<std::optional<std::vector<double>>> slots(options.samples);
    std::vector<std::string> errors(options.samples);

    #ifdef USE_OPENMP
    const int threads = options.workers > 0 ? options.workers : omp_get_max_threads();
    #pragma omp parallel for schedule(dynamic) num_threads(threads)
    #endif
    for (long long b = 0; b < total; ++b) {
        const size_t idx = static_cast<size_t>(b);
        try {
            const ObservationMatrix resample = data.selectRows(resampleRows(n, options.seed, idx));
            const NetworkModel model = estimate(resample, options.network);
            std::vector<double> upper;
            upper.reserve(pairs);
            for (size_t i = 0; i < p; ++i) {
                for (size_t j = i + 1; j < p; ++j) upper.push_back(model.weights[i][j]);
            }
            slots[idx] = std::move(upper);
        } catch (const std::exception& e) {
            // Nothing may leave the parallel region.
            errors[idx] = e.what();
        }
    }

    std::vector<const std::vector<double>*> good;
    for (size_t b = 0; b < options.samples; ++b) {
        if (slots[b]) {
            good.push_back(&*slots[b]);
        } else {
            res.failures.push_back({b, errors[b]});
        }
    }
    res.succeeded = good.size();
    if (good.empty()) {
        throw Psynet::EstimationException("All " + std::to_string(options.samples) + " bootstrap resamples failed; first error: " +
                                          (res.failures.empty() ? std::string("unknown") : res.failures.front().message));
    }

    const double tail = (1.0 - options.ciLevel) / 2.0;
    res.edges.reserve(pairs);
    std::vector<double> values(good.size());
    size_t k = 0;
    for (size_t i = 0; i < p; ++i) {
        for (size_t j = i + 1; j < p; ++j, ++k) {
            EdgeSummary e;
            e.from = i;
            e.to = j;
            e.sampleWeight = res.sample.weights[i][j];

            double sum = 0.0;
            size_t nonzero = 0;
            for (size_t b = 0; b < good.size(); ++b) {
                values[b] = (*good[b])[k];
                sum += values[b];
                if (values[b] != 0.0) ++nonzero;
            }
            const double count = static_cast<double>(good.size());
            e.mean = sum / count;
            double ss = 0.0;
            for (double v : values) ss += (v - e.mean) * (v - e.mean);
            e.sd = good.size() > 1 ? std::sqrt(ss / (count - 1.0)) : 0.0;
            e.lower = CommonUtils::quantileByNth(values, tail);
            e.upper = CommonUtils::quantileByNth(values, 1.0 - tail);
            e.inclusion = static_cast<double>(nonzero) / count;
            res.edges.push_back(e);
        }
    }
    return res;
}
