#include "Statistics.h"

#include <algorithm>
#include <cmath>
#include <iterator>

ColumnStats Statistics::calculateStats(const std::vector<double>& col) {
    ColumnStats stats;
    std::vector<double> sorted;
    sorted.reserve(col.size());
    std::copy_if(col.begin(), col.end(), std::back_inserter(sorted), [](double v) { return std::isfinite(v); });
    if (sorted.empty()) return stats;
    std::sort(sorted.begin(), sorted.end());

    const size_t n = sorted.size();
    const double nd = static_cast<double>(n);
    stats.count = n;
    stats.min = sorted.front();
    stats.max = sorted.back();
    stats.median = (n % 2 == 1) ? sorted[n / 2] : 0.5 * (sorted[n / 2 - 1] + sorted[n / 2]);

    double sum = 0.0;
    for (double v : sorted) sum += v;
    stats.mean = sum / nd;

    double m2 = 0.0;
    double m3 = 0.0;
    double m4 = 0.0;
    for (double v : sorted) {
        const double d = v - stats.mean;
        const double d2 = d * d;
        m2 += d2;
        m3 += d2 * d;
        m4 += d2 * d2;
    }
    if (n < 2) return stats;
    stats.variance = m2 / (nd - 1.0);
    stats.stddev = std::sqrt(stats.variance);
    if (!(stats.stddev > 0.0)) return stats;

    const double s2 = stats.variance;
    if (n > 2) stats.skewness = nd / ((nd - 1.0) * (nd - 2.0)) * m3 / (s2 * stats.stddev);
    if (n > 3) {
        const double a = nd * (nd + 1.0) / ((nd - 1.0) * (nd - 2.0) * (nd - 3.0));
        const double b = 3.0 * (nd - 1.0) * (nd - 1.0) / ((nd - 2.0) * (nd - 3.0));
        stats.kurtosis = a * m4 / (s2 * s2) - b;
    }
    return stats;
}

std::vector<ColumnStats> Statistics::describe(const ObservationMatrix& data) {
    std::vector<ColumnStats> out;
    out.reserve(data.itemCount());
    for (const auto& col : data.columns) out.push_back(calculateStats(col));
    return out;
}
