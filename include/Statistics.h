#pragma once

#include "ItemDataset.h"

#include <cstddef>
#include <vector>

// Item descriptives as printed in the data section (psych::describe layout).
struct ColumnStats {
    size_t count = 0;
    double mean = 0.0;
    double median = 0.0;
    double variance = 0.0;
    double stddev = 0.0;
    double skewness = 0.0; // adjusted Fisher-Pearson, 0 below three values
    double kurtosis = 0.0; // excess, 0 below four values
    double min = 0.0;
    double max = 0.0;
};

namespace Statistics {
// Sample (n-1) moments over the finite values of col.
ColumnStats calculateStats(const std::vector<double>& col);
std::vector<ColumnStats> describe(const ObservationMatrix& data);
}
