#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace StatsUtils {
double meanAbsoluteError(const std::vector<double>& actual, const std::vector<double>& predicted);
double rootMeanSquaredError(const std::vector<double>& actual, const std::vector<double>& predicted);

// Coefficient of determination. A constant target scores 1.0 when predicted
// exactly and 0.0 otherwise.
double r2Score(const std::vector<double>& actual, const std::vector<double>& predicted);

// Returns 0.0 when either side has no variance.
double pearson(const std::vector<double>& a, const std::vector<double>& b);

struct HoldoutSplit {
    std::vector<size_t> train;
    std::vector<size_t> test;
};

// Shuffled train/test partition of [0, n). The test side receives
// ceil(n * testFraction) rows, and the train side always keeps at least one.
HoldoutSplit holdoutSplit(size_t n, double testFraction, uint32_t seed);
}
