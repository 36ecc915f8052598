#include "StatsUtils.h"

#include <algorithm>
#include <cmath>
#include <random>

namespace StatsUtils {
double meanAbsoluteError(const std::vector<double>& actual, const std::vector<double>& predicted) {
    const size_t n = std::min(actual.size(), predicted.size());
    if (n == 0) return 0.0;
    double sum = 0.0;
    for (size_t i = 0; i < n; ++i) sum += std::abs(actual[i] - predicted[i]);
    return sum / static_cast<double>(n);
}

double rootMeanSquaredError(const std::vector<double>& actual, const std::vector<double>& predicted) {
    const size_t n = std::min(actual.size(), predicted.size());
    if (n == 0) return 0.0;
    double sum = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double d = actual[i] - predicted[i];
        sum += d * d;
    }
    return std::sqrt(sum / static_cast<double>(n));
}

double r2Score(const std::vector<double>& actual, const std::vector<double>& predicted) {
    const size_t n = std::min(actual.size(), predicted.size());
    if (n == 0) return 0.0;
    double mean = 0.0;
    for (size_t i = 0; i < n; ++i) mean += actual[i];
    mean /= static_cast<double>(n);

    double tss = 0.0, rss = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double d = actual[i] - predicted[i];
        rss += d * d;
        const double t = actual[i] - mean;
        tss += t * t;
    }
    if (tss <= 1e-12) return rss <= 1e-12 ? 1.0 : 0.0;
    return 1.0 - rss / tss;
}

double pearson(const std::vector<double>& a, const std::vector<double>& b) {
    const size_t n = std::min(a.size(), b.size());
    if (n < 2) return 0.0;
    double ma = 0.0, mb = 0.0;
    for (size_t i = 0; i < n; ++i) {
        ma += a[i];
        mb += b[i];
    }
    ma /= static_cast<double>(n);
    mb /= static_cast<double>(n);

    double cov = 0.0, va = 0.0, vb = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double da = a[i] - ma;
        const double db = b[i] - mb;
        cov += da * db;
        va += da * da;
        vb += db * db;
    }
    if (va <= 1e-12 || vb <= 1e-12) return 0.0;
    return std::clamp(cov / std::sqrt(va * vb), -1.0, 1.0);
}

HoldoutSplit holdoutSplit(size_t n, double testFraction, uint32_t seed) {
    HoldoutSplit split;
    if (n == 0) return split;

    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::mt19937 rng(seed);
    std::shuffle(order.begin(), order.end(), rng);

    size_t testCount = static_cast<size_t>(std::ceil(static_cast<double>(n) * testFraction));
    testCount = std::min(testCount, n - 1);

    split.test.assign(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(testCount));
    split.train.assign(order.begin() + static_cast<std::ptrdiff_t>(testCount), order.end());
    return split;
}
}
