#include "RandomForest.h"

#include "CanvassExceptions.h"
#include "StatsUtils.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>
#include <string>
#include <utility>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
constexpr double kImpurityEpsilon = 1e-12;
constexpr double kMinGain = 1e-12;
constexpr double kFeatureThreshold = 1e-7;
constexpr uint32_t kTreeSeedStride = 0x9e3779b9U;
}

RandomForestRegressor::RandomForestRegressor(ForestOptions options) : options_(options) {
    if (options_.minSamplesSplit < 2) options_.minSamplesSplit = 2;
    if (options_.minSamplesLeaf < 1) options_.minSamplesLeaf = 1;
}

RandomForestRegressor::Tree RandomForestRegressor::buildTree(const Matrix& X,
                                                             const std::vector<double>& y,
                                                             uint32_t seed) const {
    Tree tree;
    tree.importance.assign(featureCount_, 0.0);
    std::mt19937 rng(seed);

    const size_t n = X.size();
    std::vector<size_t> rootSamples(n);
    if (options_.bootstrap) {
        std::uniform_int_distribution<size_t> pick(0, n - 1);
        for (auto& s : rootSamples) s = pick(rng);
    } else {
        std::iota(rootSamples.begin(), rootSamples.end(), 0);
    }

    struct Pending {
        int node;
        std::vector<size_t> samples;
        size_t depth;
    };

    std::vector<Pending> stack;
    tree.nodes.emplace_back();
    stack.push_back({0, std::move(rootSamples), 0});

    std::vector<size_t> featureOrder(featureCount_);
    std::iota(featureOrder.begin(), featureOrder.end(), 0);
    std::vector<std::pair<double, double>> column;

    const size_t minLeaf = options_.minSamplesLeaf;
    while (!stack.empty()) {
        Pending work = std::move(stack.back());
        stack.pop_back();

        const size_t m = work.samples.size();
        double sum = 0.0, sumSq = 0.0;
        for (size_t s : work.samples) {
            sum += y[s];
            sumSq += y[s] * y[s];
        }
        const double dm = static_cast<double>(m);
        tree.nodes[static_cast<size_t>(work.node)].value = sum / dm;
        const double sse = std::max(0.0, sumSq - sum * sum / dm);

        const bool depthExhausted = options_.maxDepth > 0 && work.depth >= options_.maxDepth;
        if (depthExhausted || m < options_.minSamplesSplit || m < 2 * minLeaf || sse <= kImpurityEpsilon * dm) {
            continue;
        }

        // Ties between equally good features go to whichever is visited first.
        std::shuffle(featureOrder.begin(), featureOrder.end(), rng);

        int bestFeature = -1;
        double bestThreshold = 0.0;
        double bestGain = kMinGain;
        for (size_t f : featureOrder) {
            column.clear();
            for (size_t s : work.samples) column.emplace_back(X[s][f], y[s]);
            std::sort(column.begin(), column.end(),
                      [](const auto& a, const auto& b) { return a.first < b.first; });
            if (column.back().first - column.front().first <= kFeatureThreshold) continue;

            double leftSum = 0.0, leftSq = 0.0;
            for (size_t k = 0; k + 1 < m; ++k) {
                leftSum += column[k].second;
                leftSq += column[k].second * column[k].second;
                if (column[k + 1].first - column[k].first <= kFeatureThreshold) continue;

                const size_t nl = k + 1;
                const size_t nr = m - nl;
                if (nl < minLeaf || nr < minLeaf) continue;

                const double rightSum = sum - leftSum;
                const double rightSq = sumSq - leftSq;
                const double sseLeft = leftSq - leftSum * leftSum / static_cast<double>(nl);
                const double sseRight = rightSq - rightSum * rightSum / static_cast<double>(nr);
                const double gain = sse - sseLeft - sseRight;
                if (gain > bestGain) {
                    bestGain = gain;
                    bestFeature = static_cast<int>(f);
                    bestThreshold = (column[k].first + column[k + 1].first) / 2.0;
                    if (bestThreshold >= column[k + 1].first) bestThreshold = column[k].first;
                }
            }
        }
        if (bestFeature < 0) continue;

        std::vector<size_t> leftSamples;
        std::vector<size_t> rightSamples;
        leftSamples.reserve(m);
        rightSamples.reserve(m);
        for (size_t s : work.samples) {
            if (X[s][static_cast<size_t>(bestFeature)] <= bestThreshold) leftSamples.push_back(s);
            else rightSamples.push_back(s);
        }
        if (leftSamples.empty() || rightSamples.empty()) continue;

        tree.importance[static_cast<size_t>(bestFeature)] += bestGain;
        tree.hasSplit = true;

        const int leftIdx = static_cast<int>(tree.nodes.size());
        tree.nodes.emplace_back();
        const int rightIdx = static_cast<int>(tree.nodes.size());
        tree.nodes.emplace_back();

        Node& node = tree.nodes[static_cast<size_t>(work.node)];
        node.feature = bestFeature;
        node.threshold = bestThreshold;
        node.left = leftIdx;
        node.right = rightIdx;

        stack.push_back({rightIdx, std::move(rightSamples), work.depth + 1});
        stack.push_back({leftIdx, std::move(leftSamples), work.depth + 1});
    }

    const double total = std::accumulate(tree.importance.begin(), tree.importance.end(), 0.0);
    if (total > 0.0) {
        for (double& v : tree.importance) v /= total;
    }
    return tree;
}

void RandomForestRegressor::fit(const Matrix& X, const std::vector<double>& y) {
    if (X.empty() || X.size() != y.size()) {
        throw Canvass::TrainingException("feature matrix and target must be non-empty and of equal length (" +
                                         std::to_string(X.size()) + " vs " + std::to_string(y.size()) + ")");
    }
    if (options_.nEstimators == 0) {
        throw Canvass::TrainingException("ensemble needs at least one tree");
    }
    const size_t p = X.front().size();
    if (p == 0) {
        throw Canvass::TrainingException("feature matrix has no columns");
    }
    for (size_t i = 0; i < X.size(); ++i) {
        if (X[i].size() != p) {
            throw Canvass::TrainingException("ragged feature matrix at row " + std::to_string(i));
        }
        if (!std::isfinite(y[i])) {
            throw Canvass::TrainingException("non-finite target at row " + std::to_string(i));
        }
        for (double v : X[i]) {
            if (!std::isfinite(v)) {
                throw Canvass::TrainingException("non-finite feature value at row " + std::to_string(i));
            }
        }
    }

    featureCount_ = p;
    std::vector<Tree> trees(options_.nEstimators);
    const int treeCount = static_cast<int>(options_.nEstimators);

#ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
#endif
    for (int t = 0; t < treeCount; ++t) {
        const uint32_t treeSeed = options_.seed + static_cast<uint32_t>(t + 1) * kTreeSeedStride;
        trees[static_cast<size_t>(t)] = buildTree(X, y, treeSeed);
    }
    trees_ = std::move(trees);

    importances_.assign(p, 0.0);
    size_t splitTrees = 0;
    for (const auto& tree : trees_) {
        if (!tree.hasSplit) continue;
        ++splitTrees;
        for (size_t j = 0; j < p; ++j) importances_[j] += tree.importance[j];
    }
    if (splitTrees > 0) {
        const double total = std::accumulate(importances_.begin(), importances_.end(), 0.0);
        if (total > 0.0) {
            for (double& v : importances_) v /= total;
        }
    }
}

double RandomForestRegressor::predict(const std::vector<double>& x) const {
    if (trees_.empty()) {
        throw Canvass::TrainingException("predict called on an unfitted ensemble");
    }
    if (x.size() != featureCount_) {
        throw Canvass::TrainingException("expected " + std::to_string(featureCount_) +
                                         " features, got " + std::to_string(x.size()));
    }
    double sum = 0.0;
    for (const auto& tree : trees_) {
        size_t idx = 0;
        while (tree.nodes[idx].feature >= 0) {
            const Node& node = tree.nodes[idx];
            idx = static_cast<size_t>(x[static_cast<size_t>(node.feature)] <= node.threshold ? node.left : node.right);
        }
        sum += tree.nodes[idx].value;
    }
    return sum / static_cast<double>(trees_.size());
}

std::vector<double> RandomForestRegressor::predict(const Matrix& X) const {
    std::vector<double> out;
    out.reserve(X.size());
    for (const auto& row : X) out.push_back(predict(row));
    return out;
}

HoldoutFit fitWithHoldout(const RandomForestRegressor::Matrix& X,
                          const std::vector<double>& y,
                          const ForestOptions& options,
                          double testFraction) {
    if (X.size() < 2 || X.size() != y.size()) {
        throw Canvass::TrainingException("holdout fit needs at least two aligned samples");
    }

    const StatsUtils::HoldoutSplit split = StatsUtils::holdoutSplit(X.size(), testFraction, options.seed);
    RandomForestRegressor::Matrix Xtr;
    std::vector<double> ytr;
    Xtr.reserve(split.train.size());
    ytr.reserve(split.train.size());
    for (size_t idx : split.train) {
        Xtr.push_back(X[idx]);
        ytr.push_back(y[idx]);
    }

    HoldoutFit result{RandomForestRegressor(options), RegressionMetrics{}};
    result.model.fit(Xtr, ytr);

    const std::vector<size_t>& evalRows = split.test.empty() ? split.train : split.test;
    std::vector<double> actual;
    std::vector<double> predicted;
    actual.reserve(evalRows.size());
    predicted.reserve(evalRows.size());
    for (size_t idx : evalRows) {
        actual.push_back(y[idx]);
        predicted.push_back(result.model.predict(X[idx]));
    }

    result.metrics.r2 = StatsUtils::r2Score(actual, predicted);
    result.metrics.mae = StatsUtils::meanAbsoluteError(actual, predicted);
    result.metrics.rmse = StatsUtils::rootMeanSquaredError(actual, predicted);
    result.metrics.trainSamples = split.train.size();
    result.metrics.testSamples = split.test.size();
    return result;
}
