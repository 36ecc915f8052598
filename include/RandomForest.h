#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

struct ForestOptions {
    size_t nEstimators = 100;
    size_t maxDepth = 0; // 0 => grow until leaves are pure
    size_t minSamplesSplit = 2;
    size_t minSamplesLeaf = 1;
    bool bootstrap = true;
    uint32_t seed = 42;
};

struct RegressionMetrics {
    double r2 = 0.0;
    double mae = 0.0;
    double rmse = 0.0;
    size_t trainSamples = 0;
    size_t testSamples = 0;
};

/**
 * Bagged CART regression ensemble (variance-reduction splits) with
 * mean-decrease-impurity feature importances.
 * Each tree draws its own seed from the ensemble seed and its index, so a
 * fit is reproducible regardless of how many threads build the trees.
 */
class RandomForestRegressor {
public:
    using Matrix = std::vector<std::vector<double>>;

    explicit RandomForestRegressor(ForestOptions options = ForestOptions{});

    /**
     * @brief Fits all trees on X/y.
     * @pre X is rectangular and X.size() == y.size().
     * @throws Canvass::TrainingException on empty, ragged or non-finite input.
     */
    void fit(const Matrix& X, const std::vector<double>& y);

    double predict(const std::vector<double>& x) const;
    std::vector<double> predict(const Matrix& X) const;

    // Normalized to sum 1, or all zeros when no tree found an informative split.
    const std::vector<double>& featureImportances() const noexcept { return importances_; }

    bool fitted() const noexcept { return !trees_.empty(); }

private:
    struct Node {
        int feature = -1;
        double threshold = 0.0;
        double value = 0.0;
        int left = -1;
        int right = -1;
    };

    struct Tree {
        std::vector<Node> nodes;
        std::vector<double> importance;
        bool hasSplit = false;
    };

    Tree buildTree(const Matrix& X, const std::vector<double>& y, uint32_t seed) const;

    ForestOptions options_;
    std::vector<Tree> trees_;
    std::vector<double> importances_;
    size_t featureCount_ = 0;
};

struct HoldoutFit {
    RandomForestRegressor model;
    RegressionMetrics metrics;
};

/**
 * @brief Shuffled train/test split, fit on the train side, metrics on the test side.
 * @throws Canvass::TrainingException when the data cannot be fitted.
 */
HoldoutFit fitWithHoldout(const RandomForestRegressor::Matrix& X,
                          const std::vector<double>& y,
                          const ForestOptions& options,
                          double testFraction);
