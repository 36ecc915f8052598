#include "SectionImportanceRanker.h"

#include "CanvassExceptions.h"
#include "CommonUtils.h"
#include "RandomForest.h"

#include <algorithm>
#include <numeric>

SectionImportanceRanker::SectionImportanceRanker(RankerTuning tuning, std::vector<std::string> categories)
    : tuning_(tuning), categories_(std::move(categories)) {}

std::map<std::string, double> SectionImportanceRanker::categoryMeans(const std::vector<FeedbackRecord>& records) const {
    std::map<std::string, double> means;
    for (const auto& category : categories_) {
        double sum = 0.0;
        size_t count = 0;
        for (const auto& record : records) {
            if (auto score = record.score(category)) {
                sum += *score;
                ++count;
            }
        }
        means[category] = count > 0 ? sum / static_cast<double>(count) : tuning_.missingFallback;
    }
    return means;
}

SectionImportanceRanking SectionImportanceRanker::rank(const std::vector<FeedbackRecord>& records) const {
    if (categories_.empty()) {
        throw Canvass::TrainingException("no categories configured for ranking");
    }
    const std::map<std::string, double> means = categoryMeans(records);

    RandomForestRegressor::Matrix X;
    std::vector<double> y;
    for (const auto& record : records) {
        const auto mean = record.meanScore();
        if (!mean || *mean < tuning_.satisfactionThreshold) continue;

        std::vector<double> row;
        row.reserve(categories_.size());
        for (const auto& category : categories_) {
            const auto score = record.score(category);
            row.push_back(score ? *score : means.at(category));
        }
        X.push_back(std::move(row));
        y.push_back(*mean);
    }
    if (X.size() < tuning_.minSamples) {
        throw Canvass::InsufficientDataException(
            "section ranking has " + std::to_string(X.size()) + " satisfied responses, needs " +
            std::to_string(tuning_.minSamples));
    }

    ForestOptions fopts;
    fopts.nEstimators = tuning_.trees;
    fopts.maxDepth = tuning_.maxDepth;
    fopts.minSamplesSplit = tuning_.minSamplesSplit;
    fopts.seed = tuning_.seed;
    const HoldoutFit fit = fitWithHoldout(X, y, fopts, tuning_.testFraction);

    const auto& importances = fit.model.featureImportances();
    const double total = std::accumulate(importances.begin(), importances.end(), 0.0);
    if (total <= 0.0) {
        throw Canvass::TrainingException("ranking ensemble found no informative split");
    }

    SectionImportanceRanking ranking;
    std::vector<size_t> order(categories_.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return importances[a] > importances[b];
    });
    for (size_t idx : order) {
        ranking.sortedCategories.push_back(categories_[idx]);
        ranking.importancePerCategory[categories_[idx]] = importances[idx] / total;
    }
    ranking.r2 = fit.metrics.r2;
    ranking.mae = fit.metrics.mae;
    ranking.sampleSize = X.size();
    ranking.trainedAt = CommonUtils::nowUnixSeconds();
    return ranking;
}
