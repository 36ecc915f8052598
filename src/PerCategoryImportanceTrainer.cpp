#include "PerCategoryImportanceTrainer.h"

#include "CanvassExceptions.h"
#include "CategoryWeightVectorizer.h"
#include "CommonUtils.h"
#include "RandomForest.h"

#include <algorithm>
#include <unordered_set>

std::vector<PreparedDocument> prepareDocuments(const std::vector<FeedbackRecord>& records,
                                               const TextNormalizer& normalizer) {
    std::vector<PreparedDocument> out;
    out.reserve(records.size());
    for (const auto& record : records) {
        out.push_back({record.id, normalizer.normalize(record.text).joined(), record.categoryScores});
    }
    return out;
}

PerCategoryImportanceTrainer::PerCategoryImportanceTrainer(TrainerTuning tuning) : tuning_(std::move(tuning)) {}

bool PerCategoryImportanceTrainer::inBucket(double score, Polarity polarity) const noexcept {
    return polarity == Polarity::STRENGTH ? score >= tuning_.strengthThreshold
                                          : score < tuning_.lackingThreshold;
}

BucketImportance PerCategoryImportanceTrainer::train(const std::vector<PreparedDocument>& documents,
                                                     const std::string& category,
                                                     Polarity polarity) const {
    std::vector<std::string> corpus;
    std::vector<double> target;
    for (const auto& doc : documents) {
        auto it = doc.categoryScores.find(category);
        if (it == doc.categoryScores.end() || !inBucket(it->second, polarity)) continue;
        if (CommonUtils::isBlank(doc.text)) continue;
        corpus.push_back(doc.text);
        target.push_back(it->second);
    }
    if (corpus.size() < tuning_.minSamples) {
        throw Canvass::InsufficientDataException(
            category + "/" + polarityToString(polarity) + " has " + std::to_string(corpus.size()) +
            " usable responses, needs " + std::to_string(tuning_.minSamples));
    }

    VectorizerOptions vopts;
    vopts.maxFeatures = tuning_.maxFeatures;
    vopts.ngramMin = tuning_.ngramMin;
    vopts.ngramMax = tuning_.ngramMax;
    vopts.minDocumentFrequency = tuning_.minDocumentFrequency;
    vopts.removeStopWords = true;
    CategoryWeightVectorizer vectorizer(vopts);
    const auto rows = vectorizer.fitTransform(corpus);
    const auto X = CategoryWeightVectorizer::toDense(rows, vectorizer.vocabularySize());

    ForestOptions fopts;
    fopts.nEstimators = tuning_.trees;
    fopts.maxDepth = tuning_.maxDepth;
    fopts.minSamplesSplit = tuning_.minSamplesSplit;
    fopts.seed = tuning_.seed;
    const HoldoutFit fit = fitWithHoldout(X, target, fopts, tuning_.testFraction);

    const std::unordered_set<std::string> noise(tuning_.noiseWords.begin(), tuning_.noiseWords.end());
    const auto& importances = fit.model.featureImportances();
    const auto& terms = vectorizer.terms();

    BucketImportance out;
    for (size_t j = 0; j < terms.size(); ++j) {
        if (noise.count(terms[j]) > 0) continue;
        out.rankedKeywords.push_back({terms[j], importances[j]});
    }
    std::sort(out.rankedKeywords.begin(), out.rankedKeywords.end(), [](const KeywordScore& a, const KeywordScore& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.word < b.word;
    });

    ImportanceResult& result = out.result;
    result.category = category;
    result.polarity = polarity;
    const size_t keep = std::min(tuning_.topKeywords, out.rankedKeywords.size());
    result.keywords.assign(out.rankedKeywords.begin(), out.rankedKeywords.begin() + static_cast<std::ptrdiff_t>(keep));
    result.modelR2 = fit.metrics.r2;
    result.mae = fit.metrics.mae;
    result.rmse = fit.metrics.rmse;
    result.sampleSize = corpus.size();
    result.trainedAt = CommonUtils::nowUnixSeconds();
    return out;
}

ImportanceTrainingOutcome PerCategoryImportanceTrainer::trainAll(const std::vector<PreparedDocument>& documents,
                                                                 const std::vector<std::string>& categories) const {
    ImportanceTrainingOutcome outcome;
    for (const auto& category : categories) {
        for (Polarity polarity : {Polarity::STRENGTH, Polarity::LACKING}) {
            auto stage = runStage("importance", category, polarity, [&]() {
                return train(documents, category, polarity);
            });
            if (stage.ok()) {
                outcome.buckets.push_back(std::move(stage.value()));
            } else {
                ++outcome.skipped;
                outcome.errors.push_back(stage.error());
            }
        }
    }
    return outcome;
}
