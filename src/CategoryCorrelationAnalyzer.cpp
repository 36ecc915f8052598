#include "CategoryCorrelationAnalyzer.h"

#include "CanvassExceptions.h"
#include "CommonUtils.h"
#include "RandomForest.h"
#include "StatsUtils.h"

namespace {
constexpr double kNeutralScore = 3.0;

double documentMean(const PreparedDocument& doc) {
    if (doc.categoryScores.empty()) return kNeutralScore;
    double sum = 0.0;
    for (const auto& [category, score] : doc.categoryScores) sum += score;
    return sum / static_cast<double>(doc.categoryScores.size());
}
}

CategoryCorrelationAnalyzer::CategoryCorrelationAnalyzer(CorrelationTuning tuning, std::vector<std::string> categories)
    : tuning_(tuning), categories_(std::move(categories)) {}

VectorizerOptions CategoryCorrelationAnalyzer::vectorizerOptions() const {
    VectorizerOptions options;
    options.maxFeatures = tuning_.maxFeatures;
    options.ngramMin = 1;
    options.ngramMax = 1;
    options.minDocumentFrequency = 1;
    options.removeStopWords = true;
    return options;
}

CategoryWeightVectorizer CategoryCorrelationAnalyzer::fitVectorizer(const std::vector<PreparedDocument>& documents) const {
    std::vector<std::string> corpus;
    for (const auto& doc : documents) {
        if (!CommonUtils::isBlank(doc.text)) corpus.push_back(doc.text);
    }
    if (corpus.empty()) {
        throw Canvass::InsufficientDataException("no response carries usable text");
    }
    CategoryWeightVectorizer vectorizer(vectorizerOptions());
    vectorizer.fit(corpus);
    return vectorizer;
}

double CategoryCorrelationAnalyzer::targetValue(const PreparedDocument& doc, const std::string& target) const {
    if (target != kOverallTarget) {
        auto it = doc.categoryScores.find(target);
        if (it != doc.categoryScores.end()) return it->second;
    }
    return documentMean(doc);
}

CategoryCorrelation CategoryCorrelationAnalyzer::analyze(const CategoryWeightVectorizer& vectorizer,
                                                         const std::vector<PreparedDocument>& documents,
                                                         const std::string& target) const {
    std::vector<SparseVector> rows;
    std::vector<double> y;
    for (const auto& doc : documents) {
        if (CommonUtils::isBlank(doc.text)) continue;
        rows.push_back(vectorizer.transform(doc.text));
        y.push_back(targetValue(doc, target));
    }
    const RandomForestRegressor::Matrix X = CategoryWeightVectorizer::toDense(rows, vectorizer.vocabularySize());
    if (X.size() < tuning_.minSamples) {
        throw Canvass::InsufficientDataException(
            target + " correlation has " + std::to_string(X.size()) + " usable responses, needs " +
            std::to_string(tuning_.minSamples));
    }

    ForestOptions fopts;
    fopts.nEstimators = tuning_.trees;
    fopts.maxDepth = tuning_.maxDepth;
    fopts.minSamplesSplit = tuning_.minSamplesSplit;
    fopts.seed = tuning_.seed;
    const HoldoutFit fit = fitWithHoldout(X, y, fopts, tuning_.testFraction);

    CategoryCorrelation out;
    out.category = target;
    out.correlation = StatsUtils::pearson(y, fit.model.predict(X));
    out.r2 = fit.metrics.r2;
    out.mae = fit.metrics.mae;
    out.trainingSamples = fit.metrics.trainSamples;
    out.testSamples = fit.metrics.testSamples;
    return out;
}

CorrelationOutcome CategoryCorrelationAnalyzer::analyzeAll(const CategoryWeightVectorizer& vectorizer,
                                                           const std::vector<PreparedDocument>& documents) const {
    CorrelationOutcome outcome;
    std::vector<std::string> targets = categories_;
    targets.emplace_back(kOverallTarget);
    for (const auto& target : targets) {
        auto stage = runStage("correlation", target, std::nullopt, [&]() {
            return analyze(vectorizer, documents, target);
        });
        if (stage.ok()) {
            outcome.correlations.push_back(stage.value());
        } else {
            outcome.errors.push_back(stage.error());
        }
    }
    return outcome;
}
