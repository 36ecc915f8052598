#pragma once

#include "CanvassConfig.h"
#include "FeedbackSource.h"
#include "InsightTypes.h"
#include "PipelineTypes.h"
#include "TextNormalizer.h"

#include <map>
#include <string>
#include <vector>

// A record reduced to what the trainers consume. `text` is the normalized,
// space-joined token sequence and may be empty.
struct PreparedDocument {
    std::string recordId;
    std::string text;
    std::map<std::string, double> categoryScores;
};

std::vector<PreparedDocument> prepareDocuments(const std::vector<FeedbackRecord>& records,
                                               const TextNormalizer& normalizer);

struct BucketImportance {
    ImportanceResult result;
    // Every noise-filtered feature by importance. Kept in memory for
    // deduplication and never persisted.
    std::vector<KeywordScore> rankedKeywords;
};

struct ImportanceTrainingOutcome {
    std::vector<BucketImportance> buckets; // categories in configured order, strength first
    std::vector<StageError> errors;
    size_t skipped = 0;
};

class PerCategoryImportanceTrainer {
public:
    explicit PerCategoryImportanceTrainer(TrainerTuning tuning);

    bool inBucket(double score, Polarity polarity) const noexcept;

    /**
     * @brief Fits a fresh vectorizer and ensemble on one (category, polarity) bucket.
     * @pre documents carry normalized text.
     * @post result.keywords holds at most topKeywords words, importance descending.
     * @throws Canvass::InsufficientDataException below minSamples non-empty documents.
     * @throws Canvass::VectorizationException when no term survives filtering.
     * @throws Canvass::TrainingException on a degenerate fit.
     */
    BucketImportance train(const std::vector<PreparedDocument>& documents,
                           const std::string& category,
                           Polarity polarity) const;

    // Every (category, polarity) key. A failing key is recorded and omitted.
    ImportanceTrainingOutcome trainAll(const std::vector<PreparedDocument>& documents,
                                       const std::vector<std::string>& categories) const;

private:
    TrainerTuning tuning_;
};
