#pragma once

#include "CanvassConfig.h"
#include "CategoryWeightVectorizer.h"
#include "CorrelationStore.h"
#include "FeedbackSource.h"
#include "ModelRegistry.h"
#include "PerCategoryImportanceTrainer.h"
#include "PipelineTypes.h"
#include "SentimentScorer.h"
#include "TextNormalizer.h"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * Sequences one full retrain: load, sentiment, importance, deduplication,
 * ranking, correlations, then an atomic commit and publication.
 * Collaborators are borrowed and must outlive the orchestrator.
 */
class PipelineOrchestrator final {
public:
    PipelineOrchestrator(CanvassConfig config,
                         const FeedbackSource& source,
                         CorrelationStore& store,
                         ModelRegistry& registry,
                         const SentimentScorer& scorer);

    /**
     * @brief Runs every stage for the context's tenant.
     * @post Never throws. On failure the previously committed results stay current.
     */
    PipelineRunSummary trainAll(const RunContext& context);

    FeedbackQuery query() const;
    const CanvassConfig& config() const noexcept { return config_; }

private:
    struct RunState {
        std::vector<FeedbackRecord> records;
        std::vector<PreparedDocument> documents;
        std::optional<CategoryWeightVectorizer> globalVectorizer;
        std::vector<BucketImportance> buckets;
        InsightSnapshot snapshot;
        PipelineRunSummary summary;
    };

    bool loadRecords(const RunContext& context, RunState& state) const;
    bool computeSentiments(const RunContext& context, RunState& state);
    void fitGlobalVectorizer(RunState& state) const;
    void trainImportance(RunState& state) const;
    void deduplicateKeywords(RunState& state) const;
    void rankSections(RunState& state) const;
    void analyzeCorrelations(RunState& state) const;
    void persistAndPublish(const RunContext& context, RunState& state);

    void log(const std::string& stage, const std::string& message) const;
    void recordError(RunState& state, const StageError& error) const;

    CanvassConfig config_;
    const FeedbackSource& source_;
    CorrelationStore& store_;
    ModelRegistry& registry_;
    const SentimentScorer& scorer_;
    TextNormalizer normalizer_;
    std::mutex runMutex_;
};
