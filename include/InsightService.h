#pragma once

#include "CorrelationStore.h"
#include "FeedbackSource.h"
#include "InsightTypes.h"
#include "ModelRegistry.h"
#include "PipelineOrchestrator.h"
#include "PipelineTypes.h"
#include "SentimentScorer.h"

#include <optional>
#include <string>
#include <vector>

struct SectionInsight {
    std::string category;
    std::optional<double> score; // nullopt => no data
    bool isLow = false;
    std::vector<std::string> lackingKeywords;
    std::vector<std::string> recommendations;

    bool noData() const noexcept { return !score.has_value(); }
};

/**
 * Read and retrain boundary handed to the embedding application. Reads are
 * served from the registry; a tenant missing from the registry is loaded
 * from the store on first access.
 */
class InsightService {
public:
    InsightService(PipelineOrchestrator& orchestrator,
                   CorrelationStore& store,
                   ModelRegistry& registry,
                   const SentimentScorer& scorer);

    /**
     * @brief Publishes the last committed snapshot of the tenant, if any.
     * @throws Canvass::PersistenceException when the store cannot be read.
     */
    bool warmStart(const RunContext& context);

    PipelineRunSummary trainAll(const RunContext& context);

    std::optional<ImportanceResult> getKeywords(const RunContext& context,
                                                const std::string& category,
                                                Polarity polarity) const;
    std::vector<std::string> getOverallKeywords(const RunContext& context) const;
    std::optional<SectionImportanceRanking> getSectionRanking(const RunContext& context) const;
    std::vector<CategoryCorrelation> getCategoryCorrelations(const RunContext& context) const;

    SentimentResult analyzeSentiment(const std::string& text) const;
    std::optional<RecordSentiment> getRecordSentiment(const RunContext& context, const std::string& recordId) const;

    /**
     * @brief One entry per configured category describing why the record scored low.
     * @post Recommendations are only produced for categories with lacking keywords.
     */
    std::vector<SectionInsight> getSectionInsights(const RunContext& context, const FeedbackRecord& record) const;

    // A committed set that is empty (a retrain on too little data) does not count.
    bool hasResults(const RunContext& context) const;
    ModelRegistry::SnapshotPtr snapshot(const RunContext& context) const;

    static std::vector<std::string> recommendationsFor(const std::string& category,
                                                       const std::vector<std::string>& lackingKeywords);

private:
    PipelineOrchestrator& orchestrator_;
    CorrelationStore& store_;
    ModelRegistry& registry_;
    const SentimentScorer& scorer_;
};
