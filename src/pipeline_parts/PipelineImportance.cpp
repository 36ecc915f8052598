#include "PipelineOrchestrator.h"

#include "CategoryCorrelationAnalyzer.h"
#include "CommonUtils.h"
#include "CrossCategoryDeduplicator.h"

void PipelineOrchestrator::fitGlobalVectorizer(RunState& state) const {
    const CategoryCorrelationAnalyzer analyzer(config_.correlation, config_.categories);
    auto fitted = runStage("vectorize", "", std::nullopt, [&]() {
        return analyzer.fitVectorizer(state.documents);
    });
    if (!fitted.ok()) {
        recordError(state, fitted.error());
        return;
    }
    state.globalVectorizer.emplace(std::move(fitted.value()));
    log("Vectorize", "Global vocabulary of " + std::to_string(state.globalVectorizer->vocabularySize()) + " terms");
}

void PipelineOrchestrator::trainImportance(RunState& state) const {
    const PerCategoryImportanceTrainer trainer(config_.trainer);
    ImportanceTrainingOutcome outcome = trainer.trainAll(state.documents, config_.categories);
    for (const auto& error : outcome.errors) recordError(state, error);

    state.summary.trained = outcome.buckets.size();
    state.summary.skipped = outcome.skipped;
    for (const auto& bucket : outcome.buckets) {
        log("Trainer", bucket.result.category + "/" + polarityToString(bucket.result.polarity) +
                       ": n=" + std::to_string(bucket.result.sampleSize) +
                       " r2=" + std::to_string(bucket.result.modelR2) +
                       " [" + CommonUtils::join(bucket.result.words(), ", ") + "]");
    }
    state.buckets = std::move(outcome.buckets);
}

void PipelineOrchestrator::deduplicateKeywords(RunState& state) const {
    const CrossCategoryDeduplicator deduplicator(config_.dedup);
    auto deduped = runStage("deduplicate", "", Polarity::LACKING, [&]() {
        return deduplicator.apply(state.buckets);
    });
    if (!deduped.ok()) {
        recordError(state, deduped.error());
        return;
    }
    const DeduplicationOutcome& outcome = deduped.value();
    state.snapshot.overallKeywords = outcome.overall;
    for (const auto& entry : outcome.usedFallback) {
        if (entry.second) log("Deduplicate", entry.first + ": specialization filter left too few words, kept top candidates");
    }
    log("Deduplicate", "Overall keywords [" + CommonUtils::join(outcome.overall.words(), ", ") + "]");
}
