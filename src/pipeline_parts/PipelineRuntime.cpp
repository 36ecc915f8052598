#include "PipelineOrchestrator.h"

#include "CommonUtils.h"

#include <chrono>
#include <iostream>
#include <utility>

PipelineOrchestrator::PipelineOrchestrator(CanvassConfig config,
                                           const FeedbackSource& source,
                                           CorrelationStore& store,
                                           ModelRegistry& registry,
                                           const SentimentScorer& scorer)
    : config_(std::move(config)),
      source_(source),
      store_(store),
      registry_(registry),
      scorer_(scorer) {}

FeedbackQuery PipelineOrchestrator::query() const {
    FeedbackQuery q;
    q.since = config_.since;
    q.until = config_.until;
    return q;
}

PipelineRunSummary PipelineOrchestrator::trainAll(const RunContext& context) {
    std::lock_guard<std::mutex> runLock(runMutex_);
    const auto begin = std::chrono::steady_clock::now();

    RunState state;
    state.summary.startedAt = CommonUtils::nowUnixSeconds();
    log("Run", "Starting retrain for tenant '" + context.tenant + "' (trigger: " + context.trigger + ")");

    auto finish = [&]() {
        state.summary.durationMs = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - begin).count();
        log("Run", "Finished in " + std::to_string(state.summary.durationMs) + " ms: " +
                   std::to_string(state.summary.trained) + " trained, " +
                   std::to_string(state.summary.skipped) + " skipped, " +
                   std::to_string(state.summary.errors.size()) + " stage errors");
        return std::move(state.summary);
    };

    if (!loadRecords(context, state)) return finish();
    if (!computeSentiments(context, state)) return finish();

    state.documents = prepareDocuments(state.records, normalizer_);
    fitGlobalVectorizer(state);
    trainImportance(state);
    deduplicateKeywords(state);
    rankSections(state);
    if (config_.correlation.enabled) {
        analyzeCorrelations(state);
    } else {
        log("Correlation", "Disabled by configuration");
    }
    persistAndPublish(context, state);
    return finish();
}

void PipelineOrchestrator::log(const std::string& stage, const std::string& message) const {
    if (!config_.verbose) return;
    std::cout << "[Canvass][" << stage << "] " << message << "\n";
}

void PipelineOrchestrator::recordError(RunState& state, const StageError& error) const {
    if (error.kind == StageErrorKind::Training || error.kind == StageErrorKind::Persistence ||
        error.kind == StageErrorKind::Source) {
        std::cout << "[Canvass][Warning] " << error.describe() << "\n";
    } else {
        log("Skip", error.describe());
    }
    state.summary.errors.push_back(error);
}
