#include "PipelineOrchestrator.h"

#include "CommonUtils.h"

#include <unordered_set>

bool PipelineOrchestrator::loadRecords(const RunContext& context, RunState& state) const {
    auto loaded = runStage("load", "", std::nullopt, [&]() {
        return source_.completeRecords(context, query());
    });
    if (!loaded.ok()) {
        StageError error = loaded.error();
        error.kind = StageErrorKind::Source;
        recordError(state, error);
        state.summary.failed = true;
        return false;
    }
    state.records = std::move(loaded.value());
    state.summary.recordCount = state.records.size();
    log("Load", std::to_string(state.records.size()) + " complete records");
    return true;
}

bool PipelineOrchestrator::computeSentiments(const RunContext& context, RunState& state) {
    auto upserted = runStage("sentiment", "", std::nullopt, [&]() {
        std::unordered_set<std::string> analyzed;
        if (!config_.recomputeSentiment) analyzed = store_.analyzedRecordIds(context);

        const int64_t now = CommonUtils::nowUnixSeconds();
        std::vector<RecordSentiment> pending;
        std::unordered_set<std::string> queued;
        for (const auto& record : state.records) {
            if (analyzed.count(record.id) || !queued.insert(record.id).second) continue;
            RecordSentiment entry;
            entry.recordId = record.id;
            entry.result = scorer_.analyze(record.text);
            entry.textLength = record.text.size();
            entry.analyzedAt = now;
            pending.push_back(std::move(entry));
        }
        return store_.upsertSentiments(context, pending);
    });
    if (!upserted.ok()) {
        recordError(state, upserted.error());
        state.summary.failed = true;
        return false;
    }
    state.summary.sentimentsComputed = upserted.value();
    log("Sentiment", std::to_string(upserted.value()) + " records scored");
    return true;
}
