#include "PipelineOrchestrator.h"

#include "CommonUtils.h"

#include <iostream>

void PipelineOrchestrator::persistAndPublish(const RunContext& context, RunState& state) {
    for (auto& bucket : state.buckets) state.snapshot.importanceResults.push_back(std::move(bucket.result));
    state.buckets.clear();

    InsightSnapshot& snapshot = state.snapshot;
    // An empty set is committed too: keys without enough data must read as absent.
    if (snapshot.empty()) {
        std::cout << "[Canvass][Warning] No stage produced a result; committing an empty result set\n";
    }

    snapshot.committedAt = CommonUtils::nowUnixSeconds();
    auto committed = runStage("persist", "", std::nullopt, [&]() {
        return store_.commitResults(context, snapshot);
    });
    if (!committed.ok()) {
        StageError error = committed.error();
        error.kind = StageErrorKind::Persistence;
        recordError(state, error);
        state.summary.failed = true;
        return;
    }

    snapshot.version = committed.value();
    state.summary.version = snapshot.version;
    state.summary.persisted = true;
    log("Persist", "Committed result version " + std::to_string(state.summary.version));
    if (!registry_.publish(context, std::move(snapshot))) {
        log("Persist", "A newer version is already published; registry left unchanged");
    }
}
