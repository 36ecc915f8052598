#include "PipelineOrchestrator.h"

#include "CategoryCorrelationAnalyzer.h"
#include "SectionImportanceRanker.h"

#include <iomanip>
#include <sstream>

void PipelineOrchestrator::rankSections(RunState& state) const {
    const SectionImportanceRanker ranker(config_.ranker, config_.categories);
    auto ranked = runStage("ranking", "", std::nullopt, [&]() {
        return ranker.rank(state.records);
    });
    if (!ranked.ok()) {
        recordError(state, ranked.error());
        return;
    }
    state.snapshot.ranking = std::move(ranked.value());
    state.summary.rankingTrained = true;

    std::ostringstream line;
    line << std::fixed << std::setprecision(3);
    const auto& ranking = *state.snapshot.ranking;
    for (size_t i = 0; i < ranking.sortedCategories.size(); ++i) {
        const std::string& category = ranking.sortedCategories[i];
        if (i > 0) line << ", ";
        line << category << "=" << ranking.importancePerCategory.at(category);
    }
    log("Ranking", "n=" + std::to_string(ranking.sampleSize) + " " + line.str());
}

void PipelineOrchestrator::analyzeCorrelations(RunState& state) const {
    if (!state.globalVectorizer) {
        log("Correlation", "Skipped, no global vocabulary");
        return;
    }
    const CategoryCorrelationAnalyzer analyzer(config_.correlation, config_.categories);
    CorrelationOutcome outcome = analyzer.analyzeAll(*state.globalVectorizer, state.documents);
    for (const auto& error : outcome.errors) recordError(state, error);
    for (const auto& c : outcome.correlations) {
        log("Correlation", c.category + ": r=" + std::to_string(c.correlation) + " r2=" + std::to_string(c.r2));
    }
    state.summary.correlationsTrained = !outcome.correlations.empty();
    state.snapshot.correlations = std::move(outcome.correlations);
}
