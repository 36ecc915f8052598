#include "InsightService.h"

#include "CommonUtils.h"

#include <algorithm>
#include <map>

namespace {
const std::map<std::string, std::vector<std::string>>& categoryTemplates() {
    static const std::map<std::string, std::vector<std::string>> templates = {
        {"Compensation & Benefits", {
            "Consider reviewing salary structures and benefits packages",
            "Conduct market research on competitive compensation",
            "Implement transparent pay scales and promotion criteria"}},
        {"Work-Life Balance", {
            "Review workload distribution and deadlines",
            "Implement flexible working arrangements",
            "Encourage proper use of vacation and sick leave"}},
        {"Culture & Values", {
            "Assess workplace safety and comfort",
            "Ensure adequate resources and tools are available",
            "Promote inclusive and positive culture initiatives"}},
        {"Career Development", {
            "Create clear career progression paths",
            "Provide regular training and skill development opportunities",
            "Implement mentorship programs"}},
        {"Management & Leadership", {
            "Improve communication channels and frequency",
            "Provide management training and support",
            "Create open feedback mechanisms"}}
    };
    return templates;
}

void appendUnique(std::vector<std::string>& out, const std::string& item) {
    if (std::find(out.begin(), out.end(), item) == out.end()) out.push_back(item);
}
}

InsightService::InsightService(PipelineOrchestrator& orchestrator,
                               CorrelationStore& store,
                               ModelRegistry& registry,
                               const SentimentScorer& scorer)
    : orchestrator_(orchestrator), store_(store), registry_(registry), scorer_(scorer) {}

bool InsightService::warmStart(const RunContext& context) {
    auto latest = store_.loadLatest(context);
    if (!latest) return false;
    registry_.publishIfAbsent(context, std::move(*latest));
    return true;
}

PipelineRunSummary InsightService::trainAll(const RunContext& context) {
    return orchestrator_.trainAll(context);
}

ModelRegistry::SnapshotPtr InsightService::snapshot(const RunContext& context) const {
    if (auto current = registry_.current(context)) return current;
    auto latest = store_.loadLatest(context);
    if (!latest) return nullptr;
    return registry_.publishIfAbsent(context, std::move(*latest));
}

std::optional<ImportanceResult> InsightService::getKeywords(const RunContext& context,
                                                            const std::string& category,
                                                            Polarity polarity) const {
    auto current = snapshot(context);
    if (!current) return std::nullopt;
    const ImportanceResult* result = current->find(category, polarity);
    if (!result) return std::nullopt;
    return *result;
}

std::vector<std::string> InsightService::getOverallKeywords(const RunContext& context) const {
    auto current = snapshot(context);
    return current ? current->overallKeywords.words() : std::vector<std::string>{};
}

std::optional<SectionImportanceRanking> InsightService::getSectionRanking(const RunContext& context) const {
    auto current = snapshot(context);
    if (!current) return std::nullopt;
    return current->ranking;
}

std::vector<CategoryCorrelation> InsightService::getCategoryCorrelations(const RunContext& context) const {
    auto current = snapshot(context);
    return current ? current->correlations : std::vector<CategoryCorrelation>{};
}

SentimentResult InsightService::analyzeSentiment(const std::string& text) const {
    return scorer_.analyze(text);
}

std::optional<RecordSentiment> InsightService::getRecordSentiment(const RunContext& context,
                                                                  const std::string& recordId) const {
    return store_.getSentiment(context, recordId);
}

bool InsightService::hasResults(const RunContext& context) const {
    auto current = snapshot(context);
    return current && !current->empty();
}

std::vector<std::string> InsightService::recommendationsFor(const std::string& category,
                                                            const std::vector<std::string>& lackingKeywords) {
    std::vector<std::string> out;
    if (lackingKeywords.empty()) return out;

    const std::string joined = CommonUtils::toLower(CommonUtils::join(lackingKeywords, " "));
    if (joined.find("workload") != std::string::npos) {
        appendUnique(out, "Address workload concerns and resource allocation");
    } else if (joined.find("communication") != std::string::npos) {
        appendUnique(out, "Improve communication processes and transparency");
    } else if (joined.find("recognition") != std::string::npos) {
        appendUnique(out, "Implement better recognition and reward systems");
    }

    auto it = categoryTemplates().find(category);
    if (it != categoryTemplates().end()) {
        for (size_t i = 0; i < it->second.size() && i < 2; ++i) appendUnique(out, it->second[i]);
    }
    return out;
}

std::vector<SectionInsight> InsightService::getSectionInsights(const RunContext& context,
                                                               const FeedbackRecord& record) const {
    auto current = snapshot(context);
    const double lowThreshold = orchestrator_.config().trainer.lackingThreshold;

    std::vector<SectionInsight> out;
    for (const auto& category : orchestrator_.config().categories) {
        SectionInsight insight;
        insight.category = category;
        insight.score = record.score(category);
        if (insight.score) {
            insight.isLow = *insight.score < lowThreshold;
            const ImportanceResult* lacking = current ? current->find(category, Polarity::LACKING) : nullptr;
            if (lacking) insight.lackingKeywords = lacking->words();
            insight.recommendations = recommendationsFor(category, insight.lackingKeywords);
        }
        out.push_back(std::move(insight));
    }
    return out;
}
