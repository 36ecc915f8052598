#include "CanvassConfig.h"
#include "CanvassExceptions.h"
#include "CorrelationStore.h"
#include "FeedbackSource.h"
#include "InsightService.h"
#include "ModelRegistry.h"
#include "PipelineOrchestrator.h"
#include "SentimentScorer.h"
#include "TerminalUI.h"

#include <algorithm>
#include <iostream>
#include <string>

namespace {
CsvSourceOptions sourceOptions(const CanvassConfig& config) {
    CsvSourceOptions options;
    options.path = config.feedbackPath;
    options.delimiter = config.delimiter;
    options.textColumn = config.textColumn;
    options.idColumn = config.idColumn;
    options.completeColumn = config.completeColumn;
    options.dateColumn = config.dateColumn;
    options.categories = config.categories;
    options.verbose = config.verbose;

    // Configured mappings win; default survey columns fill the rest.
    options.categoryColumns = config.categoryColumns;
    for (const auto& entry : CsvFeedbackSource::defaultCategoryColumns()) {
        if (std::find(config.categories.begin(), config.categories.end(), entry.first) == config.categories.end()) continue;
        options.categoryColumns.emplace(entry.first, entry.second);
    }
    return options;
}

SentimentScorer makeScorer(const CanvassConfig& config) {
    if (config.sentimentLexicon.empty()) return SentimentScorer();
    SentimentScorer scorer = SentimentScorer::fromLexiconFile(config.sentimentLexicon);
    if (config.verbose) {
        std::cout << "[Canvass][Sentiment] Loaded " << scorer.lexiconSize() << " lexicon entries from "
                  << config.sentimentLexicon << "\n";
    }
    return scorer;
}

int showInsights(const CanvassConfig& config,
                 const RunContext& context,
                 const FeedbackSource& source,
                 const InsightService& service) {
    const auto records = source.completeRecords(context, FeedbackQuery{});
    auto it = std::find_if(records.begin(), records.end(), [&](const FeedbackRecord& r) {
        return r.id == config.insightsRecordId;
    });
    if (it == records.end()) {
        throw Canvass::IOException("Record '" + config.insightsRecordId + "' not found among complete records of " +
                                   config.feedbackPath);
    }
    const auto stored = service.getRecordSentiment(context, it->id);
    TerminalUI::printSentiment(it->text, stored ? stored->result : service.analyzeSentiment(it->text));
    if (!service.hasResults(context)) {
        std::cout << "[Canvass][Warning] No committed results yet; keywords and recommendations are empty\n";
    }
    TerminalUI::printSectionInsights(it->id, service.getSectionInsights(context, *it));
    return 0;
}
}

int main(int argc, char* argv[]) {
    try {
        const CanvassConfig config = CanvassConfig::fromArgs(argc, argv);
        const SentimentScorer scorer = makeScorer(config);

        if (config.sentimentText) {
            TerminalUI::printSentiment(*config.sentimentText, scorer.analyze(*config.sentimentText));
            return 0;
        }

        RunContext context;
        context.tenant = config.tenant;
        context.trigger = "cli";

        CorrelationStore store(config.databasePath);
        ModelRegistry registry;
        CsvFeedbackSource source(sourceOptions(config));
        PipelineOrchestrator orchestrator(config, source, store, registry, scorer);
        InsightService service(orchestrator, store, registry, scorer);

        if (service.warmStart(context) && config.verbose) {
            std::cout << "[Canvass][Store] Loaded committed results from " << store.path() << "\n";
        }

        if (!config.insightsRecordId.empty()) return showInsights(config, context, source, service);

        if (config.showOnly) {
            auto snapshot = service.snapshot(context);
            if (!snapshot) {
                std::cout << "[Canvass][Warning] No committed results in " << store.path() << "\n";
                return 1;
            }
            TerminalUI::printSnapshot(config.categories, *snapshot);
            return 0;
        }

        if (service.hasResults(context) && !config.forceRetrain) {
            std::cout << "[Canvass] Found committed results. Use --force-retrain true to retrain.\n";
            TerminalUI::printSnapshot(config.categories, *service.snapshot(context));
            return 0;
        }

        const PipelineRunSummary summary = service.trainAll(context);
        TerminalUI::printRunSummary(summary);
        if (auto snapshot = service.snapshot(context)) {
            TerminalUI::printSnapshot(config.categories, *snapshot);
        }
        return summary.failed ? 1 : 0;
    } catch (const Canvass::CanvassException& e) {
        std::cerr << "[Canvass Error] " << e.what() << "\n";
        return 1;
    }
}
