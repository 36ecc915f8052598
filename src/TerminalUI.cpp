#include "TerminalUI.h"
#include "CommonUtils.h"
#include <algorithm>
#include <iostream>
#include <iomanip>

namespace {
const char* kRule = "============================================================================================================\n";

std::string keywordCell(const ImportanceResult* result) {
    if (!result) return "(insufficient data)";
    if (result->keywords.empty()) return "(no distinctive words)";
    return CommonUtils::join(result->words(), ", ");
}
}

void TerminalUI::printSentiment(const std::string& text, const SentimentResult& result) {
    std::cout << "\n[Sentiment] \"" << text << "\"\n"
              << "        -> Label: " << sentimentLabelToString(result.label)
              << " | Compound: " << std::fixed << std::setprecision(4) << result.compound
              << " | Confidence: " << result.confidence << "\n"
              << "           pos=" << std::setprecision(3) << result.pos
              << " neu=" << result.neu
              << " neg=" << result.neg << "\n";
}

void TerminalUI::printKeywordTable(const std::vector<std::string>& categories, const InsightSnapshot& snapshot) {
    size_t maxNameLen = 15;
    for (const auto& name : categories) maxNameLen = std::max(maxNameLen, name.length());
    const int w = static_cast<int>(maxNameLen) + 2;

    std::cout << "\n============================================== KEYWORD DRIVERS ==============================================\n";
    std::cout << std::left << std::setw(w) << "Category" << std::setw(10) << "Polarity" << std::setw(8) << "n"
              << std::setw(8) << "r2" << "Keywords\n";
    std::cout << std::string(w + 26 + 40, '-') << "\n";
    for (const auto& category : categories) {
        for (Polarity polarity : {Polarity::STRENGTH, Polarity::LACKING}) {
            const ImportanceResult* result = snapshot.find(category, polarity);
            std::cout << std::left << std::setw(w) << category << std::setw(10) << polarityToString(polarity);
            if (result) {
                std::cout << std::setw(8) << result->sampleSize
                          << std::setw(8) << std::fixed << std::setprecision(2) << result->modelR2;
            } else {
                std::cout << std::setw(8) << "-" << std::setw(8) << "-";
            }
            std::cout << keywordCell(result) << "\n";
        }
    }
    std::cout << kRule;
}

void TerminalUI::printOverallKeywords(const OverallKeywordSet& keywords) {
    std::cout << "\n[Overall] Words that drive low scores across every category:\n";
    if (keywords.empty()) {
        std::cout << "        -> None (no lacking results were trained).\n";
        return;
    }
    for (const auto& kw : keywords.keywords) {
        std::cout << "        - " << std::left << std::setw(20) << kw.word
                  << ": " << std::fixed << std::setprecision(4) << kw.score << "\n";
    }
}

void TerminalUI::printSectionRanking(const SectionImportanceRanking& ranking) {
    std::cout << "\n[Ranking] Category influence on overall satisfaction (n=" << ranking.sampleSize
              << ", r2=" << std::fixed << std::setprecision(3) << ranking.r2
              << ", mae=" << ranking.mae << "):\n";
    for (size_t i = 0; i < ranking.sortedCategories.size(); ++i) {
        const std::string& category = ranking.sortedCategories[i];
        auto it = ranking.importancePerCategory.find(category);
        const double share = it == ranking.importancePerCategory.end() ? 0.0 : it->second;
        std::cout << "        " << (i + 1) << ". " << std::left << std::setw(28) << category
                  << std::right << std::setw(7) << std::setprecision(2) << (share * 100.0) << "%\n";
    }
}

void TerminalUI::printCorrelations(const std::vector<CategoryCorrelation>& correlations) {
    std::cout << "\n========================================== TEXT TO SCORE CORRELATIONS ==========================================\n";
    if (correlations.empty()) {
        std::cout << "        -> No correlation models were trained.\n";
        std::cout << kRule;
        return;
    }
    std::cout << std::left << std::setw(30) << "Target" << std::setw(12) << "Pearson r" << std::setw(12) << "r2"
              << std::setw(12) << "MAE" << std::setw(8) << "Train" << "Test\n";
    std::cout << std::string(80, '-') << "\n";
    for (const auto& c : correlations) {
        std::cout << std::left << std::setw(30) << c.category
                  << std::fixed << std::setprecision(3)
                  << std::setw(12) << c.correlation
                  << std::setw(12) << c.r2
                  << std::setw(12) << c.mae
                  << std::setw(8) << c.trainingSamples
                  << c.testSamples << "\n";
    }
    std::cout << kRule;
}

void TerminalUI::printSnapshot(const std::vector<std::string>& categories, const InsightSnapshot& snapshot) {
    std::cout << "\n[Canvass] Result version " << snapshot.version << " committed at " << snapshot.committedAt << "\n";
    printKeywordTable(categories, snapshot);
    printOverallKeywords(snapshot.overallKeywords);
    if (snapshot.ranking) {
        printSectionRanking(*snapshot.ranking);
    } else {
        std::cout << "\n[Ranking] Not available (too few highly satisfied respondents).\n";
    }
    printCorrelations(snapshot.correlations);
}

void TerminalUI::printRunSummary(const PipelineRunSummary& summary) {
    std::cout << "\n[Canvass] Run " << (summary.failed ? "FAILED" : "completed")
              << " in " << summary.durationMs << " ms\n"
              << "        -> Records: " << summary.recordCount
              << " | Sentiments computed: " << summary.sentimentsComputed << "\n"
              << "        -> Keyword models trained: " << summary.trained
              << " | skipped: " << summary.skipped << "\n"
              << "        -> Ranking: " << (summary.rankingTrained ? "yes" : "no")
              << " | Correlations: " << (summary.correlationsTrained ? "yes" : "no") << "\n";
    if (summary.persisted) {
        std::cout << "        -> Committed as version " << summary.version << "\n";
    } else {
        std::cout << "        -> Nothing committed; previous results remain current\n";
    }
    if (!summary.errors.empty()) {
        std::cout << "        Stage errors:\n";
        for (const auto& error : summary.errors) std::cout << "          * " << error.describe() << "\n";
    }
}

void TerminalUI::printSectionInsights(const std::string& recordId, const std::vector<SectionInsight>& insights) {
    std::cout << "\n============================================ SECTION INSIGHTS ============================================\n";
    std::cout << "Record: " << recordId << "\n";
    for (const auto& insight : insights) {
        std::cout << "\n  " << insight.category << ": ";
        if (insight.noData()) {
            std::cout << "no data\n";
            continue;
        }
        std::cout << std::fixed << std::setprecision(2) << *insight.score << (insight.isLow ? "  (low)" : "") << "\n";
        if (!insight.lackingKeywords.empty()) {
            std::cout << "     Lacking: " << CommonUtils::join(insight.lackingKeywords, ", ") << "\n";
        }
        for (const auto& rec : insight.recommendations) std::cout << "     * " << rec << "\n";
    }
    std::cout << kRule;
}
