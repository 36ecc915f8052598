#pragma once
#include "InsightService.h"
#include "InsightTypes.h"
#include "PipelineTypes.h"
#include "SentimentScorer.h"
#include <vector>
#include <string>

class TerminalUI {
public:
    static void printSentiment(const std::string& text, const SentimentResult& result);

    // Keyword tables, strength and lacking side by side per category
    static void printKeywordTable(const std::vector<std::string>& categories, const InsightSnapshot& snapshot);
    static void printOverallKeywords(const OverallKeywordSet& keywords);
    static void printSectionRanking(const SectionImportanceRanking& ranking);
    static void printCorrelations(const std::vector<CategoryCorrelation>& correlations);

    static void printSnapshot(const std::vector<std::string>& categories, const InsightSnapshot& snapshot);
    static void printRunSummary(const PipelineRunSummary& summary);
    static void printSectionInsights(const std::string& recordId, const std::vector<SectionInsight>& insights);
};
