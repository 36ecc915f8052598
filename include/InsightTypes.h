#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Explicit per-call scope. Every stored row is keyed by the tenant.
struct RunContext {
    std::string tenant = "default";
    std::string trigger = "manual";
};

enum class Polarity { STRENGTH, LACKING };

std::string polarityToString(Polarity polarity);
std::optional<Polarity> polarityFromString(const std::string& value);

struct KeywordScore {
    std::string word;
    double score = 0.0;
};

struct ImportanceResult {
    std::string category;
    Polarity polarity = Polarity::STRENGTH;
    std::vector<KeywordScore> keywords; // importance descending
    double modelR2 = 0.0;
    double mae = 0.0;
    double rmse = 0.0;
    size_t sampleSize = 0;
    int64_t trainedAt = 0;

    std::vector<std::string> words() const;
};

struct SectionImportanceRanking {
    std::vector<std::string> sortedCategories;
    std::map<std::string, double> importancePerCategory;
    double r2 = 0.0;
    double mae = 0.0;
    size_t sampleSize = 0;
    int64_t trainedAt = 0;
};

struct OverallKeywordSet {
    std::vector<KeywordScore> keywords;

    bool empty() const noexcept { return keywords.empty(); }
    std::vector<std::string> words() const;
};

// How well free text alone predicts one category score.
struct CategoryCorrelation {
    std::string category;
    double correlation = 0.0;
    double r2 = 0.0;
    double mae = 0.0;
    size_t trainingSamples = 0;
    size_t testSamples = 0;
};

/**
 * Complete set of derived results produced by one run. This is the unit of
 * atomic persistence and of publication to readers.
 */
struct InsightSnapshot {
    int64_t version = 0;
    int64_t committedAt = 0;
    std::vector<ImportanceResult> importanceResults;
    std::optional<SectionImportanceRanking> ranking;
    OverallKeywordSet overallKeywords;
    std::vector<CategoryCorrelation> correlations;

    const ImportanceResult* find(const std::string& category, Polarity polarity) const;
    // True when no stage produced anything, as after a retrain on too little data.
    bool empty() const noexcept;
};
