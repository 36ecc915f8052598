#pragma once

#include "CanvassConfig.h"
#include "InsightTypes.h"
#include "PerCategoryImportanceTrainer.h"

#include <map>
#include <string>
#include <vector>

struct DeduplicationOutcome {
    OverallKeywordSet overall;
    std::vector<std::string> commonVocabulary;           // aggregate score descending
    std::map<std::string, std::vector<KeywordScore>> finalKeywords; // per lacking category
    std::map<std::string, bool> usedFallback;
};

/**
 * Removes words that drive low scores across every category. A word stays
 * in a category's lacking list only when it is comparatively specific to
 * that category; the aggregate leaders become the overall keyword set.
 */
class CrossCategoryDeduplicator {
public:
    explicit CrossCategoryDeduplicator(DeduplicationTuning tuning);

    // Summed positive importance per word over all lacking buckets, ambiguous words excluded.
    std::map<std::string, double> aggregate(const std::vector<BucketImportance>& buckets) const;

    DeduplicationOutcome deduplicate(const std::vector<BucketImportance>& buckets) const;

    /**
     * @brief Replaces the keywords of every lacking result with its deduplicated list.
     * @post Metrics and strength results are untouched.
     */
    DeduplicationOutcome apply(std::vector<BucketImportance>& buckets) const;

private:
    bool isAmbiguous(const std::string& word) const;

    DeduplicationTuning tuning_;
};
