#pragma once

#include "CanvassConfig.h"
#include "FeedbackSource.h"
#include "InsightTypes.h"

#include <map>
#include <string>
#include <vector>

/**
 * Ranks categories by how much they drive the overall score of satisfied
 * respondents. Features are the category scores themselves; the target is
 * the record's mean score.
 */
class SectionImportanceRanker {
public:
    SectionImportanceRanker(RankerTuning tuning, std::vector<std::string> categories);

    // Corpus-wide mean per category over the given records, or the fallback when absent.
    std::map<std::string, double> categoryMeans(const std::vector<FeedbackRecord>& records) const;

    /**
     * @brief Trains the ranking ensemble over records whose mean score reaches the threshold.
     * @post sortedCategories is a permutation of the configured categories and
     *       importancePerCategory sums to 1.
     * @throws Canvass::InsufficientDataException below minSamples qualifying records.
     * @throws Canvass::TrainingException when no split carries information.
     */
    SectionImportanceRanking rank(const std::vector<FeedbackRecord>& records) const;

private:
    RankerTuning tuning_;
    std::vector<std::string> categories_;
};
