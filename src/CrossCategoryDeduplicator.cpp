#include "CrossCategoryDeduplicator.h"

#include "CommonUtils.h"

#include <algorithm>
#include <unordered_set>

namespace {
std::vector<KeywordScore> sortByScore(const std::map<std::string, double>& scores) {
    std::vector<KeywordScore> out;
    out.reserve(scores.size());
    for (const auto& [word, score] : scores) out.push_back({word, score});
    std::stable_sort(out.begin(), out.end(), [](const KeywordScore& a, const KeywordScore& b) {
        return a.score > b.score;
    });
    return out;
}
}

CrossCategoryDeduplicator::CrossCategoryDeduplicator(DeduplicationTuning tuning) : tuning_(std::move(tuning)) {
    for (auto& word : tuning_.ambiguousWords) word = CommonUtils::toLower(CommonUtils::trim(word));
}

bool CrossCategoryDeduplicator::isAmbiguous(const std::string& word) const {
    const std::string lowered = CommonUtils::toLower(word);
    return std::find(tuning_.ambiguousWords.begin(), tuning_.ambiguousWords.end(), lowered) !=
           tuning_.ambiguousWords.end();
}

std::map<std::string, double> CrossCategoryDeduplicator::aggregate(const std::vector<BucketImportance>& buckets) const {
    std::map<std::string, double> totals;
    for (const auto& bucket : buckets) {
        if (bucket.result.polarity != Polarity::LACKING) continue;
        for (const auto& kw : bucket.rankedKeywords) {
            if (kw.score <= 0.0 || isAmbiguous(kw.word)) continue;
            totals[kw.word] += kw.score;
        }
    }
    return totals;
}

DeduplicationOutcome CrossCategoryDeduplicator::deduplicate(const std::vector<BucketImportance>& buckets) const {
    DeduplicationOutcome outcome;
    const std::map<std::string, double> totals = aggregate(buckets);
    const std::vector<KeywordScore> ranked = sortByScore(totals);

    const size_t commonCount = std::min(tuning_.commonVocabularySize, ranked.size());
    std::unordered_set<std::string> common;
    for (size_t i = 0; i < commonCount; ++i) {
        outcome.commonVocabulary.push_back(ranked[i].word);
        common.insert(ranked[i].word);
    }
    const size_t overallCount = std::min(tuning_.overallKeywordCount, ranked.size());
    outcome.overall.keywords.assign(ranked.begin(), ranked.begin() + static_cast<std::ptrdiff_t>(overallCount));

    // Number of lacking buckets each word carries positive importance in.
    std::map<std::string, size_t> spread;
    for (const auto& bucket : buckets) {
        if (bucket.result.polarity != Polarity::LACKING) continue;
        for (const auto& kw : bucket.rankedKeywords) {
            if (kw.score > 0.0) ++spread[kw.word];
        }
    }

    for (const auto& bucket : buckets) {
        if (bucket.result.polarity != Polarity::LACKING) continue;
        const std::string& category = bucket.result.category;

        std::vector<KeywordScore> candidates;
        std::vector<std::pair<KeywordScore, double>> specialized;
        for (const auto& kw : bucket.rankedKeywords) {
            if (kw.score <= 0.0 || common.count(kw.word) > 0 || isAmbiguous(kw.word)) continue;
            candidates.push_back(kw);

            auto it = totals.find(kw.word);
            const double overallScore = it == totals.end() ? 0.0 : it->second;
            const double ratio = overallScore > 0.0 ? kw.score / overallScore : 1.0;
            if (overallScore == 0.0 || ratio >= tuning_.specializationThreshold) {
                specialized.emplace_back(kw, ratio * kw.score);
            }
        }
        std::stable_sort(specialized.begin(), specialized.end(), [](const auto& a, const auto& b) {
            return a.second > b.second;
        });

        std::vector<KeywordScore> chosen;
        const bool fallback = specialized.size() < tuning_.minKeywords;
        if (fallback) {
            chosen = std::move(candidates);
        } else {
            for (auto& entry : specialized) chosen.push_back(std::move(entry.first));
        }
        if (chosen.empty()) {
            // A small vocabulary can land entirely in the common set; words no
            // other lacking bucket shares are still specific to this category.
            for (const auto& kw : bucket.rankedKeywords) {
                if (kw.score > 0.0 && !isAmbiguous(kw.word) && spread[kw.word] <= 1) chosen.push_back(kw);
            }
        }
        if (chosen.size() > tuning_.maxKeywords) chosen.resize(tuning_.maxKeywords);

        outcome.usedFallback[category] = fallback;
        outcome.finalKeywords[category] = std::move(chosen);
    }
    return outcome;
}

DeduplicationOutcome CrossCategoryDeduplicator::apply(std::vector<BucketImportance>& buckets) const {
    DeduplicationOutcome outcome = deduplicate(buckets);
    for (auto& bucket : buckets) {
        if (bucket.result.polarity != Polarity::LACKING) continue;
        auto it = outcome.finalKeywords.find(bucket.result.category);
        if (it != outcome.finalKeywords.end()) bucket.result.keywords = it->second;
    }
    return outcome;
}
