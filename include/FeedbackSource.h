#pragma once

#include "InsightTypes.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct FeedbackRecord {
    std::string id;
    std::string text;
    std::map<std::string, double> categoryScores; // missing categories are absent
    int64_t submittedAt = 0;                      // 0 => unknown
    bool complete = true;

    std::optional<double> score(const std::string& category) const;
    // Mean of the available category scores, or nullopt when none are present.
    std::optional<double> meanScore() const;
};

struct FeedbackQuery {
    std::optional<int64_t> since;   // inclusive
    std::optional<int64_t> until;   // inclusive
    std::string requiredCategory;   // empty => any

    bool matches(const FeedbackRecord& record) const;
};

/**
 * Read-only supplier of survey records. Implementations are owned by the
 * embedding application and must be safe to call from the pipeline thread.
 */
class FeedbackSource {
public:
    virtual ~FeedbackSource() = default;

    /**
     * @brief All complete records of the context's tenant that satisfy the query.
     * @throws Canvass::IOException when the backing data cannot be read.
     */
    virtual std::vector<FeedbackRecord> completeRecords(const RunContext& context,
                                                        const FeedbackQuery& query) const = 0;
};

class InMemoryFeedbackSource final : public FeedbackSource {
public:
    void add(const RunContext& context, FeedbackRecord record);
    void clear(const RunContext& context);
    size_t size(const RunContext& context) const;

    std::vector<FeedbackRecord> completeRecords(const RunContext& context,
                                                const FeedbackQuery& query) const override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<FeedbackRecord>> recordsByTenant_;
};

struct CsvSourceOptions {
    std::string path;
    char delimiter = ',';
    std::string textColumn = "free_text_box";
    std::string idColumn = "uid";          // missing => 1-based row number
    std::string completeColumn;            // empty => every row is complete
    std::string dateColumn = "review_date";
    std::vector<std::string> categories;
    // Category -> survey question columns averaged into its score. A category
    // with no mapping reads a column carrying its own name.
    std::map<std::string, std::vector<std::string>> categoryColumns;
    bool verbose = false;
};

/**
 * Survey export reader. The file is re-read on every call so that a retrain
 * always sees the current export. The tenant in the context is not used.
 */
class CsvFeedbackSource final : public FeedbackSource {
public:
    explicit CsvFeedbackSource(CsvSourceOptions options);

    std::vector<FeedbackRecord> completeRecords(const RunContext& context,
                                                const FeedbackQuery& query) const override;

    static const std::map<std::string, std::vector<std::string>>& defaultCategoryColumns();

private:
    CsvSourceOptions options_;
};
