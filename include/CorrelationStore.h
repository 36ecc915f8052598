#pragma once

#include "InsightTypes.h"
#include "SentimentScorer.h"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

struct sqlite3;

struct RunHistoryEntry {
    int64_t version = 0;
    int64_t committedAt = 0;
    std::string trigger;
    size_t importanceCount = 0;
    bool rankingPresent = false;
    size_t correlationCount = 0;
};

/**
 * Durable, versioned storage of derived results in one SQLite database.
 * Every row is keyed by tenant. A commit replaces the tenant's whole result
 * set inside one transaction, so readers never observe a mix of versions.
 * One connection per store, serialized by an internal mutex.
 */
class CorrelationStore {
public:
    /**
     * @brief Opens (creating when needed) the database and its schema.
     * @throws Canvass::PersistenceException when the file cannot be opened or migrated.
     */
    explicit CorrelationStore(const std::string& path);
    ~CorrelationStore();

    CorrelationStore(const CorrelationStore&) = delete;
    CorrelationStore& operator=(const CorrelationStore&) = delete;

    std::optional<ImportanceResult> getLatest(const RunContext& context,
                                              const std::string& category,
                                              Polarity polarity) const;
    std::optional<SectionImportanceRanking> getOverallRanking(const RunContext& context) const;
    OverallKeywordSet getOverallKeywords(const RunContext& context) const;
    std::vector<CategoryCorrelation> getCorrelations(const RunContext& context) const;

    // Most recently committed snapshot, or nullopt before the first commit.
    std::optional<InsightSnapshot> loadLatest(const RunContext& context) const;

    /**
     * @brief Inserts or replaces one row per record id.
     * @throws Canvass::PersistenceException; no row of the batch is kept on failure.
     */
    size_t upsertSentiments(const RunContext& context, const std::vector<RecordSentiment>& results);
    std::optional<RecordSentiment> getSentiment(const RunContext& context, const std::string& recordId) const;
    std::unordered_set<std::string> analyzedRecordIds(const RunContext& context) const;
    size_t sentimentCount(const RunContext& context) const;

    /**
     * @brief Atomically replaces every derived result of the tenant.
     * @post On success the snapshot is readable under the returned version.
     * @throws Canvass::PersistenceException after rolling back; earlier results stay intact.
     */
    int64_t commitResults(const RunContext& context, const InsightSnapshot& snapshot);

    // Newest first.
    std::vector<RunHistoryEntry> runHistory(const RunContext& context, size_t limit) const;

    const std::string& path() const noexcept { return path_; }

private:
    void exec(const char* sql) const;
    void ensureSchema();

    mutable std::mutex mutex_;
    sqlite3* db_ = nullptr;
    std::string path_;
};
