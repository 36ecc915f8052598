#include "CorrelationStore.h"

#include "CanvassExceptions.h"
#include "CommonUtils.h"

#include <sqlite3.h>

#include <iostream>
#include <utility>

namespace {
constexpr int kBusyTimeoutMs = 30000;

constexpr const char* kConnectionPragmas =
    "PRAGMA journal_mode=WAL;"
    "PRAGMA synchronous=NORMAL;"
    "PRAGMA foreign_keys=ON;";

constexpr const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS sentiment_results (
    tenant TEXT NOT NULL,
    record_id TEXT NOT NULL,
    compound REAL NOT NULL,
    pos REAL NOT NULL,
    neu REAL NOT NULL,
    neg REAL NOT NULL,
    label TEXT NOT NULL,
    confidence REAL NOT NULL,
    text_length INTEGER NOT NULL,
    analyzed_at INTEGER NOT NULL,
    PRIMARY KEY (tenant, record_id)
);
CREATE TABLE IF NOT EXISTS result_versions (
    tenant TEXT NOT NULL,
    version INTEGER NOT NULL,
    committed_at INTEGER NOT NULL,
    trigger_name TEXT NOT NULL,
    importance_count INTEGER NOT NULL,
    ranking_present INTEGER NOT NULL,
    correlation_count INTEGER NOT NULL,
    PRIMARY KEY (tenant, version)
);
CREATE TABLE IF NOT EXISTS importance_results (
    tenant TEXT NOT NULL,
    category TEXT NOT NULL,
    polarity TEXT NOT NULL,
    model_r2 REAL NOT NULL,
    mae REAL NOT NULL,
    rmse REAL NOT NULL,
    sample_size INTEGER NOT NULL,
    trained_at INTEGER NOT NULL,
    version INTEGER NOT NULL,
    PRIMARY KEY (tenant, category, polarity)
);
CREATE TABLE IF NOT EXISTS importance_keywords (
    tenant TEXT NOT NULL,
    category TEXT NOT NULL,
    polarity TEXT NOT NULL,
    ordinal INTEGER NOT NULL,
    word TEXT NOT NULL,
    score REAL NOT NULL,
    PRIMARY KEY (tenant, category, polarity, ordinal)
);
CREATE TABLE IF NOT EXISTS section_ranking (
    tenant TEXT PRIMARY KEY,
    r2 REAL NOT NULL,
    mae REAL NOT NULL,
    sample_size INTEGER NOT NULL,
    trained_at INTEGER NOT NULL,
    version INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS section_ranking_entries (
    tenant TEXT NOT NULL,
    ordinal INTEGER NOT NULL,
    category TEXT NOT NULL,
    importance REAL NOT NULL,
    PRIMARY KEY (tenant, ordinal)
);
CREATE TABLE IF NOT EXISTS overall_keywords (
    tenant TEXT NOT NULL,
    ordinal INTEGER NOT NULL,
    word TEXT NOT NULL,
    score REAL NOT NULL,
    PRIMARY KEY (tenant, ordinal)
);
CREATE TABLE IF NOT EXISTS category_correlations (
    tenant TEXT NOT NULL,
    category TEXT NOT NULL,
    correlation REAL NOT NULL,
    r2 REAL NOT NULL,
    mae REAL NOT NULL,
    training_samples INTEGER NOT NULL,
    test_samples INTEGER NOT NULL,
    position INTEGER NOT NULL,
    PRIMARY KEY (tenant, category)
);
)SQL";

void execSql(sqlite3* db, const char* sql) {
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        const std::string message = errMsg ? errMsg : sqlite3_errstr(rc);
        sqlite3_free(errMsg);
        throw Canvass::PersistenceException("SQL error: " + message);
    }
}

// Prepared statement owned for one scope.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw Canvass::PersistenceException(std::string("prepare failed: ") + sqlite3_errmsg(db_));
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bindText(int idx, const std::string& value) {
        check(sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
        return *this;
    }
    Statement& bindInt(int idx, int64_t value) {
        check(sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(value)));
        return *this;
    }
    Statement& bindDouble(int idx, double value) {
        check(sqlite3_bind_double(stmt_, idx, value));
        return *this;
    }

    // True while a row is available.
    bool step() {
        const int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw Canvass::PersistenceException(std::string("step failed: ") + sqlite3_errmsg(db_));
    }

    void run() {
        while (step()) {
        }
    }

    void reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    std::string text(int col) const {
        const unsigned char* raw = sqlite3_column_text(stmt_, col);
        return raw ? std::string(reinterpret_cast<const char*>(raw)) : std::string();
    }
    int64_t integer(int col) const { return static_cast<int64_t>(sqlite3_column_int64(stmt_, col)); }
    double real(int col) const { return sqlite3_column_double(stmt_, col); }

private:
    void check(int rc) const {
        if (rc != SQLITE_OK) {
            throw Canvass::PersistenceException(std::string("bind failed: ") + sqlite3_errmsg(db_));
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

// BEGIN IMMEDIATE on construction, ROLLBACK unless commit() was reached.
class Transaction {
public:
    // Writers take the write lock up front; readers pass "BEGIN" to pin one WAL snapshot.
    explicit Transaction(sqlite3* db, const char* begin = "BEGIN IMMEDIATE") : db_(db) { execSql(db_, begin); }
    ~Transaction() {
        if (committed_) return;
        char* errMsg = nullptr;
        if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, &errMsg) != SQLITE_OK) {
            std::cerr << "[Canvass][Warning] Rollback failed: " << (errMsg ? errMsg : "unknown") << "\n";
        }
        sqlite3_free(errMsg);
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        execSql(db_, "COMMIT");
        committed_ = true;
    }

private:
    sqlite3* db_;
    bool committed_ = false;
};

Polarity parsePolarity(const std::string& raw) {
    const auto polarity = polarityFromString(raw);
    if (!polarity) throw Canvass::PersistenceException("unknown polarity in store: " + raw);
    return *polarity;
}

std::vector<KeywordScore> readKeywords(sqlite3* db,
                                       const std::string& tenant,
                                       const std::string& category,
                                       Polarity polarity) {
    Statement stmt(db,
                   "SELECT word, score FROM importance_keywords "
                   "WHERE tenant = ?1 AND category = ?2 AND polarity = ?3 ORDER BY ordinal");
    stmt.bindText(1, tenant).bindText(2, category).bindText(3, polarityToString(polarity));
    std::vector<KeywordScore> out;
    while (stmt.step()) out.push_back({stmt.text(0), stmt.real(1)});
    return out;
}

ImportanceResult readImportanceRow(sqlite3* db, const std::string& tenant, const Statement& row) {
    ImportanceResult result;
    result.category = row.text(0);
    result.polarity = parsePolarity(row.text(1));
    result.modelR2 = row.real(2);
    result.mae = row.real(3);
    result.rmse = row.real(4);
    result.sampleSize = static_cast<size_t>(row.integer(5));
    result.trainedAt = row.integer(6);
    result.keywords = readKeywords(db, tenant, result.category, result.polarity);
    return result;
}

constexpr const char* kSelectImportance =
    "SELECT category, polarity, model_r2, mae, rmse, sample_size, trained_at FROM importance_results ";

std::vector<ImportanceResult> readAllImportance(sqlite3* db, const std::string& tenant) {
    Statement stmt(db, (std::string(kSelectImportance) + "WHERE tenant = ?1 ORDER BY category, polarity DESC").c_str());
    stmt.bindText(1, tenant);
    std::vector<ImportanceResult> out;
    while (stmt.step()) out.push_back(readImportanceRow(db, tenant, stmt));
    return out;
}

std::optional<SectionImportanceRanking> readRanking(sqlite3* db, const std::string& tenant) {
    Statement head(db, "SELECT r2, mae, sample_size, trained_at FROM section_ranking WHERE tenant = ?1");
    head.bindText(1, tenant);
    if (!head.step()) return std::nullopt;

    SectionImportanceRanking ranking;
    ranking.r2 = head.real(0);
    ranking.mae = head.real(1);
    ranking.sampleSize = static_cast<size_t>(head.integer(2));
    ranking.trainedAt = head.integer(3);

    Statement entries(db,
                      "SELECT category, importance FROM section_ranking_entries WHERE tenant = ?1 ORDER BY ordinal");
    entries.bindText(1, tenant);
    while (entries.step()) {
        const std::string category = entries.text(0);
        ranking.sortedCategories.push_back(category);
        ranking.importancePerCategory[category] = entries.real(1);
    }
    return ranking;
}

OverallKeywordSet readOverallKeywords(sqlite3* db, const std::string& tenant) {
    Statement stmt(db, "SELECT word, score FROM overall_keywords WHERE tenant = ?1 ORDER BY ordinal");
    stmt.bindText(1, tenant);
    OverallKeywordSet out;
    while (stmt.step()) out.keywords.push_back({stmt.text(0), stmt.real(1)});
    return out;
}

std::vector<CategoryCorrelation> readCorrelations(sqlite3* db, const std::string& tenant) {
    Statement stmt(db,
                   "SELECT category, correlation, r2, mae, training_samples, test_samples "
                   "FROM category_correlations WHERE tenant = ?1 ORDER BY position");
    stmt.bindText(1, tenant);
    std::vector<CategoryCorrelation> out;
    while (stmt.step()) {
        CategoryCorrelation c;
        c.category = stmt.text(0);
        c.correlation = stmt.real(1);
        c.r2 = stmt.real(2);
        c.mae = stmt.real(3);
        c.trainingSamples = static_cast<size_t>(stmt.integer(4));
        c.testSamples = static_cast<size_t>(stmt.integer(5));
        out.push_back(std::move(c));
    }
    return out;
}

std::optional<std::pair<int64_t, int64_t>> readLatestVersion(sqlite3* db, const std::string& tenant) {
    Statement stmt(db,
                   "SELECT version, committed_at FROM result_versions WHERE tenant = ?1 "
                   "ORDER BY version DESC LIMIT 1");
    stmt.bindText(1, tenant);
    if (!stmt.step()) return std::nullopt;
    return std::make_pair(stmt.integer(0), stmt.integer(1));
}

void deleteTenantResults(sqlite3* db, const std::string& tenant) {
    static const char* kTables[] = {
        "importance_keywords", "importance_results", "section_ranking_entries",
        "section_ranking", "overall_keywords", "category_correlations"
    };
    for (const char* table : kTables) {
        Statement stmt(db, (std::string("DELETE FROM ") + table + " WHERE tenant = ?1").c_str());
        stmt.bindText(1, tenant);
        stmt.run();
    }
}
}

CorrelationStore::CorrelationStore(const std::string& path) : path_(path) {
    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        const std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw Canvass::PersistenceException("Failed to open database " + path_ + ": " + message);
    }
    sqlite3_busy_timeout(db_, kBusyTimeoutMs);
    try {
        exec(kConnectionPragmas);
        ensureSchema();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

CorrelationStore::~CorrelationStore() {
    if (db_) sqlite3_close(db_);
}

void CorrelationStore::exec(const char* sql) const {
    execSql(db_, sql);
}

void CorrelationStore::ensureSchema() {
    Transaction tx(db_);
    exec(kSchema);
    tx.commit();
}

std::optional<ImportanceResult> CorrelationStore::getLatest(const RunContext& context,
                                                            const std::string& category,
                                                            Polarity polarity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, (std::string(kSelectImportance) + "WHERE tenant = ?1 AND category = ?2 AND polarity = ?3").c_str());
    stmt.bindText(1, context.tenant).bindText(2, category).bindText(3, polarityToString(polarity));
    if (!stmt.step()) return std::nullopt;
    return readImportanceRow(db_, context.tenant, stmt);
}

std::optional<SectionImportanceRanking> CorrelationStore::getOverallRanking(const RunContext& context) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return readRanking(db_, context.tenant);
}

OverallKeywordSet CorrelationStore::getOverallKeywords(const RunContext& context) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return readOverallKeywords(db_, context.tenant);
}

std::vector<CategoryCorrelation> CorrelationStore::getCorrelations(const RunContext& context) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return readCorrelations(db_, context.tenant);
}

std::optional<InsightSnapshot> CorrelationStore::loadLatest(const RunContext& context) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(db_, "BEGIN");
    const auto latest = readLatestVersion(db_, context.tenant);
    if (!latest) return std::nullopt;

    InsightSnapshot snapshot;
    snapshot.version = latest->first;
    snapshot.committedAt = latest->second;
    snapshot.importanceResults = readAllImportance(db_, context.tenant);
    snapshot.ranking = readRanking(db_, context.tenant);
    snapshot.overallKeywords = readOverallKeywords(db_, context.tenant);
    snapshot.correlations = readCorrelations(db_, context.tenant);
    tx.commit();
    return snapshot;
}

size_t CorrelationStore::upsertSentiments(const RunContext& context, const std::vector<RecordSentiment>& results) {
    if (results.empty()) return 0;
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(db_);
    Statement stmt(db_,
                   "INSERT INTO sentiment_results "
                   "(tenant, record_id, compound, pos, neu, neg, label, confidence, text_length, analyzed_at) "
                   "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10) "
                   "ON CONFLICT(tenant, record_id) DO UPDATE SET "
                   "compound = excluded.compound, pos = excluded.pos, neu = excluded.neu, neg = excluded.neg, "
                   "label = excluded.label, confidence = excluded.confidence, "
                   "text_length = excluded.text_length, analyzed_at = excluded.analyzed_at");
    for (const auto& entry : results) {
        stmt.bindText(1, context.tenant)
            .bindText(2, entry.recordId)
            .bindDouble(3, entry.result.compound)
            .bindDouble(4, entry.result.pos)
            .bindDouble(5, entry.result.neu)
            .bindDouble(6, entry.result.neg)
            .bindText(7, sentimentLabelToString(entry.result.label))
            .bindDouble(8, entry.result.confidence)
            .bindInt(9, static_cast<int64_t>(entry.textLength))
            .bindInt(10, entry.analyzedAt);
        stmt.run();
        stmt.reset();
    }
    tx.commit();
    return results.size();
}

std::optional<RecordSentiment> CorrelationStore::getSentiment(const RunContext& context,
                                                              const std::string& recordId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_,
                   "SELECT compound, pos, neu, neg, label, confidence, text_length, analyzed_at "
                   "FROM sentiment_results WHERE tenant = ?1 AND record_id = ?2");
    stmt.bindText(1, context.tenant).bindText(2, recordId);
    if (!stmt.step()) return std::nullopt;

    RecordSentiment out;
    out.recordId = recordId;
    out.result.compound = stmt.real(0);
    out.result.pos = stmt.real(1);
    out.result.neu = stmt.real(2);
    out.result.neg = stmt.real(3);
    out.result.label = sentimentLabelFromString(stmt.text(4));
    out.result.confidence = stmt.real(5);
    out.textLength = static_cast<size_t>(stmt.integer(6));
    out.analyzedAt = stmt.integer(7);
    return out;
}

std::unordered_set<std::string> CorrelationStore::analyzedRecordIds(const RunContext& context) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "SELECT record_id FROM sentiment_results WHERE tenant = ?1");
    stmt.bindText(1, context.tenant);
    std::unordered_set<std::string> ids;
    while (stmt.step()) ids.insert(stmt.text(0));
    return ids;
}

size_t CorrelationStore::sentimentCount(const RunContext& context) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "SELECT COUNT(*) FROM sentiment_results WHERE tenant = ?1");
    stmt.bindText(1, context.tenant);
    return stmt.step() ? static_cast<size_t>(stmt.integer(0)) : 0;
}

int64_t CorrelationStore::commitResults(const RunContext& context, const InsightSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string& tenant = context.tenant;
    Transaction tx(db_);

    int64_t version = 1;
    {
        Statement stmt(db_, "SELECT COALESCE(MAX(version), 0) + 1 FROM result_versions WHERE tenant = ?1");
        stmt.bindText(1, tenant);
        if (stmt.step()) version = stmt.integer(0);
    }
    const int64_t committedAt = snapshot.committedAt > 0 ? snapshot.committedAt : CommonUtils::nowUnixSeconds();

    deleteTenantResults(db_, tenant);

    {
        Statement result(db_,
                         "INSERT INTO importance_results "
                         "(tenant, category, polarity, model_r2, mae, rmse, sample_size, trained_at, version) "
                         "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)");
        Statement keyword(db_,
                          "INSERT INTO importance_keywords (tenant, category, polarity, ordinal, word, score) "
                          "VALUES (?1, ?2, ?3, ?4, ?5, ?6)");
        for (const auto& r : snapshot.importanceResults) {
            const std::string polarity = polarityToString(r.polarity);
            result.bindText(1, tenant)
                .bindText(2, r.category)
                .bindText(3, polarity)
                .bindDouble(4, r.modelR2)
                .bindDouble(5, r.mae)
                .bindDouble(6, r.rmse)
                .bindInt(7, static_cast<int64_t>(r.sampleSize))
                .bindInt(8, r.trainedAt)
                .bindInt(9, version);
            result.run();
            result.reset();

            for (size_t rank = 0; rank < r.keywords.size(); ++rank) {
                keyword.bindText(1, tenant)
                    .bindText(2, r.category)
                    .bindText(3, polarity)
                    .bindInt(4, static_cast<int64_t>(rank))
                    .bindText(5, r.keywords[rank].word)
                    .bindDouble(6, r.keywords[rank].score);
                keyword.run();
                keyword.reset();
            }
        }
    }

    if (snapshot.ranking) {
        const auto& ranking = *snapshot.ranking;
        Statement head(db_,
                       "INSERT INTO section_ranking (tenant, r2, mae, sample_size, trained_at, version) "
                       "VALUES (?1, ?2, ?3, ?4, ?5, ?6)");
        head.bindText(1, tenant)
            .bindDouble(2, ranking.r2)
            .bindDouble(3, ranking.mae)
            .bindInt(4, static_cast<int64_t>(ranking.sampleSize))
            .bindInt(5, ranking.trainedAt)
            .bindInt(6, version);
        head.run();

        Statement entry(db_,
                        "INSERT INTO section_ranking_entries (tenant, ordinal, category, importance) "
                        "VALUES (?1, ?2, ?3, ?4)");
        for (size_t rank = 0; rank < ranking.sortedCategories.size(); ++rank) {
            const std::string& category = ranking.sortedCategories[rank];
            auto it = ranking.importancePerCategory.find(category);
            entry.bindText(1, tenant)
                .bindInt(2, static_cast<int64_t>(rank))
                .bindText(3, category)
                .bindDouble(4, it == ranking.importancePerCategory.end() ? 0.0 : it->second);
            entry.run();
            entry.reset();
        }
    }

    {
        Statement stmt(db_, "INSERT INTO overall_keywords (tenant, ordinal, word, score) VALUES (?1, ?2, ?3, ?4)");
        for (size_t rank = 0; rank < snapshot.overallKeywords.keywords.size(); ++rank) {
            const auto& kw = snapshot.overallKeywords.keywords[rank];
            stmt.bindText(1, tenant).bindInt(2, static_cast<int64_t>(rank)).bindText(3, kw.word).bindDouble(4, kw.score);
            stmt.run();
            stmt.reset();
        }
    }

    {
        Statement stmt(db_,
                       "INSERT INTO category_correlations "
                       "(tenant, category, correlation, r2, mae, training_samples, test_samples, position) "
                       "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)");
        for (size_t i = 0; i < snapshot.correlations.size(); ++i) {
            const auto& c = snapshot.correlations[i];
            stmt.bindText(1, tenant)
                .bindText(2, c.category)
                .bindDouble(3, c.correlation)
                .bindDouble(4, c.r2)
                .bindDouble(5, c.mae)
                .bindInt(6, static_cast<int64_t>(c.trainingSamples))
                .bindInt(7, static_cast<int64_t>(c.testSamples))
                .bindInt(8, static_cast<int64_t>(i));
            stmt.run();
            stmt.reset();
        }
    }

    {
        Statement stmt(db_,
                       "INSERT INTO result_versions "
                       "(tenant, version, committed_at, trigger_name, importance_count, ranking_present, correlation_count) "
                       "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)");
        stmt.bindText(1, tenant)
            .bindInt(2, version)
            .bindInt(3, committedAt)
            .bindText(4, context.trigger)
            .bindInt(5, static_cast<int64_t>(snapshot.importanceResults.size()))
            .bindInt(6, snapshot.ranking ? 1 : 0)
            .bindInt(7, static_cast<int64_t>(snapshot.correlations.size()));
        stmt.run();
    }

    tx.commit();
    return version;
}

std::vector<RunHistoryEntry> CorrelationStore::runHistory(const RunContext& context, size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_,
                   "SELECT version, committed_at, trigger_name, importance_count, ranking_present, correlation_count "
                   "FROM result_versions WHERE tenant = ?1 ORDER BY version DESC LIMIT ?2");
    stmt.bindText(1, context.tenant).bindInt(2, static_cast<int64_t>(limit));
    std::vector<RunHistoryEntry> out;
    while (stmt.step()) {
        RunHistoryEntry entry;
        entry.version = stmt.integer(0);
        entry.committedAt = stmt.integer(1);
        entry.trigger = stmt.text(2);
        entry.importanceCount = static_cast<size_t>(stmt.integer(3));
        entry.rankingPresent = stmt.integer(4) != 0;
        entry.correlationCount = static_cast<size_t>(stmt.integer(5));
        out.push_back(std::move(entry));
    }
    return out;
}
