#include "CanvassConfig.h"
#include "CanvassExceptions.h"
#include "CategoryWeightVectorizer.h"
#include "CorrelationStore.h"
#include "CrossCategoryDeduplicator.h"
#include "FeedbackSource.h"
#include "InsightService.h"
#include "ModelRegistry.h"
#include "PerCategoryImportanceTrainer.h"
#include "PipelineOrchestrator.h"
#include "RandomForest.h"
#include "SectionImportanceRanker.h"
#include "SentimentScorer.h"
#include "TextNormalizer.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

std::string temp_path(const std::string& name) {
    const fs::path path = fs::temp_directory_path() / ("canvass_test_" + name);
    for (const char* suffix : {"", "-wal", "-shm", "-journal"}) {
        fs::remove(path.string() + suffix);
    }
    return path.string();
}

FeedbackRecord make_record(const std::string& id, const std::string& text,
                           std::map<std::string, double> scores) {
    FeedbackRecord r;
    r.id = id;
    r.text = text;
    r.categoryScores = std::move(scores);
    return r;
}

bool contains(const std::vector<std::string>& words, const std::string& word) {
    return std::find(words.begin(), words.end(), word) != words.end();
}

CanvassConfig two_category_config(const std::string& dbPath) {
    CanvassConfig config;
    config.databasePath = dbPath;
    config.categories = {"Pay", "Culture"};
    return config;
}

// 48 records: Pay drives low scores through "late unpaid" versus "low raise",
// Culture is the only varying score among satisfied respondents.
void add_survey(InMemoryFeedbackSource& source, const RunContext& ctx) {
    const char* filler[] = {"office", "remote", "project", "meeting"};
    for (int i = 0; i < 48; ++i) {
        const bool payHigh = i % 2 == 0;
        const bool cultureHigh = i % 3 != 2;
        const double pay = payHigh ? 4.5 : (i % 4 == 1 ? 1.0 : 2.0);
        const double culture = cultureHigh ? (i % 6 == 0 ? 5.0 : 4.0) : 2.0;

        std::string text = payHigh ? "salary bonus generous" : (i % 4 == 1 ? "salary late unpaid" : "salary low raise");
        text += cultureHigh ? " team friendly supportive " : " toxic gossip manager ";
        text += filler[i % 4];
        if (i % 5 == 0) text += " good nice";
        source.add(ctx, make_record("r" + std::to_string(i), text, {{"Pay", pay}, {"Culture", culture}}));
    }
}

class FailingSource final : public FeedbackSource {
public:
    std::vector<FeedbackRecord> completeRecords(const RunContext&, const FeedbackQuery&) const override {
        throw Canvass::IOException("export unavailable");
    }
};

void test_text_normalizer() {
    std::cout << "Testing TextNormalizer..." << std::endl;

    TextNormalizer normalizer;
    const NormalizedText text = normalizer.normalize("The Managers are NOT listening!!");
    assert(text.tokens.size() == 2);
    assert(text.tokens[0] == "manager");
    assert(text.tokens[1] == "listening");
    assert(text.joined() == "manager listening");

    assert(TextNormalizer::lemmatize("bonuses") == "bonus");
    assert(TextNormalizer::lemmatize("companies") == "company");
    assert(TextNormalizer::lemmatize("bonus") == "bonus");
    assert(TextNormalizer::lemmatize("goes") == "go");
    assert(TextNormalizer::lemmatize("heroes") == "hero");
    assert(TextNormalizer::lemmatize("shoes") == "shoe");
    assert(normalizer.normalize("").empty());
    assert(normalizer.normalize("I've 123 there!").empty());

    std::cout << "  PASS" << std::endl;
}

void test_sentiment_scorer() {
    std::cout << "Testing SentimentScorer..." << std::endl;

    SentimentScorer scorer;
    const SentimentResult empty = scorer.analyze("");
    assert(empty.compound == 0.0);
    assert(empty.pos == 0.0);
    assert(empty.neu == 1.0);
    assert(empty.neg == 0.0);
    assert(empty.label == SentimentLabel::NEUTRAL);
    assert(empty.confidence == 0.0);

    assert(scorer.analyze("I love this great team").label == SentimentLabel::POSITIVE);
    assert(scorer.analyze("terrible awful management").label == SentimentLabel::NEGATIVE);

    for (const char* text : {"GREAT!!! love love love", "not bad at all", "horrible, horrible, HORRIBLE",
                             "the office", ":) but terrible"}) {
        const SentimentResult r = scorer.analyze(text);
        assert(r.compound >= -1.0 && r.compound <= 1.0);
        assert(std::abs(r.pos + r.neu + r.neg - 1.0) < 1e-6);
    }

    assert(SentimentScorer::classify(0.05, 0.2, 0.8, 0.0).label == SentimentLabel::POSITIVE);
    assert(SentimentScorer::classify(0.0499, 0.1, 0.9, 0.0).label == SentimentLabel::NEUTRAL);
    assert(SentimentScorer::classify(-0.05, 0.0, 0.8, 0.2).label == SentimentLabel::NEGATIVE);
    assert(SentimentScorer::classify(-0.0499, 0.0, 0.9, 0.1).label == SentimentLabel::NEUTRAL);

    const std::string lexiconPath = temp_path("lexicon.txt");
    {
        std::ofstream out(lexiconPath);
        out << "overtime\t-2.0\t0.4\t[-2, -2]\n"
            << "bonus\t2.2\t0.6\t[2, 2]\n";
    }
    const SentimentScorer custom = SentimentScorer::fromLexiconFile(lexiconPath);
    assert(custom.lexiconSize() == 2);
    assert(custom.analyze("unpaid overtime").label == SentimentLabel::NEGATIVE);
    assert(custom.analyze("great").label == SentimentLabel::NEUTRAL);

    {
        std::ofstream out(lexiconPath);
        out << "bonus\tlots\n";
    }
    bool threw = false;
    try {
        SentimentScorer::fromLexiconFile(lexiconPath);
    } catch (const Canvass::ConfigurationException&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_vectorizer() {
    std::cout << "Testing CategoryWeightVectorizer..." << std::endl;

    CategoryWeightVectorizer unfitted;
    bool threw = false;
    try {
        unfitted.transform("salary");
    } catch (const Canvass::VectorizationException&) {
        threw = true;
    }
    assert(threw);

    CategoryWeightVectorizer vectorizer;
    const auto rows = vectorizer.fitTransform({"salary bonus", "salary raise", "bonus raise"});
    assert(vectorizer.vocabularySize() == 3);
    assert(vectorizer.indexOf("salary").has_value());
    assert(!vectorizer.indexOf("manager").has_value());
    for (const auto& row : rows) {
        double norm = 0.0;
        for (const auto& entry : row) norm += entry.second * entry.second;
        assert(std::abs(norm - 1.0) < 1e-9);
    }

    VectorizerOptions options;
    options.removeStopWords = true;
    CategoryWeightVectorizer stopOnly(options);
    threw = false;
    try {
        stopOnly.fit({"the and of", "is it the"});
    } catch (const Canvass::VectorizationException&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_random_forest() {
    std::cout << "Testing RandomForestRegressor..." << std::endl;

    RandomForestRegressor::Matrix X;
    std::vector<double> y;
    for (int i = 0; i < 20; ++i) {
        X.push_back({static_cast<double>(i), 1.0});
        y.push_back(i < 10 ? 1.0 : 5.0);
    }

    ForestOptions options;
    options.nEstimators = 25;
    RandomForestRegressor forest(options);
    forest.fit(X, y);
    assert(forest.fitted());
    const auto& importances = forest.featureImportances();
    assert(importances.size() == 2);
    assert(std::abs(importances[0] - 1.0) < 1e-9);
    assert(importances[1] == 0.0);
    assert(forest.predict(X[0]) < 3.0);
    assert(forest.predict(X[19]) > 3.0);

    RandomForestRegressor again(options);
    again.fit(X, y);
    assert(again.predict(X) == forest.predict(X));

    bool threw = false;
    try {
        RandomForestRegressor ragged(options);
        ragged.fit({{1.0, 2.0}, {1.0}}, {1.0, 2.0});
    } catch (const Canvass::TrainingException&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_trainer_buckets() {
    std::cout << "Testing PerCategoryImportanceTrainer buckets..." << std::endl;

    PerCategoryImportanceTrainer trainer(TrainerTuning{});
    assert(trainer.inBucket(4.0, Polarity::STRENGTH));
    assert(!trainer.inBucket(3.99, Polarity::STRENGTH));
    assert(trainer.inBucket(2.99, Polarity::LACKING));
    assert(!trainer.inBucket(3.0, Polarity::LACKING));

    std::vector<PreparedDocument> docs;
    for (int i = 0; i < 9; ++i) docs.push_back({"d" + std::to_string(i), "salary late", {{"Pay", 1.0}}});
    bool threw = false;
    try {
        trainer.train(docs, "Pay", Polarity::LACKING);
    } catch (const Canvass::InsufficientDataException&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_pay_scenario() {
    std::cout << "Testing Pay strength scenario..." << std::endl;

    const RunContext ctx;
    InMemoryFeedbackSource source;
    for (int i = 0; i < 12; ++i) {
        source.add(ctx, make_record("p" + std::to_string(i), "salary bonus raise", {{"Pay", 4.5}, {"Culture", 3.0}}));
    }
    for (int i = 0; i < 8; ++i) {
        source.add(ctx, make_record("g" + std::to_string(i), "the office is fine", {{"Pay", 3.0}, {"Culture", 3.0}}));
    }

    CanvassConfig config = two_category_config(temp_path("pay.db"));
    config.correlation.enabled = false;
    CorrelationStore store(config.databasePath);
    ModelRegistry registry;
    SentimentScorer scorer;
    PipelineOrchestrator orchestrator(config, source, store, registry, scorer);
    InsightService service(orchestrator, store, registry, scorer);

    const PipelineRunSummary summary = service.trainAll(ctx);
    assert(!summary.failed);
    assert(summary.persisted);
    assert(summary.trained == 1);
    assert(summary.skipped == 3);
    assert(summary.sentimentsComputed == 20);

    const auto pay = service.getKeywords(ctx, "Pay", Polarity::STRENGTH);
    assert(pay.has_value());
    assert(pay->sampleSize == 12);
    const auto words = pay->words();
    assert(words.size() <= 5);
    assert(contains(words, "salary"));
    assert(contains(words, "bonus"));
    assert(contains(words, "raise"));

    assert(!service.getKeywords(ctx, "Pay", Polarity::LACKING).has_value());
    assert(!service.getSectionRanking(ctx).has_value());

    std::cout << "  PASS" << std::endl;
}

void test_absent_below_minimum() {
    std::cout << "Testing absent result below minimum samples..." << std::endl;

    const RunContext ctx;
    InMemoryFeedbackSource source;
    for (int i = 0; i < 9; ++i) {
        source.add(ctx, make_record("p" + std::to_string(i), "salary bonus raise", {{"Pay", 4.5}}));
    }

    CanvassConfig config = two_category_config(temp_path("absent.db"));
    CorrelationStore store(config.databasePath);
    ModelRegistry registry;
    SentimentScorer scorer;
    PipelineOrchestrator orchestrator(config, source, store, registry, scorer);
    InsightService service(orchestrator, store, registry, scorer);

    const PipelineRunSummary summary = service.trainAll(ctx);
    assert(!summary.failed);
    assert(summary.persisted);
    assert(summary.version == 1);
    assert(summary.trained == 0);
    assert(!service.getKeywords(ctx, "Pay", Polarity::STRENGTH).has_value());
    assert(!store.getLatest(ctx, "Pay", Polarity::STRENGTH).has_value());
    assert(registry.current(ctx)->empty());
    assert(!service.hasResults(ctx));

    bool sawPayStrength = false;
    for (const auto& error : summary.errors) {
        if (error.category == "Pay" && error.polarity == Polarity::STRENGTH) {
            assert(error.kind == StageErrorKind::InsufficientData);
            sawPayStrength = true;
        }
    }
    assert(sawPayStrength);

    std::cout << "  PASS" << std::endl;
}

void test_retrain_on_shrunk_data() {
    std::cout << "Testing retrain after data shrinks below minimum..." << std::endl;

    const RunContext ctx;
    InMemoryFeedbackSource source;
    for (int i = 0; i < 12; ++i) {
        source.add(ctx, make_record("p" + std::to_string(i), "salary bonus raise", {{"Pay", 4.5}, {"Culture", 3.0}}));
    }

    CanvassConfig config = two_category_config(temp_path("shrunk.db"));
    config.correlation.enabled = false;
    CorrelationStore store(config.databasePath);
    ModelRegistry registry;
    SentimentScorer scorer;
    PipelineOrchestrator orchestrator(config, source, store, registry, scorer);
    InsightService service(orchestrator, store, registry, scorer);

    assert(service.trainAll(ctx).persisted);
    assert(service.getKeywords(ctx, "Pay", Polarity::STRENGTH)->sampleSize == 12);

    source.clear(ctx);
    for (int i = 0; i < 5; ++i) {
        source.add(ctx, make_record("s" + std::to_string(i), "salary bonus raise", {{"Pay", 4.5}, {"Culture", 3.0}}));
    }
    const PipelineRunSummary second = service.trainAll(ctx);
    assert(!second.failed);
    assert(second.persisted);
    assert(second.version == 2);
    assert(second.trained == 0);

    // The older result from the larger dataset must not survive.
    assert(!service.getKeywords(ctx, "Pay", Polarity::STRENGTH).has_value());
    assert(!store.getLatest(ctx, "Pay", Polarity::STRENGTH).has_value());
    assert(!service.hasResults(ctx));

    ModelRegistry coldRegistry;
    InsightService cold(orchestrator, store, coldRegistry, scorer);
    assert(cold.warmStart(ctx));
    assert(cold.snapshot(ctx)->version == 2);
    assert(cold.snapshot(ctx)->empty());
    assert(store.runHistory(ctx, 10).size() == 2);

    std::cout << "  PASS" << std::endl;
}

BucketImportance lacking_bucket(const std::string& category, std::vector<KeywordScore> ranked) {
    BucketImportance bucket;
    bucket.result.category = category;
    bucket.result.polarity = Polarity::LACKING;
    bucket.result.sampleSize = 10;
    bucket.result.keywords.assign(ranked.begin(), ranked.begin() + std::min<size_t>(5, ranked.size()));
    bucket.rankedKeywords = std::move(ranked);
    return bucket;
}

void test_deduplicator() {
    std::cout << "Testing CrossCategoryDeduplicator..." << std::endl;

    std::vector<BucketImportance> buckets;
    buckets.push_back(lacking_bucket("Pay", {{"manager", 0.4}, {"good", 0.3}, {"salary", 0.1}, {"late", 0.08},
                                             {"unpaid", 0.05}, {"raise", 0.04}, {"bonus", 0.03}}));
    buckets.push_back(lacking_bucket("Hours", {{"manager", 0.5}, {"hours", 0.2}, {"shift", 0.1}, {"overtime", 0.1},
                                               {"weekend", 0.05}, {"stress", 0.05}}));
    BucketImportance strength;
    strength.result.category = "Pay";
    strength.result.polarity = Polarity::STRENGTH;
    strength.result.keywords = {{"manager", 0.9}};
    strength.rankedKeywords = strength.result.keywords;
    buckets.push_back(strength);

    DeduplicationTuning tuning;
    tuning.commonVocabularySize = 1;
    CrossCategoryDeduplicator deduplicator(tuning);

    const auto totals = deduplicator.aggregate(buckets);
    assert(std::abs(totals.at("manager") - 0.9) < 1e-12);
    assert(totals.count("good") == 0);

    const DeduplicationOutcome outcome = deduplicator.apply(buckets);
    assert(outcome.commonVocabulary.size() == 1);
    assert(outcome.commonVocabulary[0] == "manager");
    assert(outcome.overall.keywords.front().word == "manager");
    assert(!contains(outcome.overall.words(), "good"));
    assert(outcome.overall.keywords.size() <= 10);

    for (const auto& bucket : buckets) {
        const auto words = bucket.result.words();
        if (bucket.result.polarity == Polarity::STRENGTH) {
            assert(contains(words, "manager"));
            continue;
        }
        assert(!contains(words, "manager"));
        assert(!contains(words, "good"));
        assert(words.size() <= 5);
        assert(!outcome.usedFallback.at(bucket.result.category));
    }
    assert(buckets[0].result.words().front() == "salary");
    assert(buckets[1].result.words().front() == "hours");

    // Too few specific words falls back to the plain candidate order.
    DeduplicationTuning strict = tuning;
    strict.minKeywords = 5;
    strict.specializationThreshold = 2.0;
    std::vector<BucketImportance> shared;
    shared.push_back(lacking_bucket("A", {{"manager", 0.5}, {"slow", 0.3}, {"pay", 0.2}}));
    shared.push_back(lacking_bucket("B", {{"manager", 0.5}, {"slow", 0.3}, {"pay", 0.2}}));
    const DeduplicationOutcome fallback = CrossCategoryDeduplicator(strict).deduplicate(shared);
    assert(fallback.usedFallback.at("A"));
    assert(fallback.finalKeywords.at("A").size() == 2);
    assert(fallback.finalKeywords.at("A")[0].word == "slow");

    std::cout << "  PASS" << std::endl;
}

void test_section_ranker() {
    std::cout << "Testing SectionImportanceRanker..." << std::endl;

    std::vector<FeedbackRecord> records;
    for (int i = 0; i < 30; ++i) {
        records.push_back(make_record("s" + std::to_string(i), "",
                                      {{"A", i % 2 == 0 ? 4.0 : 5.0}, {"B", 4.5}, {"C", 4.0}}));
    }
    records.push_back(make_record("low", "", {{"A", 1.0}, {"B", 1.0}, {"C", 1.0}}));

    SectionImportanceRanker ranker(RankerTuning{}, {"A", "B", "C"});
    const SectionImportanceRanking ranking = ranker.rank(records);
    assert(ranking.sampleSize == 30);
    assert(ranking.sortedCategories.size() == 3);
    assert(ranking.sortedCategories[0] == "A");
    const std::set<std::string> permutation(ranking.sortedCategories.begin(), ranking.sortedCategories.end());
    assert(permutation == std::set<std::string>({"A", "B", "C"}));
    double sum = 0.0;
    for (const auto& entry : ranking.importancePerCategory) sum += entry.second;
    assert(std::abs(sum - 1.0) < 1e-9);

    const auto means = ranker.categoryMeans({make_record("x", "", {{"A", 2.0}})});
    assert(means.at("A") == 2.0);
    assert(means.at("B") == 3.0);

    records.resize(9);
    bool threw = false;
    try {
        ranker.rank(records);
    } catch (const Canvass::InsufficientDataException&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

InsightSnapshot sample_snapshot() {
    InsightSnapshot snapshot;
    ImportanceResult pay;
    pay.category = "Pay";
    pay.polarity = Polarity::LACKING;
    pay.keywords = {{"salary", 0.4}, {"late", 0.2}};
    pay.modelR2 = 0.5;
    pay.sampleSize = 14;
    snapshot.importanceResults.push_back(pay);

    SectionImportanceRanking ranking;
    ranking.sortedCategories = {"Culture", "Pay"};
    ranking.importancePerCategory = {{"Culture", 0.7}, {"Pay", 0.3}};
    ranking.sampleSize = 20;
    snapshot.ranking = ranking;

    snapshot.overallKeywords.keywords = {{"manager", 0.9}};
    snapshot.correlations.push_back({"Pay", 0.6, 0.35, 0.4, 16, 4});
    return snapshot;
}

void test_store_roundtrip() {
    std::cout << "Testing CorrelationStore reopen..." << std::endl;

    const std::string path = temp_path("roundtrip.db");
    RunContext ctx;
    ctx.trigger = "test";
    {
        CorrelationStore store(path);
        assert(!store.loadLatest(ctx).has_value());
        assert(store.commitResults(ctx, sample_snapshot()) == 1);
        assert(store.commitResults(ctx, sample_snapshot()) == 2);
    }

    CorrelationStore reopened(path);
    const auto latest = reopened.loadLatest(ctx);
    assert(latest.has_value());
    assert(latest->version == 2);
    const ImportanceResult* pay = latest->find("Pay", Polarity::LACKING);
    assert(pay != nullptr);
    assert(pay->words() == std::vector<std::string>({"salary", "late"}));
    assert(pay->sampleSize == 14);
    assert(latest->ranking->sortedCategories == std::vector<std::string>({"Culture", "Pay"}));
    assert(latest->overallKeywords.words() == std::vector<std::string>({"manager"}));
    assert(latest->correlations.size() == 1);
    assert(latest->correlations[0].testSamples == 4);
    assert(!reopened.getLatest(ctx, "Pay", Polarity::STRENGTH).has_value());

    assert(reopened.getOverallRanking(ctx)->importancePerCategory.at("Culture") == 0.7);
    assert(reopened.getOverallKeywords(ctx).words() == latest->overallKeywords.words());
    assert(reopened.getCorrelations(ctx)[0].category == "Pay");

    RunContext other;
    other.tenant = "other";
    assert(!reopened.loadLatest(other).has_value());
    assert(!reopened.getOverallRanking(other).has_value());
    assert(reopened.getOverallKeywords(other).empty());

    const auto history = reopened.runHistory(ctx, 10);
    assert(history.size() == 2);
    assert(history[0].version == 2);
    assert(history[0].trigger == "test");
    assert(history[0].importanceCount == 1);
    assert(history[0].rankingPresent);

    std::cout << "  PASS" << std::endl;
}

void test_store_two_connections() {
    std::cout << "Testing CorrelationStore shared database file..." << std::endl;

    const std::string path = temp_path("shared_file.db");
    const RunContext ctx;
    CorrelationStore reader(path);
    CorrelationStore writer(path);

    // An empty read still closes its transaction.
    assert(!reader.loadLatest(ctx).has_value());
    assert(!reader.loadLatest(ctx).has_value());

    assert(writer.commitResults(ctx, sample_snapshot()) == 1);
    const auto first = reader.loadLatest(ctx);
    assert(first->version == 1);
    assert(first->find("Pay", Polarity::LACKING) != nullptr);

    InsightSnapshot smaller;
    smaller.overallKeywords.keywords = {{"commute", 0.5}};
    assert(writer.commitResults(ctx, smaller) == 2);

    // Every table must come from the same version.
    const auto second = reader.loadLatest(ctx);
    assert(second->version == 2);
    assert(second->importanceResults.empty());
    assert(!second->ranking.has_value());
    assert(second->correlations.empty());
    assert(second->overallKeywords.words() == std::vector<std::string>({"commute"}));

    assert(reader.commitResults(ctx, sample_snapshot()) == 3);
    assert(writer.loadLatest(ctx)->version == 3);

    std::cout << "  PASS" << std::endl;
}

void test_store_failed_commit() {
    std::cout << "Testing CorrelationStore failed commit..." << std::endl;

    const RunContext ctx;
    CorrelationStore store(temp_path("rollback.db"));
    assert(store.commitResults(ctx, sample_snapshot()) == 1);

    InsightSnapshot broken = sample_snapshot();
    broken.importanceResults.push_back(broken.importanceResults.front());
    bool threw = false;
    try {
        store.commitResults(ctx, broken);
    } catch (const Canvass::PersistenceException&) {
        threw = true;
    }
    assert(threw);

    const auto latest = store.loadLatest(ctx);
    assert(latest.has_value());
    assert(latest->version == 1);
    assert(latest->importanceResults.size() == 1);
    assert(latest->ranking.has_value());
    assert(store.runHistory(ctx, 10).size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_sentiment_upsert() {
    std::cout << "Testing sentiment upsert..." << std::endl;

    const RunContext ctx;
    CorrelationStore store(temp_path("sentiment.db"));
    SentimentScorer scorer;

    std::vector<RecordSentiment> batch;
    for (const char* id : {"a", "b"}) {
        RecordSentiment entry;
        entry.recordId = id;
        entry.result = scorer.analyze("great team");
        entry.textLength = 10;
        batch.push_back(entry);
    }
    assert(store.upsertSentiments(ctx, batch) == 2);

    batch[0].result = scorer.analyze("terrible manager");
    assert(store.upsertSentiments(ctx, batch) == 2);
    assert(store.sentimentCount(ctx) == 2);

    const auto a = store.getSentiment(ctx, "a");
    assert(a.has_value());
    assert(a->result.label == SentimentLabel::NEGATIVE);
    assert(a->textLength == 10);
    assert(store.analyzedRecordIds(ctx) == std::unordered_set<std::string>({"a", "b"}));
    assert(!store.getSentiment(ctx, "missing").has_value());

    std::cout << "  PASS" << std::endl;
}

void test_orchestrator_full_run() {
    std::cout << "Testing PipelineOrchestrator full run..." << std::endl;

    const RunContext ctx;
    InMemoryFeedbackSource source;
    add_survey(source, ctx);

    CanvassConfig config = two_category_config(temp_path("full.db"));
    CorrelationStore store(config.databasePath);
    ModelRegistry registry;
    SentimentScorer scorer;
    PipelineOrchestrator orchestrator(config, source, store, registry, scorer);
    InsightService service(orchestrator, store, registry, scorer);

    const PipelineRunSummary first = service.trainAll(ctx);
    assert(!first.failed);
    assert(first.persisted);
    assert(first.version == 1);
    assert(first.recordCount == 48);
    assert(first.sentimentsComputed == 48);
    assert(first.trained == 4);
    assert(first.rankingTrained);
    assert(first.correlationsTrained);

    const auto ranking = service.getSectionRanking(ctx);
    assert(ranking.has_value());
    assert(ranking->sortedCategories.size() == 2);
    assert(ranking->sortedCategories[0] == "Culture");
    double sum = 0.0;
    for (const auto& entry : ranking->importancePerCategory) sum += entry.second;
    assert(std::abs(sum - 1.0) < 1e-9);

    const std::vector<std::string> ambiguous = {"good", "nice", "great", "positive"};
    for (const char* category : {"Pay", "Culture"}) {
        const auto lacking = service.getKeywords(ctx, category, Polarity::LACKING);
        assert(lacking.has_value());
        assert(lacking->keywords.size() <= 5);
        for (const auto& word : ambiguous) assert(!contains(lacking->words(), word));
    }
    assert(service.getOverallKeywords(ctx).size() <= 10);
    assert(service.getCategoryCorrelations(ctx).size() == 3);

    const PipelineRunSummary second = service.trainAll(ctx);
    assert(second.version == 2);
    assert(second.sentimentsComputed == 0);
    assert(store.sentimentCount(ctx) == 48);

    const auto rerank = service.getSectionRanking(ctx);
    assert(rerank->sortedCategories == ranking->sortedCategories);
    for (const auto& category : config.categories) {
        for (Polarity polarity : {Polarity::STRENGTH, Polarity::LACKING}) {
            const auto a = store.getLatest(ctx, category, polarity);
            const auto b = service.getKeywords(ctx, category, polarity);
            assert(a.has_value() && b.has_value());
            const auto wa = a->words();
            const auto wb = b->words();
            assert(std::set<std::string>(wa.begin(), wa.end()) == std::set<std::string>(wb.begin(), wb.end()));
        }
    }

    // A fresh registry warms from the committed store.
    ModelRegistry coldRegistry;
    InsightService cold(orchestrator, store, coldRegistry, scorer);
    assert(cold.warmStart(ctx));
    assert(cold.snapshot(ctx)->version == 2);

    FeedbackRecord probe = make_record("probe", "salary late", {{"Pay", 2.0}});
    const auto insights = service.getSectionInsights(ctx, probe);
    assert(insights.size() == 2);
    assert(insights[0].category == "Pay");
    assert(insights[0].isLow);
    assert(insights[1].noData());
    assert(insights[1].recommendations.empty());

    std::cout << "  PASS" << std::endl;
}

void test_orchestrator_determinism() {
    std::cout << "Testing PipelineOrchestrator determinism..." << std::endl;

    const RunContext ctx;
    InMemoryFeedbackSource source;
    add_survey(source, ctx);

    std::vector<InsightSnapshot> runs;
    for (int attempt = 0; attempt < 2; ++attempt) {
        CanvassConfig config = two_category_config(temp_path("determinism" + std::to_string(attempt) + ".db"));
        CorrelationStore store(config.databasePath);
        ModelRegistry registry;
        SentimentScorer scorer;
        PipelineOrchestrator orchestrator(config, source, store, registry, scorer);
        const PipelineRunSummary summary = orchestrator.trainAll(ctx);
        assert(summary.persisted);
        runs.push_back(*registry.current(ctx));
    }

    assert(runs[0].ranking->sortedCategories == runs[1].ranking->sortedCategories);
    assert(runs[0].importanceResults.size() == runs[1].importanceResults.size());
    for (const auto& result : runs[0].importanceResults) {
        const ImportanceResult* other = runs[1].find(result.category, result.polarity);
        assert(other != nullptr);
        assert(result.words() == other->words());
    }
    assert(runs[0].overallKeywords.words() == runs[1].overallKeywords.words());

    std::cout << "  PASS" << std::endl;
}

void test_orchestrator_failing_source() {
    std::cout << "Testing PipelineOrchestrator failing source..." << std::endl;

    const RunContext ctx;
    InMemoryFeedbackSource good;
    add_survey(good, ctx);

    CanvassConfig config = two_category_config(temp_path("failing.db"));
    config.correlation.enabled = false;
    CorrelationStore store(config.databasePath);
    ModelRegistry registry;
    SentimentScorer scorer;

    PipelineOrchestrator healthy(config, good, store, registry, scorer);
    assert(healthy.trainAll(ctx).version == 1);

    FailingSource failing;
    PipelineOrchestrator broken(config, failing, store, registry, scorer);
    const PipelineRunSummary summary = broken.trainAll(ctx);
    assert(summary.failed);
    assert(!summary.persisted);
    assert(summary.errors.size() == 1);
    assert(summary.errors[0].kind == StageErrorKind::Source);
    assert(registry.current(ctx)->version == 1);
    assert(store.loadLatest(ctx)->version == 1);

    std::cout << "  PASS" << std::endl;
}

void test_shared_lacking_word_end_to_end() {
    std::cout << "Testing shared lacking word through the full pipeline..." << std::endl;

    const RunContext ctx;
    InMemoryFeedbackSource source;
    for (int i = 0; i < 12; ++i) {
        const bool worst = i % 2 == 0;
        const double low = worst ? 1.0 : 2.0;
        source.add(ctx, make_record("pay" + std::to_string(i),
                                    worst ? "manager manager salary late" : "manager salary late",
                                    {{"Pay", low}, {"Culture", 4.5}}));
        source.add(ctx, make_record("cul" + std::to_string(i),
                                    worst ? "manager manager toxic gossip" : "manager toxic gossip",
                                    {{"Pay", 4.5}, {"Culture", low}}));
    }

    CanvassConfig config = two_category_config(temp_path("shared_word.db"));
    config.correlation.enabled = false;
    CorrelationStore store(config.databasePath);
    ModelRegistry registry;
    SentimentScorer scorer;
    PipelineOrchestrator orchestrator(config, source, store, registry, scorer);
    InsightService service(orchestrator, store, registry, scorer);

    const PipelineRunSummary summary = service.trainAll(ctx);
    assert(!summary.failed);
    assert(summary.persisted);

    assert(contains(service.getOverallKeywords(ctx), "manager"));
    for (const char* category : {"Pay", "Culture"}) {
        const auto lacking = service.getKeywords(ctx, category, Polarity::LACKING);
        assert(lacking.has_value());
        assert(lacking->sampleSize == 12);
        assert(!lacking->keywords.empty());
        assert(lacking->keywords.size() <= 5);
        assert(!contains(lacking->words(), "manager"));
    }
    for (const auto& word : service.getKeywords(ctx, "Pay", Polarity::LACKING)->words()) {
        assert(!contains(service.getKeywords(ctx, "Culture", Polarity::LACKING)->words(), word));
    }

    std::cout << "  PASS" << std::endl;
}

void test_concurrent_retrains() {
    std::cout << "Testing concurrent retrains..." << std::endl;

    const RunContext ctx;
    InMemoryFeedbackSource source;
    add_survey(source, ctx);

    CanvassConfig config = two_category_config(temp_path("concurrent.db"));
    config.correlation.enabled = false;
    CorrelationStore store(config.databasePath);
    ModelRegistry registry;
    SentimentScorer scorer;
    PipelineOrchestrator first(config, source, store, registry, scorer);
    PipelineOrchestrator second(config, source, store, registry, scorer);

    // Two runs share each orchestrator's lock, the other two race it.
    std::vector<PipelineRunSummary> summaries(4);
    std::vector<std::thread> workers;
    for (size_t i = 0; i < summaries.size(); ++i) {
        PipelineOrchestrator& orchestrator = i % 2 == 0 ? first : second;
        workers.emplace_back([&orchestrator, &summaries, &ctx, i]() { summaries[i] = orchestrator.trainAll(ctx); });
    }
    for (auto& worker : workers) worker.join();

    std::set<int64_t> versions;
    for (const auto& summary : summaries) {
        assert(!summary.failed);
        assert(summary.persisted);
        versions.insert(summary.version);
    }
    assert(versions == std::set<int64_t>({1, 2, 3, 4}));

    const auto committed = store.loadLatest(ctx);
    assert(committed->version == 4);
    assert(registry.current(ctx)->version == 4);
    assert(committed->importanceResults.size() == registry.current(ctx)->importanceResults.size());
    assert(store.runHistory(ctx, 10).size() == 4);
    assert(store.sentimentCount(ctx) == 48);

    std::cout << "  PASS" << std::endl;
}

void test_registry_tenants() {
    std::cout << "Testing ModelRegistry tenants..." << std::endl;

    RunContext a;
    a.tenant = "acme";
    RunContext b;
    b.tenant = "beta";
    ModelRegistry registry;
    InsightSnapshot first;
    first.version = 1;
    registry.publish(b, first);
    registry.publish(a, first);
    assert(registry.tenants() == std::vector<std::string>({"acme", "beta"}));

    InsightSnapshot stale;
    stale.version = 0;
    assert(registry.publishIfAbsent(a, stale)->version == 1);
    InsightSnapshot newer;
    newer.version = 2;
    assert(registry.publish(a, newer));
    assert(registry.current(a)->version == 2);
    // A slower run finishing late must not roll the registry back.
    assert(!registry.publish(a, first));
    assert(registry.current(a)->version == 2);
    assert(registry.current(b)->version == 1);

    registry.clear(a);
    assert(!registry.has(a));
    assert(registry.current(a) == nullptr);
    assert(registry.has(b));

    InMemoryFeedbackSource source;
    source.add(a, make_record("1", "text", {{"Pay", 2.0}}));
    FeedbackRecord incomplete = make_record("2", "text", {{"Pay", 4.0}});
    incomplete.complete = false;
    source.add(a, incomplete);
    assert(source.size(a) == 2);
    assert(source.size(b) == 0);
    assert(source.completeRecords(a, FeedbackQuery{}).size() == 1);
    FeedbackQuery cultureOnly;
    cultureOnly.requiredCategory = "Culture";
    assert(source.completeRecords(a, cultureOnly).empty());
    source.clear(a);
    assert(source.size(a) == 0);

    std::cout << "  PASS" << std::endl;
}

void test_recommendations() {
    std::cout << "Testing section recommendations..." << std::endl;

    const auto workload = InsightService::recommendationsFor("Work-Life Balance", {"workload", "hours"});
    assert(workload.size() == 3);
    assert(workload[0] == "Address workload concerns and resource allocation");
    assert(workload[1] == "Review workload distribution and deadlines");

    assert(InsightService::recommendationsFor("Work-Life Balance", {}).empty());
    const auto generic = InsightService::recommendationsFor("Diversity & Inclusion", {"communication"});
    assert(generic.size() == 1);
    assert(generic[0] == "Improve communication processes and transparency");

    std::cout << "  PASS" << std::endl;
}

void test_config_file() {
    std::cout << "Testing CanvassConfig file parsing..." << std::endl;

    const std::string path = temp_path("config.yaml");
    {
        std::ofstream out(path);
        out << "# survey settings\n"
            << "categories: Pay, Culture\n"
            << "columns.Pay: salary_fairness, bonus_fairness\n"
            << "trees: 50   # fewer trees\n"
            << "seed: 7\n"
            << "until: 2024-03-31\n"
            << "correlation_enabled: false\n";
    }
    CanvassConfig base;
    base.feedbackPath = "survey.csv";
    const CanvassConfig config = CanvassConfig::fromFile(path, base);
    config.validate();
    assert(config.categories == std::vector<std::string>({"Pay", "Culture"}));
    assert(config.categoryColumns.at("Pay").size() == 2);
    assert(config.trainer.trees == 50);
    assert(config.ranker.seed == 7);
    assert(config.correlation.seed == 7);
    assert(!config.correlation.enabled);
    assert(config.until.has_value());
    assert(*config.until % 86400 == 86399);

    for (const char* bad : {"bogus_key: 1\n", "trees: many\n", "verbose: maybe\n", "no separator here\n"}) {
        const std::string badPath = temp_path("bad.yaml");
        {
            std::ofstream out(badPath);
            out << bad;
        }
        bool threw = false;
        try {
            CanvassConfig::fromFile(badPath, base);
        } catch (const Canvass::ConfigurationException&) {
            threw = true;
        }
        assert(threw);
    }

    CanvassConfig duplicate = base;
    duplicate.categories = {"Pay", "Pay"};
    bool threw = false;
    try {
        duplicate.validate();
    } catch (const Canvass::ConfigurationException&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_csv_source() {
    std::cout << "Testing CsvFeedbackSource..." << std::endl;

    const std::string path = temp_path("survey.csv");
    {
        std::ofstream out(path);
        out << "uid,free_text_box,review_date,Pay,Culture\n"
            << "u1,\"Salary is late,\nagain\",2024-01-15,2,4\n"
            << "u2,great team,2024-02-01,6,5\n"
            << ",no id here,,3,3\n"
            << "u4,bad date,yesterday,1,1\n";
    }

    CsvSourceOptions options;
    options.path = path;
    options.categories = {"Pay", "Culture"};
    CsvFeedbackSource source(options);
    const RunContext ctx;

    const auto all = source.completeRecords(ctx, FeedbackQuery{});
    assert(all.size() == 4);
    assert(all[0].id == "u1");
    assert(all[0].text.find('\n') != std::string::npos);
    assert(all[0].score("Pay") == 2.0);
    assert(!all[1].score("Pay").has_value());
    assert(all[1].score("Culture") == 5.0);
    assert(all[2].id == "3");
    assert(all[2].submittedAt == 0);
    assert(all[3].id == "u4");
    assert(all[3].submittedAt == 0);
    assert(all[3].score("Pay") == 1.0);

    FeedbackQuery query;
    query.since = all[1].submittedAt;
    const auto recent = source.completeRecords(ctx, query);
    assert(recent.size() == 1);
    assert(recent[0].id == "u2");

    CsvSourceOptions missing = options;
    missing.textColumn = "comments";
    bool threw = false;
    try {
        CsvFeedbackSource(missing).completeRecords(ctx, FeedbackQuery{});
    } catch (const Canvass::IOException&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Canvass Tests ===" << std::endl;

    test_text_normalizer();
    test_sentiment_scorer();
    test_vectorizer();
    test_random_forest();
    test_trainer_buckets();
    test_pay_scenario();
    test_absent_below_minimum();
    test_retrain_on_shrunk_data();
    test_deduplicator();
    test_section_ranker();
    test_store_roundtrip();
    test_store_two_connections();
    test_store_failed_commit();
    test_sentiment_upsert();
    test_orchestrator_full_run();
    test_orchestrator_determinism();
    test_orchestrator_failing_source();
    test_shared_lacking_word_end_to_end();
    test_concurrent_retrains();
    test_registry_tenants();
    test_recommendations();
    test_config_file();
    test_csv_source();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
