#include "CanvassConfig.h"

#include "CanvassExceptions.h"
#include "CSVUtils.h"
#include "CommonUtils.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <unordered_map>
#include <unordered_set>

namespace {
constexpr int64_t kSecondsPerDay = 86400;

const char* kUsage =
    "Usage: canvass <feedback.csv> [--config path] [--db path] [--tenant id] [--delimiter c] "
    "[--categories a,b,...] [--text-column name] [--id-column name] [--complete-column name] "
    "[--date-column name] [--since YYYY-MM-DD] [--until YYYY-MM-DD] [--lexicon path] "
    "[--force-retrain true|false] [--show-only true|false] [--recompute-sentiment true|false] "
    "[--seed N] [--trees N] [--verbose true|false] [--sentiment \"text\"] [--insights record-id]";

template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Canvass::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Canvass::CanvassException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Canvass::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

std::string stripCommentOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());
    bool inQuotes = false;
    for (char c : line) {
        if (c == '"') inQuotes = !inQuotes;
        if (!inQuotes && c == '#') break;
        out.push_back(c);
    }
    return CommonUtils::trim(out);
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') {
            inQuotes = !inQuotes;
        } else if (!inQuotes && line[i] == sep) {
            return i;
        }
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// Keys are case-insensitive with '-' and '_' interchangeable. The category
// part of "columns.<Category>" keeps its spelling.
std::string normalizeConfigKey(std::string key) {
    key = CommonUtils::trim(key);
    const std::string lowered = CommonUtils::toLower(key);
    if (lowered.rfind("columns.", 0) == 0) {
        return "columns." + CommonUtils::trim(key.substr(8));
    }
    std::string out = lowered;
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue) {
    const int parsed = parseNumericStrict<int>(
        value,
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoi(v, pos); });
    if (parsed < minValue) {
        throw Canvass::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

uint32_t parseUIntStrict(const std::string& value, const std::string& key) {
    if (!value.empty() && value[0] == '-') {
        throw Canvass::ConfigurationException("Invalid unsigned integer for " + key + ": " + value);
    }
    const unsigned long parsed = parseNumericStrict<unsigned long>(
        value,
        key,
        "Invalid unsigned integer for ",
        [](const std::string& v, size_t* pos) { return std::stoul(v, pos); });
    if (parsed > static_cast<unsigned long>(std::numeric_limits<uint32_t>::max())) {
        throw Canvass::ConfigurationException("Value for " + key + " exceeds uint32 range");
    }
    return static_cast<uint32_t>(parsed);
}

double parseDoubleStrict(const std::string& value, const std::string& key, double minValue) {
    const double parsed = parseNumericStrict<double>(
        value,
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
    if (!std::isfinite(parsed)) {
        throw Canvass::ConfigurationException("Value for " + key + " must be finite");
    }
    if (parsed < minValue) {
        throw Canvass::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Canvass::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

int64_t parseDateStrict(const std::string& value, const std::string& key, bool endOfDay) {
    const std::string v = CommonUtils::trim(value);
    int64_t ts = 0;
    if (v.size() != 10 || v[4] != '-' || !CSVUtils::parseTimestamp(v, ts)) {
        throw Canvass::ConfigurationException("Invalid date for " + key + ": " + value + " (expected YYYY-MM-DD)");
    }
    return endOfDay ? ts + kSecondsPerDay - 1 : ts;
}

char parseDelimiter(const std::string& value) {
    if (value == "\\t" || CommonUtils::toLower(value) == "tab") return '\t';
    if (value.size() != 1) throw Canvass::ConfigurationException("delimiter expects a single character");
    return value[0];
}

void applySeed(CanvassConfig& config, uint32_t seed) {
    config.trainer.seed = seed;
    config.ranker.seed = seed;
    config.correlation.seed = seed;
}

void applyTrees(CanvassConfig& config, size_t trees) {
    config.trainer.trees = trees;
    config.ranker.trees = trees;
    config.correlation.trees = trees;
}

void assignKeyValue(CanvassConfig& config, const std::string& key, const std::string& value) {
    if (key.rfind("columns.", 0) == 0) {
        const std::string category = key.substr(8);
        if (category.empty()) {
            throw Canvass::ConfigurationException("columns.<category> requires a non-empty category name");
        }
        std::vector<std::string> columns = CommonUtils::splitList(value);
        if (columns.empty()) {
            throw Canvass::ConfigurationException("columns." + category + " requires at least one column");
        }
        config.categoryColumns[category] = std::move(columns);
        return;
    }
    if (key == "delimiter") {
        config.delimiter = parseDelimiter(value);
        return;
    }
    if (key == "categories") {
        config.categories = CommonUtils::splitList(value);
        return;
    }
    if (key == "noise_words") {
        config.trainer.noiseWords = CommonUtils::splitList(value);
        return;
    }
    if (key == "ambiguous_words") {
        config.dedup.ambiguousWords = CommonUtils::splitList(value);
        return;
    }
    if (key == "since" || key == "until") {
        const std::string trimmed = CommonUtils::trim(value);
        auto& slot = key == "since" ? config.since : config.until;
        if (trimmed.empty()) {
            slot.reset();
        } else {
            slot = parseDateStrict(trimmed, key, key == "until");
        }
        return;
    }
    if (key == "seed") {
        applySeed(config, parseUIntStrict(value, key));
        return;
    }

    struct SizeRule {
        size_t TrainerTuning::*member;
        int minValue;
    };
    struct DoubleRule {
        double TrainerTuning::*member;
        double minValue;
    };

    static const std::unordered_map<std::string, std::string CanvassConfig::*> stringFields = {
        {"feedback", &CanvassConfig::feedbackPath},
        {"database", &CanvassConfig::databasePath},
        {"tenant", &CanvassConfig::tenant},
        {"text_column", &CanvassConfig::textColumn},
        {"id_column", &CanvassConfig::idColumn},
        {"complete_column", &CanvassConfig::completeColumn},
        {"date_column", &CanvassConfig::dateColumn},
        {"sentiment_lexicon", &CanvassConfig::sentimentLexicon}
    };
    static const std::unordered_map<std::string, bool CanvassConfig::*> boolFields = {
        {"verbose", &CanvassConfig::verbose},
        {"force_retrain", &CanvassConfig::forceRetrain},
        {"show_only", &CanvassConfig::showOnly},
        {"recompute_sentiment", &CanvassConfig::recomputeSentiment}
    };
    static const std::unordered_map<std::string, SizeRule> trainerSizeFields = {
        {"min_samples", {&TrainerTuning::minSamples, 1}},
        {"max_features", {&TrainerTuning::maxFeatures, 0}},
        {"ngram_min", {&TrainerTuning::ngramMin, 1}},
        {"ngram_max", {&TrainerTuning::ngramMax, 1}},
        {"min_document_frequency", {&TrainerTuning::minDocumentFrequency, 1}},
        {"trees", {&TrainerTuning::trees, 1}},
        {"max_depth", {&TrainerTuning::maxDepth, 0}},
        {"min_samples_split", {&TrainerTuning::minSamplesSplit, 2}},
        {"top_keywords", {&TrainerTuning::topKeywords, 1}}
    };
    static const std::unordered_map<std::string, DoubleRule> trainerDoubleFields = {
        {"strength_threshold", {&TrainerTuning::strengthThreshold, 1.0}},
        {"lacking_threshold", {&TrainerTuning::lackingThreshold, 1.0}},
        {"test_fraction", {&TrainerTuning::testFraction, 0.0}}
    };

    if (const auto it = stringFields.find(key); it != stringFields.end()) {
        config.*(it->second) = value;
        return;
    }
    if (const auto it = boolFields.find(key); it != boolFields.end()) {
        config.*(it->second) = parseBoolStrict(value, key);
        return;
    }
    if (const auto it = trainerSizeFields.find(key); it != trainerSizeFields.end()) {
        config.trainer.*(it->second.member) = static_cast<size_t>(parseIntStrict(value, key, it->second.minValue));
        return;
    }
    if (const auto it = trainerDoubleFields.find(key); it != trainerDoubleFields.end()) {
        config.trainer.*(it->second.member) = parseDoubleStrict(value, key, it->second.minValue);
        return;
    }

    if (key == "common_vocabulary_size") {
        config.dedup.commonVocabularySize = static_cast<size_t>(parseIntStrict(value, key, 0));
    } else if (key == "overall_keyword_count") {
        config.dedup.overallKeywordCount = static_cast<size_t>(parseIntStrict(value, key, 1));
    } else if (key == "specialization_threshold") {
        config.dedup.specializationThreshold = parseDoubleStrict(value, key, 0.0);
    } else if (key == "min_keywords") {
        config.dedup.minKeywords = static_cast<size_t>(parseIntStrict(value, key, 0));
    } else if (key == "max_keywords") {
        config.dedup.maxKeywords = static_cast<size_t>(parseIntStrict(value, key, 1));
    } else if (key == "satisfaction_threshold") {
        config.ranker.satisfactionThreshold = parseDoubleStrict(value, key, 1.0);
    } else if (key == "ranker_trees") {
        config.ranker.trees = static_cast<size_t>(parseIntStrict(value, key, 1));
    } else if (key == "ranker_max_depth") {
        config.ranker.maxDepth = static_cast<size_t>(parseIntStrict(value, key, 0));
    } else if (key == "ranker_min_samples_split") {
        config.ranker.minSamplesSplit = static_cast<size_t>(parseIntStrict(value, key, 2));
    } else if (key == "ranker_min_samples") {
        config.ranker.minSamples = static_cast<size_t>(parseIntStrict(value, key, 1));
    } else if (key == "correlation_enabled") {
        config.correlation.enabled = parseBoolStrict(value, key);
    } else if (key == "correlation_max_features") {
        config.correlation.maxFeatures = static_cast<size_t>(parseIntStrict(value, key, 0));
    } else if (key == "correlation_trees") {
        config.correlation.trees = static_cast<size_t>(parseIntStrict(value, key, 1));
    } else {
        throw Canvass::ConfigurationException("Unknown configuration key: " + key);
    }
}
}

const std::vector<std::string>& CanvassConfig::defaultCategories() {
    static const std::vector<std::string> categories = {
        "Compensation & Benefits",
        "Work-Life Balance",
        "Culture & Values",
        "Diversity & Inclusion",
        "Career Development",
        "Management & Leadership"
    };
    return categories;
}

CanvassConfig CanvassConfig::fromArgs(int argc, char* argv[]) {
    if (argc < 2) {
        throw Canvass::ConfigurationException(kUsage);
    }

    CanvassConfig config;
    int first = 1;
    const std::string firstArg = argv[1];
    if (firstArg == "--help" || firstArg == "-h") {
        throw Canvass::ConfigurationException(kUsage);
    }
    if (firstArg.rfind("--", 0) != 0) {
        config.feedbackPath = firstArg;
        first = 2;
    }

    std::string configPath;
    std::unordered_map<std::string, std::string> flagValues;
    std::vector<std::string> flagOrder;
    for (int i = first; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            throw Canvass::ConfigurationException("Unexpected argument: " + arg);
        }
        if (i + 1 >= argc) {
            throw Canvass::ConfigurationException(arg + " expects a value");
        }
        const std::string value = argv[++i];
        if (arg == "--config") {
            configPath = value;
            continue;
        }
        if (flagValues.count(arg) == 0) flagOrder.push_back(arg);
        flagValues[arg] = value;
    }

    // The file provides the base; explicit flags override it.
    if (!configPath.empty()) {
        const std::string feedbackFromArgs = config.feedbackPath;
        config = fromFile(configPath, config);
        if (!feedbackFromArgs.empty()) config.feedbackPath = feedbackFromArgs;
    }

    for (const auto& flag : flagOrder) {
        const std::string& value = flagValues[flag];
        if (flag == "--db") {
            config.databasePath = value;
        } else if (flag == "--tenant") {
            config.tenant = value;
        } else if (flag == "--delimiter") {
            config.delimiter = parseDelimiter(value);
        } else if (flag == "--categories") {
            config.categories = CommonUtils::splitList(value);
        } else if (flag == "--text-column") {
            config.textColumn = value;
        } else if (flag == "--id-column") {
            config.idColumn = value;
        } else if (flag == "--complete-column") {
            config.completeColumn = value;
        } else if (flag == "--date-column") {
            config.dateColumn = value;
        } else if (flag == "--since") {
            config.since = parseDateStrict(value, flag, false);
        } else if (flag == "--until") {
            config.until = parseDateStrict(value, flag, true);
        } else if (flag == "--lexicon") {
            config.sentimentLexicon = value;
        } else if (flag == "--force-retrain") {
            config.forceRetrain = parseBoolStrict(value, flag);
        } else if (flag == "--show-only") {
            config.showOnly = parseBoolStrict(value, flag);
        } else if (flag == "--recompute-sentiment") {
            config.recomputeSentiment = parseBoolStrict(value, flag);
        } else if (flag == "--seed") {
            applySeed(config, parseUIntStrict(value, flag));
        } else if (flag == "--trees") {
            applyTrees(config, static_cast<size_t>(parseIntStrict(value, flag, 1)));
        } else if (flag == "--verbose") {
            config.verbose = parseBoolStrict(value, flag);
        } else if (flag == "--sentiment") {
            config.sentimentText = value;
        } else if (flag == "--insights") {
            config.insightsRecordId = CommonUtils::trim(value);
        } else {
            throw Canvass::ConfigurationException("Unknown option: " + flag);
        }
    }

    config.validate();
    return config;
}

CanvassConfig CanvassConfig::fromFile(const std::string& configPath, const CanvassConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Canvass::ConfigurationException("Could not open config file: " + configPath);

    CanvassConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = stripCommentOutsideQuotes(line);
        if (line.empty()) continue;

        const size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) {
            throw Canvass::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) + ": '" + line + "' -> expected key: value");
        }

        const std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        const std::string value = maybeUnquote(line.substr(sep + 1));
        try {
            assignKeyValue(config, key, value);
        } catch (const Canvass::CanvassException& ex) {
            throw Canvass::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    return config;
}

void TrainerTuning::validate() const {
    if (lackingThreshold > strengthThreshold) {
        throw Canvass::ConfigurationException("lacking_threshold must be <= strength_threshold");
    }
    if (strengthThreshold > 5.0 || lackingThreshold > 5.0) {
        throw Canvass::ConfigurationException("score thresholds must be within [1,5]");
    }
    if (minSamples < 2) {
        throw Canvass::ConfigurationException("min_samples must be >= 2");
    }
    if (ngramMin == 0 || ngramMin > ngramMax) {
        throw Canvass::ConfigurationException("ngram_min must be >= 1 and <= ngram_max");
    }
    if (minDocumentFrequency == 0) {
        throw Canvass::ConfigurationException("min_document_frequency must be >= 1");
    }
    if (trees == 0) {
        throw Canvass::ConfigurationException("trees must be >= 1");
    }
    if (minSamplesSplit < 2) {
        throw Canvass::ConfigurationException("min_samples_split must be >= 2");
    }
    if (testFraction <= 0.0 || testFraction >= 1.0) {
        throw Canvass::ConfigurationException("test_fraction must be within (0,1)");
    }
    if (topKeywords == 0) {
        throw Canvass::ConfigurationException("top_keywords must be >= 1");
    }
}

void DeduplicationTuning::validate() const {
    if (overallKeywordCount == 0) {
        throw Canvass::ConfigurationException("overall_keyword_count must be >= 1");
    }
    if (specializationThreshold < 0.0) {
        throw Canvass::ConfigurationException("specialization_threshold must be >= 0");
    }
    if (maxKeywords == 0) {
        throw Canvass::ConfigurationException("max_keywords must be >= 1");
    }
    if (minKeywords > maxKeywords) {
        throw Canvass::ConfigurationException("min_keywords must be <= max_keywords");
    }
}

void RankerTuning::validate() const {
    if (satisfactionThreshold < 1.0 || satisfactionThreshold > 5.0) {
        throw Canvass::ConfigurationException("satisfaction_threshold must be within [1,5]");
    }
    if (minSamples < 2) {
        throw Canvass::ConfigurationException("ranker_min_samples must be >= 2");
    }
    if (trees == 0) {
        throw Canvass::ConfigurationException("ranker_trees must be >= 1");
    }
    if (minSamplesSplit < 2) {
        throw Canvass::ConfigurationException("ranker_min_samples_split must be >= 2");
    }
    if (testFraction <= 0.0 || testFraction >= 1.0) {
        throw Canvass::ConfigurationException("ranker test fraction must be within (0,1)");
    }
}

void CorrelationTuning::validate() const {
    if (trees == 0) {
        throw Canvass::ConfigurationException("correlation_trees must be >= 1");
    }
    if (minSamples < 2) {
        throw Canvass::ConfigurationException("correlation min samples must be >= 2");
    }
    if (testFraction <= 0.0 || testFraction >= 1.0) {
        throw Canvass::ConfigurationException("correlation test fraction must be within (0,1)");
    }
}

void CanvassConfig::validate() const {
    const bool needsFeedback = !sentimentText.has_value() && (!showOnly || !insightsRecordId.empty());
    if (needsFeedback && feedbackPath.empty()) {
        throw Canvass::ConfigurationException("feedback path is required");
    }
    if (databasePath.empty()) {
        throw Canvass::ConfigurationException("database path must not be empty");
    }
    if (CommonUtils::trim(tenant).empty()) {
        throw Canvass::ConfigurationException("tenant must not be empty");
    }
    if (delimiter == '"' || delimiter == '\n' || delimiter == '\r') {
        throw Canvass::ConfigurationException("delimiter cannot be a quote or newline");
    }
    if (CommonUtils::trim(textColumn).empty()) {
        throw Canvass::ConfigurationException("text_column must not be empty");
    }
    if (categories.empty()) {
        throw Canvass::ConfigurationException("at least one category is required");
    }
    std::unordered_set<std::string> seen;
    for (const auto& category : categories) {
        if (!seen.insert(category).second) {
            throw Canvass::ConfigurationException("duplicate category: " + category);
        }
    }
    for (const auto& [category, columns] : categoryColumns) {
        if (seen.count(category) == 0) {
            throw Canvass::ConfigurationException("columns." + category + " names an unconfigured category");
        }
        if (columns.empty()) {
            throw Canvass::ConfigurationException("columns." + category + " requires at least one column");
        }
    }
    if (since && until && *since > *until) {
        throw Canvass::ConfigurationException("since must not be after until");
    }
    trainer.validate();
    dedup.validate();
    ranker.validate();
    correlation.validate();
}
