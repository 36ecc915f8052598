#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

struct TrainerTuning {
    // Bucket boundaries on the 1..5 category score.
    double strengthThreshold = 4.0; // score >= threshold
    double lackingThreshold = 3.0;  // score < threshold
    size_t minSamples = 10;

    // Subset-local term weighting.
    size_t maxFeatures = 200;
    size_t ngramMin = 1;
    size_t ngramMax = 2;
    size_t minDocumentFrequency = 2;

    size_t trees = 100;
    size_t maxDepth = 20;
    size_t minSamplesSplit = 5;
    double testFraction = 0.2;
    uint32_t seed = 42;
    size_t topKeywords = 5;

    std::vector<std::string> noiseWords = {
        "feel", "company", "say", "job", "ive", "provided", "there", "work", "employee", "time",
        "good", "great", "well", "need", "make", "get", "would", "could", "should"
    };

    void validate() const;
};

struct DeduplicationTuning {
    std::vector<std::string> ambiguousWords = {"good", "nice", "great", "positive"};
    size_t commonVocabularySize = 35;
    size_t overallKeywordCount = 10;
    // score_in_category / score_overall needed to keep a word category-specific.
    double specializationThreshold = 1.0;
    size_t minKeywords = 5;
    size_t maxKeywords = 5;

    void validate() const;
};

struct RankerTuning {
    double satisfactionThreshold = 4.0;
    size_t minSamples = 10;
    size_t trees = 100;
    size_t maxDepth = 0; // 0 => unlimited
    size_t minSamplesSplit = 2;
    double testFraction = 0.2;
    uint32_t seed = 42;
    double missingFallback = 3.0;

    void validate() const;
};

struct CorrelationTuning {
    bool enabled = true;
    size_t maxFeatures = 1000;
    size_t minSamples = 10;
    size_t trees = 100;
    size_t maxDepth = 0;
    size_t minSamplesSplit = 2;
    double testFraction = 0.2;
    uint32_t seed = 42;

    void validate() const;
};

struct CanvassConfig {
    std::string feedbackPath;
    std::string databasePath = "canvass.db";
    std::string tenant = "default";
    char delimiter = ',';

    std::vector<std::string> categories = defaultCategories();
    std::map<std::string, std::vector<std::string>> categoryColumns;

    std::string textColumn = "free_text_box";
    std::string idColumn = "uid";
    std::string completeColumn;
    std::string dateColumn = "review_date";
    std::optional<int64_t> since; // unix seconds, start of day
    std::optional<int64_t> until; // unix seconds, end of day

    std::string sentimentLexicon; // empty => built-in lexicon
    bool verbose = false;
    bool forceRetrain = false;
    bool showOnly = false;
    bool recomputeSentiment = false;

    // One-shot CLI actions.
    std::optional<std::string> sentimentText;
    std::string insightsRecordId;

    TrainerTuning trainer;
    DeduplicationTuning dedup;
    RankerTuning ranker;
    CorrelationTuning correlation;

    static const std::vector<std::string>& defaultCategories();

    /**
     * @brief Builds config from CLI args and an optional config file.
     * @pre argv[1] is the feedback CSV path, or the first flag for runs that need no input file.
     * @post Returns a validated config object.
     * @throws Canvass::ConfigurationException on invalid arguments or values.
     */
    static CanvassConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Merges values from a loose YAML `key: value` file over `base`.
     * @throws Canvass::ConfigurationException on unreadable files or invalid values.
     */
    static CanvassConfig fromFile(const std::string& configPath, const CanvassConfig& base);

    /**
     * @brief Validates cross-field invariants of the merged configuration.
     * @throws Canvass::ConfigurationException on invalid values.
     */
    void validate() const;
};
