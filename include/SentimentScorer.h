#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

enum class SentimentLabel { POSITIVE, NEGATIVE, NEUTRAL };

std::string sentimentLabelToString(SentimentLabel label);
SentimentLabel sentimentLabelFromString(const std::string& value);

struct SentimentResult {
    double compound = 0.0;
    double pos = 0.0;
    double neu = 1.0;
    double neg = 0.0;
    SentimentLabel label = SentimentLabel::NEUTRAL;
    double confidence = 0.0;
};

// Persisted per-record form of a SentimentResult.
struct RecordSentiment {
    std::string recordId;
    SentimentResult result;
    size_t textLength = 0;
    int64_t analyzedAt = 0;
};

class SentimentScorer {
public:
    static constexpr double kPositiveThreshold = 0.05;
    static constexpr double kNegativeThreshold = -0.05;

    SentimentScorer();
    explicit SentimentScorer(std::unordered_map<std::string, double> lexicon);

    /**
     * @brief Loads a VADER-format lexicon (word<TAB>valence[<TAB>...]) from disk.
     * @throws Canvass::IOException when the file cannot be opened.
     * @throws Canvass::ConfigurationException on a malformed valence.
     */
    static SentimentScorer fromLexiconFile(const std::string& path);

    /**
     * @brief Scores text with the compound valence rules and assigns a label.
     * @post compound in [-1,1]; pos + neu + neg == 1.
     */
    SentimentResult analyze(const std::string& text) const;

    // Applies the label thresholds to already computed scores.
    static SentimentResult classify(double compound, double pos, double neu, double neg);

    size_t lexiconSize() const noexcept { return lexicon_.size(); }

    static const std::unordered_map<std::string, double>& builtinLexicon();

private:
    double lookup(const std::string& lowered, bool* found) const;
    double tokenValence(const std::vector<std::string>& words,
                        const std::vector<std::string>& lowered,
                        size_t i,
                        bool capsDifferential) const;

    std::unordered_map<std::string, double> lexicon_;
};
