#pragma once

#include <string>
#include <unordered_set>
#include <vector>

struct NormalizedText {
    std::vector<std::string> tokens;

    bool empty() const noexcept { return tokens.empty(); }
    std::string joined() const;
};

class TextNormalizer {
public:
    TextNormalizer();
    explicit TextNormalizer(const std::vector<std::string>& extraStopwords);

    /**
     * @brief Lowercases, keeps letters and spaces, drops stopwords and lemmatizes.
     * @post Output is deterministic for a given input; empty input yields no tokens.
     */
    NormalizedText normalize(const std::string& text) const;

    bool isStopword(const std::string& token) const;

    // Noun lemma of a lowercase token (plural forms only).
    static std::string lemmatize(const std::string& token);

    static const std::unordered_set<std::string>& englishStopwords();
    static const std::vector<std::string>& domainStopwords();

private:
    std::unordered_set<std::string> stopwords_;
};
