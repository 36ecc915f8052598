#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

struct VectorizerOptions {
    size_t maxFeatures = 0; // 0 => unlimited
    size_t ngramMin = 1;
    size_t ngramMax = 1;
    size_t minDocumentFrequency = 1;
    bool removeStopWords = false;
};

// (feature index, weight) pairs ordered by index.
using SparseVector = std::vector<std::pair<size_t, double>>;

/**
 * TF-IDF term weighting with smoothed idf and L2-normalized rows.
 * A fitted instance is immutable; refitting replaces the whole vocabulary.
 */
class CategoryWeightVectorizer {
public:
    explicit CategoryWeightVectorizer(VectorizerOptions options = VectorizerOptions{});

    /**
     * @brief Learns vocabulary and idf weights from the corpus.
     * @throws Canvass::VectorizationException when no term survives filtering.
     */
    void fit(const std::vector<std::string>& corpus);

    /**
     * @brief Weighted sparse vector of a document against the fitted vocabulary.
     * @throws Canvass::VectorizationException when called before fit().
     */
    SparseVector transform(const std::string& text) const;

    std::vector<SparseVector> fitTransform(const std::vector<std::string>& corpus);

    static std::vector<std::vector<double>> toDense(const std::vector<SparseVector>& rows, size_t width);

    bool fitted() const noexcept { return fitted_; }
    size_t vocabularySize() const noexcept { return terms_.size(); }
    const std::vector<std::string>& terms() const noexcept { return terms_; }
    std::optional<size_t> indexOf(const std::string& term) const;

    static const std::unordered_set<std::string>& englishStopWords();

private:
    std::vector<std::string> analyze(const std::string& text) const;

    VectorizerOptions options_;
    std::vector<std::string> terms_;
    std::unordered_map<std::string, size_t> termIndex_;
    std::vector<double> idf_;
    bool fitted_ = false;
};
