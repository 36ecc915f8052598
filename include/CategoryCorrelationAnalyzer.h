#pragma once

#include "CanvassConfig.h"
#include "CategoryWeightVectorizer.h"
#include "InsightTypes.h"
#include "PerCategoryImportanceTrainer.h"
#include "PipelineTypes.h"

#include <string>
#include <vector>

struct CorrelationOutcome {
    std::vector<CategoryCorrelation> correlations;
    std::vector<StageError> errors;
};

/**
 * Measures how well the free text alone predicts each category score, using
 * one corpus-wide vocabulary shared by every target.
 */
class CategoryCorrelationAnalyzer {
public:
    static constexpr const char* kOverallTarget = "Overall Rating";

    CategoryCorrelationAnalyzer(CorrelationTuning tuning, std::vector<std::string> categories);

    VectorizerOptions vectorizerOptions() const;

    /**
     * @brief Fits the shared vocabulary over every non-empty document.
     * @throws Canvass::InsufficientDataException when no document has text.
     * @throws Canvass::VectorizationException on an empty vocabulary.
     */
    CategoryWeightVectorizer fitVectorizer(const std::vector<PreparedDocument>& documents) const;

    /**
     * @brief Holdout metrics plus the Pearson r of fitted predictions over all documents.
     * @throws Canvass::InsufficientDataException below minSamples non-empty documents.
     */
    CategoryCorrelation analyze(const CategoryWeightVectorizer& vectorizer,
                                const std::vector<PreparedDocument>& documents,
                                const std::string& target) const;

    CorrelationOutcome analyzeAll(const CategoryWeightVectorizer& vectorizer,
                                  const std::vector<PreparedDocument>& documents) const;

private:
    double targetValue(const PreparedDocument& doc, const std::string& target) const;

    CorrelationTuning tuning_;
    std::vector<std::string> categories_;
};
