#include "InsightTypes.h"

#include "CommonUtils.h"

std::string polarityToString(Polarity polarity) {
    return polarity == Polarity::STRENGTH ? "strength" : "lacking";
}

std::optional<Polarity> polarityFromString(const std::string& value) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "strength") return Polarity::STRENGTH;
    if (v == "lacking") return Polarity::LACKING;
    return std::nullopt;
}

std::vector<std::string> ImportanceResult::words() const {
    std::vector<std::string> out;
    out.reserve(keywords.size());
    for (const auto& k : keywords) out.push_back(k.word);
    return out;
}

std::vector<std::string> OverallKeywordSet::words() const {
    std::vector<std::string> out;
    out.reserve(keywords.size());
    for (const auto& k : keywords) out.push_back(k.word);
    return out;
}

const ImportanceResult* InsightSnapshot::find(const std::string& category, Polarity polarity) const {
    for (const auto& result : importanceResults) {
        if (result.category == category && result.polarity == polarity) return &result;
    }
    return nullptr;
}

bool InsightSnapshot::empty() const noexcept {
    return importanceResults.empty() && !ranking && overallKeywords.empty() && correlations.empty();
}
