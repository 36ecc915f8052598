#include "SentimentScorer.h"

#include "CanvassExceptions.h"
#include "CommonUtils.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <unordered_set>

namespace {
constexpr double kBoosterIncrement = 0.293;
constexpr double kBoosterDecrement = -0.293;
constexpr double kCapsIncrement = 0.733;
constexpr double kNegationScalar = -0.74;
constexpr double kNeverAmplifier = 1.25;
constexpr double kSecondWordDamping = 0.95;
constexpr double kThirdWordDamping = 0.9;
constexpr double kBeforeButFactor = 0.5;
constexpr double kAfterButFactor = 1.5;
constexpr double kNormalizationAlpha = 15.0;
constexpr double kExclamationWeight = 0.292;
constexpr size_t kMaxExclamations = 4;
constexpr double kQuestionWeight = 0.18;
constexpr double kQuestionCap = 0.96;

const std::unordered_set<std::string>& negationWords() {
    static const std::unordered_set<std::string> words = {
        "aint", "arent", "cannot", "cant", "couldnt", "darent", "didnt", "doesnt",
        "ain't", "aren't", "can't", "couldn't", "daren't", "didn't", "doesn't",
        "dont", "hadnt", "hasnt", "havent", "isnt", "mightnt", "mustnt", "neither",
        "don't", "hadn't", "hasn't", "haven't", "isn't", "mightn't", "mustn't",
        "neednt", "needn't", "never", "none", "nope", "nor", "not", "nothing", "nowhere",
        "oughtnt", "shant", "shouldnt", "uhuh", "wasnt", "werent",
        "oughtn't", "shan't", "shouldn't", "uh-uh", "wasn't", "weren't",
        "without", "wont", "wouldnt", "won't", "wouldn't", "rarely", "seldom", "despite"
    };
    return words;
}

const std::unordered_map<std::string, double>& boosterWords() {
    static const std::unordered_map<std::string, double> words = [] {
        std::unordered_map<std::string, double> out;
        for (const char* w : {"absolutely", "amazingly", "awfully", "completely", "considerable",
                              "considerably", "decidedly", "deeply", "enormous", "enormously",
                              "entirely", "especially", "exceptional", "exceptionally", "extreme",
                              "extremely", "fabulously", "fully", "greatly", "hella", "highly",
                              "hugely", "incredible", "incredibly", "intensely", "major", "majorly",
                              "more", "most", "particularly", "purely", "quite", "really",
                              "remarkably", "so", "substantially", "thoroughly", "total", "totally",
                              "tremendous", "tremendously", "uber", "unbelievably", "unusually",
                              "utter", "utterly", "very"}) {
            out.emplace(w, kBoosterIncrement);
        }
        for (const char* w : {"almost", "barely", "hardly", "just enough", "kind of", "kinda",
                              "kindof", "kind-of", "less", "little", "marginal", "marginally",
                              "occasional", "occasionally", "partly", "scarce", "scarcely",
                              "slight", "slightly", "somewhat", "sort of", "sorta", "sortof",
                              "sort-of"}) {
            out.emplace(w, kBoosterDecrement);
        }
        return out;
    }();
    return words;
}

const std::unordered_map<std::string, double>& idioms() {
    static const std::unordered_map<std::string, double> phrases = {
        {"the shit", 3.0}, {"the bomb", 3.0}, {"bad ass", 1.5}, {"badass", 1.5},
        {"bus stopper", 0.0}, {"yeah right", -2.0}, {"kiss of death", -1.5},
        {"to die for", 3.0}, {"beating heart", 3.1}, {"broken heart", -2.9}
    };
    return phrases;
}

char asciiLower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool isUpperWord(const std::string& word) {
    bool sawCased = false;
    for (unsigned char c : word) {
        if (std::islower(c)) return false;
        if (std::isupper(c)) sawCased = true;
    }
    return sawCased;
}

bool isNegated(const std::string& lowered) {
    return negationWords().count(lowered) > 0 || lowered.find("n't") != std::string::npos;
}

std::string stripPunctuationIfWord(const std::string& token) {
    size_t b = 0;
    size_t e = token.size();
    while (b < e && std::ispunct(static_cast<unsigned char>(token[b]))) ++b;
    while (e > b && std::ispunct(static_cast<unsigned char>(token[e - 1]))) --e;
    // Short remainders are probably emoticons and keep their punctuation.
    if (e - b <= 2) return token;
    return token.substr(b, e - b);
}

std::vector<std::string> wordsAndEmoticons(const std::string& text) {
    std::vector<std::string> out;
    size_t pos = 0;
    while (pos < text.size()) {
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
        if (pos >= text.size()) break;
        size_t end = pos;
        while (end < text.size() && !std::isspace(static_cast<unsigned char>(text[end]))) ++end;
        out.push_back(stripPunctuationIfWord(text.substr(pos, end - pos)));
        pos = end;
    }
    return out;
}

double boosterScalar(const std::string& word, const std::string& lowered, double valence, bool capsDifferential) {
    auto it = boosterWords().find(lowered);
    if (it == boosterWords().end()) return 0.0;
    double scalar = it->second;
    if (valence < 0.0) scalar = -scalar;
    if (capsDifferential && isUpperWord(word)) {
        scalar += (valence > 0.0) ? kCapsIncrement : -kCapsIncrement;
    }
    return scalar;
}

double punctuationEmphasis(const std::string& text) {
    const size_t exclamations = std::min<size_t>(
        static_cast<size_t>(std::count(text.begin(), text.end(), '!')), kMaxExclamations);
    const size_t questions = static_cast<size_t>(std::count(text.begin(), text.end(), '?'));
    double questionAmp = 0.0;
    if (questions > 1) {
        questionAmp = (questions <= 3) ? static_cast<double>(questions) * kQuestionWeight : kQuestionCap;
    }
    return static_cast<double>(exclamations) * kExclamationWeight + questionAmp;
}

double normalizeScore(double score) {
    const double norm = score / std::sqrt(score * score + kNormalizationAlpha);
    return std::clamp(norm, -1.0, 1.0);
}
}

std::string sentimentLabelToString(SentimentLabel label) {
    switch (label) {
        case SentimentLabel::POSITIVE: return "positive";
        case SentimentLabel::NEGATIVE: return "negative";
        case SentimentLabel::NEUTRAL: return "neutral";
    }
    return "neutral";
}

SentimentLabel sentimentLabelFromString(const std::string& value) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "positive") return SentimentLabel::POSITIVE;
    if (v == "negative") return SentimentLabel::NEGATIVE;
    return SentimentLabel::NEUTRAL;
}

SentimentScorer::SentimentScorer() : lexicon_(builtinLexicon()) {}

SentimentScorer::SentimentScorer(std::unordered_map<std::string, double> lexicon)
    : lexicon_(std::move(lexicon)) {}

SentimentScorer SentimentScorer::fromLexiconFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw Canvass::IOException("Could not open sentiment lexicon: " + path);

    std::unordered_map<std::string, double> lexicon;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (CommonUtils::trim(line).empty()) continue;
        const size_t tab = line.find('\t');
        if (tab == std::string::npos) continue;
        const std::string word = CommonUtils::toLower(CommonUtils::trim(line.substr(0, tab)));
        size_t end = line.find('\t', tab + 1);
        if (end == std::string::npos) end = line.size();
        const std::string raw = CommonUtils::trim(line.substr(tab + 1, end - tab - 1));
        try {
            size_t consumed = 0;
            const double valence = std::stod(raw, &consumed);
            if (consumed != raw.size()) throw std::invalid_argument(raw);
            if (!word.empty()) lexicon[word] = valence;
        } catch (const std::exception&) {
            throw Canvass::ConfigurationException(
                "Invalid valence at " + path + ":" + std::to_string(lineNo) + ": '" + raw + "'");
        }
    }
    if (lexicon.empty()) {
        throw Canvass::ConfigurationException("Sentiment lexicon is empty: " + path);
    }
    return SentimentScorer(std::move(lexicon));
}

double SentimentScorer::lookup(const std::string& lowered, bool* found) const {
    auto it = lexicon_.find(lowered);
    if (found) *found = (it != lexicon_.end());
    return (it != lexicon_.end()) ? it->second : 0.0;
}

double SentimentScorer::tokenValence(const std::vector<std::string>& words,
                                     const std::vector<std::string>& lowered,
                                     size_t i,
                                     bool capsDifferential) const {
    bool known = false;
    const double base = lookup(lowered[i], &known);
    if (!known) return 0.0;

    const auto inLexicon = [&](size_t idx) { return lexicon_.count(lowered[idx]) > 0; };

    double valence = base;
    if (lowered[i] == "no" && i + 1 < words.size() && inLexicon(i + 1)) {
        valence = 0.0;
    }
    if ((i > 0 && lowered[i - 1] == "no") ||
        (i > 1 && lowered[i - 2] == "no") ||
        (i > 2 && lowered[i - 3] == "no" && (lowered[i - 1] == "or" || lowered[i - 1] == "nor"))) {
        valence = base * kNegationScalar;
    }

    if (capsDifferential && isUpperWord(words[i])) {
        valence += (valence > 0.0) ? kCapsIncrement : -kCapsIncrement;
    }

    for (size_t startI = 0; startI < 3; ++startI) {
        if (i <= startI) break;
        const size_t prev = i - (startI + 1);
        if (inLexicon(prev)) continue;

        double s = boosterScalar(words[prev], lowered[prev], valence, capsDifferential);
        if (startI == 1 && s != 0.0) s *= kSecondWordDamping;
        if (startI == 2 && s != 0.0) s *= kThirdWordDamping;
        valence += s;

        if (startI == 0) {
            if (isNegated(lowered[i - 1])) valence *= kNegationScalar;
        } else if (startI == 1) {
            const bool soThis = lowered[i - 1] == "so" || lowered[i - 1] == "this";
            if (lowered[i - 2] == "never" && soThis) {
                valence *= kNeverAmplifier;
            } else if (lowered[i - 2] == "without" && lowered[i - 1] == "doubt") {
                // "without doubt" intensifies rather than negates.
            } else if (isNegated(lowered[i - 2])) {
                valence *= kNegationScalar;
            }
        } else {
            const bool soThis = lowered[i - 2] == "so" || lowered[i - 2] == "this" ||
                                lowered[i - 1] == "so" || lowered[i - 1] == "this";
            if (lowered[i - 3] == "never" && soThis) {
                valence *= kNeverAmplifier;
            } else if (lowered[i - 3] == "without" && (lowered[i - 2] == "doubt" || lowered[i - 1] == "doubt")) {
            } else if (isNegated(lowered[i - 3])) {
                valence *= kNegationScalar;
            }

            const std::string oneZero = lowered[i - 1] + " " + lowered[i];
            const std::string twoOneZero = lowered[i - 2] + " " + oneZero;
            const std::string twoOne = lowered[i - 2] + " " + lowered[i - 1];
            const std::string threeTwoOne = lowered[i - 3] + " " + twoOne;
            const std::string threeTwo = lowered[i - 3] + " " + lowered[i - 2];
            for (const std::string* seq : {&oneZero, &twoOneZero, &twoOne, &threeTwoOne, &threeTwo}) {
                auto it = idioms().find(*seq);
                if (it != idioms().end()) {
                    valence = it->second;
                    break;
                }
            }
            if (i + 1 < words.size()) {
                auto it = idioms().find(lowered[i] + " " + lowered[i + 1]);
                if (it != idioms().end()) valence = it->second;
            }
            if (i + 2 < words.size()) {
                auto it = idioms().find(lowered[i] + " " + lowered[i + 1] + " " + lowered[i + 2]);
                if (it != idioms().end()) valence = it->second;
            }
            for (const std::string* seq : {&threeTwoOne, &threeTwo, &twoOne}) {
                auto it = boosterWords().find(*seq);
                if (it != boosterWords().end()) valence += it->second;
            }
        }
    }

    if (i > 1 && !inLexicon(i - 1) && lowered[i - 1] == "least") {
        if (lowered[i - 2] != "at" && lowered[i - 2] != "very") valence *= kNegationScalar;
    } else if (i > 0 && !inLexicon(i - 1) && lowered[i - 1] == "least") {
        valence *= kNegationScalar;
    }
    return valence;
}

SentimentResult SentimentScorer::classify(double compound, double pos, double neu, double neg) {
    SentimentResult result;
    result.compound = compound;
    result.pos = pos;
    result.neu = neu;
    result.neg = neg;
    if (compound >= kPositiveThreshold) {
        result.label = SentimentLabel::POSITIVE;
        result.confidence = compound;
    } else if (compound <= kNegativeThreshold) {
        result.label = SentimentLabel::NEGATIVE;
        result.confidence = std::abs(compound);
    } else {
        result.label = SentimentLabel::NEUTRAL;
        result.confidence = neu;
    }
    return result;
}

SentimentResult SentimentScorer::analyze(const std::string& text) const {
    if (CommonUtils::isBlank(text)) return SentimentResult{};

    const std::vector<std::string> words = wordsAndEmoticons(text);
    std::vector<std::string> lowered;
    lowered.reserve(words.size());
    size_t upperCount = 0;
    for (const auto& w : words) {
        std::string l(w);
        std::transform(l.begin(), l.end(), l.begin(), asciiLower);
        lowered.push_back(std::move(l));
        if (isUpperWord(w)) ++upperCount;
    }
    const bool capsDifferential = upperCount > 0 && upperCount < words.size();

    std::vector<double> sentiments;
    sentiments.reserve(words.size());
    for (size_t i = 0; i < words.size(); ++i) {
        if (boosterWords().count(lowered[i]) > 0) {
            sentiments.push_back(0.0);
            continue;
        }
        if (i + 1 < words.size() && lowered[i] == "kind" && lowered[i + 1] == "of") {
            sentiments.push_back(0.0);
            continue;
        }
        sentiments.push_back(tokenValence(words, lowered, i, capsDifferential));
    }

    auto butIt = std::find(lowered.begin(), lowered.end(), "but");
    if (butIt != lowered.end()) {
        const size_t bi = static_cast<size_t>(std::distance(lowered.begin(), butIt));
        for (size_t si = 0; si < sentiments.size(); ++si) {
            if (si < bi) sentiments[si] *= kBeforeButFactor;
            else if (si > bi) sentiments[si] *= kAfterButFactor;
        }
    }

    if (sentiments.empty()) return SentimentResult{};

    const double emphasis = punctuationEmphasis(text);
    double sum = 0.0;
    double posSum = 0.0;
    double negSum = 0.0;
    double neuCount = 0.0;
    for (double s : sentiments) {
        sum += s;
        if (s > 0.0) posSum += s + 1.0;
        else if (s < 0.0) negSum += s - 1.0;
        else neuCount += 1.0;
    }
    if (sum > 0.0) sum += emphasis;
    else if (sum < 0.0) sum -= emphasis;
    const double compound = normalizeScore(sum);

    if (posSum > std::abs(negSum)) posSum += emphasis;
    else if (posSum < std::abs(negSum)) negSum -= emphasis;

    const double total = posSum + std::abs(negSum) + neuCount;
    if (total <= 0.0) return SentimentResult{};
    return classify(compound, std::abs(posSum / total), std::abs(neuCount / total), std::abs(negSum / total));
}
