#include "TextNormalizer.h"

#include "CommonUtils.h"

#include <cctype>
#include <string_view>
#include <unordered_map>

namespace {
bool endsWith(const std::string& s, const char* suffix) {
    const std::string_view sv(suffix);
    return s.size() >= sv.size() && s.compare(s.size() - sv.size(), sv.size(), sv) == 0;
}

bool isVowel(char c) {
    return c == 'a' || c == 'e' || c == 'i' || c == 'o' || c == 'u';
}

std::string dropSuffix(const std::string& s, size_t n, const char* replacement = "") {
    return s.substr(0, s.size() - n) + replacement;
}

const std::unordered_map<std::string, std::string>& irregularPlurals() {
    static const std::unordered_map<std::string, std::string> table = {
        {"men", "man"}, {"women", "woman"}, {"children", "child"}, {"feet", "foot"},
        {"teeth", "tooth"}, {"mice", "mouse"}, {"geese", "goose"}, {"oxen", "ox"},
        {"lives", "life"}, {"wives", "wife"}, {"knives", "knife"}, {"leaves", "leaf"},
        {"halves", "half"}, {"selves", "self"}, {"shelves", "shelf"}, {"wolves", "wolf"},
        {"thieves", "thief"}, {"loaves", "loaf"}, {"calves", "calf"},
        {"analyses", "analysis"}, {"crises", "crisis"}, {"diagnoses", "diagnosis"},
        {"hypotheses", "hypothesis"}, {"theses", "thesis"}, {"bases", "base"},
        {"criteria", "criterion"}, {"phenomena", "phenomenon"}, {"indices", "index"},
        {"matrices", "matrix"}, {"appendices", "appendix"},
        {"potatoes", "potato"}, {"tomatoes", "tomato"}, {"heroes", "hero"}, {"echoes", "echo"},
        {"vetoes", "veto"}, {"goes", "go"}, {"volcanoes", "volcano"}, {"dominoes", "domino"},
        {"excuses", "excuse"}, {"abuses", "abuse"},
        {"headaches", "headache"}, {"aches", "ache"}, {"niches", "niche"}, {"caches", "cache"},
        {"movies", "movie"}, {"cookies", "cookie"}, {"rookies", "rookie"}, {"zombies", "zombie"},
        {"ties", "tie"}, {"lies", "lie"}, {"pies", "pie"}, {"dies", "die"}
    };
    return table;
}

const std::unordered_set<std::string>& invariantWords() {
    static const std::unordered_set<std::string> words = {
        "always", "sometimes", "perhaps", "towards", "afterwards", "besides", "whereas",
        "nowadays", "overseas", "news", "series", "species", "means", "headquarters",
        "bias", "alias", "atlas", "canvas", "christmas", "chaos", "ethos", "kudos",
        "specimen", "abdomen", "regimen", "acumen", "omen", "stamen", "amen"
    };
    return words;
}
}

std::string NormalizedText::joined() const {
    return CommonUtils::join(tokens, " ");
}

const std::unordered_set<std::string>& TextNormalizer::englishStopwords() {
    static const std::unordered_set<std::string> words = {
        "i", "me", "my", "myself", "we", "our", "ours", "ourselves", "you", "your", "yours",
        "yourself", "yourselves", "he", "him", "his", "himself", "she", "her", "hers", "herself",
        "it", "its", "itself", "they", "them", "their", "theirs", "themselves", "what", "which",
        "who", "whom", "this", "that", "these", "those", "am", "is", "are", "was", "were", "be",
        "been", "being", "have", "has", "had", "having", "do", "does", "did", "doing", "a", "an",
        "the", "and", "but", "if", "or", "because", "as", "until", "while", "of", "at", "by",
        "for", "with", "about", "against", "between", "into", "through", "during", "before",
        "after", "above", "below", "to", "from", "up", "down", "in", "out", "on", "off", "over",
        "under", "again", "further", "then", "once", "here", "there", "when", "where", "why",
        "how", "all", "any", "both", "each", "few", "more", "most", "other", "some", "such", "no",
        "nor", "not", "only", "own", "same", "so", "than", "too", "very", "s", "t", "can", "will",
        "just", "don", "should", "now", "d", "ll", "m", "o", "re", "ve", "y", "ain", "aren",
        "couldn", "didn", "doesn", "hadn", "hasn", "haven", "isn", "ma", "mightn", "mustn",
        "needn", "shan", "shouldn", "wasn", "weren", "won", "wouldn"
    };
    return words;
}

const std::vector<std::string>& TextNormalizer::domainStopwords() {
    static const std::vector<std::string> words = {"there", "ive", "im", "feel"};
    return words;
}

TextNormalizer::TextNormalizer() : TextNormalizer(domainStopwords()) {}

TextNormalizer::TextNormalizer(const std::vector<std::string>& extraStopwords)
    : stopwords_(englishStopwords()) {
    for (const auto& word : extraStopwords) {
        const std::string lowered = CommonUtils::toLower(CommonUtils::trim(word));
        if (!lowered.empty()) stopwords_.insert(lowered);
    }
}

bool TextNormalizer::isStopword(const std::string& token) const {
    return stopwords_.find(CommonUtils::toLower(token)) != stopwords_.end();
}

std::string TextNormalizer::lemmatize(const std::string& token) {
    const auto& irregular = irregularPlurals();
    auto it = irregular.find(token);
    if (it != irregular.end()) return it->second;

    if (token.size() <= 3 || invariantWords().count(token) > 0) return token;
    if (endsWith(token, "ss") || endsWith(token, "us") || endsWith(token, "is") || endsWith(token, "ics")) {
        return token;
    }

    if (endsWith(token, "men")) return dropSuffix(token, 3, "man");
    if (endsWith(token, "ies")) return dropSuffix(token, 3, "y");
    if (endsWith(token, "sses") || endsWith(token, "ches") || endsWith(token, "shes") ||
        endsWith(token, "xes") || endsWith(token, "zzes")) {
        return dropSuffix(token, 2);
    }
    if (token.size() > 4 && endsWith(token, "uses")) {
        // bonuses -> bonus, houses -> house
        const char before = token[token.size() - 5];
        return isVowel(before) ? dropSuffix(token, 1) : dropSuffix(token, 2);
    }
    if (token.back() == 's') return dropSuffix(token, 1);
    return token;
}

NormalizedText TextNormalizer::normalize(const std::string& text) const {
    NormalizedText out;
    if (text.empty()) return out;

    std::string cleaned;
    cleaned.reserve(text.size());
    for (unsigned char c : text) {
        if (std::isalpha(c)) {
            cleaned.push_back(static_cast<char>(std::tolower(c)));
        } else if (std::isspace(c)) {
            cleaned.push_back(' ');
        }
    }

    size_t pos = 0;
    while (pos < cleaned.size()) {
        const size_t start = cleaned.find_first_not_of(' ', pos);
        if (start == std::string::npos) break;
        size_t end = cleaned.find(' ', start);
        if (end == std::string::npos) end = cleaned.size();
        const std::string token = cleaned.substr(start, end - start);
        pos = end;

        if (stopwords_.count(token) > 0) continue;
        std::string lemma = lemmatize(token);
        if (!lemma.empty()) out.tokens.push_back(std::move(lemma));
    }
    return out;
}
