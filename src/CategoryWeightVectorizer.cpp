#include "CategoryWeightVectorizer.h"

#include "CanvassExceptions.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>

namespace {
constexpr size_t kMinTokenLength = 2;

bool isTokenChar(unsigned char c) {
    return std::isalnum(c) || c == '_';
}
}

CategoryWeightVectorizer::CategoryWeightVectorizer(VectorizerOptions options) : options_(options) {
    if (options_.ngramMin == 0) options_.ngramMin = 1;
    if (options_.ngramMax < options_.ngramMin) options_.ngramMax = options_.ngramMin;
    if (options_.minDocumentFrequency == 0) options_.minDocumentFrequency = 1;
}

const std::unordered_set<std::string>& CategoryWeightVectorizer::englishStopWords() {
    static const std::unordered_set<std::string> words = {
        "a", "about", "above", "across", "after", "afterwards", "again", "against", "all", "almost",
        "alone", "along", "already", "also", "although", "always", "am", "among", "amongst",
        "amoungst", "amount", "an", "and", "another", "any", "anyhow", "anyone", "anything",
        "anyway", "anywhere", "are", "around", "as", "at", "back", "be", "became", "because",
        "become", "becomes", "becoming", "been", "before", "beforehand", "behind", "being", "below",
        "beside", "besides", "between", "beyond", "bill", "both", "bottom", "but", "by", "call",
        "can", "cannot", "cant", "co", "con", "could", "couldnt", "cry", "de", "describe", "detail",
        "do", "done", "down", "due", "during", "each", "eg", "eight", "either", "eleven", "else",
        "elsewhere", "empty", "enough", "etc", "even", "ever", "every", "everyone", "everything",
        "everywhere", "except", "few", "fifteen", "fifty", "fill", "find", "fire", "first", "five",
        "for", "former", "formerly", "forty", "found", "four", "from", "front", "full", "further",
        "get", "give", "go", "had", "has", "hasnt", "have", "he", "hence", "her", "here",
        "hereafter", "hereby", "herein", "hereupon", "hers", "herself", "him", "himself", "his",
        "how", "however", "hundred", "i", "ie", "if", "in", "inc", "indeed", "interest", "into",
        "is", "it", "its", "itself", "keep", "last", "latter", "latterly", "least", "less", "ltd",
        "made", "many", "may", "me", "meanwhile", "might", "mill", "mine", "more", "moreover",
        "most", "mostly", "move", "much", "must", "my", "myself", "name", "namely", "neither",
        "never", "nevertheless", "next", "nine", "no", "nobody", "none", "noone", "nor", "not",
        "nothing", "now", "nowhere", "of", "off", "often", "on", "once", "one", "only", "onto",
        "or", "other", "others", "otherwise", "our", "ours", "ourselves", "out", "over", "own",
        "part", "per", "perhaps", "please", "put", "rather", "re", "same", "see", "seem", "seemed",
        "seeming", "seems", "serious", "several", "she", "should", "show", "side", "since",
        "sincere", "six", "sixty", "so", "some", "somehow", "someone", "something", "sometime",
        "sometimes", "somewhere", "still", "such", "system", "take", "ten", "than", "that", "the",
        "their", "them", "themselves", "then", "thence", "there", "thereafter", "thereby",
        "therefore", "therein", "thereupon", "these", "they", "thick", "thin", "third", "this",
        "those", "though", "three", "through", "throughout", "thru", "thus", "to", "together",
        "too", "top", "toward", "towards", "twelve", "twenty", "two", "un", "under", "until", "up",
        "upon", "us", "very", "via", "was", "we", "well", "were", "what", "whatever", "when",
        "whence", "whenever", "where", "whereafter", "whereas", "whereby", "wherein", "whereupon",
        "wherever", "whether", "which", "while", "whither", "who", "whoever", "whole", "whom",
        "whose", "why", "will", "with", "within", "without", "would", "yet", "you", "your", "yours",
        "yourself", "yourselves"
    };
    return words;
}

std::vector<std::string> CategoryWeightVectorizer::analyze(const std::string& text) const {
    std::vector<std::string> tokens;
    std::string cur;
    auto flush = [&]() {
        if (cur.size() >= kMinTokenLength &&
            (!options_.removeStopWords || englishStopWords().count(cur) == 0)) {
            tokens.push_back(cur);
        }
        cur.clear();
    };
    for (unsigned char c : text) {
        if (isTokenChar(c)) {
            cur.push_back(static_cast<char>(std::tolower(c)));
        } else {
            flush();
        }
    }
    flush();

    if (options_.ngramMin == 1 && options_.ngramMax == 1) return tokens;

    std::vector<std::string> grams;
    for (size_t n = options_.ngramMin; n <= options_.ngramMax; ++n) {
        if (tokens.size() < n) break;
        for (size_t i = 0; i + n <= tokens.size(); ++i) {
            std::string gram = tokens[i];
            for (size_t k = 1; k < n; ++k) {
                gram.push_back(' ');
                gram += tokens[i + k];
            }
            grams.push_back(std::move(gram));
        }
    }
    return grams;
}

void CategoryWeightVectorizer::fit(const std::vector<std::string>& corpus) {
    fitted_ = false;
    terms_.clear();
    termIndex_.clear();
    idf_.clear();

    if (corpus.empty()) {
        throw Canvass::VectorizationException("cannot fit on an empty corpus");
    }

    std::unordered_map<std::string, size_t> documentFrequency;
    std::unordered_map<std::string, size_t> termFrequency;
    for (const auto& doc : corpus) {
        std::unordered_map<std::string, size_t> counts;
        for (auto& term : analyze(doc)) ++counts[term];
        for (const auto& kv : counts) {
            ++documentFrequency[kv.first];
            termFrequency[kv.first] += kv.second;
        }
    }

    std::vector<std::string> kept;
    kept.reserve(documentFrequency.size());
    for (const auto& kv : documentFrequency) {
        if (kv.second >= options_.minDocumentFrequency) kept.push_back(kv.first);
    }

    if (options_.maxFeatures > 0 && kept.size() > options_.maxFeatures) {
        std::sort(kept.begin(), kept.end(), [&](const std::string& a, const std::string& b) {
            const size_t fa = termFrequency[a];
            const size_t fb = termFrequency[b];
            if (fa != fb) return fa > fb;
            return a < b;
        });
        kept.resize(options_.maxFeatures);
    }

    if (kept.empty()) {
        throw Canvass::VectorizationException(
            "empty vocabulary; documents contain only stop words or terms below min_df=" +
            std::to_string(options_.minDocumentFrequency));
    }

    std::sort(kept.begin(), kept.end());
    const double n = static_cast<double>(corpus.size());
    terms_ = std::move(kept);
    idf_.reserve(terms_.size());
    for (size_t i = 0; i < terms_.size(); ++i) {
        termIndex_.emplace(terms_[i], i);
        const double df = static_cast<double>(documentFrequency[terms_[i]]);
        idf_.push_back(std::log((1.0 + n) / (1.0 + df)) + 1.0);
    }
    fitted_ = true;
}

SparseVector CategoryWeightVectorizer::transform(const std::string& text) const {
    if (!fitted_) {
        throw Canvass::VectorizationException("transform called before fit");
    }

    std::map<size_t, double> weights;
    for (const auto& term : analyze(text)) {
        auto it = termIndex_.find(term);
        if (it != termIndex_.end()) weights[it->second] += 1.0;
    }

    SparseVector out;
    out.reserve(weights.size());
    double norm = 0.0;
    for (const auto& kv : weights) {
        const double w = kv.second * idf_[kv.first];
        out.emplace_back(kv.first, w);
        norm += w * w;
    }
    if (norm > 0.0) {
        norm = std::sqrt(norm);
        for (auto& entry : out) entry.second /= norm;
    }
    return out;
}

std::vector<SparseVector> CategoryWeightVectorizer::fitTransform(const std::vector<std::string>& corpus) {
    fit(corpus);
    std::vector<SparseVector> rows;
    rows.reserve(corpus.size());
    for (const auto& doc : corpus) rows.push_back(transform(doc));
    return rows;
}

std::vector<std::vector<double>> CategoryWeightVectorizer::toDense(const std::vector<SparseVector>& rows, size_t width) {
    std::vector<std::vector<double>> dense(rows.size(), std::vector<double>(width, 0.0));
    for (size_t r = 0; r < rows.size(); ++r) {
        for (const auto& entry : rows[r]) {
            if (entry.first < width) dense[r][entry.first] = entry.second;
        }
    }
    return dense;
}

std::optional<size_t> CategoryWeightVectorizer::indexOf(const std::string& term) const {
    auto it = termIndex_.find(term);
    if (it == termIndex_.end()) return std::nullopt;
    return it->second;
}
