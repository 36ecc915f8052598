#include "FeedbackSource.h"

#include "CSVUtils.h"
#include "CanvassExceptions.h"
#include "CommonUtils.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <fstream>
#include <iostream>
#include <unordered_map>

namespace {
constexpr double kMinScore = 1.0;
constexpr double kMaxScore = 5.0;

bool parseScore(const std::string& raw, double& out) {
    const std::string s = CommonUtils::trim(raw);
    if (s.empty()) return false;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out, std::chars_format::general);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return false;
    return std::isfinite(out) && out >= kMinScore && out <= kMaxScore;
}

bool isTruthy(const std::string& raw) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(raw));
    return v == "1" || v == "true" || v == "yes" || v == "y" || v == "t" ||
           v == "complete" || v == "completed";
}

std::optional<size_t> findColumn(const std::unordered_map<std::string, size_t>& index, const std::string& name) {
    if (name.empty()) return std::nullopt;
    auto it = index.find(name);
    if (it == index.end()) it = index.find(CommonUtils::toLower(name));
    if (it == index.end()) return std::nullopt;
    return it->second;
}

std::string fieldAt(const std::vector<std::string>& row, size_t idx) {
    return idx < row.size() ? row[idx] : std::string();
}
}

std::optional<double> FeedbackRecord::score(const std::string& category) const {
    auto it = categoryScores.find(category);
    if (it == categoryScores.end()) return std::nullopt;
    return it->second;
}

std::optional<double> FeedbackRecord::meanScore() const {
    if (categoryScores.empty()) return std::nullopt;
    double sum = 0.0;
    for (const auto& [category, value] : categoryScores) sum += value;
    return sum / static_cast<double>(categoryScores.size());
}

bool FeedbackQuery::matches(const FeedbackRecord& record) const {
    if (since || until) {
        if (record.submittedAt == 0) return false;
        if (since && record.submittedAt < *since) return false;
        if (until && record.submittedAt > *until) return false;
    }
    if (!requiredCategory.empty() && record.categoryScores.count(requiredCategory) == 0) return false;
    return true;
}

void InMemoryFeedbackSource::add(const RunContext& context, FeedbackRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    recordsByTenant_[context.tenant].push_back(std::move(record));
}

void InMemoryFeedbackSource::clear(const RunContext& context) {
    std::lock_guard<std::mutex> lock(mutex_);
    recordsByTenant_.erase(context.tenant);
}

size_t InMemoryFeedbackSource::size(const RunContext& context) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = recordsByTenant_.find(context.tenant);
    return it == recordsByTenant_.end() ? 0 : it->second.size();
}

std::vector<FeedbackRecord> InMemoryFeedbackSource::completeRecords(const RunContext& context,
                                                                    const FeedbackQuery& query) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<FeedbackRecord> out;
    auto it = recordsByTenant_.find(context.tenant);
    if (it == recordsByTenant_.end()) return out;
    for (const auto& record : it->second) {
        if (record.complete && query.matches(record)) out.push_back(record);
    }
    return out;
}

const std::map<std::string, std::vector<std::string>>& CsvFeedbackSource::defaultCategoryColumns() {
    static const std::map<std::string, std::vector<std::string>> columns = {
        {"Compensation & Benefits", {"salary_fairness", "compensation_competitiveness", "benefits_adequacy"}},
        {"Work-Life Balance", {"workload_balance", "schedule_flexibility", "leave_policies_adequacy"}},
        {"Culture & Values", {"mission_values_meaningful", "positive_inclusive_culture",
                              "Company_acts_ethically", "encouragement_of_innovation"}},
        {"Diversity & Inclusion", {"positive_inclusive_culture", "colleague_respect_support",
                                   "team_collaboration_effectiveness", "constructive_conflict_management"}},
        {"Career Development", {"professional_growth_opportunities", "training_skill_development",
                                "clear_career_paths"}},
        {"Management & Leadership", {"manager_communication_clarity", "raising_concerns_comfortability",
                                     "manager_support_for_employees"}}
    };
    return columns;
}

CsvFeedbackSource::CsvFeedbackSource(CsvSourceOptions options) : options_(std::move(options)) {}

std::vector<FeedbackRecord> CsvFeedbackSource::completeRecords(const RunContext& context,
                                                               const FeedbackQuery& query) const {
    (void)context;
    std::ifstream in(options_.path, std::ios::binary);
    if (!in) throw Canvass::IOException("Could not open feedback file: " + options_.path);

    CSVUtils::skipBOM(in);
    bool malformed = false;
    bool limitExceeded = false;
    const std::vector<std::string> header =
        CSVUtils::normalizeHeader(CSVUtils::parseCSVLine(in, options_.delimiter, &malformed, &limitExceeded));
    if (header.empty() || malformed || limitExceeded) {
        throw Canvass::IOException("Feedback file has no readable header: " + options_.path);
    }

    std::unordered_map<std::string, size_t> index;
    for (size_t i = 0; i < header.size(); ++i) {
        index.emplace(header[i], i);
        index.emplace(CommonUtils::toLower(header[i]), i);
    }

    const auto textIdx = findColumn(index, options_.textColumn);
    if (!textIdx) {
        throw Canvass::IOException("Text column '" + options_.textColumn + "' not found in " + options_.path);
    }
    const auto idIdx = findColumn(index, options_.idColumn);
    const auto dateIdx = findColumn(index, options_.dateColumn);
    std::optional<size_t> completeIdx;
    if (!options_.completeColumn.empty()) {
        completeIdx = findColumn(index, options_.completeColumn);
        if (!completeIdx) {
            throw Canvass::IOException("Complete column '" + options_.completeColumn + "' not found in " + options_.path);
        }
    }

    std::vector<std::pair<std::string, std::vector<size_t>>> categoryIndices;
    for (const auto& category : options_.categories) {
        std::vector<std::string> columns;
        auto mapped = options_.categoryColumns.find(category);
        if (mapped != options_.categoryColumns.end()) {
            columns = mapped->second;
        } else {
            columns.push_back(category);
        }
        std::vector<size_t> resolved;
        for (const auto& column : columns) {
            if (auto idx = findColumn(index, column)) resolved.push_back(*idx);
        }
        if (resolved.empty()) {
            std::cout << "[Canvass][Warning] No score columns found for category '" << category << "'\n";
        }
        categoryIndices.emplace_back(category, std::move(resolved));
    }
    if (options_.verbose && !dateIdx && !options_.dateColumn.empty()) {
        std::cout << "[Canvass][Source] Date column '" << options_.dateColumn
                  << "' not present; submission dates are unknown\n";
    }

    std::vector<FeedbackRecord> out;
    size_t rowNumber = 0;
    size_t skippedMalformed = 0;
    size_t undatedRows = 0;
    while (in.peek() != EOF) {
        std::vector<std::string> row = CSVUtils::parseCSVLine(in, options_.delimiter, &malformed, &limitExceeded);
        if (row.empty()) {
            if (limitExceeded || malformed) ++skippedMalformed;
            continue;
        }
        ++rowNumber;
        if (malformed) {
            ++skippedMalformed;
            continue;
        }
        if (std::all_of(row.begin(), row.end(), [](const std::string& v) { return CommonUtils::isBlank(v); })) {
            continue;
        }

        FeedbackRecord record;
        record.id = idIdx ? CommonUtils::trim(fieldAt(row, *idIdx)) : std::string();
        if (record.id.empty()) record.id = std::to_string(rowNumber);
        record.text = fieldAt(row, *textIdx);
        record.complete = completeIdx ? isTruthy(fieldAt(row, *completeIdx)) : true;

        if (dateIdx) {
            const std::string rawDate = CommonUtils::trim(fieldAt(row, *dateIdx));
            // An unreadable date leaves the record undated; only a date filter drops it.
            if (!rawDate.empty() && !CSVUtils::parseTimestamp(rawDate, record.submittedAt)) {
                record.submittedAt = 0;
                ++undatedRows;
            }
        }

        for (const auto& [category, indices] : categoryIndices) {
            double sum = 0.0;
            size_t count = 0;
            for (size_t idx : indices) {
                double value = 0.0;
                if (parseScore(fieldAt(row, idx), value)) {
                    sum += value;
                    ++count;
                }
            }
            if (count > 0) record.categoryScores[category] = sum / static_cast<double>(count);
        }

        if (record.complete && query.matches(record)) out.push_back(std::move(record));
    }

    if (skippedMalformed > 0) {
        std::cout << "[Canvass][Warning] Skipped " << skippedMalformed << " malformed row(s) in " << options_.path << "\n";
    }
    if (undatedRows > 0) {
        std::cout << "[Canvass][Warning] " << undatedRows << " row(s) in " << options_.path
                  << " have unparseable dates and are treated as undated\n";
    }
    if (options_.verbose) {
        std::cout << "[Canvass][Source] Loaded " << out.size() << " complete record(s) from " << rowNumber
                  << " row(s)\n";
    }
    return out;
}
