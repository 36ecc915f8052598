#include "CSVUtils.h"

#include "CommonUtils.h"

#include <charconv>
#include <unordered_set>

namespace {
bool parseFixedInt(const std::string& s, size_t offset, size_t len, int& out) {
    if (offset + len > s.size()) return false;
    const char* b = s.data() + offset;
    const char* e = b + len;
    auto [ptr, ec] = std::from_chars(b, e, out);
    return ec == std::errc{} && ptr == e;
}

bool isLeapYear(int year) {
    if (year % 400 == 0) return true;
    if (year % 100 == 0) return false;
    return year % 4 == 0;
}

int daysInMonth(int year, int month) {
    static const int kMonthDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2) return isLeapYear(year) ? 29 : 28;
    return kMonthDays[month - 1];
}
}

namespace CSVUtils {
std::string trimUnquotedField(const std::string& value) {
    const size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    const size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

void skipBOM(std::istream& is) {
    static const unsigned char kBom[3] = {0xEF, 0xBB, 0xBF};
    if (!is.good()) return;
    size_t matched = 0;
    while (matched < 3) {
        const int next = is.peek();
        if (next == EOF || static_cast<unsigned char>(next) != kBom[matched]) break;
        is.get();
        ++matched;
    }
    if (matched == 3) return;
    is.clear(is.rdstate() & ~std::ios::eofbit);
    for (size_t i = 0; i < matched; ++i) is.unget();
}

std::vector<std::string> parseCSVLine(std::istream& is,
                                      char delimiter,
                                      bool* malformed,
                                      bool* limitExceeded,
                                      const ParseLimits& limits) {
    if (malformed) *malformed = false;
    if (limitExceeded) *limitExceeded = false;
    if (is.peek() == EOF) return {};

    std::vector<std::string> row;
    std::string val;
    bool inQuotes = false;
    bool fieldQuoted = false;
    bool sawData = false;
    bool exceeded = false;
    size_t recordBytes = 0;
    char c;

    auto pushField = [&]() {
        row.push_back(fieldQuoted ? val : trimUnquotedField(val));
        val.clear();
        fieldQuoted = false;
        if (limits.maxColumns > 0 && row.size() > limits.maxColumns) exceeded = true;
    };
    auto append = [&](char ch) {
        val.push_back(ch);
        if (limits.maxFieldBytes > 0 && val.size() > limits.maxFieldBytes) exceeded = true;
    };

    while (!exceeded && is.get(c)) {
        if (limits.maxRecordBytes > 0 && ++recordBytes > limits.maxRecordBytes) {
            exceeded = true;
            break;
        }

        if (c == '"') {
            sawData = true;
            if (!inQuotes && val.empty() && !fieldQuoted) {
                inQuotes = true;
                fieldQuoted = true;
            } else if (inQuotes && is.peek() == '"') {
                is.get();
                append('"');
            } else if (inQuotes) {
                inQuotes = false;
            } else {
                append(c);
            }
        } else if (c == delimiter && !inQuotes) {
            sawData = true;
            pushField();
        } else if (c == '\r' || c == '\n') {
            if (c == '\r' && is.peek() == '\n') is.get();
            if (!inQuotes) break;
            append('\n');
        } else {
            sawData = true;
            append(c);
        }
    }

    if (exceeded) {
        if (limitExceeded) *limitExceeded = true;
        // Discard the remainder of the oversized physical line.
        std::string rest;
        std::getline(is, rest);
        return {};
    }
    if (inQuotes && malformed) *malformed = true;
    if (!sawData) return {};

    pushField();
    return row;
}

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header) {
    std::vector<std::string> out;
    out.reserve(header.size());
    std::unordered_set<std::string> seen;

    for (size_t i = 0; i < header.size(); ++i) {
        std::string name = CommonUtils::trim(header[i]);
        if (name.empty()) name = "column_" + std::to_string(i + 1);

        std::string candidate = name;
        for (size_t suffix = 2; seen.count(candidate) > 0; ++suffix) {
            candidate = name + "_" + std::to_string(suffix);
        }
        seen.insert(candidate);
        out.push_back(std::move(candidate));
    }
    return out;
}

int64_t daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const int mp = static_cast<int>(m) + (m > 2 ? -3 : 9);
    const unsigned doy = (153 * static_cast<unsigned>(mp) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<int64_t>(era) * 146097 + static_cast<int64_t>(doe) - 719468;
}

bool parseTimestamp(const std::string& value, int64_t& outUnixSeconds) {
    const std::string s = CommonUtils::trim(value);
    if (s.empty()) return false;

    {
        int64_t epoch = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), epoch);
        if (ec == std::errc{} && ptr == s.data() + s.size()) {
            outUnixSeconds = epoch;
            return true;
        }
    }

    int year = 0, month = 0, day = 0;
    if (s.size() < 10 || s[4] != '-' || s[7] != '-' ||
        !parseFixedInt(s, 0, 4, year) || !parseFixedInt(s, 5, 2, month) || !parseFixedInt(s, 8, 2, day)) {
        return false;
    }
    if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month)) return false;

    int hour = 0, minute = 0, second = 0;
    if (s.size() > 10) {
        if (s[10] != ' ' && s[10] != 'T') return false;
        const std::string timePart = s.substr(11);
        // Fractional seconds and zone suffixes are ignored.
        if (timePart.size() < 8 ||
            !parseFixedInt(timePart, 0, 2, hour) || timePart[2] != ':' ||
            !parseFixedInt(timePart, 3, 2, minute) || timePart[5] != ':' ||
            !parseFixedInt(timePart, 6, 2, second)) {
            return false;
        }
        if (hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 60) return false;
    }

    const int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    outUnixSeconds = days * 86400 + static_cast<int64_t>(hour) * 3600 + static_cast<int64_t>(minute) * 60 + second;
    return true;
}
} // namespace CSVUtils
