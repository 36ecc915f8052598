#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// Low-level tokenization of survey exports. Values stay raw strings here;
// score and date interpretation happen in the record source.
struct ParseLimits {
    size_t maxFieldBytes = 1024 * 1024;        // 1 MiB of free text per cell
    size_t maxRecordBytes = 16 * 1024 * 1024;  // 16 MiB
    size_t maxColumns = 4096;
};

std::string trimUnquotedField(const std::string& value);
void skipBOM(std::istream& is);

/**
 * @brief Reads one logical record. Quoted fields may span physical lines.
 * @post Returns an empty vector at EOF or for a blank line.
 */
std::vector<std::string> parseCSVLine(std::istream& is,
                                      char delimiter,
                                      bool* malformed = nullptr,
                                      bool* limitExceeded = nullptr,
                                      const ParseLimits& limits = ParseLimits{});

// Fills blank names and de-duplicates repeated ones with a numeric suffix.
std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);

// Accepts integer epoch seconds, YYYY-MM-DD, and YYYY-MM-DD[ T]HH:MM:SS.
bool parseTimestamp(const std::string& value, int64_t& outUnixSeconds);

int64_t daysFromCivil(int y, unsigned m, unsigned d);
}
