#pragma once

#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// Record tokenization for respondent x item tables.
// Quoted fields keep their content verbatim; unquoted fields are trimmed.
struct ParseLimits {
    size_t maxFieldBytes = 1024 * 1024;       // 1 MiB
    size_t maxColumns = 4096;
};

struct RecordStatus {
    bool malformed = false;       // unterminated quote
    bool limitExceeded = false;
    size_t consumedLines = 0;
};

std::string trimUnquotedField(const std::string& value);
void skipBOM(std::istream& is);

/**
 * @brief Reads one logical CSV record (quoted fields may span lines).
 * @post Returns an empty vector at EOF or for a blank line.
 */
std::vector<std::string> parseCSVLine(std::istream& is,
                                      char delimiter,
                                      RecordStatus* status = nullptr,
                                      const ParseLimits& limits = ParseLimits{});

/**
 * @brief Fills empty header cells and de-duplicates repeated names.
 * @details R's write.csv emits an empty first header cell for row names; that
 * cell becomes "column_1" so it can be recognized and skipped.
 */
std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);
}
