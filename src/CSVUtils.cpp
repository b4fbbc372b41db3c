#include "CSVUtils.h"

#include <unordered_set>

namespace CSVUtils {
std::string trimUnquotedField(const std::string& value) {
    if (value.empty()) return value;
    const size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    const size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

void skipBOM(std::istream& is) {
    if (!is.good()) return;
    static const unsigned char bom[3] = {0xEF, 0xBB, 0xBF};

    size_t matched = 0;
    while (matched < 3) {
        const int next = is.peek();
        if (next == EOF || static_cast<unsigned char>(next) != bom[matched]) break;
        is.get();
        ++matched;
    }
    if (matched == 3 || matched == 0) return;

    is.clear(is.rdstate() & ~std::ios::eofbit);
    while (matched-- > 0) is.unget();
}

std::vector<std::string> parseCSVLine(std::istream& is,
                                      char delimiter,
                                      RecordStatus* status,
                                      const ParseLimits& limits) {
    RecordStatus local;
    RecordStatus& st = status ? *status : local;
    st = RecordStatus{};
    if (is.peek() == EOF) return {};

    std::vector<std::string> row;
    std::string val;
    bool inQuotes = false;
    bool fieldQuoted = false;
    bool sawDelimiter = false;
    char c;

    auto pushField = [&]() {
        row.push_back(fieldQuoted ? val : trimUnquotedField(val));
        val.clear();
        fieldQuoted = false;
        if (limits.maxColumns > 0 && row.size() > limits.maxColumns) st.limitExceeded = true;
    };

    while (is.get(c)) {
        if (limits.maxFieldBytes > 0 && val.size() > limits.maxFieldBytes) {
            st.limitExceeded = true;
            break;
        }

        if (inQuotes) {
            if (c == '"') {
                if (is.peek() == '"') {
                    is.get();
                    val += '"';
                } else {
                    inQuotes = false;
                }
            } else {
                if (c == '\n') ++st.consumedLines;
                val += c;
            }
            continue;
        }

        if (c == '"' && CSVUtils::trimUnquotedField(val).empty()) {
            val.clear();
            inQuotes = true;
            fieldQuoted = true;
        } else if (c == delimiter) {
            pushField();
            sawDelimiter = true;
            if (st.limitExceeded) break;
        } else if (c == '\r' || c == '\n') {
            if (c == '\r' && is.peek() == '\n') is.get();
            ++st.consumedLines;
            break;
        } else if (fieldQuoted && (c == ' ' || c == '\t')) {
            continue;
        } else {
            val += c;
        }
    }

    if (inQuotes) st.malformed = true;

    if (!sawDelimiter && !fieldQuoted && trimUnquotedField(val).empty()) {
        return {};
    }
    pushField();
    return row;
}

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header) {
    std::vector<std::string> out = header;
    std::unordered_set<std::string> seen;

    for (size_t i = 0; i < out.size(); ++i) {
        if (out[i].empty()) {
            out[i] = "column_" + std::to_string(i + 1);
        }

        const std::string original = out[i];
        if (seen.find(out[i]) != seen.end()) {
            size_t suffix = 2;
            while (seen.find(original + "_" + std::to_string(suffix)) != seen.end()) {
                ++suffix;
            }
            out[i] = original + "_" + std::to_string(suffix);
        }
        seen.insert(out[i]);
    }

    return out;
}
} // namespace CSVUtils
