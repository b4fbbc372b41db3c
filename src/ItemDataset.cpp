#include "ItemDataset.h"
#include "CSVUtils.h"
#include "CommonUtils.h"
#include "PsynetExceptions.h"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <fstream>
#include <limits>

namespace {
bool isMissingToken(const std::string& raw) {
    std::string s = CommonUtils::trim(raw);
    if (s.empty()) return true;
    s = CommonUtils::toLower(s);
    return s == "na" || s == "n/a" || s == "null" || s == "none" || s == "nan" || s == "missing" || s == ".";
}
} // namespace

ItemDataset::ItemDataset(std::string filename, char delimiter)
    : filename_(std::move(filename)), delimiter_(delimiter) {}

bool ItemDataset::parseDouble(const std::string& v, double& out) {
    std::string cleaned = CommonUtils::trim(v);
    if (!cleaned.empty() && cleaned.front() == '+') cleaned.erase(cleaned.begin());
    if (cleaned.empty()) return false;

    const char* b = cleaned.data();
    const char* e = b + cleaned.size();
    auto [p, ec] = std::from_chars(b, e, out, std::chars_format::general);
    return ec == std::errc{} && p == e && std::isfinite(out);
}

void ItemDataset::load() {
    std::ifstream in(filename_, std::ios::binary);
    if (!in) throw Psynet::IOException("Could not open file: " + filename_);

    CSVUtils::skipBOM(in);

    CSVUtils::RecordStatus status;
    auto rawHeader = CSVUtils::parseCSVLine(in, delimiter_, &status);
    if (status.malformed || rawHeader.empty()) throw Psynet::DatasetException("Malformed or empty CSV header");

    const bool hasRowNames = rawHeader.size() > 1 && rawHeader.front().empty();
    const size_t skip = hasRowNames ? 1 : 0;
    const std::vector<std::string> header = CSVUtils::normalizeHeader(
        std::vector<std::string>(rawHeader.begin() + static_cast<long>(skip), rawHeader.end()));

    columns_.assign(header.size(), ItemColumn{});
    for (size_t c = 0; c < header.size(); ++c) columns_[c].name = header[c];
    rowCount_ = 0;

    size_t lineNo = 1 + status.consumedLines;
    while (in.peek() != EOF) {
        const size_t recordLine = lineNo + 1;
        auto row = CSVUtils::parseCSVLine(in, delimiter_, &status);
        lineNo += std::max<size_t>(1, status.consumedLines);
        if (status.malformed) {
            throw Psynet::DatasetException("Unterminated quoted field near line " + std::to_string(recordLine));
        }
        if (status.limitExceeded) {
            throw Psynet::DatasetException("Record exceeds parser limits near line " + std::to_string(recordLine));
        }
        if (row.empty()) continue;

        if (row.size() > header.size() + skip) {
            const bool extraEmpty = std::all_of(row.begin() + static_cast<long>(header.size() + skip), row.end(),
                                                [](const std::string& v) { return CommonUtils::trim(v).empty(); });
            if (!extraEmpty) {
                throw Psynet::DatasetException("Line " + std::to_string(recordLine) + " has " + std::to_string(row.size()) +
                                               " fields, header has " + std::to_string(header.size() + skip));
            }
        }
        row.resize(header.size() + skip);

        for (size_t c = 0; c < header.size(); ++c) {
            ItemColumn& col = columns_[c];
            const std::string& token = row[c + skip];
            double value = 0.0;
            if (isMissingToken(token)) {
                col.values.push_back(std::numeric_limits<double>::quiet_NaN());
                col.missing.push_back(1);
            } else if (parseDouble(token, value)) {
                col.values.push_back(value);
                col.missing.push_back(0);
            } else {
                if (col.numeric) {
                    col.numeric = false;
                    col.firstNonNumericToken = token;
                    col.firstNonNumericRow = rowCount_ + 1;
                }
                col.values.push_back(std::numeric_limits<double>::quiet_NaN());
                col.missing.push_back(1);
            }
        }
        ++rowCount_;
    }

    if (rowCount_ == 0) throw Psynet::DatasetException("Dataset has a header but no data rows: " + filename_);
}

std::vector<size_t> ItemDataset::numericColumnIndices() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].numeric) out.push_back(i);
    return out;
}

std::vector<std::string> ItemDataset::numericColumnNames() const {
    std::vector<std::string> out;
    for (size_t idx : numericColumnIndices()) out.push_back(columns_[idx].name);
    return out;
}

int ItemDataset::findColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].name == name) return static_cast<int>(i);
    return -1;
}

ObservationMatrix ItemDataset::completeCases(const std::vector<std::string>& items, MissingDataReport* report) const {
    if (items.empty()) throw Psynet::DatasetException("No items selected for analysis");

    std::vector<size_t> idx;
    idx.reserve(items.size());
    for (const auto& item : items) {
        const int found = findColumnIndex(item);
        if (found < 0) throw Psynet::DatasetException("Item column not found: " + item);
        const ItemColumn& col = columns_[static_cast<size_t>(found)];
        if (!col.numeric) {
            throw Psynet::DatasetException("Item column '" + item + "' is not numeric (token '" + col.firstNonNumericToken +
                                           "' in data row " + std::to_string(col.firstNonNumericRow) + ")");
        }
        if (std::all_of(col.missing.begin(), col.missing.end(), [](uint8_t m) { return m != 0; })) {
            throw Psynet::DatasetException("Item column '" + item + "' is entirely missing");
        }
        idx.push_back(static_cast<size_t>(found));
    }

    MissingDataReport local;
    local.originalRows = rowCount_;
    local.items = items;
    local.missingPerItem.assign(items.size(), 0);

    MissingMask keep(rowCount_, 1);
    for (size_t r = 0; r < rowCount_; ++r) {
        size_t missingInRow = 0;
        for (size_t k = 0; k < idx.size(); ++k) {
            if (columns_[idx[k]].missing[r]) {
                ++missingInRow;
                ++local.missingPerItem[k];
            }
        }
        if (missingInRow > 0) keep[r] = 0;
        if (missingInRow == idx.size()) ++local.allMissingRows;
    }

    local.keptRows = static_cast<size_t>(std::count(keep.begin(), keep.end(), static_cast<uint8_t>(1)));
    local.removedRows = rowCount_ - local.keptRows;
    if (report) *report = local;

    if (local.keptRows == 0) {
        throw Psynet::DatasetException("No complete cases remain after listwise deletion (" +
                                       std::to_string(rowCount_) + " rows, all incomplete)");
    }

    ObservationMatrix out;
    out.items = items;
    out.columns.assign(idx.size(), std::vector<double>{});
    for (size_t k = 0; k < idx.size(); ++k) {
        const auto& values = columns_[idx[k]].values;
        auto& dst = out.columns[k];
        dst.reserve(local.keptRows);
        for (size_t r = 0; r < rowCount_; ++r) {
            if (keep[r]) dst.push_back(values[r]);
        }
    }
    return out;
}

ObservationMatrix ObservationMatrix::selectRows(const std::vector<size_t>& rowIndices) const {
    ObservationMatrix out;
    out.items = items;
    out.columns.assign(columns.size(), std::vector<double>{});
    for (size_t c = 0; c < columns.size(); ++c) {
        auto& dst = out.columns[c];
        dst.reserve(rowIndices.size());
        for (size_t r : rowIndices) dst.push_back(columns[c][r]);
    }
    return out;
}

ObservationMatrix ObservationMatrix::fromRows(std::vector<std::string> items, const std::vector<std::vector<double>>& rows) {
    ObservationMatrix out;
    out.columns.assign(items.size(), std::vector<double>{});
    for (auto& col : out.columns) col.reserve(rows.size());
    for (size_t r = 0; r < rows.size(); ++r) {
        if (rows[r].size() != items.size()) {
            throw Psynet::DatasetException("Row " + std::to_string(r) + " has " + std::to_string(rows[r].size()) +
                                           " values, expected " + std::to_string(items.size()));
        }
        for (size_t c = 0; c < items.size(); ++c) out.columns[c].push_back(rows[r][c]);
    }
    out.items = std::move(items);
    return out;
}
