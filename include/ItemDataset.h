#pragma once
#include <cstdint>
#include <string>
#include <vector>

using MissingMask = std::vector<uint8_t>;

struct ItemColumn {
    std::string name;
    bool numeric = true;
    std::vector<double> values;
    MissingMask missing;
    std::string firstNonNumericToken;
    size_t firstNonNumericRow = 0;
};

/**
 * Dense respondent x item matrix, stored column-major.
 * Produced once by listwise deletion and read-only afterwards.
 */
struct ObservationMatrix {
    std::vector<std::string> items;
    std::vector<std::vector<double>> columns;

    size_t rowCount() const noexcept { return columns.empty() ? 0 : columns.front().size(); }
    size_t itemCount() const noexcept { return items.size(); }
    double at(size_t row, size_t item) const { return columns[item][row]; }

    /**
     * @brief Builds a new matrix from the given row indices (repeats allowed).
     * @pre every index < rowCount().
     */
    ObservationMatrix selectRows(const std::vector<size_t>& rowIndices) const;

    /**
     * @brief Builds a matrix from row-major data.
     * @throws Psynet::DatasetException when a row width differs from items.size().
     */
    static ObservationMatrix fromRows(std::vector<std::string> items, const std::vector<std::vector<double>>& rows);
};

struct MissingDataReport {
    size_t originalRows = 0;
    size_t keptRows = 0;
    size_t removedRows = 0;
    size_t allMissingRows = 0;
    std::vector<std::string> items;
    std::vector<size_t> missingPerItem;

    double removedRatio() const noexcept {
        return originalRows == 0 ? 0.0 : static_cast<double>(removedRows) / static_cast<double>(originalRows);
    }
};

class ItemDataset {
public:
    explicit ItemDataset(std::string filename, char delimiter = ',');

    /**
     * @brief Loads the CSV file and classifies every column as numeric or not.
     * @details A leading unnamed column (R row names) is dropped. Missing tokens
     * (empty, NA, N/A, null, nan, missing) are recorded in the per-column mask.
     * @throws Psynet::IOException / Psynet::DatasetException on IO or parse failure.
     */
    void load();

    size_t rowCount() const noexcept { return rowCount_; }
    size_t colCount() const noexcept { return columns_.size(); }
    const std::vector<ItemColumn>& columns() const noexcept { return columns_; }

    std::vector<size_t> numericColumnIndices() const;
    std::vector<std::string> numericColumnNames() const;

    /**
     * @brief Returns index of named column or -1 when absent.
     */
    int findColumnIndex(const std::string& name) const;

    /**
     * @brief Listwise deletion over the requested items.
     * @post Returned matrix has no missing values; report (if given) counts removals.
     * @throws Psynet::DatasetException when an item is absent, non-numeric or
     * entirely missing, or when no complete row remains.
     */
    ObservationMatrix completeCases(const std::vector<std::string>& items, MissingDataReport* report = nullptr) const;

private:
    std::string filename_;
    char delimiter_;
    size_t rowCount_ = 0;
    std::vector<ItemColumn> columns_;

    static bool parseDouble(const std::string& v, double& out);
};
