#pragma once
#include "CleaningConfig.h"
#include "StatsUtils.h"
#include "Table.h"
#include <string>
#include <unordered_map>
#include <vector>

struct CleaningReport {
    size_t originalRowCount = 0;
    size_t finalRowCount = 0;
    std::unordered_map<std::string, size_t> trimmedCells;
    size_t droppedMissingRows = 0;
    std::unordered_map<std::string, StatsUtils::IqrBounds> outlierBounds;
    std::unordered_map<std::string, size_t> outlierCounts;
};

struct CleaningResult {
    Table table;
    CleaningReport report;
};

/**
 * Stateless table cleaning operations. Every operation validates its column
 * arguments before touching data and returns a new Table; the input is never
 * modified.
 */
class TableCleaner {
public:
    static constexpr double kDefaultIqrFactor = 1.5;

    /**
     * @brief Strips leading/trailing whitespace from every value of the named text columns.
     * @details Values are UTF-8; the whitespace set is CommonUtils::whitespaceLengthAt's.
     * @post Missing cells stay missing; other columns are unchanged.
     * @throws Scour::ColumnNotFoundException for the first absent name.
     * @throws Scour::ColumnTypeException when a named column is not TEXT.
     */
    static Table trimStrings(const Table& table, const std::vector<std::string>& cols);

    /**
     * @brief Keeps only rows where none of the named columns is missing.
     * @post Row labels of kept rows are preserved.
     * @throws Scour::ColumnNotFoundException for the first absent name.
     */
    static Table dropInvalidRows(const Table& table, const std::vector<std::string>& cols);

    /**
     * @brief Keeps rows whose value in col lies inside [Q1 - f*IQR, Q3 + f*IQR].
     * @details Quartiles use linear interpolation over the non-missing values.
     *          Rows missing col cannot be compared against the fence and are dropped.
     * @throws Scour::ColumnNotFoundException when col is absent.
     * @throws Scour::ColumnTypeException when col is not NUMERIC.
     * @throws Scour::ConfigurationException when factor is negative or not finite.
     */
    static Table removeOutliersIQR(const Table& table, const std::string& col,
                                   double factor = kDefaultIqrFactor);

    // Fence used by removeOutliersIQR; same validation.
    static StatsUtils::IqrBounds computeIqrBounds(const Table& table, const std::string& col,
                                                  double factor = kDefaultIqrFactor);

    /**
     * @brief Chains trim -> drop -> outlier removal as configured.
     * @throws Scour::ConfigurationException on invalid config, plus the errors of each step.
     */
    static CleaningResult run(const Table& table, const CleaningConfig& config);
};
