#include "TableCleaner.h"
#include "CommonUtils.h"
#include "ScourExceptions.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
using NumVec = std::vector<double>;
using StrVec = std::vector<std::string>;

size_t requireColumn(const Table& table, const std::string& name) {
    const int idx = table.findColumnIndex(name);
    if (idx < 0) throw Scour::ColumnNotFoundException(name);
    return static_cast<size_t>(idx);
}

void requireType(const TypedColumn& col, ColumnType expected) {
    if (col.type != expected) {
        throw Scour::ColumnTypeException(col.name, columnTypeName(col.type), columnTypeName(expected));
    }
}

// Existence is checked for every name before any type check, so the first
// absent column wins over an earlier mistyped one.
std::vector<size_t> resolveColumns(const Table& table, const std::vector<std::string>& names) {
    std::vector<size_t> indices;
    indices.reserve(names.size());
    for (const auto& name : names) indices.push_back(requireColumn(table, name));
    return indices;
}

void validateFactor(double factor) {
    if (!std::isfinite(factor) || factor < 0.0) {
        throw Scour::ConfigurationException("IQR factor must be a finite value >= 0, got " + std::to_string(factor));
    }
}

size_t trimColumn(TypedColumn& col) {
    auto& values = std::get<StrVec>(col.values);
    size_t changed = 0;
    for (size_t i = 0; i < values.size(); ++i) {
        if (col.missing[i]) continue;
        std::string trimmed = CommonUtils::trim(values[i]);
        if (trimmed.size() == values[i].size()) continue;
        values[i] = std::move(trimmed);
        ++changed;
    }
    return changed;
}

Table trimStringsCounted(const Table& table,
                         const std::vector<std::string>& cols,
                         std::unordered_map<std::string, size_t>* changedCells) {
    std::vector<size_t> indices = resolveColumns(table, cols);
    for (size_t idx : indices) requireType(table.columns()[idx], ColumnType::TEXT);

    std::sort(indices.begin(), indices.end());
    indices.erase(std::unique(indices.begin(), indices.end()), indices.end());

    std::vector<TypedColumn> columns = table.columns();
    std::vector<size_t> changed(indices.size(), 0);

    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (size_t pos = 0; pos < indices.size(); ++pos) {
        changed[pos] = trimColumn(columns[indices[pos]]);
    }

    if (changedCells) {
        for (size_t pos = 0; pos < indices.size(); ++pos) {
            (*changedCells)[columns[indices[pos]].name] = changed[pos];
        }
    }
    return Table(std::move(columns), table.rowIndex());
}

StatsUtils::IqrBounds boundsForColumn(const TypedColumn& col, double factor) {
    const auto& values = std::get<NumVec>(col.values);
    return StatsUtils::iqrBounds(StatsUtils::observedValues(values, col.missing), factor);
}

// Missing cells have no value to compare, so they fall outside the fence.
Table keepInsideFence(const Table& table, const TypedColumn& column, const StatsUtils::IqrBounds& bounds) {
    const auto& values = std::get<NumVec>(column.values);
    MissingMask keep(values.size(), 0);
    for (size_t r = 0; r < values.size(); ++r) {
        keep[r] = (!column.missing[r] && bounds.contains(values[r])) ? 1 : 0;
    }
    return table.selectRows(keep);
}

const TypedColumn& requireNumericColumn(const Table& table, const std::string& col, double factor) {
    const TypedColumn& column = table.columns()[requireColumn(table, col)];
    requireType(column, ColumnType::NUMERIC);
    validateFactor(factor);
    return column;
}
}

Table TableCleaner::trimStrings(const Table& table, const std::vector<std::string>& cols) {
    return trimStringsCounted(table, cols, nullptr);
}

Table TableCleaner::dropInvalidRows(const Table& table, const std::vector<std::string>& cols) {
    const std::vector<size_t> indices = resolveColumns(table, cols);

    MissingMask keep(table.rowCount(), 1);
    for (size_t idx : indices) {
        const TypedColumn& col = table.columns()[idx];
        for (size_t r = 0; r < keep.size(); ++r) {
            if (col.missing[r]) keep[r] = 0;
        }
    }
    return table.selectRows(keep);
}

StatsUtils::IqrBounds TableCleaner::computeIqrBounds(const Table& table, const std::string& col, double factor) {
    return boundsForColumn(requireNumericColumn(table, col, factor), factor);
}

Table TableCleaner::removeOutliersIQR(const Table& table, const std::string& col, double factor) {
    const TypedColumn& column = requireNumericColumn(table, col, factor);
    return keepInsideFence(table, column, boundsForColumn(column, factor));
}

CleaningResult TableCleaner::run(const Table& table, const CleaningConfig& config) {
    config.validate();

    CleaningResult result;
    CleaningReport& report = result.report;
    report.originalRowCount = table.rowCount();
    result.table = table;

    if (!config.trimColumns.empty()) {
        result.table = trimStringsCounted(result.table, config.trimColumns, &report.trimmedCells);
        if (config.verbose) {
            size_t total = 0;
            for (const auto& kv : report.trimmedCells) total += kv.second;
            std::cout << "[Scour][Trim] " << total << " value(s) trimmed in: "
                      << CommonUtils::joinNames(config.trimColumns) << "\n";
        }
    }

    if (!config.requiredColumns.empty()) {
        const size_t before = result.table.rowCount();
        result.table = dropInvalidRows(result.table, config.requiredColumns);
        report.droppedMissingRows = before - result.table.rowCount();
        if (config.verbose) {
            std::cout << "[Scour][Missing] Dropped " << report.droppedMissingRows
                      << " row(s) missing any of: " << CommonUtils::joinNames(config.requiredColumns) << "\n";
        }
    }

    for (const auto& col : config.outlierColumns) {
        const size_t before = result.table.rowCount();
        const TypedColumn& column = requireNumericColumn(result.table, col, config.outlierIqrMultiplier);
        const StatsUtils::IqrBounds bounds = boundsForColumn(column, config.outlierIqrMultiplier);
        result.table = keepInsideFence(result.table, column, bounds);
        report.outlierBounds[col] = bounds;
        report.outlierCounts[col] = before - result.table.rowCount();
        if (config.verbose) {
            std::cout << "[Scour][Outliers] " << col << ": fence [" << bounds.lower << ", " << bounds.upper
                      << "], removed " << report.outlierCounts[col] << " row(s)\n";
        }
    }

    report.finalRowCount = result.table.rowCount();
    if (config.verbose) {
        std::cout << "[Scour] Cleaning complete: " << report.originalRowCount << " -> "
                  << report.finalRowCount << " rows.\n";
    }
    return result;
}
