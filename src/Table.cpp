#include "Table.h"
#include "ScourExceptions.h"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
using NumVec = std::vector<double>;
using StrVec = std::vector<std::string>;

size_t storageSize(const ColumnStorage& values) {
    return std::visit([](const auto& v) { return v.size(); }, values);
}

template <typename T>
TypedColumn makeColumn(std::string name, ColumnType type, const std::vector<std::optional<T>>& cells) {
    TypedColumn col;
    col.name = std::move(name);
    col.type = type;
    std::vector<T> values;
    values.reserve(cells.size());
    col.missing.reserve(cells.size());
    for (const auto& cell : cells) {
        values.push_back(cell.has_value() ? *cell : T{});
        col.missing.push_back(cell.has_value() ? 0 : 1);
    }
    col.values = std::move(values);
    return col;
}

template <typename T>
std::vector<T> keepRows(const std::vector<T>& values, const MissingMask& keepMask, size_t keptCount) {
    std::vector<T> next;
    next.reserve(keptCount);
    for (size_t i = 0; i < values.size(); ++i) {
        if (keepMask[i]) next.push_back(values[i]);
    }
    return next;
}

template <typename T>
bool sameObservedCells(const std::vector<T>& a, const std::vector<T>& b, const MissingMask& missing) {
    for (size_t i = 0; i < a.size(); ++i) {
        if (missing[i]) continue;
        if (!(a[i] == b[i])) return false;
    }
    return true;
}
}

const char* columnTypeName(ColumnType type) noexcept {
    switch (type) {
        case ColumnType::NUMERIC: return "numeric";
        case ColumnType::CATEGORICAL: return "categorical";
        case ColumnType::TEXT: return "text";
    }
    return "unknown";
}

size_t TypedColumn::missingCount() const noexcept {
    return static_cast<size_t>(std::count_if(missing.begin(), missing.end(), [](uint8_t m) { return m != 0; }));
}

std::optional<double> TypedColumn::numericAt(size_t row) const {
    if (isMissing(row)) return std::nullopt;
    return std::get<NumVec>(values)[row];
}

std::optional<std::string> TypedColumn::textAt(size_t row) const {
    if (isMissing(row)) return std::nullopt;
    return std::get<StrVec>(values)[row];
}

bool TypedColumn::operator==(const TypedColumn& other) const {
    if (name != other.name || type != other.type || missing != other.missing) return false;
    if (values.index() != other.values.index()) return false;
    if (type == ColumnType::NUMERIC) {
        return sameObservedCells(std::get<NumVec>(values), std::get<NumVec>(other.values), missing);
    }
    return sameObservedCells(std::get<StrVec>(values), std::get<StrVec>(other.values), missing);
}

TypedColumn makeNumericColumn(std::string name, const std::vector<std::optional<double>>& cells) {
    return makeColumn(std::move(name), ColumnType::NUMERIC, cells);
}

TypedColumn makeTextColumn(std::string name, const std::vector<std::optional<std::string>>& cells) {
    return makeColumn(std::move(name), ColumnType::TEXT, cells);
}

TypedColumn makeCategoricalColumn(std::string name, const std::vector<std::optional<std::string>>& cells) {
    return makeColumn(std::move(name), ColumnType::CATEGORICAL, cells);
}

Table::Table(std::vector<TypedColumn> columns) {
    for (auto& col : columns) addColumn(std::move(col));
}

Table::Table(std::vector<TypedColumn> columns, RowIndex rowIndex) : rowIndex_(std::move(rowIndex)) {
    for (const auto& col : columns) {
        if (col.size() != rowIndex_.size()) {
            throw Scour::TableException("Row index length " + std::to_string(rowIndex_.size()) +
                                        " does not match column '" + col.name + "' length " +
                                        std::to_string(col.size()));
        }
    }
    for (auto& col : columns) addColumn(std::move(col));
}

void Table::validateColumn(const TypedColumn& column) const {
    if (column.name.empty()) throw Scour::TableException("Column name must not be empty");
    if (findColumnIndex(column.name) >= 0) {
        throw Scour::TableException("Duplicate column name '" + column.name + "'");
    }

    const bool numericStorage = std::holds_alternative<NumVec>(column.values);
    if ((column.type == ColumnType::NUMERIC) != numericStorage) {
        throw Scour::TableException("Column '" + column.name + "' storage does not match type " +
                                    columnTypeName(column.type));
    }
    if (storageSize(column.values) != column.missing.size()) {
        throw Scour::TableException("Column '" + column.name + "' missing mask size mismatch");
    }
    if (!columns_.empty() || !rowIndex_.empty()) {
        if (column.size() != rowCount()) {
            throw Scour::TableException("Column '" + column.name + "' has " + std::to_string(column.size()) +
                                        " rows, expected " + std::to_string(rowCount()));
        }
    }
}

void Table::addColumn(TypedColumn column) {
    validateColumn(column);

    if (columns_.empty() && rowIndex_.empty()) {
        rowIndex_.resize(column.size());
        std::iota(rowIndex_.begin(), rowIndex_.end(), int64_t{0});
    }

    // Any nonzero marker means missing; store it as 1 for every column type.
    for (auto& m : column.missing) m = m ? 1 : 0;

    if (column.type == ColumnType::NUMERIC) {
        auto& values = std::get<NumVec>(column.values);
        for (size_t i = 0; i < values.size(); ++i) {
            if (column.missing[i] || std::isnan(values[i])) {
                column.missing[i] = 1;
                values[i] = 0.0;
            }
        }
    }

    columns_.push_back(std::move(column));
}

std::vector<std::string> Table::columnNames() const {
    std::vector<std::string> out;
    out.reserve(columns_.size());
    for (const auto& col : columns_) out.push_back(col.name);
    return out;
}

int Table::findColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].name == name) return static_cast<int>(i);
    return -1;
}

const TypedColumn& Table::column(const std::string& name) const {
    const int idx = findColumnIndex(name);
    if (idx < 0) throw Scour::ColumnNotFoundException(name);
    return columns_[static_cast<size_t>(idx)];
}

Table Table::selectRows(const MissingMask& keepMask) const {
    if (keepMask.size() != rowCount()) throw Scour::TableException("Row mask size mismatch");

    const size_t kept = static_cast<size_t>(std::count_if(keepMask.begin(), keepMask.end(),
                                                          [](uint8_t k) { return k != 0; }));

    Table out;
    out.rowIndex_ = keepRows(rowIndex_, keepMask, kept);
    out.columns_.resize(columns_.size());

    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(static)
    #endif
    for (size_t c = 0; c < columns_.size(); ++c) {
        const TypedColumn& src = columns_[c];
        TypedColumn& dst = out.columns_[c];
        dst.name = src.name;
        dst.type = src.type;
        dst.missing = keepRows(src.missing, keepMask, kept);
        if (src.type == ColumnType::NUMERIC) {
            dst.values = keepRows(std::get<NumVec>(src.values), keepMask, kept);
        } else {
            dst.values = keepRows(std::get<StrVec>(src.values), keepMask, kept);
        }
    }

    return out;
}

bool Table::operator==(const Table& other) const {
    return rowIndex_ == other.rowIndex_ && columns_ == other.columns_;
}
