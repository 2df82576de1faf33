#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

enum class ColumnType { NUMERIC, CATEGORICAL, TEXT };
using ColumnStorage = std::variant<std::vector<double>, std::vector<std::string>>;
using MissingMask = std::vector<uint8_t>;
using RowIndex = std::vector<int64_t>;

const char* columnTypeName(ColumnType type) noexcept;

struct TypedColumn {
    std::string name;
    ColumnType type = ColumnType::TEXT;
    ColumnStorage values = std::vector<std::string>{};
    MissingMask missing;

    size_t size() const noexcept { return missing.size(); }
    bool isMissing(size_t row) const { return missing[row] != 0; }
    size_t missingCount() const noexcept;

    /**
     * @brief Cell accessors; empty optional when the cell is missing.
     * @pre numericAt: type == NUMERIC. textAt: type is TEXT or CATEGORICAL.
     */
    std::optional<double> numericAt(size_t row) const;
    std::optional<std::string> textAt(size_t row) const;

    bool operator==(const TypedColumn& other) const;
    bool operator!=(const TypedColumn& other) const { return !(*this == other); }
};

TypedColumn makeNumericColumn(std::string name, const std::vector<std::optional<double>>& cells);
TypedColumn makeTextColumn(std::string name, const std::vector<std::optional<std::string>>& cells);
TypedColumn makeCategoricalColumn(std::string name, const std::vector<std::optional<std::string>>& cells);

class Table {
public:
    Table() = default;

    /**
     * @brief Builds a table with the default row index 0..n-1.
     * @throws Scour::TableException on duplicate names or unequal column lengths.
     */
    explicit Table(std::vector<TypedColumn> columns);

    /**
     * @brief Builds a table with explicit row labels.
     * @throws Scour::TableException when index length differs from the column length.
     */
    Table(std::vector<TypedColumn> columns, RowIndex rowIndex);

    /**
     * @brief Appends a column, storing every nonzero missing marker as 1 and
     *        normalising NaN cells of numeric columns to missing.
     * @pre column.name is not already present; column length equals rowCount()
     *      unless the table has no columns yet.
     * @throws Scour::TableException when an invariant would break.
     */
    void addColumn(TypedColumn column);

    size_t rowCount() const noexcept { return rowIndex_.size(); }
    size_t colCount() const noexcept { return columns_.size(); }

    const std::vector<TypedColumn>& columns() const noexcept { return columns_; }
    const RowIndex& rowIndex() const noexcept { return rowIndex_; }
    std::vector<std::string> columnNames() const;

    /**
     * @brief Returns index of named column or -1 when absent.
     */
    int findColumnIndex(const std::string& name) const;

    /**
     * @throws Scour::ColumnNotFoundException when the column is absent.
     */
    const TypedColumn& column(const std::string& name) const;

    /**
     * @brief Returns a new table holding the rows where keepMask is set.
     * @post Column order, types and row labels of kept rows are preserved.
     * @throws Scour::TableException when mask size mismatches row count.
     */
    Table selectRows(const MissingMask& keepMask) const;

    bool operator==(const Table& other) const;
    bool operator!=(const Table& other) const { return !(*this == other); }

private:
    std::vector<TypedColumn> columns_;
    RowIndex rowIndex_;

    void validateColumn(const TypedColumn& column) const;
};
