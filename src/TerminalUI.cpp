#include "TerminalUI.h"
#include <algorithm>
#include <iostream>
#include <iomanip>
#include <map>
#include <sstream>
#include <vector>

namespace {
constexpr const char* kMissingCell = "<NA>";

std::string formatCell(const TypedColumn& col, size_t row) {
    if (col.isMissing(row)) return kMissingCell;
    if (col.type == ColumnType::NUMERIC) {
        std::ostringstream os;
        os << *col.numericAt(row);
        return os.str();
    }
    // Quote text so surrounding whitespace stays visible.
    return "\"" + *col.textAt(row) + "\"";
}
}

void TerminalUI::printTable(const std::string& title, const Table& table) {
    const size_t rows = table.rowCount();
    std::vector<std::vector<std::string>> cells(table.colCount(), std::vector<std::string>(rows));
    std::vector<size_t> widths(table.colCount(), 0);

    for (size_t c = 0; c < table.colCount(); ++c) {
        const TypedColumn& col = table.columns()[c];
        widths[c] = std::max<size_t>(col.name.size(), 6);
        for (size_t r = 0; r < rows; ++r) {
            cells[c][r] = formatCell(col, r);
            widths[c] = std::max(widths[c], cells[c][r].size());
        }
    }

    size_t total = 8;
    for (size_t w : widths) total += w + 2;

    std::cout << "\n== " << title << " (" << rows << " rows x " << table.colCount() << " cols) ==\n";
    std::cout << std::left << std::setw(8) << "index";
    for (size_t c = 0; c < table.colCount(); ++c) {
        std::cout << std::setw(static_cast<int>(widths[c] + 2)) << table.columns()[c].name;
    }
    std::cout << "\n" << std::string(total, '-') << "\n";

    for (size_t r = 0; r < rows; ++r) {
        std::cout << std::left << std::setw(8) << table.rowIndex()[r];
        for (size_t c = 0; c < table.colCount(); ++c) {
            std::cout << std::setw(static_cast<int>(widths[c] + 2)) << cells[c][r];
        }
        std::cout << "\n";
    }
}

void TerminalUI::printCleaningReport(const CleaningReport& report) {
    std::cout << "\n============================== CLEANING REPORT ==============================\n";
    std::cout << "    Rows: " << report.originalRowCount << " -> " << report.finalRowCount << "\n";

    // Sorted for stable output.
    const std::map<std::string, size_t> trimmed(report.trimmedCells.begin(), report.trimmedCells.end());
    for (const auto& kv : trimmed) {
        std::cout << "    [Trim] " << std::left << std::setw(15) << kv.first << kv.second << " value(s) trimmed\n";
    }
    std::cout << "    [Missing] " << report.droppedMissingRows << " row(s) dropped\n";

    const std::map<std::string, StatsUtils::IqrBounds> bounds(report.outlierBounds.begin(), report.outlierBounds.end());
    const std::ios_base::fmtflags flags = std::cout.flags();
    const std::streamsize precision = std::cout.precision();
    for (const auto& kv : bounds) {
        const auto& b = kv.second;
        const auto count = report.outlierCounts.find(kv.first);
        std::cout << "    [Outliers] " << std::left << std::setw(15) << kv.first
                  << std::fixed << std::setprecision(3)
                  << "Q1=" << b.q1 << " Q3=" << b.q3 << " IQR=" << b.iqr
                  << " fence=[" << b.lower << ", " << b.upper << "]"
                  << " removed=" << (count != report.outlierCounts.end() ? count->second : 0) << "\n";
    }
    std::cout.flags(flags);
    std::cout.precision(precision);
    std::cout << "=============================================================================\n";
}
