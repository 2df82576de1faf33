#pragma once
#include "TableCleaner.h"
#include "Table.h"
#include <string>

class TerminalUI {
public:
    // Renders the row index and every column; missing cells show as <NA>.
    static void printTable(const std::string& title, const Table& table);
    static void printCleaningReport(const CleaningReport& report);
};
