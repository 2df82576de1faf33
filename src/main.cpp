#include "ScourExceptions.h"
#include "TableCleaner.h"
#include "TerminalUI.h"
#include <iostream>
#include <string>

namespace {
void printUsage(const std::string& prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Runs the cleaning operations on a built-in sample table.\n"
              << "Options:\n"
              << "  --verbose    Log each pipeline step\n"
              << "  --help       Show this help message\n";
}

Table makeSampleTable() {
    return Table({
        makeTextColumn("name", {std::string(" Alice "), std::string("Bob"), std::nullopt, std::string(" Carol ")}),
        makeNumericColumn("age", {25.0, std::nullopt, 35.0, 120.0}),
        makeTextColumn("city", {std::string("SCL"), std::string("LPZ"), std::string("SCL"), std::string("LPZ")}),
    });
}
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    try {
        const Table sample = makeSampleTable();
        TerminalUI::printTable("Sample", sample);

        TerminalUI::printTable("trimStrings(name)", TableCleaner::trimStrings(sample, {"name"}));
        TerminalUI::printTable("dropInvalidRows(name, age)", TableCleaner::dropInvalidRows(sample, {"name", "age"}));
        TerminalUI::printTable("removeOutliersIQR(age, 0.5)", TableCleaner::removeOutliersIQR(sample, "age", 0.5));

        CleaningConfig config;
        config.trimColumns = {"name", "city"};
        config.requiredColumns = {"name"};
        config.outlierColumns = {"age"};
        config.outlierIqrMultiplier = 0.5;
        config.verbose = verbose;

        const CleaningResult result = TableCleaner::run(sample, config);
        TerminalUI::printTable("Pipeline result", result.table);
        TerminalUI::printCleaningReport(result.report);
    } catch (const Scour::ScourException& e) {
        std::cerr << "[Scour] " << e.what() << "\n";
        return 1;
    }
    return 0;
}
