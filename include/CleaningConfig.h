#pragma once
#include <string>
#include <vector>

struct CleaningConfig {
    // Text columns whose values get leading/trailing whitespace removed.
    std::vector<std::string> trimColumns;
    // Rows missing a value in any of these columns are dropped.
    std::vector<std::string> requiredColumns;
    // Numeric columns filtered by the Tukey fence, applied in order.
    std::vector<std::string> outlierColumns;

    // IQR multiplier for Tukey-style outlier fence (lower/higher => more/less aggressive).
    double outlierIqrMultiplier = 1.5;
    bool verbose = false;

    /**
     * @brief Validates column lists and the fence multiplier.
     * @throws Scour::ConfigurationException on empty or repeated names, or a
     *         negative / non-finite multiplier.
     */
    void validate() const;
};
