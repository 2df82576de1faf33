#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace StatsUtils {

/**
 * @brief Tukey fence derived from the observed values of one column.
 * @details Quantile and fence fields are NaN when no value was observed.
 */
struct IqrBounds {
    double q1 = 0.0;
    double q3 = 0.0;
    double iqr = 0.0;
    double lower = 0.0;
    double upper = 0.0;
    size_t observed = 0;

    // Inclusive on both ends; false for NaN bounds or values.
    bool contains(double value) const noexcept { return lower <= value && value <= upper; }
};

double percentileSorted(const std::vector<double>& sorted, double q);
std::vector<double> observedValues(const std::vector<double>& values, const std::vector<uint8_t>& missing);
IqrBounds iqrBounds(std::vector<double> observed, double factor);

}
