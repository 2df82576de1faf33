#include "CleaningConfig.h"
#include "ScourExceptions.h"
#include <cmath>
#include <unordered_set>

namespace {
void validateColumnList(const std::vector<std::string>& names, const std::string& key) {
    std::unordered_set<std::string> seen;
    for (const auto& name : names) {
        if (name.empty()) {
            throw Scour::ConfigurationException(key + " must not contain empty column names");
        }
        if (!seen.insert(name).second) {
            throw Scour::ConfigurationException(key + " lists column '" + name + "' more than once");
        }
    }
}
}

void CleaningConfig::validate() const {
    validateColumnList(trimColumns, "trim_columns");
    validateColumnList(requiredColumns, "required_columns");
    validateColumnList(outlierColumns, "outlier_columns");

    if (!std::isfinite(outlierIqrMultiplier) || outlierIqrMultiplier < 0.0) {
        throw Scour::ConfigurationException("outlier_iqr_multiplier must be a finite value >= 0");
    }
}
