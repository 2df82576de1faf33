#include "StatsUtils.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace StatsUtils {
namespace {
// Weighted blend matching NumPy's linear method; the upper half is computed from b
// so that t == 1 returns b exactly.
double lerp(double a, double b, double t) {
    const double diff = b - a;
    if (t >= 0.5) return b - diff * (1.0 - t);
    return a + diff * t;
}
}

double percentileSorted(const std::vector<double>& sorted, double q) {
    if (sorted.empty()) return std::numeric_limits<double>::quiet_NaN();
    if (sorted.size() == 1) return sorted.front();

    const double qq = std::clamp(q, 0.0, 1.0);
    const double pos = qq * static_cast<double>(sorted.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(pos));
    const size_t hi = std::min(lo + 1, sorted.size() - 1);
    const double t = pos - static_cast<double>(lo);
    return lerp(sorted[lo], sorted[hi], t);
}

std::vector<double> observedValues(const std::vector<double>& values, const std::vector<uint8_t>& missing) {
    std::vector<double> observed;
    observed.reserve(values.size());
    for (size_t i = 0; i < values.size() && i < missing.size(); ++i) {
        if (missing[i]) continue;
        observed.push_back(values[i]);
    }
    return observed;
}

IqrBounds iqrBounds(std::vector<double> observed, double factor) {
    IqrBounds bounds;
    bounds.observed = observed.size();
    std::sort(observed.begin(), observed.end());

    bounds.q1 = percentileSorted(observed, 0.25);
    bounds.q3 = percentileSorted(observed, 0.75);
    bounds.iqr = bounds.q3 - bounds.q1;
    bounds.lower = bounds.q1 - factor * bounds.iqr;
    bounds.upper = bounds.q3 + factor * bounds.iqr;
    return bounds;
}
}
