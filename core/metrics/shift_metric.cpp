#include "metrics/shift_metric.hpp"
#include "random/deterministic_rng.hpp"
#include <algorithm>
#include <cmath>

namespace putman {

double l2Distance(const ScoreMap& a, const ScoreMap& b) {
    double sum = 0.0;
    auto ia = a.begin();
    auto ib = b.begin();
    // Both maps are ordered: walk the key union in one merge pass.
    while (ia != a.end() || ib != b.end()) {
        double va = 0.0;
        double vb = 0.0;
        if (ib == b.end() || (ia != a.end() && ia->first < ib->first)) {
            va = (ia++)->second;
        } else if (ia == a.end() || ib->first < ia->first) {
            vb = (ib++)->second;
        } else {
            va = (ia++)->second;
            vb = (ib++)->second;
        }
        double diff = va - vb;
        sum += diff * diff;
    }
    return std::sqrt(sum);
}

double stepDelta(const ScoreMap* previous, const ScoreMap& current) {
    if (!previous) return 0.0;
    return round3(l2Distance(*previous, current));
}

DeltaStats summarizeDeltas(const std::vector<double>& deltas) {
    DeltaStats stats;
    if (deltas.empty()) return stats;

    double total = 0.0;
    for (double d : deltas) {
        stats.max = std::max(stats.max, d);
        total += d;
    }
    stats.mean = total / static_cast<double>(deltas.size());
    stats.has_change = stats.max > 0.0;
    return stats;
}

} // namespace putman
