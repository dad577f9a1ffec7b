#pragma once

#include "activation/activation_scorer.hpp"

#include <vector>

namespace putman {

// ─── Shift Metric ─────────────────────────────────────────────
// Delta between consecutive steps: L2 distance between activation
// vectors, keys missing on one side counting as 0.

/// Unrounded L2 distance over the union of keys.
double l2Distance(const ScoreMap& a, const ScoreMap& b);

/// Stored delta for a step: 0 for the first step (no previous vector),
/// otherwise round3(l2Distance(previous, current)).
double stepDelta(const ScoreMap* previous, const ScoreMap& current);

struct DeltaStats {
    double max = 0.0;
    double mean = 0.0;
    bool has_change = false;  // max > 0
};

DeltaStats summarizeDeltas(const std::vector<double>& deltas);

} // namespace putman
