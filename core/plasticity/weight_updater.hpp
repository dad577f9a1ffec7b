#pragma once

#include "activation/activation_scorer.hpp"
#include "config/pipeline_params.hpp"
#include "graph/context_vector.hpp"
#include "graph/graph.hpp"

#include <cstdint>

namespace putman {

// ─── Weight Updater ───────────────────────────────────────────
// Drift between recursion steps. Edge weights move toward the mean
// activation of their endpoints, novel edges get a small push, and a
// fresh RNG seeded per step adds a symmetric ±0.01 term:
//   w' = round3(clamp01(w(1 - lr) + mean * lr + push * 0.05 + (r - 0.5) * 0.02))
// Context drift is deterministic and periodic, independent of the RNG:
//   c' = round3(clamp01(c + sin((step + 1)(index + 1)) * 0.005 + bias * 0.01))

class WeightUpdater {
public:
    static constexpr double kNoveltyPushScale = 0.05;
    static constexpr double kStochasticSpan = 0.02;
    static constexpr double kContextWobble = 0.005;
    static constexpr double kContextBiasScale = 0.01;

    WeightUpdater(double learning_rate, double drift_bias)
        : learning_rate_(learning_rate), drift_bias_(drift_bias) {}

    explicit WeightUpdater(const PipelineParams& params)
        : WeightUpdater(params.weight_learning_rate, params.drift_bias) {}

    /// New graph with drifted edge weights. Draws one value per edge, in
    /// edge order, from an RNG seeded with `step_seed`.
    Graph updateWeights(const Graph& graph, const ScoreMap& scores, uint32_t step_seed) const;

    /// New context vector perturbed for the transition after `step`.
    ContextVector driftContext(const ContextVector& context, int step) const;

    /// Seed for the update that follows `step`.
    static uint32_t stepSeed(uint32_t base_seed, int step) {
        return base_seed + static_cast<uint32_t>(step) + 1u;
    }

private:
    double learning_rate_;
    double drift_bias_;
};

} // namespace putman
