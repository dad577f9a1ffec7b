#include "plasticity/weight_updater.hpp"
#include "random/deterministic_rng.hpp"
#include <cmath>
#include <vector>

namespace putman {

namespace {
double scoreOf(const ScoreMap& scores, const std::string& id) {
    auto it = scores.find(id);
    return it != scores.end() ? it->second : 0.0;
}
}

Graph WeightUpdater::updateWeights(const Graph& graph, const ScoreMap& scores,
                                   uint32_t step_seed) const {
    DeterministicRng rng(step_seed);
    std::vector<double> weights;
    weights.reserve(graph.edgeCount());

    for (const Edge& e : graph.edges()) {
        double mean_activation = (scoreOf(scores, e.source) + scoreOf(scores, e.target)) / 2.0;
        double novelty_push = e.is_prior ? 0.0 : drift_bias_;
        double stochastic = (rng.next() - 0.5) * kStochasticSpan;
        double next = clamp01(e.weight * (1.0 - learning_rate_) +
                              mean_activation * learning_rate_ +
                              novelty_push * kNoveltyPushScale +
                              stochastic);
        weights.push_back(round3(next));
    }
    return graph.withEdgeWeights(weights);
}

ContextVector WeightUpdater::driftContext(const ContextVector& context, int step) const {
    ContextVector next;
    const auto& entries = context.entries();
    for (size_t index = 0; index < entries.size(); index++) {
        double perturb = std::sin(static_cast<double>(step + 1) * static_cast<double>(index + 1)) *
                         kContextWobble;
        next.set(entries[index].first,
                 round3(clamp01(entries[index].second + perturb + drift_bias_ * kContextBiasScale)));
    }
    return next;
}

} // namespace putman
