#pragma once

#include "graph/graph.hpp"
#include "graph/context_vector.hpp"

#include <map>
#include <string>

namespace putman {

/// Node id → activation score in (0, 1).
using ScoreMap = std::map<std::string, double>;

/// Per-node breakdown of the activation formula.
struct ActivationTerms {
    double degree_score = 0.0;   // mean incident edge weight, 0 if isolated
    double context_score = 0.0;
    double novelty_bonus = 0.0;
    double raw = 0.0;
    double score = 0.0;          // sigmoid((raw - 0.5) * 4), rounded
};

// ─── Activation Scorer ─────────────────────────────────────────
// Stateless map over nodes:
//   raw   = blend * context + (1 - blend) * degree + novelty
//   score = round3(sigmoid((raw - 0.5) * 4))

class ActivationScorer {
public:
    static constexpr double kNoveltyBonus = 0.08;

    explicit ActivationScorer(double context_blend) : context_blend_(context_blend) {}

    /// Score every node in the graph.
    ScoreMap score(const Graph& graph, const ContextVector& context) const;

    /// Breakdown for a single node.
    ActivationTerms scoreNode(const Graph& graph, const ContextVector& context,
                              const Node& node) const;

    static double sigmoid(double x);

private:
    double context_blend_;
};

} // namespace putman
