#include "activation/activation_scorer.hpp"
#include "random/deterministic_rng.hpp"
#include <cmath>

namespace putman {

ScoreMap ActivationScorer::score(const Graph& graph, const ContextVector& context) const {
    ScoreMap scores;
    graph.forEachNode([&](const Node& node) {
        scores[node.id] = scoreNode(graph, context, node).score;
    });
    return scores;
}

ActivationTerms ActivationScorer::scoreNode(const Graph& graph, const ContextVector& context,
                                            const Node& node) const {
    ActivationTerms terms;

    auto incident = graph.incidentEdges(node.id);
    if (!incident.empty()) {
        double sum = 0.0;
        for (const Edge* e : incident) sum += e->weight;
        terms.degree_score = sum / static_cast<double>(incident.size());
    }
    terms.context_score = context.get(node.id);
    terms.novelty_bonus = node.is_novel ? kNoveltyBonus : 0.0;

    terms.raw = context_blend_ * terms.context_score +
                (1.0 - context_blend_) * terms.degree_score +
                terms.novelty_bonus;
    terms.score = round3(sigmoid((terms.raw - 0.5) * 4.0));
    return terms;
}

double ActivationScorer::sigmoid(double x) {
    return 1.0 / (1.0 + std::exp(-x));
}

} // namespace putman
