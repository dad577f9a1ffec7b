#include "reflection/interpreter.hpp"
#include "random/deterministic_rng.hpp"
#include <algorithm>

namespace putman {

InterpretationSummary Interpreter::interpret(
    const std::vector<BeamCandidate>& beams,
    const ScoreMap& scores,
    const Graph& kept_graph
) const {
    InterpretationSummary summary;
    summary.top_nodes = topK(scores);
    summary.top_edges = topK(edgeContributions(beams));

    kept_graph.forEachNode([&](const Node& n) {
        auto it = scores.find(n.id);
        summary.centroid[n.id] = it != scores.end() ? it->second : 0.0;
    });
    return summary;
}

std::map<std::string, double> Interpreter::edgeContributions(
    const std::vector<BeamCandidate>& beams) {
    std::map<std::string, double> contribution;
    for (const auto& beam : beams) {
        for (const auto& edge_id : beam.edge_path) {
            contribution[edge_id] += beam.score;
        }
    }
    return contribution;
}

std::vector<ScoredId> Interpreter::topK(const std::map<std::string, double>& values) const {
    std::vector<std::pair<std::string, double>> ranked(values.begin(), values.end());
    std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) return a.second > b.second;
        return a.first < b.first;
    });

    std::vector<ScoredId> top;
    for (size_t i = 0; i < ranked.size() && i < top_k_; i++) {
        top.push_back({ranked[i].first, round3(ranked[i].second)});
    }
    return top;
}

} // namespace putman
