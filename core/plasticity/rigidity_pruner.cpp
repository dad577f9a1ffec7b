#include "plasticity/rigidity_pruner.hpp"
#include <algorithm>
#include <unordered_set>

namespace putman {

namespace {
double scoreOf(const ScoreMap& scores, const std::string& id) {
    auto it = scores.find(id);
    return it != scores.end() ? it->second : 0.0;
}
}

std::vector<std::string> RigidityPruner::identifyActive(const Graph& graph,
                                                        const ScoreMap& scores) const {
    std::vector<std::string> active;
    for (const Node& n : graph.nodes()) {
        if (scoreOf(scores, n.id) >= activation_threshold_) {
            active.push_back(n.id);
        }
    }
    return active;
}

PruneResult RigidityPruner::prune(const Graph& graph, const ScoreMap& scores) const {
    PruneResult result;
    result.active_set = identifyActive(graph, scores);

    const double retention = retentionThreshold();
    std::unordered_set<std::string> kept;
    for (const Node& n : graph.nodes()) {
        if (scoreOf(scores, n.id) >= retention) {
            kept.insert(n.id);
        } else {
            result.pruned_nodes.push_back(n.id);
        }
    }

    const double edge_threshold = rigidity_;
    result.kept_graph = graph.extractSubgraph(kept, [edge_threshold](const Edge& e) {
        return e.weight >= edge_threshold;
    });

    for (const Edge& e : graph.edges()) {
        if (!result.kept_graph.hasEdge(e.id)) {
            result.pruned_edges.push_back(e.id);
        }
    }

    std::sort(result.pruned_nodes.begin(), result.pruned_nodes.end());
    std::sort(result.pruned_edges.begin(), result.pruned_edges.end());
    return result;
}

} // namespace putman
