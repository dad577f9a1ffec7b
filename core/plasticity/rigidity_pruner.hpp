#pragma once

#include "activation/activation_scorer.hpp"
#include "graph/graph.hpp"

#include <string>
#include <vector>

namespace putman {

/// Outcome of one pruning pass.
struct PruneResult {
    Graph kept_graph;
    std::vector<std::string> active_set;    // graph order (beam seed order)
    std::vector<std::string> pruned_nodes;  // sorted
    std::vector<std::string> pruned_edges;  // sorted
};

// ─── Rigidity Pruner ──────────────────────────────────────────
// Two thresholds over the activation scores:
// - active:  score >= activation_threshold
// - kept:    score >= activation_threshold * rigidity
// An edge survives when both endpoints are kept and weight >= rigidity.
// With rigidity <= 1 the active set is a subset of the kept nodes.

class RigidityPruner {
public:
    RigidityPruner(double activation_threshold, double rigidity)
        : activation_threshold_(activation_threshold), rigidity_(rigidity) {}

    /// Identify active node ids, in graph order.
    std::vector<std::string> identifyActive(const Graph& graph, const ScoreMap& scores) const;

    /// Full pass: active set, reduced graph and the sorted complements.
    PruneResult prune(const Graph& graph, const ScoreMap& scores) const;

    double activationThreshold() const { return activation_threshold_; }
    double rigidity() const { return rigidity_; }
    double retentionThreshold() const { return activation_threshold_ * rigidity_; }

private:
    double activation_threshold_;
    double rigidity_;
};

} // namespace putman
