#pragma once

#include "activation/activation_scorer.hpp"
#include "search/beam_candidate.hpp"
#include "graph/graph.hpp"

#include <map>
#include <string>
#include <vector>

namespace putman {

/// An id paired with a rounded score.
struct ScoredId {
    std::string id;
    double score = 0.0;

    bool operator==(const ScoredId& other) const {
        return id == other.id && score == other.score;
    }
};

/// Summary of one step.
struct InterpretationSummary {
    std::vector<ScoredId> top_nodes;         // by activation score
    std::vector<ScoredId> top_edges;         // by accumulated beam contribution
    std::map<std::string, double> centroid;  // every kept node → current score

    bool operator==(const InterpretationSummary& other) const {
        return top_nodes == other.top_nodes && top_edges == other.top_edges &&
               centroid == other.centroid;
    }
};

// ─── Interpreter ──────────────────────────────────────────────
// Pure summarization over the scores, the surviving beam and the
// pruned graph. Rankings break ties by id ascending.

class Interpreter {
public:
    explicit Interpreter(size_t top_k = 5) : top_k_(top_k) {}

    InterpretationSummary interpret(
        const std::vector<BeamCandidate>& beams,
        const ScoreMap& scores,
        const Graph& kept_graph
    ) const;

    /// Sum of candidate scores per edge, over every candidate traversing it.
    static std::map<std::string, double> edgeContributions(
        const std::vector<BeamCandidate>& beams);

private:
    std::vector<ScoredId> topK(const std::map<std::string, double>& values) const;

    size_t top_k_;
};

} // namespace putman
