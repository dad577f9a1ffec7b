#pragma once

#include "search/beam_candidate.hpp"
#include "activation/activation_scorer.hpp"
#include "graph/graph.hpp"

#include <string>
#include <vector>

namespace putman {

/// Beam Reconstructor: deterministic best-first path search.
/// Seeds are the active nodes (or the first few graph nodes when none
/// are active). Each round extends every beam along every incident edge
/// to a neighbor not yet on its path, pools the expansions, sorts them
/// by score (descending, ties by path key) and keeps beam_width.
/// Stops early when a round produces no expansion.
class BeamSearch {
public:
    explicit BeamSearch(BeamConfig config = {}) : config_(config) {}

    ReconstructionResult search(
        const Graph& graph,
        const ScoreMap& scores,
        const std::vector<std::string>& active_set
    ) const;

    /// Initial single-node candidates.
    std::vector<BeamCandidate> seedCandidates(
        const Graph& graph,
        const ScoreMap& scores,
        const std::vector<std::string>& active_set
    ) const;

private:
    /// Ordering used to rank pooled expansions.
    static bool ranksBefore(const BeamCandidate& a, const BeamCandidate& b);

    BeamConfig config_;
};

} // namespace putman
