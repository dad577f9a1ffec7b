#pragma once

#include <string>
#include <vector>

namespace putman {

/// A partial reconstruction path. edge_path[i] joins node_path[i] and
/// node_path[i + 1]; no node repeats within a path.
struct BeamCandidate {
    std::vector<std::string> node_path;
    std::vector<std::string> edge_path;
    double score = 0.0;  // cumulative, rounded to 3 decimals per extension

    const std::string& tail() const { return node_path.back(); }

    bool visits(const std::string& node_id) const;

    /// Concatenated node ids; the tie-break key between equal scores.
    std::string pathKey() const;

    bool operator==(const BeamCandidate& other) const {
        return node_path == other.node_path && edge_path == other.edge_path &&
               score == other.score;
    }
};

/// Beam search configuration.
struct BeamConfig {
    int beam_width = 4;   // candidates kept per round
    int max_rounds = 3;   // expansion rounds, independent of recursion depth
    int max_fallback_seeds = 3;  // seeds taken from graph order when nothing is active
};

/// Result of a reconstruction run.
struct ReconstructionResult {
    std::vector<BeamCandidate> candidates;
    int rounds_completed = 0;
    int total_expansions = 0;
};

} // namespace putman
