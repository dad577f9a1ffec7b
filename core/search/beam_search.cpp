#include "search/beam_search.hpp"
#include "random/deterministic_rng.hpp"
#include <algorithm>

namespace putman {

bool BeamCandidate::visits(const std::string& node_id) const {
    return std::find(node_path.begin(), node_path.end(), node_id) != node_path.end();
}

std::string BeamCandidate::pathKey() const {
    std::string key;
    for (const auto& id : node_path) key += id;
    return key;
}

namespace {
double scoreOf(const ScoreMap& scores, const std::string& id) {
    auto it = scores.find(id);
    return it != scores.end() ? it->second : 0.0;
}
}

std::vector<BeamCandidate> BeamSearch::seedCandidates(
    const Graph& graph,
    const ScoreMap& scores,
    const std::vector<std::string>& active_set
) const {
    std::vector<std::string> seeds = active_set;
    if (seeds.empty()) {
        size_t count = std::min(static_cast<size_t>(config_.max_fallback_seeds), graph.nodeCount());
        for (size_t i = 0; i < count; i++) {
            seeds.push_back(graph.nodes()[i].id);
        }
    }

    std::vector<BeamCandidate> beams;
    beams.reserve(seeds.size());
    for (const auto& id : seeds) {
        BeamCandidate c;
        c.node_path.push_back(id);
        c.score = scoreOf(scores, id);
        beams.push_back(std::move(c));
    }
    return beams;
}

ReconstructionResult BeamSearch::search(
    const Graph& graph,
    const ScoreMap& scores,
    const std::vector<std::string>& active_set
) const {
    ReconstructionResult result;
    std::vector<BeamCandidate> beam = seedCandidates(graph, scores, active_set);

    for (int round = 0; round < config_.max_rounds; round++) {
        std::vector<BeamCandidate> candidates;

        for (const auto& parent : beam) {
            const std::string& tail = parent.tail();
            for (const Edge* edge : graph.incidentEdges(tail)) {
                const std::string& next = edge->other(tail);
                if (parent.visits(next)) continue;

                BeamCandidate child = parent;
                child.node_path.push_back(next);
                child.edge_path.push_back(edge->id);
                child.score = round3(parent.score + scoreOf(scores, next) + edge->weight);
                candidates.push_back(std::move(child));
            }
        }

        result.total_expansions += static_cast<int>(candidates.size());
        if (candidates.empty()) break;  // nothing left to extend

        std::stable_sort(candidates.begin(), candidates.end(), ranksBefore);

        size_t width = std::min(static_cast<size_t>(std::max(config_.beam_width, 1)),
                                candidates.size());
        candidates.resize(width);
        beam = std::move(candidates);
        result.rounds_completed = round + 1;
    }

    result.candidates = std::move(beam);
    return result;
}

bool BeamSearch::ranksBefore(const BeamCandidate& a, const BeamCandidate& b) {
    if (a.score != b.score) return a.score > b.score;
    return a.pathKey() < b.pathKey();
}

} // namespace putman
