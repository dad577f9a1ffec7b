#pragma once

#include "activation/activation_scorer.hpp"
#include "config/pipeline_params.hpp"
#include "reflection/interpreter.hpp"
#include "search/beam_candidate.hpp"

#include <map>
#include <string>
#include <vector>

namespace putman {

/// Everything recorded for one recursion step. A self-contained value:
/// no references into engine state.
struct StepRunLog {
    int step = 0;
    uint32_t seed = 0;
    PipelineParams params;
    std::vector<std::string> active_set;    // sorted
    std::vector<std::string> pruned_nodes;  // sorted
    std::vector<std::string> pruned_edges;  // sorted
    std::vector<BeamCandidate> beam_candidates;
    InterpretationSummary interpretation;
    ScoreMap activation_vector;
    std::map<std::string, double> edge_weights;
    double delta = 0.0;

    bool operator==(const StepRunLog& other) const {
        return step == other.step && seed == other.seed && params == other.params &&
               active_set == other.active_set && pruned_nodes == other.pruned_nodes &&
               pruned_edges == other.pruned_edges &&
               beam_candidates == other.beam_candidates &&
               interpretation == other.interpretation &&
               activation_vector == other.activation_vector &&
               edge_weights == other.edge_weights && delta == other.delta;
    }
};

/// The replayable trace of one run.
struct RunLog {
    static constexpr const char* kModelName = "PUTMAN Pipeline Visual Simulator";
    // Constant so the log stays a pure function of its inputs.
    static constexpr const char* kCreatedAt = "deterministic";

    std::string model = kModelName;
    std::string created_at = kCreatedAt;
    PipelineParams params;
    std::vector<StepRunLog> steps;

    std::vector<double> deltas() const {
        std::vector<double> out;
        out.reserve(steps.size());
        for (const auto& s : steps) out.push_back(s.delta);
        return out;
    }

    bool operator==(const RunLog& other) const {
        return model == other.model && created_at == other.created_at &&
               params == other.params && steps == other.steps;
    }
    bool operator!=(const RunLog& other) const { return !(*this == other); }
};

} // namespace putman
