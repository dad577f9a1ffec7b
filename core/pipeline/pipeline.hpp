#pragma once

#include "config/pipeline_params.hpp"
#include "graph/context_vector.hpp"
#include "graph/graph.hpp"
#include "runlog/runlog.hpp"

namespace putman {

/// Final engine state plus the trace of the run.
struct SimulationOutput {
    Graph graph;            // full graph after the last weight update
    ContextVector context;  // context after the last drift
    RunLog runlog;
};

// ─── Pipeline ─────────────────────────────────────────────────
// Generates the graph once, then for each of recursion_depth steps:
//   score → prune → beam reconstruct → interpret → delta
// followed (except after the last step) by weight and context drift.
// A run is closed: fresh graph, context and RNG instances per call,
// no I/O, no shared state.

class Pipeline {
public:
    /// Validates `params` (InvalidParameter) before building any state.
    explicit Pipeline(const PipelineParams& params);

    SimulationOutput run() const;

    const PipelineParams& params() const { return params_; }

private:
    StepRunLog runStep(int step, const Graph& graph, const ContextVector& context,
                       const ScoreMap* previous_scores, ScoreMap& scores_out) const;

    PipelineParams params_;
};

/// Engine entry point.
SimulationOutput runPipeline(const PipelineParams& params);

} // namespace putman
