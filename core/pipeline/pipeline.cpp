#include "pipeline/pipeline.hpp"

#include "activation/activation_scorer.hpp"
#include "graph/graph_generator.hpp"
#include "metrics/shift_metric.hpp"
#include "plasticity/rigidity_pruner.hpp"
#include "plasticity/weight_updater.hpp"
#include "reflection/interpreter.hpp"
#include "search/beam_search.hpp"

#include <algorithm>
#include <utility>

namespace putman {

Pipeline::Pipeline(const PipelineParams& params) : params_(params) {
    params_.validate();
}

SimulationOutput Pipeline::run() const {
    GeneratedGraph generated = GraphGenerator::generate(params_.seed, params_.generatorParams());
    Graph graph = std::move(generated.graph);
    ContextVector context = std::move(generated.context);

    const WeightUpdater updater(params_);

    SimulationOutput out;
    out.runlog.params = params_;

    ScoreMap previous;
    for (int step = 0; step < params_.recursion_depth; step++) {
        ScoreMap scores;
        out.runlog.steps.push_back(
            runStep(step, graph, context, step > 0 ? &previous : nullptr, scores));

        if (step < params_.recursion_depth - 1) {
            graph = updater.updateWeights(graph, scores,
                                          WeightUpdater::stepSeed(params_.seed, step));
            context = updater.driftContext(context, step);
        }
        previous = std::move(scores);
    }

    out.graph = std::move(graph);
    out.context = std::move(context);
    return out;
}

StepRunLog Pipeline::runStep(int step, const Graph& graph, const ContextVector& context,
                             const ScoreMap* previous_scores, ScoreMap& scores_out) const {
    const ActivationScorer scorer(params_.context_blend);
    const RigidityPruner pruner(params_.activation_threshold, params_.rigidity);
    BeamConfig beam_config;
    beam_config.beam_width = params_.beam_width;
    const BeamSearch beam(beam_config);
    const Interpreter interpreter;

    ScoreMap scores = scorer.score(graph, context);
    PruneResult pruned = pruner.prune(graph, scores);
    ReconstructionResult reconstruction = beam.search(pruned.kept_graph, scores, pruned.active_set);

    StepRunLog log;
    log.step = step;
    log.seed = params_.seed;
    log.params = params_;
    log.active_set = pruned.active_set;
    std::sort(log.active_set.begin(), log.active_set.end());
    log.pruned_nodes = std::move(pruned.pruned_nodes);
    log.pruned_edges = std::move(pruned.pruned_edges);
    log.interpretation = interpreter.interpret(reconstruction.candidates, scores, pruned.kept_graph);
    log.beam_candidates = std::move(reconstruction.candidates);
    for (const Edge& e : graph.edges()) {
        log.edge_weights[e.id] = e.weight;
    }
    log.delta = stepDelta(previous_scores, scores);
    log.activation_vector = scores;

    scores_out = std::move(scores);
    return log;
}

SimulationOutput runPipeline(const PipelineParams& params) {
    return Pipeline(params).run();
}

} // namespace putman
