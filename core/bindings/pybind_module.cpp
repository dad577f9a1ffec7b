// PyBind11 bindings for the PUTMAN C++ core.
// Exposes parameters, presets, the pipeline entry point, runlog values
// and the canonical hash to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "config/pipeline_params.hpp"
#include "graph/context_vector.hpp"
#include "graph/graph.hpp"
#include "metrics/shift_metric.hpp"
#include "pipeline/pipeline.hpp"
#include "reflection/interpreter.hpp"
#include "reflection/step_diff.hpp"
#include "runlog/runlog.hpp"
#include "runlog/runlog_hasher.hpp"
#include "search/beam_candidate.hpp"

namespace py = pybind11;

PYBIND11_MODULE(putman_bindings, m) {
    m.doc() = "PUTMAN pipeline engine bindings";

    py::register_exception<putman::InvalidParameter>(m, "InvalidParameter", PyExc_ValueError);

    // ── PipelineParams ──
    py::class_<putman::PipelineParams>(m, "PipelineParams")
        .def(py::init<>())
        .def_readwrite("seed", &putman::PipelineParams::seed)
        .def_readwrite("node_count", &putman::PipelineParams::node_count)
        .def_readwrite("edge_density", &putman::PipelineParams::edge_density)
        .def_readwrite("overlap_percent", &putman::PipelineParams::overlap_percent)
        .def_readwrite("recursion_depth", &putman::PipelineParams::recursion_depth)
        .def_readwrite("rigidity", &putman::PipelineParams::rigidity)
        .def_readwrite("beam_width", &putman::PipelineParams::beam_width)
        .def_readwrite("activation_threshold", &putman::PipelineParams::activation_threshold)
        .def_readwrite("context_blend", &putman::PipelineParams::context_blend)
        .def_readwrite("weight_learning_rate", &putman::PipelineParams::weight_learning_rate)
        .def_readwrite("drift_bias", &putman::PipelineParams::drift_bias)
        .def("validate", &putman::PipelineParams::validate)
        .def("get", &putman::PipelineParams::get)
        .def("set", &putman::PipelineParams::set)
        .def_static("field_names", &putman::PipelineParams::fieldNames);

    py::class_<putman::ClampResult>(m, "ClampResult")
        .def_readonly("applied", &putman::ClampResult::applied)
        .def_readonly("clamped_fields", &putman::ClampResult::clamped_fields);

    m.def("clamp_to_ui_bounds", &putman::clampToUiBounds);

    // ── Presets ──
    py::class_<putman::Preset>(m, "Preset")
        .def_readonly("name", &putman::Preset::name)
        .def_readonly("description", &putman::Preset::description)
        .def_readonly("params", &putman::Preset::params);

    m.def("builtin_presets", &putman::builtinPresets);
    m.def("find_preset", &putman::findPreset);

    // ── Graph ──
    py::class_<putman::Node>(m, "Node")
        .def_readonly("id", &putman::Node::id)
        .def_readonly("is_prior", &putman::Node::is_prior)
        .def_readonly("is_novel", &putman::Node::is_novel);

    py::class_<putman::Edge>(m, "Edge")
        .def_readonly("id", &putman::Edge::id)
        .def_readonly("source", &putman::Edge::source)
        .def_readonly("target", &putman::Edge::target)
        .def_readonly("weight", &putman::Edge::weight)
        .def_readonly("is_prior", &putman::Edge::is_prior);

    py::class_<putman::Graph>(m, "Graph")
        .def("nodes", &putman::Graph::nodes)
        .def("edges", &putman::Graph::edges)
        .def("node_count", &putman::Graph::nodeCount)
        .def("edge_count", &putman::Graph::edgeCount);

    py::class_<putman::ContextVector>(m, "ContextVector")
        .def("get", &putman::ContextVector::get,
             py::arg("node_id"), py::arg("default_val") = 0.0)
        .def("entries", &putman::ContextVector::entries)
        .def("__len__", &putman::ContextVector::size);

    // ── Runlog ──
    py::class_<putman::BeamCandidate>(m, "BeamCandidate")
        .def_readonly("node_path", &putman::BeamCandidate::node_path)
        .def_readonly("edge_path", &putman::BeamCandidate::edge_path)
        .def_readonly("score", &putman::BeamCandidate::score);

    py::class_<putman::ScoredId>(m, "ScoredId")
        .def_readonly("id", &putman::ScoredId::id)
        .def_readonly("score", &putman::ScoredId::score);

    py::class_<putman::InterpretationSummary>(m, "InterpretationSummary")
        .def_readonly("top_nodes", &putman::InterpretationSummary::top_nodes)
        .def_readonly("top_edges", &putman::InterpretationSummary::top_edges)
        .def_readonly("centroid", &putman::InterpretationSummary::centroid);

    py::class_<putman::StepRunLog>(m, "StepRunLog")
        .def_readonly("step", &putman::StepRunLog::step)
        .def_readonly("seed", &putman::StepRunLog::seed)
        .def_readonly("params", &putman::StepRunLog::params)
        .def_readonly("active_set", &putman::StepRunLog::active_set)
        .def_readonly("pruned_nodes", &putman::StepRunLog::pruned_nodes)
        .def_readonly("pruned_edges", &putman::StepRunLog::pruned_edges)
        .def_readonly("beam_candidates", &putman::StepRunLog::beam_candidates)
        .def_readonly("interpretation", &putman::StepRunLog::interpretation)
        .def_readonly("activation_vector", &putman::StepRunLog::activation_vector)
        .def_readonly("edge_weights", &putman::StepRunLog::edge_weights)
        .def_readonly("delta", &putman::StepRunLog::delta);

    py::class_<putman::RunLog>(m, "RunLog")
        .def_readonly("model", &putman::RunLog::model)
        .def_readonly("created_at", &putman::RunLog::created_at)
        .def_readonly("params", &putman::RunLog::params)
        .def_readonly("steps", &putman::RunLog::steps)
        .def("deltas", &putman::RunLog::deltas);

    py::class_<putman::SimulationOutput>(m, "SimulationOutput")
        .def_readonly("graph", &putman::SimulationOutput::graph)
        .def_readonly("context", &putman::SimulationOutput::context)
        .def_readonly("runlog", &putman::SimulationOutput::runlog);

    // ── Analysis ──
    py::class_<putman::StepDiff>(m, "StepDiff")
        .def_readonly("newly_active", &putman::StepDiff::newly_active)
        .def_readonly("newly_pruned", &putman::StepDiff::newly_pruned);

    py::class_<putman::DeltaStats>(m, "DeltaStats")
        .def_readonly("max", &putman::DeltaStats::max)
        .def_readonly("mean", &putman::DeltaStats::mean)
        .def_readonly("has_change", &putman::DeltaStats::has_change);

    m.def("diff_steps", &putman::diffAt, py::arg("runlog"), py::arg("index"));
    m.def("summarize_deltas", &putman::summarizeDeltas);

    // ── Entry points ──
    m.def("run_pipeline", &putman::runPipeline, py::arg("params"));
    m.def("runlog_hash", &putman::runlogHash, py::arg("runlog"));
    m.def("canonicalize", py::overload_cast<const putman::RunLog&>(
        &putman::RunlogHasher::canonicalize));
}
