#include "config/pipeline_params.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace putman {

namespace {

void requireFinite(const std::string& field, double value) {
    if (!std::isfinite(value)) {
        throw InvalidParameter(field, "must be finite");
    }
}

void requireRange(const std::string& field, double value,
                  double lo, bool lo_inclusive, double hi, bool hi_inclusive) {
    requireFinite(field, value);
    bool ok_lo = lo_inclusive ? value >= lo : value > lo;
    bool ok_hi = hi_inclusive ? value <= hi : value < hi;
    if (!ok_lo || !ok_hi) {
        throw InvalidParameter(field,
            std::to_string(value) + " outside " + (lo_inclusive ? "[" : "(") +
            std::to_string(lo) + ", " + std::to_string(hi) + (hi_inclusive ? "]" : ")"));
    }
}

void requireAtLeastOne(const std::string& field, int value) {
    if (value < 1) {
        throw InvalidParameter(field, std::to_string(value) + " must be >= 1");
    }
}

// Whole numbers beyond the int range saturate, so clamping still sees
// which side of the bounds they fell on.
int toIntField(double value) {
    constexpr double lo = std::numeric_limits<int>::min();
    constexpr double hi = std::numeric_limits<int>::max();
    return static_cast<int>(std::min(hi, std::max(lo, value)));
}

double roundHalfUp(double value) {
    return std::floor(value + 0.5);
}

} // namespace

void PipelineParams::validate() const {
    requireAtLeastOne("nodeCount", node_count);
    requireRange("edgeDensity", edge_density, 0.0, false, 1.0, true);
    requireRange("overlapPercent", overlap_percent, 0.0, true, 1.0, true);
    requireAtLeastOne("recursionDepth", recursion_depth);
    requireRange("rigidity", rigidity, 0.0, false, 1.0, true);
    requireAtLeastOne("beamWidth", beam_width);
    requireRange("activationThreshold", activation_threshold, 0.0, false, 1.0, false);
    requireRange("contextBlend", context_blend, 0.0, true, 1.0, true);
    requireRange("weightLearningRate", weight_learning_rate, 0.0, true, 1.0, true);
    requireRange("driftBias", drift_bias, 0.0, true, 1.0, true);
}

const std::vector<std::string>& PipelineParams::fieldNames() {
    static const std::vector<std::string> names = {
        "seed", "nodeCount", "edgeDensity", "overlapPercent", "recursionDepth",
        "rigidity", "beamWidth", "activationThreshold", "contextBlend",
        "weightLearningRate", "driftBias",
    };
    return names;
}

bool PipelineParams::isIntegerField(const std::string& field) {
    return field == "seed" || field == "nodeCount" ||
           field == "recursionDepth" || field == "beamWidth";
}

double PipelineParams::get(const std::string& field) const {
    if (field == "seed") return static_cast<double>(seed);
    if (field == "nodeCount") return node_count;
    if (field == "edgeDensity") return edge_density;
    if (field == "overlapPercent") return overlap_percent;
    if (field == "recursionDepth") return recursion_depth;
    if (field == "rigidity") return rigidity;
    if (field == "beamWidth") return beam_width;
    if (field == "activationThreshold") return activation_threshold;
    if (field == "contextBlend") return context_blend;
    if (field == "weightLearningRate") return weight_learning_rate;
    if (field == "driftBias") return drift_bias;
    throw InvalidParameter(field, "unknown field");
}

void PipelineParams::set(const std::string& field, double value) {
    if (isIntegerField(field)) {
        requireFinite(field, value);
        if (value != std::floor(value)) {
            throw InvalidParameter(field, "must be an integer");
        }
    }
    if (field == "seed") {
        if (value < 0.0 || value > 4294967295.0) {
            throw InvalidParameter(field, "must fit an unsigned 32-bit integer");
        }
        seed = static_cast<uint32_t>(value);
    }
    else if (field == "nodeCount") node_count = toIntField(value);
    else if (field == "edgeDensity") edge_density = value;
    else if (field == "overlapPercent") overlap_percent = value;
    else if (field == "recursionDepth") recursion_depth = toIntField(value);
    else if (field == "rigidity") rigidity = value;
    else if (field == "beamWidth") beam_width = toIntField(value);
    else if (field == "activationThreshold") activation_threshold = value;
    else if (field == "contextBlend") context_blend = value;
    else if (field == "weightLearningRate") weight_learning_rate = value;
    else if (field == "driftBias") drift_bias = value;
    else throw InvalidParameter(field, "unknown field");
}

bool PipelineParams::operator==(const PipelineParams& other) const {
    for (const auto& field : fieldNames()) {
        if (get(field) != other.get(field)) return false;
    }
    return true;
}

// ─── Interactive bounds ───────────────────────────────────────

const std::vector<ParamBounds>& uiBounds() {
    static const std::vector<ParamBounds> bounds = {
        {"seed", 0, 9999},
        {"nodeCount", 12, 60},
        {"edgeDensity", 0.08, 0.45},
        {"overlapPercent", 0.05, 0.8},
        {"recursionDepth", 2, 16},
        {"rigidity", 0.1, 0.7},
        {"beamWidth", 1, 10},
        {"activationThreshold", 0.3, 0.8},
        {"contextBlend", 0.1, 0.9},
        {"weightLearningRate", 0.05, 0.5},
        {"driftBias", 0.0, 0.4},
    };
    return bounds;
}

ClampResult clampToUiBounds(const PipelineParams& requested) {
    ClampResult result;
    result.applied = requested;
    for (const auto& b : uiBounds()) {
        double value = requested.get(b.field);
        double clamped = std::min(b.max, std::max(b.min, value));
        if (PipelineParams::isIntegerField(b.field)) {
            clamped = roundHalfUp(clamped);
        }
        result.applied.set(b.field, clamped);
        if (clamped != value) {
            result.clamped_fields.push_back(b.field);
        }
    }
    return result;
}

// ─── Presets ──────────────────────────────────────────────────

const std::vector<Preset>& builtinPresets() {
    static const std::vector<Preset> presets = [] {
        std::vector<Preset> p;

        Preset stable;
        stable.name = "stable";
        stable.description =
            "Moderate rigidity and low drift: the active core settles within a few steps.";
        p.push_back(stable);  // defaults are the stable configuration

        Preset drift;
        drift.name = "drift";
        drift.description =
            "Strong drift bias and a fast learning rate: novel edges gain weight every step.";
        drift.params.seed = 7;
        drift.params.node_count = 32;
        drift.params.edge_density = 0.25;
        drift.params.overlap_percent = 0.45;
        drift.params.recursion_depth = 10;
        drift.params.rigidity = 0.3;
        drift.params.beam_width = 5;
        drift.params.activation_threshold = 0.5;
        drift.params.context_blend = 0.45;
        drift.params.weight_learning_rate = 0.35;
        drift.params.drift_bias = 0.3;
        p.push_back(drift);

        Preset collapse;
        collapse.name = "collapse";
        collapse.description =
            "High rigidity on a sparse graph: pruning removes most structure and the beam narrows.";
        collapse.params.seed = 13;
        collapse.params.node_count = 20;
        collapse.params.edge_density = 0.12;
        collapse.params.overlap_percent = 0.15;
        collapse.params.recursion_depth = 8;
        collapse.params.rigidity = 0.65;
        collapse.params.beam_width = 2;
        collapse.params.activation_threshold = 0.7;
        collapse.params.context_blend = 0.7;
        collapse.params.weight_learning_rate = 0.1;
        collapse.params.drift_bias = 0.02;
        p.push_back(collapse);

        return p;
    }();
    return presets;
}

std::optional<Preset> findPreset(const std::string& name) {
    for (const auto& preset : builtinPresets()) {
        if (preset.name == name) return preset;
    }
    return std::nullopt;
}

} // namespace putman
