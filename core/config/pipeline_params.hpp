#pragma once

#include "graph/graph_generator.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace putman {

// ─── InvalidParameter ─────────────────────────────────────────
// Raised at the engine boundary when a parameter is out of range.

class InvalidParameter : public std::invalid_argument {
public:
    InvalidParameter(std::string field, const std::string& message)
        : std::invalid_argument("Invalid parameter '" + field + "': " + message),
          field_(std::move(field)) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

// ─── Pipeline Parameters ──────────────────────────────────────
// The complete parameter record of a run. Field names exposed through
// get()/set()/fieldNames() are the external camelCase names used in
// runlogs and preset files.

struct PipelineParams {
    uint32_t seed = 42;
    int node_count = 24;                // >= 1
    double edge_density = 0.22;         // (0, 1]
    double overlap_percent = 0.3;       // [0, 1]
    int recursion_depth = 6;            // >= 1
    double rigidity = 0.3;              // (0, 1]
    int beam_width = 4;                 // >= 1
    double activation_threshold = 0.5;  // (0, 1)
    double context_blend = 0.55;        // [0, 1]
    double weight_learning_rate = 0.2;  // [0, 1]
    double drift_bias = 0.08;           // [0, 1]

    /// Throws InvalidParameter naming the first offending field.
    void validate() const;

    GeneratorParams generatorParams() const {
        return {node_count, edge_density, overlap_percent};
    }

    /// Field access by external name. Unknown names throw InvalidParameter.
    double get(const std::string& field) const;
    void set(const std::string& field, double value);

    /// External field names in canonical order.
    static const std::vector<std::string>& fieldNames();
    static bool isIntegerField(const std::string& field);

    bool operator==(const PipelineParams& other) const;
    bool operator!=(const PipelineParams& other) const { return !(*this == other); }
};

// ─── Interactive bounds ───────────────────────────────────────
// Tighter ranges applied to user and preset input before a run.

struct ParamBounds {
    std::string field;
    double min = 0.0;
    double max = 0.0;
};

const std::vector<ParamBounds>& uiBounds();

struct ClampResult {
    PipelineParams applied;
    std::vector<std::string> clamped_fields;  // fields whose value changed
};

/// Clamp every field to uiBounds(); integer fields are rounded after clamping.
ClampResult clampToUiBounds(const PipelineParams& requested);

// ─── Presets ──────────────────────────────────────────────────

struct Preset {
    std::string name;
    std::string description;
    PipelineParams params;
};

/// Built-in presets: stable, drift, collapse.
const std::vector<Preset>& builtinPresets();

std::optional<Preset> findPreset(const std::string& name);

} // namespace putman
