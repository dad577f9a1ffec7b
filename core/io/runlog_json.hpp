#pragma once

#include "config/pipeline_params.hpp"
#include "reflection/step_diff.hpp"
#include "runlog/runlog.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace putman::io {

using json = nlohmann::json;

/// Malformed or unreadable runlog / preset input.
class FormatError : public std::runtime_error {
public:
    explicit FormatError(const std::string& message) : std::runtime_error(message) {}
};

// ─── Parameters ───────────────────────────────────────────────

json toJson(const PipelineParams& params);

/// Every field of PipelineParams::fieldNames() must be present and numeric.
PipelineParams paramsFromJson(const json& j);

// ─── Runlog ───────────────────────────────────────────────────
// camelCase field names; import → runlogHash reproduces the hash of
// the exported value.

json toJson(const BeamCandidate& candidate);
json toJson(const InterpretationSummary& summary);
json toJson(const StepRunLog& step);
json toJson(const RunLog& runlog);

RunLog runlogFromJson(const json& j);

/// Reads a runlog file. Accepts a bare runlog or an export payload
/// (whose "runlog" member is used).
RunLog loadRunlogFile(const std::string& path);

// ─── Export payload ───────────────────────────────────────────

struct ExportPayload {
    std::string exported_at_iso;  // wall clock; not part of the hashed runlog
    size_t selected_step_index = 0;
    double selected_delta = 0.0;
    size_t newly_active_count = 0;
    size_t dropped_count = 0;
    PipelineParams params_requested;
    PipelineParams params_applied;
    std::vector<std::string> clamped_fields;
    RunLog runlog;
};

/// Builds a payload for `step_index` of `runlog`, diffing it against the
/// previous step. Throws std::out_of_range for a bad index.
ExportPayload makeExportPayload(const RunLog& runlog, size_t step_index,
                                const PipelineParams& requested,
                                const std::vector<std::string>& clamped_fields);

json toJson(const ExportPayload& payload);

/// Pretty-printed with a 2-space indent.
void writeExportFile(const std::string& path, const ExportPayload& payload);

/// "putman-runlog-seed-<seed>.json"
std::string defaultExportFileName(uint32_t seed);

/// Current UTC time, e.g. "2026-10-18T09:41:07.123Z".
std::string isoTimestampUtc();

// ─── Preset files ─────────────────────────────────────────────
// { "name": ..., "description": ..., "params": { ...eleven fields... } }

Preset presetFromJson(const json& j);
Preset loadPresetFile(const std::string& path);

} // namespace putman::io
