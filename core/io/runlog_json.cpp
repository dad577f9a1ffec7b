#include "io/runlog_json.hpp"

#include <chrono>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

namespace putman::io {

namespace {

const json& requireField(const json& j, const std::string& key) {
    if (!j.is_object()) {
        throw FormatError("Expected an object while reading '" + key + "'");
    }
    auto it = j.find(key);
    if (it == j.end()) {
        throw FormatError("Missing field: " + key);
    }
    return *it;
}

double requireNumber(const json& j, const std::string& key) {
    const json& v = requireField(j, key);
    if (!v.is_number()) {
        throw FormatError("Field '" + key + "' is not a number");
    }
    return v.get<double>();
}

std::string requireString(const json& j, const std::string& key) {
    const json& v = requireField(j, key);
    if (!v.is_string()) {
        throw FormatError("Field '" + key + "' is not a string");
    }
    return v.get<std::string>();
}

std::vector<std::string> requireStringArray(const json& j, const std::string& key) {
    const json& v = requireField(j, key);
    if (!v.is_array()) {
        throw FormatError("Field '" + key + "' is not an array");
    }
    std::vector<std::string> out;
    for (const auto& item : v) {
        if (!item.is_string()) {
            throw FormatError("Field '" + key + "' contains a non-string item");
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

std::map<std::string, double> requireNumberMap(const json& j, const std::string& key) {
    const json& v = requireField(j, key);
    if (!v.is_object()) {
        throw FormatError("Field '" + key + "' is not an object");
    }
    std::map<std::string, double> out;
    for (auto it = v.begin(); it != v.end(); ++it) {
        if (!it.value().is_number()) {
            throw FormatError("Field '" + key + "." + it.key() + "' is not a number");
        }
        out[it.key()] = it.value().get<double>();
    }
    return out;
}

json scoredIdsToJson(const std::vector<ScoredId>& entries) {
    json arr = json::array();
    for (const auto& e : entries) {
        arr.push_back({{"id", e.id}, {"score", e.score}});
    }
    return arr;
}

std::vector<ScoredId> scoredIdsFromJson(const json& j, const std::string& key) {
    const json& v = requireField(j, key);
    if (!v.is_array()) {
        throw FormatError("Field '" + key + "' is not an array");
    }
    std::vector<ScoredId> out;
    for (const auto& item : v) {
        out.push_back({requireString(item, "id"), requireNumber(item, "score")});
    }
    return out;
}

int toStepIndex(double value) {
    if (value < 0.0 || value > static_cast<double>(std::numeric_limits<int>::max()) ||
        value != std::floor(value)) {
        throw FormatError("Field 'step' is not a non-negative integer");
    }
    return static_cast<int>(value);
}

uint32_t toSeed(double value) {
    if (value < 0.0 || value > 4294967295.0 || value != static_cast<double>(static_cast<uint64_t>(value))) {
        throw FormatError("Seed is not an unsigned 32-bit integer");
    }
    return static_cast<uint32_t>(value);
}

json readJsonFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw FormatError("Cannot open file: " + path);
    }
    try {
        return json::parse(in);
    } catch (const json::parse_error& e) {
        throw FormatError("Malformed JSON in " + path + ": " + e.what());
    }
}

} // namespace

// ─── Parameters ───────────────────────────────────────────────

json toJson(const PipelineParams& params) {
    json j = json::object();
    for (const auto& name : PipelineParams::fieldNames()) {
        if (name == "seed") {
            j[name] = params.seed;
        } else if (PipelineParams::isIntegerField(name)) {
            j[name] = static_cast<int>(params.get(name));
        } else {
            j[name] = params.get(name);
        }
    }
    return j;
}

PipelineParams paramsFromJson(const json& j) {
    PipelineParams params;
    for (const auto& name : PipelineParams::fieldNames()) {
        params.set(name, requireNumber(j, name));
    }
    return params;
}

// ─── Runlog ───────────────────────────────────────────────────

json toJson(const BeamCandidate& candidate) {
    return {
        {"nodePath", candidate.node_path},
        {"edgePath", candidate.edge_path},
        {"score", candidate.score},
    };
}

json toJson(const InterpretationSummary& summary) {
    return {
        {"topNodes", scoredIdsToJson(summary.top_nodes)},
        {"topEdges", scoredIdsToJson(summary.top_edges)},
        {"centroid", summary.centroid},
    };
}

json toJson(const StepRunLog& step) {
    json candidates = json::array();
    for (const auto& c : step.beam_candidates) candidates.push_back(toJson(c));

    return {
        {"step", step.step},
        {"seed", step.seed},
        {"params", toJson(step.params)},
        {"activeSet", step.active_set},
        {"prunedNodes", step.pruned_nodes},
        {"prunedEdges", step.pruned_edges},
        {"beamCandidates", candidates},
        {"interpretation", toJson(step.interpretation)},
        {"activationVector", step.activation_vector},
        {"edgeWeights", step.edge_weights},
        {"delta", step.delta},
    };
}

json toJson(const RunLog& runlog) {
    json steps = json::array();
    for (const auto& s : runlog.steps) steps.push_back(toJson(s));

    return {
        {"model", runlog.model},
        {"createdAt", runlog.created_at},
        {"params", toJson(runlog.params)},
        {"steps", steps},
    };
}

RunLog runlogFromJson(const json& j) {
    RunLog runlog;
    runlog.model = requireString(j, "model");
    runlog.created_at = requireString(j, "createdAt");
    runlog.params = paramsFromJson(requireField(j, "params"));

    const json& steps = requireField(j, "steps");
    if (!steps.is_array()) {
        throw FormatError("Field 'steps' is not an array");
    }
    for (const auto& s : steps) {
        StepRunLog step;
        step.step = toStepIndex(requireNumber(s, "step"));
        step.seed = toSeed(requireNumber(s, "seed"));
        step.params = paramsFromJson(requireField(s, "params"));
        step.active_set = requireStringArray(s, "activeSet");
        step.pruned_nodes = requireStringArray(s, "prunedNodes");
        step.pruned_edges = requireStringArray(s, "prunedEdges");

        const json& candidates = requireField(s, "beamCandidates");
        if (!candidates.is_array()) {
            throw FormatError("Field 'beamCandidates' is not an array");
        }
        for (const auto& c : candidates) {
            BeamCandidate candidate;
            candidate.node_path = requireStringArray(c, "nodePath");
            candidate.edge_path = requireStringArray(c, "edgePath");
            candidate.score = requireNumber(c, "score");
            step.beam_candidates.push_back(std::move(candidate));
        }

        const json& interp = requireField(s, "interpretation");
        step.interpretation.top_nodes = scoredIdsFromJson(interp, "topNodes");
        step.interpretation.top_edges = scoredIdsFromJson(interp, "topEdges");
        step.interpretation.centroid = requireNumberMap(interp, "centroid");

        step.activation_vector = requireNumberMap(s, "activationVector");
        step.edge_weights = requireNumberMap(s, "edgeWeights");
        step.delta = requireNumber(s, "delta");
        runlog.steps.push_back(std::move(step));
    }
    return runlog;
}

RunLog loadRunlogFile(const std::string& path) {
    json j = readJsonFile(path);
    if (j.is_object() && j.contains("runlog")) {
        return runlogFromJson(j["runlog"]);
    }
    return runlogFromJson(j);
}

// ─── Export payload ───────────────────────────────────────────

ExportPayload makeExportPayload(const RunLog& runlog, size_t step_index,
                                const PipelineParams& requested,
                                const std::vector<std::string>& clamped_fields) {
    StepDiff diff = diffAt(runlog, step_index);

    ExportPayload payload;
    payload.exported_at_iso = isoTimestampUtc();
    payload.selected_step_index = step_index;
    payload.selected_delta = runlog.steps[step_index].delta;
    payload.newly_active_count = diff.newly_active.size();
    payload.dropped_count = diff.newly_pruned.size();
    payload.params_requested = requested;
    payload.params_applied = runlog.params;
    payload.clamped_fields = clamped_fields;
    payload.runlog = runlog;
    return payload;
}

json toJson(const ExportPayload& payload) {
    return {
        {"exportedAtISO", payload.exported_at_iso},
        {"selectedStepIndex", payload.selected_step_index},
        {"selectedDelta", payload.selected_delta},
        {"diff", {
            {"newlyActiveCount", payload.newly_active_count},
            {"droppedCount", payload.dropped_count},
        }},
        {"paramsRequested", toJson(payload.params_requested)},
        {"paramsApplied", toJson(payload.params_applied)},
        {"clampedFields", payload.clamped_fields},
        {"runlog", toJson(payload.runlog)},
    };
}

void writeExportFile(const std::string& path, const ExportPayload& payload) {
    std::ofstream out(path);
    if (!out) {
        throw FormatError("Cannot write file: " + path);
    }
    out << toJson(payload).dump(2) << "\n";
    if (!out) {
        throw FormatError("Write failed: " + path);
    }
}

std::string defaultExportFileName(uint32_t seed) {
    return "putman-runlog-seed-" + std::to_string(seed) + ".json";
}

std::string isoTimestampUtc() {
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&now_time_t, &utc);

    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%dT%H:%M:%S", &utc);

    std::ostringstream oss;
    oss << time_buf << "." << std::setfill('0') << std::setw(3) << now_ms.count() << "Z";
    return oss.str();
}

// ─── Preset files ─────────────────────────────────────────────

Preset presetFromJson(const json& j) {
    Preset preset;
    preset.name = requireString(j, "name");
    preset.description = j.contains("description") ? requireString(j, "description") : "";
    preset.params = paramsFromJson(requireField(j, "params"));
    return preset;
}

Preset loadPresetFile(const std::string& path) {
    return presetFromJson(readJsonFile(path));
}

} // namespace putman::io
