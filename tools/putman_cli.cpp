// putman: command-line front end for the activation pipeline engine
//
// Usage: putman <command> [options]
//
// Commands:
//   run        Run a preset (optionally overriding the seed) and print the trace
//   hash       Print the canonical hash of a saved runlog
//   presets    List built-in presets
//   help       Show this help

#include "config/pipeline_params.hpp"
#include "io/runlog_json.hpp"
#include "metrics/shift_metric.hpp"
#include "pipeline/pipeline.hpp"
#include "reflection/step_diff.hpp"
#include "runlog/runlog_hasher.hpp"

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <string>

using namespace putman;

namespace {

const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

// Global verbose flag for debug logging
std::atomic<bool> verbose_mode{false};

void log_debug(const char* component, const char* fmt, ...) {
    if (!verbose_mode) return;

    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", std::localtime(&now_time_t));

    std::cerr << "[" << time_buf << "." << std::setfill('0') << std::setw(3) << now_ms.count()
              << "][" << component << "] ";

    va_list args;
    va_start(args, fmt);
    vfprintf(stderr, fmt, args);
    va_end(args);
    std::cerr << "\n";
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "putman - activation / pruning / reconstruction pipeline simulator\n\n"
              << "Usage: " << name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  run                Run a preset and print the runlog hash and per-step trace\n"
              << "  hash <file>        Print the canonical hash of a runlog or export file\n"
              << "  presets            List built-in presets\n"
              << "  help               Show this help\n\n"
              << "Run options:\n"
              << "  --preset NAME      Built-in preset (stable, drift, collapse; default stable)\n"
              << "  --preset-file PATH Load the preset from a JSON file\n"
              << "  --seed N           Override the preset seed\n"
              << "  --step I           Step selected for the export diff (default 0)\n"
              << "  --out FILE         Write the JSON export payload to FILE\n"
              << "  --export           Write the export to the default file name\n"
              << "  -v, --verbose      Debug logging on stderr\n";
}

struct RunOptions {
    std::string preset_name = "stable";
    std::string preset_file;
    bool has_seed = false;
    uint32_t seed = 0;
    size_t step = 0;
    std::string out_path;
    bool export_default = false;
};

Preset resolve_preset(const RunOptions& opts) {
    if (!opts.preset_file.empty()) {
        log_debug("preset", "loading %s", opts.preset_file.c_str());
        return io::loadPresetFile(opts.preset_file);
    }
    auto preset = findPreset(opts.preset_name);
    if (!preset) {
        throw io::FormatError("Unknown preset: " + opts.preset_name);
    }
    return *preset;
}

int cmd_run(const RunOptions& opts) {
    Preset preset = resolve_preset(opts);
    PipelineParams requested = preset.params;
    if (opts.has_seed) requested.seed = opts.seed;

    ClampResult clamped = clampToUiBounds(requested);
    for (const auto& field : clamped.clamped_fields) {
        log_debug("preset", "clamped %s: %g -> %g", field.c_str(),
                  requested.get(field), clamped.applied.get(field));
    }

    log_debug("engine", "running preset '%s' seed=%u depth=%d nodes=%d",
              preset.name.c_str(), clamped.applied.seed,
              clamped.applied.recursion_depth, clamped.applied.node_count);
    SimulationOutput out = runPipeline(clamped.applied);
    const RunLog& runlog = out.runlog;

    std::cout << "preset: " << preset.name << "\n";
    if (!clamped.clamped_fields.empty()) {
        std::cout << "clamped:";
        for (const auto& f : clamped.clamped_fields) std::cout << " " << f;
        std::cout << "\n";
    }
    std::cout << "hash: " << runlogHash(runlog) << "\n";

    for (size_t i = 0; i < runlog.steps.size(); i++) {
        const StepRunLog& step = runlog.steps[i];
        StepDiff diff = diffAt(runlog, i);
        auto best = winningCandidate(step);
        std::cout << "step " << step.step
                  << "  delta=" << std::fixed << std::setprecision(3) << step.delta
                  << "  active=" << step.active_set.size()
                  << "  pruned=" << step.pruned_nodes.size() << "/" << step.pruned_edges.size()
                  << "  newly_active=" << diff.newly_active.size()
                  << "  dropped=" << diff.newly_pruned.size()
                  << "  best=" << (best ? best->score : 0.0)
                  << "\n";
    }

    DeltaStats stats = summarizeDeltas(runlog.deltas());
    std::cout << "delta max=" << stats.max << " mean=" << stats.mean
              << (stats.has_change ? "" : " (no change)") << "\n";
    std::cout.unsetf(std::ios::floatfield);

    std::string path = opts.out_path;
    if (path.empty() && opts.export_default) {
        path = io::defaultExportFileName(clamped.applied.seed);
    }
    if (!path.empty()) {
        io::ExportPayload payload =
            io::makeExportPayload(runlog, opts.step, requested, clamped.clamped_fields);
        io::writeExportFile(path, payload);
        log_debug("export", "wrote %s (%zu steps)", path.c_str(), runlog.steps.size());
        std::cout << "exported: " << path << "\n";
    }
    return 0;
}

int cmd_hash(const std::string& path) {
    RunLog runlog = io::loadRunlogFile(path);
    log_debug("hash", "loaded %zu steps from %s", runlog.steps.size(), path.c_str());
    std::cout << runlogHash(runlog) << "\n";
    return 0;
}

int cmd_presets() {
    for (const auto& preset : builtinPresets()) {
        std::cout << preset.name << "  " << preset.description << "\n";
    }
    return 0;
}

uint32_t parse_seed(const char* text) {
    unsigned long long value = std::stoull(text);
    if (value > 0xffffffffULL) {
        throw InvalidParameter("seed", "must fit an unsigned 32-bit integer");
    }
    return static_cast<uint32_t>(value);
}

} // namespace

int main(int argc, char* argv[]) {
    std::string command;
    std::string file_arg;
    RunOptions opts;

    try {
        for (int i = 1; i < argc; ++i) {
            if (strcmp(argv[i], "--preset") == 0 && i + 1 < argc) {
                opts.preset_name = argv[++i];
            } else if (strcmp(argv[i], "--preset-file") == 0 && i + 1 < argc) {
                opts.preset_file = argv[++i];
            } else if (strcmp(argv[i], "--seed") == 0 && i + 1 < argc) {
                opts.seed = parse_seed(argv[++i]);
                opts.has_seed = true;
            } else if (strcmp(argv[i], "--step") == 0 && i + 1 < argc) {
                opts.step = static_cast<size_t>(std::stoul(argv[++i]));
            } else if (strcmp(argv[i], "--out") == 0 && i + 1 < argc) {
                opts.out_path = argv[++i];
            } else if (strcmp(argv[i], "--export") == 0) {
                opts.export_default = true;
            } else if (strcmp(argv[i], "--verbose") == 0 || strcmp(argv[i], "-v") == 0) {
                verbose_mode = true;
            } else if (argv[i][0] == '-') {
                std::cerr << "Unknown option: " << argv[i] << "\n";
                print_usage(argv[0]);
                return 2;
            } else if (command.empty()) {
                command = argv[i];
            } else if (file_arg.empty()) {
                file_arg = argv[i];
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    if (command.empty() || command == "help") {
        print_usage(argv[0]);
        return command.empty() ? 2 : 0;
    }

    try {
        if (command == "run") return cmd_run(opts);
        if (command == "presets") return cmd_presets();
        if (command == "hash") {
            if (file_arg.empty()) {
                std::cerr << "Usage: " << prog_name(argv[0]) << " hash <file>\n";
                return 2;
            }
            return cmd_hash(file_arg);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 2;
}
