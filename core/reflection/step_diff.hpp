#pragma once

#include "runlog/runlog.hpp"

#include <optional>
#include <string>
#include <vector>

namespace putman {

// ─── Step Diff ────────────────────────────────────────────────
// What changed between two consecutive recorded steps.
//   newly_active: active now, not active before.
//   newly_pruned: pruned now, not pruned before; when neither step
//                 pruned any node, nodes that dropped out of the
//                 active set instead.

struct StepDiff {
    std::vector<std::string> newly_active;
    std::vector<std::string> newly_pruned;
};

/// `previous` is null for the first step: every active node is new and
/// nothing counts as newly pruned.
StepDiff diffSteps(const StepRunLog* previous, const StepRunLog& current);

/// Diff of step `index` against its predecessor. Throws std::out_of_range.
StepDiff diffAt(const RunLog& runlog, size_t index);

/// Best surviving candidate of a step, if the beam is non-empty.
std::optional<BeamCandidate> winningCandidate(const StepRunLog& step);

} // namespace putman
