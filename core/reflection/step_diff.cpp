#include "reflection/step_diff.hpp"
#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace putman {

namespace {

std::vector<std::string> minus(const std::vector<std::string>& from,
                               const std::vector<std::string>& remove) {
    std::unordered_set<std::string> drop(remove.begin(), remove.end());
    std::vector<std::string> out;
    for (const auto& id : from) {
        if (!drop.count(id)) out.push_back(id);
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace

StepDiff diffSteps(const StepRunLog* previous, const StepRunLog& current) {
    StepDiff diff;
    if (!previous) {
        diff.newly_active = minus(current.active_set, {});
        return diff;
    }

    diff.newly_active = minus(current.active_set, previous->active_set);
    if (!current.pruned_nodes.empty() || !previous->pruned_nodes.empty()) {
        diff.newly_pruned = minus(current.pruned_nodes, previous->pruned_nodes);
    } else {
        diff.newly_pruned = minus(previous->active_set, current.active_set);
    }
    return diff;
}

StepDiff diffAt(const RunLog& runlog, size_t index) {
    if (index >= runlog.steps.size()) {
        throw std::out_of_range("Step index out of range: " + std::to_string(index));
    }
    const StepRunLog* previous = index > 0 ? &runlog.steps[index - 1] : nullptr;
    return diffSteps(previous, runlog.steps[index]);
}

std::optional<BeamCandidate> winningCandidate(const StepRunLog& step) {
    if (step.beam_candidates.empty()) return std::nullopt;
    return step.beam_candidates.front();
}

} // namespace putman
