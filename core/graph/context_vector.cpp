#include "graph/context_vector.hpp"

namespace putman {

void ContextVector::set(const std::string& node_id, double value) {
    auto it = index_.find(node_id);
    if (it != index_.end()) {
        entries_[it->second].second = value;
        return;
    }
    index_.emplace(node_id, entries_.size());
    entries_.emplace_back(node_id, value);
}

double ContextVector::get(const std::string& node_id, double default_val) const {
    auto it = index_.find(node_id);
    return it != index_.end() ? entries_[it->second].second : default_val;
}

} // namespace putman
