#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace putman {

/// Per-node context values in [0,1]. Entries keep insertion order
/// (node generation order); the drift update depends on each entry's
/// position, so the order is part of the value.
class ContextVector {
public:
    using Entry = std::pair<std::string, double>;

    ContextVector() = default;

    /// Insert or overwrite. New keys are appended.
    void set(const std::string& node_id, double value);

    /// Value for `node_id`, or `default_val` when absent.
    double get(const std::string& node_id, double default_val = 0.0) const;

    bool contains(const std::string& node_id) const { return index_.count(node_id) > 0; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const std::vector<Entry>& entries() const { return entries_; }

    bool operator==(const ContextVector& other) const { return entries_ == other.entries_; }
    bool operator!=(const ContextVector& other) const { return !(*this == other); }

private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace putman
