#pragma once

#include <string>
#include <utility>

namespace putman {

/// A node of the synthetic activation graph.
/// Membership flags are fixed at generation time.
struct Node {
    std::string id;
    bool is_prior = false;
    bool is_novel = false;

    Node() = default;
    Node(std::string id, bool is_prior, bool is_novel)
        : id(std::move(id)), is_prior(is_prior), is_novel(is_novel) {}

    bool operator==(const Node& other) const {
        return id == other.id && is_prior == other.is_prior && is_novel == other.is_novel;
    }
};

} // namespace putman
