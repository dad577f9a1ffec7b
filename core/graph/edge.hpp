#pragma once

#include <string>
#include <utility>

namespace putman {

/// An undirected edge stored with a fixed source → target order.
/// The id is derived from the endpoint pair; weight drifts between steps.
struct Edge {
    std::string id;
    std::string source;
    std::string target;
    double weight = 0.0;
    bool is_prior = false;  // both endpoints are prior nodes

    Edge() = default;
    Edge(std::string source, std::string target, double weight, bool is_prior)
        : id(makeId(source, target)), source(std::move(source)),
          target(std::move(target)), weight(weight), is_prior(is_prior) {}

    static std::string makeId(const std::string& source, const std::string& target) {
        return source + "->" + target;
    }

    /// The endpoint opposite to `node_id`.
    const std::string& other(const std::string& node_id) const {
        return node_id == source ? target : source;
    }

    bool operator==(const Edge& other) const {
        return id == other.id && source == other.source && target == other.target &&
               weight == other.weight && is_prior == other.is_prior;
    }
};

} // namespace putman
