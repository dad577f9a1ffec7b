#include "graph/graph.hpp"
#include <stdexcept>

namespace putman {

// ─── Construction ──────────────────────────────────────────────

void Graph::addNode(const Node& node) {
    if (node_index_.count(node.id)) {
        throw std::runtime_error("Node ID already exists: " + node.id);
    }
    node_index_.emplace(node.id, nodes_.size());
    nodes_.push_back(node);
    incident_[node.id];  // ensure entry exists
}

void Graph::addEdge(const Edge& edge) {
    if (edge_index_.count(edge.id))
        throw std::runtime_error("Edge ID already exists: " + edge.id);
    if (!node_index_.count(edge.source))
        throw std::runtime_error("Source node not found: " + edge.source);
    if (!node_index_.count(edge.target))
        throw std::runtime_error("Target node not found: " + edge.target);

    size_t index = edges_.size();
    edge_index_.emplace(edge.id, index);
    edges_.push_back(edge);
    incident_[edge.source].push_back(index);
    incident_[edge.target].push_back(index);
}

// ─── Lookup ────────────────────────────────────────────────────

const Node* Graph::getNode(const std::string& id) const {
    auto it = node_index_.find(id);
    return it != node_index_.end() ? &nodes_[it->second] : nullptr;
}

const Edge* Graph::getEdge(const std::string& id) const {
    auto it = edge_index_.find(id);
    return it != edge_index_.end() ? &edges_[it->second] : nullptr;
}

std::vector<std::string> Graph::getNodeIds() const {
    std::vector<std::string> ids;
    ids.reserve(nodes_.size());
    for (const auto& n : nodes_) ids.push_back(n.id);
    return ids;
}

std::vector<std::string> Graph::getEdgeIds() const {
    std::vector<std::string> ids;
    ids.reserve(edges_.size());
    for (const auto& e : edges_) ids.push_back(e.id);
    return ids;
}

// ─── Adjacency queries ────────────────────────────────────────

std::vector<const Edge*> Graph::incidentEdges(const std::string& node_id) const {
    auto it = incident_.find(node_id);
    if (it == incident_.end()) return {};
    std::vector<const Edge*> result;
    result.reserve(it->second.size());
    for (size_t index : it->second) {
        result.push_back(&edges_[index]);
    }
    return result;
}

size_t Graph::degree(const std::string& node_id) const {
    auto it = incident_.find(node_id);
    return it != incident_.end() ? it->second.size() : 0;
}

// ─── Subgraph extraction ──────────────────────────────────────

Graph Graph::extractSubgraph(const std::unordered_set<std::string>& node_ids,
                             const std::function<bool(const Edge&)>& edge_filter) const {
    Graph sub;
    for (const auto& node : nodes_) {
        if (node_ids.count(node.id)) sub.addNode(node);
    }
    for (const auto& edge : edges_) {
        if (!node_ids.count(edge.source) || !node_ids.count(edge.target)) continue;
        if (edge_filter && !edge_filter(edge)) continue;
        sub.addEdge(edge);
    }
    return sub;
}

// ─── Functional update ─────────────────────────────────────────

Graph Graph::withEdgeWeights(const std::vector<double>& weights) const {
    if (weights.size() != edges_.size()) {
        throw std::runtime_error("Weight count " + std::to_string(weights.size()) +
                                 " does not match edge count " + std::to_string(edges_.size()));
    }
    Graph copy = *this;
    for (size_t i = 0; i < copy.edges_.size(); i++) {
        copy.edges_[i].weight = weights[i];
    }
    return copy;
}

// ─── Iteration ─────────────────────────────────────────────────

void Graph::forEachNode(const std::function<void(const Node&)>& fn) const {
    for (const auto& node : nodes_) fn(node);
}

} // namespace putman
