#pragma once

#include "graph/node.hpp"
#include "graph/edge.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace putman {

// ─── Graph ─────────────────────────────────────────────────────
// Ordered node and edge sequences (generation order, never re-sorted)
// with hash indexes for O(1) lookup and per-node incident edge lists.
// A run never mutates a Graph in place: weight drift produces a new
// value through withEdgeWeights().

class Graph {
public:
    Graph() = default;

    // ── Construction ──
    void addNode(const Node& node);
    void addEdge(const Edge& edge);

    // ── Lookup ──
    const Node* getNode(const std::string& id) const;
    const Edge* getEdge(const std::string& id) const;
    bool hasNode(const std::string& id) const { return node_index_.count(id) > 0; }
    bool hasEdge(const std::string& id) const { return edge_index_.count(id) > 0; }

    const std::vector<Node>& nodes() const { return nodes_; }
    const std::vector<Edge>& edges() const { return edges_; }
    size_t nodeCount() const { return nodes_.size(); }
    size_t edgeCount() const { return edges_.size(); }

    std::vector<std::string> getNodeIds() const;
    std::vector<std::string> getEdgeIds() const;

    // ── Adjacency queries ──
    /// Edges touching `node_id`, in edge generation order.
    std::vector<const Edge*> incidentEdges(const std::string& node_id) const;
    size_t degree(const std::string& node_id) const;

    // ── Subgraph extraction ──
    /// Keeps the listed nodes (in graph order) and the edges between them
    /// that also satisfy `edge_filter` when one is given.
    Graph extractSubgraph(const std::unordered_set<std::string>& node_ids,
                          const std::function<bool(const Edge&)>& edge_filter = nullptr) const;

    // ── Functional update ──
    /// Copy of this graph with edge weights replaced, one per edge in order.
    Graph withEdgeWeights(const std::vector<double>& weights) const;

    // ── Iteration ──
    void forEachNode(const std::function<void(const Node&)>& fn) const;

    bool operator==(const Graph& other) const {
        return nodes_ == other.nodes_ && edges_ == other.edges_;
    }

private:
    std::vector<Node> nodes_;
    std::vector<Edge> edges_;

    std::unordered_map<std::string, size_t> node_index_;
    std::unordered_map<std::string, size_t> edge_index_;

    // node id → indexes into edges_
    std::unordered_map<std::string, std::vector<size_t>> incident_;
};

} // namespace putman
