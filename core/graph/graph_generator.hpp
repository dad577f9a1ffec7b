#pragma once

#include "graph/graph.hpp"
#include "graph/context_vector.hpp"

#include <cstdint>
#include <string>

namespace putman {

/// Shape of a generated graph.
struct GeneratorParams {
    int node_count = 24;
    double edge_density = 0.22;    // (0, 1]
    double overlap_percent = 0.3;  // [0, 1]
};

struct GeneratedGraph {
    Graph graph;
    ContextVector context;
};

// ─── Graph Generator ───────────────────────────────────────────
// Builds a seeded random graph with a prior population, a novel
// population and a deliberate overlap band between them, plus the
// initial context vector. Draw order is fixed: edges by (i<j) pair
// order, then context by node order. The output is a pure function
// of (seed, params).

class GraphGenerator {
public:
    static GeneratedGraph generate(uint32_t seed, const GeneratorParams& params);

    /// Zero-padded stable node id: 7 → "n007".
    static std::string makeNodeId(int index);

    /// Number of nodes in the overlap band: max(1, floor(n * overlap)).
    static int overlapCount(const GeneratorParams& params);

    /// Number of prior nodes: max(overlap + 1, floor(n * 0.6)).
    static int priorCount(const GeneratorParams& params);
};

} // namespace putman
