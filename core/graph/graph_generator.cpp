#include "graph/graph_generator.hpp"
#include "random/deterministic_rng.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace putman {

namespace {
constexpr double kPriorShare = 0.6;
constexpr double kMinEdgeWeight = 0.2;
constexpr double kEdgeWeightSpan = 0.8;
constexpr double kPriorContextBase = 0.45;
constexpr double kNovelContextBase = 0.35;
constexpr double kNoveltyLift = 0.20;
constexpr double kContextSpan = 0.25;
}

std::string GraphGenerator::makeNodeId(int index) {
    std::ostringstream oss;
    oss << "n" << std::setw(3) << std::setfill('0') << index;
    return oss.str();
}

int GraphGenerator::overlapCount(const GeneratorParams& params) {
    return std::max(1, static_cast<int>(std::floor(params.node_count * params.overlap_percent)));
}

int GraphGenerator::priorCount(const GeneratorParams& params) {
    return std::max(overlapCount(params) + 1,
                    static_cast<int>(std::floor(params.node_count * kPriorShare)));
}

GeneratedGraph GraphGenerator::generate(uint32_t seed, const GeneratorParams& params) {
    DeterministicRng rng(seed);
    const int overlap = overlapCount(params);
    const int prior = priorCount(params);

    GeneratedGraph out;
    for (int i = 0; i < params.node_count; i++) {
        out.graph.addNode(Node(makeNodeId(i), i < prior, i >= prior - overlap));
    }

    // addEdge() only appends to the edge list; the node vector is stable.
    const std::vector<Node>& ordered = out.graph.nodes();
    for (size_t i = 0; i < ordered.size(); i++) {
        for (size_t j = i + 1; j < ordered.size(); j++) {
            if (rng.next() > params.edge_density) continue;
            double weight = round3(kMinEdgeWeight + rng.next() * kEdgeWeightSpan);
            out.graph.addEdge(Edge(ordered[i].id, ordered[j].id, weight,
                                   ordered[i].is_prior && ordered[j].is_prior));
        }
    }

    for (const auto& node : ordered) {
        double base = node.is_prior ? kPriorContextBase : kNovelContextBase;
        double lift = node.is_novel ? kNoveltyLift : 0.0;
        out.context.set(node.id, round3(base + lift + rng.next() * kContextSpan));
    }

    return out;
}

} // namespace putman
