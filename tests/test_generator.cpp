#include <gtest/gtest.h>
#include "graph/graph_generator.hpp"

#include <unordered_set>

using namespace putman;

namespace {

GeneratorParams scenarioShape() {
    GeneratorParams p;
    p.node_count = 24;
    p.edge_density = 0.22;
    p.overlap_percent = 0.3;
    return p;
}

} // namespace

// ─── Identifiers and population sizes ─────────────────────────

TEST(GeneratorTest, ZeroPaddedIds) {
    EXPECT_EQ(GraphGenerator::makeNodeId(0), "n000");
    EXPECT_EQ(GraphGenerator::makeNodeId(7), "n007");
    EXPECT_EQ(GraphGenerator::makeNodeId(42), "n042");
    EXPECT_EQ(GraphGenerator::makeNodeId(1234), "n1234");
}

TEST(GeneratorTest, PopulationCounts) {
    GeneratorParams p = scenarioShape();
    EXPECT_EQ(GraphGenerator::overlapCount(p), 7);   // floor(24 * 0.3)
    EXPECT_EQ(GraphGenerator::priorCount(p), 14);    // floor(24 * 0.6)

    p.node_count = 1;
    EXPECT_EQ(GraphGenerator::overlapCount(p), 1);
    EXPECT_EQ(GraphGenerator::priorCount(p), 2);
}

TEST(GeneratorTest, PriorAndNovelFlags) {
    GeneratedGraph out = GraphGenerator::generate(42, scenarioShape());
    const auto& nodes = out.graph.nodes();
    ASSERT_EQ(nodes.size(), 24u);

    int prior = 0, novel = 0, both = 0;
    for (size_t i = 0; i < nodes.size(); i++) {
        EXPECT_EQ(nodes[i].id, GraphGenerator::makeNodeId(static_cast<int>(i)));
        EXPECT_EQ(nodes[i].is_prior, i < 14);
        EXPECT_EQ(nodes[i].is_novel, i >= 7);
        prior += nodes[i].is_prior;
        novel += nodes[i].is_novel;
        both += nodes[i].is_prior && nodes[i].is_novel;
    }
    EXPECT_EQ(prior, 14);
    EXPECT_EQ(novel, 17);
    EXPECT_EQ(both, 7);  // overlap band
}

// ─── Seeded output ─────────────────────────────────────────────

TEST(GeneratorTest, ScenarioGraph) {
    GeneratedGraph out = GraphGenerator::generate(42, scenarioShape());
    EXPECT_EQ(out.graph.edgeCount(), 55u);

    const Edge& first = out.graph.edges().front();
    EXPECT_EQ(first.id, "n000->n005");
    EXPECT_DOUBLE_EQ(first.weight, 0.621);
    EXPECT_TRUE(first.is_prior);

    ASSERT_EQ(out.context.size(), 24u);
    EXPECT_DOUBLE_EQ(out.context.get("n000"), 0.629);
    EXPECT_DOUBLE_EQ(out.context.get("n001"), 0.496);
    EXPECT_DOUBLE_EQ(out.context.get("n002"), 0.662);
}

TEST(GeneratorTest, SmallCompleteGraph) {
    GeneratorParams p;
    p.node_count = 3;
    p.edge_density = 1.0;
    p.overlap_percent = 0.3;
    GeneratedGraph out = GraphGenerator::generate(7, p);

    ASSERT_EQ(out.graph.edgeCount(), 3u);
    EXPECT_EQ(out.graph.edges()[0].id, "n000->n001");
    EXPECT_DOUBLE_EQ(out.graph.edges()[0].weight, 0.25);
    EXPECT_TRUE(out.graph.edges()[0].is_prior);
    EXPECT_DOUBLE_EQ(out.graph.edges()[1].weight, 0.759);
    EXPECT_FALSE(out.graph.edges()[1].is_prior);
    EXPECT_DOUBLE_EQ(out.graph.edges()[2].weight, 0.524);

    EXPECT_DOUBLE_EQ(out.context.get("n000"), 0.567);
    EXPECT_DOUBLE_EQ(out.context.get("n001"), 0.71);
    EXPECT_DOUBLE_EQ(out.context.get("n002"), 0.688);
}

TEST(GeneratorTest, Deterministic) {
    GeneratedGraph a = GraphGenerator::generate(1337, scenarioShape());
    GeneratedGraph b = GraphGenerator::generate(1337, scenarioShape());
    EXPECT_TRUE(a.graph == b.graph);
    EXPECT_TRUE(a.context == b.context);

    GeneratedGraph c = GraphGenerator::generate(1338, scenarioShape());
    EXPECT_FALSE(a.graph == c.graph && a.context == c.context);
}

TEST(GeneratorTest, EdgesAreUniqueAndOrdered) {
    GeneratorParams p = scenarioShape();
    p.edge_density = 0.45;
    GeneratedGraph out = GraphGenerator::generate(9, p);

    std::unordered_set<std::string> ids;
    std::string previous_pair;
    for (const Edge& e : out.graph.edges()) {
        EXPECT_TRUE(ids.insert(e.id).second) << "duplicate " << e.id;
        EXPECT_LT(e.source, e.target);
        EXPECT_TRUE(out.graph.hasNode(e.source));
        EXPECT_TRUE(out.graph.hasNode(e.target));
        EXPECT_GE(e.weight, 0.2);
        EXPECT_LE(e.weight, 1.0);
        EXPECT_EQ(e.is_prior, out.graph.getNode(e.source)->is_prior &&
                              out.graph.getNode(e.target)->is_prior);
        std::string pair = e.source + "|" + e.target;
        EXPECT_LT(previous_pair, pair);
        previous_pair = pair;
    }
}

TEST(GeneratorTest, ContextRanges) {
    GeneratedGraph out = GraphGenerator::generate(3, scenarioShape());
    for (const auto& [id, value] : out.context.entries()) {
        const Node* n = out.graph.getNode(id);
        ASSERT_NE(n, nullptr);
        double base = (n->is_prior ? 0.45 : 0.35) + (n->is_novel ? 0.2 : 0.0);
        EXPECT_GE(value, base - 1e-9);
        EXPECT_LE(value, base + 0.25 + 1e-9);
    }
}

TEST(GeneratorTest, FullDensityIsComplete) {
    GeneratorParams p;
    p.node_count = 10;
    p.edge_density = 1.0;
    p.overlap_percent = 0.5;
    GeneratedGraph out = GraphGenerator::generate(11, p);
    EXPECT_EQ(out.graph.edgeCount(), 45u);
}

TEST(GeneratorTest, SingleNodeHasNoEdges) {
    GeneratorParams p = scenarioShape();
    p.node_count = 1;
    GeneratedGraph out = GraphGenerator::generate(42, p);
    EXPECT_EQ(out.graph.nodeCount(), 1u);
    EXPECT_EQ(out.graph.edgeCount(), 0u);
    EXPECT_TRUE(out.graph.nodes()[0].is_prior);
    EXPECT_FALSE(out.graph.nodes()[0].is_novel);
    EXPECT_EQ(out.context.size(), 1u);
}
