#include <gtest/gtest.h>
#include "graph/graph.hpp"
#include "graph/context_vector.hpp"

using namespace putman;

namespace {

Graph triangle() {
    Graph g;
    g.addNode(Node("n000", true, false));
    g.addNode(Node("n001", true, true));
    g.addNode(Node("n002", false, true));
    g.addEdge(Edge("n000", "n001", 0.25, true));
    g.addEdge(Edge("n000", "n002", 0.75, false));
    g.addEdge(Edge("n001", "n002", 0.5, false));
    return g;
}

} // namespace

// ─── Basic Node/Edge construction ──────────────────────────────

TEST(GraphTest, AddAndGetNode) {
    Graph g;
    g.addNode(Node("n000", true, false));
    ASSERT_EQ(g.nodeCount(), 1u);
    const Node* n = g.getNode("n000");
    ASSERT_NE(n, nullptr);
    EXPECT_TRUE(n->is_prior);
    EXPECT_FALSE(n->is_novel);
    EXPECT_EQ(g.getNode("missing"), nullptr);
}

TEST(GraphTest, DuplicateNodeThrows) {
    Graph g;
    g.addNode(Node("n000", true, false));
    EXPECT_THROW(g.addNode(Node("n000", false, true)), std::runtime_error);
}

TEST(GraphTest, EdgeIdFromEndpoints) {
    Edge e("n003", "n017", 0.4, false);
    EXPECT_EQ(e.id, "n003->n017");
    EXPECT_EQ(e.other("n003"), "n017");
    EXPECT_EQ(e.other("n017"), "n003");
}

TEST(GraphTest, AddAndGetEdge) {
    Graph g = triangle();
    ASSERT_EQ(g.edgeCount(), 3u);
    const Edge* e = g.getEdge("n000->n002");
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->source, "n000");
    EXPECT_EQ(e->target, "n002");
    EXPECT_DOUBLE_EQ(e->weight, 0.75);
    EXPECT_FALSE(e->is_prior);
}

TEST(GraphTest, EdgeValidation) {
    Graph g = triangle();
    EXPECT_THROW(g.addEdge(Edge("n000", "n001", 0.9, true)), std::runtime_error);
    EXPECT_THROW(g.addEdge(Edge("n000", "n099", 0.9, true)), std::runtime_error);
    EXPECT_THROW(g.addEdge(Edge("n099", "n000", 0.9, true)), std::runtime_error);
    EXPECT_EQ(g.edgeCount(), 3u);
}

TEST(GraphTest, GenerationOrderPreserved) {
    Graph g = triangle();
    EXPECT_EQ(g.getNodeIds(), (std::vector<std::string>{"n000", "n001", "n002"}));
    EXPECT_EQ(g.getEdgeIds(),
              (std::vector<std::string>{"n000->n001", "n000->n002", "n001->n002"}));
}

// ─── Adjacency Queries ────────────────────────────────────────

TEST(GraphTest, IncidentEdgesInEdgeOrder) {
    Graph g = triangle();
    auto incident = g.incidentEdges("n002");
    ASSERT_EQ(incident.size(), 2u);
    EXPECT_EQ(incident[0]->id, "n000->n002");
    EXPECT_EQ(incident[1]->id, "n001->n002");
    EXPECT_EQ(g.degree("n000"), 2u);
    EXPECT_TRUE(g.incidentEdges("missing").empty());
}

TEST(GraphTest, IsolatedNodeHasNoIncidentEdges) {
    Graph g;
    g.addNode(Node("n000", true, false));
    EXPECT_TRUE(g.incidentEdges("n000").empty());
    EXPECT_EQ(g.degree("n000"), 0u);
}

// ─── Subgraph Extraction ──────────────────────────────────────

TEST(GraphTest, ExtractSubgraph) {
    Graph g = triangle();
    Graph sub = g.extractSubgraph({"n002", "n000"});
    EXPECT_EQ(sub.getNodeIds(), (std::vector<std::string>{"n000", "n002"}));
    ASSERT_EQ(sub.edgeCount(), 1u);
    EXPECT_TRUE(sub.hasEdge("n000->n002"));
}

TEST(GraphTest, ExtractSubgraphWithEdgeFilter) {
    Graph g = triangle();
    Graph sub = g.extractSubgraph({"n000", "n001", "n002"},
                                  [](const Edge& e) { return e.weight >= 0.5; });
    EXPECT_EQ(sub.nodeCount(), 3u);
    EXPECT_EQ(sub.getEdgeIds(), (std::vector<std::string>{"n000->n002", "n001->n002"}));
}

// ─── Functional update ─────────────────────────────────────────

TEST(GraphTest, WithEdgeWeightsLeavesOriginal) {
    Graph g = triangle();
    Graph next = g.withEdgeWeights({0.1, 0.2, 0.3});
    EXPECT_DOUBLE_EQ(next.getEdge("n000->n001")->weight, 0.1);
    EXPECT_DOUBLE_EQ(next.getEdge("n001->n002")->weight, 0.3);
    EXPECT_DOUBLE_EQ(g.getEdge("n000->n001")->weight, 0.25);
    EXPECT_FALSE(next == g);

    // Adjacency in the copy points at the copy's edges.
    EXPECT_DOUBLE_EQ(next.incidentEdges("n000")[0]->weight, 0.1);
}

TEST(GraphTest, WithEdgeWeightsSizeMismatchThrows) {
    Graph g = triangle();
    EXPECT_THROW(g.withEdgeWeights({0.1}), std::runtime_error);
}

// ─── Context Vector ────────────────────────────────────────────

TEST(ContextVectorTest, KeepsInsertionOrder) {
    ContextVector c;
    c.set("n002", 0.3);
    c.set("n000", 0.1);
    c.set("n001", 0.2);
    ASSERT_EQ(c.size(), 3u);
    EXPECT_EQ(c.entries()[0].first, "n002");
    EXPECT_EQ(c.entries()[2].first, "n001");
}

TEST(ContextVectorTest, OverwriteKeepsPosition) {
    ContextVector c;
    c.set("a", 0.1);
    c.set("b", 0.2);
    c.set("a", 0.9);
    EXPECT_EQ(c.size(), 2u);
    EXPECT_EQ(c.entries()[0].first, "a");
    EXPECT_DOUBLE_EQ(c.get("a"), 0.9);
}

TEST(ContextVectorTest, MissingKeyDefault) {
    ContextVector c;
    EXPECT_DOUBLE_EQ(c.get("nope"), 0.0);
    EXPECT_DOUBLE_EQ(c.get("nope", 0.7), 0.7);
    EXPECT_FALSE(c.contains("nope"));
}
