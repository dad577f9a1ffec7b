#include <gtest/gtest.h>
#include "reflection/interpreter.hpp"
#include "reflection/step_diff.hpp"

using namespace putman;

namespace {

BeamCandidate candidate(std::vector<std::string> nodes,
                        std::vector<std::string> edges, double score) {
    BeamCandidate c;
    c.node_path = std::move(nodes);
    c.edge_path = std::move(edges);
    c.score = score;
    return c;
}

StepRunLog stepWith(std::vector<std::string> active, std::vector<std::string> pruned) {
    StepRunLog s;
    s.active_set = std::move(active);
    s.pruned_nodes = std::move(pruned);
    return s;
}

} // namespace

// ─── Interpreter ──────────────────────────────────────────────

TEST(InterpreterTest, TopNodesRankedWithIdTieBreak) {
    ScoreMap scores = {{"n3", 0.9}, {"n1", 0.5}, {"n2", 0.9}, {"n0", 0.1}};
    Graph kept;
    InterpretationSummary s = Interpreter(3).interpret({}, scores, kept);

    ASSERT_EQ(s.top_nodes.size(), 3u);
    EXPECT_EQ(s.top_nodes[0].id, "n2");
    EXPECT_EQ(s.top_nodes[1].id, "n3");
    EXPECT_EQ(s.top_nodes[2].id, "n1");
    EXPECT_TRUE(s.top_edges.empty());
    EXPECT_TRUE(s.centroid.empty());
}

TEST(InterpreterTest, TopEdgesSumCandidateScores) {
    std::vector<BeamCandidate> beams = {
        candidate({"a", "b", "c"}, {"a->b", "b->c"}, 2.5),
        candidate({"a", "b", "d"}, {"a->b", "b->d"}, 2.0),
    };
    std::map<std::string, double> contrib = Interpreter::edgeContributions(beams);
    EXPECT_DOUBLE_EQ(contrib["a->b"], 4.5);
    EXPECT_DOUBLE_EQ(contrib["b->c"], 2.5);
    EXPECT_DOUBLE_EQ(contrib["b->d"], 2.0);

    InterpretationSummary s = Interpreter().interpret(beams, {}, Graph());
    ASSERT_EQ(s.top_edges.size(), 3u);
    EXPECT_EQ(s.top_edges[0], (ScoredId{"a->b", 4.5}));
    EXPECT_EQ(s.top_edges[1], (ScoredId{"b->c", 2.5}));
    EXPECT_EQ(s.top_edges[2], (ScoredId{"b->d", 2.0}));
}

TEST(InterpreterTest, RankedScoresRoundedToThreeDecimals) {
    ScoreMap scores = {{"a", 0.12345}, {"b", 0.98765}};
    InterpretationSummary s = Interpreter().interpret({}, scores, Graph());
    ASSERT_EQ(s.top_nodes.size(), 2u);
    EXPECT_DOUBLE_EQ(s.top_nodes[0].score, 0.988);
    EXPECT_DOUBLE_EQ(s.top_nodes[1].score, 0.123);
}

TEST(InterpreterTest, CentroidCoversKeptNodesOnly) {
    Graph kept;
    kept.addNode(Node("a", true, false));
    kept.addNode(Node("c", false, true));
    ScoreMap scores = {{"a", 0.7}, {"b", 0.2}, {"c", 0.4}};

    InterpretationSummary s = Interpreter().interpret({}, scores, kept);
    EXPECT_EQ(s.centroid.size(), 2u);
    EXPECT_DOUBLE_EQ(s.centroid.at("a"), 0.7);
    EXPECT_DOUBLE_EQ(s.centroid.at("c"), 0.4);
    EXPECT_EQ(s.centroid.count("b"), 0u);
    // Top nodes still rank every scored node.
    EXPECT_EQ(s.top_nodes.size(), 3u);
}

// ─── Step Diff ────────────────────────────────────────────────

TEST(StepDiffTest, FirstStepEverythingNewlyActive) {
    StepRunLog first = stepWith({"n002", "n000", "n001"}, {"n003"});
    StepDiff d = diffSteps(nullptr, first);
    EXPECT_EQ(d.newly_active, (std::vector<std::string>{"n000", "n001", "n002"}));
    EXPECT_TRUE(d.newly_pruned.empty());
}

TEST(StepDiffTest, PrunedDifferenceWhenNodesPruned) {
    StepRunLog prev = stepWith({"a", "b"}, {"x"});
    StepRunLog cur = stepWith({"b", "c"}, {"x", "y", "a"});
    StepDiff d = diffSteps(&prev, cur);
    EXPECT_EQ(d.newly_active, (std::vector<std::string>{"c"}));
    EXPECT_EQ(d.newly_pruned, (std::vector<std::string>{"a", "y"}));
}

TEST(StepDiffTest, DroppedActiveWhenNothingPruned) {
    StepRunLog prev = stepWith({"a", "b", "c"}, {});
    StepRunLog cur = stepWith({"b", "d"}, {});
    StepDiff d = diffSteps(&prev, cur);
    EXPECT_EQ(d.newly_active, (std::vector<std::string>{"d"}));
    EXPECT_EQ(d.newly_pruned, (std::vector<std::string>{"a", "c"}));
}

TEST(StepDiffTest, DiffAtBoundsChecked) {
    RunLog log;
    log.steps.push_back(stepWith({"a"}, {}));
    log.steps.push_back(stepWith({"a", "b"}, {}));

    EXPECT_EQ(diffAt(log, 0).newly_active, (std::vector<std::string>{"a"}));
    EXPECT_EQ(diffAt(log, 1).newly_active, (std::vector<std::string>{"b"}));
    EXPECT_THROW(diffAt(log, 2), std::out_of_range);
}

TEST(StepDiffTest, WinningCandidateIsFirst) {
    StepRunLog s;
    EXPECT_FALSE(winningCandidate(s).has_value());

    s.beam_candidates.push_back(candidate({"a", "b"}, {"a->b"}, 1.5));
    s.beam_candidates.push_back(candidate({"b", "a"}, {"a->b"}, 1.5));
    auto best = winningCandidate(s);
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->node_path, (std::vector<std::string>{"a", "b"}));
}
