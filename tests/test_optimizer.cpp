#include <gtest/gtest.h>
#include "colony/path_optimizer.hpp"

#include <algorithm>
#include <map>
#include <numeric>
#include <set>
#include <stdexcept>

using namespace edupath;

// A(1) → B(2) → C(3), each the sole prerequisite of the next.
static ModuleGraph chainGraph() {
    ModuleGraph g;
    Module a("A", "Module A", 1, 30);
    Module b("B", "Module B", 2, 30);
    b.prerequisites = {"A"};
    Module c("C", "Module C", 3, 30);
    c.prerequisites = {"B"};
    g.addModule(a);
    g.addModule(b);
    g.addModule(c);
    return g;
}

// `n` modules with no prerequisites.
static ModuleGraph flatGraph(int n) {
    ModuleGraph g;
    for (int i = 0; i < n; i++) {
        std::string id = "M" + std::string(i < 10 ? "0" : "") + std::to_string(i);
        g.addModule(Module(id, "Flat " + id, 1 + i % 5, 20 + i));
    }
    return g;
}

struct OptimizerFixture {
    ModuleGraph graph;
    TrailStore trails;
    ColonyConfig config;
    std::mt19937 rng;
    PathOptimizer optimizer;

    explicit OptimizerFixture(ModuleGraph g, ColonyConfig c = {}, uint32_t seed = 42)
        : graph(std::move(g)), trails(graph), config(c), rng(seed),
          optimizer(graph, trails, config, rng) {}
};

// ─── Selection probabilities ───────────────────────────────────

TEST(PathOptimizerTest, ProbabilitiesSumToOne) {
    OptimizerFixture f(flatGraph(6));
    f.trails.require("M00", "M02").reinforce(3.0);
    LearnerProfile learner("l1", LearningStyle::Practical, 2.5);

    std::vector<std::string> candidates{"M01", "M02", "M03", "M04", "M05"};
    auto probs = f.optimizer.selectionProbabilities("M00", candidates, learner);
    ASSERT_EQ(probs.size(), candidates.size());
    EXPECT_NEAR(std::accumulate(probs.begin(), probs.end(), 0.0), 1.0, 1e-9);
    for (double p : probs) EXPECT_GT(p, 0.0);
}

TEST(PathOptimizerTest, ProbabilityFollowsPheromoneAndAttractiveness) {
    ModuleGraph g;
    g.addModule(Module("start", "Start", 1, 10));
    g.addModule(Module("x", "X", 1, 10));
    g.addModule(Module("y", "Y", 1, 10));
    OptimizerFixture f(std::move(g));
    f.trails.require("start", "x").reinforce(1.0);  // 2.0 vs 1.0

    LearnerProfile learner("l1");
    auto probs = f.optimizer.selectionProbabilities("start", {"x", "y"}, learner);
    // Equal attractiveness, α = 1: pheromone ratio 2:1
    EXPECT_NEAR(probs[0], 2.0 / 3.0, 1e-12);
    EXPECT_NEAR(probs[1], 1.0 / 3.0, 1e-12);
}

TEST(PathOptimizerTest, MissingTrailUsesDefaultPheromone) {
    ModuleGraph g;
    g.addModule(Module("x", "X", 1, 10));
    g.addModule(Module("y", "Y", 1, 10));
    OptimizerFixture f(std::move(g));

    LearnerProfile learner("l1");
    // (x → x) has no trail: 0.5 against the initial 1.0 of (x → y)
    auto probs = f.optimizer.selectionProbabilities("x", {"x", "y"}, learner);
    EXPECT_NEAR(probs[0], 0.5 / 1.5, 1e-12);
    EXPECT_NEAR(probs[1], 1.0 / 1.5, 1e-12);
}

TEST(PathOptimizerTest, ZeroWeightFallsBackToUniform) {
    ColonyConfig config;
    config.alpha = 2000.0;  // 0.01^2000 underflows to zero
    OptimizerFixture f(flatGraph(5), config);
    f.trails.evaporateAll(1.0);

    LearnerProfile learner("l1");
    std::vector<std::string> candidates{"M01", "M02", "M03", "M04"};
    auto probs = f.optimizer.selectionProbabilities("M00", candidates, learner);
    for (double p : probs) EXPECT_DOUBLE_EQ(p, 0.25);

    std::set<std::string> seen;
    for (int i = 0; i < 200; i++) {
        seen.insert(f.optimizer.selectNext("M00", candidates, learner));
    }
    EXPECT_EQ(seen.size(), candidates.size());
}

TEST(PathOptimizerTest, SelectNextEdgeCases) {
    OptimizerFixture f(flatGraph(3));
    LearnerProfile learner("l1");
    EXPECT_THROW(f.optimizer.selectNext("M00", {}, learner), std::invalid_argument);
    EXPECT_EQ(f.optimizer.selectNext("M00", {"M02"}, learner), "M02");
    EXPECT_TRUE(f.optimizer.selectionProbabilities("M00", {}, learner).empty());
}

TEST(PathOptimizerTest, SelectNextPrefersHeavyTrail) {
    OptimizerFixture f(flatGraph(3));
    f.trails.require("M00", "M01").reinforce(9.0);
    f.trails.require("M00", "M02").evaporate(0.99);
    LearnerProfile learner("l1");

    int heavy = 0;
    for (int i = 0; i < 500; i++) {
        if (f.optimizer.selectNext("M00", {"M01", "M02"}, learner) == "M01") heavy++;
    }
    EXPECT_GT(heavy, 450);
}

// ─── Path construction ─────────────────────────────────────────

TEST(PathOptimizerTest, ChainPathFollowsPrerequisites) {
    OptimizerFixture f(chainGraph());
    LearnerProfile learner("l1");
    learner.setCurrentModule("A");

    ModulePath path = f.optimizer.constructPath(learner, "C");
    EXPECT_EQ(path, (ModulePath{"A", "B", "C"}));
}

TEST(PathOptimizerTest, EmptyPathWhenAtTarget) {
    OptimizerFixture f(chainGraph());
    LearnerProfile learner("l1");
    learner.setCurrentModule("C");
    EXPECT_TRUE(f.optimizer.constructPath(learner, "C").empty());
}

TEST(PathOptimizerTest, EmptyPathWhenTargetCompleted) {
    OptimizerFixture f(chainGraph());
    LearnerProfile learner("l1");
    learner.setCurrentModule("A");
    learner.markCompleted("C");
    EXPECT_TRUE(f.optimizer.constructPath(learner, "C").empty());
}

TEST(PathOptimizerTest, EmptyPathWithoutCurrentModule) {
    OptimizerFixture f(chainGraph());
    LearnerProfile learner("l1");
    EXPECT_TRUE(f.optimizer.constructPath(learner, "C").empty());
}

TEST(PathOptimizerTest, UnknownModulesThrow) {
    OptimizerFixture f(chainGraph());
    LearnerProfile learner("l1");
    learner.setCurrentModule("A");
    EXPECT_THROW(f.optimizer.constructPath(learner, "Z"), std::out_of_range);

    learner.setCurrentModule("Q");
    EXPECT_THROW(f.optimizer.constructPath(learner, "C"), std::out_of_range);
}

TEST(PathOptimizerTest, PathIsBoundedAndNeverRevisits) {
    OptimizerFixture f(flatGraph(15));
    LearnerProfile learner("l1", LearningStyle::Visual, 3.0);
    learner.setCurrentModule("M00");
    learner.markCompleted("M00");

    for (int run = 0; run < 100; run++) {
        ModulePath path = f.optimizer.constructPath(learner, "M14");
        ASSERT_FALSE(path.empty());
        EXPECT_LE(static_cast<int>(path.size()), f.config.max_path_length);
        std::set<std::string> unique(path.begin(), path.end());
        EXPECT_EQ(unique.size(), path.size());
        if (path.size() < 10) {
            EXPECT_EQ(path.back(), "M14");
        }
        EXPECT_EQ(std::count(path.begin(), path.end(), "M00"), 0);
    }
}

TEST(PathOptimizerTest, PathStopsWhenNoCandidates) {
    // x and y require each other, so the goal can never unlock
    ModuleGraph g;
    g.addModule(Module("start", "Start", 1, 10));
    g.addModule(Module("gate", "Gate", 2, 10));
    Module x("x", "X", 2, 10);
    x.prerequisites = {"y"};
    Module y("y", "Y", 2, 10);
    y.prerequisites = {"x"};
    Module goal("goal", "Goal", 3, 10);
    goal.prerequisites = {"x"};
    g.addModule(x);
    g.addModule(y);
    g.addModule(goal);
    OptimizerFixture f(std::move(g));

    LearnerProfile learner("l1");
    learner.setCurrentModule("start");
    learner.markCompleted("start");
    ModulePath path = f.optimizer.constructPath(learner, "goal");
    EXPECT_EQ(path, ModulePath{"gate"});

    OptimizationResult result = f.optimizer.optimize(learner, "goal", 10);
    EXPECT_FALSE(result.reached_target);
    EXPECT_EQ(result.path, ModulePath{"gate"});
}

// ─── Evaluation ────────────────────────────────────────────────

TEST(PathOptimizerTest, EvaluateEmptyPath) {
    OptimizerFixture f(chainGraph());
    LearnerProfile learner("l1");
    EXPECT_DOUBLE_EQ(f.optimizer.evaluatePath({}, learner), 0.0);
}

TEST(PathOptimizerTest, EvaluateChainPath) {
    OptimizerFixture f(chainGraph());
    LearnerProfile learner("l1", LearningStyle::Mixed, 1.0);
    double efficiency = 1.0 / 1.3;
    // A: skill 1.0, prereq 1.0; B: skill 0.84, prereq 0; C: skill 0.68, prereq 0
    double expected = ((0.5 * 1.0 + 0.3) + (0.5 * 0.84) + (0.5 * 0.68) +
                       3 * 0.2 * efficiency) / 3.0;
    EXPECT_NEAR(f.optimizer.evaluatePath({"A", "B", "C"}, learner), expected, 1e-12);
}

TEST(PathOptimizerTest, EvaluateCountsCompletedPrerequisites) {
    OptimizerFixture f(chainGraph());
    LearnerProfile fresh("fresh", LearningStyle::Mixed, 2.0);
    LearnerProfile prepared("prepared", LearningStyle::Mixed, 2.0);
    prepared.markCompleted("A");
    EXPECT_GT(f.optimizer.evaluatePath({"B"}, prepared), f.optimizer.evaluatePath({"B"}, fresh));
    EXPECT_NEAR(f.optimizer.evaluatePath({"B"}, prepared) -
                f.optimizer.evaluatePath({"B"}, fresh), 0.3, 1e-12);
}

TEST(PathOptimizerTest, EvaluateStaysInBounds) {
    OptimizerFixture f(ModuleGraph::defaultCatalog());
    for (double skill : {1.0, 4.0, 10.0}) {
        LearnerProfile learner("l", LearningStyle::Mixed, skill);
        auto ids = f.graph.getModuleIds();
        for (size_t len = 1; len <= ids.size(); len++) {
            ModulePath path(ids.begin(), ids.begin() + len);
            double score = f.optimizer.evaluatePath(path, learner);
            EXPECT_GE(score, 0.05);
            EXPECT_LT(score, 0.99);
        }
    }
}

// ─── Pheromone update ──────────────────────────────────────────

TEST(PathOptimizerTest, PathEdges) {
    auto edges = PathOptimizer::pathEdges("A", {"A", "B", "C"});
    ASSERT_EQ(edges.size(), 2);
    EXPECT_EQ(edges[0], std::make_pair(std::string("A"), std::string("B")));
    EXPECT_EQ(edges[1], std::make_pair(std::string("B"), std::string("C")));

    edges = PathOptimizer::pathEdges("S", {"A", "B"});
    ASSERT_EQ(edges.size(), 2);
    EXPECT_EQ(edges[0].first, "S");

    EXPECT_TRUE(PathOptimizer::pathEdges("S", {}).empty());
}

TEST(PathOptimizerTest, UpdateEvaporatesAllThenReinforcesPath) {
    OptimizerFixture f(chainGraph());
    f.optimizer.updatePheromones("A", {"A", "B", "C"}, 0.5);

    // 1.0 × 0.9 + 0.5 × 1.0
    EXPECT_NEAR(f.trails.require("A", "B").pheromone_level, 1.4, 1e-12);
    EXPECT_NEAR(f.trails.require("B", "C").pheromone_level, 1.4, 1e-12);
    EXPECT_NEAR(f.trails.require("C", "A").pheromone_level, 0.9, 1e-12);
    EXPECT_NEAR(f.trails.require("B", "A").pheromone_level, 0.9, 1e-12);
}

// ─── Optimization loop ─────────────────────────────────────────

TEST(PathOptimizerTest, OptimizeChainReachesTarget) {
    int reached = 0;
    const int runs = 20;
    for (uint32_t seed = 1; seed <= runs; seed++) {
        OptimizerFixture f(chainGraph(), ColonyConfig{}, seed);
        LearnerProfile learner("l1", LearningStyle::Mixed, 1.0);
        learner.setCurrentModule("A");

        OptimizationResult result = f.optimizer.optimize(learner, "C", 50);
        EXPECT_EQ(result.iterations_run, 50);
        ASSERT_FALSE(result.empty());
        if (result.reached_target) reached++;

        auto b = std::find(result.path.begin(), result.path.end(), "B");
        auto c = std::find(result.path.begin(), result.path.end(), "C");
        if (c != result.path.end()) {
            EXPECT_TRUE(b != result.path.end() && b < c) << "path skipped B";
        }
    }
    EXPECT_GE(reached, runs * 9 / 10);
}

TEST(PathOptimizerTest, OptimizeCompletedTargetIsEmpty) {
    OptimizerFixture f(chainGraph());
    LearnerProfile learner("l1");
    learner.setCurrentModule("A");
    learner.markCompleted("C");

    OptimizationResult result;
    EXPECT_NO_THROW(result = f.optimizer.optimize(learner, "C", 10));
    EXPECT_TRUE(result.empty());
    EXPECT_FALSE(result.reached_target);
    EXPECT_EQ(result.best_found_at_iteration, -1);
    EXPECT_DOUBLE_EQ(result.score, 0.0);
}

TEST(PathOptimizerTest, OptimizeReinforcesChosenEdges) {
    OptimizerFixture f(chainGraph());
    LearnerProfile learner("l1");
    learner.setCurrentModule("A");
    f.optimizer.optimize(learner, "C", 30);

    EXPECT_GT(f.trails.require("A", "B").pheromone_level,
              f.trails.require("A", "C").pheromone_level);
    EXPECT_GT(f.trails.require("B", "C").pheromone_level,
              f.trails.require("C", "B").pheromone_level);
}

TEST(PathOptimizerTest, FailedIterationsAreSkipped) {
    OptimizerFixture f(chainGraph());
    LearnerProfile learner("l1");
    learner.setCurrentModule("A");

    int calls = 0;
    f.optimizer.setScorer([&](const ModulePath& path, const LearnerProfile&) {
        calls++;
        if (calls % 3 == 0) throw std::runtime_error("transient fault");
        return 0.1 * static_cast<double>(path.size());
    });

    OptimizationResult result = f.optimizer.optimize(learner, "C", 9);
    EXPECT_EQ(result.iterations_run, 9);
    EXPECT_EQ(result.failed_iterations, 3);
    EXPECT_EQ(result.path, (ModulePath{"A", "B", "C"}));
    EXPECT_EQ(result.best_found_at_iteration, 0);
    EXPECT_NEAR(result.score, 0.3, 1e-12);
}

TEST(PathOptimizerTest, OutOfRangeInsideIterationKeepsBest) {
    OptimizerFixture f(chainGraph());
    LearnerProfile learner("l1");
    learner.setCurrentModule("A");

    std::map<int, double> scores{{1, 0.4}};
    int calls = 0;
    f.optimizer.setScorer([&](const ModulePath&, const LearnerProfile&) {
        return scores.at(++calls);  // only the first call has a score
    });

    OptimizationResult result;
    EXPECT_NO_THROW(result = f.optimizer.optimize(learner, "C", 5));
    EXPECT_EQ(result.iterations_run, 5);
    EXPECT_EQ(result.failed_iterations, 4);
    EXPECT_EQ(result.path, (ModulePath{"A", "B", "C"}));
    EXPECT_NEAR(result.score, 0.4, 1e-12);
    EXPECT_EQ(result.best_found_at_iteration, 0);
}

TEST(PathOptimizerTest, NonPositiveScorerStillKeepsBest) {
    OptimizerFixture f(chainGraph());
    LearnerProfile learner("l1");
    learner.setCurrentModule("A");

    int calls = 0;
    f.optimizer.setScorer([&](const ModulePath&, const LearnerProfile&) {
        return -1.0 + 0.1 * (++calls == 3 ? 1 : 0);
    });

    OptimizationResult result = f.optimizer.optimize(learner, "C", 5);
    ASSERT_FALSE(result.empty());
    EXPECT_TRUE(result.reached_target);
    EXPECT_EQ(result.best_found_at_iteration, 2);
    EXPECT_NEAR(result.score, -0.9, 1e-12);
}

TEST(PathOptimizerTest, OptimizeUnknownTargetThrows) {
    OptimizerFixture f(chainGraph());
    LearnerProfile learner("l1");
    learner.setCurrentModule("A");
    EXPECT_THROW(f.optimizer.optimize(learner, "nope", 5), std::out_of_range);
}

TEST(PathOptimizerTest, OptimizeUnknownCurrentModuleThrows) {
    OptimizerFixture f(chainGraph());
    LearnerProfile learner("l1");
    learner.setCurrentModule("nowhere");
    EXPECT_THROW(f.optimizer.optimize(learner, "C", 5), std::out_of_range);
}

TEST(PathOptimizerTest, DeterministicRunConverges) {
    OptimizerFixture f(chainGraph());
    LearnerProfile learner("l1");
    learner.setCurrentModule("A");
    OptimizationResult result = f.optimizer.optimize(learner, "C", 20);
    EXPECT_TRUE(result.converged);
    EXPECT_EQ(result.best_score_history.size(), 20);
    EXPECT_EQ(result.paths_generated, 20);
}
