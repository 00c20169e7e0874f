#pragma once

#include "colony/colony_config.hpp"
#include "graph/module_graph.hpp"
#include "learner/learner_profile.hpp"
#include "pheromone/trail_store.hpp"

#include <functional>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace edupath {

/// Pheromone level assumed for a pair that has no trail record.
constexpr double kDefaultPheromone = 0.5;

using ModulePath = std::vector<std::string>;

/// Replacement path scorer, e.g. for experiments. Same contract as
/// PathOptimizer::evaluatePath.
using PathScorer = std::function<double(const ModulePath&, const LearnerProfile&)>;

/// Outcome of one optimization run. An empty path means no route was found.
struct OptimizationResult {
    ModulePath path;
    double score = 0.0;
    bool reached_target = false;
    int iterations_run = 0;
    int failed_iterations = 0;
    int paths_generated = 0;           // non-empty candidate paths
    int best_found_at_iteration = -1;  // -1 when no path was found
    bool converged = false;
    std::vector<double> best_score_history;  // best score after each iteration

    bool empty() const { return path.empty(); }
};

// ─── PathOptimizer ─────────────────────────────────────────────
// Ant-colony search over the module graph for one learner:
// - probabilistic path construction (pheromone^α × attractiveness^β)
// - roulette-wheel selection
// - path evaluation
// - evaporate-all then reinforce-current-path each iteration
//
// Holds references only; the graph, trails, config and RNG must outlive
// it. Not thread-safe: a run mutates every trail in the store.

class PathOptimizer {
public:
    PathOptimizer(const ModuleGraph& graph, TrailStore& trails,
                  const ColonyConfig& config, std::mt19937& rng);

    void setScorer(PathScorer fn) { scorer_ = std::move(fn); }

    /// P(m) for every candidate, in candidate order. Uniform when the
    /// total weight is zero or not finite. Empty input → empty output.
    std::vector<double> selectionProbabilities(const std::string& current,
                                               const std::vector<std::string>& candidates,
                                               const LearnerProfile& learner) const;

    /// Roulette-wheel pick. Never fails on a non-empty candidate list;
    /// throws std::invalid_argument on an empty one.
    const std::string& selectNext(const std::string& current,
                                  const std::vector<std::string>& candidates,
                                  const LearnerProfile& learner);

    /// Builds one candidate path toward `target`. The path may stop short
    /// of the target when no candidate remains; it is empty when the
    /// learner has no current module, is already at the target, or has
    /// completed it. Throws std::out_of_range for modules not in the graph.
    ModulePath constructPath(const LearnerProfile& learner, const std::string& target);

    /// Mean per-module quality, 0 for an empty path. Per module:
    ///   0.5·skill + 0.2·efficiency + 0.3·prerequisites
    /// so non-empty paths score within [0.05, 0.99).
    double evaluatePath(const ModulePath& path, const LearnerProfile& learner) const;

    /// Evaporates all trails, then reinforces the edges of `path` (starting
    /// at `origin`) by score × reinforcement factor.
    void updatePheromones(const std::string& origin, const ModulePath& path, double score);

    /// Runs `iterations` construct/evaluate/update cycles and keeps the best
    /// path; the first non-empty path is best until a higher score replaces
    /// it. Throws std::out_of_range before the loop for a target or current
    /// module not in the graph. An iteration that throws is logged and
    /// skipped, and the best path so far is kept.
    OptimizationResult optimize(const LearnerProfile& learner, const std::string& target,
                                int iterations);

    /// Consecutive (from, to) pairs of origin + path, skipping origin when
    /// it is the first path element.
    static std::vector<std::pair<std::string, std::string>>
    pathEdges(const std::string& origin, const ModulePath& path);

private:
    const ModuleGraph& graph_;
    TrailStore& trails_;
    const ColonyConfig& config_;
    std::mt19937& rng_;
    PathScorer scorer_;

    double score(const ModulePath& path, const LearnerProfile& learner) const;
};

} // namespace edupath
