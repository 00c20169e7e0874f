#pragma once

#include "colony/colony_config.hpp"
#include "colony/path_optimizer.hpp"
#include "graph/module_graph.hpp"
#include "learner/learner_profile.hpp"
#include "pheromone/trail_store.hpp"

#include <map>
#include <optional>
#include <random>
#include <string>

namespace edupath {

/// A learner's real attempt at a module.
struct ProgressEvent {
    std::string learner_id;
    std::string module_id;
    double score = 0.0;          // 0..100
    int completion_time = 0;     // minutes
    int attempts_needed = 1;
    std::optional<bool> success; // unset → score >= 70
};

struct ColonyStats {
    long total_paths_generated = 0;
    long total_learning_events = 0;
    long optimization_runs = 0;
};

// ─── Colony ────────────────────────────────────────────────────
// The engine instance. Owns the module graph, one trail per ordered
// module pair, the learner roster and run statistics. Callers pass the
// instance explicitly; there is no process-wide colony.
//
// Single-threaded. An optimize call mutates every trail; callers that
// share a colony across threads must serialize calls themselves.
// Readers that run concurrently with an optimize call see a partially
// updated pheromone field (read-uncommitted).

class Colony {
public:
    /// Throws std::invalid_argument for an empty graph or invalid config,
    /// std::runtime_error when prerequisites reference unknown modules.
    explicit Colony(ModuleGraph graph, ColonyConfig config = {});

    Colony(const Colony&) = delete;
    Colony& operator=(const Colony&) = delete;

    // ── Learners ──
    /// Throws std::invalid_argument if the id is taken.
    LearnerProfile& createLearner(const std::string& learner_id,
                                  LearningStyle style = LearningStyle::Mixed,
                                  double skill_level = kMinSkill);
    LearnerProfile* getLearner(const std::string& learner_id);
    const LearnerProfile* getLearner(const std::string& learner_id) const;
    /// Throws std::out_of_range for unknown ids.
    LearnerProfile& requireLearner(const std::string& learner_id);
    size_t learnerCount() const { return learners_.size(); }

    /// Applies a real progress event. An unknown learner joins the roster
    /// once the event is accepted. The event's success flag, when set,
    /// decides success for the learner record and the trail alike. When the
    /// learner had a different current module and the attempt succeeded,
    /// the (previous → module) trail records the traversal.
    /// Throws std::out_of_range for modules not in the graph and
    /// std::invalid_argument for invalid events; a rejected event changes
    /// nothing.
    const PerformanceRecord& recordProgress(const ProgressEvent& event);

    // ── Optimization ──
    /// Full run for a known learner. `iterations` defaults to the
    /// configured budget. Throws std::out_of_range for unknown learner
    /// or target.
    OptimizationResult optimize(const std::string& learner_id, const std::string& target,
                                std::optional<int> iterations = std::nullopt);

    /// Best path, or std::nullopt when no route exists.
    std::optional<ModulePath> recommendPath(const std::string& learner_id,
                                            const std::string& target,
                                            std::optional<int> iterations = std::nullopt);

    /// Replaces the scorer used by subsequent runs. Empty → built-in.
    void setScorer(PathScorer fn) { scorer_ = std::move(fn); }

    // ── Read-only access ──
    const ModuleGraph& graph() const { return graph_; }
    const TrailStore& trails() const { return trails_; }
    const std::map<std::string, LearnerProfile>& learners() const { return learners_; }
    const ColonyConfig& config() const { return config_; }
    const ColonyStats& stats() const { return stats_; }

private:
    ModuleGraph graph_;
    ColonyConfig config_;
    TrailStore trails_;
    std::map<std::string, LearnerProfile> learners_;
    ColonyStats stats_;
    std::mt19937 rng_;
    PathScorer scorer_;
};

} // namespace edupath
