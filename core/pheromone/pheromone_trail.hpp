#pragma once

#include <chrono>
#include <string>

namespace edupath {

constexpr double kMinPheromone = 0.01;
constexpr double kMaxPheromone = 10.0;
constexpr double kInitialPheromone = 1.0;

// ─── PheromoneTrail ────────────────────────────────────────────
// Directed (from → to) transition record. Holds the pheromone level the
// optimizer reads and writes, plus statistics from real learner
// traversals, which are independent of algorithmic reinforcement.

struct PheromoneTrail {
    std::string from_module;
    std::string to_module;
    double pheromone_level = kInitialPheromone;  // always in [0.01, 10.0]
    int traversal_count = 0;
    double success_rate = 0.0;
    double total_score = 0.0;
    int average_completion_time = 0;              // minutes
    std::chrono::system_clock::time_point last_updated = std::chrono::system_clock::now();

    PheromoneTrail() = default;
    PheromoneTrail(std::string from, std::string to, double level = kInitialPheromone);

    /// level ← level × (1 − rate), floored at kMinPheromone.
    /// Throws std::invalid_argument unless 0 ≤ rate ≤ 1.
    void evaporate(double rate);

    /// level ← level + amount, clamped to [kMinPheromone, kMaxPheromone].
    void reinforce(double amount);

    /// Records one real learner traversal of this edge.
    ///
    /// The completion time average uses the recurrence (old + new) / 2,
    /// starting from 0, in integer minutes. This weights recent traversals
    /// more heavily than a true mean would; existing consumers of the
    /// value depend on it, so it is kept as is.
    void recordTraversal(double score, int completion_time, bool success);

    /// pheromone_level × (1 + success_rate). Reporting metric only.
    double trailStrength() const { return pheromone_level * (1.0 + success_rate); }

    double averageScore() const {
        return traversal_count > 0 ? total_score / traversal_count : 0.0;
    }

    int successCount() const;
};

} // namespace edupath
