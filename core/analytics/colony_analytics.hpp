#pragma once

#include "colony/colony.hpp"

#include <string>
#include <vector>

namespace edupath {

struct TrailStatistics {
    size_t total_trails = 0;
    size_t traversed_trails = 0;      // traversal_count > 0
    double average_pheromone = 0.0;
    double max_pheromone = 0.0;
    double min_pheromone = 0.0;
    double average_success_rate = 0.0;  // over traversed trails only
};

struct LearnerSummary {
    std::string learner_id;
    double skill_level = 0.0;
    LearningStyle learning_style = LearningStyle::Mixed;
    size_t completed_modules = 0;
    size_t attempts = 0;
    double average_score = 0.0;
    double success_rate = 0.0;
    int recommended_difficulty = 1;
};

struct ColonySnapshot {
    size_t module_count = 0;
    size_t learner_count = 0;
    ColonyStats stats;
    TrailStatistics trails;
    std::vector<LearnerSummary> learners;
};

// ─── Analytics ─────────────────────────────────────────────────
// Read-only views over a colony for reports and exporters. No
// formatting happens here.

TrailStatistics trailStatistics(const TrailStore& trails);

/// The `n` trails with the highest trailStrength(), strongest first.
/// Ties keep store order (from, to).
std::vector<PheromoneTrail> strongestTrails(const TrailStore& trails, size_t n);

/// Mean trailStrength() over the edges of origin + path; 0 with no edges.
double pathStrength(const TrailStore& trails, const std::string& origin,
                    const ModulePath& path);

LearnerSummary summarizeLearner(const LearnerProfile& learner);

ColonySnapshot colonySnapshot(const Colony& colony);

} // namespace edupath
