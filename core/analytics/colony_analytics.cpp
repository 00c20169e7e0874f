#include "analytics/colony_analytics.hpp"

#include <algorithm>

namespace edupath {

TrailStatistics trailStatistics(const TrailStore& trails) {
    TrailStatistics s;
    s.total_trails = trails.size();
    if (s.total_trails == 0) return s;

    double pheromone_sum = 0.0;
    double success_sum = 0.0;
    s.min_pheromone = kMaxPheromone;

    trails.forEach([&](const PheromoneTrail& t) {
        pheromone_sum += t.pheromone_level;
        s.max_pheromone = std::max(s.max_pheromone, t.pheromone_level);
        s.min_pheromone = std::min(s.min_pheromone, t.pheromone_level);
        if (t.traversal_count > 0) {
            s.traversed_trails++;
            success_sum += t.success_rate;
        }
    });

    s.average_pheromone = pheromone_sum / s.total_trails;
    if (s.traversed_trails > 0) {
        s.average_success_rate = success_sum / s.traversed_trails;
    }
    return s;
}

std::vector<PheromoneTrail> strongestTrails(const TrailStore& trails, size_t n) {
    std::vector<PheromoneTrail> all;
    all.reserve(trails.size());
    trails.forEach([&](const PheromoneTrail& t) { all.push_back(t); });

    std::stable_sort(all.begin(), all.end(),
        [](const PheromoneTrail& a, const PheromoneTrail& b) {
            return a.trailStrength() > b.trailStrength();
        });
    if (all.size() > n) all.resize(n);
    return all;
}

double pathStrength(const TrailStore& trails, const std::string& origin,
                    const ModulePath& path) {
    double sum = 0.0;
    int edges = 0;
    for (const auto& [from, to] : PathOptimizer::pathEdges(origin, path)) {
        if (const PheromoneTrail* t = trails.find(from, to)) {
            sum += t->trailStrength();
            edges++;
        }
    }
    return edges > 0 ? sum / edges : 0.0;
}

LearnerSummary summarizeLearner(const LearnerProfile& learner) {
    LearnerSummary s;
    s.learner_id = learner.id();
    s.skill_level = learner.skillLevel();
    s.learning_style = learner.learningStyle();
    s.completed_modules = learner.completedModules().size();
    s.attempts = learner.performanceHistory().size();
    s.average_score = learner.recentAverageScore(s.attempts).value_or(0.0);
    s.success_rate = learner.overallSuccessRate();
    s.recommended_difficulty = learner.recommendedDifficulty();
    return s;
}

ColonySnapshot colonySnapshot(const Colony& colony) {
    ColonySnapshot snap;
    snap.module_count = colony.graph().moduleCount();
    snap.learner_count = colony.learners().size();
    snap.stats = colony.stats();
    snap.trails = trailStatistics(colony.trails());
    for (const auto& [_, learner] : colony.learners()) {
        snap.learners.push_back(summarizeLearner(learner));
    }
    return snap;
}

} // namespace edupath
