#include "pheromone/pheromone_trail.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace edupath {

PheromoneTrail::PheromoneTrail(std::string from, std::string to, double level)
    : from_module(std::move(from)), to_module(std::move(to)),
      pheromone_level(std::clamp(level, kMinPheromone, kMaxPheromone)) {}

void PheromoneTrail::evaporate(double rate) {
    if (rate < 0.0 || rate > 1.0) {
        throw std::invalid_argument("Evaporation rate must be within [0,1]");
    }
    pheromone_level = std::max(kMinPheromone, pheromone_level * (1.0 - rate));
    last_updated = std::chrono::system_clock::now();
}

void PheromoneTrail::reinforce(double amount) {
    pheromone_level = std::clamp(pheromone_level + amount, kMinPheromone, kMaxPheromone);
    last_updated = std::chrono::system_clock::now();
}

int PheromoneTrail::successCount() const {
    return static_cast<int>(std::lround(success_rate * traversal_count));
}

void PheromoneTrail::recordTraversal(double score, int completion_time, bool success) {
    int successes_before = successCount();

    traversal_count++;
    total_score += score;
    average_completion_time = (average_completion_time + completion_time) / 2;
    success_rate = static_cast<double>(successes_before + (success ? 1 : 0)) /
                   traversal_count;
    last_updated = std::chrono::system_clock::now();
}

} // namespace edupath
