#include "pheromone/trail_store.hpp"

#include <stdexcept>

namespace edupath {

TrailStore::TrailStore(const ModuleGraph& graph, double initial_level) {
    auto ids = graph.getModuleIds();
    for (const auto& from : ids) {
        for (const auto& to : ids) {
            if (from == to) continue;
            trails_.emplace(TrailKey{from, to}, PheromoneTrail(from, to, initial_level));
        }
    }
}

PheromoneTrail* TrailStore::find(const std::string& from, const std::string& to) {
    auto it = trails_.find(TrailKey{from, to});
    return it != trails_.end() ? &it->second : nullptr;
}

const PheromoneTrail* TrailStore::find(const std::string& from, const std::string& to) const {
    auto it = trails_.find(TrailKey{from, to});
    return it != trails_.end() ? &it->second : nullptr;
}

PheromoneTrail& TrailStore::require(const std::string& from, const std::string& to) {
    PheromoneTrail* trail = find(from, to);
    if (!trail) {
        throw std::out_of_range("Trail not found: " + from + " -> " + to);
    }
    return *trail;
}

double TrailStore::pheromoneOr(const std::string& from, const std::string& to,
                               double fallback) const {
    const PheromoneTrail* trail = find(from, to);
    return trail ? trail->pheromone_level : fallback;
}

void TrailStore::evaporateAll(double rate) {
    const std::vector<TrailKey> keys = trailKeys();
    for (const auto& key : keys) {
        trails_.at(key).evaporate(rate);
    }
}

std::vector<TrailKey> TrailStore::trailKeys() const {
    std::vector<TrailKey> keys;
    keys.reserve(trails_.size());
    for (const auto& [key, _] : trails_) {
        keys.push_back(key);
    }
    return keys;
}

void TrailStore::forEach(const std::function<void(const PheromoneTrail&)>& fn) const {
    for (const auto& [_, trail] : trails_) {
        fn(trail);
    }
}

} // namespace edupath
