#pragma once

#include "pheromone/pheromone_trail.hpp"
#include "graph/module_graph.hpp"

#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace edupath {

using TrailKey = std::pair<std::string, std::string>;  // (from, to)

// ─── TrailStore ────────────────────────────────────────────────
// Exactly one trail per ordered pair of distinct modules, created
// eagerly from the graph. Trails are never removed.

class TrailStore {
public:
    TrailStore() = default;
    explicit TrailStore(const ModuleGraph& graph,
                        double initial_level = kInitialPheromone);

    PheromoneTrail* find(const std::string& from, const std::string& to);
    const PheromoneTrail* find(const std::string& from, const std::string& to) const;

    /// Throws std::out_of_range if no trail exists for the pair.
    PheromoneTrail& require(const std::string& from, const std::string& to);

    /// Pheromone level of (from → to), or `fallback` when the pair has no trail.
    double pheromoneOr(const std::string& from, const std::string& to,
                       double fallback) const;

    /// Evaporates every trail. Iterates over a key list captured before
    /// any trail is touched.
    void evaporateAll(double rate);

    std::vector<TrailKey> trailKeys() const;
    size_t size() const { return trails_.size(); }

    void forEach(const std::function<void(const PheromoneTrail&)>& fn) const;

private:
    std::map<TrailKey, PheromoneTrail> trails_;
};

} // namespace edupath
