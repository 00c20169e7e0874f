#include "colony/path_optimizer.hpp"
#include "colony/attractiveness.hpp"
#include "util/log.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>

namespace edupath {

PathOptimizer::PathOptimizer(const ModuleGraph& graph, TrailStore& trails,
                             const ColonyConfig& config, std::mt19937& rng)
    : graph_(graph), trails_(trails), config_(config), rng_(rng) {}

// ─── Selection ─────────────────────────────────────────────────

std::vector<double> PathOptimizer::selectionProbabilities(
    const std::string& current,
    const std::vector<std::string>& candidates,
    const LearnerProfile& learner) const {

    std::vector<double> weights;
    weights.reserve(candidates.size());
    double total = 0.0;

    for (const auto& id : candidates) {
        const Module& module = graph_.requireModule(id);
        double tau = trails_.pheromoneOr(current, id, kDefaultPheromone);
        double eta = attractiveness(module, learner);
        double w = std::pow(tau, config_.alpha) * std::pow(eta, config_.beta);
        weights.push_back(w);
        total += w;
    }

    if (candidates.empty()) return weights;

    if (total <= 0.0 || !std::isfinite(total)) {
        return std::vector<double>(candidates.size(), 1.0 / candidates.size());
    }
    for (double& w : weights) {
        w /= total;
    }
    return weights;
}

const std::string& PathOptimizer::selectNext(const std::string& current,
                                             const std::vector<std::string>& candidates,
                                             const LearnerProfile& learner) {
    if (candidates.empty()) {
        throw std::invalid_argument("selectNext called with no candidates");
    }

    auto probs = selectionProbabilities(current, candidates, learner);
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    double draw = dist(rng_);

    double cumulative = 0.0;
    for (size_t i = 0; i < candidates.size(); i++) {
        cumulative += probs[i];
        if (cumulative >= draw) return candidates[i];
    }
    // Rounding left the last bucket short of the draw
    return candidates.front();
}

// ─── Construction ──────────────────────────────────────────────

ModulePath PathOptimizer::constructPath(const LearnerProfile& learner,
                                        const std::string& target) {
    graph_.requireModule(target);

    const std::string origin = learner.currentModule().value_or(target);
    graph_.requireModule(origin);

    ModulePath path;
    if (origin == target || learner.isCompleted(target)) return path;

    std::set<std::string> visited;
    std::string current = origin;

    while (static_cast<int>(path.size()) < config_.max_path_length) {
        std::vector<std::string> candidates;
        for (auto& id : learner.availableModules(graph_, visited)) {
            if (!visited.count(id)) candidates.push_back(std::move(id));
        }
        if (candidates.empty()) break;

        std::string next = selectNext(current, candidates, learner);
        path.push_back(next);
        visited.insert(next);
        current = next;

        if (current == target) break;
    }
    return path;
}

// ─── Evaluation ────────────────────────────────────────────────

double PathOptimizer::evaluatePath(const ModulePath& path,
                                   const LearnerProfile& learner) const {
    if (path.empty()) return 0.0;

    const double efficiency = 1.0 / (1.0 + 0.1 * static_cast<double>(path.size()));
    double running_skill = learner.skillLevel();
    double total = 0.0;

    for (const auto& id : path) {
        const Module& module = graph_.requireModule(id);

        double skill = skillMatch(module.difficulty, running_skill);

        double prereq = 1.0;
        if (module.hasPrerequisites()) {
            size_t met = std::count_if(module.prerequisites.begin(), module.prerequisites.end(),
                [&](const std::string& p) { return learner.isCompleted(p); });
            prereq = static_cast<double>(met) / module.prerequisites.size();
        }

        total += 0.5 * skill + 0.2 * efficiency + 0.3 * prereq;
        running_skill = std::min(kMaxSkill, running_skill + 0.2);
    }

    return total / static_cast<double>(path.size());
}

double PathOptimizer::score(const ModulePath& path, const LearnerProfile& learner) const {
    return scorer_ ? scorer_(path, learner) : evaluatePath(path, learner);
}

// ─── Pheromone update ──────────────────────────────────────────

std::vector<std::pair<std::string, std::string>>
PathOptimizer::pathEdges(const std::string& origin, const ModulePath& path) {
    std::vector<std::pair<std::string, std::string>> edges;
    if (path.empty()) return edges;

    std::string prev = origin;
    for (const auto& id : path) {
        if (id != prev) edges.emplace_back(prev, id);
        prev = id;
    }
    return edges;
}

void PathOptimizer::updatePheromones(const std::string& origin, const ModulePath& path,
                                     double path_score) {
    trails_.evaporateAll(config_.evaporation_rate);

    double deposit = path_score * config_.reinforcement_factor;
    for (const auto& [from, to] : pathEdges(origin, path)) {
        if (PheromoneTrail* trail = trails_.find(from, to)) {
            trail->reinforce(deposit);
        }
    }
}

// ─── Optimization loop ─────────────────────────────────────────

OptimizationResult PathOptimizer::optimize(const LearnerProfile& learner,
                                           const std::string& target,
                                           int iterations) {
    graph_.requireModule(target);
    const std::string origin = learner.currentModule().value_or(target);
    graph_.requireModule(origin);

    OptimizationResult result;

    for (int i = 0; i < iterations; i++) {
        try {
            ModulePath path = constructPath(learner, target);
            double path_score = score(path, learner);

            if (!path.empty()) {
                result.paths_generated++;
                if (result.best_found_at_iteration < 0 || path_score > result.score) {
                    result.score = path_score;
                    result.path = path;
                    result.best_found_at_iteration = i;
                }
            }

            updatePheromones(origin, path, path_score);
        } catch (const std::exception& e) {
            result.failed_iterations++;
            EDUPATH_LOG_WARN("optimizer", "Iteration " << i << " for learner '"
                             << learner.id() << "' failed: " << e.what());
        }
        result.iterations_run++;
        result.best_score_history.push_back(result.score);
    }

    result.reached_target = !result.path.empty() && result.path.back() == target;

    // Converged: the best score gained no more than the threshold over
    // the second half of the run.
    if (!result.path.empty() && result.iterations_run >= 2) {
        double midway = result.best_score_history[result.iterations_run / 2 - 1];
        result.converged = (result.score - midway) <= config_.convergence_threshold;
    }

    EDUPATH_LOG_DEBUG("optimizer", "Learner '" << learner.id() << "' -> '" << target
                      << "': best score " << result.score << " over "
                      << result.iterations_run << " iterations, path length "
                      << result.path.size());
    return result;
}

} // namespace edupath
