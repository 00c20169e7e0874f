#include "colony/colony.hpp"
#include "util/log.hpp"

#include <stdexcept>

namespace edupath {

namespace {

std::mt19937 seededEngine(const ColonyConfig& config) {
    if (config.random_seed) return std::mt19937(*config.random_seed);
    std::random_device rd;
    return std::mt19937(rd());
}

} // namespace

Colony::Colony(ModuleGraph graph, ColonyConfig config)
    : graph_(std::move(graph)), config_(std::move(config)) {
    if (graph_.empty()) {
        throw std::invalid_argument("Colony requires at least one module");
    }
    graph_.validate();
    config_.validate();
    trails_ = TrailStore(graph_);
    rng_ = seededEngine(config_);

    EDUPATH_LOG_INFO("colony", "Initialized with " << graph_.moduleCount() << " modules, "
                     << trails_.size() << " trails");
}

LearnerProfile& Colony::createLearner(const std::string& learner_id, LearningStyle style,
                                      double skill_level) {
    if (learners_.count(learner_id)) {
        throw std::invalid_argument("Learner already exists: " + learner_id);
    }
    auto [it, _] = learners_.emplace(learner_id, LearnerProfile(learner_id, style, skill_level));
    return it->second;
}

LearnerProfile* Colony::getLearner(const std::string& learner_id) {
    auto it = learners_.find(learner_id);
    return it != learners_.end() ? &it->second : nullptr;
}

const LearnerProfile* Colony::getLearner(const std::string& learner_id) const {
    auto it = learners_.find(learner_id);
    return it != learners_.end() ? &it->second : nullptr;
}

LearnerProfile& Colony::requireLearner(const std::string& learner_id) {
    LearnerProfile* learner = getLearner(learner_id);
    if (!learner) {
        throw std::out_of_range("Learner not found: " + learner_id);
    }
    return *learner;
}

const PerformanceRecord& Colony::recordProgress(const ProgressEvent& event) {
    graph_.requireModule(event.module_id);

    LearnerProfile* learner = getLearner(event.learner_id);
    std::optional<std::string> previous;

    if (learner) {
        previous = learner->currentModule();
        learner->recordPerformance(event.module_id, event.score, event.completion_time,
                                   event.attempts_needed, event.success);
    } else {
        // Join the roster only once the event has been accepted
        LearnerProfile fresh(event.learner_id);
        fresh.recordPerformance(event.module_id, event.score, event.completion_time,
                                event.attempts_needed, event.success);
        learner = &learners_.emplace(event.learner_id, std::move(fresh)).first->second;
    }
    const PerformanceRecord& record = learner->performanceHistory().back();

    if (previous && *previous != event.module_id && record.success) {
        if (PheromoneTrail* trail = trails_.find(*previous, event.module_id)) {
            trail->recordTraversal(event.score, event.completion_time, record.success);
        } else {
            EDUPATH_LOG_WARN("colony", "No trail for '" << *previous << "' -> '"
                             << event.module_id << "', traversal not recorded");
        }
    }

    stats_.total_learning_events++;
    EDUPATH_LOG_DEBUG("colony", "Learner '" << learner->id() << "' scored " << event.score
                      << " on '" << event.module_id << "', skill now "
                      << learner->skillLevel());
    return record;
}

OptimizationResult Colony::optimize(const std::string& learner_id, const std::string& target,
                                    std::optional<int> iterations) {
    const LearnerProfile& learner = requireLearner(learner_id);
    graph_.requireModule(target);

    int budget = iterations.value_or(config_.max_iterations);
    if (budget < 1) {
        throw std::invalid_argument("Iteration count must be at least 1");
    }

    PathOptimizer optimizer(graph_, trails_, config_, rng_);
    if (scorer_) optimizer.setScorer(scorer_);

    OptimizationResult result = optimizer.optimize(learner, target, budget);

    stats_.optimization_runs++;
    stats_.total_paths_generated += result.paths_generated;

    if (result.empty()) {
        EDUPATH_LOG_INFO("colony", "No route from learner '" << learner_id
                         << "' to '" << target << "'");
    }
    return result;
}

std::optional<ModulePath> Colony::recommendPath(const std::string& learner_id,
                                                const std::string& target,
                                                std::optional<int> iterations) {
    OptimizationResult result = optimize(learner_id, target, iterations);
    if (result.empty()) return std::nullopt;
    return std::move(result.path);
}

} // namespace edupath
