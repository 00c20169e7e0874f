#include "colony/colony_config.hpp"
#include "util/log.hpp"

#include <fstream>
#include <stdexcept>

namespace edupath {

void ColonyConfig::validate() const {
    if (alpha < 0.0) throw std::invalid_argument("alpha must be non-negative");
    if (beta < 0.0) throw std::invalid_argument("beta must be non-negative");
    if (evaporation_rate < 0.0 || evaporation_rate > 1.0)
        throw std::invalid_argument("evaporationRate must be within [0,1]");
    if (reinforcement_factor < 0.0)
        throw std::invalid_argument("reinforcementFactor must be non-negative");
    if (max_iterations < 1) throw std::invalid_argument("maxIterations must be at least 1");
    if (convergence_threshold < 0.0)
        throw std::invalid_argument("convergenceThreshold must be non-negative");
    if (max_path_length < 1) throw std::invalid_argument("maxPathLength must be at least 1");
}

ColonyConfig PartialColonyConfig::resolve() const {
    ColonyConfig c;
    if (alpha) c.alpha = *alpha;
    if (beta) c.beta = *beta;
    if (evaporation_rate) c.evaporation_rate = *evaporation_rate;
    if (reinforcement_factor) c.reinforcement_factor = *reinforcement_factor;
    if (max_iterations) c.max_iterations = *max_iterations;
    if (convergence_threshold) c.convergence_threshold = *convergence_threshold;
    if (max_path_length) c.max_path_length = *max_path_length;
    if (random_seed) c.random_seed = random_seed;
    return c;
}

namespace {

template <typename T>
void readField(const nlohmann::json& doc, const char* key, std::optional<T>& out) {
    auto it = doc.find(key);
    if (it != doc.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

} // namespace

PartialColonyConfig PartialColonyConfig::fromJson(const nlohmann::json& doc) {
    PartialColonyConfig p;
    if (!doc.is_object()) return p;
    readField(doc, "alpha", p.alpha);
    readField(doc, "beta", p.beta);
    readField(doc, "evaporationRate", p.evaporation_rate);
    readField(doc, "reinforcementFactor", p.reinforcement_factor);
    readField(doc, "maxIterations", p.max_iterations);
    readField(doc, "convergenceThreshold", p.convergence_threshold);
    readField(doc, "maxPathLength", p.max_path_length);
    readField(doc, "randomSeed", p.random_seed);
    return p;
}

ColonyConfig loadColonyConfigOrDefault(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        EDUPATH_LOG_WARN("config", "Config file '" << path << "' not found, using defaults");
        return ColonyConfig{};
    }
    try {
        ColonyConfig config = PartialColonyConfig::fromJson(nlohmann::json::parse(in)).resolve();
        config.validate();
        return config;
    } catch (const std::exception& e) {
        EDUPATH_LOG_WARN("config", "Invalid config '" << path << "': " << e.what()
                         << "; using defaults");
        return ColonyConfig{};
    }
}

} // namespace edupath
