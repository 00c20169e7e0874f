#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace edupath {

/// Optimizer parameters.
struct ColonyConfig {
    double alpha = 1.0;                   // pheromone exponent
    double beta = 2.0;                    // attractiveness exponent
    double evaporation_rate = 0.1;        // fraction lost per iteration, [0,1]
    double reinforcement_factor = 1.0;    // deposit = path score × factor
    int max_iterations = 100;             // default iteration budget per run
    double convergence_threshold = 0.001; // best-score gain that still counts as progress
    int max_path_length = 10;
    std::optional<uint32_t> random_seed;  // unset → seeded from std::random_device

    /// Throws std::invalid_argument describing the first bad field.
    void validate() const;
};

/// Config as supplied by a provider: any field may be missing.
struct PartialColonyConfig {
    std::optional<double> alpha;
    std::optional<double> beta;
    std::optional<double> evaporation_rate;
    std::optional<double> reinforcement_factor;
    std::optional<int> max_iterations;
    std::optional<double> convergence_threshold;
    std::optional<int> max_path_length;
    std::optional<uint32_t> random_seed;

    /// Missing fields take their ColonyConfig defaults.
    ColonyConfig resolve() const;

    /// Reads camelCase keys (alpha, beta, evaporationRate,
    /// reinforcementFactor, maxIterations, convergenceThreshold,
    /// maxPathLength, randomSeed). Unknown keys are ignored.
    /// Throws nlohmann::json::exception on wrongly typed values.
    static PartialColonyConfig fromJson(const nlohmann::json& doc);
};

/// Loads a JSON config file. Missing file, parse errors and invalid
/// values fall back to defaults with a warning.
ColonyConfig loadColonyConfigOrDefault(const std::string& path);

} // namespace edupath
