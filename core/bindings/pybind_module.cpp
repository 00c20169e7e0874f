// PyBind11 bindings for the EDUPATH core.
// Exposes the module graph, trails, learners, config, colony and analytics.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "graph/module.hpp"
#include "graph/module_graph.hpp"
#include "graph/graph_loader.hpp"
#include "pheromone/pheromone_trail.hpp"
#include "pheromone/trail_store.hpp"
#include "learner/learner_profile.hpp"
#include "colony/colony_config.hpp"
#include "colony/attractiveness.hpp"
#include "colony/path_optimizer.hpp"
#include "colony/colony.hpp"
#include "analytics/colony_analytics.hpp"
#include "util/log.hpp"

namespace py = pybind11;

PYBIND11_MODULE(edupath_bindings, m) {
    m.doc() = "EDUPATH C++ Core Bindings";

    // ── Logging ──
    py::enum_<edupath::LogLevel>(m, "LogLevel")
        .value("DEBUG", edupath::LogLevel::Debug)
        .value("INFO", edupath::LogLevel::Info)
        .value("WARN", edupath::LogLevel::Warn)
        .value("ERROR", edupath::LogLevel::Error);
    m.def("set_log_level", &edupath::setLogLevel);

    // ── Module ──
    py::class_<edupath::Module>(m, "Module")
        .def(py::init<>())
        .def(py::init<std::string, std::string, int, int>())
        .def_readwrite("id", &edupath::Module::id)
        .def_readwrite("title", &edupath::Module::title)
        .def_readwrite("difficulty", &edupath::Module::difficulty)
        .def_readwrite("estimated_time", &edupath::Module::estimated_time)
        .def_readwrite("prerequisites", &edupath::Module::prerequisites)
        .def_readwrite("tags", &edupath::Module::tags)
        .def_readwrite("learning_objectives", &edupath::Module::learning_objectives)
        .def_readwrite("category", &edupath::Module::category)
        .def("has_tag", &edupath::Module::hasTag);

    // ── ModuleGraph ──
    py::class_<edupath::ModuleGraph>(m, "ModuleGraph")
        .def(py::init<>())
        .def("add_module", &edupath::ModuleGraph::addModule)
        .def("validate", &edupath::ModuleGraph::validate)
        .def("get_module", &edupath::ModuleGraph::getModule,
             py::return_value_policy::reference_internal)
        .def("has_module", &edupath::ModuleGraph::hasModule)
        .def("get_module_ids", &edupath::ModuleGraph::getModuleIds)
        .def("get_dependents", &edupath::ModuleGraph::getDependents)
        .def("module_count", &edupath::ModuleGraph::moduleCount)
        .def_static("default_catalog", &edupath::ModuleGraph::defaultCatalog);

    m.def("load_module_graph", &edupath::loadModuleGraphOrDefault, py::arg("path"));
    m.def("parse_module_graph",
          py::overload_cast<const std::string&>(&edupath::parseModuleGraph),
          py::arg("text"));

    // ── PheromoneTrail ──
    py::class_<edupath::PheromoneTrail>(m, "PheromoneTrail")
        .def(py::init<std::string, std::string, double>(),
             py::arg("from_module"), py::arg("to_module"),
             py::arg("level") = edupath::kInitialPheromone)
        .def_readonly("from_module", &edupath::PheromoneTrail::from_module)
        .def_readonly("to_module", &edupath::PheromoneTrail::to_module)
        .def_readonly("pheromone_level", &edupath::PheromoneTrail::pheromone_level)
        .def_readonly("traversal_count", &edupath::PheromoneTrail::traversal_count)
        .def_readonly("success_rate", &edupath::PheromoneTrail::success_rate)
        .def_readonly("total_score", &edupath::PheromoneTrail::total_score)
        .def_readonly("average_completion_time",
                      &edupath::PheromoneTrail::average_completion_time)
        .def("evaporate", &edupath::PheromoneTrail::evaporate)
        .def("reinforce", &edupath::PheromoneTrail::reinforce)
        .def("record_traversal", &edupath::PheromoneTrail::recordTraversal)
        .def("trail_strength", &edupath::PheromoneTrail::trailStrength)
        .def("average_score", &edupath::PheromoneTrail::averageScore);

    py::class_<edupath::TrailStore>(m, "TrailStore")
        .def("find", py::overload_cast<const std::string&, const std::string&>(
                 &edupath::TrailStore::find, py::const_),
             py::return_value_policy::reference_internal)
        .def("trail_keys", &edupath::TrailStore::trailKeys)
        .def("size", &edupath::TrailStore::size);

    // ── Learner ──
    py::enum_<edupath::LearningStyle>(m, "LearningStyle")
        .value("VISUAL", edupath::LearningStyle::Visual)
        .value("PRACTICAL", edupath::LearningStyle::Practical)
        .value("THEORETICAL", edupath::LearningStyle::Theoretical)
        .value("MIXED", edupath::LearningStyle::Mixed);

    py::class_<edupath::LearnerPreferences>(m, "LearnerPreferences")
        .def(py::init<>())
        .def_readwrite("max_session_time", &edupath::LearnerPreferences::max_session_time)
        .def_readwrite("sessions_per_week", &edupath::LearnerPreferences::sessions_per_week);

    py::class_<edupath::PerformanceRecord>(m, "PerformanceRecord")
        .def_readonly("module_id", &edupath::PerformanceRecord::module_id)
        .def_readonly("score", &edupath::PerformanceRecord::score)
        .def_readonly("completion_time", &edupath::PerformanceRecord::completion_time)
        .def_readonly("attempts_needed", &edupath::PerformanceRecord::attempts_needed)
        .def_readonly("success", &edupath::PerformanceRecord::success)
        .def_readonly("skill_at_time", &edupath::PerformanceRecord::skill_at_time);

    py::class_<edupath::LearnerProfile>(m, "LearnerProfile")
        .def(py::init<std::string, edupath::LearningStyle, double>(),
             py::arg("learner_id"),
             py::arg("style") = edupath::LearningStyle::Mixed,
             py::arg("skill_level") = edupath::kMinSkill)
        .def_property_readonly("id", &edupath::LearnerProfile::id)
        .def_property_readonly("current_module", &edupath::LearnerProfile::currentModule)
        .def_property_readonly("skill_level", &edupath::LearnerProfile::skillLevel)
        .def_property_readonly("learning_style", &edupath::LearnerProfile::learningStyle)
        .def_property_readonly("completed_modules", &edupath::LearnerProfile::completedModules)
        .def_property_readonly("performance_history",
                               &edupath::LearnerProfile::performanceHistory)
        .def("set_current_module", &edupath::LearnerProfile::setCurrentModule)
        .def("mark_completed", &edupath::LearnerProfile::markCompleted)
        .def("set_max_session_time", [](edupath::LearnerProfile& self, int minutes) {
            self.preferences().max_session_time = minutes;
        })
        .def("record_performance", &edupath::LearnerProfile::recordPerformance,
             py::arg("module_id"), py::arg("score"), py::arg("completion_time"),
             py::arg("attempts") = 1, py::arg("success") = py::none(),
             py::return_value_policy::copy)
        .def("available_modules",
             py::overload_cast<const edupath::ModuleGraph&>(
                 &edupath::LearnerProfile::availableModules, py::const_))
        .def("recommended_difficulty", &edupath::LearnerProfile::recommendedDifficulty);

    // ── ColonyConfig ──
    py::class_<edupath::ColonyConfig>(m, "ColonyConfig")
        .def(py::init<>())
        .def_readwrite("alpha", &edupath::ColonyConfig::alpha)
        .def_readwrite("beta", &edupath::ColonyConfig::beta)
        .def_readwrite("evaporation_rate", &edupath::ColonyConfig::evaporation_rate)
        .def_readwrite("reinforcement_factor", &edupath::ColonyConfig::reinforcement_factor)
        .def_readwrite("max_iterations", &edupath::ColonyConfig::max_iterations)
        .def_readwrite("convergence_threshold", &edupath::ColonyConfig::convergence_threshold)
        .def_readwrite("max_path_length", &edupath::ColonyConfig::max_path_length)
        .def_readwrite("random_seed", &edupath::ColonyConfig::random_seed)
        .def("validate", &edupath::ColonyConfig::validate);

    m.def("load_colony_config", &edupath::loadColonyConfigOrDefault, py::arg("path"));
    m.def("attractiveness", &edupath::attractiveness);

    // ── OptimizationResult ──
    py::class_<edupath::OptimizationResult>(m, "OptimizationResult")
        .def(py::init<>())
        .def_readwrite("path", &edupath::OptimizationResult::path)
        .def_readwrite("score", &edupath::OptimizationResult::score)
        .def_readwrite("reached_target", &edupath::OptimizationResult::reached_target)
        .def_readwrite("iterations_run", &edupath::OptimizationResult::iterations_run)
        .def_readwrite("failed_iterations", &edupath::OptimizationResult::failed_iterations)
        .def_readwrite("paths_generated", &edupath::OptimizationResult::paths_generated)
        .def_readwrite("best_found_at_iteration",
                       &edupath::OptimizationResult::best_found_at_iteration)
        .def_readwrite("converged", &edupath::OptimizationResult::converged)
        .def("empty", &edupath::OptimizationResult::empty);

    // ── Colony ──
    py::class_<edupath::ProgressEvent>(m, "ProgressEvent")
        .def(py::init<>())
        .def_readwrite("learner_id", &edupath::ProgressEvent::learner_id)
        .def_readwrite("module_id", &edupath::ProgressEvent::module_id)
        .def_readwrite("score", &edupath::ProgressEvent::score)
        .def_readwrite("completion_time", &edupath::ProgressEvent::completion_time)
        .def_readwrite("attempts_needed", &edupath::ProgressEvent::attempts_needed)
        .def_readwrite("success", &edupath::ProgressEvent::success);

    py::class_<edupath::ColonyStats>(m, "ColonyStats")
        .def_readonly("total_paths_generated", &edupath::ColonyStats::total_paths_generated)
        .def_readonly("total_learning_events", &edupath::ColonyStats::total_learning_events)
        .def_readonly("optimization_runs", &edupath::ColonyStats::optimization_runs);

    py::class_<edupath::Colony>(m, "Colony")
        .def(py::init<edupath::ModuleGraph, edupath::ColonyConfig>(),
             py::arg("graph"), py::arg("config") = edupath::ColonyConfig{})
        .def("create_learner", &edupath::Colony::createLearner,
             py::arg("learner_id"), py::arg("style") = edupath::LearningStyle::Mixed,
             py::arg("skill_level") = edupath::kMinSkill,
             py::return_value_policy::reference_internal)
        .def("get_learner",
             py::overload_cast<const std::string&>(&edupath::Colony::getLearner),
             py::return_value_policy::reference_internal)
        .def("record_progress", &edupath::Colony::recordProgress,
             py::return_value_policy::copy)
        .def("optimize", &edupath::Colony::optimize,
             py::arg("learner_id"), py::arg("target"), py::arg("iterations") = py::none())
        .def("recommend_path", &edupath::Colony::recommendPath,
             py::arg("learner_id"), py::arg("target"), py::arg("iterations") = py::none())
        .def("set_scorer", &edupath::Colony::setScorer)
        .def_property_readonly("graph", &edupath::Colony::graph,
                               py::return_value_policy::reference_internal)
        .def_property_readonly("trails", &edupath::Colony::trails,
                               py::return_value_policy::reference_internal)
        .def_property_readonly("stats", &edupath::Colony::stats,
                               py::return_value_policy::reference_internal)
        .def("learner_count", &edupath::Colony::learnerCount);

    // ── Analytics ──
    py::class_<edupath::TrailStatistics>(m, "TrailStatistics")
        .def_readonly("total_trails", &edupath::TrailStatistics::total_trails)
        .def_readonly("traversed_trails", &edupath::TrailStatistics::traversed_trails)
        .def_readonly("average_pheromone", &edupath::TrailStatistics::average_pheromone)
        .def_readonly("max_pheromone", &edupath::TrailStatistics::max_pheromone)
        .def_readonly("min_pheromone", &edupath::TrailStatistics::min_pheromone)
        .def_readonly("average_success_rate", &edupath::TrailStatistics::average_success_rate);

    m.def("trail_statistics", &edupath::trailStatistics);
    m.def("strongest_trails", &edupath::strongestTrails, py::arg("trails"), py::arg("n") = 10);
    m.def("path_strength", &edupath::pathStrength);
}
