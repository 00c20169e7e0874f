#pragma once

#include "graph/module_graph.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace edupath {

/// Builds a ModuleGraph from a definition document of the form
///   { "modules": { "<id>": { "title": ..., "difficulty": 1..5,
///       "estimatedTime": minutes, "prerequisites": [...], "tags": [...],
///       "learningObjectives": [...], "category": ... } } }
/// Throws std::runtime_error (or std::invalid_argument from ModuleGraph)
/// on malformed input.
ModuleGraph parseModuleGraph(const nlohmann::json& doc);

/// Same as parseModuleGraph, from JSON text.
ModuleGraph parseModuleGraph(const std::string& text);

/// Reads `path`. A missing, unreadable or malformed file is not fatal:
/// a warning is logged and the built-in catalog is returned instead.
ModuleGraph loadModuleGraphOrDefault(const std::string& path);

} // namespace edupath
