#include "graph/module_graph.hpp"

#include <stdexcept>

namespace edupath {

void ModuleGraph::addModule(Module module) {
    if (module.id.empty()) {
        throw std::invalid_argument("Module id must not be empty");
    }
    if (modules_.count(module.id)) {
        throw std::invalid_argument("Module already exists: " + module.id);
    }
    if (module.difficulty < 1 || module.difficulty > 5) {
        throw std::invalid_argument("Module difficulty out of range [1,5]: " + module.id);
    }
    if (module.estimated_time <= 0) {
        throw std::invalid_argument("Module estimated time must be positive: " + module.id);
    }
    if (module.prerequisites.count(module.id)) {
        throw std::invalid_argument("Module lists itself as prerequisite: " + module.id);
    }
    std::string id = module.id;
    modules_.emplace(std::move(id), std::move(module));
}

void ModuleGraph::validate() const {
    for (const auto& [id, module] : modules_) {
        for (const auto& prereq : module.prerequisites) {
            if (!modules_.count(prereq)) {
                throw std::runtime_error("Unknown prerequisite '" + prereq +
                                         "' for module '" + id + "'");
            }
        }
    }
}

const Module* ModuleGraph::getModule(const std::string& id) const {
    auto it = modules_.find(id);
    return it != modules_.end() ? &it->second : nullptr;
}

const Module& ModuleGraph::requireModule(const std::string& id) const {
    auto it = modules_.find(id);
    if (it == modules_.end()) {
        throw std::out_of_range("Module not found: " + id);
    }
    return it->second;
}

std::vector<std::string> ModuleGraph::getModuleIds() const {
    std::vector<std::string> ids;
    ids.reserve(modules_.size());
    for (const auto& [id, _] : modules_) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<std::string> ModuleGraph::getDependents(const std::string& id) const {
    std::vector<std::string> dependents;
    for (const auto& [other_id, module] : modules_) {
        if (module.prerequisites.count(id)) {
            dependents.push_back(other_id);
        }
    }
    return dependents;
}

void ModuleGraph::forEachModule(const std::function<void(const Module&)>& fn) const {
    for (const auto& [_, module] : modules_) {
        fn(module);
    }
}

// ─── Default catalog ───────────────────────────────────────────

namespace {

Module makeModule(const std::string& id, const std::string& title, int difficulty,
                  int minutes, std::set<std::string> prereqs,
                  std::set<std::string> tags, std::vector<std::string> objectives,
                  const std::string& category) {
    Module m(id, title, difficulty, minutes);
    m.prerequisites = std::move(prereqs);
    m.tags = std::move(tags);
    m.learning_objectives = std::move(objectives);
    m.category = category;
    return m;
}

} // namespace

ModuleGraph ModuleGraph::defaultCatalog() {
    ModuleGraph g;
    g.addModule(makeModule("intro_programming", "Introduction to Programming", 1, 60,
                           {}, {"Fundamentals", "Theory"},
                           {"Understand what a program is", "Write a first program"},
                           "fundamentals"));
    g.addModule(makeModule("variables_types", "Variables and Data Types", 1, 45,
                           {"intro_programming"}, {"Fundamentals", "Hands-on"},
                           {"Declare variables", "Choose appropriate types"},
                           "fundamentals"));
    g.addModule(makeModule("control_flow", "Control Flow Exercises", 2, 60,
                           {"variables_types"}, {"Fundamentals", "Hands-on"},
                           {"Use conditionals", "Write loops"},
                           "fundamentals"));
    g.addModule(makeModule("functions", "Functions and Scope", 2, 75,
                           {"control_flow"}, {"Fundamentals"},
                           {"Define functions", "Reason about scope"},
                           "fundamentals"));
    g.addModule(makeModule("data_structures", "Data Structures Theory", 3, 90,
                           {"functions"}, {"Theory"},
                           {"Compare arrays, lists and maps", "Analyse complexity"},
                           "computer_science"));
    g.addModule(makeModule("oop_basics", "Object-Oriented Programming", 3, 90,
                           {"functions"}, {"Design"},
                           {"Model with classes", "Apply encapsulation"},
                           "design"));
    g.addModule(makeModule("gui_development", "GUI Interface Development", 4, 120,
                           {"oop_basics"}, {"Visual", "Hands-on"},
                           {"Build a windowed application", "Handle UI events"},
                           "applications"));
    g.addModule(makeModule("algorithms", "Algorithms Project", 5, 150,
                           {"data_structures", "oop_basics"}, {"Hands-on", "Theory"},
                           {"Implement sorting and searching", "Design efficient solutions"},
                           "computer_science"));
    g.validate();
    return g;
}

} // namespace edupath
