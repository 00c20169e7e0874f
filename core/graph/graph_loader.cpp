#include "graph/graph_loader.hpp"
#include "util/log.hpp"

#include <fstream>
#include <stdexcept>

namespace edupath {

namespace {

std::set<std::string> stringSet(const nlohmann::json& obj, const char* key) {
    std::set<std::string> out;
    if (!obj.contains(key)) return out;
    for (const auto& v : obj.at(key)) {
        out.insert(v.get<std::string>());
    }
    return out;
}

} // namespace

ModuleGraph parseModuleGraph(const nlohmann::json& doc) {
    if (!doc.is_object() || !doc.contains("modules") || !doc.at("modules").is_object()) {
        throw std::runtime_error("Module definition must contain a \"modules\" object");
    }

    ModuleGraph graph;
    const nlohmann::json& modules = doc.at("modules");
    for (auto it = modules.begin(); it != modules.end(); ++it) {
        const std::string& id = it.key();
        const nlohmann::json& def = it.value();
        if (!def.is_object()) {
            throw std::runtime_error("Module definition is not an object: " + id);
        }
        Module m;
        m.id = id;
        m.title = def.value("title", id);
        m.difficulty = def.at("difficulty").get<int>();
        m.estimated_time = def.at("estimatedTime").get<int>();
        m.prerequisites = stringSet(def, "prerequisites");
        m.tags = stringSet(def, "tags");
        if (def.contains("learningObjectives")) {
            m.learning_objectives =
                def.at("learningObjectives").get<std::vector<std::string>>();
        }
        m.category = def.value("category", std::string());
        graph.addModule(std::move(m));
    }
    if (graph.empty()) {
        throw std::runtime_error("Module definition contains no modules");
    }
    graph.validate();
    return graph;
}

ModuleGraph parseModuleGraph(const std::string& text) {
    return parseModuleGraph(nlohmann::json::parse(text));
}

ModuleGraph loadModuleGraphOrDefault(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        EDUPATH_LOG_WARN("graph", "Module definitions not found at '" << path
                         << "', using built-in catalog");
        return ModuleGraph::defaultCatalog();
    }
    try {
        nlohmann::json doc = nlohmann::json::parse(in);
        ModuleGraph graph = parseModuleGraph(doc);
        EDUPATH_LOG_INFO("graph", "Loaded " << graph.moduleCount()
                         << " modules from '" << path << "'");
        return graph;
    } catch (const std::exception& e) {
        EDUPATH_LOG_WARN("graph", "Malformed module definitions in '" << path
                         << "': " << e.what() << "; using built-in catalog");
        return ModuleGraph::defaultCatalog();
    }
}

} // namespace edupath
