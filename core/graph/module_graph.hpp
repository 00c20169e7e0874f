#pragma once

#include "graph/module.hpp"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace edupath {

// ─── ModuleGraph ───────────────────────────────────────────────
// Static id → Module mapping. Prerequisites are the implicit edges.
// Loaded once before a colony is built and read-only afterwards.
// Ordered map so that module iteration order is stable across runs.

class ModuleGraph {
public:
    ModuleGraph() = default;

    /// Throws std::invalid_argument on duplicate id, difficulty outside
    /// 1..5, non-positive estimated time or a self-prerequisite.
    void addModule(Module module);

    /// Throws std::runtime_error if any prerequisite is not a known module.
    void validate() const;

    const Module* getModule(const std::string& id) const;
    /// Throws std::out_of_range for unknown ids.
    const Module& requireModule(const std::string& id) const;
    bool hasModule(const std::string& id) const { return modules_.count(id) > 0; }

    std::vector<std::string> getModuleIds() const;
    size_t moduleCount() const { return modules_.size(); }
    bool empty() const { return modules_.empty(); }

    /// Modules that list `id` as a prerequisite.
    std::vector<std::string> getDependents(const std::string& id) const;

    void forEachModule(const std::function<void(const Module&)>& fn) const;

    /// Built-in eight-module programming curriculum.
    static ModuleGraph defaultCatalog();

private:
    std::map<std::string, Module> modules_;
};

} // namespace edupath
