#pragma once

#include <set>
#include <string>
#include <utility>
#include <vector>

namespace edupath {

/// A learning module in the curriculum graph.
/// Immutable once the owning ModuleGraph is built.
struct Module {
    std::string id;
    std::string title;
    int difficulty = 1;             // 1..5
    int estimated_time = 30;        // minutes, > 0
    std::set<std::string> prerequisites;
    std::set<std::string> tags;
    std::vector<std::string> learning_objectives;
    std::string category;

    Module() = default;
    Module(std::string id, std::string title, int difficulty, int estimated_time)
        : id(std::move(id)), title(std::move(title)),
          difficulty(difficulty), estimated_time(estimated_time) {}

    bool hasTag(const std::string& tag) const {
        return tags.count(tag) > 0;
    }

    bool hasPrerequisites() const { return !prerequisites.empty(); }
};

} // namespace edupath
