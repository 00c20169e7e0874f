#pragma once

#include <optional>
#include <string>
#include <variant>

namespace edupath {

/// Kind of goal a learner can set. The payload type is fixed per kind:
///   TargetModule     → std::string (module id)
///   TargetSkill      → double      (skill level 1..10)
///   WeeklyMinutes    → int         (minutes of study per week)
///   CompleteCategory → std::string (module category)
enum class GoalKind { TargetModule, TargetSkill, WeeklyMinutes, CompleteCategory };

using GoalValue = std::variant<std::string, double, int>;

struct LearningGoal {
    GoalKind kind = GoalKind::TargetModule;
    GoalValue value;

    static LearningGoal targetModule(std::string module_id) {
        return {GoalKind::TargetModule, GoalValue(std::move(module_id))};
    }
    static LearningGoal targetSkill(double skill) {
        return {GoalKind::TargetSkill, GoalValue(skill)};
    }
    static LearningGoal weeklyMinutes(int minutes) {
        return {GoalKind::WeeklyMinutes, GoalValue(minutes)};
    }
    static LearningGoal completeCategory(std::string category) {
        return {GoalKind::CompleteCategory, GoalValue(std::move(category))};
    }

    /// True when the payload type matches the kind.
    bool wellFormed() const;
};

inline bool LearningGoal::wellFormed() const {
    switch (kind) {
        case GoalKind::TargetModule:
        case GoalKind::CompleteCategory:
            return std::holds_alternative<std::string>(value);
        case GoalKind::TargetSkill:
            return std::holds_alternative<double>(value);
        case GoalKind::WeeklyMinutes:
            return std::holds_alternative<int>(value);
    }
    return false;
}

/// Fixed set of learner preferences. Unset fields mean "no preference".
struct LearnerPreferences {
    std::optional<int> max_session_time;   // minutes
    std::optional<int> sessions_per_week;
};

} // namespace edupath
