#pragma once

#include "learner/learning_goal.hpp"
#include "graph/module_graph.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace edupath {

constexpr double kMinSkill = 1.0;
constexpr double kMaxSkill = 10.0;
constexpr double kPassingScore = 70.0;

enum class LearningStyle { Visual, Practical, Theoretical, Mixed };

const char* toString(LearningStyle style);
/// Case-insensitive. Returns std::nullopt for unknown names.
std::optional<LearningStyle> parseLearningStyle(const std::string& name);

struct PerformanceRecord {
    std::string module_id;
    double score = 0.0;          // 0..100
    int completion_time = 0;     // minutes
    int attempts_needed = 1;
    bool success = false;        // score >= 70
    std::chrono::system_clock::time_point timestamp;
    double skill_at_time = kMinSkill;  // skill level before this attempt
};

// ─── LearnerProfile ────────────────────────────────────────────
// The "ant": per-learner state consumed by the optimizer to bias
// module choice. History and completed set are append-only.

class LearnerProfile {
public:
    LearnerProfile() = default;
    explicit LearnerProfile(std::string learner_id,
                            LearningStyle style = LearningStyle::Mixed,
                            double skill_level = kMinSkill);

    const std::string& id() const { return learner_id_; }

    const std::optional<std::string>& currentModule() const { return current_module_; }
    void setCurrentModule(std::string module_id) { current_module_ = std::move(module_id); }

    double skillLevel() const { return skill_level_; }
    LearningStyle learningStyle() const { return learning_style_; }
    void setLearningStyle(LearningStyle style) { learning_style_ = style; }

    const std::set<std::string>& completedModules() const { return completed_; }
    bool isCompleted(const std::string& module_id) const { return completed_.count(module_id) > 0; }
    /// Returns false if already completed.
    bool markCompleted(const std::string& module_id);

    const std::vector<PerformanceRecord>& performanceHistory() const { return history_; }

    const std::map<GoalKind, LearningGoal>& learningGoals() const { return goals_; }
    /// Throws std::invalid_argument when the payload does not match the kind.
    void setGoal(const LearningGoal& goal);

    const LearnerPreferences& preferences() const { return preferences_; }
    LearnerPreferences& preferences() { return preferences_; }

    /// Appends a record and drifts the skill level:
    ///   success: skill += max(0, (score − 70) / 300)
    ///   failure: skill −= 0.05
    /// clamped to [1, 10] and rounded to two decimals. Success is score ≥ 70
    /// unless `success` overrides it; the record, the completion and the
    /// drift all follow the same flag. Marks the module as current, and as
    /// completed on success. Throws std::invalid_argument for score outside
    /// [0,100], negative time or attempts < 1, leaving the profile untouched.
    const PerformanceRecord& recordPerformance(const std::string& module_id, double score,
                                               int completion_time, int attempts = 1,
                                               std::optional<bool> success = std::nullopt);

    /// Not-yet-completed modules whose prerequisites are all completed.
    std::vector<std::string> availableModules(const ModuleGraph& graph) const;

    /// As above, treating `also_completed` as completed too. Used to walk
    /// a hypothetical path without touching the profile.
    std::vector<std::string> availableModules(const ModuleGraph& graph,
                                              const std::set<std::string>& also_completed) const;

    /// Difficulty to aim for next, from the last five records: one above
    /// floor(skill) after a strong run, one below after a weak one. The
    /// result is always clamped to the module range 1..5, so a skill above
    /// 5 recommends 5 rather than floor(skill).
    int recommendedDifficulty() const;

    /// Mean score of the last `n` records; std::nullopt with no history.
    std::optional<double> recentAverageScore(size_t n) const;

    double overallSuccessRate() const;

private:
    std::string learner_id_;
    std::optional<std::string> current_module_;
    double skill_level_ = kMinSkill;
    LearningStyle learning_style_ = LearningStyle::Mixed;
    std::set<std::string> completed_;
    std::vector<PerformanceRecord> history_;
    std::map<GoalKind, LearningGoal> goals_;
    LearnerPreferences preferences_;
};

} // namespace edupath
