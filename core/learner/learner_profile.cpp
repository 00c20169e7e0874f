#include "learner/learner_profile.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace edupath {

const char* toString(LearningStyle style) {
    switch (style) {
        case LearningStyle::Visual:      return "visual";
        case LearningStyle::Practical:   return "practical";
        case LearningStyle::Theoretical: return "theoretical";
        case LearningStyle::Mixed:       return "mixed";
    }
    return "mixed";
}

std::optional<LearningStyle> parseLearningStyle(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "visual") return LearningStyle::Visual;
    if (lower == "practical") return LearningStyle::Practical;
    if (lower == "theoretical") return LearningStyle::Theoretical;
    if (lower == "mixed") return LearningStyle::Mixed;
    return std::nullopt;
}

LearnerProfile::LearnerProfile(std::string learner_id, LearningStyle style, double skill_level)
    : learner_id_(std::move(learner_id)),
      skill_level_(std::clamp(skill_level, kMinSkill, kMaxSkill)),
      learning_style_(style) {
    if (learner_id_.empty()) {
        throw std::invalid_argument("Learner id must not be empty");
    }
}

bool LearnerProfile::markCompleted(const std::string& module_id) {
    return completed_.insert(module_id).second;
}

void LearnerProfile::setGoal(const LearningGoal& goal) {
    if (!goal.wellFormed()) {
        throw std::invalid_argument("Learning goal payload does not match its kind");
    }
    goals_[goal.kind] = goal;
}

const PerformanceRecord& LearnerProfile::recordPerformance(const std::string& module_id,
                                                           double score,
                                                           int completion_time,
                                                           int attempts,
                                                           std::optional<bool> success) {
    if (score < 0.0 || score > 100.0) {
        throw std::invalid_argument("Score must be within [0,100]");
    }
    if (completion_time < 0) {
        throw std::invalid_argument("Completion time must not be negative");
    }
    if (attempts < 1) {
        throw std::invalid_argument("Attempts must be at least 1");
    }

    PerformanceRecord record;
    record.module_id = module_id;
    record.score = score;
    record.completion_time = completion_time;
    record.attempts_needed = attempts;
    record.success = success.value_or(score >= kPassingScore);
    record.timestamp = std::chrono::system_clock::now();
    record.skill_at_time = skill_level_;

    double skill = skill_level_;
    if (record.success) {
        skill += std::max(0.0, (score - kPassingScore) / 300.0);
    } else {
        skill -= 0.05;
    }
    skill = std::clamp(skill, kMinSkill, kMaxSkill);
    skill_level_ = std::round(skill * 100.0) / 100.0;

    current_module_ = module_id;
    if (record.success) {
        completed_.insert(module_id);
    }

    history_.push_back(std::move(record));
    return history_.back();
}

std::vector<std::string> LearnerProfile::availableModules(const ModuleGraph& graph) const {
    return availableModules(graph, {});
}

std::vector<std::string> LearnerProfile::availableModules(
    const ModuleGraph& graph, const std::set<std::string>& also_completed) const {
    auto done = [&](const std::string& id) {
        return completed_.count(id) > 0 || also_completed.count(id) > 0;
    };
    std::vector<std::string> available;
    graph.forEachModule([&](const Module& m) {
        if (done(m.id)) return;
        bool unlocked = std::all_of(m.prerequisites.begin(), m.prerequisites.end(), done);
        if (unlocked) available.push_back(m.id);
    });
    return available;
}

int LearnerProfile::recommendedDifficulty() const {
    int base = static_cast<int>(std::floor(skill_level_));
    int recommended = base;

    if (!history_.empty()) {
        size_t window = std::min<size_t>(5, history_.size());
        double score_sum = 0.0;
        int successes = 0;
        for (size_t i = history_.size() - window; i < history_.size(); i++) {
            score_sum += history_[i].score;
            if (history_[i].success) successes++;
        }
        double avg = score_sum / window;
        double rate = static_cast<double>(successes) / window;

        if (avg > 85.0 && rate > 0.8) {
            recommended = std::min(base + 1, 5);
        } else if (avg < 70.0 || rate < 0.5) {
            recommended = std::max(base - 1, 1);
        }
    }
    return std::clamp(recommended, 1, 5);
}

std::optional<double> LearnerProfile::recentAverageScore(size_t n) const {
    if (history_.empty() || n == 0) return std::nullopt;
    size_t window = std::min(n, history_.size());
    double sum = 0.0;
    for (size_t i = history_.size() - window; i < history_.size(); i++) {
        sum += history_[i].score;
    }
    return sum / window;
}

double LearnerProfile::overallSuccessRate() const {
    if (history_.empty()) return 0.0;
    auto successes = std::count_if(history_.begin(), history_.end(),
                                   [](const PerformanceRecord& r) { return r.success; });
    return static_cast<double>(successes) / history_.size();
}

} // namespace edupath
