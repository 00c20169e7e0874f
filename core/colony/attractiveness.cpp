#include "colony/attractiveness.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <initializer_list>
#include <string>

namespace edupath {

namespace {

std::string lowercase(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool titleMentions(const Module& m, std::initializer_list<const char*> terms) {
    std::string title = lowercase(m.title);
    for (const char* term : terms) {
        if (title.find(term) != std::string::npos) return true;
    }
    return false;
}

bool isVisual(const Module& m) {
    return m.hasTag("Visual") || titleMentions(m, {"gui", "interface", "visual", "graphic"});
}

bool isHandsOn(const Module& m) {
    return m.hasTag("Hands-on") || m.hasTag("Practical") ||
           titleMentions(m, {"exercise", "project", "practice", "lab", "workshop"});
}

bool isTheoryTitled(const Module& m) {
    return titleMentions(m, {"theory", "concept", "principle", "fundamental"});
}

} // namespace

double skillMatch(int difficulty, double skill) {
    return std::max(0.1, 1.0 - std::abs(difficulty - skill) / 5.0);
}

double styleMatch(const Module& module, LearningStyle style) {
    switch (style) {
        case LearningStyle::Visual:
            return isVisual(module) ? 1.2 : 0.8;
        case LearningStyle::Practical:
            if (isHandsOn(module)) return 1.3;
            if (isTheoryTitled(module)) return 0.7;
            return 1.0;
        case LearningStyle::Theoretical:
            if (isTheoryTitled(module) || module.hasTag("Theory")) return 1.3;
            if (isHandsOn(module)) return 0.7;
            return 1.0;
        case LearningStyle::Mixed:
            return 1.0;
    }
    return 1.0;
}

double timeFit(const Module& module, const LearnerPreferences& prefs) {
    if (!prefs.max_session_time) return 1.0;
    return module.estimated_time <= *prefs.max_session_time ? 1.2 : 0.8;
}

double performanceModifier(const LearnerProfile& learner) {
    auto recent = learner.recentAverageScore(3);
    if (!recent) return 1.0;
    if (*recent > 80.0) return 1.1;
    if (*recent < 60.0) return 0.9;
    return 1.0;
}

double attractiveness(const Module& module, const LearnerProfile& learner) {
    return 0.4 * skillMatch(module.difficulty, learner.skillLevel()) +
           0.2 * styleMatch(module, learner.learningStyle()) +
           0.2 * timeFit(module, learner.preferences()) +
           0.2 * performanceModifier(learner);
}

} // namespace edupath
