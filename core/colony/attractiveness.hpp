#pragma once

#include "graph/module.hpp"
#include "learner/learner_profile.hpp"

namespace edupath {

// ─── Attractiveness ────────────────────────────────────────────
// Learner-specific desirability of a module, independent of pheromone:
//   A = 0.4·skillMatch + 0.2·styleMatch + 0.2·timeFit + 0.2·performanceModifier

/// max(0.1, 1 − |difficulty − skill| / 5)
double skillMatch(int difficulty, double skill);

/// Heuristic table over learning style × module tags/title.
double styleMatch(const Module& module, LearningStyle style);

/// 1.2 if the module fits the preferred session time, 0.8 if not,
/// 1.0 without a preference.
double timeFit(const Module& module, const LearnerPreferences& prefs);

/// From the mean of the last three scores: >80 → 1.1, <60 → 0.9, else 1.0.
double performanceModifier(const LearnerProfile& learner);

double attractiveness(const Module& module, const LearnerProfile& learner);

} // namespace edupath
