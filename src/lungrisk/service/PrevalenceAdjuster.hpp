#pragma once

#include <optional>

#include "lungrisk/math/Probability.hpp"

namespace lungrisk::service {

inline bool canAdjust(std::optional<double> piTrain, std::optional<double> piDeploy) {
    return piTrain && piDeploy && isValidPrior(*piTrain) && isValidPrior(*piDeploy);
}

// Re-expresses p, calibrated under piTrain, as the probability under piDeploy by scaling its odds
// with the prior odds ratio. Returns p untouched when either prior is missing or outside (0, 1).
inline double adjustPrior(double p, std::optional<double> piTrain, std::optional<double> piDeploy) {
    if (!canAdjust(piTrain, piDeploy)) return p;
    const double q = clipProbability(p);
    const double priorRatio = odds(*piDeploy) / odds(*piTrain);
    const double adjustedOdds = odds(q) * priorRatio;
    return clipProbability(adjustedOdds / (1.0 + adjustedOdds));
}

} // namespace lungrisk::service
