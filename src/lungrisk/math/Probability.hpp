#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>

namespace lungrisk {

// Feature vector in FeatureOrder; always finite
using FeatureVector = Eigen::VectorXd;

// Probabilities never reach 0 or 1 once they leave the classifier
inline constexpr double kProbabilityEpsilon = 1e-12;

inline double clipProbability(double p) {
    if (std::isnan(p)) return 0.5;
    return std::clamp(p, kProbabilityEpsilon, 1.0 - kProbabilityEpsilon);
}

inline double odds(double p) { return p / (1.0 - p); }

inline double sigmoid(double z) { return 1.0 / (1.0 + std::exp(-z)); }

// A prior is usable only strictly inside (0, 1)
inline bool isValidPrior(double pi) {
    return std::isfinite(pi) && pi > 0.0 && pi < 1.0;
}

} // namespace lungrisk
