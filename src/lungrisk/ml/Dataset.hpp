#pragma once

#include <vector>

#include "lungrisk/math/Probability.hpp"

namespace lungrisk::ml {

struct DataPoint {
    FeatureVector features;
    int label; // 1 positive, 0 negative
};

struct ClassCounts {
    int positive{0};
    int negative{0};

    int total() const { return positive + negative; }
    double positiveRate() const { return total() > 0 ? static_cast<double>(positive) / total() : 0.0; }
};

inline ClassCounts countClasses(const std::vector<DataPoint>& data) {
    ClassCounts c;
    for (const auto& dp : data) {
        if (dp.label == 1) ++c.positive; else ++c.negative;
    }
    return c;
}

} // namespace lungrisk::ml
