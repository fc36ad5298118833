#pragma once

#include <algorithm>
#include <cmath>
#include <random>
#include <vector>

#include "lungrisk/ml/Dataset.hpp"

namespace lungrisk::ml {

struct TrainTestSplit {
    std::vector<DataPoint> train;
    std::vector<DataPoint> test;
};

// Per-class shuffle so both halves keep the overall positive rate
inline TrainTestSplit stratifiedSplit(const std::vector<DataPoint>& data, double testRatio = 0.2, unsigned int seed = 42u) {
    std::vector<size_t> byClass[2];
    for (size_t i = 0; i < data.size(); ++i) byClass[data[i].label == 1 ? 1 : 0].push_back(i);

    std::mt19937 rng(seed);
    TrainTestSplit out;
    for (auto& rows : byClass) {
        std::shuffle(rows.begin(), rows.end(), rng);
        const size_t testCount = static_cast<size_t>(std::llround(testRatio * static_cast<double>(rows.size())));
        for (size_t k = 0; k < rows.size(); ++k) {
            (k < testCount ? out.test : out.train).push_back(data[rows[k]]);
        }
    }
    return out;
}

// Fold id for every row; each class is dealt round-robin across the folds after shuffling
inline std::vector<int> stratifiedFolds(const std::vector<DataPoint>& data, int folds, unsigned int seed = 42u) {
    std::vector<int> assignment(data.size(), 0);
    if (folds < 2) return assignment;
    std::vector<size_t> byClass[2];
    for (size_t i = 0; i < data.size(); ++i) byClass[data[i].label == 1 ? 1 : 0].push_back(i);

    std::mt19937 rng(seed);
    const size_t k = static_cast<size_t>(folds);
    size_t next = 0; // positives continue the deal where negatives stopped
    for (auto& rows : byClass) {
        std::shuffle(rows.begin(), rows.end(), rng);
        for (size_t i = 0; i < rows.size(); ++i) {
            assignment[rows[i]] = static_cast<int>((next + i) % k);
        }
        next = (next + rows.size()) % k;
    }
    return assignment;
}

} // namespace lungrisk::ml
