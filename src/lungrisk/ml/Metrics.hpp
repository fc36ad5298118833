#pragma once

#include <algorithm>
#include <limits>
#include <numeric>
#include <vector>

namespace lungrisk::ml {

// Probability that a random positive outranks a random negative; ties count one half
inline double rocAuc(const std::vector<double>& scores, const std::vector<int>& labels) {
    const size_t n = scores.size();
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), size_t{0});
    std::sort(order.begin(), order.end(), [&](size_t a, size_t b) { return scores[a] < scores[b]; });

    double rankSumPos = 0.0;
    double pos = 0.0;
    size_t i = 0;
    while (i < n) {
        size_t j = i;
        while (j + 1 < n && scores[order[j + 1]] == scores[order[i]]) ++j;
        const double avgRank = 0.5 * static_cast<double>(i + j) + 1.0;
        for (size_t k = i; k <= j; ++k) {
            if (labels[order[k]] == 1) { rankSumPos += avgRank; pos += 1.0; }
        }
        i = j + 1;
    }
    const double neg = static_cast<double>(n) - pos;
    if (pos == 0.0 || neg == 0.0) return std::numeric_limits<double>::quiet_NaN();
    return (rankSumPos - pos * (pos + 1.0) / 2.0) / (pos * neg);
}

// Test-split performance of one training run
struct EvaluationSummary {
    double rocAuc{0.0};
    double prAuc{0.0};
    double brier{0.0};
    double threshold{0.5}; // F1-optimal operating point
    double f1{0.0};
    double precision{0.0};
    double recall{0.0};
    double accuracy{0.0};
    int testRows{0};
};

// One point of the precision-recall curve at "score >= threshold"
struct PrPoint {
    double threshold;
    double precision;
    double recall;
    double f1;
};

// Descending thresholds, one per distinct score
inline std::vector<PrPoint> precisionRecallCurve(const std::vector<double>& scores, const std::vector<int>& labels) {
    const size_t n = scores.size();
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), size_t{0});
    std::sort(order.begin(), order.end(), [&](size_t a, size_t b) { return scores[a] > scores[b]; });

    double totalPos = 0.0;
    for (int y : labels) totalPos += (y == 1) ? 1.0 : 0.0;

    std::vector<PrPoint> curve;
    double tp = 0.0, fp = 0.0;
    for (size_t k = 0; k < n; ++k) {
        if (labels[order[k]] == 1) tp += 1.0; else fp += 1.0;
        if (k + 1 < n && scores[order[k + 1]] == scores[order[k]]) continue;
        const double precision = tp / (tp + fp);
        const double recall = totalPos > 0.0 ? tp / totalPos : 0.0;
        const double f1 = (precision + recall) > 0.0 ? 2.0 * precision * recall / (precision + recall) : 0.0;
        curve.push_back(PrPoint{scores[order[k]], precision, recall, f1});
    }
    return curve;
}

// Step-wise area under the PR curve
inline double averagePrecision(const std::vector<double>& scores, const std::vector<int>& labels) {
    double ap = 0.0, prevRecall = 0.0;
    for (const auto& pt : precisionRecallCurve(scores, labels)) {
        ap += (pt.recall - prevRecall) * pt.precision;
        prevRecall = pt.recall;
    }
    return ap;
}

inline double brierScore(const std::vector<double>& probs, const std::vector<int>& labels) {
    if (probs.empty()) return 0.0;
    double s = 0.0;
    for (size_t i = 0; i < probs.size(); ++i) {
        const double d = probs[i] - (labels[i] == 1 ? 1.0 : 0.0);
        s += d * d;
    }
    return s / static_cast<double>(probs.size());
}

inline PrPoint bestF1Threshold(const std::vector<double>& scores, const std::vector<int>& labels) {
    PrPoint best{0.5, 0.0, 0.0, 0.0};
    for (const auto& pt : precisionRecallCurve(scores, labels)) {
        if (pt.f1 > best.f1) best = pt;
    }
    return best;
}

inline double accuracyAt(const std::vector<double>& scores, const std::vector<int>& labels, double threshold) {
    if (scores.empty()) return 0.0;
    int correct = 0;
    for (size_t i = 0; i < scores.size(); ++i) {
        const int pred = scores[i] >= threshold ? 1 : 0;
        if (pred == labels[i]) ++correct;
    }
    return static_cast<double>(correct) / static_cast<double>(scores.size());
}

} // namespace lungrisk::ml
