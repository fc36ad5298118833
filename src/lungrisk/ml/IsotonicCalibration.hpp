#pragma once

#include <algorithm>
#include <numeric>
#include <vector>

namespace lungrisk::ml {

// Monotone map from classifier score to P(y=1), fitted by pool-adjacent-violators.
// Keeps the first and last score of every pooled block; interpolates linearly between them.
struct IsotonicCalibrator {
    std::vector<double> x;
    std::vector<double> y;
    bool fitted{false};

    void fit(const std::vector<double>& scores, const std::vector<int>& labels) {
        x.clear(); y.clear();
        if (scores.empty() || scores.size() != labels.size()) { fitted = false; return; }

        std::vector<size_t> order(scores.size());
        std::iota(order.begin(), order.end(), size_t{0});
        std::sort(order.begin(), order.end(), [&](size_t a, size_t b) { return scores[a] < scores[b]; });

        struct Block { double sumY; double weight; double xMin; double xMax; };
        std::vector<Block> blocks;
        blocks.reserve(scores.size());
        for (size_t k : order) {
            const double s = scores[k];
            const double t = labels[k] > 0 ? 1.0 : 0.0;
            // Equal scores always share one block
            if (!blocks.empty() && blocks.back().xMax == s) {
                blocks.back().sumY += t;
                blocks.back().weight += 1.0;
            } else {
                blocks.push_back(Block{t, 1.0, s, s});
            }
            while (blocks.size() > 1) {
                Block& cur = blocks.back();
                Block& prev = blocks[blocks.size() - 2];
                if (prev.sumY / prev.weight <= cur.sumY / cur.weight) break;
                prev.sumY += cur.sumY;
                prev.weight += cur.weight;
                prev.xMax = cur.xMax;
                blocks.pop_back();
            }
        }

        for (const auto& b : blocks) {
            const double v = std::clamp(b.sumY / b.weight, 0.0, 1.0);
            x.push_back(b.xMin); y.push_back(v);
            if (b.xMax > b.xMin) { x.push_back(b.xMax); y.push_back(v); }
        }
        fitted = true;
    }

    double probability(double score) const {
        if (!fitted || x.empty()) return std::clamp(score, 0.0, 1.0);
        if (score <= x.front()) return y.front();
        if (score >= x.back()) return y.back();
        auto it = std::upper_bound(x.begin(), x.end(), score);
        const size_t hi = static_cast<size_t>(it - x.begin());
        const size_t lo = hi - 1;
        const double t = (score - x[lo]) / (x[hi] - x[lo]);
        return y[lo] + t * (y[hi] - y[lo]);
    }
};

} // namespace lungrisk::ml
