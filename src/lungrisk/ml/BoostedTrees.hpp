#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <numeric>
#include <utility>
#include <vector>

#include "lungrisk/math/Probability.hpp"
#include "lungrisk/ml/Dataset.hpp"

namespace lungrisk::ml {

struct BoostParams {
    int rounds;            // number of trees
    int maxDepth;          // depth of each regression tree
    double learningRate;   // eta, shrinks every leaf
    double lambda;         // L2 penalty on leaf values
    double gamma;          // minimum gain for a split
    double minChildWeight; // minimum hessian sum per child
    double scalePosWeight; // weight of positive rows, negatives weigh 1
};

inline BoostParams defaultBoostParams() {
    return BoostParams{.rounds = 300, .maxDepth = 4, .learningRate = 0.05, .lambda = 1.0,
                       .gamma = 0.0, .minChildWeight = 1.0, .scalePosWeight = 1.0};
}

// x[feature] < threshold goes left. Leaves have left == right == -1.
struct TreeNode {
    int feature{-1};
    double threshold{0.0};
    int left{-1};
    int right{-1};
    double value{0.0};

    bool leaf() const { return left < 0 && right < 0; }
};

struct RegressionTree {
    std::vector<TreeNode> nodes;

    double predict(const FeatureVector& x) const {
        if (nodes.empty()) return 0.0;
        int i = 0;
        while (!nodes[i].leaf()) {
            const auto& nd = nodes[i];
            i = (x[nd.feature] < nd.threshold) ? nd.left : nd.right;
        }
        return nodes[i].value;
    }
};

// Second-order gradient boosting on the logistic loss
class BoostedTreeClassifier {
public:
    BoostedTreeClassifier() = default;
    explicit BoostedTreeClassifier(std::vector<RegressionTree> trees) : trees_(std::move(trees)) {}

    void train(const std::vector<DataPoint>& dataset, const BoostParams& hp) {
        trees_.clear();
        if (dataset.empty()) return;
        const int n = static_cast<int>(dataset.size());
        const int dim = static_cast<int>(dataset.front().features.size());

        // Rows sorted by each feature once; nodes filter by membership
        sorted_.assign(dim, std::vector<int>(n));
        for (int f = 0; f < dim; ++f) {
            auto& order = sorted_[f];
            std::iota(order.begin(), order.end(), 0);
            std::stable_sort(order.begin(), order.end(), [&](int a, int b) {
                return dataset[a].features[f] < dataset[b].features[f];
            });
        }

        std::vector<double> margin(n, 0.0);
        grad_.assign(n, 0.0);
        hess_.assign(n, 0.0);
        member_.assign(n, 0);
        std::vector<int> all(n);
        std::iota(all.begin(), all.end(), 0);

        trees_.reserve(static_cast<size_t>(hp.rounds));
        for (int round = 0; round < hp.rounds; ++round) {
            for (int r = 0; r < n; ++r) {
                const double p = sigmoid(margin[r]);
                const double w = dataset[r].label == 1 ? hp.scalePosWeight : 1.0;
                grad_[r] = w * (p - static_cast<double>(dataset[r].label));
                hess_[r] = std::max(w * p * (1.0 - p), 1e-16);
            }
            RegressionTree tree;
            grow(dataset, all, 0, hp, tree);
            for (int r = 0; r < n; ++r) margin[r] += tree.predict(dataset[r].features);
            trees_.push_back(std::move(tree));
        }
        sorted_.clear();
        grad_.clear();
        hess_.clear();
        member_.clear();
    }

    double decisionFunction(const FeatureVector& x) const {
        double m = 0.0;
        for (const auto& t : trees_) m += t.predict(x);
        return m;
    }

    double probability(const FeatureVector& x) const { return sigmoid(decisionFunction(x)); }

    const std::vector<RegressionTree>& trees() const { return trees_; }

private:
    int grow(const std::vector<DataPoint>& data, const std::vector<int>& rows, int depth,
             const BoostParams& hp, RegressionTree& tree) {
        double G = 0.0, H = 0.0;
        for (int r : rows) { G += grad_[r]; H += hess_[r]; }

        const int idx = static_cast<int>(tree.nodes.size());
        tree.nodes.push_back(TreeNode{});
        tree.nodes[idx].value = -hp.learningRate * G / (H + hp.lambda);
        if (depth >= hp.maxDepth || rows.size() < 2) return idx;

        for (int r : rows) member_[r] = 1;
        const double parentScore = G * G / (H + hp.lambda);
        double bestGain = 0.0;
        int bestFeature = -1;
        double bestThreshold = 0.0;
        for (int f = 0; f < static_cast<int>(sorted_.size()); ++f) {
            double GL = 0.0, HL = 0.0;
            int prev = -1;
            for (int r : sorted_[f]) {
                if (!member_[r]) continue;
                if (prev >= 0) {
                    const double a = data[prev].features[f];
                    const double b = data[r].features[f];
                    const double GR = G - GL, HR = H - HL;
                    if (a < b && HL >= hp.minChildWeight && HR >= hp.minChildWeight) {
                        const double gain = 0.5 * (GL * GL / (HL + hp.lambda) + GR * GR / (HR + hp.lambda) - parentScore) - hp.gamma;
                        if (gain > bestGain) {
                            bestGain = gain;
                            bestFeature = f;
                            bestThreshold = 0.5 * (a + b);
                        }
                    }
                }
                GL += grad_[r];
                HL += hess_[r];
                prev = r;
            }
        }
        for (int r : rows) member_[r] = 0;
        if (bestFeature < 0) return idx;

        std::vector<int> left, right;
        left.reserve(rows.size());
        right.reserve(rows.size());
        for (int r : rows) {
            if (data[r].features[bestFeature] < bestThreshold) left.push_back(r);
            else right.push_back(r);
        }
        tree.nodes[idx].feature = bestFeature;
        tree.nodes[idx].threshold = bestThreshold;
        tree.nodes[idx].value = 0.0;
        const int l = grow(data, left, depth + 1, hp, tree);
        const int r = grow(data, right, depth + 1, hp, tree);
        tree.nodes[idx].left = l;
        tree.nodes[idx].right = r;
        return idx;
    }

    std::vector<RegressionTree> trees_;

    // Scratch state, only alive during train()
    std::vector<std::vector<int>> sorted_;
    std::vector<double> grad_;
    std::vector<double> hess_;
    std::vector<char> member_;
};

} // namespace lungrisk::ml
