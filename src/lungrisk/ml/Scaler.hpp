#pragma once

#include <Eigen/Dense>
#include <string>
#include <vector>

#include "lungrisk/math/Probability.hpp"

namespace lungrisk::ml {

// Standardizes the numeric subset of a feature vector; other entries pass through.
struct FeatureScaler {
    std::vector<std::string> columns; // numeric column names, persisted
    std::vector<int> indices;         // their positions in FeatureOrder
    Eigen::VectorXd mean;
    Eigen::VectorXd std;
    bool fitted{false};

    void fit(const std::vector<FeatureVector>& features,
             const std::vector<std::string>& columnNames,
             const std::vector<int>& columnIndices) {
        columns = columnNames;
        indices = columnIndices;
        const int dim = static_cast<int>(indices.size());
        if (features.empty()) { fitted = false; return; }
        mean = Eigen::VectorXd::Zero(dim);
        std = Eigen::VectorXd::Zero(dim);
        for (const auto& x : features) {
            for (int j = 0; j < dim; ++j) mean[j] += x[indices[j]];
        }
        mean /= static_cast<double>(features.size());
        for (const auto& x : features) {
            for (int j = 0; j < dim; ++j) {
                const double diff = x[indices[j]] - mean[j];
                std[j] += diff * diff;
            }
        }
        std = (std / static_cast<double>(features.size())).array().sqrt();
        // Constant columns map to 0
        for (int j = 0; j < dim; ++j) {
            if (std[j] < 1e-12) std[j] = 1.0;
        }
        fitted = true;
    }

    FeatureVector transform(const FeatureVector& x) const {
        if (!fitted) return x;
        FeatureVector out = x;
        for (size_t j = 0; j < indices.size(); ++j) {
            const auto jj = static_cast<Eigen::Index>(j);
            out[indices[j]] = (x[indices[j]] - mean[jj]) / std[jj];
        }
        return out;
    }
};

} // namespace lungrisk::ml
