#pragma once

#include <filesystem>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "lungrisk/features/FeatureSchema.hpp"
#include "lungrisk/ml/CalibratedClassifier.hpp"
#include "lungrisk/service/ArtifactBundle.hpp"

namespace lungrisk::testing {

// Schema with the short request names used by the end-to-end scenarios
inline features::FeatureSchema shortSchema() {
    features::FeatureSchema s;
    s.order = {"age", "pack_years", "gender", "radon", "asbestos", "secondhand", "copd", "alcohol", "family_history"};
    s.numericCols = {"age", "pack_years"};
    for (const auto& name : s.binaryCols()) s.binaryMeaning[name] = features::BinaryMeaning{};
    return s;
}

inline ml::FeatureScaler fixedScaler(const features::FeatureSchema& schema) {
    ml::FeatureScaler sc;
    sc.columns = schema.numericCols;
    sc.indices = schema.numericIndices();
    sc.mean = Eigen::Vector2d(50.0, 20.0);
    sc.std = Eigen::Vector2d(10.0, 15.0);
    sc.fitted = true;
    return sc;
}

// A classifier that returns positives/total for every input: no trees, and an
// isotonic map fitted on one pooled score
inline ml::CalibratedClassifier constantClassifier(const std::vector<std::string>& featureNames, int positives, int total) {
    ml::CalibratedFold fold;
    std::vector<double> scores(static_cast<size_t>(total), 0.5);
    std::vector<int> labels(static_cast<size_t>(total), 0);
    for (int i = 0; i < positives; ++i) labels[static_cast<size_t>(i)] = 1;
    fold.calibrator.fit(scores, labels);
    return ml::CalibratedClassifier(featureNames, {fold});
}

inline service::ArtifactBundle constantBundle(int positives, int total, std::optional<double> piTrain) {
    service::ArtifactBundle b;
    b.schema = shortSchema();
    b.scaler = fixedScaler(b.schema);
    b.model = constantClassifier(b.schema.order, positives, total);
    b.piTrain = piTrain;
    b.trainingDataSource = "unit-test";
    return b;
}

// Rows whose label follows pack_years and copd, in the default lung schema order
inline std::vector<ml::DataPoint> syntheticLungData(int n, unsigned int seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> age(30.0, 80.0);
    std::uniform_real_distribution<double> pack(0.0, 60.0);
    std::bernoulli_distribution coin(0.4);
    std::uniform_real_distribution<double> u(0.0, 1.0);
    std::vector<ml::DataPoint> out;
    out.reserve(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        FeatureVector x(9);
        x << age(rng), pack(rng), coin(rng), coin(rng), coin(rng), coin(rng), coin(rng), coin(rng), coin(rng);
        const double logit = -2.0 + 0.1 * (x[1] - 30.0) + 2.0 * x[6];
        const int label = u(rng) < sigmoid(logit) ? 1 : 0;
        out.push_back(ml::DataPoint{x, label});
    }
    return out;
}

// Fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& tag) {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = "lungrisk_" + tag;
        if (info != nullptr) name += std::string("_") + info->test_suite_name() + "_" + info->name();
        path_ = std::filesystem::temp_directory_path() / name;
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace lungrisk::testing
