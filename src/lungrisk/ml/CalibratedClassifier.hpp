#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "lungrisk/math/Probability.hpp"
#include "lungrisk/ml/BoostedTrees.hpp"
#include "lungrisk/ml/Dataset.hpp"
#include "lungrisk/ml/IsotonicCalibration.hpp"
#include "lungrisk/ml/TrainUtils.hpp"

namespace lungrisk::ml {

inline constexpr const char* kCalibrationMethod = "isotonic";
inline constexpr const char* kModelFamily = "GradientBoostedTrees";

// Base ensemble fitted without one fold, calibrated on that fold
struct CalibratedFold {
    BoostedTreeClassifier base;
    IsotonicCalibrator calibrator;
};

class CalibratedClassifier {
public:
    CalibratedClassifier() = default;
    CalibratedClassifier(std::vector<std::string> featureNames, std::vector<CalibratedFold> folds)
        : featureNames_(std::move(featureNames)), folds_(std::move(folds)) {}

    // Out-of-fold isotonic calibration over `folds` stratified folds
    void fit(const std::vector<DataPoint>& train, std::vector<std::string> featureNames,
             const BoostParams& hp, int folds, unsigned int seed) {
        if (folds < 2) throw std::invalid_argument("calibration needs at least 2 folds");
        featureNames_ = std::move(featureNames);
        folds_.clear();
        const std::vector<int> assignment = stratifiedFolds(train, folds, seed);
        for (int k = 0; k < folds; ++k) {
            std::vector<DataPoint> fitPart, heldOut;
            for (size_t i = 0; i < train.size(); ++i) {
                (assignment[i] == k ? heldOut : fitPart).push_back(train[i]);
            }
            CalibratedFold fold;
            fold.base.train(fitPart, hp);
            std::vector<double> scores;
            std::vector<int> labels;
            scores.reserve(heldOut.size());
            labels.reserve(heldOut.size());
            for (const auto& dp : heldOut) {
                scores.push_back(fold.base.probability(dp.features));
                labels.push_back(dp.label);
            }
            fold.calibrator.fit(scores, labels);
            folds_.push_back(std::move(fold));
        }
    }

    // Mean of the fold-wise calibrated probabilities, clipped to (eps, 1 - eps)
    double predictProbability(const FeatureVector& x) const {
        if (folds_.empty()) return 0.5;
        double sum = 0.0;
        for (const auto& f : folds_) sum += f.calibrator.probability(f.base.probability(x));
        return clipProbability(sum / static_cast<double>(folds_.size()));
    }

    const std::vector<std::string>& featureNames() const { return featureNames_; }
    const std::vector<CalibratedFold>& folds() const { return folds_; }

private:
    std::vector<std::string> featureNames_;
    std::vector<CalibratedFold> folds_;
};

} // namespace lungrisk::ml
