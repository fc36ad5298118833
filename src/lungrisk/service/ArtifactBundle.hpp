#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "lungrisk/features/FeatureSchema.hpp"
#include "lungrisk/ml/CalibratedClassifier.hpp"
#include "lungrisk/ml/Metrics.hpp"
#include "lungrisk/ml/Scaler.hpp"

namespace lungrisk::service {

inline constexpr const char* kScalerFile = "scaler.json";
inline constexpr const char* kModelFile = "model.json";
inline constexpr const char* kMetaFile = "meta.json";
inline constexpr int kFormatVersion = 1;

// Everything that determines serving behavior for one model version
struct ArtifactBundle {
    ml::FeatureScaler scaler;
    ml::CalibratedClassifier model;
    features::FeatureSchema schema;
    std::optional<double> piTrain;
    std::string calibrationMethod{ml::kCalibrationMethod};
    std::string modelFamily{ml::kModelFamily};
    std::string trainingDataSource;
    std::optional<ml::EvaluationSummary> evaluation;

    // Throws ArtifactError when scaler, model and schema disagree
    void validate() const;
};

// Throws ArtifactError naming the missing files when scaler.json or model.json is absent
ArtifactBundle loadArtifacts(const std::filesystem::path& dir);

void saveArtifacts(const ArtifactBundle& bundle, const std::filesystem::path& dir);

} // namespace lungrisk::service
