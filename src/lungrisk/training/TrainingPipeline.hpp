#pragma once

#include <filesystem>
#include <vector>

#include "lungrisk/core/Config.hpp"
#include "lungrisk/features/FeatureEncoder.hpp"
#include "lungrisk/ml/Dataset.hpp"
#include "lungrisk/ml/Metrics.hpp"
#include "lungrisk/training/CsvTable.hpp"

namespace lungrisk::training {

struct TrainingReport {
    ml::ClassCounts all;
    ml::ClassCounts train;
    ml::ClassCounts test;
    int droppedRows{0};
    double piTrain{0.0};
    double scalePosWeight{1.0};
    ml::EvaluationSummary evaluation;
    std::filesystem::path artifactDir;
};

// Offline batch job:
//   LoadData -> ValidateColumns -> EncodeLabelsAndFeatures -> SplitTrainTest -> FitScaler
//   -> FitCalibratedClassifier -> Evaluate -> PersistArtifacts
// Runs to completion or throws on the first fatal error (SchemaError, ArtifactError).
class TrainingPipeline {
public:
    explicit TrainingPipeline(TrainingConfig config, features::FeatureSchema schema = features::lungCancerSchema());

    TrainingReport run() const;

    CsvTable loadData() const;
    void validateColumns(const CsvTable& table) const;
    std::vector<ml::DataPoint> encode(const CsvTable& table, int& droppedRows) const;

private:
    TrainingConfig config_;
    features::FeatureSchema schema_;
    features::FeatureEncoder encoder_;
};

} // namespace lungrisk::training
