#include "lungrisk/training/TrainingPipeline.hpp"

#include <algorithm>
#include <fstream>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "lungrisk/core/Errors.hpp"
#include "lungrisk/ml/CalibratedClassifier.hpp"
#include "lungrisk/ml/Scaler.hpp"
#include "lungrisk/ml/TrainUtils.hpp"
#include "lungrisk/service/ArtifactBundle.hpp"

namespace lungrisk::training {

namespace {

ml::EvaluationSummary evaluate(const ml::CalibratedClassifier& model, const std::vector<ml::DataPoint>& test) {
    std::vector<double> probs;
    std::vector<int> labels;
    probs.reserve(test.size());
    labels.reserve(test.size());
    for (const auto& dp : test) {
        probs.push_back(model.predictProbability(dp.features));
        labels.push_back(dp.label);
    }
    ml::EvaluationSummary e;
    e.testRows = static_cast<int>(test.size());
    e.rocAuc = ml::rocAuc(probs, labels);
    e.prAuc = ml::averagePrecision(probs, labels);
    e.brier = ml::brierScore(probs, labels);
    const ml::PrPoint best = ml::bestF1Threshold(probs, labels);
    e.threshold = best.threshold;
    e.f1 = best.f1;
    e.precision = best.precision;
    e.recall = best.recall;
    e.accuracy = ml::accuracyAt(probs, labels, best.threshold);
    return e;
}

std::vector<FeatureVector> featuresOf(const std::vector<ml::DataPoint>& data) {
    std::vector<FeatureVector> out;
    out.reserve(data.size());
    for (const auto& dp : data) out.push_back(dp.features);
    return out;
}

std::vector<ml::DataPoint> scaled(const ml::FeatureScaler& scaler, const std::vector<ml::DataPoint>& data) {
    std::vector<ml::DataPoint> out;
    out.reserve(data.size());
    for (const auto& dp : data) out.push_back(ml::DataPoint{scaler.transform(dp.features), dp.label});
    return out;
}

} // namespace

TrainingPipeline::TrainingPipeline(TrainingConfig config, features::FeatureSchema schema)
    : config_(std::move(config)), schema_(std::move(schema)), encoder_(schema_) {}

CsvTable TrainingPipeline::loadData() const {
    std::ifstream in(config_.csvPath);
    if (!in.is_open()) {
        throw SchemaError("Could not open training data: " + config_.csvPath +
                          " (set LUNG_CANCER_CSV or pass --csv=PATH)");
    }
    CsvTable table = readCsv(in);
    spdlog::info("[LoadData] {} rows, {} columns from {}", table.rows.size(), table.header.size(), config_.csvPath);
    return table;
}

void TrainingPipeline::validateColumns(const CsvTable& table) const {
    std::vector<std::string> expected = schema_.order;
    expected.push_back(schema_.target);
    std::string missing;
    for (const auto& name : expected) {
        if (!table.column(name)) missing += (missing.empty() ? "" : ", ") + name;
    }
    if (!missing.empty()) {
        throw SchemaError("Training data " + config_.csvPath + " is missing required column(s): " + missing);
    }
    spdlog::info("[ValidateColumns] all {} expected columns present", expected.size());
}

std::vector<ml::DataPoint> TrainingPipeline::encode(const CsvTable& table, int& droppedRows) const {
    const size_t targetCol = *table.column(schema_.target);
    std::vector<size_t> featureCols;
    for (const auto& name : schema_.order) featureCols.push_back(*table.column(name));

    const features::BinaryMeaning targetMeaning{"yes", "no"};
    std::vector<ml::DataPoint> data;
    data.reserve(table.rows.size());
    droppedRows = 0;
    for (const auto& row : table.rows) {
        if (features::trimLower(row[targetCol]).empty()) { ++droppedRows; continue; }
        features::RawAttributeSet raw;
        for (size_t i = 0; i < schema_.order.size(); ++i) raw[schema_.order[i]] = row[featureCols[i]];
        const int label = features::parseBinary(features::RawValue{row[targetCol]}, &targetMeaning);
        data.push_back(ml::DataPoint{encoder_.encode(raw).values, label});
    }
    if (droppedRows > 0) spdlog::warn("[EncodeLabelsAndFeatures] dropped {} rows without a target value", droppedRows);
    return data;
}

TrainingReport TrainingPipeline::run() const {
    TrainingReport report;
    report.artifactDir = config_.artifactDir;

    const CsvTable table = loadData();
    validateColumns(table);

    const std::vector<ml::DataPoint> data = encode(table, report.droppedRows);
    report.all = ml::countClasses(data);
    if (report.all.total() == 0) throw SchemaError("Training data " + config_.csvPath + " has no labeled rows");
    if (report.all.positive == 0 || report.all.negative == 0) {
        throw SchemaError("Training data " + config_.csvPath + " contains a single class; both outcomes are required");
    }
    report.piTrain = report.all.positiveRate();
    spdlog::info("[EncodeLabelsAndFeatures] {} rows, {} positive, training prevalence {:.4f}",
                 report.all.total(), report.all.positive, report.piTrain);

    const ml::TrainTestSplit split = ml::stratifiedSplit(data, config_.testFraction, config_.seed);
    report.train = ml::countClasses(split.train);
    report.test = ml::countClasses(split.test);
    spdlog::info("[SplitTrainTest] train={} (pos {}), test={} (pos {})", report.train.total(), report.train.positive,
                 report.test.total(), report.test.positive);

    ml::FeatureScaler scaler;
    scaler.fit(featuresOf(split.train), schema_.numericCols, schema_.numericIndices());
    for (size_t j = 0; j < scaler.columns.size(); ++j) {
        const auto jj = static_cast<Eigen::Index>(j);
        spdlog::info("[FitScaler] {}: mean={:.4f} std={:.4f}", scaler.columns[j], scaler.mean[jj], scaler.std[jj]);
    }
    const std::vector<ml::DataPoint> train = scaled(scaler, split.train);
    const std::vector<ml::DataPoint> test = scaled(scaler, split.test);

    ml::BoostParams hp = config_.boost;
    hp.scalePosWeight = static_cast<double>(report.train.negative) / std::max(report.train.positive, 1);
    report.scalePosWeight = hp.scalePosWeight;
    spdlog::info("[FitCalibratedClassifier] {} rounds, depth {}, eta {}, scalePosWeight {:.3f}, {} folds",
                 hp.rounds, hp.maxDepth, hp.learningRate, hp.scalePosWeight, config_.folds);
    ml::CalibratedClassifier model;
    model.fit(train, schema_.order, hp, config_.folds, config_.seed);

    report.evaluation = evaluate(model, test);
    const auto& e = report.evaluation;
    spdlog::info("[Evaluate] ROC AUC={:.4f} PR AUC={:.4f} Brier={:.4f}", e.rocAuc, e.prAuc, e.brier);
    spdlog::info("[Evaluate] best F1={:.4f} at threshold {:.4f} (precision {:.4f}, recall {:.4f}, accuracy {:.4f})",
                 e.f1, e.threshold, e.precision, e.recall, e.accuracy);

    service::ArtifactBundle bundle;
    bundle.scaler = std::move(scaler);
    bundle.model = std::move(model);
    bundle.schema = schema_;
    bundle.piTrain = report.piTrain;
    bundle.trainingDataSource = std::filesystem::path(config_.csvPath).filename().string();
    bundle.evaluation = report.evaluation;
    service::saveArtifacts(bundle, config_.artifactDir);
    spdlog::info("[PersistArtifacts] done");
    return report;
}

} // namespace lungrisk::training
