#include "lungrisk/service/ScoringService.hpp"

#include <algorithm>
#include <cmath>

#include "lungrisk/service/PrevalenceAdjuster.hpp"

using json = nlohmann::json;

namespace lungrisk::service {

namespace {

json optionalNumber(std::optional<double> v) { return v ? json(*v) : json(nullptr); }

} // namespace

double toPercentage(double p) {
    const double capped = std::clamp(p, 0.0, kMaxReportedProbability);
    return std::round(capped * 100.0 * 100.0) / 100.0;
}

features::RawAttributeSet attributesFromJson(const json& body) {
    features::RawAttributeSet raw;
    if (!body.is_object()) return raw;
    for (const auto& [key, value] : body.items()) {
        if (value.is_boolean()) raw[key] = value.get<bool>();
        else if (value.is_number()) raw[key] = value.get<double>();
        else if (value.is_string()) raw[key] = value.get<std::string>();
        else raw[key] = std::monostate{};
    }
    return raw;
}

ScoringService::ScoringService(ArtifactBundle bundle, ServiceConfig config)
    : bundle_(std::move(bundle)), config_(std::move(config)), encoder_(bundle_.schema) {
    bundle_.validate();
}

ScoringService ScoringService::fromConfig(const ServiceConfig& config) {
    return ScoringService(loadArtifacts(config.artifactDir), config);
}

std::optional<double> ScoringService::trainingPrior() const {
    return config_.piTrainOverride ? config_.piTrainOverride : bundle_.piTrain;
}

FeatureVector ScoringService::prepare(const features::RawAttributeSet& raw) const {
    return bundle_.scaler.transform(encoder_.encode(raw).values);
}

PredictionResult ScoringService::score(const features::RawAttributeSet& raw,
                                       std::optional<double> deployOverride) const {
    features::EncodedFeatures encoded = encoder_.encode(raw);
    const FeatureVector x = bundle_.scaler.transform(encoded.values);

    PredictionResult r;
    r.rawProbability = bundle_.model.predictProbability(x);
    r.priorTraining = trainingPrior();
    r.priorDeployment = deployOverride ? deployOverride : config_.piDeployDefault;
    if (canAdjust(r.priorTraining, r.priorDeployment)) {
        r.adjustedProbability = adjustPrior(r.rawProbability, r.priorTraining, r.priorDeployment);
        r.usedAdjustment = true;
    }
    r.inputsUsed = std::move(encoded.inputsUsed);
    return r;
}

json ScoringService::toResponse(const PredictionResult& result) const {
    json inputs = json::object();
    for (const auto& [name, value] : result.inputsUsed) {
        if (bundle_.schema.isNumeric(name)) inputs[name] = value;
        else inputs[name] = static_cast<int>(value);
    }
    return json{
        {"riskPercentage", toPercentage(result.probability())},
        {"rawRiskPercentage", toPercentage(result.rawProbability)},
        {"adjustedRiskPercentage",
         result.adjustedProbability ? json(toPercentage(*result.adjustedProbability)) : json(nullptr)},
        {"adjustedForPrevalence", result.usedAdjustment},
        {"priorTraining", optionalNumber(result.priorTraining)},
        {"priorDeployment", optionalNumber(result.priorDeployment)},
        {"inputsUsed", inputs},
    };
}

json ScoringService::metadata() const {
    json meaning = json::object();
    for (const auto& [name, m] : bundle_.schema.binaryMeaning) meaning[name] = {{"1", m.positive}, {"0", m.negative}};
    json meta{
        {"featureOrder", bundle_.schema.order},
        {"numericCols", bundle_.schema.numericCols},
        {"binaryCols", bundle_.schema.binaryCols()},
        {"binaryMeaning", meaning},
        {"target", bundle_.schema.target},
        {"calibrationMethod", bundle_.calibrationMethod},
        {"modelFamily", bundle_.modelFamily},
        {"trainingDataSource", bundle_.trainingDataSource},
        {"priorTraining", optionalNumber(trainingPrior())},
        {"priorDeployment", optionalNumber(config_.piDeployDefault)},
    };
    if (bundle_.evaluation) {
        const auto& e = *bundle_.evaluation;
        meta["evaluation"] = {{"rocAuc", e.rocAuc}, {"prAuc", e.prAuc}, {"brier", e.brier},
                              {"threshold", e.threshold}, {"f1", e.f1}, {"accuracy", e.accuracy}};
    }
    return meta;
}

} // namespace lungrisk::service
