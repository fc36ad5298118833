#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "lungrisk/core/Config.hpp"
#include "lungrisk/features/FeatureEncoder.hpp"
#include "lungrisk/service/ArtifactBundle.hpp"

namespace lungrisk::service {

inline constexpr double kMaxReportedProbability = 0.9999;

struct PredictionResult {
    double rawProbability{0.5};
    std::optional<double> adjustedProbability;
    bool usedAdjustment{false};
    std::optional<double> priorTraining;
    std::optional<double> priorDeployment;
    std::vector<std::pair<std::string, double>> inputsUsed; // parsed, before scaling

    double probability() const { return usedAdjustment && adjustedProbability ? *adjustedProbability : rawProbability; }
};

// Probability as a percentage with two decimals, capped below 100
double toPercentage(double p);

// JSON request body -> raw attributes. null, arrays and objects count as absent.
features::RawAttributeSet attributesFromJson(const nlohmann::json& body);

// Immutable scoring context: built once at startup, shared by every request.
// All operations are const and safe to call from many threads at once.
class ScoringService {
public:
    ScoringService(ArtifactBundle bundle, ServiceConfig config);

    // Loads the bundle from config.artifactDir; throws ArtifactError when it is unusable
    static ScoringService fromConfig(const ServiceConfig& config);

    PredictionResult score(const features::RawAttributeSet& raw,
                           std::optional<double> deployOverride = std::nullopt) const;

    // Encoded and standardized vector exactly as the classifier sees it
    FeatureVector prepare(const features::RawAttributeSet& raw) const;

    nlohmann::json toResponse(const PredictionResult& result) const;
    nlohmann::json metadata() const;

    std::optional<double> trainingPrior() const;
    const ArtifactBundle& bundle() const { return bundle_; }
    const ServiceConfig& config() const { return config_; }

private:
    ArtifactBundle bundle_;
    ServiceConfig config_;
    features::FeatureEncoder encoder_;
};

} // namespace lungrisk::service
