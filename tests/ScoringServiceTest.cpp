#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "TestHelpers.hpp"
#include "lungrisk/core/Errors.hpp"
#include "lungrisk/service/ScoringService.hpp"

using namespace lungrisk;
using namespace lungrisk::service;
using json = nlohmann::json;

namespace {

features::RawAttributeSet scenarioRequest() {
    return {
        {"age", 50.0},
        {"pack_years", 20.0},
        {"gender", std::string("yes")},
        {"radon", std::string("no")},
        {"asbestos", 0.0},
        {"secondhand", std::string("true")},
        {"copd", std::string("n")},
        {"alcohol", 1.0},
        {"family_history", std::string("no")},
    };
}

ServiceConfig priors(std::optional<double> piTrain, std::optional<double> piDeploy) {
    ServiceConfig cfg;
    cfg.piTrainOverride = piTrain;
    cfg.piDeployDefault = piDeploy;
    return cfg;
}

} // namespace

TEST(ScoringService, ScenarioRequestIsEncodedAndStandardized) {
    const ScoringService svc(lungrisk::testing::constantBundle(3, 10, std::nullopt), ServiceConfig{});
    const FeatureVector x = svc.prepare(scenarioRequest());

    ASSERT_EQ(9, x.size());
    EXPECT_NEAR(0.0, x[0], 1e-12);
    EXPECT_NEAR(0.0, x[1], 1e-12);
    const std::vector<double> binaries{1, 0, 0, 1, 0, 1, 0};
    for (size_t i = 0; i < binaries.size(); ++i) {
        EXPECT_DOUBLE_EQ(binaries[i], x[static_cast<Eigen::Index>(i + 2)]) << "position " << i + 2;
    }
}

TEST(ScoringService, EqualPriorsLeaveProbabilityUnchanged) {
    const ScoringService svc(lungrisk::testing::constantBundle(3, 10, 0.10), priors(std::nullopt, 0.10));
    const PredictionResult r = svc.score(scenarioRequest());

    EXPECT_NEAR(0.30, r.rawProbability, 1e-9);
    ASSERT_TRUE(r.usedAdjustment);
    ASSERT_TRUE(r.adjustedProbability.has_value());
    EXPECT_NEAR(0.30, *r.adjustedProbability, 1e-9);
}

TEST(ScoringService, LowerDeploymentPrevalenceLowersRisk) {
    const ScoringService svc(lungrisk::testing::constantBundle(1, 2, 0.30), priors(std::nullopt, 0.01));
    const PredictionResult r = svc.score(scenarioRequest());

    EXPECT_NEAR(0.50, r.rawProbability, 1e-9);
    ASSERT_TRUE(r.adjustedProbability.has_value());
    EXPECT_LT(*r.adjustedProbability, 0.05);
    EXPECT_GT(*r.adjustedProbability, 0.01);
    EXPECT_DOUBLE_EQ(*r.adjustedProbability, r.probability());
}

TEST(ScoringService, NoPriorsMeansNoAdjustment) {
    const ScoringService svc(lungrisk::testing::constantBundle(3, 10, std::nullopt), ServiceConfig{});
    const PredictionResult r = svc.score(scenarioRequest());

    EXPECT_FALSE(r.usedAdjustment);
    EXPECT_FALSE(r.adjustedProbability.has_value());
    EXPECT_DOUBLE_EQ(r.rawProbability, r.probability());

    const json body = svc.toResponse(r);
    EXPECT_TRUE(body["adjustedRiskPercentage"].is_null());
    EXPECT_TRUE(body["priorTraining"].is_null());
    EXPECT_FALSE(body["adjustedForPrevalence"].get<bool>());
    EXPECT_DOUBLE_EQ(30.0, body["riskPercentage"].get<double>());
}

TEST(ScoringService, RequestOverrideTakesPrecedenceOverDefault) {
    const ScoringService svc(lungrisk::testing::constantBundle(3, 10, 0.30), priors(std::nullopt, 0.01));
    const PredictionResult r = svc.score(scenarioRequest(), 0.30);

    ASSERT_TRUE(r.priorDeployment.has_value());
    EXPECT_DOUBLE_EQ(0.30, *r.priorDeployment);
    EXPECT_NEAR(0.30, *r.adjustedProbability, 1e-9);
}

TEST(ScoringService, InvalidOverrideDisablesAdjustment) {
    const ScoringService svc(lungrisk::testing::constantBundle(3, 10, 0.30), priors(std::nullopt, 0.01));
    for (double bad : {0.0, 1.0, 1.5, -0.2}) {
        const PredictionResult r = svc.score(scenarioRequest(), bad);
        EXPECT_FALSE(r.usedAdjustment) << bad;
        EXPECT_NEAR(0.30, r.probability(), 1e-9) << bad;
    }
}

TEST(ScoringService, TrainingPriorOverrideReplacesBundlePrior) {
    const ScoringService svc(lungrisk::testing::constantBundle(3, 10, 0.50), priors(0.10, 0.10));
    ASSERT_TRUE(svc.trainingPrior().has_value());
    EXPECT_DOUBLE_EQ(0.10, *svc.trainingPrior());
    EXPECT_NEAR(0.30, svc.score(scenarioRequest()).probability(), 1e-9);
}

TEST(ScoringService, ResponseReportsPercentagesAndInputs) {
    const ScoringService svc(lungrisk::testing::constantBundle(1, 2, 0.30), priors(std::nullopt, 0.01));
    const json body = svc.toResponse(svc.score(scenarioRequest()));

    EXPECT_DOUBLE_EQ(50.0, body["rawRiskPercentage"].get<double>());
    EXPECT_TRUE(body["adjustedForPrevalence"].get<bool>());
    EXPECT_DOUBLE_EQ(body["adjustedRiskPercentage"].get<double>(), body["riskPercentage"].get<double>());
    EXPECT_LT(body["riskPercentage"].get<double>(), 5.0);
    EXPECT_DOUBLE_EQ(0.30, body["priorTraining"].get<double>());
    EXPECT_DOUBLE_EQ(0.01, body["priorDeployment"].get<double>());

    const json& inputs = body["inputsUsed"];
    EXPECT_DOUBLE_EQ(50.0, inputs["age"].get<double>());
    EXPECT_TRUE(inputs["gender"].is_number_integer());
    EXPECT_EQ(1, inputs["gender"].get<int>());
    EXPECT_EQ(0, inputs["copd"].get<int>());
}

TEST(ScoringService, PercentageIsCappedBelowCertainty) {
    EXPECT_DOUBLE_EQ(99.99, toPercentage(1.0));
    EXPECT_DOUBLE_EQ(99.99, toPercentage(0.99999));
    EXPECT_DOUBLE_EQ(12.35, toPercentage(0.123456));
    EXPECT_DOUBLE_EQ(0.0, toPercentage(0.0));

    const ScoringService svc(lungrisk::testing::constantBundle(10, 10, std::nullopt), ServiceConfig{});
    EXPECT_DOUBLE_EQ(99.99, svc.toResponse(svc.score(scenarioRequest()))["riskPercentage"].get<double>());
}

TEST(ScoringService, MetadataDescribesTheBundle) {
    const ScoringService svc(lungrisk::testing::constantBundle(3, 10, 0.2), priors(std::nullopt, 0.05));
    const json meta = svc.metadata();

    EXPECT_EQ(lungrisk::testing::shortSchema().order, meta["featureOrder"].get<std::vector<std::string>>());
    EXPECT_EQ(7u, meta["binaryCols"].size());
    EXPECT_EQ("yes", meta["binaryMeaning"]["copd"]["1"].get<std::string>());
    EXPECT_EQ("isotonic", meta["calibrationMethod"].get<std::string>());
    EXPECT_DOUBLE_EQ(0.2, meta["priorTraining"].get<double>());
    EXPECT_DOUBLE_EQ(0.05, meta["priorDeployment"].get<double>());
    EXPECT_FALSE(meta.contains("evaluation"));
}

TEST(ScoringService, ConcurrentRequestsAgree) {
    const ScoringService svc(lungrisk::testing::constantBundle(1, 2, 0.30), priors(std::nullopt, 0.01));
    const double expected = svc.score(scenarioRequest()).probability();

    std::vector<std::thread> workers;
    std::vector<int> mismatches(8, 0);
    for (size_t t = 0; t < mismatches.size(); ++t) {
        workers.emplace_back([&svc, &mismatches, expected, t] {
            for (int i = 0; i < 200; ++i) {
                if (svc.score(scenarioRequest()).probability() != expected) ++mismatches[t];
            }
        });
    }
    for (auto& w : workers) w.join();
    for (int m : mismatches) EXPECT_EQ(0, m);
}

TEST(ScoringService, MissingArtifactsRefuseToStart) {
    lungrisk::testing::TempDir dir("missing");
    ServiceConfig cfg;
    cfg.artifactDir = dir.path().string();
    try {
        const ScoringService svc = ScoringService::fromConfig(cfg);
        (void)svc;
        FAIL() << "expected ArtifactError";
    } catch (const ArtifactError& e) {
        EXPECT_NE(std::string::npos, std::string(e.what()).find("model.json"));
    }
}

TEST(ScoringService, BundleThatFailsIntegrityIsRejected) {
    ArtifactBundle b = lungrisk::testing::constantBundle(3, 10, std::nullopt);
    b.model = lungrisk::testing::constantClassifier({"age", "pack_years"}, 3, 10);
    EXPECT_THROW({ const ScoringService svc(b, ServiceConfig{}); }, ArtifactError);
}

TEST(ServiceConfig, ReadsEnvironment) {
    ::setenv("LUNGRISK_ARTIFACT_DIR", "/tmp/lungrisk-env", 1);
    ::setenv("LUNGRISK_PI_TRAIN", "1.5", 1);
    ::setenv("LUNGRISK_PI_DEPLOY", "0.05", 1);
    const ServiceConfig cfg = ServiceConfig::fromEnvironment();
    ::unsetenv("LUNGRISK_ARTIFACT_DIR");
    ::unsetenv("LUNGRISK_PI_TRAIN");
    ::unsetenv("LUNGRISK_PI_DEPLOY");

    EXPECT_EQ("/tmp/lungrisk-env", cfg.artifactDir);
    EXPECT_FALSE(cfg.piTrainOverride.has_value());
    ASSERT_TRUE(cfg.piDeployDefault.has_value());
    EXPECT_DOUBLE_EQ(0.05, *cfg.piDeployDefault);

    const ServiceConfig defaults = ServiceConfig::fromEnvironment();
    EXPECT_EQ("artifacts", defaults.artifactDir);
    EXPECT_FALSE(defaults.piDeployDefault.has_value());
}

TEST(AttributesFromJson, MapsJsonTypesToRawValues) {
    const json body = json::parse(R"({"age": 61, "gender": "Female", "copd": true, "radon": null, "extra": [1]})");
    const features::RawAttributeSet raw = attributesFromJson(body);

    EXPECT_DOUBLE_EQ(61.0, std::get<double>(raw.at("age")));
    EXPECT_EQ("Female", std::get<std::string>(raw.at("gender")));
    EXPECT_TRUE(std::get<bool>(raw.at("copd")));
    EXPECT_TRUE(std::holds_alternative<std::monostate>(raw.at("radon")));
    EXPECT_TRUE(std::holds_alternative<std::monostate>(raw.at("extra")));
    EXPECT_TRUE(attributesFromJson(json::array()).empty());
}
