#pragma once

#include <cstdlib>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include "lungrisk/features/RawValue.hpp"
#include "lungrisk/math/Probability.hpp"
#include "lungrisk/ml/BoostedTrees.hpp"

namespace lungrisk {

// Prior from text; invalid values are logged and dropped so adjustment stays off
inline std::optional<double> parsePrior(const char* text, const std::string& source) {
    if (text == nullptr || *text == '\0') return std::nullopt;
    auto v = features::parseDecimal(text);
    if (!v || !isValidPrior(*v)) {
        spdlog::warn("Ignoring {}='{}': prior must be a number strictly between 0 and 1", source, text);
        return std::nullopt;
    }
    return v;
}

struct ServiceConfig {
    std::string artifactDir{"artifacts"};
    std::optional<double> piTrainOverride;  // replaces the bundle's training prior
    std::optional<double> piDeployDefault;  // used when a request has no override

    static ServiceConfig fromEnvironment() {
        ServiceConfig cfg;
        if (const char* dir = std::getenv("LUNGRISK_ARTIFACT_DIR"); dir != nullptr && *dir != '\0') cfg.artifactDir = dir;
        cfg.piTrainOverride = parsePrior(std::getenv("LUNGRISK_PI_TRAIN"), "LUNGRISK_PI_TRAIN");
        cfg.piDeployDefault = parsePrior(std::getenv("LUNGRISK_PI_DEPLOY"), "LUNGRISK_PI_DEPLOY");
        return cfg;
    }
};

struct TrainingConfig {
    std::string csvPath{"lung_cancer_dataset.csv"};
    std::string artifactDir{"artifacts"};
    double testFraction{0.2};
    int folds{5};
    unsigned int seed{42u};
    ml::BoostParams boost{ml::defaultBoostParams()};

    static TrainingConfig fromEnvironment() {
        TrainingConfig cfg;
        if (const char* csv = std::getenv("LUNG_CANCER_CSV"); csv != nullptr && *csv != '\0') cfg.csvPath = csv;
        if (const char* dir = std::getenv("LUNGRISK_ARTIFACT_DIR"); dir != nullptr && *dir != '\0') cfg.artifactDir = dir;
        return cfg;
    }
};

} // namespace lungrisk
