#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

#include "lungrisk/core/Config.hpp"
#include "lungrisk/core/Logging.hpp"
#include "lungrisk/training/TrainingPipeline.hpp"

namespace {

void printUsage(const char* app) {
    std::cout << "Usage: " << app << " [options]\n"
              << "  --csv=PATH     Labeled training data (default: lung_cancer_dataset.csv or LUNG_CANCER_CSV)\n"
              << "  --out=DIR      Artifact directory (default: artifacts or LUNGRISK_ARTIFACT_DIR)\n"
              << "  --folds=K      Calibration folds (default: 5)\n"
              << "  --rounds=N     Boosting rounds per fold (default: 300)\n"
              << "  --seed=N       Split and fold seed (default: 42)\n"
              << "  --help         Show this help message\n";
}

} // namespace

int main(int argc, char** argv) {
    lungrisk::initLogging();
    lungrisk::TrainingConfig cfg = lungrisk::TrainingConfig::fromEnvironment();

    try {
        for (int i = 1; i < argc; ++i) {
            const std::string a = argv[i];
            if (a == "--help" || a == "-h") { printUsage(argv[0]); return 0; }
            else if (a.rfind("--csv=", 0) == 0) cfg.csvPath = a.substr(6);
            else if (a.rfind("--out=", 0) == 0) cfg.artifactDir = a.substr(6);
            else if (a.rfind("--folds=", 0) == 0) cfg.folds = std::stoi(a.substr(8));
            else if (a.rfind("--rounds=", 0) == 0) cfg.boost.rounds = std::stoi(a.substr(9));
            else if (a.rfind("--seed=", 0) == 0) cfg.seed = static_cast<unsigned int>(std::stoul(a.substr(7)));
            else { printUsage(argv[0]); return 1; }
        }
    } catch (const std::exception& e) {
        spdlog::error("Invalid argument: {}", e.what());
        return 1;
    }

    try {
        lungrisk::training::TrainingPipeline pipeline(cfg);
        const auto report = pipeline.run();
        spdlog::info("Model written to {} (piTrain={:.4f}, ROC AUC={:.4f})", report.artifactDir.string(),
                     report.piTrain, report.evaluation.rocAuc);
    } catch (const std::exception& e) {
        spdlog::critical("Training failed: {}", e.what());
        return 1;
    }
    return 0;
}
