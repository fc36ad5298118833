#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "lungrisk/core/Config.hpp"
#include "lungrisk/core/Errors.hpp"
#include "lungrisk/core/Logging.hpp"
#include "lungrisk/service/ScoringService.hpp"

using json = nlohmann::json;

namespace {

void printUsage(const char* app) {
    std::cout << "Usage: " << app << " [options] [REQUEST.json]\n"
              << "  --artifacts=DIR  Artifact directory (default: artifacts or LUNGRISK_ARTIFACT_DIR)\n"
              << "  --prior=P        Deployment prevalence for this run, 0 < P < 1\n"
              << "  --meta           Print model metadata and exit\n"
              << "  --help           Show this help message\n"
              << "Without REQUEST.json, reads one JSON request per line from stdin.\n";
}

// One request -> one response line. Malformed JSON is logged and skipped.
bool scoreText(const lungrisk::service::ScoringService& service, const std::string& text,
               std::optional<double> prior) {
    json body = json::parse(text, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        spdlog::warn("Skipping request that is not a JSON object");
        return false;
    }
    const auto result = service.score(lungrisk::service::attributesFromJson(body), prior);
    std::cout << service.toResponse(result).dump() << "\n";
    return true;
}

} // namespace

int main(int argc, char** argv) {
    lungrisk::initLogging();
    lungrisk::ServiceConfig cfg = lungrisk::ServiceConfig::fromEnvironment();

    std::optional<double> prior;
    bool showMeta = false;
    std::string requestPath;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--help" || a == "-h") { printUsage(argv[0]); return 0; }
        else if (a == "--meta") showMeta = true;
        else if (a.rfind("--artifacts=", 0) == 0) cfg.artifactDir = a.substr(12);
        else if (a.rfind("--prior=", 0) == 0) {
            // An out-of-range override is passed through and disables adjustment for this run
            auto v = lungrisk::features::parseDecimal(a.substr(8));
            if (!v) { spdlog::error("--prior expects a number, got '{}'", a.substr(8)); return 1; }
            prior = v;
        }
        else if (a.rfind("--", 0) == 0) { printUsage(argv[0]); return 1; }
        else requestPath = a;
    }

    try {
        const auto service = lungrisk::service::ScoringService::fromConfig(cfg);
        if (showMeta) {
            std::cout << service.metadata().dump(2) << "\n";
            return 0;
        }
        if (!requestPath.empty()) {
            std::ifstream f(requestPath);
            if (!f.is_open()) {
                spdlog::error("Could not open request file: {}", requestPath);
                return 1;
            }
            const std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
            return scoreText(service, text, prior) ? 0 : 1;
        }
        std::string line;
        while (std::getline(std::cin, line)) {
            if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
            scoreText(service, line, prior);
        }
    } catch (const lungrisk::ArtifactError& e) {
        spdlog::critical("Cannot start: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("Scoring failed: {}", e.what());
        return 1;
    }
    return 0;
}
