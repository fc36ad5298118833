#include "lungrisk/service/ArtifactBundle.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "lungrisk/core/Errors.hpp"

using json = nlohmann::json;

namespace lungrisk::service {

namespace {

json readJson(const std::filesystem::path& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw ArtifactError("Could not open artifact file: " + path.string());
    }
    try {
        json j;
        f >> j;
        return j;
    } catch (const json::exception& e) {
        throw ArtifactError("Malformed JSON in " + path.string() + ": " + e.what());
    }
}

void writeJson(const json& j, const std::filesystem::path& path) {
    std::ofstream f(path);
    if (!f.is_open()) {
        throw ArtifactError("Could not write artifact file: " + path.string());
    }
    f << j.dump(2) << "\n";
    if (!f) {
        throw ArtifactError("Failed writing artifact file: " + path.string());
    }
}

std::vector<double> toStd(const Eigen::VectorXd& v) { return std::vector<double>(v.data(), v.data() + v.size()); }

Eigen::VectorXd toEigen(const std::vector<double>& v) {
    return Eigen::Map<const Eigen::VectorXd>(v.data(), static_cast<Eigen::Index>(v.size()));
}

// ----- scaler.json -----
json scalerToJson(const ml::FeatureScaler& s) {
    return json{{"columns", s.columns}, {"mean", toStd(s.mean)}, {"std", toStd(s.std)}};
}

ml::FeatureScaler scalerFromJson(const json& j) {
    ml::FeatureScaler s;
    s.columns = j.at("columns").get<std::vector<std::string>>();
    s.mean = toEigen(j.at("mean").get<std::vector<double>>());
    s.std = toEigen(j.at("std").get<std::vector<double>>());
    s.fitted = true;
    return s;
}

// ----- model.json -----
// Nodes are stored as [feature, threshold, left, right, value]
json treeToJson(const ml::RegressionTree& t) {
    json nodes = json::array();
    for (const auto& n : t.nodes) nodes.push_back(json::array({n.feature, n.threshold, n.left, n.right, n.value}));
    return nodes;
}

ml::RegressionTree treeFromJson(const json& j) {
    ml::RegressionTree t;
    t.nodes.reserve(j.size());
    for (const auto& n : j) {
        if (!n.is_array() || n.size() != 5) throw ArtifactError("Tree node must have 5 entries");
        t.nodes.push_back(ml::TreeNode{n[0].get<int>(), n[1].get<double>(), n[2].get<int>(), n[3].get<int>(), n[4].get<double>()});
    }
    return t;
}

json modelToJson(const ml::CalibratedClassifier& m, const ArtifactBundle& b) {
    json folds = json::array();
    for (const auto& f : m.folds()) {
        json trees = json::array();
        for (const auto& t : f.base.trees()) trees.push_back(treeToJson(t));
        folds.push_back({{"base", {{"trees", trees}}},
                         {"calibrator", {{"x", f.calibrator.x}, {"y", f.calibrator.y}}}});
    }
    return json{{"method", b.calibrationMethod}, {"family", b.modelFamily},
                {"featureNames", m.featureNames()}, {"folds", folds}};
}

ml::CalibratedClassifier modelFromJson(const json& j) {
    std::vector<ml::CalibratedFold> folds;
    for (const auto& jf : j.at("folds")) {
        std::vector<ml::RegressionTree> trees;
        for (const auto& jt : jf.at("base").at("trees")) trees.push_back(treeFromJson(jt));
        ml::CalibratedFold fold;
        fold.base = ml::BoostedTreeClassifier(std::move(trees));
        fold.calibrator.x = jf.at("calibrator").at("x").get<std::vector<double>>();
        fold.calibrator.y = jf.at("calibrator").at("y").get<std::vector<double>>();
        fold.calibrator.fitted = true;
        folds.push_back(std::move(fold));
    }
    return ml::CalibratedClassifier(j.at("featureNames").get<std::vector<std::string>>(), std::move(folds));
}

// ----- meta.json -----
json evaluationToJson(const ml::EvaluationSummary& e) {
    return json{{"rocAuc", e.rocAuc}, {"prAuc", e.prAuc}, {"brier", e.brier}, {"threshold", e.threshold},
                {"f1", e.f1}, {"precision", e.precision}, {"recall", e.recall}, {"accuracy", e.accuracy},
                {"testRows", e.testRows}};
}

ml::EvaluationSummary evaluationFromJson(const json& j) {
    ml::EvaluationSummary e;
    auto num = [&](const char* key) { return j.contains(key) && j[key].is_number() ? j[key].get<double>() : std::nan(""); };
    e.rocAuc = num("rocAuc");
    e.prAuc = num("prAuc");
    e.brier = num("brier");
    e.threshold = num("threshold");
    e.f1 = num("f1");
    e.precision = num("precision");
    e.recall = num("recall");
    e.accuracy = num("accuracy");
    e.testRows = j.value("testRows", 0);
    return e;
}

json metaToJson(const ArtifactBundle& b) {
    json meaning = json::object();
    for (const auto& [name, m] : b.schema.binaryMeaning) meaning[name] = {{"1", m.positive}, {"0", m.negative}};
    json j{{"formatVersion", kFormatVersion},
           {"featureOrder", b.schema.order},
           {"numericCols", b.schema.numericCols},
           {"binaryCols", b.schema.binaryCols()},
           {"binaryMeaning", meaning},
           {"target", b.schema.target},
           {"calibrationMethod", b.calibrationMethod},
           {"modelFamily", b.modelFamily},
           {"trainingDataSource", b.trainingDataSource}};
    j["piTrain"] = b.piTrain ? json(*b.piTrain) : json(nullptr);
    if (b.evaluation) j["evaluation"] = evaluationToJson(*b.evaluation);
    return j;
}

void applyMeta(const json& j, ArtifactBundle& b) {
    const features::FeatureSchema defaults = features::lungCancerSchema();
    b.schema.order = j.at("featureOrder").get<std::vector<std::string>>();
    b.schema.numericCols = j.at("numericCols").get<std::vector<std::string>>();
    b.schema.target = j.value("target", defaults.target);
    b.schema.binaryMeaning.clear();
    if (j.contains("binaryMeaning")) {
        for (const auto& [name, m] : j.at("binaryMeaning").items()) {
            b.schema.binaryMeaning[name] = features::BinaryMeaning{m.value("1", "yes"), m.value("0", "no")};
        }
    }
    for (const auto& name : b.schema.binaryCols()) {
        if (!b.schema.binaryMeaning.count(name)) b.schema.binaryMeaning[name] = features::BinaryMeaning{};
    }
    b.schema.aliases.clear();
    for (const auto& [alias, canonical] : defaults.aliases) {
        if (std::find(b.schema.order.begin(), b.schema.order.end(), canonical) != b.schema.order.end()) {
            b.schema.aliases[alias] = canonical;
        }
    }
    if (j.contains("piTrain") && j["piTrain"].is_number()) b.piTrain = j["piTrain"].get<double>();
    b.calibrationMethod = j.value("calibrationMethod", std::string(ml::kCalibrationMethod));
    b.modelFamily = j.value("modelFamily", std::string(ml::kModelFamily));
    b.trainingDataSource = j.value("trainingDataSource", std::string());
    if (j.contains("evaluation") && j["evaluation"].is_object()) b.evaluation = evaluationFromJson(j["evaluation"]);
}

std::string joinNames(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& n : names) out += (out.empty() ? "" : ", ") + n;
    return out;
}

} // namespace

void ArtifactBundle::validate() const {
    const int dim = static_cast<int>(schema.order.size());
    if (dim == 0) throw ArtifactError("Feature order is empty");
    for (const auto& c : schema.numericCols) {
        if (std::find(schema.order.begin(), schema.order.end(), c) == schema.order.end()) {
            throw ArtifactError("Numeric column '" + c + "' is not part of the feature order");
        }
    }
    if (model.featureNames() != schema.order) {
        throw ArtifactError("Classifier was trained on [" + joinNames(model.featureNames()) +
                            "] but metadata declares feature order [" + joinNames(schema.order) + "]");
    }
    if (scaler.columns != schema.numericCols) {
        throw ArtifactError("Scaler columns [" + joinNames(scaler.columns) +
                            "] do not match numeric columns [" + joinNames(schema.numericCols) + "]");
    }
    if (scaler.mean.size() != static_cast<Eigen::Index>(scaler.columns.size()) ||
        scaler.std.size() != static_cast<Eigen::Index>(scaler.columns.size()) ||
        scaler.indices.size() != scaler.columns.size()) {
        throw ArtifactError("Scaler statistics do not match its column count");
    }
    for (Eigen::Index j = 0; j < scaler.std.size(); ++j) {
        if (!std::isfinite(scaler.mean[j]) || !std::isfinite(scaler.std[j]) || scaler.std[j] <= 0.0) {
            throw ArtifactError("Scaler statistics for '" + scaler.columns[static_cast<size_t>(j)] + "' are not usable");
        }
    }
    if (model.folds().empty()) throw ArtifactError("Classifier has no calibrated folds");
    for (const auto& fold : model.folds()) {
        if (fold.calibrator.x.size() != fold.calibrator.y.size()) {
            throw ArtifactError("Calibrator thresholds and values differ in length");
        }
        const auto& cx = fold.calibrator.x;
        const auto& cy = fold.calibrator.y;
        for (size_t i = 0; i < cx.size(); ++i) {
            if (!std::isfinite(cx[i]) || (i > 0 && cx[i] < cx[i - 1])) {
                throw ArtifactError("Calibrator thresholds must be finite and non-decreasing");
            }
            if (!std::isfinite(cy[i]) || cy[i] < 0.0 || cy[i] > 1.0) {
                throw ArtifactError("Calibrator values must lie in [0, 1]");
            }
        }
        for (const auto& tree : fold.base.trees()) {
            const int n = static_cast<int>(tree.nodes.size());
            // Nodes are stored in preorder, so children always come after their parent
            for (int idx = 0; idx < n; ++idx) {
                const auto& node = tree.nodes[static_cast<size_t>(idx)];
                if (node.leaf()) continue;
                if (node.feature < 0 || node.feature >= dim || node.left <= idx || node.left >= n ||
                    node.right <= idx || node.right >= n) {
                    throw ArtifactError("Tree node " + std::to_string(idx) +
                                        " references a feature out of range or a child that is not after it");
                }
            }
        }
    }
}

ArtifactBundle loadArtifacts(const std::filesystem::path& dir) {
    const auto scalerPath = dir / kScalerFile;
    const auto modelPath = dir / kModelFile;
    const auto metaPath = dir / kMetaFile;

    std::vector<std::string> missing;
    if (!std::filesystem::exists(scalerPath)) missing.push_back(scalerPath.string());
    if (!std::filesystem::exists(modelPath)) missing.push_back(modelPath.string());
    if (!missing.empty()) {
        throw ArtifactError("Missing model artifact(s): " + joinNames(missing) +
                            ". Run lungrisk_train to produce them.");
    }

    ArtifactBundle b;
    try {
        if (std::filesystem::exists(metaPath)) {
            applyMeta(readJson(metaPath), b);
        } else {
            spdlog::warn("{} not found; assuming the default lung cancer schema and an unknown training prior",
                         metaPath.string());
            b.schema = features::lungCancerSchema();
        }
        b.scaler = scalerFromJson(readJson(scalerPath));
        b.model = modelFromJson(readJson(modelPath));
    } catch (const json::exception& e) {
        throw ArtifactError("Invalid artifact contents in " + dir.string() + ": " + e.what());
    }

    b.scaler.indices.clear();
    for (const auto& c : b.scaler.columns) {
        auto it = std::find(b.schema.order.begin(), b.schema.order.end(), c);
        if (it == b.schema.order.end()) {
            throw ArtifactError("Scaler column '" + c + "' is not part of the feature order");
        }
        b.scaler.indices.push_back(static_cast<int>(it - b.schema.order.begin()));
    }
    b.validate();

    spdlog::info("Loaded artifacts from {}: {} features, {} calibrated folds, piTrain={}", dir.string(),
                 b.schema.order.size(), b.model.folds().size(),
                 b.piTrain ? std::to_string(*b.piTrain) : std::string("unknown"));
    return b;
}

void saveArtifacts(const ArtifactBundle& bundle, const std::filesystem::path& dir) {
    bundle.validate();
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) throw ArtifactError("Could not create artifact directory " + dir.string() + ": " + ec.message());
    writeJson(scalerToJson(bundle.scaler), dir / kScalerFile);
    writeJson(modelToJson(bundle.model, bundle), dir / kModelFile);
    writeJson(metaToJson(bundle), dir / kMetaFile);
    spdlog::info("Saved {}, {} and {} to {}", kScalerFile, kModelFile, kMetaFile, dir.string());
}

} // namespace lungrisk::service
