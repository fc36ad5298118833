#include <vector>

#include <gtest/gtest.h>

#include "TestHelpers.hpp"
#include "lungrisk/ml/BoostedTrees.hpp"
#include "lungrisk/ml/CalibratedClassifier.hpp"
#include "lungrisk/ml/Metrics.hpp"

using namespace lungrisk;
using namespace lungrisk::ml;

namespace {

BoostParams fastParams() {
    return BoostParams{.rounds = 60, .maxDepth = 2, .learningRate = 0.3, .lambda = 1.0,
                       .gamma = 0.0, .minChildWeight = 1.0, .scalePosWeight = 1.0};
}

DataPoint point(double a, double b, int label) {
    FeatureVector x(2);
    x << a, b;
    return DataPoint{x, label};
}

} // namespace

TEST(BoostedTreeClassifier, UntrainedModelPredictsOneHalf) {
    BoostedTreeClassifier model;
    EXPECT_DOUBLE_EQ(0.5, model.probability(FeatureVector::Zero(3)));
    model.train({}, fastParams());
    EXPECT_TRUE(model.trees().empty());
}

TEST(BoostedTreeClassifier, LearnsASingleInformativeFeature) {
    std::vector<DataPoint> data;
    for (int i = 0; i < 20; ++i) {
        data.push_back(point(1.0, i % 2, 1));
        data.push_back(point(0.0, i % 2, 0));
    }
    BoostedTreeClassifier model;
    model.train(data, fastParams());

    ASSERT_EQ(60u, model.trees().size());
    EXPECT_EQ(0, model.trees().front().nodes.front().feature);
    EXPECT_DOUBLE_EQ(0.5, model.trees().front().nodes.front().threshold);
    EXPECT_GT(model.probability(point(1.0, 0.0, 1).features), 0.9);
    EXPECT_LT(model.probability(point(0.0, 1.0, 0).features), 0.1);
}

TEST(BoostedTreeClassifier, PositiveWeightCounteractsImbalance) {
    std::vector<DataPoint> data;
    for (int i = 0; i < 10; ++i) data.push_back(point(0.0, 0.0, 1));
    for (int i = 0; i < 30; ++i) data.push_back(point(0.0, 0.0, 0));

    BoostParams hp = fastParams();
    hp.rounds = 200;
    BoostedTreeClassifier plain;
    plain.train(data, hp);
    hp.scalePosWeight = 3.0;
    BoostedTreeClassifier weighted;
    weighted.train(data, hp);

    const FeatureVector x = FeatureVector::Zero(2);
    EXPECT_NEAR(0.25, plain.probability(x), 0.02);
    EXPECT_NEAR(0.5, weighted.probability(x), 0.02);
}

TEST(BoostedTreeClassifier, RespectsMaximumDepth) {
    const auto data = lungrisk::testing::syntheticLungData(300, 7u);
    BoostParams hp = fastParams();
    hp.rounds = 5;
    hp.maxDepth = 3;
    BoostedTreeClassifier model;
    model.train(data, hp);
    for (const auto& tree : model.trees()) {
        EXPECT_LE(tree.nodes.size(), 15u);
        EXPECT_GE(tree.nodes.size(), 1u);
    }
}

TEST(CalibratedClassifier, OutOfFoldCalibrationRanksHeldOutData) {
    const auto train = lungrisk::testing::syntheticLungData(600, 11u);
    const auto test = lungrisk::testing::syntheticLungData(300, 12u);
    CalibratedClassifier model;
    model.fit(train, {"a", "b", "c", "d", "e", "f", "g", "h", "i"}, fastParams(), 3, 42u);

    ASSERT_EQ(3u, model.folds().size());
    std::vector<double> probs;
    std::vector<int> labels;
    for (const auto& dp : test) {
        const double p = model.predictProbability(dp.features);
        EXPECT_GE(p, kProbabilityEpsilon);
        EXPECT_LE(p, 1.0 - kProbabilityEpsilon);
        probs.push_back(p);
        labels.push_back(dp.label);
    }
    EXPECT_GT(rocAuc(probs, labels), 0.75);
}

TEST(CalibratedClassifier, RejectsFewerThanTwoFolds) {
    CalibratedClassifier model;
    EXPECT_THROW(model.fit(lungrisk::testing::syntheticLungData(20, 1u), {}, fastParams(), 1, 42u),
                 std::invalid_argument);
}

TEST(CalibratedClassifier, EmptyModelPredictsOneHalf) {
    CalibratedClassifier model;
    EXPECT_DOUBLE_EQ(0.5, model.predictProbability(FeatureVector::Zero(9)));
}
