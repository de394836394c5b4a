// =============================================================================
// AggregationEngine Tests
// =============================================================================

#include <gtest/gtest.h>
#include <optional>
#include <vector>

#include "fedrelay/aggregation_engine.hpp"
#include "fedrelay/error.hpp"

using namespace fedrelay;

class AggregationEngineTest : public ::testing::Test {
protected:
    AggregationEngine engine_;
};

TEST_F(AggregationEngineTest, SingleUpdateWithoutBaselineIsIdentityForAnyRate) {
    const WeightVector u = {0.5f, -1.25f, 3.0f};
    for (double lr : {0.0, 0.1, 0.5, 1.0}) {
        EXPECT_EQ(engine_.merge({u}, std::nullopt, lr), u) << "lr=" << lr;
    }
}

TEST_F(AggregationEngineTest, AveragesUpdatesEqually) {
    WeightVector out = engine_.merge({{2.0f, 0.0f}, {0.0f, 2.0f}}, std::nullopt, 1.0);
    EXPECT_EQ(out, (WeightVector{1.0f, 1.0f}));
}

TEST_F(AggregationEngineTest, BlendsWithBaseline) {
    WeightVector out = engine_.merge({{2.0f, 2.0f}}, WeightVector{0.0f, 0.0f}, 0.5);
    EXPECT_EQ(out, (WeightVector{1.0f, 1.0f}));
}

TEST_F(AggregationEngineTest, DefaultRateMovesTenPercent) {
    WeightVector out = engine_.merge({{10.0f}}, WeightVector{0.0f}, 0.1);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_NEAR(out[0], 1.0f, 1e-6);
}

TEST_F(AggregationEngineTest, ZeroRateReturnsBaselineUnchanged) {
    const WeightVector baseline = {0.1f, 0.2f, 0.3f};
    EXPECT_EQ(engine_.merge({{9.0f, 9.0f, 9.0f}}, baseline, 0.0), baseline);
}

TEST_F(AggregationEngineTest, FullRateReplacesBaseline) {
    const WeightVector u = {4.0f, -4.0f};
    EXPECT_EQ(engine_.merge({u}, WeightVector{1.0f, 1.0f}, 1.0), u);
}

TEST_F(AggregationEngineTest, NoUpdatesFails) {
    EXPECT_THROW(engine_.merge({}, std::nullopt, 0.5), NoUpdatesError);
    EXPECT_THROW(engine_.merge({}, WeightVector{1.0f}, 0.5), NoUpdatesError);
}

TEST_F(AggregationEngineTest, UnequalUpdatesFail) {
    EXPECT_THROW(engine_.merge({{1.0f, 2.0f}, {1.0f}}, std::nullopt, 0.5), ShapeMismatchError);
}

TEST_F(AggregationEngineTest, MismatchedBaselineFailsByDefault) {
    EXPECT_THROW(engine_.merge({{1.0f, 2.0f}}, WeightVector{1.0f, 2.0f, 3.0f}, 0.5), ShapeMismatchError);
}

TEST_F(AggregationEngineTest, IgnoreBaselinePolicyFallsBackToAverage) {
    AggregationEngine lenient(BaselineMismatchPolicy::IgnoreBaseline);
    WeightVector out = lenient.merge({{2.0f, 4.0f}, {4.0f, 2.0f}}, WeightVector{0.0f}, 0.5);
    EXPECT_EQ(out, (WeightVector{3.0f, 3.0f}));
}

TEST_F(AggregationEngineTest, IgnoreBaselinePolicyStillRejectsUnequalUpdates) {
    AggregationEngine lenient(BaselineMismatchPolicy::IgnoreBaseline);
    EXPECT_THROW(lenient.merge({{1.0f}, {1.0f, 2.0f}}, std::nullopt, 0.5), ShapeMismatchError);
}

TEST_F(AggregationEngineTest, LearningRateOutOfRangeFails) {
    EXPECT_THROW(engine_.merge({{1.0f}}, std::nullopt, -0.1), InvalidParameterError);
    EXPECT_THROW(engine_.merge({{1.0f}}, std::nullopt, 1.5), InvalidParameterError);
}

TEST_F(AggregationEngineTest, EmptyVectorsFail) {
    EXPECT_THROW(engine_.merge(std::vector<WeightVector>{WeightVector{}}, std::nullopt, 0.5), InvalidParameterError);
}

TEST_F(AggregationEngineTest, MeanOfManyUpdates) {
    std::vector<WeightVector> updates;
    for (int i = 1; i <= 4; ++i) {
        updates.push_back({static_cast<float>(i), static_cast<float>(-i)});
    }
    WeightVector mean = AggregationEngine::elementwise_mean(updates);
    EXPECT_NEAR(mean[0], 2.5f, 1e-6);
    EXPECT_NEAR(mean[1], -2.5f, 1e-6);
}

TEST(BaselineMismatchPolicyTest, ParsesNames) {
    EXPECT_EQ(parse_baseline_mismatch_policy("fail"), BaselineMismatchPolicy::Fail);
    EXPECT_EQ(parse_baseline_mismatch_policy("ignore_baseline"), BaselineMismatchPolicy::IgnoreBaseline);
    EXPECT_STREQ(baseline_mismatch_policy_name(BaselineMismatchPolicy::IgnoreBaseline), "ignore_baseline");
    EXPECT_THROW(parse_baseline_mismatch_policy("truncate"), InvalidParameterError);
}
