#include <gtest/gtest.h>
#include "ResponsePolicy.h"

using namespace BehaviorSentinel;

namespace {

FusionResult verdict(double score) {
    FusionResult r;
    r.finalScore = score;
    r.riskLevel = FusionEngine::determineRiskLevel(score);
    return r;
}

} // namespace

class ResponsePolicyTest : public ::testing::Test {
protected:
    int64_t now_ = 0;
    ResponsePolicy policy_{ResponsePolicy::Settings{}, [this]() { return now_; }};
};

TEST_F(ResponsePolicyTest, ActionsPerLevel) {
    EXPECT_STREQ(ResponsePolicy::actionFor(RiskLevel::LOW), "Continue normal operation");
    EXPECT_STREQ(ResponsePolicy::actionFor(RiskLevel::MEDIUM), "Request biometric verification");
    EXPECT_STREQ(ResponsePolicy::actionFor(RiskLevel::HIGH), "Lock account and alert security team");
}

TEST_F(ResponsePolicyTest, LowNeverAlerts) {
    auto decision = policy_.evaluate(verdict(0.2));
    EXPECT_FALSE(decision.shouldAlert);
    EXPECT_EQ(decision.riskLevel, RiskLevel::LOW);
    EXPECT_EQ(decision.action, "Continue normal operation");
}

TEST_F(ResponsePolicyTest, FirstElevatedVerdictAlerts) {
    auto decision = policy_.evaluate(verdict(0.5));
    EXPECT_TRUE(decision.shouldAlert);
    EXPECT_EQ(decision.riskLevel, RiskLevel::MEDIUM);
    EXPECT_EQ(decision.action, "Request biometric verification");
}

TEST_F(ResponsePolicyTest, RepeatWithinIntervalSuppressed) {
    EXPECT_TRUE(policy_.evaluate(verdict(0.5)).shouldAlert);
    now_ += 1000;
    EXPECT_FALSE(policy_.evaluate(verdict(0.5)).shouldAlert);
    // A level change still waits for the interval.
    EXPECT_FALSE(policy_.evaluate(verdict(5.0)).shouldAlert);

    now_ += 60000;
    EXPECT_TRUE(policy_.evaluate(verdict(5.0)).shouldAlert);
}

TEST_F(ResponsePolicyTest, SameLevelNeedsScoreJump) {
    EXPECT_TRUE(policy_.evaluate(verdict(0.5)).shouldAlert);
    now_ += 61000;
    EXPECT_FALSE(policy_.evaluate(verdict(0.55)).shouldAlert);
    EXPECT_TRUE(policy_.evaluate(verdict(0.7)).shouldAlert);
}

TEST_F(ResponsePolicyTest, LowVerdictForgetsLevel) {
    EXPECT_TRUE(policy_.evaluate(verdict(0.6)).shouldAlert);
    now_ += 61000;
    EXPECT_FALSE(policy_.evaluate(verdict(0.1)).shouldAlert);
    EXPECT_TRUE(policy_.evaluate(verdict(0.6)).shouldAlert);
}

TEST_F(ResponsePolicyTest, ResetAllowsImmediateAlert) {
    EXPECT_TRUE(policy_.evaluate(verdict(8.0)).shouldAlert);
    policy_.reset();
    EXPECT_TRUE(policy_.evaluate(verdict(8.0)).shouldAlert);
}

TEST_F(ResponsePolicyTest, SettingsFromConfig) {
    Config config;
    config.setInt("response.min_alert_interval_ms", 0);
    config.setDouble("response.min_score_delta", 0.5);
    auto settings = ResponsePolicy::Settings::fromConfig(config);
    EXPECT_EQ(settings.minAlertIntervalMs, 0);
    EXPECT_DOUBLE_EQ(settings.minScoreDelta, 0.5);

    ResponsePolicy policy(settings, [this]() { return now_; });
    EXPECT_TRUE(policy.evaluate(verdict(0.5)).shouldAlert);
    EXPECT_FALSE(policy.evaluate(verdict(0.6)).shouldAlert);
    EXPECT_TRUE(policy.evaluate(verdict(1.1)).shouldAlert);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
