#include <gtest/gtest.h>
#include "AgentSuite.h"
#include "BaselineStore.h"
#include <memory>
#include <optional>
#include <stdexcept>

using namespace BehaviorSentinel;

namespace {

class FakeScorer : public IExternalScorer {
public:
    enum class Mode { Ok, Fail, Throw };

    explicit FakeScorer(Mode mode) : mode_(mode) {}

    ExternalScoreResult score(const FeatureMap& features) override {
        ++calls;
        lastFeatures = features;
        if (mode_ == Mode::Throw) {
            throw std::runtime_error("model process exited");
        }
        if (mode_ == Mode::Fail) {
            return ExternalScoreResult::failure("timeout");
        }
        ExternalScoreResult r;
        r.ok = true;
        r.score = 0.7;
        r.mse = 0.02;
        r.threshold = 0.05;
        return r;
    }

    std::string getName() const override { return "FakeScorer"; }

    int calls = 0;
    FeatureMap lastFeatures;

private:
    Mode mode_;
};

} // namespace

class AgentSuiteTest : public ::testing::Test {
protected:
    void SetUp() override {
        suite_ = std::make_unique<AgentSuite>(AgentSuite::Settings{}, [this]() { return now_; });
        ASSERT_TRUE(store_.initialize(":memory:").ok());
    }

    void swipe() {
        TouchAgent& touch = suite_->touch();
        touch.onTouchDown(0, 100.0f, 800.0f, 0.5f, 0.1f);
        now_ += 120;
        touch.onTouchMove(0, 110.0f, 550.0f, 0.5f, 0.1f);
        now_ += 120;
        touch.onTouchUp(0, 100.0f, 300.0f, 0.5f, 0.1f);
        now_ += 500;
    }

    static UsageAgent::State steadyUsage() {
        UsageAgent::State s;
        s.totalSessions = 10;
        s.inWarmup = false;
        return s;
    }

    int64_t now_ = 1700000000000;
    std::unique_ptr<AgentSuite> suite_;
    BaselineStore store_;
};

TEST_F(AgentSuiteTest, InactiveAgentsAreNotFused) {
    SuiteVerdict verdict = suite_->evaluate();
    EXPECT_DOUBLE_EQ(verdict.fusion.finalScore, 0.0);
    EXPECT_EQ(verdict.fusion.riskLevel, RiskLevel::LOW);
    EXPECT_EQ(verdict.fusion.explanations, std::vector<std::string>{"no signals available"});
    EXPECT_FALSE(verdict.alert.shouldAlert);
    EXPECT_EQ(verdict.touch.explanations(), std::vector<std::string>{"agent not active"});
    EXPECT_FALSE(verdict.external.has_value());
}

TEST_F(AgentSuiteTest, OnlyActiveAgentsContribute) {
    suite_->typing().start();
    SuiteVerdict verdict = suite_->evaluate();
    ASSERT_GE(verdict.fusion.explanations.size(), 3u);
    EXPECT_EQ(verdict.fusion.explanations[0], "typing normal");
    EXPECT_EQ(verdict.fusion.explanations[1], "typing-only fusion");
    EXPECT_EQ(verdict.fusion.timestampMs, now_);
}

TEST_F(AgentSuiteTest, UnknownAppRaisesHighRiskAlert) {
    suite_->usage().applyState(steadyUsage());
    suite_->usage().start();
    suite_->usage().onAppOpened("com.unknown");

    SuiteVerdict verdict = suite_->evaluate("unknown app");
    EXPECT_DOUBLE_EQ(verdict.usage.score(), 1.0);
    EXPECT_DOUBLE_EQ(verdict.fusion.finalScore, 10.0);
    EXPECT_EQ(verdict.fusion.riskLevel, RiskLevel::HIGH);
    EXPECT_TRUE(verdict.alert.shouldAlert);
    EXPECT_EQ(verdict.alert.riskLevel, RiskLevel::HIGH);

    now_ += 1000;
    EXPECT_FALSE(suite_->evaluate().alert.shouldAlert);
}

TEST_F(AgentSuiteTest, AttachedStoreRecordsEveryVerdict) {
    suite_->attachStore(&store_);
    suite_->typing().start();
    suite_->usage().start();
    suite_->evaluate();
    now_ += 5000;
    suite_->evaluate();

    auto logs = store_.recentScoreLogs(10);
    ASSERT_TRUE(logs.ok());
    ASSERT_EQ(logs->size(), 2u);
    const ScoreLogEntry& newest = logs->front();
    EXPECT_EQ(newest.timestampMs, now_);
    EXPECT_FALSE(newest.touch.has_value());
    ASSERT_TRUE(newest.typing.has_value());
    EXPECT_DOUBLE_EQ(*newest.typing, 0.0);
    ASSERT_TRUE(newest.usage.has_value());
    EXPECT_EQ(newest.risk, "LOW");

    suite_->attachStore(nullptr);
    suite_->evaluate();
    EXPECT_EQ(store_.recentScoreLogs(10)->size(), 2u);
}

TEST_F(AgentSuiteTest, SaveAndLoadStateThroughStore) {
    suite_->usage().applyState(steadyUsage());
    TypingAgent::State typing;
    typing.dwellMean = 95.5;
    typing.totalKeystrokes = 250;
    typing.isInWarmup = false;
    suite_->typing().applyState(typing);

    ASSERT_TRUE(suite_->saveState(store_).ok());

    AgentSuite restored(AgentSuite::Settings{}, [this]() { return now_; });
    EXPECT_EQ(restored.loadState(store_), 3u);
    EXPECT_EQ(restored.typing().exportState(), suite_->typing().exportState());
    EXPECT_EQ(restored.usage().exportState(), suite_->usage().exportState());
    EXPECT_EQ(restored.touch().exportState(), suite_->touch().exportState());
    EXPECT_FALSE(restored.typing().getState().isInWarmup);
}

TEST_F(AgentSuiteTest, LoadSkipsMissingAndMalformedRecords) {
    EXPECT_EQ(suite_->loadState(store_), 0u);

    ASSERT_TRUE(suite_->saveState(store_).ok());
    ASSERT_TRUE(store_.saveState(TypingAgent::AGENT_NAME, "v1,not,a,state", now_).ok());

    AgentSuite restored(AgentSuite::Settings{}, [this]() { return now_; });
    EXPECT_EQ(restored.loadState(store_), 2u);
    EXPECT_TRUE(restored.typing().getState().isInWarmup);
}

TEST_F(AgentSuiteTest, SaveFailsWhenStoreClosed) {
    store_.shutdown();
    auto saved = suite_->saveState(store_);
    ASSERT_FALSE(saved.ok());
    EXPECT_EQ(saved.error().code, ErrorCode::DatabaseError);
}

TEST_F(AgentSuiteTest, ExternalScoreReportedButNotFused) {
    auto scorer = std::make_shared<FakeScorer>(FakeScorer::Mode::Ok);
    suite_->setExternalScorer(scorer);
    suite_->touch().start();

    SuiteVerdict before = suite_->evaluate();
    EXPECT_FALSE(before.external.has_value());
    EXPECT_EQ(scorer->calls, 0);

    swipe();
    SuiteVerdict verdict = suite_->evaluate();
    ASSERT_TRUE(verdict.external.has_value());
    EXPECT_TRUE(verdict.external->ok);
    EXPECT_DOUBLE_EQ(verdict.external->score, 0.7);
    EXPECT_EQ(scorer->calls, 1);
    EXPECT_EQ(scorer->lastFeatures.count("avg_velocity"), 1u);
    EXPECT_DOUBLE_EQ(verdict.fusion.finalScore, 0.0);
}

TEST_F(AgentSuiteTest, FailingExternalScorerIsTreatedAsAbsent) {
    auto scorer = std::make_shared<FakeScorer>(FakeScorer::Mode::Fail);
    suite_->setExternalScorer(scorer);
    suite_->touch().start();
    swipe();

    SuiteVerdict verdict = suite_->evaluate();
    EXPECT_EQ(scorer->calls, 1);
    EXPECT_FALSE(verdict.external.has_value());
}

TEST_F(AgentSuiteTest, ThrowingExternalScorerIsTreatedAsAbsent) {
    auto scorer = std::make_shared<FakeScorer>(FakeScorer::Mode::Throw);
    suite_->setExternalScorer(scorer);
    suite_->touch().start();
    swipe();

    std::optional<ExternalScoreResult> external;
    EXPECT_NO_THROW(external = suite_->evaluate().external);
    EXPECT_EQ(scorer->calls, 1);
    EXPECT_FALSE(external.has_value());
}

TEST_F(AgentSuiteTest, StopAllExcludesEveryAgent) {
    suite_->startAll();
    EXPECT_TRUE(suite_->touch().isActive());
    suite_->stopAll();
    EXPECT_FALSE(suite_->usage().isActive());
    EXPECT_EQ(suite_->evaluate().fusion.explanations, std::vector<std::string>{"no signals available"});
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
