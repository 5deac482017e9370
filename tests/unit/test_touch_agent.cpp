#include <gtest/gtest.h>
#include "TouchAgent.h"
#include "TouchFeatureCsvExporter.h"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>

using namespace BehaviorSentinel;
namespace fs = std::filesystem;

class TouchAgentTest : public ::testing::Test {
protected:
    void SetUp() override {
        agent_ = std::make_unique<TouchAgent>(TouchAgent::Settings{}, [this]() { return now_; });
    }

    // Curved swipe: 4 steps along -y with a sine bulge along x.
    void curvedSwipe(int64_t durationMs = 300, double wobble = 10.0, float pressure = 0.5f) {
        agent_->onTouchDown(0, 0.0f, 0.0f, pressure, 0.1f);
        for (int i = 1; i < 4; ++i) {
            now_ += durationMs / 4;
            float x = static_cast<float>(wobble * std::sin(3.14159265358979 * i / 4.0));
            agent_->onTouchMove(0, x, -100.0f * i, pressure, 0.1f);
        }
        now_ += durationMs - 3 * (durationMs / 4);
        agent_->onTouchUp(0, 0.0f, -400.0f, pressure, 0.1f);
        now_ += 500;
    }

    // Straight swipe along x with one interior sample.
    void straightSwipe(int64_t durationMs, float length = 200.0f, float pressure = 0.5f) {
        agent_->onTouchDown(0, 0.0f, 0.0f, pressure, 0.1f);
        now_ += durationMs / 2;
        agent_->onTouchMove(0, length / 2, 0.0f, pressure, 0.1f);
        now_ += durationMs - durationMs / 2;
        agent_->onTouchUp(0, length, 0.0f, pressure, 0.1f);
        now_ += 500;
    }

    static bool contains(const std::vector<std::string>& items, const std::string& value) {
        return std::find(items.begin(), items.end(), value) != items.end();
    }

    int64_t now_ = 1000000;
    std::unique_ptr<TouchAgent> agent_;
};

TEST_F(TouchAgentTest, InactiveAgentReportsNotActive) {
    auto result = agent_->getResult();
    EXPECT_DOUBLE_EQ(result.score(), 0.0);
    EXPECT_EQ(result.explanations(), std::vector<std::string>{"agent not active"});
    EXPECT_EQ(result.timestampMs(), now_);
}

TEST_F(TouchAgentTest, EventsIgnoredWhileInactive) {
    curvedSwipe();
    EXPECT_EQ(agent_->totalGestures(), 0);
    EXPECT_EQ(agent_->windowCount(), 0u);
    EXPECT_FALSE(agent_->latestFeatures().has_value());
}

TEST_F(TouchAgentTest, StopReportsNotActive) {
    agent_->start();
    for (int i = 0; i < 8; ++i) curvedSwipe();
    agent_->stop();
    EXPECT_FALSE(agent_->isActive());
    EXPECT_EQ(agent_->getResult().explanations(), std::vector<std::string>{"agent not active"});
}

TEST_F(TouchAgentTest, WarmupReportsInsufficientData) {
    agent_->start();
    for (int i = 0; i < 4; ++i) curvedSwipe();

    auto result = agent_->getResult();
    EXPECT_DOUBLE_EQ(result.score(), 0.0);
    EXPECT_EQ(result.explanations(), std::vector<std::string>{"insufficient data for analysis"});
    EXPECT_TRUE(agent_->isInWarmup());

    curvedSwipe();
    EXPECT_FALSE(agent_->isInWarmup());
    EXPECT_NE(agent_->getResult().explanations(), std::vector<std::string>{"insufficient data for analysis"});
}

TEST_F(TouchAgentTest, GestureEndingWarmupIsNotLearned) {
    agent_->start();
    for (int i = 0; i < 5; ++i) curvedSwipe();
    EXPECT_DOUBLE_EQ(agent_->getState().avgVelocity, 0.0);

    curvedSwipe();
    EXPECT_GT(agent_->getState().avgVelocity, 0.0);
    EXPECT_EQ(agent_->totalGestures(), 6);
}

TEST_F(TouchAgentTest, LinearSwipesTriggerLinearityBonus) {
    agent_->start();
    for (int64_t d : {100, 150, 200, 250, 300}) {
        straightSwipe(d);
    }
    EXPECT_DOUBLE_EQ(agent_->botPatternScore(), 0.5);
}

TEST_F(TouchAgentTest, CurvedSwipesBelowThresholdSuppressBonus) {
    agent_->start();
    for (int64_t d : {100, 150, 200, 250}) {
        straightSwipe(d);
    }
    curvedSwipe(600);
    // 4 of 5 is not more than 80%
    EXPECT_DOUBLE_EQ(agent_->botPatternScore(), 0.0);
}

TEST_F(TouchAgentTest, FewerThanFiveGesturesNeverBot) {
    agent_->start();
    for (int i = 0; i < 4; ++i) straightSwipe(20);
    EXPECT_DOUBLE_EQ(agent_->botPatternScore(), 0.0);
}

TEST_F(TouchAgentTest, FastIdenticalLinearSwipesSaturate) {
    agent_->start();
    for (int i = 0; i < 6; ++i) straightSwipe(20);
    EXPECT_DOUBLE_EQ(agent_->botPatternScore(), 1.0);
}

TEST_F(TouchAgentTest, ConsistentBehaviourScoresNormal) {
    agent_->start();
    for (int i = 0; i < 50; ++i) curvedSwipe();

    auto result = agent_->getResult();
    EXPECT_LT(result.score(), 0.3);
    EXPECT_EQ(result.explanations(), std::vector<std::string>{"normal touch behavior patterns"});
}

TEST_F(TouchAgentTest, RoboticSwipesRaiseScore) {
    agent_->start();
    for (int i = 0; i < 50; ++i) curvedSwipe();
    double trained = agent_->getResult().score();
    agent_->stop();
    agent_->start();

    // Baselines keep learning after warmup, so five gestures land in the moderate band.
    for (int i = 0; i < 5; ++i) straightSwipe(40, 800.0f, 1.0f);

    EXPECT_DOUBLE_EQ(agent_->botPatternScore(), 1.0);
    auto result = agent_->getResult();
    EXPECT_GT(result.score(), trained);
    EXPECT_GT(result.score(), 0.3);
    EXPECT_LT(result.score(), 0.6);
    EXPECT_TRUE(contains(result.explanations(), "moderate touch behavior anomalies detected"));
    EXPECT_TRUE(contains(result.explanations(), "unusual gesture velocity patterns"));
    EXPECT_TRUE(contains(result.explanations(), "irregular swipe curvature"));
}

TEST_F(TouchAgentTest, LinearFastSwipesAgainstRestoredProfileScoreHigh) {
    TouchAgent::State profile;
    profile.avgVelocity = 1.3;
    profile.avgVelocityVar = 0.04;
    profile.peakVelocity = 2.0;
    profile.peakVelocityVar = 0.25;
    profile.pathDeviation = 7.0;
    profile.pathDeviationVar = 4.0;
    profile.jitter = 4.0;
    profile.jitterVar = 1.0;
    profile.pressureProfile = 0.5;
    profile.pressureProfileVar = 0.01;
    profile.isInWarmup = true;
    agent_->applyState(profile);
    agent_->start();

    // Warmup gestures are not learned, so they are scored against the restored profile.
    for (int i = 0; i < 5; ++i) straightSwipe(40, 800.0f, 1.0f);

    EXPECT_FALSE(agent_->isInWarmup());
    EXPECT_EQ(agent_->getState().avgVelocity, 1.3);
    EXPECT_DOUBLE_EQ(agent_->botPatternScore(), 1.0);

    auto result = agent_->getResult();
    EXPECT_NEAR(result.score(), 0.85, 1e-9);
    EXPECT_EQ(result.explanations(),
              (std::vector<std::string>{"significant touch behavior anomalies",
                                        "robotic touch patterns detected",
                                        "highly irregular gesture dynamics",
                                        "suspiciously linear touch paths"}));
}

TEST_F(TouchAgentTest, GetResultIsIdempotent) {
    agent_->start();
    for (int i = 0; i < 20; ++i) curvedSwipe(200 + 10 * i, 5.0 + i);

    auto first = agent_->getResult();
    auto second = agent_->getResult();
    EXPECT_EQ(first.score(), second.score());
    EXPECT_EQ(first.explanations(), second.explanations());
}

TEST_F(TouchAgentTest, StopKeepsBaselines) {
    agent_->start();
    for (int i = 0; i < 10; ++i) curvedSwipe();
    auto before = agent_->getState();

    agent_->stop();
    EXPECT_EQ(agent_->windowCount(), 0u);
    auto after = agent_->getState();
    EXPECT_EQ(after.avgVelocity, before.avgVelocity);
    EXPECT_EQ(after.totalGestures, 10);
    EXPECT_FALSE(after.isInWarmup);
}

TEST_F(TouchAgentTest, ResetReturnsToWarmup) {
    agent_->start();
    for (int i = 0; i < 10; ++i) curvedSwipe();

    agent_->resetBaseline();
    auto state = agent_->getState();
    EXPECT_TRUE(state.isInWarmup);
    EXPECT_EQ(state.totalGestures, 0);
    EXPECT_DOUBLE_EQ(state.avgVelocity, 0.0);
    EXPECT_DOUBLE_EQ(state.pathDeviationVar, 0.0);
    EXPECT_EQ(agent_->windowCount(), 0u);

    for (int i = 0; i < 4; ++i) curvedSwipe();
    EXPECT_EQ(agent_->getResult().explanations(), std::vector<std::string>{"insufficient data for analysis"});
    curvedSwipe();
    EXPECT_FALSE(agent_->isInWarmup());
}

TEST_F(TouchAgentTest, TaggedDispatch) {
    agent_->start();
    agent_->add(TouchPhase::DOWN, 3, 10.0f, 10.0f, 0.4f, 0.1f);
    now_ += 80;
    agent_->add(TouchPhase::UP, 3, 12.0f, 11.0f, 0.4f, 0.1f);

    auto latest = agent_->latestFeatures();
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->type, GestureType::TAP);
    EXPECT_EQ(latest->pointerId, 3);
    EXPECT_EQ(latest->durationMs(), 80);
}

TEST_F(TouchAgentTest, ListenersReceiveFeatures) {
    agent_->start();
    std::vector<GestureFeatures> seen;
    auto id = agent_->addFeatureListener([&](const GestureFeatures& f) { seen.push_back(f); });

    curvedSwipe();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].type, GestureType::SWIPE);
    EXPECT_GT(seen[0].pathDeviation, 1.0);

    EXPECT_TRUE(agent_->removeFeatureListener(id));
    EXPECT_FALSE(agent_->removeFeatureListener(id));
    curvedSwipe();
    EXPECT_EQ(seen.size(), 1u);
}

TEST_F(TouchAgentTest, ThrowingListenerDoesNotStopOthers) {
    agent_->start();
    int calls = 0;
    agent_->addFeatureListener([](const GestureFeatures&) { throw std::runtime_error("sink full"); });
    agent_->addFeatureListener([&](const GestureFeatures&) { ++calls; });

    curvedSwipe();
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(agent_->totalGestures(), 1);
}

TEST_F(TouchAgentTest, ListenerMayQueryAgent) {
    agent_->start();
    int64_t observed = -1;
    agent_->addFeatureListener([&](const GestureFeatures&) { observed = agent_->totalGestures(); });
    curvedSwipe();
    EXPECT_EQ(observed, 1);
}

TEST_F(TouchAgentTest, CsvExporterWritesHeaderAndRows) {
    auto dir = fs::temp_directory_path() / "behavior_sentinel_touch_csv";
    fs::remove_all(dir);

    std::string path;
    {
        auto exporter = TouchFeatureCsvExporter::create(dir.string(), "session");
        ASSERT_TRUE(exporter.ok()) << exporter.error().message;
        path = (*exporter)->path();
        EXPECT_NE(path.find("session_touch_features_"), std::string::npos);

        auto id = agent_->addFeatureListener((*exporter)->listener());
        agent_->start();
        curvedSwipe();
        curvedSwipe();
        EXPECT_EQ((*exporter)->rowsWritten(), 2u);
        agent_->removeFeatureListener(id);
    }

    std::ifstream in(path);
    std::string header;
    std::getline(in, header);
    EXPECT_EQ(header, GestureFeatures::csvHeader());
    int rows = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) ++rows;
    }
    EXPECT_EQ(rows, 2);

    fs::remove_all(dir);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
