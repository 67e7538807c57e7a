#include <gtest/gtest.h>
#include "transport/congestion_controller.hpp"
#include "system/logger.hpp"

using namespace nocturne;
using namespace nocturne::transport;

class CongestionControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::initialize("test_congestion_controller.log", Logger::Level::Debug, false);
    }

    void TearDown() override {
        Logger::shutdown();
    }

    QueueSettings settings_;
};

TEST_F(CongestionControllerTest, UnknownPeerIsIdle) {
    CongestionController controller(settings_);

    auto state = controller.stateFor("nobody");
    EXPECT_EQ(state.consecutiveFailures, 0u);
    EXPECT_EQ(state.backoffMs, 0u);
    EXPECT_EQ(controller.readyAt("nobody"), std::chrono::steady_clock::time_point::min());
    EXPECT_EQ(controller.qualityFor("nobody", 0), ConnectionQuality::Excellent);
    EXPECT_FALSE(controller.isCongested("nobody"));
}

TEST_F(CongestionControllerTest, BackoffGrowsWithStreakAndIsCapped) {
    CongestionController controller(settings_);

    controller.recordFailure("peer");
    EXPECT_EQ(controller.backoffFor("peer").count(), 50);
    controller.recordFailure("peer");
    EXPECT_EQ(controller.backoffFor("peer").count(), 100);
    controller.recordFailure("peer");
    EXPECT_EQ(controller.backoffFor("peer").count(), 150);

    for (int i = 0; i < 30; ++i) {
        controller.recordFailure("peer");
    }
    EXPECT_EQ(controller.backoffFor("peer").count(), 1000);
    EXPECT_EQ(controller.stateFor("peer").totalFailures, 33u);
}

TEST_F(CongestionControllerTest, SuccessRecoversGradually) {
    CongestionController controller(settings_);

    controller.recordFailure("peer");
    controller.recordFailure("peer");
    ASSERT_EQ(controller.stateFor("peer").backoffMs, 100u);

    controller.recordSuccess("peer");
    auto state = controller.stateFor("peer");
    EXPECT_EQ(state.consecutiveFailures, 1u);
    EXPECT_EQ(state.backoffMs, 90u);

    for (int i = 0; i < 20; ++i) {
        controller.recordSuccess("peer");
    }
    state = controller.stateFor("peer");
    EXPECT_EQ(state.consecutiveFailures, 0u);
    EXPECT_EQ(state.backoffMs, 0u);
    EXPECT_EQ(state.totalSuccesses, 21u);
}

TEST_F(CongestionControllerTest, ReadyAtIsLastFailurePlusBackoff) {
    CongestionController controller(settings_);
    controller.recordFailure("peer");

    auto state = controller.stateFor("peer");
    EXPECT_EQ(controller.readyAt("peer"), state.lastFailure + std::chrono::milliseconds(50));
    EXPECT_GT(controller.readyAt("peer"), std::chrono::steady_clock::now());
}

TEST_F(CongestionControllerTest, QualityFromFailureStreak) {
    CongestionController controller(settings_);

    controller.recordFailure("peer");
    EXPECT_EQ(controller.qualityFor("peer", 0), ConnectionQuality::Good);

    controller.recordFailure("peer");
    controller.recordFailure("peer");
    EXPECT_EQ(controller.qualityFor("peer", 0), ConnectionQuality::Fair);
    EXPECT_TRUE(controller.isCongested("peer"));

    controller.recordFailure("peer");
    controller.recordFailure("peer");
    EXPECT_EQ(controller.qualityFor("peer", 0), ConnectionQuality::Poor);
}

TEST_F(CongestionControllerTest, QualityFromQueueFill) {
    CongestionController controller(settings_);

    // total capacity 350
    EXPECT_EQ(controller.qualityFor("peer", 69), ConnectionQuality::Excellent);
    EXPECT_EQ(controller.qualityFor("peer", 70), ConnectionQuality::Good);
    EXPECT_EQ(controller.qualityFor("peer", 175), ConnectionQuality::Fair);
    EXPECT_EQ(controller.qualityFor("peer", 263), ConnectionQuality::Poor);
}

TEST_F(CongestionControllerTest, PeersAreIndependent) {
    CongestionController controller(settings_);
    for (int i = 0; i < 6; ++i) {
        controller.recordFailure("a");
    }

    EXPECT_EQ(controller.qualityFor("a", 0), ConnectionQuality::Poor);
    EXPECT_EQ(controller.qualityFor("b", 0), ConnectionQuality::Excellent);

    controller.removePeer("a");
    EXPECT_EQ(controller.qualityFor("a", 0), ConnectionQuality::Excellent);
}

TEST_F(CongestionControllerTest, UpdateSettingsAppliesToNextFailure) {
    CongestionController controller(settings_);

    QueueSettings faster = settings_;
    faster.baseBackoffMs = 5;
    controller.updateSettings(faster);

    controller.recordFailure("peer");
    EXPECT_EQ(controller.backoffFor("peer").count(), 5);
}
