#include <gtest/gtest.h>
#include "chunkflow/transfer/transfer_analytics.hpp"
#include <thread>

using namespace chunkflow::transfer;

class TransferAnalyticsTest : public ::testing::Test {
protected:
    TransferAnalytics analytics;
};

TEST_F(TransferAnalyticsTest, StartTracking) {
    analytics.start_tracking("t1", 1000);
    
    ASSERT_TRUE(analytics.is_tracking("t1"));
    auto stats = analytics.get_stats("t1");
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->total_bytes, 1000u);
    EXPECT_EQ(stats->transferred_bytes, 0u);
    EXPECT_FALSE(stats->end_time.has_value());
}

TEST_F(TransferAnalyticsTest, ReportForCompletedTransfer) {
    analytics.start_tracking("t1", 1000);
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    analytics.update_progress("t1", 500, 100.0);
    analytics.complete("t1");
    
    auto stats = analytics.get_stats("t1");
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->transferred_bytes, 500u);
    EXPECT_GE(stats->peak_speed, 100.0);
    EXPECT_GT(stats->average_speed, 0.0);
    EXPECT_TRUE(stats->end_time.has_value());
    
    auto report = analytics.get_report("t1");
    EXPECT_NE(report.find("Transfer Report"), std::string::npos);
    EXPECT_NE(report.find("Transferred: 500 / 1000 bytes"), std::string::npos);
    EXPECT_NE(report.find("Retransmissions: 0"), std::string::npos);
    EXPECT_NE(report.find("Errors: 0"), std::string::npos);
    EXPECT_NE(report.find("Efficiency: 100.00%"), std::string::npos);
}

TEST_F(TransferAnalyticsTest, PeakSpeedIsHighWaterMark) {
    analytics.start_tracking("t1", 10000);
    analytics.update_progress("t1", 1000, 300.0);
    analytics.update_progress("t1", 1000, 900.0);
    analytics.update_progress("t1", 1000, 200.0);
    
    auto stats = analytics.get_stats("t1");
    ASSERT_TRUE(stats.has_value());
    EXPECT_DOUBLE_EQ(stats->peak_speed, 900.0);
    EXPECT_EQ(stats->transferred_bytes, 3000u);
}

TEST_F(TransferAnalyticsTest, EfficiencyChargesRetransmissions) {
    analytics.start_tracking("t1", 1000);
    for (int i = 0; i < 4; ++i) {
        analytics.record_retransmission("t1");
    }
    analytics.record_error("t1");
    
    // 1000 / (1000 + 4 * 1024)
    EXPECT_NEAR(analytics.get_efficiency("t1"), 1000.0 / 5096.0, 1e-9);
    
    auto report = analytics.get_report("t1");
    EXPECT_NE(report.find("Retransmissions: 4"), std::string::npos);
    EXPECT_NE(report.find("Errors: 1"), std::string::npos);
    EXPECT_NE(report.find("Efficiency: 19.62%"), std::string::npos);
}

TEST_F(TransferAnalyticsTest, RetransmissionCostConfigurable) {
    TransferAnalytics custom(250);
    EXPECT_EQ(custom.get_retransmission_cost(), 250u);
    
    custom.start_tracking("t1", 1000);
    custom.record_retransmission("t1");
    custom.record_retransmission("t1");
    custom.record_retransmission("t1");
    custom.record_retransmission("t1");
    
    EXPECT_DOUBLE_EQ(custom.get_efficiency("t1"), 0.5);
    
    custom.set_retransmission_cost(0);
    EXPECT_DOUBLE_EQ(custom.get_efficiency("t1"), 1.0);
}

TEST_F(TransferAnalyticsTest, UnknownIdsIgnored) {
    analytics.update_progress("ghost", 100, 50.0);
    analytics.record_retransmission("ghost");
    analytics.record_error("ghost");
    analytics.complete("ghost");
    
    EXPECT_FALSE(analytics.is_tracking("ghost"));
    EXPECT_FALSE(analytics.get_stats("ghost").has_value());
    EXPECT_EQ(analytics.get_report("ghost"), "No data");
    EXPECT_EQ(analytics.size(), 0u);
}

TEST_F(TransferAnalyticsTest, CompleteStampsEndTimeOnce) {
    analytics.start_tracking("t1", 100);
    analytics.complete("t1");
    auto first = analytics.get_stats("t1")->end_time;
    
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    analytics.complete("t1");
    auto second = analytics.get_stats("t1")->end_time;
    
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, *second);
}

TEST_F(TransferAnalyticsTest, Discard) {
    analytics.start_tracking("t1", 100);
    analytics.start_tracking("t2", 200);
    analytics.discard("t1");
    
    EXPECT_FALSE(analytics.is_tracking("t1"));
    EXPECT_TRUE(analytics.is_tracking("t2"));
    EXPECT_EQ(analytics.size(), 1u);
    
    // Late events for a discarded record are dropped
    analytics.update_progress("t1", 50, 10.0);
    EXPECT_FALSE(analytics.is_tracking("t1"));
}

TEST_F(TransferAnalyticsTest, EmptyTransferIsFullyEfficient) {
    analytics.start_tracking("empty", 0);
    EXPECT_DOUBLE_EQ(analytics.get_efficiency("empty"), 1.0);
}

TEST_F(TransferAnalyticsTest, DisplayProgressEasesTowardMeasured) {
    analytics.start_tracking("t1", 1000);
    
    auto initial = analytics.get_display_progress("t1");
    ASSERT_TRUE(initial.has_value());
    EXPECT_DOUBLE_EQ(initial->progress, 0.0);
    
    // Half done in one update, but the display moves at most 5%
    analytics.update_progress("t1", 500, 100.0);
    auto eased = analytics.get_display_progress("t1");
    ASSERT_TRUE(eased.has_value());
    EXPECT_DOUBLE_EQ(eased->progress, 0.05);
    EXPECT_DOUBLE_EQ(eased->speed, 15.0);
    
    analytics.update_progress("t1", 0, 100.0);
    EXPECT_DOUBLE_EQ(analytics.get_display_progress("t1")->progress, 0.10);
    
    analytics.complete("t1");
    auto done = analytics.get_display_progress("t1");
    EXPECT_DOUBLE_EQ(done->progress, 1.0);
    EXPECT_DOUBLE_EQ(done->eta_seconds, 0.0);
}

TEST_F(TransferAnalyticsTest, DisplayProgressFollowsRecordLifetime) {
    EXPECT_FALSE(analytics.get_display_progress("ghost").has_value());
    
    analytics.start_tracking("t1", 100);
    analytics.update_progress("t1", 100, 10.0);
    analytics.discard("t1");
    EXPECT_FALSE(analytics.get_display_progress("t1").has_value());
    
    // Restarting a transfer starts the display over
    analytics.start_tracking("t1", 100);
    EXPECT_DOUBLE_EQ(analytics.get_display_progress("t1")->progress, 0.0);
}

TEST_F(TransferAnalyticsTest, RetransmissionCostSafeAcrossThreads) {
    analytics.start_tracking("t1", 1000);
    
    std::thread writer([this] {
        for (std::uint64_t i = 0; i < 10000; ++i) {
            analytics.set_retransmission_cost(i % 2 == 0 ? 100 : 200);
        }
    });
    
    for (int i = 0; i < 10000; ++i) {
        auto cost = analytics.get_retransmission_cost();
        EXPECT_TRUE(cost == TransferAnalytics::DEFAULT_RETRANSMISSION_COST || cost == 100u || cost == 200u);
    }
    writer.join();
    
    EXPECT_EQ(analytics.get_retransmission_cost(), 200u);
}
