#include <gtest/gtest.h>
#include <stall_reporter.hpp>
#include <rdzv_protocol.h>

#include <chrono>

using namespace std::chrono_literals;

TEST(StallReporterTest, SnapshotOmitsRanksWithoutArrival) {
    const auto now = rdzv::SyncClock::now();
    const std::vector<std::optional<rdzv::SyncClock::time_point>> arrivals{
        std::nullopt, now - 2s, now - 1500ms
    };
    const rdzv::ElapsedSnapshot snapshot = rdzv::StallReporter::elapsedSnapshot(arrivals, now);
    ASSERT_EQ(snapshot.size(), 3);
    EXPECT_FALSE(snapshot[0].has_value());
    ASSERT_TRUE(snapshot[1].has_value());
    EXPECT_NEAR(*snapshot[1], 2.0, 1e-6);
    ASSERT_TRUE(snapshot[2].has_value());
    EXPECT_NEAR(*snapshot[2], 1.5, 1e-6);
}

TEST(StallReporterTest, WarningListsReportedRanksOnly) {
    const rdzv::StallReporter reporter(5.0, 1.0);
    const rdzv::ElapsedSnapshot snapshot{std::nullopt, 1.25, 1.0};
    const std::string message = reporter.formatStallWarning(3, snapshot);

    EXPECT_NE(message.find("not been called by all 3 workers"), std::string::npos) << message;
    EXPECT_NE(message.find("{1: 1.25, 2: 1.00}"), std::string::npos) << message;
    EXPECT_EQ(message.find("0: "), std::string::npos) << message;
    EXPECT_NE(message.find(RDZV_BARRIER_WARN_INTERVAL_S_ENV_VAR), std::string::npos) << message;
    EXPECT_NE(message.find("current value: 1 seconds"), std::string::npos) << message;
}

TEST(StallReporterTest, WarningWithoutReportedRanks) {
    const rdzv::StallReporter reporter(5.0, 60.0);
    const std::string message = reporter.formatStallWarning(2, {std::nullopt, std::nullopt});
    EXPECT_NE(message.find("{}"), std::string::npos) << message;
    EXPECT_NE(message.find("current value: 60 seconds"), std::string::npos) << message;
}

TEST(StallReporterTest, TimeoutFailureCarriesSnapshot) {
    const rdzv::StallReporter reporter(1.0, 60.0);
    const rdzv::ElapsedSnapshot snapshot{1.0, std::nullopt};
    const rdzv::SyncFailureInfo failure = reporter.makeTimeoutFailure(2, snapshot);

    EXPECT_EQ(failure.code, rdzv::SYNC_BROADCAST_TIMEOUT);
    EXPECT_EQ(failure.expected_world_size, 2);
    EXPECT_DOUBLE_EQ(failure.timeout_s, 1.0);
    ASSERT_EQ(failure.elapsed_s_per_rank.size(), 2);
    EXPECT_TRUE(failure.elapsed_s_per_rank[0].has_value());
    EXPECT_FALSE(failure.elapsed_s_per_rank[1].has_value());

    const std::string description = failure.describe();
    EXPECT_NE(description.find("1: not reported"), std::string::npos) << description;
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
