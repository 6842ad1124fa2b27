#include <gtest/gtest.h>
#include <sync_service.hpp>

#include <chrono>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

using rdzv::SynchronizationService;
using rdzv::SyncFailureInfo;
using rdzv::SyncResultCode;
using rdzv::SyncServiceConfig;

struct BroadcastOutcome {
    SyncResultCode code = rdzv::SYNC_SUCCESS;
    std::optional<std::string> data{};
    SyncFailureInfo failure{};
};

template<typename T>
static void awaitCounter(const SynchronizationService<T> &service, const uint32_t counter) {
    for (int i = 0; i < 500 && service.getCounter() != counter; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    ASSERT_EQ(service.getCounter(), counter);
}

static std::thread launchBroadcast(SynchronizationService<std::string> &service,
                                   const uint32_t world_rank, const uint32_t world_size,
                                   const std::string &data, BroadcastOutcome &outcome) {
    return std::thread([&service, world_rank, world_size, data, &outcome] {
        outcome.code = service.broadcastFromRankZero(world_rank, world_size, data, outcome.data, &outcome.failure);
    });
}

TEST(SyncServiceTest, AllRanksReceiveRankZeroPayload) {
    for (uint32_t world_size = 1; world_size <= 8; ++world_size) {
        SynchronizationService<std::string> service{};
        std::vector<BroadcastOutcome> outcomes(world_size);
        std::vector<std::thread> threads{};
        for (uint32_t rank = 0; rank < world_size; ++rank) {
            threads.push_back(launchBroadcast(service, rank, world_size, "payload-of-" + std::to_string(rank),
                                              outcomes[rank]));
        }
        for (auto &thread: threads) {
            thread.join();
        }
        for (uint32_t rank = 0; rank < world_size; ++rank) {
            EXPECT_EQ(outcomes[rank].code, rdzv::SYNC_SUCCESS) << "world size " << world_size << ", rank " << rank;
            EXPECT_EQ(outcomes[rank].data, "payload-of-0") << "world size " << world_size << ", rank " << rank;
        }
        EXPECT_EQ(service.getCounter(), 0);
        EXPECT_EQ(service.getWorldSize(), 0);
        EXPECT_FALSE(service.getReducedData().has_value());
    }
}

TEST(SyncServiceTest, RankZeroArrivingLastReleasesRound) {
    SynchronizationService<std::string> service{};
    BroadcastOutcome rank1{}, rank2{};
    std::thread t1 = launchBroadcast(service, 1, 3, "", rank1);
    std::thread t2 = launchBroadcast(service, 2, 3, "", rank2);
    awaitCounter(service, 2);
    EXPECT_EQ(service.getWorldSize(), 3);
    EXPECT_FALSE(service.getReducedData().has_value());

    std::optional<std::string> data{};
    EXPECT_EQ(service.broadcastFromRankZero(0, 3, "ckpt", data), rdzv::SYNC_SUCCESS);
    EXPECT_EQ(data, "ckpt");
    t1.join();
    t2.join();
    EXPECT_EQ(rank1.data, "ckpt");
    EXPECT_EQ(rank2.data, "ckpt");
    EXPECT_EQ(service.getCounter(), 0);
}

TEST(SyncServiceTest, WorldSizeMismatchFailsOnlyTheLateCaller) {
    SynchronizationService<std::string> service{};
    BroadcastOutcome rank1{};
    std::thread t1 = launchBroadcast(service, 1, 3, "", rank1);
    awaitCounter(service, 1);

    std::optional<std::string> data{};
    SyncFailureInfo failure{};
    EXPECT_EQ(service.broadcastFromRankZero(0, 2, "wrong", data, &failure), rdzv::SYNC_WORLD_SIZE_MISMATCH);
    EXPECT_FALSE(data.has_value());
    EXPECT_EQ(failure.code, rdzv::SYNC_WORLD_SIZE_MISMATCH);
    EXPECT_EQ(failure.expected_world_size, 3);
    EXPECT_EQ(failure.provided_world_size, 2);

    // the active round is untouched by the rejected caller
    EXPECT_EQ(service.getCounter(), 1);
    EXPECT_EQ(service.getWorldSize(), 3);
    EXPECT_FALSE(service.getReducedData().has_value());

    BroadcastOutcome rank2{};
    std::thread t2 = launchBroadcast(service, 2, 3, "", rank2);
    EXPECT_EQ(service.broadcastFromRankZero(0, 3, "right", data), rdzv::SYNC_SUCCESS);
    t1.join();
    t2.join();
    EXPECT_EQ(data, "right");
    EXPECT_EQ(rank1.code, rdzv::SYNC_SUCCESS);
    EXPECT_EQ(rank1.data, "right");
    EXPECT_EQ(rank2.data, "right");
    EXPECT_EQ(service.getCounter(), 0);
    EXPECT_EQ(service.getWorldSize(), 0);
}

TEST(SyncServiceTest, TimeoutSnapshotOmitsMissingRanks) {
    SynchronizationService<std::string> service(SyncServiceConfig{.timeout_s = 1.0, .warn_interval_s = 60.0});
    BroadcastOutcome rank0{}, rank1{};
    std::thread t0 = launchBroadcast(service, 0, 3, "data", rank0);
    std::thread t1 = launchBroadcast(service, 1, 3, "", rank1);
    t0.join();
    t1.join();

    for (const BroadcastOutcome *outcome: {&rank0, &rank1}) {
        EXPECT_EQ(outcome->code, rdzv::SYNC_BROADCAST_TIMEOUT);
        EXPECT_FALSE(outcome->data.has_value());
        EXPECT_DOUBLE_EQ(outcome->failure.timeout_s, 1.0);
        ASSERT_EQ(outcome->failure.elapsed_s_per_rank.size(), 3);
        EXPECT_TRUE(outcome->failure.elapsed_s_per_rank[0].has_value());
        EXPECT_TRUE(outcome->failure.elapsed_s_per_rank[1].has_value());
        EXPECT_FALSE(outcome->failure.elapsed_s_per_rank[2].has_value());
    }
    EXPECT_EQ(service.getCounter(), 0);
    EXPECT_EQ(service.getWorldSize(), 0);
}

TEST(SyncServiceTest, SingleRankTimesOutAfterConfiguredDuration) {
    SynchronizationService<int> service(SyncServiceConfig{.timeout_s = 1.0, .warn_interval_s = 60.0});
    std::optional<int> data{};
    SyncFailureInfo failure{};

    const auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(service.broadcastFromRankZero(0, 2, 7, data, &failure), rdzv::SYNC_BROADCAST_TIMEOUT);
    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    EXPECT_GE(elapsed, 1.0);
    EXPECT_LT(elapsed, 2.0);
    EXPECT_FALSE(data.has_value());
    EXPECT_EQ(failure.code, rdzv::SYNC_BROADCAST_TIMEOUT);
    ASSERT_EQ(failure.elapsed_s_per_rank.size(), 2);
    ASSERT_TRUE(failure.elapsed_s_per_rank[0].has_value());
    EXPECT_NEAR(*failure.elapsed_s_per_rank[0], 1.0, 0.25);
    EXPECT_FALSE(failure.elapsed_s_per_rank[1].has_value());
    EXPECT_EQ(service.getCounter(), 0);
    EXPECT_EQ(service.getWorldSize(), 0);
}

TEST(SyncServiceTest, StallWarningLoggedWhileRankZeroIsLate) {
    const LogLevel previous_level = Logger::getReportingLevel();
    Logger::setReportingLevel(WARN);
    testing::internal::CaptureStdout();

    SynchronizationService<std::string> service(SyncServiceConfig{.timeout_s = 5.0, .warn_interval_s = 1.0});
    BroadcastOutcome rank1{}, rank2{};
    std::thread t1 = launchBroadcast(service, 1, 3, "", rank1);
    std::thread t2 = launchBroadcast(service, 2, 3, "", rank2);
    std::this_thread::sleep_for(2s);

    std::optional<std::string> data{};
    const SyncResultCode code = service.broadcastFromRankZero(0, 3, "ckpt-42", data);
    t1.join();
    t2.join();

    const std::string output = testing::internal::GetCapturedStdout();
    Logger::setReportingLevel(previous_level);

    EXPECT_EQ(code, rdzv::SYNC_SUCCESS);
    EXPECT_EQ(data, "ckpt-42");
    EXPECT_EQ(rank1.code, rdzv::SYNC_SUCCESS);
    EXPECT_EQ(rank1.data, "ckpt-42");
    EXPECT_EQ(rank2.code, rdzv::SYNC_SUCCESS);
    EXPECT_EQ(rank2.data, "ckpt-42");
    EXPECT_NE(output.find("has not been called by all 3 workers"), std::string::npos) << output;
    EXPECT_EQ(service.getCounter(), 0);
}

TEST(SyncServiceTest, ConsecutiveRoundsDoNotLeakPayload) {
    SynchronizationService<std::string> service{};
    for (const std::string payload: {"first", "second", "third"}) {
        BroadcastOutcome rank1{};
        std::thread t1 = launchBroadcast(service, 1, 2, "", rank1);
        awaitCounter(service, 1);
        // rank 1 is alone in the new round; the previous payload must be gone
        EXPECT_FALSE(service.getReducedData().has_value());

        std::optional<std::string> data{};
        EXPECT_EQ(service.broadcastFromRankZero(0, 2, payload, data), rdzv::SYNC_SUCCESS);
        t1.join();
        EXPECT_EQ(data, payload);
        EXPECT_EQ(rank1.data, payload);
        EXPECT_EQ(service.getCounter(), 0);
        EXPECT_EQ(service.getWorldSize(), 0);
    }
}

TEST(SyncServiceTest, NewRoundMayUseDifferentWorldSize) {
    SynchronizationService<std::string> service{};
    std::optional<std::string> data{};
    EXPECT_EQ(service.broadcastFromRankZero(0, 1, "solo", data), rdzv::SYNC_SUCCESS);
    EXPECT_EQ(data, "solo");

    BroadcastOutcome rank1{};
    std::thread t1 = launchBroadcast(service, 1, 2, "", rank1);
    awaitCounter(service, 1);
    EXPECT_EQ(service.getWorldSize(), 2);
    EXPECT_EQ(service.broadcastFromRankZero(0, 2, "pair", data), rdzv::SYNC_SUCCESS);
    t1.join();
    EXPECT_EQ(rank1.data, "pair");
}

TEST(SyncServiceTest, InvalidArgumentsLeaveStateUntouched) {
    SynchronizationService<std::string> service{};
    std::optional<std::string> data{};
    SyncFailureInfo failure{};

    EXPECT_EQ(service.broadcastFromRankZero(0, 0, "x", data, &failure), rdzv::SYNC_INVALID_ARGUMENT);
    EXPECT_EQ(failure.code, rdzv::SYNC_INVALID_ARGUMENT);
    EXPECT_EQ(service.broadcastFromRankZero(2, 2, "x", data), rdzv::SYNC_INVALID_ARGUMENT);
    EXPECT_EQ(service.broadcastFromRankZero(7, 3, "x", data), rdzv::SYNC_INVALID_ARGUMENT);

    EXPECT_FALSE(data.has_value());
    EXPECT_EQ(service.getCounter(), 0);
    EXPECT_EQ(service.getWorldSize(), 0);
}

TEST(SyncServiceTest, DuplicateRankCompletesRoundWithoutRankZero) {
    SynchronizationService<std::string> service{};
    BroadcastOutcome first{};
    std::thread t = launchBroadcast(service, 1, 2, "", first);
    awaitCounter(service, 1);

    std::optional<std::string> data{"stale"};
    EXPECT_EQ(service.broadcastFromRankZero(1, 2, "", data), rdzv::SYNC_SUCCESS);
    t.join();

    // rank 0 never deposited a payload
    EXPECT_FALSE(data.has_value());
    EXPECT_EQ(first.code, rdzv::SYNC_SUCCESS);
    EXPECT_FALSE(first.data.has_value());
    EXPECT_EQ(service.getCounter(), 0);
}

TEST(SyncServiceTest, ShutdownReleasesWaiters) {
    SynchronizationService<std::string> service{};
    BroadcastOutcome rank0{}, rank1{};
    std::thread t0 = launchBroadcast(service, 0, 3, "data", rank0);
    std::thread t1 = launchBroadcast(service, 1, 3, "", rank1);
    awaitCounter(service, 2);

    service.shutdown();
    t0.join();
    t1.join();

    EXPECT_TRUE(service.isShutdown());
    EXPECT_EQ(rank0.code, rdzv::SYNC_SERVICE_SHUTDOWN);
    EXPECT_EQ(rank1.code, rdzv::SYNC_SERVICE_SHUTDOWN);
    EXPECT_EQ(rank1.failure.code, rdzv::SYNC_SERVICE_SHUTDOWN);
    EXPECT_FALSE(rank0.data.has_value());
    EXPECT_EQ(service.getCounter(), 0);
    EXPECT_EQ(service.getWorldSize(), 0);

    std::optional<std::string> data{};
    EXPECT_EQ(service.broadcastFromRankZero(0, 1, "late", data), rdzv::SYNC_SERVICE_SHUTDOWN);
    EXPECT_FALSE(data.has_value());
}

TEST(SyncServiceTest, InvalidConfigFallsBackToDefaults) {
    const SynchronizationService<int> service(SyncServiceConfig{.timeout_s = -1.0, .warn_interval_s = 0.0});
    EXPECT_DOUBLE_EQ(service.getConfig().timeout_s, RDZV_DEFAULT_BARRIER_TIMEOUT_S);
    EXPECT_DOUBLE_EQ(service.getConfig().warn_interval_s, RDZV_DEFAULT_BARRIER_WARN_INTERVAL_S);
}

TEST(SyncServiceTest, TimeoutOfOneCallerDoesNotAbortOthers) {
    SynchronizationService<std::string> service(SyncServiceConfig{.timeout_s = 1.0, .warn_interval_s = 60.0});
    BroadcastOutcome rank1{}, rank2{};
    const auto start = std::chrono::steady_clock::now();
    std::thread t1 = launchBroadcast(service, 1, 3, "", rank1);
    std::this_thread::sleep_for(500ms);
    std::thread t2 = launchBroadcast(service, 2, 3, "", rank2);

    // rank 1 fails at its own deadline while rank 2 keeps waiting
    t1.join();
    const double rank1_elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    EXPECT_EQ(rank1.code, rdzv::SYNC_BROADCAST_TIMEOUT);
    EXPECT_GE(rank1_elapsed, 1.0);
    EXPECT_LT(rank1_elapsed, 1.4);
    EXPECT_EQ(service.getCounter(), 1);
    EXPECT_EQ(service.getWorldSize(), 3);

    t2.join();
    const double rank2_elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    EXPECT_EQ(rank2.code, rdzv::SYNC_BROADCAST_TIMEOUT);
    EXPECT_GE(rank2_elapsed, 1.5);
    EXPECT_LT(rank2_elapsed, 2.5);
    ASSERT_EQ(rank2.failure.elapsed_s_per_rank.size(), 3);
    EXPECT_FALSE(rank2.failure.elapsed_s_per_rank[0].has_value());
    ASSERT_TRUE(rank2.failure.elapsed_s_per_rank[1].has_value());
    EXPECT_GE(*rank2.failure.elapsed_s_per_rank[1], 1.0);
    ASSERT_TRUE(rank2.failure.elapsed_s_per_rank[2].has_value());
    EXPECT_NEAR(*rank2.failure.elapsed_s_per_rank[2], 1.0, 0.25);
    EXPECT_EQ(service.getCounter(), 0);
    EXPECT_EQ(service.getWorldSize(), 0);
}

TEST(SyncServiceTest, LongestAllowedDurationsStillBlock) {
    SynchronizationService<int> service(SyncServiceConfig{
        .timeout_s = RDZV_MAX_BARRIER_DURATION_S,
        .warn_interval_s = RDZV_MAX_BARRIER_DURATION_S
    });
    EXPECT_DOUBLE_EQ(service.getConfig().timeout_s, RDZV_MAX_BARRIER_DURATION_S);

    std::optional<int> rank0_data{};
    SyncResultCode rank0_code = rdzv::SYNC_BROADCAST_TIMEOUT;
    std::thread t0([&] { rank0_code = service.broadcastFromRankZero(0, 2, 7, rank0_data); });
    std::this_thread::sleep_for(500ms);
    EXPECT_EQ(service.getCounter(), 1);

    std::optional<int> rank1_data{};
    EXPECT_EQ(service.broadcastFromRankZero(1, 2, 0, rank1_data), rdzv::SYNC_SUCCESS);
    t0.join();
    EXPECT_EQ(rank0_code, rdzv::SYNC_SUCCESS);
    EXPECT_EQ(rank0_data, 7);
    EXPECT_EQ(rank1_data, 7);
}

TEST(SyncServiceTest, OverlongDurationsFallBackToDefaults) {
    const SyncServiceConfig overlong{.timeout_s = 1e12, .warn_interval_s = 1e12};
    EXPECT_FALSE(overlong.isValid());

    SynchronizationService<int> service(overlong);
    EXPECT_DOUBLE_EQ(service.getConfig().timeout_s, RDZV_DEFAULT_BARRIER_TIMEOUT_S);
    EXPECT_DOUBLE_EQ(service.getConfig().warn_interval_s, RDZV_DEFAULT_BARRIER_WARN_INTERVAL_S);

    // a lone caller waits instead of timing out at once
    std::optional<int> rank0_data{};
    SyncResultCode rank0_code = rdzv::SYNC_BROADCAST_TIMEOUT;
    std::thread t0([&] { rank0_code = service.broadcastFromRankZero(0, 2, 7, rank0_data); });
    std::this_thread::sleep_for(500ms);
    EXPECT_EQ(service.getCounter(), 1);

    service.shutdown();
    t0.join();
    EXPECT_EQ(rank0_code, rdzv::SYNC_SERVICE_SHUTDOWN);
}

TEST(SyncServiceTest, OverlongEnvironmentDurationsAreIgnored) {
    ASSERT_EQ(setenv(RDZV_BARRIER_TIMEOUT_S_ENV_VAR, "1e12", 1), 0);
    ASSERT_EQ(setenv(RDZV_BARRIER_WARN_INTERVAL_S_ENV_VAR, "2.5", 1), 0);
    const SyncServiceConfig config = SyncServiceConfig::FromEnvironment({});
    unsetenv(RDZV_BARRIER_TIMEOUT_S_ENV_VAR);
    unsetenv(RDZV_BARRIER_WARN_INTERVAL_S_ENV_VAR);

    EXPECT_DOUBLE_EQ(config.timeout_s, RDZV_DEFAULT_BARRIER_TIMEOUT_S);
    EXPECT_DOUBLE_EQ(config.warn_interval_s, 2.5);
    EXPECT_TRUE(config.isValid());
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
