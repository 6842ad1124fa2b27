#include <gtest/gtest.h>
#include <rdzv.h>

#include <cstring>
#include <string>
#include <thread>

#include <port_guard.h>

static rdzvMasterCreateParams_t masterParams(const uint16_t port, const double timeout_s = 0) {
    rdzvMasterCreateParams_t params{};
    params.listen_address = {.inet = {.protocol = inetIPv4, .ipv4 = {.data = {0, 0, 0, 0}}}, .port = port};
    params.barrier_timeout_s = timeout_s;
    params.barrier_warn_interval_s = 0;
    return params;
}

static rdzvClientCreateParams_t clientParams(const uint16_t port) {
    rdzvClientCreateParams_t params{};
    params.master_address = {.inet = {.protocol = inetIPv4, .ipv4 = {.data = {127, 0, 0, 1}}}, .port = port};
    return params;
}

// must run before any other test initializes the library
TEST(CApiTest, TestRequiresInit) {
    rdzvClient_t *client{};
    const rdzvClientCreateParams_t params = clientParams(28220);
    EXPECT_EQ(rdzvCreateClient(&params, &client), rdzvNotInitialized);
    EXPECT_EQ(rdzvInit(), rdzvSuccess);
    EXPECT_EQ(rdzvInit(), rdzvSuccess);
}

TEST(CApiTest, TestCreateMasterRejectsNegativeDurations) {
    ASSERT_EQ(rdzvInit(), rdzvSuccess);
    rdzvMasterInstance_t *master{};
    const rdzvMasterCreateParams_t params = masterParams(28221, -1.0);
    EXPECT_EQ(rdzvCreateMaster(&params, &master), rdzvInvalidArgument);
    EXPECT_EQ(rdzvCreateMaster(nullptr, &master), rdzvInvalidArgument);

    const rdzvMasterCreateParams_t overlong_params = masterParams(28221, 1e12);
    EXPECT_EQ(rdzvCreateMaster(&overlong_params, &master), rdzvInvalidArgument);
}

TEST(CApiTest, TestConnectWithoutMaster) {
    ASSERT_EQ(rdzvInit(), rdzvSuccess);
    rdzvClient_t *client{};
    const rdzvClientCreateParams_t params = clientParams(28222);
    ASSERT_EQ(rdzvCreateClient(&params, &client), rdzvSuccess);
    EXPECT_EQ(rdzvConnect(client), rdzvMasterConnectionFailed);

    // the client is not connected; broadcasting is a usage error
    rdzvBuffer_t buffer{};
    EXPECT_EQ(rdzvBroadcastFromRankZero(client, 0, 1, nullptr, 0, &buffer, nullptr), rdzvInvalidUsage);
    EXPECT_EQ(rdzvDestroyClient(client), rdzvSuccess);
}

TEST(CApiTest, TestBroadcastFromRankZero) {
    ASSERT_EQ(rdzvInit(), rdzvSuccess);
    GUARD_PORT(28223);

    rdzvMasterInstance_t *master{};
    const rdzvMasterCreateParams_t master_params = masterParams(28223);
    ASSERT_EQ(rdzvCreateMaster(&master_params, &master), rdzvSuccess);
    ASSERT_EQ(rdzvRunMaster(master), rdzvSuccess);
    uint16_t port{};
    ASSERT_EQ(rdzvGetMasterListenPort(master, &port), rdzvSuccess);
    EXPECT_EQ(port, 28223);

    const rdzvClientCreateParams_t client_params = clientParams(port);
    rdzvClient_t *client0{}, *client1{};
    ASSERT_EQ(rdzvCreateClient(&client_params, &client0), rdzvSuccess);
    ASSERT_EQ(rdzvCreateClient(&client_params, &client1), rdzvSuccess);
    ASSERT_EQ(rdzvConnect(client0), rdzvSuccess);
    ASSERT_EQ(rdzvConnect(client1), rdzvSuccess);
    EXPECT_EQ(rdzvConnect(client1), rdzvInvalidUsage);

    EXPECT_EQ(rdzvBroadcastFromRankZero(client1, 2, 2, nullptr, 0, nullptr, nullptr), rdzvInvalidArgument);

    rdzvBuffer_t buffer1{};
    rdzvResult_t result1{};
    std::thread rank1([&] {
        result1 = rdzvBroadcastFromRankZero(client1, 1, 2, nullptr, 0, &buffer1, nullptr);
    });

    // wait until rank 1 entered the barrier
    rdzvBarrierState_t state{};
    for (int i = 0; i < 500; ++i) {
        ASSERT_EQ(rdzvGetBarrierState(client0, &state), rdzvSuccess);
        EXPECT_EQ(rdzvFreeBuffer(&state.reduced_data), rdzvSuccess);
        if (state.counter == 1) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(state.counter, 1);
    EXPECT_EQ(state.world_size, 2);
    EXPECT_FALSE(state.has_reduced_data);

    const std::string payload = "ckpt-42";
    rdzvBuffer_t buffer0{};
    EXPECT_EQ(rdzvBroadcastFromRankZero(client0, 0, 2, payload.data(), payload.size(), &buffer0, nullptr),
              rdzvSuccess);
    rank1.join();
    EXPECT_EQ(result1, rdzvSuccess);

    for (const rdzvBuffer_t *buffer: {&buffer0, &buffer1}) {
        ASSERT_EQ(buffer->size, payload.size());
        EXPECT_EQ(std::string(reinterpret_cast<const char *>(buffer->data), buffer->size), payload);
    }
    EXPECT_EQ(rdzvFreeBuffer(&buffer0), rdzvSuccess);
    EXPECT_EQ(rdzvFreeBuffer(&buffer1), rdzvSuccess);
    EXPECT_EQ(buffer0.data, nullptr);
    EXPECT_EQ(buffer0.size, 0);

    EXPECT_EQ(rdzvDestroyClient(client0), rdzvSuccess);
    EXPECT_EQ(rdzvDestroyClient(client1), rdzvSuccess);
    ASSERT_EQ(rdzvInterruptMaster(master), rdzvSuccess);
    ASSERT_EQ(rdzvMasterAwaitTermination(master), rdzvSuccess);
    ASSERT_EQ(rdzvDestroyMaster(master), rdzvSuccess);
}

TEST(CApiTest, TestBroadcastTimeout) {
    ASSERT_EQ(rdzvInit(), rdzvSuccess);
    GUARD_PORT(28224);

    rdzvMasterInstance_t *master{};
    const rdzvMasterCreateParams_t master_params = masterParams(28224, 1.0);
    ASSERT_EQ(rdzvCreateMaster(&master_params, &master), rdzvSuccess);
    ASSERT_EQ(rdzvRunMaster(master), rdzvSuccess);

    const rdzvClientCreateParams_t client_params = clientParams(28224);
    rdzvClient_t *client{};
    ASSERT_EQ(rdzvCreateClient(&client_params, &client), rdzvSuccess);
    ASSERT_EQ(rdzvConnect(client), rdzvSuccess);

    constexpr uint8_t value = 7;
    rdzvBuffer_t buffer{};
    rdzvBarrierFailureInfo_t failure{};
    EXPECT_EQ(rdzvBroadcastFromRankZero(client, 0, 2, &value, sizeof(value), &buffer, &failure),
              rdzvBroadcastTimeout);
    EXPECT_EQ(buffer.data, nullptr);
    EXPECT_DOUBLE_EQ(failure.timeout_s, 1.0);
    ASSERT_EQ(failure.num_ranks, 2);
    EXPECT_TRUE(failure.rank_reported[0]);
    EXPECT_NEAR(failure.elapsed_s_per_rank[0], 1.0, 0.25);
    EXPECT_FALSE(failure.rank_reported[1]);
    EXPECT_EQ(rdzvFreeBarrierFailureInfo(&failure), rdzvSuccess);
    EXPECT_EQ(failure.num_ranks, 0);

    EXPECT_EQ(rdzvDestroyClient(client), rdzvSuccess);
    ASSERT_EQ(rdzvInterruptMaster(master), rdzvSuccess);
    ASSERT_EQ(rdzvMasterAwaitTermination(master), rdzvSuccess);
    ASSERT_EQ(rdzvDestroyMaster(master), rdzvSuccess);
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
