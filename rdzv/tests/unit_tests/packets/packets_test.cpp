#include <gtest/gtest.h>
#include <rdzv_packets.hpp>

#include <algorithm>
#include <stdexcept>

TEST(PacketsTest, BroadcastRequestWireLayout) {
    rdzv::C2MPacketBroadcastFromRankZero packet{};
    packet.world_rank = 1;
    packet.world_size = 3;
    packet.payload = {0xAB, 0xCD};

    PacketWriteBuffer buffer{};
    packet.serialize(buffer);

    // u32 rank | u32 world size | u64 length | bytes, all big endian
    const std::vector<uint8_t> expected{
        0, 0, 0, 1,
        0, 0, 0, 3,
        0, 0, 0, 0, 0, 0, 0, 2,
        0xAB, 0xCD
    };
    ASSERT_EQ(buffer.size(), expected.size());
    EXPECT_TRUE(std::equal(expected.begin(), expected.end(), buffer.data()));
}

TEST(PacketsTest, TimeoutResultKeepsAbsentRanks) {
    rdzv::M2CPacketBroadcastResult packet{};
    packet.result_code = rdzv::SYNC_BROADCAST_TIMEOUT;
    packet.failure_info.expected_world_size = 2;
    packet.failure_info.provided_world_size = 2;
    packet.failure_info.timeout_s = 1.0;
    packet.failure_info.elapsed_s_per_rank = {1.01, std::nullopt};

    PacketWriteBuffer write_buffer{};
    packet.serialize(write_buffer);

    PacketReadBuffer read_buffer{write_buffer.data(), write_buffer.size()};
    rdzv::M2CPacketBroadcastResult decoded{};
    ASSERT_TRUE(decoded.deserialize(read_buffer));
    EXPECT_EQ(read_buffer.remaining(), 0);

    EXPECT_EQ(decoded.result_code, rdzv::SYNC_BROADCAST_TIMEOUT);
    EXPECT_EQ(decoded.failure_info.code, rdzv::SYNC_BROADCAST_TIMEOUT);
    EXPECT_FALSE(decoded.payload.has_value());
    EXPECT_DOUBLE_EQ(decoded.failure_info.timeout_s, 1.0);
    ASSERT_EQ(decoded.failure_info.elapsed_s_per_rank.size(), 2);
    ASSERT_TRUE(decoded.failure_info.elapsed_s_per_rank[0].has_value());
    EXPECT_DOUBLE_EQ(*decoded.failure_info.elapsed_s_per_rank[0], 1.01);
    EXPECT_FALSE(decoded.failure_info.elapsed_s_per_rank[1].has_value());
}

TEST(PacketsTest, SuccessResultKeepsEmptyAndAbsentPayloadApart) {
    rdzv::M2CPacketBroadcastResult empty_payload{};
    empty_payload.result_code = rdzv::SYNC_SUCCESS;
    empty_payload.payload = rdzv::BroadcastPayload{};

    rdzv::M2CPacketBroadcastResult no_payload{};
    no_payload.result_code = rdzv::SYNC_SUCCESS;
    no_payload.payload = std::nullopt;

    PacketWriteBuffer empty_buffer{};
    empty_payload.serialize(empty_buffer);
    PacketWriteBuffer absent_buffer{};
    no_payload.serialize(absent_buffer);

    PacketReadBuffer empty_read{empty_buffer.data(), empty_buffer.size()};
    rdzv::M2CPacketBroadcastResult decoded_empty{};
    ASSERT_TRUE(decoded_empty.deserialize(empty_read));
    ASSERT_TRUE(decoded_empty.payload.has_value());
    EXPECT_TRUE(decoded_empty.payload->empty());

    PacketReadBuffer absent_read{absent_buffer.data(), absent_buffer.size()};
    rdzv::M2CPacketBroadcastResult decoded_absent{};
    ASSERT_TRUE(decoded_absent.deserialize(absent_read));
    EXPECT_EQ(decoded_absent.result_code, rdzv::SYNC_SUCCESS);
    EXPECT_FALSE(decoded_absent.payload.has_value());
}

TEST(PacketsTest, ResultWithUnknownCodeIsRejected) {
    PacketWriteBuffer buffer{};
    buffer.write<uint8_t>(rdzv::SYNC_SERVICE_SHUTDOWN + 1);
    buffer.write<rdzv::boolean>(false);

    PacketReadBuffer read_buffer{buffer.data(), buffer.size()};
    rdzv::M2CPacketBroadcastResult decoded{};
    EXPECT_FALSE(decoded.deserialize(read_buffer));
}

TEST(PacketsTest, ResultWithOversizedSnapshotIsRejected) {
    PacketWriteBuffer buffer{};
    buffer.write<uint8_t>(rdzv::SYNC_BROADCAST_TIMEOUT);
    buffer.write<rdzv::boolean>(false);
    buffer.write<uint32_t>(2);
    buffer.write<uint32_t>(2);
    buffer.write<double>(1.0);
    buffer.write<uint64_t>(1ull << 40);

    PacketReadBuffer read_buffer{buffer.data(), buffer.size()};
    rdzv::M2CPacketBroadcastResult decoded{};
    EXPECT_FALSE(decoded.deserialize(read_buffer));
}

TEST(PacketsTest, TruncatedRequestThrows) {
    PacketWriteBuffer buffer{};
    buffer.write<uint32_t>(0);
    buffer.write<uint32_t>(1);
    buffer.write<uint64_t>(100); // announces more payload than present
    buffer.write<uint8_t>(1);

    PacketReadBuffer read_buffer{buffer.data(), buffer.size()};
    rdzv::C2MPacketBroadcastFromRankZero decoded{};
    EXPECT_THROW((void) decoded.deserialize(read_buffer), std::out_of_range);
}

TEST(PacketsTest, BarrierStateWithoutReducedData) {
    rdzv::M2CPacketBarrierState packet{};
    packet.counter = 2;
    packet.world_size = 3;
    packet.reduced_data = std::nullopt;

    PacketWriteBuffer write_buffer{};
    packet.serialize(write_buffer);
    EXPECT_EQ(write_buffer.size(), sizeof(uint32_t) * 2 + sizeof(rdzv::boolean));

    PacketReadBuffer read_buffer{write_buffer.data(), write_buffer.size()};
    rdzv::M2CPacketBarrierState decoded{};
    ASSERT_TRUE(decoded.deserialize(read_buffer));
    EXPECT_EQ(decoded.counter, 2);
    EXPECT_EQ(decoded.world_size, 3);
    EXPECT_FALSE(decoded.reduced_data.has_value());
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
