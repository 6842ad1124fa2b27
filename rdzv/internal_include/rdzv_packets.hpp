#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include <rdzv_packet.hpp>
#include <rdzv_packet_buffer.hpp>
#include <rdzv_types.hpp>

namespace rdzv {
    // Definitions:

    // --- Rendezvous Protocol ---
    // C2M: Client to Master
    // M2C: Master to Client

    // C2M packets:
#define C2M_PACKET_BROADCAST_FROM_RANK_ZERO_ID 1
#define C2M_PACKET_QUERY_BARRIER_STATE_ID 2

    // M2C packets:
#define M2C_PACKET_BROADCAST_RESULT_ID 1
#define M2C_PACKET_BARRIER_STATE_ID 2

    // C2MPacketBroadcastFromRankZero
    class C2MPacketBroadcastFromRankZero final : public Packet {
    public:
        static packetId_t packet_id;

        uint32_t world_rank;
        uint32_t world_size;

        /// Payload of the caller; only the payload of rank 0 is broadcast
        BroadcastPayload payload;

        void serialize(PacketWriteBuffer &buffer) const override;

        [[nodiscard]] bool deserialize(PacketReadBuffer &buffer) override;
    };

    // C2MPacketQueryBarrierState
    class C2MPacketQueryBarrierState final : public EmptyPacket {
    public:
        static packetId_t packet_id;
    };

    // M2CPacketBroadcastResult
    class M2CPacketBroadcastResult final : public Packet {
    public:
        static packetId_t packet_id;

        SyncResultCode result_code;

        /// Payload of rank 0; only meaningful if result_code is SYNC_SUCCESS.
        /// Empty if the round was released without rank 0 having entered it.
        std::optional<BroadcastPayload> payload;

        /// Failure details; only meaningful if result_code is not SYNC_SUCCESS
        SyncFailureInfo failure_info;

        void serialize(PacketWriteBuffer &buffer) const override;

        [[nodiscard]] bool deserialize(PacketReadBuffer &buffer) override;
    };

    // M2CPacketBarrierState
    class M2CPacketBarrierState final : public Packet {
    public:
        static packetId_t packet_id;

        uint32_t counter;
        uint32_t world_size;
        std::optional<BroadcastPayload> reduced_data;

        void serialize(PacketWriteBuffer &buffer) const override;

        [[nodiscard]] bool deserialize(PacketReadBuffer &buffer) override;
    };
}
