#include "rdzv_packets.hpp"

// EmptyPacket
void rdzv::EmptyPacket::serialize(PacketWriteBuffer &buffer) const {
    // do nothing
}

bool rdzv::EmptyPacket::deserialize(PacketReadBuffer &buffer) {
    // do nothing
    return true;
}

// C2MPacketBroadcastFromRankZero
rdzv::packetId_t rdzv::C2MPacketBroadcastFromRankZero::packet_id = C2M_PACKET_BROADCAST_FROM_RANK_ZERO_ID;

void rdzv::C2MPacketBroadcastFromRankZero::serialize(PacketWriteBuffer &buffer) const {
    buffer.write<uint32_t>(world_rank);
    buffer.write<uint32_t>(world_size);
    buffer.writeBytes(payload);
}

bool rdzv::C2MPacketBroadcastFromRankZero::deserialize(PacketReadBuffer &buffer) {
    world_rank = buffer.read<uint32_t>();
    world_size = buffer.read<uint32_t>();
    payload = buffer.readBytes();
    return true;
}

// C2MPacketQueryBarrierState
rdzv::packetId_t rdzv::C2MPacketQueryBarrierState::packet_id = C2M_PACKET_QUERY_BARRIER_STATE_ID;

// M2CPacketBroadcastResult
rdzv::packetId_t rdzv::M2CPacketBroadcastResult::packet_id = M2C_PACKET_BROADCAST_RESULT_ID;

void rdzv::M2CPacketBroadcastResult::serialize(PacketWriteBuffer &buffer) const {
    buffer.write<uint8_t>(result_code);
    buffer.write<boolean>(payload.has_value());
    if (payload) {
        buffer.writeBytes(*payload);
    }
    buffer.write<uint32_t>(failure_info.expected_world_size);
    buffer.write<uint32_t>(failure_info.provided_world_size);
    buffer.write<double>(failure_info.timeout_s);
    buffer.write<uint64_t>(failure_info.elapsed_s_per_rank.size());
    for (const auto &elapsed: failure_info.elapsed_s_per_rank) {
        buffer.write<boolean>(elapsed.has_value());
        buffer.write<double>(elapsed.value_or(0.0));
    }
}

bool rdzv::M2CPacketBroadcastResult::deserialize(PacketReadBuffer &buffer) {
    const auto code = buffer.read<uint8_t>();
    if (code > SYNC_SERVICE_SHUTDOWN) {
        return false;
    }
    result_code = static_cast<SyncResultCode>(code);
    if (buffer.read<boolean>()) {
        payload = buffer.readBytes();
    } else {
        payload = std::nullopt;
    }

    failure_info = {};
    failure_info.code = result_code;
    failure_info.expected_world_size = buffer.read<uint32_t>();
    failure_info.provided_world_size = buffer.read<uint32_t>();
    failure_info.timeout_s = buffer.read<double>();

    constexpr size_t entry_size = sizeof(boolean) + sizeof(double);
    const auto n_entries = buffer.read<uint64_t>();
    if (n_entries > buffer.remaining() / entry_size) {
        return false;
    }
    failure_info.elapsed_s_per_rank.reserve(n_entries);
    for (size_t i = 0; i < n_entries; i++) {
        const bool reported = buffer.read<boolean>();
        const auto elapsed = buffer.read<double>();
        if (reported) {
            failure_info.elapsed_s_per_rank.emplace_back(elapsed);
        } else {
            failure_info.elapsed_s_per_rank.emplace_back(std::nullopt);
        }
    }
    return true;
}

// M2CPacketBarrierState
rdzv::packetId_t rdzv::M2CPacketBarrierState::packet_id = M2C_PACKET_BARRIER_STATE_ID;

void rdzv::M2CPacketBarrierState::serialize(PacketWriteBuffer &buffer) const {
    buffer.write<uint32_t>(counter);
    buffer.write<uint32_t>(world_size);
    buffer.write<boolean>(reduced_data.has_value());
    if (reduced_data) {
        buffer.writeBytes(*reduced_data);
    }
}

bool rdzv::M2CPacketBarrierState::deserialize(PacketReadBuffer &buffer) {
    counter = buffer.read<uint32_t>();
    world_size = buffer.read<uint32_t>();
    if (buffer.read<boolean>()) {
        reduced_data = buffer.readBytes();
    } else {
        reduced_data = std::nullopt;
    }
    return true;
}
