#include "rdzv_client_handler.hpp"

#include <rdzv_inet_utils.hpp>
#include <rdzv_log.hpp>
#include <rdzv_packets.hpp>

rdzv::RendezvousClientHandler::RendezvousClientHandler(const rdzv_socket_address_t &master_address) :
    master_socket(master_address) {
}

bool rdzv::RendezvousClientHandler::connect() {
    if (connected) {
        LOG(WARN) << "RendezvousClientHandler::connect() called while already connected";
        return false;
    }
    if (interrupted) {
        return false;
    }
    if (!master_socket.establishConnection()) {
        LOG(ERR) << "Failed to connect to master " << rdzv_sockaddr_to_str(master_socket.getConnectSockAddr());
        return false;
    }
    LOG(DEBUG) << "Connected to master " << rdzv_sockaddr_to_str(master_socket.getConnectSockAddr());
    connected = true;
    return true;
}

bool rdzv::RendezvousClientHandler::broadcastFromRankZero(const uint32_t world_rank, const uint32_t world_size,
                                                          const BroadcastPayload &payload,
                                                          SyncResultCode &result_out,
                                                          std::optional<BroadcastPayload> &data_out,
                                                          SyncFailureInfo *failure_out) {
    if (!connected || interrupted) {
        return false;
    }
    std::lock_guard guard{request_mutex};

    C2MPacketBroadcastFromRankZero request{};
    request.world_rank = world_rank;
    request.world_size = world_size;
    request.payload = payload;
    if (!master_socket.sendPacket<C2MPacketBroadcastFromRankZero>(request)) {
        LOG(ERR) << "Failed to send C2MPacketBroadcastFromRankZero to master";
        return false;
    }

    const auto response = master_socket.receivePacket<M2CPacketBroadcastResult>();
    if (!response) {
        if (!interrupted) {
            LOG(ERR) << "Failed to receive M2CPacketBroadcastResult from master";
        }
        return false;
    }

    result_out = response->result_code;
    if (response->result_code == SYNC_SUCCESS) {
        data_out = response->payload;
    } else {
        data_out = std::nullopt;
        if (failure_out != nullptr) {
            *failure_out = response->failure_info;
        }
    }
    return true;
}

bool rdzv::RendezvousClientHandler::queryBarrierState(BarrierStateInfo &state_out) {
    if (!connected || interrupted) {
        return false;
    }
    std::lock_guard guard{request_mutex};
    if (!master_socket.sendPacket<C2MPacketQueryBarrierState>({})) {
        LOG(ERR) << "Failed to send C2MPacketQueryBarrierState to master";
        return false;
    }
    const auto response = master_socket.receivePacket<M2CPacketBarrierState>();
    if (!response) {
        LOG(ERR) << "Failed to receive M2CPacketBarrierState from master";
        return false;
    }
    state_out = BarrierStateInfo{
        .counter = response->counter,
        .world_size = response->world_size,
        .reduced_data = response->reduced_data
    };
    return true;
}

bool rdzv::RendezvousClientHandler::interrupt() {
    if (interrupted.exchange(true)) {
        return true;
    }
    if (!connected) {
        return true;
    }
    connected = false;
    return master_socket.closeConnection(true);
}

bool rdzv::RendezvousClientHandler::isConnected() const {
    return connected;
}

rdzv::RendezvousClientHandler::~RendezvousClientHandler() {
    if (connected) {
        if (!interrupt()) [[unlikely]] {
            LOG(ERR) << "Failed to close connection to master from destructor";
        }
    }
}
