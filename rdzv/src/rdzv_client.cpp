#include "rdzv_client.hpp"

#include "rdzv_client_handler.hpp"

rdzv::RendezvousClient::RendezvousClient(const rdzv_socket_address_t &master_socket_address) :
    client(new RendezvousClientHandler(master_socket_address)) {
}

bool rdzv::RendezvousClient::connect() const {
    return client->connect();
}

bool rdzv::RendezvousClient::broadcastFromRankZero(const uint32_t world_rank, const uint32_t world_size,
                                                   const BroadcastPayload &payload,
                                                   SyncResultCode &result_out,
                                                   std::optional<BroadcastPayload> &data_out,
                                                   SyncFailureInfo *failure_out) const {
    return client->broadcastFromRankZero(world_rank, world_size, payload, result_out, data_out, failure_out);
}

bool rdzv::RendezvousClient::queryBarrierState(BarrierStateInfo &state_out) const {
    return client->queryBarrierState(state_out);
}

bool rdzv::RendezvousClient::interrupt() const {
    return client->interrupt();
}

bool rdzv::RendezvousClient::isConnected() const {
    return client->isConnected();
}

rdzv::RendezvousClient::~RendezvousClient() {
    delete client;
}
