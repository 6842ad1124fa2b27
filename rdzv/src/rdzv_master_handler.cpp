#include "rdzv_master_handler.hpp"

#include <rdzv_inet_utils.hpp>
#include <rdzv_packets.hpp>
#include <thread_guard.hpp>
#include <tinysockets.hpp>

#include <stdexcept>
#include <vector>

rdzv::RendezvousMasterHandler::RendezvousMasterHandler(const rdzv_socket_address_t &listen_address,
                                                       const SyncServiceConfig &config) :
    server_socket(listen_address), sync_service(config) {
    server_socket.addReadCallback([this](const rdzv_socket_address_t &client_address, const std::span<uint8_t> &data) {
        onClientRead(client_address, data);
    });
    server_socket.addJoinCallback(
        [this](const rdzv_socket_address_t &client_address) { onClientJoin(client_address); });
    server_socket.addCloseCallback(
        [this](const rdzv_socket_address_t &client_address) { onClientDisconnect(client_address); });
}

bool rdzv::RendezvousMasterHandler::run() {
    if (running || interrupted) {
        return false;
    }
    if (!server_socket.listen()) {
        return false;
    }
    LOG(DEBUG) << "RendezvousMasterHandler listening on port " << server_socket.getListenPort();
    if (!server_socket.runAsync()) {
        return false;
    }
    server_thread_id = server_socket.getServerThreadId();
    running = true;
    return true;
}

bool rdzv::RendezvousMasterHandler::interrupt() {
    if (interrupted) {
        return true;
    }
    // release all broadcasts blocked in the barrier; their results are no longer delivered
    sync_service.shutdown();
    if (!server_socket.interrupt()) {
        return false;
    }
    interrupted = true;
    return true;
}

bool rdzv::RendezvousMasterHandler::join() {
    if (!running) {
        return false;
    }
    server_socket.join();
    joinBroadcastWorkers();
    return true;
}

bool rdzv::RendezvousMasterHandler::kickClient(const rdzv_socket_address_t &client_address) const {
    THREAD_GUARD(server_thread_id);
    LOG(DEBUG) << "Kicking client " << rdzv_sockaddr_to_str(client_address);
    if (!server_socket.closeClientConnection(client_address)) [[unlikely]] {
        return false;
    }
    return true;
}

uint16_t rdzv::RendezvousMasterHandler::getListenPort() const {
    return server_socket.getListenPort();
}

const rdzv::SyncServiceConfig &rdzv::RendezvousMasterHandler::getSyncConfig() const {
    return sync_service.getConfig();
}

void rdzv::RendezvousMasterHandler::onClientRead(const rdzv_socket_address_t &client_address,
                                                 const std::span<uint8_t> &data) {
    THREAD_GUARD(server_thread_id);
    packetId_t packet_type{};
    try {
        packet_type = PacketReadBuffer::wrap(data).read<packetId_t>();
    } catch (const std::out_of_range &e) {
        LOG(ERR) << "Received truncated packet from " << rdzv_sockaddr_to_str(client_address) << ": " << e.what();
        if (!kickClient(client_address)) [[unlikely]] {
            LOG(ERR) << "Failed to kick client " << rdzv_sockaddr_to_str(client_address);
        }
        return;
    }

    PacketReadBuffer buffer = PacketReadBuffer::wrap(data);
    if (packet_type == C2MPacketBroadcastFromRankZero::packet_id) {
        auto packet = server_socket.receivePacket<C2MPacketBroadcastFromRankZero>(buffer);
        if (!packet) {
            LOG(ERR) << "Failed to deserialize C2MPacketBroadcastFromRankZero from "
                    << rdzv_sockaddr_to_str(client_address);
            if (!kickClient(client_address)) [[unlikely]] {
                LOG(ERR) << "Failed to kick client " << rdzv_sockaddr_to_str(client_address);
            }
            return;
        }
        handleBroadcastFromRankZero(client_address, *packet);
    } else if (packet_type == C2MPacketQueryBarrierState::packet_id) {
        const auto packet = server_socket.receivePacket<C2MPacketQueryBarrierState>(buffer);
        if (!packet) {
            LOG(ERR) << "Failed to deserialize C2MPacketQueryBarrierState from "
                    << rdzv_sockaddr_to_str(client_address);
            if (!kickClient(client_address)) [[unlikely]] {
                LOG(ERR) << "Failed to kick client " << rdzv_sockaddr_to_str(client_address);
            }
            return;
        }
        handleQueryBarrierState(client_address, *packet);
    } else {
        LOG(ERR) << "Unknown packet type " << packet_type << " from " << rdzv_sockaddr_to_str(client_address);
        if (!kickClient(client_address)) [[unlikely]] {
            LOG(ERR) << "Failed to kick client " << rdzv_sockaddr_to_str(client_address);
        }
    }
}

void rdzv::RendezvousMasterHandler::handleBroadcastFromRankZero(const rdzv_socket_address_t &client_address,
                                                                C2MPacketBroadcastFromRankZero &packet) {
    THREAD_GUARD(server_thread_id);
    LOG(DEBUG) << "Received C2MPacketBroadcastFromRankZero from " << rdzv_sockaddr_to_str(client_address)
            << " (rank " << packet.world_rank << " of " << packet.world_size << ", " << packet.payload.size()
            << " bytes)";

    if (const auto [_, inserted] = pending_clients.insert(rdzv_socket_to_internal(client_address)); !inserted) {
        LOG(WARN) << "Client " << rdzv_sockaddr_to_str(client_address)
                << " issued a broadcast while its previous broadcast is still in progress";
        if (!kickClient(client_address)) [[unlikely]] {
            LOG(ERR) << "Failed to kick client " << rdzv_sockaddr_to_str(client_address);
        }
        return;
    }

    const uint64_t request_id = next_request_id++;

    // the barrier blocks until all peers arrived; wait on a dedicated thread to keep the event loop responsive
    std::lock_guard guard{workers_mutex};
    broadcast_workers.emplace(request_id, std::thread(
                                  [this, request_id, client_address, packet = std::move(packet)] {
                                      std::optional<BroadcastPayload> data_out{};
                                      SyncFailureInfo failure{};
                                      const SyncResultCode code = sync_service.broadcastFromRankZero(
                                          packet.world_rank, packet.world_size, packet.payload, data_out, &failure);

                                      M2CPacketBroadcastResult result{};
                                      result.result_code = code;
                                      if (code == SYNC_SUCCESS) {
                                          result.payload = std::move(data_out);
                                      } else {
                                          result.failure_info = std::move(failure);
                                      }
                                      if (!server_socket.postTask([this, request_id, client_address, result] {
                                          onBroadcastComplete(request_id, client_address, result);
                                      })) {
                                          LOG(DEBUG) << "Master is shutting down; dropping broadcast result for "
                                                  << rdzv_sockaddr_to_str(client_address);
                                      }
                                  }));
}

void rdzv::RendezvousMasterHandler::onBroadcastComplete(const uint64_t request_id,
                                                        const rdzv_socket_address_t &client_address,
                                                        const M2CPacketBroadcastResult &result) {
    THREAD_GUARD(server_thread_id);
    if (result.result_code != SYNC_SUCCESS) {
        LOG(DEBUG) << "Broadcast of " << rdzv_sockaddr_to_str(client_address) << " failed with "
                << sync_result_code_to_str(result.result_code);
    }
    if (pending_clients.erase(rdzv_socket_to_internal(client_address)) == 0) {
        LOG(DEBUG) << "Client " << rdzv_sockaddr_to_str(client_address)
                << " disconnected before its broadcast completed";
    } else if (!server_socket.sendPacket<M2CPacketBroadcastResult>(client_address, result)) {
        LOG(ERR) << "Failed to send M2CPacketBroadcastResult to " << rdzv_sockaddr_to_str(client_address);
    }

    // reap the worker; it has finished its work once it posted this task
    std::thread worker{};
    {
        std::lock_guard guard{workers_mutex};
        if (const auto it = broadcast_workers.find(request_id); it != broadcast_workers.end()) {
            worker = std::move(it->second);
            broadcast_workers.erase(it);
        }
    }
    if (worker.joinable()) {
        worker.join();
    }
}

void rdzv::RendezvousMasterHandler::handleQueryBarrierState(const rdzv_socket_address_t &client_address,
                                                            const C2MPacketQueryBarrierState &) {
    THREAD_GUARD(server_thread_id);
    M2CPacketBarrierState response{};
    response.counter = sync_service.getCounter();
    response.world_size = sync_service.getWorldSize();
    response.reduced_data = sync_service.getReducedData();
    if (!server_socket.sendPacket<M2CPacketBarrierState>(client_address, response)) {
        LOG(ERR) << "Failed to send M2CPacketBarrierState to " << rdzv_sockaddr_to_str(client_address);
    }
}

void rdzv::RendezvousMasterHandler::onClientJoin(const rdzv_socket_address_t &client_address) {
    THREAD_GUARD(server_thread_id);
    LOG(DEBUG) << "Client " << rdzv_sockaddr_to_str(client_address) << " connected";
}

void rdzv::RendezvousMasterHandler::onClientDisconnect(const rdzv_socket_address_t &client_address) {
    THREAD_GUARD(server_thread_id);
    LOG(DEBUG) << "Client " << rdzv_sockaddr_to_str(client_address) << " disconnected";

    // an outstanding broadcast of this client stays in the barrier; its peers still count on the arrival
    if (pending_clients.erase(rdzv_socket_to_internal(client_address)) != 0) {
        LOG(WARN) << "Client " << rdzv_sockaddr_to_str(client_address)
                << " disconnected while its broadcast is in progress";
    }
}

void rdzv::RendezvousMasterHandler::joinBroadcastWorkers() {
    std::vector<std::thread> workers{};
    {
        std::lock_guard guard{workers_mutex};
        workers.reserve(broadcast_workers.size());
        for (auto &[_, worker]: broadcast_workers) {
            workers.push_back(std::move(worker));
        }
        broadcast_workers.clear();
    }
    for (auto &worker: workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

rdzv::RendezvousMasterHandler::~RendezvousMasterHandler() {
    if (running && !interrupted) {
        if (!interrupt()) [[unlikely]] {
            LOG(ERR) << "Failed to interrupt RendezvousMasterHandler from destructor";
        }
    }
    if (running) {
        if (!join()) [[unlikely]] {
            LOG(ERR) << "Failed to join RendezvousMasterHandler from destructor";
        }
    }
}
