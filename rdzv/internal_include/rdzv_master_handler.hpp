#pragma once

#include <rdzv_inet.h>
#include <rdzv_inet_utils.hpp>
#include <rdzv_packets.hpp>
#include <rdzv_types.hpp>
#include <sync_config.hpp>
#include <sync_service.hpp>
#include <tinysockets.hpp>

#include <atomic>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace rdzv {
    class RendezvousMasterHandler {
        /// Server socket
        tinysockets::ServerSocket server_socket;

        /// Thread ID of the server thread.
        /// Server socket callbacks such as @code onClientRead @endcode and @code onClientDisconnect @endcode
        /// as well as tasks posted by broadcast workers will only ever be invoked from this thread.
        std::thread::id server_thread_id;

        /// Barrier shared by all clients of this master
        SynchronizationService<BroadcastPayload> sync_service;

        /// Guards broadcast_workers
        std::mutex workers_mutex{};

        /// One thread per broadcast request currently blocked in the synchronization service.
        /// A worker is joined on the server thread once its result has been sent,
        /// or by @code join @endcode when the master shuts down.
        std::unordered_map<uint64_t, std::thread> broadcast_workers{};

        /// Id assigned to the next broadcast request; only accessed from the server thread
        uint64_t next_request_id = 0;

        /// Clients with an outstanding broadcast request; only accessed from the server thread.
        /// A client issues one request at a time over its connection.
        std::unordered_set<internal_inet_socket_address_t> pending_clients{};

    public:
        std::atomic_bool running = false;
        std::atomic_bool interrupted = false;

        RendezvousMasterHandler(const rdzv_socket_address_t &listen_address, const SyncServiceConfig &config);

        RendezvousMasterHandler(const RendezvousMasterHandler &other) = delete;

        RendezvousMasterHandler(RendezvousMasterHandler &&other) = delete;

        RendezvousMasterHandler &operator=(const RendezvousMasterHandler &other) = delete;

        RendezvousMasterHandler &operator=(RendezvousMasterHandler &&other) = delete;

        [[nodiscard]] bool run();

        /// Shuts down the synchronization service, releasing all waiting broadcasts,
        /// and interrupts the server socket
        [[nodiscard]] bool interrupt();

        /// Blocks until the server thread and all broadcast workers have terminated
        [[nodiscard]] bool join();

        [[nodiscard]] bool kickClient(const rdzv_socket_address_t &client_address) const;

        [[nodiscard]] uint16_t getListenPort() const;

        [[nodiscard]] const SyncServiceConfig &getSyncConfig() const;

        ~RendezvousMasterHandler();

    private:
        // packet handling functions
        void handleBroadcastFromRankZero(const rdzv_socket_address_t &client_address,
                                         C2MPacketBroadcastFromRankZero &packet);

        void handleQueryBarrierState(const rdzv_socket_address_t &client_address,
                                     const C2MPacketQueryBarrierState &packet);

        /// Invoked on the server thread once a broadcast worker has obtained its result
        void onBroadcastComplete(uint64_t request_id, const rdzv_socket_address_t &client_address,
                                 const M2CPacketBroadcastResult &result);

        void joinBroadcastWorkers();

        void onClientRead(const rdzv_socket_address_t &client_address, const std::span<uint8_t> &data);

        void onClientJoin(const rdzv_socket_address_t &client_address);

        void onClientDisconnect(const rdzv_socket_address_t &client_address);
    };
}
