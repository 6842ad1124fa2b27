#pragma once

#include <rdzv_inet.h>
#include <rdzv_types.hpp>

#include <optional>

namespace rdzv {
    class RendezvousClientHandler;

    /// Worker-side endpoint of the rendezvous protocol.
    /// Holds a persistent connection to the master over which broadcast requests are issued one at a time.
    class RendezvousClient {
        RendezvousClientHandler *client;

    public:
        explicit RendezvousClient(const rdzv_socket_address_t &master_socket_address);

        RendezvousClient(const RendezvousClient &other) = delete;

        RendezvousClient(RendezvousClient &&other) = delete;

        RendezvousClient &operator=(const RendezvousClient &other) = delete;

        RendezvousClient &operator=(RendezvousClient &&other) = delete;

        /// Connect to the master
        [[nodiscard]] bool connect() const;

        /// Enters the barrier of the master and waits until all world_size ranks arrived.
        /// @param result_out outcome of the barrier as decided by the master
        /// @param data_out populated with rank 0's payload if result_out is SYNC_SUCCESS;
        ///                 empty if the round was released without rank 0 having entered it
        /// @param failure_out if not null, populated with the failure details if result_out is not SYNC_SUCCESS
        /// @return false if communication with the master failed
        [[nodiscard]] bool broadcastFromRankZero(uint32_t world_rank, uint32_t world_size,
                                                 const BroadcastPayload &payload,
                                                 SyncResultCode &result_out,
                                                 std::optional<BroadcastPayload> &data_out,
                                                 SyncFailureInfo *failure_out = nullptr) const;

        /// Queries the state of the active round on the master
        [[nodiscard]] bool queryBarrierState(BarrierStateInfo &state_out) const;

        /// Interrupt the client; closes the connection to the master
        [[nodiscard]] bool interrupt() const;

        [[nodiscard]] bool isConnected() const;

        ~RendezvousClient();
    };
}
