#pragma once

#include <rdzv_inet.h>
#include <rdzv_types.hpp>
#include <tinysockets.hpp>

#include <atomic>
#include <mutex>
#include <optional>

namespace rdzv {
    class RendezvousClientHandler {
        /// Socket connected to the master
        tinysockets::BlockingIOSocket master_socket;

        /// Serializes requests; the protocol allows one outstanding request per connection
        std::mutex request_mutex{};

        std::atomic_bool connected = false;
        std::atomic_bool interrupted = false;

    public:
        explicit RendezvousClientHandler(const rdzv_socket_address_t &master_address);

        RendezvousClientHandler(const RendezvousClientHandler &other) = delete;

        RendezvousClientHandler(RendezvousClientHandler &&other) = delete;

        RendezvousClientHandler &operator=(const RendezvousClientHandler &other) = delete;

        RendezvousClientHandler &operator=(RendezvousClientHandler &&other) = delete;

        [[nodiscard]] bool connect();

        /// Sends the broadcast request to the master and blocks until the master answers.
        /// Returns false if the request could not be transmitted or the connection failed while waiting;
        /// the outcome of the barrier itself is reported via @code result_out@endcode
        [[nodiscard]] bool broadcastFromRankZero(uint32_t world_rank, uint32_t world_size,
                                                 const BroadcastPayload &payload,
                                                 SyncResultCode &result_out,
                                                 std::optional<BroadcastPayload> &data_out,
                                                 SyncFailureInfo *failure_out);

        [[nodiscard]] bool queryBarrierState(BarrierStateInfo &state_out);

        /// Closes the connection to the master. A request blocked on the master returns false.
        [[nodiscard]] bool interrupt();

        [[nodiscard]] bool isConnected() const;

        ~RendezvousClientHandler();
    };
}
