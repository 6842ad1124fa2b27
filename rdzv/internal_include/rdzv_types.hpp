#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rdzv {
    typedef uint8_t boolean;

    /// Payload type exchanged over the wire; the master hosts a service over opaque bytes.
    using BroadcastPayload = std::vector<uint8_t>;

    /// Per-rank seconds since the rank entered its wait; empty for ranks that have not reported.
    using ElapsedSnapshot = std::vector<std::optional<double>>;

    enum SyncResultCode : uint8_t {
        /// All participants arrived; the returned data is rank 0's payload.
        SYNC_SUCCESS = 0,

        /// world_size was zero or world_rank was not below world_size.
        /// Rejected before any round state was touched.
        SYNC_INVALID_ARGUMENT = 1,

        /// The caller declared a world size different from the one of the active round.
        /// Fatal for the call; the caller must fix the inconsistency before retrying.
        SYNC_WORLD_SIZE_MISMATCH = 2,

        /// The caller waited longer than the configured timeout for its peers.
        /// The failure info carries the per-rank elapsed time snapshot.
        SYNC_BROADCAST_TIMEOUT = 3,

        /// The hosting service is shutting down; waiting calls are released with this code.
        SYNC_SERVICE_SHUTDOWN = 4
    };

    [[nodiscard]] const char *sync_result_code_to_str(SyncResultCode code);

    /// Structured description of a failed broadcast call.
    struct SyncFailureInfo {
        SyncResultCode code = SYNC_SUCCESS;

        /// World size of the active round (mismatch only)
        uint32_t expected_world_size = 0;

        /// World size the failing caller declared
        uint32_t provided_world_size = 0;

        /// Configured total wait bound (timeout only)
        double timeout_s = 0;

        /// Elapsed wait per rank at the moment of the timeout (timeout only)
        ElapsedSnapshot elapsed_s_per_rank{};

        /// Renders the failure as a message suitable for logs and error reports.
        [[nodiscard]] std::string describe() const;
    };

    /// Snapshot of the active round as observed by the master. Diagnostics only.
    struct BarrierStateInfo {
        /// Number of participants currently inside the active round
        uint32_t counter = 0;

        /// World size of the active round; 0 if no round is active
        uint32_t world_size = 0;

        /// Payload deposited by rank 0 in the active round, if any
        std::optional<BroadcastPayload> reduced_data{};
    };
}
