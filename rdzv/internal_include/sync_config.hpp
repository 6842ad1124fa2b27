#pragma once

#include <rdzv_protocol.h>

namespace rdzv {
    /// Timing configuration of a synchronization service.
    /// Fixed at construction of the service for its whole lifetime.
    struct SyncServiceConfig {
        /// Total time in seconds a participant waits for its peers before failing with a broadcast timeout
        double timeout_s = RDZV_DEFAULT_BARRIER_TIMEOUT_S;

        /// Interval in seconds between two stall warnings logged by a waiting participant
        double warn_interval_s = RDZV_DEFAULT_BARRIER_WARN_INTERVAL_S;

        /// Returns @code base@endcode with the overrides from the RDZV_BARRIER_TIMEOUT_S and
        /// RDZV_BARRIER_WARN_INTERVAL_S environment variables applied.
        /// Unparsable values, non-positive values and values above RDZV_MAX_BARRIER_DURATION_S are ignored.
        [[nodiscard]] static SyncServiceConfig FromEnvironment(const SyncServiceConfig &base);

        /// Returns false if either duration is not a positive finite number of at most RDZV_MAX_BARRIER_DURATION_S
        [[nodiscard]] bool isValid() const;
    };
}
