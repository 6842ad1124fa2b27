#pragma once

#include <rdzv_types.hpp>
#include <round_state.hpp>

#include <optional>
#include <string>
#include <vector>

namespace rdzv {
    /// Produces the diagnostics of a stalled round: periodic warnings while participants wait,
    /// and the failure info of a call whose wait exceeded the timeout.
    class StallReporter {
        double timeout_s;
        double warn_interval_s;

    public:
        StallReporter(double timeout_s, double warn_interval_s);

        /// Seconds each rank has been waiting at @code now@endcode.
        /// Ranks without a recorded arrival are empty.
        [[nodiscard]] static ElapsedSnapshot elapsedSnapshot(
            const std::vector<std::optional<SyncClock::time_point>> &arrival_times,
            SyncClock::time_point now);

        /// Builds the warning text logged while a round is stalled.
        /// Only ranks that reported are listed.
        [[nodiscard]] std::string formatStallWarning(uint32_t world_size, const ElapsedSnapshot &snapshot) const;

        /// Logs a stall warning for the current snapshot. Advisory; never affects the outcome of a call.
        void logStallWarning(uint32_t world_size, const ElapsedSnapshot &snapshot) const;

        /// Builds the failure info of a call that timed out.
        [[nodiscard]] SyncFailureInfo makeTimeoutFailure(uint32_t world_size, const ElapsedSnapshot &snapshot) const;

        [[nodiscard]] double getTimeoutSeconds() const;

        [[nodiscard]] double getWarnIntervalSeconds() const;
    };
}
