#include "stall_reporter.hpp"

#include <rdzv_log.hpp>
#include <rdzv_protocol.h>

#include <iomanip>
#include <sstream>

rdzv::StallReporter::StallReporter(const double timeout_s, const double warn_interval_s) : timeout_s(timeout_s),
    warn_interval_s(warn_interval_s) {
}

rdzv::ElapsedSnapshot rdzv::StallReporter::elapsedSnapshot(
    const std::vector<std::optional<SyncClock::time_point>> &arrival_times,
    const SyncClock::time_point now) {
    ElapsedSnapshot snapshot{};
    snapshot.reserve(arrival_times.size());
    for (const auto &arrival_time: arrival_times) {
        if (!arrival_time) {
            snapshot.emplace_back(std::nullopt);
            continue;
        }
        snapshot.emplace_back(std::chrono::duration<double>(now - *arrival_time).count());
    }
    return snapshot;
}

std::string rdzv::StallReporter::formatStallWarning(const uint32_t world_size, const ElapsedSnapshot &snapshot) const {
    std::ostringstream oss;
    oss << "broadcastFromRankZero has not been called by all " << world_size << " workers in the group. "
            << "Please ensure that all workers reach the barrier regardless of whether they contribute data or not. "
            << "Here are the ranks that have reported so far and how long they have been waiting in seconds: {";
    bool first = true;
    for (size_t rank = 0; rank < snapshot.size(); ++rank) {
        if (!snapshot[rank]) {
            continue;
        }
        if (!first) {
            oss << ", ";
        }
        first = false;
        oss << rank << ": " << std::fixed << std::setprecision(2) << *snapshot[rank];
    }
    oss << "}. You can set the " << RDZV_BARRIER_WARN_INTERVAL_S_ENV_VAR
            << " environment variable to change the frequency of this warning from its current value: "
            << std::defaultfloat << warn_interval_s << " seconds.";
    return oss.str();
}

void rdzv::StallReporter::logStallWarning(const uint32_t world_size, const ElapsedSnapshot &snapshot) const {
    LOG(WARN) << formatStallWarning(world_size, snapshot);
}

rdzv::SyncFailureInfo rdzv::StallReporter::makeTimeoutFailure(const uint32_t world_size,
                                                             const ElapsedSnapshot &snapshot) const {
    return SyncFailureInfo{
        .code = SYNC_BROADCAST_TIMEOUT,
        .expected_world_size = world_size,
        .provided_world_size = world_size,
        .timeout_s = timeout_s,
        .elapsed_s_per_rank = snapshot
    };
}

double rdzv::StallReporter::getTimeoutSeconds() const {
    return timeout_s;
}

double rdzv::StallReporter::getWarnIntervalSeconds() const {
    return warn_interval_s;
}
