#pragma once

#include <guard_utils.hpp>
#include <rdzv_log.hpp>
#include <rdzv_types.hpp>
#include <round_state.hpp>
#include <stall_reporter.hpp>
#include <sync_config.hpp>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>

namespace rdzv {
    /// Synchronization barrier over a cohort of ranks 0..world_size-1 that broadcasts the payload of rank 0.
    ///
    /// Every call to @code broadcastFromRankZero@endcode enters the active round. When the number of entered
    /// participants equals the world size, all waiting participants are released together and every call
    /// returns the payload rank 0 supplied. Callers that are not the last to arrive wait in slices of the
    /// configured warn interval, logging a stall warning after each slice, and fail with a broadcast timeout
    /// once the configured timeout elapses.
    ///
    /// All bookkeeping happens while holding a single mutex; a waiting caller only releases it while
    /// blocked on the condition variable, after its own state mutations are complete.
    template<typename T>
    class SynchronizationService {
        SyncServiceConfig config;

        StallReporter stall_reporter;

        mutable std::mutex state_mutex{};

        /// Notified on release of a round and on shutdown
        std::condition_variable release_cv{};

        RoundState<T> round_state{};

        /// Incremented each time a round is released.
        /// A waiter is released once the generation differs from the one it observed on arrival.
        uint64_t release_generation = 0;

        bool shutting_down = false;

    public:
        explicit SynchronizationService(const SyncServiceConfig &config = {}) : config(sanitize(config)),
                                                                               stall_reporter(
                                                                                   this->config.timeout_s,
                                                                                   this->config.warn_interval_s) {
        }

        SynchronizationService(const SynchronizationService &other) = delete;

        SynchronizationService(SynchronizationService &&other) = delete;

        SynchronizationService &operator=(const SynchronizationService &other) = delete;

        SynchronizationService &operator=(SynchronizationService &&other) = delete;

        /// Blocks until all @code world_size@endcode participants of the round have called this method,
        /// then outputs the data supplied by rank 0 to every participant, including rank 0 itself.
        ///
        /// @param world_rank rank of the caller; must be below @code world_size@endcode
        /// @param world_size number of participants of the round; must be positive and agree with the active round
        /// @param data the caller's payload; only the payload of rank 0 is broadcast
        /// @param data_out populated with rank 0's payload on success
        /// @param failure_out if not null, populated with the failure details when the call does not succeed
        /// @return SYNC_SUCCESS when released, or the code of the failure. Round state is cleaned up before returning.
        [[nodiscard]] SyncResultCode broadcastFromRankZero(const uint32_t world_rank, const uint32_t world_size,
                                                           const T &data,
                                                           std::optional<T> &data_out,
                                                           SyncFailureInfo *failure_out = nullptr) {
            if (world_size == 0 || world_rank >= world_size) {
                LOG(WARN) << "Rejecting broadcast from rank " << world_rank << " with world size " << world_size;
                return fail(failure_out, SyncFailureInfo{
                                .code = SYNC_INVALID_ARGUMENT,
                                .provided_world_size = world_size
                            });
            }

            std::unique_lock lock{state_mutex};
            if (shutting_down) {
                return fail(failure_out, SyncFailureInfo{
                                .code = SYNC_SERVICE_SHUTDOWN,
                                .provided_world_size = world_size
                            });
            }
            if (!round_state.setupOrValidate(world_size)) {
                const SyncFailureInfo failure{
                    .code = SYNC_WORLD_SIZE_MISMATCH,
                    .expected_world_size = round_state.getWorldSize(),
                    .provided_world_size = world_size
                };
                LOG(WARN) << "Rank " << world_rank << ": " << failure.describe();
                return fail(failure_out, failure);
            }

            bool counted = false;
            guard_utils::phase_guard round_guard(
                [this, &counted, world_rank, &data] { counted = round_state.enter(world_rank, data); },
                [this, &counted] {
                    if (counted) {
                        round_state.leave();
                    }
                });

            // the last participant to arrive releases the whole round
            if (round_state.isFull()) {
                release_generation++;
                release_cv.notify_all();
                data_out = round_state.getReducedData();
                return SYNC_SUCCESS;
            }

            const uint64_t arrival_generation = release_generation;
            const auto arrival_time = SyncClock::now();
            round_state.recordArrival(world_rank, arrival_time);

            const auto deadline = saturatingAdd(arrival_time, toClockDuration(config.timeout_s));
            const auto warn_interval = toClockDuration(config.warn_interval_s);
            const auto is_released = [this, arrival_generation] {
                return release_generation != arrival_generation || shutting_down;
            };
            while (true) {
                const auto slice_end = std::min(saturatingAdd(SyncClock::now(), warn_interval), deadline);
                if (release_cv.wait_until(lock, slice_end, is_released)) {
                    break;
                }
                const auto now = SyncClock::now();
                const ElapsedSnapshot snapshot = StallReporter::elapsedSnapshot(round_state.getArrivalTimes(), now);
                if (now >= deadline) {
                    const SyncFailureInfo failure = stall_reporter.makeTimeoutFailure(
                        round_state.getWorldSize(), snapshot);
                    LOG(WARN) << "Rank " << world_rank << ": " << failure.describe();
                    return fail(failure_out, failure);
                }
                stall_reporter.logStallWarning(round_state.getWorldSize(), snapshot);
            }

            if (release_generation == arrival_generation) {
                // woken by shutdown before the round was complete
                return fail(failure_out, SyncFailureInfo{
                                .code = SYNC_SERVICE_SHUTDOWN,
                                .provided_world_size = world_size
                            });
            }
            data_out = round_state.getReducedData();
            return SYNC_SUCCESS;
        }

        /// Releases every waiting participant with SYNC_SERVICE_SHUTDOWN and rejects all future calls.
        void shutdown() {
            {
                std::lock_guard guard{state_mutex};
                shutting_down = true;
            }
            release_cv.notify_all();
        }

        [[nodiscard]] bool isShutdown() const {
            std::lock_guard guard{state_mutex};
            return shutting_down;
        }

        /// Number of participants currently inside the active round. Diagnostics only.
        [[nodiscard]] uint32_t getCounter() const {
            std::lock_guard guard{state_mutex};
            return round_state.getCounter();
        }

        /// World size of the active round, 0 if no round is active. Diagnostics only.
        [[nodiscard]] uint32_t getWorldSize() const {
            std::lock_guard guard{state_mutex};
            return round_state.getWorldSize();
        }

        /// Payload of rank 0 in the active round, if any. Diagnostics only.
        [[nodiscard]] std::optional<T> getReducedData() const {
            std::lock_guard guard{state_mutex};
            return round_state.getReducedData();
        }

        [[nodiscard]] const SyncServiceConfig &getConfig() const {
            return config;
        }

    private:
        static SyncResultCode fail(SyncFailureInfo *failure_out, const SyncFailureInfo &failure) {
            if (failure_out != nullptr) {
                *failure_out = failure;
            }
            return failure.code;
        }

        /// Converts seconds to clock ticks, saturating at half the representable range
        static SyncClock::duration toClockDuration(const double seconds) {
            constexpr SyncClock::duration max_duration = SyncClock::duration::max() / 2;
            if (!(seconds < std::chrono::duration<double>(max_duration).count())) {
                return max_duration;
            }
            if (seconds <= 0) {
                return SyncClock::duration::zero();
            }
            return std::chrono::duration_cast<SyncClock::duration>(std::chrono::duration<double>(seconds));
        }

        static SyncClock::time_point saturatingAdd(const SyncClock::time_point time_point,
                                                   const SyncClock::duration duration) {
            if (duration > SyncClock::time_point::max() - time_point) {
                return SyncClock::time_point::max();
            }
            return time_point + duration;
        }

        static SyncServiceConfig sanitize(const SyncServiceConfig &config) {
            if (config.isValid()) {
                return config;
            }
            LOG(WARN) << "Invalid synchronization service configuration (timeout_s=" << config.timeout_s
                    << ", warn_interval_s=" << config.warn_interval_s << "); falling back to defaults";
            return SyncServiceConfig{};
        }
    };
}
