#pragma once

#include <rdzv_log.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

namespace rdzv {
    using SyncClock = std::chrono::steady_clock;

    /// Mutable state of the active broadcast round together with the bookkeeping that starts,
    /// enters, leaves and tears down a round.
    ///
    /// A round starts implicitly with the first arrival after the previous round fully drained and
    /// ends when the last participant leaves. Exactly one round is active at a time.
    ///
    /// Invariants:
    /// - 0 <= counter <= world_size
    /// - world_size == 0 <=> counter == 0
    /// - reduced_data is only populated while counter > 0
    ///
    /// This class is not synchronized; the owning service serializes all access.
    template<typename T>
    class RoundState {
        /// Number of participants currently inside the active round
        uint32_t counter = 0;

        /// Expected participant count of the active round; 0 means no active round
        uint32_t world_size = 0;

        /// Payload supplied by rank 0 for the active round
        std::optional<T> reduced_data{};

        /// Arrival time per rank of the ranks that entered a wait; sized to world_size on setup
        std::vector<std::optional<SyncClock::time_point>> arrival_times{};

    public:
        /// Starts a round if none is active, otherwise checks that the caller agrees on the cohort size.
        /// @return false if a round is active and its world size differs from @code world_size@endcode
        [[nodiscard]] bool setupOrValidate(const uint32_t world_size) {
            if (this->world_size == 0) {
                this->world_size = world_size;
                arrival_times.assign(world_size, std::nullopt);
                return true;
            }
            return world_size == this->world_size;
        }

        /// Enters the active round. Rank 0 deposits its payload.
        /// The counter never exceeds the world size; an entry beyond capacity is not counted.
        /// @return true if the entry was counted and must be matched by a call to @code leave@endcode
        [[nodiscard]] bool enter(const uint32_t world_rank, const T &data) {
            if (world_rank == 0) {
                reduced_data = data;
            }
            if (counter < world_size) {
                counter++;
                return true;
            }
            LOG(DEBUG) << "Rank " << world_rank << " entered a full round of world size " << world_size
                    << "; entry not counted";
            return false;
        }

        /// Leaves the active round. The last participant to leave ends the round.
        void leave() {
            if (counter == 0) [[unlikely]] {
                LOG(BUG) << "RoundState::leave() called without an active participant. This is a bug!";
                return;
            }
            counter--;
            if (counter == 0) {
                reduced_data = std::nullopt;
                world_size = 0;
            }
        }

        /// Records the time the specified rank started waiting for its peers
        void recordArrival(const uint32_t world_rank, const SyncClock::time_point time) {
            if (world_rank >= arrival_times.size()) [[unlikely]] {
                LOG(BUG) << "Arrival recorded for rank " << world_rank << " outside of world size "
                        << arrival_times.size() << ". This is a bug!";
                return;
            }
            arrival_times[world_rank] = time;
        }

        [[nodiscard]] bool isFull() const {
            return world_size != 0 && counter == world_size;
        }

        [[nodiscard]] uint32_t getCounter() const {
            return counter;
        }

        [[nodiscard]] uint32_t getWorldSize() const {
            return world_size;
        }

        [[nodiscard]] const std::optional<T> &getReducedData() const {
            return reduced_data;
        }

        [[nodiscard]] const std::vector<std::optional<SyncClock::time_point>> &getArrivalTimes() const {
            return arrival_times;
        }
    };
}
