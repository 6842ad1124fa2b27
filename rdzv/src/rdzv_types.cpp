#include "rdzv_types.hpp"

#include <iomanip>
#include <sstream>

const char *rdzv::sync_result_code_to_str(const SyncResultCode code) {
    switch (code) {
        case SYNC_SUCCESS:
            return "SYNC_SUCCESS";
        case SYNC_INVALID_ARGUMENT:
            return "SYNC_INVALID_ARGUMENT";
        case SYNC_WORLD_SIZE_MISMATCH:
            return "SYNC_WORLD_SIZE_MISMATCH";
        case SYNC_BROADCAST_TIMEOUT:
            return "SYNC_BROADCAST_TIMEOUT";
        case SYNC_SERVICE_SHUTDOWN:
            return "SYNC_SERVICE_SHUTDOWN";
        default:
            return "UNKNOWN";
    }
}

std::string rdzv::SyncFailureInfo::describe() const {
    std::ostringstream oss;
    switch (code) {
        case SYNC_SUCCESS:
            oss << "no failure";
            break;
        case SYNC_INVALID_ARGUMENT:
            oss << "Invalid broadcast arguments: world size " << provided_world_size
                    << " does not admit the provided rank.";
            break;
        case SYNC_WORLD_SIZE_MISMATCH:
            oss << "Expects all callers to provide the same world size. Got " << provided_world_size
                    << " and expected " << expected_world_size << ".";
            break;
        case SYNC_BROADCAST_TIMEOUT: {
            oss << "The broadcast operation timed out after " << std::fixed << std::setprecision(2) << timeout_s
                    << " seconds. Not all " << elapsed_s_per_rank.size()
                    << " workers reached the barrier in time. Time elapsed per rank in seconds: {";
            bool first = true;
            for (size_t rank = 0; rank < elapsed_s_per_rank.size(); ++rank) {
                if (!first) {
                    oss << ", ";
                }
                first = false;
                oss << rank << ": ";
                if (elapsed_s_per_rank[rank]) {
                    oss << *elapsed_s_per_rank[rank];
                } else {
                    oss << "not reported";
                }
            }
            oss << "}";
            break;
        }
        case SYNC_SERVICE_SHUTDOWN:
            oss << "The synchronization service was shut down while the call was in progress.";
            break;
    }
    return oss.str();
}
