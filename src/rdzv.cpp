#include "rdzv.h"
#include "rdzv_internal.hpp"

#include <rdzv_protocol.h>

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <new>
#include <optional>

static constinit bool rdzv_initialized = false;

#define RDZV_VALIDATE_INITIALIZED() \
    if (!rdzv_initialized) { \
        return (rdzvNotInitialized); \
    }

static rdzvResult_t internalRdzvInit() {
    return rdzvSuccess;
}

rdzvResult_t rdzvInit() {
    if (rdzv_initialized) {
        return rdzvSuccess;
    }
    RDZV_ERR_PROPAGATE(internalRdzvInit());
    rdzv_initialized = true;
    return rdzvSuccess;
}

static rdzvResult_t getRdzvResult(const rdzv::SyncResultCode code) {
    switch (code) {
        case rdzv::SYNC_SUCCESS:
            return rdzvSuccess;
        case rdzv::SYNC_INVALID_ARGUMENT:
            return rdzvInvalidArgument;
        case rdzv::SYNC_WORLD_SIZE_MISMATCH:
            return rdzvWorldSizeMismatch;
        case rdzv::SYNC_BROADCAST_TIMEOUT:
            return rdzvBroadcastTimeout;
        case rdzv::SYNC_SERVICE_SHUTDOWN:
            return rdzvServiceShutdown;
        default:
            [[unlikely]] return rdzvInternalError;
    }
}

/// Copies the bytes into a buffer allocated with malloc; an empty payload yields an empty buffer.
static bool copyToBuffer(const rdzv::BroadcastPayload &bytes, rdzvBuffer_t &buffer_out) {
    buffer_out.data = nullptr;
    buffer_out.size = 0;
    if (bytes.empty()) {
        return true;
    }
    auto *data = static_cast<uint8_t *>(std::malloc(bytes.size()));
    if (data == nullptr) [[unlikely]] {
        return false;
    }
    std::memcpy(data, bytes.data(), bytes.size());
    buffer_out.data = data;
    buffer_out.size = bytes.size();
    return true;
}

static bool copyFailureInfo(const rdzv::SyncFailureInfo &failure, rdzvBarrierFailureInfo_t &failure_out) {
    failure_out.expected_world_size = failure.expected_world_size;
    failure_out.provided_world_size = failure.provided_world_size;
    failure_out.timeout_s = failure.timeout_s;
    failure_out.num_ranks = 0;
    failure_out.rank_reported = nullptr;
    failure_out.elapsed_s_per_rank = nullptr;

    const size_t num_ranks = failure.elapsed_s_per_rank.size();
    if (num_ranks == 0) {
        return true;
    }
    auto *rank_reported = static_cast<bool *>(std::malloc(num_ranks * sizeof(bool)));
    auto *elapsed = static_cast<double *>(std::malloc(num_ranks * sizeof(double)));
    if (rank_reported == nullptr || elapsed == nullptr) [[unlikely]] {
        std::free(rank_reported);
        std::free(elapsed);
        return false;
    }
    for (size_t i = 0; i < num_ranks; ++i) {
        const std::optional<double> &entry = failure.elapsed_s_per_rank[i];
        rank_reported[i] = entry.has_value();
        elapsed[i] = entry.value_or(0.0);
    }
    failure_out.num_ranks = num_ranks;
    failure_out.rank_reported = rank_reported;
    failure_out.elapsed_s_per_rank = elapsed;
    return true;
}

rdzvResult_t rdzvCreateMaster(const rdzvMasterCreateParams_t *params, rdzvMasterInstance_t **p_master_handle_out) {
    RDZV_VALIDATE_INITIALIZED();
    RDZV_VALIDATE(params != nullptr, rdzvInvalidArgument);
    RDZV_VALIDATE(p_master_handle_out != nullptr, rdzvInvalidArgument);
    RDZV_VALIDATE(std::isfinite(params->barrier_timeout_s) && params->barrier_timeout_s >= 0 &&
                  params->barrier_timeout_s <= RDZV_MAX_BARRIER_DURATION_S, rdzvInvalidArgument);
    RDZV_VALIDATE(std::isfinite(params->barrier_warn_interval_s) && params->barrier_warn_interval_s >= 0 &&
                  params->barrier_warn_interval_s <= RDZV_MAX_BARRIER_DURATION_S, rdzvInvalidArgument);

    // explicit durations take precedence over the environment
    rdzv::SyncServiceConfig config = rdzv::SyncServiceConfig::FromEnvironment({});
    if (params->barrier_timeout_s > 0) {
        config.timeout_s = params->barrier_timeout_s;
    }
    if (params->barrier_warn_interval_s > 0) {
        config.warn_interval_s = params->barrier_warn_interval_s;
    }

    *p_master_handle_out = new rdzvMasterInstance_t{
        .master_handler = std::make_unique<rdzv::RendezvousMaster>(params->listen_address, config),
    };
    return rdzvSuccess;
}

rdzvResult_t rdzvRunMaster(rdzvMasterInstance_t *master_instance) {
    RDZV_VALIDATE_INITIALIZED();
    RDZV_VALIDATE(master_instance != nullptr, rdzvInvalidArgument);
    RDZV_VALIDATE(master_instance->master_handler != nullptr, rdzvInvalidUsage);
    if (!master_instance->master_handler->launch()) [[unlikely]] {
        return rdzvInvalidUsage;
    }
    return rdzvSuccess;
}

rdzvResult_t rdzvInterruptMaster(rdzvMasterInstance_t *master_instance) {
    RDZV_VALIDATE_INITIALIZED();
    RDZV_VALIDATE(master_instance != nullptr, rdzvInvalidArgument);
    RDZV_VALIDATE(master_instance->master_handler != nullptr, rdzvInvalidUsage);
    if (!master_instance->master_handler->interrupt()) [[unlikely]] {
        return rdzvInvalidUsage;
    }
    return rdzvSuccess;
}

rdzvResult_t rdzvMasterAwaitTermination(rdzvMasterInstance_t *master_instance) {
    RDZV_VALIDATE_INITIALIZED();
    RDZV_VALIDATE(master_instance != nullptr, rdzvInvalidArgument);
    RDZV_VALIDATE(master_instance->master_handler != nullptr, rdzvInvalidUsage);
    if (!master_instance->master_handler->join()) [[unlikely]] {
        return rdzvInvalidUsage;
    }
    return rdzvSuccess;
}

rdzvResult_t rdzvGetMasterListenPort(const rdzvMasterInstance_t *master_instance, uint16_t *port_out) {
    RDZV_VALIDATE_INITIALIZED();
    RDZV_VALIDATE(master_instance != nullptr, rdzvInvalidArgument);
    RDZV_VALIDATE(port_out != nullptr, rdzvInvalidArgument);
    RDZV_VALIDATE(master_instance->master_handler != nullptr, rdzvInvalidUsage);
    const uint16_t port = master_instance->master_handler->getListenPort();
    RDZV_VALIDATE(port != 0, rdzvInvalidUsage);
    *port_out = port;
    return rdzvSuccess;
}

// ReSharper disable once CppParameterMayBeConstPtrOrRef
rdzvResult_t rdzvDestroyMaster(rdzvMasterInstance_t *master_instance) {
    RDZV_VALIDATE_INITIALIZED();
    RDZV_VALIDATE(master_instance != nullptr, rdzvInvalidArgument);
    delete master_instance;
    return rdzvSuccess;
}

rdzvResult_t rdzvCreateClient(const rdzvClientCreateParams_t *params, rdzvClient_t **client_out) {
    RDZV_VALIDATE_INITIALIZED();
    RDZV_VALIDATE(params != nullptr, rdzvInvalidArgument);
    RDZV_VALIDATE(client_out != nullptr, rdzvInvalidArgument);
    *client_out = new rdzvClient_t(*params);
    return rdzvSuccess;
}

rdzvResult_t rdzvConnect(rdzvClient_t *client) {
    RDZV_VALIDATE_INITIALIZED();
    RDZV_VALIDATE(client != nullptr, rdzvInvalidArgument);
    RDZV_VALIDATE(client->client == nullptr, rdzvInvalidUsage);
    client->client = std::make_unique<rdzv::RendezvousClient>(client->params.master_address);
    if (!client->client->connect()) {
        LOG(ERR) << "Failed to establish connection to master";
        client->client = nullptr;
        return rdzvMasterConnectionFailed;
    }
    return rdzvSuccess;
}

// ReSharper disable once CppParameterMayBeConstPtrOrRef
rdzvResult_t rdzvDestroyClient(rdzvClient_t *client) {
    RDZV_VALIDATE_INITIALIZED();
    RDZV_VALIDATE(client != nullptr, rdzvInvalidArgument);
    if (client->client != nullptr) {
        if (!client->client->interrupt()) [[unlikely]] {
            LOG(WARN) << "Failed to close connection to master while destroying client";
        }
    }
    delete client;
    return rdzvSuccess;
}

rdzvResult_t rdzvBroadcastFromRankZero(const rdzvClient_t *client,
                                       const uint32_t world_rank, const uint32_t world_size,
                                       const void *payload, const size_t payload_size,
                                       rdzvBuffer_t *payload_out,
                                       rdzvBarrierFailureInfo_t *failure_out) {
    RDZV_VALIDATE_INITIALIZED();
    RDZV_VALIDATE(client != nullptr, rdzvInvalidArgument);
    RDZV_VALIDATE(client->client != nullptr, rdzvInvalidUsage);
    RDZV_VALIDATE(payload_out != nullptr, rdzvInvalidArgument);
    RDZV_VALIDATE(payload != nullptr || payload_size == 0, rdzvInvalidArgument);
    RDZV_VALIDATE(world_size > 0 && world_rank < world_size, rdzvInvalidArgument);
    payload_out->data = nullptr;
    payload_out->size = 0;

    const auto *payload_bytes = static_cast<const uint8_t *>(payload);
    const rdzv::BroadcastPayload request_payload = payload_size == 0
                                                       ? rdzv::BroadcastPayload{}
                                                       : rdzv::BroadcastPayload(
                                                           payload_bytes, payload_bytes + payload_size);

    rdzv::SyncResultCode result{};
    std::optional<rdzv::BroadcastPayload> data{};
    rdzv::SyncFailureInfo failure{};
    if (!client->client->broadcastFromRankZero(world_rank, world_size, request_payload, result, data, &failure)) {
        LOG(ERR) << "Broadcast from rank zero failed; connection to master lost";
        return rdzvMasterConnectionLost;
    }
    if (result != rdzv::SYNC_SUCCESS) {
        if (failure_out != nullptr && !copyFailureInfo(failure, *failure_out)) [[unlikely]] {
            return rdzvInternalError;
        }
        return getRdzvResult(result);
    }
    if (!copyToBuffer(data.value_or(rdzv::BroadcastPayload{}), *payload_out)) [[unlikely]] {
        return rdzvInternalError;
    }
    return rdzvSuccess;
}

rdzvResult_t rdzvGetBarrierState(const rdzvClient_t *client, rdzvBarrierState_t *state_out) {
    RDZV_VALIDATE_INITIALIZED();
    RDZV_VALIDATE(client != nullptr, rdzvInvalidArgument);
    RDZV_VALIDATE(client->client != nullptr, rdzvInvalidUsage);
    RDZV_VALIDATE(state_out != nullptr, rdzvInvalidArgument);

    rdzv::BarrierStateInfo state{};
    if (!client->client->queryBarrierState(state)) {
        return rdzvMasterConnectionLost;
    }
    state_out->counter = state.counter;
    state_out->world_size = state.world_size;
    state_out->has_reduced_data = state.reduced_data.has_value();
    if (!copyToBuffer(state.reduced_data.value_or(rdzv::BroadcastPayload{}), state_out->reduced_data)) [[unlikely]] {
        return rdzvInternalError;
    }
    return rdzvSuccess;
}

rdzvResult_t rdzvFreeBuffer(rdzvBuffer_t *buffer) {
    RDZV_VALIDATE(buffer != nullptr, rdzvInvalidArgument);
    std::free(buffer->data);
    buffer->data = nullptr;
    buffer->size = 0;
    return rdzvSuccess;
}

rdzvResult_t rdzvFreeBarrierFailureInfo(rdzvBarrierFailureInfo_t *failure_info) {
    RDZV_VALIDATE(failure_info != nullptr, rdzvInvalidArgument);
    std::free(failure_info->rank_reported);
    std::free(failure_info->elapsed_s_per_rank);
    failure_info->rank_reported = nullptr;
    failure_info->elapsed_s_per_rank = nullptr;
    failure_info->num_ranks = 0;
    return rdzvSuccess;
}
