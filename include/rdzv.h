#pragma once

#include <rdzv_inet.h>

#ifdef __cplusplus
#include <cstddef>
#include <cstdint>
#else
#include <stddef.h>
#include <stdint.h>
#include <stdbool.h>
#endif

#ifdef _MSC_VER
#define RDZV_EXPORT __declspec(dllexport)
#else
#define RDZV_EXPORT __attribute__((visibility("default")))
#endif

#ifdef __cplusplus
extern "C" {
#endif

typedef enum rdzvResult_t {
    rdzvSuccess = 0,
    rdzvNotInitialized = 1,
    rdzvInternalError = 2,
    rdzvInvalidArgument = 3,
    rdzvInvalidUsage = 4,
    rdzvMasterConnectionFailed = 5,
    rdzvMasterConnectionLost = 6,
    rdzvWorldSizeMismatch = 7,
    rdzvBroadcastTimeout = 8,
    rdzvServiceShutdown = 9
} rdzvResult_t;

typedef struct rdzvMasterCreateParams_t {
    /**
     * The address to listen for incoming client connections on.
     */
    rdzv_socket_address_t listen_address;

    /**
     * Total time in seconds a participant waits for its peers before its broadcast fails with
     * @code rdzvBroadcastTimeout@endcode.
     * If 0, the value of the RDZV_BARRIER_TIMEOUT_S environment variable is used if set,
     * otherwise 30 minutes. Must not exceed one year.
     */
    double barrier_timeout_s;

    /**
     * Interval in seconds between two stall warnings logged while participants wait for their peers.
     * If 0, the value of the RDZV_BARRIER_WARN_INTERVAL_S environment variable is used if set,
     * otherwise 60 seconds. Must not exceed one year.
     */
    double barrier_warn_interval_s;
} rdzvMasterCreateParams_t;

typedef struct rdzvClientCreateParams_t {
    /**
     * The address of the master node to connect to.
     */
    rdzv_socket_address_t master_address;
} rdzvClientCreateParams_t;

/**
 * A byte buffer allocated by the library.
 * Must be released with @code rdzvFreeBuffer@endcode.
 */
typedef struct rdzvBuffer_t {
    uint8_t *data;
    size_t size;
} rdzvBuffer_t;

/**
 * Details of a failed broadcast.
 * Must be released with @code rdzvFreeBarrierFailureInfo@endcode.
 */
typedef struct rdzvBarrierFailureInfo_t {
    /**
     * The world size of the active round; set on @code rdzvWorldSizeMismatch@endcode
     */
    uint32_t expected_world_size;

    /**
     * The world size declared by the failing caller
     */
    uint32_t provided_world_size;

    /**
     * The configured timeout; set on @code rdzvBroadcastTimeout@endcode
     */
    double timeout_s;

    /**
     * Number of entries in @code rank_reported@endcode and @code elapsed_s_per_rank@endcode.
     * Equals the world size on @code rdzvBroadcastTimeout@endcode, 0 otherwise.
     */
    size_t num_ranks;

    /**
     * Whether the rank had entered its wait at the moment of the timeout
     */
    bool *rank_reported;

    /**
     * Seconds the rank had been waiting at the moment of the timeout; only meaningful if the rank reported
     */
    double *elapsed_s_per_rank;
} rdzvBarrierFailureInfo_t;

typedef struct rdzvBarrierState_t {
    /**
     * Number of participants currently inside the active round
     */
    uint32_t counter;

    /**
     * World size of the active round; 0 if no round is active
     */
    uint32_t world_size;

    /**
     * Whether rank 0 has deposited its payload in the active round
     */
    bool has_reduced_data;

    /**
     * Payload of rank 0 if @code has_reduced_data@endcode is true. Must be released with @code rdzvFreeBuffer@endcode.
     */
    rdzvBuffer_t reduced_data;
} rdzvBarrierState_t;

typedef struct rdzvMasterInstanceState_t rdzvMasterInstance_t;

typedef struct rdzvClientState_t rdzvClient_t;

#define RDZV_NULLABLE /* nothing */

/**
 * Initializes the rdzv library.
 * Must be called before rdzv library functions are used.
 */
RDZV_EXPORT rdzvResult_t rdzvInit(void);

/**
 * Creates a master node handle.
 * @param params Parameters to create the master with.
 * @param p_master_handle_out Pointer to the master node handle to be created.
 * @return @code rdzvSuccess@endcode if the master node handle was created successfully.
 * @return @code rdzvInvalidArgument@endcode if a duration parameter is negative.
 */
RDZV_EXPORT rdzvResult_t rdzvCreateMaster(const rdzvMasterCreateParams_t *params,
                                          rdzvMasterInstance_t **p_master_handle_out);

/**
 * Runs a master node. This function is non-blocking.
 * @param master_instance The master node handle to run.
 * @return @code rdzvSuccess@endcode if the master node was run successfully.
 * @return @code rdzvInvalidUsage@endcode if the master is already running or the listen address cannot be bound.
 */
RDZV_EXPORT rdzvResult_t rdzvRunMaster(rdzvMasterInstance_t *master_instance);

/**
 * Interrupts a master node.
 * Broadcasts waiting in the barrier are released with @code rdzvServiceShutdown@endcode.
 * @param master_instance The master node handle to interrupt.
 * @return @code rdzvSuccess@endcode if the master node was interrupted successfully.
 */
RDZV_EXPORT rdzvResult_t rdzvInterruptMaster(rdzvMasterInstance_t *master_instance);

/**
 * Awaits termination of a master node. This function is blocking.
 * @param master_instance The master node handle to await termination of.
 * @return @code rdzvSuccess@endcode if the master node was terminated successfully.
 * @return @code rdzvInvalidUsage@endcode if the master handle was never run.
 */
RDZV_EXPORT rdzvResult_t rdzvMasterAwaitTermination(rdzvMasterInstance_t *master_instance);

/**
 * Obtains the port the master node is listening on.
 * @param master_instance The running master node.
 * @param port_out Populated with the listen port.
 * @return @code rdzvInvalidUsage@endcode if the master node is not running.
 */
RDZV_EXPORT rdzvResult_t rdzvGetMasterListenPort(const rdzvMasterInstance_t *master_instance, uint16_t *port_out);

/**
 * Destroys a master node. Must only be called after rdzvMasterAwaitTermination has been called and returned.
 * @param master_instance The master node handle to destroy.
 * @return @code rdzvSuccess@endcode if the master node was destroyed successfully.
 */
RDZV_EXPORT rdzvResult_t rdzvDestroyMaster(rdzvMasterInstance_t *master_instance);

/**
 * Creates a new client.
 * @param params Parameters to create the client with.
 * @param client_out Pointer to the client to be created.
 * @return @code rdzvSuccess@endcode if the client was created successfully.
 * @return @code rdzvNotInitialized@endcode if @code rdzvInit@endcode has not been called yet.
 */
RDZV_EXPORT rdzvResult_t rdzvCreateClient(const rdzvClientCreateParams_t *params, rdzvClient_t **client_out);

/**
 * Establishes the connection to the master node.
 * This function must be called on a client for the client to be usable.
 *
 * @return @code rdzvSuccess@endcode if the connection was established successfully.
 * @return @code rdzvInvalidUsage@endcode if the client is already connected to a master node.
 * @return @code rdzvMasterConnectionFailed@endcode if the master node could not be reached.
 */
RDZV_EXPORT rdzvResult_t rdzvConnect(rdzvClient_t *client);

/**
 * Destroys a client and closes its connection to the master node.
 * @param client The client to destroy.
 * @return @code rdzvSuccess@endcode if the client was destroyed successfully.
 */
RDZV_EXPORT rdzvResult_t rdzvDestroyClient(rdzvClient_t *client);

/**
 * Enters the barrier of the master node and blocks until all @code world_size@endcode ranks have called this
 * function, then outputs the payload supplied by rank 0 to every caller including rank 0 itself.
 * All callers of one round must declare the same world size.
 *
 * @param client The connected client.
 * @param world_rank The rank of the caller; must be smaller than @code world_size@endcode.
 * @param world_size The number of participants of the round; must be positive.
 * @param payload The payload of the caller; only the payload of rank 0 is broadcast. May be null if payload_size is 0.
 * @param payload_size The size of the payload in bytes.
 * @param payload_out Populated with a copy of rank 0's payload on success. Must be released with @code rdzvFreeBuffer@endcode.
 * @param failure_out If not null, populated with the failure details if the barrier fails.
 *
 * @return @code rdzvSuccess@endcode if all ranks arrived.
 * @return @code rdzvInvalidArgument@endcode if the rank or world size is invalid.
 * @return @code rdzvWorldSizeMismatch@endcode if the active round was started with a different world size.
 * @return @code rdzvBroadcastTimeout@endcode if not all ranks arrived within the configured timeout.
 * @return @code rdzvServiceShutdown@endcode if the master node was interrupted.
 * @return @code rdzvMasterConnectionLost@endcode if the connection to the master node failed.
 */
RDZV_EXPORT rdzvResult_t rdzvBroadcastFromRankZero(const rdzvClient_t *client,
                                                   uint32_t world_rank, uint32_t world_size,
                                                   const void *RDZV_NULLABLE payload, size_t payload_size,
                                                   rdzvBuffer_t *payload_out,
                                                   rdzvBarrierFailureInfo_t *RDZV_NULLABLE failure_out);

/**
 * Queries the state of the active round on the master node. Diagnostics only.
 * @param client The connected client.
 * @param state_out Populated with the state of the active round.
 * @return @code rdzvMasterConnectionLost@endcode if the connection to the master node failed.
 */
RDZV_EXPORT rdzvResult_t rdzvGetBarrierState(const rdzvClient_t *client, rdzvBarrierState_t *state_out);

/**
 * Releases a buffer allocated by the library. Resets the buffer to empty.
 */
RDZV_EXPORT rdzvResult_t rdzvFreeBuffer(rdzvBuffer_t *buffer);

/**
 * Releases the per-rank arrays of a failure info allocated by the library.
 */
RDZV_EXPORT rdzvResult_t rdzvFreeBarrierFailureInfo(rdzvBarrierFailureInfo_t *failure_info);

#ifdef __cplusplus
}
#endif
