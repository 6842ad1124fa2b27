#pragma once

/// Port that the master node is listening on for incoming connections.
/// Master node connections are persistent; a client keeps its connection open across rounds
/// and issues one broadcast request at a time over it.
#define RDZV_PROTOCOL_PORT_MASTER 48248

/// Environment variable overriding the master listen port of the rdzv_master executable.
#define RDZV_MASTER_PORT_ENV_VAR "RDZV_MASTER_PORT"

/// Environment variable overriding the interval in seconds between two stall warnings
/// logged by a waiting participant.
#define RDZV_BARRIER_WARN_INTERVAL_S_ENV_VAR "RDZV_BARRIER_WARN_INTERVAL_S"

/// Environment variable overriding the total time in seconds a participant waits for its peers
/// before the call fails with a broadcast timeout.
#define RDZV_BARRIER_TIMEOUT_S_ENV_VAR "RDZV_BARRIER_TIMEOUT_S"

#define RDZV_DEFAULT_BARRIER_TIMEOUT_S (30.0 * 60.0)

#define RDZV_DEFAULT_BARRIER_WARN_INTERVAL_S 60.0

/// Upper bound in seconds for the barrier timeout and the warn interval (one year).
/// Larger durations are rejected as invalid configuration.
#define RDZV_MAX_BARRIER_DURATION_S (365.0 * 24.0 * 60.0 * 60.0)
