#pragma once

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef enum rdzv_inet_protocol_t {
    inetIPv4,
    inetIPv6
} rdzv_inet_protocol_t;

typedef struct rdzv_ipv4_address_t {
    uint8_t data[4];
} rdzv_ipv4_address_t;

typedef struct rdzv_ipv6_address_t {
    uint8_t data[16];
} rdzv_ipv6_address_t;

typedef struct rdzv_inet_address_t {
    rdzv_inet_protocol_t protocol;
    union {
        rdzv_ipv4_address_t ipv4;
        rdzv_ipv6_address_t ipv6;
    };
} rdzv_inet_address_t;

/// Port is stored in host byte order.
typedef struct rdzv_socket_address_t {
    rdzv_inet_address_t inet;
    uint16_t port;
} rdzv_socket_address_t;

#ifdef __cplusplus
}
#endif
