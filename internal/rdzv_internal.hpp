#pragma once

#include <rdzv.h>
#include <rdzv_client.hpp>
#include <rdzv_master.hpp>
#include <rdzv_log.hpp>
#include <memory>

#define RDZV_DEBUG(msg) LOG(DEBUG) << msg;

#define __RDZV_STRINGIFY(x) #x
#define __RDZV_TOSTRING(x) __RDZV_STRINGIFY(x)

#define RDZV_VALIDATE(condition, err) {  \
if (!(condition)) {                      \
RDZV_DEBUG(__FILE__ ":" __RDZV_TOSTRING(__LINE__) ": " #condition);         \
return err;                              \
}                                        \
}

#define RDZV_ERR_PROPAGATE(status) { rdzvResult_t status_val = status; if (status_val != rdzvSuccess) { return (status_val); } }

struct rdzvClientState_t {
    std::unique_ptr<rdzv::RendezvousClient> client;

    rdzvClientCreateParams_t params;

    explicit rdzvClientState_t(const rdzvClientCreateParams_t &params) : params(params) {
    }
};

struct rdzvMasterInstanceState_t {
    std::unique_ptr<rdzv::RendezvousMaster> master_handler;
};
