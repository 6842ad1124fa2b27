#include <rdzv.h>
#include <rdzv_protocol.h>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

#define RDZV_CHECK(status) { rdzvResult_t status_val = status; if (status_val != rdzvSuccess) { std::cerr << "Error: " << status_val << std::endl; exit(1); } }

static rdzvMasterInstance_t *master_instance{};

void signal_handler(const int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        std::cout << "Interrupting master node..." << std::endl;
        RDZV_CHECK(rdzvInterruptMaster(master_instance));
    }
}

static uint16_t GetListenPort() {
    const char *env_var = std::getenv(RDZV_MASTER_PORT_ENV_VAR);
    if (env_var == nullptr) {
        return RDZV_PROTOCOL_PORT_MASTER;
    }
    try {
        size_t n_parsed = 0;
        const unsigned long port = std::stoul(env_var, &n_parsed);
        if (n_parsed == std::string(env_var).size() && port > 0 && port <= UINT16_MAX) {
            return static_cast<uint16_t>(port);
        }
    } catch (const std::exception &) {
    }
    std::cerr << "Invalid value for " RDZV_MASTER_PORT_ENV_VAR ": " << env_var << "; using default port "
            << RDZV_PROTOCOL_PORT_MASTER << std::endl;
    return RDZV_PROTOCOL_PORT_MASTER;
}

int main() {
    rdzvMasterCreateParams_t params{};
    params.listen_address.inet.protocol = inetIPv4;
    params.listen_address.inet.ipv4 = {0, 0, 0, 0};
    params.listen_address.port = GetListenPort();

    // 0 selects the environment overrides or the defaults
    params.barrier_timeout_s = 0;
    params.barrier_warn_interval_s = 0;

    // install signal handler for interrupt & termination signals
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    RDZV_CHECK(rdzvInit());
    RDZV_CHECK(rdzvCreateMaster(&params, &master_instance));
    RDZV_CHECK(rdzvRunMaster(master_instance));
    std::cout << "Master node listening on port " << params.listen_address.port << std::endl;

    RDZV_CHECK(rdzvMasterAwaitTermination(master_instance));
    RDZV_CHECK(rdzvDestroyMaster(master_instance));

    std::cout << "Master node terminated." << std::endl;
}
