#include "sync_config.hpp"

#include <rdzv_log.hpp>

#include <cmath>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>

static std::optional<double> GetPositiveDoubleEnvVar(const char *var_name) {
    const char *env_var = std::getenv(var_name);
    if (env_var == nullptr) {
        return std::nullopt;
    }
    try {
        size_t n_parsed = 0;
        const double value = std::stod(env_var, &n_parsed);
        if (n_parsed != std::string(env_var).size() || !std::isfinite(value) || value <= 0 ||
            value > RDZV_MAX_BARRIER_DURATION_S) {
            LOG(WARN) << "Ignoring invalid value for environment variable " << var_name << ": " << env_var;
            return std::nullopt;
        }
        return value;
    } catch (const std::invalid_argument &) {
        LOG(WARN) << "Ignoring invalid value for environment variable " << var_name << ": " << env_var;
    } catch (const std::out_of_range &) {
        LOG(WARN) << "Ignoring out of range value for environment variable " << var_name << ": " << env_var;
    }
    return std::nullopt;
}

rdzv::SyncServiceConfig rdzv::SyncServiceConfig::FromEnvironment(const SyncServiceConfig &base) {
    SyncServiceConfig config = base;
    if (const auto timeout_s = GetPositiveDoubleEnvVar(RDZV_BARRIER_TIMEOUT_S_ENV_VAR)) {
        config.timeout_s = *timeout_s;
    }
    if (const auto warn_interval_s = GetPositiveDoubleEnvVar(RDZV_BARRIER_WARN_INTERVAL_S_ENV_VAR)) {
        config.warn_interval_s = *warn_interval_s;
    }
    return config;
}

bool rdzv::SyncServiceConfig::isValid() const {
    return std::isfinite(timeout_s) && timeout_s > 0 && timeout_s <= RDZV_MAX_BARRIER_DURATION_S &&
           std::isfinite(warn_interval_s) && warn_interval_s > 0 && warn_interval_s <= RDZV_MAX_BARRIER_DURATION_S;
}
