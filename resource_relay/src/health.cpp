#include "health.hpp"

HealthCheck::HealthCheck(const Config& config, const DatasourceRegistry& registry)
    : config_(config), registry_(registry) {}

nlohmann::json HealthCheck::get_status() const {
    nlohmann::json status = {
        {"ok", is_healthy()},
        {"service", config_.service_name},
        {"datasources", registry_.size()}
    };

    return status;
}

bool HealthCheck::is_healthy() const {
    return registry_.size() > 0;
}
