#pragma once

#include "config.hpp"
#include "datasource_registry.hpp"
#include <nlohmann/json.hpp>

class HealthCheck {
public:
    HealthCheck(const Config& config, const DatasourceRegistry& registry);

    nlohmann::json get_status() const;
    bool is_healthy() const;

private:
    const Config& config_;
    const DatasourceRegistry& registry_;
};
