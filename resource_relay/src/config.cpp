#include "config.hpp"
#include "datasource_registry.hpp"
#include "gce_metadata.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        size_t pos = 0;
        int parsed = std::stoi(val, &pos);
        if (pos != std::string(val).size()) {
            throw std::invalid_argument(name);
        }
        return parsed;
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8090);

    cfg.datasources_file = get_env("DATASOURCES_FILE");
    cfg.monitoring_url = get_env("MONITORING_URL", StaticDatasourceRegistry::kDefaultMonitoringUrl);
    cfg.resource_manager_url = get_env("RESOURCE_MANAGER_URL",
                                       StaticDatasourceRegistry::kDefaultResourceManagerUrl);
    cfg.access_token = get_env("ACCESS_TOKEN");
    cfg.gce_metadata_url = get_env("GCE_METADATA_URL", GceMetadataClient::kDefaultMetadataUrl);

    cfg.upstream_timeout_ms = get_env_int("UPSTREAM_TIMEOUT_MS", 30000);
    cfg.max_pages = get_env_int("RELAY_MAX_PAGES", 0);
    cfg.max_decoded_bytes = get_env_int("RELAY_MAX_DECODED_BYTES", 0);

    cfg.service_name = get_env("SERVICE_NAME", "resource_relay");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (listen_port <= 0 || listen_port > 65535) {
        throw std::runtime_error("LISTEN_PORT must be between 1 and 65535");
    }
    if (upstream_timeout_ms <= 0) {
        throw std::runtime_error("UPSTREAM_TIMEOUT_MS must be positive");
    }
    if (max_pages < 0) {
        throw std::runtime_error("RELAY_MAX_PAGES must not be negative");
    }
    if (max_decoded_bytes < 0) {
        throw std::runtime_error("RELAY_MAX_DECODED_BYTES must not be negative");
    }
    if (datasources_file.empty() && (monitoring_url.empty() || resource_manager_url.empty())) {
        throw std::runtime_error("MONITORING_URL and RESOURCE_MANAGER_URL are required without DATASOURCES_FILE");
    }

    spdlog::info("Configuration validated successfully");
    if (datasources_file.empty()) {
        spdlog::info("  Monitoring: {}", monitoring_url);
        spdlog::info("  Resource manager: {}", resource_manager_url);
        spdlog::info("  Access token: {}", access_token.empty() ? "unset" : "set");
    } else {
        spdlog::info("  Datasources file: {}", datasources_file);
    }
    spdlog::info("  Upstream timeout: {}ms, page limit: {}", upstream_timeout_ms,
                 max_pages == 0 ? std::string("none") : std::to_string(max_pages));
    spdlog::info("  Decoded page limit: {}",
                 max_decoded_bytes == 0 ? std::string("none") : std::to_string(max_decoded_bytes) + " bytes");
}
