#include "config.hpp"
#include "curl_client.hpp"
#include "datasource_registry.hpp"
#include "gce_metadata.hpp"
#include "health.hpp"
#include "relay_server.hpp"
#include "resource_handler.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <curl/curl.h>
#include <signal.h>
#include <atomic>
#include <chrono>
#include <thread>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int) {
    shutdown_requested = true;
}

void setup_logging(const std::string& service_name, const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(service_name, console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

std::unique_ptr<StaticDatasourceRegistry> load_datasources(const Config& config) {
    long timeout_ms = config.upstream_timeout_ms;

    if (!config.datasources_file.empty()) {
        return StaticDatasourceRegistry::from_file(config.datasources_file,
            [timeout_ms](const std::string& token) {
                return CurlUpstreamClient::with_bearer_token(token, timeout_ms);
            });
    }

    return StaticDatasourceRegistry::single(config.monitoring_url,
                                            config.resource_manager_url,
                                            CurlUpstreamClient::with_bearer_token(config.access_token, timeout_ms));
}

int main() {
    try {
        // Load configuration
        auto config = Config::from_env();

        // Setup logging
        setup_logging(config.service_name, config.log_level);

        spdlog::info("==============================================");
        spdlog::info("Cloud Monitoring Resource Relay v1.0");
        spdlog::info("==============================================");

        // Validate config
        config.validate();

        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }

        // Setup signal handling
        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        // Initialize components
        auto registry = load_datasources(config);
        ResourceHandler handler(*registry, config.max_pages, static_cast<size_t>(config.max_decoded_bytes));
        GceMetadataClient gce_metadata(std::make_shared<CurlUpstreamClient>(HeaderMap{}, config.upstream_timeout_ms),
                                       config.gce_metadata_url);
        HealthCheck health(config, *registry);

        RelayServer server(config, handler, gce_metadata, health);
        server.start();

        // Main loop
        while (!shutdown_requested && server.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        bool listen_failed = !shutdown_requested;
        if (!listen_failed) {
            spdlog::info("Received shutdown signal");
        }
        server.stop();
        curl_global_cleanup();

        spdlog::info("Shutdown complete");
        return listen_failed ? 1 : 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
