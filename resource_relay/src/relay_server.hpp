#pragma once

#include "config.hpp"
#include "gce_metadata.hpp"
#include "health.hpp"
#include "resource_handler.hpp"
#include <httplib.h>
#include <atomic>
#include <memory>
#include <thread>

class RelayServer {
public:
    RelayServer(const Config& config,
                const ResourceHandler& handler,
                const GceMetadataClient& gce_metadata,
                const HealthCheck& health);

    void start();
    void stop();
    bool is_running() const { return running_; }

    // First value of each upstream header replaces, later values append.
    // The body goes out byte for byte; httplib never re-encodes it.
    static void write_response(const RelayResponse& relay, httplib::Response& res);
    static InboundRequest to_inbound(const httplib::Request& req);

private:
    const Config& config_;
    const ResourceHandler& handler_;
    const GceMetadataClient& gce_metadata_;
    const HealthCheck& health_;

    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
    std::thread server_thread_;

    void setup_routes();
    void handle_resource(const httplib::Request& req, httplib::Response& res, const ResourceRoute& route);
    void handle_gce_default_project(const httplib::Request& req, httplib::Response& res);
    void handle_health(const httplib::Request& req, httplib::Response& res);
};
