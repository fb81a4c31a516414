#include "relay_server.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

RelayServer::RelayServer(const Config& config,
                         const ResourceHandler& handler,
                         const GceMetadataClient& gce_metadata,
                         const HealthCheck& health)
    : config_(config)
    , handler_(handler)
    , gce_metadata_(gce_metadata)
    , health_(health)
    , server_(std::make_unique<httplib::Server>())
{}

void RelayServer::start() {
    if (running_) return;

    setup_routes();
    running_ = true;

    server_thread_ = std::thread([this]() {
        spdlog::info("Starting HTTP server on {}:{}",
                     config_.listen_addr, config_.listen_port);
        if (!server_->listen(config_.listen_addr.c_str(), config_.listen_port)) {
            spdlog::error("HTTP server could not listen on {}:{}",
                          config_.listen_addr, config_.listen_port);
        }
        running_ = false;
    });

    spdlog::info("Relay server started");
}

void RelayServer::stop() {
    server_->stop();
    running_ = false;

    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    spdlog::info("Relay server stopped");
}

void RelayServer::setup_routes() {
    const std::pair<const char*, ResourceRoute> routes[] = {
        {"/metricDescriptors/.*", {SubService::CloudMonitoring, ResourceKind::MetricDescriptors}},
        {"/services/.*", {SubService::CloudMonitoring, ResourceKind::Services}},
        {"/slo-services/.*", {SubService::CloudMonitoring, ResourceKind::Slos}},
        {TargetResolver::kProjectsRoute, {SubService::ResourceManager, ResourceKind::Projects}}
    };

    for (const auto& [pattern, route] : routes) {
        server_->Get(pattern,
            [this, route = route](const httplib::Request& req, httplib::Response& res) {
                handle_resource(req, res, route);
            });
    }

    server_->Get("/gceDefaultProject",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_gce_default_project(req, res);
        });

    server_->Get("/health",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_health(req, res);
        });
}

InboundRequest RelayServer::to_inbound(const httplib::Request& req) {
    InboundRequest inbound;
    inbound.target = req.target.empty() ? req.path : req.target;
    for (const auto& [name, value] : req.headers) {
        inbound.headers.add(name, value);
    }
    inbound.is_cancelled = [&req]() { return req.is_connection_closed(); };
    return inbound;
}

void RelayServer::write_response(const RelayResponse& relay, httplib::Response& res) {
    res.status = relay.status;
    for (const auto& entry : relay.headers.entries()) {
        res.headers.erase(entry.name);
        if (util::iequals(entry.name, "Content-Type")) continue;
        for (const auto& value : entry.values) {
            res.set_header(entry.name, value);
        }
    }

    // The body is already in its final content coding. A sized content
    // provider is sent as is, whereas httplib may compress a plain body again.
    std::string content_type = relay.headers.get("Content-Type");
    if (content_type.empty()) {
        content_type = "application/json";
    }
    res.headers.erase("Content-Type");
    res.body.clear();
    auto body = std::make_shared<std::string>(relay.body);
    res.set_content_provider(body->size(), content_type,
        [body](size_t offset, size_t length, httplib::DataSink& sink) {
            return sink.write(body->data() + offset, length);
        });
}

void RelayServer::handle_resource(const httplib::Request& req, httplib::Response& res,
                                  const ResourceRoute& route) {
    write_response(handler_.handle(to_inbound(req), route), res);
}

void RelayServer::handle_gce_default_project(const httplib::Request& req, httplib::Response& res) {
    try {
        auto project = gce_metadata_.default_project(to_inbound(req).is_cancelled);
        res.status = kStatusOk;
        res.set_content(project, "text/plain");
    } catch (const std::exception& e) {
        spdlog::error("GCE default project lookup failed: {}", e.what());
        res.status = kStatusBadRequest;
        res.set_content(std::string("unexpected error ") + e.what(), "text/plain");
    }
}

void RelayServer::handle_health(const httplib::Request& req, httplib::Response& res) {
    auto health = health_.get_status();

    res.set_content(health.dump(), "application/json");
    res.status = health_.is_healthy() ? 200 : 503;
}
