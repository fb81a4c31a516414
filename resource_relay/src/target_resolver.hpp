#pragma once

#include "datasource_registry.hpp"
#include "normalizer.hpp"
#include "upstream_client.hpp"
#include <memory>
#include <string>

struct ForwardTarget {
    std::string path;
    std::string query;
};

// Which backend and which normalizer serve an inbound route
struct ResourceRoute {
    SubService sub_service;
    ResourceKind kind;
};

class TargetResolver {
public:
    static constexpr const char* kProjectsRoute = "/projects";
    static constexpr const char* kResourceManagerPath = "/v1/projects";

    // "/projects" maps to the resource-manager listing; any other path drops
    // its first segment ("/services/v3/x" -> "/v3/x"). The query is kept.
    // Throws RelayError MissingServiceSegment for paths like "/services".
    static ForwardTarget get_target(const std::string& inbound_target);

    // Rewrites path, scheme and host of `request` for the sub-service of the
    // given datasource and returns the client to send it with.
    static std::shared_ptr<UpstreamClient> resolve(RelayRequest& request,
                                                   const DatasourceRegistry& registry,
                                                   const std::string& datasource_uid,
                                                   SubService sub);
};
