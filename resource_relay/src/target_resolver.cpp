#include "target_resolver.hpp"
#include "relay_error.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

ForwardTarget TargetResolver::get_target(const std::string& inbound_target) {
    ForwardTarget target;
    std::string path = inbound_target;
    size_t q = inbound_target.find('?');
    if (q != std::string::npos) {
        path = inbound_target.substr(0, q);
        target.query = inbound_target.substr(q + 1);
    }

    if (path == kProjectsRoute) {
        target.path = kResourceManagerPath;
        return target;
    }

    auto parts = util::split(path, '/', 3);
    if (parts.size() < 3) {
        throw RelayError(ErrorKind::MissingServiceSegment,
                         "the request should contain the service on its path");
    }
    target.path = "/" + parts[2];
    return target;
}

std::shared_ptr<UpstreamClient> TargetResolver::resolve(RelayRequest& request,
                                                        const DatasourceRegistry& registry,
                                                        const std::string& datasource_uid,
                                                        SubService sub) {
    ForwardTarget target = get_target(request.path);

    auto datasource = registry.get(datasource_uid);
    const auto& endpoint = datasource->endpoint(sub);
    if (!endpoint.client) {
        throw RelayError(ErrorKind::DatasourceNotFound,
                         fmt::format("no client configured for {}", sub_service_name(sub)));
    }

    RelayRequest base;
    try {
        base = RelayRequest::from_url(endpoint.url);
    } catch (const RelayError& e) {
        throw RelayError(ErrorKind::DatasourceNotFound, e.what());
    }

    request.path = target.path;
    request.scheme = base.scheme;
    request.host = base.host;

    spdlog::debug("Resolved {} target {}", sub_service_name(sub), request.url());
    return endpoint.client;
}
