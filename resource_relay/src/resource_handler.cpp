#include "resource_handler.hpp"
#include "pagination.hpp"
#include "response_builder.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace {

// Not forwarded upstream: hop-by-hop headers, routing input and the
// connection pseudo-headers httplib adds to every request
const char* const kSkippedRequestHeaders[] = {
    "Host", "Connection", "Keep-Alive", "Proxy-Connection", "Proxy-Authorization",
    "TE", "Trailer", "Transfer-Encoding", "Upgrade", "Content-Length",
    ResourceHandler::kDatasourceHeader,
    "REMOTE_ADDR", "REMOTE_PORT", "LOCAL_ADDR", "LOCAL_PORT"
};

// Recomputed by the server for the rebuilt body
const char* const kFramingHeaders[] = {
    "Content-Length", "Transfer-Encoding", "Connection", "Keep-Alive"
};

template <size_t N>
bool contains_name(const char* const (&names)[N], const std::string& name) {
    return std::any_of(std::begin(names), std::end(names),
        [&name](const char* n) { return util::iequals(n, name); });
}

} // namespace

ResourceHandler::ResourceHandler(const DatasourceRegistry& registry, int max_pages, size_t max_decoded_bytes)
    : registry_(registry)
    , max_pages_(max_pages)
    , max_decoded_bytes_(max_decoded_bytes)
{}

std::string ResourceHandler::datasource_uid(const HeaderMap& headers) {
    std::string uid = util::trim(headers.get(kDatasourceHeader));
    return uid.empty() ? StaticDatasourceRegistry::kDefaultUid : uid;
}

bool ResourceHandler::is_forwarded_header(const std::string& name) {
    return !contains_name(kSkippedRequestHeaders, name);
}

RelayResponse ResourceHandler::error_response(int status, const std::string& message) {
    RelayResponse response;
    response.status = status;
    response.headers.set("Content-Type", "text/plain");
    response.body = message;
    return response;
}

RelayResponse ResourceHandler::handle(const InboundRequest& request, const ResourceRoute& route) const {
    spdlog::debug("Received resource call url={} kind={}", request.target,
                  ItemNormalizer::kind_name(route.kind));

    RelayRequest outbound = RelayRequest::from_target(request.target);
    for (const auto& entry : request.headers.entries()) {
        if (!is_forwarded_header(entry.name)) continue;
        for (const auto& value : entry.values) {
            outbound.headers.add(entry.name, value);
        }
    }

    RelayOutcome outcome;
    try {
        auto client = TargetResolver::resolve(outbound, registry_, datasource_uid(request.headers),
                                              route.sub_service);
        PaginationDriver driver(*client, route.kind, max_pages_, max_decoded_bytes_);
        outcome = driver.run(outbound, request.is_cancelled);
    } catch (const RelayError& e) {
        spdlog::error("Resource call {} failed ({}): {}", request.target,
                      RelayError::kind_name(e.kind()), e.what());
        return error_response(e.status(), std::string("unexpected error ") + e.what());
    } catch (const std::exception& e) {
        spdlog::error("Resource call {} failed: {}", request.target, e.what());
        return error_response(kStatusInternalServerError, std::string("unexpected error ") + e.what());
    }

    std::string body;
    try {
        body = ResponseBuilder::build(outcome.items, outcome.last_content_encoding);
    } catch (const RelayError& e) {
        spdlog::error("Formatting {} failed: {}", request.target, e.what());
        return error_response(e.status(), std::string("error formatting response ") + e.what());
    }

    RelayResponse response;
    response.status = outcome.last_status_code;
    for (const auto& entry : outcome.last_headers.entries()) {
        if (contains_name(kFramingHeaders, entry.name)) continue;
        for (const auto& value : entry.values) {
            response.headers.add(entry.name, value);
        }
    }
    if (!response.headers.contains("Content-Type")) {
        response.headers.set("Content-Type", "application/json");
    }
    response.body = std::move(body);

    spdlog::debug("Relayed {} item(s) for {}", outcome.items.size(), request.target);
    return response;
}
