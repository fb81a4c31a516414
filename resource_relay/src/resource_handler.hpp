#pragma once

#include "datasource_registry.hpp"
#include "header_map.hpp"
#include "relay_error.hpp"
#include "target_resolver.hpp"
#include "upstream_client.hpp"
#include <cstddef>
#include <string>

struct InboundRequest {
    std::string target;  // raw "/path?query"
    HeaderMap headers;
    CancelCheck is_cancelled;
};

struct RelayResponse {
    int status = kStatusOk;
    HeaderMap headers;
    std::string body;
};

// Serves one resource-list call end to end: resolve the target, drain the
// upstream pages, build the aggregated body. Errors become plain-text
// responses; nothing escapes as an exception.
class ResourceHandler {
public:
    static constexpr const char* kDatasourceHeader = "X-Datasource-Uid";

    ResourceHandler(const DatasourceRegistry& registry, int max_pages, size_t max_decoded_bytes = 0);

    RelayResponse handle(const InboundRequest& request, const ResourceRoute& route) const;

    static std::string datasource_uid(const HeaderMap& headers);
    static bool is_forwarded_header(const std::string& name);

private:
    const DatasourceRegistry& registry_;
    int max_pages_;
    size_t max_decoded_bytes_;

    static RelayResponse error_response(int status, const std::string& message);
};
