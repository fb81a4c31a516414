#pragma once

#include "header_map.hpp"
#include <functional>
#include <string>

// Polled by long-running work; returns true once the inbound caller is gone
using CancelCheck = std::function<bool()>;

// Outbound request state. Created once per inbound call and mutated in place
// while paging.
struct RelayRequest {
    std::string method = "GET";
    std::string scheme = "https";
    std::string host;
    std::string path = "/";
    std::string raw_query;
    HeaderMap headers;

    // "/path?query" split into path and raw query
    static RelayRequest from_target(const std::string& target);
    // Absolute "scheme://host/path?query" URL
    static RelayRequest from_url(const std::string& url);

    std::string url() const;

    // Replaces every value of key; the query is re-encoded with sorted keys
    void set_query_param(const std::string& key, const std::string& value);
    std::string query_param(const std::string& key) const;
};

struct UpstreamResponse {
    int status = 0;
    HeaderMap headers;
    std::string body;
};

// An already-authenticated HTTP client for one upstream sub-service.
// Implementations must be safe to call from several threads at once.
class UpstreamClient {
public:
    virtual ~UpstreamClient() = default;

    // Throws RelayError TransportError when no response could be obtained
    virtual UpstreamResponse execute(const RelayRequest& request,
                                     const CancelCheck& is_cancelled) = 0;
};
