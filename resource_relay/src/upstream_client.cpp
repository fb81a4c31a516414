#include "upstream_client.hpp"
#include "relay_error.hpp"
#include "util.hpp"

RelayRequest RelayRequest::from_target(const std::string& target) {
    RelayRequest request;
    size_t q = target.find('?');
    if (q == std::string::npos) {
        request.path = target;
    } else {
        request.path = target.substr(0, q);
        request.raw_query = target.substr(q + 1);
    }
    if (request.path.empty()) {
        request.path = "/";
    }
    return request;
}

RelayRequest RelayRequest::from_url(const std::string& url) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        throw RelayError(ErrorKind::TransportError, "invalid URL: " + url);
    }

    size_t host_start = scheme_end + 3;
    size_t host_end = url.find_first_of("/?", host_start);
    std::string host = url.substr(host_start, host_end == std::string::npos
                                                 ? std::string::npos
                                                 : host_end - host_start);
    if (host.empty()) {
        throw RelayError(ErrorKind::TransportError, "invalid URL: " + url);
    }

    RelayRequest request = from_target(host_end == std::string::npos ? "/" : url.substr(host_end));
    request.scheme = util::to_lower(url.substr(0, scheme_end));
    request.host = host;
    return request;
}

std::string RelayRequest::url() const {
    std::string out = scheme + "://" + host + path;
    if (!raw_query.empty()) {
        out += "?" + raw_query;
    }
    return out;
}

void RelayRequest::set_query_param(const std::string& key, const std::string& value) {
    auto values = util::parse_query(raw_query);
    values[key] = {value};
    raw_query = util::encode_query(values);
}

std::string RelayRequest::query_param(const std::string& key) const {
    auto values = util::parse_query(raw_query);
    auto it = values.find(key);
    if (it == values.end() || it->second.empty()) return "";
    return it->second.front();
}
