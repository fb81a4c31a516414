#pragma once

#include "normalizer.hpp"
#include "upstream_client.hpp"
#include <cstddef>
#include <string>
#include <vector>

struct RelayOutcome {
    std::vector<NormalizedItem> items;
    // Always taken from the final page fetched
    HeaderMap last_headers;
    std::string last_content_encoding;
    int last_status_code = 0;
};

// Drains a token-paginated upstream listing. Pages are fetched strictly in
// order; the pageToken query parameter of the request is rewritten in place
// between pages. Any failure discards everything accumulated so far.
class PaginationDriver {
public:
    static constexpr const char* kPageTokenParam = "pageToken";

    // max_pages == 0 leaves the loop bounded only by the upstream token;
    // max_decoded_bytes == 0 leaves page bodies unbounded after decompression
    PaginationDriver(UpstreamClient& client, ResourceKind kind, int max_pages = 0,
                     size_t max_decoded_bytes = 0);

    RelayOutcome run(RelayRequest& request, const CancelCheck& is_cancelled = {}) const;

private:
    UpstreamClient& client_;
    ResourceKind kind_;
    int max_pages_;
    size_t max_decoded_bytes_;
};
