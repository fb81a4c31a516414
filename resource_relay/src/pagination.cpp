#include "pagination.hpp"
#include "codec.hpp"
#include "relay_error.hpp"
#include <spdlog/spdlog.h>

PaginationDriver::PaginationDriver(UpstreamClient& client, ResourceKind kind, int max_pages,
                                   size_t max_decoded_bytes)
    : client_(client)
    , kind_(kind)
    , max_pages_(max_pages)
    , max_decoded_bytes_(max_decoded_bytes)
{}

RelayOutcome PaginationDriver::run(RelayRequest& request, const CancelCheck& is_cancelled) const {
    RelayOutcome outcome;
    std::vector<NormalizedItem> items;
    int pages = 0;

    while (true) {
        if (is_cancelled && is_cancelled()) {
            throw RelayError(ErrorKind::TransportError, "request cancelled by caller");
        }
        if (max_pages_ > 0 && pages >= max_pages_) {
            throw RelayError(ErrorKind::PageLimitExceeded,
                             fmt::format("page limit of {} reached for {}", max_pages_, request.path));
        }

        UpstreamResponse response = client_.execute(request, is_cancelled);
        ++pages;

        outcome.last_content_encoding = response.headers.get("Content-Encoding");
        outcome.last_headers = std::move(response.headers);
        outcome.last_status_code = response.status;

        spdlog::debug("Fetched {} page {} from {}: status={} encoding='{}' bytes={}",
                      ItemNormalizer::kind_name(kind_), pages, request.host,
                      response.status, outcome.last_content_encoding, response.body.size());
        if (response.status >= 400) {
            spdlog::warn("Upstream {} answered {} for {}", request.host, response.status, request.path);
        }

        std::string body;
        try {
            body = Codec::decode(outcome.last_content_encoding, response.body, max_decoded_bytes_);
        } catch (const RelayError& e) {
            throw RelayError(e.kind(), e.status(), std::string("unable to decode response ") + e.what());
        }

        PageResult page;
        try {
            page = ItemNormalizer::normalize(kind_, body, std::move(items));
        } catch (const RelayError& e) {
            throw RelayError(ErrorKind::InternalProcessingError, kStatusInternalServerError,
                             std::string("data processing error ") + e.what());
        }
        items = std::move(page.items);

        if (page.continuation_token.empty()) {
            break;
        }
        request.set_query_param(kPageTokenParam, page.continuation_token);
    }

    outcome.items = std::move(items);
    return outcome;
}
