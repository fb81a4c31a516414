#include "curl_client.hpp"
#include "relay_error.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <memory>

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlHeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

} // namespace

CurlUpstreamClient::CurlUpstreamClient(HeaderMap default_headers, long timeout_ms)
    : default_headers_(std::move(default_headers))
    , timeout_ms_(timeout_ms)
{}

std::shared_ptr<UpstreamClient> CurlUpstreamClient::with_bearer_token(const std::string& token,
                                                                      long timeout_ms) {
    HeaderMap headers;
    if (!token.empty()) {
        headers.set("Authorization", "Bearer " + token);
    }
    return std::make_shared<CurlUpstreamClient>(std::move(headers), timeout_ms);
}

size_t CurlUpstreamClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

size_t CurlUpstreamClient::header_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* headers = static_cast<HeaderMap*>(userp);
    std::string line(buffer, size * nitems);

    // A new status line starts a new response (redirect or 100 Continue)
    if (line.compare(0, 5, "HTTP/") == 0) {
        *headers = HeaderMap{};
        return size * nitems;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        headers->add(util::trim(line.substr(0, colon)), util::trim(line.substr(colon + 1)));
    }
    return size * nitems;
}

int CurlUpstreamClient::progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* is_cancelled = static_cast<const CancelCheck*>(clientp);
    return (*is_cancelled)() ? 1 : 0;
}

UpstreamResponse CurlUpstreamClient::execute(const RelayRequest& request,
                                             const CancelCheck& is_cancelled) {
    CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        throw RelayError(ErrorKind::TransportError, "Failed to initialize CURL");
    }

    // Forwarded headers first, then the client's own on top
    HeaderMap outgoing = request.headers;
    for (const auto& entry : default_headers_.entries()) {
        outgoing.erase(entry.name);
        for (const auto& value : entry.values) {
            outgoing.add(entry.name, value);
        }
    }

    CurlHeaderList header_list(nullptr, &curl_slist_free_all);
    for (const auto& entry : outgoing.entries()) {
        for (const auto& value : entry.values) {
            std::string line = entry.name + ": " + value;
            curl_slist* appended = curl_slist_append(header_list.get(), line.c_str());
            if (!appended) {
                throw RelayError(ErrorKind::TransportError, "Failed to build request headers");
            }
            header_list.release();
            header_list.reset(appended);
        }
    }

    std::string url = request.url();
    UpstreamResponse response;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    if (is_cancelled) {
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &is_cancelled);
    }

    CURLcode res = curl_easy_perform(curl.get());

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        throw RelayError(ErrorKind::TransportError, "request cancelled by caller");
    }
    if (res != CURLE_OK) {
        spdlog::error("Upstream request to {} failed: {}", request.host, curl_easy_strerror(res));
        throw RelayError(ErrorKind::TransportError,
                         std::string("upstream request failed: ") + curl_easy_strerror(res));
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<int>(status);

    return response;
}
