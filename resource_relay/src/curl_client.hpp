#pragma once

#include "upstream_client.hpp"
#include <curl/curl.h>
#include <memory>
#include <string>

// libcurl-backed upstream client. Every execute() call owns its own easy
// handle, so one instance may serve concurrent inbound calls.
class CurlUpstreamClient : public UpstreamClient {
public:
    // default_headers are attached to every request and override forwarded
    // headers of the same name (e.g. Authorization)
    explicit CurlUpstreamClient(HeaderMap default_headers = {}, long timeout_ms = 30000);

    UpstreamResponse execute(const RelayRequest& request,
                             const CancelCheck& is_cancelled) override;

    // Client carrying "Authorization: Bearer <token>" when token is not empty
    static std::shared_ptr<UpstreamClient> with_bearer_token(const std::string& token, long timeout_ms);

private:
    HeaderMap default_headers_;
    long timeout_ms_;

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userp);
    static int progress_callback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                                 curl_off_t ultotal, curl_off_t ulnow);
};
