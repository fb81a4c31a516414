#pragma once

#include "upstream_client.hpp"
#include <memory>
#include <string>

// Looks up the default project of the GCE instance the relay runs on.
class GceMetadataClient {
public:
    static constexpr const char* kDefaultMetadataUrl = "http://metadata.google.internal";
    static constexpr const char* kProjectIdPath = "/computeMetadata/v1/project/project-id";

    GceMetadataClient(std::shared_ptr<UpstreamClient> client, const std::string& metadata_url);

    // Throws RelayError TransportError when the metadata server is unreachable
    // or does not answer 200 with a project id.
    std::string default_project(const CancelCheck& is_cancelled = {}) const;

private:
    std::shared_ptr<UpstreamClient> client_;
    std::string metadata_url_;
};
