#include "gce_metadata.hpp"
#include "relay_error.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

GceMetadataClient::GceMetadataClient(std::shared_ptr<UpstreamClient> client, const std::string& metadata_url)
    : client_(std::move(client))
    , metadata_url_(metadata_url)
{}

std::string GceMetadataClient::default_project(const CancelCheck& is_cancelled) const {
    RelayRequest request = RelayRequest::from_url(metadata_url_ + kProjectIdPath);
    request.headers.set("Metadata-Flavor", "Google");

    auto response = client_->execute(request, is_cancelled);
    if (response.status != kStatusOk) {
        throw RelayError(ErrorKind::TransportError,
                         fmt::format("metadata server answered status {}", response.status));
    }

    std::string project = util::trim(response.body);
    if (project.empty()) {
        throw RelayError(ErrorKind::TransportError, "metadata server returned an empty project id");
    }

    spdlog::debug("GCE default project: {}", project);
    return project;
}
