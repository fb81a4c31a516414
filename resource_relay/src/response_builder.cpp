#include "response_builder.hpp"
#include "codec.hpp"
#include "relay_error.hpp"

std::string ResponseBuilder::build(const std::vector<NormalizedItem>& items, const std::string& encoding) {
    std::string body;
    try {
        body = nlohmann::json(items).dump();
    } catch (const nlohmann::json::exception& e) {
        throw RelayError(ErrorKind::InternalProcessingError, kStatusInternalServerError,
                         std::string("response marshaling error ") + e.what());
    }

    try {
        return Codec::encode(encoding, body);
    } catch (const RelayError& e) {
        throw RelayError(e.kind(), kStatusInternalServerError,
                         std::string("unable to encode response ") + e.what());
    }
}
