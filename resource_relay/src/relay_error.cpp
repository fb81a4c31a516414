#include "relay_error.hpp"

RelayError::RelayError(ErrorKind kind, const std::string& message)
    : RelayError(kind, default_status(kind), message)
{}

RelayError::RelayError(ErrorKind kind, int status, const std::string& message)
    : std::runtime_error(message)
    , kind_(kind)
    , status_(status)
{}

int RelayError::default_status(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InternalProcessingError:
            return kStatusInternalServerError;
        default:
            return kStatusBadRequest;
    }
}

const char* RelayError::kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnsupportedEncoding: return "UnsupportedEncoding";
        case ErrorKind::TransportError: return "TransportError";
        case ErrorKind::MalformedUpstreamResponse: return "MalformedUpstreamResponse";
        case ErrorKind::InvalidResourceName: return "InvalidResourceName";
        case ErrorKind::MissingServiceSegment: return "MissingServiceSegment";
        case ErrorKind::InternalProcessingError: return "InternalProcessingError";
        case ErrorKind::PageLimitExceeded: return "PageLimitExceeded";
        case ErrorKind::DatasourceNotFound: return "DatasourceNotFound";
    }
    return "Unknown";
}
