#pragma once

#include <stdexcept>
#include <string>

constexpr int kStatusOk = 200;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusInternalServerError = 500;

enum class ErrorKind {
    UnsupportedEncoding,
    TransportError,
    MalformedUpstreamResponse,
    InvalidResourceName,
    MissingServiceSegment,
    InternalProcessingError,
    PageLimitExceeded,
    DatasourceNotFound
};

// Error raised anywhere in the relay pipeline. Carries the HTTP status the
// caller will see; every kind except InternalProcessingError defaults to 400.
class RelayError : public std::runtime_error {
public:
    RelayError(ErrorKind kind, const std::string& message);
    RelayError(ErrorKind kind, int status, const std::string& message);

    ErrorKind kind() const { return kind_; }
    int status() const { return status_; }

    static int default_status(ErrorKind kind);
    static const char* kind_name(ErrorKind kind);

private:
    ErrorKind kind_;
    int status_;
};
