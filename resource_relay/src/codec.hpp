#pragma once

#include <cstddef>
#include <string>

// Content-coding transform shared by both directions of the relay.
// Supported encodings: "" (identity), "gzip", "deflate", "br".
class Codec {
public:
    // Throws RelayError: UnsupportedEncoding (400) for an unknown encoding,
    // MalformedUpstreamResponse (400) for a corrupt or truncated stream, for
    // data trailing the stream, or when the decompressed size would exceed
    // max_decoded_bytes (0 = unlimited). Concatenated gzip members are all
    // decoded.
    static std::string decode(const std::string& encoding, const std::string& body,
                              size_t max_decoded_bytes = 0);

    // Throws RelayError: UnsupportedEncoding (500) for an unknown encoding,
    // InternalProcessingError (500) when the compressor fails.
    static std::string encode(const std::string& encoding, const std::string& data);

    static bool is_supported(const std::string& encoding);
};
