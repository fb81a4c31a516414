#include "codec.hpp"
#include "relay_error.hpp"
#include <brotli/decode.h>
#include <brotli/encode.h>
#include <spdlog/spdlog.h>
#include <zlib.h>
#include <cstdint>
#include <memory>

namespace {

constexpr size_t kChunkSize = 16384;
constexpr int kBrotliQuality = 6;

enum class ZlibFormat { Gzip, Zlib, RawDeflate };

int window_bits(ZlibFormat format) {
    switch (format) {
        case ZlibFormat::Gzip: return MAX_WBITS + 16;
        case ZlibFormat::Zlib: return MAX_WBITS;
        case ZlibFormat::RawDeflate: return -MAX_WBITS;
    }
    return MAX_WBITS;
}

RelayError malformed(const std::string& detail) {
    return RelayError(ErrorKind::MalformedUpstreamResponse, kStatusBadRequest, detail);
}

RelayError internal(const std::string& detail) {
    return RelayError(ErrorKind::InternalProcessingError, kStatusInternalServerError, detail);
}

// Owns an initialized z_stream; inflateEnd/deflateEnd runs on every exit path.
class ZStream {
public:
    enum class Mode { Inflate, Deflate };

    ZStream(Mode mode, ZlibFormat format) : mode_(mode) {
        int ret = mode_ == Mode::Inflate
            ? inflateInit2(&stream_, window_bits(format))
            : deflateInit2(&stream_, Z_DEFAULT_COMPRESSION, Z_DEFLATED,
                           window_bits(format), 8, Z_DEFAULT_STRATEGY);
        if (ret != Z_OK) {
            throw internal("zlib stream initialization failed with code " + std::to_string(ret));
        }
    }

    ~ZStream() {
        int ret = mode_ == Mode::Inflate ? inflateEnd(&stream_) : deflateEnd(&stream_);
        if (ret != Z_OK) {
            spdlog::warn("Failed to close zlib stream: code {}", ret);
        }
    }

    ZStream(const ZStream&) = delete;
    ZStream& operator=(const ZStream&) = delete;

    z_stream* get() { return &stream_; }

private:
    z_stream stream_{};
    Mode mode_;
};

using BrotliDecoderPtr = std::unique_ptr<BrotliDecoderState, decltype(&BrotliDecoderDestroyInstance)>;
using BrotliEncoderPtr = std::unique_ptr<BrotliEncoderState, decltype(&BrotliEncoderDestroyInstance)>;

// Appends a decoded chunk; max_bytes == 0 means no limit
void append_bounded(std::string& out, const char* data, size_t size, size_t max_bytes) {
    if (max_bytes != 0 && out.size() + size > max_bytes) {
        throw malformed("decoded response exceeds " + std::to_string(max_bytes) + " bytes");
    }
    out.append(data, size);
}

std::string inflate_all(const std::string& body, ZlibFormat format, size_t max_bytes) {
    ZStream zs(ZStream::Mode::Inflate, format);
    z_stream* s = zs.get();
    s->next_in = reinterpret_cast<Bytef*>(const_cast<char*>(body.data()));
    s->avail_in = static_cast<uInt>(body.size());

    std::string out;
    char buf[kChunkSize];
    while (true) {
        s->next_out = reinterpret_cast<Bytef*>(buf);
        s->avail_out = sizeof(buf);
        int ret = inflate(s, Z_NO_FLUSH);
        if (ret == Z_BUF_ERROR && s->avail_in == 0) {
            throw malformed("unexpected end of compressed stream");
        }
        if (ret != Z_OK && ret != Z_STREAM_END) {
            throw malformed(std::string("invalid compressed stream: ") +
                            (s->msg ? s->msg : std::to_string(ret)));
        }
        append_bounded(out, buf, sizeof(buf) - s->avail_out, max_bytes);

        if (ret == Z_STREAM_END) {
            if (s->avail_in == 0) break;
            // gzip bodies may hold several members; anything else must end here
            if (format != ZlibFormat::Gzip) {
                throw malformed("unexpected data after compressed stream");
            }
            if (inflateReset(s) != Z_OK) {
                throw internal("zlib stream reset failed");
            }
        }
    }
    return out;
}

std::string deflate_all(const std::string& data, ZlibFormat format) {
    ZStream zs(ZStream::Mode::Deflate, format);
    z_stream* s = zs.get();
    s->next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    s->avail_in = static_cast<uInt>(data.size());

    std::string out;
    char buf[kChunkSize];
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        s->next_out = reinterpret_cast<Bytef*>(buf);
        s->avail_out = sizeof(buf);
        ret = deflate(s, Z_FINISH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            throw internal("deflate failed with code " + std::to_string(ret));
        }
        out.append(buf, sizeof(buf) - s->avail_out);
    }
    return out;
}

// HTTP "deflate" arrives either zlib-wrapped or raw; a zlib header is a CMF
// byte with method 8 whose 16-bit value with FLG is a multiple of 31.
bool has_zlib_header(const std::string& body) {
    if (body.size() < 2) return false;
    auto cmf = static_cast<unsigned char>(body[0]);
    auto flg = static_cast<unsigned char>(body[1]);
    return (cmf & 0x0F) == 8 && ((cmf << 8) | flg) % 31 == 0;
}

std::string brotli_decode(const std::string& body, size_t max_bytes) {
    BrotliDecoderPtr state(BrotliDecoderCreateInstance(nullptr, nullptr, nullptr),
                           &BrotliDecoderDestroyInstance);
    if (!state) {
        throw internal("brotli decoder allocation failed");
    }

    const auto* next_in = reinterpret_cast<const uint8_t*>(body.data());
    size_t avail_in = body.size();

    std::string out;
    uint8_t buf[kChunkSize];
    while (true) {
        uint8_t* next_out = buf;
        size_t avail_out = sizeof(buf);
        auto res = BrotliDecoderDecompressStream(state.get(), &avail_in, &next_in,
                                                 &avail_out, &next_out, nullptr);
        append_bounded(out, reinterpret_cast<const char*>(buf), sizeof(buf) - avail_out, max_bytes);

        if (res == BROTLI_DECODER_RESULT_SUCCESS) {
            if (avail_in != 0) {
                throw malformed("unexpected data after brotli stream");
            }
            break;
        }
        if (res == BROTLI_DECODER_RESULT_ERROR) {
            throw malformed(std::string("invalid brotli stream: ") +
                            BrotliDecoderErrorString(BrotliDecoderGetErrorCode(state.get())));
        }
        if (res == BROTLI_DECODER_RESULT_NEEDS_MORE_INPUT) {
            throw malformed("unexpected end of brotli stream");
        }
        // BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT: drain again
    }
    return out;
}

std::string brotli_encode(const std::string& data) {
    BrotliEncoderPtr state(BrotliEncoderCreateInstance(nullptr, nullptr, nullptr),
                           &BrotliEncoderDestroyInstance);
    if (!state) {
        throw internal("brotli encoder allocation failed");
    }
    if (BrotliEncoderSetParameter(state.get(), BROTLI_PARAM_QUALITY, kBrotliQuality) == BROTLI_FALSE) {
        throw internal("brotli set quality failed");
    }

    const auto* next_in = reinterpret_cast<const uint8_t*>(data.data());
    size_t avail_in = data.size();

    std::string out;
    uint8_t buf[kChunkSize];
    while (true) {
        uint8_t* next_out = buf;
        size_t avail_out = sizeof(buf);
        if (BrotliEncoderCompressStream(state.get(), BROTLI_OPERATION_FINISH, &avail_in, &next_in,
                                        &avail_out, &next_out, nullptr) == BROTLI_FALSE) {
            throw internal("brotli compression failed");
        }
        out.append(reinterpret_cast<const char*>(buf), sizeof(buf) - avail_out);
        if (BrotliEncoderIsFinished(state.get()) == BROTLI_TRUE) break;
    }
    return out;
}

} // namespace

bool Codec::is_supported(const std::string& encoding) {
    return encoding.empty() || encoding == "gzip" || encoding == "deflate" || encoding == "br";
}

std::string Codec::decode(const std::string& encoding, const std::string& body, size_t max_decoded_bytes) {
    if (encoding.empty()) {
        return body;
    }
    if (encoding == "gzip") {
        return inflate_all(body, ZlibFormat::Gzip, max_decoded_bytes);
    }
    if (encoding == "deflate") {
        return inflate_all(body, has_zlib_header(body) ? ZlibFormat::Zlib : ZlibFormat::RawDeflate,
                           max_decoded_bytes);
    }
    if (encoding == "br") {
        return brotli_decode(body, max_decoded_bytes);
    }
    throw RelayError(ErrorKind::UnsupportedEncoding, kStatusBadRequest,
                     "unexpected encoding type " + encoding);
}

std::string Codec::encode(const std::string& encoding, const std::string& data) {
    if (encoding.empty()) {
        return data;
    }
    if (encoding == "gzip") {
        return deflate_all(data, ZlibFormat::Gzip);
    }
    if (encoding == "deflate") {
        return deflate_all(data, ZlibFormat::RawDeflate);
    }
    if (encoding == "br") {
        return brotli_encode(data);
    }
    throw RelayError(ErrorKind::UnsupportedEncoding, kStatusInternalServerError,
                     "unexpected encoding type " + encoding);
}
