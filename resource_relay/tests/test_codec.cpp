#include <catch2/catch_test_macros.hpp>
#include "../src/codec.hpp"
#include "test_helpers.hpp"
#include <zlib.h>

TEST_CASE("Codec round trip", "[codec]") {
    const std::string json = R"([{"value":"svc","label":"Service"},{"value":"p","label":"Project"}])";
    const std::string binary = std::string("\x00\x01\xff\x10", 4) + "payload" + std::string(1, '\0') + "end";

    SECTION("Identity leaves bytes untouched") {
        REQUIRE(Codec::encode("", json) == json);
        REQUIRE(Codec::decode("", json) == json);
    }

    SECTION("Every compressed encoding restores the payload") {
        for (const std::string encoding : {"gzip", "deflate", "br"}) {
            INFO("encoding " << encoding);
            auto encoded = Codec::encode(encoding, json);
            REQUIRE(encoded != json);
            REQUIRE(Codec::decode(encoding, encoded) == json);
            REQUIRE(Codec::decode(encoding, Codec::encode(encoding, binary)) == binary);
            REQUIRE(Codec::decode(encoding, Codec::encode(encoding, "")).empty());
        }
    }

    SECTION("Large payload spans several chunks") {
        std::string large;
        for (int i = 0; i < 20000; i++) {
            large += "{\"value\":\"item-" + std::to_string(i) + "\"},";
        }
        for (const std::string encoding : {"gzip", "deflate", "br"}) {
            REQUIRE(Codec::decode(encoding, Codec::encode(encoding, large)) == large);
        }
    }

    SECTION("Concatenated gzip members are all decoded") {
        auto body = Codec::encode("gzip", "[1,") + Codec::encode("gzip", "2]");
        REQUIRE(Codec::decode("gzip", body) == "[1,2]");
    }

    SECTION("gzip output carries the gzip magic") {
        auto encoded = Codec::encode("gzip", json);
        REQUIRE(encoded.size() > 2);
        REQUIRE(static_cast<unsigned char>(encoded[0]) == 0x1f);
        REQUIRE(static_cast<unsigned char>(encoded[1]) == 0x8b);
    }

    SECTION("deflate decode accepts zlib-wrapped streams") {
        uLongf size = compressBound(json.size());
        std::string wrapped(size, '\0');
        REQUIRE(compress(reinterpret_cast<Bytef*>(&wrapped[0]), &size,
                         reinterpret_cast<const Bytef*>(json.data()), json.size()) == Z_OK);
        wrapped.resize(size);

        REQUIRE(Codec::decode("deflate", wrapped) == json);
    }
}

TEST_CASE("Codec failures", "[codec]") {
    SECTION("Unknown encoding on decode is a bad request") {
        auto err = capture_relay_error([] { Codec::decode("compress", "abc"); });
        REQUIRE(err.kind() == ErrorKind::UnsupportedEncoding);
        REQUIRE(err.status() == 400);
    }

    SECTION("Unknown encoding on encode is an internal error") {
        auto err = capture_relay_error([] { Codec::encode("zstd", "abc"); });
        REQUIRE(err.kind() == ErrorKind::UnsupportedEncoding);
        REQUIRE(err.status() == 500);
    }

    SECTION("Encoding names are case sensitive") {
        REQUIRE_FALSE(Codec::is_supported("GZIP"));
        REQUIRE(Codec::is_supported("br"));
        REQUIRE(Codec::is_supported(""));
    }

    SECTION("Corrupt gzip input is malformed") {
        auto err = capture_relay_error([] { Codec::decode("gzip", "definitely not gzip"); });
        REQUIRE(err.kind() == ErrorKind::MalformedUpstreamResponse);
        REQUIRE(err.status() == 400);
    }

    SECTION("Truncated streams are malformed") {
        const std::string payload(4096, 'x');
        for (const std::string encoding : {"gzip", "br"}) {
            INFO("encoding " << encoding);
            auto encoded = Codec::encode(encoding, payload);
            encoded.resize(encoded.size() / 2);
            auto err = capture_relay_error([&] { Codec::decode(encoding, encoded); });
            REQUIRE(err.kind() == ErrorKind::MalformedUpstreamResponse);
        }
    }

    SECTION("Data after the end of a stream is malformed") {
        for (const std::string encoding : {"gzip", "deflate", "br"}) {
            INFO("encoding " << encoding);
            auto err = capture_relay_error([&] {
                Codec::decode(encoding, Codec::encode(encoding, "[]") + "GARBAGE");
            });
            REQUIRE(err.kind() == ErrorKind::MalformedUpstreamResponse);
        }
    }

    SECTION("Decoded size limit") {
        const std::string payload(100000, 'x');
        for (const std::string encoding : {"gzip", "deflate", "br"}) {
            INFO("encoding " << encoding);
            auto encoded = Codec::encode(encoding, payload);
            REQUIRE(Codec::decode(encoding, encoded, payload.size()) == payload);
            auto err = capture_relay_error([&] { Codec::decode(encoding, encoded, 4096); });
            REQUIRE(err.kind() == ErrorKind::MalformedUpstreamResponse);
            REQUIRE(err.status() == 400);
        }
    }

    SECTION("Corrupt brotli input is malformed") {
        auto err = capture_relay_error([] { Codec::decode("br", std::string(32, '\xff')); });
        REQUIRE(err.kind() == ErrorKind::MalformedUpstreamResponse);
    }
}
