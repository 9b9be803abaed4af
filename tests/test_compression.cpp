// tests/test_compression.cpp
#include "tests.hpp"

#include <string>

#include "strata/codec/compression.hpp"

using namespace strata;

namespace {
    core::byte_buffer text_bytes(const std::string& s) {
        const auto* p = reinterpret_cast<const core::byte*>(s.data());
        return { p, p + s.size() };
    }

    std::string repeated(std::size_t n) {
        std::string s;
        for (std::size_t i = 0; i < n; ++i) {
            s += "chunk-" + std::to_string(i % 97) + ";";
        }
        return s;
    }
}

TEST_SUITE("codec/compression") {

    TEST_CASE("zlib stream starts with a zlib header") {
        auto packed = codec::compress_zlib(text_bytes("hello"));
        REQUIRE(packed);
        REQUIRE(packed->size() >= 2);
        CHECK(std::to_integer<int>((*packed)[0]) == 0x78);
    }

    TEST_CASE("gzip stream starts with the gzip magic") {
        auto packed = codec::compress_gzip(text_bytes("hello"));
        REQUIRE(packed);
        REQUIRE(packed->size() >= 2);
        CHECK(std::to_integer<int>((*packed)[0]) == 0x1F);
        CHECK(std::to_integer<int>((*packed)[1]) == 0x8B);
    }

    TEST_CASE("large input survives both wrappers") {
        const auto input = text_bytes(repeated(20000));

        auto z = codec::compress_zlib(input);
        REQUIRE(z);
        CHECK(z->size() < input.size());
        auto back = codec::decompress_zlib(z.value());
        REQUIRE(back);
        CHECK(back.value() == input);

        auto g = codec::compress_gzip(input, 9);
        REQUIRE(g);
        auto gback = codec::decompress_gzip(g.value());
        REQUIRE(gback);
        CHECK(gback.value() == input);
    }

    TEST_CASE("empty input") {
        auto z = codec::compress_zlib({});
        REQUIRE(z);
        auto back = codec::decompress_zlib(z.value());
        REQUIRE(back);
        CHECK(back->empty());
    }

    TEST_CASE("wrong wrapper is an error") {
        auto g = codec::compress_gzip(text_bytes("some gzip data"));
        REQUIRE(g);
        auto res = codec::decompress_zlib(g.value());
        CHECK_FALSE(res);
        CHECK_FALSE(res.error().describe().empty());
    }

    TEST_CASE("truncated stream is an error") {
        auto z = codec::compress_zlib(text_bytes(repeated(500)));
        REQUIRE(z);
        auto cut = z.value();
        cut.resize(cut.size() / 2);
        CHECK_FALSE(codec::decompress_zlib(cut));
    }

    TEST_CASE("garbage is an error") {
        core::byte_buffer junk(64, core::byte{ 0x42 });
        CHECK_FALSE(codec::decompress_zlib(junk));
        CHECK_FALSE(codec::decompress_gzip(junk));
    }
}
