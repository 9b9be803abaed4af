// tests/test_coords.cpp
#include "tests.hpp"

#include <cstdint>

#include "strata/region/coords.hpp"

using namespace strata::region;

TEST_SUITE("region/coords") {

    TEST_CASE("positive chunks fold into region 0") {
        CHECK(region_of({ 4, 4 }) == region_pos{ 0, 0 });
        CHECK(local_of({ 4, 4 }) == local_pos{ 4, 4 });
        CHECK(region_of({ 31, 32 }) == region_pos{ 0, 1 });
        CHECK(local_of({ 31, 32 }) == local_pos{ 31, 0 });
        CHECK(region_of({ 100, 100 }) == region_pos{ 3, 3 });
        CHECK(local_of({ 100, 100 }) == local_pos{ 4, 4 });
    }

    TEST_CASE("negative chunks floor") {
        CHECK(region_of({ -1, -1 }) == region_pos{ -1, -1 });
        CHECK(local_of({ -1, -1 }) == local_pos{ 31, 31 });
        CHECK(region_of({ -32, -33 }) == region_pos{ -1, -2 });
        CHECK(local_of({ -32, -33 }) == local_pos{ 0, 31 });
    }

    TEST_CASE("slot index is x + z * 32") {
        CHECK(slot_index({ 0, 0 }) == 0);
        CHECK(slot_index({ 15, 3 }) == 111);
        CHECK(slot_index({ 31, 31 }) == 1023);
        CHECK(local_of_slot(111) == local_pos{ 15, 3 });
    }

    TEST_CASE("chunk_of reverses the fold") {
        for (chunk_pos c : { chunk_pos{ 4, 4 }, chunk_pos{ -1, -1 }, chunk_pos{ 100, -33 } }) {
            CHECK(chunk_of(region_of(c), local_of(c)) == c);
        }
        constexpr chunk_pos lo{ INT32_MIN, INT32_MIN };
        constexpr chunk_pos hi{ INT32_MAX, INT32_MAX };
        CHECK(region_of(lo) == region_pos{ -(1 << 26), -(1 << 26) });
        CHECK(chunk_of(region_of(lo), local_of(lo)) == lo);
        CHECK(chunk_of(region_of(hi), local_of(hi)) == hi);
    }

    TEST_CASE("region validity follows the chunk range") {
        CHECK(is_valid_region({ 0, 0 }));
        CHECK(is_valid_region({ -(1 << 26), (1 << 26) - 1 }));
        CHECK_FALSE(is_valid_region({ 1 << 26, 0 }));
        CHECK_FALSE(is_valid_region({ 0, -(1 << 26) - 1 }));
        CHECK_FALSE(is_valid_region({ INT32_MAX, INT32_MIN }));
    }

    TEST_CASE("local validity") {
        CHECK(is_valid_local(0, 31));
        CHECK_FALSE(is_valid_local(32, 0));
        CHECK_FALSE(is_valid_local(0, -1));
    }

    TEST_CASE("region file names") {
        CHECK(region_file_name({ 0, 0 }) == "r.0.0.mca");
        CHECK(region_file_name({ -1, 3 }) == "r.-1.3.mca");

        auto p = parse_region_file_name("r.-12.7.mca");
        REQUIRE(p.has_value());
        CHECK(*p == region_pos{ -12, 7 });

        CHECK_FALSE(parse_region_file_name("r.1.mca").has_value());
        CHECK_FALSE(parse_region_file_name("r.1.2.mcr").has_value());
        CHECK_FALSE(parse_region_file_name("r.a.2.mca").has_value());
        CHECK_FALSE(parse_region_file_name("r..2.mca").has_value());
        CHECK_FALSE(parse_region_file_name("level.dat").has_value());
    }
}
