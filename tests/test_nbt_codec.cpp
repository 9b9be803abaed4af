// tests/test_nbt_codec.cpp
#include "tests.hpp"

#include <initializer_list>
#include <sstream>
#include <string>

#include "strata/nbt/codec.hpp"
#include "strata/nbt/debug_print.hpp"

using namespace strata;
using nbt::compound_tag;
using nbt::list_tag;
using nbt::tag;
using nbt::tag_type;

namespace {
    core::byte_buffer bytes(std::initializer_list<int> v) {
        core::byte_buffer out;
        for (auto b : v) {
            out.push_back(static_cast<core::byte>(b));
        }
        return out;
    }

    void append_text(core::byte_buffer& out, const std::string& s) {
        out.push_back(static_cast<core::byte>(s.size() >> 8));
        out.push_back(static_cast<core::byte>(s.size() & 0xFF));
        for (char c : s) {
            out.push_back(static_cast<core::byte>(c));
        }
    }
}

TEST_SUITE("nbt/codec") {

    TEST_CASE("decode hello world") {
        core::byte_buffer in = bytes({ 0x0A });
        append_text(in, "hello world");
        in.push_back(core::byte{ 0x08 });
        append_text(in, "name");
        append_text(in, "Bananrama");
        in.push_back(core::byte{ 0x00 });

        std::string root_name;
        auto res = nbt::decode(in, &root_name);
        REQUIRE(res);
        CHECK(root_name == "hello world");
        CHECK(res->size() == 1);
        REQUIRE(res->get_str("name") != nullptr);
        CHECK(*res->get_str("name") == "Bananrama");
    }

    TEST_CASE("encode writes the root header and end tag") {
        compound_tag root;
        root.insert_i16("s", -2);
        auto out = nbt::encode(root, "r");
        REQUIRE(out);
        const auto expected = bytes({
            0x0A, 0x00, 0x01, 'r',
            0x02, 0x00, 0x01, 's', 0xFF, 0xFE,
            0x00 });
        CHECK(out.value() == expected);
    }

    TEST_CASE("every tag type survives encode/decode") {
        compound_tag level;
        level.insert_i32("xPos", 15);
        level.insert_i32("zPos", -3);

        list_tag sections;
        for (int i = 0; i < 3; ++i) {
            compound_tag s;
            s.insert_i8("Y", static_cast<std::int8_t>(i));
            CHECK(sections.push_back(tag{ std::move(s) }));
        }

        compound_tag root;
        root.insert_bool("flag", true);
        root.insert_i8("i8", -7);
        root.insert_i16("i16", 12345);
        root.insert_i32("i32", -123456789);
        root.insert_i64("i64", 0x0102030405060708LL);
        root.insert_f32("f32", 1.23f);
        root.insert_f64("f64", -2.5e100);
        root.insert_str("str", "test");
        root.insert_i8_vec("bytes", { 1, -2, 3 });
        root.insert_i32_vec("ints", { 0, 1, -1, 1 << 30 });
        root.insert_i64_vec("longs", { -1LL, 1LL << 40 });
        root.insert_list("Sections", std::move(sections));
        root.insert_list("empty", list_tag{});
        root.insert_compound_tag("Level", std::move(level));

        auto out = nbt::encode(root);
        REQUIRE(out);
        auto back = nbt::decode(out.value());
        REQUIRE(back);
        CHECK(back.value() == root);

        CHECK(*back->get_bool("flag"));
        CHECK(*back->get_f32("f32") == 1.23f);
        CHECK(*back->get_i64("i64") == 0x0102030405060708LL);
        const auto* lvl = back->get_compound_tag("Level");
        REQUIRE(lvl != nullptr);
        CHECK(*lvl->get_i32("xPos") == 15);
        CHECK(*lvl->get_i32("zPos") == -3);
        const auto* list = back->get_list("Sections");
        REQUIRE(list != nullptr);
        CHECK(list->element_type == tag_type::compound);
        CHECK(list->size() == 3);
    }

    TEST_CASE("compound keeps insertion order and replaces on insert") {
        compound_tag c;
        c.insert_i32("b", 1);
        c.insert_i32("a", 2);
        c.insert_i32("b", 3);
        REQUIRE(c.size() == 2);
        CHECK(c.begin()->name == "b");
        CHECK(*c.get_i32("b") == 3);
        CHECK_FALSE(c.get_i16("b").has_value());
        CHECK(c.erase("b"));
        CHECK_FALSE(c.contains_key("b"));
        CHECK_FALSE(c.erase("b"));
    }

    TEST_CASE("list rejects mixed element types") {
        list_tag l;
        CHECK(l.push_back(tag{ std::int32_t{ 1 } }));
        CHECK_FALSE(l.push_back(tag{ std::string{ "x" } }));
        CHECK(l.size() == 1);
    }

    TEST_CASE("root must be a compound") {
        auto res = nbt::decode(bytes({ 0x01, 0x00, 0x00, 0x05 }));
        REQUIRE_FALSE(res);
        CHECK(res.error().code == nbt::decode_errc::root_not_compound);
        CHECK(res.error().tag_id == 1);
    }

    TEST_CASE("unknown tag type") {
        auto res = nbt::decode(bytes({ 0x0A, 0x00, 0x00, 0x0D, 0x00, 0x00 }));
        REQUIRE_FALSE(res);
        CHECK(res.error().code == nbt::decode_errc::unknown_tag_type);
        CHECK(res.error().tag_id == 13);
    }

    TEST_CASE("truncated input") {
        compound_tag root;
        root.insert_str("key", "some value");
        auto out = nbt::encode(root);
        REQUIRE(out);
        auto cut = out.value();
        cut.pop_back();
        auto res = nbt::decode(cut);
        REQUIRE_FALSE(res);
        CHECK(res.error().code == nbt::decode_errc::unexpected_end);

        CHECK_FALSE(nbt::decode(core::byte_buffer{}));
    }

    TEST_CASE("negative array length") {
        auto in = bytes({ 0x0A, 0x00, 0x00, 0x07, 0x00, 0x01, 'a', 0xFF, 0xFF, 0xFF, 0xFF, 0x00 });
        auto res = nbt::decode(in);
        REQUIRE_FALSE(res);
        CHECK(res.error().code == nbt::decode_errc::negative_length);
    }

    TEST_CASE("negative list length") {
        auto in = bytes({ 0x0A, 0x00, 0x00, 0x09, 0x00, 0x01, 'l', 0x03, 0x80, 0x00, 0x00, 0x00, 0x00 });
        auto res = nbt::decode(in);
        REQUIRE_FALSE(res);
        CHECK(res.error().code == nbt::decode_errc::negative_length);
    }

    TEST_CASE("nesting limit") {
        auto in = bytes({ 0x0A, 0x00, 0x00, 0x09, 0x00, 0x00 });
        for (int i = 0; i < 600; ++i) {
            for (int b : { 0x09, 0x00, 0x00, 0x00, 0x01 }) {
                in.push_back(static_cast<core::byte>(b));
            }
        }
        auto res = nbt::decode(in);
        REQUIRE_FALSE(res);
        CHECK(res.error().code == nbt::decode_errc::nesting_too_deep);
    }

    TEST_CASE("oversized string is an encode error") {
        compound_tag root;
        root.insert_str("big", std::string(70000, 'x'));
        auto out = nbt::encode(root);
        REQUIRE_FALSE(out);
        CHECK(out.error().code == nbt::encode_errc::string_too_long);
        CHECK(out.error().length == 70000);
    }

    TEST_CASE("list items that disagree with the element type are an encode error") {
        SUBCASE("items under an end element type") {
            list_tag l;
            l.items.push_back(tag{ std::int32_t{ 7 } });
            compound_tag root;
            root.insert_list("l", std::move(l));
            auto out = nbt::encode(root);
            REQUIRE_FALSE(out);
            CHECK(out.error().code == nbt::encode_errc::list_type_mismatch);
            CHECK(out.error().length == 0);
        }
        SUBCASE("string among bytes") {
            list_tag l;
            REQUIRE(l.push_back(tag{ std::int8_t{ 1 } }));
            l.items.push_back(tag{ std::string{ "x" } });
            compound_tag root;
            root.insert_list("l", std::move(l));
            auto out = nbt::encode(root);
            REQUIRE_FALSE(out);
            CHECK(out.error().code == nbt::encode_errc::list_type_mismatch);
            CHECK(out.error().length == 1);
            CHECK(out.error().describe() == "list item 1 does not match the list element type");
        }
    }

    TEST_CASE("debug_print renders nested tags") {
        compound_tag level;
        level.insert_i32("xPos", 4);
        compound_tag root;
        root.insert_compound_tag("Level", std::move(level));
        root.insert_i8_vec("Biomes", std::vector<std::int8_t>(20, 1));

        std::ostringstream os;
        nbt::debug_print(os, root);
        const auto text = os.str();
        CHECK(text.find("'Level'") != std::string::npos);
        CHECK(text.find("int 'xPos': 4") != std::string::npos);
        CHECK(text.find("[20]") != std::string::npos);
        CHECK(text.find("...") != std::string::npos);
    }
}
