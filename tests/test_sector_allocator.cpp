// tests/test_sector_allocator.cpp
#include "tests.hpp"

#include "strata/region/sector_allocator.hpp"

using namespace strata::region;

namespace {
    std::uint64_t first_word(const sector_allocator& a) {
        return a.bitmap().words().empty() ? 0 : a.bitmap().words()[0];
    }

    region_header::entries_type entries_with(std::initializer_list<chunk_metadata> items) {
        region_header::entries_type e{};
        std::size_t slot = 0;
        for (const auto& m : items) {
            e[slot++] = m;
        }
        return e;
    }
}

TEST_SUITE("region/sector_allocator") {

    TEST_CASE("only header sectors are used in an empty region") {
        auto a = sector_allocator::from_header(8, region_header::entries_type{});
        CHECK(first_word(a) == 0b00000011);
        CHECK(a.sectors_count() == 8);
        CHECK(a.used_count() == 2);
    }

    TEST_CASE("a chunk covering the rest of the file") {
        auto a = sector_allocator::from_header(8, entries_with({ { 2, 6, 0 } }));
        CHECK(first_word(a) == 0b11111111);
    }

    TEST_CASE("partially used") {
        auto a = sector_allocator::from_header(10, entries_with({ { 3, 3, 0 }, { 8, 1, 0 } }));
        CHECK(first_word(a) == 0b100111011);
    }

    TEST_CASE("ranges past the end are ignored") {
        auto a = sector_allocator::from_header(4, entries_with({ { 3, 5, 0 }, { 40, 2, 0 } }));
        CHECK(a.sectors_count() == 4);
        CHECK(first_word(a) == 0b1011);
    }

    TEST_CASE("first_fit returns the start of the first run") {
        sector_allocator a(10);
        a.mark_range(2, 1, true);
        a.mark_range(5, 1, true);
        // free: 3 4 | 6 7 8 9
        CHECK(a.first_fit(1) == std::optional<std::size_t>{ 3 });
        CHECK(a.first_fit(2) == std::optional<std::size_t>{ 3 });
        CHECK(a.first_fit(3) == std::optional<std::size_t>{ 6 });
        CHECK(a.first_fit(4) == std::optional<std::size_t>{ 6 });
        CHECK_FALSE(a.first_fit(5).has_value());
        CHECK_FALSE(a.first_fit(0).has_value());
    }

    TEST_CASE("trailing_free") {
        sector_allocator a(6);
        CHECK(a.trailing_free() == 4);
        a.mark_range(4, 1, true);
        CHECK(a.trailing_free() == 1);
        a.mark_range(5, 1, true);
        CHECK(a.trailing_free() == 0);
    }

    TEST_CASE("grow appends used sectors") {
        sector_allocator a(3);
        a.grow(2);
        CHECK(a.sectors_count() == 5);
        CHECK(a.is_used(3));
        CHECK(a.is_used(4));
        CHECK_FALSE(a.is_used(2));
        CHECK(a.trailing_free() == 0);
    }

    TEST_CASE("releasing a range makes it available again") {
        sector_allocator a(6);
        a.mark_range(2, 4, true);
        CHECK_FALSE(a.first_fit(1).has_value());
        a.mark_range(3, 2, false);
        CHECK(a.first_fit(2) == std::optional<std::size_t>{ 3 });
        CHECK(a.is_used(0));
        CHECK(a.is_used(1));
    }
}
