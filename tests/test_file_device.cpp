// tests/test_file_device.cpp
#include "tests.hpp"

#include <filesystem>
#include <vector>

#include "strata/core/bytes.hpp"
#include "strata/storage/device.hpp"
#include "strata/storage/file_device.hpp"
#include "strata/storage/memory_device.hpp"

using namespace strata::core;
using namespace strata::storage;

TEST_SUITE("storage/file_device") {

    TEST_CASE("open/create + size is zero") {
        namespace fs = std::filesystem;
        auto path = make_temp_path("strata_fd");
        temp_path_guard guard{ path };

        {
            file_device dev(path);
            CHECK(dev.is_open());
            CHECK(dev.get_file_size() == 0);
            CHECK(dev.path() == path);
        }

        CHECK(fs::exists(path));
    }

    TEST_CASE("write_at_offset / read_at_offset roundtrip") {
        auto path = make_temp_path("strata_fd_io");
        temp_path_guard guard{ path };

        file_device dev(path);
        REQUIRE(dev.is_open());

        std::vector<byte> wbuf(32);
        for (std::size_t i = 0; i < wbuf.size(); ++i) {
            wbuf[i] = static_cast<byte>(i ^ 0x5Au);
        }
        CHECK(dev.write_at_offset(100, wbuf.data(), wbuf.size()));
        CHECK(dev.get_file_size() == 132);

        std::vector<byte> rbuf(wbuf.size());
        CHECK(dev.read_at_offset(100, rbuf.data(), rbuf.size()));
        CHECK(rbuf == wbuf);

        // the gap before the write reads back as zeros
        std::vector<byte> gap(100, byte{ 0xFF });
        CHECK(dev.read_at_offset(0, gap.data(), gap.size()));
        for (auto b : gap) {
            CHECK(b == byte{ 0 });
        }
    }

    TEST_CASE("short read fails") {
        auto path = make_temp_path("strata_fd_short");
        temp_path_guard guard{ path };

        file_device dev(path);
        std::vector<byte> wbuf(10, byte{ 1 });
        REQUIRE(dev.write_at_offset(0, wbuf.data(), wbuf.size()));

        std::vector<byte> rbuf(20);
        CHECK_FALSE(dev.read_at_offset(0, rbuf.data(), rbuf.size()));
        CHECK(dev.read_at_offset(0, rbuf.data(), 10));
    }

    TEST_CASE("grow_to zero-extends and never shrinks") {
        auto path = make_temp_path("strata_fd_grow");
        temp_path_guard guard{ path };

        file_device dev(path);
        CHECK(dev.grow_to(8192));
        CHECK(dev.get_file_size() == 8192);
        CHECK(dev.grow_to(100));
        CHECK(dev.get_file_size() == 8192);

        std::vector<byte> tail(16, byte{ 0xFF });
        CHECK(dev.read_at_offset(8192 - 16, tail.data(), tail.size()));
        for (auto b : tail) {
            CHECK(b == byte{ 0 });
        }
    }

    TEST_CASE("reopen sees earlier writes") {
        auto path = make_temp_path("strata_fd_reopen");
        temp_path_guard guard{ path };

        std::vector<byte> wbuf(8, byte{ 0xAB });
        {
            file_device dev(path);
            REQUIRE(dev.write_at_offset(4, wbuf.data(), wbuf.size()));
        }
        file_device dev(path);
        CHECK(dev.get_file_size() == 12);
        std::vector<byte> rbuf(8);
        CHECK(dev.read_at_offset(4, rbuf.data(), rbuf.size()));
        CHECK(rbuf == wbuf);
    }
}

TEST_SUITE("storage/memory_device") {

    TEST_CASE("behaves like a file") {
        memory_device dev;
        CHECK(dev.get_file_size() == 0);

        std::vector<byte> wbuf(4, byte{ 7 });
        CHECK(dev.write_at_offset(10, wbuf.data(), wbuf.size()));
        CHECK(dev.get_file_size() == 14);

        std::vector<byte> rbuf(4);
        CHECK(dev.read_at_offset(10, rbuf.data(), rbuf.size()));
        CHECK(rbuf == wbuf);
        CHECK_FALSE(dev.read_at_offset(12, rbuf.data(), rbuf.size()));

        CHECK(dev.grow_to(4096));
        CHECK(dev.get_file_size() == 4096);
        CHECK(dev.grow_to(16));
        CHECK(dev.get_file_size() == 4096);
    }
}
