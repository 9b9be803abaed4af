/*
 * File: codec/compression.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2025-12-14
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <format>
#include <limits>
#include <string>

#include <zlib.h>

#include "strata/core/bytes.hpp"
#include "strata/core/result.hpp"

namespace strata::codec {

    using core::byte;
    using core::byte_view;
    using core::byte_buffer;

    // Scheme ids as they appear in a chunk record.
    enum class compression_scheme : std::uint8_t {
        gzip = 1,
        zlib = 2,
    };

    struct compression_error {
        int code = Z_OK;        // zlib return code
        std::string message{};

        std::string describe() const {
            return std::format("zlib error {}: {}", code, message);
        }
    };

    using compression_result = core::result<byte_buffer, compression_error>;

    namespace detail {

        // zlib window bits: 15 is a zlib wrapper, +16 selects the gzip wrapper.
        constexpr int zlib_window_bits = 15;
        constexpr int gzip_window_bits = 15 + 16;
        constexpr std::size_t stream_chunk = 16 * 1024;

        inline compression_error make_error(int code, const z_stream& zs, const char* what) {
            return { code, zs.msg ? std::string(zs.msg) : std::string(what) };
        }

        inline compression_result deflate_stream(byte_view input, int level, int window_bits) {
            z_stream zs{};
            int rc = deflateInit2(&zs, level, Z_DEFLATED, window_bits, 8, Z_DEFAULT_STRATEGY);
            if (rc != Z_OK) {
                return core::fail(make_error(rc, zs, "deflateInit2 failed"));
            }

            byte_buffer out;
            out.resize(deflateBound(&zs, static_cast<uLong>(input.size())));

            zs.next_in = reinterpret_cast<Bytef*>(const_cast<byte*>(input.data()));
            zs.avail_in = static_cast<uInt>(input.size());
            zs.next_out = reinterpret_cast<Bytef*>(out.data());
            zs.avail_out = static_cast<uInt>(out.size());

            rc = deflate(&zs, Z_FINISH);
            if (rc != Z_STREAM_END) {
                auto err = make_error(rc, zs, "deflate did not finish");
                deflateEnd(&zs);
                return core::fail(std::move(err));
            }

            out.resize(zs.total_out);
            deflateEnd(&zs);
            return out;
        }

        inline compression_result inflate_stream(byte_view input, int window_bits) {
            z_stream zs{};
            int rc = inflateInit2(&zs, window_bits);
            if (rc != Z_OK) {
                return core::fail(make_error(rc, zs, "inflateInit2 failed"));
            }

            zs.next_in = reinterpret_cast<Bytef*>(const_cast<byte*>(input.data()));
            zs.avail_in = static_cast<uInt>(input.size());

            byte_buffer out;
            do {
                const auto produced = out.size();
                out.resize(produced + stream_chunk);
                zs.next_out = reinterpret_cast<Bytef*>(out.data() + produced);
                zs.avail_out = static_cast<uInt>(stream_chunk);

                rc = inflate(&zs, Z_NO_FLUSH);
                if (rc == Z_NEED_DICT || rc == Z_DATA_ERROR || rc == Z_MEM_ERROR || rc == Z_STREAM_ERROR) {
                    auto err = make_error(rc, zs, "corrupt stream");
                    inflateEnd(&zs);
                    return core::fail(std::move(err));
                }
                if (rc == Z_BUF_ERROR && zs.avail_in == 0) {
                    // input ran out before the end of the stream
                    inflateEnd(&zs);
                    return core::fail(compression_error{ Z_BUF_ERROR, "truncated stream" });
                }
            } while (rc != Z_STREAM_END);

            out.resize(zs.total_out);
            inflateEnd(&zs);
            return out;
        }
    }

    inline compression_result compress_zlib(byte_view input, int level = Z_DEFAULT_COMPRESSION) {
        return detail::deflate_stream(input, level, detail::zlib_window_bits);
    }

    inline compression_result compress_gzip(byte_view input, int level = Z_DEFAULT_COMPRESSION) {
        return detail::deflate_stream(input, level, detail::gzip_window_bits);
    }

    inline compression_result decompress_zlib(byte_view input) {
        return detail::inflate_stream(input, detail::zlib_window_bits);
    }

    inline compression_result decompress_gzip(byte_view input) {
        return detail::inflate_stream(input, detail::gzip_window_bits);
    }

} // namespace strata::codec
