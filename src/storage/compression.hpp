#pragma once

// DEFLATE compression/decompression for stored objects.
//
// Objects are written to disk as raw DEFLATE (no zlib/gzip header). Small
// objects still go through deflate so every file on disk has one format.
//
// Internal header — not installed.

#include <algorithm>
#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include <zlib.h>

namespace diff_server::storage {

// Compress data using raw DEFLATE (no zlib/gzip header).
inline auto deflate_compress(std::span<const std::byte> input)
    -> std::optional<std::vector<std::byte>> {

    auto stream = z_stream{};
    // windowBits = -15 for raw deflate (negative = no header)
    auto ret = ::deflateInit2(&stream, Z_BEST_SPEED, Z_DEFLATED,
                              -15, 8, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) return std::nullopt;

    auto bound = ::deflateBound(&stream, static_cast<uLong>(input.size()));
    auto output = std::vector<std::byte>(bound);

    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(bound);

    ret = ::deflate(&stream, Z_FINISH);
    ::deflateEnd(&stream);

    if (ret != Z_STREAM_END) return std::nullopt;

    output.resize(stream.total_out);
    return output;
}

// Decompress raw DEFLATE data (no zlib/gzip header).
// max_output_size limits decompressed output to prevent memory bombs.
inline auto deflate_decompress(std::span<const std::byte> input,
                               std::size_t max_output_size = std::size_t{256} * 1024 * 1024)
    -> std::optional<std::vector<std::byte>> {

    auto output_size = std::clamp(input.size() * 4, std::size_t{64}, max_output_size);
    auto output = std::vector<std::byte>(output_size);

    auto stream = z_stream{};
    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(output_size);

    auto ret = ::inflateInit2(&stream, -15);
    if (ret != Z_OK) return std::nullopt;

    ret = ::inflate(&stream, Z_FINISH);

    while ((ret == Z_BUF_ERROR || ret == Z_OK) && output_size < max_output_size) {
        auto written = stream.total_out;
        output_size = std::min(output_size * 2, max_output_size);
        output.resize(output_size);
        stream.next_out = reinterpret_cast<Bytef*>(output.data() + written);
        stream.avail_out = static_cast<uInt>(output_size - written);
        ret = ::inflate(&stream, Z_FINISH);
    }

    ::inflateEnd(&stream);

    if (ret != Z_STREAM_END) return std::nullopt;

    output.resize(stream.total_out);
    return output;
}

}  // namespace diff_server::storage
