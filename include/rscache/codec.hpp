#pragma once

#include <cstddef>
#include <cstdint>

#include <optional>
#include <vector>

#include <rscache/disappointment.hpp>
#include <rscache/span.hpp>

namespace rscache
{

enum class compression_type : std::uint8_t
{
    none = 0,
    bzip2 = 1,
    gzip = 2,
};

/**
 * whether the envelope is followed by a two byte revision, this isn't
 * encoded in the envelope itself and must be known from the context
 */
enum class revision_suffix
{
    absent,
    present,
};

// tag + stored length
inline constexpr std::size_t envelope_header_length = 5;
// additional field for compressed payloads
inline constexpr std::size_t decompressed_length_field = 4;

struct decoded_payload
{
    compression_type compression;
    std::vector<std::byte> data;
    std::optional<std::uint16_t> revision;
};

/**
 * wraps data into an envelope
 *
 * layout (big endian):
 * [u8 tag][u32 stored length][u32 decompressed length, compressed only]
 * [stored payload][u16 revision, optional]
 *
 * uncompressed envelopes (tag 0) carry no decompressed length field, the
 * payload follows the stored length directly
 */
auto encode(compression_type compression,
            ro_dynblob data,
            std::optional<std::uint16_t> revision = std::nullopt)
        -> result<std::vector<std::byte>>;

auto decode(ro_dynblob buffer,
            revision_suffix revisionSuffix = revision_suffix::absent)
        -> result<decoded_payload>;

namespace detail
{

auto compress_bzip2(ro_dynblob data) -> result<std::vector<std::byte>>;
auto decompress_bzip2(ro_dynblob compressed, std::size_t decompressedLength)
        -> result<std::vector<std::byte>>;

auto compress_gzip(ro_dynblob data) -> result<std::vector<std::byte>>;
auto decompress_gzip(ro_dynblob compressed, std::size_t decompressedLength)
        -> result<std::vector<std::byte>>;

} // namespace detail

} // namespace rscache
