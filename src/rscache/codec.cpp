#include <rscache/codec.hpp>

#include <algorithm>
#include <array>
#include <ios>
#include <limits>
#include <new>

#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/filter/bzip2.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_streambuf.hpp>

#include <rscache/byte_cursor.hpp>
#include <rscache/utils/binary_codec.hpp>

namespace rscache
{

namespace
{

namespace io = boost::iostreams;

// the stored bzip2 streams lack the magic and block size prefix
constexpr std::array<char, 4> bzip2_stream_prefix{'B', 'Z', 'h', '1'};

// upper bound for reservations sized by an untrusted declared length
constexpr std::size_t max_output_reservation = std::size_t{1} << 20;
constexpr std::size_t unbounded_output
        = std::numeric_limits<std::size_t>::max();

/**
 * runs the input through the filter and fails with
 * decompressed_length_mismatch as soon as the output exceeds outputLimit
 */
template <typename Filter>
auto run_filter(Filter filter,
                std::span<char const> input,
                std::size_t const sizeHint,
                std::size_t const outputLimit,
                cache_errc const onFailure) -> result<std::vector<std::byte>>
{
    std::vector<char> output;
    try
    {
        output.reserve(std::min(sizeHint, max_output_reservation));

        io::filtering_istreambuf in;
        in.push(filter);
        in.push(io::array_source(input.data(), input.size()));

        std::array<char, 4096> chunk;
        for (;;)
        {
            auto const numRead = in.sgetn(
                    chunk.data(), static_cast<std::streamsize>(chunk.size()));
            if (numRead <= 0)
            {
                break;
            }
            auto const n = static_cast<std::size_t>(numRead);
            if (n > outputLimit - output.size())
            {
                return cache_errc::decompressed_length_mismatch;
            }
            output.insert(output.end(), chunk.data(), chunk.data() + n);
        }
    }
    catch (io::bzip2_error const &)
    {
        return onFailure;
    }
    catch (io::gzip_error const &)
    {
        return onFailure;
    }
    catch (std::ios_base::failure const &)
    {
        // premature end of stream, reported by the symmetric filter itself
        return onFailure;
    }
    catch (std::bad_alloc const &)
    {
        return errc::not_enough_memory;
    }

    auto const bytes = as_bytes(std::span(output));
    return std::vector<std::byte>(bytes.begin(), bytes.end());
}

auto as_chars(ro_dynblob const data) noexcept -> std::span<char const>
{
    return {reinterpret_cast<char const *>(data.data()), data.size()};
}

auto check_length(std::vector<std::byte> decompressed,
                  std::size_t const decompressedLength)
        -> result<std::vector<std::byte>>
{
    if (decompressed.size() != decompressedLength)
    {
        return cache_errc::decompressed_length_mismatch;
    }
    return decompressed;
}

} // namespace

namespace detail
{

auto compress_bzip2(ro_dynblob const data) -> result<std::vector<std::byte>>
{
    RSCACHE_TRY(auto &&compressed,
                run_filter(io::bzip2_compressor(io::bzip2_params(1)),
                           as_chars(data), data.size() / 2, unbounded_output,
                           cache_errc::compression_failed));
    if (compressed.size() < bzip2_stream_prefix.size())
    {
        return cache_errc::compression_failed;
    }
    compressed.erase(compressed.begin(),
                     compressed.begin() + bzip2_stream_prefix.size());
    return std::move(compressed);
}

auto decompress_bzip2(ro_dynblob const compressed,
                      std::size_t const decompressedLength)
        -> result<std::vector<std::byte>>
{
    std::vector<char> stream(bzip2_stream_prefix.begin(),
                             bzip2_stream_prefix.end());
    auto const chars = as_chars(compressed);
    stream.insert(stream.end(), chars.begin(), chars.end());

    RSCACHE_TRY(auto &&decompressed,
                run_filter(io::bzip2_decompressor(), std::span(stream),
                           decompressedLength, decompressedLength,
                           cache_errc::decompression_failed));
    return check_length(std::move(decompressed), decompressedLength);
}

auto compress_gzip(ro_dynblob const data) -> result<std::vector<std::byte>>
{
    return run_filter(io::gzip_compressor(), as_chars(data), data.size() / 2,
                      unbounded_output, cache_errc::compression_failed);
}

auto decompress_gzip(ro_dynblob const compressed,
                     std::size_t const decompressedLength)
        -> result<std::vector<std::byte>>
{
    RSCACHE_TRY(auto &&decompressed,
                run_filter(io::gzip_decompressor(), as_chars(compressed),
                           decompressedLength, decompressedLength,
                           cache_errc::decompression_failed));
    return check_length(std::move(decompressed), decompressedLength);
}

} // namespace detail

auto encode(compression_type const compression,
            ro_dynblob const data,
            std::optional<std::uint16_t> const revision)
        -> result<std::vector<std::byte>>
{
    using limits = std::numeric_limits<std::uint32_t>;

    std::vector<std::byte> compressed;
    ro_dynblob stored = data;
    switch (compression)
    {
    case compression_type::none:
        break;
    case compression_type::bzip2:
        RSCACHE_TRY(compressed, detail::compress_bzip2(data));
        stored = compressed;
        break;
    case compression_type::gzip:
        RSCACHE_TRY(compressed, detail::compress_gzip(data));
        stored = compressed;
        break;
    default:
        return cache_errc::unsupported_compression;
    }
    if (data.size() > limits::max() || stored.size() > limits::max())
    {
        return cache_errc::payload_too_large;
    }

    auto const hasDecompressedLength = compression != compression_type::none;
    std::vector<std::byte> buffer(
            envelope_header_length
            + (hasDecompressedLength ? decompressed_length_field : 0U)
            + stored.size() + (revision.has_value() ? 2U : 0U));
    rw_dynblob const out(buffer);

    store_be(out, static_cast<std::uint8_t>(compression), 0);
    store_be(out, static_cast<std::uint32_t>(stored.size()), 1);
    auto offset = envelope_header_length;
    if (hasDecompressedLength)
    {
        store_be(out, static_cast<std::uint32_t>(data.size()), offset);
        offset += decompressed_length_field;
    }
    rscache::copy(stored, out.subspan(offset));
    offset += stored.size();
    if (revision.has_value())
    {
        store_be(out, *revision, offset);
    }

    return buffer;
}

auto decode(ro_dynblob const buffer, revision_suffix const revisionSuffix)
        -> result<decoded_payload>
{
    byte_cursor in(buffer);

    RSCACHE_TRY(auto &&tag, in.read_u8());
    auto const compression = static_cast<compression_type>(tag);
    RSCACHE_TRY(auto &&storedLength, in.read_u32());

    decoded_payload decoded{
            .compression = compression,
            .data = {},
            .revision = std::nullopt,
    };

    switch (compression)
    {
    case compression_type::none:
    {
        RSCACHE_TRY(auto &&stored, in.read_bytes(storedLength));
        decoded.data.assign(stored.begin(), stored.end());
        break;
    }
    case compression_type::bzip2:
    {
        RSCACHE_TRY(auto &&decompressedLength, in.read_u32());
        RSCACHE_TRY(auto &&stored, in.read_bytes(storedLength));
        RSCACHE_TRY(decoded.data,
                    detail::decompress_bzip2(stored, decompressedLength));
        break;
    }
    case compression_type::gzip:
    {
        RSCACHE_TRY(auto &&decompressedLength, in.read_u32());
        RSCACHE_TRY(auto &&stored, in.read_bytes(storedLength));
        RSCACHE_TRY(decoded.data,
                    detail::decompress_gzip(stored, decompressedLength));
        break;
    }
    default:
        return cache_errc::unsupported_compression;
    }

    if (revisionSuffix == revision_suffix::present)
    {
        RSCACHE_TRY(decoded.revision, in.read_u16());
    }
    return decoded;
}

} // namespace rscache
