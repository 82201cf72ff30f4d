#include <rscache/sector.hpp>

#include <rscache/utils/binary_codec.hpp>

namespace rscache
{

auto sector_header::decode(byte_cursor &in,
                           sector_header_size const layout) noexcept
        -> result<sector_header>
{
    if (in.remaining_size() < header_length(layout))
    {
        return cache_errc::truncated_buffer;
    }

    sector_header header{};
    if (layout == sector_header_size::expanded)
    {
        RSCACHE_TRY(header.archive_id, in.read_u32());
    }
    else
    {
        RSCACHE_TRY(header.archive_id, in.read_u16());
    }
    RSCACHE_TRY(header.chunk, in.read_u16());
    RSCACHE_TRY(header.next, in.read_u24());
    RSCACHE_TRY(header.index_id, in.read_u8());

    return header;
}

auto sector_header::encode(rw_dynblob const out,
                           sector_header_size const layout) const noexcept
        -> result<void>
{
    auto const headerLength = header_length(layout);
    if (out.size() < headerLength)
    {
        return errc::invalid_argument;
    }
    if (next > 0xff'ffffU)
    {
        return errc::invalid_argument;
    }

    std::size_t offset = 0;
    if (layout == sector_header_size::expanded)
    {
        store_be(out, archive_id, offset);
        offset += 4;
    }
    else
    {
        if (archive_id > std::numeric_limits<std::uint16_t>::max())
        {
            return errc::invalid_argument;
        }
        store_be(out, static_cast<std::uint16_t>(archive_id), offset);
        offset += 2;
    }
    store_be(out, chunk, offset);
    store_be_u24(out, next, offset + 2);
    store_be(out, index_id, offset + 5);

    return oc::success();
}

auto sector_header::validate(std::uint32_t const archiveId,
                             std::uint16_t const expectedChunk,
                             std::uint8_t const indexId) const noexcept
        -> result<void>
{
    if (archive_id != archiveId)
    {
        return cache_errc::sector_archive_mismatch;
    }
    if (chunk != expectedChunk)
    {
        return cache_errc::sector_chunk_mismatch;
    }
    if (index_id != indexId)
    {
        return cache_errc::sector_index_mismatch;
    }
    return oc::success();
}

auto sector::decode(ro_dynblob const buffer,
                    sector_header_size const layout) noexcept -> result<sector>
{
    byte_cursor in(buffer);
    RSCACHE_TRY(auto &&header, sector_header::decode(in, layout));

    return sector{.header = header, .payload = in.remaining()};
}

} // namespace rscache
