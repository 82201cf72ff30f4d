#include "test-utils.hpp"

#include <algorithm>

#include <rscache/index_file.hpp>
#include <rscache/utils/binary_codec.hpp>

namespace rscache_tests
{

auto make_content(std::size_t const size, std::uint8_t const seed)
        -> std::vector<std::byte>
{
    std::vector<std::byte> content(size);
    std::uint32_t state = seed * 2'654'435'761U + 1U;
    for (auto &b : content)
    {
        state = state * 1'103'515'245U + 12'345U;
        b = static_cast<std::byte>(state >> 16);
    }
    return content;
}

void sector_image::put(std::uint32_t const sectorIdx,
                       rscache::sector_header const &header,
                       rscache::ro_dynblob const payload)
{
    auto const layout = rscache::select_header_size(header.archive_id);
    auto const offset = static_cast<std::size_t>(rscache::to_offset(sectorIdx));
    auto const headerLength = rscache::header_length(layout);

    auto const end = offset + headerLength + payload.size();
    if (mData.size() < end)
    {
        mData.resize(end);
    }

    auto const target = std::span(mData).subspan(offset);
    header.encode(target, layout).value();
    rscache::copy(payload, target.subspan(headerLength));
}

auto sector_image::put_archive(std::uint8_t const indexId,
                               std::uint32_t const archiveId,
                               std::span<std::uint32_t const> const sectors,
                               rscache::ro_dynblob const content,
                               std::uint32_t const trailingNext)
        -> rscache::archive_locator
{
    auto const layout = rscache::select_header_size(archiveId);
    auto const payloadLength = rscache::payload_length(layout);

    auto remaining = content;
    for (std::size_t i = 0; i < sectors.size(); ++i)
    {
        auto const next
                = i + 1 < sectors.size() ? sectors[i + 1] : trailingNext;
        auto const chunkLength = std::min(payloadLength, remaining.size());
        put(sectors[i],
            {.archive_id = archiveId,
             .chunk = static_cast<std::uint16_t>(i),
             .next = next,
             .index_id = indexId},
            remaining.first(chunkLength));
        remaining = remaining.subspan(chunkLength);
    }

    return {.id = archiveId,
            .index_id = indexId,
            .start_sector = sectors.empty() ? 0U : sectors.front(),
            .byte_length = static_cast<std::uint32_t>(content.size())};
}

auto make_index(std::span<rscache::archive_locator const> const locators)
        -> std::vector<std::byte>
{
    std::uint32_t numEntries = 0;
    for (auto const &locator : locators)
    {
        numEntries = std::max(numEntries, locator.id + 1);
    }

    std::vector<std::byte> content(numEntries * rscache::index_entry_size);
    rscache::rw_dynblob const out(content);
    for (auto const &locator : locators)
    {
        auto const offset = locator.id * rscache::index_entry_size;
        rscache::store_be_u24(out, locator.byte_length, offset);
        rscache::store_be_u24(out, locator.start_sector, offset + 3);
    }
    return content;
}

} // namespace rscache_tests
