#include <rscache/sector_chain.hpp>

#include <algorithm>
#include <array>
#include <unordered_set>

#include <rscache/utils/misc.hpp>

namespace rscache
{

auto expected_sector_count(archive_locator const &locator) noexcept
        -> std::size_t
{
    auto const layout = select_header_size(locator.id);
    return utils::div_ceil(static_cast<std::size_t>(locator.byte_length),
                           payload_length(layout));
}

auto read_archive(sector_source &source, archive_locator const &locator)
        -> result<std::vector<std::byte>>
{
    auto const layout = select_header_size(locator.id);
    auto const headerLength = header_length(layout);
    auto const payloadLength = payload_length(layout);

    std::vector<std::byte> archive;
    archive.reserve(locator.byte_length);

    // the chunk check alone misses cycles of 2^16 sectors
    std::unordered_set<std::uint32_t> visited;

    std::array<std::byte, sector_size> sectorBuffer;
    std::size_t remaining = locator.byte_length;
    std::uint32_t sectorIdx = locator.start_sector;

    for (std::size_t chunk = 0; remaining > 0; ++chunk)
    {
        if (!visited.insert(sectorIdx).second)
        {
            return cache_errc::sector_chain_cycle;
        }

        // the final sector may be stored without its unused tail
        auto const window = std::span(sectorBuffer)
                                    .first(std::min(sector_size,
                                                    headerLength + remaining));
        RSCACHE_TRY(auto &&numRead, source.read(to_offset(sectorIdx), window));
        if (numRead != window.size())
        {
            return cache_errc::sector_chain_ended;
        }

        RSCACHE_TRY(auto &&block, sector::decode(window, layout));
        // the on-disk chunk field wraps for archives above 2^16 sectors
        RSCACHE_TRY(block.header.validate(locator.id,
                                          static_cast<std::uint16_t>(chunk),
                                          locator.index_id));

        auto const numBytes = std::min(payloadLength, remaining);
        auto const payload = block.payload.first(numBytes);
        archive.insert(archive.end(), payload.begin(), payload.end());
        remaining -= numBytes;

        if (remaining > 0)
        {
            if (block.header.next == 0)
            {
                return cache_errc::sector_chain_ended;
            }
            sectorIdx = block.header.next;
        }
    }

    return archive;
}

} // namespace rscache
