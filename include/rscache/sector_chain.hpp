#pragma once

#include <cstddef>
#include <cstdint>

#include <vector>

#include <rscache/disappointment.hpp>
#include <rscache/sector.hpp>
#include <rscache/sector_source.hpp>

namespace rscache
{

/**
 * where an archive starts and how many bytes it spans
 */
struct archive_locator
{
    std::uint32_t id;
    std::uint8_t index_id;
    std::uint32_t start_sector;
    std::uint32_t byte_length;

    friend constexpr auto operator==(archive_locator const &,
                                     archive_locator const &) noexcept -> bool
            = default;
};

constexpr auto to_offset(std::uint32_t const sectorIdx) noexcept
        -> std::uint64_t
{
    return static_cast<std::uint64_t>(sectorIdx) * sector_size;
}

/**
 * number of sectors an archive of the given length occupies
 */
auto expected_sector_count(archive_locator const &locator) noexcept
        -> std::size_t;

/**
 * reassembles the archive by following the sector chain
 *
 * Every sector is validated against the locator's identity and its
 * position in the chain. Reading stops as soon as byte_length bytes have
 * been collected; the next pointer of the final sector is never followed.
 * Every sector consumes a full payload window, so a chain ends after
 * expected_sector_count(locator) sectors at the latest. A chain which
 * visits a sector twice fails with sector_chain_cycle.
 */
auto read_archive(sector_source &source, archive_locator const &locator)
        -> result<std::vector<std::byte>>;

} // namespace rscache
