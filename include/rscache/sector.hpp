#pragma once

#include <cstddef>
#include <cstdint>

#include <limits>

#include <rscache/byte_cursor.hpp>
#include <rscache/disappointment.hpp>
#include <rscache/span.hpp>

namespace rscache
{

/**
 * the header layout of every sector of one archive, archives with an id
 * which does not fit into 16 bit use the expanded layout
 */
enum class sector_header_size
{
    normal,
    expanded,
};

inline constexpr std::size_t sector_size = 520;

inline constexpr std::size_t sector_header_length = 8;
inline constexpr std::size_t sector_payload_length = 512;
inline constexpr std::size_t expanded_sector_header_length = 10;
inline constexpr std::size_t expanded_sector_payload_length = 510;

static_assert(sector_header_length + sector_payload_length == sector_size);
static_assert(expanded_sector_header_length + expanded_sector_payload_length
              == sector_size);

constexpr auto select_header_size(std::uint32_t const archiveId) noexcept
        -> sector_header_size
{
    return archiveId > std::numeric_limits<std::uint16_t>::max()
                   ? sector_header_size::expanded
                   : sector_header_size::normal;
}

constexpr auto header_length(sector_header_size const layout) noexcept
        -> std::size_t
{
    return layout == sector_header_size::expanded
                   ? expanded_sector_header_length
                   : sector_header_length;
}

constexpr auto payload_length(sector_header_size const layout) noexcept
        -> std::size_t
{
    return layout == sector_header_size::expanded
                   ? expanded_sector_payload_length
                   : sector_payload_length;
}

struct sector_header
{
    std::uint32_t archive_id;
    std::uint16_t chunk;
    // absolute sector index of the next block, 24 bit on disk
    std::uint32_t next;
    std::uint8_t index_id;

    /**
     * decodes a header from the cursor and leaves the cursor positioned at
     * the first payload byte
     */
    static auto decode(byte_cursor &in, sector_header_size layout) noexcept
            -> result<sector_header>;

    /**
     * writes the header into the first header_length(layout) bytes of out
     *
     * fails with errc::invalid_argument if out is too small or a field does
     * not fit the layout
     */
    auto encode(rw_dynblob out, sector_header_size layout) const noexcept
            -> result<void>;

    /**
     * checks archive identity, sequence position and owning index in this
     * order and reports the first mismatch
     */
    auto validate(std::uint32_t archiveId,
                  std::uint16_t expectedChunk,
                  std::uint8_t indexId) const noexcept -> result<void>;

    friend constexpr auto operator==(sector_header const &,
                                     sector_header const &) noexcept -> bool
            = default;
};

/**
 * a decoded block, the payload borrows from the buffer it was decoded from
 */
struct sector
{
    sector_header header;
    ro_dynblob payload;

    /**
     * everything behind the header is treated as payload, the caller
     * defines the block boundary by the size of the buffer
     */
    static auto decode(ro_dynblob buffer, sector_header_size layout) noexcept
            -> result<sector>;
};

} // namespace rscache
