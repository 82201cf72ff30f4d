#pragma once

#include <cstddef>
#include <cstdint>

#include <span>
#include <vector>

#include <rscache/disappointment.hpp>
#include <rscache/span.hpp>

namespace rscache
{

struct checksum_entry
{
    std::uint32_t crc;
    std::uint32_t revision;

    friend constexpr auto operator==(checksum_entry const &,
                                     checksum_entry const &) noexcept -> bool
            = default;
};

// serialized size of one checksum_entry
inline constexpr std::size_t checksum_entry_size = 8;

/**
 * the per index (crc, revision) table a client validates its cache with
 *
 * Entries are stored in index id order, i.e. the position of an entry is
 * the id of the index it describes.
 */
class checksum final
{
public:
    checksum() noexcept = default;

    void push(checksum_entry entry)
    {
        mEntries.push_back(entry);
    }

    /**
     * checks the client supplied crcs against the table
     *
     * @return true iff both have the same length and all crcs match
     * position by position, revisions are not compared
     */
    [[nodiscard]] auto validate_crcs(std::span<std::uint32_t const> crcs) const
            noexcept -> bool;

    /**
     * serializes the table into an uncompressed envelope without revision
     *
     * the table is consumed, afterwards it is empty
     */
    auto encode() && -> result<std::vector<std::byte>>;

    [[nodiscard]] auto size() const noexcept -> std::size_t
    {
        return mEntries.size();
    }
    [[nodiscard]] auto empty() const noexcept -> bool
    {
        return mEntries.empty();
    }
    [[nodiscard]] auto entries() const noexcept
            -> std::span<checksum_entry const>
    {
        return mEntries;
    }

private:
    std::vector<checksum_entry> mEntries;
};

/**
 * CRC-32 as used by zip and zlib (reflected 0x04C11DB7)
 */
auto crc32(ro_dynblob data) noexcept -> std::uint32_t;

} // namespace rscache
