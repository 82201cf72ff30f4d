#include <rscache/checksum.hpp>

#include <algorithm>

#include <boost/crc.hpp>

#include <rscache/codec.hpp>
#include <rscache/utils/binary_codec.hpp>

namespace rscache
{

auto checksum::validate_crcs(std::span<std::uint32_t const> const crcs) const
        noexcept -> bool
{
    return std::ranges::equal(mEntries, crcs, {},
                              [](checksum_entry const &entry)
                              { return entry.crc; });
}

auto checksum::encode() && -> result<std::vector<std::byte>>
{
    auto const entries = std::move(mEntries);
    mEntries.clear();

    std::vector<std::byte> table(entries.size() * checksum_entry_size);
    rw_dynblob const out(table);
    for (std::size_t i = 0; i < entries.size(); ++i)
    {
        auto const offset = i * checksum_entry_size;
        store_be(out, entries[i].crc, offset);
        store_be(out, entries[i].revision, offset + 4);
    }

    return rscache::encode(compression_type::none, table);
}

auto crc32(ro_dynblob const data) noexcept -> std::uint32_t
{
    boost::crc_32_type crc;
    crc.process_bytes(data.data(), data.size());
    return crc.checksum();
}

} // namespace rscache
