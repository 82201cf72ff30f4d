#include <rscache/index_file.hpp>

#include <rscache/utils/binary_codec.hpp>

namespace rscache
{

auto index_file::parse(std::uint8_t const indexId, ro_dynblob const content)
        -> result<index_file>
{
    if (content.size() % index_entry_size != 0)
    {
        return cache_errc::corrupt_index_file;
    }

    std::vector<entry> entries;
    entries.reserve(content.size() / index_entry_size);
    for (std::size_t offset = 0; offset < content.size();
         offset += index_entry_size)
    {
        entries.push_back({
                .byte_length = load_be_u24(content, offset),
                .start_sector = load_be_u24(content, offset + 3),
        });
    }
    return index_file(indexId, std::move(entries));
}

auto index_file::locate(std::uint32_t const archiveId) const noexcept
        -> result<archive_locator>
{
    if (archiveId >= mEntries.size())
    {
        return cache_errc::no_such_archive;
    }
    auto const &e = mEntries[archiveId];
    if (e.empty())
    {
        return cache_errc::no_such_archive;
    }
    return archive_locator{
            .id = archiveId,
            .index_id = mIndexId,
            .start_sector = e.start_sector,
            .byte_length = e.byte_length,
    };
}

} // namespace rscache
