#include <rscache/cache.hpp>

#include <iterator>

#include <fmt/format.h>

#include <rscache/byte_cursor.hpp>

namespace rscache
{

namespace
{

// reference tables starting with this format carry the index revision
constexpr std::uint8_t versioned_reference_format = 6;

auto reference_revision(ro_dynblob const referenceTable)
        -> result<std::uint32_t>
{
    byte_cursor in(referenceTable);
    RSCACHE_TRY(auto &&format, in.read_u8());
    if (format < versioned_reference_format)
    {
        return std::uint32_t{0};
    }
    return in.read_u32();
}

} // namespace

cache::cache(std::unique_ptr<sector_source> source,
             std::vector<index_file> indices,
             cache_options options)
    : mSource(std::move(source))
    , mIndices()
    , mOptions(std::move(options))
{
    for (auto &index : indices)
    {
        auto const id = index.id();
        mIndices.insert_or_assign(id, std::move(index));
    }
}

auto cache::open(llfio::path_handle const &base,
                 llfio::path_view const directory,
                 cache_options options) -> result<cache>
{
    RSCACHE_TRY(auto &&dir, llfio::path_handle::path(base, directory));
    RSCACHE_TRY(auto &&data,
                file_sector_source::open(
                        dir, llfio::path_view(options.data_file_name)));

    std::vector<index_file> indices;
    for (unsigned id = 0; id <= reference_index_id; ++id)
    {
        auto const fileName
                = fmt::format("{}{}", options.index_file_prefix, id);
        auto rx = read_file(dir, llfio::path_view(fileName));
        if (rx.has_error())
        {
            if (rx.assume_error() == errc::no_such_file_or_directory)
            {
                continue;
            }
            return std::move(rx).as_failure();
        }

        RSCACHE_TRY(auto &&index,
                    index_file::parse(static_cast<std::uint8_t>(id),
                                      rx.assume_value()));
        indices.push_back(std::move(index));
    }

    return cache(std::make_unique<file_sector_source>(std::move(data)),
                 std::move(indices), std::move(options));
}

auto cache::has_index(std::uint8_t const indexId) const noexcept -> bool
{
    return mIndices.contains(indexId);
}

auto cache::index_count() const noexcept -> std::size_t
{
    return mIndices.size() - (has_index(reference_index_id) ? 1U : 0U);
}

auto cache::archive_count(std::uint8_t const indexId) const noexcept
        -> result<std::size_t>
{
    auto const it = mIndices.find(indexId);
    if (it == mIndices.end())
    {
        return cache_errc::no_such_index;
    }
    return it->second.size();
}

auto cache::index_ids() const -> std::vector<std::uint8_t>
{
    std::vector<std::uint8_t> ids;
    ids.reserve(mIndices.size());
    for (auto const &[id, index] : mIndices)
    {
        ids.push_back(id);
    }
    return ids;
}

auto cache::locate(std::uint8_t const indexId,
                   std::uint32_t const archiveId) const noexcept
        -> result<archive_locator>
{
    auto const it = mIndices.find(indexId);
    if (it == mIndices.end())
    {
        return cache_errc::no_such_index;
    }
    return it->second.locate(archiveId);
}

auto cache::read(std::uint8_t const indexId, std::uint32_t const archiveId)
        -> result<std::vector<std::byte>>
{
    RSCACHE_TRY(auto &&locator, locate(indexId, archiveId));
    return read_archive(*mSource, locator);
}

auto cache::read_decoded(std::uint8_t const indexId,
                         std::uint32_t const archiveId,
                         revision_suffix const revisionSuffix)
        -> result<decoded_payload>
{
    RSCACHE_TRY(auto &&raw, read(indexId, archiveId));
    return decode(raw, revisionSuffix);
}

auto cache::create_checksum() -> result<checksum>
{
    if (!has_index(reference_index_id))
    {
        return cache_errc::no_such_index;
    }

    checksum table;
    if (index_count() == 0)
    {
        return table;
    }

    // the last index which isn't the reference index
    auto const lastIndexId = std::prev(mIndices.lower_bound(reference_index_id))
                                     ->first;
    for (unsigned id = 0; id <= lastIndexId; ++id)
    {
        auto rx = read(reference_index_id, id);
        if (rx.has_error())
        {
            if (rx.assume_error() == cache_errc::no_such_archive)
            {
                table.push({.crc = 0, .revision = 0});
                continue;
            }
            return std::move(rx).as_failure();
        }

        auto const &raw = rx.assume_value();
        RSCACHE_TRY(auto &&decoded, decode(raw));
        RSCACHE_TRY(auto &&revision, reference_revision(decoded.data));
        table.push({.crc = crc32(raw), .revision = revision});
    }
    return table;
}

} // namespace rscache
