#include <rscache/sector_source.hpp>

#include <algorithm>
#include <cstring>

namespace rscache
{

auto memory_sector_source::read(std::uint64_t const offset,
                                rw_dynblob const buffer) noexcept
        -> result<std::size_t>
{
    if (offset >= mStorage.size())
    {
        return std::size_t{0};
    }
    auto const available = mStorage.subspan(static_cast<std::size_t>(offset));
    auto const n = std::min(available.size(), buffer.size());
    rscache::copy(available.first(n), buffer);
    return n;
}

auto file_sector_source::open(llfio::path_handle const &base,
                              llfio::path_view const path) noexcept
        -> result<file_sector_source>
{
    RSCACHE_TRY(auto &&file,
                llfio::file_handle::file(base, path,
                                         llfio::file_handle::mode::read,
                                         llfio::file_handle::creation::open_existing,
                                         llfio::file_handle::caching::all));
    return file_sector_source(std::move(file));
}

auto file_sector_source::read(std::uint64_t const offset,
                              rw_dynblob const buffer) noexcept
        -> result<std::size_t>
{
    llfio::file_handle::buffer_type reqBuffers[] = {
            {buffer.data(), buffer.size()}
    };

    RSCACHE_TRY(auto &&readBuffers, mFile.read({reqBuffers, offset}));

    std::size_t numRead = 0;
    for (auto const &readBuffer : readBuffers)
    {
        // llfio may hand out its own memory instead of filling ours
        if (readBuffer.data() != buffer.data() + numRead)
        {
            std::memcpy(buffer.data() + numRead, readBuffer.data(),
                        readBuffer.size());
        }
        numRead += readBuffer.size();
    }
    return numRead;
}

auto file_sector_source::size() noexcept -> result<std::uint64_t>
{
    RSCACHE_TRY(auto &&extent, mFile.maximum_extent());
    return static_cast<std::uint64_t>(extent);
}

auto read_file(llfio::path_handle const &base, llfio::path_view const path)
        -> result<std::vector<std::byte>>
{
    RSCACHE_TRY(auto &&source, file_sector_source::open(base, path));
    RSCACHE_TRY(auto &&extent, source.size());

    std::vector<std::byte> content(static_cast<std::size_t>(extent));
    RSCACHE_TRY(auto &&numRead, source.read(0, content));
    content.resize(numRead);
    return content;
}

} // namespace rscache
