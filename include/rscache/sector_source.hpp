#pragma once

#include <cstddef>
#include <cstdint>

#include <type_traits>
#include <vector>

#include <rscache/disappointment.hpp>
#include <rscache/llfio.hpp>
#include <rscache/span.hpp>

namespace rscache
{

/**
 * random access storage backing the sector chains
 *
 * Reads are positioned, implementations must not keep a shared cursor.
 * Concurrent reads are allowed if the implementation says so.
 */
class sector_source
{
public:
    /**
     * reads up to buffer.size() bytes starting at offset
     *
     * @return the number of bytes read which is only smaller than the
     * buffer if the end of the storage has been reached
     */
    virtual auto read(std::uint64_t offset, rw_dynblob buffer) noexcept
            -> result<std::size_t> = 0;

    virtual auto size() noexcept -> result<std::uint64_t> = 0;

    virtual ~sector_source() = default;

protected:
    sector_source() = default;
    sector_source(sector_source const &) = default;
    sector_source &operator=(sector_source const &) = default;
};

/**
 * serves reads from a borrowed memory region, safe for concurrent reads
 */
class memory_sector_source final : public sector_source
{
public:
    explicit memory_sector_source(ro_dynblob storage) noexcept
        : mStorage(storage)
    {
    }

    auto read(std::uint64_t offset, rw_dynblob buffer) noexcept
            -> result<std::size_t> override;
    auto size() noexcept -> result<std::uint64_t> override
    {
        return mStorage.size();
    }

private:
    ro_dynblob mStorage;
};

/**
 * serves reads from a file through llfio's scatter read, which maps onto
 * positioned reads and is therefore safe for concurrent use
 */
class file_sector_source final : public sector_source
{
public:
    explicit file_sector_source(llfio::file_handle file) noexcept
        : mFile(std::move(file))
    {
    }

    static auto open(llfio::path_handle const &base,
                     llfio::path_view path) noexcept
            -> result<file_sector_source>;

    auto read(std::uint64_t offset, rw_dynblob buffer) noexcept
            -> result<std::size_t> override;
    auto size() noexcept -> result<std::uint64_t> override;

private:
    llfio::file_handle mFile;
};

/**
 * reads the whole content of the file at base/path
 */
auto read_file(llfio::path_handle const &base, llfio::path_view path)
        -> result<std::vector<std::byte>>;

} // namespace rscache
