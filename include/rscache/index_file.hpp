#pragma once

#include <cstddef>
#include <cstdint>

#include <vector>

#include <rscache/disappointment.hpp>
#include <rscache/sector_chain.hpp>
#include <rscache/span.hpp>

namespace rscache
{

// length u24 + start sector u24
inline constexpr std::size_t index_entry_size = 6;

/**
 * the parsed content of one main_file_cache.idx<N> file
 */
class index_file final
{
public:
    struct entry
    {
        std::uint32_t byte_length;
        std::uint32_t start_sector;

        // sector 0 holds no archive data, it marks an unused slot
        [[nodiscard]] constexpr auto empty() const noexcept -> bool
        {
            return byte_length == 0 || start_sector == 0;
        }

        friend constexpr auto operator==(entry const &, entry const &) noexcept
                -> bool = default;
    };

    index_file() noexcept = default;
    index_file(std::uint8_t indexId, std::vector<entry> entries) noexcept
        : mIndexId(indexId)
        , mEntries(std::move(entries))
    {
    }

    static auto parse(std::uint8_t indexId, ro_dynblob content)
            -> result<index_file>;

    [[nodiscard]] auto id() const noexcept -> std::uint8_t
    {
        return mIndexId;
    }
    [[nodiscard]] auto size() const noexcept -> std::size_t
    {
        return mEntries.size();
    }

    auto locate(std::uint32_t archiveId) const noexcept
            -> result<archive_locator>;

private:
    std::uint8_t mIndexId{0};
    std::vector<entry> mEntries;
};

} // namespace rscache
