#pragma once

#include <cstddef>
#include <cstdint>

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <rscache/checksum.hpp>
#include <rscache/codec.hpp>
#include <rscache/disappointment.hpp>
#include <rscache/index_file.hpp>
#include <rscache/llfio.hpp>
#include <rscache/sector_chain.hpp>
#include <rscache/sector_source.hpp>

namespace rscache
{

// the index whose archive N describes index N
inline constexpr std::uint8_t reference_index_id = 255;

struct cache_options
{
    std::string data_file_name{"main_file_cache.dat2"};
    std::string index_file_prefix{"main_file_cache.idx"};
};

class cache final
{
public:
    cache(std::unique_ptr<sector_source> source,
          std::vector<index_file> indices,
          cache_options options = {});

    cache(cache &&) = default;
    cache &operator=(cache &&) = default;

    /**
     * opens the data file and every index file found in directory
     *
     * index files are optional, a missing data file isn't
     */
    static auto open(llfio::path_handle const &base,
                     llfio::path_view directory,
                     cache_options options = {}) -> result<cache>;

    [[nodiscard]] auto has_index(std::uint8_t indexId) const noexcept -> bool;
    // excludes the reference index
    [[nodiscard]] auto index_count() const noexcept -> std::size_t;
    auto archive_count(std::uint8_t indexId) const noexcept
            -> result<std::size_t>;
    // ids of the loaded indices in ascending order
    [[nodiscard]] auto index_ids() const -> std::vector<std::uint8_t>;

    auto locate(std::uint8_t indexId, std::uint32_t archiveId) const noexcept
            -> result<archive_locator>;

    /**
     * reassembles the still encoded archive
     */
    auto read(std::uint8_t indexId, std::uint32_t archiveId)
            -> result<std::vector<std::byte>>;
    auto read_decoded(std::uint8_t indexId,
                      std::uint32_t archiveId,
                      revision_suffix revisionSuffix = revision_suffix::absent)
            -> result<decoded_payload>;

    /**
     * builds the checksum table from the reference tables
     *
     * an index without reference table gets a zero entry
     */
    auto create_checksum() -> result<checksum>;

private:
    std::unique_ptr<sector_source> mSource;
    std::map<std::uint8_t, index_file> mIndices;
    cache_options mOptions;
};

} // namespace rscache
