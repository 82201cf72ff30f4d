#include "rscache/cli/commandlets/verify.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace rscache::cli
{

auto verify::exec(lyra::group const &) const -> result<void>
{
    RSCACHE_TRY(auto &&cache, mCacheLocation.open());

    std::vector<std::uint8_t> indexIds;
    if (mIndexId.has_value())
    {
        RSCACHE_TRY(auto &&indexId, to_index_id(*mIndexId));
        if (!cache.has_index(indexId))
        {
            return cache_errc::no_such_index;
        }
        indexIds.push_back(indexId);
    }
    else
    {
        indexIds = cache.index_ids();
    }

    std::size_t numVerified = 0;
    std::size_t numFailed = 0;
    for (auto const indexId : indexIds)
    {
        RSCACHE_TRY(auto &&numArchives, cache.archive_count(indexId));
        for (std::uint32_t archiveId = 0; archiveId < numArchives; ++archiveId)
        {
            if (auto locator = cache.locate(indexId, archiveId);
                locator.has_error())
            {
                // unused slot
                continue;
            }

            ++numVerified;
            if (auto rx = cache.read_decoded(indexId, archiveId);
                rx.has_error())
            {
                ++numFailed;
                fmt::print("{:>3} {:>6} {} {}\n", indexId, archiveId,
                           to_string(failure_category_of(rx.assume_error())),
                           rx.assume_error().message().c_str());
            }
        }
    }

    fmt::print("{} archives verified, {} failed\n", numVerified, numFailed);
    if (numFailed > 0)
    {
        return cli_errc::exit_error;
    }
    return oc::success();
}

} // namespace rscache::cli
