#include "rscache/cli/commandlets/extract.hpp"

#include <vector>

#include <rscache/llfio.hpp>

namespace rscache::cli
{

auto extract::exec(lyra::group const &) const -> result<void>
{
    using file_handle = llfio::file_handle;

    RSCACHE_TRY(auto &&indexId, to_index_id(mIndexId));
    RSCACHE_TRY(auto &&cache, mCacheLocation.open());

    std::vector<std::byte> content;
    if (mRaw)
    {
        RSCACHE_TRY(content, cache.read(indexId, mArchiveId));
    }
    else
    {
        RSCACHE_TRY(auto &&decoded, cache.read_decoded(indexId, mArchiveId));
        content = std::move(decoded.data);
    }

    RSCACHE_TRY(auto &&outFile,
                llfio::file({}, mTargetFile, file_handle::mode::write,
                            file_handle::creation::always_new));

    file_handle::const_buffer_type outBuffers[] = {ro_dynblob(content)};
    RSCACHE_TRY(outFile.write({outBuffers, 0U}));
    RSCACHE_TRY(outFile.close());

    fmt::print("{} bytes written to {}\n", content.size(), mTargetFile);
    return oc::success();
}

} // namespace rscache::cli
