#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <lyra/lyra.hpp>

#include "rscache/cli/commandlets/base.hpp"
#include "rscache/cli/error.hpp"

namespace rscache::cli
{

class extract : public commandlet_base<extract>
{
    cache_location &mCacheLocation;
    unsigned mIndexId;
    std::uint32_t mArchiveId;
    std::string mTargetFile;
    bool mRaw;

public:
    extract(lyra::cli &parser, cache_location &cacheLocation)
        : commandlet_base<extract>()
        , mCacheLocation(cacheLocation)
        , mIndexId(0)
        , mArchiveId(0)
        , mTargetFile()
        , mRaw(false)
    {
        cmd.help("extract a single archive from the cache");
        cmd.add_argument(lyra::opt(mIndexId, "index")["-i"]["--index"]
                                 .required()
                                 .help("The id of the index to read from"));
        cmd.add_argument(lyra::opt(mArchiveId, "archive")["-a"]["--archive"]
                                 .required()
                                 .help("The id of the archive within the "
                                       "index"));
        cmd.add_argument(
                lyra::opt(mTargetFile, "file")["--to"].required().help(
                        "The file the archive is written to. Must not "
                        "exist beforehand."));
        cmd.add_argument(lyra::opt(mRaw)["--raw"].optional().help(
                "Write the still encoded archive"));

        parser |= cmd;
    }
    static constexpr std::string_view name = "extract";

    auto exec(lyra::group const &) const -> result<void>;
};

} // namespace rscache::cli
