#pragma once

#include <optional>
#include <string_view>

#include <lyra/lyra.hpp>

#include "rscache/cli/commandlets/base.hpp"
#include "rscache/cli/error.hpp"

namespace rscache::cli
{

class verify : public commandlet_base<verify>
{
    cache_location &mCacheLocation;
    std::optional<unsigned> mIndexId;

public:
    verify(lyra::cli &parser, cache_location &cacheLocation)
        : commandlet_base<verify>()
        , mCacheLocation(cacheLocation)
        , mIndexId(std::nullopt)
    {
        cmd.help("read and decode every archive and report the failures");
        cmd.add_argument(lyra::opt(mIndexId, "index")["-i"]["--index"]
                                 .optional()
                                 .help("Only verify the archives of this "
                                       "index"));
        parser |= cmd;
    }
    static constexpr std::string_view name = "verify";

    auto exec(lyra::group const &) const -> result<void>;
};

} // namespace rscache::cli
