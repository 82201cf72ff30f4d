#pragma once

#include <string_view>

#include <lyra/lyra.hpp>

#include "rscache/cli/commandlets/base.hpp"
#include "rscache/cli/error.hpp"

namespace rscache::cli
{

class print_checksum : public commandlet_base<print_checksum>
{
    cache_location &mCacheLocation;
    bool mEncoded;

public:
    print_checksum(lyra::cli &parser, cache_location &cacheLocation)
        : commandlet_base<print_checksum>()
        , mCacheLocation(cacheLocation)
        , mEncoded(false)
    {
        cmd.help("print the checksum table built from the reference tables");
        cmd.add_argument(lyra::opt(mEncoded)["--encoded"].optional().help(
                "Print the hex encoded table as it is sent to a client"));
        parser |= cmd;
    }
    static constexpr std::string_view name = "checksum";

    auto exec(lyra::group const &) const -> result<void>;
};

} // namespace rscache::cli
