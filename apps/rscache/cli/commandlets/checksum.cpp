#include "rscache/cli/commandlets/checksum.hpp"

#include "rscache/cli/utils.hpp"

namespace rscache::cli
{

auto print_checksum::exec(lyra::group const &) const -> result<void>
{
    RSCACHE_TRY(auto &&cache, mCacheLocation.open());
    RSCACHE_TRY(auto &&table, cache.create_checksum());

    if (mEncoded)
    {
        RSCACHE_TRY(auto &&encoded, std::move(table).encode());
        fmt::print("{}\n", to_hex(encoded));
        return oc::success();
    }

    auto const entries = table.entries();
    for (std::size_t i = 0; i < entries.size(); ++i)
    {
        fmt::print("{:>3} {:08x} {}\n", i, entries[i].crc,
                   entries[i].revision);
    }
    return oc::success();
}

} // namespace rscache::cli
