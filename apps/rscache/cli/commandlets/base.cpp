#include "rscache/cli/commandlets/base.hpp"

#include <limits>

namespace rscache::cli
{

auto cache_location::open() const -> result<cache>
{
    return cache::open({}, llfio::path_view(directory), options);
}

auto to_index_id(unsigned const value) noexcept -> result<std::uint8_t>
{
    if (value > std::numeric_limits<std::uint8_t>::max())
    {
        return cli_errc::bad_index_id;
    }
    return static_cast<std::uint8_t>(value);
}

} // namespace rscache::cli
