#include <rscache/disappointment.hpp>

namespace rscache
{

auto failure_category_of(system_error::error const &error) noexcept
        -> failure_category
{
    if (error.domain() == cache_domain)
    {
        auto const &cacheCode = static_cast<cache_code const &>(
                static_cast<system_error::status_code<void> const &>(error));
        return failure_category_of(cacheCode.value());
    }
    if (error == errc::no_such_file_or_directory)
    {
        return failure_category::not_found;
    }
    return failure_category::io;
}

} // namespace rscache
