#pragma once

#include <cstddef>
#include <cstdint>

#include <algorithm>
#include <span>

namespace rscache
{
inline constexpr std::size_t dynamic_extent = std::dynamic_extent;

template <std::size_t Extent>
using rw_blob = std::span<std::byte, Extent>;
using rw_dynblob = rw_blob<dynamic_extent>;

template <std::size_t Extent>
using ro_blob = std::span<const std::byte, Extent>;
using ro_dynblob = ro_blob<dynamic_extent>;

/**
 * copies as many bytes as fit into dest and returns the unwritten rest
 */
inline auto copy(ro_dynblob source, rw_dynblob dest) noexcept -> rw_dynblob
{
    auto const n = std::min(source.size(), dest.size());
    std::copy_n(source.data(), n, dest.data());
    return dest.subspan(n);
}

} // namespace rscache
