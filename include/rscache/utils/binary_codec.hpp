#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <cstring>

#include <type_traits>

#include <boost/endian/conversion.hpp>

#include <rscache/span.hpp>
#include <rscache/utils/misc.hpp>

namespace rscache
{

/**
 * loads a big endian integer from memory, the caller is responsible for
 * the bounds check
 */
template <utils::integer T, std::size_t Extent>
inline auto load_be(std::span<const std::byte, Extent> memory,
                    std::size_t offset = 0) noexcept -> T
{
    assert(offset + sizeof(T) <= memory.size_bytes());

    T stored;
    std::memcpy(&stored, memory.data() + offset, sizeof(T));
    return boost::endian::big_to_native(stored);
}

template <utils::integer T, std::size_t Extent>
inline void store_be(std::span<std::byte, Extent> memory,
                     T value,
                     std::size_t offset = 0) noexcept
{
    assert(offset + sizeof(T) <= memory.size_bytes());

    auto const stored = boost::endian::native_to_big(value);
    std::memcpy(memory.data() + offset, &stored, sizeof(T));
}

// the sector and index formats use 24 bit fields
template <std::size_t Extent>
inline auto load_be_u24(std::span<const std::byte, Extent> memory,
                        std::size_t offset = 0) noexcept -> std::uint32_t
{
    assert(offset + 3 <= memory.size_bytes());

    return std::to_integer<std::uint32_t>(memory[offset]) << 16
         | std::to_integer<std::uint32_t>(memory[offset + 1]) << 8
         | std::to_integer<std::uint32_t>(memory[offset + 2]);
}

template <std::size_t Extent>
inline void store_be_u24(std::span<std::byte, Extent> memory,
                         std::uint32_t value,
                         std::size_t offset = 0) noexcept
{
    assert(offset + 3 <= memory.size_bytes());
    assert(value <= 0xff'ffffU);

    memory[offset] = static_cast<std::byte>(value >> 16);
    memory[offset + 1] = static_cast<std::byte>(value >> 8);
    memory[offset + 2] = static_cast<std::byte>(value);
}

} // namespace rscache
