#include <rscache/byte_cursor.hpp>

#include <algorithm>
#include <iterator>

namespace rscache
{

auto byte_cursor::read_u24() noexcept -> result<std::uint32_t>
{
    if (remaining_size() < 3)
    {
        return cache_errc::truncated_buffer;
    }
    auto const value = load_be_u24(mBuffer, mPosition);
    mPosition += 3;
    return value;
}

auto byte_cursor::read_smart() noexcept -> result<std::uint16_t>
{
    if (empty())
    {
        return cache_errc::truncated_buffer;
    }
    if (std::to_integer<std::uint8_t>(mBuffer[mPosition]) < 0x80U)
    {
        RSCACHE_TRY(auto value, read_u8());
        return static_cast<std::uint16_t>(value);
    }
    RSCACHE_TRY(auto value, read_u16());
    return static_cast<std::uint16_t>(value - 0x8000U);
}

auto byte_cursor::read_big_smart() noexcept -> result<std::uint32_t>
{
    if (empty())
    {
        return cache_errc::truncated_buffer;
    }
    if (std::to_integer<std::uint8_t>(mBuffer[mPosition]) < 0x80U)
    {
        RSCACHE_TRY(auto value, read_u16());
        return static_cast<std::uint32_t>(value);
    }
    RSCACHE_TRY(auto value, read_u32());
    return value & 0x7fff'ffffU;
}

auto byte_cursor::read_string() -> result<std::string>
{
    auto const rest = remaining();
    auto const terminator = std::ranges::find(rest, std::byte{});
    if (terminator == rest.end())
    {
        return cache_errc::truncated_buffer;
    }

    auto const length
            = static_cast<std::size_t>(std::distance(rest.begin(), terminator));
    std::string value(length, '\0');
    std::ranges::transform(rest.first(length), value.begin(),
                           [](std::byte b)
                           { return static_cast<char>(b); });

    mPosition += length + 1;
    return value;
}

auto byte_cursor::read_bytes(std::size_t const n) noexcept
        -> result<ro_dynblob>
{
    if (remaining_size() < n)
    {
        return cache_errc::truncated_buffer;
    }
    auto const bytes = mBuffer.subspan(mPosition, n);
    mPosition += n;
    return bytes;
}

auto byte_cursor::skip(std::size_t const n) noexcept -> result<void>
{
    if (remaining_size() < n)
    {
        return cache_errc::truncated_buffer;
    }
    mPosition += n;
    return oc::success();
}

} // namespace rscache
