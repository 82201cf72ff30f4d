#pragma once

#include <cstddef>
#include <cstdint>

#include <string>

#include <rscache/disappointment.hpp>
#include <rscache/span.hpp>
#include <rscache/utils/binary_codec.hpp>

namespace rscache
{

/**
 * sequential big endian reader over a borrowed byte slice
 *
 * Every read is bounds checked; a read which would cross the end of the
 * slice fails with cache_errc::truncated_buffer and leaves the cursor
 * where it was.
 */
class byte_cursor final
{
public:
    byte_cursor() noexcept = default;
    explicit byte_cursor(ro_dynblob buffer) noexcept
        : mBuffer(buffer)
        , mPosition(0)
    {
    }

    template <utils::integer T>
    auto read() noexcept -> result<T>
    {
        if (remaining_size() < sizeof(T))
        {
            return cache_errc::truncated_buffer;
        }
        auto const value = load_be<T>(mBuffer, mPosition);
        mPosition += sizeof(T);
        return value;
    }

    auto read_u8() noexcept -> result<std::uint8_t>
    {
        return read<std::uint8_t>();
    }
    auto read_i8() noexcept -> result<std::int8_t>
    {
        return read<std::int8_t>();
    }
    auto read_u16() noexcept -> result<std::uint16_t>
    {
        return read<std::uint16_t>();
    }
    auto read_u24() noexcept -> result<std::uint32_t>;
    auto read_u32() noexcept -> result<std::uint32_t>
    {
        return read<std::uint32_t>();
    }
    auto read_i32() noexcept -> result<std::int32_t>
    {
        return read<std::int32_t>();
    }

    /**
     * one byte if the value is below 128, otherwise two bytes with the
     * high bit of the first byte set
     */
    auto read_smart() noexcept -> result<std::uint16_t>;
    /**
     * two bytes if the first byte has its high bit cleared, otherwise
     * four bytes with the high bit masked off
     */
    auto read_big_smart() noexcept -> result<std::uint32_t>;

    /**
     * reads a NUL terminated string, the terminator is consumed but not
     * part of the returned value; every byte maps to one char
     */
    auto read_string() -> result<std::string>;

    auto read_bytes(std::size_t n) noexcept -> result<ro_dynblob>;
    auto skip(std::size_t n) noexcept -> result<void>;

    [[nodiscard]] auto position() const noexcept -> std::size_t
    {
        return mPosition;
    }
    [[nodiscard]] auto remaining_size() const noexcept -> std::size_t
    {
        return mBuffer.size() - mPosition;
    }
    [[nodiscard]] auto remaining() const noexcept -> ro_dynblob
    {
        return mBuffer.subspan(mPosition);
    }
    [[nodiscard]] auto empty() const noexcept -> bool
    {
        return mPosition == mBuffer.size();
    }

private:
    ro_dynblob mBuffer{};
    std::size_t mPosition{0};
};

} // namespace rscache
