#pragma once
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <ostream>
#include <span>
#include <string_view>
#include <vector>

#include "boost-unit-test.hpp"

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <rscache/codec.hpp>
#include <rscache/disappointment.hpp>
#include <rscache/sector.hpp>
#include <rscache/sector_chain.hpp>
#include <rscache/span.hpp>

SYSTEM_ERROR2_NAMESPACE_BEGIN

inline auto operator<<(std::ostream &s, status_code<void> const &sc)
        -> std::ostream &
{
    fmt::print(s, "[{}|{}]", sc.domain().name().c_str(), sc.message().c_str());
    return s;
}
inline auto operator<<(std::ostream &s, errc c) -> std::ostream &
{
    return operator<<(s, make_status_code(c));
}

SYSTEM_ERROR2_NAMESPACE_END

namespace rscache
{

inline auto boost_test_print_type(std::ostream &s, cache_errc c)
        -> std::ostream &
{
    return operator<<(s, make_status_code(c));
}

inline auto boost_test_print_type(std::ostream &s, failure_category c)
        -> std::ostream &
{
    return s << to_string(c);
}

inline auto boost_test_print_type(std::ostream &s, compression_type c)
        -> std::ostream &
{
    return s << static_cast<unsigned>(c);
}

inline auto boost_test_print_type(std::ostream &s, sector_header_size layout)
        -> std::ostream &
{
    return s << (layout == sector_header_size::expanded ? "expanded"
                                                        : "normal");
}

inline auto boost_test_print_type(std::ostream &s, sector_header const &h)
        -> std::ostream &
{
    fmt::print(s, "{{archive: {}, chunk: {}, next: {}, index: {}}}",
               h.archive_id, h.chunk, h.next, h.index_id);
    return s;
}

inline auto boost_test_print_type(std::ostream &s, archive_locator const &l)
        -> std::ostream &
{
    fmt::print(s, "{{id: {}, index: {}, start: {}, length: {}}}", l.id,
               l.index_id, l.start_sector, l.byte_length);
    return s;
}

template <typename T>
inline auto check_result(result<T> const &rx)
        -> boost::test_tools::predicate_result
{
    if (!rx)
    {
        boost::test_tools::predicate_result prx{false};
        prx.message() << rx.assume_error();
        return prx;
    }
    return true;
}
} // namespace rscache

#define TEST_RESULT(...) BOOST_TEST((::rscache::check_result((__VA_ARGS__))))
#define TEST_RESULT_REQUIRE(...)                                               \
    BOOST_TEST_REQUIRE((::rscache::check_result((__VA_ARGS__))))

namespace std
{

inline auto boost_test_print_type(std::ostream &s, std::byte b)
        -> std::ostream &
{
    fmt::print(s, FMT_STRING("{:x}"), static_cast<std::uint8_t>(b));
    return s;
}

} // namespace std

namespace rscache_tests
{

inline auto bytes(std::initializer_list<unsigned> values)
        -> std::vector<std::byte>
{
    std::vector<std::byte> out;
    out.reserve(values.size());
    for (auto const v : values)
    {
        out.push_back(static_cast<std::byte>(v));
    }
    return out;
}

inline auto to_vector(rscache::ro_dynblob data) -> std::vector<std::byte>
{
    return {data.begin(), data.end()};
}

/**
 * a reproducible byte pattern which differs between archives
 */
auto make_content(std::size_t size, std::uint8_t seed)
        -> std::vector<std::byte>;

/**
 * builds the content of a sector data file in memory
 */
class sector_image
{
public:
    /**
     * writes a sector at the given index, the file is extended as needed
     * and the sector only occupies header + payload bytes
     */
    void put(std::uint32_t sectorIdx,
             rscache::sector_header const &header,
             rscache::ro_dynblob payload);

    /**
     * stores content as a chain over the given sectors, the last sector
     * links to trailingNext
     */
    auto put_archive(std::uint8_t indexId,
                     std::uint32_t archiveId,
                     std::span<std::uint32_t const> sectors,
                     rscache::ro_dynblob content,
                     std::uint32_t trailingNext = 0)
            -> rscache::archive_locator;

    [[nodiscard]] auto data() const noexcept -> rscache::ro_dynblob
    {
        return mData;
    }

private:
    std::vector<std::byte> mData;
};

/**
 * builds the content of an index file
 */
auto make_index(std::span<rscache::archive_locator const> locators)
        -> std::vector<std::byte>;

} // namespace rscache_tests
