#include <rscache/sector.hpp>
#include "boost-unit-test.hpp"
#include "test-utils.hpp"

#include <array>
#include <vector>

using namespace rscache;

BOOST_AUTO_TEST_SUITE(sector_tests)

BOOST_AUTO_TEST_CASE(header_size_switches_above_16_bit_ids)
{
    BOOST_TEST(select_header_size(0) == sector_header_size::normal);
    BOOST_TEST(select_header_size(65'535) == sector_header_size::normal);
    BOOST_TEST(select_header_size(65'536) == sector_header_size::expanded);

    BOOST_TEST(header_length(sector_header_size::normal) == 8U);
    BOOST_TEST(payload_length(sector_header_size::normal) == 512U);
    BOOST_TEST(header_length(sector_header_size::expanded) == 10U);
    BOOST_TEST(payload_length(sector_header_size::expanded) == 510U);
}

BOOST_AUTO_TEST_CASE(decode_normal_header)
{
    auto const buffer
            = rscache_tests::bytes({0x12, 0x34, 0x00, 0x02, 0x00, 0x01, 0x00,
                                    0x07, 0xaa, 0xbb});
    byte_cursor in(buffer);

    auto const header
            = sector_header::decode(in, sector_header_size::normal).value();
    BOOST_TEST(header == (sector_header{.archive_id = 0x1234,
                                        .chunk = 2,
                                        .next = 0x100,
                                        .index_id = 7}));
    BOOST_TEST(in.position() == 8U);
}

BOOST_AUTO_TEST_CASE(decode_expanded_header)
{
    auto const buffer
            = rscache_tests::bytes({0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0xff,
                                    0xff, 0xff, 0x02});
    byte_cursor in(buffer);

    auto const header
            = sector_header::decode(in, sector_header_size::expanded).value();
    BOOST_TEST(header == (sector_header{.archive_id = 65'536,
                                        .chunk = 0,
                                        .next = 0xff'ffff,
                                        .index_id = 2}));
}

BOOST_AUTO_TEST_CASE(decode_short_header_is_truncated)
{
    auto const buffer = rscache_tests::bytes({0x00, 0x01, 0x00, 0x00});
    byte_cursor in(buffer);

    auto rx = sector_header::decode(in, sector_header_size::normal);
    BOOST_TEST_REQUIRE(rx.has_error());
    BOOST_TEST(rx.assume_error() == cache_errc::truncated_buffer);
}

BOOST_DATA_TEST_CASE(header_encode_decode_round_trip,
                     boost::unit_test::data::make(std::vector<std::uint32_t>{
                             0U, 1U, 65'535U, 65'536U, 0xffff'ffffU}),
                     archiveId)
{
    auto const layout = select_header_size(archiveId);
    sector_header const header{.archive_id = archiveId,
                               .chunk = 0xfffe,
                               .next = 0x12'3456,
                               .index_id = 255};

    std::array<std::byte, expanded_sector_header_length> buffer{};
    TEST_RESULT_REQUIRE(header.encode(buffer, layout));

    byte_cursor in(std::span(buffer).first(header_length(layout)));
    auto const decoded = sector_header::decode(in, layout).value();
    BOOST_TEST(decoded == header);
    BOOST_TEST(in.empty());
}

BOOST_AUTO_TEST_CASE(encode_rejects_fields_which_do_not_fit)
{
    std::array<std::byte, sector_header_length> buffer{};

    sector_header const wideId{.archive_id = 65'536,
                               .chunk = 0,
                               .next = 0,
                               .index_id = 0};
    BOOST_TEST(wideId.encode(buffer, sector_header_size::normal).assume_error()
               == errc::invalid_argument);

    sector_header const wideNext{.archive_id = 1,
                                 .chunk = 0,
                                 .next = 0x100'0000,
                                 .index_id = 0};
    BOOST_TEST(wideNext.encode(buffer, sector_header_size::normal).has_error());

    BOOST_TEST(wideId.encode(buffer, sector_header_size::expanded).has_error());
}

BOOST_AUTO_TEST_CASE(validate_reports_archive_before_chunk_before_index)
{
    sector_header const header{.archive_id = 1,
                               .chunk = 0,
                               .next = 2,
                               .index_id = 255};

    TEST_RESULT(header.validate(1, 0, 255));

    // every field differs, the archive id is reported
    BOOST_TEST(header.validate(0, 1, 0).assume_error()
               == cache_errc::sector_archive_mismatch);
    BOOST_TEST(header.validate(0, 0, 255).assume_error()
               == cache_errc::sector_archive_mismatch);
    BOOST_TEST(header.validate(1, 1, 0).assume_error()
               == cache_errc::sector_chunk_mismatch);
    BOOST_TEST(header.validate(1, 1, 255).assume_error()
               == cache_errc::sector_chunk_mismatch);
    BOOST_TEST(header.validate(1, 0, 0).assume_error()
               == cache_errc::sector_index_mismatch);
}

BOOST_AUTO_TEST_CASE(sector_decode_keeps_all_remaining_bytes_as_payload)
{
    std::array<std::byte, sector_size> buffer{};
    sector_header const header{.archive_id = 9,
                               .chunk = 3,
                               .next = 4,
                               .index_id = 1};
    TEST_RESULT_REQUIRE(header.encode(buffer, sector_header_size::normal));

    auto const full = sector::decode(buffer, sector_header_size::normal).value();
    BOOST_TEST(full.header == header);
    BOOST_TEST(full.payload.size() == sector_payload_length);
    BOOST_TEST(full.payload.data() == buffer.data() + sector_header_length);

    auto const partial = sector::decode(std::span(buffer).first(20),
                                        sector_header_size::normal)
                                 .value();
    BOOST_TEST(partial.payload.size() == 12U);

    auto const headerOnly = sector::decode(std::span(buffer).first(8),
                                           sector_header_size::normal)
                                    .value();
    BOOST_TEST(headerOnly.payload.empty());
}

BOOST_AUTO_TEST_SUITE_END()
