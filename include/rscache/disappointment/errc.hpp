#pragma once

#include <algorithm>
#include <string_view>

#include <boost/predef/compiler.h>

#include <status-code/error.hpp>
#include <status-code/system_code.hpp>

#if defined(BOOST_COMP_GNUC_AVAILABLE)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnon-virtual-dtor"
#endif

namespace rscache
{

namespace system_error = SYSTEM_ERROR2_NAMESPACE;

enum class cache_errc : int
{
    success = 0,
    truncated_buffer = 1,
    sector_archive_mismatch,
    sector_chunk_mismatch,
    sector_index_mismatch,
    sector_chain_ended,
    sector_chain_cycle,
    unsupported_compression,
    compression_failed,
    decompression_failed,
    decompressed_length_mismatch,
    payload_too_large,
    corrupt_index_file,
    no_such_index,
    no_such_archive,
};

/**
 * coarse classification of a failure which tells a caller which
 * remediation applies (re-download, report a format bug, treat as absent)
 */
enum class failure_category
{
    none,
    truncation,
    identity_mismatch,
    chain_integrity,
    compression,
    not_found,
    invalid_input,
    io,
};

constexpr auto failure_category_of(cache_errc const value) noexcept
        -> failure_category
{
    using enum cache_errc;
    switch (value)
    {
    case success:
        return failure_category::none;

    case truncated_buffer:
        return failure_category::truncation;

    case sector_archive_mismatch:
    case sector_chunk_mismatch:
    case sector_index_mismatch:
        return failure_category::identity_mismatch;

    case sector_chain_ended:
    case sector_chain_cycle:
        return failure_category::chain_integrity;

    case unsupported_compression:
    case compression_failed:
    case decompression_failed:
    case decompressed_length_mismatch:
        return failure_category::compression;

    case no_such_index:
    case no_such_archive:
        return failure_category::not_found;

    case payload_too_large:
    case corrupt_index_file:
        return failure_category::invalid_input;
    }
    return failure_category::io;
}

constexpr auto to_string(failure_category const value) noexcept
        -> std::string_view
{
    using enum failure_category;
    using namespace std::string_view_literals;
    switch (value)
    {
    case none:
        return "none"sv;
    case truncation:
        return "truncation"sv;
    case identity_mismatch:
        return "identity-mismatch"sv;
    case chain_integrity:
        return "chain-integrity"sv;
    case compression:
        return "compression"sv;
    case not_found:
        return "not-found"sv;
    case invalid_input:
        return "invalid-input"sv;
    case io:
        return "io"sv;
    }
    return "unknown"sv;
}

class cache_domain_type;
using cache_code = system_error::status_code<cache_domain_type>;

class cache_domain_type : public system_error::status_code_domain
{
    using base = system_error::status_code_domain;
    template <class DomainType>
    friend class system_error::status_code;

public:
    static constexpr std::string_view uuid
            = "5B0A6D7E-3C41-4E8F-9A27-C1D8E4F0B296";

    constexpr ~cache_domain_type() noexcept = default;
    constexpr cache_domain_type() noexcept
        : base(uuid.data(), base::_uuid_size<uuid.size()>{})
    {
    }
    constexpr cache_domain_type(cache_domain_type const &) noexcept = default;
    constexpr auto operator=(cache_domain_type const &) noexcept
            -> cache_domain_type & = default;

    using value_type = cache_errc;
    using base::string_ref;

    [[nodiscard]] constexpr auto name() const noexcept -> string_ref override
    {
        return string_ref("rscache-domain");
    }
    [[nodiscard]] constexpr auto payload_info() const noexcept
            -> payload_info_t override
    {
        return {sizeof(value_type),
                sizeof(value_type) + sizeof(cache_domain_type *),
                std::max(alignof(value_type), alignof(cache_domain_type *))};
    }

    static constexpr auto get() noexcept -> cache_domain_type const &;

protected:
    [[nodiscard]] constexpr auto
    _do_failure(system_error::status_code<void> const &code) const noexcept
            -> bool override
    {
        return static_cast<cache_code const &>(code).value()
               != cache_errc::success;
    }

    [[nodiscard]] constexpr auto
    map_to_generic(value_type const value) const noexcept -> system_error::errc
    {
        using enum cache_errc;
        using sys_errc = system_error::errc;
        switch (value)
        {
        case success:
            return sys_errc::success;

        case truncated_buffer:
        case sector_archive_mismatch:
        case sector_chunk_mismatch:
        case sector_index_mismatch:
        case sector_chain_ended:
        case sector_chain_cycle:
        case decompression_failed:
        case decompressed_length_mismatch:
        case corrupt_index_file:
            return sys_errc::bad_message;

        case unsupported_compression:
            return sys_errc::not_supported;

        case compression_failed:
            return sys_errc::io_error;

        case payload_too_large:
            return sys_errc::value_too_large;

        case no_such_index:
        case no_such_archive:
            return sys_errc::no_such_file_or_directory;

        default:
            return sys_errc::unknown;
        }
    }

    [[nodiscard]] constexpr auto
    map_to_message(value_type const value) const noexcept -> std::string_view
    {
        using enum cache_errc;
        using namespace std::string_view_literals;

        switch (value)
        {
        case success:
            return "success"sv;

        case truncated_buffer:
            return "the buffer ended before a fixed width field or a declared payload was complete"sv;

        case sector_archive_mismatch:
            return "a sector header names a different archive than the one being read"sv;

        case sector_chunk_mismatch:
            return "a sector header carries an unexpected chunk sequence number"sv;

        case sector_index_mismatch:
            return "a sector header names a different index than the one being read"sv;

        case sector_chain_ended:
            return "the sector chain ended before the declared archive length was read"sv;

        case sector_chain_cycle:
            return "the sector chain visits a sector twice (cyclic next pointer)"sv;

        case unsupported_compression:
            return "the payload uses an unknown compression tag"sv;

        case compression_failed:
            return "the compressor failed to process the payload"sv;

        case decompression_failed:
            return "the decompressor rejected the payload"sv;

        case decompressed_length_mismatch:
            return "the decompressed payload size differs from the declared length"sv;

        case payload_too_large:
            return "the payload does not fit into a 32 bit length field"sv;

        case corrupt_index_file:
            return "the index file size is not a multiple of the index entry size"sv;

        case no_such_index:
            return "the cache contains no index with the given id"sv;

        case no_such_archive:
            return "the index contains no archive with the given id"sv;

        default:
            return "unknown rscache error code"sv;
        }
    }

    [[nodiscard]] constexpr auto
    _do_equivalent(system_error::status_code<void> const &lhs,
                   system_error::status_code<void> const &rhs) const noexcept
            -> bool override
    {
        auto const &clhs = static_cast<cache_code const &>(lhs);
        if (rhs.domain() == *this)
        {
            return clhs.value() == static_cast<cache_code const &>(rhs).value();
        }
        if (rhs.domain() == system_error::generic_code_domain)
        {
            system_error::errc sysErrc
                    = static_cast<system_error::generic_code const &>(rhs)
                              .value();

            return system_error::errc::unknown != sysErrc
                   && map_to_generic(clhs.value()) == sysErrc;
        }
        return false;
    }
    [[nodiscard]] constexpr auto
    _generic_code(system_error::status_code<void> const &code) const noexcept
            -> system_error::generic_code override
    {
        return map_to_generic(static_cast<cache_code const &>(code).value());
    }

    [[nodiscard]] constexpr auto
    _do_message(system_error::status_code<void> const &code) const noexcept
            -> string_ref override
    {
        auto const cacheCode = static_cast<cache_code const &>(code);
        auto const message = map_to_message(cacheCode.value());
        return string_ref(message.data(), message.size());
    }

    SYSTEM_ERROR2_NORETURN void _do_throw_exception(
            system_error::status_code<void> const &code) const override
    {
        throw system_error::status_error<cache_domain_type>(
                static_cast<cache_code const &>(code).clone());
    }
};
inline constexpr cache_domain_type cache_domain{};

constexpr auto cache_domain_type::get() noexcept -> cache_domain_type const &
{
    return cache_domain;
}

constexpr auto make_status_code(cache_errc c) noexcept -> cache_code
{
    return cache_code(system_error::in_place, c);
}

} // namespace rscache

#if defined(BOOST_COMP_GNUC_AVAILABLE)
#pragma GCC diagnostic pop
#endif
