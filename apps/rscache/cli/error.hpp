#pragma once

#include <algorithm>
#include <string_view>

#include <boost/predef/compiler.h>

#include <rscache/disappointment.hpp>

#if defined(BOOST_COMP_GNUC_AVAILABLE)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnon-virtual-dtor"
#endif

namespace rscache::cli
{
/**
 * @brief CLI specific errors.
 */
enum class cli_errc : int
{
    /**
     * @brief Terminate the program with return value 1 now. Error message
     * should be printed before returning this error.
     */
    exit_error,
    /**
     * @brief Index ids are limited to the range [0, 255].
     */
    bad_index_id,
};

class cli_domain_type;
using cli_code = system_error::status_code<cli_domain_type>;

class cli_domain_type : public system_error::status_code_domain
{
    using base = system_error::status_code_domain;
    template <class DomainType>
    friend class system_error::status_code;

public:
    static constexpr std::string_view uuid
            = "9E3D1F42-7B6A-4C05-8D19-2A4F6E0B7C31";

    constexpr ~cli_domain_type() noexcept = default;
    constexpr cli_domain_type() noexcept
        : base(uuid.data(), base::_uuid_size<uuid.size()>{})
    {
    }
    constexpr cli_domain_type(cli_domain_type const &) noexcept = default;
    constexpr auto operator=(cli_domain_type const &) noexcept
            -> cli_domain_type & = default;

    using value_type = cli_errc;
    using base::string_ref;

    constexpr auto name() const noexcept -> string_ref override
    {
        return string_ref("rscache-cli-domain");
    }
    constexpr auto payload_info() const noexcept -> payload_info_t override
    {
        return {sizeof(value_type),
                sizeof(value_type) + sizeof(cli_domain_type *),
                std::max(alignof(value_type), alignof(cli_domain_type *))};
    }

    static constexpr auto get() noexcept -> cli_domain_type const &;

protected:
    constexpr auto
    _do_failure(system_error::status_code<void> const &code) const noexcept
            -> bool override
    {
        (void)code;
        return true;
    }

    constexpr auto map_to_generic(value_type const value) const noexcept
            -> system_error::errc
    {
        using enum cli_errc;
        using sys_errc = system_error::errc;
        switch (value)
        {
        case bad_index_id:
            return sys_errc::invalid_argument;

        case exit_error:
        default:
            return sys_errc::unknown;
        }
    }

    constexpr auto map_to_message(value_type const value) const noexcept
            -> std::string_view
    {
        using enum cli_errc;
        using namespace std::string_view_literals;

        switch (value)
        {
        case exit_error:
            return "Terminate the program with return value 1 now."sv;
        case bad_index_id:
            return "Index ids must lie within [0, 255]."sv;

        default:
            return "unknown rscache cli error code"sv;
        }
    }

    constexpr auto
    _do_equivalent(system_error::status_code<void> const &lhs,
                   system_error::status_code<void> const &rhs) const noexcept
            -> bool override
    {
        auto const &clhs = static_cast<cli_code const &>(lhs);
        if (rhs.domain() == *this)
        {
            return clhs.value() == static_cast<cli_code const &>(rhs).value();
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
    constexpr auto
    _generic_code(system_error::status_code<void> const &code) const noexcept
            -> system_error::generic_code override
    {
        return map_to_generic(static_cast<cli_code const &>(code).value());
    }

    constexpr auto
    _do_message(system_error::status_code<void> const &code) const noexcept
            -> string_ref override
    {
        auto const cliCode = static_cast<cli_code const &>(code);
        auto const message = map_to_message(cliCode.value());
        return string_ref(message.data(), message.size());
    }

    SYSTEM_ERROR2_NORETURN void _do_throw_exception(
            system_error::status_code<void> const &code) const override
    {
        throw system_error::status_error<cli_domain_type>(
                static_cast<cli_code const &>(code).clone());
    }
};
inline constexpr cli_domain_type cli_domain{};

constexpr auto cli_domain_type::get() noexcept -> cli_domain_type const &
{
    return cli_domain;
}

constexpr auto make_status_code(cli_errc c) noexcept -> cli_code
{
    return cli_code{system_error::in_place, c};
}

} // namespace rscache::cli

#if defined(BOOST_COMP_GNUC_AVAILABLE)
#pragma GCC diagnostic pop
#endif
