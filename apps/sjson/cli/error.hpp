#pragma once

#include <algorithm>
#include <string_view>

#include <boost/predef/compiler.h>

#include <sjson/disappointment.hpp>

#if defined(BOOST_COMP_GNUC_AVAILABLE)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnon-virtual-dtor"
#endif

namespace sjson::cli
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
    exit_error = 1,
    /**
     * @brief The name space for a name based uuid is not one of dns, url,
     * oid and x500.
     */
    unknown_namespace,
    /**
     * @brief More uuids were requested than a single document may hold.
     */
    count_too_large,
    /**
     * @brief The requested uuid version cannot be generated from the given
     * arguments.
     */
    unsupported_uuid_version,
};

class cli_domain_type;
using cli_code = system_error::status_code<cli_domain_type>;
using cli_error = system_error::status_error<cli_domain_type>;

class cli_domain_type : public system_error::status_code_domain
{
    using base = system_error::status_code_domain;
    template <class DomainType>
    friend class system_error::status_code;

public:
    static constexpr std::string_view uuid
            = "A3C9E6D2-17B4-4E58-8F0A-6D2B94C1E735";

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

    [[nodiscard]] constexpr auto name() const noexcept -> string_ref override
    {
        return string_ref("sjson-cli-domain");
    }
    [[nodiscard]] constexpr auto payload_info() const noexcept
            -> payload_info_t override
    {
        return {sizeof(value_type),
                sizeof(value_type) + sizeof(cli_domain_type *),
                std::max(alignof(value_type), alignof(cli_domain_type *))};
    }

    static constexpr auto get() noexcept -> cli_domain_type const &;

protected:
    [[nodiscard]] constexpr auto
    _do_failure(system_error::status_code<void> const &code) const noexcept
            -> bool override
    {
        (void)code;
        return true;
    }

    [[nodiscard]] constexpr auto
    map_to_generic(value_type const value) const noexcept -> system_error::errc
    {
        using enum cli_errc;
        using sys_errc = system_error::errc;
        switch (value)
        {
        case unknown_namespace:
        case unsupported_uuid_version:
            return sys_errc::invalid_argument;
        case count_too_large:
            return sys_errc::value_too_large;

        case exit_error:
        default:
            return sys_errc::unknown;
        }
    }

    [[nodiscard]] constexpr auto
    map_to_message(value_type const value) const noexcept -> std::string_view
    {
        using enum cli_errc;
        using namespace std::string_view_literals;

        switch (value)
        {
        case exit_error:
            return "Terminate the program with return value 1 now."sv;
        case unknown_namespace:
            return "The uuid name space must be one of dns, url, oid or x500."sv;
        case count_too_large:
            return "At most 1000000 uuids can be generated at once."sv;
        case unsupported_uuid_version:
            return "Random uuids are version 1 or 4, name based uuids are "
                   "version 3 or 5."sv;

        default:
            return "unknown sjson cli error code"sv;
        }
    }

    [[nodiscard]] constexpr auto
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
    [[nodiscard]] constexpr auto
    _generic_code(system_error::status_code<void> const &code) const noexcept
            -> system_error::generic_code override
    {
        return map_to_generic(static_cast<cli_code const &>(code).value());
    }

    [[nodiscard]] constexpr auto
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

} // namespace sjson::cli

#if defined(BOOST_COMP_GNUC_AVAILABLE)
#pragma GCC diagnostic pop
#endif
