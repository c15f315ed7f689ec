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

namespace sjson
{

namespace system_error = SYSTEM_ERROR2_NAMESPACE;

enum class json_errc : int
{
    success = 0,
    /**
     * @brief The value is neither a built-in JSON kind nor a foreign type
     * enabled by the active options.
     */
    unsupported_type = 1,
    /**
     * @brief An integer used to construct a uuid lies outside
     * [0, 2^128 - 1] or a uuid field exceeds its bit width.
     */
    range_error,
    invalid_uuid_string,
    invalid_uuid_size,
    invalid_utf8,
    integer_out_of_range,
    recursion_limit,
};

class json_domain_type;
using json_code = system_error::status_code<json_domain_type>;

class json_domain_type : public system_error::status_code_domain
{
    using base = system_error::status_code_domain;
    template <class DomainType>
    friend class system_error::status_code;

public:
    static constexpr std::string_view uuid
            = "5B2E0C8A-3D71-4F6E-9A14-C07D8E2B91F3";

    constexpr ~json_domain_type() noexcept = default;
    constexpr json_domain_type() noexcept
        : base(uuid.data(), base::_uuid_size<uuid.size()>{})
    {
    }
    constexpr json_domain_type(json_domain_type const &) noexcept = default;
    constexpr auto operator=(json_domain_type const &) noexcept
            -> json_domain_type & = default;

    using value_type = json_errc;
    using base::string_ref;

    [[nodiscard]] constexpr auto name() const noexcept -> string_ref override
    {
        return string_ref("sjson-domain");
    }
    [[nodiscard]] constexpr auto payload_info() const noexcept
            -> payload_info_t override
    {
        return {sizeof(value_type),
                sizeof(value_type) + sizeof(json_domain_type *),
                std::max(alignof(value_type), alignof(json_domain_type *))};
    }

    static constexpr auto get() noexcept -> json_domain_type const &;

protected:
    [[nodiscard]] constexpr auto
    _do_failure(system_error::status_code<void> const &code) const noexcept
            -> bool override
    {
        return static_cast<json_code const &>(code).value()
               != json_errc::success;
    }

    [[nodiscard]] constexpr auto
    map_to_generic(value_type const value) const noexcept -> system_error::errc
    {
        using enum json_errc;
        using sys_errc = system_error::errc;
        switch (value)
        {
        case success:
            return sys_errc::success;

        case unsupported_type:
            return sys_errc::operation_not_supported;

        case range_error:
            return sys_errc::argument_out_of_domain;

        case invalid_uuid_string:
        case invalid_uuid_size:
            return sys_errc::invalid_argument;

        case invalid_utf8:
            return sys_errc::illegal_byte_sequence;

        case integer_out_of_range:
        case recursion_limit:
            return sys_errc::value_too_large;

        default:
            return sys_errc::unknown;
        }
    }

    [[nodiscard]] constexpr auto
    map_to_message(value_type const value) const noexcept -> std::string_view
    {
        using enum json_errc;
        using namespace std::string_view_literals;

        switch (value)
        {
        case success:
            return "success"sv;

        case unsupported_type:
            return "Type is not JSON serializable"sv;

        case range_error:
            return "the integer or field is out of range for a 128-bit uuid"sv;

        case invalid_uuid_string:
            return "badly formed hexadecimal uuid string"sv;

        case invalid_uuid_size:
            return "a uuid must be constructed from exactly 16 bytes"sv;

        case invalid_utf8:
            return "str is not valid UTF-8"sv;

        case integer_out_of_range:
            return "Integer exceeds 53-bit range"sv;

        case recursion_limit:
            return "Recursion limit reached"sv;

        default:
            return "unknown sjson error code"sv;
        }
    }

    [[nodiscard]] constexpr auto
    _do_equivalent(system_error::status_code<void> const &lhs,
                   system_error::status_code<void> const &rhs) const noexcept
            -> bool override
    {
        auto const &jlhs = static_cast<json_code const &>(lhs);
        if (rhs.domain() == *this)
        {
            return jlhs.value() == static_cast<json_code const &>(rhs).value();
        }
        if (rhs.domain() == system_error::generic_code_domain)
        {
            system_error::errc sysErrc
                    = static_cast<system_error::generic_code const &>(rhs)
                              .value();

            return system_error::errc::unknown != sysErrc
                   && map_to_generic(jlhs.value()) == sysErrc;
        }
        return false;
    }
    [[nodiscard]] constexpr auto
    _generic_code(system_error::status_code<void> const &code) const noexcept
            -> system_error::generic_code override
    {
        return map_to_generic(static_cast<json_code const &>(code).value());
    }

    [[nodiscard]] constexpr auto
    _do_message(system_error::status_code<void> const &code) const noexcept
            -> string_ref override
    {
        auto const jsonCode = static_cast<json_code const &>(code);
        auto const message = map_to_message(jsonCode.value());
        return string_ref(message.data(), message.size());
    }

    SYSTEM_ERROR2_NORETURN void _do_throw_exception(
            system_error::status_code<void> const &code) const override
    {
        throw system_error::status_error<json_domain_type>(
                static_cast<json_code const &>(code).clone());
    }
};
inline constexpr json_domain_type json_domain{};

constexpr auto json_domain_type::get() noexcept -> json_domain_type const &
{
    return json_domain;
}

constexpr auto make_status_code(json_errc c) noexcept -> json_code
{
    return json_code(system_error::in_place, c);
}

} // namespace sjson

#if defined(BOOST_COMP_GNUC_AVAILABLE)
#pragma GCC diagnostic pop
#endif
