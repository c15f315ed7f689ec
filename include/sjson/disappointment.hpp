#pragma once

#include <utility>

#include <boost/predef.h>

#if defined BOOST_COMP_MSVC_AVAILABLE
#pragma warning(push, 3)
#pragma warning(disable : 6285)
#endif

#include <outcome/bad_access.hpp>
#include <outcome/experimental/status_result.hpp>
#include <outcome/try.hpp>
#include <status-code/error.hpp>

#if defined BOOST_COMP_MSVC_AVAILABLE
#pragma warning(pop)
#endif

#include <sjson/disappointment/errc.hpp>
#include <sjson/disappointment/generic_errc.hpp>

namespace sjson
{
namespace outcome = OUTCOME_V2_NAMESPACE;
namespace oc = OUTCOME_V2_NAMESPACE;

namespace detail
{
class result_no_value_policy : public outcome::policy::base
{
public:
    //! Performs a narrow check of state, used in the assume_value()
    //! functions.
    using base::narrow_value_check;

    //! Performs a narrow check of state, used in the assume_error()
    //! functions.
    using base::narrow_error_check;

    //! Performs a wide check of state, used in the value() functions.
    template <class Impl>
    static constexpr void wide_value_check(Impl &&self)
    {
        if (!base::_has_value(self))
        {
            if (base::_has_error(self))
            {
                // moving lvalues is expected in this case.
                // NOLINTNEXTLINE(bugprone-move-forwarding-reference)
                base::_error(std::move(self)).throw_exception();
            }
            throw outcome::bad_result_access("no value");
        }
    }

    //! Performs a wide check of state, used in the error() functions.
    template <class Impl>
    static constexpr void wide_error_check(Impl &&self)
    {
        if (!base::_has_error(self))
        {
            throw outcome::bad_result_access("no error");
        }
    }
};

} // namespace detail

using oc::failure;
using oc::success;

template <typename R, typename E = system_error::error>
using result = oc::basic_result<R, E, detail::result_no_value_policy>;

} // namespace sjson

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define SJSON_TRY(...) OUTCOME_TRY(__VA_ARGS__)

// NOLINTEND(cppcoreguidelines-macro-usage)
