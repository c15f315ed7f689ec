#include <sjson/disappointment.hpp>

#include <string_view>

#include "boost-unit-test.hpp"
#include "test-utils.hpp"

namespace sjson_tests
{

using namespace std::string_view_literals;
using sjson::errc;
using sjson::json_errc;

BOOST_AUTO_TEST_SUITE(disappointment)

BOOST_AUTO_TEST_CASE(json_domain_identity)
{
    sjson::system_error::error const e = json_errc::unsupported_type;

    BOOST_TEST((e.domain() == sjson::json_domain));
    BOOST_TEST(std::string_view(e.domain().name().c_str()) == "sjson-domain"sv);
    BOOST_TEST(e.failure());
}

BOOST_AUTO_TEST_CASE(json_domain_messages)
{
    BOOST_TEST(std::string_view(
                       sjson::make_status_code(json_errc::unsupported_type)
                               .message()
                               .c_str())
               == "Type is not JSON serializable"sv);
    BOOST_TEST(std::string_view(
                       sjson::make_status_code(json_errc::invalid_utf8)
                               .message()
                               .c_str())
               == "str is not valid UTF-8"sv);
    BOOST_TEST(std::string_view(
                       sjson::make_status_code(json_errc::recursion_limit)
                               .message()
                               .c_str())
               == "Recursion limit reached"sv);
}

BOOST_AUTO_TEST_CASE(json_success_is_no_failure)
{
    BOOST_TEST(!sjson::make_status_code(json_errc::success).failure());
}

BOOST_AUTO_TEST_CASE(generic_equivalence)
{
    sjson::system_error::error const unsupported = json_errc::unsupported_type;
    BOOST_TEST(unsupported == errc::operation_not_supported);
    BOOST_TEST(unsupported != errc::invalid_argument);

    sjson::system_error::error const range = json_errc::range_error;
    BOOST_TEST(range == errc::argument_out_of_domain);

    sjson::system_error::error const badText = json_errc::invalid_uuid_string;
    sjson::system_error::error const badSize = json_errc::invalid_uuid_size;
    BOOST_TEST(badText == errc::invalid_argument);
    BOOST_TEST(badSize == errc::invalid_argument);
    BOOST_TEST(badText != badSize);

    sjson::system_error::error const utf8 = json_errc::invalid_utf8;
    BOOST_TEST(utf8 == errc::illegal_byte_sequence);

    sjson::system_error::error const integer = json_errc::integer_out_of_range;
    sjson::system_error::error const depth = json_errc::recursion_limit;
    BOOST_TEST(integer == errc::value_too_large);
    BOOST_TEST(depth == errc::value_too_large);
}

BOOST_AUTO_TEST_CASE(try_propagates_failure)
{
    auto const inner = [](bool fail) -> sjson::result<int>
    {
        if (fail)
        {
            return json_errc::range_error;
        }
        return 7;
    };
    auto const outer = [&](bool fail) -> sjson::result<int>
    {
        SJSON_TRY(auto &&v, inner(fail));
        return v + 1;
    };

    auto const ok = outer(false);
    TEST_RESULT_REQUIRE(ok);
    BOOST_TEST(ok.assume_value() == 8);
    BOOST_TEST(outer(true).assume_error() == json_errc::range_error);
}

BOOST_AUTO_TEST_SUITE_END()

} // namespace sjson_tests
