#include "sjson/detail/utf.hpp"

#include <string>
#include <string_view>

#include "boost-unit-test.hpp"

namespace sjson_tests
{

using namespace std::string_view_literals;
using sjson::utf::find_invalid;

constexpr auto npos = std::string_view::npos;

BOOST_AUTO_TEST_SUITE(utf)

BOOST_AUTO_TEST_CASE(sequence_length_of_lead_units)
{
    using sjson::utf::detail::sequence_length;
    BOOST_TEST(sequence_length('a') == 1U);
    BOOST_TEST(sequence_length('\xc3') == 2U);
    BOOST_TEST(sequence_length('\xe2') == 3U);
    BOOST_TEST(sequence_length('\xf0') == 4U);
    BOOST_TEST(sequence_length('\x80') == 0U);
    BOOST_TEST(sequence_length('\xff') == 0U);
}

BOOST_AUTO_TEST_CASE(valid_text)
{
    BOOST_TEST(find_invalid(""sv) == npos);
    BOOST_TEST(find_invalid("plain ascii"sv) == npos);
    BOOST_TEST(find_invalid(std::string_view("\0", 1U)) == npos);
    // U+00FC U+20AC U+1F600
    BOOST_TEST(find_invalid("\xc3\xbc\xe2\x82\xac\xf0\x9f\x98\x80"sv) == npos);
    // U+10FFFF
    BOOST_TEST(find_invalid("\xf4\x8f\xbf\xbf"sv) == npos);
}

BOOST_AUTO_TEST_CASE(stray_trail_unit)
{
    BOOST_TEST(find_invalid("ab\x80"sv) == 2U);
}

BOOST_AUTO_TEST_CASE(truncated_sequence)
{
    BOOST_TEST(find_invalid("a\xe2\x82"sv) == 1U);
    BOOST_TEST(find_invalid("\xe2\x82z"sv) == 0U);
}

BOOST_AUTO_TEST_CASE(overlong_encoding)
{
    BOOST_TEST(find_invalid("\xc0\xaf"sv) == 0U);
    BOOST_TEST(find_invalid("\xe0\x80\xaf"sv) == 0U);
}

BOOST_AUTO_TEST_CASE(surrogates_and_out_of_range)
{
    BOOST_TEST(find_invalid("\xed\xa0\x80"sv) == 0U);
    BOOST_TEST(find_invalid("x\xf4\x90\x80\x80"sv) == 1U);
}

BOOST_AUTO_TEST_SUITE_END()

} // namespace sjson_tests
