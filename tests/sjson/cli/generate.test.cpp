#include "sjson/cli/commandlets/generate.hpp"

#include <string_view>

#include <sjson/uuid.hpp>

#include "boost-unit-test.hpp"
#include "test-utils.hpp"

namespace sjson_tests
{

using namespace std::string_view_literals;
using sjson::cli::cli_errc;
using sjson::cli::generate_parameters;

namespace
{

auto uuid_at(sjson::value::array const &ids, std::size_t i)
        -> sjson::uuid const *
{
    auto const *object = ids.at(i).get_if<sjson::foreign>();
    return object != nullptr ? object->get_if<sjson::uuid>() : nullptr;
}

} // namespace

BOOST_AUTO_TEST_SUITE(cli_generate)

BOOST_AUTO_TEST_CASE(random_uuids)
{
    auto rx = sjson::cli::generate_uuids({.count = 3U});
    TEST_RESULT_REQUIRE(rx);
    BOOST_TEST_REQUIRE(rx.assume_value().size() == 3U);
    for (std::size_t i = 0U; i < 3U; ++i)
    {
        auto const *id = uuid_at(rx.assume_value(), i);
        BOOST_TEST_REQUIRE((id != nullptr));
        BOOST_TEST((id->version() == uuids::uuid_version::random_number_based));
    }
}

BOOST_AUTO_TEST_CASE(time_based_uuids)
{
    auto rx = sjson::cli::generate_uuids({.count = 2U, .version = 1U});
    TEST_RESULT_REQUIRE(rx);
    BOOST_TEST_REQUIRE(rx.assume_value().size() == 2U);
    auto const *id = uuid_at(rx.assume_value(), 1U);
    BOOST_TEST_REQUIRE((id != nullptr));
    BOOST_TEST((id->version() == uuids::uuid_version::time_based));
}

BOOST_AUTO_TEST_CASE(name_based_uuids)
{
    auto v5 = sjson::cli::generate_uuids({.name = "python.org"});
    TEST_RESULT_REQUIRE(v5);
    BOOST_TEST_REQUIRE(v5.assume_value().size() == 1U);
    BOOST_TEST_REQUIRE((uuid_at(v5.assume_value(), 0U) != nullptr));
    BOOST_TEST(sjson::canonical_string(*uuid_at(v5.assume_value(), 0U))
               == "886313e1-3b8a-5372-9b90-0c9aee199e5d"sv);

    auto v3 = sjson::cli::generate_uuids(
            {.version = 3U, .nameSpace = "dns", .name = "python.org"});
    TEST_RESULT_REQUIRE(v3);
    BOOST_TEST_REQUIRE((uuid_at(v3.assume_value(), 0U) != nullptr));
    BOOST_TEST(sjson::canonical_string(*uuid_at(v3.assume_value(), 0U))
               == "6fa459ea-ee8a-3ca4-894e-db77e160355e"sv);
}

BOOST_AUTO_TEST_CASE(count_is_limited)
{
    auto rx = sjson::cli::generate_uuids(
            {.count = sjson::cli::max_generate_count + 1U});
    BOOST_TEST_REQUIRE(rx.has_failure());
    BOOST_TEST((rx.assume_error() == cli_errc::count_too_large));

    auto huge = sjson::cli::generate_uuids({.count = 0xffff'ffffU});
    BOOST_TEST_REQUIRE(huge.has_failure());
    BOOST_TEST((huge.assume_error() == cli_errc::count_too_large));
    BOOST_TEST((huge.assume_error() == sjson::errc::value_too_large));
}

BOOST_AUTO_TEST_CASE(invalid_arguments)
{
    auto unknown = sjson::cli::generate_uuids({.nameSpace = "isbn"});
    BOOST_TEST_REQUIRE(unknown.has_failure());
    BOOST_TEST((unknown.assume_error() == cli_errc::unknown_namespace));

    auto randomV3 = sjson::cli::generate_uuids({.version = 3U});
    BOOST_TEST_REQUIRE(randomV3.has_failure());
    BOOST_TEST(
            (randomV3.assume_error() == cli_errc::unsupported_uuid_version));

    auto namedV4 = sjson::cli::generate_uuids(
            {.version = 4U, .name = "python.org"});
    BOOST_TEST_REQUIRE(namedV4.has_failure());
    BOOST_TEST(
            (namedV4.assume_error() == cli_errc::unsupported_uuid_version));
}

BOOST_AUTO_TEST_SUITE_END()

} // namespace sjson_tests
